//! # Raw Syntax Trees
//!
//! `RawSyntax` is the immutable node type of a deserialized syntax tree.
//! Nodes are shared through `RawSyntaxPtr` (`Rc<const RawSyntax>`), so an
//! incremental tree can reuse unchanged subtrees of the tree it was derived
//! from without copying them.
//!
//! ## Node Shapes
//!
//! | Payload | Fields |
//! |---------|--------|
//! | `TokenData` | token kind, text, leading trivia, trailing trivia |
//! | `LayoutData` | syntax kind, ordered children (a child may be absent) |
//!
//! Every node also carries an optional numeric id (used to resolve reused
//! nodes) and a presence flag. Missing nodes are placeholders the front-end
//! inserted for syntax that is not in the source; they render as nothing.

#ifndef LTH_SYNTAX_RAW_SYNTAX_HPP
#define LTH_SYNTAX_RAW_SYNTAX_HPP

#include "common.hpp"
#include "syntax/syntax_kind.hpp"
#include "syntax/token_kind.hpp"
#include "syntax/trivia.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lth::syntax {

struct RawSyntax;

/// Shared handle to an immutable node. A null handle is an absent child.
using RawSyntaxPtr = Rc<const RawSyntax>;

enum class SourcePresence : uint8_t {
    Present,
    Missing,
};

/// Payload of a token node.
struct TokenData {
    TokenKind kind;
    std::string text;
    Trivia leading_trivia;
    Trivia trailing_trivia;
};

/// Payload of a layout (non-token) node.
struct LayoutData {
    SyntaxKind kind;
    std::vector<RawSyntaxPtr> children;
};

struct RawSyntax {
    using Payload = std::variant<TokenData, LayoutData>;

    Payload data;
    std::optional<uint64_t> id;
    SourcePresence presence = SourcePresence::Present;

    static auto make_token(TokenData token, std::optional<uint64_t> id = std::nullopt,
                           SourcePresence presence = SourcePresence::Present) -> RawSyntaxPtr;

    static auto make_layout(LayoutData layout, std::optional<uint64_t> id = std::nullopt,
                            SourcePresence presence = SourcePresence::Present) -> RawSyntaxPtr;

    /// Checks if this node holds payload `T`.
    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(data);
    }

    /// Gets the payload as `T`. Throws if this node holds the other payload.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(data);
    }

    [[nodiscard]] auto is_token() const -> bool {
        return is<TokenData>();
    }

    [[nodiscard]] auto is_present() const -> bool {
        return presence == SourcePresence::Present;
    }

    [[nodiscard]] auto is_missing() const -> bool {
        return presence == SourcePresence::Missing;
    }

    /// True for layout nodes of an `Unknown*` kind.
    [[nodiscard]] auto is_unknown() const -> bool;

    /// Number of child slots (0 for tokens).
    [[nodiscard]] auto num_children() const -> size_t;

    /// Child at `index`, or null if the slot is absent or out of range.
    [[nodiscard]] auto child(size_t index) const -> const RawSyntax*;

    /// Display name: `SourceFileSyntax` for layouts, `TokenSyntax` for tokens.
    [[nodiscard]] auto display_name() const -> std::string;
};

/// Appends the source text of `node` (present tokens only) to `out`.
void write_source(const RawSyntax& node, std::string& out);

/// Reconstructs the source text of a tree: for every present token, its
/// leading trivia, text and trailing trivia, in order.
[[nodiscard]] auto source_text(const RawSyntax& node) -> std::string;

} // namespace lth::syntax

#endif // LTH_SYNTAX_RAW_SYNTAX_HPP
