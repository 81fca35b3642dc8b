//! # Syntax Classification
//!
//! Assigns an editor-style colouring class to every token of a tree and
//! renders the tree with the classes as inline markup.
//!
//! ## Context Rules
//!
//! A token's class comes from its kind, except where its position in the
//! tree says otherwise:
//!
//! | Position | Class |
//! |----------|-------|
//! | identifier in `SimpleTypeIdentifier` / `MemberTypeIdentifier` | `TypeIdentifier` |
//! | `@` or identifier in `Attribute` | `Attribute` |
//! | identifier in the condition of an `IfConfigClause` | `BuildConfigId` |
//! | `\`, `(`, `)` of an `ExpressionSegment` | `StringInterpolationAnchor` |
//! | identifier spelled `<#...#>` | `EditorPlaceholder` |
//!
//! ## Markup
//!
//! ```text
//! <kw>let</kw> x = <int>1</int>
//! ```
//!
//! A tag opens where the class changes and closes where it changes again,
//! so neighbouring tokens of one class share a tag. Whitespace trivia and
//! unclassified tokens are written without a tag.

#ifndef LTH_SYNTAX_CLASSIFIER_HPP
#define LTH_SYNTAX_CLASSIFIER_HPP

#include "syntax/raw_syntax.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lth::syntax {

enum class SyntaxClassification : uint8_t {
    None,
    Keyword,
    Identifier,
    TypeIdentifier,
    DollarIdentifier,
    IntegerLiteral,
    FloatingLiteral,
    StringLiteral,
    StringInterpolationAnchor,
    PoundDirectiveKeyword,
    BuildConfigId,
    Attribute,
    ObjectLiteral,
    EditorPlaceholder,
    LineComment,
    DocLineComment,
    BlockComment,
    DocBlockComment,
};

/// Classes keyed by token node identity.
using ClassificationMap = std::unordered_map<const RawSyntax*, SyntaxClassification>;

/// Classifies every token reachable from `root`. The map refers to nodes
/// of `root`, which must outlive it.
[[nodiscard]] auto classify_tokens(const RawSyntax& root) -> ClassificationMap;

/// Class of a trivia piece (comments only; everything else is `None`).
[[nodiscard]] auto classify_trivia(TriviaKind kind) -> SyntaxClassification;

/// Markup tag of a class; empty for untagged classes.
[[nodiscard]] auto classification_tag(SyntaxClassification classification) -> std::string_view;

/// Renders a tree with classification markup.
class ClassifiedTreePrinter {
public:
    explicit ClassifiedTreePrinter(const ClassificationMap& classifications)
        : classifications_(classifications) {}

    [[nodiscard]] auto print(const RawSyntax& root) -> std::string;

private:
    const ClassificationMap& classifications_;
};

} // namespace lth::syntax

#endif // LTH_SYNTAX_CLASSIFIER_HPP
