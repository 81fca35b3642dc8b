//! # Trivia
//!
//! Whitespace and comments attached to the front (leading) or back
//! (trailing) of a token. Whitespace pieces are stored as a repeat count of
//! a single character sequence; comments and garbage text keep their text.
//!
//! | Kind | Storage | Renders as |
//! |------|---------|------------|
//! | `Space` | count | `' '` x count |
//! | `Newline` | count | `'\n'` x count |
//! | `CarriageReturnLineFeed` | count | `"\r\n"` x count |
//! | `LineComment` | text | text |
//! | `GarbageText` | text | text |

#ifndef LTH_SYNTAX_TRIVIA_HPP
#define LTH_SYNTAX_TRIVIA_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lth::syntax {

enum class TriviaKind : uint8_t {
    Space,
    Tab,
    VerticalTab,
    Formfeed,
    Newline,
    CarriageReturn,
    CarriageReturnLineFeed,
    Backtick,
    LineComment,
    BlockComment,
    DocLineComment,
    DocBlockComment,
    GarbageText,
};

[[nodiscard]] auto trivia_kind_name(TriviaKind kind) -> std::string_view;
[[nodiscard]] auto trivia_kind_from_name(std::string_view name) -> std::optional<TriviaKind>;

/// True for kinds stored as a repeat count rather than text.
[[nodiscard]] inline auto is_count_trivia(TriviaKind kind) -> bool {
    return kind <= TriviaKind::Backtick;
}

/// True for the four comment kinds.
[[nodiscard]] inline auto is_comment_trivia(TriviaKind kind) -> bool {
    return kind >= TriviaKind::LineComment && kind <= TriviaKind::DocBlockComment;
}

/// Upper bound on the sum of repeat counts in one serialized tree. Readers
/// reject payloads above it; a count piece renders as that many characters.
inline constexpr uint64_t MAX_TRIVIA_REPEAT = uint64_t{1} << 24;

/// A single piece of trivia.
struct TriviaPiece {
    TriviaKind kind = TriviaKind::Space;
    uint64_t count = 0; ///< Repeat count for count kinds
    std::string text;   ///< Text for comment and garbage kinds

    static auto counted(TriviaKind kind, uint64_t count) -> TriviaPiece {
        return TriviaPiece{kind, count, {}};
    }

    static auto with_text(TriviaKind kind, std::string text) -> TriviaPiece {
        return TriviaPiece{kind, 0, std::move(text)};
    }

    /// Appends the source text of this piece to `out`.
    void write(std::string& out) const;
};

using Trivia = std::vector<TriviaPiece>;

/// Appends the source text of every piece to `out`.
void write_trivia(const Trivia& trivia, std::string& out);

} // namespace lth::syntax

#endif // LTH_SYNTAX_TRIVIA_HPP
