#include "syntax/trivia.hpp"

#include <array>

namespace lth::syntax {

namespace {

constexpr std::array<std::string_view, 13> TRIVIA_KIND_NAMES = {
    "Space",
    "Tab",
    "VerticalTab",
    "Formfeed",
    "Newline",
    "CarriageReturn",
    "CarriageReturnLineFeed",
    "Backtick",
    "LineComment",
    "BlockComment",
    "DocLineComment",
    "DocBlockComment",
    "GarbageText",
};

static_assert(TRIVIA_KIND_NAMES.size() == static_cast<size_t>(TriviaKind::GarbageText) + 1);

/// The character sequence a count piece repeats.
auto repeated_text(TriviaKind kind) -> std::string_view {
    switch (kind) {
    case TriviaKind::Space:
        return " ";
    case TriviaKind::Tab:
        return "\t";
    case TriviaKind::VerticalTab:
        return "\v";
    case TriviaKind::Formfeed:
        return "\f";
    case TriviaKind::Newline:
        return "\n";
    case TriviaKind::CarriageReturn:
        return "\r";
    case TriviaKind::CarriageReturnLineFeed:
        return "\r\n";
    case TriviaKind::Backtick:
        return "`";
    default:
        return "";
    }
}

} // namespace

auto trivia_kind_name(TriviaKind kind) -> std::string_view {
    return TRIVIA_KIND_NAMES[static_cast<size_t>(kind)];
}

auto trivia_kind_from_name(std::string_view name) -> std::optional<TriviaKind> {
    for (size_t i = 0; i < TRIVIA_KIND_NAMES.size(); ++i) {
        if (TRIVIA_KIND_NAMES[i] == name) {
            return static_cast<TriviaKind>(i);
        }
    }
    return std::nullopt;
}

void TriviaPiece::write(std::string& out) const {
    if (!is_count_trivia(kind)) {
        out += text;
        return;
    }
    auto unit = repeated_text(kind);
    if (unit.size() == 1) {
        out.append(count, unit[0]);
        return;
    }
    out.reserve(out.size() + count * unit.size());
    for (uint64_t i = 0; i < count; ++i) {
        out += unit;
    }
}

void write_trivia(const Trivia& trivia, std::string& out) {
    for (const auto& piece : trivia) {
        piece.write(out);
    }
}

} // namespace lth::syntax
