//! # Raw Syntax Implementation
//!
//! Node construction and source rendering.

#include "syntax/raw_syntax.hpp"

namespace lth::syntax {

auto RawSyntax::make_token(TokenData token, std::optional<uint64_t> id, SourcePresence presence)
    -> RawSyntaxPtr {
    return make_rc<const RawSyntax>(RawSyntax{std::move(token), id, presence});
}

auto RawSyntax::make_layout(LayoutData layout, std::optional<uint64_t> id,
                            SourcePresence presence) -> RawSyntaxPtr {
    return make_rc<const RawSyntax>(RawSyntax{std::move(layout), id, presence});
}

auto RawSyntax::is_unknown() const -> bool {
    if (const auto* layout = std::get_if<LayoutData>(&data)) {
        return is_unknown_kind(layout->kind);
    }
    return false;
}

auto RawSyntax::num_children() const -> size_t {
    if (const auto* layout = std::get_if<LayoutData>(&data)) {
        return layout->children.size();
    }
    return 0;
}

auto RawSyntax::child(size_t index) const -> const RawSyntax* {
    const auto* layout = std::get_if<LayoutData>(&data);
    if (!layout || index >= layout->children.size()) {
        return nullptr;
    }
    return layout->children[index].get();
}

auto RawSyntax::display_name() const -> std::string {
    if (is_token()) {
        return "TokenSyntax";
    }
    return syntax_kind_display_name(as<LayoutData>().kind);
}

void write_source(const RawSyntax& node, std::string& out) {
    if (node.is_missing()) {
        return;
    }
    if (const auto* token = std::get_if<TokenData>(&node.data)) {
        write_trivia(token->leading_trivia, out);
        out += token->text;
        write_trivia(token->trailing_trivia, out);
        return;
    }
    for (const auto& child : node.as<LayoutData>().children) {
        if (child) {
            write_source(*child, out);
        }
    }
}

auto source_text(const RawSyntax& node) -> std::string {
    std::string out;
    write_source(node, out);
    return out;
}

} // namespace lth::syntax
