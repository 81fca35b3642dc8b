//! # Token Kind Tables
//!
//! One row per `TokenKind`: its serialized name and, for fixed tokens, its
//! text. Rows are in enum order so a kind indexes its own row.

#include "syntax/token_kind.hpp"

#include <array>
#include <string>
#include <unordered_map>

namespace lth::syntax {

namespace {

struct TokenKindInfo {
    TokenKind kind;
    std::string_view name;
    std::string_view text; ///< Empty for payload tokens
};

constexpr std::array TOKEN_KINDS = {
    TokenKindInfo{TokenKind::kw_associatedtype, "kw_associatedtype", "associatedtype"},
    TokenKindInfo{TokenKind::kw_class, "kw_class", "class"},
    TokenKindInfo{TokenKind::kw_deinit, "kw_deinit", "deinit"},
    TokenKindInfo{TokenKind::kw_enum, "kw_enum", "enum"},
    TokenKindInfo{TokenKind::kw_extension, "kw_extension", "extension"},
    TokenKindInfo{TokenKind::kw_func, "kw_func", "func"},
    TokenKindInfo{TokenKind::kw_import, "kw_import", "import"},
    TokenKindInfo{TokenKind::kw_init, "kw_init", "init"},
    TokenKindInfo{TokenKind::kw_inout, "kw_inout", "inout"},
    TokenKindInfo{TokenKind::kw_let, "kw_let", "let"},
    TokenKindInfo{TokenKind::kw_operator, "kw_operator", "operator"},
    TokenKindInfo{TokenKind::kw_precedencegroup, "kw_precedencegroup", "precedencegroup"},
    TokenKindInfo{TokenKind::kw_protocol, "kw_protocol", "protocol"},
    TokenKindInfo{TokenKind::kw_struct, "kw_struct", "struct"},
    TokenKindInfo{TokenKind::kw_subscript, "kw_subscript", "subscript"},
    TokenKindInfo{TokenKind::kw_typealias, "kw_typealias", "typealias"},
    TokenKindInfo{TokenKind::kw_var, "kw_var", "var"},
    TokenKindInfo{TokenKind::kw_fileprivate, "kw_fileprivate", "fileprivate"},
    TokenKindInfo{TokenKind::kw_internal, "kw_internal", "internal"},
    TokenKindInfo{TokenKind::kw_private, "kw_private", "private"},
    TokenKindInfo{TokenKind::kw_public, "kw_public", "public"},
    TokenKindInfo{TokenKind::kw_static, "kw_static", "static"},

    TokenKindInfo{TokenKind::kw_defer, "kw_defer", "defer"},
    TokenKindInfo{TokenKind::kw_if, "kw_if", "if"},
    TokenKindInfo{TokenKind::kw_guard, "kw_guard", "guard"},
    TokenKindInfo{TokenKind::kw_do, "kw_do", "do"},
    TokenKindInfo{TokenKind::kw_repeat, "kw_repeat", "repeat"},
    TokenKindInfo{TokenKind::kw_else, "kw_else", "else"},
    TokenKindInfo{TokenKind::kw_for, "kw_for", "for"},
    TokenKindInfo{TokenKind::kw_in, "kw_in", "in"},
    TokenKindInfo{TokenKind::kw_while, "kw_while", "while"},
    TokenKindInfo{TokenKind::kw_return, "kw_return", "return"},
    TokenKindInfo{TokenKind::kw_break, "kw_break", "break"},
    TokenKindInfo{TokenKind::kw_continue, "kw_continue", "continue"},
    TokenKindInfo{TokenKind::kw_fallthrough, "kw_fallthrough", "fallthrough"},
    TokenKindInfo{TokenKind::kw_switch, "kw_switch", "switch"},
    TokenKindInfo{TokenKind::kw_case, "kw_case", "case"},
    TokenKindInfo{TokenKind::kw_default, "kw_default", "default"},
    TokenKindInfo{TokenKind::kw_where, "kw_where", "where"},
    TokenKindInfo{TokenKind::kw_catch, "kw_catch", "catch"},
    TokenKindInfo{TokenKind::kw_throw, "kw_throw", "throw"},

    TokenKindInfo{TokenKind::kw_as, "kw_as", "as"},
    TokenKindInfo{TokenKind::kw_Any, "kw_Any", "Any"},
    TokenKindInfo{TokenKind::kw_false, "kw_false", "false"},
    TokenKindInfo{TokenKind::kw_is, "kw_is", "is"},
    TokenKindInfo{TokenKind::kw_nil, "kw_nil", "nil"},
    TokenKindInfo{TokenKind::kw_rethrows, "kw_rethrows", "rethrows"},
    TokenKindInfo{TokenKind::kw_super, "kw_super", "super"},
    TokenKindInfo{TokenKind::kw_self, "kw_self", "self"},
    TokenKindInfo{TokenKind::kw_Self, "kw_Self", "Self"},
    TokenKindInfo{TokenKind::kw_true, "kw_true", "true"},
    TokenKindInfo{TokenKind::kw_try, "kw_try", "try"},
    TokenKindInfo{TokenKind::kw_throws, "kw_throws", "throws"},
    TokenKindInfo{TokenKind::kw___FILE__, "kw___FILE__", "__FILE__"},
    TokenKindInfo{TokenKind::kw___LINE__, "kw___LINE__", "__LINE__"},
    TokenKindInfo{TokenKind::kw___COLUMN__, "kw___COLUMN__", "__COLUMN__"},
    TokenKindInfo{TokenKind::kw___FUNCTION__, "kw___FUNCTION__", "__FUNCTION__"},
    TokenKindInfo{TokenKind::kw___DSO_HANDLE__, "kw___DSO_HANDLE__", "__DSO_HANDLE__"},
    TokenKindInfo{TokenKind::kw__, "kw__", "_"},

    TokenKindInfo{TokenKind::l_paren, "l_paren", "("},
    TokenKindInfo{TokenKind::r_paren, "r_paren", ")"},
    TokenKindInfo{TokenKind::l_brace, "l_brace", "{"},
    TokenKindInfo{TokenKind::r_brace, "r_brace", "}"},
    TokenKindInfo{TokenKind::l_square, "l_square", "["},
    TokenKindInfo{TokenKind::r_square, "r_square", "]"},
    TokenKindInfo{TokenKind::l_angle, "l_angle", "<"},
    TokenKindInfo{TokenKind::r_angle, "r_angle", ">"},
    TokenKindInfo{TokenKind::period, "period", "."},
    TokenKindInfo{TokenKind::prefix_period, "prefix_period", "."},
    TokenKindInfo{TokenKind::comma, "comma", ","},
    TokenKindInfo{TokenKind::ellipsis, "ellipsis", "..."},
    TokenKindInfo{TokenKind::colon, "colon", ":"},
    TokenKindInfo{TokenKind::semi, "semi", ";"},
    TokenKindInfo{TokenKind::equal, "equal", "="},
    TokenKindInfo{TokenKind::at_sign, "at_sign", "@"},
    TokenKindInfo{TokenKind::pound, "pound", "#"},
    TokenKindInfo{TokenKind::prefix_amp, "prefix_amp", "&"},
    TokenKindInfo{TokenKind::arrow, "arrow", "->"},
    TokenKindInfo{TokenKind::backtick, "backtick", "`"},
    TokenKindInfo{TokenKind::backslash, "backslash", "\\"},
    TokenKindInfo{TokenKind::exclaim_postfix, "exclaim_postfix", "!"},
    TokenKindInfo{TokenKind::postfix_question_mark, "postfix_question_mark", "?"},
    TokenKindInfo{TokenKind::infix_question_mark, "infix_question_mark", "?"},
    TokenKindInfo{TokenKind::string_quote, "string_quote", "\""},
    TokenKindInfo{TokenKind::single_quote, "single_quote", "'"},
    TokenKindInfo{TokenKind::multiline_string_quote, "multiline_string_quote", "\"\"\""},

    TokenKindInfo{TokenKind::pound_keyPath, "pound_keyPath", "#keyPath"},
    TokenKindInfo{TokenKind::pound_line, "pound_line", "#line"},
    TokenKindInfo{TokenKind::pound_selector, "pound_selector", "#selector"},
    TokenKindInfo{TokenKind::pound_file, "pound_file", "#file"},
    TokenKindInfo{TokenKind::pound_column, "pound_column", "#column"},
    TokenKindInfo{TokenKind::pound_function, "pound_function", "#function"},
    TokenKindInfo{TokenKind::pound_dsohandle, "pound_dsohandle", "#dsohandle"},
    TokenKindInfo{TokenKind::pound_assert, "pound_assert", "#assert"},
    TokenKindInfo{TokenKind::pound_sourceLocation, "pound_sourceLocation", "#sourceLocation"},
    TokenKindInfo{TokenKind::pound_warning, "pound_warning", "#warning"},
    TokenKindInfo{TokenKind::pound_error, "pound_error", "#error"},
    TokenKindInfo{TokenKind::pound_if, "pound_if", "#if"},
    TokenKindInfo{TokenKind::pound_else, "pound_else", "#else"},
    TokenKindInfo{TokenKind::pound_elseif, "pound_elseif", "#elseif"},
    TokenKindInfo{TokenKind::pound_endif, "pound_endif", "#endif"},
    TokenKindInfo{TokenKind::pound_available, "pound_available", "#available"},
    TokenKindInfo{TokenKind::pound_fileLiteral, "pound_fileLiteral", "#fileLiteral"},
    TokenKindInfo{TokenKind::pound_imageLiteral, "pound_imageLiteral", "#imageLiteral"},
    TokenKindInfo{TokenKind::pound_colorLiteral, "pound_colorLiteral", "#colorLiteral"},

    TokenKindInfo{TokenKind::integer_literal, "integer_literal", ""},
    TokenKindInfo{TokenKind::floating_literal, "floating_literal", ""},
    TokenKindInfo{TokenKind::string_literal, "string_literal", ""},
    TokenKindInfo{TokenKind::unknown, "unknown", ""},
    TokenKindInfo{TokenKind::identifier, "identifier", ""},
    TokenKindInfo{TokenKind::unspaced_binary_operator, "unspaced_binary_operator", ""},
    TokenKindInfo{TokenKind::spaced_binary_operator, "spaced_binary_operator", ""},
    TokenKindInfo{TokenKind::postfix_operator, "postfix_operator", ""},
    TokenKindInfo{TokenKind::prefix_operator, "prefix_operator", ""},
    TokenKindInfo{TokenKind::dollarident, "dollarident", ""},
    TokenKindInfo{TokenKind::contextual_keyword, "contextual_keyword", ""},
    TokenKindInfo{TokenKind::raw_string_delimiter, "raw_string_delimiter", ""},
    TokenKindInfo{TokenKind::string_segment, "string_segment", ""},
    TokenKindInfo{TokenKind::string_interpolation_anchor, "string_interpolation_anchor", ")"},
    TokenKindInfo{TokenKind::eof, "eof", ""},
};

constexpr auto rows_in_enum_order() -> bool {
    for (size_t i = 0; i < TOKEN_KINDS.size(); ++i) {
        if (static_cast<size_t>(TOKEN_KINDS[i].kind) != i) {
            return false;
        }
    }
    return true;
}

static_assert(TOKEN_KINDS.size() == static_cast<size_t>(TokenKind::eof) + 1,
              "TOKEN_KINDS must have one row per TokenKind");
static_assert(rows_in_enum_order(), "TOKEN_KINDS rows must follow TokenKind order");

auto info(TokenKind kind) -> const TokenKindInfo& {
    return TOKEN_KINDS[static_cast<size_t>(kind)];
}

} // namespace

auto token_kind_name(TokenKind kind) -> std::string_view {
    return info(kind).name;
}

auto token_kind_from_name(std::string_view name) -> std::optional<TokenKind> {
    static const std::unordered_map<std::string_view, TokenKind> by_name = [] {
        std::unordered_map<std::string_view, TokenKind> map;
        for (const auto& row : TOKEN_KINDS) {
            map.emplace(row.name, row.kind);
        }
        return map;
    }();

    auto it = by_name.find(name);
    if (it == by_name.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto fixed_token_text(TokenKind kind) -> std::optional<std::string_view> {
    // eof has no text but is still a fixed token
    if (kind == TokenKind::eof) {
        return std::string_view{};
    }
    const auto& row = info(kind);
    if (row.text.empty()) {
        return std::nullopt;
    }
    return row.text;
}

auto is_keyword(TokenKind kind) -> bool {
    return kind <= TokenKind::kw__;
}

auto is_pound_keyword(TokenKind kind) -> bool {
    return kind >= TokenKind::pound_keyPath && kind <= TokenKind::pound_colorLiteral;
}

} // namespace lth::syntax
