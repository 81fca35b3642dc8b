//! # Token Kinds
//!
//! The closed set of token kinds that can appear in a serialized syntax
//! tree. Each kind has a serialized name (`kw_let`, `l_paren`,
//! `identifier`, ...) which is what both tree formats carry.
//!
//! Kinds fall into two groups:
//!
//! - **Fixed tokens** (keywords, punctuation, `#` keywords) always have the
//!   same text, so a serialized token may omit it.
//! - **Payload tokens** (identifiers, literals, operators, string segments)
//!   carry their text in the serialized form.

#ifndef LTH_SYNTAX_TOKEN_KIND_HPP
#define LTH_SYNTAX_TOKEN_KIND_HPP

#include <cstdint>
#include <optional>
#include <string_view>

namespace lth::syntax {

enum class TokenKind : uint8_t {
    // ========================================================================
    // Declaration Keywords
    // ========================================================================
    kw_associatedtype,
    kw_class,
    kw_deinit,
    kw_enum,
    kw_extension,
    kw_func,
    kw_import,
    kw_init,
    kw_inout,
    kw_let,
    kw_operator,
    kw_precedencegroup,
    kw_protocol,
    kw_struct,
    kw_subscript,
    kw_typealias,
    kw_var,
    kw_fileprivate,
    kw_internal,
    kw_private,
    kw_public,
    kw_static,

    // ========================================================================
    // Statement Keywords
    // ========================================================================
    kw_defer,
    kw_if,
    kw_guard,
    kw_do,
    kw_repeat,
    kw_else,
    kw_for,
    kw_in,
    kw_while,
    kw_return,
    kw_break,
    kw_continue,
    kw_fallthrough,
    kw_switch,
    kw_case,
    kw_default,
    kw_where,
    kw_catch,
    kw_throw,

    // ========================================================================
    // Expression Keywords
    // ========================================================================
    kw_as,
    kw_Any,
    kw_false,
    kw_is,
    kw_nil,
    kw_rethrows,
    kw_super,
    kw_self,
    kw_Self,
    kw_true,
    kw_try,
    kw_throws,
    kw___FILE__,
    kw___LINE__,
    kw___COLUMN__,
    kw___FUNCTION__,
    kw___DSO_HANDLE__,
    kw__, ///< `_` wildcard

    // ========================================================================
    // Punctuation
    // ========================================================================
    l_paren,
    r_paren,
    l_brace,
    r_brace,
    l_square,
    r_square,
    l_angle,
    r_angle,
    period,
    prefix_period,
    comma,
    ellipsis,
    colon,
    semi,
    equal,
    at_sign,
    pound,
    prefix_amp,
    arrow,
    backtick,
    backslash,
    exclaim_postfix,
    postfix_question_mark,
    infix_question_mark,
    string_quote,
    single_quote,
    multiline_string_quote,

    // ========================================================================
    // Pound Keywords
    // ========================================================================
    pound_keyPath,
    pound_line,
    pound_selector,
    pound_file,
    pound_column,
    pound_function,
    pound_dsohandle,
    pound_assert,
    pound_sourceLocation,
    pound_warning,
    pound_error,
    pound_if,
    pound_else,
    pound_elseif,
    pound_endif,
    pound_available,
    pound_fileLiteral,
    pound_imageLiteral,
    pound_colorLiteral,

    // ========================================================================
    // Payload Tokens
    // ========================================================================
    integer_literal,
    floating_literal,
    string_literal,
    unknown,
    identifier,
    unspaced_binary_operator,
    spaced_binary_operator,
    postfix_operator,
    prefix_operator,
    dollarident,
    contextual_keyword,
    raw_string_delimiter,
    string_segment,
    string_interpolation_anchor,
    eof,
};

/// Serialized name of a token kind (e.g. "kw_let").
[[nodiscard]] auto token_kind_name(TokenKind kind) -> std::string_view;

/// Looks up a token kind by its serialized name.
[[nodiscard]] auto token_kind_from_name(std::string_view name) -> std::optional<TokenKind>;

/// Text of a fixed token, or `nullopt` for payload tokens.
[[nodiscard]] auto fixed_token_text(TokenKind kind) -> std::optional<std::string_view>;

[[nodiscard]] auto is_keyword(TokenKind kind) -> bool;
[[nodiscard]] auto is_pound_keyword(TokenKind kind) -> bool;

} // namespace lth::syntax

#endif // LTH_SYNTAX_TOKEN_KIND_HPP
