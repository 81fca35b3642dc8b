//! # JSON Parser
//!
//! A lexer and recursive descent parser that turns serialized syntax trees
//! into `JsonValue` documents.
//!
//! Numbers without a fraction or exponent are kept as integers so that node
//! ids survive exactly. Strings are unescaped into UTF-8, including
//! `\uXXXX` surrogate pairs. Nesting is limited to `MAX_DEPTH` levels.
//!
//! ```cpp
//! auto result = parse_json(R"({"id": 3, "presence": "Present"})");
//! if (is_ok(result)) {
//!     auto id = unwrap(result).get("id")->try_as_u64();
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <optional>
#include <string_view>

namespace lth::json {

/// Lexical elements of JSON (RFC 8259).
enum class JsonTokenKind : uint8_t {
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    Colon,
    Comma,
    String,
    Number,
    True,
    False,
    Null,
    Eof,
    Error
};

/// A token produced by `JsonLexer`.
///
/// `text` holds the unescaped content of a string token, or the error
/// message of an `Error` token.
struct JsonToken {
    JsonTokenKind kind = JsonTokenKind::Eof;
    size_t line = 1;
    size_t column = 1;
    size_t offset = 0;
    std::string text;
    JsonNumber number;
};

/// Splits JSON input into tokens, one at a time.
class JsonLexer {
public:
    explicit JsonLexer(std::string_view input);

    /// Returns the next token. Returns `Eof` forever once the input is
    /// exhausted, and an `Error` token on malformed input.
    auto next_token() -> JsonToken;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= input_.size();
    }
    [[nodiscard]] auto peek() const -> char {
        return at_end() ? '\0' : input_[pos_];
    }
    auto advance() -> char;
    void skip_whitespace();

    auto scan_string(JsonToken token) -> JsonToken;
    auto scan_number(JsonToken token) -> JsonToken;
    auto scan_keyword(JsonToken token) -> JsonToken;

    /// Reads four hex digits of a `\u` escape.
    auto scan_hex4() -> std::optional<uint32_t>;

    static auto error_token(JsonToken token, std::string message) -> JsonToken;
};

/// Recursive descent parser over `JsonLexer` tokens.
class JsonParser {
public:
    explicit JsonParser(std::string_view input);

    /// Parses exactly one JSON value followed by end of input.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

    static constexpr size_t MAX_DEPTH = 4096;

private:
    JsonLexer lexer_;
    JsonToken current_;
    size_t depth_ = 0;

    void advance();
    [[nodiscard]] auto make_error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
};

/// Parses a complete JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace lth::json
