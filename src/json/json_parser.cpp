//! # JSON Parser Implementation
//!
//! The lexer works on a `std::string_view` and tracks line/column for every
//! token. The parser keeps one token of lookahead in `current_`.

#include "json/json_parser.hpp"

#include <charconv>
#include <cstdlib>
#include <string>

namespace lth::json {

// ============================================================================
// JsonLexer
// ============================================================================

namespace {

/// Appends a code point to `out` as UTF-8.
void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

} // namespace

JsonLexer::JsonLexer(std::string_view input) : input_(input) {}

auto JsonLexer::advance() -> char {
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonLexer::skip_whitespace() {
    while (!at_end()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonLexer::error_token(JsonToken token, std::string message) -> JsonToken {
    token.kind = JsonTokenKind::Error;
    token.text = std::move(message);
    return token;
}

auto JsonLexer::next_token() -> JsonToken {
    skip_whitespace();

    JsonToken token;
    token.line = line_;
    token.column = column_;
    token.offset = pos_;

    if (at_end()) {
        token.kind = JsonTokenKind::Eof;
        return token;
    }

    char c = peek();
    switch (c) {
    case '{':
        advance();
        token.kind = JsonTokenKind::LBrace;
        return token;
    case '}':
        advance();
        token.kind = JsonTokenKind::RBrace;
        return token;
    case '[':
        advance();
        token.kind = JsonTokenKind::LBracket;
        return token;
    case ']':
        advance();
        token.kind = JsonTokenKind::RBracket;
        return token;
    case ':':
        advance();
        token.kind = JsonTokenKind::Colon;
        return token;
    case ',':
        advance();
        token.kind = JsonTokenKind::Comma;
        return token;
    case '"':
        return scan_string(std::move(token));
    default:
        break;
    }

    if (c == '-' || is_digit(c)) {
        return scan_number(std::move(token));
    }
    if (c >= 'a' && c <= 'z') {
        return scan_keyword(std::move(token));
    }

    advance();
    return error_token(std::move(token), std::string("Unexpected character '") + c + "'");
}

auto JsonLexer::scan_hex4() -> std::optional<uint32_t> {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        if (at_end()) {
            return std::nullopt;
        }
        char h = advance();
        value <<= 4;
        if (h >= '0' && h <= '9') {
            value |= static_cast<uint32_t>(h - '0');
        } else if (h >= 'a' && h <= 'f') {
            value |= static_cast<uint32_t>(h - 'a' + 10);
        } else if (h >= 'A' && h <= 'F') {
            value |= static_cast<uint32_t>(h - 'A' + 10);
        } else {
            return std::nullopt;
        }
    }
    return value;
}

auto JsonLexer::scan_string(JsonToken token) -> JsonToken {
    advance(); // opening quote
    std::string out;

    while (true) {
        if (at_end()) {
            return error_token(std::move(token), "Unterminated string");
        }
        char c = advance();
        if (c == '"') {
            break;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return error_token(std::move(token), "Unescaped control character in string");
        }
        if (c != '\\') {
            out.push_back(c);
            continue;
        }

        if (at_end()) {
            return error_token(std::move(token), "Unterminated escape sequence");
        }
        char esc = advance();
        switch (esc) {
        case '"':
            out.push_back('"');
            break;
        case '\\':
            out.push_back('\\');
            break;
        case '/':
            out.push_back('/');
            break;
        case 'b':
            out.push_back('\b');
            break;
        case 'f':
            out.push_back('\f');
            break;
        case 'n':
            out.push_back('\n');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'u': {
            auto cp = scan_hex4();
            if (!cp) {
                return error_token(std::move(token), "Invalid \\u escape");
            }
            uint32_t code = *cp;
            if (code >= 0xDC00 && code <= 0xDFFF) {
                return error_token(std::move(token), "Unpaired low surrogate in \\u escape");
            }
            if (code >= 0xD800 && code <= 0xDBFF) {
                if (peek() != '\\') {
                    return error_token(std::move(token), "Unpaired high surrogate in \\u escape");
                }
                advance();
                if (at_end() || advance() != 'u') {
                    return error_token(std::move(token), "Unpaired high surrogate in \\u escape");
                }
                auto low = scan_hex4();
                if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                    return error_token(std::move(token), "Invalid low surrogate in \\u escape");
                }
                code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
            }
            append_utf8(out, code);
            break;
        }
        default:
            return error_token(std::move(token), std::string("Invalid escape '\\") + esc + "'");
        }
    }

    token.kind = JsonTokenKind::String;
    token.text = std::move(out);
    return token;
}

auto JsonLexer::scan_number(JsonToken token) -> JsonToken {
    size_t start = pos_;
    bool negative = false;
    bool is_float = false;

    if (peek() == '-') {
        negative = true;
        advance();
    }

    if (peek() == '0') {
        advance();
    } else if (is_digit(peek())) {
        while (is_digit(peek())) {
            advance();
        }
    } else {
        return error_token(std::move(token), "Expected digit in number");
    }

    if (peek() == '.') {
        is_float = true;
        advance();
        if (!is_digit(peek())) {
            return error_token(std::move(token), "Expected digit after decimal point");
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!is_digit(peek())) {
            return error_token(std::move(token), "Expected digit in exponent");
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    std::string_view text = input_.substr(start, pos_ - start);
    const char* first = text.data();
    const char* last = text.data() + text.size();
    token.kind = JsonTokenKind::Number;

    if (!is_float) {
        int64_t i64 = 0;
        auto [ptr, ec] = std::from_chars(first, last, i64);
        if (ec == std::errc{} && ptr == last) {
            token.number = JsonNumber(i64);
            return token;
        }
        if (!negative) {
            uint64_t u64 = 0;
            auto [uptr, uec] = std::from_chars(first, last, u64);
            if (uec == std::errc{} && uptr == last) {
                token.number = JsonNumber(u64);
                return token;
            }
        }
        // Out of integer range; fall through to double.
    }

    token.number = JsonNumber(std::strtod(std::string(text).c_str(), nullptr));
    return token;
}

auto JsonLexer::scan_keyword(JsonToken token) -> JsonToken {
    size_t start = pos_;
    while (!at_end() && peek() >= 'a' && peek() <= 'z') {
        advance();
    }
    std::string_view word = input_.substr(start, pos_ - start);

    if (word == "true") {
        token.kind = JsonTokenKind::True;
    } else if (word == "false") {
        token.kind = JsonTokenKind::False;
    } else if (word == "null") {
        token.kind = JsonTokenKind::Null;
    } else {
        return error_token(std::move(token), "Unknown literal '" + std::string(word) + "'");
    }
    return token;
}

// ============================================================================
// JsonParser
// ============================================================================

JsonParser::JsonParser(std::string_view input) : lexer_(input) {
    advance();
}

void JsonParser::advance() {
    current_ = lexer_.next_token();
}

auto JsonParser::make_error(const std::string& msg) const -> JsonError {
    const std::string& text = current_.kind == JsonTokenKind::Error ? current_.text : msg;
    return JsonError::make(text, current_.line, current_.column, current_.offset);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }
    if (current_.kind != JsonTokenKind::Eof) {
        return make_error("Unexpected content after JSON value");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    switch (current_.kind) {
    case JsonTokenKind::LBrace:
        return parse_object();
    case JsonTokenKind::LBracket:
        return parse_array();
    case JsonTokenKind::String: {
        JsonValue value(std::move(current_.text));
        advance();
        return value;
    }
    case JsonTokenKind::Number: {
        JsonValue value(current_.number);
        advance();
        return value;
    }
    case JsonTokenKind::True:
        advance();
        return JsonValue(true);
    case JsonTokenKind::False:
        advance();
        return JsonValue(false);
    case JsonTokenKind::Null:
        advance();
        return JsonValue();
    case JsonTokenKind::Eof:
        return make_error("Unexpected end of input");
    default:
        return make_error("Expected a JSON value");
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("Maximum nesting depth exceeded");
    }
    advance(); // '{'

    JsonObject object;
    if (current_.kind == JsonTokenKind::RBrace) {
        advance();
        --depth_;
        return JsonValue(std::move(object));
    }

    while (true) {
        if (current_.kind != JsonTokenKind::String) {
            return make_error("Expected string key in object");
        }
        std::string key = std::move(current_.text);
        advance();

        if (current_.kind != JsonTokenKind::Colon) {
            return make_error("Expected ':' after object key");
        }
        advance();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        object.insert_or_assign(std::move(key), std::move(unwrap(value)));

        if (current_.kind == JsonTokenKind::Comma) {
            advance();
            continue;
        }
        if (current_.kind == JsonTokenKind::RBrace) {
            advance();
            break;
        }
        return make_error("Expected ',' or '}' in object");
    }

    --depth_;
    return JsonValue(std::move(object));
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("Maximum nesting depth exceeded");
    }
    advance(); // '['

    JsonArray array;
    if (current_.kind == JsonTokenKind::RBracket) {
        advance();
        --depth_;
        return JsonValue(std::move(array));
    }

    while (true) {
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        array.push_back(std::move(unwrap(value)));

        if (current_.kind == JsonTokenKind::Comma) {
            advance();
            continue;
        }
        if (current_.kind == JsonTokenKind::RBracket) {
            advance();
            break;
        }
        return make_error("Expected ',' or ']' in array");
    }

    --depth_;
    return JsonValue(std::move(array));
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace lth::json
