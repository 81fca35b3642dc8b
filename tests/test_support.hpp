//! # Test Support
//!
//! Temporary directories, tree fixtures in both serialization formats, and
//! small builders for in-memory syntax trees.

#pragma once

#include "syntax/raw_syntax.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lth::test {

namespace fs = std::filesystem;

// ============================================================================
// Files
// ============================================================================

/// A fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::string pattern = (fs::temp_directory_path() / "lth_test_XXXXXX").string();
        if (!mkdtemp(pattern.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const fs::path& {
        return path_;
    }

    /// Absolute path of `name` inside the directory, as a string.
    [[nodiscard]] auto file(const std::string& name) const -> std::string {
        return (path_ / name).string();
    }

private:
    fs::path path_;
};

inline void write_text(const std::string& path, std::string_view content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
}

inline auto read_text(const std::string& path) -> std::string {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

/// Writes an executable `/bin/sh` script.
inline void write_script(const std::string& path, const std::string& body) {
    write_text(path, "#!/bin/sh\n" + body);
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
}

// ============================================================================
// JSON tree fixtures
// ============================================================================

inline auto json_escape(std::string_view text) -> std::string {
    std::string out;
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        default:
            out += c;
        }
    }
    return out;
}

/// `[{"kind":"Space","value":n}]`, or `[]` for n == 0.
inline auto json_spaces(int n) -> std::string {
    if (n == 0) {
        return "[]";
    }
    return R"([{"kind":"Space","value":)" + std::to_string(n) + "}]";
}

/// A token node. An id of 0 means "no id"; empty text omits the text field.
inline auto json_token(uint64_t id, std::string_view kind, std::string_view text,
                       const std::string& leading = "[]", const std::string& trailing = "[]",
                       std::string_view presence = "Present") -> std::string {
    std::string out = "{";
    if (id != 0) {
        out += R"("id":)" + std::to_string(id) + ",";
    }
    out += R"("tokenKind":{"kind":")" + std::string(kind) + "\"";
    if (!text.empty()) {
        out += R"(,"text":")" + json_escape(text) + "\"";
    }
    out += "},";
    out += R"("leadingTrivia":)" + leading + ",";
    out += R"("trailingTrivia":)" + trailing + ",";
    out += R"("presence":")" + std::string(presence) + "\"}";
    return out;
}

/// A layout node. Use `"null"` for absent children.
inline auto json_layout(uint64_t id, std::string_view kind, const std::vector<std::string>& children,
                        std::string_view presence = "Present") -> std::string {
    std::string out = "{";
    if (id != 0) {
        out += R"("id":)" + std::to_string(id) + ",";
    }
    out += R"("kind":")" + std::string(kind) + R"(","layout":[)";
    for (size_t i = 0; i < children.size(); ++i) {
        if (i > 0) {
            out += ",";
        }
        out += children[i];
    }
    out += R"(],"presence":")" + std::string(presence) + "\"}";
    return out;
}

inline auto json_omitted(uint64_t id) -> std::string {
    return R"({"id":)" + std::to_string(id) + R"(,"omitted":true})";
}

/// `let x = <value>` as a full tree. Node ids are 1..14.
inline auto let_decl_json(std::string_view value = "1") -> std::string {
    auto initializer = json_layout(
        10, "InitializerClause",
        {json_token(11, "equal", "", "[]", json_spaces(1)),
         json_layout(12, "IntegerLiteralExpr", {json_token(13, "integer_literal", value)})});
    auto binding = json_layout(
        7, "PatternBinding",
        {json_layout(8, "IdentifierPattern",
                     {json_token(9, "identifier", "x", "[]", json_spaces(1))}),
         "null", initializer, "null", "null"});
    auto decl = json_layout(4, "VariableDecl",
                            {"null", "null", json_token(5, "kw_let", "", "[]", json_spaces(1)),
                             json_layout(6, "PatternBindingList", {binding})});
    auto item = json_layout(3, "CodeBlockItem", {decl, "null", "null"});
    return json_layout(1, "SourceFile",
                       {json_layout(2, "CodeBlockItemList", {item}), json_token(14, "eof", "")});
}

/// Incremental transfer of `let x = <value>` against `let_decl_json()`:
/// `let`, the pattern, `=` and the eof token are reused by id.
inline auto let_decl_incremental_json(std::string_view value) -> std::string {
    auto initializer = json_layout(
        27, "InitializerClause",
        {json_omitted(11),
         json_layout(28, "IntegerLiteralExpr", {json_token(29, "integer_literal", value)})});
    auto binding =
        json_layout(26, "PatternBinding", {json_omitted(8), "null", initializer, "null", "null"});
    auto decl = json_layout(24, "VariableDecl",
                            {"null", "null", json_omitted(5),
                             json_layout(25, "PatternBindingList", {binding})});
    auto item = json_layout(23, "CodeBlockItem", {decl, "null", "null"});
    return json_layout(21, "SourceFile",
                       {json_layout(22, "CodeBlockItemList", {item}), json_omitted(14)});
}

// ============================================================================
// ByteTree fixtures
// ============================================================================

/// Builds ByteTree payloads field by field.
class ByteTreeWriter {
public:
    struct Piece {
        std::string kind;
        uint32_t count = 0;
        std::string text;
    };

    explicit ByteTreeWriter(uint32_t version = 0x00010000) {
        u32(version);
    }

    void u32(uint32_t value) {
        for (int i = 0; i < 4; ++i) {
            out_.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
        }
    }

    void object(uint32_t fields) {
        u32(0x80000000u | fields);
    }

    void scalar(std::string_view bytes) {
        u32(static_cast<uint32_t>(bytes.size()));
        out_ += bytes;
    }

    void scalar_u8(uint8_t value) {
        u32(1);
        out_.push_back(static_cast<char>(value));
    }

    void scalar_u32(uint32_t value) {
        u32(4);
        u32(value);
    }

    /// An empty scalar: an absent child or a missing id.
    void empty() {
        u32(0);
    }

    void token(uint32_t id, std::string_view kind, std::string_view text,
               const std::vector<Piece>& leading = {}, const std::vector<Piece>& trailing = {},
               uint32_t extra_fields = 0) {
        object(7 + extra_fields);
        scalar_u8(0);
        scalar_u32(id);
        scalar_u8(1);
        scalar(kind);
        scalar(text);
        trivia(leading);
        trivia(trailing);
        extras(extra_fields);
    }

    /// Starts a layout node; write `child_count` children next, then call
    /// `extras(extra_fields)`.
    void begin_layout(uint32_t id, std::string_view kind, uint32_t child_count,
                      uint32_t extra_fields = 0) {
        object(5 + extra_fields);
        scalar_u8(1);
        scalar_u32(id);
        scalar_u8(1);
        scalar(kind);
        object(child_count);
    }

    void omitted(uint32_t id) {
        object(2);
        scalar_u8(2);
        scalar_u32(id);
    }

    /// Unknown trailing fields of a newer writer.
    void extras(uint32_t count) {
        for (uint32_t i = 0; i < count; ++i) {
            scalar("future");
        }
    }

    [[nodiscard]] auto bytes() const -> const std::string& {
        return out_;
    }

private:
    std::string out_;

    void trivia(const std::vector<Piece>& pieces) {
        object(static_cast<uint32_t>(pieces.size()));
        for (const auto& piece : pieces) {
            object(2);
            scalar(piece.kind);
            if (piece.text.empty()) {
                scalar_u32(piece.count);
            } else {
                scalar(piece.text);
            }
        }
    }
};

/// `let x = 1` as a ByteTree payload, with `extra_fields` unknown fields
/// appended to every node.
inline auto let_decl_byte_tree(uint32_t extra_fields = 0, uint32_t version = 0x00010000)
    -> std::string {
    const std::vector<ByteTreeWriter::Piece> space = {{"Space", 1, ""}};
    ByteTreeWriter w(version);
    w.begin_layout(1, "SourceFile", 2, extra_fields);
    {
        w.begin_layout(2, "CodeBlockItemList", 1, extra_fields);
        w.begin_layout(3, "CodeBlockItem", 3, extra_fields);
        {
            w.begin_layout(4, "VariableDecl", 4, extra_fields);
            w.empty();
            w.empty();
            w.token(5, "kw_let", "let", {}, space, extra_fields);
            w.begin_layout(6, "PatternBindingList", 1, extra_fields);
            {
                w.begin_layout(7, "PatternBinding", 5, extra_fields);
                w.begin_layout(8, "IdentifierPattern", 1, extra_fields);
                w.token(9, "identifier", "x", {}, space, extra_fields);
                w.extras(extra_fields);
                w.empty();
                w.begin_layout(10, "InitializerClause", 2, extra_fields);
                w.token(11, "equal", "=", {}, space, extra_fields);
                w.begin_layout(12, "IntegerLiteralExpr", 1, extra_fields);
                w.token(13, "integer_literal", "1", {}, {}, extra_fields);
                w.extras(extra_fields);
                w.extras(extra_fields);
                w.empty();
                w.empty();
                w.extras(extra_fields);
            }
            w.extras(extra_fields);
            w.extras(extra_fields);
            w.empty();
            w.empty();
        }
        w.extras(extra_fields);
        w.extras(extra_fields);
        w.token(14, "eof", "", {}, {}, extra_fields);
    }
    w.extras(extra_fields);
    return w.bytes();
}

// ============================================================================
// In-memory trees
// ============================================================================

inline auto spaces(uint64_t n) -> syntax::Trivia {
    return {syntax::TriviaPiece::counted(syntax::TriviaKind::Space, n)};
}

inline auto tok(syntax::TokenKind kind, std::string text, syntax::Trivia leading = {},
                syntax::Trivia trailing = {}) -> syntax::RawSyntaxPtr {
    return syntax::RawSyntax::make_token(
        syntax::TokenData{kind, std::move(text), std::move(leading), std::move(trailing)});
}

inline auto missing_tok(syntax::TokenKind kind) -> syntax::RawSyntaxPtr {
    return syntax::RawSyntax::make_token(syntax::TokenData{kind, "", {}, {}}, std::nullopt,
                                         syntax::SourcePresence::Missing);
}

inline auto node(syntax::SyntaxKind kind, std::vector<syntax::RawSyntaxPtr> children)
    -> syntax::RawSyntaxPtr {
    return syntax::RawSyntax::make_layout(syntax::LayoutData{kind, std::move(children)});
}

} // namespace lth::test
