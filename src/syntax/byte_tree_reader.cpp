//! # ByteTree Reader
//!
//! Binary tree format. All integers are little-endian.
//!
//! ```text
//! stream  := u32 version, value
//! value   := u32 header, body
//! header  := bit 31 set   -> object, low bits = number of fields
//!            bit 31 clear -> scalar, low bits = byte length
//! ```
//!
//! Node object fields:
//!
//! | Field | Token | Layout | Omitted |
//! |-------|-------|--------|---------|
//! | 0 | tag `u8` = 0 | tag `u8` = 1 | tag `u8` = 2 |
//! | 1 | id `u32` | id `u32` | id `u32` |
//! | 2 | presence `u8` | presence `u8` | |
//! | 3 | kind name | kind name | |
//! | 4 | text | children object | |
//! | 5 | leading trivia object | | |
//! | 6 | trailing trivia object | | |
//!
//! An empty scalar in a children object is an absent child, and an empty id
//! scalar means the node has no id. Fields after the ones listed are skipped
//! so newer writers can append fields.
//!
//! Every field needs at least its 4-byte header, so an object header claiming
//! more fields than the remaining bytes can hold is rejected before anything
//! is allocated. Objects nest at most `MAX_DEPTH` levels.

#include "syntax/deserializer.hpp"

#include <string>

namespace lth::syntax {

namespace {

constexpr uint32_t OBJECT_BIT = 0x80000000u;

enum class NodeTag : uint8_t {
    Token = 0,
    Layout = 1,
    Omitted = 2,
};

struct Header {
    bool is_object;
    uint32_t size; ///< Field count for objects, byte length for scalars
};

auto error(std::string message) -> SyntaxError {
    return SyntaxError::make("malformed ByteTree syntax tree: " + std::move(message));
}

class ByteTreeReader {
public:
    ByteTreeReader(std::string_view bytes, NodeLookupTable& table) : bytes_(bytes), table_(table) {}

    auto read() -> Result<RawSyntaxPtr, SyntaxError>;

    static constexpr size_t MAX_DEPTH = 1024;

private:
    std::string_view bytes_;
    size_t pos_ = 0;
    NodeLookupTable& table_;
    size_t depth_ = 0;
    uint64_t repeated_ = 0; ///< Sum of trivia repeat counts read so far

    auto read_u32() -> Result<uint32_t, SyntaxError>;
    auto read_header() -> Result<Header, SyntaxError>;
    auto read_bytes(uint32_t length) -> Result<std::string_view, SyntaxError>;

    /// Reads a scalar field and checks its length.
    auto read_scalar(uint32_t expected_length, const char* what)
        -> Result<std::string_view, SyntaxError>;
    auto read_string(const char* what) -> Result<std::string, SyntaxError>;

    /// Skips one value of any shape.
    auto skip_value() -> Result<bool, SyntaxError>;
    auto skip_fields(uint32_t count) -> Result<bool, SyntaxError>;

    /// Reads a child slot: an object node, or an empty scalar for absent.
    auto read_child() -> Result<RawSyntaxPtr, SyntaxError>;
    auto read_node_fields(uint32_t field_count) -> Result<RawSyntaxPtr, SyntaxError>;
    auto read_trivia(Trivia& out) -> Result<bool, SyntaxError>;
};

auto decode_u32(std::string_view bytes) -> uint32_t {
    auto b = [&](size_t i) { return static_cast<uint32_t>(static_cast<uint8_t>(bytes[i])); };
    return b(0) | (b(1) << 8) | (b(2) << 16) | (b(3) << 24);
}

auto ByteTreeReader::read_bytes(uint32_t length) -> Result<std::string_view, SyntaxError> {
    if (bytes_.size() - pos_ < length) {
        return error("unexpected end of data at offset " + std::to_string(pos_));
    }
    auto view = bytes_.substr(pos_, length);
    pos_ += length;
    return view;
}

auto ByteTreeReader::read_u32() -> Result<uint32_t, SyntaxError> {
    auto raw = read_bytes(4);
    if (is_err(raw)) {
        return unwrap_err(raw);
    }
    return decode_u32(unwrap(raw));
}

auto ByteTreeReader::read_header() -> Result<Header, SyntaxError> {
    auto raw = read_u32();
    if (is_err(raw)) {
        return unwrap_err(raw);
    }
    uint32_t value = unwrap(raw);
    Header header{(value & OBJECT_BIT) != 0, value & ~OBJECT_BIT};
    if (header.is_object && header.size > (bytes_.size() - pos_) / 4) {
        return error("object of " + std::to_string(header.size) + " fields at offset " +
                     std::to_string(pos_ - 4) + " exceeds the remaining data");
    }
    return header;
}

auto ByteTreeReader::read_scalar(uint32_t expected_length, const char* what)
    -> Result<std::string_view, SyntaxError> {
    auto header = read_header();
    if (is_err(header)) {
        return unwrap_err(header);
    }
    const auto& h = unwrap(header);
    if (h.is_object || h.size != expected_length) {
        return error(std::string(what) + " must be a " + std::to_string(expected_length) +
                     "-byte scalar");
    }
    return read_bytes(h.size);
}

auto ByteTreeReader::read_string(const char* what) -> Result<std::string, SyntaxError> {
    auto header = read_header();
    if (is_err(header)) {
        return unwrap_err(header);
    }
    const auto& h = unwrap(header);
    if (h.is_object) {
        return error(std::string(what) + " must be a scalar");
    }
    auto raw = read_bytes(h.size);
    if (is_err(raw)) {
        return unwrap_err(raw);
    }
    return std::string(unwrap(raw));
}

auto ByteTreeReader::skip_value() -> Result<bool, SyntaxError> {
    auto header = read_header();
    if (is_err(header)) {
        return unwrap_err(header);
    }
    const auto& h = unwrap(header);
    if (h.is_object) {
        if (++depth_ > MAX_DEPTH) {
            return error("maximum nesting depth exceeded");
        }
        auto skipped = skip_fields(h.size);
        --depth_;
        return skipped;
    }
    auto raw = read_bytes(h.size);
    if (is_err(raw)) {
        return unwrap_err(raw);
    }
    return true;
}

auto ByteTreeReader::skip_fields(uint32_t count) -> Result<bool, SyntaxError> {
    for (uint32_t i = 0; i < count; ++i) {
        auto skipped = skip_value();
        if (is_err(skipped)) {
            return skipped;
        }
    }
    return true;
}

auto ByteTreeReader::read() -> Result<RawSyntaxPtr, SyntaxError> {
    auto version = read_u32();
    if (is_err(version)) {
        return error("missing protocol version");
    }
    uint32_t major = unwrap(version) >> 16;
    uint32_t minor = unwrap(version) & 0xFFFF;
    if (major != BYTE_TREE_MAJOR_VERSION) {
        return SyntaxError::make("unsupported ByteTree protocol version " + std::to_string(major) +
                                 "." + std::to_string(minor) + " (expected major version " +
                                 std::to_string(BYTE_TREE_MAJOR_VERSION) + ")");
    }

    auto root = read_child();
    if (is_err(root)) {
        return root;
    }
    if (!unwrap(root)) {
        return error("tree has no root node");
    }
    if (pos_ != bytes_.size()) {
        return error(std::to_string(bytes_.size() - pos_) + " trailing bytes after root node");
    }
    return root;
}

auto ByteTreeReader::read_child() -> Result<RawSyntaxPtr, SyntaxError> {
    auto header = read_header();
    if (is_err(header)) {
        return unwrap_err(header);
    }
    const auto& h = unwrap(header);
    if (!h.is_object) {
        if (h.size != 0) {
            return error("child slot must be a node object or an empty scalar");
        }
        return RawSyntaxPtr{};
    }
    if (++depth_ > MAX_DEPTH) {
        return error("maximum nesting depth exceeded");
    }
    auto node = read_node_fields(h.size);
    --depth_;
    return node;
}

auto ByteTreeReader::read_node_fields(uint32_t field_count) -> Result<RawSyntaxPtr, SyntaxError> {
    if (field_count < 2) {
        return error("node object has " + std::to_string(field_count) + " fields");
    }

    auto tag_raw = read_scalar(1, "node tag");
    if (is_err(tag_raw)) {
        return unwrap_err(tag_raw);
    }
    auto tag = static_cast<uint8_t>(unwrap(tag_raw)[0]);

    std::optional<uint64_t> id;
    {
        auto header = read_header();
        if (is_err(header)) {
            return unwrap_err(header);
        }
        const auto& h = unwrap(header);
        if (h.is_object || (h.size != 0 && h.size != 4)) {
            return error("node id must be a 4-byte or empty scalar");
        }
        auto raw = read_bytes(h.size);
        if (is_err(raw)) {
            return unwrap_err(raw);
        }
        if (h.size == 4) {
            id = decode_u32(unwrap(raw));
        }
    }

    if (tag == static_cast<uint8_t>(NodeTag::Omitted)) {
        if (!id) {
            return error("omitted node has no id");
        }
        auto skipped = skip_fields(field_count - 2);
        if (is_err(skipped)) {
            return unwrap_err(skipped);
        }
        auto it = table_.find(*id);
        if (it == table_.end()) {
            return SyntaxError::make("omitted node with id " + std::to_string(*id) +
                                     " was not found in the lookup table");
        }
        return it->second;
    }

    bool is_token = tag == static_cast<uint8_t>(NodeTag::Token);
    if (!is_token && tag != static_cast<uint8_t>(NodeTag::Layout)) {
        return error("unknown node tag " + std::to_string(tag));
    }
    uint32_t known_fields = is_token ? 7 : 5;
    if (field_count < known_fields) {
        return error(std::string(is_token ? "token" : "layout") + " node has " +
                     std::to_string(field_count) + " fields, expected at least " +
                     std::to_string(known_fields));
    }

    auto presence_raw = read_scalar(1, "node presence");
    if (is_err(presence_raw)) {
        return unwrap_err(presence_raw);
    }
    auto presence =
        unwrap(presence_raw)[0] != 0 ? SourcePresence::Present : SourcePresence::Missing;

    auto kind_name = read_string("kind name");
    if (is_err(kind_name)) {
        return unwrap_err(kind_name);
    }

    RawSyntaxPtr node;
    if (is_token) {
        auto kind = token_kind_from_name(unwrap(kind_name));
        if (!kind) {
            return error("unknown token kind '" + unwrap(kind_name) + "'");
        }
        auto text = read_string("token text");
        if (is_err(text)) {
            return unwrap_err(text);
        }
        TokenData token{*kind, std::move(unwrap(text)), {}, {}};
        auto leading = read_trivia(token.leading_trivia);
        if (is_err(leading)) {
            return unwrap_err(leading);
        }
        auto trailing = read_trivia(token.trailing_trivia);
        if (is_err(trailing)) {
            return unwrap_err(trailing);
        }
        node = RawSyntax::make_token(std::move(token), id, presence);
    } else {
        auto kind = syntax_kind_from_name(unwrap(kind_name));
        if (!kind) {
            return error("unknown syntax kind '" + unwrap(kind_name) + "'");
        }
        auto header = read_header();
        if (is_err(header)) {
            return unwrap_err(header);
        }
        const auto h = unwrap(header);
        if (!h.is_object) {
            return error("layout children must be an object");
        }
        LayoutData layout{*kind, {}};
        layout.children.reserve(h.size);
        for (uint32_t i = 0; i < h.size; ++i) {
            auto child = read_child();
            if (is_err(child)) {
                return child;
            }
            layout.children.push_back(std::move(unwrap(child)));
        }
        node = RawSyntax::make_layout(std::move(layout), id, presence);
    }

    auto skipped = skip_fields(field_count - known_fields);
    if (is_err(skipped)) {
        return unwrap_err(skipped);
    }

    if (node->id) {
        table_[*node->id] = node;
    }
    return node;
}

auto ByteTreeReader::read_trivia(Trivia& out) -> Result<bool, SyntaxError> {
    auto header = read_header();
    if (is_err(header)) {
        return unwrap_err(header);
    }
    const auto h = unwrap(header);
    if (!h.is_object) {
        return error("trivia must be an object");
    }

    for (uint32_t i = 0; i < h.size; ++i) {
        auto piece_header = read_header();
        if (is_err(piece_header)) {
            return unwrap_err(piece_header);
        }
        const auto ph = unwrap(piece_header);
        if (!ph.is_object || ph.size < 2) {
            return error("trivia piece must be an object with at least 2 fields");
        }

        auto kind_name = read_string("trivia kind");
        if (is_err(kind_name)) {
            return unwrap_err(kind_name);
        }
        auto kind = trivia_kind_from_name(unwrap(kind_name));
        if (!kind) {
            return error("unknown trivia kind '" + unwrap(kind_name) + "'");
        }

        if (is_count_trivia(*kind)) {
            auto count = read_scalar(4, "trivia count");
            if (is_err(count)) {
                return unwrap_err(count);
            }
            uint32_t repeat = decode_u32(unwrap(count));
            if (repeat > MAX_TRIVIA_REPEAT - repeated_) {
                return error("trivia repeat counts exceed " + std::to_string(MAX_TRIVIA_REPEAT));
            }
            repeated_ += repeat;
            out.push_back(TriviaPiece::counted(*kind, repeat));
        } else {
            auto text = read_string("trivia text");
            if (is_err(text)) {
                return unwrap_err(text);
            }
            out.push_back(TriviaPiece::with_text(*kind, std::move(unwrap(text))));
        }

        auto skipped = skip_fields(ph.size - 2);
        if (is_err(skipped)) {
            return skipped;
        }
    }
    return true;
}

} // namespace

auto read_byte_tree(std::string_view bytes, NodeLookupTable& table)
    -> Result<RawSyntaxPtr, SyntaxError> {
    ByteTreeReader reader(bytes, table);
    return reader.read();
}

} // namespace lth::syntax
