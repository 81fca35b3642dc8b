//! # Syntax Tree Deserializer
//!
//! Reads serialized syntax trees in either of two formats:
//!
//! | Format | Payload |
//! |--------|---------|
//! | `Json` | one JSON object per node, nested through `"layout"` arrays |
//! | `ByteTree` | little-endian binary, length-prefixed scalars and objects |
//!
//! ## Sessions
//!
//! A `SyntaxTreeDeserializer` is a session. Every node that carries an id is
//! recorded in the session's lookup table, and a later payload may refer to
//! a recorded node by id instead of repeating it ("omitted" nodes). This is
//! how an incremental tree transfer reuses the unchanged parts of the
//! previous tree:
//!
//! ```cpp
//! SyntaxTreeDeserializer session;
//! auto pre_edit = session.deserialize(pre_edit_bytes, SerializationFormat::Json);
//! auto post_edit = session.deserialize(incremental_bytes, SerializationFormat::Json);
//! ```
//!
//! An omitted node whose id is not in the table is an error.

#ifndef LTH_SYNTAX_DESERIALIZER_HPP
#define LTH_SYNTAX_DESERIALIZER_HPP

#include "common.hpp"
#include "syntax/raw_syntax.hpp"
#include "syntax/syntax_error.hpp"

#include <cstdint>
#include <string_view>
#include <unordered_map>

namespace lth::syntax {

enum class SerializationFormat : uint8_t {
    Json,
    ByteTree,
};

/// Command-line name of a format ("json" or "byteTree").
[[nodiscard]] auto serialization_format_name(SerializationFormat format) -> std::string_view;

/// Id-to-node table shared by all payloads of one session.
using NodeLookupTable = std::unordered_map<uint64_t, RawSyntaxPtr>;

/// Major ByteTree protocol version this reader understands.
constexpr uint32_t BYTE_TREE_MAJOR_VERSION = 1;

class SyntaxTreeDeserializer {
public:
    /// Deserializes one payload, resolving omitted nodes against (and
    /// recording new ids into) the session's lookup table.
    [[nodiscard]] auto deserialize(std::string_view bytes, SerializationFormat format)
        -> Result<RawSyntaxPtr, SyntaxError>;

    /// Node recorded under `id`, or null.
    [[nodiscard]] auto lookup(uint64_t id) const -> RawSyntaxPtr;

    /// Number of nodes recorded so far.
    [[nodiscard]] auto recorded_nodes() const -> size_t {
        return lookup_table_.size();
    }

private:
    NodeLookupTable lookup_table_;
};

/// Reads a JSON tree payload. Used by `SyntaxTreeDeserializer`.
[[nodiscard]] auto read_json_tree(std::string_view bytes, NodeLookupTable& table)
    -> Result<RawSyntaxPtr, SyntaxError>;

/// Reads a ByteTree payload. Used by `SyntaxTreeDeserializer`.
[[nodiscard]] auto read_byte_tree(std::string_view bytes, NodeLookupTable& table)
    -> Result<RawSyntaxPtr, SyntaxError>;

} // namespace lth::syntax

#endif // LTH_SYNTAX_DESERIALIZER_HPP
