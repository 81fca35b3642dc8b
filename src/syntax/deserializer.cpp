//! # Deserializer Session

#include "syntax/deserializer.hpp"

#include "log/log.hpp"

namespace lth::syntax {

auto serialization_format_name(SerializationFormat format) -> std::string_view {
    switch (format) {
    case SerializationFormat::Json:
        return "json";
    case SerializationFormat::ByteTree:
        return "byteTree";
    }
    return "json";
}

auto SyntaxTreeDeserializer::deserialize(std::string_view bytes, SerializationFormat format)
    -> Result<RawSyntaxPtr, SyntaxError> {
    LTH_LOG_DEBUG("deserialize", "Reading " << bytes.size() << " bytes as "
                                            << serialization_format_name(format) << " ("
                                            << lookup_table_.size() << " nodes known)");

    auto result = format == SerializationFormat::ByteTree ? read_byte_tree(bytes, lookup_table_)
                                                          : read_json_tree(bytes, lookup_table_);

    if (is_ok(result)) {
        LTH_LOG_DEBUG("deserialize", "Session now knows " << lookup_table_.size() << " nodes");
    } else {
        LTH_LOG_DEBUG("deserialize", "Failed: " << unwrap_err(result).message);
    }
    return result;
}

auto SyntaxTreeDeserializer::lookup(uint64_t id) const -> RawSyntaxPtr {
    auto it = lookup_table_.find(id);
    if (it == lookup_table_.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace lth::syntax
