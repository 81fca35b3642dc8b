//! # JSON Value Implementation

#include "json/json_value.hpp"

namespace lth::json {

auto JsonValue::type_name() const -> const char* {
    switch (data.index()) {
    case 0:
        return "null";
    case 1:
        return "bool";
    case 2:
        return "number";
    case 3:
        return "string";
    case 4:
        return "array";
    case 5:
        return "object";
    default:
        return "invalid";
    }
}

} // namespace lth::json
