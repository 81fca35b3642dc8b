//! # JSON Value Types
//!
//! The in-memory JSON model that serialized syntax trees are read into before
//! they are turned into `RawSyntax` nodes.
//!
//! ## Number Handling
//!
//! | JSON Input | Storage Type | Reason |
//! |------------|--------------|--------|
//! | `42` | `Int64` | No decimal point |
//! | `18446744073709551615` | `Uint64` | Too large for int64 |
//! | `3.5` | `Double` | Has decimal point or exponent |
//!
//! Node ids and trivia counts are unsigned integers, so integers keep their
//! exact value instead of passing through `double`.
//!
//! ## Ownership
//!
//! Arrays and objects are boxed, which makes `JsonValue` move-only. A parsed
//! document is consumed once by the deserializer and never copied.

#pragma once

#include "common.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lth::json {

struct JsonValue;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

/// A JSON object containing key-value pairs (ordered by key).
using JsonObject = std::map<std::string, JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// Discriminated union for JSON numbers preserving integer precision.
struct JsonNumber {
    enum class Kind : uint8_t {
        Int64,  ///< Signed integer
        Uint64, ///< Unsigned integer above INT64_MAX
        Double  ///< Number with fraction or exponent
    };

    Kind kind = Kind::Int64;

    union {
        int64_t i64;
        uint64_t u64;
        double f64;
    };

    JsonNumber() : i64(0) {}
    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}
    explicit JsonNumber(uint64_t value) : kind(Kind::Uint64), u64(value) {}
    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}

    /// Returns the value as `uint64_t` if it is a non-negative integer.
    [[nodiscard]] auto try_as_u64() const -> std::optional<uint64_t> {
        switch (kind) {
        case Kind::Int64:
            if (i64 < 0)
                return std::nullopt;
            return static_cast<uint64_t>(i64);
        case Kind::Uint64:
            return u64;
        case Kind::Double:
            return std::nullopt;
        }
        return std::nullopt;
    }

    /// Returns the value as `double` (lossy for large integers).
    [[nodiscard]] auto as_f64() const -> double {
        switch (kind) {
        case Kind::Int64:
            return static_cast<double>(i64);
        case Kind::Uint64:
            return static_cast<double>(u64);
        case Kind::Double:
            return f64;
        }
        return 0.0;
    }
};

// ============================================================================
// JsonValue
// ============================================================================

/// A JSON value of any type.
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant = std::variant<Null,             // null
                                      bool,             // boolean
                                      JsonNumber,       // number
                                      std::string,      // string
                                      Box<JsonArray>,   // array (boxed)
                                      Box<JsonObject>>; // object (boxed)

    ValueVariant data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(JsonNumber value) : data(value) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    JsonValue(JsonValue&&) noexcept = default;
    JsonValue& operator=(JsonValue&&) noexcept = default;
    JsonValue(const JsonValue&) = delete;
    JsonValue& operator=(const JsonValue&) = delete;

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    /// Returns the JSON type name ("null", "bool", "number", "string",
    /// "array" or "object") for diagnostics.
    [[nodiscard]] auto type_name() const -> const char*;

    // ========================================================================
    // Accessors
    // ========================================================================

    /// Throws `std::bad_variant_access` if this is not a boolean.
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    /// Throws `std::bad_variant_access` if this is not a number.
    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }

    /// Throws `std::bad_variant_access` if this is not a string.
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    /// Throws `std::bad_variant_access` if this is not an array.
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    /// Returns the unsigned integer value, or `nullopt` for any other value.
    [[nodiscard]] auto try_as_u64() const -> std::optional<uint64_t> {
        if (!is_number())
            return std::nullopt;
        return as_number().try_as_u64();
    }

    /// Looks up a key in an object.
    ///
    /// Returns `nullptr` if this is not an object or the key is absent.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue* {
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            if (it != (*obj)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    /// Size of an array or object; 0 for every other type.
    [[nodiscard]] auto size() const -> size_t {
        if (auto* arr = std::get_if<Box<JsonArray>>(&data)) {
            return (*arr)->size();
        }
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            return (*obj)->size();
        }
        return 0;
    }
};

} // namespace lth::json
