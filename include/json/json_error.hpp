//! # JSON Error Type
//!
//! Errors produced while parsing JSON payloads, carrying the location of the
//! offending input so fixture authors can find the broken spot.
//!
//! ```cpp
//! auto error = JsonError::make("Expected ':' after object key", 3, 17);
//! error.to_string(); // "line 3, column 17: Expected ':' after object key"
//! ```

#pragma once

#include <cstddef>
#include <string>

namespace lth::json {

/// An error encountered during JSON parsing.
struct JsonError {
    /// Human-readable error description.
    std::string message;

    /// Line number where the error occurred (1-based, 0 if unknown).
    size_t line = 0;

    /// Column number where the error occurred (1-based, 0 if unknown).
    size_t column = 0;

    /// Byte offset in the input where the error occurred.
    size_t offset = 0;

    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0, 0};
    }

    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// Formats the error as `"line X, column Y: message"`, dropping the
    /// location parts that are unknown.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace lth::json
