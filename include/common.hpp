//! # Common Definitions
//!
//! This module provides the common types and utilities shared by every
//! lit-test-helper component.
//!
//! ## Overview
//!
//! - **Version Information**: Tool version constants
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: Fallible operations return `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared
//! - **Immutable Trees**: Syntax nodes are shared through `Rc<const T>` and
//!   never mutated after construction

#ifndef LTH_COMMON_HPP
#define LTH_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace lth {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.1.0";

/// Name of the executable, used in usage hints.
constexpr const char* TOOL_NAME = "lit-test-helper";

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// Operations that produce no value return `Result<bool, E>` with `true`
/// on success.
///
/// # Example
///
/// ```cpp
/// Result<std::string, HarnessError> read(const std::string& path);
///
/// auto result = read("a.json");
/// if (is_ok(result)) {
///     auto& bytes = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

/// Creates a new Rc containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace lth

#endif // LTH_COMMON_HPP
