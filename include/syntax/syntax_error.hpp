//! # Syntax Library Errors
//!
//! Every fallible operation of the syntax library (deserializing a tree,
//! invoking the external parser) reports failure as a `SyntaxError`.

#ifndef LTH_SYNTAX_SYNTAX_ERROR_HPP
#define LTH_SYNTAX_SYNTAX_ERROR_HPP

#include <string>

namespace lth::syntax {

/// A failure reported by the syntax library.
struct SyntaxError {
    /// Human-readable description, shown to the user unchanged.
    std::string message;

    static auto make(std::string msg) -> SyntaxError {
        return SyntaxError{std::move(msg)};
    }
};

} // namespace lth::syntax

#endif // LTH_SYNTAX_SYNTAX_ERROR_HPP
