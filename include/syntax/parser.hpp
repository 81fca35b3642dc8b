//! # Syntax Tree Parser
//!
//! Source files are not parsed in-process. `SyntaxTreeParser` runs the
//! compiler front-end as
//!
//! ```text
//! <compiler> -frontend -emit-syntax <source-file>
//! ```
//!
//! and deserializes the JSON tree it prints on standard output with a fresh
//! deserializer session.

#ifndef LTH_SYNTAX_PARSER_HPP
#define LTH_SYNTAX_PARSER_HPP

#include "common.hpp"
#include "syntax/raw_syntax.hpp"
#include "syntax/syntax_error.hpp"

#include <optional>
#include <string>

namespace lth::syntax {

/// Executable looked up on `PATH` when no compiler is given explicitly.
constexpr const char* DEFAULT_COMPILER_NAME = "swiftc";

class SyntaxTreeParser {
public:
    /// Parses `source_path` with `compiler`, or with `swiftc` from `PATH`
    /// when `compiler` is empty.
    ///
    /// Errors name the source file when it cannot be read, and the compiler
    /// executable when it cannot be found, exits non-zero (the compiler's
    /// diagnostics are included) or prints an unreadable tree.
    [[nodiscard]] static auto parse(const std::string& source_path,
                                    const std::optional<std::string>& compiler = std::nullopt)
        -> Result<RawSyntaxPtr, SyntaxError>;

    /// Resolves the compiler executable to run.
    [[nodiscard]] static auto resolve_compiler(const std::optional<std::string>& compiler)
        -> Result<std::string, SyntaxError>;
};

} // namespace lth::syntax

#endif // LTH_SYNTAX_PARSER_HPP
