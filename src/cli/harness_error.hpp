//! # Harness Errors
//!
//! Every failure of a harness invocation is a `HarnessError`. Lower layers
//! return them through `Result`; only the driver turns one into a diagnostic
//! on the error stream and exit code 1.
//!
//! | Kind | Raised when |
//! |------|-------------|
//! | `MissingRequiredArgument` | an action's required flag is absent |
//! | `InvalidArgumentValue` | a flag's value is outside its allowed set |
//! | `MalformedArgument` | the argument vector breaks the flag/value grammar |
//! | `NoActionSpecified` | no action flag was given |
//! | `FileAccess` | an input cannot be read or the output cannot be written |
//! | `Collaborator` | the syntax library reported a failure |

#pragma once

#include <string>

namespace lth::cli {

enum class HarnessErrorKind {
    MissingRequiredArgument,
    InvalidArgumentValue,
    MalformedArgument,
    NoActionSpecified,
    FileAccess,
    Collaborator,
};

struct HarnessError {
    HarnessErrorKind kind;
    std::string message; ///< Cause, for the kinds that carry one
    std::string flag;    ///< Offending flag, if any
    std::string value;   ///< Offending value, if any
    std::string path;    ///< File involved, if any

    static auto missing_argument(std::string flag) -> HarnessError;
    static auto invalid_value(std::string flag, std::string value) -> HarnessError;
    static auto malformed(std::string message, std::string flag = {}) -> HarnessError;
    static auto no_action() -> HarnessError;
    static auto file_access(std::string path, std::string cause) -> HarnessError;
    static auto collaborator(std::string message, std::string path = {}) -> HarnessError;

    /// One-line (for `NoActionSpecified`, two-line) description for the user.
    [[nodiscard]] auto describe() const -> std::string;
};

} // namespace lth::cli
