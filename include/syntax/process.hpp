//! # Subprocess Execution
//!
//! Runs an external program, capturing its standard output and standard
//! error, and locates executables on `PATH`.

#ifndef LTH_SYNTAX_PROCESS_HPP
#define LTH_SYNTAX_PROCESS_HPP

#include "common.hpp"
#include "syntax/syntax_error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lth::syntax {

/// Outcome of a process that was started and ran to completion.
struct ProcessResult {
    int exit_code = -1; ///< Exit status, or -1 if killed by a signal
    std::string stdout_output;
    std::string stderr_output;
};

/// Runs `exe_path` with `args`, blocking until it exits.
///
/// Fails only when the process could not be started at all; a non-zero exit
/// status is reported through `ProcessResult::exit_code`.
[[nodiscard]] auto run_process(const std::string& exe_path, const std::vector<std::string>& args)
    -> Result<ProcessResult, SyntaxError>;

/// Searches the directories of `PATH` for an executable file named `name`.
[[nodiscard]] auto find_in_path(std::string_view name) -> std::optional<std::string>;

} // namespace lth::syntax

#endif // LTH_SYNTAX_PROCESS_HPP
