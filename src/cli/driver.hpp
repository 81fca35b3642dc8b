//! # Harness Driver Interface
//!
//! `lth_main()` is the process entry point; `run()` is the same pipeline
//! with explicit streams so it can be driven in-process by tests.

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace lth::cli {

/// Parses `args` (program name excluded), configures logging, selects and
/// runs one action. Action output goes to `out`, diagnostics to `err`.
///
/// Returns 0 on success and 1 on any failure.
[[nodiscard]] auto run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err)
    -> int;

} // namespace lth::cli

/// Main entry point of the lit-test-helper binary.
int lth_main(int argc, char* argv[]);
