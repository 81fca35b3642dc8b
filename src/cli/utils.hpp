//! # CLI Utilities
//!
//! | Function | Description |
//! |----------|-------------|
//! | `read_file_bytes()` | Read a whole file as raw bytes |
//! | `write_file()` | Overwrite a file with the given text (not atomic) |
//! | `usage_text()` | The `-help` text |

#pragma once

#include "cli/harness_error.hpp"
#include "common.hpp"

#include <string>

namespace lth::cli {

// File I/O
[[nodiscard]] auto read_file_bytes(const std::string& path) -> Result<std::string, HarnessError>;
[[nodiscard]] auto write_file(const std::string& path, const std::string& content)
    -> Result<bool, HarnessError>;

// Help text
[[nodiscard]] auto usage_text() -> std::string;

} // namespace lth::cli
