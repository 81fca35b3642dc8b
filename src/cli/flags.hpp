//! # Command-Line Flags
//!
//! Names of every flag the harness understands.

#pragma once

#include <array>
#include <string_view>

namespace lth::cli::flags {

// Actions
constexpr std::string_view DESERIALIZE = "-deserialize";
constexpr std::string_view DESERIALIZE_INCREMENTAL = "-deserialize-incremental";
constexpr std::string_view CLASSIFY_SYNTAX = "-classify-syntax";
constexpr std::string_view PRINT_SOURCE = "-print-source";
constexpr std::string_view HELP = "-help";

// Inputs and outputs
constexpr std::string_view SOURCE_FILE = "-source-file";
constexpr std::string_view PRE_EDIT_TREE = "-pre-edit-tree";
constexpr std::string_view INCR_TREE = "-incr-tree";
constexpr std::string_view SERIALIZATION_FORMAT = "-serialization-format";
constexpr std::string_view OUT = "-out";
constexpr std::string_view SWIFTC = "-swiftc";

// Logging
constexpr std::string_view LOG_LEVEL = "-log-level";
constexpr std::string_view LOG_FILTER = "-log-filter";
constexpr std::string_view LOG_FILE = "-log-file";
constexpr std::string_view LOG_FORMAT = "-log-format";

/// Flags that must be followed by a value.
constexpr std::array VALUE_FLAGS = {
    SOURCE_FILE, PRE_EDIT_TREE, INCR_TREE,  SERIALIZATION_FORMAT, OUT,
    SWIFTC,      LOG_LEVEL,     LOG_FILTER, LOG_FILE,             LOG_FORMAT,
};

[[nodiscard]] constexpr auto takes_value(std::string_view flag) -> bool {
    for (auto name : VALUE_FLAGS) {
        if (name == flag) {
            return true;
        }
    }
    return false;
}

} // namespace lth::cli::flags
