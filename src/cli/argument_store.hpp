//! # Argument Store
//!
//! Parses the harness argument vector into a flag -> optional value map.
//!
//! ## Grammar
//!
//! - A token starting with `-` starts a new flag.
//! - If the next token does not start with `-`, it is that flag's value;
//!   otherwise the flag is a boolean.
//! - A flag given more than once keeps its last value.
//! - Unknown flags are stored like known ones.
//!
//! ```text
//! -deserialize -pre-edit-tree a.json -out b.swift
//!   -> {-deserialize: none, -pre-edit-tree: "a.json", -out: "b.swift"}
//! ```
//!
//! A value-bearing flag without a value, or a value with no flag before it,
//! is a `MalformedArgument` error. That includes a value-bearing flag
//! followed directly by another flag (`-out -deserialize`) or ending the
//! vector: it is not read as a boolean, so it never reaches the action as
//! `MissingRequiredArgument`.

#pragma once

#include "cli/harness_error.hpp"
#include "common.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lth::cli {

class ArgumentStore {
public:
    /// Parses raw arguments (program name excluded).
    [[nodiscard]] static auto parse(const std::vector<std::string>& args)
        -> Result<ArgumentStore, HarnessError>;

    /// True if the flag was given, with or without a value.
    [[nodiscard]] auto has(std::string_view flag) const -> bool;

    /// The flag's value, or `nullopt` if absent or given without a value.
    [[nodiscard]] auto get(std::string_view flag) const -> std::optional<std::string>;

    /// The flag's value, or `MissingRequiredArgument` naming the flag.
    [[nodiscard]] auto get_required(std::string_view flag) const
        -> Result<std::string, HarnessError>;

    [[nodiscard]] auto size() const -> size_t {
        return values_.size();
    }

private:
    std::map<std::string, std::optional<std::string>, std::less<>> values_;
};

} // namespace lth::cli
