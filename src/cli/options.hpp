//! # Action Selection and Format Resolution
//!
//! ## Action Precedence
//!
//! When several action flags are given, the first match in this order wins,
//! regardless of where the flags appear on the command line:
//!
//! | Order | Flag | Action |
//! |-------|------|--------|
//! | 1 | `-deserialize-incremental` | `IncrementalRoundTrip` |
//! | 2 | `-classify-syntax` | `ClassifySyntaxColoring` |
//! | 3 | `-deserialize` | `Deserialize` |
//! | 4 | `-print-source` | `PrintTreeStructure` |
//! | 5 | `-help` | `Help` |

#pragma once

#include "cli/argument_store.hpp"
#include "cli/harness_error.hpp"
#include "syntax/deserializer.hpp"

#include <string_view>

namespace lth::cli {

enum class Action {
    Deserialize,
    IncrementalRoundTrip,
    ClassifySyntaxColoring,
    PrintTreeStructure,
    Help,
};

[[nodiscard]] auto action_name(Action action) -> std::string_view;

/// Picks the single action to run, or fails with `NoActionSpecified`.
[[nodiscard]] auto select_action(const ArgumentStore& args) -> Result<Action, HarnessError>;

/// Resolves `-serialization-format`: absent or empty means json, otherwise
/// exactly `json` or `byteTree`.
[[nodiscard]] auto resolve_format(const ArgumentStore& args)
    -> Result<syntax::SerializationFormat, HarnessError>;

} // namespace lth::cli
