//! # Action Executors
//!
//! One function per action. Each validates its required flags and the
//! serialization format before touching any file, drives the syntax library
//! and returns the text destined for standard output (often empty). None of
//! them writes to the process streams.
//!
//! | Action | Required | Optional | Output |
//! |--------|----------|----------|--------|
//! | Deserialize | `-pre-edit-tree`, `-out` | `-serialization-format` | `-out` |
//! | IncrementalRoundTrip | `-pre-edit-tree`, `-incr-tree`, `-out` | `-serialization-format` | `-out` |
//! | ClassifySyntaxColoring | `-source-file` | `-swiftc`, `-out` | `-out` or stdout |
//! | PrintTreeStructure | `-source-file` | `-swiftc` | stdout |
//! | Help | | | stdout |

#pragma once

#include "cli/argument_store.hpp"
#include "cli/harness_error.hpp"
#include "cli/options.hpp"
#include "syntax/raw_syntax.hpp"

#include <string>

namespace lth::cli {

/// Text an action wants written to standard output.
using ActionOutput = std::string;

[[nodiscard]] auto perform_deserialize(const ArgumentStore& args)
    -> Result<ActionOutput, HarnessError>;

[[nodiscard]] auto perform_round_trip(const ArgumentStore& args)
    -> Result<ActionOutput, HarnessError>;

[[nodiscard]] auto perform_classify_syntax(const ArgumentStore& args)
    -> Result<ActionOutput, HarnessError>;

[[nodiscard]] auto perform_print_tree(const ArgumentStore& args)
    -> Result<ActionOutput, HarnessError>;

/// Dispatches to the executor of `action`.
[[nodiscard]] auto run_action(Action action, const ArgumentStore& args)
    -> Result<ActionOutput, HarnessError>;

/// Renders the tree structure: `<KindSyntax>` ... `</KindSyntax>` around
/// every present layout node and the full text of every present token.
///
/// An `Unknown*` node anywhere in the tree is a contract violation: it is
/// logged at Fatal level and the process aborts.
[[nodiscard]] auto print_tree_structure(const syntax::RawSyntax& root) -> std::string;

} // namespace lth::cli
