//! # Harness Driver
//!
//! ```text
//! run()
//!   ├─ ArgumentStore::parse()
//!   ├─ LoggingScope (Logger::init on the error stream)
//!   ├─ select_action()
//!   └─ run_action()
//!        ├─ -deserialize-incremental → perform_round_trip()
//!        ├─ -classify-syntax         → perform_classify_syntax()
//!        ├─ -deserialize             → perform_deserialize()
//!        ├─ -print-source            → perform_print_tree()
//!        └─ -help                    → usage_text()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning |
//! |------|---------|
//! | 0 | Action succeeded |
//! | 1 | Any failure, reported on the error stream |

#include "cli/driver.hpp"

#include "cli/actions.hpp"
#include "cli/argument_store.hpp"
#include "cli/options.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <iostream>

namespace lth::cli {

namespace {

/// Console records of one run go to the driver's error stream; the sinks
/// are dropped before `run` returns so none outlives that stream.
class LoggingScope {
public:
    LoggingScope(const std::vector<std::string>& args, std::ostream& err) {
        log::Logger::init(log::parse_log_options(args), err);
    }

    ~LoggingScope() {
        log::Logger::instance().flush();
        log::Logger::instance().reset();
    }

    LoggingScope(const LoggingScope&) = delete;
    LoggingScope& operator=(const LoggingScope&) = delete;
};

auto report(const HarnessError& error, std::ostream& err) -> int {
    err << error.describe() << "\n";
    if (error.kind != HarnessErrorKind::NoActionSpecified) {
        err << "Run " << TOOL_NAME << " -help for more help.\n";
    }
    err.flush();
    return 1;
}

} // namespace

auto run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) -> int {
    auto parsed = ArgumentStore::parse(args);
    if (is_err(parsed)) {
        return report(unwrap_err(parsed), err);
    }
    const auto& store = unwrap(parsed);

    LoggingScope logging(args, err);
    LTH_LOG_DEBUG("driver", TOOL_NAME << " " << VERSION << " invoked with " << args.size()
                                      << " arguments");

    auto action = select_action(store);
    if (is_err(action)) {
        return report(unwrap_err(action), err);
    }

    auto result = run_action(unwrap(action), store);
    if (is_err(result)) {
        LTH_LOG_DEBUG("driver", action_name(unwrap(action)) << " failed");
        return report(unwrap_err(result), err);
    }

    out << unwrap(result);
    out.flush();
    return 0;
}

} // namespace lth::cli

int lth_main(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return lth::cli::run(args, std::cout, std::cerr);
}
