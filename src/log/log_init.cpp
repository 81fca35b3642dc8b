//! # Log Initialization from the Command Line
//!
//! Extracts logging options from the harness argument vector and the
//! LTH_LOG environment variable to produce a LogConfig. Log flags follow the
//! harness grammar: a flag and its value are two separate tokens.

#include "log/log.hpp"

#include <cstdlib>
#include <string>

namespace lth::log {

LogConfig parse_log_options(const std::vector<std::string>& args) {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    auto value_after = [&args](size_t i) -> const std::string* {
        if (i + 1 < args.size() && !args[i + 1].starts_with('-')) {
            return &args[i + 1];
        }
        return nullptr;
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-log-level") {
            if (const auto* value = value_after(i)) {
                config.level = parse_level(*value);
                has_cli_level = true;
                ++i;
            }
        } else if (arg == "-log-filter") {
            if (const auto* value = value_after(i)) {
                config.filter_spec = *value;
                has_cli_filter = true;
                ++i;
            }
        } else if (arg == "-log-file") {
            if (const auto* value = value_after(i)) {
                config.log_file = *value;
                ++i;
            }
        } else if (arg == "-log-format") {
            if (const auto* value = value_after(i)) {
                config.format = (*value == "json" || *value == "JSON") ? LogFormat::JSON
                                                                       : LogFormat::Text;
                ++i;
            }
        } else if (arg == "-q") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (arg.size() >= 2 && arg.find_first_not_of('v', 1) == std::string::npos) {
            // -v = Info, -vv = Debug, -vvv = Trace
            int count = static_cast<int>(arg.size() - 1);
            if (count > v_count) {
                v_count = count;
            }
        }
    }

    if (!has_cli_level && v_count > 0) {
        if (v_count >= 3) {
            config.level = LogLevel::Trace;
        } else if (v_count == 2) {
            config.level = LogLevel::Debug;
        } else {
            config.level = LogLevel::Info;
        }
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("LTH_LOG");
        std::string env_str = env_log ? env_log : "";
        if (!env_str.empty()) {
            if (env_str.find('=') != std::string::npos ||
                env_str.find(',') != std::string::npos) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

} // namespace lth::log
