//! # Logging
//!
//! Diagnostic logging for lit-test-helper. Records carry a level and the
//! name of the component that produced them (`driver`, `actions`,
//! `deserialize`, `parser`, `classify`) so a single component can be traced
//! without drowning in the others.
//!
//! Records never reach stdout: lit compares the harness's stdout against
//! golden files. The console sink writes to stderr and the threshold
//! defaults to Warn, so a passing invocation prints nothing extra.
//!
//! ## Usage
//!
//! ```cpp
//! LTH_LOG_DEBUG("deserialize", "Read " << bytes.size() << " bytes from " << path);
//! LTH_LOG_FATAL("actions", "Unknown node " << kind_name);
//! ```
//!
//! ## Configuration
//!
//! | Source | Example |
//! |--------|---------|
//! | `-log-level <level>` | `-log-level debug` |
//! | `-log-filter <filter>` | `-log-filter parser=trace,*=error` |
//! | `-log-file <path>` | `-log-file harness.log` |
//! | `-log-format <text\|json>` | `-log-format json` |
//! | `-v`, `-vv`, `-vvv`, `-q` | Info, Debug, Trace, Error |
//! | `LTH_LOG` | `LTH_LOG=deserialize=trace` |

#ifndef LTH_LOG_HPP
#define LTH_LOG_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace lth::log {

// ============================================================================
// Levels
// ============================================================================

/// Severity, in ascending order. `Off` only appears as a threshold.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5, ///< Contract violations; the caller aborts afterwards
    Off = 6
};

inline constexpr std::array<const char*, 7> LEVEL_NAMES = {"TRACE", "DEBUG", "INFO", "WARN",
                                                           "ERROR", "FATAL", "OFF"};

/// Upper-case display name of `level`.
inline auto level_name(LogLevel level) -> const char* {
    return LEVEL_NAMES[static_cast<size_t>(level)];
}

/// Parses a level name in any letter case. Unrecognized names yield `fallback`.
auto parse_level(std::string_view name, LogLevel fallback = LogLevel::Warn) -> LogLevel;

// ============================================================================
// Records and Formatting
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file; ///< `__FILE__` of the call site
    int line;
    int64_t timestamp_ms; ///< Milliseconds since the epoch
};

enum class LogFormat {
    Text, ///< One human-readable line per record
    JSON  ///< One JSON object per line
};

/// `HH:MM:SS.mmm LEVEL [module] message`, without a trailing newline.
auto format_text(const LogRecord& record) -> std::string;

/// `{"ts":...,"level":...,"module":...,"msg":...}`, without a trailing newline.
auto format_json(const LogRecord& record) -> std::string;

/// Milliseconds since the epoch.
inline auto epoch_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes records to a diagnostic stream (stderr unless told otherwise) in
/// the style of a compiler diagnostic: `lit-test-helper: warn: [parser] ...`.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(std::ostream& stream = std::cerr) : stream_(stream) {}

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ostream& stream_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends records to a file. Error and Fatal records are flushed at once so
/// they survive the abort that follows a Fatal record.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    auto is_open() const -> bool {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module thresholds parsed from `module=level,...,*=level`.
///
/// A bare module name enables that module at Trace. `*` sets the threshold
/// for modules that are not listed.
class LogFilter {
public:
    void parse(std::string_view filter);

    auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest threshold of any module or the default.
    auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Warn;
    std::map<std::string, LogLevel, std::less<>> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Empty means every module uses `level`
    std::string log_file;    ///< Empty means no file sink
    bool console = true;
};

/// Process-wide logger. It has no sinks until `init` or `add_sink` is called,
/// and drops every record until then.
class Logger {
public:
    /// Replaces the sinks and thresholds with those described by `config`.
    /// Console records go to `console`, which must outlive the sinks (until
    /// the next `init` or `reset`). A log file that cannot be opened is
    /// reported as a Warn record under `driver`.
    static void init(const LogConfig& config, std::ostream& console = std::cerr);

    static auto instance() -> Logger&;

    /// Checked by the macros before the message is built.
    auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(LogLevel level, std::string_view module, std::string message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Sets one threshold for every module.
    void set_level(LogLevel level);

    auto level() const -> LogLevel {
        return level_;
    }

    /// Drops all sinks and restores the Warn threshold.
    void reset();

    void flush();

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Builds a LogConfig from the harness argument vector (program name
/// excluded). Flags and values are separate tokens; a log flag without a
/// value is ignored. `LTH_LOG` (a level name or a filter) is consulted only
/// when the command line sets neither a level nor a filter.
auto parse_log_options(const std::vector<std::string>& args) -> LogConfig;

// ============================================================================
// Macros
// ============================================================================

// Calls below this level compile to nothing. 0=Trace ... 6=Off.
#ifndef LTH_MIN_LOG_LEVEL
#define LTH_MIN_LOG_LEVEL 0
#endif

#define LTH_LOG_IMPL(level, module_str, msg)                                                       \
    do {                                                                                           \
        if (static_cast<int>(level) >= LTH_MIN_LOG_LEVEL) {                                        \
            auto& lth_logger_ = ::lth::log::Logger::instance();                                    \
            if (lth_logger_.should_log(level, module_str)) {                                       \
                std::ostringstream lth_oss_;                                                       \
                lth_oss_ << msg;                                                                   \
                lth_logger_.log(level, module_str, lth_oss_.str(), __FILE__, __LINE__);            \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define LTH_LOG_TRACE(module, msg) LTH_LOG_IMPL(::lth::log::LogLevel::Trace, module, msg)
#define LTH_LOG_DEBUG(module, msg) LTH_LOG_IMPL(::lth::log::LogLevel::Debug, module, msg)
#define LTH_LOG_INFO(module, msg) LTH_LOG_IMPL(::lth::log::LogLevel::Info, module, msg)
#define LTH_LOG_WARN(module, msg) LTH_LOG_IMPL(::lth::log::LogLevel::Warn, module, msg)
#define LTH_LOG_ERROR(module, msg) LTH_LOG_IMPL(::lth::log::LogLevel::Error, module, msg)
#define LTH_LOG_FATAL(module, msg) LTH_LOG_IMPL(::lth::log::LogLevel::Fatal, module, msg)

} // namespace lth::log

#endif // LTH_LOG_HPP
