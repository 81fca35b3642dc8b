//! # Logger Implementation

#include "common.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>

namespace lth::log {

auto parse_level(std::string_view name, LogLevel fallback) -> LogLevel {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
        if (upper == LEVEL_NAMES[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return fallback;
}

// ============================================================================
// Formatting
// ============================================================================

namespace {

auto clock_time(int64_t timestamp_ms) -> std::string {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_buf;
    localtime_r(&seconds, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << (timestamp_ms % 1000);
    return oss.str();
}

void write_json_string(std::ostringstream& oss, std::string_view text) {
    oss << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(c) << std::dec << std::setfill(' ');
            } else {
                oss << c;
            }
        }
    }
    oss << '"';
}

auto lower_level_name(LogLevel level) -> std::string {
    std::string name = level_name(level);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

} // namespace

auto format_text(const LogRecord& record) -> std::string {
    std::ostringstream oss;
    oss << clock_time(record.timestamp_ms) << " " << std::left << std::setw(5)
        << level_name(record.level) << " [" << record.module << "] " << record.message;
    return oss.str();
}

auto format_json(const LogRecord& record) -> std::string {
    std::ostringstream oss;
    oss << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
        << "\",\"module\":";
    write_json_string(oss, record.module);
    oss << ",\"msg\":";
    write_json_string(oss, record.message);
    oss << "}";
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::write(const LogRecord& record) {
    if (format_ == LogFormat::JSON) {
        stream_ << format_json(record) << "\n";
        return;
    }
    stream_ << TOOL_NAME << ": " << lower_level_name(record.level) << ": [" << record.module
            << "] " << record.message << "\n";
}

void ConsoleSink::flush() {
    stream_.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << (format_ == LogFormat::JSON ? format_json(record) : format_text(record)) << "\n";
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view filter) {
    module_levels_.clear();

    while (!filter.empty()) {
        size_t comma = filter.find(',');
        auto entry = filter.substr(0, comma);
        filter = comma == std::string_view::npos ? std::string_view{} : filter.substr(comma + 1);

        if (entry.empty()) {
            continue;
        }
        size_t eq = entry.find('=');
        if (eq == std::string_view::npos) {
            module_levels_.insert_or_assign(std::string(entry), LogLevel::Trace);
            continue;
        }

        auto name = entry.substr(0, eq);
        auto level = parse_level(entry.substr(eq + 1));
        if (name == "*") {
            default_level_ = level;
        } else {
            module_levels_.insert_or_assign(std::string(name), level);
        }
    }
}

auto LogFilter::should_log(LogLevel level, std::string_view module) const -> bool {
    auto it = module_levels_.find(module);
    LogLevel threshold = it != module_levels_.end() ? it->second : default_level_;
    return level != LogLevel::Off && level >= threshold;
}

auto LogFilter::min_level() const -> LogLevel {
    LogLevel min = default_level_;
    for (const auto& [name, level] : module_levels_) {
        min = std::min(min, level);
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config, std::ostream& console) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);
    if (!config.filter_spec.empty()) {
        // Modules the filter does not name keep the command-line level
        // unless the filter sets "*" explicitly.
        logger.filter_.parse(config.filter_spec);
    }
    logger.level_ = logger.filter_.min_level();

    if (config.console) {
        auto console_sink = std::make_unique<ConsoleSink>(console);
        console_sink->set_format(config.format);
        logger.sinks_.push_back(std::move(console_sink));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else if (logger.should_log(LogLevel::Warn, "driver")) {
            LogRecord record{LogLevel::Warn, "driver",
                             "could not open log file '" + config.log_file + "'",
                             __FILE__, __LINE__, epoch_ms()};
            for (auto& sink : logger.sinks_) {
                sink->write(record);
            }
        }
    }
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    return level >= level_ && filter_.should_log(level, module);
}

void Logger::log(LogLevel level, std::string_view module, std::string message, const char* file,
                 int line) {
    LogRecord record{level, module, std::move(message), file, line, epoch_ms()};

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    filter_ = LogFilter{};
    level_ = LogLevel::Warn;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace lth::log
