//! # Logger Unit Tests
//!
//! LogFilter parsing, level filtering, FileSink output, and how the harness
//! command line and LTH_LOG map onto a LogConfig.

#include "log/log.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace lth::log;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, DefaultLevelIsWarn) {
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "driver"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "driver"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "driver"));
}

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("deserialize=debug,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "deserialize"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "deserialize"));

    // Unmatched modules use the "*" level
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "parser"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "parser"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    filter.parse("classify");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "classify"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "actions"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("actions=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "actions"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "driver"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("parser=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilterKeepsDefault) {
    filter.parse("");
    EXPECT_EQ(filter.default_level(), LogLevel::Warn);
    EXPECT_EQ(filter.min_level(), LogLevel::Warn);
}

TEST(LogLevelTest, ParseLevelNames) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
}

// ============================================================================
// Helper: Capture sink that stores records in memory
// ============================================================================

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    std::vector<Entry> records;
};

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().reset();
        auto capture = std::make_unique<CaptureSink>();
        sink = capture.get();
        Logger::instance().add_sink(std::move(capture));
    }

    void TearDown() override {
        Logger::instance().reset();
    }

    CaptureSink* sink = nullptr;
};

// ============================================================================
// Level Filtering
// ============================================================================

TEST_F(LoggerTest, DebugHiddenAtDefaultLevel) {
    LTH_LOG_DEBUG("deserialize", "hidden");
    LTH_LOG_WARN("deserialize", "shown " << 42);

    ASSERT_EQ(sink->records.size(), 1u);
    EXPECT_EQ(sink->records[0].level, LogLevel::Warn);
    EXPECT_EQ(sink->records[0].module, "deserialize");
    EXPECT_EQ(sink->records[0].message, "shown 42");
}

TEST_F(LoggerTest, AllVisibleAtTrace) {
    Logger::instance().set_level(LogLevel::Trace);

    LTH_LOG_TRACE("parser", "t");
    LTH_LOG_DEBUG("parser", "d");
    LTH_LOG_INFO("parser", "i");

    EXPECT_EQ(sink->records.size(), 3u);
}

TEST_F(LoggerTest, AllHiddenAtOff) {
    Logger::instance().set_level(LogLevel::Off);

    LTH_LOG_ERROR("driver", "e");
    LTH_LOG_FATAL("driver", "f");

    EXPECT_TRUE(sink->records.empty());
}

TEST_F(LoggerTest, ModuleFilterAppliesPerModule) {
    LogConfig config;
    config.console = false;
    config.filter_spec = "classify=trace";
    Logger::init(config);
    auto capture = std::make_unique<CaptureSink>();
    auto* classify_sink = capture.get();
    Logger::instance().add_sink(std::move(capture));

    LTH_LOG_TRACE("classify", "visible");
    LTH_LOG_DEBUG("actions", "hidden");
    LTH_LOG_WARN("actions", "visible");

    EXPECT_EQ(classify_sink->records.size(), 2u);
}

// ============================================================================
// FileSink
// ============================================================================

TEST(FileSinkTest, WritesTextLines) {
    lth::test::TempDir dir;
    auto path = dir.file("harness.log");
    {
        FileSink sink(path, false);
        ASSERT_TRUE(sink.is_open());
        LogRecord record{LogLevel::Info, "actions", "wrote 12 bytes", __FILE__, __LINE__,
                         epoch_ms()};
        sink.write(record);
    }

    auto content = lth::test::read_text(path);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[actions] wrote 12 bytes"), std::string::npos);
}

TEST(FileSinkTest, JsonEscapesSpecialCharacters) {
    lth::test::TempDir dir;
    auto path = dir.file("harness.jsonl");
    {
        FileSink sink(path, false);
        sink.set_format(LogFormat::JSON);
        LogRecord record{LogLevel::Error, "parser", "line1\n\"quoted\"", __FILE__, __LINE__, 0};
        sink.write(record);
    }

    auto content = lth::test::read_text(path);
    EXPECT_NE(content.find(R"("level":"ERROR")"), std::string::npos);
    EXPECT_NE(content.find(R"("module":"parser")"), std::string::npos);
    EXPECT_NE(content.find(R"(line1\n\"quoted\")"), std::string::npos);
}

TEST(ConsoleSinkTest, WritesDiagnosticStyleLines) {
    std::ostringstream stream;
    ConsoleSink sink(stream);
    sink.write(LogRecord{LogLevel::Warn, "parser", "slow compiler", __FILE__, __LINE__, 0});
    EXPECT_EQ(stream.str(), "lit-test-helper: warn: [parser] slow compiler\n");
}

TEST(ConsoleSinkTest, UnopenableLogFileIsReportedOnConsoleStream) {
    lth::test::TempDir dir;
    LogConfig config;
    config.log_file = dir.file("no-such-dir/harness.log");

    std::ostringstream console;
    Logger::init(config, console);
    Logger::instance().reset();

    EXPECT_EQ(console.str(),
              "lit-test-helper: warn: [driver] could not open log file '" + config.log_file + "'\n");
}

TEST(LogLevelTest, UnknownNameUsesFallback) {
    EXPECT_EQ(parse_level("Trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("verbose"), LogLevel::Warn);
    EXPECT_EQ(parse_level("verbose", LogLevel::Info), LogLevel::Info);
}

TEST(FileSinkTest, InitRoutesRecordsToLogFile) {
    lth::test::TempDir dir;
    LogConfig config;
    config.console = false;
    config.level = LogLevel::Debug;
    config.log_file = dir.file("init.log");
    Logger::init(config);

    LTH_LOG_DEBUG("driver", "configured");
    Logger::instance().flush();
    Logger::instance().reset();

    EXPECT_NE(lth::test::read_text(config.log_file).find("[driver] configured"),
              std::string::npos);
}

// ============================================================================
// Command-Line Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("LTH_LOG");
    }

    void TearDown() override {
        unsetenv("LTH_LOG");
    }
};

TEST_F(LogOptionsTest, DefaultsToWarnOnConsole) {
    auto config = parse_log_options({"-deserialize"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.format, LogFormat::Text);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.log_file.empty());
    EXPECT_TRUE(config.console);
}

TEST_F(LogOptionsTest, ReadsFlagValuePairs) {
    auto config = parse_log_options({"-classify-syntax", "-log-level", "debug", "-log-filter",
                                     "parser=trace", "-log-file", "out.log", "-log-format",
                                     "json"});
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "parser=trace");
    EXPECT_EQ(config.log_file, "out.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, FlagWithoutValueIsIgnored) {
    auto config = parse_log_options({"-log-level", "-deserialize"});
    EXPECT_EQ(config.level, LogLevel::Warn);
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse_log_options({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse_log_options({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse_log_options({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse_log_options({"-q"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, EnvironmentLevel) {
    setenv("LTH_LOG", "info", 1);
    EXPECT_EQ(parse_log_options({}).level, LogLevel::Info);
}

TEST_F(LogOptionsTest, EnvironmentFilter) {
    setenv("LTH_LOG", "deserialize=trace,*=error", 1);
    auto config = parse_log_options({});
    EXPECT_EQ(config.filter_spec, "deserialize=trace,*=error");
}

TEST_F(LogOptionsTest, CommandLineOverridesEnvironment) {
    setenv("LTH_LOG", "trace", 1);
    EXPECT_EQ(parse_log_options({"-log-level", "error"}).level, LogLevel::Error);
}
