//! # Logger Unit Tests
//!
//! Tests for the logging layer: LogFilter parsing, record formatting,
//! FileSink I/O, level and module filtering, command-line options and
//! thread safety.

#include "schemat/log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace schemat::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("format=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "format"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "format"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "format"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "cli"));
}

TEST_F(LogFilterTest, ParseAllTrace) {
    filter.parse("*=trace");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "format"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "anything"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("cli=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "cli"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "format"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    // A bare module name logs everything from that module
    filter.parse("format");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "format"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "cli"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("format=trace,cli=info,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "format"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "other"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "other"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("format=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, MinLevelDefaultOnly) {
    filter.parse("*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Error);
}

TEST_F(LogFilterTest, EmptyFilter) {
    filter.parse("");
    EXPECT_EQ(filter.default_level(), LogLevel::Info);
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "format"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "format"));
}

// ============================================================================
// Level Names
// ============================================================================

TEST(LogLevelTest, ParseLevelNames) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("bogus"), LogLevel::Info);
}

TEST(LogLevelTest, LevelNames) {
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
}

// ============================================================================
// Record Formatting
// ============================================================================

namespace {

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = 1234567890;
    return record;
}

} // anonymous namespace

TEST(FormatRecordTest, TextContainsLevelAndModule) {
    auto text = format_record(make_record(LogLevel::Info, "format", "hello"), LogFormat::Text);
    EXPECT_NE(text.find("INFO  [format] hello"), std::string::npos);
    EXPECT_EQ(text.find("\033["), std::string::npos);
}

TEST(FormatRecordTest, TextWithColors) {
    auto text =
        format_record(make_record(LogLevel::Error, "cli", "boom"), LogFormat::Text, true);
    EXPECT_NE(text.find("\033["), std::string::npos);
    EXPECT_NE(text.find("[cli] boom"), std::string::npos);
}

TEST(FormatRecordTest, Json) {
    auto json = format_record(make_record(LogLevel::Warn, "cli", "no match"), LogFormat::JSON);
    EXPECT_EQ(json,
              "{\"ts\":1234567890,\"level\":\"WARN\",\"module\":\"cli\",\"msg\":\"no match\"}");
}

TEST(FormatRecordTest, JsonEscapesSpecialCharacters) {
    auto json = format_record(
        make_record(LogLevel::Info, "escape", "line1\nline2\ttab\"quote\\backslash"),
        LogFormat::JSON);
    EXPECT_NE(json.find("\\n"), std::string::npos);
    EXPECT_NE(json.find("\\t"), std::string::npos);
    EXPECT_NE(json.find("\\\""), std::string::npos);
    EXPECT_NE(json.find("\\\\"), std::string::npos);
}

TEST(ConsoleSinkTest, WritesWithoutColors) {
    // Output goes to stderr; the record must simply be accepted
    ConsoleSink sink(false);
    sink.write(make_record(LogLevel::Info, "test", "hello"));
    sink.flush();
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "schemat_log_test.log";
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    void TearDown() override {
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path);
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return content;
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string());
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "test", "file sink test"));
        sink.flush();
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[test]"), std::string::npos);
    EXPECT_NE(content.find("file sink test"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string());
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "m1", "first"));
    }
    {
        FileSink sink(temp_file.string());
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Warn, "m2", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormatOneRecordPerLine) {
    {
        FileSink sink(temp_file.string());
        sink.set_format(LogFormat::JSON);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Error, "json_test", "first"));
        sink.write(make_record(LogLevel::Error, "json_test", "second"));
    }

    std::istringstream lines(read_file(temp_file));
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        EXPECT_EQ(line.front(), '{');
        EXPECT_EQ(line.back(), '}');
        EXPECT_NE(line.find("\"level\":\"ERROR\""), std::string::npos);
        ++count;
    }
    EXPECT_EQ(count, 2);
}

// ============================================================================
// Level and Module Filtering
// ============================================================================

TEST(LogLevelFilteringTest, DebugHiddenAtInfoLevel) {
    LogFilter filter;
    filter.set_default_level(LogLevel::Info);

    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "any"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "any"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "any"));
    EXPECT_TRUE(filter.should_log(LogLevel::Fatal, "any"));
}

TEST(LogLevelFilteringTest, AllHiddenAtOff) {
    LogFilter filter;
    filter.set_default_level(LogLevel::Off);

    EXPECT_FALSE(filter.should_log(LogLevel::Error, "any"));
    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "any"));
}

TEST(ModuleFilteringTest, OnlyFormatShown) {
    LogFilter filter;
    filter.parse("format=trace,*=off");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "format"));
    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "cli"));
}

// ============================================================================
// Command-Line Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("SCHEMAT_LOG");
    }

    void TearDown() override {
        unsetenv("SCHEMAT_LOG");
    }

    auto parse(std::vector<std::string> args) -> LogConfig {
        args.insert(args.begin(), "schemat");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return parse_log_options(static_cast<int>(args.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, Defaults) {
    auto config = parse({"file.scm"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.format, LogFormat::Text);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.log_file.empty());
}

TEST_F(LogOptionsTest, Verbosity) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"--verbose"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitLevelWinsOverVerbosity) {
    EXPECT_EQ(parse({"-vvv", "--log-level=error"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, FilterFileAndFormat) {
    auto config =
        parse({"--log-filter=format=debug", "--log-file=/tmp/x.log", "--log-format=json"});
    EXPECT_EQ(config.filter_spec, "format=debug");
    EXPECT_EQ(config.log_file, "/tmp/x.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, StopsAtDoubleDash) {
    EXPECT_EQ(parse({"--", "-vv"}).level, LogLevel::Warn);
}

TEST_F(LogOptionsTest, EnvironmentLevel) {
    setenv("SCHEMAT_LOG", "debug", 1);
    EXPECT_EQ(parse({}).level, LogLevel::Debug);
}

TEST_F(LogOptionsTest, EnvironmentFilter) {
    setenv("SCHEMAT_LOG", "format=trace,cli", 1);
    auto config = parse({});
    EXPECT_EQ(config.filter_spec, "format=trace,cli");
    EXPECT_EQ(config.level, LogLevel::Warn);
}

TEST_F(LogOptionsTest, CommandLineOverridesEnvironment) {
    setenv("SCHEMAT_LOG", "trace", 1);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST(LogOptionRecognitionTest, IsLogOption) {
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("--log-filter=format"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_TRUE(is_log_option("-vv"));
    EXPECT_FALSE(is_log_option("-v"));
    EXPECT_FALSE(is_log_option("--check"));
    EXPECT_FALSE(is_log_option("src/"));
}

// ============================================================================
// Thread Safety
// ============================================================================

namespace {

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        messages.push_back(record.message);
    }
    void flush() override {}

    std::vector<std::string> messages;
};

} // anonymous namespace

TEST(LoggerThreadSafetyTest, ConcurrentLogging) {
    LogConfig config;
    config.console = false;
    config.level = LogLevel::Trace;
    Logger::init(config);

    auto& logger = Logger::instance();
    auto capture = std::make_unique<CaptureSink>();
    auto* capture_ptr = capture.get();
    logger.add_sink(std::move(capture));

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([t, messages_per_thread]() {
            for (int i = 0; i < messages_per_thread; i++) {
                SCHEMAT_LOG_INFO("test", "thread-" << t << "-msg-" << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture_ptr->messages.size()), num_threads * messages_per_thread);

    // Drop the capture sink so later tests log nowhere
    config.level = LogLevel::Warn;
    Logger::init(config);
}

TEST(LoggerTest, NoSinksMeansNoLogging) {
    LogConfig config;
    config.console = false;
    config.level = LogLevel::Trace;
    Logger::init(config);

    EXPECT_FALSE(Logger::instance().should_log(LogLevel::Fatal, "format"));

    config.level = LogLevel::Warn;
    Logger::init(config);
}
