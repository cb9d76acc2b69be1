//! # Logger Unit Tests
//!
//! LogFilter parsing, level names, record formatting, FileSink I/O, the
//! global Logger with a capturing sink, and CLI flag parsing.

#include "derive/registry.hpp"
#include "lexer/lexer.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace vnc::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, DefaultIsWarn) {
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "anything"));
}

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("expand=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "expand"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "expand"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "expand"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "config"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "config"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("parser=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "parser"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "derive"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    // No `=level` enables everything for that module
    filter.parse("derive");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "derive"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "expand"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("derive=trace,expand=info,config=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "derive"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "expand"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "expand"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "config"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "config"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "other"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "other"));
}

TEST_F(LogFilterTest, ReparseReplacesModules) {
    filter.parse("derive=trace");
    filter.parse("expand=trace");
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "derive"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "expand"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("derive=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, MinLevelDefaultOnly) {
    filter.set_default_level(LogLevel::Error);
    EXPECT_EQ(filter.min_level(), LogLevel::Error);
}

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelTest, ParseLevelIgnoresCase) {
    EXPECT_EQ(parse_level("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parse_level("Debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
}

TEST(LogLevelTest, UnknownLevelClearsOk) {
    bool ok = true;
    EXPECT_EQ(parse_level("loud", &ok), LogLevel::Info);
    EXPECT_FALSE(ok);

    parse_level("error", &ok);
    EXPECT_TRUE(ok);
}

TEST(LogLevelTest, LevelNames) {
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(level_name(LogLevel::Fatal), "FATAL");
}

// ============================================================================
// Formatting
// ============================================================================

namespace {

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    return LogRecord{.level = level,
                     .module = module,
                     .message = std::move(message),
                     .file = __FILE__,
                     .line = __LINE__,
                     .timestamp_ms = epoch_ms()};
}

} // namespace

TEST(LogFormatTest, TextContainsLevelModuleAndMessage) {
    auto text = format_text(make_record(LogLevel::Info, "expand", "expanded 2 items"));
    EXPECT_NE(text.find("INFO "), std::string::npos);
    EXPECT_NE(text.find("[expand] expanded 2 items"), std::string::npos);
    EXPECT_EQ(text.find('\n'), std::string::npos);
}

TEST(LogFormatTest, JsonEscapesMessage) {
    auto json = format_json(make_record(LogLevel::Warn, "config", "bad \"key\"\n"));
    EXPECT_NE(json.find("\"level\":\"WARN\""), std::string::npos);
    EXPECT_NE(json.find("\"module\":\"config\""), std::string::npos);
    EXPECT_NE(json.find("\"msg\":\"bad \\\"key\\\"\\n\""), std::string::npos);
    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
}

// ============================================================================
// Sinks
// ============================================================================

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {
        ++flushes;
    }

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    std::vector<Entry> records;
    int flushes = 0;
};

TEST(FileSinkTest, AppendsLines) {
    auto path = fs::temp_directory_path() / "vnc_log_test_file_sink.log";
    fs::remove(path);
    {
        FileSink sink(path.string());
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "expand", "first"));
        sink.write(make_record(LogLevel::Error, "expand", "second"));
        sink.flush();
    }

    std::ifstream in(path);
    std::string line1;
    std::string line2;
    std::getline(in, line1);
    std::getline(in, line2);
    EXPECT_NE(line1.find("first"), std::string::npos);
    EXPECT_NE(line2.find("ERROR"), std::string::npos);
    in.close();
    fs::remove(path);
}

TEST(FileSinkTest, UnwritablePathIsNotOpen) {
    FileSink sink("/nonexistent-dir/vnc/log.txt");
    EXPECT_FALSE(sink.is_open());
    // Writing to a closed sink is a no-op
    sink.write(make_record(LogLevel::Error, "expand", "dropped"));
}

TEST(MultiSinkTest, ForwardsToEveryChild) {
    MultiSink multi;
    auto first = std::make_unique<CaptureSink>();
    auto second = std::make_unique<CaptureSink>();
    auto* first_ptr = first.get();
    auto* second_ptr = second.get();
    multi.add(std::move(first));
    multi.add(std::move(second));
    EXPECT_EQ(multi.size(), 2u);

    multi.write(make_record(LogLevel::Info, "derive", "hello"));
    multi.flush();
    EXPECT_EQ(first_ptr->records.size(), 1u);
    EXPECT_EQ(second_ptr->records.size(), 1u);
    EXPECT_EQ(second_ptr->flushes, 1);
}

// ============================================================================
// Global Logger
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    CaptureSink* sink_ = nullptr;

    void SetUp() override {
        LogConfig config;
        config.console = false;
        config.level = LogLevel::Trace;
        Logger::init(config);
        auto sink = std::make_unique<CaptureSink>();
        sink_ = sink.get();
        Logger::instance().add_sink(std::move(sink));
    }

    void TearDown() override {
        LogConfig config;
        config.console = false;
        Logger::init(config);
    }
};

TEST_F(LoggerTest, MacrosReachSink) {
    VNC_LOG_INFO("expand", "expanded " << 3 << " items");
    ASSERT_EQ(sink_->records.size(), 1u);
    EXPECT_EQ(sink_->records[0].level, LogLevel::Info);
    EXPECT_EQ(sink_->records[0].module, "expand");
    EXPECT_EQ(sink_->records[0].message, "expanded 3 items");
}

TEST_F(LoggerTest, LevelGatesMessages) {
    Logger::instance().set_level(LogLevel::Warn);
    VNC_LOG_DEBUG("expand", "hidden");
    VNC_LOG_WARN("expand", "shown");
    ASSERT_EQ(sink_->records.size(), 1u);
    EXPECT_EQ(sink_->records[0].message, "shown");
}

TEST_F(LoggerTest, FilterSelectsModules) {
    Logger::instance().set_level(LogLevel::Error);
    Logger::instance().set_filter("derive=debug");
    VNC_LOG_DEBUG("derive", "kept");
    VNC_LOG_DEBUG("parser", "dropped");
    ASSERT_EQ(sink_->records.size(), 1u);
    EXPECT_EQ(sink_->records[0].module, "derive");
}

TEST_F(LoggerTest, DuplicateDirectiveIsReported) {
    auto source = vnc::lexer::Source::from_string(
        "#[enum_variant_name_const]\n#[enum_variant_name_const]\nenum Twice { A }");
    vnc::lexer::Lexer lex(source);
    vnc::parser::Parser parser(lex.tokenize());
    auto item = parser.parse_single_item();
    ASSERT_TRUE(vnc::is_ok(item));

    auto directive = vnc::derive::find_directive(vnc::unwrap(item));
    ASSERT_TRUE(directive.has_value());

    bool warned = false;
    for (const auto& record : sink_->records) {
        if (record.level == LogLevel::Warn && record.module == "derive" &&
            record.message.find("Twice") != std::string::npos) {
            warned = true;
        }
    }
    EXPECT_TRUE(warned);
}

TEST_F(LoggerTest, FlushReachesSinks) {
    Logger::instance().flush();
    EXPECT_EQ(sink_->flushes, 1);
}

// ============================================================================
// CLI Parsing
// ============================================================================

namespace {

auto parse_args(std::vector<std::string> args) -> LogConfig {
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_log_options(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(LogOptionsTest, ExplicitFlags) {
    auto config = parse_args({"vnc", "expand", "--log-level=debug", "--log-filter=derive=trace",
                              "--log-file=out.log", "--log-format=json", "in.rs"});
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "derive=trace");
    EXPECT_EQ(config.log_file, "out.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST(LogOptionsTest, Verbosity) {
    EXPECT_EQ(parse_args({"vnc", "-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse_args({"vnc", "-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse_args({"vnc", "-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse_args({"vnc", "-q"}).level, LogLevel::Error);
    // An explicit level wins over -v
    EXPECT_EQ(parse_args({"vnc", "-vvv", "--log-level=error"}).level, LogLevel::Error);
}

TEST(LogOptionsTest, EnvironmentFallback) {
    setenv("VNC_LOG", "expand=debug", 1);
    auto from_env = parse_args({"vnc", "check", "in.rs"});
    EXPECT_EQ(from_env.filter_spec, "expand=debug");

    setenv("VNC_LOG", "info", 1);
    EXPECT_EQ(parse_args({"vnc"}).level, LogLevel::Info);

    // Flags take precedence over the environment
    EXPECT_EQ(parse_args({"vnc", "-q"}).level, LogLevel::Error);
    unsetenv("VNC_LOG");
}

TEST(LogOptionsTest, IsLogOption) {
    EXPECT_TRUE(is_log_option("--log-level=info"));
    EXPECT_TRUE(is_log_option("-vv"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("--version"));
    EXPECT_FALSE(is_log_option("-o"));
}
