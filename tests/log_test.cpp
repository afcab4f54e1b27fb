//! # Logging Tests

#include "log/log.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace cleandoc::log;

namespace {

/// Records `module:message` for every record it receives.
class RecordingSink : public LogSink {
public:
    explicit RecordingSink(std::vector<std::string>& lines) : lines_(lines) {}

    void write(const LogRecord& record) override {
        lines_.push_back(std::string(record.module) + ":" + record.message);
    }

    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

auto record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    return LogRecord{level, module, std::move(message), __FILE__, __LINE__, 42};
}

} // namespace

// ============================================================================
// Filters
// ============================================================================

TEST(LogFilterTest, ModuleEntryAndWildcard) {
    LogFilter filter;
    filter.parse("links=debug, *=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "links"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "links"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "attrs"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "attrs"));
}

TEST(LogFilterTest, BareNameMeansTrace) {
    LogFilter filter;
    filter.parse("cfg");

    EXPECT_EQ(filter.threshold_for("cfg"), LogLevel::Trace);
    EXPECT_EQ(filter.threshold_for("clean"), LogLevel::Info);
}

TEST(LogFilterTest, PrefixCoversSubmodules) {
    LogFilter filter;
    filter.parse("clean=debug,clean.types=trace");

    EXPECT_EQ(filter.threshold_for("clean.types"), LogLevel::Trace);
    EXPECT_EQ(filter.threshold_for("clean.item"), LogLevel::Debug);
    EXPECT_EQ(filter.threshold_for("cleaner"), LogLevel::Info);
}

TEST(LogFilterTest, OffSilencesEvenFatal) {
    LogFilter filter;
    filter.parse("attrs=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "attrs"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "links"));
}

TEST(LogFilterTest, ReparseDropsOldEntries) {
    LogFilter filter;
    filter.parse("links=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
    EXPECT_EQ(filter.default_level(), LogLevel::Error);

    filter.parse("cfg=warn");
    EXPECT_EQ(filter.threshold_for("links"), LogLevel::Error);
    EXPECT_EQ(filter.min_level(), LogLevel::Warn);
}

TEST(LogLevelTest, NamesRoundTripAnyCase) {
    EXPECT_EQ(parse_level("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parse_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level(level_name(LogLevel::Error)), LogLevel::Error);
    EXPECT_EQ(parse_level("verbose"), LogLevel::Info);
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, TextLine) {
    std::string text = format_text(record(LogLevel::Warn, "attrs", "bad fragment"));

    EXPECT_NE(text.find("WARN  [attrs] bad fragment"), std::string::npos);
    EXPECT_EQ(text.find('\n'), std::string::npos);
}

TEST(LogFormatTest, JsonObject) {
    std::string json = format_json(record(LogLevel::Info, "links", "a \"quoted\"\nline"));

    EXPECT_EQ(json, "{\"ts\":42,\"level\":\"INFO\",\"module\":\"links\","
                    "\"msg\":\"a \\\"quoted\\\"\\nline\"}");
}

TEST(LogFormatTest, JsonEscapesControlCharacters) {
    std::string json = format_json(record(LogLevel::Debug, "cfg", std::string("x\x01y")));

    EXPECT_NE(json.find("x\\u0001y"), std::string::npos);
}

// ============================================================================
// Sinks
// ============================================================================

TEST(MultiSinkTest, EveryChildSeesEveryRecord) {
    std::vector<std::string> first;
    std::vector<std::string> second;
    MultiSink sink;
    sink.add(std::make_unique<RecordingSink>(first));
    sink.add(std::make_unique<RecordingSink>(second));
    sink.add(nullptr);

    sink.write(record(LogLevel::Info, "cfg", "x"));

    EXPECT_EQ(sink.size(), 2u);
    EXPECT_EQ(first, std::vector<std::string>{"cfg:x"});
    EXPECT_EQ(second, std::vector<std::string>{"cfg:x"});
}

// ============================================================================
// Global Logger
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogConfig config;
        config.level = LogLevel::Debug;
        config.console = false;
        Logger::init(config);
        Logger::instance().add_sink(std::make_unique<RecordingSink>(lines));
    }

    void TearDown() override {
        LogConfig quiet;
        quiet.console = false;
        Logger::init(quiet);
    }

    std::vector<std::string> lines;
};

TEST_F(LoggerTest, MacroHonorsDefaultLevel) {
    CLEANDOC_LOG_DEBUG("clean", "kept " << 1);
    CLEANDOC_LOG_TRACE("clean", "dropped");

    EXPECT_EQ(lines, std::vector<std::string>{"clean:kept 1"});
    EXPECT_EQ(Logger::instance().level(), LogLevel::Debug);
}

TEST_F(LoggerTest, FilterOpensOneModule) {
    Logger::instance().set_filter("links=trace,*=error");

    CLEANDOC_LOG_TRACE("links", "resolved");
    CLEANDOC_LOG_INFO("attrs", "ignored");

    EXPECT_EQ(lines, std::vector<std::string>{"links:resolved"});
}

TEST_F(LoggerTest, SetLevelForgetsModuleEntries) {
    Logger::instance().set_filter("links=trace");
    Logger::instance().set_level(LogLevel::Error);

    CLEANDOC_LOG_TRACE("links", "gone");
    CLEANDOC_LOG_ERROR("links", "kept");

    EXPECT_EQ(lines, std::vector<std::string>{"links:kept"});
}

TEST_F(LoggerTest, ClearedSinksReceiveNothing) {
    Logger::instance().clear_sinks();
    CLEANDOC_LOG_WARN("cfg", "nowhere");

    EXPECT_TRUE(lines.empty());
}
