// SPILLWAY - Util Module Tests
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include <gtest/gtest.h>

#include <spillway/util/logging.h>
#include <spillway/util/time.h>

#include <memory>
#include <string>
#include <vector>

namespace spillway {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info); // Default
}

TEST_F(LoggingTest, LoggerSingleton) {
    EXPECT_EQ(&Logger::Instance(), &Logger::Instance());
}

TEST_F(LoggingTest, LoggerAddRemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    auto sink = std::make_shared<ConsoleSink>();
    logger.AddSink(sink);
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, LoggerWillLog) {
    auto& logger = Logger::Instance();

    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::GAUGE));
    EXPECT_TRUE(logger.WillLog(LogLevel::Info, LogCategory::GAUGE));
    EXPECT_TRUE(logger.WillLog(LogLevel::Warn, LogCategory::GAUGE));

    logger.SetLevel(LogLevel::Off);
    EXPECT_FALSE(logger.WillLog(LogLevel::Fatal, LogCategory::GAUGE));
}

TEST_F(LoggingTest, LoggerCategoryFiltering) {
    auto& logger = Logger::Instance();

    logger.DisableAllCategories();
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::VOTES));

    logger.EnableCategory(LogCategory::VOTES);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::VOTES));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::LEDGER));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::LEDGER));
}

TEST_F(LoggingTest, StreamMacroReachesCallbackSink) {
    std::vector<LogEntry> captured;
    auto sink = std::make_shared<CallbackSink>(
        [&](const LogEntry& entry) { captured.push_back(entry); }, LogLevel::Trace);
    Logger::Instance().AddSink(sink);

    LOG_WARN(LogCategory::GAUGE) << "pool " << 3 << " rejected";
    LOG_DEBUG(LogCategory::GAUGE) << "filtered out";

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].message, "pool 3 rejected");
    EXPECT_EQ(captured[0].category, LogCategory::GAUGE);
    EXPECT_EQ(captured[0].level, LogLevel::Warn);
}

TEST_F(LoggingTest, PrintfMacro) {
    std::vector<std::string> messages;
    auto sink = std::make_shared<CallbackSink>(
        [&](const LogEntry& entry) { messages.push_back(entry.message); });
    Logger::Instance().AddSink(sink);

    LogInfoF(LogCategory::CONFIG, "window=%d", 42);

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "window=42");
}

TEST_F(LoggingTest, FixedWidthAndBasename) {
    EXPECT_EQ(FixedWidth("INFO", 5), "INFO ");
    EXPECT_EQ(FixedWidth("TOOLONG", 3), "TOO");
    EXPECT_EQ(GetBasename("/a/b/controller.cpp"), "controller.cpp");
    EXPECT_EQ(GetBasename("plain.cpp"), "plain.cpp");
}

// ============================================================================
// Time Tests
// ============================================================================

class TimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        DisableMockTime();
    }

    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(TimeTest, GetTimeIsPositive) {
    EXPECT_GT(GetTime(), 0);
}

TEST_F(TimeTest, MockTime) {
    EXPECT_FALSE(IsMockTimeEnabled());

    EnableMockTime();
    EXPECT_TRUE(IsMockTimeEnabled());

    SetMockTime(1000);
    EXPECT_EQ(GetMockTime(), 1000);
    EXPECT_EQ(GetTime(), 1000);

    AdvanceMockTime(Seconds{100});
    EXPECT_EQ(GetTime(), 1100);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_NE(GetTime(), 1100);
}

TEST_F(TimeTest, FormatDuration) {
    EXPECT_EQ(FormatDuration(Seconds{0}), "0s");
    EXPECT_EQ(FormatDuration(Seconds{45}), "45s");
    EXPECT_EQ(FormatDuration(Seconds{3600 + 23 * 60 + 45}), "1h 23m 45s");
    EXPECT_EQ(FormatDuration(Seconds{365 * SECONDS_PER_DAY}), "365d");
    EXPECT_EQ(FormatDuration(Seconds{-90}), "-1m 30s");
}

} // namespace
} // namespace util
} // namespace spillway
