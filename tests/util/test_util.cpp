// VOTELOCK - Logging and Time Tests
// Copyright (c) 2024 VOTELOCK Developers
// MIT License

#include <gtest/gtest.h>

#include <votelock/util/logging.h>
#include <votelock/util/time.h>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <unistd.h>

namespace votelock {
namespace util {
namespace {

// ============================================================================
// Logging
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { Reset(); }
    void TearDown() override { Reset(); }

    static void Reset() {
        Logger& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CallbackSink> Capture(LogLevel level = LogLevel::Trace) {
        auto sink = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { captured.push_back(entry); }, level);
        Logger::Instance().AddSink(sink);
        return sink;
    }

    std::vector<LogEntry> captured;
};

TEST_F(LoggerTest, LevelNames) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");

    EXPECT_EQ(LogLevelFromString("Debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("WARNING"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("error"), LogLevel::Error);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("verbose"), LogLevel::Info);
}

TEST_F(LoggerTest, SinksCanBeAddedAndRemoved) {
    Logger& logger = Logger::Instance();
    auto console = std::make_shared<ConsoleSink>(LogLevel::Error, false);
    auto callback = Capture();
    logger.AddSink(console);
    EXPECT_EQ(logger.SinkCount(), 2u);

    logger.RemoveSink(console);
    EXPECT_EQ(logger.SinkCount(), 1u);
    logger.RemoveSink(console);
    EXPECT_EQ(logger.SinkCount(), 1u);
}

TEST_F(LoggerTest, ThresholdAndOff) {
    Logger& logger = Logger::Instance();
    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::LOCK));
    EXPECT_TRUE(logger.WillLog(LogLevel::Info, LogCategory::LOCK));

    logger.SetLevel(LogLevel::Off);
    EXPECT_FALSE(logger.WillLog(LogLevel::Fatal, LogCategory::LOCK));
}

TEST_F(LoggerTest, CategoryFilter) {
    Logger& logger = Logger::Instance();

    logger.DisableCategory(LogCategory::QUERY);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::QUERY));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::LOCK));

    logger.EnableCategory(LogCategory::CHECKPOINT);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::CHECKPOINT));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::LOCK));

    logger.DisableCategory(LogCategory::CHECKPOINT);
    EXPECT_FALSE(logger.WillLog(LogLevel::Error, LogCategory::CHECKPOINT));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::QUERY));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::SNAPSHOT));
}

TEST_F(LoggerTest, StreamAndPrintfMacros) {
    Capture();

    LOG_INFO(LogCategory::POOL) << "pool " << 7 << " ready";
    LogInfoF(LogCategory::LOCK, "lock %d of %s", 3, "alice");
    LOG_DEBUG(LogCategory::POOL) << "below threshold";

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0].message, "pool 7 ready");
    EXPECT_EQ(captured[0].category, LogCategory::POOL);
    EXPECT_EQ(captured[0].level, LogLevel::Info);
    EXPECT_EQ(GetBasename(captured[0].file), "test_util.cpp");
    EXPECT_GT(captured[0].line, 0);
    EXPECT_EQ(captured[1].message, "lock 3 of alice");
}

TEST_F(LoggerTest, SinkLevelAppliesAfterLoggerLevel) {
    Logger::Instance().SetLevel(LogLevel::Debug);
    Capture(LogLevel::Warn);

    LOG_DEBUG(LogCategory::CHECKPOINT) << "dropped by sink";
    LOG_WARN(LogCategory::CHECKPOINT) << "kept";

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].message, "kept");
}

TEST_F(LoggerTest, FileSinkAppendsFormattedLines) {
    char path[] = "/tmp/votelock_log_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_NE(fd, -1);
    close(fd);

    {
        auto sink = std::make_shared<FileSink>(path, LogLevel::Info);
        ASSERT_TRUE(sink->IsOpen());
        Logger::Instance().AddSink(sink);
        LOG_WARN(LogCategory::CHECKPOINT) << "rolling capped";
        LOG_INFO(LogCategory::DEFAULT) << "plain";
        Logger::Instance().Shutdown();
    }

    std::ifstream in(path);
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("[WARN ] [checkpoint] test_util.cpp:"), std::string::npos);
    EXPECT_NE(text.find("rolling capped\n"), std::string::npos);
    EXPECT_EQ(text.find("[default]"), std::string::npos);
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);

    std::remove(path);
}

TEST(LogFormatTest, LineLayout) {
    LogEntry entry;
    entry.level = LogLevel::Error;
    entry.category = LogCategory::SNAPSHOT;
    entry.message = "bad magic";
    entry.file = "/src/voting/escrow.cpp";
    entry.line = 42;

    LogLineFormat format;
    format.timestamp = false;
    EXPECT_EQ(FormatLogLine(entry, format), "[ERROR] [snapshot] bad magic");

    format.location = true;
    format.category = false;
    EXPECT_EQ(FormatLogLine(entry, format), "[ERROR] escrow.cpp:42 bad magic");
}

TEST(LogFormatTest, Helpers) {
    EXPECT_EQ(FixedWidth("INFO", 5), "INFO ");
    EXPECT_EQ(FixedWidth("checkpoint", 5), "check");
    EXPECT_EQ(FixedWidth("ab", 4, '.'), "ab..");

    EXPECT_EQ(GetBasename("/usr/src/votelock/checkpoint.cpp"), "checkpoint.cpp");
    EXPECT_EQ(GetBasename("escrow.cpp"), "escrow.cpp");
    EXPECT_EQ(GetBasename("dir/"), "");

    std::string stamp = FormatLogTimestamp(FromUnixTime(1704067200));
    ASSERT_EQ(stamp.size(), 23u);
    EXPECT_EQ(stamp[19], '.');
    EXPECT_EQ(stamp.substr(20), "000");
}

// ============================================================================
// Time
// ============================================================================

class MockTimeTest : public ::testing::Test {
protected:
    void SetUp() override { DisableMockTime(); }
    void TearDown() override { DisableMockTime(); }
};

TEST_F(MockTimeTest, RealClockIsPlausible) {
    // 2024-01-01 or later
    EXPECT_GE(GetTime(), 1704067200);
}

TEST_F(MockTimeTest, PinAndAdvance) {
    EXPECT_FALSE(IsMockTimeEnabled());

    EnableMockTime();
    SetMockTime(2800 * SECONDS_PER_WEEK);
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTime(), 2800 * SECONDS_PER_WEEK);

    AdvanceMockTime(Seconds{3 * SECONDS_PER_DAY});
    EXPECT_EQ(GetMockTime(), 2800 * SECONDS_PER_WEEK + 3 * SECONDS_PER_DAY);
    EXPECT_EQ(GetTime(), GetMockTime());

    DisableMockTime();
    EXPECT_NE(GetTime(), GetMockTime());
}

TEST(TimeFormatTest, UnixConversions) {
    EXPECT_EQ(ToUnixTime(FromUnixTime(1704067200)), 1704067200);
    EXPECT_EQ(FormatISO8601(FromUnixTime(0)), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatTimestamp(1704067200 + 37 * SECONDS_PER_MINUTE + 5),
              "2024-01-01T00:37:05Z");
}

TEST(TimeFormatTest, Durations) {
    EXPECT_EQ(FormatDuration(Seconds{0}), "0s");
    EXPECT_EQ(FormatDuration(Seconds{45}), "45s");
    EXPECT_EQ(FormatDuration(Seconds{SECONDS_PER_HOUR + 30}), "1h 30s");
    EXPECT_EQ(FormatDuration(Seconds{52 * SECONDS_PER_WEEK}), "52w");
    EXPECT_EQ(FormatDuration(Seconds{SECONDS_PER_WEEK + SECONDS_PER_DAY + SECONDS_PER_HOUR +
                                     SECONDS_PER_MINUTE + 1}),
              "1w 1d 1h 1m 1s");
    EXPECT_EQ(FormatDuration(Seconds{-2 * SECONDS_PER_DAY}), "-2d");
}

} // namespace
} // namespace util
} // namespace votelock
