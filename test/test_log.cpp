#include <gtest/gtest.h>
#include <string>
#include "Log.h"
#include "support/LogCapture.h"

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous = getLogLevel();
        clearCapturedLogs();
    }

    void TearDown() override {
        setLogLevel(previous);
    }

    LogLevel previous;
};

TEST_F(LogTest, FormatsTagAndMessage) {
    setLogLevel(LogLevel::Info);
    logInfo("RELAY", "Door relay energized for %d ms", 800);

    ASSERT_EQ(1u, capturedLogs().size());
    EXPECT_EQ("[RELAY] Door relay energized for 800 ms", capturedLogs()[0].text);
    EXPECT_EQ(LogLevel::Info, capturedLogs()[0].level);
}

TEST_F(LogTest, FiltersBelowMinimumLevel) {
    setLogLevel(LogLevel::Warn);
    logDebug("T", "debug");
    logInfo("T", "info");
    logWarn("T", "warn");
    logError("T", "error");

    ASSERT_EQ(2u, capturedLogs().size());
    EXPECT_EQ(LogLevel::Warn, capturedLogs()[0].level);
    EXPECT_EQ(LogLevel::Error, capturedLogs()[1].level);
}

TEST_F(LogTest, LongLinesAreTruncated) {
    setLogLevel(LogLevel::Debug);
    std::string text(LOG_LINE_MAX_LEN * 2, 'a');
    logDebug("T", "%s", text.c_str());

    ASSERT_EQ(1u, capturedLogs().size());
    EXPECT_EQ((size_t)LOG_LINE_MAX_LEN - 1, capturedLogs()[0].text.size());
}

TEST_F(LogTest, LevelNames) {
    EXPECT_STREQ("debug", logLevelName(LogLevel::Debug));
    EXPECT_STREQ("info", logLevelName(LogLevel::Info));
    EXPECT_STREQ("warn", logLevelName(LogLevel::Warn));
    EXPECT_STREQ("error", logLevelName(LogLevel::Error));
}
