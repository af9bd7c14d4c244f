#include <gtest/gtest.h>
#include "Utils/Logger.h"
#include "TempDirectory.h"

using namespace UnifiedScan;
using UnifiedScan::Testing::TempDirectory;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_saved = Logger::GetInstance().GetConfig();
    }

    void TearDown() override {
        Logger::GetInstance().Configure(m_saved);
    }

    LoggerConfig m_saved;
};

// ============================================================================
// Levels
// ============================================================================

TEST_F(LoggerTest, ParseLevel_KnownNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::ParseLevel("TRACE", level));
    EXPECT_EQ(level, LogLevel::TRACE);
    EXPECT_TRUE(Logger::ParseLevel(" warn ", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_TRUE(Logger::ParseLevel("error", level));
    EXPECT_EQ(level, LogLevel::FAILURE);
}

TEST_F(LoggerTest, ParseLevel_UnknownLeavesLevel) {
    LogLevel level = LogLevel::CRITICAL;
    EXPECT_FALSE(Logger::ParseLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::CRITICAL);
}

TEST_F(LoggerTest, IsEnabled_RespectsMinimum) {
    LoggerConfig config;
    config.minLevel = LogLevel::WARNING;
    config.toConsole = false;
    Logger::GetInstance().Configure(config);

    EXPECT_FALSE(Logger::GetInstance().IsEnabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::GetInstance().IsEnabled(LogLevel::WARNING));
    EXPECT_TRUE(Logger::GetInstance().IsEnabled(LogLevel::CRITICAL));
}

// ============================================================================
// File Output
// ============================================================================

/**
 * @brief Enabled lines land in the daily file with their tag; filtered lines do not.
 */
TEST_F(LoggerTest, Write_DailyFile) {
    TempDirectory dir;
    LoggerConfig config;
    config.minLevel = LogLevel::INFO;
    config.toConsole = false;
    config.logDirectory = dir.WPath();
    Logger::GetInstance().Configure(config);

    LogTrace("LoggerTest", L"hidden line");
    LogWarning("LoggerTest", L"visible line");

    std::filesystem::path logFile;
    for (const auto& entry : std::filesystem::directory_iterator(dir.Path())) {
        logFile = entry.path();
    }
    ASSERT_FALSE(logFile.empty());
    EXPECT_EQ(logFile.extension(), ".log");

    std::string content = TempDirectory::ReadFile(logFile);
    EXPECT_NE(content.find("[WARNING] LoggerTest: visible line"), std::string::npos);
    EXPECT_EQ(content.find("hidden line"), std::string::npos);
}
