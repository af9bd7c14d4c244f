#include <gtest/gtest.h>
#include "Core/EngineConfig.h"
#include "TempDirectory.h"

using namespace UnifiedScan;
using UnifiedScan::Testing::TempDirectory;

class EngineConfigTest : public ::testing::Test {
protected:
    std::wstring Write(const std::string& content) {
        return dir.WriteFile("engine.ini", content).wstring();
    }

    TempDirectory dir;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(EngineConfigTest, Defaults) {
    EngineConfig config;
    EXPECT_TRUE(config.scanRoots.empty());
    EXPECT_TRUE(config.scanProcesses);
    EXPECT_TRUE(config.scanScheduledTasks);
    EXPECT_EQ(config.heuristics.maxHashFileSize, 50000000u);
    EXPECT_EQ(config.heuristics.recentFileDays, 7);
    EXPECT_EQ(config.progress.reportIntervalMs, 250);
    EXPECT_EQ(config.progress.immediateReportFiles, 5u);
    EXPECT_FALSE(config.remediation.quarantineFiles);
    EXPECT_EQ(config.logLevel, "info");
}

// ============================================================================
// INI Loading
// ============================================================================

TEST_F(EngineConfigTest, Load_AllSections) {
    auto path = Write(
        "# engine settings\n"
        "[scan]\n"
        "roots = /srv, /home\n"
        "exclude = /srv/cache\n"
        "registry = no\n"
        "\n"
        "[Heuristics]\n"
        "max_hash_file_size = 1048576\n"
        "suspicious_names = Patch, Loader\n"
        "\n"
        "[progress]\n"
        "report_interval_ms = 100\n"
        "\n"
        "[remediation]\n"
        "quarantine = true\n"
        "protected_paths = /opt/vendor\n"
        "\n"
        "[paths]\n"
        "signatures = data/signatures.txt\n"
        "\n"
        "[logging]\n"
        "level = Warning\n");

    EngineConfig config;
    std::string error;
    ASSERT_TRUE(LoadEngineConfig(path, config, error)) << error;

    ASSERT_EQ(config.scanRoots.size(), 2u);
    EXPECT_EQ(config.scanRoots[0], L"/srv");
    EXPECT_EQ(config.scanRoots[1], L"/home");
    ASSERT_EQ(config.excludedPaths.size(), 1u);
    EXPECT_FALSE(config.scanRegistry);
    EXPECT_TRUE(config.scanStartup);
    EXPECT_EQ(config.heuristics.maxHashFileSize, 1048576u);
    ASSERT_EQ(config.heuristics.suspiciousNameTokens.size(), 2u);
    EXPECT_EQ(config.heuristics.suspiciousNameTokens[0], L"patch");
    EXPECT_EQ(config.progress.reportIntervalMs, 100);
    EXPECT_TRUE(config.remediation.quarantineFiles);
    ASSERT_EQ(config.remediation.extraProtectedPaths.size(), 1u);
    EXPECT_EQ(config.signatureFile, L"data/signatures.txt");
    EXPECT_EQ(config.logLevel, "warning");
}

TEST_F(EngineConfigTest, Load_UnknownKeysIgnored) {
    auto path = Write("[scan]\ncolour = blue\n[extras]\nanything = 1\n");
    EngineConfig config;
    std::string error;
    EXPECT_TRUE(LoadEngineConfig(path, config, error));
}

/**
 * @brief A bad value names its line and leaves the caller's config untouched.
 */
TEST_F(EngineConfigTest, Load_BadValue) {
    auto path = Write("[scan]\nprocesses = false\n[progress]\nreport_interval_ms = soon\n");
    EngineConfig config;
    std::string error;

    EXPECT_FALSE(LoadEngineConfig(path, config, error));
    EXPECT_EQ(error, "line 4: invalid value for progress.report_interval_ms");
    EXPECT_TRUE(config.scanProcesses);
}

TEST_F(EngineConfigTest, Load_MalformedLines) {
    EngineConfig config;
    std::string error;

    EXPECT_FALSE(LoadEngineConfig(Write("[scan\n"), config, error));
    EXPECT_EQ(error, "line 1: unterminated section header");

    EXPECT_FALSE(LoadEngineConfig(Write("[scan]\nprocesses\n"), config, error));
    EXPECT_EQ(error, "line 2: expected key = value");

    EXPECT_FALSE(LoadEngineConfig(Write("[logging]\nlevel = loud\n"), config, error));
}

TEST_F(EngineConfigTest, Load_MissingFile) {
    EngineConfig config;
    std::string error;
    EXPECT_FALSE(LoadEngineConfig((dir.Path() / "none.ini").wstring(), config, error));
    EXPECT_FALSE(error.empty());
}
