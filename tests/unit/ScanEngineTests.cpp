#include <gtest/gtest.h>
#include "Core/ScanEngine.h"
#include "Core/SignatureStore.h"
#include "FakePlatformProbe.h"
#include "TempDirectory.h"
#include <algorithm>

using namespace UnifiedScan;
using UnifiedScan::Testing::FakePlatformProbe;
using UnifiedScan::Testing::TempDirectory;

namespace fs = std::filesystem;

namespace {

    const wchar_t* RUN_KEY = L"SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Run";

    struct RecordedProgress {
        std::wstring message;
        int percent;
    };

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class ScanEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        signatures.LoadDefaults();

        config.scanRoots = { dir.WPath() };
        config.heuristics.hiddenExecutableLocations = { L"hidden-drop" };
        config.heuristics.tempLocations = { L"staging-temp" };

        sink.onProgress = [this](const std::wstring& message, int percent) {
            progress.push_back({ message, percent });
        };
        sink.onThreatFound = [this](const Threat& threat) { found.push_back(threat); };
    }

    // One threat per domain with a scriptable surface
    void PopulateInfectedMachine() {
        probe.processes = { { 100, L"xmrig.exe", L"C:\\Users\\x\\xmrig.exe" }, { 101, L"init", L"" } };
        probe.SetRegistryValue(RegistryHive::CURRENT_USER, RUN_KEY, L"Updater", L"C:\\Users\\x\\keylog.exe");
        dir.WriteFile("invoice.pdf.exe", "bad");
        dir.WriteFile("report.pdf", "fine");
    }

    TempDirectory dir;
    SignatureStore signatures;
    FakePlatformProbe probe;
    EngineConfig config;
    CallbackEventSink sink;
    std::vector<RecordedProgress> progress;
    std::vector<Threat> found;
};

// ============================================================================
// Complete Runs
// ============================================================================

/**
 * @brief Progress never moves backwards and only the completed scan reaches 100.
 */
TEST_F(ScanEngineTest, RunScan_ProgressMonotonicToHundred) {
    PopulateInfectedMachine();
    ScanEngine engine(signatures, probe, config);

    ScanResult result = engine.RunScan(&sink);

    ASSERT_FALSE(result.error.has_value());
    EXPECT_FALSE(result.cancelled);
    ASSERT_FALSE(progress.empty());
    for (size_t i = 1; i < progress.size(); i++) {
        EXPECT_GE(progress[i].percent, progress[i - 1].percent) << "at event " << i;
    }
    EXPECT_EQ(progress.back().percent, 100);
    EXPECT_EQ(std::count_if(progress.begin(), progress.end(),
        [](const RecordedProgress& p) { return p.percent == 100; }), 1);
    EXPECT_EQ(engine.GetState(), ScanState::COMPLETED);
    EXPECT_FALSE(engine.IsScanning());
}

TEST_F(ScanEngineTest, RunScan_CollectsEveryDomain) {
    PopulateInfectedMachine();
    ScanEngine engine(signatures, probe, config);

    ScanResult result = engine.RunScan(&sink);

    ASSERT_EQ(result.ThreatsFound(), 3u);
    EXPECT_EQ(found.size(), 3u);
    EXPECT_EQ(result.threats[0].category, ThreatCategory::PROCESS);
    EXPECT_EQ(result.threats[1].category, ThreatCategory::STARTUP);
    EXPECT_EQ(result.threats[2].category, ThreatCategory::FILE);

    // 2 processes + 1 startup value + 2 files + 2 Winlogon values
    EXPECT_EQ(result.filesScanned, 7u);
    EXPECT_EQ(result.totalFilesEstimated, 2u);
    EXPECT_GE(result.endTime, result.startTime);
    EXPECT_EQ(progress.back().message.rfind(L"Found 3 threats in 7 files", 0), 0u);
}

TEST_F(ScanEngineTest, RunScan_SeverityCountsPartitionThreats) {
    PopulateInfectedMachine();
    ScanEngine engine(signatures, probe, config);

    ScanResult result = engine.RunScan();

    EXPECT_EQ(result.CriticalCount(), 1u);
    EXPECT_EQ(result.HighCount(), 2u);
    EXPECT_EQ(result.CriticalCount() + result.HighCount() + result.MediumCount() + result.LowCount(),
        result.ThreatsFound());
}

TEST_F(ScanEngineTest, RunScan_CleanMessage) {
    dir.WriteFile("report.pdf", "fine");
    ScanEngine engine(signatures, probe, config);

    ScanResult result = engine.RunScan(&sink);

    EXPECT_EQ(result.ThreatsFound(), 0u);
    EXPECT_EQ(progress.back().message.rfind(L"Scan complete! Scanned ", 0), 0u);
    EXPECT_NE(progress.back().message.find(L"No threats found!"), std::wstring::npos);
}

TEST_F(ScanEngineTest, RunScan_DisabledPhasesSkipped) {
    PopulateInfectedMachine();
    config.scanFileSystem = false;
    config.scanStartup = false;
    ScanEngine engine(signatures, probe, config);

    ScanResult result = engine.RunScan();

    ASSERT_EQ(result.ThreatsFound(), 1u);
    EXPECT_EQ(result.threats[0].category, ThreatCategory::PROCESS);
    EXPECT_EQ(result.totalFilesEstimated, 0u);
}

// ============================================================================
// Failure and Cancellation
// ============================================================================

TEST_F(ScanEngineTest, RunScan_NoVolumesIsError) {
    config.scanRoots.clear();
    ScanEngine engine(signatures, probe, config);

    ScanResult result = engine.RunScan(&sink);

    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "No fixed local volume is available to scan");
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(engine.GetState(), ScanState::FAILED);
    EXPECT_LT(progress.back().percent, 100);
    EXPECT_EQ(progress.back().message.rfind(L"Error: ", 0), 0u);
}

/**
 * @brief A cancel during the process phase keeps what was found so far.
 */
TEST_F(ScanEngineTest, CancelScan_PreservesPartialResult) {
    PopulateInfectedMachine();
    ScanEngine engine(signatures, probe, config);
    sink.onThreatFound = [&engine](const Threat&) { engine.CancelScan(); };

    ScanResult result = engine.RunScan(&sink);

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.error.has_value());
    ASSERT_EQ(result.ThreatsFound(), 1u);
    EXPECT_EQ(result.threats[0].name, L"xmrig.exe");
    EXPECT_EQ(result.filesScanned, 1u);
    EXPECT_EQ(engine.GetState(), ScanState::CANCELLED);
    EXPECT_LT(progress.back().percent, 100);
    EXPECT_EQ(progress.back().message.rfind(L"Scan cancelled after 1 files", 0), 0u);
}

/**
 * @brief A cancel issued on the first progress report, right after the scan claims
 *        the engine, stops the run before any phase does work.
 */
TEST_F(ScanEngineTest, CancelScan_AtFirstReportIsHonored) {
    PopulateInfectedMachine();
    ScanEngine engine(signatures, probe, config);
    sink.onProgress = [&](const std::wstring& message, int percent) {
        if (progress.empty()) engine.CancelScan();
        progress.push_back({ message, percent });
    };

    ScanResult result = engine.RunScan(&sink);

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.ThreatsFound(), 0u);
    EXPECT_EQ(result.filesScanned, 0u);
    EXPECT_EQ(engine.GetState(), ScanState::CANCELLED);
}

TEST_F(ScanEngineTest, CancelScan_NextScanStartsClean) {
    PopulateInfectedMachine();
    ScanEngine engine(signatures, probe, config);
    sink.onThreatFound = [&engine](const Threat&) { engine.CancelScan(); };

    ASSERT_TRUE(engine.RunScan(&sink).cancelled);

    ScanResult second = engine.RunScan();
    EXPECT_FALSE(second.cancelled);
    EXPECT_EQ(second.ThreatsFound(), 3u);
}

TEST_F(ScanEngineTest, CancelScan_IdleIsNoOp) {
    ScanEngine engine(signatures, probe, config);
    engine.CancelScan();

    ScanResult result = engine.RunScan();
    EXPECT_FALSE(result.cancelled);
}

TEST_F(ScanEngineTest, RunScan_SecondScanRejectedWhileRunning) {
    ScanEngine engine(signatures, probe, config);
    std::optional<ScanResult> nested;
    ScanStartStatus nestedStart = ScanStartStatus::STARTED;

    sink.onProgress = [&](const std::wstring&, int) {
        if (nested) return;
        nested = engine.RunScan();
        std::future<ScanResult> handle;
        nestedStart = engine.StartScan(nullptr, handle);
    };

    ScanResult result = engine.RunScan(&sink);

    EXPECT_FALSE(result.error.has_value());
    ASSERT_TRUE(nested.has_value());
    ASSERT_TRUE(nested->error.has_value());
    EXPECT_EQ(*nested->error, "Scan already in progress");
    EXPECT_EQ(nestedStart, ScanStartStatus::ALREADY_RUNNING);
}

// ============================================================================
// Background Worker
// ============================================================================

TEST_F(ScanEngineTest, StartScan_DeliversResultAndEvents) {
    PopulateInfectedMachine();
    ScanEngine engine(signatures, probe, config);
    auto queue = std::make_shared<ScanEventQueue>();

    std::future<ScanResult> handle;
    ASSERT_EQ(engine.StartScan(queue, handle), ScanStartStatus::STARTED);
    ScanResult result = handle.get();

    EXPECT_EQ(result.ThreatsFound(), 3u);
    EXPECT_FALSE(engine.IsScanning());

    auto events = queue->Drain();
    size_t threatEvents = std::count_if(events.begin(), events.end(),
        [](const ScanEvent& e) { return e.type == ScanEventType::THREAT_FOUND; });
    EXPECT_EQ(threatEvents, 3u);

    // The engine can be reused once the worker is done
    std::future<ScanResult> second;
    ASSERT_EQ(engine.StartScan(nullptr, second), ScanStartStatus::STARTED);
    EXPECT_EQ(second.get().ThreatsFound(), 3u);
}
