#include <gtest/gtest.h>
#include "Core/FileScanner.h"
#include "Core/ScanSession.h"
#include "Core/SignatureStore.h"
#include "FakePlatformProbe.h"
#include "TempDirectory.h"

using namespace UnifiedScan;
using UnifiedScan::Testing::FakePlatformProbe;
using UnifiedScan::Testing::TempDirectory;

namespace fs = std::filesystem;

// ============================================================================
// Test Fixture
// ============================================================================

class FileScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        signatures.LoadDefaults();

        // Location tokens that cannot occur in the scratch directory's own path
        config.heuristics.hiddenExecutableLocations = { L"hidden-drop" };
        config.heuristics.tempLocations = { L"staging-temp" };
        config.scanRoots = { dir.WPath() };

        sink.onProgress = [this](const std::wstring&, int percent) { percents.push_back(percent); };
        session = std::make_unique<ScanSession>(signatures, probe, config, &sink, cancellation);
        scanner = std::make_unique<FileScanner>(*session);
    }

    std::vector<Threat> Classify(const fs::path& path) {
        return scanner->ClassifyFile(path.wstring());
    }

    TempDirectory dir;
    SignatureStore signatures;
    FakePlatformProbe probe;
    EngineConfig config;
    CancellationToken cancellation;
    CallbackEventSink sink;
    std::vector<int> percents;
    std::unique_ptr<ScanSession> session;
    std::unique_ptr<FileScanner> scanner;
};

// ============================================================================
// Name Checks
// ============================================================================

TEST_F(FileScannerTest, IsDisguisedExecutable) {
    EXPECT_TRUE(FileScanner::IsDisguisedExecutable(L"invoice.pdf.exe"));
    EXPECT_TRUE(FileScanner::IsDisguisedExecutable(L"Holiday.JPG.scr"));
    EXPECT_FALSE(FileScanner::IsDisguisedExecutable(L"photo.png.lnk"));
    EXPECT_FALSE(FileScanner::IsDisguisedExecutable(L"setup.exe"));
    EXPECT_FALSE(FileScanner::IsDisguisedExecutable(L"archive.tar.gz"));
    EXPECT_FALSE(FileScanner::IsDisguisedExecutable(L"my.app.exe"));
}

TEST_F(FileScannerTest, ExtensionSets) {
    EXPECT_TRUE(FileScanner::IsScannableExtension(L".EXE"));
    EXPECT_TRUE(FileScanner::IsScannableExtension(L".pdf"));
    EXPECT_FALSE(FileScanner::IsScannableExtension(L".txt"));
    EXPECT_TRUE(FileScanner::IsExecutableExtension(L".ps1"));
    EXPECT_FALSE(FileScanner::IsExecutableExtension(L".docx"));
}

TEST_F(FileScannerTest, ShouldSkipDirectory) {
    EXPECT_TRUE(FileScanner::ShouldSkipDirectory(L"$Recycle.Bin"));
    EXPECT_TRUE(FileScanner::ShouldSkipDirectory(L"System Volume Information"));
    EXPECT_TRUE(FileScanner::ShouldSkipDirectory(L"$SysReset"));
    EXPECT_FALSE(FileScanner::ShouldSkipDirectory(L"Documents"));
}

// ============================================================================
// Classification
// ============================================================================

TEST_F(FileScannerTest, Classify_DoubleExtensionIsHigh) {
    auto path = dir.WriteFile("invoice.pdf.exe", std::string(100, 'x'));
    auto threats = Classify(path);

    ASSERT_EQ(threats.size(), 1u);
    EXPECT_EQ(threats[0].category, ThreatCategory::FILE);
    EXPECT_EQ(threats[0].severity, ThreatSeverity::HIGH);
    EXPECT_EQ(threats[0].name, L"invoice.pdf.exe");
    EXPECT_EQ(threats[0].location, path.wstring());
    EXPECT_TRUE(threats[0].removable);
    ASSERT_TRUE(threats[0].sizeBytes.has_value());
    EXPECT_EQ(*threats[0].sizeBytes, 100u);
}

TEST_F(FileScannerTest, Classify_ShortcutIsClean) {
    auto path = dir.WriteFile("photo.png.lnk", "shortcut");
    EXPECT_TRUE(Classify(path).empty());
}

TEST_F(FileScannerTest, Classify_NamePatternUsesSignatureSeverity) {
    auto path = dir.WriteFile("cheap_Keylogger.zip", "zip");
    auto threats = Classify(path);

    ASSERT_EQ(threats.size(), 1u);
    EXPECT_EQ(threats[0].severity, ThreatSeverity::MEDIUM);
    EXPECT_EQ(threats[0].classification, "Suspicious File");
    EXPECT_EQ(probe.hashCalls, 0u);
}

/**
 * @brief A 10 KB executable whose digest is in the store is Critical malware.
 */
TEST_F(FileScannerTest, Classify_KnownHashIsCritical) {
    auto path = dir.WriteFile("payload.exe", std::string(10 * 1024, 'A'));
    probe.digests[path.wstring()] = "275a021bbfb6489e54d471899f7db9d1663fc695ec2fe2a2c4538aabf651fd0f";

    auto threats = Classify(path);
    ASSERT_EQ(threats.size(), 1u);
    EXPECT_EQ(threats[0].severity, ThreatSeverity::CRITICAL);
    EXPECT_EQ(threats[0].classification, "Malware");
    EXPECT_EQ(threats[0].details, L"SHA256: 275a021bbfb6489e54d471899f7db9d1663fc695ec2fe2a2c4538aabf651fd0f");
}

TEST_F(FileScannerTest, Classify_HashSkippedAtSizeCeiling) {
    auto path = dir.WriteFile("payload.exe", "x");
    FileMetadata large;
    large.size = config.heuristics.maxHashFileSize;
    large.creationTime = std::chrono::system_clock::now();
    probe.metadata[path.wstring()] = large;

    EXPECT_TRUE(Classify(path).empty());
    EXPECT_EQ(probe.hashCalls, 0u);
}

TEST_F(FileScannerTest, Classify_DocumentsNotHashed) {
    auto path = dir.WriteFile("quarterly.pdf", "pdf");
    probe.digests[path.wstring()] = "275a021bbfb6489e54d471899f7db9d1663fc695ec2fe2a2c4538aabf651fd0f";

    EXPECT_TRUE(Classify(path).empty());
    EXPECT_EQ(probe.hashCalls, 0u);
}

TEST_F(FileScannerTest, Classify_HiddenExecutableInDropLocation) {
    auto path = dir.WriteFile(fs::path("hidden-drop") / "svchosts.exe", std::string(64, 'x'));
    FileMetadata hidden;
    hidden.attributes = FileAttribute::HIDDEN;
    hidden.size = 64;
    hidden.creationTime = std::chrono::system_clock::now() - std::chrono::hours(24 * 90);
    probe.metadata[path.wstring()] = hidden;

    auto threats = Classify(path);
    ASSERT_EQ(threats.size(), 1u);
    EXPECT_EQ(threats[0].severity, ThreatSeverity::HIGH);
}

TEST_F(FileScannerTest, Classify_RecentTempExecutableIsLow) {
    auto path = dir.WriteFile(fs::path("staging-temp") / "setup.exe", std::string(500, 'x'));
    auto threats = Classify(path);

    ASSERT_EQ(threats.size(), 1u);
    EXPECT_EQ(threats[0].severity, ThreatSeverity::LOW);
    EXPECT_EQ(threats[0].classification, "Potentially Unwanted");
}

TEST_F(FileScannerTest, Classify_OldTempExecutableIsClean) {
    auto path = dir.WriteFile(fs::path("staging-temp") / "setup.exe", std::string(500, 'x'));
    FileMetadata old;
    old.size = 500;
    old.creationTime = std::chrono::system_clock::now() - std::chrono::hours(24 * 30);
    probe.metadata[path.wstring()] = old;

    EXPECT_TRUE(Classify(path).empty());
}

/**
 * @brief The location heuristics are independent: one file can raise both.
 */
TEST_F(FileScannerTest, Classify_HiddenAndRecentBothReported) {
    auto path = dir.WriteFile(fs::path("staging-temp") / "hidden-drop" / "upd.exe", std::string(100, 'x'));
    FileMetadata meta;
    meta.attributes = FileAttribute::HIDDEN;
    meta.size = 100;
    meta.creationTime = std::chrono::system_clock::now();
    probe.metadata[path.wstring()] = meta;

    auto threats = Classify(path);
    ASSERT_EQ(threats.size(), 2u);
    EXPECT_EQ(threats[0].severity, ThreatSeverity::HIGH);
    EXPECT_EQ(threats[1].severity, ThreatSeverity::LOW);
}

TEST_F(FileScannerTest, Classify_UnreadableMetadataSkipsFile) {
    auto path = dir.WriteFile("invoice.pdf.exe", "x");
    probe.metadataStatus[path.wstring()] = ProbeStatus::ACCESS_DENIED;
    EXPECT_TRUE(Classify(path).empty());
}

// ============================================================================
// Traversal
// ============================================================================

TEST_F(FileScannerTest, ResolveRoots_NoVolumesThrows) {
    config.scanRoots.clear();
    EXPECT_THROW(scanner->ResolveRoots(), ScanFailure);

    probe.volumes = { L"/mnt/data" };
    auto roots = scanner->ResolveRoots();
    ASSERT_EQ(roots.size(), 1u);
    EXPECT_EQ(roots[0], L"/mnt/data");
}

/**
 * @brief Counting and scanning visit the same files; skipped and excluded
 * directories and non-scannable extensions are left out of both.
 */
TEST_F(FileScannerTest, CountMatchesScan) {
    dir.WriteFile("a.exe", "a");
    dir.WriteFile("notes.txt", "not scannable");
    dir.WriteFile(fs::path("docs") / "report.pdf", "pdf");
    dir.WriteFile(fs::path("docs") / "deep" / "tool.ps1", "ps");
    dir.WriteFile(fs::path("docs") / "deep" / "invoice.pdf.exe", "bad");
    dir.WriteFile(fs::path("$Recycle.Bin") / "old.exe", "skipped");
    dir.WriteFile(fs::path("cache") / "cached.exe", "excluded");
    config.excludedPaths = { (dir.Path() / "cache").wstring() };

    FileScanner configured(*session);
    uint64_t total = 0;
    ASSERT_EQ(configured.CountFiles(config.scanRoots, total), PhaseOutcome::COMPLETED);
    EXPECT_EQ(total, 4u);

    session->SetTotalFilesEstimated(total);
    ASSERT_EQ(configured.ScanRoots(config.scanRoots), PhaseOutcome::COMPLETED);
    EXPECT_EQ(configured.GetFilesVisited(), total);
    EXPECT_EQ(session->FilesScanned(), total);

    ASSERT_EQ(session->Threats().size(), 1u);
    EXPECT_EQ(session->Threats()[0].name, L"invoice.pdf.exe");
}

TEST_F(FileScannerTest, ScanRoots_PercentStaysInFileRange) {
    for (int i = 0; i < 20; i++) {
        dir.WriteFile("file" + std::to_string(i) + ".pdf", "x");
    }
    uint64_t total = 0;
    ASSERT_EQ(scanner->CountFiles(config.scanRoots, total), PhaseOutcome::COMPLETED);
    session->SetTotalFilesEstimated(total);
    ASSERT_EQ(scanner->ScanRoots(config.scanRoots), PhaseOutcome::COMPLETED);

    ASSERT_FALSE(percents.empty());
    for (size_t i = 0; i < percents.size(); i++) {
        EXPECT_GE(percents[i], FileScanner::PROGRESS_START);
        EXPECT_LE(percents[i], FileScanner::PROGRESS_START + FileScanner::PROGRESS_SPAN);
        if (i > 0) EXPECT_GE(percents[i], percents[i - 1]);
    }
}

TEST_F(FileScannerTest, ScanRoots_CancelledBeforeStart) {
    dir.WriteFile("a.exe", "a");
    cancellation.Cancel();

    EXPECT_EQ(scanner->ScanRoots(config.scanRoots), PhaseOutcome::CANCELLED);
    EXPECT_EQ(scanner->GetFilesVisited(), 0u);
    EXPECT_EQ(session->FilesScanned(), 0u);
}

TEST_F(FileScannerTest, ScanRoots_MissingRootIsSkipped) {
    std::vector<std::wstring> roots = { (dir.Path() / "does-not-exist").wstring() };
    uint64_t total = 0;
    EXPECT_EQ(scanner->CountFiles(roots, total), PhaseOutcome::COMPLETED);
    EXPECT_EQ(total, 0u);
}
