#include <gtest/gtest.h>
#include "Security/ThreatRemover.h"
#include "Security/Quarantine.h"
#include "FakePlatformProbe.h"
#include "TempDirectory.h"

using namespace UnifiedScan;
using UnifiedScan::Testing::FakePlatformProbe;
using UnifiedScan::Testing::TempDirectory;

namespace {

    const wchar_t* RUN_KEY = L"SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Run";

    Threat MakeThreat(ThreatCategory category, const std::wstring& name, const std::wstring& location) {
        Threat threat;
        threat.category = category;
        threat.name = name;
        threat.location = location;
        threat.severity = ThreatSeverity::HIGH;
        threat.removable = true;
        return threat;
    }

    bool StartsWith(const std::wstring& text, const std::wstring& prefix) {
        return text.compare(0, prefix.size(), prefix) == 0;
    }

} // namespace

class ThreatRemoverTest : public ::testing::Test {
protected:
    TempDirectory dir;
    FakePlatformProbe probe;
    ThreatRemover remover{ probe };
};

// ============================================================================
// Protected Locations
// ============================================================================

TEST_F(ThreatRemoverTest, IsProtectedSystemPath) {
    EXPECT_TRUE(ThreatRemover::IsProtectedSystemPath(L"C:\\Windows\\System32\\Tasks\\Microsoft\\Defrag"));
    EXPECT_TRUE(ThreatRemover::IsProtectedSystemPath(L"c:\\windows\\winsxs\\amd64_x\\a.dll"));
    EXPECT_TRUE(ThreatRemover::IsProtectedSystemPath(L"D:/$Recycle.Bin/S-1-5-21/$R1.exe"));
    EXPECT_TRUE(ThreatRemover::IsProtectedSystemPath(
        L"C:\\Program Files\\WindowsApps\\Microsoft.Photos_1.0\\Photos.exe"));
    EXPECT_TRUE(ThreatRemover::IsProtectedSystemPath(L"C:\\Windows\\SystemApps\\Shell\\x.exe"));
    EXPECT_FALSE(ThreatRemover::IsProtectedSystemPath(L"C:\\Users\\bob\\Downloads\\invoice.pdf.exe"));
    EXPECT_FALSE(ThreatRemover::IsProtectedSystemPath(L"C:\\Windows\\System32\\drivers\\evil.sys"));
    EXPECT_FALSE(ThreatRemover::IsProtectedSystemPath(L""));
}

/**
 * @brief A protected file is reported as such and never reaches the delete call.
 */
TEST_F(ThreatRemoverTest, Remove_ProtectedFileUntouched) {
    Threat threat = MakeThreat(ThreatCategory::FILE, L"Defrag", L"C:\\Windows\\System32\\Tasks\\Defrag");

    RemovalResult result = remover.RemoveThreat(threat);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.isProtectedSystem);
    EXPECT_EQ(result.message, L"Protected Windows component - requires TrustedInstaller (safe to ignore)");
    EXPECT_TRUE(probe.removedFiles.empty());
    EXPECT_TRUE(probe.elevatedPaths.empty());
}

TEST_F(ThreatRemoverTest, Remove_ConfiguredProtectedPath) {
    auto path = dir.WriteFile("vendor/tool.exe", "x");
    RemediationConfig config;
    config.extraProtectedPaths = { dir.WPath() };
    ThreatRemover guarded(probe, config);

    EXPECT_TRUE(guarded.IsProtectedPath(path.wstring()));
    RemovalResult result = guarded.RemoveThreat(MakeThreat(ThreatCategory::FILE, L"tool.exe", path.wstring()));
    EXPECT_TRUE(result.isProtectedSystem);
    EXPECT_TRUE(std::filesystem::exists(path));
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ThreatRemoverTest, Remove_FileIsIdempotent) {
    auto path = dir.WriteFile("invoice.pdf.exe", "bad");
    Threat threat = MakeThreat(ThreatCategory::FILE, L"invoice.pdf.exe", path.wstring());

    RemovalResult first = remover.RemoveThreat(threat);
    EXPECT_TRUE(first.success);
    EXPECT_EQ(first.message, L"Deleted: invoice.pdf.exe");
    EXPECT_FALSE(std::filesystem::exists(path));

    RemovalResult second = remover.RemoveThreat(threat);
    EXPECT_TRUE(second.success);
    EXPECT_EQ(second.message, L"File already removed");
    EXPECT_EQ(probe.removedFiles.size(), 1u);
}

TEST_F(ThreatRemoverTest, Remove_AccessDeniedGoesThroughElevation) {
    auto path = dir.WriteFile("locked.exe", "bad");
    probe.removeStatus[path.wstring()] = ProbeStatus::ACCESS_DENIED;

    RemovalResult result = remover.RemoveThreat(MakeThreat(ThreatCategory::FILE, L"locked.exe", path.wstring()));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, L"Force deleted: locked.exe");
    ASSERT_EQ(probe.elevatedPaths.size(), 1u);
    EXPECT_EQ(probe.elevatedPaths[0], path.wstring());
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ThreatRemoverTest, Remove_ElevationTimeoutFails) {
    auto path = dir.WriteFile("locked.exe", "bad");
    probe.removeStatus[path.wstring()] = ProbeStatus::ACCESS_DENIED;
    probe.elevateStatus = ProbeStatus::TIMED_OUT;

    RemovalResult result = remover.RemoveThreat(MakeThreat(ThreatCategory::FILE, L"locked.exe", path.wstring()));

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.isProtectedSystem);
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(ThreatRemoverTest, Remove_FileInUse) {
    auto path = dir.WriteFile("busy.exe", "bad");
    probe.removeStatus[path.wstring()] = ProbeStatus::IN_USE;

    RemovalResult result = remover.RemoveThreat(MakeThreat(ThreatCategory::FILE, L"busy.exe", path.wstring()));

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(probe.elevatedPaths.empty());
}

TEST_F(ThreatRemoverTest, Remove_FileIntoQuarantine) {
    TempDirectory vault;
    auto path = dir.WriteFile("payload.exe", "MZ payload");
    QuarantineManager quarantine(probe);
    QuarantineConfig quarantineConfig;
    quarantineConfig.quarantineRoot = vault.WPath();
    ASSERT_TRUE(quarantine.Initialize(quarantineConfig));

    RemediationConfig config;
    config.quarantineFiles = true;
    ThreatRemover quarantining(probe, config, &quarantine);

    RemovalResult result = quarantining.RemoveThreat(
        MakeThreat(ThreatCategory::FILE, L"payload.exe", path.wstring()));

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(StartsWith(result.message, L"Quarantined: payload.exe ("));
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_EQ(quarantine.GetQuarantineCount(), 1u);
}

TEST_F(ThreatRemoverTest, Remove_QuarantineLockedFileIsNotElevated) {
    TempDirectory vault;
    auto path = dir.WriteFile("busy.exe", "MZ payload");
    probe.removeStatus[path.wstring()] = ProbeStatus::IN_USE;
    QuarantineManager quarantine(probe);
    QuarantineConfig quarantineConfig;
    quarantineConfig.quarantineRoot = vault.WPath();
    ASSERT_TRUE(quarantine.Initialize(quarantineConfig));

    RemediationConfig config;
    config.quarantineFiles = true;
    ThreatRemover quarantining(probe, config, &quarantine);

    RemovalResult result = quarantining.RemoveThreat(
        MakeThreat(ThreatCategory::FILE, L"busy.exe", path.wstring()));

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(probe.elevatedPaths.empty());
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(quarantine.GetQuarantineCount(), 0u);
}

// ============================================================================
// Processes
// ============================================================================

TEST_F(ThreatRemoverTest, Remove_ProcessByPid) {
    probe.processes = { { 42, L"xmrig.exe", L"" } };
    Threat threat = MakeThreat(ThreatCategory::PROCESS, L"xmrig.exe", L"Unknown");
    threat.processId = 42;

    RemovalResult first = remover.RemoveThreat(threat);
    EXPECT_TRUE(first.success);
    EXPECT_EQ(first.message, L"Process xmrig.exe (PID 42) terminated");

    RemovalResult second = remover.RemoveThreat(threat);
    EXPECT_TRUE(second.success);
    EXPECT_EQ(second.message, L"Process already terminated");
}

TEST_F(ThreatRemoverTest, Remove_ProcessByNameKillsEveryInstance) {
    probe.processes = {
        { 10, L"XMRig.exe", L"" },
        { 11, L"bash", L"" },
        { 12, L"xmrig.exe", L"" },
    };

    RemovalResult result = remover.RemoveThreat(MakeThreat(ThreatCategory::PROCESS, L"xmrig.exe", L"Unknown"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, L"Terminated 2 process(es)");
    ASSERT_EQ(probe.killedProcesses.size(), 2u);
    EXPECT_EQ(probe.processes.size(), 1u);
}

TEST_F(ThreatRemoverTest, Remove_ProcessKillDenied) {
    probe.processes = { { 7, L"mimikatz.exe", L"" } };
    probe.killStatus[7] = ProbeStatus::ACCESS_DENIED;
    Threat threat = MakeThreat(ThreatCategory::PROCESS, L"mimikatz.exe", L"Unknown");
    threat.processId = 7;

    EXPECT_FALSE(remover.RemoveThreat(threat).success);
}

// ============================================================================
// Registry
// ============================================================================

TEST_F(ThreatRemoverTest, Remove_StartupEntryBothHives) {
    probe.SetRegistryValue(RegistryHive::CURRENT_USER, RUN_KEY, L"Updater", L"keylog.exe");
    probe.SetRegistryValue(RegistryHive::LOCAL_MACHINE, RUN_KEY, L"Updater", L"keylog.exe");
    Threat threat = MakeThreat(ThreatCategory::STARTUP, L"Updater", std::wstring(L"HKCU\\") + RUN_KEY + L"\\Updater");

    RemovalResult result = remover.RemoveThreat(threat);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, L"Removed startup entry: Updater");
    EXPECT_FALSE(probe.HasRegistryValue(RegistryHive::CURRENT_USER, RUN_KEY, L"Updater"));
    EXPECT_FALSE(probe.HasRegistryValue(RegistryHive::LOCAL_MACHINE, RUN_KEY, L"Updater"));

    RemovalResult again = remover.RemoveThreat(threat);
    EXPECT_TRUE(again.success);
}

/**
 * @brief A value that survives the delete is reported as a failure.
 */
TEST_F(ThreatRemoverTest, Remove_StartupEntryVerifiedAbsent) {
    probe.SetRegistryValue(RegistryHive::CURRENT_USER, RUN_KEY, L"Sticky", L"keylog.exe");
    probe.deleteValueStatus[L"Sticky"] = ProbeStatus::ACCESS_DENIED;

    RemovalResult result = remover.RemoveThreat(
        MakeThreat(ThreatCategory::STARTUP, L"Sticky", std::wstring(L"HKCU\\") + RUN_KEY + L"\\Sticky"));

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(StartsWith(result.message, L"Could not remove startup entry"));
}

TEST_F(ThreatRemoverTest, Remove_RegistryValueOnlyNamedHive) {
    const wchar_t* key = L"SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Policies\\Explorer\\Run";
    probe.SetRegistryValue(RegistryHive::LOCAL_MACHINE, key, L"Run1", L"powershell -enc AAAA");
    probe.SetRegistryValue(RegistryHive::CURRENT_USER, key, L"Run1", L"untouched");

    RemovalResult result = remover.RemoveThreat(
        MakeThreat(ThreatCategory::REGISTRY, L"Run1", std::wstring(L"HKLM\\") + key + L"\\Run1"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, L"Removed registry value: Run1");
    EXPECT_FALSE(probe.HasRegistryValue(RegistryHive::LOCAL_MACHINE, key, L"Run1"));
    EXPECT_TRUE(probe.HasRegistryValue(RegistryHive::CURRENT_USER, key, L"Run1"));
}

TEST_F(ThreatRemoverTest, Remove_NonRemovableRegistryUntouched) {
    Threat threat = MakeThreat(ThreatCategory::REGISTRY, L"Shell",
        L"HKLM\\SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion\\Winlogon\\Shell");
    threat.removable = false;

    RemovalResult result = remover.RemoveThreat(threat);

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.isProtectedSystem);
    EXPECT_TRUE(probe.deletedValues.empty());
}

TEST_F(ThreatRemoverTest, ParseRegistryLocation) {
    std::optional<RegistryHive> hive;
    std::wstring key;
    std::wstring value;

    ASSERT_TRUE(ThreatRemover::ParseRegistryLocation(L"hkey_local_machine\\SOFTWARE\\Run\\evil", hive, key, value));
    ASSERT_TRUE(hive.has_value());
    EXPECT_EQ(*hive, RegistryHive::LOCAL_MACHINE);
    EXPECT_EQ(key, L"SOFTWARE\\Run");
    EXPECT_EQ(value, L"evil");

    ASSERT_TRUE(ThreatRemover::ParseRegistryLocation(L"HKCU\\SOFTWARE\\Run\\x", hive, key, value));
    EXPECT_EQ(*hive, RegistryHive::CURRENT_USER);

    ASSERT_TRUE(ThreatRemover::ParseRegistryLocation(L"SOFTWARE\\Run\\bare", hive, key, value));
    EXPECT_FALSE(hive.has_value());
    EXPECT_EQ(value, L"bare");

    EXPECT_FALSE(ThreatRemover::ParseRegistryLocation(L"novalue", hive, key, value));
}

// ============================================================================
// Other Categories
// ============================================================================

TEST_F(ThreatRemoverTest, Remove_ServiceDisabledByStem) {
    RemovalResult result = remover.RemoveThreat(
        MakeThreat(ThreatCategory::SERVICE, L"badsvc", L"C:\\ProgramData\\svc\\badsvc.exe"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, L"Service badsvc disabled");
    ASSERT_EQ(probe.disabledServices.size(), 1u);
    EXPECT_EQ(probe.disabledServices[0], L"badsvc");
}

TEST_F(ThreatRemoverTest, Remove_ScheduledTaskDisablesService) {
    probe.serviceResult = { ProbeStatus::OK, ProbeStatus::ACCESS_DENIED };

    RemovalResult result = remover.RemoveThreat(
        MakeThreat(ThreatCategory::SCHEDULED_TASK, L"evilminer", L"/etc/cron.d/evilminer"));

    EXPECT_TRUE(result.success);
    ASSERT_EQ(probe.disabledServices.size(), 1u);
    EXPECT_EQ(probe.disabledServices[0], L"evilminer");
}

TEST_F(ThreatRemoverTest, Remove_ServiceDisableFails) {
    probe.serviceResult = { ProbeStatus::ACCESS_DENIED, ProbeStatus::ACCESS_DENIED };
    EXPECT_FALSE(remover.RemoveThreat(MakeThreat(ThreatCategory::SERVICE, L"svc", L"svc")).success);
}

TEST_F(ThreatRemoverTest, Remove_BrowserExtensionNeedsBrowser) {
    Threat threat = MakeThreat(ThreatCategory::BROWSER_EXTENSION, L"abcdefgh", dir.WPath());
    threat.removable = false;

    RemovalResult result = remover.RemoveThreat(threat);

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find(L"extension manager"), std::wstring::npos);
    EXPECT_TRUE(std::filesystem::exists(dir.Path()));
}

TEST_F(ThreatRemoverTest, Remove_NetworkUnsupported) {
    RemovalResult result = remover.RemoveThreat(MakeThreat(ThreatCategory::NETWORK, L"conn", L"10.0.0.1:4444"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, L"Removal not supported for type: Network");
}
