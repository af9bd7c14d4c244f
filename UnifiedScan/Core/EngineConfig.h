/**
 * EngineConfig.h
 *
 * Tunables for a scan run and for remediation.
 *
 * The defaults reproduce the stock behaviour; an INI file can override
 * any of them:
 *
 *   [scan]
 *   roots = /home, /opt
 *   exclude = /proc, /sys
 *   processes = true
 *
 *   [heuristics]
 *   max_hash_file_size = 52428800
 *
 *   [progress]
 *   report_interval_ms = 250
 *
 *   [remediation]
 *   quarantine = false
 *
 *   [paths]
 *   signatures = data/signatures.txt
 *
 *   [logging]
 *   level = info
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace UnifiedScan {

    struct HeuristicConfig {
        uint64_t maxHashFileSize = 50000000;
        int recentFileDays = 7;
        uint64_t smallFileSize = 1000000;
        size_t shortFileNameLength = 8;
        std::vector<std::wstring> suspiciousNameTokens = { L"update", L"setup", L"install" };
        std::vector<std::wstring> hiddenExecutableLocations = { L"temp", L"appdata", L"programdata" };
        std::vector<std::wstring> tempLocations = { L"temp", L"tmp" };
    };

    struct ProgressConfig {
        int reportIntervalMs = 250;
        uint64_t immediateReportFiles = 5;
    };

    struct RemediationConfig {
        bool quarantineFiles = false;
        int elevationTimeoutMs = 5000;
        std::vector<std::wstring> extraProtectedPaths;
    };

    struct EngineConfig {
        // Empty: every fixed volume reported by the platform probe
        std::vector<std::wstring> scanRoots;
        std::vector<std::wstring> excludedPaths = DefaultExcludedPaths();

        bool scanProcesses = true;
        bool scanStartup = true;
        bool scanBrowserExtensions = true;
        bool scanFileSystem = true;
        bool scanRegistry = true;
        bool scanScheduledTasks = true;

        HeuristicConfig heuristics;
        ProgressConfig progress;
        RemediationConfig remediation;

        std::wstring signatureFile;
        std::wstring quarantineDirectory;
        std::wstring logDirectory;
        std::string logLevel = "info";

        static std::vector<std::wstring> DefaultExcludedPaths();
    };

    /**
     * Reads an INI file over the values already in config.
     * Unknown sections and keys are logged and ignored.
     * @return false if the file cannot be read or a value is malformed;
     *         error then holds a message naming the line
     */
    bool LoadEngineConfig(const std::wstring& path, EngineConfig& config, std::string& error);

} // namespace UnifiedScan
