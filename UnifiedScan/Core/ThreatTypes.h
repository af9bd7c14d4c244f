/**
 * ThreatTypes.h
 *
 * Result model shared by the scanners, the orchestrator and the remover.
 *
 * A Threat is created once by a scanner and never modified afterwards.
 * A ScanResult is sealed once ScanEngine returns it; remediation reads
 * its threats and produces independent RemovalResult values.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace UnifiedScan {

    enum class ThreatCategory {
        FILE,
        PROCESS,
        REGISTRY,
        STARTUP,
        BROWSER_EXTENSION,
        NETWORK,
        SCHEDULED_TASK,
        SERVICE
    };

    enum class ThreatSeverity { LOW, MEDIUM, HIGH, CRITICAL };

    struct Threat {
        ThreatCategory category = ThreatCategory::FILE;
        std::wstring name;              // entity name: file, process, value or extension id
        std::wstring description;
        std::wstring location;          // path, registry location or process image path
        std::wstring details;           // e.g. "SHA256: ..." or the registry value data
        ThreatSeverity severity = ThreatSeverity::LOW;
        std::string classification;     // "Malware", "Suspicious File", "Adware/PUP", ...
        bool removable = false;
        std::optional<uint64_t> sizeBytes;
        std::optional<uint32_t> processId;
        std::chrono::system_clock::time_point detectedAt;
    };

    struct ScanResult {
        std::chrono::system_clock::time_point startTime;
        std::chrono::system_clock::time_point endTime;
        std::chrono::milliseconds duration{ 0 };
        uint64_t filesScanned = 0;
        uint64_t totalFilesEstimated = 0;
        std::vector<Threat> threats;
        bool cancelled = false;
        std::optional<std::string> error;

        size_t ThreatsFound() const { return threats.size(); }
        size_t CountBySeverity(ThreatSeverity severity) const;
        size_t CriticalCount() const { return CountBySeverity(ThreatSeverity::CRITICAL); }
        size_t HighCount() const { return CountBySeverity(ThreatSeverity::HIGH); }
        size_t MediumCount() const { return CountBySeverity(ThreatSeverity::MEDIUM); }
        size_t LowCount() const { return CountBySeverity(ThreatSeverity::LOW); }
    };

    struct RemovalResult {
        bool success = false;
        std::wstring message;
        bool isProtectedSystem = false;
    };

    const wchar_t* ToString(ThreatCategory category);
    const wchar_t* ToString(ThreatSeverity severity);

    // "2m 5s" / "42s"
    std::wstring FormatDuration(std::chrono::milliseconds duration);

} // namespace UnifiedScan
