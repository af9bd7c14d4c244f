/**
 * ThreatTypes.cpp - Result model helpers
 */

#include "ThreatTypes.h"
#include <algorithm>

namespace UnifiedScan {

    size_t ScanResult::CountBySeverity(ThreatSeverity severity) const {
        return static_cast<size_t>(std::count_if(threats.begin(), threats.end(),
            [severity](const Threat& t) { return t.severity == severity; }));
    }

    const wchar_t* ToString(ThreatCategory category) {
        switch (category) {
        case ThreatCategory::FILE:              return L"File";
        case ThreatCategory::PROCESS:           return L"Process";
        case ThreatCategory::REGISTRY:          return L"Registry";
        case ThreatCategory::STARTUP:           return L"Startup";
        case ThreatCategory::BROWSER_EXTENSION: return L"BrowserExtension";
        case ThreatCategory::NETWORK:           return L"Network";
        case ThreatCategory::SCHEDULED_TASK:    return L"ScheduledTask";
        case ThreatCategory::SERVICE:           return L"Service";
        }
        return L"Unknown";
    }

    const wchar_t* ToString(ThreatSeverity severity) {
        switch (severity) {
        case ThreatSeverity::LOW:      return L"Low";
        case ThreatSeverity::MEDIUM:   return L"Medium";
        case ThreatSeverity::HIGH:     return L"High";
        case ThreatSeverity::CRITICAL: return L"Critical";
        }
        return L"Unknown";
    }

    std::wstring FormatDuration(std::chrono::milliseconds duration) {
        auto totalSeconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
        if (totalSeconds < 0) totalSeconds = 0;

        if (totalSeconds >= 60) {
            return std::to_wstring(totalSeconds / 60) + L"m " + std::to_wstring(totalSeconds % 60) + L"s";
        }
        return std::to_wstring(totalSeconds) + L"s";
    }

} // namespace UnifiedScan
