/**
 * RegistryScanner.cpp - Registry hijack points
 */

#include "RegistryScanner.h"
#include "ScanSession.h"
#include "SignatureStore.h"
#include "../Utils/StringUtils.h"
#include "../Utils/Logger.h"

namespace UnifiedScan {

    static const wchar_t* WINLOGON_KEY = L"SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion\\Winlogon";
    static const wchar_t* BHO_KEY = L"SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Explorer\\Browser Helper Objects";

    const std::vector<RegistryLocation>& RegistryScanner::ValueLocations() {
        static const std::vector<RegistryLocation> locations = {
            { RegistryHive::LOCAL_MACHINE, L"SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Policies\\Explorer\\Run" },
            { RegistryHive::LOCAL_MACHINE, L"SOFTWARE\\Microsoft\\Internet Explorer\\Toolbar" },
            { RegistryHive::LOCAL_MACHINE, L"SOFTWARE\\Microsoft\\Internet Explorer\\Extensions" },
            { RegistryHive::CURRENT_USER,  L"SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Policies\\Explorer\\Run" },
        };
        return locations;
    }

    PhaseOutcome RegistryScanner::CheckValue(ScanSession& session, RegistryHive hive, const std::wstring& key,
        const std::wstring& valueName, bool removable) {
        if (session.IsCancelled()) return PhaseOutcome::CANCELLED;
        session.IncrementFilesScanned();

        std::wstring location = FormatRegistryLocation(hive, key, valueName);
        try {
            std::wstring value;
            ProbeStatus status = session.Probe().ReadRegistryValue(hive, key, valueName, value);
            if (status != ProbeStatus::OK) {
                if (status != ProbeStatus::NOT_FOUND && status != ProbeStatus::NOT_SUPPORTED) {
                    LogTrace("RegistryScanner", L"Cannot read " + location + L": " + ToString(status));
                }
                return PhaseOutcome::COMPLETED;
            }

            auto signature = session.Signatures().MatchRegistryValue(value);
            if (!signature) return PhaseOutcome::COMPLETED;

            Threat threat;
            threat.category = ThreatCategory::REGISTRY;
            threat.name = valueName.empty() ? key.substr(key.find_last_of(L'\\') + 1) : valueName;
            threat.description = L"Registry value matches threat pattern: " + signature->description;
            threat.location = location;
            threat.details = value;
            threat.severity = ThreatSeverity::HIGH;
            threat.classification = "Registry Threat";
            threat.removable = removable;
            session.AddThreat(std::move(threat));
        } catch (const std::exception& e) {
            LogTrace("RegistryScanner", L"Skipping " + location + L": " + Utils::FromUtf8(e.what()));
        }
        return PhaseOutcome::COMPLETED;
    }

    PhaseOutcome RegistryScanner::Scan(ScanSession& session) {
        PlatformProbe& probe = session.Probe();

        for (const auto& location : ValueLocations()) {
            if (session.IsCancelled()) return PhaseOutcome::CANCELLED;

            for (const auto& valueName : probe.ListRegistryValueNames(location.hive, location.key)) {
                if (CheckValue(session, location.hive, location.key, valueName, true) == PhaseOutcome::CANCELLED) {
                    return PhaseOutcome::CANCELLED;
                }
            }
        }

        // Shell and Userinit must be restored to their defaults, never deleted
        for (const wchar_t* valueName : { L"Shell", L"Userinit" }) {
            if (CheckValue(session, RegistryHive::LOCAL_MACHINE, WINLOGON_KEY, valueName, false) == PhaseOutcome::CANCELLED) {
                return PhaseOutcome::CANCELLED;
            }
        }

        // One subkey per CLSID; its default value names the helper object
        for (const auto& clsid : probe.ListRegistrySubKeys(RegistryHive::LOCAL_MACHINE, BHO_KEY)) {
            std::wstring key = std::wstring(BHO_KEY) + L"\\" + clsid;
            if (CheckValue(session, RegistryHive::LOCAL_MACHINE, key, L"", false) == PhaseOutcome::CANCELLED) {
                return PhaseOutcome::CANCELLED;
            }
        }

        session.PublishFilesScanned();
        return PhaseOutcome::COMPLETED;
    }

} // namespace UnifiedScan
