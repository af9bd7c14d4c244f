/**
 * StartupScanner.cpp
 *
 * Both the value name and the command line it launches are matched
 * against the file name patterns; either one flags the entry as High.
 */

#include "StartupScanner.h"
#include "ScanSession.h"
#include "SignatureStore.h"
#include "../Utils/StringUtils.h"
#include "../Utils/Logger.h"

namespace UnifiedScan {

    const std::vector<RegistryLocation>& StartupScanner::StartupLocations() {
        static const std::vector<RegistryLocation> locations = {
            { RegistryHive::CURRENT_USER,  L"SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Run" },
            { RegistryHive::CURRENT_USER,  L"SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\RunOnce" },
            { RegistryHive::LOCAL_MACHINE, L"SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Run" },
            { RegistryHive::LOCAL_MACHINE, L"SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\RunOnce" },
            { RegistryHive::LOCAL_MACHINE, L"SOFTWARE\\WOW6432Node\\Microsoft\\Windows\\CurrentVersion\\Run" },
        };
        return locations;
    }

    PhaseOutcome StartupScanner::Scan(ScanSession& session) {
        PlatformProbe& probe = session.Probe();

        for (const auto& location : StartupLocations()) {
            if (session.IsCancelled()) return PhaseOutcome::CANCELLED;

            for (const auto& valueName : probe.ListRegistryValueNames(location.hive, location.key)) {
                if (session.IsCancelled()) return PhaseOutcome::CANCELLED;
                session.IncrementFilesScanned();

                try {
                    std::wstring value;
                    ProbeStatus status = probe.ReadRegistryValue(location.hive, location.key, valueName, value);
                    if (status != ProbeStatus::OK) {
                        LogTrace("StartupScanner", L"Cannot read " +
                            FormatRegistryLocation(location.hive, location.key, valueName));
                        value.clear();
                    }

                    auto signature = session.Signatures().MatchFileName(valueName);
                    if (!signature) signature = session.Signatures().MatchFileName(value);
                    if (!signature) continue;

                    Threat threat;
                    threat.category = ThreatCategory::STARTUP;
                    threat.name = valueName;
                    threat.description = L"Startup entry contains suspicious pattern: " + signature->description;
                    threat.location = FormatRegistryLocation(location.hive, location.key, valueName);
                    threat.details = value;
                    threat.severity = ThreatSeverity::HIGH;
                    threat.classification = "Startup Threat";
                    threat.removable = true;
                    session.AddThreat(std::move(threat));
                } catch (const std::exception& e) {
                    LogTrace("StartupScanner", L"Skipping value " + valueName + L": " + Utils::FromUtf8(e.what()));
                }
            }
        }

        session.PublishFilesScanned();
        return PhaseOutcome::COMPLETED;
    }

} // namespace UnifiedScan
