/**
 * ProcessScanner.cpp
 *
 * Every running process is looked up by image name. A match is Critical
 * and keeps the process id so the remover can terminate that exact
 * instance.
 */

#include "ProcessScanner.h"
#include "ScanSession.h"
#include "SignatureStore.h"
#include "../Utils/StringUtils.h"
#include "../Utils/Logger.h"

namespace UnifiedScan {

    PhaseOutcome ProcessScanner::Scan(ScanSession& session) {
        std::vector<ProcessEntry> processes;
        ProbeStatus status = session.Probe().ListProcesses(processes);
        if (status != ProbeStatus::OK) {
            LogWarning("ProcessScanner", std::wstring(L"Cannot enumerate processes: ") + ToString(status));
            return PhaseOutcome::COMPLETED;
        }

        for (const auto& process : processes) {
            if (session.IsCancelled()) return PhaseOutcome::CANCELLED;
            session.IncrementFilesScanned();

            try {
                auto signature = session.Signatures().MatchProcess(process.name);
                if (!signature) continue;

                Threat threat;
                threat.category = ThreatCategory::PROCESS;
                threat.name = process.name;
                threat.description = L"Running process matches known malware signature: " + signature->description;
                threat.location = process.executablePath.empty() ? L"Unknown" : process.executablePath;
                threat.severity = ThreatSeverity::CRITICAL;
                threat.classification = "Malware";
                threat.removable = true;
                threat.processId = process.processId;
                session.AddThreat(std::move(threat));
            } catch (const std::exception& e) {
                LogTrace("ProcessScanner", L"Skipping PID " + std::to_wstring(process.processId) + L": " +
                    Utils::FromUtf8(e.what()));
            }
        }

        session.PublishFilesScanned();
        return PhaseOutcome::COMPLETED;
    }

} // namespace UnifiedScan
