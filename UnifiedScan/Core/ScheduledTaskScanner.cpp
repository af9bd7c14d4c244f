/**
 * ScheduledTaskScanner.cpp
 *
 * The raw task definition (XML on Windows, a crontab elsewhere) is
 * matched against the file name patterns as a whole.
 */

#include "ScheduledTaskScanner.h"
#include "ScanSession.h"
#include "SignatureStore.h"
#include "../Utils/StringUtils.h"
#include "../Utils/Logger.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace UnifiedScan {

    PhaseOutcome ScheduledTaskScanner::Scan(ScanSession& session) {
        for (const auto& taskFile : session.Probe().ListScheduledTaskFiles()) {
            if (session.IsCancelled()) return PhaseOutcome::CANCELLED;
            session.IncrementFilesScanned();

            try {
                std::wstring content;
                if (!ReadTextFile(taskFile, MAX_TASK_FILE_BYTES, content)) {
                    LogTrace("ScheduledTaskScanner", L"Cannot read " + taskFile);
                    continue;
                }

                auto signature = session.Signatures().MatchFileName(content);
                if (!signature) continue;

                Threat threat;
                threat.category = ThreatCategory::SCHEDULED_TASK;
                threat.name = fs::path(taskFile).filename().wstring();
                threat.description = L"Scheduled task contains suspicious pattern: " + signature->description;
                threat.location = taskFile;
                threat.severity = ThreatSeverity::MEDIUM;
                threat.classification = "Scheduled Task";
                threat.removable = true;
                session.AddThreat(std::move(threat));
            } catch (const std::exception& e) {
                LogTrace("ScheduledTaskScanner", L"Skipping " + taskFile + L": " + Utils::FromUtf8(e.what()));
            }
        }

        session.PublishFilesScanned();
        return PhaseOutcome::COMPLETED;
    }

} // namespace UnifiedScan
