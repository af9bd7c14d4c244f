/**
 * ScheduledTaskScanner.h - Task definitions in the OS task store
 */

#pragma once

#include "DomainScanner.h"

namespace UnifiedScan {

    class ScheduledTaskScanner : public DomainScanner {
    public:
        // Larger task files are truncated before matching
        static constexpr size_t MAX_TASK_FILE_BYTES = 1024 * 1024;

        const wchar_t* GetName() const override { return L"Scheduled tasks"; }
        PhaseOutcome Scan(ScanSession& session) override;
    };

} // namespace UnifiedScan
