/**
 * ProcessScanner.h - Running processes against the process signatures
 */

#pragma once

#include "DomainScanner.h"

namespace UnifiedScan {

    class ProcessScanner : public DomainScanner {
    public:
        const wchar_t* GetName() const override { return L"Processes"; }
        PhaseOutcome Scan(ScanSession& session) override;
    };

} // namespace UnifiedScan
