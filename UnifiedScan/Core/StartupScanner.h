/**
 * StartupScanner.h - "Run" and "RunOnce" autostart entries
 */

#pragma once

#include "DomainScanner.h"
#include <vector>

namespace UnifiedScan {

    class StartupScanner : public DomainScanner {
    public:
        const wchar_t* GetName() const override { return L"Startup entries"; }
        PhaseOutcome Scan(ScanSession& session) override;

        static const std::vector<RegistryLocation>& StartupLocations();
    };

} // namespace UnifiedScan
