/**
 * BrowserExtensionScanner.h
 *
 * Installed browser extensions. Findings are never removable by the
 * engine: deleting an extension directory under a running browser can
 * corrupt the profile, so the user is pointed at the browser instead.
 */

#pragma once

#include "DomainScanner.h"

namespace UnifiedScan {

    class BrowserExtensionScanner : public DomainScanner {
    public:
        const wchar_t* GetName() const override { return L"Browser extensions"; }
        PhaseOutcome Scan(ScanSession& session) override;

    private:
        PhaseOutcome ScanExtensionRoot(ScanSession& session, const BrowserExtensionRoot& root);
        std::wstring FindAdwareMarker(ScanSession& session, const std::wstring& extensionDir);
    };

} // namespace UnifiedScan
