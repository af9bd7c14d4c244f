/**
 * RegistryScanner.h
 *
 * High-value hijack points: policy Run keys, the Winlogon shell and
 * userinit values, Browser Helper Objects and Internet Explorer toolbar
 * and extension keys.
 */

#pragma once

#include "DomainScanner.h"
#include <vector>

namespace UnifiedScan {

    class RegistryScanner : public DomainScanner {
    public:
        const wchar_t* GetName() const override { return L"Registry"; }
        PhaseOutcome Scan(ScanSession& session) override;

        // Keys whose every value is checked
        static const std::vector<RegistryLocation>& ValueLocations();

    private:
        // Checks one value; removable is false where deleting would break logon
        PhaseOutcome CheckValue(ScanSession& session, RegistryHive hive, const std::wstring& key,
            const std::wstring& valueName, bool removable);
    };

} // namespace UnifiedScan
