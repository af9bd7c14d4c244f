/**
 * DomainScanner.h
 *
 * Common shape of the non-file-system checks (processes, startup entries,
 * browser extensions, registry hijack points, scheduled tasks).
 *
 * A scanner walks one platform surface, counts every entry it examines
 * in the session's files-scanned counter and reports matches through
 * ScanSession::AddThreat. An entry that cannot be read is skipped; the
 * scanner goes on with its siblings. Scanners hold no state between runs.
 */

#pragma once

#include "Cancellation.h"
#include "../Platform/PlatformProbe.h"
#include <string>

namespace UnifiedScan {

    class ScanSession;

    struct RegistryLocation {
        RegistryHive hive;
        const wchar_t* key;
    };

    class DomainScanner {
    public:
        virtual ~DomainScanner() = default;

        virtual const wchar_t* GetName() const = 0;
        virtual PhaseOutcome Scan(ScanSession& session) = 0;

    protected:
        // Reads at most maxBytes and decodes them (UTF-8 or UTF-16 with BOM)
        static bool ReadTextFile(const std::wstring& path, size_t maxBytes, std::wstring& text);
    };

    // "HKCU\<key>\<valueName>"
    std::wstring FormatRegistryLocation(RegistryHive hive, const std::wstring& key, const std::wstring& valueName);

} // namespace UnifiedScan
