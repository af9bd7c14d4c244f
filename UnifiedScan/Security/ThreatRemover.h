/**
 * ThreatRemover.h
 *
 * Remediation engine: one removal attempt per call, dispatched on the
 * threat's category.
 *
 * - PROCESS: terminate by id, or by base name when no id was recorded
 * - FILE: clear attributes and delete (or quarantine), with an
 *   ownership-recovery retry on access denied
 * - STARTUP / REGISTRY: delete the value, then confirm it is gone
 * - SERVICE / SCHEDULED_TASK: disable and stop the service
 *
 * A target that no longer exists counts as removed. Paths owned by the
 * operating system are never touched and come back with
 * isProtectedSystem set. RemoveThreat never throws.
 */

#pragma once

#include "../Core/ThreatTypes.h"
#include "../Core/EngineConfig.h"
#include "../Platform/PlatformProbe.h"
#include <string>
#include <vector>
#include <optional>

namespace UnifiedScan {

    class QuarantineManager;

    class ThreatRemover {
    public:
        // quarantine is used for FILE threats when config.quarantineFiles is set
        ThreatRemover(PlatformProbe& probe, RemediationConfig config = RemediationConfig(),
            QuarantineManager* quarantine = nullptr);

        ThreatRemover(const ThreatRemover&) = delete;
        ThreatRemover& operator=(const ThreatRemover&) = delete;

        RemovalResult RemoveThreat(const Threat& threat);

        // Built-in list plus RemediationConfig::extraProtectedPaths
        bool IsProtectedPath(const std::wstring& path) const;

        static bool IsProtectedSystemPath(const std::wstring& path);

        /**
         * Splits "HKLM\Software\...\ValueName" into its parts. hive stays
         * empty when the location carries no hive prefix.
         */
        static bool ParseRegistryLocation(const std::wstring& location, std::optional<RegistryHive>& hive,
            std::wstring& key, std::wstring& valueName);

    private:
        RemovalResult RemoveProcess(const Threat& threat);
        RemovalResult RemoveFileThreat(const Threat& threat);
        RemovalResult RemoveRegistryEntry(const Threat& threat, bool bothHives);
        RemovalResult DisableService(const Threat& threat);

        PlatformProbe& m_probe;
        RemediationConfig m_config;
        QuarantineManager* m_quarantine;
        std::vector<std::wstring> m_extraProtected;
    };

} // namespace UnifiedScan
