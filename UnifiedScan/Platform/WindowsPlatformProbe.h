/**
 * WindowsPlatformProbe.h
 *
 * PlatformProbe over the Win32 API: Toolhelp snapshots for processes, the
 * registry API, CryptoAPI SHA-256, takeown/icacls for ownership recovery
 * and the service control manager.
 */

#pragma once

#include "PlatformProbe.h"

namespace UnifiedScan {

    class WindowsPlatformProbe : public PlatformProbe {
    public:
        explicit WindowsPlatformProbe(int elevationTimeoutMs);

        std::vector<std::wstring> ListFixedVolumes() override;

        ProbeStatus ListProcesses(std::vector<ProcessEntry>& processes) override;
        ProbeStatus KillProcess(uint32_t processId) override;

        ProbeStatus ReadRegistryValue(RegistryHive hive, const std::wstring& key,
            const std::wstring& valueName, std::wstring& value) override;
        ProbeStatus DeleteRegistryValue(RegistryHive hive, const std::wstring& key,
            const std::wstring& valueName) override;
        std::vector<std::wstring> ListRegistryValueNames(RegistryHive hive, const std::wstring& key) override;
        std::vector<std::wstring> ListRegistrySubKeys(RegistryHive hive, const std::wstring& key) override;

        std::vector<BrowserExtensionRoot> ListBrowserExtensionRoots() override;
        std::vector<std::wstring> ListScheduledTaskFiles() override;

        ProbeStatus GetFileMetadata(const std::wstring& path, FileMetadata& metadata) override;
        ProbeStatus SetAttributes(const std::wstring& path, uint32_t attributes) override;
        ProbeStatus RemoveFile(const std::wstring& path) override;
        ProbeStatus ComputeFileHash(const std::wstring& path, std::string& digest) override;

        ProbeStatus ElevateAndRetry(const std::wstring& path, const FileOperation& operation) override;
        ServiceControlResult DisableAndStopService(const std::wstring& serviceName) override;

    private:
        // Runs a console tool hidden and waits at most m_elevationTimeoutMs
        ProbeStatus RunTool(const std::wstring& commandLine);

        int m_elevationTimeoutMs;
    };

} // namespace UnifiedScan
