/**
 * PosixPlatformProbe.h
 *
 * PlatformProbe for Linux and other POSIX hosts. Processes come from
 * /proc, hashing from OpenSSL, services from systemctl. There is no
 * registry: registry calls answer NOT_SUPPORTED or empty lists, and cron
 * tables stand in for the scheduled task store.
 */

#pragma once

#include "PlatformProbe.h"

namespace UnifiedScan {

    class PosixPlatformProbe : public PlatformProbe {
    public:
        explicit PosixPlatformProbe(int commandTimeoutMs);

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
        // fork/exec with a deadline; the child is killed when it expires
        ProbeStatus RunCommand(const std::vector<std::string>& argv);

        int m_commandTimeoutMs;
    };

} // namespace UnifiedScan
