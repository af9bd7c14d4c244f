/**
 * PlatformProbe.h
 *
 * Operating-system primitives used by the scanners and the remover.
 *
 * Every call reports its outcome as a ProbeStatus and returns data through
 * out-parameters. Implementations never throw for ordinary OS failures;
 * an exception escaping a probe is treated as a bug by the callers and
 * contained at the scanner or remover boundary.
 *
 * CreatePlatformProbe() returns the implementation for the platform the
 * engine was built for (WindowsPlatformProbe or PosixPlatformProbe).
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <chrono>
#include <cstdint>

namespace UnifiedScan {

    enum class ProbeStatus {
        OK,
        NOT_FOUND,
        ACCESS_DENIED,
        IN_USE,
        TIMED_OUT,
        NOT_SUPPORTED,
        FAILURE
    };

    enum class RegistryHive { CURRENT_USER, LOCAL_MACHINE };

    struct ProcessEntry {
        uint32_t processId = 0;
        std::wstring name;              // image name, e.g. "xmrig.exe"
        std::wstring executablePath;    // empty if it could not be resolved
    };

    namespace FileAttribute {
        constexpr uint32_t NORMAL = 0;
        constexpr uint32_t READ_ONLY = 1;
        constexpr uint32_t HIDDEN = 2;
        constexpr uint32_t SYSTEM = 4;
    }

    struct FileMetadata {
        uint32_t attributes = FileAttribute::NORMAL;
        uint64_t size = 0;
        std::chrono::system_clock::time_point creationTime;
    };

    struct BrowserExtensionRoot {
        std::wstring browser;           // "Chrome", "Edge", "Firefox", ...
        std::wstring path;              // directory holding one entry per extension
    };

    struct ServiceControlResult {
        ProbeStatus disableStatus = ProbeStatus::FAILURE;
        ProbeStatus stopStatus = ProbeStatus::FAILURE;
    };

    using FileOperation = std::function<ProbeStatus()>;

    const wchar_t* ToString(ProbeStatus status);
    const wchar_t* ToString(RegistryHive hive);

    class PlatformProbe {
    public:
        virtual ~PlatformProbe() = default;

        // Roots of the fixed, ready local volumes
        virtual std::vector<std::wstring> ListFixedVolumes() = 0;

        virtual ProbeStatus ListProcesses(std::vector<ProcessEntry>& processes) = 0;
        virtual ProbeStatus KillProcess(uint32_t processId) = 0;

        // Registry. Platforms without a registry answer NOT_SUPPORTED or empty lists.
        virtual ProbeStatus ReadRegistryValue(RegistryHive hive, const std::wstring& key,
            const std::wstring& valueName, std::wstring& value) = 0;
        virtual ProbeStatus DeleteRegistryValue(RegistryHive hive, const std::wstring& key,
            const std::wstring& valueName) = 0;
        virtual std::vector<std::wstring> ListRegistryValueNames(RegistryHive hive, const std::wstring& key) = 0;
        virtual std::vector<std::wstring> ListRegistrySubKeys(RegistryHive hive, const std::wstring& key) = 0;

        virtual std::vector<BrowserExtensionRoot> ListBrowserExtensionRoots() = 0;
        virtual std::vector<std::wstring> ListScheduledTaskFiles() = 0;

        virtual ProbeStatus GetFileMetadata(const std::wstring& path, FileMetadata& metadata) = 0;
        virtual ProbeStatus SetAttributes(const std::wstring& path, uint32_t attributes) = 0;
        virtual ProbeStatus RemoveFile(const std::wstring& path) = 0;

        // SHA-256 over the raw file bytes, lower-case hex
        virtual ProbeStatus ComputeFileHash(const std::wstring& path, std::string& digest) = 0;

        /**
         * Takes ownership of path, grants full control to the administrators
         * group, then runs operation once more. The ownership tools are
         * external processes and are killed after the configured timeout.
         */
        virtual ProbeStatus ElevateAndRetry(const std::wstring& path, const FileOperation& operation) = 0;

        // Both steps are always attempted
        virtual ServiceControlResult DisableAndStopService(const std::wstring& serviceName) = 0;
    };

    std::unique_ptr<PlatformProbe> CreatePlatformProbe(int elevationTimeoutMs);

} // namespace UnifiedScan
