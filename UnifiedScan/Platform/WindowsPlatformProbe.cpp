/**
 * WindowsPlatformProbe.cpp
 *
 * Win32 implementation of the platform primitives.
 *
 * Requirements: Windows 10+, C++17. Some operations (killing foreign
 * processes, HKLM writes, service control, takeown) need Administrator.
 */

#define NOMINMAX
#include <windows.h>
#include <tlhelp32.h>
#include <wincrypt.h>
#include <shlobj.h>
#include <knownfolders.h>
#include "WindowsPlatformProbe.h"
#include "../Utils/Logger.h"
#include <filesystem>
#include <system_error>

#pragma comment(lib, "crypt32.lib")
#pragma comment(lib, "advapi32.lib")
#pragma comment(lib, "shell32.lib")
#pragma comment(lib, "ole32.lib")

namespace fs = std::filesystem;

namespace UnifiedScan {

    namespace {

        // FILETIME epoch (1601) to Unix epoch, in 100ns ticks
        constexpr uint64_t FILETIME_UNIX_OFFSET = 116444736000000000ULL;

        ProbeStatus MapWin32Error(DWORD error) {
            switch (error) {
            case ERROR_SUCCESS:
                return ProbeStatus::OK;
            case ERROR_FILE_NOT_FOUND:
            case ERROR_PATH_NOT_FOUND:
            case ERROR_INVALID_PARAMETER:
            case ERROR_SERVICE_DOES_NOT_EXIST:
                return ProbeStatus::NOT_FOUND;
            case ERROR_ACCESS_DENIED:
            case ERROR_PRIVILEGE_NOT_HELD:
                return ProbeStatus::ACCESS_DENIED;
            case ERROR_SHARING_VIOLATION:
            case ERROR_LOCK_VIOLATION:
            case ERROR_USER_MAPPED_FILE:
                return ProbeStatus::IN_USE;
            default:
                return ProbeStatus::FAILURE;
            }
        }

        HKEY RootKey(RegistryHive hive) {
            return hive == RegistryHive::CURRENT_USER ? HKEY_CURRENT_USER : HKEY_LOCAL_MACHINE;
        }

        // Closes a registry key on scope exit
        class RegistryKey {
        public:
            RegistryKey() = default;
            ~RegistryKey() { if (m_key) RegCloseKey(m_key); }

            RegistryKey(const RegistryKey&) = delete;
            RegistryKey& operator=(const RegistryKey&) = delete;

            LSTATUS Open(RegistryHive hive, const std::wstring& path, REGSAM access) {
                return RegOpenKeyExW(RootKey(hive), path.c_str(), 0, access, &m_key);
            }

            HKEY Get() const { return m_key; }

        private:
            HKEY m_key = nullptr;
        };

        std::wstring KnownFolder(REFKNOWNFOLDERID id) {
            PWSTR raw = nullptr;
            std::wstring path;
            if (SUCCEEDED(SHGetKnownFolderPath(id, 0, nullptr, &raw)) && raw) {
                path = raw;
            }
            if (raw) CoTaskMemFree(raw);
            return path;
        }

        std::chrono::system_clock::time_point FromFileTime(const FILETIME& ft) {
            ULARGE_INTEGER ticks;
            ticks.LowPart = ft.dwLowDateTime;
            ticks.HighPart = ft.dwHighDateTime;
            if (ticks.QuadPart < FILETIME_UNIX_OFFSET) {
                return std::chrono::system_clock::time_point{};
            }
            auto sinceEpoch = std::chrono::microseconds((ticks.QuadPart - FILETIME_UNIX_OFFSET) / 10);
            return std::chrono::system_clock::time_point(
                std::chrono::duration_cast<std::chrono::system_clock::duration>(sinceEpoch));
        }

    } // namespace

    WindowsPlatformProbe::WindowsPlatformProbe(int elevationTimeoutMs)
        : m_elevationTimeoutMs(elevationTimeoutMs) {
    }

    std::vector<std::wstring> WindowsPlatformProbe::ListFixedVolumes() {
        std::vector<std::wstring> volumes;
        DWORD mask = GetLogicalDrives();

        for (int i = 0; i < 26; i++) {
            if (!(mask & (1u << i))) continue;

            std::wstring root;
            root.push_back(static_cast<wchar_t>(L'A' + i));
            root += L":\\";

            if (GetDriveTypeW(root.c_str()) != DRIVE_FIXED) continue;

            // A volume that cannot report its information is not ready
            wchar_t fsName[MAX_PATH + 1] = {};
            if (!GetVolumeInformationW(root.c_str(), nullptr, 0, nullptr, nullptr, nullptr,
                fsName, MAX_PATH + 1)) {
                LogTrace("PlatformProbe", L"Skipping volume that is not ready: " + root);
                continue;
            }
            volumes.push_back(root);
        }
        return volumes;
    }

    ProbeStatus WindowsPlatformProbe::ListProcesses(std::vector<ProcessEntry>& processes) {
        processes.clear();

        HANDLE hSnapshot = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
        if (hSnapshot == INVALID_HANDLE_VALUE) {
            LogError("PlatformProbe", L"Failed to create process snapshot");
            return MapWin32Error(GetLastError());
        }

        PROCESSENTRY32W pe32;
        pe32.dwSize = sizeof(PROCESSENTRY32W);

        if (Process32FirstW(hSnapshot, &pe32)) {
            do {
                // System Idle Process
                if (pe32.th32ProcessID == 0) continue;

                ProcessEntry entry;
                entry.processId = pe32.th32ProcessID;
                entry.name = pe32.szExeFile;

                HANDLE hProcess = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pe32.th32ProcessID);
                if (hProcess) {
                    wchar_t imagePath[MAX_PATH * 2] = {};
                    DWORD size = MAX_PATH * 2;
                    if (QueryFullProcessImageNameW(hProcess, 0, imagePath, &size)) {
                        entry.executablePath.assign(imagePath, size);
                    }
                    CloseHandle(hProcess);
                }

                processes.push_back(std::move(entry));
            } while (Process32NextW(hSnapshot, &pe32));
        }

        CloseHandle(hSnapshot);
        return ProbeStatus::OK;
    }

    ProbeStatus WindowsPlatformProbe::KillProcess(uint32_t processId) {
        HANDLE hProcess = OpenProcess(PROCESS_TERMINATE, FALSE, processId);
        if (hProcess == NULL) {
            return MapWin32Error(GetLastError());
        }

        BOOL result = TerminateProcess(hProcess, 1);
        DWORD error = result ? ERROR_SUCCESS : GetLastError();
        CloseHandle(hProcess);

        if (result) {
            LogInfo("PlatformProbe", L"Terminated process PID: " + std::to_wstring(processId));
        }
        return MapWin32Error(error);
    }

    ProbeStatus WindowsPlatformProbe::ReadRegistryValue(RegistryHive hive, const std::wstring& key,
        const std::wstring& valueName, std::wstring& value) {
        RegistryKey handle;
        LSTATUS status = handle.Open(hive, key, KEY_QUERY_VALUE);
        if (status != ERROR_SUCCESS) return MapWin32Error(static_cast<DWORD>(status));

        DWORD type = 0;
        DWORD size = 0;
        const wchar_t* name = valueName.empty() ? nullptr : valueName.c_str();
        status = RegQueryValueExW(handle.Get(), name, nullptr, &type, nullptr, &size);
        if (status != ERROR_SUCCESS) return MapWin32Error(static_cast<DWORD>(status));

        std::vector<BYTE> buffer(size + sizeof(wchar_t) * 2, 0);
        status = RegQueryValueExW(handle.Get(), name, nullptr, &type, buffer.data(), &size);
        if (status != ERROR_SUCCESS) return MapWin32Error(static_cast<DWORD>(status));

        switch (type) {
        case REG_SZ:
        case REG_EXPAND_SZ:
            value = reinterpret_cast<const wchar_t*>(buffer.data());
            break;
        case REG_MULTI_SZ: {
            value.clear();
            const wchar_t* item = reinterpret_cast<const wchar_t*>(buffer.data());
            while (*item) {
                if (!value.empty()) value += L' ';
                value += item;
                item += wcslen(item) + 1;
            }
            break;
        }
        case REG_DWORD:
            value = std::to_wstring(*reinterpret_cast<const DWORD*>(buffer.data()));
            break;
        default:
            value.clear();
            break;
        }
        return ProbeStatus::OK;
    }

    ProbeStatus WindowsPlatformProbe::DeleteRegistryValue(RegistryHive hive, const std::wstring& key,
        const std::wstring& valueName) {
        RegistryKey handle;
        LSTATUS status = handle.Open(hive, key, KEY_SET_VALUE);
        if (status != ERROR_SUCCESS) return MapWin32Error(static_cast<DWORD>(status));

        status = RegDeleteValueW(handle.Get(), valueName.c_str());
        return MapWin32Error(static_cast<DWORD>(status));
    }

    std::vector<std::wstring> WindowsPlatformProbe::ListRegistryValueNames(RegistryHive hive, const std::wstring& key) {
        std::vector<std::wstring> names;
        RegistryKey handle;
        if (handle.Open(hive, key, KEY_QUERY_VALUE) != ERROR_SUCCESS) return names;

        // 16383 is the documented maximum value name length
        wchar_t name[16384];
        for (DWORD index = 0;; index++) {
            DWORD length = 16384;
            LSTATUS status = RegEnumValueW(handle.Get(), index, name, &length, nullptr, nullptr, nullptr, nullptr);
            if (status == ERROR_NO_MORE_ITEMS) break;
            if (status != ERROR_SUCCESS) continue;
            names.emplace_back(name, length);
        }
        return names;
    }

    std::vector<std::wstring> WindowsPlatformProbe::ListRegistrySubKeys(RegistryHive hive, const std::wstring& key) {
        std::vector<std::wstring> subKeys;
        RegistryKey handle;
        if (handle.Open(hive, key, KEY_ENUMERATE_SUB_KEYS) != ERROR_SUCCESS) return subKeys;

        wchar_t name[256];
        for (DWORD index = 0;; index++) {
            DWORD length = 256;
            LSTATUS status = RegEnumKeyExW(handle.Get(), index, name, &length, nullptr, nullptr, nullptr, nullptr);
            if (status == ERROR_NO_MORE_ITEMS) break;
            if (status != ERROR_SUCCESS) continue;
            subKeys.emplace_back(name, length);
        }
        return subKeys;
    }

    std::vector<BrowserExtensionRoot> WindowsPlatformProbe::ListBrowserExtensionRoots() {
        std::vector<BrowserExtensionRoot> roots;

        std::wstring localAppData = KnownFolder(FOLDERID_LocalAppData);
        if (!localAppData.empty()) {
            roots.push_back({ L"Chrome", localAppData + L"\\Google\\Chrome\\User Data\\Default\\Extensions" });
            roots.push_back({ L"Edge", localAppData + L"\\Microsoft\\Edge\\User Data\\Default\\Extensions" });
        }

        std::wstring roamingAppData = KnownFolder(FOLDERID_RoamingAppData);
        if (!roamingAppData.empty()) {
            std::error_code ec;
            fs::path profiles = fs::path(roamingAppData) / L"Mozilla" / L"Firefox" / L"Profiles";
            for (fs::directory_iterator it(profiles, ec), end; !ec && it != end; it.increment(ec)) {
                if (it->is_directory(ec)) {
                    roots.push_back({ L"Firefox", (it->path() / L"extensions").wstring() });
                }
            }
        }
        return roots;
    }

    std::vector<std::wstring> WindowsPlatformProbe::ListScheduledTaskFiles() {
        std::vector<std::wstring> files;

        wchar_t windowsDir[MAX_PATH] = {};
        UINT length = GetWindowsDirectoryW(windowsDir, MAX_PATH);
        if (length == 0 || length >= MAX_PATH) return files;

        fs::path taskStore = fs::path(windowsDir) / L"System32" / L"Tasks";
        std::error_code ec;
        fs::recursive_directory_iterator it(taskStore, fs::directory_options::skip_permission_denied, ec);
        for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
            std::error_code typeEc;
            if (it->is_regular_file(typeEc)) {
                files.push_back(it->path().wstring());
            }
        }
        return files;
    }

    ProbeStatus WindowsPlatformProbe::GetFileMetadata(const std::wstring& path, FileMetadata& metadata) {
        WIN32_FILE_ATTRIBUTE_DATA data;
        if (!GetFileAttributesExW(path.c_str(), GetFileExInfoStandard, &data)) {
            return MapWin32Error(GetLastError());
        }

        metadata.attributes = FileAttribute::NORMAL;
        if (data.dwFileAttributes & FILE_ATTRIBUTE_READONLY) metadata.attributes |= FileAttribute::READ_ONLY;
        if (data.dwFileAttributes & FILE_ATTRIBUTE_HIDDEN) metadata.attributes |= FileAttribute::HIDDEN;
        if (data.dwFileAttributes & FILE_ATTRIBUTE_SYSTEM) metadata.attributes |= FileAttribute::SYSTEM;

        metadata.size = (static_cast<uint64_t>(data.nFileSizeHigh) << 32) | data.nFileSizeLow;
        metadata.creationTime = FromFileTime(data.ftCreationTime);
        return ProbeStatus::OK;
    }

    ProbeStatus WindowsPlatformProbe::SetAttributes(const std::wstring& path, uint32_t attributes) {
        DWORD native = 0;
        if (attributes & FileAttribute::READ_ONLY) native |= FILE_ATTRIBUTE_READONLY;
        if (attributes & FileAttribute::HIDDEN) native |= FILE_ATTRIBUTE_HIDDEN;
        if (attributes & FileAttribute::SYSTEM) native |= FILE_ATTRIBUTE_SYSTEM;
        if (native == 0) native = FILE_ATTRIBUTE_NORMAL;

        if (!SetFileAttributesW(path.c_str(), native)) {
            return MapWin32Error(GetLastError());
        }
        return ProbeStatus::OK;
    }

    ProbeStatus WindowsPlatformProbe::RemoveFile(const std::wstring& path) {
        if (!DeleteFileW(path.c_str())) {
            return MapWin32Error(GetLastError());
        }
        return ProbeStatus::OK;
    }

    ProbeStatus WindowsPlatformProbe::ComputeFileHash(const std::wstring& path, std::string& digest) {
        HCRYPTPROV hProv = 0;
        HCRYPTHASH hHash = 0;
        BYTE buffer[64 * 1024];
        DWORD cbRead = 0;
        BYTE rgbHash[32];
        DWORD cbHash = sizeof(rgbHash);
        const char hexDigits[] = "0123456789abcdef";

        HANDLE hFile = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE,
            NULL, OPEN_EXISTING, FILE_FLAG_SEQUENTIAL_SCAN, NULL);
        if (hFile == INVALID_HANDLE_VALUE) {
            return MapWin32Error(GetLastError());
        }

        if (!CryptAcquireContextW(&hProv, NULL, NULL, PROV_RSA_AES, CRYPT_VERIFYCONTEXT)) {
            CloseHandle(hFile);
            return ProbeStatus::FAILURE;
        }

        if (!CryptCreateHash(hProv, CALG_SHA_256, 0, 0, &hHash)) {
            CryptReleaseContext(hProv, 0);
            CloseHandle(hFile);
            return ProbeStatus::FAILURE;
        }

        ProbeStatus status = ProbeStatus::OK;
        while (true) {
            if (!ReadFile(hFile, buffer, sizeof(buffer), &cbRead, NULL)) {
                status = MapWin32Error(GetLastError());
                break;
            }
            if (cbRead == 0) break;
            if (!CryptHashData(hHash, buffer, cbRead, 0)) {
                status = ProbeStatus::FAILURE;
                break;
            }
        }

        if (status == ProbeStatus::OK) {
            if (CryptGetHashParam(hHash, HP_HASHVAL, rgbHash, &cbHash, 0)) {
                digest.clear();
                for (DWORD i = 0; i < cbHash; i++) {
                    digest += hexDigits[rgbHash[i] >> 4];
                    digest += hexDigits[rgbHash[i] & 0xf];
                }
            } else {
                status = ProbeStatus::FAILURE;
            }
        }

        CryptDestroyHash(hHash);
        CryptReleaseContext(hProv, 0);
        CloseHandle(hFile);
        return status;
    }

    ProbeStatus WindowsPlatformProbe::RunTool(const std::wstring& commandLine) {
        STARTUPINFOW si = {};
        si.cb = sizeof(si);
        PROCESS_INFORMATION pi = {};

        // CreateProcessW may modify the command line buffer
        std::vector<wchar_t> buffer(commandLine.begin(), commandLine.end());
        buffer.push_back(L'\0');

        if (!CreateProcessW(nullptr, buffer.data(), nullptr, nullptr, FALSE, CREATE_NO_WINDOW,
            nullptr, nullptr, &si, &pi)) {
            LogWarning("PlatformProbe", L"Cannot start: " + commandLine);
            return MapWin32Error(GetLastError());
        }

        ProbeStatus status = ProbeStatus::OK;
        DWORD wait = WaitForSingleObject(pi.hProcess, static_cast<DWORD>(m_elevationTimeoutMs));
        if (wait == WAIT_TIMEOUT) {
            TerminateProcess(pi.hProcess, 1);
            LogWarning("PlatformProbe", L"Timed out: " + commandLine);
            status = ProbeStatus::TIMED_OUT;
        } else {
            DWORD exitCode = 1;
            if (!GetExitCodeProcess(pi.hProcess, &exitCode) || exitCode != 0) {
                status = ProbeStatus::FAILURE;
            }
        }

        CloseHandle(pi.hThread);
        CloseHandle(pi.hProcess);
        return status;
    }

    ProbeStatus WindowsPlatformProbe::ElevateAndRetry(const std::wstring& path, const FileOperation& operation) {
        ProbeStatus takeown = RunTool(L"takeown /F \"" + path + L"\"");
        // S-1-5-32-544 is BUILTIN\Administrators on every locale
        ProbeStatus icacls = RunTool(L"icacls \"" + path + L"\" /grant *S-1-5-32-544:F");

        if (takeown != ProbeStatus::OK || icacls != ProbeStatus::OK) {
            LogWarning("PlatformProbe", L"Ownership recovery incomplete for " + path +
                L" (takeown: " + ToString(takeown) + L", icacls: " + ToString(icacls) + L")");
        }

        ProbeStatus status = operation();
        if (status != ProbeStatus::OK &&
            (takeown == ProbeStatus::TIMED_OUT || icacls == ProbeStatus::TIMED_OUT)) {
            return ProbeStatus::TIMED_OUT;
        }
        return status;
    }

    ServiceControlResult WindowsPlatformProbe::DisableAndStopService(const std::wstring& serviceName) {
        ServiceControlResult result;

        SC_HANDLE hManager = OpenSCManagerW(nullptr, nullptr, SC_MANAGER_CONNECT);
        if (!hManager) {
            result.disableStatus = result.stopStatus = MapWin32Error(GetLastError());
            return result;
        }

        SC_HANDLE hService = OpenServiceW(hManager, serviceName.c_str(),
            SERVICE_CHANGE_CONFIG | SERVICE_STOP | SERVICE_QUERY_STATUS);
        if (!hService) {
            result.disableStatus = result.stopStatus = MapWin32Error(GetLastError());
            CloseServiceHandle(hManager);
            return result;
        }

        if (ChangeServiceConfigW(hService, SERVICE_NO_CHANGE, SERVICE_DISABLED, SERVICE_NO_CHANGE,
            nullptr, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr)) {
            result.disableStatus = ProbeStatus::OK;
        } else {
            result.disableStatus = MapWin32Error(GetLastError());
        }

        SERVICE_STATUS status = {};
        if (ControlService(hService, SERVICE_CONTROL_STOP, &status)) {
            result.stopStatus = ProbeStatus::OK;
        } else {
            DWORD error = GetLastError();
            result.stopStatus = (error == ERROR_SERVICE_NOT_ACTIVE) ? ProbeStatus::OK : MapWin32Error(error);
        }

        CloseServiceHandle(hService);
        CloseServiceHandle(hManager);
        return result;
    }

    std::unique_ptr<PlatformProbe> CreatePlatformProbe(int elevationTimeoutMs) {
        return std::make_unique<WindowsPlatformProbe>(elevationTimeoutMs);
    }

} // namespace UnifiedScan
