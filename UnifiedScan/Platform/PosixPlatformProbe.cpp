/**
 * PosixPlatformProbe.cpp - POSIX implementation of the platform primitives
 */

#include "PosixPlatformProbe.h"
#include "../Utils/StringUtils.h"
#include "../Utils/Logger.h"
#include <openssl/evp.h>
#include <filesystem>
#include <fstream>
#include <thread>
#include <cerrno>
#include <cstdlib>
#include <csignal>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace fs = std::filesystem;

namespace UnifiedScan {

    namespace {

        ProbeStatus MapErrno(int error) {
            switch (error) {
            case 0:
                return ProbeStatus::OK;
            case ENOENT:
            case ENOTDIR:
            case ESRCH:
                return ProbeStatus::NOT_FOUND;
            case EACCES:
            case EPERM:
            case EROFS:
                return ProbeStatus::ACCESS_DENIED;
            case EBUSY:
            case ETXTBSY:
                return ProbeStatus::IN_USE;
            default:
                return ProbeStatus::FAILURE;
            }
        }

        std::string Narrow(const std::wstring& path) {
            return fs::path(path).string();
        }

        bool IsNumeric(const std::string& text) {
            if (text.empty()) return false;
            for (char c : text) {
                if (c < '0' || c > '9') return false;
            }
            return true;
        }

        void CollectRegularFiles(const fs::path& directory, std::vector<std::wstring>& files) {
            std::error_code ec;
            for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
                std::error_code typeEc;
                if (it->is_regular_file(typeEc)) {
                    files.push_back(it->path().wstring());
                }
            }
        }

    } // namespace

    PosixPlatformProbe::PosixPlatformProbe(int commandTimeoutMs)
        : m_commandTimeoutMs(commandTimeoutMs) {
    }

    std::vector<std::wstring> PosixPlatformProbe::ListFixedVolumes() {
        return { L"/" };
    }

    ProbeStatus PosixPlatformProbe::ListProcesses(std::vector<ProcessEntry>& processes) {
        processes.clear();

        std::error_code ec;
        fs::directory_iterator it("/proc", ec);
        if (ec) {
            LogError("PlatformProbe", L"Cannot enumerate /proc: " + Utils::FromUtf8(ec.message()));
            return MapErrno(ec.value());
        }

        for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
            std::string pid = it->path().filename().string();
            if (!IsNumeric(pid)) continue;

            ProcessEntry entry;
            entry.processId = static_cast<uint32_t>(std::strtoul(pid.c_str(), nullptr, 10));

            // The process may exit between listing and reading; skip it then
            std::ifstream comm(it->path() / "comm");
            std::string name;
            if (!comm.is_open() || !std::getline(comm, name)) continue;
            entry.name = Utils::FromUtf8(Utils::Trim(name));

            std::error_code linkEc;
            fs::path exe = fs::read_symlink(it->path() / "exe", linkEc);
            if (!linkEc) {
                entry.executablePath = exe.wstring();
                // comm is truncated to 15 characters; the image name is not
                if (exe.has_filename()) entry.name = exe.filename().wstring();
            }

            processes.push_back(std::move(entry));
        }
        return ProbeStatus::OK;
    }

    ProbeStatus PosixPlatformProbe::KillProcess(uint32_t processId) {
        if (::kill(static_cast<pid_t>(processId), SIGKILL) != 0) {
            return MapErrno(errno);
        }
        LogInfo("PlatformProbe", L"Terminated process PID: " + std::to_wstring(processId));
        return ProbeStatus::OK;
    }

    ProbeStatus PosixPlatformProbe::ReadRegistryValue(RegistryHive, const std::wstring&,
        const std::wstring&, std::wstring& value) {
        value.clear();
        return ProbeStatus::NOT_SUPPORTED;
    }

    ProbeStatus PosixPlatformProbe::DeleteRegistryValue(RegistryHive, const std::wstring&, const std::wstring&) {
        return ProbeStatus::NOT_SUPPORTED;
    }

    std::vector<std::wstring> PosixPlatformProbe::ListRegistryValueNames(RegistryHive, const std::wstring&) {
        return {};
    }

    std::vector<std::wstring> PosixPlatformProbe::ListRegistrySubKeys(RegistryHive, const std::wstring&) {
        return {};
    }

    std::vector<BrowserExtensionRoot> PosixPlatformProbe::ListBrowserExtensionRoots() {
        std::vector<BrowserExtensionRoot> roots;

        const char* home = std::getenv("HOME");
        if (!home || !*home) return roots;
        fs::path homeDir(home);

        roots.push_back({ L"Chrome", (homeDir / ".config" / "google-chrome" / "Default" / "Extensions").wstring() });
        roots.push_back({ L"Chromium", (homeDir / ".config" / "chromium" / "Default" / "Extensions").wstring() });
        roots.push_back({ L"Edge", (homeDir / ".config" / "microsoft-edge" / "Default" / "Extensions").wstring() });

        std::error_code ec;
        fs::path profiles = homeDir / ".mozilla" / "firefox";
        for (fs::directory_iterator it(profiles, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code typeEc;
            if (it->is_directory(typeEc)) {
                roots.push_back({ L"Firefox", (it->path() / "extensions").wstring() });
            }
        }
        return roots;
    }

    std::vector<std::wstring> PosixPlatformProbe::ListScheduledTaskFiles() {
        std::vector<std::wstring> files;

        std::error_code ec;
        if (fs::is_regular_file("/etc/crontab", ec)) {
            files.push_back(L"/etc/crontab");
        }
        CollectRegularFiles("/etc/cron.d", files);
        CollectRegularFiles("/var/spool/cron", files);
        CollectRegularFiles("/var/spool/cron/crontabs", files);
        return files;
    }

    ProbeStatus PosixPlatformProbe::GetFileMetadata(const std::wstring& path, FileMetadata& metadata) {
        std::string native = Narrow(path);
        struct stat st;
        if (::stat(native.c_str(), &st) != 0) {
            return MapErrno(errno);
        }

        metadata.attributes = FileAttribute::NORMAL;
        if (!(st.st_mode & S_IWUSR)) metadata.attributes |= FileAttribute::READ_ONLY;

        std::string name = fs::path(native).filename().string();
        if (!name.empty() && name[0] == '.') metadata.attributes |= FileAttribute::HIDDEN;

        metadata.size = static_cast<uint64_t>(st.st_size);
        // No portable birth time; the inode change time is the closest stand-in
        metadata.creationTime = std::chrono::system_clock::from_time_t(st.st_ctime);
        return ProbeStatus::OK;
    }

    ProbeStatus PosixPlatformProbe::SetAttributes(const std::wstring& path, uint32_t attributes) {
        std::string native = Narrow(path);
        struct stat st;
        if (::stat(native.c_str(), &st) != 0) {
            return MapErrno(errno);
        }

        // Only the read-only bit has a POSIX counterpart
        mode_t mode = st.st_mode & 07777;
        if (attributes & FileAttribute::READ_ONLY) {
            mode &= ~static_cast<mode_t>(S_IWUSR | S_IWGRP | S_IWOTH);
        } else {
            mode |= S_IWUSR;
        }

        if (::chmod(native.c_str(), mode) != 0) {
            return MapErrno(errno);
        }
        return ProbeStatus::OK;
    }

    ProbeStatus PosixPlatformProbe::RemoveFile(const std::wstring& path) {
        std::string native = Narrow(path);
        if (::unlink(native.c_str()) != 0) {
            return MapErrno(errno);
        }
        return ProbeStatus::OK;
    }

    ProbeStatus PosixPlatformProbe::ComputeFileHash(const std::wstring& path, std::string& digest) {
        std::string native = Narrow(path);
        int fd = ::open(native.c_str(), O_RDONLY);
        if (fd < 0) {
            return MapErrno(errno);
        }

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            if (ctx) EVP_MD_CTX_free(ctx);
            ::close(fd);
            return ProbeStatus::FAILURE;
        }

        ProbeStatus status = ProbeStatus::OK;
        std::vector<unsigned char> buffer(64 * 1024);
        while (true) {
            ssize_t bytesRead = ::read(fd, buffer.data(), buffer.size());
            if (bytesRead < 0) {
                if (errno == EINTR) continue;
                status = MapErrno(errno);
                break;
            }
            if (bytesRead == 0) break;
            if (EVP_DigestUpdate(ctx, buffer.data(), static_cast<size_t>(bytesRead)) != 1) {
                status = ProbeStatus::FAILURE;
                break;
            }
        }

        if (status == ProbeStatus::OK) {
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hashLength = 0;
            if (EVP_DigestFinal_ex(ctx, hash, &hashLength) == 1) {
                const char hexDigits[] = "0123456789abcdef";
                digest.clear();
                for (unsigned int i = 0; i < hashLength; i++) {
                    digest += hexDigits[hash[i] >> 4];
                    digest += hexDigits[hash[i] & 0xf];
                }
            } else {
                status = ProbeStatus::FAILURE;
            }
        }

        EVP_MD_CTX_free(ctx);
        ::close(fd);
        return status;
    }

    namespace {

        // Adds owner write permission and puts the original mode back on destruction
        class WritableGrant {
        public:
            WritableGrant(const std::string& path, const wchar_t* what) : m_path(path) {
                struct stat st;
                if (m_path.empty() || ::stat(m_path.c_str(), &st) != 0) return;
                m_mode = st.st_mode & 07777;
                if (m_mode & S_IWUSR) return;
                if (::chmod(m_path.c_str(), m_mode | S_IWUSR) == 0) {
                    m_granted = true;
                } else {
                    LogWarning("PlatformProbe", std::wstring(L"Cannot make ") + what + L" writable: " +
                        Utils::FromUtf8(m_path));
                }
            }

            ~WritableGrant() {
                if (!m_granted) return;
                // The file is gone when the operation succeeded; nothing to put back then
                if (::chmod(m_path.c_str(), m_mode) != 0 && errno != ENOENT) {
                    LogWarning("PlatformProbe", L"Cannot restore permissions of " + Utils::FromUtf8(m_path));
                }
            }

            WritableGrant(const WritableGrant&) = delete;
            WritableGrant& operator=(const WritableGrant&) = delete;

        private:
            std::string m_path;
            mode_t m_mode = 0;
            bool m_granted = false;
        };

    } // namespace

    ProbeStatus PosixPlatformProbe::ElevateAndRetry(const std::wstring& path, const FileOperation& operation) {
        // Unlinking needs write permission on the directory, not the file
        std::string native = Narrow(path);
        WritableGrant directoryGrant(fs::path(native).parent_path().string(), L"directory");
        WritableGrant fileGrant(native, L"file");

        return operation();
    }

    ProbeStatus PosixPlatformProbe::RunCommand(const std::vector<std::string>& argv) {
        std::vector<char*> args;
        for (const auto& arg : argv) args.push_back(const_cast<char*>(arg.c_str()));
        args.push_back(nullptr);

        pid_t child = ::fork();
        if (child < 0) {
            return MapErrno(errno);
        }
        if (child == 0) {
            int devNull = ::open("/dev/null", O_WRONLY);
            if (devNull >= 0) {
                ::dup2(devNull, STDOUT_FILENO);
                ::dup2(devNull, STDERR_FILENO);
                ::close(devNull);
            }
            ::execvp(args[0], args.data());
            ::_exit(127);
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_commandTimeoutMs);
        int status = 0;
        while (true) {
            pid_t done = ::waitpid(child, &status, WNOHANG);
            if (done == child) break;
            if (done < 0 && errno != EINTR) return ProbeStatus::FAILURE;

            if (std::chrono::steady_clock::now() >= deadline) {
                ::kill(child, SIGKILL);
                ::waitpid(child, &status, 0);
                LogWarning("PlatformProbe", L"Timed out: " + Utils::FromUtf8(argv[0]));
                return ProbeStatus::TIMED_OUT;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        if (!WIFEXITED(status)) return ProbeStatus::FAILURE;
        switch (WEXITSTATUS(status)) {
        case 0:   return ProbeStatus::OK;
        case 4:                                     // LSB: no such program or service
        case 5:   return ProbeStatus::NOT_FOUND;    // systemctl: unit not loaded
        case 127: return ProbeStatus::NOT_SUPPORTED;
        default:  return ProbeStatus::FAILURE;
        }
    }

    ServiceControlResult PosixPlatformProbe::DisableAndStopService(const std::wstring& serviceName) {
        std::string unit = Utils::ToUtf8(serviceName);

        ServiceControlResult result;
        result.disableStatus = RunCommand({ "systemctl", "disable", unit });
        result.stopStatus = RunCommand({ "systemctl", "stop", unit });
        return result;
    }

    std::unique_ptr<PlatformProbe> CreatePlatformProbe(int elevationTimeoutMs) {
        return std::make_unique<PosixPlatformProbe>(elevationTimeoutMs);
    }

} // namespace UnifiedScan
