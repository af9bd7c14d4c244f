/**
 * ThreatRemover.cpp - Category specific removal strategies
 */

#include "ThreatRemover.h"
#include "Quarantine.h"
#include "../Utils/StringUtils.h"
#include "../Utils/Logger.h"
#include <algorithm>
#include <cwchar>

namespace UnifiedScan {

    // Drive-relative, lower case, backslash separated
    static const std::vector<std::wstring> PROTECTED_PATHS = {
        L"\\windows\\system32\\tasks",
        L"\\windows\\syswow64\\tasks",
        L"\\program files\\windowsapps",
        L"\\windows\\winsxs",
        L"\\windows\\servicing",
        L"\\windows\\installer",
        L"\\windows\\assembly",
        L"\\$recycle.bin",
        L"\\system volume information"
    };

    static const wchar_t* PROTECTED_MESSAGE =
        L"Protected Windows component - requires TrustedInstaller (safe to ignore)";

    namespace {

        std::wstring NormalizePath(const std::wstring& path) {
            std::wstring normalized = Utils::ToLower(path);
            std::replace(normalized.begin(), normalized.end(), L'/', L'\\');

            // "c:\windows" and "\\?\c:\windows" compare like "\windows"
            if (Utils::StartsWith(normalized, L"\\\\?\\")) normalized.erase(0, 4);
            if (normalized.size() >= 2 && normalized[1] == L':') normalized.erase(0, 2);
            return normalized;
        }

        bool StartsWithAny(const std::wstring& normalized, const std::vector<std::wstring>& prefixes) {
            return std::any_of(prefixes.begin(), prefixes.end(),
                [&normalized](const std::wstring& prefix) {
                    return !prefix.empty() && Utils::StartsWith(normalized, prefix);
                });
        }

        bool IsLocationBased(ThreatCategory category) {
            return category == ThreatCategory::FILE ||
                category == ThreatCategory::SCHEDULED_TASK ||
                category == ThreatCategory::BROWSER_EXTENSION;
        }

        RemovalResult Succeeded(const std::wstring& message) {
            RemovalResult result;
            result.success = true;
            result.message = message;
            return result;
        }

        RemovalResult Failed(const std::wstring& message) {
            RemovalResult result;
            result.success = false;
            result.message = message;
            return result;
        }

        ProbeStatus FromQuarantineResult(QuarantineResult result) {
            switch (result) {
            case QuarantineResult::SUCCESS:        return ProbeStatus::OK;
            case QuarantineResult::FILE_NOT_FOUND: return ProbeStatus::NOT_FOUND;
            case QuarantineResult::ACCESS_DENIED:  return ProbeStatus::ACCESS_DENIED;
            case QuarantineResult::FILE_IN_USE:    return ProbeStatus::IN_USE;
            default:                               return ProbeStatus::FAILURE;
            }
        }

        // Locations may use either separator whatever the host platform
        std::wstring LeafName(const std::wstring& path) {
            size_t separator = path.find_last_of(L"\\/");
            return separator == std::wstring::npos ? path : path.substr(separator + 1);
        }

        std::wstring StemOf(const std::wstring& path) {
            std::wstring leaf = LeafName(path);
            size_t dot = leaf.find_last_of(L'.');
            return (dot == std::wstring::npos || dot == 0) ? leaf : leaf.substr(0, dot);
        }

    } // namespace

    ThreatRemover::ThreatRemover(PlatformProbe& probe, RemediationConfig config, QuarantineManager* quarantine)
        : m_probe(probe)
        , m_config(std::move(config))
        , m_quarantine(quarantine) {
        for (const auto& path : m_config.extraProtectedPaths) {
            if (!path.empty()) m_extraProtected.push_back(NormalizePath(path));
        }
    }

    bool ThreatRemover::IsProtectedSystemPath(const std::wstring& path) {
        if (path.empty()) return false;
        std::wstring normalized = NormalizePath(path);

        if (StartsWithAny(normalized, PROTECTED_PATHS)) return true;

        // Store apps
        return Utils::Contains(normalized, L"windowsapps") || Utils::Contains(normalized, L"systemapps");
    }

    bool ThreatRemover::IsProtectedPath(const std::wstring& path) const {
        if (IsProtectedSystemPath(path)) return true;
        return !path.empty() && StartsWithAny(NormalizePath(path), m_extraProtected);
    }

    bool ThreatRemover::ParseRegistryLocation(const std::wstring& location, std::optional<RegistryHive>& hive,
        std::wstring& key, std::wstring& valueName) {
        static const std::pair<const wchar_t*, RegistryHive> PREFIXES[] = {
            { L"hkey_local_machine\\", RegistryHive::LOCAL_MACHINE },
            { L"hklm\\", RegistryHive::LOCAL_MACHINE },
            { L"hkey_current_user\\", RegistryHive::CURRENT_USER },
            { L"hkcu\\", RegistryHive::CURRENT_USER },
        };

        hive.reset();
        std::wstring rest = location;
        std::wstring lowered = Utils::ToLower(location);
        for (const auto& prefix : PREFIXES) {
            if (Utils::StartsWith(lowered, prefix.first)) {
                hive = prefix.second;
                rest = location.substr(wcslen(prefix.first));
                break;
            }
        }

        size_t separator = rest.find_last_of(L'\\');
        if (separator == std::wstring::npos || separator == 0) return false;

        key = rest.substr(0, separator);
        valueName = rest.substr(separator + 1);
        return true;
    }

    RemovalResult ThreatRemover::RemoveThreat(const Threat& threat) {
        LogInfo("ThreatRemover", std::wstring(L"Removing: ") + ToString(threat.category) + L" - " +
            threat.name + L" at " + threat.location);

        RemovalResult result;
        try {
            if (IsLocationBased(threat.category) && IsProtectedPath(threat.location)) {
                result.success = false;
                result.message = PROTECTED_MESSAGE;
                result.isProtectedSystem = true;
            } else if (!threat.removable) {
                result = (threat.category == ThreatCategory::BROWSER_EXTENSION)
                    ? Failed(L"Remove this extension from the browser's extension manager")
                    : Failed(L"Cannot be removed automatically - restore the original value manually");
            } else {
                switch (threat.category) {
                case ThreatCategory::PROCESS:
                    result = RemoveProcess(threat);
                    break;
                case ThreatCategory::FILE:
                    result = RemoveFileThreat(threat);
                    break;
                case ThreatCategory::STARTUP:
                    result = RemoveRegistryEntry(threat, true);
                    break;
                case ThreatCategory::REGISTRY:
                    result = RemoveRegistryEntry(threat, false);
                    break;
                case ThreatCategory::SERVICE:
                case ThreatCategory::SCHEDULED_TASK:
                    result = DisableService(threat);
                    break;
                default:
                    result = Failed(std::wstring(L"Removal not supported for type: ") + ToString(threat.category));
                    break;
                }
            }
        } catch (const std::exception& e) {
            result = Failed(L"Error: " + Utils::FromUtf8(e.what()));
        }

        if (result.success) {
            LogInfo("ThreatRemover", result.message);
        } else {
            LogWarning("ThreatRemover", threat.name + L": " + result.message);
        }
        return result;
    }

    RemovalResult ThreatRemover::RemoveProcess(const Threat& threat) {
        if (threat.processId) {
            ProbeStatus status = m_probe.KillProcess(*threat.processId);
            if (status == ProbeStatus::OK) {
                return Succeeded(L"Process " + threat.name + L" (PID " + std::to_wstring(*threat.processId) +
                    L") terminated");
            }
            if (status == ProbeStatus::NOT_FOUND) {
                return Succeeded(L"Process already terminated");
            }
            return Failed(std::wstring(L"Failed to kill process: ") + ToString(status));
        }

        std::vector<ProcessEntry> processes;
        ProbeStatus status = m_probe.ListProcesses(processes);
        if (status != ProbeStatus::OK) {
            return Failed(std::wstring(L"Cannot enumerate processes: ") + ToString(status));
        }

        std::wstring target = Utils::ToLower(StemOf(threat.name));
        size_t matched = 0;
        size_t terminated = 0;
        for (const auto& process : processes) {
            if (Utils::ToLower(StemOf(process.name)) != target) continue;
            matched++;

            ProbeStatus killStatus = m_probe.KillProcess(process.processId);
            if (killStatus == ProbeStatus::OK || killStatus == ProbeStatus::NOT_FOUND) terminated++;
        }

        if (matched == 0) return Succeeded(L"Process already terminated");
        if (terminated == matched) {
            return Succeeded(L"Terminated " + std::to_wstring(terminated) + L" process(es)");
        }
        return Failed(L"Failed to kill " + std::to_wstring(matched - terminated) + L" of " +
            std::to_wstring(matched) + L" process(es)");
    }

    RemovalResult ThreatRemover::RemoveFileThreat(const Threat& threat) {
        const std::wstring& path = threat.location;
        std::wstring fileName = LeafName(path);

        FileMetadata metadata;
        if (m_probe.GetFileMetadata(path, metadata) == ProbeStatus::NOT_FOUND) {
            return Succeeded(L"File already removed");
        }

        bool quarantine = m_config.quarantineFiles && m_quarantine && m_quarantine->IsInitialized();
        QuarantineEntry entry;

        FileOperation operation = [&]() {
            if (quarantine) {
                return FromQuarantineResult(m_quarantine->QuarantineFile(path, threat.name, &entry));
            }
            ProbeStatus attributeStatus = m_probe.SetAttributes(path, FileAttribute::NORMAL);
            if (attributeStatus == ProbeStatus::NOT_FOUND) return attributeStatus;
            return m_probe.RemoveFile(path);
        };

        std::wstring done = quarantine ? L"Quarantined: " : L"Deleted: ";
        ProbeStatus status = operation();
        if (status == ProbeStatus::OK) {
            return Succeeded(done + fileName + (quarantine ? L" (" + entry.quarantineId + L")" : L""));
        }
        if (status == ProbeStatus::NOT_FOUND) return Succeeded(L"File already removed");
        if (status == ProbeStatus::IN_USE) return Failed(L"File is in use - close the program using it and retry");
        if (status != ProbeStatus::ACCESS_DENIED) {
            return Failed(std::wstring(L"Failed to delete: ") + ToString(status));
        }

        LogInfo("ThreatRemover", L"Access denied, taking ownership of " + path);
        status = m_probe.ElevateAndRetry(path, operation);
        if (status == ProbeStatus::OK) {
            return Succeeded(L"Force " + Utils::ToLower(done) + fileName);
        }
        if (status == ProbeStatus::NOT_FOUND) return Succeeded(L"File already removed");
        if (status == ProbeStatus::TIMED_OUT) return Failed(L"Taking ownership timed out - file was not removed");
        return Failed(L"File protected by the operating system - may require manual removal");
    }

    RemovalResult ThreatRemover::RemoveRegistryEntry(const Threat& threat, bool bothHives) {
        std::optional<RegistryHive> prefix;
        std::wstring key;
        std::wstring valueName;
        if (!ParseRegistryLocation(threat.location, prefix, key, valueName)) {
            return Failed(L"Invalid registry path");
        }

        // Startup findings may come from either hive
        std::vector<RegistryHive> hives;
        if (prefix && !bothHives) {
            hives.push_back(*prefix);
        } else {
            hives = { RegistryHive::CURRENT_USER, RegistryHive::LOCAL_MACHINE };
        }

        bool deleted = false;
        bool stillPresent = false;
        ProbeStatus lastError = ProbeStatus::NOT_FOUND;

        for (RegistryHive hive : hives) {
            ProbeStatus status = m_probe.DeleteRegistryValue(hive, key, valueName);
            if (status == ProbeStatus::OK) {
                deleted = true;
            } else if (status != ProbeStatus::NOT_FOUND) {
                lastError = status;
            }

            std::wstring remaining;
            ProbeStatus readStatus = m_probe.ReadRegistryValue(hive, key, valueName, remaining);
            if (readStatus == ProbeStatus::OK) {
                stillPresent = true;
            } else if (readStatus != ProbeStatus::NOT_FOUND) {
                lastError = readStatus;
            }
        }

        std::wstring what = (threat.category == ThreatCategory::STARTUP) ? L"startup entry" : L"registry value";
        if (stillPresent) {
            return Failed(L"Could not remove " + what + L": " + ToString(lastError));
        }
        if (deleted) {
            return Succeeded(L"Removed " + what + L": " + valueName);
        }
        if (lastError == ProbeStatus::NOT_FOUND) {
            return Succeeded(L"The " + what + L" is already gone");
        }
        return Failed(L"Could not remove " + what + L": " + ToString(lastError));
    }

    RemovalResult ThreatRemover::DisableService(const Threat& threat) {
        std::wstring serviceName = StemOf(threat.location);
        if (serviceName.empty()) serviceName = threat.name;

        ServiceControlResult control = m_probe.DisableAndStopService(serviceName);

        if (control.disableStatus == ProbeStatus::NOT_FOUND) {
            return Succeeded(L"Service " + serviceName + L" no longer exists");
        }
        if (control.disableStatus != ProbeStatus::OK) {
            return Failed(L"Failed to disable service " + serviceName + L": " + ToString(control.disableStatus));
        }

        std::wstring message = L"Service " + serviceName + L" disabled";
        if (control.stopStatus != ProbeStatus::OK && control.stopStatus != ProbeStatus::NOT_FOUND) {
            message += std::wstring(L" (stop: ") + ToString(control.stopStatus) + L")";
        }
        return Succeeded(message);
    }

} // namespace UnifiedScan
