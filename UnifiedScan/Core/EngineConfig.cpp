/**
 * EngineConfig.cpp - Defaults and INI loader
 */

#include "EngineConfig.h"
#include "../Utils/StringUtils.h"
#include "../Utils/Logger.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace UnifiedScan {

    std::vector<std::wstring> EngineConfig::DefaultExcludedPaths() {
#ifdef _WIN32
        return {};
#else
        return { L"/proc", L"/sys", L"/dev", L"/run" };
#endif
    }

    namespace {

        bool ParseBool(const std::string& text, bool& value) {
            std::string lowered = Utils::ToLower(text);
            if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") {
                value = true;
                return true;
            }
            if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
                value = false;
                return true;
            }
            return false;
        }

        bool ParseUnsigned(const std::string& text, uint64_t& value) {
            if (text.empty()) return false;
            for (char c : text) {
                if (c < '0' || c > '9') return false;
            }
            try {
                value = std::stoull(text);
            } catch (const std::exception&) {
                return false;
            }
            return true;
        }

        bool ParseInt(const std::string& text, int& value) {
            uint64_t parsed = 0;
            if (!ParseUnsigned(text, parsed) || parsed > 0x7FFFFFFF) return false;
            value = static_cast<int>(parsed);
            return true;
        }

        std::vector<std::wstring> ParseList(const std::string& text) {
            std::vector<std::wstring> items;
            for (const auto& part : Utils::Split(text, ',')) {
                std::string item = Utils::Trim(part);
                if (!item.empty()) items.push_back(Utils::FromUtf8(item));
            }
            return items;
        }

        enum class ApplyStatus { APPLIED, UNKNOWN_KEY, BAD_VALUE };

        ApplyStatus ApplyScan(EngineConfig& config, const std::string& key, const std::string& value) {
            bool flag = false;
            bool* toggle = nullptr;

            if (key == "roots") { config.scanRoots = ParseList(value); return ApplyStatus::APPLIED; }
            if (key == "exclude") { config.excludedPaths = ParseList(value); return ApplyStatus::APPLIED; }

            if (key == "processes") toggle = &config.scanProcesses;
            else if (key == "startup") toggle = &config.scanStartup;
            else if (key == "browser_extensions") toggle = &config.scanBrowserExtensions;
            else if (key == "file_system") toggle = &config.scanFileSystem;
            else if (key == "registry") toggle = &config.scanRegistry;
            else if (key == "scheduled_tasks") toggle = &config.scanScheduledTasks;
            else return ApplyStatus::UNKNOWN_KEY;

            if (!ParseBool(value, flag)) return ApplyStatus::BAD_VALUE;
            *toggle = flag;
            return ApplyStatus::APPLIED;
        }

        ApplyStatus ApplyHeuristics(HeuristicConfig& config, const std::string& key, const std::string& value) {
            uint64_t number = 0;

            if (key == "max_hash_file_size") {
                if (!ParseUnsigned(value, number)) return ApplyStatus::BAD_VALUE;
                config.maxHashFileSize = number;
            } else if (key == "recent_file_days") {
                if (!ParseInt(value, config.recentFileDays)) return ApplyStatus::BAD_VALUE;
            } else if (key == "small_file_size") {
                if (!ParseUnsigned(value, number)) return ApplyStatus::BAD_VALUE;
                config.smallFileSize = number;
            } else if (key == "short_name_length") {
                if (!ParseUnsigned(value, number)) return ApplyStatus::BAD_VALUE;
                config.shortFileNameLength = static_cast<size_t>(number);
            } else if (key == "suspicious_names") {
                config.suspiciousNameTokens = ParseList(Utils::ToLower(value));
            } else if (key == "hidden_executable_locations") {
                config.hiddenExecutableLocations = ParseList(Utils::ToLower(value));
            } else if (key == "temp_locations") {
                config.tempLocations = ParseList(Utils::ToLower(value));
            } else {
                return ApplyStatus::UNKNOWN_KEY;
            }
            return ApplyStatus::APPLIED;
        }

        ApplyStatus ApplyProgress(ProgressConfig& config, const std::string& key, const std::string& value) {
            if (key == "report_interval_ms") {
                if (!ParseInt(value, config.reportIntervalMs)) return ApplyStatus::BAD_VALUE;
            } else if (key == "immediate_report_files") {
                if (!ParseUnsigned(value, config.immediateReportFiles)) return ApplyStatus::BAD_VALUE;
            } else {
                return ApplyStatus::UNKNOWN_KEY;
            }
            return ApplyStatus::APPLIED;
        }

        ApplyStatus ApplyRemediation(RemediationConfig& config, const std::string& key, const std::string& value) {
            if (key == "quarantine") {
                if (!ParseBool(value, config.quarantineFiles)) return ApplyStatus::BAD_VALUE;
            } else if (key == "elevation_timeout_ms") {
                if (!ParseInt(value, config.elevationTimeoutMs)) return ApplyStatus::BAD_VALUE;
            } else if (key == "protected_paths") {
                config.extraProtectedPaths = ParseList(value);
            } else {
                return ApplyStatus::UNKNOWN_KEY;
            }
            return ApplyStatus::APPLIED;
        }

        ApplyStatus ApplyPaths(EngineConfig& config, const std::string& key, const std::string& value) {
            if (key == "signatures") config.signatureFile = Utils::FromUtf8(value);
            else if (key == "quarantine") config.quarantineDirectory = Utils::FromUtf8(value);
            else if (key == "logs") config.logDirectory = Utils::FromUtf8(value);
            else return ApplyStatus::UNKNOWN_KEY;
            return ApplyStatus::APPLIED;
        }

        ApplyStatus ApplyLogging(EngineConfig& config, const std::string& key, const std::string& value) {
            if (key != "level") return ApplyStatus::UNKNOWN_KEY;
            LogLevel level;
            if (!Logger::ParseLevel(value, level)) return ApplyStatus::BAD_VALUE;
            config.logLevel = Utils::ToLower(value);
            return ApplyStatus::APPLIED;
        }

    } // namespace

    bool LoadEngineConfig(const std::wstring& path, EngineConfig& config, std::string& error) {
        std::ifstream file{ fs::path(path) };
        if (!file.is_open()) {
            error = "cannot open configuration file " + Utils::ToUtf8(path);
            return false;
        }

        // Parse into a copy so a bad file leaves the caller's config untouched
        EngineConfig loaded = config;
        std::string section;
        std::string line;
        size_t lineNumber = 0;

        while (std::getline(file, line)) {
            lineNumber++;
            std::string trimmed = Utils::Trim(line);
            if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') continue;

            if (trimmed.front() == '[') {
                if (trimmed.back() != ']') {
                    error = "line " + std::to_string(lineNumber) + ": unterminated section header";
                    return false;
                }
                section = Utils::ToLower(Utils::Trim(trimmed.substr(1, trimmed.size() - 2)));
                continue;
            }

            size_t eq = trimmed.find('=');
            if (eq == std::string::npos) {
                error = "line " + std::to_string(lineNumber) + ": expected key = value";
                return false;
            }

            std::string key = Utils::ToLower(Utils::Trim(trimmed.substr(0, eq)));
            std::string value = Utils::Trim(trimmed.substr(eq + 1));

            ApplyStatus status = ApplyStatus::UNKNOWN_KEY;
            if (section == "scan") status = ApplyScan(loaded, key, value);
            else if (section == "heuristics") status = ApplyHeuristics(loaded.heuristics, key, value);
            else if (section == "progress") status = ApplyProgress(loaded.progress, key, value);
            else if (section == "remediation") status = ApplyRemediation(loaded.remediation, key, value);
            else if (section == "paths") status = ApplyPaths(loaded, key, value);
            else if (section == "logging") status = ApplyLogging(loaded, key, value);

            if (status == ApplyStatus::BAD_VALUE) {
                error = "line " + std::to_string(lineNumber) + ": invalid value for " +
                    (section.empty() ? key : section + "." + key);
                return false;
            }
            if (status == ApplyStatus::UNKNOWN_KEY) {
                LogWarning("EngineConfig", L"Ignoring unknown setting [" + Utils::FromUtf8(section) +
                    L"] " + Utils::FromUtf8(key) + L" at line " + std::to_wstring(lineNumber));
            }
        }

        config = std::move(loaded);
        return true;
    }

} // namespace UnifiedScan
