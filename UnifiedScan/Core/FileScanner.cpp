/**
 * FileScanner.cpp
 *
 * Traversal and per-file classification. The walk is iterative (explicit
 * stack), so deep trees cannot exhaust the worker's stack.
 */

#include "FileScanner.h"
#include "ScanSession.h"
#include "SignatureStore.h"
#include "../Platform/PlatformProbe.h"
#include "../Utils/StringUtils.h"
#include "../Utils/Logger.h"
#include <unordered_set>
#include <algorithm>

namespace fs = std::filesystem;

namespace UnifiedScan {

    // Executables, scripts, installers and shortcuts
    static const std::unordered_set<std::wstring> EXECUTABLE_EXTENSIONS = {
        L".exe", L".dll", L".scr", L".bat", L".cmd", L".vbs", L".vbe", L".js", L".jse",
        L".wsf", L".wsh", L".ps1", L".psm1", L".msi", L".msp", L".com", L".pif",
        L".application", L".gadget", L".msc", L".jar", L".hta", L".cpl", L".inf",
        L".reg", L".lnk", L".scf", L".sys", L".drv"
    };

    // Scanned in addition to the executables
    static const std::unordered_set<std::wstring> DOCUMENT_EXTENSIONS = {
        L".doc", L".docx", L".docm", L".xls", L".xlsx", L".xlsm", L".ppt", L".pptx", L".pptm",
        L".pdf", L".rtf",
        L".zip", L".rar", L".7z", L".tar", L".gz",
        L".py", L".rb", L".pl", L".sh", L".php",
        L".iso", L".img", L".vhd"
    };

    // Second-to-last extensions used to disguise an executable
    static const std::unordered_set<std::wstring> INNOCUOUS_EXTENSIONS = {
        L".pdf", L".doc", L".docx", L".xls", L".xlsx", L".jpg", L".png", L".txt", L".mp3"
    };

    static const std::unordered_set<std::wstring> SKIPPED_DIRECTORIES = {
        L"$recycle.bin", L"system volume information", L"windows.old", L"recovery",
        L"$windows.~bt", L"$windows.~ws", L"config.msi", L"msocache", L"perflogs"
    };

    namespace {

        std::wstring NormalizeForCompare(const fs::path& path) {
            std::wstring text = path.lexically_normal().generic_wstring();
            while (text.size() > 1 && text.back() == L'/') text.pop_back();
#ifdef _WIN32
            text = Utils::ToLower(text);
#endif
            return text;
        }

        bool ContainsAny(const std::wstring& text, const std::vector<std::wstring>& tokens) {
            return std::any_of(tokens.begin(), tokens.end(),
                [&text](const std::wstring& token) { return !token.empty() && Utils::Contains(text, token); });
        }

    } // namespace

    FileScanner::FileScanner(ScanSession& session)
        : m_session(session) {
        for (const auto& excluded : session.Config().excludedPaths) {
            if (!excluded.empty()) m_excluded.push_back(NormalizeForCompare(fs::path(excluded)));
        }
    }

    bool FileScanner::IsScannableExtension(const std::wstring& extension) {
        std::wstring lowered = Utils::ToLower(extension);
        return EXECUTABLE_EXTENSIONS.count(lowered) > 0 || DOCUMENT_EXTENSIONS.count(lowered) > 0;
    }

    bool FileScanner::IsExecutableExtension(const std::wstring& extension) {
        return EXECUTABLE_EXTENSIONS.count(Utils::ToLower(extension)) > 0;
    }

    bool FileScanner::ShouldSkipDirectory(const std::wstring& directoryName) {
        std::wstring lowered = Utils::ToLower(directoryName);
        return SKIPPED_DIRECTORIES.count(lowered) > 0 || Utils::StartsWith(lowered, L"$");
    }

    bool FileScanner::IsDisguisedExecutable(const std::wstring& fileName) {
        auto parts = Utils::Split(Utils::ToLower(fileName), L'.');
        if (parts.size() <= 2) return false;

        std::wstring last = L"." + parts[parts.size() - 1];
        std::wstring secondLast = L"." + parts[parts.size() - 2];

        // Shortcuts legitimately look like "photo.png.lnk"
        if (last == L".lnk") return false;

        return EXECUTABLE_EXTENSIONS.count(last) > 0 && INNOCUOUS_EXTENSIONS.count(secondLast) > 0;
    }

    std::vector<std::wstring> FileScanner::ResolveRoots() {
        std::vector<std::wstring> roots = m_session.Config().scanRoots;
        if (roots.empty()) {
            roots = m_session.Probe().ListFixedVolumes();
            if (roots.empty()) {
                throw ScanFailure("No fixed local volume is available to scan");
            }
        }
        return roots;
    }

    bool FileScanner::IsExcluded(const fs::path& directory) const {
        if (m_excluded.empty()) return false;
        std::wstring normalized = NormalizeForCompare(directory);
        return std::find(m_excluded.begin(), m_excluded.end(), normalized) != m_excluded.end();
    }

    PhaseOutcome FileScanner::WalkTree(const std::vector<std::wstring>& roots, const FileVisitor& visitor) {
        for (const auto& root : roots) {
            if (m_session.IsCancelled()) return PhaseOutcome::CANCELLED;

            fs::path rootPath(root);
            if (IsExcluded(rootPath)) continue;

            std::vector<fs::path> pending;
            pending.push_back(rootPath);

            while (!pending.empty()) {
                if (m_session.IsCancelled()) return PhaseOutcome::CANCELLED;

                fs::path directory = std::move(pending.back());
                pending.pop_back();

                std::error_code ec;
                fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
                if (ec) {
                    LogTrace("FileScanner", L"Skipping directory " + directory.wstring() + L": " +
                        Utils::FromUtf8(ec.message()));
                    continue;
                }

                std::vector<fs::path> subdirectories;
                for (fs::directory_iterator end; it != end; it.increment(ec)) {
                    if (ec) break;
                    if (m_session.IsCancelled()) return PhaseOutcome::CANCELLED;

                    const fs::directory_entry& entry = *it;
                    std::error_code typeEc;

                    if (entry.is_directory(typeEc)) {
                        std::error_code linkEc;
                        if (entry.is_symlink(linkEc) || linkEc) continue;

                        std::wstring name;
                        try {
                            name = entry.path().filename().wstring();
                        } catch (const std::exception&) {
                            continue;
                        }
                        if (ShouldSkipDirectory(name) || IsExcluded(entry.path())) continue;

                        subdirectories.push_back(entry.path());
                        continue;
                    }
                    if (typeEc) continue;
                    if (!entry.is_regular_file(typeEc) || typeEc) continue;

                    std::wstring extension;
                    try {
                        extension = entry.path().extension().wstring();
                    } catch (const std::exception&) {
                        continue;
                    }
                    if (!IsScannableExtension(extension)) continue;

                    visitor(entry.path());
                }

                if (ec) {
                    LogTrace("FileScanner", L"Stopped listing " + directory.wstring() + L": " +
                        Utils::FromUtf8(ec.message()));
                }

                // Reverse so the first subdirectory is walked first
                for (auto sub = subdirectories.rbegin(); sub != subdirectories.rend(); ++sub) {
                    pending.push_back(std::move(*sub));
                }
            }
        }
        return PhaseOutcome::COMPLETED;
    }

    PhaseOutcome FileScanner::CountFiles(const std::vector<std::wstring>& roots, uint64_t& total) {
        total = 0;
        return WalkTree(roots, [&total](const fs::path&) { total++; });
    }

    int FileScanner::FilePercent() const {
        uint64_t total = m_session.TotalFilesEstimated();
        if (total == 0) return PROGRESS_START;

        uint64_t percent = PROGRESS_START + (m_filesVisited * PROGRESS_SPAN) / total;
        return static_cast<int>(std::min<uint64_t>(percent, PROGRESS_START + PROGRESS_SPAN));
    }

    PhaseOutcome FileScanner::ScanRoots(const std::vector<std::wstring>& roots) {
        m_filesVisited = 0;

        for (size_t i = 0; i < roots.size(); i++) {
            if (m_session.IsCancelled()) return PhaseOutcome::CANCELLED;

            int percent = PROGRESS_START + static_cast<int>(i * PROGRESS_SPAN / roots.size());
            m_session.ReportProgress(L"Scanning " + roots[i] + L"...", percent);

            PhaseOutcome outcome = WalkTree({ roots[i] }, [this](const fs::path& path) {
                m_session.IncrementFilesScanned();
                m_filesVisited++;

                try {
                    std::wstring filePath = path.wstring();
                    m_session.ReportFileProgress(filePath, FilePercent());

                    for (auto& threat : ClassifyFile(filePath)) {
                        m_session.AddThreat(std::move(threat));
                    }
                } catch (const std::exception& e) {
                    LogTrace("FileScanner", L"Skipping file: " + Utils::FromUtf8(e.what()));
                }
            });

            if (outcome == PhaseOutcome::CANCELLED) return outcome;
        }

        m_session.PublishFilesScanned();
        return PhaseOutcome::COMPLETED;
    }

    std::vector<Threat> FileScanner::ClassifyFile(const std::wstring& filePath) {
        std::vector<Threat> threats;

        FileMetadata metadata;
        ProbeStatus status = m_session.Probe().GetFileMetadata(filePath, metadata);
        if (status != ProbeStatus::OK) {
            LogTrace("FileScanner", L"No metadata (" + std::wstring(ToString(status)) + L"): " + filePath);
            return threats;
        }

        fs::path path(filePath);
        std::wstring fileName = Utils::ToLower(path.filename().wstring());
        std::wstring extension = Utils::ToLower(path.extension().wstring());
        std::wstring parentDir = Utils::ToLower(path.parent_path().wstring());
        bool executable = IsExecutableExtension(extension);
        const HeuristicConfig& heuristics = m_session.Config().heuristics;

        auto makeThreat = [&](const std::wstring& description, ThreatSeverity severity,
            const std::string& classification) {
            Threat threat;
            threat.category = ThreatCategory::FILE;
            threat.name = path.filename().wstring();
            threat.description = description;
            threat.location = filePath;
            threat.severity = severity;
            threat.classification = classification;
            threat.removable = true;
            threat.sizeBytes = metadata.size;
            return threat;
        };

        // 1. Name pattern
        if (auto signature = m_session.Signatures().MatchFileName(fileName)) {
            threats.push_back(makeThreat(L"Filename matches threat pattern: " + signature->description,
                signature->severity, "Suspicious File"));
            return threats;
        }

        // 2. Double extension
        if (IsDisguisedExecutable(fileName)) {
            threats.push_back(makeThreat(L"File uses a double extension to disguise an executable",
                ThreatSeverity::HIGH, "Suspicious File"));
            return threats;
        }

        // 3. Known-malware hash, size gated
        if (executable && metadata.size > 0 && metadata.size < heuristics.maxHashFileSize &&
            !m_session.IsCancelled()) {
            std::string digest;
            ProbeStatus hashStatus = m_session.Probe().ComputeFileHash(filePath, digest);
            if (hashStatus == ProbeStatus::OK) {
                if (m_session.Signatures().MatchHash(digest)) {
                    Threat threat = makeThreat(L"File hash matches known malware signature",
                        ThreatSeverity::CRITICAL, "Malware");
                    threat.details = L"SHA256: " + Utils::FromUtf8(digest);
                    threats.push_back(std::move(threat));
                    return threats;
                }
            } else {
                LogTrace("FileScanner", L"Cannot hash (" + std::wstring(ToString(hashStatus)) + L"): " + filePath);
            }
        }

        if (!executable) return threats;

        // 4. Hidden executable in a user-writable location
        if ((metadata.attributes & FileAttribute::HIDDEN) &&
            ContainsAny(parentDir, heuristics.hiddenExecutableLocations)) {
            threats.push_back(makeThreat(L"Hidden executable file in suspicious location",
                ThreatSeverity::HIGH, "Suspicious File"));
        }

        // 5. Small, recently created, oddly named executable in a temp directory
        auto recentWindow = std::chrono::hours(24) * heuristics.recentFileDays;
        bool recent = metadata.creationTime > std::chrono::system_clock::now() - recentWindow;
        if (recent && ContainsAny(parentDir, heuristics.tempLocations) &&
            metadata.size < heuristics.smallFileSize &&
            (ContainsAny(fileName, heuristics.suspiciousNameTokens) ||
                fileName.size() < heuristics.shortFileNameLength)) {
            threats.push_back(makeThreat(L"Recently created executable in temp folder",
                ThreatSeverity::LOW, "Potentially Unwanted"));
        }

        return threats;
    }

} // namespace UnifiedScan
