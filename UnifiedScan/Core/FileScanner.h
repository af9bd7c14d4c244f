/**
 * FileScanner.h
 *
 * Two-pass walk of the local volumes.
 *
 * Responsibilities:
 * - Counting pass: total number of files with a scannable extension
 * - Scanning pass: classify each of those files by name, double
 *   extension, content hash and location heuristics
 * - Throttled per-file telemetry
 *
 * Both passes share WalkTree, so for an unchanged tree they visit the
 * same files in the same order: the files of a directory first, then its
 * subdirectories in enumeration order.
 *
 * Error policy (the only one used by the walk): an entry that cannot be
 * read is skipped and the walk continues with its next sibling. This
 * covers directories that cannot be opened or vanish, entries whose
 * type cannot be queried, and files whose metadata or content cannot be
 * read. Skips are logged at TRACE level. Nothing in the walk aborts the
 * pass except cancellation.
 */

#pragma once

#include "ThreatTypes.h"
#include "Cancellation.h"
#include <string>
#include <vector>
#include <functional>
#include <filesystem>

namespace UnifiedScan {

    class ScanSession;

    class FileScanner {
    public:
        // Percent range owned by the scanning pass
        static constexpr int PROGRESS_START = 12;
        static constexpr int PROGRESS_SPAN = 78;

        explicit FileScanner(ScanSession& session);

        FileScanner(const FileScanner&) = delete;
        FileScanner& operator=(const FileScanner&) = delete;

        /**
         * Configured roots, or every fixed volume when none are configured.
         * @throws ScanFailure if there is nothing to scan
         */
        std::vector<std::wstring> ResolveRoots();

        PhaseOutcome CountFiles(const std::vector<std::wstring>& roots, uint64_t& total);
        PhaseOutcome ScanRoots(const std::vector<std::wstring>& roots);

        // Files visited by the last ScanRoots call
        uint64_t GetFilesVisited() const { return m_filesVisited; }

        // All findings for one file; at most one from the name/hash checks
        std::vector<Threat> ClassifyFile(const std::wstring& filePath);

        static bool IsScannableExtension(const std::wstring& extension);
        static bool IsExecutableExtension(const std::wstring& extension);
        static bool ShouldSkipDirectory(const std::wstring& directoryName);

        // "invoice.pdf.exe" style names; shortcuts (".lnk") are exempt
        static bool IsDisguisedExecutable(const std::wstring& fileName);

    private:
        using FileVisitor = std::function<void(const std::filesystem::path&)>;

        PhaseOutcome WalkTree(const std::vector<std::wstring>& roots, const FileVisitor& visitor);
        bool IsExcluded(const std::filesystem::path& directory) const;
        int FilePercent() const;

        ScanSession& m_session;
        std::vector<std::wstring> m_excluded;
        uint64_t m_filesVisited = 0;
    };

} // namespace UnifiedScan
