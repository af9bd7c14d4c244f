/**
 * BrowserExtensionScanner.cpp
 *
 * An extension is flagged when its directory (or packed .xpi) name matches
 * a file name pattern, or when its manifest.json mentions an adware
 * marker. Chromium browsers keep the manifest one level down, in a
 * version directory; both places are read.
 */

#include "BrowserExtensionScanner.h"
#include "ScanSession.h"
#include "SignatureStore.h"
#include "../Utils/StringUtils.h"
#include "../Utils/Logger.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace UnifiedScan {

    static constexpr size_t MAX_MANIFEST_BYTES = 1024 * 1024;

    PhaseOutcome BrowserExtensionScanner::Scan(ScanSession& session) {
        for (const auto& root : session.Probe().ListBrowserExtensionRoots()) {
            if (session.IsCancelled()) return PhaseOutcome::CANCELLED;

            if (ScanExtensionRoot(session, root) == PhaseOutcome::CANCELLED) {
                return PhaseOutcome::CANCELLED;
            }
        }

        session.PublishFilesScanned();
        return PhaseOutcome::COMPLETED;
    }

    std::wstring BrowserExtensionScanner::FindAdwareMarker(ScanSession& session, const std::wstring& extensionDir) {
        std::vector<fs::path> manifests = { fs::path(extensionDir) / L"manifest.json" };

        std::error_code ec;
        for (fs::directory_iterator it(extensionDir, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code typeEc;
            if (it->is_directory(typeEc)) {
                manifests.push_back(it->path() / L"manifest.json");
            }
        }

        for (const auto& manifest : manifests) {
            std::wstring text;
            if (!ReadTextFile(manifest.wstring(), MAX_MANIFEST_BYTES, text)) continue;

            if (auto marker = session.Signatures().MatchAdwareMarker(text)) {
                return L"Adware: " + marker->pattern;
            }
        }
        return {};
    }

    PhaseOutcome BrowserExtensionScanner::ScanExtensionRoot(ScanSession& session, const BrowserExtensionRoot& root) {
        std::error_code ec;
        fs::directory_iterator it(root.path, ec);
        if (ec) {
            // Browser not installed or profile not readable
            LogTrace("BrowserExtensionScanner", L"Skipping " + root.browser + L" store " + root.path);
            return PhaseOutcome::COMPLETED;
        }

        for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
            if (session.IsCancelled()) return PhaseOutcome::CANCELLED;

            try {
                std::error_code typeEc;
                bool isDirectory = it->is_directory(typeEc);
                bool isPacked = !isDirectory && it->is_regular_file(typeEc) &&
                    Utils::ToLower(it->path().extension().wstring()) == L".xpi";
                if (!isDirectory && !isPacked) continue;

                session.IncrementFilesScanned();

                std::wstring extensionName = it->path().filename().wstring();
                std::wstring pattern;
                if (auto signature = session.Signatures().MatchFileName(extensionName)) {
                    pattern = signature->description;
                } else if (isDirectory) {
                    pattern = FindAdwareMarker(session, it->path().wstring());
                }
                if (pattern.empty()) continue;

                Threat threat;
                threat.category = ThreatCategory::BROWSER_EXTENSION;
                threat.name = extensionName;
                threat.description = root.browser + L" extension matches threat pattern: " + pattern;
                threat.location = it->path().wstring();
                threat.details = root.browser;
                threat.severity = ThreatSeverity::MEDIUM;
                threat.classification = "Adware/PUP";
                threat.removable = false;
                session.AddThreat(std::move(threat));
            } catch (const std::exception& e) {
                LogTrace("BrowserExtensionScanner", L"Skipping extension entry: " + Utils::FromUtf8(e.what()));
            }
        }
        return PhaseOutcome::COMPLETED;
    }

} // namespace UnifiedScan
