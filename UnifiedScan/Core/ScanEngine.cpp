/**
 * ScanEngine.cpp - Phase sequencing, result assembly and the scan worker
 */

#include "ScanEngine.h"
#include "ScanSession.h"
#include "FileScanner.h"
#include "ProcessScanner.h"
#include "StartupScanner.h"
#include "BrowserExtensionScanner.h"
#include "RegistryScanner.h"
#include "ScheduledTaskScanner.h"
#include "SignatureStore.h"
#include "../Platform/PlatformProbe.h"
#include "../Utils/StringUtils.h"
#include "../Utils/Logger.h"

namespace UnifiedScan {

    namespace {

        // Phase start percentages
        constexpr int PERCENT_COUNTING = 1;
        constexpr int PERCENT_COUNTED = 3;
        constexpr int PERCENT_PROCESSES = 4;
        constexpr int PERCENT_STARTUP = 7;
        constexpr int PERCENT_EXTENSIONS = 10;
        constexpr int PERCENT_REGISTRY = 91;
        constexpr int PERCENT_TASKS = 96;
        constexpr int PERCENT_FINALIZING = 99;

        // Clears the in-flight flag however Execute leaves
        class ScanningFlagGuard {
        public:
            explicit ScanningFlagGuard(std::atomic<bool>& flag) : m_flag(flag) {}
            ~ScanningFlagGuard() { m_flag.store(false); }

            ScanningFlagGuard(const ScanningFlagGuard&) = delete;
            ScanningFlagGuard& operator=(const ScanningFlagGuard&) = delete;

        private:
            std::atomic<bool>& m_flag;
        };

    } // namespace

    const wchar_t* ToString(ScanState state) {
        switch (state) {
        case ScanState::IDLE:                        return L"Idle";
        case ScanState::COUNTING:                    return L"Counting";
        case ScanState::SCANNING_PROCESSES:          return L"Scanning processes";
        case ScanState::SCANNING_STARTUP:            return L"Scanning startup";
        case ScanState::SCANNING_BROWSER_EXTENSIONS: return L"Scanning browser extensions";
        case ScanState::SCANNING_FILE_SYSTEM:        return L"Scanning file system";
        case ScanState::SCANNING_REGISTRY:           return L"Scanning registry";
        case ScanState::SCANNING_SCHEDULED_TASKS:    return L"Scanning scheduled tasks";
        case ScanState::FINALIZING:                  return L"Finalizing";
        case ScanState::COMPLETED:                   return L"Completed";
        case ScanState::CANCELLED:                   return L"Cancelled";
        case ScanState::FAILED:                      return L"Failed";
        }
        return L"Unknown";
    }

    ScanEngine::ScanEngine(const SignatureStore& signatures, PlatformProbe& probe, EngineConfig config)
        : m_signatures(signatures)
        , m_probe(probe)
        , m_config(std::move(config)) {
    }

    ScanEngine::~ScanEngine() {
        CancelScan();
        std::lock_guard<std::mutex> lock(m_threadMutex);
        if (m_scanThread.joinable()) {
            m_scanThread.join();
        }
    }

    ScanStartStatus ScanEngine::StartScan(std::shared_ptr<ScanEventSink> sink, std::future<ScanResult>& handle) {
        if (!TryBeginScan()) {
            LogWarning("ScanEngine", L"Scan already in progress");
            return ScanStartStatus::ALREADY_RUNNING;
        }

        std::lock_guard<std::mutex> lock(m_threadMutex);
        // The previous worker has already cleared m_isScanning and is exiting
        if (m_scanThread.joinable()) {
            m_scanThread.join();
        }

        std::packaged_task<ScanResult()> task([this, sink]() {
            return Execute(sink.get());
        });
        handle = task.get_future();
        m_scanThread = std::thread(std::move(task));
        return ScanStartStatus::STARTED;
    }

    ScanResult ScanEngine::RunScan(ScanEventSink* sink) {
        if (!TryBeginScan()) {
            ScanResult rejected;
            rejected.startTime = rejected.endTime = std::chrono::system_clock::now();
            rejected.error = "Scan already in progress";
            return rejected;
        }
        return Execute(sink);
    }

    bool ScanEngine::TryBeginScan() {
        // Claiming the flag and clearing the token happen under the lock CancelScan takes
        std::lock_guard<std::mutex> lock(m_controlMutex);
        bool expected = false;
        if (!m_isScanning.compare_exchange_strong(expected, true)) return false;
        m_cancellation.Reset();
        return true;
    }

    void ScanEngine::CancelScan() {
        std::lock_guard<std::mutex> lock(m_controlMutex);
        if (m_isScanning.load()) {
            LogInfo("ScanEngine", L"Cancellation requested");
            m_cancellation.Cancel();
        }
    }

    void ScanEngine::SetState(ScanState state) {
        m_state.store(state);
        LogTrace("ScanEngine", std::wstring(L"State: ") + ToString(state));
    }

    PhaseOutcome ScanEngine::RunDomainPhase(ScanSession& session, ScanState state, DomainScanner& scanner,
        int percent, const std::wstring& message) {
        if (session.IsCancelled()) return PhaseOutcome::CANCELLED;

        SetState(state);
        session.ReportProgress(message, percent);

        uint64_t before = session.FilesScanned();
        size_t threatsBefore = session.Threats().size();
        PhaseOutcome outcome = scanner.Scan(session);

        LogInfo("ScanEngine", std::wstring(scanner.GetName()) + L": " +
            std::to_wstring(session.FilesScanned() - before) + L" entries, " +
            std::to_wstring(session.Threats().size() - threatsBefore) + L" threats");
        return outcome;
    }

    PhaseOutcome ScanEngine::RunPhases(ScanSession& session) {
        FileScanner fileScanner(session);
        std::vector<std::wstring> roots;

        SetState(ScanState::COUNTING);
        session.ReportProgress(L"Initializing scan...", 0);

        if (m_config.scanFileSystem) {
            session.ReportProgress(L"Analyzing drives and counting files...", PERCENT_COUNTING);
            roots = fileScanner.ResolveRoots();

            uint64_t total = 0;
            if (fileScanner.CountFiles(roots, total) == PhaseOutcome::CANCELLED) {
                return PhaseOutcome::CANCELLED;
            }
            session.SetTotalFilesEstimated(total);
            session.ReportProgress(L"Found " + Utils::FormatCount(total) + L" files to scan across " +
                std::to_wstring(roots.size()) + L" location(s)", PERCENT_COUNTED);
        }

        ProcessScanner processScanner;
        StartupScanner startupScanner;
        BrowserExtensionScanner extensionScanner;
        RegistryScanner registryScanner;
        ScheduledTaskScanner taskScanner;

        if (m_config.scanProcesses &&
            RunDomainPhase(session, ScanState::SCANNING_PROCESSES, processScanner, PERCENT_PROCESSES,
                L"Scanning running processes for malware...") == PhaseOutcome::CANCELLED) {
            return PhaseOutcome::CANCELLED;
        }

        if (m_config.scanStartup &&
            RunDomainPhase(session, ScanState::SCANNING_STARTUP, startupScanner, PERCENT_STARTUP,
                L"Checking startup programs...") == PhaseOutcome::CANCELLED) {
            return PhaseOutcome::CANCELLED;
        }

        if (m_config.scanBrowserExtensions &&
            RunDomainPhase(session, ScanState::SCANNING_BROWSER_EXTENSIONS, extensionScanner, PERCENT_EXTENSIONS,
                L"Scanning browser extensions for adware...") == PhaseOutcome::CANCELLED) {
            return PhaseOutcome::CANCELLED;
        }

        if (m_config.scanFileSystem) {
            if (session.IsCancelled()) return PhaseOutcome::CANCELLED;

            SetState(ScanState::SCANNING_FILE_SYSTEM);
            session.ReportProgress(L"Starting comprehensive file scan...", FileScanner::PROGRESS_START);
            if (fileScanner.ScanRoots(roots) == PhaseOutcome::CANCELLED) {
                return PhaseOutcome::CANCELLED;
            }
            LogInfo("ScanEngine", L"File system: " + Utils::FormatCount(fileScanner.GetFilesVisited()) +
                L" of " + Utils::FormatCount(session.TotalFilesEstimated()) + L" counted files scanned");
        }

        if (m_config.scanRegistry &&
            RunDomainPhase(session, ScanState::SCANNING_REGISTRY, registryScanner, PERCENT_REGISTRY,
                L"Deep scanning registry for threats...") == PhaseOutcome::CANCELLED) {
            return PhaseOutcome::CANCELLED;
        }

        if (m_config.scanScheduledTasks &&
            RunDomainPhase(session, ScanState::SCANNING_SCHEDULED_TASKS, taskScanner, PERCENT_TASKS,
                L"Checking scheduled tasks...") == PhaseOutcome::CANCELLED) {
            return PhaseOutcome::CANCELLED;
        }

        if (session.IsCancelled()) return PhaseOutcome::CANCELLED;
        SetState(ScanState::FINALIZING);
        session.ReportProgress(L"Finalizing scan results...", PERCENT_FINALIZING);
        return PhaseOutcome::COMPLETED;
    }

    ScanResult ScanEngine::Execute(ScanEventSink* sink) {
        ScanningFlagGuard guard(m_isScanning);

        ScanResult result;
        result.startTime = std::chrono::system_clock::now();
        auto started = std::chrono::steady_clock::now();

        LogInfo("ScanEngine", L"Scan started");

        ScanSession session(m_signatures, m_probe, m_config, sink, m_cancellation);
        PhaseOutcome outcome = PhaseOutcome::COMPLETED;

        try {
            outcome = RunPhases(session);
        } catch (const ScanFailure& e) {
            result.error = e.what();
        } catch (const std::exception& e) {
            result.error = std::string("Unexpected error: ") + e.what();
        }

        result.endTime = std::chrono::system_clock::now();
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        result.filesScanned = session.FilesScanned();
        result.totalFilesEstimated = session.TotalFilesEstimated();
        result.threats = session.TakeThreats();

        std::wstring files = Utils::FormatCount(result.filesScanned);
        std::wstring elapsed = FormatDuration(result.duration);

        // Reporting the outcome must not turn a sealed result into an exception
        try {
            if (result.error) {
                SetState(ScanState::FAILED);
                LogError("ScanEngine", L"Scan failed: " + Utils::FromUtf8(*result.error));
                session.ReportProgress(L"Error: " + Utils::FromUtf8(*result.error), session.LastPercent());
            } else if (outcome == PhaseOutcome::CANCELLED) {
                result.cancelled = true;
                SetState(ScanState::CANCELLED);
                session.ReportProgress(L"Scan cancelled after " + files + L" files (" + elapsed + L")",
                    session.LastPercent());
            } else {
                SetState(ScanState::COMPLETED);
                std::wstring message = result.threats.empty()
                    ? L"Scan complete! Scanned " + files + L" files in " + elapsed + L" - No threats found!"
                    : L"Found " + std::to_wstring(result.threats.size()) + L" threats in " + files +
                        L" files (" + elapsed + L")";
                session.ReportProgress(message, 100);
            }
        } catch (const std::exception& e) {
            LogError("ScanEngine", L"Event sink failed: " + Utils::FromUtf8(e.what()));
        }

        return result;
    }

} // namespace UnifiedScan
