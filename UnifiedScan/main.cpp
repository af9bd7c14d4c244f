/**
 * main.cpp
 *
 * Command-line entry point.
 *
 * Responsibilities:
 * - Parse the command line and the optional INI configuration
 * - Set up logging, signatures and the platform probe
 * - Run one full scan on the engine's worker while printing its events
 * - Optionally remove (or quarantine) every removable threat found
 *
 * Exit codes: 0 clean, 1 threats found, 2 error, 3 cancelled
 */

#include "Core/ScanEngine.h"
#include "Core/SignatureStore.h"
#include "Core/EngineConfig.h"
#include "Core/ScanEvents.h"
#include "Platform/PlatformProbe.h"
#include "Security/ThreatRemover.h"
#include "Security/Quarantine.h"
#include "Utils/Logger.h"
#include "Utils/StringUtils.h"
#include <csignal>
#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <future>
#include <exception>

namespace UnifiedScan {

    namespace {

        constexpr int EXIT_CLEAN = 0;
        constexpr int EXIT_THREATS = 1;
        constexpr int EXIT_FAILED = 2;
        constexpr int EXIT_CANCELLED = 3;

        std::atomic<bool> g_interrupted{ false };

        void HandleInterrupt(int) {
            g_interrupted.store(true);
        }

        std::string Narrow(const std::wstring& text) {
            return Utils::ToUtf8(text);
        }

    } // namespace

    struct CommandLineOptions {
        std::wstring configFile;
        std::wstring signatureFile;
        std::vector<std::wstring> roots;
        std::wstring quarantineDirectory;
        std::wstring logDirectory;
        bool removeThreats = false;
        bool verbose = false;
        bool showHelp = false;
    };

    class Application {
    public:
        int Run(const std::vector<std::wstring>& args);

    private:
        bool ParseArguments(const std::vector<std::wstring>& args, std::string& error);
        bool BuildConfig(EngineConfig& config);
        void InitializeLogging(const EngineConfig& config);
        bool LoadSignatures(const EngineConfig& config);
        ScanResult ExecuteScan(ScanEngine& engine);
        void PrintEvent(const ScanEvent& event, int& lastPercent);
        void PrintSummary(const ScanResult& result);
        bool RemoveThreats(const ScanResult& result, PlatformProbe& probe, const EngineConfig& config);
        int ShowHelp();

        CommandLineOptions m_options;
        SignatureStore m_signatures;
    };

    int Application::Run(const std::vector<std::wstring>& args) {
        std::string parseError;
        if (!ParseArguments(args, parseError)) {
            std::cerr << "[ERROR] " << parseError << std::endl;
            ShowHelp();
            return EXIT_FAILED;
        }
        if (m_options.showHelp) {
            return ShowHelp();
        }

        EngineConfig config;
        if (!BuildConfig(config)) {
            return EXIT_FAILED;
        }

        InitializeLogging(config);

        if (!LoadSignatures(config)) {
            return EXIT_FAILED;
        }

        std::unique_ptr<PlatformProbe> probe = CreatePlatformProbe(config.remediation.elevationTimeoutMs);

        ScanResult result;
        {
            ScanEngine engine(m_signatures, *probe, config);
            result = ExecuteScan(engine);
        }

        PrintSummary(result);

        if (result.error) {
            return EXIT_FAILED;
        }

        bool removalFailed = false;
        if (m_options.removeThreats && !result.threats.empty()) {
            removalFailed = !RemoveThreats(result, *probe, config);
        }

        if (result.cancelled) {
            return EXIT_CANCELLED;
        }
        if (result.threats.empty()) {
            return EXIT_CLEAN;
        }
        return (removalFailed || !m_options.removeThreats) ? EXIT_THREATS : EXIT_CLEAN;
    }

    bool Application::ParseArguments(const std::vector<std::wstring>& args, std::string& error) {
        for (size_t i = 0; i < args.size(); i++) {
            const std::wstring& arg = args[i];

            auto nextValue = [&](std::wstring& target) {
                if (i + 1 >= args.size()) {
                    error = "missing value for " + Narrow(arg);
                    return false;
                }
                target = args[++i];
                return true;
            };

            if (arg == L"--help" || arg == L"-h") {
                m_options.showHelp = true;
            } else if (arg == L"--config") {
                if (!nextValue(m_options.configFile)) return false;
            } else if (arg == L"--signatures") {
                if (!nextValue(m_options.signatureFile)) return false;
            } else if (arg == L"--path") {
                std::wstring root;
                if (!nextValue(root)) return false;
                m_options.roots.push_back(root);
            } else if (arg == L"--quarantine") {
                if (!nextValue(m_options.quarantineDirectory)) return false;
            } else if (arg == L"--log-dir") {
                if (!nextValue(m_options.logDirectory)) return false;
            } else if (arg == L"--remove") {
                m_options.removeThreats = true;
            } else if (arg == L"--verbose" || arg == L"-v") {
                m_options.verbose = true;
            } else {
                error = "unknown option " + Narrow(arg);
                return false;
            }
        }
        return true;
    }

    bool Application::BuildConfig(EngineConfig& config) {
        if (!m_options.configFile.empty()) {
            std::string error;
            if (!LoadEngineConfig(m_options.configFile, config, error)) {
                std::cerr << "[ERROR] " << Narrow(m_options.configFile) << ": " << error << std::endl;
                return false;
            }
        }

        // Command line wins over the file
        if (!m_options.signatureFile.empty()) config.signatureFile = m_options.signatureFile;
        if (!m_options.roots.empty()) config.scanRoots = m_options.roots;
        if (!m_options.logDirectory.empty()) config.logDirectory = m_options.logDirectory;
        if (!m_options.quarantineDirectory.empty()) {
            config.quarantineDirectory = m_options.quarantineDirectory;
            config.remediation.quarantineFiles = true;
        }
        if (m_options.verbose) config.logLevel = "trace";
        return true;
    }

    void Application::InitializeLogging(const EngineConfig& config) {
        LoggerConfig loggerConfig;
        loggerConfig.logDirectory = config.logDirectory;
        if (!Logger::ParseLevel(config.logLevel, loggerConfig.minLevel)) {
            std::cerr << "[WARNING] Unknown log level '" << config.logLevel << "', using info" << std::endl;
        }
        // Scan progress is printed by the CLI itself
        if (!m_options.verbose && loggerConfig.minLevel < LogLevel::WARNING && config.logDirectory.empty()) {
            loggerConfig.minLevel = LogLevel::WARNING;
        }
        Logger::GetInstance().Configure(loggerConfig);
    }

    bool Application::LoadSignatures(const EngineConfig& config) {
        m_signatures.LoadDefaults();

        if (!config.signatureFile.empty()) {
            SignatureLoadStats stats;
            if (!m_signatures.LoadFromFile(config.signatureFile, &stats)) {
                std::cerr << "[ERROR] Cannot open signature file " << Narrow(config.signatureFile) << std::endl;
                return false;
            }
            std::cout << "Loaded " << stats.loaded << " signatures from " << Narrow(config.signatureFile);
            if (stats.rejected > 0) std::cout << " (" << stats.rejected << " rejected)";
            std::cout << std::endl;
        }

        std::cout << "Signatures: " << m_signatures.GetSignatureCount() << " patterns, "
            << m_signatures.GetHashCount() << " hashes" << std::endl;
        return true;
    }

    ScanResult Application::ExecuteScan(ScanEngine& engine) {
        auto queue = std::make_shared<ScanEventQueue>();
        std::future<ScanResult> handle;

        if (engine.StartScan(queue, handle) != ScanStartStatus::STARTED) {
            ScanResult busy;
            busy.error = "Scan already in progress";
            return busy;
        }

        g_interrupted.store(false);
        std::signal(SIGINT, HandleInterrupt);

        int lastPercent = -1;
        bool cancelRequested = false;
        while (handle.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
            if (g_interrupted.load() && !cancelRequested) {
                std::cout << std::endl << "Cancelling..." << std::endl;
                engine.CancelScan();
                cancelRequested = true;
            }

            queue->WaitForEvents(std::chrono::milliseconds(100));
            for (const auto& event : queue->Drain()) {
                PrintEvent(event, lastPercent);
            }
        }

        for (const auto& event : queue->Drain()) {
            PrintEvent(event, lastPercent);
        }
        std::signal(SIGINT, SIG_DFL);

        return handle.get();
    }

    void Application::PrintEvent(const ScanEvent& event, int& lastPercent) {
        switch (event.type) {
        case ScanEventType::PROGRESS:
            // File progress floods the console; only show phase changes unless verbose
            if (m_options.verbose || event.percent != lastPercent ||
                !Utils::StartsWith(event.text, L"Scanning: ")) {
                std::cout << "[" << event.percent << "%] " << Narrow(event.text) << std::endl;
            }
            lastPercent = event.percent;
            break;
        case ScanEventType::THREAT_FOUND:
            std::cout << "  ! " << Narrow(ToString(event.threat.severity)) << " "
                << Narrow(ToString(event.threat.category)) << ": " << Narrow(event.threat.name)
                << " (" << Narrow(event.threat.location) << ")" << std::endl;
            break;
        case ScanEventType::FILES_SCANNED:
        case ScanEventType::CURRENT_FILE:
            break;
        }
    }

    void Application::PrintSummary(const ScanResult& result) {
        std::cout << std::endl << "========================================" << std::endl;
        if (result.error) {
            std::cout << "Scan failed: " << *result.error << std::endl;
        } else if (result.cancelled) {
            std::cout << "Scan cancelled" << std::endl;
        } else {
            std::cout << "Scan completed" << std::endl;
        }
        std::cout << "Files scanned:  " << Narrow(Utils::FormatCount(result.filesScanned)) << std::endl;
        std::cout << "Duration:       " << Narrow(FormatDuration(result.duration)) << std::endl;
        std::cout << "Threats found:  " << result.ThreatsFound() << std::endl;
        std::cout << "  Critical: " << result.CriticalCount() << "  High: " << result.HighCount()
            << "  Medium: " << result.MediumCount() << "  Low: " << result.LowCount() << std::endl;
        std::cout << "========================================" << std::endl;

        for (const auto& threat : result.threats) {
            std::cout << Narrow(ToString(threat.severity)) << "\t" << Narrow(ToString(threat.category))
                << "\t" << Narrow(threat.name) << "\t" << Narrow(threat.location);
            if (!threat.details.empty()) std::cout << "\t" << Narrow(threat.details);
            std::cout << std::endl;
        }
    }

    bool Application::RemoveThreats(const ScanResult& result, PlatformProbe& probe, const EngineConfig& config) {
        std::unique_ptr<QuarantineManager> quarantine;
        if (config.remediation.quarantineFiles && !config.quarantineDirectory.empty()) {
            quarantine = std::make_unique<QuarantineManager>(probe);
            QuarantineConfig quarantineConfig;
            quarantineConfig.quarantineRoot = config.quarantineDirectory;
            if (!quarantine->Initialize(quarantineConfig)) {
                std::cerr << "[ERROR] Cannot open quarantine directory "
                    << Narrow(config.quarantineDirectory) << std::endl;
                return false;
            }
        }

        ThreatRemover remover(probe, config.remediation, quarantine.get());

        std::cout << std::endl << "Removing threats..." << std::endl;
        size_t removed = 0;
        size_t skipped = 0;
        size_t failed = 0;
        for (const auto& threat : result.threats) {
            RemovalResult removal = remover.RemoveThreat(threat);
            const char* tag = removal.success ? "[OK]     " : (removal.isProtectedSystem ? "[SKIP]   " : "[FAILED] ");
            std::cout << tag << Narrow(threat.name) << ": " << Narrow(removal.message) << std::endl;

            if (removal.success) removed++;
            else if (removal.isProtectedSystem) skipped++;
            else failed++;
        }

        std::cout << "Removed " << removed << ", skipped " << skipped << " protected, "
            << failed << " failed" << std::endl;
        return failed == 0;
    }

    int Application::ShowHelp() {
        std::cout <<
            "UnifiedScan - threat scanner and remover\n"
            "\n"
            "Usage: unifiedscan [options]\n"
            "\n"
            "Options:\n"
            "  --config FILE        INI configuration file\n"
            "  --signatures FILE    extra signature definitions\n"
            "  --path DIR           scan DIR instead of every fixed volume (repeatable)\n"
            "  --remove             remove the threats found\n"
            "  --quarantine DIR     quarantine removed files into DIR instead of deleting them\n"
            "  --log-dir DIR        write a daily log file into DIR\n"
            "  --verbose, -v        trace logging and per-file progress\n"
            "  --help, -h           show this help\n"
            "\n"
            "Exit codes: 0 clean, 1 threats found, 2 error, 3 cancelled\n";
        return EXIT_CLEAN;
    }

} // namespace UnifiedScan

#ifdef _WIN32
int wmain(int argc, wchar_t* argv[]) {
    std::vector<std::wstring> args(argv + 1, argv + argc);
#else
int main(int argc, char* argv[]) {
    std::vector<std::wstring> args;
    for (int i = 1; i < argc; i++) {
        args.push_back(UnifiedScan::Utils::FromUtf8(argv[i]));
    }
#endif

    try {
        UnifiedScan::Application application;
        return application.Run(args);
    }
    catch (const std::exception& e) {
        std::cerr << "[CRITICAL] " << e.what() << std::endl;
        return 2;
    }
}
