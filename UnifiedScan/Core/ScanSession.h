/**
 * ScanSession.h
 *
 * Mutable state of one scan run, shared by the phases that make it up.
 *
 * A session is owned by ScanEngine for the duration of RunScan and only
 * touched from the scan worker, so the counters need no locking. The
 * cancellation token is the one member another thread writes to.
 */

#pragma once

#include "ThreatTypes.h"
#include "ScanEvents.h"
#include "Cancellation.h"
#include "ProgressThrottle.h"
#include "EngineConfig.h"
#include <string>
#include <vector>
#include <stdexcept>

namespace UnifiedScan {

    // Raised inside a run when nothing useful can be scanned; ScanEngine
    // turns it into ScanResult::error
    class ScanFailure : public std::runtime_error {
    public:
        explicit ScanFailure(const std::string& message) : std::runtime_error(message) {}
    };

    class SignatureStore;
    class PlatformProbe;

    class ScanSession {
    public:
        ScanSession(const SignatureStore& signatures, PlatformProbe& probe, const EngineConfig& config,
            ScanEventSink* sink, const CancellationToken& cancellation);

        ScanSession(const ScanSession&) = delete;
        ScanSession& operator=(const ScanSession&) = delete;

        const SignatureStore& Signatures() const { return m_signatures; }
        PlatformProbe& Probe() { return m_probe; }
        const EngineConfig& Config() const { return m_config; }

        bool IsCancelled() const { return m_cancellation.IsCancellationRequested(); }

        // Appends to the result and notifies the sink
        void AddThreat(Threat threat);
        const std::vector<Threat>& Threats() const { return m_threats; }
        std::vector<Threat> TakeThreats();

        uint64_t IncrementFilesScanned() { return ++m_filesScanned; }
        uint64_t FilesScanned() const { return m_filesScanned; }

        void SetTotalFilesEstimated(uint64_t total) { m_totalFilesEstimated = total; }
        uint64_t TotalFilesEstimated() const { return m_totalFilesEstimated; }

        /**
         * Emits a progress notification. The percent is clamped so it
         * never drops below the last value reported in this session.
         */
        void ReportProgress(const std::wstring& message, int percent);
        int LastPercent() const { return m_lastPercent; }

        // Throttled per-file telemetry: current file, count and percent
        void ReportFileProgress(const std::wstring& path, int percent);

        void PublishFilesScanned();

    private:
        const SignatureStore& m_signatures;
        PlatformProbe& m_probe;
        const EngineConfig& m_config;
        ScanEventSink* m_sink;
        const CancellationToken& m_cancellation;

        ProgressThrottle m_throttle;
        std::vector<Threat> m_threats;
        uint64_t m_filesScanned = 0;
        uint64_t m_totalFilesEstimated = 0;
        int m_lastPercent = 0;
    };

} // namespace UnifiedScan
