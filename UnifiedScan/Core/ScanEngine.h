/**
 * ScanEngine.h
 *
 * Scan orchestrator.
 *
 * Responsibilities:
 * - Run the phases of a full scan in order on one worker thread:
 *   counting, processes, startup entries, browser extensions, file
 *   system, registry, scheduled tasks, finalizing
 * - Map the phases onto one monotonic percentage (100 only on completion)
 * - Allow a single scan at a time and cooperative cancellation
 * - Assemble the ScanResult, including partial results after
 *   cancellation or a fatal error
 *
 * The engine is an owned object: callers create one per signature store
 * and probe, and keep it alive while a scan started with StartScan runs.
 */

#pragma once

#include "ThreatTypes.h"
#include "EngineConfig.h"
#include "Cancellation.h"
#include "ScanEvents.h"
#include <string>
#include <memory>
#include <future>
#include <thread>
#include <mutex>
#include <atomic>

namespace UnifiedScan {

    class SignatureStore;
    class PlatformProbe;
    class ScanSession;
    class DomainScanner;

    enum class ScanState {
        IDLE,
        COUNTING,
        SCANNING_PROCESSES,
        SCANNING_STARTUP,
        SCANNING_BROWSER_EXTENSIONS,
        SCANNING_FILE_SYSTEM,
        SCANNING_REGISTRY,
        SCANNING_SCHEDULED_TASKS,
        FINALIZING,
        COMPLETED,
        CANCELLED,
        FAILED
    };

    enum class ScanStartStatus { STARTED, ALREADY_RUNNING };

    const wchar_t* ToString(ScanState state);

    class ScanEngine {
    public:
        ScanEngine(const SignatureStore& signatures, PlatformProbe& probe, EngineConfig config = EngineConfig());
        ~ScanEngine();

        ScanEngine(const ScanEngine&) = delete;
        ScanEngine& operator=(const ScanEngine&) = delete;

        /**
         * Starts a scan on the background worker.
         * @param sink receives the scan's events; may be null
         * @param handle becomes ready with the sealed ScanResult
         * @return ALREADY_RUNNING (handle untouched) if a scan is in flight
         */
        ScanStartStatus StartScan(std::shared_ptr<ScanEventSink> sink, std::future<ScanResult>& handle);

        // Runs a scan on the calling thread. A second concurrent call
        // returns at once with error "Scan already in progress".
        ScanResult RunScan(ScanEventSink* sink = nullptr);

        // No-op when no scan is running
        void CancelScan();

        bool IsScanning() const { return m_isScanning.load(); }
        ScanState GetState() const { return m_state.load(); }
        const EngineConfig& GetConfig() const { return m_config; }

    private:
        bool TryBeginScan();
        ScanResult Execute(ScanEventSink* sink);
        PhaseOutcome RunPhases(ScanSession& session);
        PhaseOutcome RunDomainPhase(ScanSession& session, ScanState state, DomainScanner& scanner,
            int percent, const std::wstring& message);
        void SetState(ScanState state);

        const SignatureStore& m_signatures;
        PlatformProbe& m_probe;
        EngineConfig m_config;

        std::atomic<bool> m_isScanning{ false };
        std::atomic<ScanState> m_state{ ScanState::IDLE };
        CancellationToken m_cancellation;
        std::mutex m_controlMutex;

        std::thread m_scanThread;
        std::mutex m_threadMutex;
    };

} // namespace UnifiedScan
