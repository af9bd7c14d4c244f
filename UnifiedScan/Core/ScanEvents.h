/**
 * ScanEvents.h
 *
 * Notifications emitted by the scan worker.
 *
 * Every sink method is called on the worker thread and must return
 * quickly. ScanEventQueue is the default sink: the worker pushes, the
 * consumer thread drains at its own pace.
 */

#pragma once

#include "ThreatTypes.h"
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>

namespace UnifiedScan {

    class ScanEventSink {
    public:
        virtual ~ScanEventSink() = default;

        virtual void OnProgress(const std::wstring& message, int percent) = 0;
        virtual void OnThreatFound(const Threat& threat) = 0;
        virtual void OnFilesScannedChanged(uint64_t filesScanned) = 0;
        virtual void OnCurrentFileChanged(const std::wstring& path) = 0;
    };

    enum class ScanEventType { PROGRESS, THREAT_FOUND, FILES_SCANNED, CURRENT_FILE };

    struct ScanEvent {
        ScanEventType type = ScanEventType::PROGRESS;
        std::wstring text;          // progress message or current file
        int percent = 0;
        uint64_t filesScanned = 0;
        Threat threat;
    };

    class ScanEventQueue : public ScanEventSink {
    public:
        void OnProgress(const std::wstring& message, int percent) override;
        void OnThreatFound(const Threat& threat) override;
        void OnFilesScannedChanged(uint64_t filesScanned) override;
        void OnCurrentFileChanged(const std::wstring& path) override;

        // Removes and returns everything queued so far, oldest first
        std::vector<ScanEvent> Drain();

        // @return true if at least one event is queued when the call returns
        bool WaitForEvents(std::chrono::milliseconds timeout);

        size_t Size() const;

    private:
        void Push(ScanEvent event);

        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::deque<ScanEvent> m_events;
    };

    // Forwards to optional callbacks; unset callbacks are ignored
    class CallbackEventSink : public ScanEventSink {
    public:
        std::function<void(const std::wstring&, int)> onProgress;
        std::function<void(const Threat&)> onThreatFound;
        std::function<void(uint64_t)> onFilesScannedChanged;
        std::function<void(const std::wstring&)> onCurrentFileChanged;

        void OnProgress(const std::wstring& message, int percent) override;
        void OnThreatFound(const Threat& threat) override;
        void OnFilesScannedChanged(uint64_t filesScanned) override;
        void OnCurrentFileChanged(const std::wstring& path) override;
    };

} // namespace UnifiedScan
