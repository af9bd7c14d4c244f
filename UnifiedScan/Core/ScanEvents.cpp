/**
 * ScanEvents.cpp - Event queue and callback adapters
 */

#include "ScanEvents.h"
#include <iterator>

namespace UnifiedScan {

    void ScanEventQueue::Push(ScanEvent event) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_events.push_back(std::move(event));
        }
        m_cv.notify_one();
    }

    void ScanEventQueue::OnProgress(const std::wstring& message, int percent) {
        ScanEvent event;
        event.type = ScanEventType::PROGRESS;
        event.text = message;
        event.percent = percent;
        Push(std::move(event));
    }

    void ScanEventQueue::OnThreatFound(const Threat& threat) {
        ScanEvent event;
        event.type = ScanEventType::THREAT_FOUND;
        event.threat = threat;
        Push(std::move(event));
    }

    void ScanEventQueue::OnFilesScannedChanged(uint64_t filesScanned) {
        ScanEvent event;
        event.type = ScanEventType::FILES_SCANNED;
        event.filesScanned = filesScanned;
        Push(std::move(event));
    }

    void ScanEventQueue::OnCurrentFileChanged(const std::wstring& path) {
        ScanEvent event;
        event.type = ScanEventType::CURRENT_FILE;
        event.text = path;
        Push(std::move(event));
    }

    std::vector<ScanEvent> ScanEventQueue::Drain() {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<ScanEvent> events(std::make_move_iterator(m_events.begin()),
            std::make_move_iterator(m_events.end()));
        m_events.clear();
        return events;
    }

    bool ScanEventQueue::WaitForEvents(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [this]() { return !m_events.empty(); });
    }

    size_t ScanEventQueue::Size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events.size();
    }

    void CallbackEventSink::OnProgress(const std::wstring& message, int percent) {
        if (onProgress) onProgress(message, percent);
    }

    void CallbackEventSink::OnThreatFound(const Threat& threat) {
        if (onThreatFound) onThreatFound(threat);
    }

    void CallbackEventSink::OnFilesScannedChanged(uint64_t filesScanned) {
        if (onFilesScannedChanged) onFilesScannedChanged(filesScanned);
    }

    void CallbackEventSink::OnCurrentFileChanged(const std::wstring& path) {
        if (onCurrentFileChanged) onCurrentFileChanged(path);
    }

} // namespace UnifiedScan
