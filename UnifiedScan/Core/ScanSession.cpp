/**
 * ScanSession.cpp - Per-run counters, threat list and telemetry
 */

#include "ScanSession.h"
#include "../Utils/Logger.h"
#include <algorithm>

namespace UnifiedScan {

    ScanSession::ScanSession(const SignatureStore& signatures, PlatformProbe& probe, const EngineConfig& config,
        ScanEventSink* sink, const CancellationToken& cancellation)
        : m_signatures(signatures)
        , m_probe(probe)
        , m_config(config)
        , m_sink(sink)
        , m_cancellation(cancellation)
        , m_throttle(std::chrono::milliseconds(config.progress.reportIntervalMs),
            config.progress.immediateReportFiles) {
    }

    void ScanSession::AddThreat(Threat threat) {
        threat.detectedAt = std::chrono::system_clock::now();

        LogWarning("ScanSession", std::wstring(L"Threat found [") + ToString(threat.severity) + L"] " +
            threat.name + L" at " + threat.location);

        m_threats.push_back(std::move(threat));
        if (m_sink) m_sink->OnThreatFound(m_threats.back());
    }

    std::vector<Threat> ScanSession::TakeThreats() {
        std::vector<Threat> threats = std::move(m_threats);
        m_threats.clear();
        return threats;
    }

    void ScanSession::ReportProgress(const std::wstring& message, int percent) {
        percent = std::min(100, std::max(percent, m_lastPercent));
        m_lastPercent = percent;

        LogInfo("ScanSession", L"[" + std::to_wstring(percent) + L"%] " + message);
        if (m_sink) m_sink->OnProgress(message, percent);
    }

    void ScanSession::ReportFileProgress(const std::wstring& path, int percent) {
        if (!m_throttle.ShouldReport(m_filesScanned)) return;

        percent = std::min(100, std::max(percent, m_lastPercent));
        m_lastPercent = percent;

        if (m_sink) {
            m_sink->OnCurrentFileChanged(path);
            m_sink->OnFilesScannedChanged(m_filesScanned);
            m_sink->OnProgress(L"Scanning: " + path, percent);
        }
    }

    void ScanSession::PublishFilesScanned() {
        if (m_sink) m_sink->OnFilesScannedChanged(m_filesScanned);
    }

} // namespace UnifiedScan
