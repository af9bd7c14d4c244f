/**
 * ProgressThrottle.cpp - Time based telemetry throttle
 */

#include "ProgressThrottle.h"

namespace UnifiedScan {

    ProgressThrottle::ProgressThrottle(std::chrono::milliseconds interval, uint64_t immediateReportFiles)
        : m_interval(interval)
        , m_immediateReportFiles(immediateReportFiles) {
    }

    bool ProgressThrottle::ShouldReport(uint64_t filesScanned, Clock::time_point now) {
        if (filesScanned <= m_immediateReportFiles ||
            !m_hasReported ||
            now - m_lastReport >= m_interval) {
            m_lastReport = now;
            m_hasReported = true;
            return true;
        }
        return false;
    }

    void ProgressThrottle::Reset() {
        m_hasReported = false;
        m_lastReport = Clock::time_point{};
    }

} // namespace UnifiedScan
