/**
 * ProgressThrottle.h
 *
 * Rate limiter for per-file telemetry. A report is allowed when the
 * configured interval has elapsed since the last allowed report, or
 * unconditionally while the run has seen no more than
 * immediateReportFiles files.
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace UnifiedScan {

    class ProgressThrottle {
    public:
        using Clock = std::chrono::steady_clock;

        ProgressThrottle(std::chrono::milliseconds interval, uint64_t immediateReportFiles);

        bool ShouldReport(uint64_t filesScanned, Clock::time_point now);
        bool ShouldReport(uint64_t filesScanned) { return ShouldReport(filesScanned, Clock::now()); }

        void Reset();

    private:
        std::chrono::milliseconds m_interval;
        uint64_t m_immediateReportFiles;
        Clock::time_point m_lastReport;
        bool m_hasReported = false;
    };

} // namespace UnifiedScan
