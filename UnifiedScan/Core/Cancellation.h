/**
 * Cancellation.h - Cooperative cancellation flag shared by the scan worker
 * and the caller that requests a stop.
 */

#pragma once

#include <atomic>

namespace UnifiedScan {

    class CancellationToken {
    public:
        void Cancel() { m_cancelled.store(true); }
        void Reset() { m_cancelled.store(false); }
        bool IsCancellationRequested() const { return m_cancelled.load(); }

    private:
        std::atomic<bool> m_cancelled{ false };
    };

    // Result of one scan phase. Cancellation unwinds through this, not through exceptions.
    enum class PhaseOutcome { COMPLETED, CANCELLED };

} // namespace UnifiedScan
