#pragma once

#include "datatypes.hpp"
#include "diagnostics.hpp"
#include <cstddef>
#include <string>

namespace core {

    enum class CycleStatus {
        Completed,
        Aborted // Snapshot unavailable or risk store corrupted
    };

    const char* toString(CycleStatus status);

    // Outcome of one coordinator pass; read by storage and the dashboard
    struct CycleSummary {
        Timestamp cycle_timestamp;
        Timestamp finished_time;
        CycleStatus status = CycleStatus::Completed;
        std::string abort_reason;

        std::size_t snapshot_assets = 0;
        std::size_t factor_records = 0;
        std::size_t funding_excluded = 0;
        std::size_t signals_emitted = 0;

        std::size_t forced_deltas = 0;
        std::size_t deltas_proposed = 0;  // Forced + sizer deltas
        std::size_t deltas_approved = 0;
        std::size_t deltas_clamped = 0;
        std::size_t deltas_rejected = 0;
        std::size_t deltas_skipped = 0;   // Sizer deltas superseded by a forced delta

        std::size_t orders_submitted = 0;
        std::size_t orders_filled = 0;
        std::size_t orders_failed = 0;    // FAILED or REJECTED
        std::size_t orders_inflight = 0;  // Still running at the cycle deadline

        double equity = 0.0;
        double total_exposure = 0.0;
        double unrealized_pnl = 0.0;
        double realized_pnl = 0.0;

        Diagnostics diagnostics;
    };

} // namespace core
