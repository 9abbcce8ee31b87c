#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include <vector>

namespace strategy_engine {

    // --- PositionSizer ---
    // Maps ranked signals to notional deltas against a read-only exposure copy.
    // Advisory only: the risk manager has the final say.
    class PositionSizer {
    public:
        explicit PositionSizer(core::config::SizingConfig config);

        // Signal deltas in rank order, followed by SCALE_DOWN for held assets
        // that dropped out of the signal list (in symbol order).
        std::vector<core::PositionDelta> propose(const std::vector<core::Signal>& signals,
                                                 const core::ExposureView& exposure) const;

        // entry_cap * (floor + (1 - floor) * strength), never above entry_cap
        double stepNotional(double strength, double entry_cap) const;

    private:
        core::config::SizingConfig config_;
    };

} // namespace strategy_engine
