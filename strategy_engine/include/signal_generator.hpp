#pragma once

#include "interfaces.hpp"
#include "datatypes.hpp"
#include "config.hpp"
#include <vector>

namespace strategy_engine {

    // --- SignalGenerator ---
    // Filters FactorRecords and ranks the survivors into SHORT candidates.
    // Output is recomputed from scratch every cycle.
    class SignalGenerator {
    public:
        // Builds the standard filter set: no DeFi, unlock <= threshold, tier >= 1
        explicit SignalGenerator(core::config::SignalConfig config);

        // Custom filter set, used by tests
        SignalGenerator(core::config::SignalConfig config, FilterList filters);

        std::vector<core::Signal> generate(const std::vector<core::FactorRecord>& records) const;

        // Weighted score in [0,1]
        double score(const core::FactorRecord& record) const;

        // Strength desc, then unlock_progress asc, then symbol asc
        static bool ranksBefore(const core::Signal& a, const core::Signal& b);

    private:
        core::config::SignalConfig config_;
        FilterList filters_;
    };

} // namespace strategy_engine
