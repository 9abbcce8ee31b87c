#pragma once

#include "datatypes.hpp"
#include "cycle_summary.hpp"
#include <vector>

namespace data {

    // Append-only persistence for everything a cycle produces, keyed by cycle timestamp,
    // plus the latest position per asset. Methods return false on failure; callers log
    // and carry on.
    class IStorageSink {
    public:
        virtual ~IStorageSink() = default;

        virtual bool saveSnapshot(const core::MarketSnapshot& snapshot) = 0;
        virtual bool saveFactorRecords(const std::vector<core::FactorRecord>& records) = 0;
        virtual bool saveSignals(const std::vector<core::Signal>& signals) = 0;
        virtual bool saveOrderEvent(const core::Order& order) = 0; // Terminal orders only
        virtual bool saveCycleSummary(const core::CycleSummary& summary) = 0;
        virtual bool savePosition(const core::PositionState& position) = 0; // Replaces the asset's row
    };

} // namespace data
