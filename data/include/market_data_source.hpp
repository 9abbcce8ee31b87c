#pragma once

#include "datatypes.hpp"

namespace data {

    // Produces one MarketSnapshot per cycle.
    // Throws core::SnapshotUnavailableException when nothing usable could be fetched;
    // per-asset gaps are left as empty optionals for the factor engine to report.
    class IMarketDataSource {
    public:
        virtual ~IMarketDataSource() = default;
        virtual core::MarketSnapshot getSnapshot(core::Timestamp cycle_timestamp) = 0;
    };

} // namespace data
