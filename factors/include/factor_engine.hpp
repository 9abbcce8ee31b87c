#pragma once

#include <string>
#include <vector>
#include <optional>
#include "datatypes.hpp"
#include "diagnostics.hpp"
#include "config.hpp"

namespace factors {

    struct FactorEngineResult {
        std::vector<core::FactorRecord> records; // Ordered by asset symbol
        core::Diagnostics diagnostics;           // One DATA_GAP entry per dropped asset
        std::size_t funding_excluded = 0;        // Assets failing the funding gate
    };

    // Turns one MarketSnapshot into FactorRecords.
    // Pure: no I/O, no state beyond the static config.
    class FactorEngine {
    public:
        explicit FactorEngine(core::config::FactorConfig config);

        FactorEngineResult compute(const core::MarketSnapshot& snapshot) const;

        // 0 when below the liquidity or market-cap floor, otherwise 1..3 by 24h volume
        int liquidityTier(double volume_24h, double market_cap) const;

        // Peak rate of change over the window, normalized by pump_reference_gain, in [0,1]
        double pumpScore(const std::vector<double>& recent_prices) const;

        core::TrackTag classify(const std::string& asset) const;

    private:
        // Empty optional when the asset is dropped; reason appended to diagnostics
        std::optional<core::FactorRecord> buildRecord(const std::string& asset,
                                                      const core::MarketQuote& quote,
                                                      core::Timestamp cycle_timestamp,
                                                      core::Diagnostics& diagnostics,
                                                      bool& funding_excluded) const;

        core::config::FactorConfig config_;
    };

} // namespace factors
