#pragma once

#include "interfaces.hpp"
#include "datatypes.hpp"
#include <string>

namespace strategy_engine {

    // Rejects one track entirely (policy: never short DeFi)
    class TrackExclusionFilter : public IFactorFilter {
    public:
        explicit TrackExclusionFilter(core::TrackTag excluded);
        ~TrackExclusionFilter() override = default;

        bool accept(const core::FactorRecord& record) const override;
        std::string describe() const override;

    private:
        core::TrackTag excluded_;
    };

    // Rejects assets with unlock_progress_ratio above the threshold
    class UnlockThresholdFilter : public IFactorFilter {
    public:
        explicit UnlockThresholdFilter(double threshold);
        ~UnlockThresholdFilter() override = default;

        bool accept(const core::FactorRecord& record) const override;
        std::string describe() const override;

    private:
        double threshold_;
    };

    // Rejects assets below a liquidity tier (tier 0 = illiquid)
    class MinLiquidityTierFilter : public IFactorFilter {
    public:
        explicit MinLiquidityTierFilter(int min_tier);
        ~MinLiquidityTierFilter() override = default;

        bool accept(const core::FactorRecord& record) const override;
        std::string describe() const override;

    private:
        int min_tier_;
    };

} // namespace strategy_engine
