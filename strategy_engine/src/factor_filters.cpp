#include "factor_filters.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept> // For std::invalid_argument

namespace strategy_engine {

// --- TrackExclusionFilter ---
TrackExclusionFilter::TrackExclusionFilter(core::TrackTag excluded)
    : excluded_(excluded)
{}

bool TrackExclusionFilter::accept(const core::FactorRecord& record) const {
    return record.track_tag != excluded_;
}

std::string TrackExclusionFilter::describe() const {
    return fmt::format("track != {}", core::toString(excluded_));
}

// --- UnlockThresholdFilter ---
UnlockThresholdFilter::UnlockThresholdFilter(double threshold)
    : threshold_(threshold)
{
    if (threshold_ < 0.0 || threshold_ > 1.0) {
        throw std::invalid_argument("Unlock threshold must be within [0, 1].");
    }
}

bool UnlockThresholdFilter::accept(const core::FactorRecord& record) const {
    return record.unlock_progress_ratio <= threshold_;
}

std::string UnlockThresholdFilter::describe() const {
    return fmt::format("unlock_progress <= {:.3f}", threshold_);
}

// --- MinLiquidityTierFilter ---
MinLiquidityTierFilter::MinLiquidityTierFilter(int min_tier)
    : min_tier_(min_tier)
{
    if (min_tier_ < 0 || min_tier_ > 3) {
        throw std::invalid_argument("Liquidity tier must be within [0, 3].");
    }
}

bool MinLiquidityTierFilter::accept(const core::FactorRecord& record) const {
    return record.liquidity_tier >= min_tier_;
}

std::string MinLiquidityTierFilter::describe() const {
    return fmt::format("liquidity_tier >= {}", min_tier_);
}

} // namespace strategy_engine
