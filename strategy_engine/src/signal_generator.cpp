#include "signal_generator.hpp"
#include "factor_filters.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm> // For std::sort
#include <memory>

namespace strategy_engine {

SignalGenerator::SignalGenerator(core::config::SignalConfig config)
    : config_(std::move(config))
{
    filters_.push_back(std::make_unique<TrackExclusionFilter>(core::TrackTag::DeFi));
    filters_.push_back(std::make_unique<UnlockThresholdFilter>(config_.unlock_threshold));
    filters_.push_back(std::make_unique<MinLiquidityTierFilter>(1));
    core::logging::getLogger()->debug("SignalGenerator created with {} filters.", filters_.size());
}

SignalGenerator::SignalGenerator(core::config::SignalConfig config, FilterList filters)
    : config_(std::move(config)), filters_(std::move(filters))
{}

double SignalGenerator::score(const core::FactorRecord& record) const {
    double weight_sum = config_.pump_score_weight + config_.liquidity_weight + config_.meme_weight;
    if (weight_sum <= 0.0) return 0.0;

    double meme = record.track_tag == core::TrackTag::Meme ? 1.0 : 0.0;
    double raw = config_.pump_score_weight * record.pump_score +
                 config_.liquidity_weight * (static_cast<double>(record.liquidity_tier) / 3.0) +
                 config_.meme_weight * meme;
    return core::utils::clamp01(raw / weight_sum);
}

bool SignalGenerator::ranksBefore(const core::Signal& a, const core::Signal& b) {
    if (a.strength_score != b.strength_score) return a.strength_score > b.strength_score;
    if (a.unlock_progress_ratio != b.unlock_progress_ratio) return a.unlock_progress_ratio < b.unlock_progress_ratio;
    return a.asset < b.asset;
}

std::vector<core::Signal> SignalGenerator::generate(const std::vector<core::FactorRecord>& records) const {
    auto logger = core::logging::getLogger();
    std::vector<core::Signal> signals;
    signals.reserve(records.size());

    for (const auto& record : records) {
        bool rejected = false;
        for (const auto& filter : filters_) {
            if (!filter) continue;
            if (!filter->accept(record)) {
                logger->debug("{} filtered out: fails '{}'", record.asset, filter->describe());
                rejected = true;
                break;
            }
        }
        if (rejected) continue;

        double strength = score(record);
        if (strength < config_.min_signal_strength) {
            logger->debug("{} filtered out: strength {:.4f} below {:.4f}", record.asset, strength, config_.min_signal_strength);
            continue;
        }

        core::Signal signal;
        signal.asset = record.asset;
        signal.direction = core::SignalDirection::Short;
        signal.strength_score = strength;
        signal.unlock_progress_ratio = record.unlock_progress_ratio;
        signal.cycle_timestamp = record.cycle_timestamp;
        signals.push_back(std::move(signal));
    }

    // Total order, so the result does not depend on input order
    std::sort(signals.begin(), signals.end(), &SignalGenerator::ranksBefore);

    logger->info("Signal generator: {} records -> {} SHORT candidates", records.size(), signals.size());
    for (std::size_t i = 0; i < signals.size(); ++i) {
        logger->debug("  #{} {} strength={:.4f} unlock={:.3f}", i + 1, signals[i].asset,
                      signals[i].strength_score, signals[i].unlock_progress_ratio);
    }
    return signals;
}

} // namespace strategy_engine
