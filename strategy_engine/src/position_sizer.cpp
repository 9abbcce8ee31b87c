#include "position_sizer.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm> // For std::min
#include <set>

namespace strategy_engine {

PositionSizer::PositionSizer(core::config::SizingConfig config)
    : config_(std::move(config))
{}

double PositionSizer::stepNotional(double strength, double entry_cap) const {
    double fraction = config_.entry_size_floor + (1.0 - config_.entry_size_floor) * core::utils::clamp01(strength);
    return std::min(entry_cap * fraction, entry_cap);
}

std::vector<core::PositionDelta> PositionSizer::propose(const std::vector<core::Signal>& signals,
                                                        const core::ExposureView& exposure) const
{
    auto logger = core::logging::getLogger();
    std::vector<core::PositionDelta> deltas;
    std::set<std::string> signalled;

    for (const auto& signal : signals) {
        signalled.insert(signal.asset);

        double current = 0.0;
        auto it = exposure.positions.find(signal.asset);
        if (it != exposure.positions.end()) {
            current = it->second.current_notional;
        }

        core::PositionDelta delta;
        delta.asset = signal.asset;
        delta.strength_score = signal.strength_score;

        double step = stepNotional(signal.strength_score, exposure.entry_notional_cap);
        if (current <= core::kNotionalEpsilon) {
            delta.reason = core::DeltaReason::NewSignal;
            delta.target_change_notional = step;
            delta.note = fmt::format("entry at {:.1f}% of entry cap", 100.0 * step / std::max(exposure.entry_notional_cap, core::kNotionalEpsilon));
        } else if (current < exposure.max_notional_cap - core::kNotionalEpsilon) {
            double room = exposure.max_notional_cap - current;
            delta.reason = core::DeltaReason::ScaleUp;
            delta.target_change_notional = std::min(step, room);
            delta.note = fmt::format("scale up from {:.2f}", current);
        } else {
            logger->debug("Sizer: {} already at max cap ({:.2f}), no delta", signal.asset, current);
            continue;
        }

        if (delta.target_change_notional < config_.min_order_notional) {
            logger->debug("Sizer: {} {} of {:.2f} below min order notional {:.2f}, skipped",
                          delta.asset, core::toString(delta.reason), delta.target_change_notional, config_.min_order_notional);
            continue;
        }
        logger->debug("Sizer: {} {} {:+.2f}", delta.asset, core::toString(delta.reason), delta.target_change_notional);
        deltas.push_back(std::move(delta));
    }

    // Signal decay: unwind anything held that is no longer a candidate
    for (const auto& entry : exposure.positions) {
        const core::PositionState& position = entry.second;
        if (position.current_notional <= core::kNotionalEpsilon) continue;
        if (signalled.count(entry.first) > 0) continue;

        if (position.current_notional < config_.min_order_notional) {
            logger->debug("Sizer: {} residual {:.2f} below min order notional, not unwound", entry.first, position.current_notional);
            continue;
        }

        core::PositionDelta delta;
        delta.asset = entry.first;
        delta.reason = core::DeltaReason::ScaleDown;
        delta.target_change_notional = -position.current_notional;
        delta.note = "signal decayed";
        logger->debug("Sizer: {} SCALE_DOWN {:+.2f} (no longer signalled)", delta.asset, delta.target_change_notional);
        deltas.push_back(std::move(delta));
    }

    logger->info("Position sizer: {} signals -> {} deltas", signals.size(), deltas.size());
    return deltas;
}

} // namespace strategy_engine
