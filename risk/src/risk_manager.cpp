#include "risk_manager.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm> // For std::min, std::max
#include <cmath>     // For std::isfinite, std::fabs

namespace risk {

    const char* toString(RejectReason reason) {
        switch (reason) {
            case RejectReason::CapExceeded:              return "CAP_EXCEEDED";
            case RejectReason::ConflictingInflightOrder: return "CONFLICTING_INFLIGHT_ORDER";
            case RejectReason::PortfolioCeiling:         return "PORTFOLIO_CEILING";
            case RejectReason::NothingToReduce:          return "NOTHING_TO_REDUCE";
            case RejectReason::BelowMinNotional:         return "BELOW_MIN_NOTIONAL";
            default:                                     return "UNKNOWN";
        }
    }

    RiskManager::RiskManager(core::config::RiskConfig config)
        : config_(std::move(config)), equity_(config_.portfolio_equity)
    {
        if (!(equity_ > 0.0)) {
            throw core::ConfigException("RiskManager requires positive portfolio equity.");
        }
        core::logging::getLogger()->info("RiskManager initialized: equity={:.2f}, entry cap={:.2f}, max cap={:.2f}, ceiling={:.2f}",
                                         equity_, equity_ * config_.entry_cap_pct, equity_ * config_.max_cap_pct,
                                         equity_ * config_.portfolio_ceiling_pct);
    }

    // --- Caps & equity ---

    void RiskManager::setEquity(double equity) {
        if (!std::isfinite(equity) || equity <= 0.0) {
            core::logging::getLogger()->warn("Ignoring invalid equity update: {}", equity);
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::fabs(equity - equity_) > core::kNotionalEpsilon) {
            core::logging::getLogger()->info("Portfolio equity updated: {:.2f} -> {:.2f}", equity_, equity);
        }
        equity_ = equity;
    }

    double RiskManager::equity() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return equity_;
    }

    double RiskManager::entryNotionalCap() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return equity_ * config_.entry_cap_pct;
    }

    double RiskManager::maxNotionalCap() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return equity_ * config_.max_cap_pct;
    }

    double RiskManager::totalNotional() const {
        double total = 0.0;
        for (const auto& entry : positions_) total += entry.second.current_notional;
        return total;
    }

    double RiskManager::reservedNotional() const {
        double total = 0.0;
        for (const auto& entry : inflight_) total += entry.second.increase_notional;
        return total;
    }

    // --- Validation ---

    ValidationResult RiskManager::reject(const core::PositionDelta& delta, RejectReason reason, std::string detail) const {
        core::logging::getLogger()->warn("Risk rejected {} {} {:+.2f}: {} ({})", delta.asset, core::toString(delta.reason),
                                         delta.target_change_notional, toString(reason), detail);
        ValidationResult result;
        result.rejection = Rejection{reason, std::move(detail)};
        return result;
    }

    ValidationResult RiskManager::validate(const core::PositionDelta& delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (corrupted_) {
            throw core::RiskStateException("Risk store corrupted: " + corruption_detail_);
        }

        const double requested = delta.target_change_notional;
        if (!std::isfinite(requested) || std::fabs(requested) <= core::kNotionalEpsilon) {
            return reject(delta, RejectReason::BelowMinNotional, "zero or non-finite change");
        }
        if (inflight_.count(delta.asset) > 0) {
            return reject(delta, RejectReason::ConflictingInflightOrder, "asset already has an order in flight");
        }

        double current = 0.0;
        double quantity = 0.0;
        double avg_entry = 0.0;
        auto pos_it = positions_.find(delta.asset);
        if (pos_it != positions_.end()) {
            current = pos_it->second.current_notional;
            quantity = pos_it->second.quantity;
            avg_entry = pos_it->second.average_entry_price;
        }

        const double entry_cap = equity_ * config_.entry_cap_pct;
        const double max_cap = equity_ * config_.max_cap_pct;

        ApprovedDelta approved;
        approved.delta = delta;

        if (requested > 0.0) {
            double amount = requested;

            // Per-asset caps
            if (delta.reason == core::DeltaReason::NewSignal || current <= core::kNotionalEpsilon) {
                if (current + amount > entry_cap + core::kNotionalEpsilon) {
                    return reject(delta, RejectReason::CapExceeded,
                                  fmt::format("entry would reach {:.2f} above entry cap {:.2f}", current + amount, entry_cap));
                }
            } else {
                double room = max_cap - current;
                if (room < config_.min_order_notional || room <= core::kNotionalEpsilon) {
                    return reject(delta, RejectReason::CapExceeded,
                                  fmt::format("exposure {:.2f} leaves {:.2f} under max cap {:.2f}", current, room, max_cap));
                }
                // A clamped increase stops short of the cap so fill slippage cannot push it over
                double clamped_room = max_cap * (1.0 - config_.fill_slippage_buffer_pct) - current;
                if (amount > clamped_room + core::kNotionalEpsilon) {
                    amount = std::max(clamped_room, 0.0);
                    approved.clamped = true;
                    approved.clamp_reason = RejectReason::CapExceeded;
                }
            }

            // Portfolio-wide ceiling, counting increases still in flight
            double headroom = equity_ * config_.portfolio_ceiling_pct - totalNotional() - reservedNotional();
            if (headroom < config_.min_order_notional || headroom <= core::kNotionalEpsilon) {
                return reject(delta, RejectReason::PortfolioCeiling,
                              fmt::format("portfolio headroom {:.2f} below min order notional", std::max(headroom, 0.0)));
            }
            if (amount > headroom + core::kNotionalEpsilon) {
                amount = headroom;
                approved.clamped = true;
                approved.clamp_reason = RejectReason::PortfolioCeiling;
            }

            if (amount < config_.min_order_notional) {
                return reject(delta, RejectReason::BelowMinNotional,
                              fmt::format("{:.2f} below min order notional {:.2f}", amount, config_.min_order_notional));
            }

            approved.approved_change_notional = amount;
            approved.order_notional = amount;
            approved.side = core::OrderSide::Sell;
            inflight_[delta.asset] = Reservation{amount, max_cap, false};
        } else {
            if (current <= core::kNotionalEpsilon || quantity <= 0.0) {
                return reject(delta, RejectReason::NothingToReduce, "no exposure held");
            }
            double amount = -requested;
            if (amount > current + core::kNotionalEpsilon) {
                amount = current;
                approved.clamped = true;
            }
            bool full_unwind = amount >= current - core::kNotionalEpsilon;
            double cover_quantity = full_unwind ? quantity : quantity * (amount / current);

            double price = avg_entry;
            auto mark_it = marks_.find(delta.asset);
            if (mark_it != marks_.end()) price = mark_it->second;
            double order_notional = cover_quantity * price;

            // Dust is allowed through only when it closes the position
            if (!full_unwind && order_notional < config_.min_order_notional - core::kNotionalEpsilon) {
                return reject(delta, RejectReason::BelowMinNotional,
                              fmt::format("reduction of {:.2f} below min order notional {:.2f}", order_notional, config_.min_order_notional));
            }

            approved.approved_change_notional = full_unwind ? -current : -amount;
            approved.order_notional = order_notional;
            approved.side = core::OrderSide::Buy;
            inflight_[delta.asset] = Reservation{0.0, max_cap, full_unwind};
        }

        core::logging::getLogger()->debug("Risk approved {} {} {:+.2f} (order {} {:.2f}{})", delta.asset,
                                          core::toString(delta.reason), approved.approved_change_notional,
                                          core::toString(approved.side), approved.order_notional,
                                          approved.clamped ? ", clamped" : "");
        ValidationResult result;
        result.approved = std::move(approved);
        return result;
    }

    void RiskManager::releaseLock(const std::string& asset) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inflight_.erase(asset) > 0) {
            core::logging::getLogger()->debug("In-flight lock for {} released without an order.", asset);
        }
    }

    // --- PnL monitoring ---

    std::vector<core::PositionDelta> RiskManager::evaluatePnl() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto logger = core::logging::getLogger();
        std::vector<core::PositionDelta> forced;
        const double max_cap = equity_ * config_.max_cap_pct;

        for (const auto& entry : positions_) {
            const core::PositionState view = decorate(entry.second);
            if (view.current_notional <= core::kNotionalEpsilon) continue;
            if (view.has_inflight_order) {
                logger->trace("PnL check skipped for {}: order in flight", view.asset);
                continue;
            }
            if (marks_.count(view.asset) == 0) {
                logger->debug("PnL check skipped for {}: no mark price", view.asset);
                continue;
            }

            double pnl_ratio = view.unrealized_pnl / view.current_notional;
            core::PositionDelta delta;
            delta.asset = view.asset;
            delta.reason = core::DeltaReason::RiskForced;

            if (pnl_ratio <= -config_.stop_loss_threshold) {
                delta.target_change_notional = -view.current_notional;
                delta.note = fmt::format("stop loss at {:.2f}% PnL, full unwind", 100.0 * pnl_ratio);
            } else if (view.current_notional >= config_.near_cap_ratio * max_cap &&
                       (pnl_ratio <= -config_.reduce_loss_threshold || pnl_ratio >= config_.reduce_profit_threshold)) {
                delta.target_change_notional = -view.current_notional * config_.reduce_position_ratio;
                delta.note = fmt::format("near cap with {:.2f}% PnL, reduce {:.0f}%", 100.0 * pnl_ratio,
                                         100.0 * config_.reduce_position_ratio);
            } else if (view.current_notional > max_cap + core::kNotionalEpsilon) {
                // Trim at least one minimum order at the mark so the cover is tradable
                double excess = view.current_notional - max_cap;
                double min_trim = config_.min_order_notional * view.average_entry_price / marks_.at(view.asset);
                delta.target_change_notional = -std::min(view.current_notional, std::max(excess, min_trim));
                delta.note = fmt::format("exposure {:.2f} above max cap {:.2f}, trim", view.current_notional, max_cap);
            } else {
                continue;
            }

            logger->warn("RISK_FORCED {}: {:+.2f} ({})", delta.asset, delta.target_change_notional, delta.note);
            forced.push_back(std::move(delta));
        }
        return forced;
    }

    // --- Commit ---

    void RiskManager::markCorrupted(const std::string& detail) {
        corrupted_ = true;
        corruption_detail_ = detail;
        core::logging::getLogger()->critical("Risk store marked corrupted: {}", detail);
    }

    void RiskManager::commit(const core::Order& order) {
        if (!core::isTerminal(order.status)) {
            throw core::RiskStateException(fmt::format("commit called with non-terminal order {} ({})",
                                                       order.id, core::toString(order.status)));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto logger = core::logging::getLogger();

        auto lock_it = inflight_.find(order.asset);
        if (lock_it == inflight_.end()) {
            markCorrupted(fmt::format("commit for {} (order {}) without an in-flight lock", order.asset, order.id));
            return;
        }
        const Reservation reservation = lock_it->second;
        inflight_.erase(lock_it);

        if (order.filled_notional <= core::kNotionalEpsilon) {
            logger->info("Order {} for {} ended {} with no fill; exposure unchanged.", order.id, order.asset,
                         core::toString(order.status));
            return;
        }
        if (!std::isfinite(order.filled_notional) || !std::isfinite(order.average_fill_price) ||
            order.average_fill_price <= 0.0) {
            markCorrupted(fmt::format("order {} for {} has invalid fill: notional={}, price={}", order.id, order.asset,
                                      order.filled_notional, order.average_fill_price));
            return;
        }

        core::PositionState updated;
        auto pos_it = positions_.find(order.asset);
        if (pos_it != positions_.end()) updated = pos_it->second;
        updated.asset = order.asset;

        double fill_quantity = order.filled_notional / order.average_fill_price;
        if (order.side == core::OrderSide::Sell) {
            double new_quantity = updated.quantity + fill_quantity;
            updated.average_entry_price =
                (updated.quantity * updated.average_entry_price + fill_quantity * order.average_fill_price) / new_quantity;
            updated.quantity = new_quantity;
        } else {
            double cover = std::min(fill_quantity, updated.quantity);
            if (fill_quantity > updated.quantity * (1.0 + 1e-9) + 1e-12) {
                logger->warn("Order {} covered {:.8f} {} but only {:.8f} was short; excess ignored.",
                             order.id, fill_quantity, order.asset, updated.quantity);
            }
            updated.realized_pnl += cover * (updated.average_entry_price - order.average_fill_price);
            updated.quantity -= cover;

            // Covers are sized at the mark, so a full unwind can leave a sliver too small to trade
            double residual = updated.quantity * order.average_fill_price;
            if (reservation.full_unwind && updated.quantity > 0.0 && residual < config_.min_order_notional) {
                logger->warn("Order {} left {:.8f} {} short ({:.2f}) after a full unwind; closing it at the fill price.",
                             order.id, updated.quantity, order.asset, residual);
                updated.realized_pnl += updated.quantity * (updated.average_entry_price - order.average_fill_price);
                updated.quantity = 0.0;
            }
        }
        updated.current_notional = updated.quantity * updated.average_entry_price;
        if (updated.current_notional <= core::kNotionalEpsilon) {
            updated.quantity = 0.0;
            updated.current_notional = 0.0;
            updated.average_entry_price = 0.0;
        }
        updated.last_update_time = order.terminal_time;

        if (!std::isfinite(updated.current_notional) || !std::isfinite(updated.realized_pnl)) {
            markCorrupted(fmt::format("commit of order {} produced non-finite exposure for {}", order.id, order.asset));
            return;
        }
        // The exchange fill is authoritative; evaluatePnl() trims the excess
        if (order.side == core::OrderSide::Sell &&
            updated.current_notional > reservation.max_cap + core::kNotionalEpsilon) {
            logger->warn("Order {} filled {} to {:.2f}, above max cap {:.2f}", order.id, order.asset,
                         updated.current_notional, reservation.max_cap);
        }

        positions_[order.asset] = updated;
        logger->info("Committed {} {} {} {:.2f} @ {:.6f}: exposure {:.2f}, qty {:.8f}, realized {:.2f}",
                     order.id, order.asset, core::toString(order.side), order.filled_notional,
                     order.average_fill_price, updated.current_notional, updated.quantity, updated.realized_pnl);
    }

    void RiskManager::restorePositions(const std::map<std::string, core::PositionState>& stored) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!inflight_.empty()) {
            throw core::RiskStateException("cannot restore positions while orders are in flight");
        }

        std::map<std::string, core::PositionState> restored;
        double total = 0.0;
        for (const auto& entry : stored) {
            const core::PositionState& row = entry.second;
            if (!std::isfinite(row.quantity) || !std::isfinite(row.average_entry_price) ||
                !std::isfinite(row.realized_pnl) || row.quantity < 0.0 ||
                (row.quantity > 0.0 && !(row.average_entry_price > 0.0))) {
                throw core::RiskStateException(fmt::format("stored position for {} is unusable: qty={}, avg={}",
                                                           entry.first, row.quantity, row.average_entry_price));
            }
            core::PositionState position;
            position.asset = entry.first;
            position.quantity = row.quantity;
            position.average_entry_price = row.quantity > 0.0 ? row.average_entry_price : 0.0;
            position.current_notional = position.quantity * position.average_entry_price;
            position.realized_pnl = row.realized_pnl;
            position.last_update_time = row.last_update_time;
            total += position.current_notional;
            restored[entry.first] = position;
        }

        positions_ = std::move(restored);
        core::logging::getLogger()->info("Restored {} position(s) with {:.2f} total exposure.", positions_.size(), total);
    }

    std::map<std::string, core::PositionState> reconcilePositions(
        const std::map<std::string, core::PositionState>& stored,
        const std::map<std::string, core::PositionState>& venue)
    {
        auto logger = core::logging::getLogger();
        std::map<std::string, core::PositionState> merged;

        for (const auto& entry : venue) {
            core::PositionState position = entry.second;
            position.asset = entry.first;
            auto stored_it = stored.find(entry.first);
            if (stored_it == stored.end()) {
                logger->warn("Venue holds {:.8f} {} short that was not stored; adopting it.", position.quantity, entry.first);
            } else {
                position.realized_pnl = stored_it->second.realized_pnl;
                if (std::fabs(stored_it->second.quantity - position.quantity) > 1e-9 * std::max(1.0, position.quantity)) {
                    logger->warn("Stored {} short {:.8f} differs from venue {:.8f}; using the venue.",
                                 entry.first, stored_it->second.quantity, position.quantity);
                }
            }
            position.current_notional = position.quantity * position.average_entry_price;
            merged[entry.first] = position;
        }

        for (const auto& entry : stored) {
            if (merged.count(entry.first) > 0) continue;
            core::PositionState closed = entry.second;
            closed.asset = entry.first;
            if (closed.quantity > 0.0) {
                logger->warn("Stored {} short {:.8f} is not open on the venue; marking it closed.",
                             entry.first, closed.quantity);
            }
            closed.quantity = 0.0;
            closed.average_entry_price = 0.0;
            closed.current_notional = 0.0;
            merged[entry.first] = closed;
        }
        return merged;
    }

    // --- Marks & reads ---

    void RiskManager::updateMarks(const core::MarketSnapshot& snapshot) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : snapshot.quotes) {
            const auto& price = entry.second.price;
            if (price && std::isfinite(*price) && *price > 0.0) {
                marks_[entry.first] = *price;
            }
        }
    }

    std::optional<double> RiskManager::mark(const std::string& asset) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = marks_.find(asset);
        if (it == marks_.end()) return std::nullopt;
        return it->second;
    }

    core::PositionState RiskManager::decorate(const core::PositionState& position) const {
        core::PositionState view = position;
        view.entry_notional_cap = equity_ * config_.entry_cap_pct;
        view.max_notional_cap = equity_ * config_.max_cap_pct;
        view.has_inflight_order = inflight_.count(position.asset) > 0;
        auto mark_it = marks_.find(position.asset);
        // Short: profit when the mark is below the average entry
        view.unrealized_pnl = mark_it != marks_.end()
            ? view.quantity * (view.average_entry_price - mark_it->second)
            : 0.0;
        return view;
    }

    std::map<std::string, core::PositionState> RiskManager::positions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, core::PositionState> result;
        for (const auto& entry : positions_) {
            result[entry.first] = decorate(entry.second);
        }
        return result;
    }

    std::optional<core::PositionState> RiskManager::position(const std::string& asset) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(asset);
        if (it == positions_.end()) return std::nullopt;
        return decorate(it->second);
    }

    core::ExposureView RiskManager::exposureSnapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        core::ExposureView view;
        view.equity = equity_;
        view.entry_notional_cap = equity_ * config_.entry_cap_pct;
        view.max_notional_cap = equity_ * config_.max_cap_pct;
        view.portfolio_ceiling = equity_ * config_.portfolio_ceiling_pct;
        view.total_notional = totalNotional();
        for (const auto& entry : positions_) {
            view.positions[entry.first] = decorate(entry.second);
        }
        return view;
    }

    bool RiskManager::hasInflightOrder(const std::string& asset) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inflight_.count(asset) > 0;
    }

    std::size_t RiskManager::inflightCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inflight_.size();
    }

    void RiskManager::checkIntegrity() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (corrupted_) {
            throw core::RiskStateException("Risk store corrupted: " + corruption_detail_);
        }
    }

    bool RiskManager::isCorrupted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return corrupted_;
    }

} // namespace risk
