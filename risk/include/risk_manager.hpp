#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace risk {

    enum class RejectReason {
        CapExceeded,
        ConflictingInflightOrder,
        PortfolioCeiling,
        NothingToReduce,
        BelowMinNotional
    };

    const char* toString(RejectReason reason);

    struct ApprovedDelta {
        core::PositionDelta delta;             // As proposed
        double approved_change_notional = 0.0; // Signed, cost-basis change
        double order_notional = 0.0;           // Market-value size sent to the exchange (> 0)
        core::OrderSide side = core::OrderSide::Sell;
        bool clamped = false;
        std::optional<RejectReason> clamp_reason; // Which limit cut the request down
    };

    struct Rejection {
        RejectReason reason = RejectReason::CapExceeded;
        std::string detail;
    };

    struct ValidationResult {
        std::optional<ApprovedDelta> approved;
        std::optional<Rejection> rejection;

        bool isApproved() const { return approved.has_value(); }
    };

    // --- RiskManager ---
    // Single owner of PositionState. validate() approves or rejects deltas and, on
    // approval, takes the asset's in-flight lock; commit() is the only path that
    // mutates exposure and releases that lock. All public methods are thread-safe.
    class RiskManager {
    public:
        explicit RiskManager(core::config::RiskConfig config);

        // Enforces entry/max caps, one in-flight order per asset and the portfolio ceiling
        ValidationResult validate(const core::PositionDelta& delta);

        // Releases a lock taken by validate() when no order was ever submitted
        void releaseLock(const std::string& asset);

        // Forced unwind/reduce deltas for held assets without in-flight orders
        std::vector<core::PositionDelta> evaluatePnl() const;

        // Applies a terminal order's fill; throws core::RiskStateException for non-terminal orders
        void commit(const core::Order& order);

        // Replaces the store with persisted positions at startup. Throws
        // core::RiskStateException while orders are in flight or on unusable rows.
        void restorePositions(const std::map<std::string, core::PositionState>& stored);

        // Latest mark prices; drive unrealized PnL only
        void updateMarks(const core::MarketSnapshot& snapshot);
        std::optional<double> mark(const std::string& asset) const;

        void setEquity(double equity);
        double equity() const;
        double entryNotionalCap() const;
        double maxNotionalCap() const;

        // Read-only copies for the sizer and the dashboard
        core::ExposureView exposureSnapshot() const;
        std::map<std::string, core::PositionState> positions() const;
        std::optional<core::PositionState> position(const std::string& asset) const;
        bool hasInflightOrder(const std::string& asset) const;
        std::size_t inflightCount() const;

        // Throws core::RiskStateException once the store has been marked corrupted
        void checkIntegrity() const;
        bool isCorrupted() const;

    private:
        struct Reservation {
            double increase_notional = 0.0; // Pending cost-basis increase, 0 for reductions
            double max_cap = 0.0;           // Cap in force when the order was approved
            bool full_unwind = false;       // Reduction meant to close the position
        };

        // Caller holds mutex_
        double totalNotional() const;
        double reservedNotional() const;
        core::PositionState decorate(const core::PositionState& position) const;
        void markCorrupted(const std::string& detail);
        ValidationResult reject(const core::PositionDelta& delta, RejectReason reason, std::string detail) const;

        core::config::RiskConfig config_;
        double equity_;

        mutable std::mutex mutex_;
        std::map<std::string, core::PositionState> positions_;
        std::map<std::string, double> marks_;
        std::map<std::string, Reservation> inflight_; // Asset -> lock held by an approved delta
        bool corrupted_ = false;
        std::string corruption_detail_;
    };

    // Startup reconciliation: the venue's open shorts win over the stored ones.
    // Realized PnL is carried over from the stored state.
    std::map<std::string, core::PositionState> reconcilePositions(
        const std::map<std::string, core::PositionState>& stored,
        const std::map<std::string, core::PositionState>& venue);

} // namespace risk
