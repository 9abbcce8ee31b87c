#pragma once // Use #pragma once for include guards (common practice)

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <map>    // For per-asset snapshot quotes
#include <optional> // For fields the data source may not provide

namespace core {

    // Using system_clock for time points, cycle timestamps are wall-clock
    using Timestamp = std::chrono::system_clock::time_point;

    // Notional below this is treated as zero exposure (float dust)
    constexpr double kNotionalEpsilon = 1e-6;

    // One asset's raw market fields inside a snapshot.
    // Every field is optional here; the factor engine decides what is required.
    struct MarketQuote {
        std::optional<double> price;
        std::optional<double> funding_rate;
        std::optional<double> volume_24h;      // Quote currency (USDT) volume
        std::optional<double> market_cap;
        std::optional<double> unlock_progress; // Circulating / total supply, [0,1]
        std::vector<double> recent_prices;     // Price-change window, oldest first
    };

    struct MarketSnapshot {
        Timestamp timestamp;
        std::map<std::string, MarketQuote> quotes; // Symbol -> quote, ordered for determinism
    };

    enum class TrackTag {
        DeFi,
        Meme,
        Infra,
        Other
    };

    struct FactorRecord {
        std::string asset;
        Timestamp cycle_timestamp;
        double funding_rate = 0.0;          // Always >= 0 once a record exists
        int liquidity_tier = 0;             // 0 = illiquid, 3 = deepest
        double pump_score = 0.0;            // [0,1]
        TrackTag track_tag = TrackTag::Other;
        double unlock_progress_ratio = 0.0; // [0,1]
        double price = 0.0;
        double volume_24h = 0.0;
        double market_cap = 0.0;
    };

    enum class SignalDirection {
        Short // Only direction the strategy trades
    };

    struct Signal {
        std::string asset;
        SignalDirection direction = SignalDirection::Short;
        double strength_score = 0.0;        // [0,1]
        double unlock_progress_ratio = 0.0; // Kept for tie-breaking
        Timestamp cycle_timestamp;
    };

    // Exposure is tracked on a cost basis: quantity * average_entry_price.
    struct PositionState {
        std::string asset;
        double current_notional = 0.0;     // Short exposure, >= 0
        double quantity = 0.0;             // Base units held short
        double average_entry_price = 0.0;
        double entry_notional_cap = 0.0;
        double max_notional_cap = 0.0;
        double unrealized_pnl = 0.0;       // Positive when the short is in profit
        double realized_pnl = 0.0;
        bool has_inflight_order = false;
        Timestamp last_update_time;
    };

    // Read-only copy of the risk store handed to the position sizer
    struct ExposureView {
        double equity = 0.0;
        double entry_notional_cap = 0.0;
        double max_notional_cap = 0.0;
        double portfolio_ceiling = 0.0;  // Aggregate short exposure allowed
        double total_notional = 0.0;
        std::map<std::string, PositionState> positions;
    };

    enum class DeltaReason {
        NewSignal,
        ScaleUp,
        ScaleDown,
        RiskForced
    };

    struct PositionDelta {
        std::string asset;
        double target_change_notional = 0.0; // > 0 grows the short, < 0 reduces it
        DeltaReason reason = DeltaReason::NewSignal;
        double strength_score = 0.0;
        std::string note;
    };

    enum class OrderSide {
        Buy, // Covers short exposure
        Sell // Opens or adds to short exposure
    };

    enum class OrderStatus {
        Created,
        Submitted,
        PartiallyFilled,
        Filled,
        Rejected,
        Failed
    };

    inline bool isTerminal(OrderStatus status) {
        return status == OrderStatus::Filled ||
               status == OrderStatus::Rejected ||
               status == OrderStatus::Failed;
    }

    // Failure taxonomy surfaced in cycle summaries
    enum class ErrorKind {
        DataGap,            // Missing/invalid per-asset snapshot field, asset dropped for the cycle
        ValidationRejected, // Cap, ceiling or conflicting order, delta dropped
        ExchangeTransient,  // Network/rate-limit, retried with backoff
        ExchangeTerminal,   // Rejected order/invalid instrument, no retry
        RiskForcedOverride  // Not an error: a priority risk action
    };

    struct Order {
        std::string id;                 // Client order id
        std::string exchange_order_id;  // Id of the currently working exchange order
        std::string asset;
        OrderSide side = OrderSide::Sell;
        DeltaReason reason = DeltaReason::NewSignal;
        double requested_notional = 0.0;
        double filled_notional = 0.0;
        double average_fill_price = 0.0;
        OrderStatus status = OrderStatus::Created;
        int attempts = 0;
        bool remainder_dropped = false;
        std::optional<ErrorKind> error_kind; // Last exchange error seen, if any
        std::string error_message;
        Timestamp cycle_timestamp;
        Timestamp created_time;
        Timestamp terminal_time;
    };

    // Basic TimeSeries concept
    template<typename T>
    using TimeSeries = std::vector<T>; // Simple alias for now

    // String helpers for logs, storage and the dashboard
    const char* toString(TrackTag tag);
    const char* toString(DeltaReason reason);
    const char* toString(OrderSide side);
    const char* toString(OrderStatus status);
    const char* toString(SignalDirection direction);
    const char* toString(ErrorKind kind);

    TrackTag trackTagFromString(const std::string& tag_str); // Unknown strings map to Other

    // Inverse of toString for stored values; throw std::invalid_argument when unknown
    DeltaReason deltaReasonFromString(const std::string& str);
    OrderSide orderSideFromString(const std::string& str);
    OrderStatus orderStatusFromString(const std::string& str);
    ErrorKind errorKindFromString(const std::string& str);

} // namespace core
