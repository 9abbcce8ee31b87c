#include "datatypes.hpp"
#include "diagnostics.hpp"
#include "cycle_summary.hpp"
#include <algorithm> // For std::transform
#include <cctype>    // For std::tolower
#include <stdexcept> // For std::invalid_argument

namespace core {

    const char* toString(TrackTag tag) {
        switch (tag) {
            case TrackTag::DeFi:  return "DeFi";
            case TrackTag::Meme:  return "Meme";
            case TrackTag::Infra: return "Infra";
            case TrackTag::Other: return "Other";
        }
        return "Other";
    }

    const char* toString(DeltaReason reason) {
        switch (reason) {
            case DeltaReason::NewSignal:  return "NEW_SIGNAL";
            case DeltaReason::ScaleUp:    return "SCALE_UP";
            case DeltaReason::ScaleDown:  return "SCALE_DOWN";
            case DeltaReason::RiskForced: return "RISK_FORCED";
        }
        return "UNKNOWN";
    }

    const char* toString(OrderSide side) {
        return side == OrderSide::Buy ? "BUY" : "SELL";
    }

    const char* toString(OrderStatus status) {
        switch (status) {
            case OrderStatus::Created:         return "CREATED";
            case OrderStatus::Submitted:       return "SUBMITTED";
            case OrderStatus::PartiallyFilled: return "PARTIALLY_FILLED";
            case OrderStatus::Filled:          return "FILLED";
            case OrderStatus::Rejected:        return "REJECTED";
            case OrderStatus::Failed:          return "FAILED";
        }
        return "UNKNOWN";
    }

    const char* toString(SignalDirection /*direction*/) {
        return "SHORT";
    }

    const char* toString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::DataGap:            return "DATA_GAP";
            case ErrorKind::ValidationRejected: return "VALIDATION_REJECTED";
            case ErrorKind::ExchangeTransient:  return "EXCHANGE_TRANSIENT";
            case ErrorKind::ExchangeTerminal:   return "EXCHANGE_TERMINAL";
            case ErrorKind::RiskForcedOverride: return "RISK_FORCED_OVERRIDE";
        }
        return "UNKNOWN";
    }

    TrackTag trackTagFromString(const std::string& tag_str) {
        std::string lower_str = tag_str;
        std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
            [](unsigned char c){ return std::tolower(c); });
        if (lower_str == "defi") return TrackTag::DeFi;
        if (lower_str == "meme") return TrackTag::Meme;
        if (lower_str == "infra" || lower_str == "infrastructure") return TrackTag::Infra;
        return TrackTag::Other;
    }

    DeltaReason deltaReasonFromString(const std::string& str) {
        for (DeltaReason r : {DeltaReason::NewSignal, DeltaReason::ScaleUp, DeltaReason::ScaleDown, DeltaReason::RiskForced}) {
            if (str == toString(r)) return r;
        }
        throw std::invalid_argument("Unknown delta reason: " + str);
    }

    OrderSide orderSideFromString(const std::string& str) {
        if (str == "BUY") return OrderSide::Buy;
        if (str == "SELL") return OrderSide::Sell;
        throw std::invalid_argument("Unknown order side: " + str);
    }

    OrderStatus orderStatusFromString(const std::string& str) {
        for (OrderStatus s : {OrderStatus::Created, OrderStatus::Submitted, OrderStatus::PartiallyFilled,
                              OrderStatus::Filled, OrderStatus::Rejected, OrderStatus::Failed}) {
            if (str == toString(s)) return s;
        }
        throw std::invalid_argument("Unknown order status: " + str);
    }

    ErrorKind errorKindFromString(const std::string& str) {
        for (ErrorKind k : {ErrorKind::DataGap, ErrorKind::ValidationRejected, ErrorKind::ExchangeTransient,
                            ErrorKind::ExchangeTerminal, ErrorKind::RiskForcedOverride}) {
            if (str == toString(k)) return k;
        }
        throw std::invalid_argument("Unknown error kind: " + str);
    }

    Diagnostic makeDiagnostic(ErrorKind kind, std::string asset, std::string message,
                              Timestamp timestamp, std::string order_id) {
        Diagnostic diag;
        diag.kind = kind;
        diag.asset = std::move(asset);
        diag.order_id = std::move(order_id);
        diag.message = std::move(message);
        diag.timestamp = timestamp;
        return diag;
    }

    const char* toString(CycleStatus status) {
        return status == CycleStatus::Completed ? "COMPLETED" : "ABORTED";
    }

} // namespace core
