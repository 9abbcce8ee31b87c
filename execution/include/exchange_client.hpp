#pragma once

#include "datatypes.hpp"
#include <map>
#include <optional>
#include <string>

namespace execution {

    // Exchange-side view of one working order
    enum class ExchangeOrderState {
        New,
        PartiallyFilled,
        Filled,
        Canceled,
        Rejected,
        Expired
    };

    const char* toString(ExchangeOrderState state);

    struct OrderUpdate {
        std::string exchange_order_id;
        ExchangeOrderState state = ExchangeOrderState::New;
        double filled_notional = 0.0;    // Cumulative for this exchange order
        double average_fill_price = 0.0;
        std::string message;
    };

    // --- Exchange Client Interface ---
    // Implementations throw core::ExchangeTransientException for retryable failures
    // (network, rate limit, 5xx) and core::ExchangeTerminalException otherwise.
    class IExchangeClient {
    public:
        virtual ~IExchangeClient() = default;

        virtual std::string name() const = 0;

        // Market order sized in quote notional; returns the exchange order id
        virtual std::string submitOrder(const std::string& asset, core::OrderSide side, double notional,
                                        const std::string& client_order_id) = 0;

        virtual OrderUpdate pollOrder(const std::string& asset, const std::string& exchange_order_id) = 0;

        // Returns the order's state after cancellation
        virtual OrderUpdate cancelOrder(const std::string& asset, const std::string& exchange_order_id) = 0;

        // Looks an order up by the client id it was submitted with; empty when
        // the venue never accepted it
        virtual std::optional<OrderUpdate> findOrder(const std::string& asset, const std::string& client_order_id) = 0;

        // Open short positions keyed by asset (quantity and average entry price),
        // when the venue reports them
        virtual std::optional<std::map<std::string, core::PositionState>> fetchOpenPositions() = 0;

        // Account equity in quote currency, when the venue reports one
        virtual std::optional<double> fetchAccountEquity() = 0;
    };

} // namespace execution
