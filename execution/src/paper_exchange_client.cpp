#include "paper_exchange_client.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath> // For std::isfinite

namespace execution {

    PaperExchangeClient::PaperExchangeClient(double slippage_bps)
        : slippage_bps_(slippage_bps)
    {
        core::logging::getLogger()->info("PaperExchangeClient created: slippage={:.1f} bps", slippage_bps_);
    }

    void PaperExchangeClient::updateMarks(const core::MarketSnapshot& snapshot) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : snapshot.quotes) {
            const auto& price = entry.second.price;
            if (price && std::isfinite(*price) && *price > 0.0) {
                marks_[entry.first] = *price;
            }
        }
    }

    void PaperExchangeClient::setMark(const std::string& asset, double price) {
        std::lock_guard<std::mutex> lock(mutex_);
        marks_[asset] = price;
    }

    std::string PaperExchangeClient::submitOrder(const std::string& asset, core::OrderSide side, double notional,
                                                 const std::string& client_order_id)
    {
        if (!(notional > 0.0) || !std::isfinite(notional)) {
            throw core::ExchangeTerminalException(fmt::format("Invalid notional {} for {}", notional, asset));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto mark_it = marks_.find(asset);
        if (mark_it == marks_.end()) {
            throw core::ExchangeTerminalException(fmt::format("No paper market for {}", asset));
        }

        // Sells fill below the mark, buys above it
        double slip = slippage_bps_ / 10000.0;
        double price = side == core::OrderSide::Sell ? mark_it->second * (1.0 - slip) : mark_it->second * (1.0 + slip);

        OrderUpdate fill;
        fill.exchange_order_id = fmt::format("paper-{}", next_id_++);
        fill.state = ExchangeOrderState::Filled;
        fill.filled_notional = notional;
        fill.average_fill_price = price;
        orders_[fill.exchange_order_id] = fill;
        client_ids_[client_order_id] = fill.exchange_order_id;

        core::logging::getLogger()->debug("Paper fill {} ({}): {} {} {:.2f} @ {:.6f}", fill.exchange_order_id,
                                          client_order_id, core::toString(side), asset, notional, price);
        return fill.exchange_order_id;
    }

    OrderUpdate PaperExchangeClient::pollOrder(const std::string& asset, const std::string& exchange_order_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(exchange_order_id);
        if (it == orders_.end()) {
            throw core::ExchangeTerminalException(fmt::format("Unknown paper order {} for {}", exchange_order_id, asset));
        }
        return it->second;
    }

    OrderUpdate PaperExchangeClient::cancelOrder(const std::string& asset, const std::string& exchange_order_id) {
        // Paper orders are already final
        return pollOrder(asset, exchange_order_id);
    }

    std::optional<OrderUpdate> PaperExchangeClient::findOrder(const std::string& asset,
                                                              const std::string& client_order_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto id_it = client_ids_.find(client_order_id);
        if (id_it == client_ids_.end()) return std::nullopt;
        auto order_it = orders_.find(id_it->second);
        if (order_it == orders_.end()) {
            throw core::ExchangeTerminalException(fmt::format("Paper order {} for {} went missing", id_it->second, asset));
        }
        return order_it->second;
    }

} // namespace execution
