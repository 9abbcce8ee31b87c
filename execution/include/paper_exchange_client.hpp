#pragma once

#include "exchange_client.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace execution {

    // --- PaperExchangeClient ---
    // Simulate mode: every market order fills in full at the latest mark,
    // shifted against us by slippage_bps. No network access.
    class PaperExchangeClient : public IExchangeClient {
    public:
        explicit PaperExchangeClient(double slippage_bps = 0.0);
        ~PaperExchangeClient() override = default;

        std::string name() const override { return "paper"; }

        // Fed from each cycle's snapshot
        void updateMarks(const core::MarketSnapshot& snapshot);
        void setMark(const std::string& asset, double price);

        std::string submitOrder(const std::string& asset, core::OrderSide side, double notional,
                                const std::string& client_order_id) override;
        OrderUpdate pollOrder(const std::string& asset, const std::string& exchange_order_id) override;
        OrderUpdate cancelOrder(const std::string& asset, const std::string& exchange_order_id) override;
        std::optional<OrderUpdate> findOrder(const std::string& asset, const std::string& client_order_id) override;

        // Paper positions live only in the risk store and the database
        std::optional<std::map<std::string, core::PositionState>> fetchOpenPositions() override { return std::nullopt; }

        // Paper trading keeps the configured equity
        std::optional<double> fetchAccountEquity() override { return std::nullopt; }

    private:
        double slippage_bps_;
        std::mutex mutex_;
        std::map<std::string, double> marks_;
        std::map<std::string, OrderUpdate> orders_;
        std::map<std::string, std::string> client_ids_; // Client order id -> paper order id
        std::atomic<long long> next_id_{1};
    };

} // namespace execution
