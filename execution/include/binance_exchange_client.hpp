#pragma once

#include "exchange_client.hpp"
#include "config.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace cpr { class Response; }

namespace execution {

    // Lowercase hex HMAC-SHA256, as Binance expects in the signature parameter
    std::string hmacSha256Hex(const std::string& key, const std::string& data);

    // --- BinanceExchangeClient ---
    // USDT-M futures market orders over the signed REST API (cpr + OpenSSL).
    class BinanceExchangeClient : public IExchangeClient {
    public:
        explicit BinanceExchangeClient(core::config::ExchangeConfig config);
        ~BinanceExchangeClient() override = default;

        std::string name() const override { return "binance-futures"; }

        std::string submitOrder(const std::string& asset, core::OrderSide side, double notional,
                                const std::string& client_order_id) override;
        OrderUpdate pollOrder(const std::string& asset, const std::string& exchange_order_id) override;
        OrderUpdate cancelOrder(const std::string& asset, const std::string& exchange_order_id) override;
        std::optional<OrderUpdate> findOrder(const std::string& asset, const std::string& client_order_id) override;
        std::optional<std::map<std::string, core::PositionState>> fetchOpenPositions() override;
        std::optional<double> fetchAccountEquity() override;

    private:
        struct LotFilter {
            double step_size = 0.0;
            double min_qty = 0.0;
            int precision = 0;
        };

        LotFilter lotFilter(const std::string& symbol);
        double markPrice(const std::string& symbol);
        std::string formatQuantity(double quantity, const LotFilter& filter) const;

        // Appends recvWindow/timestamp/signature and sends the request
        cpr::Response sendSigned(const std::string& method, const std::string& path, const std::string& query);
        // sendSigned() followed by checkResponse(); returns the body
        std::string signedRequest(const std::string& method, const std::string& path, const std::string& query);
        std::string publicGet(const std::string& path, const std::string& query);

        // Throws ExchangeTransientException / ExchangeTerminalException on failure
        void checkResponse(const cpr::Response& response, const std::string& what) const;
        OrderUpdate parseOrder(const std::string& body) const;

        core::config::ExchangeConfig config_;
        std::mutex filters_mutex_;
        std::map<std::string, LotFilter> filters_; // Cached from exchangeInfo
    };

} // namespace execution
