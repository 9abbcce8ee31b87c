#pragma once

#include "market_data_source.hpp"
#include "token_supply.hpp"
#include "config.hpp"
#include <map>
#include <string>
#include <vector>

namespace data {

    // --- BinanceMarketDataClient ---
    // Public USDT-M futures endpoints (premiumIndex, ticker/24hr, klines) joined
    // with the static token supply table for market cap and unlock progress.
    class BinanceMarketDataClient : public IMarketDataSource {
    public:
        BinanceMarketDataClient(core::config::MarketDataConfig config, TokenSupplyTable supply);

        core::MarketSnapshot getSnapshot(core::Timestamp cycle_timestamp) override;

        // Pure assembly step of getSnapshot, separated from the HTTP calls.
        // An empty ticker_body leaves every volume missing.
        core::MarketSnapshot buildSnapshot(core::Timestamp cycle_timestamp,
                                           const std::string& premium_body,
                                           const std::string& ticker_body,
                                           const std::map<std::string, std::vector<double>>& closes) const;

        // "PEPEUSDT" -> "PEPE"; empty when the symbol is not quoted in quote_asset
        std::string baseAsset(const std::string& symbol) const;

        // Symbols the snapshot covers, given the premiumIndex payload
        std::vector<std::string> universe(const std::string& premium_body) const;

    private:
        // Throws core::ApiRequestException on transport errors or non-200 status
        std::string httpGet(const std::string& path, const std::string& query) const;

        std::vector<double> fetchCloses(const std::string& symbol) const;

        core::config::MarketDataConfig config_;
        TokenSupplyTable supply_;
    };

} // namespace data
