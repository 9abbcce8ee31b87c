#include "binance_market_data_client.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>

namespace data {

    namespace {
        // Binance encodes decimals as strings; accept either form
        std::optional<double> numberField(const nlohmann::json& obj, const char* key) {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null()) {
                return std::nullopt;
            }
            try {
                double value = it->is_string() ? std::stod(it->get<std::string>()) : it->get<double>();
                if (!std::isfinite(value)) {
                    return std::nullopt;
                }
                return value;
            } catch (const std::exception&) {
                return std::nullopt; // Unparseable value becomes a data gap
            }
        }

        nlohmann::json parseArray(const std::string& body, const char* what) {
            nlohmann::json parsed = nlohmann::json::parse(body);
            if (!parsed.is_array()) {
                throw core::DataLoadException(fmt::format("Unexpected {} payload: not an array", what));
            }
            return parsed;
        }
    } // end anonymous namespace

    BinanceMarketDataClient::BinanceMarketDataClient(core::config::MarketDataConfig config, TokenSupplyTable supply)
        : config_(std::move(config)), supply_(std::move(supply))
    {
        core::logging::getLogger()->debug("BinanceMarketDataClient created: base_url={}, quote={}, {} supply entries",
                                          config_.base_url, config_.quote_asset, supply_.size());
    }

    std::string BinanceMarketDataClient::httpGet(const std::string& path, const std::string& query) const {
        std::string url = config_.base_url + path + (query.empty() ? "" : "?" + query);
        core::logging::getLogger()->trace("GET {}", url);

        cpr::Response response = cpr::Get(cpr::Url{url},
                                          cpr::Header{{"Accept", "application/json"}},
                                          cpr::Timeout{std::chrono::milliseconds(config_.request_timeout_ms)});

        if (response.error) {
            throw core::ApiRequestException(fmt::format("GET {} failed (CPR error {}): {}", path,
                                                        static_cast<int>(response.error.code),
                                                        response.error.message));
        }
        if (response.status_code != 200) {
            throw core::ApiRequestException(fmt::format("GET {} failed: status={}, body='{}'", path,
                                                        response.status_code, response.text.substr(0, 200)));
        }
        return response.text;
    }

    std::string BinanceMarketDataClient::baseAsset(const std::string& symbol) const {
        const std::string& quote = config_.quote_asset;
        if (symbol.size() <= quote.size() ||
            symbol.compare(symbol.size() - quote.size(), quote.size(), quote) != 0) {
            return "";
        }
        return symbol.substr(0, symbol.size() - quote.size());
    }

    std::vector<std::string> BinanceMarketDataClient::universe(const std::string& premium_body) const {
        std::vector<std::string> symbols;
        if (!config_.symbols.empty()) {
            symbols = config_.symbols;
        } else {
            for (const auto& item : parseArray(premium_body, "premiumIndex")) {
                std::string symbol = item.value("symbol", "");
                if (!baseAsset(symbol).empty()) {
                    symbols.push_back(symbol);
                }
            }
        }
        std::sort(symbols.begin(), symbols.end());
        symbols.erase(std::unique(symbols.begin(), symbols.end()), symbols.end());
        return symbols;
    }

    std::vector<double> BinanceMarketDataClient::fetchCloses(const std::string& symbol) const {
        std::string body = httpGet("/fapi/v1/klines",
                                   fmt::format("symbol={}&interval=1d&limit={}", symbol, config_.price_window_days));
        std::vector<double> closes;
        for (const auto& kline : parseArray(body, "klines")) {
            // [openTime, open, high, low, close, volume, ...]
            if (!kline.is_array() || kline.size() < 5) {
                continue;
            }
            const auto& close = kline[4];
            closes.push_back(close.is_string() ? std::stod(close.get<std::string>()) : close.get<double>());
        }
        return closes;
    }

    core::MarketSnapshot BinanceMarketDataClient::buildSnapshot(
        core::Timestamp cycle_timestamp,
        const std::string& premium_body,
        const std::string& ticker_body,
        const std::map<std::string, std::vector<double>>& closes) const
    {
        auto logger = core::logging::getLogger();
        core::MarketSnapshot snapshot;
        snapshot.timestamp = cycle_timestamp;

        std::vector<std::string> symbols;
        std::map<std::string, nlohmann::json> premium_by_symbol;
        try {
            for (const auto& item : parseArray(premium_body, "premiumIndex")) {
                premium_by_symbol[item.value("symbol", "")] = item;
            }
            symbols = universe(premium_body);
        } catch (const nlohmann::json::exception& e) {
            throw core::SnapshotUnavailableException(std::string("premiumIndex payload unreadable: ") + e.what());
        } catch (const core::DataLoadException& e) {
            throw core::SnapshotUnavailableException(e.what());
        }

        std::map<std::string, double> volumes;
        if (!ticker_body.empty()) {
            try {
                for (const auto& item : parseArray(ticker_body, "ticker/24hr")) {
                    auto volume = numberField(item, "quoteVolume");
                    if (volume) {
                        volumes[item.value("symbol", "")] = *volume;
                    }
                }
            } catch (const std::exception& e) {
                logger->warn("ticker/24hr payload unreadable, volumes missing this cycle: {}", e.what());
                volumes.clear();
            }
        }

        for (const auto& symbol : symbols) {
            core::MarketQuote quote;
            auto premium_it = premium_by_symbol.find(symbol);
            if (premium_it != premium_by_symbol.end()) {
                quote.price = numberField(premium_it->second, "markPrice");
                quote.funding_rate = numberField(premium_it->second, "lastFundingRate");
            }

            auto volume_it = volumes.find(symbol);
            if (volume_it != volumes.end()) {
                quote.volume_24h = volume_it->second;
            }

            auto supply_it = supply_.find(baseAsset(symbol));
            if (supply_it != supply_.end()) {
                const TokenSupply& supply = supply_it->second;
                quote.unlock_progress = std::min(1.0, supply.circulating_supply / supply.total_supply);
                if (quote.price) {
                    quote.market_cap = *quote.price * supply.circulating_supply;
                }
            }

            auto closes_it = closes.find(symbol);
            if (closes_it != closes.end()) {
                quote.recent_prices = closes_it->second;
            }
            snapshot.quotes.emplace(symbol, std::move(quote));
        }

        if (snapshot.quotes.empty()) {
            throw core::SnapshotUnavailableException("premiumIndex returned no symbols for the configured universe");
        }
        return snapshot;
    }

    core::MarketSnapshot BinanceMarketDataClient::getSnapshot(core::Timestamp cycle_timestamp) {
        auto logger = core::logging::getLogger();

        std::string premium_body;
        try {
            premium_body = httpGet("/fapi/v1/premiumIndex", "");
        } catch (const core::ApiRequestException& e) {
            throw core::SnapshotUnavailableException(std::string("premiumIndex unavailable: ") + e.what());
        }

        std::string ticker_body;
        try {
            ticker_body = httpGet("/fapi/v1/ticker/24hr", "");
        } catch (const core::ApiRequestException& e) {
            logger->warn("ticker/24hr unavailable, volumes missing this cycle: {}", e.what());
        }

        std::vector<std::string> symbols;
        try {
            symbols = universe(premium_body);
        } catch (const std::exception& e) {
            throw core::SnapshotUnavailableException(std::string("premiumIndex payload unreadable: ") + e.what());
        }

        std::map<std::string, std::vector<double>> closes;
        for (const auto& symbol : symbols) {
            try {
                closes[symbol] = fetchCloses(symbol);
            } catch (const std::exception& e) {
                // Empty window surfaces as a DATA_GAP in the factor engine
                logger->warn("klines unavailable for {}: {}", symbol, e.what());
            }
        }

        core::MarketSnapshot snapshot = buildSnapshot(cycle_timestamp, premium_body, ticker_body, closes);
        logger->info("Market snapshot assembled: {} assets, {} with price windows", snapshot.quotes.size(), closes.size());
        return snapshot;
    }

} // namespace data
