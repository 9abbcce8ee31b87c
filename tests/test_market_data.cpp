#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "binance_market_data_client.hpp"
#include "token_supply.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

using namespace data;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

// Payloads in the shape the public futures endpoints return them
const std::string kPremiumBody = R"([
    {"symbol": "PEPEUSDT", "markPrice": "0.00001200", "lastFundingRate": "0.00010000"},
    {"symbol": "UNIUSDT", "markPrice": "7.5", "lastFundingRate": "-0.00020000"},
    {"symbol": "ARBUSDT", "markPrice": 0.8, "lastFundingRate": "not-a-number"},
    {"symbol": "BTCBUSD", "markPrice": "60000", "lastFundingRate": "0.0001"}
])";

const std::string kTickerBody = R"([
    {"symbol": "PEPEUSDT", "quoteVolume": "250000000.5"},
    {"symbol": "UNIUSDT", "quoteVolume": 42000000}
])";

TokenSupplyTable testSupply() {
    TokenSupplyTable supply;
    supply["PEPE"] = TokenSupply{420690000000000.0, 420690000000000.0};
    supply["UNI"] = TokenSupply{600000000.0, 1000000000.0};
    return supply;
}

core::config::MarketDataConfig testConfig() {
    core::config::MarketDataConfig config;
    config.base_url = "http://127.0.0.1:9";
    return config;
}

TEST(test_snapshot_joins_endpoints_and_supply) {
    BinanceMarketDataClient client(testConfig(), testSupply());
    core::Timestamp ts = core::utils::fromEpochMillis(1718000000000);

    std::map<std::string, std::vector<double>> closes;
    closes["PEPEUSDT"] = {0.00001, 0.000011, 0.000012};

    core::MarketSnapshot snapshot = client.buildSnapshot(ts, kPremiumBody, kTickerBody, closes);
    ASSERT_TRUE(snapshot.timestamp == ts);
    ASSERT_EQ(snapshot.quotes.size(), 3u); // BTCBUSD is not quoted in USDT

    const core::MarketQuote& pepe = snapshot.quotes.at("PEPEUSDT");
    ASSERT_NEAR(*pepe.price, 0.000012, 1e-12);
    ASSERT_NEAR(*pepe.funding_rate, 0.0001, 1e-12);
    ASSERT_NEAR(*pepe.volume_24h, 250000000.5, 1e-6);
    ASSERT_NEAR(*pepe.unlock_progress, 1.0, 1e-12);
    ASSERT_NEAR(*pepe.market_cap, 0.000012 * 420690000000000.0, 1.0);
    ASSERT_EQ(pepe.recent_prices.size(), 3u);

    const core::MarketQuote& uni = snapshot.quotes.at("UNIUSDT");
    ASSERT_NEAR(*uni.funding_rate, -0.0002, 1e-12);
    ASSERT_NEAR(*uni.volume_24h, 42000000.0, 1e-6);
    ASSERT_NEAR(*uni.unlock_progress, 0.6, 1e-12);
    ASSERT_TRUE(uni.recent_prices.empty());

    // Unparseable funding and no supply entry leave gaps for the factor engine
    const core::MarketQuote& arb = snapshot.quotes.at("ARBUSDT");
    ASSERT_NEAR(*arb.price, 0.8, 1e-12);
    ASSERT_FALSE(arb.funding_rate.has_value());
    ASSERT_FALSE(arb.volume_24h.has_value());
    ASSERT_FALSE(arb.market_cap.has_value());
    ASSERT_FALSE(arb.unlock_progress.has_value());
}

TEST(test_missing_ticker_leaves_volume_empty) {
    BinanceMarketDataClient client(testConfig(), testSupply());
    core::MarketSnapshot snapshot = client.buildSnapshot(core::utils::fromEpochMillis(0), kPremiumBody, "", {});
    for (const auto& entry : snapshot.quotes) {
        ASSERT_FALSE(entry.second.volume_24h.has_value());
    }

    snapshot = client.buildSnapshot(core::utils::fromEpochMillis(0), kPremiumBody, "{oops", {});
    ASSERT_FALSE(snapshot.quotes.at("PEPEUSDT").volume_24h.has_value());
}

TEST(test_unreadable_premium_is_snapshot_unavailable) {
    BinanceMarketDataClient client(testConfig(), testSupply());
    for (const std::string body : {"<html>busy</html>", "{\"code\": -1003}", "[]"}) {
        bool threw = false;
        try {
            client.buildSnapshot(core::utils::fromEpochMillis(0), body, kTickerBody, {});
        } catch (const core::SnapshotUnavailableException&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
    }
}

TEST(test_unreachable_endpoint_is_snapshot_unavailable) {
    core::config::MarketDataConfig config = testConfig();
    config.request_timeout_ms = 200;
    BinanceMarketDataClient client(config, testSupply());
    bool threw = false;
    try {
        client.getSnapshot(core::utils::fromEpochMillis(0));
    } catch (const core::SnapshotUnavailableException&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(test_configured_symbols_restrict_universe) {
    core::config::MarketDataConfig config = testConfig();
    config.symbols = {"UNIUSDT", "PEPEUSDT", "UNIUSDT"};
    BinanceMarketDataClient client(config, testSupply());

    std::vector<std::string> symbols = client.universe(kPremiumBody);
    ASSERT_EQ(symbols.size(), 2u);
    ASSERT_EQ(symbols[0], "PEPEUSDT");
    ASSERT_EQ(symbols[1], "UNIUSDT");

    core::MarketSnapshot snapshot = client.buildSnapshot(core::utils::fromEpochMillis(0), kPremiumBody, kTickerBody, {});
    ASSERT_EQ(snapshot.quotes.size(), 2u);
    ASSERT_EQ(snapshot.quotes.count("ARBUSDT"), 0u);
}

TEST(test_base_asset_requires_quote_suffix) {
    BinanceMarketDataClient client(testConfig(), testSupply());
    ASSERT_EQ(client.baseAsset("PEPEUSDT"), "PEPE");
    ASSERT_EQ(client.baseAsset("BTCBUSD"), "");
    ASSERT_EQ(client.baseAsset("USDT"), "");
}

TEST(test_token_supply_table_parsing) {
    nlohmann::json table = {
        {"PEPE", {{"circulating_supply", 420690000000000.0}, {"total_supply", 420690000000000.0}}},
        {"ZERO", {{"circulating_supply", 0.0}, {"total_supply", 100.0}}},
        {"BAD", {{"circulating_supply", "many"}}},
        {"TIA", {{"circulating_supply", 200000000.0}, {"total_supply", 1000000000.0}}}
    };
    TokenSupplyTable supply = parseTokenSupplyTable(table);
    ASSERT_EQ(supply.size(), 2u);
    ASSERT_NEAR(supply.at("TIA").circulating_supply, 200000000.0, 1e-6);

    bool threw = false;
    try {
        parseTokenSupplyTable(nlohmann::json::array());
    } catch (const core::DataLoadException&) {
        threw = true;
    }
    ASSERT_TRUE(threw);

    threw = false;
    try {
        loadTokenSupplyTable("does/not/exist.json");
    } catch (const core::DataLoadException&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

int main() {
    core::logging::initialize("test_market_data", spdlog::level::err, spdlog::level::debug);
    std::cout << "=== Market Data Tests ===\n\n";

    RUN_TEST(test_snapshot_joins_endpoints_and_supply);
    RUN_TEST(test_missing_ticker_leaves_volume_empty);
    RUN_TEST(test_unreadable_premium_is_snapshot_unavailable);
    RUN_TEST(test_unreachable_endpoint_is_snapshot_unavailable);
    RUN_TEST(test_configured_symbols_restrict_universe);
    RUN_TEST(test_base_asset_requires_quote_suffix);
    RUN_TEST(test_token_supply_table_parsing);

    std::cout << "\n=== All market data tests passed! ===\n";
    return 0;
}
