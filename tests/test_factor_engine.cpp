#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "factor_engine.hpp"
#include "logging.hpp"
#include "utils.hpp"

using namespace factors;

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

core::MarketQuote makeQuote(double price, double funding, double volume, double market_cap, double unlock,
                            std::vector<double> window = {1.0, 1.0, 1.0})
{
    core::MarketQuote quote;
    quote.price = price;
    quote.funding_rate = funding;
    quote.volume_24h = volume;
    quote.market_cap = market_cap;
    quote.unlock_progress = unlock;
    quote.recent_prices = std::move(window);
    return quote;
}

core::config::FactorConfig testConfig() {
    core::config::FactorConfig config;
    config.classification["PEPEUSDT"] = core::TrackTag::Meme;
    config.classification["UNIUSDT"] = core::TrackTag::DeFi;
    return config;
}

bool hasRecord(const FactorEngineResult& result, const std::string& asset) {
    for (const auto& r : result.records) {
        if (r.asset == asset) return true;
    }
    return false;
}

// ============================================
// Gates
// ============================================

TEST(test_negative_funding_is_excluded_silently) {
    FactorEngine engine(testConfig());
    core::MarketSnapshot snapshot;
    snapshot.quotes["XUSDT"] = makeQuote(1.0, -0.001, 5e7, 1e8, 0.5);
    snapshot.quotes["YUSDT"] = makeQuote(1.0, 0.0001, 5e7, 1e8, 0.5);

    FactorEngineResult result = engine.compute(snapshot);
    ASSERT_FALSE(hasRecord(result, "XUSDT"));
    ASSERT_TRUE(hasRecord(result, "YUSDT"));
    ASSERT_EQ(result.funding_excluded, 1u);
    ASSERT_TRUE(result.diagnostics.empty());
}

TEST(test_zero_funding_passes_gate) {
    FactorEngine engine(testConfig());
    core::MarketSnapshot snapshot;
    snapshot.quotes["YUSDT"] = makeQuote(1.0, 0.0, 5e7, 1e8, 0.5);
    ASSERT_EQ(engine.compute(snapshot).records.size(), 1u);
}

TEST(test_missing_fields_become_data_gaps) {
    FactorEngine engine(testConfig());
    core::MarketSnapshot snapshot;

    core::MarketQuote no_funding = makeQuote(1.0, 0.0001, 5e7, 1e8, 0.5);
    no_funding.funding_rate.reset();
    core::MarketQuote no_volume = makeQuote(1.0, 0.0001, 5e7, 1e8, 0.5);
    no_volume.volume_24h.reset();
    core::MarketQuote bad_unlock = makeQuote(1.0, 0.0001, 5e7, 1e8, 1.2);
    core::MarketQuote short_window = makeQuote(1.0, 0.0001, 5e7, 1e8, 0.5, {1.0});
    core::MarketQuote zero_price = makeQuote(0.0, 0.0001, 5e7, 1e8, 0.5);

    snapshot.quotes["AUSDT"] = no_funding;
    snapshot.quotes["BUSDT"] = no_volume;
    snapshot.quotes["CUSDT"] = bad_unlock;
    snapshot.quotes["DUSDT"] = short_window;
    snapshot.quotes["EUSDT"] = zero_price;

    FactorEngineResult result = engine.compute(snapshot);
    ASSERT_TRUE(result.records.empty());
    ASSERT_EQ(result.diagnostics.size(), 5u);
    for (const auto& d : result.diagnostics) {
        ASSERT_EQ(d.kind, core::ErrorKind::DataGap);
        ASSERT_FALSE(d.asset.empty());
    }
    ASSERT_EQ(result.funding_excluded, 0u);
}

TEST(test_records_carry_snapshot_fields_in_symbol_order) {
    FactorEngine engine(testConfig());
    core::MarketSnapshot snapshot;
    snapshot.timestamp = core::utils::fromEpochMillis(1718000000000);
    snapshot.quotes["PEPEUSDT"] = makeQuote(0.00001, 0.0002, 2e8, 4e9, 1.0);
    snapshot.quotes["ARBUSDT"] = makeQuote(0.8, 0.0001, 5e6, 3e9, 0.43);

    FactorEngineResult result = engine.compute(snapshot);
    ASSERT_EQ(result.records.size(), 2u);
    ASSERT_EQ(result.records[0].asset, "ARBUSDT");
    ASSERT_EQ(result.records[1].asset, "PEPEUSDT");

    const core::FactorRecord& pepe = result.records[1];
    ASSERT_EQ(pepe.track_tag, core::TrackTag::Meme);
    ASSERT_EQ(pepe.liquidity_tier, 3);
    ASSERT_NEAR(pepe.funding_rate, 0.0002, 1e-12);
    ASSERT_NEAR(pepe.unlock_progress_ratio, 1.0, 1e-12);
    ASSERT_TRUE(pepe.cycle_timestamp == snapshot.timestamp);
    ASSERT_EQ(result.records[0].track_tag, core::TrackTag::Other);
}

// ============================================
// Factor Calculations
// ============================================

TEST(test_liquidity_tier_boundaries) {
    FactorEngine engine(testConfig());
    // Floors: 1M volume, 10M market cap; tiers at 1M / 10M / 100M
    ASSERT_EQ(engine.liquidityTier(999999.0, 1e9), 0);
    ASSERT_EQ(engine.liquidityTier(5e7, 9e6), 0);
    ASSERT_EQ(engine.liquidityTier(1e6, 1e7), 1);
    ASSERT_EQ(engine.liquidityTier(1e7, 1e9), 2);
    ASSERT_EQ(engine.liquidityTier(1e8, 1e9), 3);
}

TEST(test_pump_score_from_peak_rate_of_change) {
    FactorEngine engine(testConfig()); // reference gain 1.0 (a 100% run-up scores 1)

    // Window of 2: ROC(1) = +50%
    ASSERT_NEAR(engine.pumpScore({1.0, 1.5}), 0.5, 1e-9);
    // Doubling within the window saturates
    ASSERT_NEAR(engine.pumpScore({1.0, 1.0, 1.0, 2.5}), 1.0, 1e-9);
    // Steady decline never scores
    ASSERT_NEAR(engine.pumpScore({2.0, 1.8, 1.5, 1.2}), 0.0, 1e-12);
    ASSERT_NEAR(engine.pumpScore({1.0}), 0.0, 1e-12);
}

TEST(test_pump_score_respects_reference_gain) {
    core::config::FactorConfig config = testConfig();
    config.pump_reference_gain = 2.0;
    FactorEngine engine(config);
    ASSERT_NEAR(engine.pumpScore({1.0, 2.0}), 0.5, 1e-9);
}

TEST(test_classification_defaults_to_other) {
    FactorEngine engine(testConfig());
    ASSERT_EQ(engine.classify("UNIUSDT"), core::TrackTag::DeFi);
    ASSERT_EQ(engine.classify("PEPEUSDT"), core::TrackTag::Meme);
    ASSERT_EQ(engine.classify("SOMETHINGUSDT"), core::TrackTag::Other);
}

int main() {
    core::logging::initialize("test_factor_engine", spdlog::level::err, spdlog::level::debug);
    std::cout << "=== Factor Engine Tests ===\n\n";

    RUN_TEST(test_negative_funding_is_excluded_silently);
    RUN_TEST(test_zero_funding_passes_gate);
    RUN_TEST(test_missing_fields_become_data_gaps);
    RUN_TEST(test_records_carry_snapshot_fields_in_symbol_order);

    RUN_TEST(test_liquidity_tier_boundaries);
    RUN_TEST(test_pump_score_from_peak_rate_of_change);
    RUN_TEST(test_pump_score_respects_reference_gain);
    RUN_TEST(test_classification_defaults_to_other);

    std::cout << "\n=== All factor engine tests passed! ===\n";
    return 0;
}
