#include <cassert>
#include <cmath>
#include <iostream>
#include <algorithm>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "signal_generator.hpp"
#include "factor_filters.hpp"
#include "logging.hpp"

using namespace strategy_engine;

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

core::FactorRecord record(const std::string& asset, double pump, int tier, core::TrackTag track, double unlock) {
    core::FactorRecord r;
    r.asset = asset;
    r.funding_rate = 0.0001;
    r.pump_score = pump;
    r.liquidity_tier = tier;
    r.track_tag = track;
    r.unlock_progress_ratio = unlock;
    r.price = 1.0;
    r.volume_24h = 5e7;
    r.market_cap = 1e9;
    return r;
}

bool contains(const std::vector<core::Signal>& signals, const std::string& asset) {
    return std::any_of(signals.begin(), signals.end(), [&](const core::Signal& s) { return s.asset == asset; });
}

// ============================================
// Filters
// ============================================

TEST(test_default_filters_drop_defi_unlocked_and_illiquid) {
    SignalGenerator generator(core::config::SignalConfig{}); // unlock threshold 0.9

    std::vector<core::FactorRecord> records {
        record("UNIUSDT", 0.8, 3, core::TrackTag::DeFi, 0.5),
        record("FULLUSDT", 0.8, 3, core::TrackTag::Other, 0.95),
        record("THINUSDT", 0.8, 0, core::TrackTag::Meme, 0.5),
        record("PEPEUSDT", 0.8, 2, core::TrackTag::Meme, 0.9),
    };

    auto signals = generator.generate(records);
    ASSERT_EQ(signals.size(), 1u);
    ASSERT_EQ(signals[0].asset, "PEPEUSDT");
    ASSERT_EQ(signals[0].direction, core::SignalDirection::Short);
    ASSERT_FALSE(contains(signals, "UNIUSDT"));
}

TEST(test_custom_filter_list_replaces_defaults) {
    FilterList filters;
    filters.push_back(std::make_unique<MinLiquidityTierFilter>(3));
    SignalGenerator generator(core::config::SignalConfig{}, std::move(filters));

    std::vector<core::FactorRecord> records {
        record("UNIUSDT", 0.1, 3, core::TrackTag::DeFi, 0.99),
        record("ARBUSDT", 0.1, 2, core::TrackTag::Infra, 0.2),
    };
    auto signals = generator.generate(records);
    ASSERT_EQ(signals.size(), 1u);
    ASSERT_EQ(signals[0].asset, "UNIUSDT");
}

TEST(test_filter_arguments_validated) {
    bool threw = false;
    try {
        UnlockThresholdFilter filter(1.5);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT_TRUE(threw);

    threw = false;
    try {
        MinLiquidityTierFilter filter(4);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(test_min_signal_strength_floor) {
    core::config::SignalConfig config;
    config.min_signal_strength = 0.5;
    SignalGenerator generator(config);

    std::vector<core::FactorRecord> records {
        record("WEAKUSDT", 0.0, 1, core::TrackTag::Other, 0.5),  // 0.1
        record("STRONGUSDT", 1.0, 3, core::TrackTag::Meme, 0.5), // 1.0
    };
    auto signals = generator.generate(records);
    ASSERT_EQ(signals.size(), 1u);
    ASSERT_EQ(signals[0].asset, "STRONGUSDT");
}

// ============================================
// Scoring & Ranking
// ============================================

TEST(test_score_is_weighted_average) {
    SignalGenerator generator(core::config::SignalConfig{}); // weights 0.5 / 0.3 / 0.2

    ASSERT_NEAR(generator.score(record("A", 1.0, 3, core::TrackTag::Meme, 0.5)), 1.0, 1e-12);
    ASSERT_NEAR(generator.score(record("B", 0.5, 3, core::TrackTag::Other, 0.5)), 0.55, 1e-12);
    ASSERT_NEAR(generator.score(record("C", 0.0, 1, core::TrackTag::Meme, 0.5)), 0.1 + 0.2, 1e-12);
    ASSERT_NEAR(generator.score(record("D", 0.0, 0, core::TrackTag::Other, 0.5)), 0.0, 1e-12);
}

TEST(test_ranking_breaks_ties_by_unlock_then_symbol) {
    SignalGenerator generator(core::config::SignalConfig{});
    std::vector<core::FactorRecord> records {
        record("CCCUSDT", 0.5, 2, core::TrackTag::Other, 0.4),
        record("BBBUSDT", 0.5, 2, core::TrackTag::Other, 0.3),
        record("AAAUSDT", 0.5, 2, core::TrackTag::Other, 0.4),
        record("TOPUSDT", 0.9, 3, core::TrackTag::Meme, 0.8),
    };

    auto signals = generator.generate(records);
    ASSERT_EQ(signals.size(), 4u);
    ASSERT_EQ(signals[0].asset, "TOPUSDT");
    ASSERT_EQ(signals[1].asset, "BBBUSDT");
    ASSERT_EQ(signals[2].asset, "AAAUSDT");
    ASSERT_EQ(signals[3].asset, "CCCUSDT");
}

TEST(test_ordering_is_deterministic_for_shuffled_input) {
    SignalGenerator generator(core::config::SignalConfig{});
    std::vector<core::FactorRecord> records;
    for (int i = 0; i < 30; ++i) {
        records.push_back(record("SYM" + std::to_string(i) + "USDT", (i % 5) / 5.0, 1 + i % 3,
                                 i % 4 == 0 ? core::TrackTag::Meme : core::TrackTag::Other, (i % 7) / 10.0));
    }

    auto expected = generator.generate(records);
    std::mt19937 rng(7);
    for (int round = 0; round < 10; ++round) {
        std::shuffle(records.begin(), records.end(), rng);
        auto signals = generator.generate(records);
        ASSERT_EQ(signals.size(), expected.size());
        for (std::size_t i = 0; i < signals.size(); ++i) {
            ASSERT_EQ(signals[i].asset, expected[i].asset);
        }
    }
}

int main() {
    core::logging::initialize("test_signal_generator", spdlog::level::err, spdlog::level::debug);
    std::cout << "=== Signal Generator Tests ===\n\n";

    RUN_TEST(test_default_filters_drop_defi_unlocked_and_illiquid);
    RUN_TEST(test_custom_filter_list_replaces_defaults);
    RUN_TEST(test_filter_arguments_validated);
    RUN_TEST(test_min_signal_strength_floor);

    RUN_TEST(test_score_is_weighted_average);
    RUN_TEST(test_ranking_breaks_ties_by_unlock_then_symbol);
    RUN_TEST(test_ordering_is_deterministic_for_shuffled_input);

    std::cout << "\n=== All signal generator tests passed! ===\n";
    return 0;
}
