#pragma once

#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "datatypes.hpp"

namespace core {
namespace config {

    using json = nlohmann::json;

    struct FactorConfig {
        double min_liquidity_usd = 1000000.0;   // 24h quote volume floor for tier > 0
        double min_market_cap_usd = 10000000.0; // Market cap floor for tier > 0
        std::vector<double> liquidity_tier_volumes {1000000.0, 10000000.0, 100000000.0};
        double pump_reference_gain = 1.0;       // Run-up that maps to pump_score 1.0
        int pump_lookback_days = 7;             // ROC period over the price window
        std::map<std::string, TrackTag> classification; // Static symbol -> track table
    };

    struct SignalConfig {
        double unlock_threshold = 0.9;
        double pump_score_weight = 0.5;
        double liquidity_weight = 0.3;
        double meme_weight = 0.2;
        double min_signal_strength = 0.0;
    };

    struct SizingConfig {
        double entry_size_floor = 0.4;  // Fraction of the entry cap used at strength 0
        double min_order_notional = 10.0;
    };

    struct RiskConfig {
        double portfolio_equity = 100000.0;
        double entry_cap_pct = 0.025;
        double max_cap_pct = 0.05;
        double portfolio_ceiling_pct = 0.5;
        double stop_loss_threshold = 0.5;
        double reduce_loss_threshold = 0.2;
        double reduce_profit_threshold = 0.2;
        double reduce_position_ratio = 0.5;
        double near_cap_ratio = 0.9;
        double min_order_notional = 10.0;
        double fill_slippage_buffer_pct = 0.0; // Share of the max cap kept free when an increase is clamped
    };

    struct ExecutionConfig {
        int retry_attempt_limit = 3;
        long backoff_base_ms = 500;
        long backoff_cap_ms = 8000;
        int max_concurrent_orders = 4;
        long order_poll_interval_ms = 500;
        long order_poll_timeout_ms = 30000;
        double min_order_notional = 10.0; // Smallest remainder worth resubmitting
    };

    struct ExchangeConfig {
        std::string base_url = "https://fapi.binance.com";
        std::string api_key;    // From BINANCE_API_KEY
        std::string api_secret; // From BINANCE_API_SECRET
        long recv_window_ms = 5000;
        long request_timeout_ms = 10000;
    };

    struct MarketDataConfig {
        std::string base_url = "https://fapi.binance.com";
        std::string quote_asset = "USDT";
        std::string token_supply_path = "config/token_supply.json";
        std::vector<std::string> symbols; // Empty = every perpetual with the quote asset
        int price_window_days = 30;
        long request_timeout_ms = 10000;
    };

    struct EngineConfig {
        long cycle_interval_seconds = 60;
        std::string database_path = "statarb_engine.db";
        std::string dashboard_state_path = "dashboard_state.json";
        std::string log_level = "info";

        FactorConfig factors;
        SignalConfig signals;
        SizingConfig sizing;
        RiskConfig risk;
        ExecutionConfig execution;
        ExchangeConfig exchange;
        MarketDataConfig market_data;
    };

    // Parse and validate; throws core::ConfigException on bad input
    EngineConfig parseEngineConfig(const json& config_json);

    // Load JSON from disk, then parseEngineConfig; credentials come from the environment
    EngineConfig loadEngineConfig(const std::string& path);

    // Throws core::ConfigException describing the first invalid option
    void validate(const EngineConfig& config);

} // namespace config
} // namespace core
