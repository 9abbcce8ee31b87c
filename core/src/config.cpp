#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <cstdlib>   // For std::getenv
#include <algorithm> // For std::is_sorted

namespace core {
namespace config {

    namespace { // File-local helpers

        const json* section(const json& root, const char* name) {
            if (!root.contains(name)) return nullptr;
            const json& sec = root.at(name);
            if (!sec.is_object()) {
                throw ConfigException(fmt::format("Config section '{}' must be an object.", name));
            }
            return &sec;
        }

        template<typename T>
        void readNumber(const json* sec, const char* key, T& target) {
            if (!sec || !sec->contains(key)) return; // Keep default
            const json& value = sec->at(key);
            if (!value.is_number()) {
                throw ConfigException(fmt::format("Config option '{}' must be a number.", key));
            }
            target = value.get<T>();
        }

        void readString(const json* sec, const char* key, std::string& target) {
            if (!sec || !sec->contains(key)) return;
            const json& value = sec->at(key);
            if (!value.is_string()) {
                throw ConfigException(fmt::format("Config option '{}' must be a string.", key));
            }
            target = value.get<std::string>();
        }

        void requireRange(double value, double lo, double hi, const char* name) {
            if (!(value >= lo && value <= hi)) {
                throw ConfigException(fmt::format("Config option '{}' = {} outside [{}, {}].", name, value, lo, hi));
            }
        }

        void requirePositive(double value, const char* name) {
            if (!(value > 0.0)) {
                throw ConfigException(fmt::format("Config option '{}' must be positive (got {}).", name, value));
            }
        }

    } // end anonymous namespace

    EngineConfig parseEngineConfig(const json& root) {
        if (!root.is_object()) {
            throw ConfigException("Engine config root must be a JSON object.");
        }
        EngineConfig cfg;

        const json* engine = section(root, "engine");
        readNumber(engine, "cycle_interval_seconds", cfg.cycle_interval_seconds);
        readString(engine, "database_path", cfg.database_path);
        readString(engine, "dashboard_state_path", cfg.dashboard_state_path);
        readString(engine, "log_level", cfg.log_level);

        const json* strategy = section(root, "strategy");
        readNumber(strategy, "min_liquidity_usd", cfg.factors.min_liquidity_usd);
        readNumber(strategy, "min_market_cap_usd", cfg.factors.min_market_cap_usd);
        readNumber(strategy, "pump_reference_gain", cfg.factors.pump_reference_gain);
        readNumber(strategy, "pump_lookback_days", cfg.factors.pump_lookback_days);
        if (strategy && strategy->contains("liquidity_tier_volumes")) {
            const json& tiers = strategy->at("liquidity_tier_volumes");
            if (!tiers.is_array() || tiers.size() != 3) {
                throw ConfigException("Config option 'liquidity_tier_volumes' must be an array of 3 numbers.");
            }
            cfg.factors.liquidity_tier_volumes = tiers.get<std::vector<double>>();
        }
        if (strategy && strategy->contains("classification")) {
            const json& table = strategy->at("classification");
            if (!table.is_object()) {
                throw ConfigException("Config option 'classification' must map symbol -> track.");
            }
            for (auto it = table.begin(); it != table.end(); ++it) {
                if (!it.value().is_string()) {
                    throw ConfigException(fmt::format("Classification for '{}' must be a string.", it.key()));
                }
                cfg.factors.classification[it.key()] = trackTagFromString(it.value().get<std::string>());
            }
        }
        readNumber(strategy, "unlock_threshold", cfg.signals.unlock_threshold);
        readNumber(strategy, "pump_score_weight", cfg.signals.pump_score_weight);
        readNumber(strategy, "liquidity_weight", cfg.signals.liquidity_weight);
        readNumber(strategy, "meme_weight", cfg.signals.meme_weight);
        readNumber(strategy, "min_signal_strength", cfg.signals.min_signal_strength);
        readNumber(strategy, "entry_size_floor", cfg.sizing.entry_size_floor);

        const json* risk = section(root, "risk");
        readNumber(risk, "portfolio_equity", cfg.risk.portfolio_equity);
        readNumber(risk, "entry_cap_pct", cfg.risk.entry_cap_pct);
        readNumber(risk, "max_cap_pct", cfg.risk.max_cap_pct);
        readNumber(risk, "portfolio_ceiling_pct", cfg.risk.portfolio_ceiling_pct);
        readNumber(risk, "stop_loss_threshold", cfg.risk.stop_loss_threshold);
        readNumber(risk, "reduce_loss_threshold", cfg.risk.reduce_loss_threshold);
        readNumber(risk, "reduce_profit_threshold", cfg.risk.reduce_profit_threshold);
        readNumber(risk, "reduce_position_ratio", cfg.risk.reduce_position_ratio);
        readNumber(risk, "near_cap_ratio", cfg.risk.near_cap_ratio);
        readNumber(risk, "min_order_notional", cfg.risk.min_order_notional);
        readNumber(risk, "fill_slippage_buffer_pct", cfg.risk.fill_slippage_buffer_pct);
        cfg.sizing.min_order_notional = cfg.risk.min_order_notional;
        cfg.execution.min_order_notional = cfg.risk.min_order_notional;

        const json* execution = section(root, "execution");
        readNumber(execution, "retry_attempt_limit", cfg.execution.retry_attempt_limit);
        readNumber(execution, "backoff_base_ms", cfg.execution.backoff_base_ms);
        readNumber(execution, "backoff_cap_ms", cfg.execution.backoff_cap_ms);
        readNumber(execution, "max_concurrent_orders", cfg.execution.max_concurrent_orders);
        readNumber(execution, "order_poll_interval_ms", cfg.execution.order_poll_interval_ms);
        readNumber(execution, "order_poll_timeout_ms", cfg.execution.order_poll_timeout_ms);

        const json* exchange = section(root, "exchange");
        readString(exchange, "base_url", cfg.exchange.base_url);
        readNumber(exchange, "recv_window_ms", cfg.exchange.recv_window_ms);
        readNumber(exchange, "request_timeout_ms", cfg.exchange.request_timeout_ms);

        const json* market = section(root, "market_data");
        readString(market, "base_url", cfg.market_data.base_url);
        readString(market, "quote_asset", cfg.market_data.quote_asset);
        readString(market, "token_supply_path", cfg.market_data.token_supply_path);
        readNumber(market, "price_window_days", cfg.market_data.price_window_days);
        readNumber(market, "request_timeout_ms", cfg.market_data.request_timeout_ms);
        if (market && market->contains("symbols")) {
            const json& symbols = market->at("symbols");
            if (!symbols.is_array()) {
                throw ConfigException("Config option 'symbols' must be an array of strings.");
            }
            cfg.market_data.symbols = symbols.get<std::vector<std::string>>();
        }

        validate(cfg);
        return cfg;
    }

    void validate(const EngineConfig& cfg) {
        if (cfg.cycle_interval_seconds <= 0) {
            throw ConfigException("Config option 'cycle_interval_seconds' must be positive.");
        }
        requirePositive(cfg.risk.portfolio_equity, "portfolio_equity");
        requireRange(cfg.risk.entry_cap_pct, 0.0, 1.0, "entry_cap_pct");
        requireRange(cfg.risk.max_cap_pct, 0.0, 1.0, "max_cap_pct");
        if (cfg.risk.entry_cap_pct > cfg.risk.max_cap_pct) {
            throw ConfigException("Config option 'entry_cap_pct' cannot exceed 'max_cap_pct'.");
        }
        requireRange(cfg.risk.portfolio_ceiling_pct, 0.0, 10.0, "portfolio_ceiling_pct");
        requireRange(cfg.risk.stop_loss_threshold, 0.0, 10.0, "stop_loss_threshold");
        requireRange(cfg.risk.reduce_loss_threshold, 0.0, 10.0, "reduce_loss_threshold");
        requireRange(cfg.risk.reduce_profit_threshold, 0.0, 10.0, "reduce_profit_threshold");
        requireRange(cfg.risk.reduce_position_ratio, 0.0, 1.0, "reduce_position_ratio");
        requireRange(cfg.risk.near_cap_ratio, 0.0, 1.0, "near_cap_ratio");
        requireRange(cfg.risk.fill_slippage_buffer_pct, 0.0, 0.5, "fill_slippage_buffer_pct");
        if (cfg.risk.min_order_notional < 0.0) {
            throw ConfigException("Config option 'min_order_notional' cannot be negative.");
        }

        requireRange(cfg.signals.unlock_threshold, 0.0, 1.0, "unlock_threshold");
        if (cfg.signals.pump_score_weight < 0.0 || cfg.signals.liquidity_weight < 0.0 || cfg.signals.meme_weight < 0.0) {
            throw ConfigException("Signal weights cannot be negative.");
        }
        requirePositive(cfg.signals.pump_score_weight + cfg.signals.liquidity_weight + cfg.signals.meme_weight,
                        "sum of signal weights");
        requireRange(cfg.signals.min_signal_strength, 0.0, 1.0, "min_signal_strength");
        requireRange(cfg.sizing.entry_size_floor, 0.0, 1.0, "entry_size_floor");

        requirePositive(cfg.factors.pump_reference_gain, "pump_reference_gain");
        if (cfg.factors.pump_lookback_days < 1) {
            throw ConfigException("Config option 'pump_lookback_days' must be at least 1.");
        }
        if (!std::is_sorted(cfg.factors.liquidity_tier_volumes.begin(), cfg.factors.liquidity_tier_volumes.end())) {
            throw ConfigException("Config option 'liquidity_tier_volumes' must be ascending.");
        }

        if (cfg.execution.retry_attempt_limit < 1) {
            throw ConfigException("Config option 'retry_attempt_limit' must be at least 1.");
        }
        if (cfg.execution.backoff_base_ms < 0 || cfg.execution.backoff_cap_ms < cfg.execution.backoff_base_ms) {
            throw ConfigException("Config options 'backoff_base_ms'/'backoff_cap_ms' must satisfy 0 <= base <= cap.");
        }
        if (cfg.execution.max_concurrent_orders < 1) {
            throw ConfigException("Config option 'max_concurrent_orders' must be at least 1.");
        }
        if (cfg.execution.order_poll_interval_ms < 0 || cfg.execution.order_poll_timeout_ms <= 0) {
            throw ConfigException("Config options 'order_poll_interval_ms'/'order_poll_timeout_ms' are invalid.");
        }
        if (cfg.market_data.price_window_days < 2) {
            throw ConfigException("Config option 'price_window_days' must be at least 2.");
        }
    }

    EngineConfig loadEngineConfig(const std::string& path) {
        auto logger = core::logging::getLogger();
        logger->info("Loading engine config from: {}", path);

        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open config file: {}", path));
        }

        json config_json;
        try {
            config_json = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }

        EngineConfig cfg;
        try {
            cfg = parseEngineConfig(config_json);
        } catch (const json::exception& e) {
            throw ConfigException(fmt::format("Invalid value in config file '{}': {}", path, e.what()));
        }

        // --- Credentials never live in the file ---
        const char* api_key_env = std::getenv("BINANCE_API_KEY");
        const char* api_secret_env = std::getenv("BINANCE_API_SECRET");
        cfg.exchange.api_key = api_key_env ? api_key_env : "";
        cfg.exchange.api_secret = api_secret_env ? api_secret_env : "";

        logger->info("Config loaded: interval={}s equity={:.2f} entry_cap={:.4f} max_cap={:.4f} ceiling={:.4f} retries={}",
                     cfg.cycle_interval_seconds, cfg.risk.portfolio_equity, cfg.risk.entry_cap_pct,
                     cfg.risk.max_cap_pct, cfg.risk.portfolio_ceiling_pct, cfg.execution.retry_attempt_limit);
        return cfg;
    }

} // namespace config
} // namespace core
