#include "factor_engine.hpp"
#include "roc_indicator.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>     // For std::isfinite
#include <algorithm> // For std::min, std::any_of

namespace factors {

    namespace {

        bool finite(const std::optional<double>& value) {
            return value.has_value() && std::isfinite(*value);
        }

        void recordGap(core::Diagnostics& diagnostics, const std::string& asset,
                       core::Timestamp ts, const std::string& message) {
            diagnostics.push_back(core::makeDiagnostic(core::ErrorKind::DataGap, asset, message, ts));
        }

    } // end anonymous namespace

    FactorEngine::FactorEngine(core::config::FactorConfig config)
        : config_(std::move(config))
    {
        core::logging::getLogger()->debug("FactorEngine created: min_liquidity={:.0f}, min_market_cap={:.0f}, classified assets={}",
                                          config_.min_liquidity_usd, config_.min_market_cap_usd, config_.classification.size());
    }

    FactorEngineResult FactorEngine::compute(const core::MarketSnapshot& snapshot) const {
        auto logger = core::logging::getLogger();
        FactorEngineResult result;
        result.records.reserve(snapshot.quotes.size());

        for (const auto& entry : snapshot.quotes) {
            bool funding_excluded = false;
            auto record = buildRecord(entry.first, entry.second, snapshot.timestamp, result.diagnostics, funding_excluded);
            if (record) {
                result.records.push_back(std::move(*record));
            } else if (funding_excluded) {
                ++result.funding_excluded;
            }
        }

        logger->info("Factor engine: {} assets in snapshot -> {} records ({} negative funding, {} data gaps)",
                     snapshot.quotes.size(), result.records.size(), result.funding_excluded, result.diagnostics.size());
        return result;
    }

    std::optional<core::FactorRecord> FactorEngine::buildRecord(const std::string& asset,
                                                                const core::MarketQuote& quote,
                                                                core::Timestamp cycle_timestamp,
                                                                core::Diagnostics& diagnostics,
                                                                bool& funding_excluded) const
    {
        auto logger = core::logging::getLogger();

        // --- Required fields ---
        if (!finite(quote.funding_rate)) {
            recordGap(diagnostics, asset, cycle_timestamp, "missing funding_rate");
            logger->warn("DATA_GAP {}: missing funding_rate", asset);
            return std::nullopt;
        }
        // Hard gate: negative funding never reaches the signal generator
        if (*quote.funding_rate < 0.0) {
            funding_excluded = true;
            logger->debug("{} excluded: negative funding rate {:.6f}", asset, *quote.funding_rate);
            return std::nullopt;
        }
        if (!finite(quote.price) || *quote.price <= 0.0) {
            recordGap(diagnostics, asset, cycle_timestamp, "missing or non-positive price");
            logger->warn("DATA_GAP {}: missing or non-positive price", asset);
            return std::nullopt;
        }
        if (!finite(quote.volume_24h) || *quote.volume_24h < 0.0) {
            recordGap(diagnostics, asset, cycle_timestamp, "missing or negative volume_24h");
            logger->warn("DATA_GAP {}: missing or negative volume_24h", asset);
            return std::nullopt;
        }
        if (!finite(quote.market_cap) || *quote.market_cap < 0.0) {
            recordGap(diagnostics, asset, cycle_timestamp, "missing or negative market_cap");
            logger->warn("DATA_GAP {}: missing or negative market_cap", asset);
            return std::nullopt;
        }
        if (!finite(quote.unlock_progress) || *quote.unlock_progress < 0.0 || *quote.unlock_progress > 1.0) {
            recordGap(diagnostics, asset, cycle_timestamp, "missing or out-of-range unlock_progress");
            logger->warn("DATA_GAP {}: missing or out-of-range unlock_progress", asset);
            return std::nullopt;
        }
        bool bad_window = quote.recent_prices.size() < 2 ||
            std::any_of(quote.recent_prices.begin(), quote.recent_prices.end(),
                        [](double p) { return !std::isfinite(p) || p <= 0.0; });
        if (bad_window) {
            recordGap(diagnostics, asset, cycle_timestamp,
                      fmt::format("invalid price-change window ({} points)", quote.recent_prices.size()));
            logger->warn("DATA_GAP {}: invalid price-change window ({} points)", asset, quote.recent_prices.size());
            return std::nullopt;
        }

        core::FactorRecord record;
        record.asset = asset;
        record.cycle_timestamp = cycle_timestamp;
        record.funding_rate = *quote.funding_rate;
        record.price = *quote.price;
        record.volume_24h = *quote.volume_24h;
        record.market_cap = *quote.market_cap;
        record.unlock_progress_ratio = *quote.unlock_progress;
        record.liquidity_tier = liquidityTier(record.volume_24h, record.market_cap);
        record.track_tag = classify(asset);

        try {
            record.pump_score = pumpScore(quote.recent_prices);
        } catch (const core::IndicatorCalculationException& e) {
            recordGap(diagnostics, asset, cycle_timestamp, fmt::format("pump score failed: {}", e.what()));
            logger->warn("DATA_GAP {}: pump score failed: {}", asset, e.what());
            return std::nullopt;
        }

        logger->debug("Factors {}: funding={:.6f} tier={} pump={:.3f} track={} unlock={:.3f}",
                      asset, record.funding_rate, record.liquidity_tier, record.pump_score,
                      core::toString(record.track_tag), record.unlock_progress_ratio);
        return record;
    }

    int FactorEngine::liquidityTier(double volume_24h, double market_cap) const {
        if (volume_24h < config_.min_liquidity_usd || market_cap < config_.min_market_cap_usd) {
            return 0;
        }
        const auto& tiers = config_.liquidity_tier_volumes;
        if (volume_24h >= tiers[2]) return 3;
        if (volume_24h >= tiers[1]) return 2;
        return 1;
    }

    double FactorEngine::pumpScore(const std::vector<double>& recent_prices) const {
        if (recent_prices.size() < 2) return 0.0;
        int period = std::min(config_.pump_lookback_days, static_cast<int>(recent_prices.size()) - 1);

        indicators::RocIndicator roc(period);
        roc.calculate(recent_prices);
        double peak_gain = roc.getPeak() / 100.0; // ROC is in percent
        return core::utils::clamp01(peak_gain / config_.pump_reference_gain);
    }

    core::TrackTag FactorEngine::classify(const std::string& asset) const {
        auto it = config_.classification.find(asset);
        return it != config_.classification.end() ? it->second : core::TrackTag::Other;
    }

} // namespace factors
