#include "binance_exchange_client.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <cmath>   // For std::floor
#include <cstdio>  // For std::snprintf
#include <cstdlib> // For std::strtod

namespace execution {

    namespace {

        using json = nlohmann::json;

        // Binance error codes worth retrying
        bool isTransientCode(int code) {
            switch (code) {
                case -1000: // UNKNOWN
                case -1001: // DISCONNECTED
                case -1003: // TOO_MANY_REQUESTS
                case -1007: // TIMEOUT
                case -1008: // SERVER_BUSY
                case -1021: // INVALID_TIMESTAMP (clock drift)
                    return true;
                default:
                    return false;
            }
        }

        double parseNumber(const json& value) {
            if (value.is_string()) return std::strtod(value.get<std::string>().c_str(), nullptr);
            if (value.is_number()) return value.get<double>();
            return 0.0;
        }

        ExchangeOrderState parseState(const std::string& status) {
            if (status == "NEW") return ExchangeOrderState::New;
            if (status == "PARTIALLY_FILLED") return ExchangeOrderState::PartiallyFilled;
            if (status == "FILLED") return ExchangeOrderState::Filled;
            if (status == "CANCELED") return ExchangeOrderState::Canceled;
            if (status == "REJECTED") return ExchangeOrderState::Rejected;
            if (status == "EXPIRED" || status == "EXPIRED_IN_MATCH") return ExchangeOrderState::Expired;
            throw core::ExchangeTerminalException(fmt::format("Unknown Binance order status '{}'", status));
        }

        // Binance error body: {"code": -2013, "msg": "Order does not exist."}
        int errorCodeOf(const std::string& body) {
            try {
                return json::parse(body).value("code", 0);
            } catch (const json::exception&) {
                return 0;
            }
        }

        constexpr int kOrderDoesNotExist = -2013;

        int decimalsOf(const std::string& step) {
            auto dot = step.find('.');
            if (dot == std::string::npos) return 0;
            auto last = step.find_last_not_of('0');
            return last == std::string::npos || last <= dot ? 0 : static_cast<int>(last - dot);
        }

    } // end anonymous namespace

    std::string hmacSha256Hex(const std::string& key, const std::string& data) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_len = 0;

        unsigned char* result = HMAC(EVP_sha256(),
                                     key.data(), static_cast<int>(key.size()),
                                     reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                                     digest, &digest_len);
        if (!result) {
            throw core::ExchangeTerminalException("HMAC-SHA256 signing failed.");
        }

        std::string hex;
        hex.reserve(digest_len * 2);
        char buf[3];
        for (unsigned int i = 0; i < digest_len; ++i) {
            std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
            hex.append(buf, 2);
        }
        return hex;
    }

    BinanceExchangeClient::BinanceExchangeClient(core::config::ExchangeConfig config)
        : config_(std::move(config))
    {
        auto logger = core::logging::getLogger();
        if (config_.api_key.empty() || config_.api_secret.empty()) {
            throw core::ConfigException("Live mode requires BINANCE_API_KEY and BINANCE_API_SECRET.");
        }
        logger->info("BinanceExchangeClient created: base_url={}", config_.base_url);
    }

    // --- HTTP helpers ---

    void BinanceExchangeClient::checkResponse(const cpr::Response& response, const std::string& what) const {
        if (response.error) {
            throw core::ExchangeTransientException(fmt::format("{}: network error ({}): {}", what,
                                                               static_cast<int>(response.error.code),
                                                               response.error.message));
        }
        long status = response.status_code;
        if (status == 200) return;

        if (status == 429 || status == 418 || status >= 500) {
            throw core::ExchangeTransientException(fmt::format("{}: HTTP {} {}", what, status, response.text));
        }

        int code = 0;
        std::string msg = response.text;
        try {
            json body = json::parse(response.text);
            code = body.value("code", 0);
            msg = body.value("msg", response.text);
        } catch (const json::exception& e) {
            core::logging::getLogger()->debug("{}: unparseable error body: {}", what, e.what());
        }

        if (isTransientCode(code)) {
            throw core::ExchangeTransientException(fmt::format("{}: HTTP {} code {}: {}", what, status, code, msg));
        }
        throw core::ExchangeTerminalException(fmt::format("{}: HTTP {} code {}: {}", what, status, code, msg));
    }

    std::string BinanceExchangeClient::publicGet(const std::string& path, const std::string& query) {
        std::string url = config_.base_url + path;
        if (!query.empty()) url += "?" + query;
        core::logging::getLogger()->trace("GET {}", url);

        cpr::Response response = cpr::Get(cpr::Url{url}, cpr::Timeout{std::chrono::milliseconds(config_.request_timeout_ms)});
        checkResponse(response, "GET " + path);
        return response.text;
    }

    std::string BinanceExchangeClient::signedRequest(const std::string& method, const std::string& path,
                                                     const std::string& query)
    {
        cpr::Response response = sendSigned(method, path, query);
        checkResponse(response, method + " " + path);
        return response.text;
    }

    cpr::Response BinanceExchangeClient::sendSigned(const std::string& method, const std::string& path,
                                                    const std::string& query)
    {
        std::string full_query = query;
        if (!full_query.empty()) full_query += "&";
        full_query += fmt::format("recvWindow={}&timestamp={}", config_.recv_window_ms,
                                  core::utils::toEpochMillis(std::chrono::system_clock::now()));
        full_query += "&signature=" + hmacSha256Hex(config_.api_secret, full_query);

        const std::string url = config_.base_url + path + "?" + full_query;
        cpr::Header headers = {{"X-MBX-APIKEY", config_.api_key}};
        cpr::Timeout timeout{std::chrono::milliseconds(config_.request_timeout_ms)};
        core::logging::getLogger()->trace("{} {}", method, path);

        if (method == "POST") {
            return cpr::Post(cpr::Url{url}, headers, timeout);
        }
        if (method == "DELETE") {
            return cpr::Delete(cpr::Url{url}, headers, timeout);
        }
        return cpr::Get(cpr::Url{url}, headers, timeout);
    }

    // --- Market metadata ---

    BinanceExchangeClient::LotFilter BinanceExchangeClient::lotFilter(const std::string& symbol) {
        {
            std::lock_guard<std::mutex> lock(filters_mutex_);
            auto it = filters_.find(symbol);
            if (it != filters_.end()) return it->second;
        }

        std::string body = publicGet("/fapi/v1/exchangeInfo", "");
        std::map<std::string, LotFilter> parsed;
        try {
            json info = json::parse(body);
            for (const auto& sym : info.at("symbols")) {
                LotFilter filter;
                for (const auto& f : sym.at("filters")) {
                    // MARKET_LOT_SIZE applies to market orders; fall back to LOT_SIZE
                    const std::string type = f.value("filterType", "");
                    if (type == "MARKET_LOT_SIZE" || (type == "LOT_SIZE" && filter.step_size <= 0.0)) {
                        std::string step = f.value("stepSize", "0");
                        filter.step_size = std::strtod(step.c_str(), nullptr);
                        filter.min_qty = parseNumber(f.value("minQty", json("0")));
                        filter.precision = decimalsOf(step);
                    }
                }
                parsed[sym.value("symbol", "")] = filter;
            }
        } catch (const json::exception& e) {
            throw core::ExchangeTransientException(fmt::format("exchangeInfo parse failed: {}", e.what()));
        }

        std::lock_guard<std::mutex> lock(filters_mutex_);
        filters_ = std::move(parsed);
        auto it = filters_.find(symbol);
        if (it == filters_.end() || it->second.step_size <= 0.0) {
            throw core::ExchangeTerminalException(fmt::format("Symbol {} is not tradable on {}", symbol, name()));
        }
        return it->second;
    }

    double BinanceExchangeClient::markPrice(const std::string& symbol) {
        std::string body = publicGet("/fapi/v1/premiumIndex", "symbol=" + symbol);
        try {
            double price = parseNumber(json::parse(body).at("markPrice"));
            if (!(price > 0.0)) {
                throw core::ExchangeTransientException(fmt::format("No mark price for {}", symbol));
            }
            return price;
        } catch (const json::exception& e) {
            throw core::ExchangeTransientException(fmt::format("premiumIndex parse failed for {}: {}", symbol, e.what()));
        }
    }

    std::string BinanceExchangeClient::formatQuantity(double quantity, const LotFilter& filter) const {
        double steps = std::floor(quantity / filter.step_size + 1e-9);
        return fmt::format("{:.{}f}", steps * filter.step_size, filter.precision);
    }

    OrderUpdate BinanceExchangeClient::parseOrder(const std::string& body) const {
        try {
            json j = json::parse(body);
            OrderUpdate update;
            update.exchange_order_id = std::to_string(j.at("orderId").get<long long>());
            update.state = parseState(j.at("status").get<std::string>());
            update.filled_notional = parseNumber(j.value("cumQuote", json("0")));
            update.average_fill_price = parseNumber(j.value("avgPrice", json("0")));
            return update;
        } catch (const json::exception& e) {
            throw core::ExchangeTransientException(fmt::format("order response parse failed: {}", e.what()));
        }
    }

    // --- IExchangeClient ---

    std::string BinanceExchangeClient::submitOrder(const std::string& asset, core::OrderSide side, double notional,
                                                   const std::string& client_order_id)
    {
        auto logger = core::logging::getLogger();
        LotFilter filter = lotFilter(asset);
        double price = markPrice(asset);
        double quantity = notional / price;
        if (quantity < filter.min_qty) {
            throw core::ExchangeTerminalException(fmt::format("{} quantity {:.8f} below exchange minimum {:.8f}",
                                                              asset, quantity, filter.min_qty));
        }

        std::string query = fmt::format("symbol={}&side={}&type=MARKET&quantity={}&newClientOrderId={}&newOrderRespType=RESULT",
                                        asset, core::toString(side), formatQuantity(quantity, filter), client_order_id);
        if (side == core::OrderSide::Buy) {
            query += "&reduceOnly=true"; // Covers never flip the account long
        }
        logger->debug("Binance submit: {}", query);

        OrderUpdate placed = parseOrder(signedRequest("POST", "/fapi/v1/order", query));
        return placed.exchange_order_id;
    }

    OrderUpdate BinanceExchangeClient::pollOrder(const std::string& asset, const std::string& exchange_order_id) {
        return parseOrder(signedRequest("GET", "/fapi/v1/order",
                                        fmt::format("symbol={}&orderId={}", asset, exchange_order_id)));
    }

    OrderUpdate BinanceExchangeClient::cancelOrder(const std::string& asset, const std::string& exchange_order_id) {
        try {
            return parseOrder(signedRequest("DELETE", "/fapi/v1/order",
                                            fmt::format("symbol={}&orderId={}", asset, exchange_order_id)));
        } catch (const core::ExchangeTerminalException& e) {
            // -2011: already filled or closed; report the final state instead
            core::logging::getLogger()->info("Cancel of {} refused ({}); fetching final state", exchange_order_id, e.what());
            return pollOrder(asset, exchange_order_id);
        }
    }

    std::optional<OrderUpdate> BinanceExchangeClient::findOrder(const std::string& asset,
                                                                const std::string& client_order_id)
    {
        const std::string path = "/fapi/v1/order";
        cpr::Response response = sendSigned("GET", path,
                                            fmt::format("symbol={}&origClientOrderId={}", asset, client_order_id));
        if (!response.error && response.status_code == 400 && errorCodeOf(response.text) == kOrderDoesNotExist) {
            core::logging::getLogger()->debug("No {} order with client id {}", asset, client_order_id);
            return std::nullopt;
        }
        checkResponse(response, "GET " + path);
        return parseOrder(response.text);
    }

    std::optional<std::map<std::string, core::PositionState>> BinanceExchangeClient::fetchOpenPositions() {
        std::string body = signedRequest("GET", "/fapi/v2/positionRisk", "");
        std::map<std::string, core::PositionState> shorts;
        try {
            for (const auto& item : json::parse(body)) {
                double amount = parseNumber(item.value("positionAmt", json("0")));
                if (amount >= 0.0) continue; // Flat or long: not ours
                core::PositionState position;
                position.asset = item.value("symbol", "");
                position.quantity = -amount;
                position.average_entry_price = parseNumber(item.value("entryPrice", json("0")));
                position.current_notional = position.quantity * position.average_entry_price;
                shorts[position.asset] = position;
            }
        } catch (const json::exception& e) {
            throw core::ExchangeTransientException(fmt::format("positionRisk parse failed: {}", e.what()));
        }
        core::logging::getLogger()->info("Venue reports {} open short position(s).", shorts.size());
        return shorts;
    }

    std::optional<double> BinanceExchangeClient::fetchAccountEquity() {
        std::string body = signedRequest("GET", "/fapi/v2/account", "");
        try {
            double equity = parseNumber(json::parse(body).at("totalMarginBalance"));
            if (equity > 0.0) return equity;
            return std::nullopt;
        } catch (const json::exception& e) {
            throw core::ExchangeTransientException(fmt::format("account response parse failed: {}", e.what()));
        }
    }

} // namespace execution
