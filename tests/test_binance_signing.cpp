#include <cassert>
#include <iostream>
#include <string>

#include "binance_exchange_client.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

using namespace execution;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)

TEST(test_hmac_sha256_rfc4231_vector) {
    ASSERT_EQ(hmacSha256Hex("Jefe", "what do ya want for nothing?"),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(test_hmac_output_is_lowercase_hex) {
    std::string signature = hmacSha256Hex("secret", "symbol=PEPEUSDT&side=SELL&type=MARKET&timestamp=1718000000000");
    ASSERT_EQ(signature.size(), 64u);
    for (char c : signature) {
        ASSERT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
    }
}

TEST(test_missing_credentials_rejected) {
    core::config::ExchangeConfig config;
    config.api_key = "key";
    bool threw = false;
    try {
        BinanceExchangeClient client(config);
    } catch (const core::ConfigException&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

int main() {
    core::logging::initialize("test_binance_signing", spdlog::level::err, spdlog::level::debug);
    std::cout << "=== Binance Signing Tests ===\n\n";

    RUN_TEST(test_hmac_sha256_rfc4231_vector);
    RUN_TEST(test_hmac_output_is_lowercase_hex);
    RUN_TEST(test_missing_credentials_rejected);

    std::cout << "\n=== All binance signing tests passed! ===\n";
    return 0;
}
