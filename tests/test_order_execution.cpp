#include <cassert>
#include <cmath>
#include <functional>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "order_execution_engine.hpp"
#include "paper_exchange_client.hpp"
#include "risk_manager.hpp"
#include "logging.hpp"
#include "test_fakes.hpp"

using namespace execution;
using testing::ScriptedExchangeClient;
using Step = ScriptedExchangeClient::Step;

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

// ============================================
// Test Helpers
// ============================================

core::config::ExecutionConfig testConfig() {
    core::config::ExecutionConfig config;
    config.retry_attempt_limit = 3;
    config.backoff_base_ms = 100;
    config.backoff_cap_ms = 1000;
    config.max_concurrent_orders = 4;
    config.order_poll_interval_ms = 1;
    config.order_poll_timeout_ms = 2000;
    config.min_order_notional = 10.0;
    return config;
}

core::PositionDelta newSignal(const std::string& asset, double notional) {
    core::PositionDelta delta;
    delta.asset = asset;
    delta.target_change_notional = notional;
    delta.reason = core::DeltaReason::NewSignal;
    delta.strength_score = 0.5;
    return delta;
}

SteadyTime in(std::chrono::milliseconds d) { return std::chrono::steady_clock::now() + d; }

SteadyTime expired() { return std::chrono::steady_clock::now() - std::chrono::seconds(1); }

// Polls a condition for up to two seconds
bool waitUntil(const std::function<bool()>& condition) {
    for (int i = 0; i < 2000; ++i) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return condition();
}

// Engine wired to a real RiskManager, as in production
struct Harness {
    explicit Harness(core::config::ExecutionConfig config = testConfig())
        : risk(core::config::RiskConfig{}),
          exchange(std::make_shared<ScriptedExchangeClient>())
    {
        engine = std::make_unique<OrderExecutionEngine>(exchange, config, [this](const core::Order& order) {
            ++commits;
            risk.commit(order);
        });
        // Backoff delays are recorded, not slept; short poll pauses are real
        engine->setSleeper([this](std::chrono::milliseconds d) {
            if (d.count() >= 50) {
                std::lock_guard<std::mutex> lock(delays_mutex);
                delays.push_back(d.count());
            } else {
                std::this_thread::sleep_for(d);
            }
        });
    }

    std::future<core::Order> submit(const std::string& asset, double notional, SteadyTime deadline) {
        risk::ValidationResult result = risk.validate(newSignal(asset, notional));
        ASSERT_TRUE(result.isApproved());
        auto future = engine->submit(*result.approved, std::chrono::system_clock::now(), deadline);
        ASSERT_TRUE(future.has_value());
        return std::move(*future);
    }

    risk::RiskManager risk;
    std::shared_ptr<ScriptedExchangeClient> exchange;
    std::atomic<int> commits{0};
    std::mutex delays_mutex;
    std::vector<long> delays;
    std::unique_ptr<OrderExecutionEngine> engine; // Last: joins workers before the rest goes away
};

// ============================================
// Retry & Terminal States
// ============================================

TEST(test_transient_failures_then_fill) {
    Harness h;
    h.exchange->script("ABC", {Step::Transient, Step::Transient, Step::Fill});

    core::Order order = h.submit("ABC", 2000.0, in(std::chrono::seconds(5))).get();

    ASSERT_EQ(order.status, core::OrderStatus::Filled);
    ASSERT_EQ(order.attempts, 3);
    ASSERT_NEAR(order.filled_notional, 2000.0, 1e-9);
    ASSERT_EQ(h.commits.load(), 1);
    ASSERT_EQ(h.exchange->submit_calls.load(), 3);

    auto position = h.risk.position("ABC");
    ASSERT_TRUE(position.has_value());
    ASSERT_NEAR(position->current_notional, 2000.0, 1e-9);
    ASSERT_FALSE(h.risk.hasInflightOrder("ABC"));

    // min(base * 2^(n-1), cap) between attempts
    ASSERT_EQ(h.delays.size(), 2u);
    ASSERT_EQ(h.delays[0], 100);
    ASSERT_EQ(h.delays[1], 200);
}

TEST(test_retry_budget_exhausted_fails_without_effect) {
    Harness h;
    h.exchange->script("ABC", {Step::Transient, Step::Transient, Step::Transient});

    core::Order order = h.submit("ABC", 2000.0, in(std::chrono::seconds(5))).get();

    ASSERT_EQ(order.status, core::OrderStatus::Failed);
    ASSERT_EQ(order.attempts, 3);
    ASSERT_TRUE(order.error_kind.has_value());
    ASSERT_EQ(*order.error_kind, core::ErrorKind::ExchangeTransient);
    ASSERT_NEAR(order.filled_notional, 0.0, 1e-12);
    ASSERT_EQ(h.commits.load(), 1);
    ASSERT_FALSE(h.risk.position("ABC").has_value());
    ASSERT_FALSE(h.risk.hasInflightOrder("ABC"));
}

TEST(test_terminal_error_rejects_without_retry) {
    Harness h;
    h.exchange->script("ABC", {Step::Terminal});

    core::Order order = h.submit("ABC", 2000.0, in(std::chrono::seconds(5))).get();

    ASSERT_EQ(order.status, core::OrderStatus::Rejected);
    ASSERT_EQ(order.attempts, 1);
    ASSERT_EQ(*order.error_kind, core::ErrorKind::ExchangeTerminal);
    ASSERT_EQ(h.exchange->submit_calls.load(), 1);
    ASSERT_TRUE(h.delays.empty());
    ASSERT_FALSE(h.risk.hasInflightOrder("ABC"));
}

TEST(test_submit_accepted_despite_transient_error_is_tracked) {
    Harness h;
    h.exchange->script("ABC", {Step::AcceptThenTransient});

    core::Order order = h.submit("ABC", 2000.0, in(std::chrono::seconds(5))).get();

    // Found by client id after the backoff instead of being sent twice
    ASSERT_EQ(order.status, core::OrderStatus::Filled);
    ASSERT_EQ(order.exchange_order_id, "x-1");
    ASSERT_EQ(h.exchange->submit_calls.load(), 1);
    ASSERT_EQ(h.exchange->find_calls.load(), 1);
    ASSERT_EQ(h.exchange->overlap_violations.load(), 0);
    ASSERT_EQ(h.delays.size(), 1u);
    ASSERT_EQ(h.commits.load(), 1);
    ASSERT_NEAR(h.risk.position("ABC")->current_notional, 2000.0, 1e-9);
}

TEST(test_failed_lookup_is_retried_before_any_resubmit) {
    Harness h;
    h.exchange->script("ABC", {Step::AcceptThenTransient});
    h.exchange->fail_finds = true;

    std::future<core::Order> future = h.submit("ABC", 2000.0, in(std::chrono::seconds(5)));
    ASSERT_TRUE(waitUntil([&] { return h.exchange->find_calls.load() >= 4; }));
    ASSERT_EQ(h.exchange->submit_calls.load(), 1);
    ASSERT_TRUE(h.risk.hasInflightOrder("ABC"));

    h.exchange->fail_finds = false;
    core::Order order = future.get();
    ASSERT_EQ(order.status, core::OrderStatus::Filled);
    ASSERT_EQ(h.exchange->submit_calls.load(), 1);
    ASSERT_NEAR(order.filled_notional, 2000.0, 1e-9);
}

TEST(test_backoff_delay_doubles_up_to_cap) {
    Harness h;
    ASSERT_EQ(h.engine->backoffDelay(0).count(), 100);
    ASSERT_EQ(h.engine->backoffDelay(1).count(), 100);
    ASSERT_EQ(h.engine->backoffDelay(2).count(), 200);
    ASSERT_EQ(h.engine->backoffDelay(3).count(), 400);
    ASSERT_EQ(h.engine->backoffDelay(4).count(), 800);
    ASSERT_EQ(h.engine->backoffDelay(5).count(), 1000);
    ASSERT_EQ(h.engine->backoffDelay(40).count(), 1000);
}

// ============================================
// Partial Fills & Timeouts
// ============================================

TEST(test_partial_fill_resubmits_remainder) {
    Harness h;
    h.exchange->script("ABC", {Step::PartialFill, Step::Fill});

    core::Order order = h.submit("ABC", 2000.0, in(std::chrono::seconds(5))).get();

    ASSERT_EQ(order.status, core::OrderStatus::Filled);
    ASSERT_FALSE(order.remainder_dropped);
    ASSERT_NEAR(order.filled_notional, 2000.0, 1e-9);
    ASSERT_EQ(order.attempts, 2);
    ASSERT_EQ(h.exchange->client_ids.size(), 2u);
    ASSERT_EQ(h.exchange->client_ids[1], order.id + "-r1");
    ASSERT_NEAR(h.risk.position("ABC")->current_notional, 2000.0, 1e-9);
}

TEST(test_partial_fill_after_deadline_drops_remainder) {
    Harness h;
    h.exchange->script("ABC", {Step::PartialFill});

    core::Order order = h.submit("ABC", 2000.0, std::chrono::steady_clock::now() - std::chrono::seconds(1)).get();

    ASSERT_EQ(order.status, core::OrderStatus::Filled);
    ASSERT_TRUE(order.remainder_dropped);
    ASSERT_NEAR(order.filled_notional, 1000.0, 1e-9);
    ASSERT_EQ(h.exchange->submit_calls.load(), 1);
    ASSERT_NEAR(h.risk.position("ABC")->current_notional, 1000.0, 1e-9);
}

TEST(test_unresolved_order_is_cancelled_after_poll_timeout) {
    core::config::ExecutionConfig config = testConfig();
    config.order_poll_timeout_ms = 30;
    Harness h(config);
    h.exchange->script("ABC", {Step::Hold});

    core::Order order = h.submit("ABC", 2000.0, in(std::chrono::seconds(5))).get();

    ASSERT_EQ(h.exchange->cancel_calls.load(), 1);
    ASSERT_EQ(order.status, core::OrderStatus::Failed);
    ASSERT_NEAR(order.filled_notional, 0.0, 1e-12);
    ASSERT_FALSE(h.risk.hasInflightOrder("ABC"));
}

TEST(test_poll_errors_after_acceptance_keep_order_open) {
    core::config::ExecutionConfig config = testConfig();
    config.order_poll_timeout_ms = 60000;
    Harness h(config);
    h.exchange->fail_polls = true;

    // Deadline already gone: polling outlives the cycle
    std::future<core::Order> future = h.submit("ABC", 2000.0, expired());
    ASSERT_TRUE(waitUntil([&] { return h.exchange->poll_calls.load() >= 8; }));

    // Well past the retry limit the order is still open and the asset still locked
    ASSERT_TRUE(h.engine->isActive("ABC"));
    ASSERT_TRUE(h.risk.hasInflightOrder("ABC"));
    ASSERT_EQ(h.commits.load(), 0);
    risk::ValidationResult second = h.risk.validate(newSignal("ABC", 500.0));
    ASSERT_FALSE(second.isApproved());
    ASSERT_EQ(second.rejection->reason, risk::RejectReason::ConflictingInflightOrder);

    h.exchange->fail_polls = false;
    core::Order order = future.get();
    ASSERT_EQ(order.status, core::OrderStatus::Filled);
    ASSERT_NEAR(order.filled_notional, 2000.0, 1e-9);
    ASSERT_EQ(h.exchange->submit_calls.load(), 1);
    ASSERT_EQ(h.commits.load(), 1);
    ASSERT_NEAR(h.risk.position("ABC")->current_notional, 2000.0, 1e-9);
    ASSERT_FALSE(h.risk.hasInflightOrder("ABC"));

    // Poll retries back off up to the cap
    ASSERT_EQ(h.delays.front(), 100);
    ASSERT_EQ(h.delays.back(), 1000);
}

TEST(test_failed_cancel_keeps_order_open_until_final_state) {
    core::config::ExecutionConfig config = testConfig();
    config.order_poll_timeout_ms = 30;
    Harness h(config);
    h.exchange->script("ABC", {Step::Hold});
    h.exchange->fail_cancels = true;

    std::future<core::Order> future = h.submit("ABC", 2000.0, in(std::chrono::seconds(5)));
    ASSERT_TRUE(waitUntil([&] { return h.exchange->cancel_calls.load() >= 3; }));
    ASSERT_TRUE(h.engine->isActive("ABC"));
    ASSERT_TRUE(h.risk.hasInflightOrder("ABC"));
    ASSERT_EQ(h.commits.load(), 0);

    // The order filled on the exchange while the cancels were failing
    h.exchange->release();
    h.exchange->fail_cancels = false;
    core::Order order = future.get();

    ASSERT_EQ(order.status, core::OrderStatus::Filled);
    ASSERT_NEAR(order.filled_notional, 2000.0, 1e-9);
    ASSERT_EQ(h.commits.load(), 1);
    ASSERT_NEAR(h.risk.position("ABC")->current_notional, 2000.0, 1e-9);
    ASSERT_FALSE(h.engine->isActive("ABC"));
}

// ============================================
// One Active Order Per Asset
// ============================================

TEST(test_second_order_for_active_asset_is_refused) {
    Harness h;
    h.exchange->script("ABC", {Step::Hold});

    std::future<core::Order> first = h.submit("ABC", 1000.0, in(std::chrono::seconds(5)));
    ASSERT_TRUE(h.engine->isActive("ABC"));

    risk::ApprovedDelta duplicate;
    duplicate.delta = newSignal("ABC", 500.0);
    duplicate.approved_change_notional = 500.0;
    duplicate.order_notional = 500.0;
    auto refused = h.engine->submit(duplicate, std::chrono::system_clock::now(), in(std::chrono::seconds(5)));
    ASSERT_FALSE(refused.has_value());

    h.exchange->release();
    ASSERT_EQ(first.get().status, core::OrderStatus::Filled);
    ASSERT_FALSE(h.engine->isActive("ABC"));
    ASSERT_EQ(h.engine->activeCount(), 0u);
}

TEST(test_concurrent_submissions_never_overlap_per_asset) {
    auto exchange = std::make_shared<ScriptedExchangeClient>();
    std::atomic<int> commits{0};
    auto engine = std::make_shared<OrderExecutionEngine>(exchange, testConfig(), [&](const core::Order&) {
        ++commits;
    });
    engine->setSleeper([](std::chrono::milliseconds) {});

    const std::vector<std::string> assets {"AAA", "BBB"};
    std::mutex futures_mutex;
    std::vector<std::future<core::Order>> futures;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 25; ++i) {
                risk::ApprovedDelta approved;
                approved.delta = newSignal(assets[(t + i) % assets.size()], 100.0);
                approved.approved_change_notional = 100.0;
                approved.order_notional = 100.0;
                auto future = engine->submit(approved, std::chrono::system_clock::now(), in(std::chrono::seconds(5)));
                if (future) {
                    std::lock_guard<std::mutex> lock(futures_mutex);
                    futures.push_back(std::move(*future));
                }
            }
        });
    }
    for (auto& thread : threads) thread.join();
    for (auto& future : futures) {
        ASSERT_EQ(future.get().status, core::OrderStatus::Filled);
    }

    ASSERT_TRUE(!futures.empty());
    ASSERT_EQ(commits.load(), static_cast<int>(futures.size()));
    ASSERT_EQ(exchange->overlap_violations.load(), 0);
    ASSERT_EQ(engine->activeCount(), 0u);
    engine->shutdown();
}

TEST(test_submit_after_shutdown_is_refused) {
    Harness h;
    h.engine->shutdown();

    risk::ApprovedDelta approved;
    approved.delta = newSignal("ABC", 100.0);
    approved.order_notional = 100.0;
    ASSERT_FALSE(h.engine->submit(approved, std::chrono::system_clock::now(), in(std::chrono::seconds(1))).has_value());
}

// ============================================
// Paper Exchange
// ============================================

TEST(test_paper_exchange_fills_at_mark_with_slippage) {
    PaperExchangeClient paper(10.0);
    paper.setMark("ABC", 2.0);

    std::string id = paper.submitOrder("ABC", core::OrderSide::Sell, 500.0, "cid-1");
    OrderUpdate update = paper.pollOrder("ABC", id);
    ASSERT_EQ(update.state, ExchangeOrderState::Filled);
    ASSERT_NEAR(update.filled_notional, 500.0, 1e-9);
    ASSERT_NEAR(update.average_fill_price, 1.998, 1e-9);

    std::string buy_id = paper.submitOrder("ABC", core::OrderSide::Buy, 500.0, "cid-2");
    ASSERT_NEAR(paper.pollOrder("ABC", buy_id).average_fill_price, 2.002, 1e-9);
    ASSERT_FALSE(paper.fetchAccountEquity().has_value());
    ASSERT_FALSE(paper.fetchOpenPositions().has_value());

    auto found = paper.findOrder("ABC", "cid-1");
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(found->exchange_order_id, id);
    ASSERT_FALSE(paper.findOrder("ABC", "cid-3").has_value());
}

TEST(test_paper_exchange_without_mark_rejects_order) {
    auto paper = std::make_shared<PaperExchangeClient>();
    risk::RiskManager risk(core::config::RiskConfig{});
    OrderExecutionEngine engine(paper, testConfig(), [&](const core::Order& order) { risk.commit(order); });

    risk::ValidationResult result = risk.validate(newSignal("NOPE", 1000.0));
    ASSERT_TRUE(result.isApproved());
    core::Order order = engine.submit(*result.approved, std::chrono::system_clock::now(),
                                      in(std::chrono::seconds(1)))->get();

    ASSERT_EQ(order.status, core::OrderStatus::Rejected);
    ASSERT_FALSE(risk.hasInflightOrder("NOPE"));
}

int main() {
    core::logging::initialize("test_order_execution", spdlog::level::warn, spdlog::level::debug);
    std::cout << "=== Order Execution Engine Tests ===\n\n";

    RUN_TEST(test_transient_failures_then_fill);
    RUN_TEST(test_retry_budget_exhausted_fails_without_effect);
    RUN_TEST(test_terminal_error_rejects_without_retry);
    RUN_TEST(test_submit_accepted_despite_transient_error_is_tracked);
    RUN_TEST(test_failed_lookup_is_retried_before_any_resubmit);
    RUN_TEST(test_backoff_delay_doubles_up_to_cap);

    RUN_TEST(test_partial_fill_resubmits_remainder);
    RUN_TEST(test_partial_fill_after_deadline_drops_remainder);
    RUN_TEST(test_unresolved_order_is_cancelled_after_poll_timeout);
    RUN_TEST(test_poll_errors_after_acceptance_keep_order_open);
    RUN_TEST(test_failed_cancel_keeps_order_open_until_final_state);

    RUN_TEST(test_second_order_for_active_asset_is_refused);
    RUN_TEST(test_concurrent_submissions_never_overlap_per_asset);
    RUN_TEST(test_submit_after_shutdown_is_refused);

    RUN_TEST(test_paper_exchange_fills_at_mark_with_slippage);
    RUN_TEST(test_paper_exchange_without_mark_rejects_order);

    std::cout << "\n=== All order execution tests passed! ===\n";
    return 0;
}
