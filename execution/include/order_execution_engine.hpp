#pragma once

#include "exchange_client.hpp"
#include "work_queue.hpp"
#include "risk_manager.hpp"
#include "datatypes.hpp"
#include "config.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace execution {

    using SteadyTime = std::chrono::steady_clock::time_point;

    // --- OrderExecutionEngine ---
    // Turns approved deltas into exchange orders and drives each one through
    //   CREATED -> SUBMITTED -> {PARTIALLY_FILLED -> SUBMITTED | FILLED | REJECTED | FAILED}
    // on a bounded pool of worker threads. Every order ends in a terminal state,
    // which is handed to the commit callback exactly once. Once the exchange has
    // accepted an order it stays active, holding its asset, until the exchange
    // confirms a final state; that may outlive the cycle deadline.
    class OrderExecutionEngine {
    public:
        using CommitCallback = std::function<void(const core::Order&)>;
        using TerminalSink = std::function<void(const core::Order&)>;
        using Sleeper = std::function<void(std::chrono::milliseconds)>;
        using Clock = std::function<SteadyTime()>;

        OrderExecutionEngine(std::shared_ptr<IExchangeClient> client,
                             core::config::ExecutionConfig config,
                             CommitCallback commit);
        ~OrderExecutionEngine();

        OrderExecutionEngine(const OrderExecutionEngine&) = delete;
        OrderExecutionEngine& operator=(const OrderExecutionEngine&) = delete;

        // Test hooks; set before the first submit
        void setSleeper(Sleeper sleeper);
        void setClock(Clock clock);

        // Called after commit for archiving (storage, dashboard)
        void setTerminalSink(TerminalSink sink);

        // Queues an order for the approved delta. Empty when the asset already
        // has an active order or the engine is shut down.
        std::optional<std::future<core::Order>> submit(const risk::ApprovedDelta& approved,
                                                       core::Timestamp cycle_timestamp,
                                                       SteadyTime deadline);

        bool isActive(const std::string& asset) const;
        std::size_t activeCount() const;

        // min(base * 2^(attempt-1), cap)
        std::chrono::milliseconds backoffDelay(int attempt) const;

        // Finishes queued orders, then joins the workers
        void shutdown();

    private:
        struct Job {
            core::Order order;
            SteadyTime deadline;
            std::promise<core::Order> promise;
        };

        // Outcome of one exchange order (one leg of a client order)
        struct LegResult {
            double filled_notional = 0.0;
            double average_fill_price = 0.0;
            bool complete = false;     // Exchange reported FILLED
            bool rejected = false;     // Exchange refused the leg
        };

        void workerLoop();
        void execute(Job& job);
        std::optional<std::string> submitWithRetry(core::Order& order, double notional, int leg);
        // Asks the venue until it answers whether a submit lost in transit was accepted
        std::optional<OrderUpdate> findSubmitted(core::Order& order, const std::string& client_id);
        // Returns only once the exchange reports a final state for the leg
        LegResult pollUntilDone(core::Order& order, const std::string& exchange_order_id);
        void applyLegFill(core::Order& order, const LegResult& leg);
        void finish(Job& job, core::OrderStatus status);

        std::shared_ptr<IExchangeClient> client_;
        core::config::ExecutionConfig config_;
        CommitCallback commit_;
        TerminalSink sink_;
        Sleeper sleeper_;
        Clock clock_;

        WorkQueue<std::shared_ptr<Job>> queue_;
        std::vector<std::thread> workers_;
        std::atomic<bool> stopped_{false};

        mutable std::mutex active_mutex_;
        std::set<std::string> active_assets_;
    };

} // namespace execution
