#include "order_execution_engine.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm> // For std::min, std::max
#include <cmath>     // For std::isfinite
#include <stdexcept> // For std::invalid_argument

namespace execution {

    const char* toString(ExchangeOrderState state) {
        switch (state) {
            case ExchangeOrderState::New:             return "NEW";
            case ExchangeOrderState::PartiallyFilled: return "PARTIALLY_FILLED";
            case ExchangeOrderState::Filled:          return "FILLED";
            case ExchangeOrderState::Canceled:        return "CANCELED";
            case ExchangeOrderState::Rejected:        return "REJECTED";
            case ExchangeOrderState::Expired:         return "EXPIRED";
        }
        return "UNKNOWN";
    }

    OrderExecutionEngine::OrderExecutionEngine(std::shared_ptr<IExchangeClient> client,
                                               core::config::ExecutionConfig config,
                                               CommitCallback commit)
        : client_(std::move(client)),
          config_(std::move(config)),
          commit_(std::move(commit)),
          sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }),
          clock_([] { return std::chrono::steady_clock::now(); })
    {
        if (!client_) throw std::invalid_argument("OrderExecutionEngine requires an exchange client.");
        if (!commit_) throw std::invalid_argument("OrderExecutionEngine requires a commit callback.");

        int worker_count = std::max(1, config_.max_concurrent_orders);
        workers_.reserve(worker_count);
        for (int i = 0; i < worker_count; ++i) {
            workers_.emplace_back(&OrderExecutionEngine::workerLoop, this);
        }
        core::logging::getLogger()->info("OrderExecutionEngine started: exchange='{}', workers={}, retry limit={}",
                                         client_->name(), worker_count, config_.retry_attempt_limit);
    }

    OrderExecutionEngine::~OrderExecutionEngine() {
        shutdown();
    }

    void OrderExecutionEngine::setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void OrderExecutionEngine::setClock(Clock clock) { clock_ = std::move(clock); }
    void OrderExecutionEngine::setTerminalSink(TerminalSink sink) { sink_ = std::move(sink); }

    void OrderExecutionEngine::shutdown() {
        if (stopped_.exchange(true)) return;
        queue_.close();
        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
        core::logging::getLogger()->info("OrderExecutionEngine stopped.");
    }

    std::chrono::milliseconds OrderExecutionEngine::backoffDelay(int attempt) const {
        if (attempt < 1) attempt = 1;
        long delay = config_.backoff_base_ms;
        for (int i = 1; i < attempt && delay < config_.backoff_cap_ms; ++i) {
            delay *= 2;
        }
        return std::chrono::milliseconds(std::min(delay, config_.backoff_cap_ms));
    }

    bool OrderExecutionEngine::isActive(const std::string& asset) const {
        std::lock_guard<std::mutex> lock(active_mutex_);
        return active_assets_.count(asset) > 0;
    }

    std::size_t OrderExecutionEngine::activeCount() const {
        std::lock_guard<std::mutex> lock(active_mutex_);
        return active_assets_.size();
    }

    std::optional<std::future<core::Order>> OrderExecutionEngine::submit(const risk::ApprovedDelta& approved,
                                                                         core::Timestamp cycle_timestamp,
                                                                         SteadyTime deadline)
    {
        auto logger = core::logging::getLogger();
        const std::string& asset = approved.delta.asset;

        auto job = std::make_shared<Job>();
        job->deadline = deadline;
        core::Order& order = job->order;
        order.created_time = std::chrono::system_clock::now();
        order.id = core::utils::generateClientOrderId(order.created_time);
        order.asset = asset;
        order.side = approved.side;
        order.reason = approved.delta.reason;
        order.requested_notional = approved.order_notional;
        order.cycle_timestamp = cycle_timestamp;
        order.status = core::OrderStatus::Created;

        std::future<core::Order> future = job->promise.get_future();
        {
            std::lock_guard<std::mutex> lock(active_mutex_);
            if (stopped_) {
                logger->warn("Order for {} refused: execution engine is shut down.", asset);
                return std::nullopt;
            }
            if (!active_assets_.insert(asset).second) {
                logger->warn("Order for {} refused: another order is still active.", asset);
                return std::nullopt;
            }
        }

        logger->info("Order {} CREATED: {} {} {:.2f} ({})", order.id, asset, core::toString(order.side),
                     order.requested_notional, core::toString(order.reason));
        if (!queue_.push(job)) {
            std::lock_guard<std::mutex> lock(active_mutex_);
            active_assets_.erase(asset);
            logger->warn("Order {} for {} refused: work queue closed.", job->order.id, asset);
            return std::nullopt;
        }
        return future;
    }

    void OrderExecutionEngine::workerLoop() {
        std::shared_ptr<Job> job;
        while (queue_.pop(job)) {
            try {
                execute(*job);
            } catch (const std::exception& e) {
                // An order must never be left without a terminal state
                core::logging::getLogger()->error("Order {} for {} aborted by unexpected error: {}",
                                                  job->order.id, job->order.asset, e.what());
                job->order.error_message = e.what();
                finish(*job, job->order.filled_notional > core::kNotionalEpsilon ? core::OrderStatus::Filled
                                                                                 : core::OrderStatus::Failed);
            }
            job.reset();
        }
    }

    std::optional<std::string> OrderExecutionEngine::submitWithRetry(core::Order& order, double notional, int leg) {
        auto logger = core::logging::getLogger();
        const std::string client_id = leg == 0 ? order.id : fmt::format("{}-r{}", order.id, leg);

        for (int attempt = 1; ; ++attempt) {
            ++order.attempts;
            std::string exchange_id;
            try {
                exchange_id = client_->submitOrder(order.asset, order.side, notional, client_id);
            } catch (const core::ExchangeTransientException& e) {
                order.error_kind = core::ErrorKind::ExchangeTransient;
                order.error_message = e.what();
                auto delay = backoffDelay(attempt);
                logger->warn("Order {} submit attempt {}/{} failed ({}); checking the exchange in {} ms", order.id,
                             attempt, config_.retry_attempt_limit, e.what(), delay.count());
                sleeper_(delay);

                // The failed request may still have placed the order
                std::optional<OrderUpdate> existing = findSubmitted(order, client_id);
                if (existing) {
                    logger->warn("Order {} was accepted as {} despite the failed submit; tracking it", order.id,
                                 existing->exchange_order_id);
                    exchange_id = existing->exchange_order_id;
                } else if (attempt >= config_.retry_attempt_limit) {
                    logger->error("Order {} submit failed after {} attempts: {}", order.id, attempt, e.what());
                    return std::nullopt;
                } else {
                    continue;
                }
            } catch (const core::ApiRequestException& e) {
                // Terminal, or an unclassified API error: never retried
                order.error_kind = core::ErrorKind::ExchangeTerminal;
                order.error_message = e.what();
                logger->error("Order {} rejected by exchange: {}", order.id, e.what());
                return std::nullopt;
            }

            order.exchange_order_id = exchange_id;
            order.status = core::OrderStatus::Submitted;
            logger->info("Order {} SUBMITTED: {} {} {:.2f} (exchange id {}, attempt {})", order.id, order.asset,
                         core::toString(order.side), notional, exchange_id, attempt);
            return exchange_id;
        }
    }

    std::optional<OrderUpdate> OrderExecutionEngine::findSubmitted(core::Order& order, const std::string& client_id) {
        auto logger = core::logging::getLogger();
        for (int failures = 0; ; ++failures) {
            try {
                return client_->findOrder(order.asset, client_id);
            } catch (const core::ApiRequestException& e) {
                auto delay = backoffDelay(failures + 1);
                if (failures == 0) {
                    logger->warn("Order {} lookup of {} failed ({}); retrying in {} ms", order.id, client_id,
                                 e.what(), delay.count());
                } else {
                    logger->debug("Order {} lookup of {} failed again: {}", order.id, client_id, e.what());
                }
                sleeper_(delay);
            }
        }
    }

    OrderExecutionEngine::LegResult OrderExecutionEngine::pollUntilDone(core::Order& order,
                                                                        const std::string& exchange_order_id)
    {
        auto logger = core::logging::getLogger();
        LegResult leg;
        const SteadyTime started = clock_();
        const auto timeout = std::chrono::milliseconds(config_.order_poll_timeout_ms);
        bool cancelled = false;
        int request_errors = 0;

        while (true) {
            OrderUpdate update;
            try {
                if (!cancelled && clock_() - started >= timeout) {
                    if (request_errors == 0) {
                        logger->warn("Order {} unresolved after {} ms; cancelling", order.id,
                                     config_.order_poll_timeout_ms);
                    }
                    update = client_->cancelOrder(order.asset, exchange_order_id);
                    cancelled = true;
                } else {
                    update = client_->pollOrder(order.asset, exchange_order_id);
                }
                request_errors = 0;
            } catch (const core::ApiRequestException& e) {
                // The exchange holds the order: its state is unknown, not failed
                const bool transient = dynamic_cast<const core::ExchangeTransientException*>(&e) != nullptr;
                order.error_kind = transient ? core::ErrorKind::ExchangeTransient : core::ErrorKind::ExchangeTerminal;
                order.error_message = e.what();
                ++request_errors;
                auto delay = backoffDelay(request_errors);
                if (request_errors == 1) {
                    logger->warn("Order {} ({}) request failed: {}; retrying in {} ms", order.id, exchange_order_id,
                                 e.what(), delay.count());
                } else if (request_errors == config_.retry_attempt_limit) {
                    logger->error("Order {} ({}) unreachable after {} requests; keeping {} locked until it resolves",
                                  order.id, exchange_order_id, request_errors, order.asset);
                } else {
                    logger->debug("Order {} request failed again: {}", order.id, e.what());
                }
                sleeper_(delay);
                continue;
            }

            leg.filled_notional = std::max(leg.filled_notional, update.filled_notional);
            if (update.average_fill_price > 0.0) leg.average_fill_price = update.average_fill_price;
            logger->trace("Order {} poll: {} filled {:.2f}", order.id, toString(update.state), update.filled_notional);

            switch (update.state) {
                case ExchangeOrderState::Filled:
                    leg.complete = true;
                    return leg;
                case ExchangeOrderState::Canceled:
                case ExchangeOrderState::Expired:
                    logger->warn("Order {} leg {} ended {} with {:.2f} filled", order.id, exchange_order_id,
                                 toString(update.state), leg.filled_notional);
                    return leg;
                case ExchangeOrderState::Rejected:
                    order.error_kind = core::ErrorKind::ExchangeTerminal;
                    order.error_message = update.message.empty() ? "rejected by exchange" : update.message;
                    leg.rejected = true;
                    return leg;
                case ExchangeOrderState::New:
                case ExchangeOrderState::PartiallyFilled:
                    break;
            }
            sleeper_(std::chrono::milliseconds(config_.order_poll_interval_ms));
        }
    }

    void OrderExecutionEngine::applyLegFill(core::Order& order, const LegResult& leg) {
        if (leg.filled_notional <= core::kNotionalEpsilon) return;
        if (!(leg.average_fill_price > 0.0) || !std::isfinite(leg.average_fill_price)) {
            core::logging::getLogger()->error("Order {} leg reported {:.2f} filled without a fill price", order.id,
                                              leg.filled_notional);
        }

        double previous_quantity = order.average_fill_price > 0.0 ? order.filled_notional / order.average_fill_price : 0.0;
        double leg_quantity = leg.average_fill_price > 0.0 ? leg.filled_notional / leg.average_fill_price : 0.0;
        order.filled_notional += leg.filled_notional;
        double total_quantity = previous_quantity + leg_quantity;
        order.average_fill_price = total_quantity > 0.0 ? order.filled_notional / total_quantity : 0.0;
    }

    void OrderExecutionEngine::execute(Job& job) {
        auto logger = core::logging::getLogger();
        core::Order& order = job.order;
        double remaining = order.requested_notional;

        for (int leg = 0; ; ++leg) {
            std::optional<std::string> exchange_id = submitWithRetry(order, remaining, leg);
            if (!exchange_id) {
                if (order.filled_notional > core::kNotionalEpsilon) {
                    order.remainder_dropped = true;
                    finish(job, core::OrderStatus::Filled);
                } else {
                    finish(job, order.error_kind == core::ErrorKind::ExchangeTerminal ? core::OrderStatus::Rejected
                                                                                      : core::OrderStatus::Failed);
                }
                return;
            }

            LegResult result = pollUntilDone(order, *exchange_id);
            applyLegFill(order, result);

            if (result.complete) {
                finish(job, core::OrderStatus::Filled);
                return;
            }
            if (order.filled_notional <= core::kNotionalEpsilon) {
                if (order.error_message.empty()) order.error_message = "no fill before the order closed";
                finish(job, result.rejected ? core::OrderStatus::Rejected : core::OrderStatus::Failed);
                return;
            }

            remaining = order.requested_notional - order.filled_notional;
            if (remaining < config_.min_order_notional) {
                order.remainder_dropped = remaining > core::kNotionalEpsilon;
                finish(job, core::OrderStatus::Filled);
                return;
            }
            if (result.rejected || clock_() >= job.deadline) {
                logger->warn("Order {} dropping remainder {:.2f} of {:.2f}", order.id, remaining, order.requested_notional);
                order.remainder_dropped = true;
                finish(job, core::OrderStatus::Filled);
                return;
            }

            order.status = core::OrderStatus::PartiallyFilled;
            logger->info("Order {} PARTIALLY_FILLED: {:.2f}/{:.2f}; resubmitting remainder", order.id,
                         order.filled_notional, order.requested_notional);
        }
    }

    void OrderExecutionEngine::finish(Job& job, core::OrderStatus status) {
        auto logger = core::logging::getLogger();
        core::Order& order = job.order;
        order.status = status;
        order.terminal_time = std::chrono::system_clock::now();

        if (status == core::OrderStatus::Filled) {
            logger->info("Order {} FILLED: {} {} {:.2f}/{:.2f} @ {:.6f}{} after {} attempt(s)", order.id, order.asset,
                         core::toString(order.side), order.filled_notional, order.requested_notional,
                         order.average_fill_price, order.remainder_dropped ? " (remainder dropped)" : "", order.attempts);
        } else {
            logger->error("Order {} {}: {} after {} attempt(s): {}", order.id, core::toString(status), order.asset,
                          order.attempts, order.error_message);
        }

        {
            std::lock_guard<std::mutex> lock(active_mutex_);
            active_assets_.erase(order.asset);
        }

        try {
            commit_(order);
        } catch (const std::exception& e) {
            logger->critical("Commit of order {} for {} failed: {}", order.id, order.asset, e.what());
        }
        if (sink_) {
            try {
                sink_(order);
            } catch (const std::exception& e) {
                logger->error("Terminal sink failed for order {}: {}", order.id, e.what());
            }
        }
        job.promise.set_value(order);
    }

} // namespace execution
