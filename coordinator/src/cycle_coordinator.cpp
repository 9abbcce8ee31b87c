#include "cycle_coordinator.hpp"
#include "dashboard_state.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm> // For std::min
#include <set>
#include <stdexcept>
#include <thread>

namespace coordinator {

    CycleCoordinator::CycleCoordinator(std::shared_ptr<data::IMarketDataSource> market_data,
                                       factors::FactorEngine factor_engine,
                                       strategy_engine::SignalGenerator signal_generator,
                                       strategy_engine::PositionSizer position_sizer,
                                       std::shared_ptr<risk::RiskManager> risk_manager,
                                       std::shared_ptr<execution::OrderExecutionEngine> execution_engine,
                                       std::chrono::milliseconds cycle_interval)
        : market_data_(std::move(market_data)),
          factor_engine_(std::move(factor_engine)),
          signal_generator_(std::move(signal_generator)),
          position_sizer_(std::move(position_sizer)),
          risk_manager_(std::move(risk_manager)),
          execution_engine_(std::move(execution_engine)),
          cycle_interval_(cycle_interval)
    {
        if (!market_data_ || !risk_manager_ || !execution_engine_) {
            throw std::invalid_argument("CycleCoordinator requires market data, risk manager and execution engine.");
        }
        if (cycle_interval_.count() <= 0) {
            throw core::ConfigException("cycle interval must be positive");
        }
    }

    void CycleCoordinator::setStorage(std::shared_ptr<data::IStorageSink> storage) {
        storage_ = std::move(storage);
        if (!storage_) return;

        // Terminal order events are archived as they happen, in or out of a cycle.
        // The sink runs after commit, so the stored position includes the fill.
        std::shared_ptr<data::IStorageSink> sink = storage_;
        std::shared_ptr<risk::RiskManager> risk_manager = risk_manager_;
        execution_engine_->setTerminalSink([sink, risk_manager](const core::Order& order) {
            auto logger = core::logging::getLogger();
            if (!sink->saveOrderEvent(order)) {
                logger->warn("Order event {} was not persisted.", order.id);
            }
            if (order.filled_notional <= core::kNotionalEpsilon) return;
            std::optional<core::PositionState> position = risk_manager->position(order.asset);
            if (position && !sink->savePosition(*position)) {
                logger->error("Position for {} was not persisted after order {}.", order.asset, order.id);
            }
        });
    }

    void CycleCoordinator::setSnapshotListener(SnapshotListener listener) { snapshot_listener_ = std::move(listener); }
    void CycleCoordinator::setEquitySource(EquitySource source) { equity_source_ = std::move(source); }
    void CycleCoordinator::setDashboardStatePath(std::string path) { dashboard_state_path_ = std::move(path); }

    std::optional<core::CycleSummary> CycleCoordinator::latestSummary() const {
        std::lock_guard<std::mutex> lock(summary_mutex_);
        return latest_summary_;
    }

    void CycleCoordinator::refreshEquity() {
        if (!equity_source_) return;
        try {
            std::optional<double> equity = equity_source_();
            if (equity && *equity > 0.0) {
                risk_manager_->setEquity(*equity);
            }
        } catch (const core::ApiRequestException& e) {
            core::logging::getLogger()->warn("Equity refresh failed, keeping {:.2f}: {}", risk_manager_->equity(), e.what());
        }
    }

    core::CycleSummary CycleCoordinator::runCycle(core::Timestamp now) {
        auto logger = core::logging::getLogger();
        const execution::SteadyTime deadline = std::chrono::steady_clock::now() + cycle_interval_;

        core::CycleSummary summary;
        summary.cycle_timestamp = now;
        logger->info("=== Cycle {} started ===", core::utils::timestampToString(now));

        collectCarriedOver(summary);

        try {
            risk_manager_->checkIntegrity();
            refreshEquity();
            runPipeline(summary, deadline);
        } catch (const core::SnapshotUnavailableException& e) {
            logger->critical("Cycle aborted, no market snapshot: {}", e.what());
            summary.status = core::CycleStatus::Aborted;
            summary.abort_reason = fmt::format("snapshot unavailable: {}", e.what());
            summary.diagnostics.push_back(core::makeDiagnostic(core::ErrorKind::DataGap, "", summary.abort_reason, now));
        } catch (const core::RiskStateException& e) {
            logger->critical("Cycle aborted, risk state corrupted: {}", e.what());
            summary.status = core::CycleStatus::Aborted;
            summary.abort_reason = fmt::format("risk state corrupted: {}", e.what());
        }

        finalize(summary);
        return summary;
    }

    void CycleCoordinator::runPipeline(core::CycleSummary& summary, execution::SteadyTime deadline) {
        auto logger = core::logging::getLogger();
        const core::Timestamp now = summary.cycle_timestamp;

        // --- Snapshot ---
        core::MarketSnapshot snapshot = market_data_->getSnapshot(now);
        snapshot.timestamp = now;
        summary.snapshot_assets = snapshot.quotes.size();
        risk_manager_->updateMarks(snapshot);
        if (snapshot_listener_) snapshot_listener_(snapshot);
        if (storage_ && !storage_->saveSnapshot(snapshot)) {
            logger->warn("Snapshot for cycle was not persisted.");
        }

        // --- Factors ---
        factors::FactorEngineResult factor_result = factor_engine_.compute(snapshot);
        summary.factor_records = factor_result.records.size();
        summary.funding_excluded = factor_result.funding_excluded;
        summary.diagnostics.insert(summary.diagnostics.end(), factor_result.diagnostics.begin(),
                                   factor_result.diagnostics.end());
        if (storage_ && !storage_->saveFactorRecords(factor_result.records)) {
            logger->warn("Factor records for cycle were not persisted.");
        }

        // --- Signals ---
        std::vector<core::Signal> signals = signal_generator_.generate(factor_result.records);
        summary.signals_emitted = signals.size();
        if (storage_ && !storage_->saveSignals(signals)) {
            logger->warn("Signals for cycle were not persisted.");
        }

        // --- Deltas: risk-forced first, then sizing ---
        std::vector<core::PositionDelta> forced = risk_manager_->evaluatePnl();
        std::vector<core::PositionDelta> sized = position_sizer_.propose(signals, risk_manager_->exposureSnapshot());
        summary.forced_deltas = forced.size();

        std::set<std::string> forced_assets;
        for (const auto& delta : forced) {
            forced_assets.insert(delta.asset);
            summary.diagnostics.push_back(core::makeDiagnostic(core::ErrorKind::RiskForcedOverride, delta.asset,
                                                               delta.note, now));
        }

        std::vector<std::future<core::Order>> futures;
        for (const auto& delta : forced) {
            ++summary.deltas_proposed;
            submitDelta(delta, summary, deadline, futures);
        }
        for (const auto& delta : sized) {
            if (forced_assets.count(delta.asset)) {
                logger->debug("Skipping {} delta for {}: risk action takes priority", core::toString(delta.reason),
                              delta.asset);
                ++summary.deltas_skipped;
                continue;
            }
            ++summary.deltas_proposed;
            submitDelta(delta, summary, deadline, futures);
        }

        // --- Wait for this cycle's orders ---
        for (auto& future : futures) {
            if (future.wait_until(deadline) == std::future_status::ready) {
                recordOrder(future.get(), summary, false);
            } else {
                ++summary.orders_inflight;
                carried_over_.push_back(std::move(future));
            }
        }
        if (summary.orders_inflight > 0) {
            logger->warn("{} order(s) still in flight at the cycle deadline; they will commit when done.",
                         summary.orders_inflight);
        }
    }

    void CycleCoordinator::submitDelta(const core::PositionDelta& delta, core::CycleSummary& summary,
                                       execution::SteadyTime deadline, std::vector<std::future<core::Order>>& futures)
    {
        auto logger = core::logging::getLogger();
        const core::Timestamp now = summary.cycle_timestamp;

        risk::ValidationResult result = risk_manager_->validate(delta);
        if (!result.isApproved()) {
            ++summary.deltas_rejected;
            const risk::Rejection& rejection = *result.rejection;
            summary.diagnostics.push_back(core::makeDiagnostic(
                core::ErrorKind::ValidationRejected, delta.asset,
                fmt::format("{} {:+.2f} rejected: {} ({})", core::toString(delta.reason), delta.target_change_notional,
                            risk::toString(rejection.reason), rejection.detail),
                now));
            return;
        }

        const risk::ApprovedDelta& approved = *result.approved;
        ++summary.deltas_approved;
        if (approved.clamped) {
            ++summary.deltas_clamped;
            logger->info("{} {} clamped from {:+.2f} to {:+.2f} ({})", core::toString(delta.reason), delta.asset,
                         delta.target_change_notional, approved.approved_change_notional,
                         approved.clamp_reason ? risk::toString(*approved.clamp_reason) : "unspecified");
        }

        std::optional<std::future<core::Order>> future = execution_engine_->submit(approved, now, deadline);
        if (!future) {
            // Never reached the exchange: give the lock back
            risk_manager_->releaseLock(delta.asset);
            --summary.deltas_approved;
            ++summary.deltas_rejected;
            summary.diagnostics.push_back(core::makeDiagnostic(core::ErrorKind::ValidationRejected, delta.asset,
                                                               "execution engine refused the order", now));
            return;
        }
        ++summary.orders_submitted;
        futures.push_back(std::move(*future));
    }

    void CycleCoordinator::recordOrder(const core::Order& order, core::CycleSummary& summary, bool carried_over) {
        const core::Timestamp now = summary.cycle_timestamp;
        const char* origin = carried_over ? " (from an earlier cycle)" : "";

        if (!carried_over) {
            if (order.status == core::OrderStatus::Filled) {
                ++summary.orders_filled;
            } else {
                ++summary.orders_failed;
            }
        }

        if (order.error_kind) {
            summary.diagnostics.push_back(core::makeDiagnostic(
                *order.error_kind, order.asset,
                fmt::format("order {}{}: {}", core::toString(order.status), origin, order.error_message), now,
                order.id));
        }
        if (order.remainder_dropped) {
            summary.diagnostics.push_back(core::makeDiagnostic(
                core::ErrorKind::ExchangeTerminal, order.asset,
                fmt::format("remainder dropped{}: filled {:.2f} of {:.2f}", origin, order.filled_notional,
                            order.requested_notional),
                now, order.id));
        }
    }

    void CycleCoordinator::collectCarriedOver(core::CycleSummary& summary) {
        auto logger = core::logging::getLogger();
        auto it = carried_over_.begin();
        while (it != carried_over_.end()) {
            if (it->wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
                core::Order order = it->get();
                logger->info("Order {} for {} finished after its cycle: {}", order.id, order.asset,
                             core::toString(order.status));
                recordOrder(order, summary, true);
                it = carried_over_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void CycleCoordinator::finalize(core::CycleSummary& summary) {
        auto logger = core::logging::getLogger();

        core::ExposureView exposure = risk_manager_->exposureSnapshot();
        summary.equity = exposure.equity;
        summary.total_exposure = exposure.total_notional;
        for (const auto& entry : exposure.positions) {
            summary.unrealized_pnl += entry.second.unrealized_pnl;
            summary.realized_pnl += entry.second.realized_pnl;
        }
        summary.finished_time = std::chrono::system_clock::now();

        logger->info("=== Cycle {} {}: {} signals, deltas {}/{} approved ({} clamped, {} rejected), orders {} filled, "
                     "{} failed, {} in flight, exposure {:.2f}, {} diagnostics ===",
                     core::utils::timestampToString(summary.cycle_timestamp), core::toString(summary.status),
                     summary.signals_emitted, summary.deltas_approved, summary.deltas_proposed, summary.deltas_clamped,
                     summary.deltas_rejected, summary.orders_filled, summary.orders_failed, summary.orders_inflight,
                     summary.total_exposure, summary.diagnostics.size());

        if (storage_ && !storage_->saveCycleSummary(summary)) {
            logger->warn("Cycle summary was not persisted.");
        }
        if (!dashboard_state_path_.empty()) {
            try {
                writeDashboardState(dashboard_state_path_, summary, exposure.positions);
            } catch (const core::StorageException& e) {
                logger->warn("Dashboard state not written: {}", e.what());
            }
        }

        std::lock_guard<std::mutex> lock(summary_mutex_);
        latest_summary_ = summary;
    }

    void CycleCoordinator::run(const std::atomic<bool>& stop) {
        auto logger = core::logging::getLogger();
        logger->info("Cycle loop started: interval {} ms", cycle_interval_.count());

        auto next_start = std::chrono::steady_clock::now();
        while (!stop.load()) {
            runCycle(std::chrono::system_clock::now());

            next_start += cycle_interval_;
            auto now = std::chrono::steady_clock::now();
            if (now > next_start) {
                logger->warn("Cycle overran its interval by {} ms; next cycle starts now",
                             std::chrono::duration_cast<std::chrono::milliseconds>(now - next_start).count());
                next_start = now;
            }

            // Sleep in short slices so a stop request is honoured promptly
            while (!stop.load() && std::chrono::steady_clock::now() < next_start) {
                auto remaining = next_start - std::chrono::steady_clock::now();
                std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
                    remaining, std::chrono::milliseconds(200)));
            }
        }
        logger->info("Cycle loop stopped; {} order(s) still in flight.", carried_over_.size());
    }

} // namespace coordinator
