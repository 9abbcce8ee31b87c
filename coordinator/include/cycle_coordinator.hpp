#pragma once

#include "datatypes.hpp"
#include "cycle_summary.hpp"
#include "market_data_source.hpp"
#include "storage_sink.hpp"
#include "factor_engine.hpp"
#include "signal_generator.hpp"
#include "position_sizer.hpp"
#include "risk_manager.hpp"
#include "order_execution_engine.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace coordinator {

    // --- CycleCoordinator ---
    // Runs snapshot -> factors -> signals -> sizing -> risk -> execution once per
    // interval on the calling thread. Orders outliving their cycle keep running on
    // the execution engine and are reported by the next cycle.
    class CycleCoordinator {
    public:
        using SnapshotListener = std::function<void(const core::MarketSnapshot&)>;
        using EquitySource = std::function<std::optional<double>()>;

        CycleCoordinator(std::shared_ptr<data::IMarketDataSource> market_data,
                         factors::FactorEngine factor_engine,
                         strategy_engine::SignalGenerator signal_generator,
                         strategy_engine::PositionSizer position_sizer,
                         std::shared_ptr<risk::RiskManager> risk_manager,
                         std::shared_ptr<execution::OrderExecutionEngine> execution_engine,
                         std::chrono::milliseconds cycle_interval);

        // Optional collaborators; set before the first cycle
        void setStorage(std::shared_ptr<data::IStorageSink> storage);
        void setSnapshotListener(SnapshotListener listener); // e.g. paper exchange marks
        void setEquitySource(EquitySource source);
        void setDashboardStatePath(std::string path);

        // One full pass. Never throws for per-asset or per-order failures; a missing
        // snapshot or a corrupted risk store yields an ABORTED summary.
        core::CycleSummary runCycle(core::Timestamp now);

        // Fixed-interval loop until `stop` is set. An overrunning cycle pushes the
        // next one back instead of overlapping it.
        void run(const std::atomic<bool>& stop);

        std::optional<core::CycleSummary> latestSummary() const;
        std::chrono::milliseconds cycleInterval() const { return cycle_interval_; }

    private:
        void runPipeline(core::CycleSummary& summary, execution::SteadyTime deadline);
        void submitDelta(const core::PositionDelta& delta, core::CycleSummary& summary, execution::SteadyTime deadline,
                         std::vector<std::future<core::Order>>& futures);
        void recordOrder(const core::Order& order, core::CycleSummary& summary, bool carried_over);
        void collectCarriedOver(core::CycleSummary& summary);
        void refreshEquity();
        void finalize(core::CycleSummary& summary);

        std::shared_ptr<data::IMarketDataSource> market_data_;
        factors::FactorEngine factor_engine_;
        strategy_engine::SignalGenerator signal_generator_;
        strategy_engine::PositionSizer position_sizer_;
        std::shared_ptr<risk::RiskManager> risk_manager_;
        std::shared_ptr<execution::OrderExecutionEngine> execution_engine_;
        std::chrono::milliseconds cycle_interval_;

        std::shared_ptr<data::IStorageSink> storage_;
        SnapshotListener snapshot_listener_;
        EquitySource equity_source_;
        std::string dashboard_state_path_;

        // Orders still running when their cycle ended
        std::vector<std::future<core::Order>> carried_over_;

        mutable std::mutex summary_mutex_;
        std::optional<core::CycleSummary> latest_summary_;
    };

} // namespace coordinator
