#include "dashboard_state.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <cstdio>  // For std::rename
#include <fstream>

namespace coordinator {

    nlohmann::json dashboardStateToJson(const core::CycleSummary& summary,
                                        const std::map<std::string, core::PositionState>& positions)
    {
        using core::utils::timestampToString;

        nlohmann::json diagnostics = nlohmann::json::array();
        for (const auto& d : summary.diagnostics) {
            diagnostics.push_back({{"kind", core::toString(d.kind)},
                                   {"asset", d.asset},
                                   {"order_id", d.order_id},
                                   {"message", d.message}});
        }

        nlohmann::json position_list = nlohmann::json::array();
        for (const auto& entry : positions) {
            const core::PositionState& p = entry.second;
            position_list.push_back({{"asset", p.asset},
                                     {"current_notional", p.current_notional},
                                     {"quantity", p.quantity},
                                     {"average_entry_price", p.average_entry_price},
                                     {"entry_notional_cap", p.entry_notional_cap},
                                     {"max_notional_cap", p.max_notional_cap},
                                     {"unrealized_pnl", p.unrealized_pnl},
                                     {"realized_pnl", p.realized_pnl},
                                     {"has_inflight_order", p.has_inflight_order},
                                     {"last_update_time", timestampToString(p.last_update_time)}});
        }

        return {
            {"cycle_timestamp", timestampToString(summary.cycle_timestamp)},
            {"finished_time", timestampToString(summary.finished_time)},
            {"status", core::toString(summary.status)},
            {"abort_reason", summary.abort_reason},
            {"signals_emitted", summary.signals_emitted},
            {"deltas", {{"forced", summary.forced_deltas},
                        {"proposed", summary.deltas_proposed},
                        {"approved", summary.deltas_approved},
                        {"clamped", summary.deltas_clamped},
                        {"rejected", summary.deltas_rejected},
                        {"skipped", summary.deltas_skipped}}},
            {"orders", {{"submitted", summary.orders_submitted},
                        {"filled", summary.orders_filled},
                        {"failed", summary.orders_failed},
                        {"inflight", summary.orders_inflight}}},
            {"equity", summary.equity},
            {"total_exposure", summary.total_exposure},
            {"unrealized_pnl", summary.unrealized_pnl},
            {"realized_pnl", summary.realized_pnl},
            {"positions", position_list},
            {"diagnostics", diagnostics}
        };
    }

    void writeDashboardState(const std::string& path, const core::CycleSummary& summary,
                             const std::map<std::string, core::PositionState>& positions)
    {
        const std::string tmp_path = path + ".tmp";
        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out.is_open()) {
                throw core::StorageException("Cannot open dashboard state file: " + tmp_path);
            }
            out << dashboardStateToJson(summary, positions).dump(2);
            if (!out) {
                throw core::StorageException("Failed writing dashboard state file: " + tmp_path);
            }
        }
        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            throw core::StorageException("Cannot move dashboard state into place: " + path);
        }
    }

} // namespace coordinator
