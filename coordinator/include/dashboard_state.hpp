#pragma once

#include "cycle_summary.hpp"
#include "datatypes.hpp"
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace coordinator {

    // Read-only view for the dashboard: the last summary plus a copy of every position
    nlohmann::json dashboardStateToJson(const core::CycleSummary& summary,
                                        const std::map<std::string, core::PositionState>& positions);

    // Writes to "<path>.tmp" then renames over path; throws core::StorageException on failure
    void writeDashboardState(const std::string& path, const core::CycleSummary& summary,
                             const std::map<std::string, core::PositionState>& positions);

} // namespace coordinator
