#pragma once

#include <map>
#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <functional>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp"
#include "cycle_summary.hpp"
#include "storage_sink.hpp"

namespace data {

class DatabaseManager : public IStorageSink {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager() override;

    // Delete copy constructor and assignment operator
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // CREATE TABLE IF NOT EXISTS for every table
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // IStorageSink
    bool saveSnapshot(const core::MarketSnapshot& snapshot) override;
    bool saveFactorRecords(const std::vector<core::FactorRecord>& records) override;
    bool saveSignals(const std::vector<core::Signal>& signals) override;
    bool saveOrderEvent(const core::Order& order) override;
    bool saveCycleSummary(const core::CycleSummary& summary) override;

    // One row per asset, replaced after every commit
    bool savePosition(const core::PositionState& position) override;

    // Every stored position, closed ones included (they carry realized PnL)
    std::map<std::string, core::PositionState> loadPositions();

    // Signals of one cycle, in rank order
    std::vector<core::Signal> querySignals(core::Timestamp cycle_timestamp);

    // Terminal order events with terminal_time in [start_time, end_time]
    std::vector<core::Order> queryOrderEvents(core::Timestamp start_time, core::Timestamp end_time);

    std::vector<core::FactorRecord> queryFactorRecords(core::Timestamp cycle_timestamp);

    std::optional<core::CycleSummary> latestCycleSummary();

private:
    using Binder = std::function<void(sqlite3_stmt*, std::size_t)>;

    // Prepared insert of `count` rows inside one transaction; caller holds mutex_
    bool insertBatch(const char* sql, std::size_t count, const Binder& bind, const char* what);

    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
    std::recursive_mutex mutex_; // Order events arrive from execution workers
};

} // namespace data
