#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace data
{

    namespace
    {
        void bindText(sqlite3_stmt *stmt, int idx, const std::string &value)
        {
            sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
        }

        void bindTimestamp(sqlite3_stmt *stmt, int idx, const core::Timestamp &ts)
        {
            bindText(stmt, idx, core::utils::timestampToString(ts));
        }

        void bindOptional(sqlite3_stmt *stmt, int idx, const std::optional<double> &value)
        {
            if (value)
                sqlite3_bind_double(stmt, idx, *value);
            else
                sqlite3_bind_null(stmt, idx);
        }

        std::string columnText(sqlite3_stmt *stmt, int col)
        {
            const unsigned char *text = sqlite3_column_text(stmt, col);
            return text ? reinterpret_cast<const char *>(text) : "";
        }

        std::string diagnosticsToJson(const core::Diagnostics &diagnostics)
        {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &d : diagnostics)
            {
                arr.push_back({{"kind", core::toString(d.kind)},
                               {"asset", d.asset},
                               {"order_id", d.order_id},
                               {"message", d.message},
                               {"timestamp", core::utils::timestampToString(d.timestamp)}});
            }
            return arr.dump();
        }

        core::Diagnostics diagnosticsFromJson(const std::string &text)
        {
            core::Diagnostics diagnostics;
            nlohmann::json arr = nlohmann::json::parse(text);
            for (const auto &item : arr)
            {
                diagnostics.push_back(core::makeDiagnostic(core::errorKindFromString(item.at("kind").get<std::string>()),
                                                           item.value("asset", ""),
                                                           item.value("message", ""),
                                                           core::utils::stringToTimestamp(item.at("timestamp").get<std::string>()),
                                                           item.value("order_id", "")));
            }
            return diagnostics;
        }
    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect(); // Ensure disconnection
    }

    bool DatabaseManager::connect()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        // Access is serialized by mutex_, so the connection itself runs without SQLite's mutex
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000);
        executeSQL("PRAGMA journal_mode=WAL;"); // Dashboard readers do not block the engine
        core::logging::getLogger()->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (connected_)
        {
            core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
            int rc = sqlite3_close(db_);
            if (rc != SQLITE_OK)
            {
                // This usually happens if prepared statements are not finalized
                core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
            }
            db_ = nullptr;
            connected_ = false;
        }
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        const std::string create_snapshots_sql = R"(
        CREATE TABLE IF NOT EXISTS market_snapshots (
            cycle_ts TEXT NOT NULL,
            asset TEXT NOT NULL,
            price REAL,            -- NULL when the source did not provide it
            funding_rate REAL,
            volume_24h REAL,
            market_cap REAL,
            unlock_progress REAL,
            window_points INTEGER,
            PRIMARY KEY (cycle_ts, asset)
        );
    )";

        const std::string create_factors_sql = R"(
        CREATE TABLE IF NOT EXISTS factor_records (
            cycle_ts TEXT NOT NULL,
            asset TEXT NOT NULL,
            funding_rate REAL,
            liquidity_tier INTEGER,
            pump_score REAL,
            track_tag TEXT,
            unlock_progress REAL,
            price REAL,
            volume_24h REAL,
            market_cap REAL,
            PRIMARY KEY (cycle_ts, asset)
        );
    )";

        const std::string create_signals_sql = R"(
        CREATE TABLE IF NOT EXISTS trade_signals (
            cycle_ts TEXT NOT NULL,
            rank INTEGER NOT NULL,
            asset TEXT NOT NULL,
            direction TEXT NOT NULL,
            strength_score REAL,
            unlock_progress REAL,
            PRIMARY KEY (cycle_ts, asset)
        );
    )";

        const std::string create_orders_sql = R"(
        CREATE TABLE IF NOT EXISTS order_events (
            order_id TEXT PRIMARY KEY,
            exchange_order_id TEXT,
            asset TEXT NOT NULL,
            side TEXT NOT NULL,
            reason TEXT NOT NULL,
            requested_notional REAL,
            filled_notional REAL,
            average_fill_price REAL,
            status TEXT NOT NULL,
            attempts INTEGER,
            remainder_dropped INTEGER,
            error_kind TEXT,
            error_message TEXT,
            cycle_ts TEXT,
            created_time TEXT,
            terminal_time TEXT
        );
    )";
        const std::string create_orders_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_order_events_terminal
        ON order_events (terminal_time);
    )";

        const std::string create_summaries_sql = R"(
        CREATE TABLE IF NOT EXISTS cycle_summaries (
            cycle_ts TEXT PRIMARY KEY,
            finished_time TEXT,
            status TEXT NOT NULL,
            abort_reason TEXT,
            snapshot_assets INTEGER,
            factor_records INTEGER,
            funding_excluded INTEGER,
            signals_emitted INTEGER,
            forced_deltas INTEGER,
            deltas_proposed INTEGER,
            deltas_approved INTEGER,
            deltas_clamped INTEGER,
            deltas_rejected INTEGER,
            deltas_skipped INTEGER,
            orders_submitted INTEGER,
            orders_filled INTEGER,
            orders_failed INTEGER,
            orders_inflight INTEGER,
            equity REAL,
            total_exposure REAL,
            unrealized_pnl REAL,
            realized_pnl REAL,
            diagnostics_json TEXT
        );
    )";

        const std::string create_positions_sql = R"(
        CREATE TABLE IF NOT EXISTS positions (
            asset TEXT PRIMARY KEY,
            quantity REAL NOT NULL,     -- Base units held short
            average_entry_price REAL,
            current_notional REAL,
            realized_pnl REAL,
            last_update_time TEXT
        );
    )";

        bool success = true;
        success &= executeSQL(create_snapshots_sql);
        success &= executeSQL(create_factors_sql);
        success &= executeSQL(create_signals_sql);
        success &= executeSQL(create_orders_sql);
        success &= executeSQL(create_orders_index_sql);
        success &= executeSQL(create_summaries_sql);
        success &= executeSQL(create_positions_sql);

        if (success)
        {
            core::logging::getLogger()->info("SQLite database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    bool DatabaseManager::insertBatch(const char *sql, std::size_t count, const Binder &bind, const char *what)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save {}: Not connected to database.", what);
            return false;
        }
        if (count == 0)
        {
            return true; // Nothing to do, report success
        }

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare INSERT for {} [{}]: {}", what, rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt); // Safe if stmt is null
            return false;
        }

        // Begin transaction for efficiency
        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving {}.", what);
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        for (std::size_t i = 0; i < count; ++i)
        {
            bind(stmt, i);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to insert {} row {} [{}]: {}", what, i, rc, sqlite3_errmsg(db_));
                success = false;
                break; // Exit loop on first error
            }

            rc = sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize the statement BEFORE commit/rollback
        sqlite3_finalize(stmt);

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            logger->error("Failed to {} transaction for saving {}.", success ? "COMMIT" : "ROLLBACK", what);
            if (success)
                executeSQL("ROLLBACK;");
            return false;
        }
        if (success)
            logger->debug("Saved {} {} row(s).", count, what);
        else
            logger->warn("Transaction rolled back while saving {}.", what);
        return success;
    }

    bool DatabaseManager::saveSnapshot(const core::MarketSnapshot &snapshot)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        const char *sql = R"(
INSERT OR IGNORE INTO market_snapshots
(cycle_ts, asset, price, funding_rate, volume_24h, market_cap, unlock_progress, window_points)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";
        std::vector<const std::pair<const std::string, core::MarketQuote> *> rows;
        rows.reserve(snapshot.quotes.size());
        for (const auto &entry : snapshot.quotes)
            rows.push_back(&entry);

        const std::string ts = core::utils::timestampToString(snapshot.timestamp);
        return insertBatch(sql, rows.size(), [&](sqlite3_stmt *stmt, std::size_t i) {
            const auto &quote = rows[i]->second;
            bindText(stmt, 1, ts);
            bindText(stmt, 2, rows[i]->first);
            bindOptional(stmt, 3, quote.price);
            bindOptional(stmt, 4, quote.funding_rate);
            bindOptional(stmt, 5, quote.volume_24h);
            bindOptional(stmt, 6, quote.market_cap);
            bindOptional(stmt, 7, quote.unlock_progress);
            sqlite3_bind_int(stmt, 8, static_cast<int>(quote.recent_prices.size()));
        }, "market snapshot");
    }

    bool DatabaseManager::saveFactorRecords(const std::vector<core::FactorRecord> &records)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        const char *sql = R"(
INSERT OR IGNORE INTO factor_records
(cycle_ts, asset, funding_rate, liquidity_tier, pump_score, track_tag, unlock_progress, price, volume_24h, market_cap)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
)";
        return insertBatch(sql, records.size(), [&](sqlite3_stmt *stmt, std::size_t i) {
            const auto &r = records[i];
            bindTimestamp(stmt, 1, r.cycle_timestamp);
            bindText(stmt, 2, r.asset);
            sqlite3_bind_double(stmt, 3, r.funding_rate);
            sqlite3_bind_int(stmt, 4, r.liquidity_tier);
            sqlite3_bind_double(stmt, 5, r.pump_score);
            bindText(stmt, 6, core::toString(r.track_tag));
            sqlite3_bind_double(stmt, 7, r.unlock_progress_ratio);
            sqlite3_bind_double(stmt, 8, r.price);
            sqlite3_bind_double(stmt, 9, r.volume_24h);
            sqlite3_bind_double(stmt, 10, r.market_cap);
        }, "factor records");
    }

    bool DatabaseManager::saveSignals(const std::vector<core::Signal> &signals)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        const char *sql = R"(
INSERT OR IGNORE INTO trade_signals
(cycle_ts, rank, asset, direction, strength_score, unlock_progress)
VALUES (?, ?, ?, ?, ?, ?);
)";
        return insertBatch(sql, signals.size(), [&](sqlite3_stmt *stmt, std::size_t i) {
            const auto &s = signals[i];
            bindTimestamp(stmt, 1, s.cycle_timestamp);
            sqlite3_bind_int(stmt, 2, static_cast<int>(i + 1));
            bindText(stmt, 3, s.asset);
            bindText(stmt, 4, core::toString(s.direction));
            sqlite3_bind_double(stmt, 5, s.strength_score);
            sqlite3_bind_double(stmt, 6, s.unlock_progress_ratio);
        }, "signals");
    }

    bool DatabaseManager::saveOrderEvent(const core::Order &order)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!core::isTerminal(order.status))
        {
            core::logging::getLogger()->warn("Refusing to archive non-terminal order {} ({}).", order.id,
                                             core::toString(order.status));
            return false;
        }
        const char *sql = R"(
INSERT OR REPLACE INTO order_events
(order_id, exchange_order_id, asset, side, reason, requested_notional, filled_notional, average_fill_price,
 status, attempts, remainder_dropped, error_kind, error_message, cycle_ts, created_time, terminal_time)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
)";
        return insertBatch(sql, 1, [&](sqlite3_stmt *stmt, std::size_t) {
            bindText(stmt, 1, order.id);
            bindText(stmt, 2, order.exchange_order_id);
            bindText(stmt, 3, order.asset);
            bindText(stmt, 4, core::toString(order.side));
            bindText(stmt, 5, core::toString(order.reason));
            sqlite3_bind_double(stmt, 6, order.requested_notional);
            sqlite3_bind_double(stmt, 7, order.filled_notional);
            sqlite3_bind_double(stmt, 8, order.average_fill_price);
            bindText(stmt, 9, core::toString(order.status));
            sqlite3_bind_int(stmt, 10, order.attempts);
            sqlite3_bind_int(stmt, 11, order.remainder_dropped ? 1 : 0);
            if (order.error_kind)
                bindText(stmt, 12, core::toString(*order.error_kind));
            else
                sqlite3_bind_null(stmt, 12);
            bindText(stmt, 13, order.error_message);
            bindTimestamp(stmt, 14, order.cycle_timestamp);
            bindTimestamp(stmt, 15, order.created_time);
            bindTimestamp(stmt, 16, order.terminal_time);
        }, "order event");
    }

    bool DatabaseManager::saveCycleSummary(const core::CycleSummary &summary)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        const char *sql = R"(
INSERT OR REPLACE INTO cycle_summaries
(cycle_ts, finished_time, status, abort_reason, snapshot_assets, factor_records, funding_excluded, signals_emitted,
 forced_deltas, deltas_proposed, deltas_approved, deltas_clamped, deltas_rejected, deltas_skipped,
 orders_submitted, orders_filled, orders_failed, orders_inflight,
 equity, total_exposure, unrealized_pnl, realized_pnl, diagnostics_json)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
)";
        return insertBatch(sql, 1, [&](sqlite3_stmt *stmt, std::size_t) {
            bindTimestamp(stmt, 1, summary.cycle_timestamp);
            bindTimestamp(stmt, 2, summary.finished_time);
            bindText(stmt, 3, core::toString(summary.status));
            bindText(stmt, 4, summary.abort_reason);
            const std::size_t counts[] = {summary.snapshot_assets, summary.factor_records, summary.funding_excluded,
                                          summary.signals_emitted, summary.forced_deltas, summary.deltas_proposed,
                                          summary.deltas_approved, summary.deltas_clamped, summary.deltas_rejected,
                                          summary.deltas_skipped, summary.orders_submitted, summary.orders_filled,
                                          summary.orders_failed, summary.orders_inflight};
            int idx = 5;
            for (std::size_t c : counts)
                sqlite3_bind_int64(stmt, idx++, static_cast<sqlite3_int64>(c));
            sqlite3_bind_double(stmt, idx++, summary.equity);
            sqlite3_bind_double(stmt, idx++, summary.total_exposure);
            sqlite3_bind_double(stmt, idx++, summary.unrealized_pnl);
            sqlite3_bind_double(stmt, idx++, summary.realized_pnl);
            bindText(stmt, idx, diagnosticsToJson(summary.diagnostics));
        }, "cycle summary");
    }

    bool DatabaseManager::savePosition(const core::PositionState &position)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        const char *sql = R"(
INSERT OR REPLACE INTO positions
(asset, quantity, average_entry_price, current_notional, realized_pnl, last_update_time)
VALUES (?, ?, ?, ?, ?, ?);
)";
        return insertBatch(sql, 1, [&](sqlite3_stmt *stmt, std::size_t) {
            bindText(stmt, 1, position.asset);
            sqlite3_bind_double(stmt, 2, position.quantity);
            sqlite3_bind_double(stmt, 3, position.average_entry_price);
            sqlite3_bind_double(stmt, 4, position.current_notional);
            sqlite3_bind_double(stmt, 5, position.realized_pnl);
            bindTimestamp(stmt, 6, position.last_update_time);
        }, "position");
    }

    // --- Queries ---

    std::map<std::string, core::PositionState> DatabaseManager::loadPositions()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        std::map<std::string, core::PositionState> positions;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot load positions: Not connected to database.");
            return positions;
        }

        const char *sql = R"(
            SELECT asset, quantity, average_entry_price, current_notional, realized_pnl, last_update_time
            FROM positions
            ORDER BY asset ASC;
        )";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare position query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return positions;
        }

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            try
            {
                core::PositionState position;
                position.asset = columnText(stmt, 0);
                position.quantity = sqlite3_column_double(stmt, 1);
                position.average_entry_price = sqlite3_column_double(stmt, 2);
                position.current_notional = sqlite3_column_double(stmt, 3);
                position.realized_pnl = sqlite3_column_double(stmt, 4);
                position.last_update_time = core::utils::stringToTimestamp(columnText(stmt, 5));
                positions[position.asset] = position;
            }
            catch (const std::exception &e)
            {
                logger->error("Skipping unreadable position row: {}", e.what());
            }
        }
        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through position query [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        logger->info("Loaded {} stored position(s).", positions.size());
        return positions;
    }

    std::vector<core::Signal> DatabaseManager::querySignals(core::Timestamp cycle_timestamp)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        std::vector<core::Signal> signals;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query signals: Not connected to database.");
            return signals;
        }

        const char *sql = R"(
            SELECT asset, strength_score, unlock_progress, cycle_ts
            FROM trade_signals
            WHERE cycle_ts = ?
            ORDER BY rank ASC;
        )";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare signal query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return signals;
        }
        bindTimestamp(stmt, 1, cycle_timestamp);

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            core::Signal signal;
            signal.asset = columnText(stmt, 0);
            signal.strength_score = sqlite3_column_double(stmt, 1);
            signal.unlock_progress_ratio = sqlite3_column_double(stmt, 2);
            signal.cycle_timestamp = core::utils::stringToTimestamp(columnText(stmt, 3));
            signals.push_back(std::move(signal));
        }
        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through signal query [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return signals;
    }

    std::vector<core::FactorRecord> DatabaseManager::queryFactorRecords(core::Timestamp cycle_timestamp)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        std::vector<core::FactorRecord> records;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query factor records: Not connected to database.");
            return records;
        }

        const char *sql = R"(
            SELECT asset, funding_rate, liquidity_tier, pump_score, track_tag, unlock_progress, price, volume_24h, market_cap
            FROM factor_records
            WHERE cycle_ts = ?
            ORDER BY asset ASC;
        )";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare factor query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return records;
        }
        bindTimestamp(stmt, 1, cycle_timestamp);

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            core::FactorRecord r;
            r.cycle_timestamp = cycle_timestamp;
            r.asset = columnText(stmt, 0);
            r.funding_rate = sqlite3_column_double(stmt, 1);
            r.liquidity_tier = sqlite3_column_int(stmt, 2);
            r.pump_score = sqlite3_column_double(stmt, 3);
            r.track_tag = core::trackTagFromString(columnText(stmt, 4));
            r.unlock_progress_ratio = sqlite3_column_double(stmt, 5);
            r.price = sqlite3_column_double(stmt, 6);
            r.volume_24h = sqlite3_column_double(stmt, 7);
            r.market_cap = sqlite3_column_double(stmt, 8);
            records.push_back(std::move(r));
        }
        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through factor query [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return records;
    }

    std::vector<core::Order> DatabaseManager::queryOrderEvents(core::Timestamp start_time, core::Timestamp end_time)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        std::vector<core::Order> orders;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query order events: Not connected to database.");
            return orders;
        }

        const char *sql = R"(
            SELECT order_id, exchange_order_id, asset, side, reason, requested_notional, filled_notional,
                   average_fill_price, status, attempts, remainder_dropped, error_kind, error_message,
                   cycle_ts, created_time, terminal_time
            FROM order_events
            WHERE terminal_time >= ? AND terminal_time <= ?   -- compare as TEXT
            ORDER BY terminal_time ASC;
        )";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare order query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return orders;
        }
        bindTimestamp(stmt, 1, start_time);
        bindTimestamp(stmt, 2, end_time);

        int row_count = 0;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            ++row_count;
            try
            {
                core::Order order;
                order.id = columnText(stmt, 0);
                order.exchange_order_id = columnText(stmt, 1);
                order.asset = columnText(stmt, 2);
                order.side = core::orderSideFromString(columnText(stmt, 3));
                order.reason = core::deltaReasonFromString(columnText(stmt, 4));
                order.requested_notional = sqlite3_column_double(stmt, 5);
                order.filled_notional = sqlite3_column_double(stmt, 6);
                order.average_fill_price = sqlite3_column_double(stmt, 7);
                order.status = core::orderStatusFromString(columnText(stmt, 8));
                order.attempts = sqlite3_column_int(stmt, 9);
                order.remainder_dropped = sqlite3_column_int(stmt, 10) != 0;
                if (sqlite3_column_type(stmt, 11) != SQLITE_NULL)
                    order.error_kind = core::errorKindFromString(columnText(stmt, 11));
                order.error_message = columnText(stmt, 12);
                order.cycle_timestamp = core::utils::stringToTimestamp(columnText(stmt, 13));
                order.created_time = core::utils::stringToTimestamp(columnText(stmt, 14));
                order.terminal_time = core::utils::stringToTimestamp(columnText(stmt, 15));
                orders.push_back(std::move(order));
            }
            catch (const std::exception &e)
            {
                logger->error("Skipping unreadable order event row {}: {}", row_count, e.what());
            }
        }
        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through order query [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return orders;
    }

    std::optional<core::CycleSummary> DatabaseManager::latestCycleSummary()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query cycle summary: Not connected to database.");
            return std::nullopt;
        }

        const char *sql = R"(
            SELECT cycle_ts, finished_time, status, abort_reason, snapshot_assets, factor_records, funding_excluded,
                   signals_emitted, forced_deltas, deltas_proposed, deltas_approved, deltas_clamped, deltas_rejected,
                   deltas_skipped, orders_submitted, orders_filled, orders_failed, orders_inflight,
                   equity, total_exposure, unrealized_pnl, realized_pnl, diagnostics_json
            FROM cycle_summaries
            ORDER BY cycle_ts DESC
            LIMIT 1;
        )";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare summary query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return std::nullopt;
        }

        std::optional<core::CycleSummary> result;
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW)
        {
            try
            {
                core::CycleSummary s;
                s.cycle_timestamp = core::utils::stringToTimestamp(columnText(stmt, 0));
                s.finished_time = core::utils::stringToTimestamp(columnText(stmt, 1));
                s.status = columnText(stmt, 2) == "COMPLETED" ? core::CycleStatus::Completed : core::CycleStatus::Aborted;
                s.abort_reason = columnText(stmt, 3);
                std::size_t *counts[] = {&s.snapshot_assets, &s.factor_records, &s.funding_excluded,
                                         &s.signals_emitted, &s.forced_deltas, &s.deltas_proposed,
                                         &s.deltas_approved, &s.deltas_clamped, &s.deltas_rejected,
                                         &s.deltas_skipped, &s.orders_submitted, &s.orders_filled,
                                         &s.orders_failed, &s.orders_inflight};
                int col = 4;
                for (std::size_t *c : counts)
                    *c = static_cast<std::size_t>(sqlite3_column_int64(stmt, col++));
                s.equity = sqlite3_column_double(stmt, col++);
                s.total_exposure = sqlite3_column_double(stmt, col++);
                s.unrealized_pnl = sqlite3_column_double(stmt, col++);
                s.realized_pnl = sqlite3_column_double(stmt, col++);
                s.diagnostics = diagnosticsFromJson(columnText(stmt, col));
                result = std::move(s);
            }
            catch (const std::exception &e)
            {
                logger->error("Unreadable cycle summary row: {}", e.what());
            }
        }
        else if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through summary query [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return result;
    }

} // namespace data
