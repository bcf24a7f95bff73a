#include "trade_store.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace data
{

    namespace
    {
        std::string columnText(sqlite3_stmt *stmt, int column)
        {
            const unsigned char *text = sqlite3_column_text(stmt, column);
            return text ? reinterpret_cast<const char *>(text) : std::string();
        }

        core::TradeAction stringToTradeAction(const std::string &action)
        {
            if (action == "BUY") return core::TradeAction::Buy;
            if (action == "SELL") return core::TradeAction::Sell;
            throw core::ExternalServiceException("Unknown trade action in store: " + action);
        }
    } // end anonymous namespace

    SqliteTradeStore::SqliteTradeStore(const std::string &db_path)
        : database_path_(db_path)
    {
        auto logger = core::logging::getLogger();
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK)
        {
            std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            throw core::ExternalServiceException(fmt::format("Cannot open trade store '{}': {}", database_path_, message));
        }

        execute(R"(
            CREATE TABLE IF NOT EXISTS trade_records (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                instrument TEXT NOT NULL,
                action TEXT NOT NULL,       -- BUY | SELL
                price REAL NOT NULL,
                quantity INTEGER NOT NULL,
                capital REAL NOT NULL,
                reason TEXT,
                timestamp TEXT NOT NULL,    -- ISO8601 +05:30
                realized_pnl REAL           -- NULL for entries
            );
        )");
        execute(R"(
            CREATE TABLE IF NOT EXISTS open_positions (
                instrument TEXT PRIMARY KEY,
                entry_time TEXT NOT NULL,
                entry_price REAL NOT NULL,
                quantity INTEGER NOT NULL,
                capital_committed REAL NOT NULL,
                entry_cost REAL NOT NULL,
                stop_loss_price REAL NOT NULL,
                take_profit_price REAL NOT NULL,
                highest_price REAL NOT NULL,
                signal_strength REAL NOT NULL
            );
        )");
        logger->info("Trade store ready: {}", database_path_);
    }

    SqliteTradeStore::~SqliteTradeStore()
    {
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    void SqliteTradeStore::execute(const std::string &sql)
    {
        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK)
        {
            std::string message = error_msg ? error_msg : "unknown error";
            sqlite3_free(error_msg); // Must free error message memory
            throw core::ExternalServiceException("Trade store SQL error: " + message);
        }
    }

    sqlite3_stmt *SqliteTradeStore::prepare(const char *sql)
    {
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            sqlite3_finalize(stmt);
            throw core::ExternalServiceException(fmt::format("Failed to prepare trade store statement [{}]: {}", rc, sqlite3_errmsg(db_)));
        }
        return stmt;
    }

    void SqliteTradeStore::record(const TradeRecord &trade)
    {
        const char *sql = R"(
INSERT INTO trade_records
(instrument, action, price, quantity, capital, reason, timestamp, realized_pnl)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";
        sqlite3_stmt *stmt = prepare(sql);

        const std::string action = core::tradeActionToString(trade.action);
        const std::string timestamp = core::utils::timestampToString(trade.timestamp);
        sqlite3_bind_text(stmt, 1, trade.instrument.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, action.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 3, trade.price);
        sqlite3_bind_int64(stmt, 4, trade.quantity);
        sqlite3_bind_double(stmt, 5, trade.capital);
        sqlite3_bind_text(stmt, 6, trade.reason.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 7, timestamp.c_str(), -1, SQLITE_TRANSIENT);
        if (trade.realized_pnl)
        {
            sqlite3_bind_double(stmt, 8, *trade.realized_pnl);
        }
        else
        {
            sqlite3_bind_null(stmt, 8);
        }

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            throw core::ExternalServiceException(fmt::format("Failed to record {} {} [{}]: {}", action, trade.instrument, rc, sqlite3_errmsg(db_)));
        }
        core::logging::getLogger()->debug("Recorded {} {} x {} @ {:.2f}", action, trade.instrument, trade.quantity, trade.price);
    }

    std::vector<TradeRecord> SqliteTradeStore::loadTradeRecords()
    {
        sqlite3_stmt *stmt = prepare(R"(
            SELECT instrument, action, price, quantity, capital, reason, timestamp, realized_pnl
            FROM trade_records ORDER BY id ASC;
        )");

        std::vector<TradeRecord> records;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            TradeRecord trade;
            trade.instrument = columnText(stmt, 0);
            trade.action = stringToTradeAction(columnText(stmt, 1));
            trade.price = sqlite3_column_double(stmt, 2);
            trade.quantity = sqlite3_column_int64(stmt, 3);
            trade.capital = sqlite3_column_double(stmt, 4);
            trade.reason = columnText(stmt, 5);
            trade.timestamp = core::utils::stringToTimestamp(columnText(stmt, 6));
            if (sqlite3_column_type(stmt, 7) != SQLITE_NULL)
            {
                trade.realized_pnl = sqlite3_column_double(stmt, 7);
            }
            records.push_back(trade);
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            throw core::ExternalServiceException(fmt::format("Error reading trade records [{}]: {}", rc, sqlite3_errmsg(db_)));
        }
        return records;
    }

    void SqliteTradeStore::saveOpenPositions(const std::vector<OpenPositionRecord> &positions)
    {
        execute("BEGIN TRANSACTION;");
        try
        {
            execute("DELETE FROM open_positions;");
            sqlite3_stmt *stmt = prepare(R"(
INSERT INTO open_positions
(instrument, entry_time, entry_price, quantity, capital_committed, entry_cost,
 stop_loss_price, take_profit_price, highest_price, signal_strength)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
)");
            for (const auto &position : positions)
            {
                const std::string entry_time = core::utils::timestampToString(position.entry_time);
                sqlite3_bind_text(stmt, 1, position.instrument.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt, 2, entry_time.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_double(stmt, 3, position.entry_price);
                sqlite3_bind_int64(stmt, 4, position.quantity);
                sqlite3_bind_double(stmt, 5, position.capital_committed);
                sqlite3_bind_double(stmt, 6, position.entry_cost);
                sqlite3_bind_double(stmt, 7, position.stop_loss_price);
                sqlite3_bind_double(stmt, 8, position.take_profit_price);
                sqlite3_bind_double(stmt, 9, position.highest_price);
                sqlite3_bind_double(stmt, 10, position.signal_strength);

                int rc = sqlite3_step(stmt);
                if (rc != SQLITE_DONE)
                {
                    std::string message = sqlite3_errmsg(db_);
                    sqlite3_finalize(stmt);
                    throw core::ExternalServiceException(fmt::format("Failed to save open position {} [{}]: {}", position.instrument, rc, message));
                }
                sqlite3_reset(stmt);
            }
            sqlite3_finalize(stmt);
            execute("COMMIT;");
        }
        catch (const core::ExternalServiceException &)
        {
            char *error_msg = nullptr;
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &error_msg);
            sqlite3_free(error_msg);
            throw;
        }
        core::logging::getLogger()->debug("Saved {} open positions", positions.size());
    }

    std::vector<OpenPositionRecord> SqliteTradeStore::loadOpenPositions()
    {
        sqlite3_stmt *stmt = prepare(R"(
            SELECT instrument, entry_time, entry_price, quantity, capital_committed, entry_cost,
                   stop_loss_price, take_profit_price, highest_price, signal_strength
            FROM open_positions ORDER BY instrument ASC;
        )");

        std::vector<OpenPositionRecord> positions;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            OpenPositionRecord position;
            position.instrument = columnText(stmt, 0);
            position.entry_time = core::utils::stringToTimestamp(columnText(stmt, 1));
            position.entry_price = sqlite3_column_double(stmt, 2);
            position.quantity = sqlite3_column_int64(stmt, 3);
            position.capital_committed = sqlite3_column_double(stmt, 4);
            position.entry_cost = sqlite3_column_double(stmt, 5);
            position.stop_loss_price = sqlite3_column_double(stmt, 6);
            position.take_profit_price = sqlite3_column_double(stmt, 7);
            position.highest_price = sqlite3_column_double(stmt, 8);
            position.signal_strength = sqlite3_column_double(stmt, 9);
            positions.push_back(position);
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            throw core::ExternalServiceException(fmt::format("Error reading open positions [{}]: {}", rc, sqlite3_errmsg(db_)));
        }
        return positions;
    }

} // namespace data
