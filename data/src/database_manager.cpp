#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <spdlog/fmt/fmt.h>
#include <vector>
#include <stdexcept>
#include <string>

namespace data
{

    namespace
    {
        using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

        StatementPtr prepareStatement(sqlite3 *db, const char *sql, int &rc)
        {
            sqlite3_stmt *stmt = nullptr;
            rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
            return StatementPtr(stmt, &sqlite3_finalize);
        }

        // Bars are stored with IST offset timestamps, so TEXT comparison orders them correctly
        const char *kSelectCandlesSql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM historical_candles
            WHERE instrument_key = ? AND interval = ? AND timestamp >= ? AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        // A re-fetched bar replaces the stored one
        const char *kUpsertCandleSql = R"(
            INSERT OR REPLACE INTO historical_candles
            (instrument_key, interval, timestamp, open, high, low, close, volume)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?);
        )";

        void bindCandle(sqlite3_stmt *stmt, const std::string &instrument_key, const std::string &interval,
                        const std::string &timestamp, const core::Candle &candle)
        {
            sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, timestamp.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 4, candle.open);
            sqlite3_bind_double(stmt, 5, candle.high);
            sqlite3_bind_double(stmt, 6, candle.low);
            sqlite3_bind_double(stmt, 7, candle.close);
            sqlite3_bind_int64(stmt, 8, candle.volume);
        }

        // Throws std::runtime_error for a missing or malformed timestamp
        core::Candle readCandle(sqlite3_stmt *stmt)
        {
            const unsigned char *ts_text = sqlite3_column_text(stmt, 0);
            if (!ts_text)
            {
                throw std::runtime_error("NULL timestamp");
            }
            core::Candle candle;
            candle.timestamp = core::utils::stringToTimestamp(reinterpret_cast<const char *>(ts_text));
            candle.open = sqlite3_column_double(stmt, 1);
            candle.high = sqlite3_column_double(stmt, 2);
            candle.low = sqlite3_column_double(stmt, 3);
            candle.close = sqlite3_column_double(stmt, 4);
            candle.volume = sqlite3_column_int64(stmt, 5);
            return candle;
        }
    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        auto logger = core::logging::getLogger();
        if (connected_)
        {
            return true;
        }

        logger->info("Opening market data database {}", database_path_);
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Cannot open market data database '{}': {}", database_path_, db_ ? sqlite3_errmsg(db_) : "out of memory");
            sqlite3_close(db_); // The handle must be closed even when the open failed
            db_ = nullptr;
            return false;
        }

        sqlite3_busy_timeout(db_, 5000); // The fetch command may write while a backtest reads
        connected_ = true;
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        if (sqlite3_close(db_) != SQLITE_OK)
        {
            // Unfinalized statements keep the handle alive
            core::logging::getLogger()->error("Error closing market data database {}: {}", database_path_, sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
        core::logging::getLogger()->debug("Market data database {} closed", database_path_);
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot execute SQL: market data database {} is not open.", database_path_);
            return false;
        }

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK)
        {
            logger->error("SQL error [{}] in '{}': {}", rc, sql, error_msg ? error_msg : sqlite3_errmsg(db_));
            sqlite3_free(error_msg);
            return false;
        }
        logger->trace("SQL executed: {}", sql);
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: market data database {} is not open.", database_path_);
            return false;
        }

        const bool tables = executeSQL(R"(
            CREATE TABLE IF NOT EXISTS historical_candles (
                instrument_key TEXT NOT NULL,
                interval TEXT NOT NULL,
                timestamp TEXT NOT NULL,    -- ISO8601 +05:30
                open REAL,
                high REAL,
                low REAL,
                close REAL,
                volume INTEGER,
                PRIMARY KEY (instrument_key, interval, timestamp)
            );
        )");
        const bool index = tables && executeSQL(R"(
            CREATE INDEX IF NOT EXISTS idx_candles_timestamp
            ON historical_candles (instrument_key, interval, timestamp);
        )");

        if (!index)
        {
            core::logging::getLogger()->error("Market data schema could not be created in {}", database_path_);
        }
        return index;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(
        const std::string &instrument_key,
        const std::string &interval,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot query candles: Not connected to database " + database_path_);
        }

        const std::string start_str = core::utils::timestampToString(start_time);
        const std::string end_str = core::utils::timestampToString(end_time);
        logger->debug("Querying {} ({}) bars between {} and {}", instrument_key, interval, start_str, end_str);

        int rc = SQLITE_OK;
        StatementPtr stmt = prepareStatement(db_, kSelectCandlesSql, rc);
        if (rc != SQLITE_OK)
        {
            throw core::DataLoadException(fmt::format("Failed to prepare candle query [{}]: {}", rc, sqlite3_errmsg(db_)));
        }
        sqlite3_bind_text(stmt.get(), 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 4, end_str.c_str(), -1, SQLITE_TRANSIENT);

        core::TimeSeries<core::Candle> candles;
        int skipped = 0;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            try
            {
                candles.push_back(readCandle(stmt.get()));
            }
            catch (const std::runtime_error &e)
            {
                // A bad row is dropped; the rest of the series is still usable
                ++skipped;
                logger->error("Skipping stored bar of {} ({}): {}", instrument_key, interval, e.what());
            }
        }
        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(fmt::format("Error reading candles of {} [{}]: {}", instrument_key, rc, sqlite3_errmsg(db_)));
        }

        logger->debug("Loaded {} bars of {} ({} skipped)", candles.size(), instrument_key, skipped);
        return candles;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                      const std::string &instrument_key,
                                      const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save candles: market data database {} is not open.", database_path_);
            return false;
        }
        if (candles.empty())
        {
            logger->debug("No candles to save for {} ({}).", instrument_key, interval);
            return true;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            return false;
        }

        bool success = true;
        {
            int rc = SQLITE_OK;
            StatementPtr stmt = prepareStatement(db_, kUpsertCandleSql, rc);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to prepare candle insert [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
            }
            for (size_t i = 0; success && i < candles.size(); ++i)
            {
                bindCandle(stmt.get(), instrument_key, interval, core::utils::timestampToString(candles[i].timestamp), candles[i]);
                rc = sqlite3_step(stmt.get());
                if (rc != SQLITE_DONE)
                {
                    logger->error("Failed to store bar {} of {} [{}]: {}", core::utils::timestampToString(candles[i].timestamp),
                                  instrument_key, rc, sqlite3_errmsg(db_));
                    success = false;
                }
                sqlite3_reset(stmt.get());
            }
        } // Statement finalized before COMMIT/ROLLBACK

        if (success && executeSQL("COMMIT;"))
        {
            logger->info("Stored {} bars for {} ({})", candles.size(), instrument_key, interval);
            return true;
        }

        if (!executeSQL("ROLLBACK;"))
        {
            logger->error("ROLLBACK failed for {} ({}).", instrument_key, interval);
        }
        logger->warn("Candle save for {} ({}) rolled back", instrument_key, interval);
        return false;
    }

} // namespace data
