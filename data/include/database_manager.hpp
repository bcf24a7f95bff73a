#pragma once

#include <string>
#include <vector>
#include <memory>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp" // Keep core types

namespace data {

class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    // Delete copy constructor and assignment operator
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;
    // Open the SQLite file (created if missing). False on failure, details logged.
    bool connect();
    void disconnect();
    bool isConnected() const;

    // Creates historical_candles and its index if needed
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
        const std::string& instrument_key,
        const std::string& interval);

    // Bars in ascending time order within [start_time, end_time].
    // Throws core::DataLoadException on SQLite failures.
    core::TimeSeries<core::Candle> queryCandles(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
};

} // namespace data