#pragma once

#include <string>
#include <vector>

#include <sqlite3.h> // Standard C header

#include "trade_recorder.hpp"

namespace data {

    // SQLite-backed trade journal (trade_records) and open-position snapshot (open_positions).
    // Use ":memory:" for a throwaway store.
    class SqliteTradeStore : public ITradeRecorder, public IPositionStore {
    public:
        // Opens (creating if needed) the database and its tables. Throws core::ExternalServiceException.
        explicit SqliteTradeStore(const std::string& db_path);
        ~SqliteTradeStore() override;

        SqliteTradeStore(const SqliteTradeStore&) = delete;
        SqliteTradeStore& operator=(const SqliteTradeStore&) = delete;

        void record(const TradeRecord& trade) override;
        void saveOpenPositions(const std::vector<OpenPositionRecord>& positions) override;
        std::vector<OpenPositionRecord> loadOpenPositions() override;

        // All trade records in insertion order
        std::vector<TradeRecord> loadTradeRecords();

    private:
        void execute(const std::string& sql);
        sqlite3_stmt* prepare(const char* sql);

        std::string database_path_;
        sqlite3* db_ = nullptr;
    };

} // namespace data
