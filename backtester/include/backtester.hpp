#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>

#include "datatypes.hpp"
#include "config.hpp"
#include "database_manager.hpp" // Needs DatabaseManager definition
#include "interfaces.hpp"       // Strategy engine interfaces
#include "regime_filter.hpp"
#include "trade_recorder.hpp"
#include "trading_engine.hpp"
#include "performance.hpp"

namespace backtester {

    class Backtester {
    public:
        // Builds the strategy from config.strategy unless one is supplied.
        // The recorder (optional) receives every BUY/SELL.
        explicit Backtester(const core::EngineConfig& config,
                            std::unique_ptr<strategy_engine::IStrategy> strategy = nullptr,
                            data::ITradeRecorder* recorder = nullptr);

        // Loads universe and benchmark bars from the database for [start_date, end_date] (YYYY-MM-DD).
        // Throws core::DataLoadException when nothing usable is found.
        void loadData(data::DatabaseManager& db_manager, const std::string& start_date, const std::string& end_date);

        // In-memory input (tests, external loaders). Candles are sorted by timestamp.
        void setInstrumentData(const std::string& instrument, core::TimeSeries<core::Candle> candles);
        void setBenchmarkData(core::TimeSeries<core::Candle> candles);

        // Runs over the sorted union of bar timestamps, optionally limited to [from, to].
        // Every call starts from a fresh ledger.
        BacktestMetrics run(std::optional<core::Timestamp> from = std::nullopt,
                            std::optional<core::Timestamp> to = std::nullopt);

        const engine::Portfolio& getPortfolio() const;
        const engine::RiskGovernor& getRiskGovernor() const;
        const BacktestMetrics& getMetrics() const { return metrics_; }
        const strategy_engine::IStrategy& getStrategy() const { return *strategy_; }
        // Instruments dropped because their indicators could not be computed
        const std::vector<std::string>& getExcludedInstruments() const { return excluded_; }

    private:
        void prepareStrategy();

        core::EngineConfig config_;
        std::unique_ptr<strategy_engine::IStrategy> strategy_;
        data::ITradeRecorder* recorder_;
        strategy_engine::RegimeFilter regime_;

        std::map<std::string, core::TimeSeries<core::Candle>> data_;
        core::TimeSeries<core::Candle> benchmark_;
        std::vector<std::string> excluded_;

        std::unique_ptr<engine::TradingEngine> engine_;
        BacktestMetrics metrics_;
    };

} // namespace backtester
