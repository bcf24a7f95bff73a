#include "backtester.hpp"
#include "strategy_factory.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace backtester {

    Backtester::Backtester(const core::EngineConfig& config,
                           std::unique_ptr<strategy_engine::IStrategy> strategy,
                           data::ITradeRecorder* recorder)
        : config_(config),
          strategy_(std::move(strategy)),
          recorder_(recorder),
          regime_(config.regimeActive(), config.regime.ma_period)
    {
        config_.validate();
        if (!strategy_) {
            strategy_ = strategy_engine::StrategyFactory::createStrategy(config_.strategy);
        }
        core::logging::getLogger()->debug("Backtester initialized with capital: {}", config_.initial_capital);
    }

    void Backtester::loadData(data::DatabaseManager& db_manager, const std::string& start_date, const std::string& end_date) {
        auto logger = core::logging::getLogger();
        logger->info("Loading historical data for backtest...");

        // Ensure DB is connected before loading data
        if (!db_manager.isConnected() && !db_manager.connect()) {
            throw core::DataLoadException("Failed to connect to market data database.");
        }

        // Query from start of start_date to end of end_date, IST like the stored timestamps
        core::Timestamp start_ts = core::utils::stringToTimestamp(start_date + "T00:00:00+05:30");
        core::Timestamp end_ts = core::utils::stringToTimestamp(end_date + "T23:59:59+05:30");

        for (const auto& instrument : config_.universe) {
            auto candles = db_manager.queryCandles(instrument, config_.interval, start_ts, end_ts);
            if (candles.empty()) {
                logger->warn("No historical data for {} between {} and {}", instrument, start_date, end_date);
                continue;
            }
            logger->info("Loaded {} bars for {}", candles.size(), instrument);
            setInstrumentData(instrument, std::move(candles));
        }
        if (data_.empty()) {
            throw core::DataLoadException("No historical data found for any instrument in the universe.");
        }

        if (config_.regimeActive()) {
            auto benchmark = db_manager.queryCandles(config_.benchmark, config_.interval, start_ts, end_ts);
            if (benchmark.empty()) {
                throw core::DataLoadException("No benchmark data found for " + config_.benchmark);
            }
            logger->info("Loaded {} benchmark bars for {}", benchmark.size(), config_.benchmark);
            setBenchmarkData(std::move(benchmark));
        }
    }

    void Backtester::setInstrumentData(const std::string& instrument, core::TimeSeries<core::Candle> candles) {
        std::sort(candles.begin(), candles.end());
        data_[instrument] = std::move(candles);
    }

    void Backtester::setBenchmarkData(core::TimeSeries<core::Candle> candles) {
        std::sort(candles.begin(), candles.end());
        benchmark_ = std::move(candles);
    }

    void Backtester::prepareStrategy() {
        auto logger = core::logging::getLogger();
        excluded_.clear();
        for (const auto& instrument : config_.universe) {
            auto it = data_.find(instrument);
            if (it == data_.end()) continue;
            try {
                strategy_->prepare(instrument, it->second);
            } catch (const core::IndicatorCalculationException& e) {
                logger->error("Excluding {}: {}", instrument, e.what());
                excluded_.push_back(instrument);
            }
        }
        regime_.prepare(benchmark_);
    }

    BacktestMetrics Backtester::run(std::optional<core::Timestamp> from, std::optional<core::Timestamp> to) {
        auto logger = core::logging::getLogger();
        logger->info("========================================================");
        logger->info("Starting Backtest Run: {} on {} instruments", strategy_->getName(), config_.universe.size());
        logger->info("========================================================");

        if (data_.empty()) {
            throw core::DataLoadException("Backtest has no instrument data loaded.");
        }
        if (config_.regimeActive() && benchmark_.empty()) {
            throw core::DataLoadException("Regime filter enabled but no benchmark data loaded for " + config_.benchmark);
        }

        prepareStrategy();

        // Reset ledger for new run
        engine_ = std::make_unique<engine::TradingEngine>(config_, *strategy_, regime_, recorder_);

        // Index bars by timestamp for every tradable instrument
        std::map<std::string, std::map<core::Timestamp, size_t>> index_by_time;
        std::set<core::Timestamp> timeline;
        for (const auto& pair : data_) {
            if (std::find(excluded_.begin(), excluded_.end(), pair.first) != excluded_.end()) continue;
            auto& by_time = index_by_time[pair.first];
            for (size_t i = 0; i < pair.second.size(); ++i) {
                const core::Timestamp& ts = pair.second[i].timestamp;
                if ((from && ts < *from) || (to && ts > *to)) continue;
                by_time[ts] = i;
                timeline.insert(ts);
            }
        }
        if (timeline.empty()) {
            throw core::DataLoadException("No bars fall inside the requested backtest range.");
        }

        logger->info("Iterating through {} bars ({} to {})...", timeline.size(),
                     core::utils::dateToString(*timeline.begin()), core::utils::dateToString(*timeline.rbegin()));

        // --- Main Event Loop ---
        for (const auto& now : timeline) {
            std::map<std::string, engine::InstrumentBar> bars;
            for (const auto& pair : index_by_time) {
                auto it = pair.second.find(now);
                if (it == pair.second.end()) continue;
                bars[pair.first] = engine::InstrumentBar{data_.at(pair.first)[it->second], it->second};
            }
            engine_->processBar(now, bars);
        }

        const auto& portfolio = engine_->getPortfolio();
        metrics_ = computeMetrics(config_.initial_capital, portfolio.getClosedTrades(),
                                  portfolio.getEquityCurve(), portfolio.openCount());
        metrics_.logMetrics();

        logger->info("========================================================");
        logger->info("Backtest Run Completed for Strategy '{}'", strategy_->getName());
        logger->info("========================================================");
        return metrics_;
    }

    const engine::Portfolio& Backtester::getPortfolio() const {
         if (!engine_) {
              throw std::runtime_error("Portfolio accessed before a backtest run.");
         }
         return engine_->getPortfolio();
    }

    const engine::RiskGovernor& Backtester::getRiskGovernor() const {
         if (!engine_) {
              throw std::runtime_error("Risk governor accessed before a backtest run.");
         }
         return engine_->getRiskGovernor();
    }

} // namespace backtester
