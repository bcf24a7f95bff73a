#include "live_trader.hpp"
#include "strategy_factory.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace live {

    namespace {
        // Day high/low from a quote, or the fallback when absent or not a positive finite number
        double rangeOr(const std::optional<double>& value, double fallback) {
            if (value && std::isfinite(*value) && *value > 0.0) {
                return *value;
            }
            return fallback;
        }
    } // namespace

    LiveTrader::LiveTrader(const core::EngineConfig& config,
                           data::IBroker& broker,
                           IApprovalGateway& approver,
                           std::unique_ptr<strategy_engine::IStrategy> strategy,
                           data::ITradeRecorder* recorder,
                           data::IPositionStore* store)
        : config_(config),
          broker_(broker),
          approver_(approver),
          strategy_(std::move(strategy)),
          store_(store),
          regime_(config.regimeActive(), config.regime.ma_period),
          trading_start_minutes_(0),
          trading_end_minutes_(0),
          clock_([]() { return std::chrono::system_clock::now(); }),
          sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); })
    {
        config_.validate();
        trading_start_minutes_ = core::utils::parseTimeOfDay(config_.live.trading_start);
        trading_end_minutes_ = core::utils::parseTimeOfDay(config_.live.trading_end);
        if (!strategy_) {
            strategy_ = strategy_engine::StrategyFactory::createStrategy(config_.strategy);
        }
        engine_ = std::make_unique<engine::TradingEngine>(config_, *strategy_, regime_, recorder, this);
        core::logging::getLogger()->info("LiveTrader created: {} on {} instruments, trading {}-{} IST, manual approval {}",
                                         strategy_->getName(), config_.universe.size(),
                                         config_.live.trading_start, config_.live.trading_end,
                                         config_.live.require_manual_approval ? "on" : "off");
    }

    bool LiveTrader::withinTradingHours(const core::Timestamp& now) const {
        int minutes = core::utils::istMinutesOfDay(now);
        return minutes >= trading_start_minutes_ && minutes <= trading_end_minutes_;
    }

    core::TimeSeries<core::Candle> LiveTrader::loadHistory(const std::string& instrument, const core::Timestamp& now) {
        // Up to yesterday; today's bar is built from quotes
        std::string from = core::utils::dateToString(core::utils::addDays(now, -config_.live.history_days));
        std::string to = core::utils::dateToString(core::utils::addDays(now, -1));
        auto candles = broker_.getHistoricalCandleData(instrument, config_.interval, from, to);
        std::sort(candles.begin(), candles.end());
        core::logging::getLogger()->info("Loaded {} historical bars for {} ({} to {})", candles.size(), instrument, from, to);
        return candles;
    }

    void LiveTrader::initialize(const core::Timestamp& now) {
        auto logger = core::logging::getLogger();
        logger->info("Initializing live trader...");

        std::vector<std::string> to_load = config_.universe;
        if (config_.regimeActive()) {
            to_load.push_back(config_.benchmark);
        }
        for (const auto& instrument : to_load) {
            try {
                auto candles = loadHistory(instrument, now);
                if (instrument == config_.benchmark && config_.regimeActive()) {
                    benchmark_history_ = std::move(candles);
                } else {
                    history_[instrument] = std::move(candles);
                }
            } catch (const core::AuthenticationException&) {
                throw;
            } catch (const core::ExternalServiceException& e) {
                logger->error("History for {} unavailable, starting without it: {}", instrument, e.what());
            }
        }

        restorePositions(now);
        initialized_ = true;
    }

    void LiveTrader::restorePositions(const core::Timestamp& now) {
        if (!store_) return;
        auto logger = core::logging::getLogger();

        std::vector<data::OpenPositionRecord> records;
        try {
            records = store_->loadOpenPositions();
        } catch (const core::ExternalServiceException& e) {
            logger->error("Could not load saved open positions: {}", e.what());
            return;
        }

        for (const auto& record : records) {
            engine::EntryFill fill;
            fill.instrument = record.instrument;
            fill.timestamp = record.entry_time;
            fill.price = record.entry_price;
            fill.quantity = record.quantity;
            fill.capital_committed = record.capital_committed;
            fill.entry_cost = record.entry_cost;
            fill.stop_loss_price = record.stop_loss_price;
            fill.take_profit_price = record.take_profit_price;
            fill.signal_strength = record.signal_strength;
            try {
                engine::Position position(fill);
                position.restoreHighestPrice(record.highest_price);
                engine_->getPortfolio().restorePosition(position);
            } catch (const std::logic_error& e) {
                logger->error("Saved position {} not restored: {}", record.instrument, e.what());
                continue;
            } catch (const core::InsufficientCapitalException& e) {
                logger->error("Saved position {} not restored: {}", record.instrument, e.what());
                continue;
            }

            // Held instruments outside the universe still need bars for their exits
            if (!history_.count(record.instrument)) {
                try {
                    history_[record.instrument] = loadHistory(record.instrument, now);
                } catch (const core::AuthenticationException&) {
                    throw;
                } catch (const core::ExternalServiceException& e) {
                    logger->error("History for held {} unavailable: {}", record.instrument, e.what());
                }
            }
        }
        logger->info("Restored {} of {} saved open positions", engine_->getPortfolio().openCount(), records.size());
    }

    void LiveTrader::savePositions() {
        if (!store_) return;
        std::vector<data::OpenPositionRecord> records;
        for (const auto& pair : engine_->getPortfolio().getOpenPositions()) {
            const engine::Position& position = pair.second;
            data::OpenPositionRecord record;
            record.instrument = position.getInstrument();
            record.entry_time = position.getEntryTime();
            record.entry_price = position.getEntryPrice();
            record.quantity = position.getQuantity();
            record.capital_committed = position.getCapitalCommitted();
            record.entry_cost = position.getEntryCost();
            record.stop_loss_price = position.getStopLossPrice();
            record.take_profit_price = position.getTakeProfitPrice();
            record.highest_price = position.getHighestPrice();
            record.signal_strength = position.getSignalStrength();
            records.push_back(record);
        }
        try {
            store_->saveOpenPositions(records);
        } catch (const core::ExternalServiceException& e) {
            core::logging::getLogger()->error("Failed to save {} open positions: {}", records.size(), e.what());
        }
    }

    core::Quote LiveTrader::fetchQuote(const std::string& instrument) {
        auto logger = core::logging::getLogger();
        const int attempts = config_.live.price_retry_attempts;
        std::chrono::milliseconds backoff(config_.live.price_retry_backoff_ms);

        for (int attempt = 1; attempt <= attempts; ++attempt) {
            try {
                core::Quote quote = broker_.getQuote(instrument);
                if (quote.hasUsablePrice()) {
                    return quote;
                }
                logger->warn("No usable price for {} (attempt {}/{})", instrument, attempt, attempts);
            } catch (const core::AuthenticationException&) {
                throw;
            } catch (const core::ExternalServiceException& e) {
                logger->warn("Quote for {} failed (attempt {}/{}): {}", instrument, attempt, attempts, e.what());
            }
            if (attempt < attempts) {
                sleeper_(backoff);
                backoff *= 2;
            }
        }
        throw core::DataGapException(fmt::format("No price for {} after {} attempts", instrument, attempts));
    }

    void LiveTrader::upsertTodayBar(core::TimeSeries<core::Candle>& history, const core::Timestamp& day, const core::Quote& quote) {
        const double price = *quote.last_price;
        const bool has_today = !history.empty() && history.back().timestamp == day;

        core::Candle bar;
        bar.timestamp = day;
        bar.open = has_today ? history.back().open : price;
        bar.close = price;
        bar.high = std::max(price, rangeOr(quote.day_high, price));
        bar.low = std::min(price, rangeOr(quote.day_low, price));
        if (has_today) {
            // The day's range only widens between polls
            bar.high = std::max(bar.high, history.back().high);
            bar.low = std::min(bar.low, history.back().low);
        }
        // Quotes carry no volume: reuse the latest known one so volume filters see a plausible value
        if (!history.empty()) {
            bar.volume = history.back().volume;
        }
        if (has_today) {
            history.back() = bar;
        } else {
            history.push_back(bar);
        }
    }

    IterationReport LiveTrader::runOnce(const core::Timestamp& now) {
        auto logger = core::logging::getLogger();
        IterationReport report;

        if (!initialized_) {
            initialize(now);
        }
        if (stop_requested_.load()) {
            engine_->haltEntries();
        }
        if (!withinTradingHours(now)) {
            logger->debug("{} outside trading hours {}-{}, idle", core::utils::timestampToString(now),
                          config_.live.trading_start, config_.live.trading_end);
            return report;
        }

        const core::Timestamp day = core::utils::istDayStart(now);

        std::vector<std::string> instruments = config_.universe;
        for (const auto& pair : engine_->getPortfolio().getOpenPositions()) {
            if (std::find(instruments.begin(), instruments.end(), pair.first) == instruments.end()) {
                instruments.push_back(pair.first);
            }
        }

        std::map<std::string, engine::InstrumentBar> bars;
        for (const auto& instrument : instruments) {
            core::Quote quote;
            try {
                quote = fetchQuote(instrument);
            } catch (const core::DataGapException& e) {
                ++report.missing_prices;
                int& missed = missed_intervals_[instrument];
                ++missed;
                if (missed >= config_.live.max_missed_intervals) {
                    logger->error("Persistent data gap for {}: {} consecutive intervals without a price", instrument, missed);
                } else {
                    logger->warn("Data gap: {}", e.what());
                }
                continue;
            }
            missed_intervals_[instrument] = 0;

            auto& history = history_[instrument];
            upsertTodayBar(history, day, quote);
            try {
                strategy_->prepare(instrument, history);
            } catch (const core::IndicatorCalculationException& e) {
                logger->error("Indicators for {} failed, no signals this interval: {}", instrument, e.what());
            }
            bars[instrument] = engine::InstrumentBar{history.back(), history.size() - 1};
            ++report.priced_instruments;
        }

        if (config_.regimeActive()) {
            try {
                upsertTodayBar(benchmark_history_, day, fetchQuote(config_.benchmark));
            } catch (const core::DataGapException& e) {
                logger->warn("Benchmark data gap, regime keeps any earlier bar of today: {}", e.what());
            }
            regime_.prepare(benchmark_history_);
        }

        report.bar = engine_->processBar(day, bars);
        report.active = true;

        if (report.bar.entries > 0 || report.bar.exits > 0) {
            savePositions();
        }
        logger->info("Iteration {}: {} priced, {} missing, {} exits, {} entries, equity {:.2f}",
                     core::utils::timestampToString(now), report.priced_instruments, report.missing_prices,
                     report.bar.exits, report.bar.entries, report.bar.equity);
        return report;
    }

    void LiveTrader::run() {
        auto logger = core::logging::getLogger();
        logger->info("Live trading loop started (poll every {}s)", config_.live.poll_interval_seconds);

        if (!initialized_) {
            initialize(clock_());
        }
        while (!stop_requested_.load()) {
            runOnce(clock_());

            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_for(lock, std::chrono::seconds(config_.live.poll_interval_seconds),
                              [this]() { return stop_requested_.load(); });
        }

        engine_->haltEntries();
        savePositions();
        logger->info("Live trading loop stopped; {} open positions left in place", engine_->getPortfolio().openCount());
    }

    void LiveTrader::stop() {
        stop_requested_.store(true);
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
        }
        wait_cv_.notify_all();
        core::logging::getLogger()->info("Stop requested: new entries halted");
    }

    bool LiveTrader::approve(const engine::OrderRequest& order) {
        if (order.action == core::TradeAction::Buy && stop_requested_.load()) {
            core::logging::getLogger()->info("Entry into {} refused: shutting down", order.instrument);
            return false;
        }
        std::future<bool> decision = approver_.requestApproval(order);
        return decision.get();
    }

    bool LiveTrader::submit(const engine::OrderRequest& order) {
        auto logger = core::logging::getLogger();
        try {
            std::string order_id = broker_.placeOrder(order.instrument, order.quantity, order.action);
            submitted_order_ids_.push_back(order_id);
            logger->info("{} {} x {} submitted, order id {}", core::tradeActionToString(order.action),
                         order.quantity, order.instrument, order_id);
            return true;
        } catch (const core::AuthenticationException&) {
            throw;
        } catch (const core::ExternalServiceException& e) {
            logger->error("Order {} {} failed: {}", core::tradeActionToString(order.action), order.instrument, e.what());
            return false;
        }
    }

    const core::TimeSeries<core::Candle>& LiveTrader::getHistory(const std::string& instrument) const {
        auto it = history_.find(instrument);
        if (it == history_.end()) {
            throw std::out_of_range("No history for " + instrument);
        }
        return it->second;
    }

    int LiveTrader::getMissedIntervals(const std::string& instrument) const {
        auto it = missed_intervals_.find(instrument);
        return it == missed_intervals_.end() ? 0 : it->second;
    }

} // namespace live
