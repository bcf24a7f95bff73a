#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "config.hpp"
#include "interfaces.hpp"       // strategy_engine::IStrategy
#include "regime_filter.hpp"
#include "broker.hpp"           // data::IBroker
#include "trade_recorder.hpp"   // data::ITradeRecorder, data::IPositionStore
#include "trading_engine.hpp"
#include "approval_gateway.hpp"

namespace live {

    // What one polling iteration did
    struct IterationReport {
        bool active = false;            // Inside trading hours and not stopped
        int priced_instruments = 0;
        int missing_prices = 0;
        engine::BarSummary bar;
    };

    // Polls the broker during IST trading hours, turns each quote into today's daily bar
    // and runs the shared engine step. Orders go through approval, then the broker.
    class LiveTrader : public engine::IExecutionHandler {
    public:
        using Clock = std::function<core::Timestamp()>;
        using Sleeper = std::function<void(std::chrono::milliseconds)>;

        // Builds the strategy from config.strategy unless one is supplied.
        // recorder and store are optional.
        LiveTrader(const core::EngineConfig& config,
                   data::IBroker& broker,
                   IApprovalGateway& approver,
                   std::unique_ptr<strategy_engine::IStrategy> strategy = nullptr,
                   data::ITradeRecorder* recorder = nullptr,
                   data::IPositionStore* store = nullptr);

        // Loads daily history for the universe and benchmark, restores saved open positions.
        // Throws core::AuthenticationException if the broker rejects the credentials.
        void initialize(const core::Timestamp& now);

        // Blocking loop until stop(). Propagates AuthenticationException.
        void run();

        // One polling iteration at 'now' (initializes on first use)
        IterationReport runOnce(const core::Timestamp& now);

        // Safe from any thread: no new entries from now on, loop exits at its next wake-up.
        // Open positions stay open.
        void stop();
        bool isStopRequested() const { return stop_requested_.load(); }

        bool withinTradingHours(const core::Timestamp& now) const;

        // --- engine::IExecutionHandler ---
        bool approve(const engine::OrderRequest& order) override;
        bool submit(const engine::OrderRequest& order) override;

        const engine::TradingEngine& getEngine() const { return *engine_; }
        const core::TimeSeries<core::Candle>& getHistory(const std::string& instrument) const;
        int getMissedIntervals(const std::string& instrument) const;
        const std::vector<std::string>& getSubmittedOrderIds() const { return submitted_order_ids_; }

        void setClock(Clock clock) { clock_ = std::move(clock); }
        void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    private:
        // Retries with exponential backoff; throws core::DataGapException when no usable price arrives
        core::Quote fetchQuote(const std::string& instrument);
        // Today's bar: open from the first poll, close from the last price, high/low from the day range
        void upsertTodayBar(core::TimeSeries<core::Candle>& history, const core::Timestamp& day, const core::Quote& quote);
        core::TimeSeries<core::Candle> loadHistory(const std::string& instrument, const core::Timestamp& now);
        void restorePositions(const core::Timestamp& now);
        void savePositions();

        core::EngineConfig config_;
        data::IBroker& broker_;
        IApprovalGateway& approver_;
        std::unique_ptr<strategy_engine::IStrategy> strategy_;
        data::IPositionStore* store_;
        strategy_engine::RegimeFilter regime_;
        std::unique_ptr<engine::TradingEngine> engine_;

        int trading_start_minutes_;
        int trading_end_minutes_;
        bool initialized_ = false;

        std::map<std::string, core::TimeSeries<core::Candle>> history_;
        core::TimeSeries<core::Candle> benchmark_history_;
        std::map<std::string, int> missed_intervals_;
        std::vector<std::string> submitted_order_ids_;

        Clock clock_;
        Sleeper sleeper_;

        std::atomic<bool> stop_requested_{false};
        std::mutex wait_mutex_;
        std::condition_variable wait_cv_;
    };

} // namespace live
