#pragma once

#include "interfaces.hpp"
#include <map>
#include <string>

namespace strategy_engine {

    struct MacdParams {
        int fast_period = 12;
        int slow_period = 26;
        int signal_period = 9;
        double histogram_threshold = 0.0;
        bool use_trend_filter = false;   // close must be above SMA(trend_period)
        int trend_period = 50;
        bool use_volume_filter = false;
        int volume_period = 20;
        double volume_multiplier = 1.0;
    };

    // MACD line crossing above its signal line; reversal is the opposite cross.
    class MacdStrategy : public IStrategy {
    public:
        explicit MacdStrategy(const MacdParams& params);

        std::string getName() const override;
        int getLookback() const override;
        void prepare(const std::string& instrument, const core::TimeSeries<core::Candle>& candles) override;
        bool isPrepared(const std::string& instrument) const override;
        SignalResult signal(const std::string& instrument, size_t bar_index) const override;
        bool trendReversal(const std::string& instrument, size_t bar_index) const override;
        core::IndicatorSnapshot snapshot(const std::string& instrument, size_t bar_index) const override;

    private:
        struct Series {
            core::TimeSeries<double> close;
            core::TimeSeries<double> volume;
            core::TimeSeries<double> macd;
            core::TimeSeries<double> signal;
            core::TimeSeries<double> histogram;
            core::TimeSeries<double> trend;
            core::TimeSeries<double> volume_avg;
        };

        const Series* find(const std::string& instrument, size_t bar_index) const;

        MacdParams params_;
        int macd_lookback_ = 0;
        std::map<std::string, Series> series_;
    };

} // namespace strategy_engine
