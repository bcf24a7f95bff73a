#pragma once

#include "interfaces.hpp"
#include <map>
#include <string>

namespace strategy_engine {

    struct MaCrossoverParams {
        int fast_period = 20;
        int slow_period = 50;
        int volume_period = 20;
        bool use_volume_filter = true;
        double volume_multiplier = 1.2;
    };

    // Golden Cross entry / Death Cross reversal on two simple moving averages of the close,
    // optionally confirmed by volume against its own moving average.
    class MaCrossoverStrategy : public IStrategy {
    public:
        explicit MaCrossoverStrategy(const MaCrossoverParams& params);

        std::string getName() const override;
        int getLookback() const override;
        void prepare(const std::string& instrument, const core::TimeSeries<core::Candle>& candles) override;
        bool isPrepared(const std::string& instrument) const override;
        SignalResult signal(const std::string& instrument, size_t bar_index) const override;
        bool trendReversal(const std::string& instrument, size_t bar_index) const override;
        core::IndicatorSnapshot snapshot(const std::string& instrument, size_t bar_index) const override;

        const MaCrossoverParams& getParams() const { return params_; }

    private:
        struct Series {
            core::TimeSeries<double> close;
            core::TimeSeries<double> volume;
            core::TimeSeries<double> fast;       // Aligned to input, NaN during warm-up
            core::TimeSeries<double> slow;
            core::TimeSeries<double> volume_avg;
        };

        const Series* find(const std::string& instrument, size_t bar_index) const;

        MaCrossoverParams params_;
        std::string fast_name_;
        std::string slow_name_;
        std::map<std::string, Series> series_;
    };

} // namespace strategy_engine
