#pragma once

#include "interfaces.hpp"
#include <map>
#include <string>

namespace strategy_engine {

    struct RsiParams {
        int period = 14;
        double oversold = 35.0;
        double overbought = 70.0;
    };

    // Mean-reversion entry when RSI drops through the oversold level;
    // reversal when it rises through the overbought level.
    class RsiStrategy : public IStrategy {
    public:
        explicit RsiStrategy(const RsiParams& params);

        std::string getName() const override;
        int getLookback() const override;
        void prepare(const std::string& instrument, const core::TimeSeries<core::Candle>& candles) override;
        bool isPrepared(const std::string& instrument) const override;
        SignalResult signal(const std::string& instrument, size_t bar_index) const override;
        bool trendReversal(const std::string& instrument, size_t bar_index) const override;
        core::IndicatorSnapshot snapshot(const std::string& instrument, size_t bar_index) const override;

    private:
        RsiParams params_;
        std::string rsi_name_;
        std::map<std::string, core::TimeSeries<double>> rsi_; // Aligned to input bars
    };

} // namespace strategy_engine
