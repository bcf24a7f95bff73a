#pragma once

#include "datatypes.hpp"
#include <map>

namespace strategy_engine {

    // Market regime gate for new entries: tradeable while the benchmark closes above its SMA.
    // A disabled filter treats every bar as tradeable. Never forces exits.
    class RegimeFilter {
    public:
        RegimeFilter(bool enabled, int ma_period);

        // Computes SMA(ma_period) of the benchmark close. Replaces earlier data.
        void prepare(const core::TimeSeries<core::Candle>& benchmark);

        // False when there is no benchmark bar at 'now' or its SMA is still warming up
        bool isTradeable(const core::Timestamp& now) const;

        bool isEnabled() const { return enabled_; }
        int getMaPeriod() const { return ma_period_; }

    private:
        struct Point {
            double close;
            double sma; // NaN during warm-up
        };

        bool enabled_;
        int ma_period_;
        std::map<core::Timestamp, Point> points_;
    };

} // namespace strategy_engine
