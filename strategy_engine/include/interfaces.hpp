#pragma once

#include <vector>
#include <string>
#include <memory> // For std::unique_ptr

#include "datatypes.hpp" // Provides Candle, TimeSeries, IndicatorSnapshot

namespace strategy_engine {

    // Outcome of evaluating the entry condition on one bar
    struct SignalResult {
        bool signal = false;
        double strength = 0.0; // In [0, 1]; 0 whenever signal is false
    };

    // --- Strategy Interface ---
    // A signal evaluator over daily bars. Series are computed once per instrument by
    // prepare() and then queried by bar index (index into the candles given to prepare()).
    // Queries never have side effects and only look at bars <= the requested index.
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        // Get the unique name/ID of the strategy (e.g. "MA_Crossover(20,50)")
        virtual std::string getName() const = 0;

        // Number of leading bars before the first signal can be produced
        virtual int getLookback() const = 0;

        // (Re)compute indicator series for an instrument. Replaces earlier results.
        // Throws core::IndicatorCalculationException if the math library fails.
        virtual void prepare(const std::string& instrument, const core::TimeSeries<core::Candle>& candles) = 0;

        virtual bool isPrepared(const std::string& instrument) const = 0;

        // Edge-triggered entry signal on bar_index
        virtual SignalResult signal(const std::string& instrument, size_t bar_index) const = 0;

        // Trend-reversal exit condition on bar_index (Death Cross for the MA variant)
        virtual bool trendReversal(const std::string& instrument, size_t bar_index) const = 0;

        // Indicator values on bar_index, stored on the position at entry
        virtual core::IndicatorSnapshot snapshot(const std::string& instrument, size_t bar_index) const = 0;
    };

} // namespace strategy_engine
