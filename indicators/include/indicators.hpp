#pragma once

#include "datatypes.hpp" // Needs Candle, TimeSeries
#include <string>
#include <vector>

namespace indicators {

// Which candle field an indicator reads
enum class PriceSource {
    Close,
    Volume
};

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // e.g. "SMA(20)", "RSI(14)"
    virtual std::string getName() const = 0;

    // Input bars consumed before the first output value
    virtual int getLookback() const = 0;

    // Replaces earlier results. Too little input leaves the result empty.
    // Throws core::IndicatorCalculationException if TA-Lib reports an error.
    virtual void calculate(const core::TimeSeries<core::Candle>& input) = 0;

    // Input size minus lookback values; use alignToInput() to index by bar
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

// Wrapper around a TA-Lib function with one real-valued output
class SingleSeriesIndicator : public IIndicator {
public:
    std::string getName() const override { return name_; }
    int getLookback() const override { return lookback_; }
    const core::TimeSeries<double>& getResult() const override { return results_; }
    void calculate(const core::TimeSeries<core::Candle>& input) override;

protected:
    SingleSeriesIndicator(std::string name, int lookback, PriceSource source);

    // Calls the TA-Lib function over all of 'values'. Returns its TA_RetCode.
    virtual int invoke(const std::vector<double>& values, int& out_begin_idx, int& out_nb_element, double* out) const = 0;

private:
    std::string name_;
    int lookback_;
    PriceSource source_;
    core::TimeSeries<double> results_;
};

// Pads a TA-Lib style result with NaN at the front so that result[i] belongs to input bar i.
// Bars without a value (warm-up, or input too short) are NaN.
core::TimeSeries<double> alignToInput(const core::TimeSeries<double>& result, int lookback, size_t input_size);

// Extracts one field of every candle as a double series (TA-Lib input)
std::vector<double> extractSource(const core::TimeSeries<core::Candle>& input, PriceSource source);

// Throws core::IndicatorCalculationException for anything but TA_SUCCESS, or when the
// first output does not start at the expected lookback.
void checkTaResult(int ret_code, const std::string& function, const std::string& indicator,
                   int out_begin_idx, int expected_begin_idx);

} // namespace indicators
