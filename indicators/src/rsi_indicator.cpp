#include "rsi_indicator.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace indicators {

namespace {

    int rsiLookback(int period) {
        if (period <= 0) {
            throw std::invalid_argument("RSI period must be positive.");
        }
        return TA_RSI_Lookback(period);
    }

} // namespace

RsiIndicator::RsiIndicator(int period)
    : SingleSeriesIndicator(fmt::format("RSI({})", period), rsiLookback(period), PriceSource::Close),
      period_(period) {}

int RsiIndicator::invoke(const std::vector<double>& values, int& out_begin_idx, int& out_nb_element, double* out) const {
    return TA_RSI(0, static_cast<int>(values.size()) - 1, values.data(),
                  period_,
                  &out_begin_idx, &out_nb_element, out);
}

} // namespace indicators
