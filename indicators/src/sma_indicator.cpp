#include "sma_indicator.hpp"
#include "ta_libc.h"            // Include TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace indicators {

namespace {

    int smaLookback(int period) {
        if (period <= 0) {
            throw std::invalid_argument("SMA period must be positive.");
        }
        return TA_MA_Lookback(period, TA_MAType_SMA);
    }

} // namespace

SmaIndicator::SmaIndicator(int period, PriceSource source)
    : SingleSeriesIndicator(source == PriceSource::Volume ? fmt::format("VolumeSMA({})", period)
                                                          : fmt::format("SMA({})", period),
                            smaLookback(period), source),
      period_(period) {}

int SmaIndicator::invoke(const std::vector<double>& values, int& out_begin_idx, int& out_nb_element, double* out) const {
    return TA_MA(0, static_cast<int>(values.size()) - 1, values.data(),
                 period_, TA_MAType_SMA,
                 &out_begin_idx, &out_nb_element, out);
}

} // namespace indicators
