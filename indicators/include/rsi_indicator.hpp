#pragma once

#include "indicators.hpp"

namespace indicators {

// Wilder's relative strength index of the close (TA_RSI), 0..100
class RsiIndicator : public SingleSeriesIndicator {
public:
    explicit RsiIndicator(int period);

    int getPeriod() const { return period_; }

protected:
    int invoke(const std::vector<double>& values, int& out_begin_idx, int& out_nb_element, double* out) const override;

private:
    int period_;
};

} // namespace indicators
