#pragma once

#include "indicators.hpp" // Base interface

namespace indicators {

// Simple moving average (TA_MA with TA_MAType_SMA) of the close, or of the volume
// for volume confirmation.
class SmaIndicator : public SingleSeriesIndicator {
public:
    explicit SmaIndicator(int period, PriceSource source = PriceSource::Close);

    int getPeriod() const { return period_; }

protected:
    int invoke(const std::vector<double>& values, int& out_begin_idx, int& out_nb_element, double* out) const override;

private:
    int period_;
};

} // namespace indicators
