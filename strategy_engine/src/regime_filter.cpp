#include "regime_filter.hpp"
#include "sma_indicator.hpp"
#include "indicators.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cmath>
#include <stdexcept>

namespace strategy_engine {

    RegimeFilter::RegimeFilter(bool enabled, int ma_period) : enabled_(enabled), ma_period_(ma_period) {
        if (ma_period_ <= 0) {
            throw std::invalid_argument("Regime filter MA period must be positive.");
        }
    }

    void RegimeFilter::prepare(const core::TimeSeries<core::Candle>& benchmark) {
        points_.clear();
        if (!enabled_) {
            return;
        }

        indicators::SmaIndicator sma(ma_period_);
        sma.calculate(benchmark);
        auto aligned = indicators::alignToInput(sma.getResult(), sma.getLookback(), benchmark.size());
        for (size_t i = 0; i < benchmark.size(); ++i) {
            points_[benchmark[i].timestamp] = Point{benchmark[i].close, aligned[i]};
        }
        core::logging::getLogger()->debug("Regime filter prepared with {} benchmark bars (SMA {})",
                                          benchmark.size(), ma_period_);
    }

    bool RegimeFilter::isTradeable(const core::Timestamp& now) const {
        if (!enabled_) {
            return true;
        }
        auto it = points_.find(now);
        if (it == points_.end()) {
            core::logging::getLogger()->debug("Regime: no benchmark bar at {}, not tradeable",
                                              core::utils::timestampToString(now));
            return false;
        }
        if (std::isnan(it->second.sma)) {
            return false;
        }
        return it->second.close > it->second.sma;
    }

} // namespace strategy_engine
