#include "macd_strategy.hpp"
#include "macd_indicator.hpp"
#include "sma_indicator.hpp"
#include "indicators.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace strategy_engine {

    MacdStrategy::MacdStrategy(const MacdParams& params) : params_(params) {
        if (params_.trend_period <= 0 || params_.volume_period <= 0) {
            throw std::invalid_argument("MACD trend and volume periods must be positive.");
        }
        // MacdIndicator validates the three MACD periods
        indicators::MacdIndicator macd(params_.fast_period, params_.slow_period, params_.signal_period);
        macd_lookback_ = macd.getLookback();
    }

    std::string MacdStrategy::getName() const {
        return fmt::format("MACD({},{},{})", params_.fast_period, params_.slow_period, params_.signal_period);
    }

    int MacdStrategy::getLookback() const {
        int lookback = macd_lookback_;
        if (params_.use_trend_filter) {
            lookback = std::max(lookback, params_.trend_period - 1);
        }
        return lookback + 1;
    }

    void MacdStrategy::prepare(const std::string& instrument, const core::TimeSeries<core::Candle>& candles) {
        indicators::MacdIndicator macd(params_.fast_period, params_.slow_period, params_.signal_period);
        indicators::SmaIndicator trend(params_.trend_period);
        indicators::SmaIndicator volume_avg(params_.volume_period, indicators::PriceSource::Volume);
        macd.calculate(candles);
        trend.calculate(candles);
        volume_avg.calculate(candles);

        const size_t n = candles.size();
        Series series;
        series.close = indicators::extractSource(candles, indicators::PriceSource::Close);
        series.volume = indicators::extractSource(candles, indicators::PriceSource::Volume);
        series.macd = indicators::alignToInput(macd.getResult(), macd.getLookback(), n);
        series.signal = indicators::alignToInput(macd.getSignalLine(), macd.getLookback(), n);
        series.histogram = indicators::alignToInput(macd.getHistogram(), macd.getLookback(), n);
        series.trend = indicators::alignToInput(trend.getResult(), trend.getLookback(), n);
        series.volume_avg = indicators::alignToInput(volume_avg.getResult(), volume_avg.getLookback(), n);
        series_[instrument] = std::move(series);

        core::logging::getLogger()->trace("{} prepared for {} ({} bars)", getName(), instrument, n);
    }

    bool MacdStrategy::isPrepared(const std::string& instrument) const {
        return series_.count(instrument) > 0;
    }

    const MacdStrategy::Series* MacdStrategy::find(const std::string& instrument, size_t bar_index) const {
        auto it = series_.find(instrument);
        if (it == series_.end() || bar_index < 1 || bar_index >= it->second.close.size()) {
            return nullptr;
        }
        return &it->second;
    }

    SignalResult MacdStrategy::signal(const std::string& instrument, size_t bar_index) const {
        const Series* s = find(instrument, bar_index);
        if (!s) return {};

        const double macd = s->macd[bar_index];
        const double signal_line = s->signal[bar_index];
        const double macd_prev = s->macd[bar_index - 1];
        const double signal_prev = s->signal[bar_index - 1];
        const double histogram = s->histogram[bar_index];
        if (std::isnan(macd) || std::isnan(signal_line) || std::isnan(macd_prev) ||
            std::isnan(signal_prev) || std::isnan(histogram)) {
            return {};
        }

        if (!(macd_prev <= signal_prev && macd > signal_line && histogram > params_.histogram_threshold)) {
            return {};
        }

        const double close = s->close[bar_index];
        if (params_.use_trend_filter) {
            const double trend = s->trend[bar_index];
            if (std::isnan(trend) || close <= trend) {
                return {};
            }
        }

        const double volume_avg = s->volume_avg[bar_index];
        const bool volume_known = !std::isnan(volume_avg) && volume_avg > 0.0;
        const double volume_ratio = volume_known ? s->volume[bar_index] / volume_avg : 0.0;
        if (params_.use_volume_filter && (!volume_known || volume_ratio < params_.volume_multiplier)) {
            return {};
        }

        const double hist_score = close > 0.0 ? std::min(1.0, std::abs(histogram) / (close * 0.01)) : 0.0;
        const double volume_score = std::min(1.0, std::max(0.0, volume_ratio - 1.0));
        const double strength = std::clamp(hist_score * 0.6 + volume_score * 0.4, 0.0, 1.0);
        return {true, strength};
    }

    bool MacdStrategy::trendReversal(const std::string& instrument, size_t bar_index) const {
        const Series* s = find(instrument, bar_index);
        if (!s) return false;

        const double macd = s->macd[bar_index];
        const double signal_line = s->signal[bar_index];
        const double macd_prev = s->macd[bar_index - 1];
        const double signal_prev = s->signal[bar_index - 1];
        if (std::isnan(macd) || std::isnan(signal_line) || std::isnan(macd_prev) || std::isnan(signal_prev)) {
            return false;
        }
        return macd_prev >= signal_prev && macd < signal_line;
    }

    core::IndicatorSnapshot MacdStrategy::snapshot(const std::string& instrument, size_t bar_index) const {
        core::IndicatorSnapshot values;
        auto it = series_.find(instrument);
        if (it == series_.end() || bar_index >= it->second.close.size()) {
            return values;
        }
        values["MACD"] = it->second.macd[bar_index];
        values["MACD_Signal"] = it->second.signal[bar_index];
        values["MACD_Hist"] = it->second.histogram[bar_index];
        return values;
    }

} // namespace strategy_engine
