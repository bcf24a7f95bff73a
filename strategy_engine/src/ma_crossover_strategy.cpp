#include "ma_crossover_strategy.hpp"
#include "sma_indicator.hpp"
#include "indicators.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace strategy_engine {

    MaCrossoverStrategy::MaCrossoverStrategy(const MaCrossoverParams& params) : params_(params) {
        if (params_.fast_period <= 0 || params_.slow_period <= 0 || params_.volume_period <= 0) {
            throw std::invalid_argument("MA crossover periods must be positive.");
        }
        if (params_.fast_period >= params_.slow_period) {
            throw std::invalid_argument(fmt::format("MA crossover fast period ({}) must be shorter than slow period ({}).",
                                                    params_.fast_period, params_.slow_period));
        }
        if (params_.volume_multiplier < 0.0) {
            throw std::invalid_argument("MA crossover volume multiplier must not be negative.");
        }
        fast_name_ = fmt::format("SMA({})", params_.fast_period);
        slow_name_ = fmt::format("SMA({})", params_.slow_period);
    }

    std::string MaCrossoverStrategy::getName() const {
        return fmt::format("MA_Crossover({},{})", params_.fast_period, params_.slow_period);
    }

    int MaCrossoverStrategy::getLookback() const {
        // One extra bar: the cross compares the previous bar with the current one
        return params_.slow_period;
    }

    void MaCrossoverStrategy::prepare(const std::string& instrument, const core::TimeSeries<core::Candle>& candles) {
        indicators::SmaIndicator fast(params_.fast_period);
        indicators::SmaIndicator slow(params_.slow_period);
        indicators::SmaIndicator volume_avg(params_.volume_period, indicators::PriceSource::Volume);
        fast.calculate(candles);
        slow.calculate(candles);
        volume_avg.calculate(candles);

        Series series;
        series.close = indicators::extractSource(candles, indicators::PriceSource::Close);
        series.volume = indicators::extractSource(candles, indicators::PriceSource::Volume);
        series.fast = indicators::alignToInput(fast.getResult(), fast.getLookback(), candles.size());
        series.slow = indicators::alignToInput(slow.getResult(), slow.getLookback(), candles.size());
        series.volume_avg = indicators::alignToInput(volume_avg.getResult(), volume_avg.getLookback(), candles.size());
        series_[instrument] = std::move(series);

        core::logging::getLogger()->trace("{} prepared for {} ({} bars)", getName(), instrument, candles.size());
    }

    bool MaCrossoverStrategy::isPrepared(const std::string& instrument) const {
        return series_.count(instrument) > 0;
    }

    const MaCrossoverStrategy::Series* MaCrossoverStrategy::find(const std::string& instrument, size_t bar_index) const {
        auto it = series_.find(instrument);
        if (it == series_.end() || bar_index < 1 || bar_index >= it->second.close.size()) {
            return nullptr;
        }
        return &it->second;
    }

    SignalResult MaCrossoverStrategy::signal(const std::string& instrument, size_t bar_index) const {
        const Series* s = find(instrument, bar_index);
        if (!s) return {};

        const double fast = s->fast[bar_index];
        const double slow = s->slow[bar_index];
        const double fast_prev = s->fast[bar_index - 1];
        const double slow_prev = s->slow[bar_index - 1];
        if (std::isnan(fast) || std::isnan(slow) || std::isnan(fast_prev) || std::isnan(slow_prev)) {
            return {};
        }

        // Golden Cross
        if (!(fast_prev <= slow_prev && fast > slow)) {
            return {};
        }

        const double close = s->close[bar_index];
        const double volume = s->volume[bar_index];
        const double volume_avg = s->volume_avg[bar_index];
        const bool volume_known = !std::isnan(volume_avg) && volume_avg > 0.0;

        if (params_.use_volume_filter) {
            if (!volume_known || volume < params_.volume_multiplier * volume_avg) {
                core::logging::getLogger()->debug("{}: golden cross on {} bar {} rejected by volume filter",
                                                  getName(), instrument, bar_index);
                return {};
            }
        }

        const double separation_pct = (fast - slow) / slow * 100.0;
        const double momentum = std::abs((fast - fast_prev) - (slow - slow_prev));
        const double price_vs_fast_pct = (close - fast) / fast * 100.0;
        const double volume_ratio = volume_known ? volume / volume_avg : 0.0;

        double strength = std::abs(separation_pct) * 0.4 +
                          momentum * 0.3 +
                          std::abs(price_vs_fast_pct) * 0.2 +
                          (volume_ratio - 1.0) * 0.1;
        strength = std::clamp(strength, 0.0, 1.0);

        return {true, strength};
    }

    bool MaCrossoverStrategy::trendReversal(const std::string& instrument, size_t bar_index) const {
        const Series* s = find(instrument, bar_index);
        if (!s) return false;

        const double fast = s->fast[bar_index];
        const double slow = s->slow[bar_index];
        const double fast_prev = s->fast[bar_index - 1];
        const double slow_prev = s->slow[bar_index - 1];
        if (std::isnan(fast) || std::isnan(slow) || std::isnan(fast_prev) || std::isnan(slow_prev)) {
            return false;
        }
        // Death Cross
        return fast_prev >= slow_prev && fast < slow;
    }

    core::IndicatorSnapshot MaCrossoverStrategy::snapshot(const std::string& instrument, size_t bar_index) const {
        core::IndicatorSnapshot values;
        auto it = series_.find(instrument);
        if (it == series_.end() || bar_index >= it->second.close.size()) {
            return values;
        }
        const Series& s = it->second;
        values[fast_name_] = s.fast[bar_index];
        values[slow_name_] = s.slow[bar_index];
        if (!std::isnan(s.volume_avg[bar_index])) {
            values["VolumeSMA"] = s.volume_avg[bar_index];
        }
        return values;
    }

} // namespace strategy_engine
