#include "rsi_strategy.hpp"
#include "rsi_indicator.hpp"
#include "indicators.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace strategy_engine {

    RsiStrategy::RsiStrategy(const RsiParams& params) : params_(params) {
        if (params_.period <= 0) {
            throw std::invalid_argument("RSI period must be positive.");
        }
        if (!(params_.oversold > 0.0 && params_.oversold < params_.overbought && params_.overbought < 100.0)) {
            throw std::invalid_argument(fmt::format("RSI levels must satisfy 0 < oversold ({}) < overbought ({}) < 100.",
                                                    params_.oversold, params_.overbought));
        }
        rsi_name_ = fmt::format("RSI({})", params_.period);
    }

    std::string RsiStrategy::getName() const {
        return fmt::format("RSI({},{:g},{:g})", params_.period, params_.oversold, params_.overbought);
    }

    int RsiStrategy::getLookback() const {
        return params_.period + 1;
    }

    void RsiStrategy::prepare(const std::string& instrument, const core::TimeSeries<core::Candle>& candles) {
        indicators::RsiIndicator rsi(params_.period);
        rsi.calculate(candles);
        rsi_[instrument] = indicators::alignToInput(rsi.getResult(), rsi.getLookback(), candles.size());
        core::logging::getLogger()->trace("{} prepared for {} ({} bars)", getName(), instrument, candles.size());
    }

    bool RsiStrategy::isPrepared(const std::string& instrument) const {
        return rsi_.count(instrument) > 0;
    }

    SignalResult RsiStrategy::signal(const std::string& instrument, size_t bar_index) const {
        auto it = rsi_.find(instrument);
        if (it == rsi_.end() || bar_index < 1 || bar_index >= it->second.size()) return {};

        const double rsi = it->second[bar_index];
        const double rsi_prev = it->second[bar_index - 1];
        if (std::isnan(rsi) || std::isnan(rsi_prev)) return {};

        if (!(rsi_prev >= params_.oversold && rsi < params_.oversold)) {
            return {};
        }
        const double strength = std::clamp((params_.oversold - rsi) / params_.oversold * 4.0, 0.0, 1.0);
        return {true, strength};
    }

    bool RsiStrategy::trendReversal(const std::string& instrument, size_t bar_index) const {
        auto it = rsi_.find(instrument);
        if (it == rsi_.end() || bar_index < 1 || bar_index >= it->second.size()) return false;

        const double rsi = it->second[bar_index];
        const double rsi_prev = it->second[bar_index - 1];
        if (std::isnan(rsi) || std::isnan(rsi_prev)) return false;
        return rsi_prev <= params_.overbought && rsi > params_.overbought;
    }

    core::IndicatorSnapshot RsiStrategy::snapshot(const std::string& instrument, size_t bar_index) const {
        core::IndicatorSnapshot values;
        auto it = rsi_.find(instrument);
        if (it != rsi_.end() && bar_index < it->second.size()) {
            values[rsi_name_] = it->second[bar_index];
        }
        return values;
    }

} // namespace strategy_engine
