#include "indicators.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>
#include <limits>
#include <stdexcept>
#include <utility>

namespace indicators {

SingleSeriesIndicator::SingleSeriesIndicator(std::string name, int lookback, PriceSource source)
    : name_(std::move(name)), lookback_(lookback), source_(source) {
    if (lookback_ < 0) {
        throw std::runtime_error(fmt::format("Negative TA-Lib lookback {} for {}", lookback_, name_));
    }
}

void SingleSeriesIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("{}: {} bars do not cover the lookback of {}, no values", name_, input.size(), lookback_);
        return;
    }

    std::vector<double> values = extractSource(input, source_);
    results_.resize(values.size() - static_cast<size_t>(lookback_));

    int out_begin_idx = 0;
    int out_nb_element = 0;
    int ret_code = invoke(values, out_begin_idx, out_nb_element, results_.data());
    if (ret_code != TA_SUCCESS || out_begin_idx != lookback_) {
        results_.clear();
    }
    checkTaResult(ret_code, "TA-Lib", name_, out_begin_idx, lookback_);

    results_.resize(static_cast<size_t>(out_nb_element));
    logger->trace("{}: {} values from {} bars", name_, results_.size(), input.size());
}

core::TimeSeries<double> alignToInput(const core::TimeSeries<double>& result, int lookback, size_t input_size) {
    core::TimeSeries<double> aligned(input_size, std::numeric_limits<double>::quiet_NaN());
    if (lookback < 0) {
        return aligned;
    }
    for (size_t i = 0; i < result.size(); ++i) {
        size_t target = static_cast<size_t>(lookback) + i;
        if (target >= input_size) {
            break;
        }
        aligned[target] = result[i];
    }
    return aligned;
}

std::vector<double> extractSource(const core::TimeSeries<core::Candle>& input, PriceSource source) {
    std::vector<double> values;
    values.reserve(input.size());
    for (const auto& candle : input) {
        values.push_back(source == PriceSource::Volume ? static_cast<double>(candle.volume) : candle.close);
    }
    return values;
}

void checkTaResult(int ret_code, const std::string& function, const std::string& indicator,
                   int out_begin_idx, int expected_begin_idx) {
    if (ret_code != TA_SUCCESS) {
        TA_RetCodeInfo info;
        TA_SetRetCodeInfo(static_cast<TA_RetCode>(ret_code), &info);
        std::string message = fmt::format("{} failed for {}: {} ({})", function, indicator,
                                          info.enumStr ? info.enumStr : "unknown",
                                          info.infoStr ? info.infoStr : "no details");
        core::logging::getLogger()->error(message);
        throw core::IndicatorCalculationException(message);
    }
    if (out_begin_idx != expected_begin_idx) {
        throw core::IndicatorCalculationException(
            fmt::format("{} for {} started at bar {}, expected {}", function, indicator, out_begin_idx, expected_begin_idx));
    }
}

} // namespace indicators
