#include "macd_indicator.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

MacdIndicator::MacdIndicator(int fast_period, int slow_period, int signal_period)
    : fast_period_(fast_period), slow_period_(slow_period), signal_period_(signal_period), lookback_(0) {
    if (fast_period_ <= 0 || slow_period_ <= 0 || signal_period_ <= 0) {
        throw std::invalid_argument("MACD periods must be positive.");
    }
    if (fast_period_ >= slow_period_) {
        throw std::invalid_argument("MACD fast period must be shorter than the slow period.");
    }

    lookback_ = TA_MACD_Lookback(fast_period_, slow_period_, signal_period_);
    if (lookback_ < 0) {
        throw std::runtime_error(fmt::format("TA_MACD_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("MACD({},{},{})", fast_period_, slow_period_, signal_period_);
    core::logging::getLogger()->debug("MacdIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string MacdIndicator::getName() const {
    return name_;
}

int MacdIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& MacdIndicator::getResult() const {
    return macd_;
}

const core::TimeSeries<double>& MacdIndicator::getSignalLine() const {
    return signal_;
}

const core::TimeSeries<double>& MacdIndicator::getHistogram() const {
    return histogram_;
}

void MacdIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    macd_.clear();
    signal_.clear();
    histogram_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> close_prices = extractSource(input, PriceSource::Close);
    int output_size = static_cast<int>(close_prices.size()) - lookback_;
    macd_.resize(output_size);
    signal_.resize(output_size);
    histogram_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MACD(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        fast_period_,
        slow_period_,
        signal_period_,
        &out_begin_idx,
        &out_nb_element,
        macd_.data(),
        signal_.data(),
        histogram_.data()
    );

    if (ret_code != TA_SUCCESS || out_begin_idx != lookback_) {
        macd_.clear();
        signal_.clear();
        histogram_.clear();
    }
    checkTaResult(ret_code, "TA_MACD", name_, out_begin_idx, lookback_);

    macd_.resize(out_nb_element);
    signal_.resize(out_nb_element);
    histogram_.resize(out_nb_element);

    logger->trace("Successfully calculated {} results for {}", macd_.size(), name_);
}

} // namespace indicators
