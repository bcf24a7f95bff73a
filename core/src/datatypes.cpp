#include "datatypes.hpp"
#include <cmath>

namespace core {

    bool Quote::hasUsablePrice() const {
        return last_price.has_value() && std::isfinite(*last_price) && *last_price > 0.0;
    }

    std::string tradeActionToString(TradeAction action) {
        switch (action) {
            case TradeAction::Buy:  return "BUY";
            case TradeAction::Sell: return "SELL";
        }
        return "UNKNOWN";
    }

    std::string exitReasonToString(ExitReason reason) {
        switch (reason) {
            case ExitReason::StopLoss:      return "Stop Loss";
            case ExitReason::TakeProfit:    return "Take Profit";
            case ExitReason::TrailingStop:  return "Trailing Stop";
            case ExitReason::DeathCross:    return "Death Cross";
            case ExitReason::MaxHoldPeriod: return "Max Hold Period";
        }
        return "Unknown";
    }

} // namespace core
