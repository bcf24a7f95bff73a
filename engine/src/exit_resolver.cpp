#include "exit_resolver.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>

namespace engine {

    ExitResolver::ExitResolver(const core::ExitConfig& config) : config_(config) {}

    double ExitResolver::stopLossPrice(double entry_price) const {
        return entry_price * (1.0 - config_.stop_loss_pct / 100.0);
    }

    double ExitResolver::takeProfitPrice(double entry_price) const {
        return entry_price * (1.0 + config_.take_profit_pct / 100.0);
    }

    double ExitResolver::trailingStopPrice(double highest_price) const {
        return highest_price * (1.0 - config_.trailing_stop_pct / 100.0);
    }

    std::optional<ExitDecision> ExitResolver::evaluate(const Position& position,
                                                       const core::Candle& bar,
                                                       const core::Timestamp& now,
                                                       const strategy_engine::IStrategy& strategy,
                                                       size_t bar_index) const {
        const int days_held = position.daysHeld(now);
        const bool past_min_hold = days_held >= config_.min_hold_days;

        // 1. Stop Loss: a gap below the stop fills at the open
        const double stop = position.getStopLossPrice();
        if (bar.low <= stop) {
            return ExitDecision{core::ExitReason::StopLoss, std::min(bar.open, stop)};
        }

        // 2. Take Profit: a gap above the target fills at the open
        const double target = position.getTakeProfitPrice();
        if (bar.high >= target) {
            return ExitDecision{core::ExitReason::TakeProfit, std::max(bar.open, target)};
        }

        // 3. Trailing Stop
        if (past_min_hold && config_.trailing_stop_pct > 0.0) {
            const double trail = trailingStopPrice(position.getHighestPrice());
            if (bar.low <= trail) {
                return ExitDecision{core::ExitReason::TrailingStop, std::min(bar.open, trail)};
            }
        }

        // 4. Death Cross (trend reversal of the active strategy)
        if (past_min_hold && strategy.trendReversal(position.getInstrument(), bar_index)) {
            return ExitDecision{core::ExitReason::DeathCross, bar.close};
        }

        // 5. Max Hold Period
        if (days_held >= config_.max_hold_days) {
            return ExitDecision{core::ExitReason::MaxHoldPeriod, bar.close};
        }

        core::logging::getLogger()->trace("Hold {} on {}: low {:.2f} high {:.2f} highest {:.2f}, {} days",
                                          position.getInstrument(), core::utils::dateToString(now),
                                          bar.low, bar.high, position.getHighestPrice(), days_held);
        return std::nullopt;
    }

} // namespace engine
