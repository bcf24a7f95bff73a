#pragma once

#include <optional>

#include "datatypes.hpp"
#include "config.hpp"
#include "position.hpp"
#include "interfaces.hpp" // strategy_engine::IStrategy

namespace engine {

    struct ExitDecision {
        core::ExitReason reason;
        double price; // Fill price
    };

    // Decides whether an open position exits on a bar. Checks run in a fixed priority,
    // first match wins: Stop Loss, Take Profit, Trailing Stop, Death Cross, Max Hold Period.
    // Trailing Stop and Death Cross are held back until min_hold_days.
    class ExitResolver {
    public:
        explicit ExitResolver(const core::ExitConfig& config);

        // 'position' must already carry the bar high in its highest price.
        // 'bar_index' indexes the strategy's prepared series for the instrument.
        std::optional<ExitDecision> evaluate(const Position& position,
                                             const core::Candle& bar,
                                             const core::Timestamp& now,
                                             const strategy_engine::IStrategy& strategy,
                                             size_t bar_index) const;

        double stopLossPrice(double entry_price) const;
        double takeProfitPrice(double entry_price) const;
        double trailingStopPrice(double highest_price) const;

    private:
        core::ExitConfig config_;
    };

} // namespace engine
