#pragma once

#include <map>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "portfolio.hpp" // engine::EquityPoint
#include "position.hpp"  // engine::Position

namespace backtester {

    // --- Backtest Metrics Struct ---
    // Ratios are fractions (0.12 == 12 %)
    struct BacktestMetrics {
        double initial_capital = 0.0;
        double final_equity = 0.0;
        double total_pnl = 0.0;
        double total_return = 0.0;
        double annualized_return = 0.0;
        double sharpe_ratio = 0.0;
        double sortino_ratio = 0.0;
        double max_drawdown = 0.0;
        double calmar_ratio = 0.0;
        int total_trades = 0;         // Closed round trips
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;
        double profit_factor = 0.0;   // Gross Profit / Gross Loss, +inf with no losers
        double avg_win_pnl = 0.0;
        double avg_loss_pnl = 0.0;    // Negative
        double avg_days_held = 0.0;
        std::map<std::string, int> exit_reason_counts;
        int open_positions_at_end = 0;

        // Helper method to log calculated metrics
        void logMetrics() const;
    };

    // Pure function of the run's outputs. Daily returns start from initial_capital.
    BacktestMetrics computeMetrics(double initial_capital,
                                   const std::vector<engine::Position>& closed_trades,
                                   const std::vector<engine::EquityPoint>& equity_curve,
                                   int open_positions_at_end);

} // namespace backtester
