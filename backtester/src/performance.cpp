#include "performance.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace backtester {

    namespace {
        constexpr double kTradingDaysPerYear = 252.0;
        constexpr double kCalendarDaysPerYear = 365.25;
    }

    void BacktestMetrics::logMetrics() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Backtest Metrics ---");
        logger->info("Initial Capital: {:.2f}", initial_capital);
        logger->info("Final Equity: {:.2f}", final_equity);
        logger->info("Total PnL: {:.2f}", total_pnl);
        logger->info("Total Return: {:.2f}%", total_return * 100.0);
        logger->info("Annualized Return: {:.2f}%", annualized_return * 100.0);
        logger->info("Sharpe Ratio: {:.2f}", sharpe_ratio);
        logger->info("Sortino Ratio: {:.2f}", sortino_ratio);
        logger->info("Max Drawdown: {:.2f}%", max_drawdown * 100.0);
        logger->info("Calmar Ratio: {:.2f}", calmar_ratio);
        logger->info("Round-Trip Trades: {} (won {}, lost {})", total_trades, winning_trades, losing_trades);
        logger->info("Win Rate: {:.2f}%", win_rate * 100.0);
        logger->info("Profit Factor: {:.2f}", profit_factor);
        logger->info("Avg Win PnL: {:.2f}", avg_win_pnl);
        logger->info("Avg Loss PnL: {:.2f}", avg_loss_pnl);
        logger->info("Avg Days Held: {:.1f}", avg_days_held);
        for (const auto& pair : exit_reason_counts) {
            logger->info("Exit '{}': {}", pair.first, pair.second);
        }
        logger->info("Open Positions At End: {}", open_positions_at_end);
        logger->info("------------------------");
    }

    BacktestMetrics computeMetrics(double initial_capital,
                                   const std::vector<engine::Position>& closed_trades,
                                   const std::vector<engine::EquityPoint>& equity_curve,
                                   int open_positions_at_end) {
        BacktestMetrics metrics;
        metrics.initial_capital = initial_capital;
        metrics.open_positions_at_end = open_positions_at_end;

        // --- PnL and Return ---
        const double final_equity = equity_curve.empty() ? initial_capital : equity_curve.back().total_equity;
        metrics.final_equity = final_equity;
        metrics.total_pnl = final_equity - initial_capital;
        metrics.total_return = (initial_capital > 1e-9) ? metrics.total_pnl / initial_capital : 0.0;

        if (equity_curve.size() >= 2) {
            const int span_days = core::utils::daysBetween(equity_curve.front().timestamp, equity_curve.back().timestamp);
            if (span_days >= 1) {
                const double growth = 1.0 + metrics.total_return;
                metrics.annualized_return = growth > 0.0
                    ? std::pow(growth, kCalendarDaysPerYear / span_days) - 1.0
                    : -1.0;
            }
        }

        // --- Max Drawdown ---
        double peak_equity = initial_capital;
        double max_drawdown = 0.0;
        for (const auto& state : equity_curve) {
            peak_equity = std::max(peak_equity, state.total_equity);
            double current_drawdown = (peak_equity > 1e-9) ? (peak_equity - state.total_equity) / peak_equity : 0.0;
            max_drawdown = std::max(max_drawdown, current_drawdown);
        }
        metrics.max_drawdown = max_drawdown;
        metrics.calmar_ratio = max_drawdown > 1e-12 ? metrics.annualized_return / max_drawdown : 0.0;

        // --- Sharpe / Sortino (daily bars) ---
        std::vector<double> daily_returns;
        double previous = initial_capital;
        for (const auto& state : equity_curve) {
            daily_returns.push_back(previous > 1e-9 ? state.total_equity / previous - 1.0 : 0.0);
            previous = state.total_equity;
        }
        if (daily_returns.size() >= 2) {
            const double n = static_cast<double>(daily_returns.size());
            const double mean_return = std::accumulate(daily_returns.begin(), daily_returns.end(), 0.0) / n;

            double sq_dev = 0.0;
            double downside_sq = 0.0;
            for (double r : daily_returns) {
                sq_dev += (r - mean_return) * (r - mean_return);
                const double downside = std::min(r, 0.0);
                downside_sq += downside * downside;
            }
            const double std_dev = std::sqrt(sq_dev / (n - 1.0)); // Sample standard deviation
            const double downside_dev = std::sqrt(downside_sq / n);

            if (std_dev > 1e-12) {
                metrics.sharpe_ratio = mean_return / std_dev * std::sqrt(kTradingDaysPerYear);
            }
            if (downside_dev > 1e-12) {
                metrics.sortino_ratio = mean_return / downside_dev * std::sqrt(kTradingDaysPerYear);
            }
        }

        // --- Trade-Based Metrics ---
        metrics.total_trades = static_cast<int>(closed_trades.size());
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        double total_days = 0.0;

        for (const auto& trade : closed_trades) {
            const double pnl = trade.getRealizedPnl().value_or(0.0);
            if (pnl > 0) {
                metrics.winning_trades++;
                gross_profit += pnl;
            } else if (pnl < 0) {
                metrics.losing_trades++;
                gross_loss += pnl; // Loss is negative
            }
            if (trade.getExitTime()) {
                total_days += trade.daysHeld(*trade.getExitTime());
            }
            if (trade.getExitReason()) {
                metrics.exit_reason_counts[core::exitReasonToString(*trade.getExitReason())]++;
            }
        }

        if (metrics.total_trades > 0) {
            metrics.win_rate = static_cast<double>(metrics.winning_trades) / metrics.total_trades;
            metrics.avg_days_held = total_days / metrics.total_trades;
        }

        if (std::abs(gross_loss) > 1e-9) {
            metrics.profit_factor = gross_profit / std::abs(gross_loss);
        } else if (gross_profit > 1e-9) {
            metrics.profit_factor = std::numeric_limits<double>::infinity();
        } else {
            metrics.profit_factor = 0.0;
        }

        metrics.avg_win_pnl = (metrics.winning_trades > 0) ? gross_profit / metrics.winning_trades : 0.0;
        metrics.avg_loss_pnl = (metrics.losing_trades > 0) ? gross_loss / metrics.losing_trades : 0.0;

        return metrics;
    }

} // namespace backtester
