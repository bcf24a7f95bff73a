#include <gtest/gtest.h>
#include "performance.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <limits>

using testing_support::day;

namespace {

    engine::Position closedTrade(const std::string& instrument, double entry, double exit, int days, core::ExitReason reason) {
        engine::EntryFill fill;
        fill.instrument = instrument;
        fill.timestamp = day(0);
        fill.price = entry;
        fill.quantity = 10;
        fill.capital_committed = entry * 10;
        fill.stop_loss_price = entry * 0.5;
        fill.take_profit_price = entry * 2.0;
        engine::Position position(fill);
        position.close(day(days), exit, reason, 0.0);
        return position;
    }

    std::vector<engine::EquityPoint> curve(const std::vector<double>& equities) {
        std::vector<engine::EquityPoint> points;
        for (size_t i = 0; i < equities.size(); ++i) {
            engine::EquityPoint point;
            point.timestamp = day(static_cast<int>(i));
            point.free_capital = equities[i];
            point.total_equity = equities[i];
            points.push_back(point);
        }
        return points;
    }

} // namespace

TEST(PerformanceTest, NoTradesMeansZeroProfitFactor) {
    backtester::BacktestMetrics metrics = backtester::computeMetrics(100000.0, {}, curve({100000.0, 100000.0}), 0);
    EXPECT_EQ(metrics.total_trades, 0);
    EXPECT_DOUBLE_EQ(metrics.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(metrics.win_rate, 0.0);
    EXPECT_DOUBLE_EQ(metrics.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(metrics.max_drawdown, 0.0);
}

TEST(PerformanceTest, OnlyWinnersMeansInfiniteProfitFactor) {
    std::vector<engine::Position> trades = {
        closedTrade("A", 100.0, 110.0, 5, core::ExitReason::TakeProfit),
        closedTrade("B", 50.0, 60.0, 3, core::ExitReason::TrailingStop),
    };
    backtester::BacktestMetrics metrics = backtester::computeMetrics(100000.0, trades, curve({100000.0, 100200.0}), 0);
    EXPECT_TRUE(std::isinf(metrics.profit_factor));
    EXPECT_GT(metrics.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(metrics.win_rate, 1.0);
    EXPECT_DOUBLE_EQ(metrics.avg_win_pnl, 100.0);
    EXPECT_DOUBLE_EQ(metrics.avg_days_held, 4.0);
}

TEST(PerformanceTest, MixedTradesAndExitReasonCounts) {
    std::vector<engine::Position> trades = {
        closedTrade("A", 100.0, 130.0, 10, core::ExitReason::TakeProfit),
        closedTrade("B", 100.0, 90.0, 4, core::ExitReason::StopLoss),
        closedTrade("C", 100.0, 90.0, 6, core::ExitReason::StopLoss),
        closedTrade("D", 100.0, 100.0, 2, core::ExitReason::MaxHoldPeriod),
    };
    backtester::BacktestMetrics metrics = backtester::computeMetrics(100000.0, trades, curve({100000.0, 100100.0}), 2);
    EXPECT_EQ(metrics.total_trades, 4);
    EXPECT_EQ(metrics.winning_trades, 1);
    EXPECT_EQ(metrics.losing_trades, 2);
    EXPECT_DOUBLE_EQ(metrics.win_rate, 0.25);
    EXPECT_DOUBLE_EQ(metrics.profit_factor, 300.0 / 200.0);
    EXPECT_DOUBLE_EQ(metrics.avg_loss_pnl, -100.0);
    EXPECT_EQ(metrics.exit_reason_counts.at("Stop Loss"), 2);
    EXPECT_EQ(metrics.exit_reason_counts.at("Take Profit"), 1);
    EXPECT_EQ(metrics.exit_reason_counts.at("Max Hold Period"), 1);
    EXPECT_EQ(metrics.open_positions_at_end, 2);
}

TEST(PerformanceTest, DrawdownAndReturnsFromTheEquityCurve) {
    backtester::BacktestMetrics metrics =
        backtester::computeMetrics(100000.0, {}, curve({100000.0, 120000.0, 90000.0, 110000.0}), 0);
    EXPECT_DOUBLE_EQ(metrics.final_equity, 110000.0);
    EXPECT_NEAR(metrics.total_return, 0.10, 1e-12);
    EXPECT_NEAR(metrics.max_drawdown, 0.25, 1e-12);
    EXPECT_GT(metrics.annualized_return, metrics.total_return);
    EXPECT_NEAR(metrics.calmar_ratio, metrics.annualized_return / 0.25, 1e-9);
    EXPECT_NE(metrics.sharpe_ratio, 0.0);
    EXPECT_NE(metrics.sortino_ratio, 0.0);
}

TEST(PerformanceTest, SingleDaySpanHasNoAnnualizedReturn) {
    backtester::BacktestMetrics metrics = backtester::computeMetrics(100000.0, {}, curve({101000.0}), 0);
    EXPECT_DOUBLE_EQ(metrics.annualized_return, 0.0);
    EXPECT_DOUBLE_EQ(metrics.calmar_ratio, 0.0);
}
