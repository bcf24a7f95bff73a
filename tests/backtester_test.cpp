#include <gtest/gtest.h>
#include "backtester.hpp"
#include "database_manager.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using testing_support::baseConfig;
using testing_support::candle;
using testing_support::day;
using testing_support::flat;

namespace {

    core::TimeSeries<core::Candle> steadyRise(int bars, double start, double step) {
        core::TimeSeries<core::Candle> candles;
        for (int d = 0; d < bars; ++d) {
            double price = start + step * d;
            candles.push_back(candle(day(d), price, price + 0.5, price - 0.5, price));
        }
        return candles;
    }

} // namespace

TEST(BacktesterTest, OpenPositionsAtTheEndStayOpenAndAreMarked) {
    core::EngineConfig config = baseConfig();
    config.universe = {"A"};
    auto strategy = std::make_unique<testing_support::ScriptedStrategy>();
    strategy->setSignal("A", 2, 0.8);
    backtester::Backtester backtest(config, std::move(strategy));
    backtest.setInstrumentData("A", steadyRise(6, 100.0, 1.0));

    backtester::BacktestMetrics metrics = backtest.run();
    EXPECT_EQ(metrics.total_trades, 0);
    EXPECT_EQ(metrics.open_positions_at_end, 1);
    // Entered at 102 with 326 shares, last close 105
    const auto& curve = backtest.getPortfolio().getEquityCurve();
    ASSERT_EQ(curve.size(), 6u);
    EXPECT_NEAR(curve.back().total_equity, 100000.0 + 326 * 3.0, 1e-6);
    EXPECT_NEAR(metrics.final_equity, curve.back().total_equity, 1e-9);
}

TEST(BacktesterTest, RunsAreIndependentAndRepeatable) {
    core::EngineConfig config = baseConfig();
    config.universe = {"A"};
    auto strategy = std::make_unique<testing_support::ScriptedStrategy>();
    strategy->setSignal("A", 1, 0.8);
    backtester::Backtester backtest(config, std::move(strategy));
    backtest.setInstrumentData("A", steadyRise(40, 100.0, 2.0));

    backtester::BacktestMetrics first = backtest.run();
    backtester::BacktestMetrics second = backtest.run();
    EXPECT_EQ(first.total_trades, 1);
    EXPECT_EQ(second.total_trades, first.total_trades);
    EXPECT_DOUBLE_EQ(second.final_equity, first.final_equity);
    EXPECT_EQ(backtest.getPortfolio().getClosedTrades().size(), 1u);
}

TEST(BacktesterTest, DateWindowLimitsTheTimeline) {
    core::EngineConfig config = baseConfig();
    config.universe = {"A"};
    backtester::Backtester backtest(config, std::make_unique<testing_support::ScriptedStrategy>());
    backtest.setInstrumentData("A", steadyRise(10, 100.0, 1.0));
    backtest.run(day(3), day(6));
    const auto& curve = backtest.getPortfolio().getEquityCurve();
    ASSERT_EQ(curve.size(), 4u);
    EXPECT_EQ(curve.front().timestamp, day(3));
    EXPECT_EQ(curve.back().timestamp, day(6));
}

TEST(BacktesterTest, MissingDataIsALoadError) {
    core::EngineConfig config = baseConfig();
    backtester::Backtester empty(config, std::make_unique<testing_support::ScriptedStrategy>());
    EXPECT_THROW(empty.run(), core::DataLoadException);

    config.regime.enabled = true;
    config.benchmark = "INDEX";
    backtester::Backtester no_benchmark(config, std::make_unique<testing_support::ScriptedStrategy>());
    no_benchmark.setInstrumentData("A", steadyRise(5, 100.0, 1.0));
    EXPECT_THROW(no_benchmark.run(), core::DataLoadException);
}

TEST(BacktesterTest, LoadsUniverseFromTheMarketDatabase) {
    data::DatabaseManager db(":memory:");
    ASSERT_TRUE(db.connect());
    ASSERT_TRUE(db.initializeSchema());
    ASSERT_TRUE(db.saveCandles(steadyRise(5, 100.0, 1.0), "A", "day"));

    core::EngineConfig config = baseConfig();
    config.universe = {"A", "B"}; // B has no rows and is skipped
    backtester::Backtester backtest(config, std::make_unique<testing_support::ScriptedStrategy>());
    backtest.loadData(db, "2024-01-01", "2024-01-31");
    backtester::BacktestMetrics metrics = backtest.run();
    EXPECT_EQ(backtest.getPortfolio().getEquityCurve().size(), 5u);
    EXPECT_DOUBLE_EQ(metrics.final_equity, 100000.0);

    core::EngineConfig other = baseConfig();
    other.universe = {"Z"};
    backtester::Backtester nothing(other, std::make_unique<testing_support::ScriptedStrategy>());
    EXPECT_THROW(nothing.loadData(db, "2024-01-01", "2024-01-31"), core::DataLoadException);
}

TEST(BacktesterTest, BuildsTheConfiguredStrategy) {
    core::EngineConfig config = baseConfig();
    config.strategy = {{"type", "ma_crossover"}, {"fast_period", 5}, {"slow_period", 10}};
    backtester::Backtester backtest(config);
    EXPECT_EQ(backtest.getStrategy().getName(), "MA_Crossover(5,10)");
}
