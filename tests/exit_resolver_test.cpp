#include <gtest/gtest.h>
#include "exit_resolver.hpp"
#include "test_helpers.hpp"

using testing_support::candle;
using testing_support::day;

namespace {

    core::ExitConfig exitConfig() {
        core::ExitConfig config;
        config.stop_loss_pct = 3.0;
        config.take_profit_pct = 12.0;
        config.trailing_stop_pct = 5.0;
        config.min_hold_days = 2;
        config.max_hold_days = 20;
        return config;
    }

    engine::Position positionAt100(const engine::ExitResolver& resolver) {
        engine::EntryFill fill;
        fill.instrument = "A";
        fill.timestamp = day(0);
        fill.price = 100.0;
        fill.quantity = 10;
        fill.capital_committed = 1000.0;
        fill.stop_loss_price = resolver.stopLossPrice(100.0);
        fill.take_profit_price = resolver.takeProfitPrice(100.0);
        return engine::Position(fill);
    }

    class ExitResolverTest : public ::testing::Test {
    protected:
        engine::ExitResolver resolver{exitConfig()};
        testing_support::ScriptedStrategy strategy;
    };

} // namespace

TEST_F(ExitResolverTest, StopLossWinsOverTakeProfitOnTheSameBar) {
    engine::Position position = positionAt100(resolver);
    auto decision = resolver.evaluate(position, candle(day(3), 100.0, 113.0, 96.0, 105.0), day(3), strategy, 3);
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->reason, core::ExitReason::StopLoss);
    EXPECT_NEAR(decision->price, 97.0, 1e-9);
}

TEST_F(ExitResolverTest, GapsFillAtTheOpen) {
    engine::Position position = positionAt100(resolver);
    auto down = resolver.evaluate(position, candle(day(1), 95.0, 96.0, 94.0, 95.5), day(1), strategy, 1);
    ASSERT_TRUE(down.has_value());
    EXPECT_EQ(down->reason, core::ExitReason::StopLoss);
    EXPECT_DOUBLE_EQ(down->price, 95.0);

    auto up = resolver.evaluate(position, candle(day(1), 115.0, 118.0, 114.0, 116.0), day(1), strategy, 1);
    ASSERT_TRUE(up.has_value());
    EXPECT_EQ(up->reason, core::ExitReason::TakeProfit);
    EXPECT_DOUBLE_EQ(up->price, 115.0);

    auto target = resolver.evaluate(position, candle(day(1), 105.0, 113.0, 104.0, 110.0), day(1), strategy, 1);
    ASSERT_TRUE(target.has_value());
    EXPECT_NEAR(target->price, 112.0, 1e-9);
}

TEST_F(ExitResolverTest, TrailingStopWaitsForMinimumHold) {
    engine::Position position = positionAt100(resolver);
    position.updateHighestPrice(110.0); // Trail at 104.5

    auto early = resolver.evaluate(position, candle(day(1), 106.0, 107.0, 104.0, 105.0), day(1), strategy, 1);
    EXPECT_FALSE(early.has_value());

    auto later = resolver.evaluate(position, candle(day(2), 106.0, 107.0, 104.0, 105.0), day(2), strategy, 2);
    ASSERT_TRUE(later.has_value());
    EXPECT_EQ(later->reason, core::ExitReason::TrailingStop);
    EXPECT_NEAR(later->price, 104.5, 1e-9);
}

TEST_F(ExitResolverTest, DeathCrossFillsAtCloseAfterMinimumHold) {
    engine::Position position = positionAt100(resolver);
    strategy.setReversal("A", 1);
    strategy.setReversal("A", 2);

    EXPECT_FALSE(resolver.evaluate(position, candle(day(1), 101.0, 102.0, 100.0, 101.0), day(1), strategy, 1).has_value());

    auto decision = resolver.evaluate(position, candle(day(2), 101.0, 102.0, 100.0, 101.5), day(2), strategy, 2);
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->reason, core::ExitReason::DeathCross);
    EXPECT_DOUBLE_EQ(decision->price, 101.5);
}

TEST_F(ExitResolverTest, MaxHoldPeriodForcesExitAtClose) {
    engine::Position position = positionAt100(resolver);
    EXPECT_FALSE(resolver.evaluate(position, candle(day(19), 101.0, 102.0, 100.0, 101.0), day(19), strategy, 19).has_value());

    auto decision = resolver.evaluate(position, candle(day(20), 101.0, 102.0, 100.0, 101.0), day(20), strategy, 20);
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->reason, core::ExitReason::MaxHoldPeriod);
    EXPECT_EQ(core::exitReasonToString(decision->reason), "Max Hold Period");
}

TEST(ExitReasonTest, NamesAreFixed) {
    EXPECT_EQ(core::exitReasonToString(core::ExitReason::StopLoss), "Stop Loss");
    EXPECT_EQ(core::exitReasonToString(core::ExitReason::TakeProfit), "Take Profit");
    EXPECT_EQ(core::exitReasonToString(core::ExitReason::TrailingStop), "Trailing Stop");
    EXPECT_EQ(core::exitReasonToString(core::ExitReason::DeathCross), "Death Cross");
}
