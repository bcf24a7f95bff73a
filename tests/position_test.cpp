#include <gtest/gtest.h>
#include "position.hpp"
#include "test_helpers.hpp"
#include <stdexcept>

using testing_support::day;

namespace {

    engine::EntryFill fill(double price = 100.0, long long quantity = 300) {
        engine::EntryFill f;
        f.instrument = "A";
        f.timestamp = day(0);
        f.price = price;
        f.quantity = quantity;
        f.capital_committed = 33333.33;
        f.entry_cost = 33.33;
        f.stop_loss_price = price * 0.9;
        f.take_profit_price = price * 1.3;
        f.signal_strength = 0.6;
        return f;
    }

} // namespace

TEST(PositionTest, RejectsInconsistentEntries) {
    engine::EntryFill zero_quantity = fill(100.0, 0);
    EXPECT_THROW(engine::Position{zero_quantity}, std::invalid_argument);

    engine::EntryFill stop_above = fill();
    stop_above.stop_loss_price = 101.0;
    EXPECT_THROW(engine::Position{stop_above}, std::invalid_argument);

    engine::EntryFill target_below = fill();
    target_below.take_profit_price = 99.0;
    EXPECT_THROW(engine::Position{target_below}, std::invalid_argument);
}

TEST(PositionTest, CloseSettlesNetOfCosts) {
    engine::Position position(fill());
    double pnl = position.close(day(5), 110.0, core::ExitReason::TakeProfit, 33.0);
    // 300 * 110 - 33 - 300 * 100 - 33.33
    EXPECT_NEAR(pnl, 2933.67, 1e-9);
    EXPECT_FALSE(position.isOpen());
    EXPECT_EQ(position.getExitReason(), core::ExitReason::TakeProfit);
    EXPECT_EQ(position.daysHeld(*position.getExitTime()), 5);
    EXPECT_NEAR(position.returnPct(), 2933.67 / 33333.33 * 100.0, 1e-9);
}

TEST(PositionTest, ClosingTwiceIsALogicError) {
    engine::Position position(fill());
    position.close(day(1), 95.0, core::ExitReason::StopLoss, 0.0);
    EXPECT_THROW(position.close(day(2), 96.0, core::ExitReason::StopLoss, 0.0), std::logic_error);
    EXPECT_THROW(position.updateHighestPrice(120.0), std::logic_error);
}

TEST(PositionTest, HighestPriceOnlyRises) {
    engine::Position position(fill());
    EXPECT_DOUBLE_EQ(position.getHighestPrice(), 100.0);
    position.updateHighestPrice(108.0);
    position.updateHighestPrice(104.0);
    EXPECT_DOUBLE_EQ(position.getHighestPrice(), 108.0);
}

TEST(PositionTest, ResidualCashIsTheUnspentSlot) {
    engine::Position position(fill());
    EXPECT_NEAR(position.residualCash(), 33333.33 - 30000.0 - 33.33, 1e-9);
    EXPECT_NEAR(position.marketValue(105.0) + position.residualCash(), 33333.33 - 33.33 + 1500.0, 1e-9);
}
