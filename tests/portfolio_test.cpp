#include <gtest/gtest.h>
#include "portfolio.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"
#include <stdexcept>

using testing_support::day;

namespace {

    engine::PortfolioSettings settings(double cost_pct = 0.1) {
        engine::PortfolioSettings s;
        s.initial_capital = 100000.0;
        s.max_positions = 3;
        s.capital_per_position = 100000.0 / 3.0;
        s.transaction_cost_pct = cost_pct;
        s.cooldown_days = 10;
        return s;
    }

    const engine::Position& open(engine::Portfolio& portfolio, const std::string& instrument, double price, int on_day = 0) {
        return portfolio.openPosition(instrument, day(on_day), 0, price, price * 0.9, price * 1.3, 0.5, {});
    }

    double committed(const engine::Portfolio& portfolio) {
        double total = 0.0;
        for (const auto& pair : portfolio.getOpenPositions()) {
            total += pair.second.getCapitalCommitted();
        }
        return total;
    }

} // namespace

TEST(PortfolioTest, FixedSlotOfOneThirdOfCapital) {
    engine::Portfolio portfolio(settings());
    EXPECT_NEAR(portfolio.capitalPerPosition(), 33333.33, 0.01);
    EXPECT_NEAR(portfolio.entryCostFor(), 33.33, 0.01);
    // floor((33333.33 - 33.33) / 99) = 336
    EXPECT_EQ(portfolio.quantityFor(99.0), 336);
    EXPECT_EQ(portfolio.quantityFor(50000.0), 0);
}

TEST(PortfolioTest, OpenAndCloseKeepTheLedgerIdentity) {
    engine::Portfolio portfolio(settings());
    const engine::Position& position = open(portfolio, "A", 99.0);
    EXPECT_EQ(position.getQuantity(), 336);
    EXPECT_NEAR(portfolio.getFreeCapital(), 100000.0 - 100000.0 / 3.0, 1e-6);
    EXPECT_NEAR(portfolio.getFreeCapital() + committed(portfolio), portfolio.getTotalCapital(), 1e-6);

    engine::Position closed = portfolio.closePosition("A", day(4), 110.0, core::ExitReason::TakeProfit);
    const double expected_pnl = 336 * 110.0 - 336 * 110.0 * 0.001 - 336 * 99.0 - 100000.0 / 3.0 * 0.001;
    EXPECT_NEAR(*closed.getRealizedPnl(), expected_pnl, 1e-6);
    EXPECT_NEAR(portfolio.getTotalCapital(), 100000.0 + expected_pnl, 1e-6);
    EXPECT_NEAR(portfolio.getFreeCapital(), portfolio.getTotalCapital(), 1e-6);
    EXPECT_EQ(portfolio.openCount(), 0);
    ASSERT_EQ(portfolio.getClosedTrades().size(), 1u);
    EXPECT_NO_THROW(portfolio.checkInvariant());
}

TEST(PortfolioTest, LosingExitStartsCooldownWinningExitDoesNot) {
    engine::Portfolio portfolio(settings(0.0));
    open(portfolio, "A", 100.0);
    open(portfolio, "B", 100.0);
    portfolio.closePosition("A", day(2), 90.0, core::ExitReason::StopLoss);
    portfolio.closePosition("B", day(2), 120.0, core::ExitReason::TakeProfit);

    EXPECT_TRUE(portfolio.isInCooldown("A", day(3)));
    EXPECT_TRUE(portfolio.isInCooldown("A", day(11)));
    EXPECT_FALSE(portfolio.isInCooldown("A", day(12)));
    EXPECT_EQ(portfolio.canOpen("A", day(5)), engine::AdmissionBlock::InCooldown);
    EXPECT_FALSE(portfolio.isInCooldown("B", day(3)));
    EXPECT_EQ(portfolio.canOpen("B", day(3)), engine::AdmissionBlock::None);
}

TEST(PortfolioTest, LedgerBreachesAreLogicErrors) {
    engine::Portfolio portfolio(settings());
    open(portfolio, "A", 100.0);
    EXPECT_THROW(open(portfolio, "A", 101.0), std::logic_error);
    open(portfolio, "B", 100.0);
    open(portfolio, "C", 100.0);
    EXPECT_EQ(portfolio.canOpen("D", day(0)), engine::AdmissionBlock::NoFreeSlot);
    EXPECT_THROW(open(portfolio, "D", 100.0), std::logic_error);
    EXPECT_THROW(portfolio.closePosition("Z", day(1), 100.0, core::ExitReason::StopLoss), std::logic_error);
}

TEST(PortfolioTest, UnfundableSlotIsInsufficientCapital) {
    engine::PortfolioSettings s = settings(0.0);
    s.max_positions = 4;
    s.capital_per_position = 40000.0;
    engine::Portfolio portfolio(s);
    open(portfolio, "A", 100.0);
    open(portfolio, "B", 100.0);
    EXPECT_EQ(portfolio.canOpen("C", day(0)), engine::AdmissionBlock::InsufficientCapital);
    EXPECT_THROW(open(portfolio, "C", 100.0), core::InsufficientCapitalException);

    // A slot that cannot buy a single share
    engine::Portfolio fresh(s);
    EXPECT_THROW(open(fresh, "X", 50000.0), core::InsufficientCapitalException);
}

TEST(PortfolioTest, EquityUsesLastKnownPrices) {
    engine::Portfolio portfolio(settings(0.0));
    open(portfolio, "A", 100.0);
    const engine::EquityPoint& first = portfolio.recordEquity(day(0), {{"A", 100.0}});
    EXPECT_NEAR(first.total_equity, 100000.0, 1e-6);

    portfolio.recordEquity(day(1), {{"A", 110.0}});
    // No price for A on day 2: the day 1 close is kept
    const engine::EquityPoint& gap = portfolio.recordEquity(day(2), {});
    EXPECT_NEAR(gap.total_equity, 100000.0 + 333 * 10.0, 1e-6);
    EXPECT_EQ(portfolio.getEquityCurve().size(), 3u);
}
