#include <gtest/gtest.h>
#include "risk_governor.hpp"
#include "test_helpers.hpp"

using testing_support::day;

namespace {

    core::RiskConfig riskConfig() {
        core::RiskConfig config;
        config.enabled = true;
        config.max_drawdown_pct = 15.0;
        config.max_consecutive_losses = 5;
        config.cooldown_days = 10;
        return config;
    }

} // namespace

TEST(RiskGovernorTest, FiveConsecutiveLossesSuspendForCooldown) {
    engine::RiskGovernor risk(riskConfig(), 100000.0);
    for (int i = 0; i < 4; ++i) {
        risk.onTradeClosed(day(i), -100.0);
    }
    EXPECT_FALSE(risk.isSuspended(day(4)));

    risk.onTradeClosed(day(4), -100.0);
    ASSERT_TRUE(risk.getSuspendedUntil().has_value());
    EXPECT_EQ(*risk.getSuspendedUntil(), day(14));
    EXPECT_EQ(risk.getLastTripReason(), engine::TripReason::ConsecutiveLosses);
    EXPECT_TRUE(risk.isSuspended(day(13)));
    EXPECT_FALSE(risk.isSuspended(day(14)));
    EXPECT_EQ(risk.getConsecutiveLosses(), 0);
}

TEST(RiskGovernorTest, WinResetsTheLossStreakAndBreakevenIsNeutral) {
    engine::RiskGovernor risk(riskConfig(), 100000.0);
    risk.onTradeClosed(day(0), -1.0);
    risk.onTradeClosed(day(1), -1.0);
    risk.onTradeClosed(day(2), 0.0);
    EXPECT_EQ(risk.getConsecutiveLosses(), 2);
    risk.onTradeClosed(day(3), 50.0);
    EXPECT_EQ(risk.getConsecutiveLosses(), 0);
}

TEST(RiskGovernorTest, SecondTripDoesNotMoveAnExistingResumeDate) {
    engine::RiskGovernor risk(riskConfig(), 100000.0);
    risk.onEquity(day(0), 84000.0); // 16 % drawdown
    ASSERT_TRUE(risk.isSuspended(day(0)));
    EXPECT_EQ(*risk.getSuspendedUntil(), day(10));

    for (int i = 0; i < 5; ++i) {
        risk.onTradeClosed(day(3), -10.0);
    }
    EXPECT_EQ(risk.getTripCount(), 2);
    EXPECT_EQ(*risk.getSuspendedUntil(), day(10));
}

TEST(RiskGovernorTest, DrawdownStillOverThresholdAfterPauseTripsAgain) {
    engine::RiskGovernor risk(riskConfig(), 100000.0);
    risk.onEquity(day(0), 85000.0);
    EXPECT_TRUE(risk.isSuspended(day(1)));
    EXPECT_NEAR(risk.getCurrentDrawdown(), 0.15, 1e-12);

    // Deeper drawdown inside the pause neither trips nor moves the resume date
    risk.onEquity(day(5), 80000.0);
    EXPECT_EQ(risk.getTripCount(), 1);
    EXPECT_EQ(*risk.getSuspendedUntil(), day(10));

    EXPECT_FALSE(risk.isSuspended(day(10)));
    risk.onEquity(day(11), 50000.0);
    EXPECT_TRUE(risk.isSuspended(day(12)));
    EXPECT_EQ(risk.getTripCount(), 2);
    EXPECT_EQ(risk.getLastTripReason(), engine::TripReason::Drawdown);
    EXPECT_EQ(*risk.getSuspendedUntil(), day(21));
}

TEST(RiskGovernorTest, RecoveryBelowThresholdLetsEntriesResume) {
    engine::RiskGovernor risk(riskConfig(), 100000.0);
    risk.onEquity(day(0), 80000.0);
    ASSERT_TRUE(risk.isSuspended(day(0)));

    risk.onEquity(day(10), 90000.0); // 10 % drawdown
    EXPECT_FALSE(risk.isSuspended(day(10)));
    EXPECT_EQ(risk.getTripCount(), 1);

    risk.onEquity(day(20), 101000.0);
    EXPECT_DOUBLE_EQ(risk.getPeakEquity(), 101000.0);
    EXPECT_DOUBLE_EQ(risk.getCurrentDrawdown(), 0.0);
}

TEST(RiskGovernorTest, DisabledGovernorNeverSuspends) {
    core::RiskConfig config = riskConfig();
    config.enabled = false;
    engine::RiskGovernor risk(config, 100000.0);
    risk.onEquity(day(0), 50000.0);
    for (int i = 0; i < 10; ++i) {
        risk.onTradeClosed(day(1), -1.0);
    }
    EXPECT_FALSE(risk.isSuspended(day(1)));
    EXPECT_EQ(risk.getTripCount(), 0);
}
