#include <gtest/gtest.h>
#include "config.hpp"
#include "exceptions.hpp"

namespace {

    core::json minimalDocument() {
        return core::json{{"universe", {"NSE_EQ|A", "NSE_EQ|B"}}};
    }

} // namespace

TEST(EngineConfigTest, MissingKeysTakeDefaults) {
    core::EngineConfig config = core::parseEngineConfig(minimalDocument());
    EXPECT_DOUBLE_EQ(config.initial_capital, 100000.0);
    EXPECT_EQ(config.portfolio.max_positions, 3);
    EXPECT_EQ(config.portfolio.sizing_mode, core::SizingMode::EqualWeight);
    EXPECT_DOUBLE_EQ(config.exits.stop_loss_pct, 10.0);
    EXPECT_DOUBLE_EQ(config.exits.take_profit_pct, 30.0);
    EXPECT_DOUBLE_EQ(config.exits.trailing_stop_pct, 3.0);
    EXPECT_DOUBLE_EQ(config.entry.min_signal_strength, 0.37);
    EXPECT_EQ(config.entry.cooldown_days, 10);
    EXPECT_EQ(config.risk.max_consecutive_losses, 5);
    EXPECT_EQ(config.live.trading_start, "09:15");
    EXPECT_EQ(config.strategy["type"], "ma_crossover");
}

TEST(EngineConfigTest, ReadsEverySection) {
    core::json document = minimalDocument();
    document["initial_capital"] = 250000;
    document["benchmark"] = "NSE_INDEX|Nifty 50";
    document["strategy"] = {{"type", "rsi"}, {"period", 10}};
    document["portfolio"] = {{"max_positions", 4}, {"sizing_mode", "percent_of_initial"},
                             {"capital_per_position_pct", 20.0}, {"transaction_cost_pct", 0.05}};
    document["exits"] = {{"stop_loss_pct", 5.0}, {"take_profit_pct", 15.0}, {"min_hold_days", 2}, {"max_hold_days", 60}};
    document["risk"] = {{"enabled", false}};
    document["live"] = {{"trading_start", "09:30"}, {"trading_end", "15:15"}, {"require_manual_approval", false}};

    core::EngineConfig config = core::parseEngineConfig(document);
    EXPECT_DOUBLE_EQ(config.initial_capital, 250000.0);
    EXPECT_EQ(config.benchmark, "NSE_INDEX|Nifty 50");
    EXPECT_EQ(config.strategy["type"], "rsi");
    EXPECT_EQ(config.portfolio.max_positions, 4);
    EXPECT_EQ(config.portfolio.sizing_mode, core::SizingMode::PercentOfInitial);
    EXPECT_DOUBLE_EQ(config.capitalPerPosition(), 50000.0);
    EXPECT_EQ(config.exits.min_hold_days, 2);
    EXPECT_FALSE(config.risk.enabled);
    EXPECT_FALSE(config.live.require_manual_approval);
    EXPECT_TRUE(config.regimeActive());
}

TEST(EngineConfigTest, EqualWeightSplitsInitialCapital) {
    core::EngineConfig config = core::parseEngineConfig(minimalDocument());
    EXPECT_NEAR(config.capitalPerPosition(), 33333.33, 0.01);
}

TEST(EngineConfigTest, RejectsStopLossNotBelowTakeProfit) {
    core::json document = minimalDocument();
    document["exits"] = {{"stop_loss_pct", 30.0}, {"take_profit_pct", 30.0}};
    EXPECT_THROW(core::parseEngineConfig(document), core::InvalidConfigurationException);
}

TEST(EngineConfigTest, RejectsEmptyOrDuplicateUniverse) {
    EXPECT_THROW(core::parseEngineConfig(core::json::object()), core::InvalidConfigurationException);
    core::json duplicate{{"universe", {"X", "X"}}};
    EXPECT_THROW(core::parseEngineConfig(duplicate), core::InvalidConfigurationException);
}

TEST(EngineConfigTest, RejectsOverAllocatedPercentSizing) {
    core::json document = minimalDocument();
    document["portfolio"] = {{"max_positions", 3}, {"sizing_mode", "percent_of_initial"}, {"capital_per_position_pct", 40.0}};
    EXPECT_THROW(core::parseEngineConfig(document), core::InvalidConfigurationException);
}

TEST(EngineConfigTest, RejectsUnknownSizingModeAndWrongTypes) {
    core::json document = minimalDocument();
    document["portfolio"] = {{"sizing_mode", "kelly"}};
    EXPECT_THROW(core::parseEngineConfig(document), core::InvalidConfigurationException);

    core::json wrong_type = minimalDocument();
    wrong_type["exits"] = {{"max_hold_days", "long"}};
    EXPECT_THROW(core::parseEngineConfig(wrong_type), core::InvalidConfigurationException);
}

TEST(EngineConfigTest, RejectsInvertedTradingWindow) {
    core::json document = minimalDocument();
    document["live"] = {{"trading_start", "15:00"}, {"trading_end", "09:15"}};
    EXPECT_THROW(core::parseEngineConfig(document), core::InvalidConfigurationException);

    core::json malformed = minimalDocument();
    malformed["live"] = {{"trading_start", "9am"}};
    EXPECT_THROW(core::parseEngineConfig(malformed), core::InvalidConfigurationException);
}

TEST(EngineConfigTest, RejectsMinHoldAboveMaxHold) {
    core::json document = minimalDocument();
    document["exits"] = {{"min_hold_days", 10}, {"max_hold_days", 5}};
    EXPECT_THROW(core::parseEngineConfig(document), core::InvalidConfigurationException);
}

TEST(EngineConfigTest, MissingFileIsAConfigurationError) {
    EXPECT_THROW(core::loadEngineConfig("/nonexistent/swing_trader_config.json"), core::InvalidConfigurationException);
}
