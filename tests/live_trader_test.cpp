#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <vector>
#include "live_trader.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using testing_support::baseConfig;
using testing_support::flat;

class LiveTraderTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = baseConfig();
        now_ = core::utils::stringToTimestamp("2024-03-05T10:00:00+05:30");

        // Five daily bars up to yesterday
        core::TimeSeries<core::Candle> history;
        for (int d = 5; d >= 1; --d) {
            history.push_back(flat(core::utils::addDays(core::utils::istDayStart(now_), -d), 100.0));
        }
        broker_.setHistory("A", history);
        broker_.setPrice("A", 100.0);
        broker_.setPrice("B", 50.0);
        broker_.setPrice("C", 20.0);
    }

    std::unique_ptr<live::LiveTrader> makeTrader(testing_support::ScriptedStrategy*& strategy) {
        auto owned = std::make_unique<testing_support::ScriptedStrategy>();
        strategy = owned.get();
        auto trader = std::make_unique<live::LiveTrader>(config_, broker_, approver_, std::move(owned),
                                                         &recorder_, &store_);
        trader->setSleeper([this](std::chrono::milliseconds delay) { delays_.push_back(delay); });
        return trader;
    }

    core::Timestamp at(const std::string& time) const {
        return core::utils::stringToTimestamp("2024-03-05T" + time + ":00+05:30");
    }

    core::EngineConfig config_;
    core::Timestamp now_;
    testing_support::ScriptedBroker broker_;
    testing_support::ScriptedApprover approver_;
    testing_support::CollectingRecorder recorder_;
    testing_support::ScriptedPositionStore store_;
    std::vector<std::chrono::milliseconds> delays_;
};

TEST_F(LiveTraderTest, IdlesOutsideTradingHours) {
    testing_support::ScriptedStrategy* strategy = nullptr;
    auto trader = makeTrader(strategy);
    live::IterationReport report = trader->runOnce(at("16:00"));
    EXPECT_FALSE(report.active);
    EXPECT_TRUE(broker_.quote_calls.empty());
    EXPECT_TRUE(trader->withinTradingHours(at("09:15")));
    EXPECT_TRUE(trader->withinTradingHours(at("15:00")));
    EXPECT_FALSE(trader->withinTradingHours(at("09:14")));
}

TEST_F(LiveTraderTest, QuoteRetriesBackOffExponentially) {
    testing_support::ScriptedStrategy* strategy = nullptr;
    auto trader = makeTrader(strategy);
    broker_.failNextQuotes("A", 2);

    live::IterationReport report = trader->runOnce(now_);
    EXPECT_TRUE(report.active);
    EXPECT_EQ(report.priced_instruments, 3);
    EXPECT_EQ(report.missing_prices, 0);
    EXPECT_EQ(broker_.quote_calls["A"], 3);
    ASSERT_EQ(delays_.size(), 2u);
    EXPECT_EQ(delays_[0], std::chrono::milliseconds(500));
    EXPECT_EQ(delays_[1], std::chrono::milliseconds(1000));
}

TEST_F(LiveTraderTest, QuoteBecomesTodaysBar) {
    testing_support::ScriptedStrategy* strategy = nullptr;
    auto trader = makeTrader(strategy);
    trader->runOnce(now_);
    broker_.setPrice("A", 104.0);
    trader->runOnce(at("10:05"));

    const auto& history = trader->getHistory("A");
    ASSERT_EQ(history.size(), 6u);
    EXPECT_EQ(history.back().timestamp, core::utils::istDayStart(now_));
    EXPECT_DOUBLE_EQ(history.back().open, 100.0);
    EXPECT_DOUBLE_EQ(history.back().close, 104.0);
    EXPECT_DOUBLE_EQ(history.back().high, 104.0);
    EXPECT_DOUBLE_EQ(history.back().low, 100.0);
    EXPECT_EQ(history.back().volume, history[4].volume);
    EXPECT_EQ(strategy->prepareCount("A"), 2);
    EXPECT_EQ(trader->getEngine().getPortfolio().getEquityCurve().size(), 1u);
}

TEST_F(LiveTraderTest, DayHighBetweenPollsLiftsHighestPrice) {
    testing_support::ScriptedStrategy* strategy = nullptr;
    auto trader = makeTrader(strategy);
    strategy->setSignal("A", 5, 0.6);
    trader->runOnce(now_);
    ASSERT_TRUE(trader->getEngine().getPortfolio().hasOpenPosition("A"));

    // Last price unchanged, but the stock traded up to 112 since the previous poll
    broker_.setDayRange("A", 112.0, 98.0);
    live::IterationReport report = trader->runOnce(at("10:05"));
    EXPECT_EQ(report.bar.exits, 0);

    const auto& today = trader->getHistory("A").back();
    EXPECT_DOUBLE_EQ(today.open, 100.0);
    EXPECT_DOUBLE_EQ(today.close, 100.0);
    EXPECT_DOUBLE_EQ(today.high, 112.0);
    EXPECT_DOUBLE_EQ(today.low, 98.0);
    EXPECT_DOUBLE_EQ(trader->getEngine().getPortfolio().getOpenPosition("A").getHighestPrice(), 112.0);

    // A later quote without a range keeps the day's extremes
    broker_.setPrice("A", 101.0);
    broker_.setDayRange("A", std::nan(""), 0.0);
    trader->runOnce(at("10:10"));
    EXPECT_DOUBLE_EQ(trader->getHistory("A").back().high, 112.0);
    EXPECT_DOUBLE_EQ(trader->getHistory("A").back().low, 98.0);
    EXPECT_DOUBLE_EQ(trader->getHistory("A").back().close, 101.0);
}

TEST_F(LiveTraderTest, DayLowThroughTheStopClosesThePosition) {
    testing_support::ScriptedStrategy* strategy = nullptr;
    auto trader = makeTrader(strategy);
    strategy->setSignal("A", 5, 0.6);
    trader->runOnce(now_);
    ASSERT_TRUE(trader->getEngine().getPortfolio().hasOpenPosition("A"));

    // Touched 89 between polls and recovered; the stop at 90 was hit
    broker_.setPrice("A", 95.0);
    broker_.setDayRange("A", 101.0, 89.0);
    live::IterationReport report = trader->runOnce(at("10:05"));
    EXPECT_EQ(report.bar.exits, 1);
    EXPECT_FALSE(trader->getEngine().getPortfolio().hasOpenPosition("A"));
    ASSERT_EQ(recorder_.records.size(), 2u);
    EXPECT_EQ(recorder_.records[1].action, core::TradeAction::Sell);
    EXPECT_NEAR(recorder_.records[1].price, 90.0, 1e-9);
}

TEST_F(LiveTraderTest, SignalIsApprovedSubmittedAndSaved) {
    testing_support::ScriptedStrategy* strategy = nullptr;
    auto trader = makeTrader(strategy);
    strategy->setSignal("A", 5, 0.6);

    live::IterationReport report = trader->runOnce(now_);
    EXPECT_EQ(report.bar.entries, 1);
    ASSERT_EQ(approver_.requests.size(), 1u);
    EXPECT_EQ(approver_.requests[0].instrument, "A");
    EXPECT_EQ(approver_.requests[0].quantity, 333);
    ASSERT_EQ(broker_.orders.size(), 1u);
    EXPECT_EQ(broker_.orders[0].action, core::TradeAction::Buy);
    EXPECT_EQ(trader->getSubmittedOrderIds(), std::vector<std::string>{"ORD1"});

    const auto& portfolio = trader->getEngine().getPortfolio();
    ASSERT_TRUE(portfolio.hasOpenPosition("A"));
    EXPECT_DOUBLE_EQ(portfolio.getOpenPosition("A").getEntryPrice(), 100.0);
    EXPECT_EQ(store_.save_count, 1);
    ASSERT_EQ(store_.saved.size(), 1u);
    EXPECT_EQ(store_.saved[0].quantity, 333);
    ASSERT_EQ(recorder_.records.size(), 1u);
    EXPECT_EQ(recorder_.records[0].action, core::TradeAction::Buy);
}

TEST_F(LiveTraderTest, RejectedOrFailedOrdersLeaveTheLedgerAlone) {
    testing_support::ScriptedStrategy* strategy = nullptr;
    auto trader = makeTrader(strategy);
    strategy->setSignal("A", 5, 0.6);
    approver_.answers = {false};
    trader->runOnce(now_);
    EXPECT_TRUE(broker_.orders.empty());
    EXPECT_EQ(trader->getEngine().getPortfolio().openCount(), 0);

    broker_.fail_orders = true;
    live::IterationReport report = trader->runOnce(at("10:05"));
    EXPECT_EQ(report.bar.entries, 0);
    EXPECT_EQ(approver_.requests.size(), 2u);
    EXPECT_EQ(trader->getEngine().getPortfolio().openCount(), 0);
    EXPECT_EQ(store_.save_count, 0);
    EXPECT_TRUE(recorder_.records.empty());
}

TEST_F(LiveTraderTest, MissingPriceIsAGapNotAStaleFill) {
    testing_support::ScriptedStrategy* strategy = nullptr;
    auto trader = makeTrader(strategy);
    strategy->setSignal("A", 5, 0.6);
    trader->runOnce(now_);
    ASSERT_TRUE(trader->getEngine().getPortfolio().hasOpenPosition("A"));

    broker_.clearPrice("A");
    live::IterationReport report = trader->runOnce(at("10:05"));
    EXPECT_EQ(report.missing_prices, 1);
    EXPECT_EQ(report.bar.data_gaps, 1);
    EXPECT_EQ(report.bar.exits, 0);
    EXPECT_EQ(trader->getMissedIntervals("A"), 1);
    EXPECT_DOUBLE_EQ(trader->getHistory("A").back().close, 100.0);

    trader->runOnce(at("10:10"));
    EXPECT_EQ(trader->getMissedIntervals("A"), 2);

    broker_.setPrice("A", 101.0);
    trader->runOnce(at("10:15"));
    EXPECT_EQ(trader->getMissedIntervals("A"), 0);
    EXPECT_TRUE(trader->getEngine().getPortfolio().hasOpenPosition("A"));
}

TEST_F(LiveTraderTest, StopHaltsEntriesButKeepsPositions) {
    testing_support::ScriptedStrategy* strategy = nullptr;
    auto trader = makeTrader(strategy);
    strategy->setSignal("A", 5, 0.6);
    trader->runOnce(now_);
    ASSERT_EQ(trader->getEngine().getPortfolio().openCount(), 1);

    trader->stop();
    EXPECT_TRUE(trader->isStopRequested());
    strategy->setSignal("B", 0, 0.9);
    trader->runOnce(at("10:05"));
    EXPECT_TRUE(trader->getEngine().entriesHalted());
    EXPECT_EQ(trader->getEngine().getPortfolio().openCount(), 1);
    EXPECT_EQ(approver_.requests.size(), 1u);

    engine::OrderRequest buy;
    buy.instrument = "C";
    buy.action = core::TradeAction::Buy;
    buy.quantity = 10;
    EXPECT_FALSE(trader->approve(buy));
}

TEST_F(LiveTraderTest, RestoresSavedPositionsAtStartup) {
    data::OpenPositionRecord saved;
    saved.instrument = "D";
    saved.entry_time = core::utils::addDays(core::utils::istDayStart(now_), -3);
    saved.entry_price = 200.0;
    saved.quantity = 166;
    saved.capital_committed = 100000.0 / 3.0;
    saved.stop_loss_price = 180.0;
    saved.take_profit_price = 260.0;
    saved.highest_price = 210.0;
    saved.signal_strength = 0.5;
    store_.saved = {saved};
    broker_.setHistory("D", {flat(saved.entry_time, 200.0)});
    broker_.setPrice("D", 205.0);

    testing_support::ScriptedStrategy* strategy = nullptr;
    auto trader = makeTrader(strategy);
    trader->initialize(now_);
    const auto& portfolio = trader->getEngine().getPortfolio();
    ASSERT_TRUE(portfolio.hasOpenPosition("D"));
    EXPECT_DOUBLE_EQ(portfolio.getOpenPosition("D").getHighestPrice(), 210.0);
    EXPECT_EQ(trader->getHistory("D").size(), 1u);

    live::IterationReport report = trader->runOnce(now_);
    EXPECT_EQ(report.priced_instruments, 4);
    EXPECT_EQ(broker_.quote_calls["D"], 1);
}

TEST_F(LiveTraderTest, RejectedCredentialsStopTheIteration) {
    testing_support::ScriptedStrategy* strategy = nullptr;
    auto trader = makeTrader(strategy);
    broker_.reject_credentials = true;
    EXPECT_THROW(trader->runOnce(now_), core::AuthenticationException);
}
