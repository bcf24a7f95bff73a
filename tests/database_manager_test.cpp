#include <gtest/gtest.h>
#include "database_manager.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using testing_support::candle;
using testing_support::day;

class DatabaseManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db_.connect());
        ASSERT_TRUE(db_.initializeSchema());
    }

    data::DatabaseManager db_{":memory:"};
};

TEST_F(DatabaseManagerTest, QueriesReturnAscendingBarsInsideTheRange) {
    core::TimeSeries<core::Candle> candles = {
        candle(day(2), 102, 103, 101, 102.5, 1200),
        candle(day(0), 100, 101, 99, 100.5, 1000),
        candle(day(1), 101, 102, 100, 101.5, 1100),
        candle(day(3), 103, 104, 102, 103.5, 1300),
    };
    ASSERT_TRUE(db_.saveCandles(candles, "NSE_EQ|A", "day"));

    auto loaded = db_.queryCandles("NSE_EQ|A", "day", day(1), day(2));
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].timestamp, day(1));
    EXPECT_EQ(loaded[1].timestamp, day(2));
    EXPECT_DOUBLE_EQ(loaded[0].close, 101.5);
    EXPECT_EQ(loaded[1].volume, 1200);

    EXPECT_TRUE(db_.queryCandles("NSE_EQ|A", "week", day(0), day(3)).empty());
    EXPECT_TRUE(db_.queryCandles("NSE_EQ|B", "day", day(0), day(3)).empty());
}

TEST_F(DatabaseManagerTest, SavingTheSameBarReplacesIt) {
    ASSERT_TRUE(db_.saveCandles({candle(day(0), 100, 101, 99, 100)}, "A", "day"));
    ASSERT_TRUE(db_.saveCandles({candle(day(0), 100, 105, 99, 104)}, "A", "day"));
    auto loaded = db_.queryCandles("A", "day", day(0), day(0));
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_DOUBLE_EQ(loaded[0].close, 104.0);
}

TEST(DatabaseManagerStandaloneTest, QueryWithoutConnectionThrows) {
    data::DatabaseManager db(":memory:");
    EXPECT_FALSE(db.isConnected());
    EXPECT_THROW(db.queryCandles("A", "day", day(0), day(1)), core::DataLoadException);
}
