#pragma once // Use #pragma once for include guards (common practice)

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <map>    // For indicator snapshots
#include <optional> // For partial live quotes

namespace core {

    // Using system_clock for time points, can be adjusted if needed
    using Timestamp = std::chrono::system_clock::time_point;


    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes
        std::optional<long long> open_interest; // Optional for non-futures/options

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Point-in-time quote from the broker / market-data feed.
    // Any field may be missing when the feed is partial or delayed.
    struct Quote {
        std::string instrument_key;
        std::optional<double> last_price;
        std::optional<double> day_high;
        std::optional<double> day_low;
        std::optional<Timestamp> timestamp;

        // A quote without a positive, finite last price is not usable
        bool hasUsablePrice() const;
    };

    enum class TradeAction {
        Buy,
        Sell
    };

    // The only ways an open position can be closed by the engine
    enum class ExitReason {
        StopLoss,
        TakeProfit,
        TrailingStop,
        DeathCross,
        MaxHoldPeriod
    };

    enum class PositionStatus {
        Open,
        Closed
    };

    std::string tradeActionToString(TradeAction action);
    std::string exitReasonToString(ExitReason reason);

    // Indicator values captured at entry (e.g., "SMA(20)" -> 1523.4)
    using IndicatorSnapshot = std::map<std::string, double>;

    template<typename T>
    using TimeSeries = std::vector<T>; // Simple alias for now

} // namespace core
