#pragma once

#include <string>
#include "datatypes.hpp" // Quote, Candle, TradeAction

namespace data {

    // Market data and order routing for the live trader.
    // Implementations throw core::ExternalServiceException for network/server trouble
    // and core::AuthenticationException when the credentials are rejected.
    class IBroker {
    public:
        virtual ~IBroker() = default;

        virtual core::Quote getQuote(const std::string& instrument_key) = 0;

        // Daily (or other interval) bars between two YYYY-MM-DD dates, ascending
        virtual core::TimeSeries<core::Candle> getHistoricalCandleData(
            const std::string& instrument_key,
            const std::string& interval,
            const std::string& from_date,
            const std::string& to_date) = 0;

        // Market order; returns the broker's order id
        virtual std::string placeOrder(const std::string& instrument_key,
                                       long long quantity,
                                       core::TradeAction action) = 0;
    };

} // namespace data
