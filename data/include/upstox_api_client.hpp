#pragma once

#include <string>
#include <vector>
#include <optional>
#include "datatypes.hpp" // For TimeSeries, Candle
#include "broker.hpp"

namespace data {

class UpstoxApiClient : public IBroker {
public:
    // Constructor - Takes API credentials/token
    UpstoxApiClient(const std::string& api_key,
                      const std::string& api_secret,
                      const std::string& redirect_uri,
                      const std::string& access_token = ""); // Access token can be set later

    void setAccessToken(const std::string& token) { access_token_ = token; }
    bool hasAccessToken() const { return !access_token_.empty(); }

    // --- Data Fetching Methods ---
    core::Quote getQuote(const std::string& instrument_key) override;

    core::TimeSeries<core::Candle> getHistoricalCandleData(
        const std::string& instrument_key,
        const std::string& interval,
        const std::string& from_date, // YYYY-MM-DD
        const std::string& to_date    // YYYY-MM-DD
    ) override;

    // --- Orders ---
    // MARKET order, delivery product ("D")
    std::string placeOrder(const std::string& instrument_key,
                           long long quantity,
                           core::TradeAction action) override;

private:
    std::string api_key_;
    std::string api_secret_;
    std::string redirect_uri_;
    std::string access_token_;
    std::string api_version_ = "2.0"; // Api-Version header value
    std::string base_url_ = "https://api.upstox.com"; // Or configurable

    // GET base_url_ + endpoint, returns the parsed body after status checks
    std::string performGetRequest(const std::string& endpoint,
                                  const std::vector<std::pair<std::string, std::string>>& params);
    std::string performPostRequest(const std::string& endpoint, const std::string& json_body);
    // Throws on transport errors, 401, non-2xx
    void checkResponse(const std::string& what, int status_code, bool transport_error,
                       const std::string& error_message, const std::string& body);
};

} // namespace data
