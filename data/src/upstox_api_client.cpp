#include "upstox_api_client.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <stdexcept> // For runtime_error etc.
#include <algorithm>

namespace data {

// Constructor Implementation
UpstoxApiClient::UpstoxApiClient(const std::string& api_key,
                                 const std::string& api_secret,
                                 const std::string& redirect_uri,
                                 const std::string& access_token)
    : api_key_(api_key),
      api_secret_(api_secret),
      redirect_uri_(redirect_uri),
      access_token_(access_token)
{
    core::logging::getLogger()->debug("UpstoxApiClient created.");
    if (access_token_.empty()) {
         core::logging::getLogger()->warn("UpstoxApiClient created without access token.");
    }
}

void UpstoxApiClient::checkResponse(const std::string& what, int status_code, bool transport_error,
                                    const std::string& error_message, const std::string& body)
{
    auto logger = core::logging::getLogger();
    if (transport_error) {
        throw core::ExternalServiceException(fmt::format("Upstox {} request failed (network): {}", what, error_message));
    }
    logger->debug("Upstox {} response status: {}, body size: {}", what, status_code, body.length());
    if (status_code == 401) {
        logger->critical("Upstox API returned 401 Unauthorized. Access token may be invalid or expired.");
        access_token_.clear();
        throw core::AuthenticationException("Upstox rejected the access token (401) on " + what);
    }
    if (status_code < 200 || status_code >= 300) {
        throw core::ExternalServiceException(fmt::format("Upstox {} request failed: status {}, body '{}'",
                                                         what, status_code, body.substr(0, 500)));
    }
}

std::string UpstoxApiClient::performGetRequest(const std::string& endpoint,
                                               const std::vector<std::pair<std::string, std::string>>& params)
{
    if (access_token_.empty()) {
        throw core::AuthenticationException("Cannot call Upstox: access token is missing.");
    }
    std::string full_url = base_url_ + endpoint;
    core::logging::getLogger()->debug("Requesting Upstox URL: {}", full_url);

    cpr::Parameters parameters{};
    for (const auto& p : params) {
        parameters.Add({p.first, p.second});
    }
    cpr::Header headers = {
        {"Accept", "application/json"},
        {"Api-Version", api_version_},
        {"Authorization", "Bearer " + access_token_}
    };

    cpr::Response response = cpr::Get(cpr::Url{full_url}, headers, parameters, cpr::Timeout{15000});
    checkResponse(endpoint, static_cast<int>(response.status_code),
                  response.error.code != cpr::ErrorCode::OK, response.error.message, response.text);
    return response.text;
}

std::string UpstoxApiClient::performPostRequest(const std::string& endpoint, const std::string& json_body)
{
    if (access_token_.empty()) {
        throw core::AuthenticationException("Cannot call Upstox: access token is missing.");
    }
    std::string full_url = base_url_ + endpoint;
    core::logging::getLogger()->debug("Posting to Upstox URL: {}", full_url);

    cpr::Header headers = {
        {"Accept", "application/json"},
        {"Content-Type", "application/json"},
        {"Api-Version", api_version_},
        {"Authorization", "Bearer " + access_token_}
    };

    cpr::Response response = cpr::Post(cpr::Url{full_url}, headers, cpr::Body{json_body}, cpr::Timeout{15000});
    checkResponse(endpoint, static_cast<int>(response.status_code),
                  response.error.code != cpr::ErrorCode::OK, response.error.message, response.text);
    return response.text;
}

namespace {
    nlohmann::json parseBody(const std::string& what, const std::string& body) {
        nlohmann::json json_response;
        try {
            json_response = nlohmann::json::parse(body);
        } catch (const nlohmann::json::parse_error& e) {
            throw core::ExternalServiceException(fmt::format("Failed to parse Upstox {} response: {}", what, e.what()));
        }
        // Check Upstox specific status within JSON
        if (json_response.contains("status") && json_response["status"] != "success") {
            std::string api_error_msg = json_response.value("message", "Unknown API error message");
            throw core::ExternalServiceException(fmt::format("Upstox {} returned non-success status: {}", what, api_error_msg));
        }
        if (!json_response.contains("data")) {
            throw core::ExternalServiceException(fmt::format("Unexpected Upstox {} response: 'data' not found.", what));
        }
        return json_response;
    }

    std::optional<double> optionalNumber(const nlohmann::json& node, const char* key) {
        if (node.contains(key) && node[key].is_number()) {
            return node[key].get<double>();
        }
        return std::nullopt;
    }
} // end anonymous namespace

core::Quote UpstoxApiClient::getQuote(const std::string& instrument_key)
{
    auto logger = core::logging::getLogger();
    std::string body = performGetRequest("/v2/market-quote/quotes", {{"instrument_key", instrument_key}});
    nlohmann::json json_response = parseBody("quote", body);

    core::Quote quote;
    quote.instrument_key = instrument_key;

    // Entries are keyed by "EXCHANGE:SYMBOL"; match on instrument_token, fall back to the only entry
    const auto& data = json_response["data"];
    const nlohmann::json* entry = nullptr;
    for (auto it = data.begin(); it != data.end(); ++it) {
        if (it.value().value("instrument_token", std::string()) == instrument_key) {
            entry = &it.value();
            break;
        }
    }
    if (!entry && data.size() == 1) {
        entry = &data.begin().value();
    }
    if (!entry) {
        logger->warn("Upstox quote response has no entry for {}", instrument_key);
        return quote; // No usable price
    }

    quote.last_price = optionalNumber(*entry, "last_price");
    if (entry->contains("ohlc") && (*entry)["ohlc"].is_object()) {
        quote.day_high = optionalNumber((*entry)["ohlc"], "high");
        quote.day_low = optionalNumber((*entry)["ohlc"], "low");
    }
    if (entry->contains("timestamp") && (*entry)["timestamp"].is_string()) {
        try {
            quote.timestamp = core::utils::stringToTimestamp((*entry)["timestamp"].get<std::string>());
        } catch (const std::runtime_error& e) {
            logger->debug("Ignoring unparseable quote timestamp for {}: {}", instrument_key, e.what());
        }
    }
    logger->trace("Quote {}: last_price={}", instrument_key, quote.last_price ? *quote.last_price : 0.0);
    return quote;
}

core::TimeSeries<core::Candle> UpstoxApiClient::getHistoricalCandleData(
    const std::string& instrument_key,
    const std::string& interval,
    const std::string& from_date, // YYYY-MM-DD
    const std::string& to_date)   // YYYY-MM-DD
{
    core::TimeSeries<core::Candle> candles;
    auto logger = core::logging::getLogger();

    // /v2/historical-candle/INSTRUMENT_KEY/INTERVAL/TO_DATE/FROM_DATE
    // URL Encoding is crucial for instrument keys containing special characters like '|'
    std::string endpoint = fmt::format("/v2/historical-candle/{}/{}/{}/{}",
                                       cpr::util::urlEncode(instrument_key),
                                       cpr::util::urlEncode(interval),
                                       to_date, // Dates usually don't need encoding
                                       from_date);

    nlohmann::json json_response = parseBody("historical-candle", performGetRequest(endpoint, {}));

    if (!json_response["data"].contains("candles") || !json_response["data"]["candles"].is_array()) {
        throw core::ExternalServiceException("Unexpected JSON structure: 'data.candles' not found or not an array.");
    }
    const auto& json_candles = json_response["data"]["candles"];
    logger->info("Received {} candles from Upstox API for {}.", json_candles.size(), instrument_key);

    // --- Convert JSON Candles to core::Candle ---
    for (const auto& json_candle : json_candles) {
        if (!json_candle.is_array() || json_candle.size() < 6) { // Expecting [timestamp, o, h, l, c, v, (oi maybe)]
            logger->warn("Skipping invalid candle data format in JSON array.");
            continue;
        }
        try {
            core::Candle candle;
            candle.timestamp = core::utils::stringToTimestamp(json_candle[0].get<std::string>());
            candle.open  = json_candle[1].get<double>();
            candle.high  = json_candle[2].get<double>();
            candle.low   = json_candle[3].get<double>();
            candle.close = json_candle[4].get<double>();
            candle.volume = json_candle[5].get<long long>();
            if (json_candle.size() > 6 && json_candle[6].is_number()) {
                candle.open_interest = json_candle[6].get<long long>();
            }
            candles.push_back(candle);
        } catch (const nlohmann::json::exception& e) {
            logger->error("Error parsing individual candle JSON data: {}", e.what());
        } catch (const std::runtime_error& e) {
            logger->error("Error converting candle data: {}", e.what());
        }
    }

    // Upstox returns newest first
    std::sort(candles.begin(), candles.end());
    logger->debug("Parsed {} candles successfully.", candles.size());
    return candles;
}

std::string UpstoxApiClient::placeOrder(const std::string& instrument_key,
                                        long long quantity,
                                        core::TradeAction action)
{
    auto logger = core::logging::getLogger();
    if (quantity <= 0) {
        throw std::invalid_argument("Order quantity must be positive for " + instrument_key);
    }
    nlohmann::json order = {
        {"quantity", quantity},
        {"product", "D"},
        {"validity", "DAY"},
        {"price", 0},
        {"tag", "swing_trader"},
        {"instrument_token", instrument_key},
        {"order_type", "MARKET"},
        {"transaction_type", core::tradeActionToString(action)},
        {"disclosed_quantity", 0},
        {"trigger_price", 0},
        {"is_amo", false}
    };
    logger->info("Placing {} MARKET order for {} x {}", core::tradeActionToString(action), quantity, instrument_key);

    nlohmann::json json_response = parseBody("order/place", performPostRequest("/v2/order/place", order.dump()));
    std::string order_id = json_response["data"].value("order_id", std::string());
    if (order_id.empty()) {
        throw core::ExternalServiceException("Upstox order/place response carries no order_id for " + instrument_key);
    }
    logger->info("Order accepted by Upstox: {}", order_id);
    return order_id;
}

} // namespace data
