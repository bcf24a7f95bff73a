#include "utils.hpp"
#include <iomanip> // For std::put_time, std::get_time
#include <sstream> // For string streams
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cmath>      // For std::pow
#include <cctype>     // For std::isdigit
#include <chrono>

namespace core {
namespace utils {

    namespace {
        const auto kIstOffset = std::chrono::hours(5) + std::chrono::minutes(30);
        constexpr long long kSecondsPerDay = 24LL * 60 * 60;

        std::tm toIstTm(const Timestamp& ts) {
            auto ist_time_point = ts + kIstOffset;
            auto tt_ist = std::chrono::system_clock::to_time_t(ist_time_point);
            std::tm time_tm;
            #ifdef _WIN32
                gmtime_s(&time_tm, &tt_ist); // Format the shifted time parts as if they were UTC figures
            #else
                gmtime_r(&tt_ist, &time_tm);
            #endif
            return time_tm;
        }
    } // end anonymous namespace

    // Note: Time zone handling is fixed to IST (+05:30) for display and day boundaries.
    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Manually parse optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore(); // consume '.'
            std::string digits;
            int digit_count = 0;
            while (std::isdigit(ss.peek()) && digit_count < 9) {
                digits += static_cast<char>(ss.get());
                digit_count++;
            }
             while (std::isdigit(ss.peek())) {
                  ss.ignore();
             }

            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, digits.length());
            }
        }

        // 3. Manually parse timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration = std::chrono::seconds(0);
        char sign_or_z = 0;

        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                     throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        } else {
             throw std::runtime_error("Timestamp missing or invalid timezone offset/indicator: " + iso_string);
        }

        // 4. Convert tm to time_t (UTC seconds since epoch)
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == (time_t)-1) {
             throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::duration<double>(fractional_seconds));

        // Example: 2015-04-20T00:00:00+05:30 -> 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        std::tm time_tm = toIstTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S");
        // Append the +05:30 offset to match the DB format
        oss << "+05:30";
        return oss.str();
    }

    std::string dateToString(const Timestamp& ts) {
        std::tm time_tm = toIstTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

    Timestamp parseDate(const std::string& date) {
        if (date.size() != 10) {
            throw std::invalid_argument("Date must be formatted as YYYY-MM-DD: " + date);
        }
        return stringToTimestamp(date + "T00:00:00+05:30");
    }

    Timestamp istDayStart(const Timestamp& ts) {
        return parseDate(dateToString(ts));
    }

    int daysBetween(const Timestamp& from, const Timestamp& to) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
        // Floor division so a negative partial day counts as -1, like a date difference
        long long days = seconds / kSecondsPerDay;
        if (seconds % kSecondsPerDay != 0 && seconds < 0) {
            --days;
        }
        return static_cast<int>(days);
    }

    Timestamp addDays(const Timestamp& ts, int days) {
        return ts + std::chrono::hours(24 * days);
    }

    int istMinutesOfDay(const Timestamp& ts) {
        std::tm time_tm = toIstTm(ts);
        return time_tm.tm_hour * 60 + time_tm.tm_min;
    }

    int parseTimeOfDay(const std::string& hh_mm) {
        if (hh_mm.size() != 5 || hh_mm[2] != ':' ||
            !std::isdigit(static_cast<unsigned char>(hh_mm[0])) || !std::isdigit(static_cast<unsigned char>(hh_mm[1])) ||
            !std::isdigit(static_cast<unsigned char>(hh_mm[3])) || !std::isdigit(static_cast<unsigned char>(hh_mm[4]))) {
            throw std::invalid_argument("Time of day must be formatted as HH:MM: '" + hh_mm + "'");
        }
        int hours = std::stoi(hh_mm.substr(0, 2));
        int minutes = std::stoi(hh_mm.substr(3, 2));
        if (hours > 23 || minutes > 59) {
            throw std::invalid_argument("Time of day out of range: '" + hh_mm + "'");
        }
        return hours * 60 + minutes;
    }

} // namespace utils
} // namespace core
