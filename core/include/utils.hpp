#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Convert Timestamp to ISO 8601 string in IST (+05:30), matching the database format
    std::string timestampToString(const Timestamp& ts);

    // Parse ISO 8601 string (with Z or +HH:MM offset) to Timestamp
    Timestamp stringToTimestamp(const std::string& iso_string);

    // "YYYY-MM-DD" of the IST calendar day containing ts
    std::string dateToString(const Timestamp& ts);

    // "YYYY-MM-DD" -> IST midnight of that day
    Timestamp parseDate(const std::string& date);

    // IST midnight of the calendar day containing ts
    Timestamp istDayStart(const Timestamp& ts);

    // Whole calendar days elapsed from 'from' to 'to' (floored, like a date difference)
    int daysBetween(const Timestamp& from, const Timestamp& to);

    Timestamp addDays(const Timestamp& ts, int days);

    // Minutes since IST midnight for ts
    int istMinutesOfDay(const Timestamp& ts);

    // "HH:MM" -> minutes since midnight. Throws std::invalid_argument on bad input.
    int parseTimeOfDay(const std::string& hh_mm);

} // namespace utils
} // namespace core
