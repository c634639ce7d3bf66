#pragma once

/**
 * Time utilities for kline data
 *
 * Bar timestamps are UTC milliseconds since the Unix epoch, as exported by
 * the exchange. These helpers convert them for reports and command-line
 * arguments.
 */

#include "../types.hpp"

#include <ctime>
#include <stdexcept>
#include <string>

namespace fbt {
namespace util {

/**
 * Parse "YYYY-MM-DD" (UTC midnight) to milliseconds.
 * Throws std::invalid_argument on malformed input.
 */
inline Timestamp parse_date(const std::string& date_str) {
    struct tm tm = {};
    const char* end = strptime(date_str.c_str(), "%Y-%m-%d", &tm);
    if (end == nullptr || *end != '\0') {
        throw std::invalid_argument("Invalid date format: " + date_str);
    }
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;

    time_t t = timegm(&tm); // UTC
    return static_cast<Timestamp>(t) * MS_PER_SECOND;
}

/**
 * Format milliseconds as "YYYY-MM-DD HH:MM:SS" (UTC).
 */
inline std::string format_timestamp(Timestamp ts, const char* fmt = "%Y-%m-%d %H:%M:%S") {
    time_t t = static_cast<time_t>(ts / MS_PER_SECOND);
    struct tm tm;
    gmtime_r(&t, &tm);
    char buf[32];
    strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}

/**
 * Kline interval to minutes: "1m", "5m", "15m", "1h", "4h", "1d", "1w".
 * Throws std::invalid_argument for anything else.
 */
inline int timeframe_to_minutes(const std::string& timeframe) {
    if (timeframe.size() < 2) {
        throw std::invalid_argument("Invalid timeframe: " + timeframe);
    }

    char unit = timeframe.back();
    std::string digits = timeframe.substr(0, timeframe.size() - 1);
    if (digits.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Invalid timeframe: " + timeframe);
    }
    int n = std::stoi(digits);
    if (n <= 0) {
        throw std::invalid_argument("Invalid timeframe: " + timeframe);
    }

    switch (unit) {
    case 'm':
        return n;
    case 'h':
        return n * 60;
    case 'd':
        return n * 60 * 24;
    case 'w':
        return n * 60 * 24 * 7;
    default:
        throw std::invalid_argument("Invalid timeframe: " + timeframe);
    }
}

// Start of the candle containing ts
inline Timestamp candle_start(Timestamp ts, const std::string& timeframe) {
    Timestamp width = static_cast<Timestamp>(timeframe_to_minutes(timeframe)) * MS_PER_MINUTE;
    return ts - (ts % width);
}

}  // namespace util
}  // namespace fbt
