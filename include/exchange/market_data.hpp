#pragma once

#include "../types.hpp"
#include <vector>
#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <iomanip>

namespace fbt {
namespace exchange {

/**
 * OHLCV price bar
 *
 * One row of a Binance futures kline export. Prices are in quote currency,
 * timestamp is the candle open time in milliseconds.
 */
struct Bar {
    Timestamp timestamp = 0;
    Price open = 0;
    Price high = 0;
    Price low = 0;
    Price close = 0;
    double volume = 0;

    // Helpers
    Price mid() const { return (high + low) / 2; }
    Price range() const { return high - low; }
    bool is_bullish() const { return close > open; }
    bool is_bearish() const { return close < open; }
};

/**
 * Load bars from CSV file
 *
 * Expected format (Binance kline export, extra columns ignored):
 * open_time,open,high,low,close,volume[,close_time,quote_volume,...]
 *
 * A header line is skipped if present. Rows with fewer than six columns or
 * unparseable numbers are skipped; the series is not otherwise checked here.
 */
inline std::vector<Bar> load_bars_csv(const std::string& filename) {
    std::vector<Bar> bars;
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::string line;
    bool first_line = true;

    while (std::getline(file, line)) {
        // Skip header if present
        if (first_line && (line.find("open_time") != std::string::npos ||
                           line.find("timestamp") != std::string::npos)) {
            first_line = false;
            continue;
        }
        first_line = false;

        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        std::stringstream ss(line);
        std::string token;
        std::vector<std::string> tokens;

        while (std::getline(ss, token, ',')) {
            tokens.push_back(token);
        }

        if (tokens.size() < 6) continue;

        Bar b;
        try {
            b.timestamp = std::stoull(tokens[0]);
            b.open = std::stod(tokens[1]);
            b.high = std::stod(tokens[2]);
            b.low = std::stod(tokens[3]);
            b.close = std::stod(tokens[4]);
            b.volume = std::stod(tokens[5]);
        } catch (const std::logic_error&) {
            continue;  // invalid_argument / out_of_range from stoull/stod
        }

        bars.push_back(b);
    }

    return bars;
}

/**
 * Save bars to CSV file (same layout load_bars_csv reads)
 */
inline void save_bars_csv(const std::string& filename, const std::vector<Bar>& bars) {
    std::ofstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filename);
    }

    file << "open_time,open,high,low,close,volume\n";
    file << std::setprecision(10);

    for (const auto& b : bars) {
        file << b.timestamp << ","
             << b.open << ","
             << b.high << ","
             << b.low << ","
             << b.close << ","
             << b.volume << "\n";
    }
}

}  // namespace exchange
}  // namespace fbt
