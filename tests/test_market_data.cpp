#include <cassert>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include "../include/exchange/market_data.hpp"
#include "../include/util/time_utils.hpp"

using namespace fbt;
using namespace fbt::exchange;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

static std::string temp_path(const char* name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

// === Bar Tests ===

TEST(test_bar_mid_and_range) {
    Bar b;
    b.high = 110;
    b.low = 90;

    ASSERT_NEAR(b.mid(), 100.0, 1e-12);
    ASSERT_NEAR(b.range(), 20.0, 1e-12);
}

TEST(test_bar_direction) {
    Bar b;
    b.open = 100;
    b.close = 105;
    ASSERT_TRUE(b.is_bullish());
    ASSERT_FALSE(b.is_bearish());

    b.close = 95;
    ASSERT_TRUE(b.is_bearish());
    ASSERT_FALSE(b.is_bullish());
}

// === CSV Tests ===

TEST(test_save_load_bars_csv) {
    std::vector<Bar> bars;
    for (int i = 0; i < 3; i++) {
        Bar b;
        b.timestamp = 1704067200000ULL + i * MS_PER_HOUR;
        b.open = 42000.5 + i;
        b.high = 42100.25 + i;
        b.low = 41900.75 + i;
        b.close = 42050.125 + i;
        b.volume = 12.5 * (i + 1);
        bars.push_back(b);
    }

    std::string path = temp_path("fbt_test_bars.csv");
    save_bars_csv(path, bars);

    auto loaded = load_bars_csv(path);
    std::remove(path.c_str());

    ASSERT_EQ(loaded.size(), 3u);
    for (size_t i = 0; i < 3; i++) {
        ASSERT_EQ(loaded[i].timestamp, bars[i].timestamp);
        ASSERT_NEAR(loaded[i].open, bars[i].open, 1e-6);
        ASSERT_NEAR(loaded[i].high, bars[i].high, 1e-6);
        ASSERT_NEAR(loaded[i].low, bars[i].low, 1e-6);
        ASSERT_NEAR(loaded[i].close, bars[i].close, 1e-6);
        ASSERT_NEAR(loaded[i].volume, bars[i].volume, 1e-6);
    }
}

TEST(test_load_binance_export_with_extra_columns) {
    std::string path = temp_path("fbt_test_binance.csv");
    {
        std::ofstream f(path);
        f << "open_time,open,high,low,close,volume,close_time,quote_volume,trades,taker_buy_volume,taker_buy_quote_volume,ignore\n";
        f << "1704067200000,42283.58,42554.57,42261.02,42475.23,1271.68,1704070799999,53957584.5,52102,656.3,27845930.1,0\r\n";
        f << "1704070800000,42475.23,42775.00,42431.65,42613.56,1196.37,1704074399999,50968305.3,48970,602.1,25650219.2,0\r\n";
    }

    auto bars = load_bars_csv(path);
    std::remove(path.c_str());

    ASSERT_EQ(bars.size(), 2u);
    ASSERT_EQ(bars[0].timestamp, 1704067200000ULL);
    ASSERT_NEAR(bars[0].close, 42475.23, 1e-9);
    ASSERT_NEAR(bars[1].volume, 1196.37, 1e-9);
}

TEST(test_load_skips_malformed_rows) {
    std::string path = temp_path("fbt_test_malformed.csv");
    {
        std::ofstream f(path);
        f << "timestamp,open,high,low,close,volume\n";
        f << "1704067200000,100,101,99,100.5,10\n";
        f << "1704070800000,100.5,abc,99,100,10\n";  // bad number
        f << "1704074400000,100,101\n";              // too few columns
        f << "\n";
        f << "1704078000000,100,102,98,101,12\n";
    }

    auto bars = load_bars_csv(path);
    std::remove(path.c_str());

    ASSERT_EQ(bars.size(), 2u);
    ASSERT_EQ(bars[1].timestamp, 1704078000000ULL);
}

TEST(test_load_without_header) {
    std::string path = temp_path("fbt_test_noheader.csv");
    {
        std::ofstream f(path);
        f << "1704067200000,100,101,99,100.5,10\n";
    }

    auto bars = load_bars_csv(path);
    std::remove(path.c_str());

    ASSERT_EQ(bars.size(), 1u);
    ASSERT_NEAR(bars[0].close, 100.5, 1e-12);
}

TEST(test_load_missing_file_throws) {
    bool thrown = false;
    try {
        load_bars_csv("/nonexistent/dir/bars.csv");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
}

// === Time Utility Tests ===

TEST(test_parse_and_format_dates) {
    ASSERT_EQ(util::parse_date("2024-01-01"), 1704067200000ULL);
    ASSERT_EQ(util::format_timestamp(1704067200000ULL), std::string("2024-01-01 00:00:00"));
    ASSERT_EQ(util::format_timestamp(1704070800000ULL, "%Y-%m-%d %H:%M"), std::string("2024-01-01 01:00"));

    bool thrown = false;
    try {
        util::parse_date("01/02/2024");
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
}

TEST(test_timeframes) {
    ASSERT_EQ(util::timeframe_to_minutes("1m"), 1);
    ASSERT_EQ(util::timeframe_to_minutes("15m"), 15);
    ASSERT_EQ(util::timeframe_to_minutes("4h"), 240);
    ASSERT_EQ(util::timeframe_to_minutes("1d"), 1440);
    ASSERT_EQ(util::timeframe_to_minutes("1w"), 10080);

    for (const char* bad : {"", "h", "1y", "xh", "0m"}) {
        bool thrown = false;
        try {
            util::timeframe_to_minutes(bad);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown);
    }

    Timestamp ts = 1704067200000ULL + 90 * MS_PER_MINUTE;  // 01:30
    ASSERT_EQ(util::candle_start(ts, "1h"), 1704067200000ULL + MS_PER_HOUR);
    ASSERT_EQ(util::candle_start(ts, "1d"), 1704067200000ULL);
}

int main() {
    std::cout << "\n=== Market Data Tests ===\n\n";

    RUN_TEST(test_bar_mid_and_range);
    RUN_TEST(test_bar_direction);
    RUN_TEST(test_save_load_bars_csv);
    RUN_TEST(test_load_binance_export_with_extra_columns);
    RUN_TEST(test_load_skips_malformed_rows);
    RUN_TEST(test_load_without_header);
    RUN_TEST(test_load_missing_file_throws);
    RUN_TEST(test_parse_and_format_dates);
    RUN_TEST(test_timeframes);

    std::cout << "\nAll tests passed!\n";
    return 0;
}
