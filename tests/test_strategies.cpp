#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>
#include "../include/backtest/strategies.hpp"

using namespace fbt;
using namespace fbt::backtest;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)

template <typename F>
static bool throws_invalid_argument(F&& f) {
    try {
        f();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

static std::vector<Bar> bars_from_closes(const std::vector<double>& closes) {
    std::vector<Bar> bars;
    for (size_t i = 0; i < closes.size(); i++) {
        Bar b;
        b.timestamp = 1704067200000ULL + i * MS_PER_HOUR;
        b.open = b.high = b.low = b.close = closes[i];
        b.volume = 1;
        bars.push_back(b);
    }
    return bars;
}

static Signal signal_at(const SignalFn& fn, const std::vector<Bar>& bars, size_t i) {
    return fn(std::span<const Bar>(bars).first(i + 1));
}

// === SMA Crossover ===

TEST(test_sma_warmup_is_flat) {
    auto fn = sma_crossover(2, 3);
    auto bars = bars_from_closes({1, 2, 3, 4});
    ASSERT_TRUE(signal_at(fn, bars, 0) == Signal::Flat);
    ASSERT_TRUE(signal_at(fn, bars, 1) == Signal::Flat);
}

TEST(test_sma_follows_trend) {
    auto fn = sma_crossover(2, 3);

    auto up = bars_from_closes({1, 2, 3, 4});
    ASSERT_TRUE(signal_at(fn, up, 2) == Signal::Long);   // 2.5 > 2.0
    ASSERT_TRUE(signal_at(fn, up, 3) == Signal::Long);

    auto down = bars_from_closes({4, 3, 2, 1});
    ASSERT_TRUE(signal_at(fn, down, 2) == Signal::Short);

    auto flat = bars_from_closes({5, 5, 5, 5});
    ASSERT_TRUE(signal_at(fn, flat, 3) == Signal::Flat);
}

TEST(test_sma_rejects_bad_periods) {
    ASSERT_TRUE(throws_invalid_argument([] { sma_crossover(5, 3); }));
    ASSERT_TRUE(throws_invalid_argument([] { sma_crossover(3, 3); }));
    ASSERT_TRUE(throws_invalid_argument([] { sma_crossover(0, 3); }));
}

// === RSI ===

TEST(test_rsi_extremes) {
    auto fn = rsi_signal(3);

    auto rising = bars_from_closes({1, 2, 3, 4});
    ASSERT_TRUE(signal_at(fn, rising, 2) == Signal::Flat);   // Warm-up
    ASSERT_TRUE(signal_at(fn, rising, 3) == Signal::Short);  // RSI 100, overbought

    auto falling = bars_from_closes({4, 3, 2, 1});
    ASSERT_TRUE(signal_at(fn, falling, 3) == Signal::Long);  // RSI 0, oversold
}

TEST(test_rsi_neutral_band) {
    // Gains 2, losses 1 -> RSI 66.7
    auto fn = rsi_signal(3);
    auto mixed = bars_from_closes({10, 11, 10, 11});
    ASSERT_TRUE(signal_at(fn, mixed, 3) == Signal::Flat);

    auto window = std::span<const Bar>(mixed);
    ASSERT_TRUE(std::abs(detail::trailing_rsi(window, 3) - 200.0 / 3.0) < 1e-9);
}

TEST(test_rsi_rejects_bad_params) {
    ASSERT_TRUE(throws_invalid_argument([] { rsi_signal(0); }));
    ASSERT_TRUE(throws_invalid_argument([] { rsi_signal(14, 70, 30); }));
}

// === Breakout ===

TEST(test_breakout) {
    auto fn = breakout_signal(2);

    auto up = bars_from_closes({100, 101, 102, 105});
    ASSERT_TRUE(signal_at(fn, up, 1) == Signal::Flat);   // Warm-up
    ASSERT_TRUE(signal_at(fn, up, 3) == Signal::Long);

    auto down = bars_from_closes({100, 99, 98, 90});
    ASSERT_TRUE(signal_at(fn, down, 3) == Signal::Short);

    auto inside = bars_from_closes({100, 110, 90, 100});
    ASSERT_TRUE(signal_at(fn, inside, 3) == Signal::Flat);
}

TEST(test_breakout_channel_excludes_current_bar) {
    auto fn = breakout_signal(2);
    auto bars = bars_from_closes({100, 100, 100, 101});
    bars[3].high = 120;  // Current bar's own high must not block the breakout
    ASSERT_TRUE(signal_at(fn, bars, 3) == Signal::Long);
}

// === Factory ===

TEST(test_make_signal) {
    auto bars = bars_from_closes({1, 2});
    ASSERT_TRUE(signal_at(make_signal("long"), bars, 1) == Signal::Long);
    ASSERT_TRUE(signal_at(make_signal("short"), bars, 1) == Signal::Short);
    ASSERT_TRUE(signal_at(make_signal("flat"), bars, 1) == Signal::Flat);

    // Defaults need 50 bars of warm-up
    ASSERT_TRUE(signal_at(make_signal("sma"), bars, 1) == Signal::Flat);
    ASSERT_TRUE(signal_at(make_signal("sma", 1, 2), bars, 1) == Signal::Long);

    ASSERT_TRUE(throws_invalid_argument([] { make_signal("macd"); }));
}

TEST(test_signal_strings) {
    ASSERT_EQ(std::string(strategy::signal_to_string(Signal::Long)), "LONG");
    ASSERT_EQ(std::string(strategy::signal_to_string(Signal::Short)), "SHORT");
    ASSERT_EQ(std::string(strategy::signal_to_string(Signal::Flat)), "FLAT");
    ASSERT_EQ(strategy::signal_direction(Signal::Short), -1);
}

int main() {
    std::cout << "\n=== Signal Generator Tests ===\n\n";

    RUN_TEST(test_sma_warmup_is_flat);
    RUN_TEST(test_sma_follows_trend);
    RUN_TEST(test_sma_rejects_bad_periods);
    RUN_TEST(test_rsi_extremes);
    RUN_TEST(test_rsi_neutral_band);
    RUN_TEST(test_rsi_rejects_bad_params);
    RUN_TEST(test_breakout);
    RUN_TEST(test_breakout_channel_excludes_current_bar);
    RUN_TEST(test_make_signal);
    RUN_TEST(test_signal_strings);

    std::cout << "\nAll tests passed!\n";
    return 0;
}
