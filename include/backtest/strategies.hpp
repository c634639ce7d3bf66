#pragma once

#include "backtest_engine.hpp"

#include <algorithm>
#include <span>
#include <stdexcept>
#include <string>

namespace fbt {
namespace backtest {

/**
 * Sample signal generators
 *
 * Each factory returns a SignalFn that looks only at the bar prefix it is
 * given, so results are independent of call order and safe to share across
 * sweep workers. The signal is the desired position, not an order: Flat
 * closes an open position.
 */

namespace detail {

// Mean close of the last `period` bars of history (history.size() >= period)
inline double trailing_sma(std::span<const Bar> history, std::size_t period) {
    double sum = 0;
    for (const Bar& b : history.last(period)) {
        sum += b.close;
    }
    return sum / static_cast<double>(period);
}

// Simple-average RSI over the last `period` close-to-close changes
inline double trailing_rsi(std::span<const Bar> history, std::size_t period) {
    double avg_gain = 0, avg_loss = 0;

    auto window = history.last(period + 1);
    for (std::size_t i = 1; i < window.size(); ++i) {
        double change = window[i].close - window[i - 1].close;
        if (change > 0) {
            avg_gain += change;
        } else {
            avg_loss -= change;
        }
    }

    avg_gain /= static_cast<double>(period);
    avg_loss /= static_cast<double>(period);

    if (avg_loss == 0) return 100;

    double rs = avg_gain / avg_loss;
    return 100 - (100 / (1 + rs));
}

inline std::size_t checked_period(int period, const char* name) {
    if (period <= 0) {
        throw std::invalid_argument(std::string(name) + " must be > 0, got " + std::to_string(period));
    }
    return static_cast<std::size_t>(period);
}

} // namespace detail

/**
 * Moving average crossover
 *
 * Long while fast SMA > slow SMA, short while below, flat during warm-up
 * or when they are equal.
 */
inline SignalFn sma_crossover(int fast_period = config::signals::SMA_FAST,
                              int slow_period = config::signals::SMA_SLOW) {
    std::size_t fast = detail::checked_period(fast_period, "fast_period");
    std::size_t slow = detail::checked_period(slow_period, "slow_period");
    if (fast >= slow) {
        throw std::invalid_argument("fast_period must be < slow_period");
    }

    return [fast, slow](std::span<const Bar> history) {
        if (history.size() < slow) return Signal::Flat;

        double fast_ma = detail::trailing_sma(history, fast);
        double slow_ma = detail::trailing_sma(history, slow);

        if (fast_ma > slow_ma) return Signal::Long;
        if (fast_ma < slow_ma) return Signal::Short;
        return Signal::Flat;
    };
}

/**
 * RSI
 *
 * Long when RSI < oversold, short when RSI > overbought, otherwise flat.
 */
inline SignalFn rsi_signal(int period = config::signals::RSI_PERIOD,
                           double oversold = config::signals::RSI_OVERSOLD,
                           double overbought = config::signals::RSI_OVERBOUGHT) {
    std::size_t n = detail::checked_period(period, "period");
    if (!(oversold < overbought)) {
        throw std::invalid_argument("oversold must be < overbought");
    }

    return [n, oversold, overbought](std::span<const Bar> history) {
        if (history.size() < n + 1) return Signal::Flat;

        double rsi = detail::trailing_rsi(history, n);
        if (rsi < oversold) return Signal::Long;
        if (rsi > overbought) return Signal::Short;
        return Signal::Flat;
    };
}

/**
 * Channel breakout
 *
 * Long when the close exceeds the highest high of the previous `lookback`
 * bars, short when it falls below their lowest low.
 */
inline SignalFn breakout_signal(int lookback = config::signals::BREAKOUT_LOOKBACK) {
    std::size_t n = detail::checked_period(lookback, "lookback");

    return [n](std::span<const Bar> history) {
        if (history.size() < n + 1) return Signal::Flat;

        // Channel excludes the current bar
        auto channel = history.subspan(history.size() - 1 - n, n);
        double highest = channel.front().high;
        double lowest = channel.front().low;
        for (const Bar& b : channel) {
            highest = std::max(highest, b.high);
            lowest = std::min(lowest, b.low);
        }

        double close = history.back().close;
        if (close > highest) return Signal::Long;
        if (close < lowest) return Signal::Short;
        return Signal::Flat;
    };
}

// Constant signal, mostly for tests and buy-and-hold baselines
inline SignalFn always(Signal signal) {
    return [signal](std::span<const Bar>) { return signal; };
}

/**
 * Look up a sample generator by name: "sma", "rsi", "breakout", "long", "short", "flat".
 * Unset parameters (<= 0) take defaults.
 */
inline SignalFn make_signal(const std::string& name, int p1 = 0, int p2 = 0) {
    if (name == "sma") {
        return sma_crossover(p1 > 0 ? p1 : config::signals::SMA_FAST, p2 > 0 ? p2 : config::signals::SMA_SLOW);
    }
    if (name == "rsi") {
        return rsi_signal(p1 > 0 ? p1 : config::signals::RSI_PERIOD);
    }
    if (name == "breakout") {
        return breakout_signal(p1 > 0 ? p1 : config::signals::BREAKOUT_LOOKBACK);
    }
    if (name == "long") return always(Signal::Long);
    if (name == "short") return always(Signal::Short);
    if (name == "flat") return always(Signal::Flat);

    throw std::invalid_argument("Unknown signal: " + name);
}

}  // namespace backtest
}  // namespace fbt
