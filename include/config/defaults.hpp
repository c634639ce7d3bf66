#pragma once

#include <cstdint>

/**
 * Centralized configuration defaults for the backtester.
 *
 * All default values are defined here to avoid duplication across:
 * - BacktestConfig
 * - MetricsCalculator
 * - PositionSizer
 * - run_backtest command-line defaults
 *
 * Naming:
 * - _RATE suffix: fraction of notional (0.0004 = 0.04%)
 * - _PCT suffix: percentage as written by humans (0.01 = 0.01%)
 * - _FRACTION suffix: fraction of account (0.02 = 2%)
 */

namespace fbt::config {

// =============================================================================
// Account
// =============================================================================
namespace account {
constexpr double INITIAL_CAPITAL = 100000.0; // USD
constexpr double LEVERAGE = 1.0;             // No leverage
constexpr double MIN_LEVERAGE = 1.0;
} // namespace account

// =============================================================================
// Trading Costs (Binance USD-M futures, regular tier)
// =============================================================================
namespace costs {
constexpr double MAKER_FEE_RATE = 0.0002; // 0.02%, accepted but not charged
constexpr double TAKER_FEE_RATE = 0.0004; // 0.04%, charged on entry and exit

// Slippage is a percentage: price * (1 +/- SLIPPAGE_PCT / 100)
constexpr double SLIPPAGE_PCT = 0.01;     // 0.01%
constexpr double PCT_DIVISOR = 100.0;
} // namespace costs

// =============================================================================
// Performance Metrics
// =============================================================================
namespace metrics {
constexpr double RISK_FREE_RATE = 0.02;    // 2% annual
constexpr double TRADING_DAYS = 252.0;     // Annualization periods
constexpr double DAYS_PER_YEAR = 365.25;   // Calendar years for CAGR
constexpr double WIPED_OUT_RETURN_PCT = -100.0;
constexpr double MIN_RELATIVE_STDEV = 1e-12; // Below this, equal returns (rounding noise)
} // namespace metrics

// =============================================================================
// Position Sizing
// =============================================================================
namespace sizing {
constexpr double FIXED_FRACTION = 0.02;       // Risk 2% per trade
constexpr double KELLY_MAX_FRACTION = 0.25;   // Cap on Kelly fraction

// Volatility targeting
constexpr double TARGET_VOLATILITY = 0.20;    // 20% annualized
constexpr double VOL_MIN_FRACTION = 0.005;    // 0.5% floor
constexpr double VOL_MAX_FRACTION = 0.10;     // 10% cap

// Stop-distance sizing cap
constexpr double RISK_BASED_MAX_FRACTION = 0.10;

constexpr double MAX_LEVERAGE = 5.0;
} // namespace sizing

// =============================================================================
// Sample Signal Generators
// =============================================================================
namespace signals {
constexpr int32_t SMA_FAST = 20;
constexpr int32_t SMA_SLOW = 50;

constexpr int32_t RSI_PERIOD = 14;
constexpr double RSI_OVERSOLD = 30.0;
constexpr double RSI_OVERBOUGHT = 70.0;

constexpr int32_t BREAKOUT_LOOKBACK = 20;
} // namespace signals

} // namespace fbt::config
