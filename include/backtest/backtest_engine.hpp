#pragma once

#include "../config/backtest_config.hpp"
#include "../exchange/market_data.hpp"
#include "../logging/async_logger.hpp"
#include "../strategy/signal.hpp"
#include "../strategy/trading_position.hpp"
#include "../types.hpp"
#include "metrics.hpp"

#include <functional>
#include <span>
#include <vector>

namespace fbt {
namespace backtest {

using Signal = strategy::Signal;
using TradingPosition = strategy::TradingPosition;
using BacktestConfig = config::BacktestConfig;
using Bar = exchange::Bar;

/**
 * Signal generator: desired position given every bar up to and including
 * the current one. The span never extends past the current bar.
 */
using SignalFn = std::function<Signal(std::span<const Bar> history)>;

/**
 * Position sizer: notional the strategy would like to put on, given the
 * running equity and the opening signal.
 *
 * NOTE: the engine records and logs this value but sizes every position at
 * equity * leverage. Kept as-is until sizing semantics are settled.
 */
using SizerFn = std::function<double(double equity, Signal signal)>;

/**
 * Backtest Engine
 *
 * Bar-by-bar simulation of a single leveraged futures position.
 *
 * Timing: the signal computed from bars[0..i] acts at bar i's close.
 * Bar 0 only seeds the equity curve; the signal function is first called
 * with two bars.
 *
 * Each run() starts from a clean state, so one engine can be reused
 * sequentially. Engines are not thread-safe; use one per thread.
 */
class BacktestEngine {
public:
    explicit BacktestEngine(const BacktestConfig& config = BacktestConfig(),
                            logging::AsyncLogger* logger = nullptr);

    /**
     * Run the simulation and compute metrics.
     *
     * @throws InvalidInputError for a series shorter than two bars, timestamps
     *         that do not strictly increase, or malformed prices
     * Exceptions from signal_fn / sizer_fn propagate unchanged.
     */
    MetricsReport run(std::span<const Bar> bars, const SignalFn& signal_fn, const SizerFn& sizer_fn);

    // Clear position, equity, trade log and equity curve
    void reset();

    const BacktestConfig& config() const { return config_; }
    const std::vector<TradeRecord>& trades() const { return trades_; }
    const std::vector<EquityPoint>& equity_curve() const { return equity_curve_; }
    const TradingPosition& position() const { return position_; }
    double equity() const { return equity_; }

    // Price after slippage against the trader
    Price entry_fill_price(Price close, Signal side) const;
    Price exit_fill_price(Price close, Signal side) const;

    // Throws InvalidInputError describing the first offending bar
    static void validate_bars(std::span<const Bar> bars);

private:
    BacktestConfig config_;
    logging::AsyncLogger* logger_;

    // State
    double equity_;
    TradingPosition position_;
    std::vector<TradeRecord> trades_;
    std::vector<EquityPoint> equity_curve_;

    void open_position(Signal signal, const Bar& bar, const SizerFn& sizer_fn);
    void close_position(const Bar& bar, Price exit_price, bool forced);
    double mark_to_market(const Bar& bar) const;
};

}  // namespace backtest
}  // namespace fbt
