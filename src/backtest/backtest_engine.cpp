#include "../../include/backtest/backtest_engine.hpp"

#include <cmath>
#include <string>

namespace fbt::backtest {

namespace {

bool is_valid_price(double p) {
    return std::isfinite(p) && p >= 0;
}

std::string bar_error(std::size_t index, const std::string& what) {
    return "bar " + std::to_string(index) + ": " + what;
}

} // namespace

// =============================================================================
// Construction / state
// =============================================================================

BacktestEngine::BacktestEngine(const BacktestConfig& config, logging::AsyncLogger* logger)
    : config_(config)
    , logger_(logger)
    , equity_(config.initial_capital) {
    config_.validate();

    if (logger_) {
        FBT_LOGF_INFO(*logger_, Engine, "engine: capital=%.2f leverage=%.2f taker=%.5f slip=%.4f%%",
                      config_.initial_capital, config_.leverage, config_.taker_fee, config_.slippage_pct);
    }
}

void BacktestEngine::reset() {
    equity_ = config_.initial_capital;
    position_ = TradingPosition{};
    trades_.clear();
    equity_curve_.clear();
}

void BacktestEngine::validate_bars(std::span<const Bar> bars) {
    if (bars.size() < 2) {
        throw InvalidInputError("need at least 2 bars, got " + std::to_string(bars.size()));
    }

    for (std::size_t i = 0; i < bars.size(); ++i) {
        const Bar& b = bars[i];

        if (!is_valid_price(b.open) || !is_valid_price(b.high) || !is_valid_price(b.low) ||
            !is_valid_price(b.close)) {
            throw InvalidInputError(bar_error(i, "prices must be finite and non-negative"));
        }
        if (!std::isfinite(b.volume) || b.volume < 0) {
            throw InvalidInputError(bar_error(i, "volume must be finite and non-negative"));
        }
        if (b.close <= 0) {
            throw InvalidInputError(bar_error(i, "close must be > 0"));
        }
        if (b.high < b.low || b.high < b.open || b.high < b.close || b.low > b.open || b.low > b.close) {
            throw InvalidInputError(bar_error(i, "inconsistent OHLC"));
        }
        if (i > 0 && b.timestamp <= bars[i - 1].timestamp) {
            throw InvalidInputError(bar_error(i, "timestamp " + std::to_string(b.timestamp) +
                                                     " does not increase (previous " +
                                                     std::to_string(bars[i - 1].timestamp) + ")"));
        }
    }
}

// =============================================================================
// Simulation
// =============================================================================

MetricsReport BacktestEngine::run(std::span<const Bar> bars, const SignalFn& signal_fn, const SizerFn& sizer_fn) {
    validate_bars(bars);
    if (!signal_fn) {
        throw InvalidInputError("signal function is empty");
    }
    if (!sizer_fn) {
        throw InvalidInputError("sizer function is empty");
    }

    reset();
    equity_curve_.reserve(bars.size() + 1);

    if (logger_) {
        FBT_LOGF_INFO(*logger_, Engine, "run: %zu bars %llu -> %llu", bars.size(),
                      static_cast<unsigned long long>(bars.front().timestamp),
                      static_cast<unsigned long long>(bars.back().timestamp));
    }

    try {
        // Bar 0 seeds the curve; nothing can be decided from a single bar
        equity_curve_.push_back({bars.front().timestamp, equity_});

        for (std::size_t i = 1; i < bars.size(); ++i) {
            const Bar& bar = bars[i];

            Signal signal = signal_fn(bars.first(i + 1));
            if (signal != Signal::Flat && signal != Signal::Long && signal != Signal::Short) {
                throw InvalidInputError(bar_error(i, "signal function returned " +
                                                         std::to_string(signal_direction(signal))));
            }

            // Exit on any change of desired side, including to flat
            if (!position_.is_flat() && signal != position_.side) {
                close_position(bar, exit_fill_price(bar.close, position_.side), false);
            }

            if (position_.is_flat() && signal != Signal::Flat) {
                open_position(signal, bar, sizer_fn);
            }

            equity_curve_.push_back({bar.timestamp, mark_to_market(bar)});
        }

        // Settle at the final close, no slippage
        const Bar& last = bars.back();
        if (!position_.is_flat()) {
            close_position(last, last.close, true);
        }
        equity_curve_.push_back({last.timestamp, equity_});
    } catch (...) {
        // All-or-nothing: a failed run leaves no partial log behind
        reset();
        throw;
    }

    MetricsReport report = MetricsCalculator::calculate(equity_curve_, trades_, config_.risk_free_rate);

    if (logger_) {
        FBT_LOGF_INFO(*logger_, Engine, "done: %d trades, equity %.2f, return %.2f%%", report.total_trades,
                      equity_, report.total_return_pct);
        FBT_LOGF_INFO(*logger_, Metrics, "sharpe=%.3f sortino=%.3f max_dd=%.2f%% win_rate=%.1f%%", report.sharpe_ratio,
                      report.sortino_ratio, report.max_drawdown_pct, report.win_rate_pct);
    }

    return report;
}

Price BacktestEngine::entry_fill_price(Price close, Signal side) const {
    double slip = config_.slippage_pct / config::costs::PCT_DIVISOR;
    return side == Signal::Short ? close * (1 - slip) : close * (1 + slip);
}

Price BacktestEngine::exit_fill_price(Price close, Signal side) const {
    double slip = config_.slippage_pct / config::costs::PCT_DIVISOR;
    return side == Signal::Short ? close * (1 + slip) : close * (1 - slip);
}

void BacktestEngine::open_position(Signal signal, const Bar& bar, const SizerFn& sizer_fn) {
    double requested = sizer_fn(equity_, signal);

    position_.side = signal;
    position_.entry_price = entry_fill_price(bar.close, signal);
    position_.entry_time = bar.timestamp;
    position_.notional = equity_ * config_.leverage;
    position_.requested_notional = requested;

    if (logger_) {
        FBT_LOGF_DEBUG(*logger_, Engine, "open %s @ %.4f notional=%.2f t=%llu", strategy::signal_to_string(signal),
                       position_.entry_price, position_.notional, static_cast<unsigned long long>(bar.timestamp));
        if (requested != position_.notional) {
            FBT_LOGF_DEBUG(*logger_, Sizing, "sizer asked %.2f, using equity*leverage %.2f", requested,
                           position_.notional);
        }
    }
}

void BacktestEngine::close_position(const Bar& bar, Price exit_price, bool forced) {
    if (position_.is_flat()) return;

    // Taker fee on entry and exit notional
    double fees = position_.notional * config_.taker_fee * 2;
    PnL pnl = position_.gross_pnl(exit_price) - fees;

    TradeRecord trade;
    trade.entry_time = position_.entry_time;
    trade.exit_time = bar.timestamp;
    trade.entry_price = position_.entry_price;
    trade.exit_price = exit_price;
    trade.side = position_.side;
    trade.notional = position_.notional;
    trade.requested_notional = position_.requested_notional;
    trade.fees = fees;
    trade.pnl = pnl;
    trade.forced = forced;
    trades_.push_back(trade);

    equity_ += pnl;

    if (logger_) {
        FBT_LOGF_DEBUG(*logger_, Engine, "close %s @ %.4f pnl=%.2f%s t=%llu", strategy::signal_to_string(trade.side),
                       exit_price, pnl, forced ? " (end)" : "", static_cast<unsigned long long>(bar.timestamp));
    }

    position_ = TradingPosition{};
}

double BacktestEngine::mark_to_market(const Bar& bar) const {
    // Unrealized P&L at the close, fees not deducted until exit
    return equity_ + position_.gross_pnl(bar.close);
}

} // namespace fbt::backtest
