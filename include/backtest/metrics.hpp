#pragma once

#include "../config/defaults.hpp"
#include "../strategy/signal.hpp"
#include "../types.hpp"

#include <ostream>
#include <span>
#include <vector>

namespace fbt {
namespace backtest {

/**
 * Trade Record
 *
 * Emitted when a position closes. Prices include slippage, pnl is net of
 * the round-trip taker fee.
 */
struct TradeRecord {
    Timestamp entry_time = 0;
    Timestamp exit_time = 0;
    Price entry_price = 0;
    Price exit_price = 0;
    strategy::Signal side = strategy::Signal::Flat;
    Notional notional = 0;            // Exposure actually put at risk
    Notional requested_notional = 0;  // Sizer output, informational
    double fees = 0;
    PnL pnl = 0;
    bool forced = false;              // Closed at end of series
};

/**
 * One point of the equity curve
 */
struct EquityPoint {
    Timestamp timestamp = 0;
    double equity = 0;
};

/**
 * Backtest Result
 *
 * Percentages are in percent units (5.0 = 5%). max_drawdown_pct is <= 0.
 */
struct MetricsReport {
    double total_return_pct = 0;
    double annual_return_pct = 0;
    double sharpe_ratio = 0;
    double sortino_ratio = 0;
    double max_drawdown_pct = 0;
    double calmar_ratio = 0;
    double win_rate_pct = 0;
    double profit_factor = 0;
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double avg_win_usd = 0;
    double avg_loss_usd = 0;
    double largest_win_usd = 0;
    double largest_loss_usd = 0;
    int consecutive_wins = 0;
    int consecutive_losses = 0;

    double initial_capital = 0;
    double final_capital = 0;
    double total_fees = 0;
    Timestamp start_time = 0;
    Timestamp end_time = 0;

    void print(std::ostream& out) const;
};

/**
 * Metrics Calculator
 *
 * Stateless. Degenerate inputs (flat curve, single return, no trades,
 * zero elapsed days) resolve to 0 rather than NaN.
 */
class MetricsCalculator {
public:
    static MetricsReport calculate(std::span<const EquityPoint> equity_curve,
                                   std::span<const TradeRecord> trades,
                                   double risk_free_rate_annual = config::metrics::RISK_FREE_RATE);

    // Simple returns between consecutive points (size n-1)
    static std::vector<double> period_returns(std::span<const EquityPoint> equity_curve);

    // Sample standard deviation (n-1); 0 for fewer than two values
    static double sample_std_dev(std::span<const double> values);

    static double max_drawdown_pct(std::span<const double> returns);

    // Longest run of values for which pred holds
    template <typename Pred>
    static int max_consecutive(std::span<const double> values, Pred pred) {
        int max_count = 0;
        int current = 0;
        for (double v : values) {
            if (pred(v)) {
                ++current;
                if (current > max_count) max_count = current;
            } else {
                current = 0;
            }
        }
        return max_count;
    }
};

}  // namespace backtest
}  // namespace fbt
