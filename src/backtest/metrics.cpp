#include "../../include/backtest/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace fbt::backtest {

namespace {

double mean_of(std::span<const double> values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double finite_or_zero(double v) {
    return std::isfinite(v) ? v : 0.0;
}

// Equal returns still leave a stdev of ~1e-20 from the rounded mean
bool has_dispersion(double std_dev, double mean) {
    return std_dev > config::metrics::MIN_RELATIVE_STDEV * std::max(1.0, std::abs(mean));
}

} // namespace

// =============================================================================
// Building blocks
// =============================================================================

std::vector<double> MetricsCalculator::period_returns(std::span<const EquityPoint> equity_curve) {
    std::vector<double> returns;
    if (equity_curve.size() < 2) return returns;

    returns.reserve(equity_curve.size() - 1);
    for (std::size_t i = 1; i < equity_curve.size(); ++i) {
        double prev = equity_curve[i - 1].equity;
        returns.push_back(prev != 0 ? (equity_curve[i].equity - prev) / prev : 0.0);
    }
    return returns;
}

double MetricsCalculator::sample_std_dev(std::span<const double> values) {
    if (values.size() < 2) return 0.0;

    double mean = mean_of(values);
    double sum_sq = 0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

double MetricsCalculator::max_drawdown_pct(std::span<const double> returns) {
    // Compounded growth of 1 unit, peak taken over the compounded series only
    double cumulative = 1.0;
    double running_max = 0.0;
    double worst = 0.0;
    bool first = true;

    for (double r : returns) {
        cumulative *= (1 + r);
        if (first || cumulative > running_max) {
            running_max = cumulative;
            first = false;
        }
        if (running_max != 0) {
            worst = std::min(worst, (cumulative - running_max) / running_max);
        }
    }
    return worst * 100;
}

// =============================================================================
// Report
// =============================================================================

MetricsReport MetricsCalculator::calculate(std::span<const EquityPoint> equity_curve,
                                           std::span<const TradeRecord> trades,
                                           double risk_free_rate_annual) {
    MetricsReport report;
    if (equity_curve.empty()) return report;

    const double initial = equity_curve.front().equity;
    const double final_equity = equity_curve.back().equity;

    report.initial_capital = initial;
    report.final_capital = final_equity;
    report.start_time = equity_curve.front().timestamp;
    report.end_time = equity_curve.back().timestamp;

    // --- Returns ---
    std::vector<double> returns = period_returns(equity_curve);

    if (initial != 0) {
        report.total_return_pct = finite_or_zero((final_equity / initial - 1) * 100);
    }

    // Whole elapsed days, as calendar arithmetic on dates would count them
    Timestamp elapsed_ms = report.end_time > report.start_time ? report.end_time - report.start_time : 0;
    double days = static_cast<double>(elapsed_ms / MS_PER_DAY);
    double years = days / config::metrics::DAYS_PER_YEAR;

    double annual_return = 0.0;
    if (years > 0 && initial > 0) {
        double growth = final_equity / initial;
        if (growth <= 0) {
            annual_return = config::metrics::WIPED_OUT_RETURN_PCT / 100;
        } else {
            annual_return = finite_or_zero(std::pow(growth, 1.0 / years) - 1);
        }
    }
    report.annual_return_pct = annual_return * 100;

    // --- Risk-adjusted ---
    const double periods = config::metrics::TRADING_DAYS;
    const double rf_per_period = risk_free_rate_annual / periods;

    std::vector<double> excess;
    std::vector<double> downside;
    excess.reserve(returns.size());
    for (double r : returns) {
        excess.push_back(r - rf_per_period);
        if (r < 0) downside.push_back(r);
    }

    double excess_mean = mean_of(excess);
    double excess_std = sample_std_dev(excess);
    if (has_dispersion(excess_std, excess_mean)) {
        report.sharpe_ratio = finite_or_zero(std::sqrt(periods) * excess_mean / excess_std);
    }

    double downside_std = sample_std_dev(downside);
    if (has_dispersion(downside_std, mean_of(downside))) {
        report.sortino_ratio = finite_or_zero(std::sqrt(periods) * excess_mean / downside_std);
    }

    report.max_drawdown_pct = finite_or_zero(max_drawdown_pct(returns));
    if (report.max_drawdown_pct != 0) {
        report.calmar_ratio = finite_or_zero(annual_return / std::abs(report.max_drawdown_pct / 100));
    }

    // --- Trades ---
    if (!trades.empty()) {
        std::vector<double> pnls;
        pnls.reserve(trades.size());

        double gross_profit = 0;
        double gross_loss = 0;
        for (const auto& trade : trades) {
            pnls.push_back(trade.pnl);
            report.total_fees += trade.fees;
            if (trade.pnl > 0) {
                report.winning_trades++;
                gross_profit += trade.pnl;
            } else if (trade.pnl < 0) {
                report.losing_trades++;
                gross_loss += trade.pnl;
            }
        }
        gross_loss = std::abs(gross_loss);

        report.total_trades = static_cast<int>(trades.size());
        report.win_rate_pct = static_cast<double>(report.winning_trades) / report.total_trades * 100;

        if (gross_loss > 0) {
            report.profit_factor = gross_profit / gross_loss;
        }
        if (report.winning_trades > 0) {
            report.avg_win_usd = gross_profit / report.winning_trades;
        }
        if (report.losing_trades > 0) {
            report.avg_loss_usd = gross_loss / report.losing_trades;
        }

        report.largest_win_usd = *std::max_element(pnls.begin(), pnls.end());
        report.largest_loss_usd = *std::min_element(pnls.begin(), pnls.end());

        report.consecutive_wins = max_consecutive(pnls, [](double p) { return p > 0; });
        report.consecutive_losses = max_consecutive(pnls, [](double p) { return p < 0; });
    }

    return report;
}

void MetricsReport::print(std::ostream& out) const {
    out << "\n=== Backtest Results ===\n";
    out << "Period: " << start_time << " - " << end_time << "\n";
    out << "\n--- Capital ---\n";
    out << "Initial: $" << initial_capital << "\n";
    out << "Final:   $" << final_capital << "\n";
    out << "Return:  " << total_return_pct << "%\n";
    out << "Annual:  " << annual_return_pct << "%\n";
    out << "Fees:    $" << total_fees << "\n";

    out << "\n--- Risk ---\n";
    out << "Max Drawdown: " << max_drawdown_pct << "%\n";
    out << "Sharpe Ratio: " << sharpe_ratio << "\n";
    out << "Sortino Ratio: " << sortino_ratio << "\n";
    out << "Calmar Ratio: " << calmar_ratio << "\n";

    out << "\n--- Trades ---\n";
    out << "Total:   " << total_trades << "\n";
    out << "Winning: " << winning_trades << " (" << win_rate_pct << "%)\n";
    out << "Losing:  " << losing_trades << "\n";
    out << "Profit Factor: " << profit_factor << "\n";
    out << "Max Consecutive Wins:   " << consecutive_wins << "\n";
    out << "Max Consecutive Losses: " << consecutive_losses << "\n";

    out << "\n--- Average Trade ---\n";
    out << "Avg Win:  $" << avg_win_usd << "\n";
    out << "Avg Loss: $" << avg_loss_usd << "\n";
    out << "Largest Win:  $" << largest_win_usd << "\n";
    out << "Largest Loss: $" << largest_loss_usd << "\n";
}

} // namespace fbt::backtest
