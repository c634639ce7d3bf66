#include "../../include/backtest/report.hpp"
#include "../../include/util/time_utils.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <stdexcept>

namespace fbt::backtest {

using json = nlohmann::json;

json metrics_to_json(const MetricsReport& report) {
    return json{
        {"total_return_pct", report.total_return_pct},
        {"annual_return_pct", report.annual_return_pct},
        {"sharpe_ratio", report.sharpe_ratio},
        {"sortino_ratio", report.sortino_ratio},
        {"max_drawdown_pct", report.max_drawdown_pct},
        {"calmar_ratio", report.calmar_ratio},
        {"win_rate_pct", report.win_rate_pct},
        {"profit_factor", report.profit_factor},
        {"total_trades", report.total_trades},
        {"winning_trades", report.winning_trades},
        {"losing_trades", report.losing_trades},
        {"avg_win_usd", report.avg_win_usd},
        {"avg_loss_usd", report.avg_loss_usd},
        {"largest_win_usd", report.largest_win_usd},
        {"largest_loss_usd", report.largest_loss_usd},
        {"consecutive_wins", report.consecutive_wins},
        {"consecutive_losses", report.consecutive_losses},
        {"initial_capital", report.initial_capital},
        {"final_capital", report.final_capital},
        {"total_fees", report.total_fees},
        {"start_time", report.start_time},
        {"end_time", report.end_time},
    };
}

json trade_to_json(const TradeRecord& trade) {
    return json{
        {"entry_time", trade.entry_time},
        {"exit_time", trade.exit_time},
        {"side", strategy::signal_to_string(trade.side)},
        {"entry_price", trade.entry_price},
        {"exit_price", trade.exit_price},
        {"notional", trade.notional},
        {"requested_notional", trade.requested_notional},
        {"fees", trade.fees},
        {"pnl", trade.pnl},
        {"forced", trade.forced},
    };
}

void write_metrics_json(const MetricsReport& report, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filepath);
    }
    file << metrics_to_json(report).dump(2) << "\n";
}

void write_trades_csv(std::span<const TradeRecord> trades, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filepath);
    }

    file << "entry_time,exit_time,side,entry_price,exit_price,notional,requested_notional,fees,pnl,forced\n";
    file << std::setprecision(10);
    for (const auto& t : trades) {
        file << t.entry_time << ","
             << t.exit_time << ","
             << strategy::signal_to_string(t.side) << ","
             << t.entry_price << ","
             << t.exit_price << ","
             << t.notional << ","
             << t.requested_notional << ","
             << t.fees << ","
             << t.pnl << ","
             << (t.forced ? 1 : 0) << "\n";
    }
}

void write_equity_csv(std::span<const EquityPoint> curve, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filepath);
    }

    file << "timestamp,equity\n";
    file << std::setprecision(12);
    for (const auto& p : curve) {
        file << p.timestamp << "," << p.equity << "\n";
    }
}

void print_trades(std::span<const TradeRecord> trades, std::ostream& out, std::size_t limit) {
    if (trades.empty()) return;

    out << "\n--- Sample Trades ---\n";
    std::size_t count = std::min(limit, trades.size());
    for (std::size_t i = 0; i < count; ++i) {
        const auto& t = trades[i];
        out << (t.side == strategy::Signal::Long ? "LONG  " : "SHORT ")
            << util::format_timestamp(t.entry_time, "%Y-%m-%d %H:%M") << " -> "
            << util::format_timestamp(t.exit_time, "%Y-%m-%d %H:%M")
            << " | Entry: $" << std::fixed << std::setprecision(2) << t.entry_price
            << " Exit: $" << t.exit_price
            << " | P&L: $" << t.pnl << (t.forced ? " (end)" : "") << "\n";
    }
    if (trades.size() > count) {
        out << "... and " << (trades.size() - count) << " more trades\n";
    }
}

} // namespace fbt::backtest
