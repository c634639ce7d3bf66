#pragma once

#include "metrics.hpp"

#include <span>
#include <string>
#include <nlohmann/json.hpp>

namespace fbt {
namespace backtest {

/**
 * Report output for presentation layers (console, files, chart viewers).
 * Readers only: nothing here feeds back into a run.
 *
 * File writers throw std::runtime_error when the file cannot be created.
 */

nlohmann::json metrics_to_json(const MetricsReport& report);
nlohmann::json trade_to_json(const TradeRecord& trade);

void write_metrics_json(const MetricsReport& report, const std::string& filepath);

// entry_time,exit_time,side,entry_price,exit_price,notional,requested_notional,fees,pnl,forced
void write_trades_csv(std::span<const TradeRecord> trades, const std::string& filepath);

// timestamp,equity
void write_equity_csv(std::span<const EquityPoint> curve, const std::string& filepath);

// First `limit` trades, one line each, with UTC times
void print_trades(std::span<const TradeRecord> trades, std::ostream& out, std::size_t limit = 5);

}  // namespace backtest
}  // namespace fbt
