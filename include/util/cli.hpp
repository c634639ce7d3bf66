#pragma once

/**
 * CLI utilities for the backtest runner
 *
 * Provides command-line argument parsing and related utilities.
 */

#include "../config/backtest_config.hpp"

#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fbt {
namespace util {

/**
 * Command-line arguments for run_backtest.
 * Cost/account overrides are optional so they only replace config file
 * values when given.
 */
struct CLIArgs {
    bool help = false;
    bool verbose = false;
    std::string data_file;
    std::string config_file;
    std::string signal = "sma";
    int param1 = 0;                  // Strategy parameters, 0 = default
    int param2 = 0;
    double sizer_fraction = config::sizing::FIXED_FRACTION;

    std::optional<double> capital;
    std::optional<double> leverage;
    std::optional<double> taker_fee;
    std::optional<double> maker_fee;
    std::optional<double> slippage_pct;
    std::optional<double> risk_free_rate;

    std::vector<double> sweep_leverage; // Non-empty = parameter sweep
    unsigned workers = 0;                // 0 = hardware concurrency

    std::string json_out;
    std::string trades_out;
    std::string equity_out;
};

/**
 * Print help message for run_backtest.
 */
inline void print_help() {
    std::cout << R"(
Futures Backtester
==================

Usage: run_backtest DATA_FILE [options]

DATA_FILE is a kline CSV: open_time,open,high,low,close,volume[,...]

Strategy:
  -s, --signal NAME      sma | rsi | breakout | long | short | flat (default: sma)
  --p1 N, --p2 N         Strategy periods (sma: fast slow, rsi: period, breakout: lookback)
  --fraction F           Sizer fraction of equity (default: 0.02)

Account & costs (override the config file):
  -f, --config FILE      JSON config file
  -c, --capital USD      Initial capital (default: 100000)
  -l, --leverage X       Leverage (default: 1)
  --taker-fee R          Taker fee rate (default: 0.0004)
  --maker-fee R          Maker fee rate (default: 0.0002, not charged)
  --slippage PCT         Slippage in percent (default: 0.01)
  --risk-free R          Annual risk-free rate (default: 0.02)

Sweep:
  --sweep-leverage LIST  Comma-separated leverages, one run each (e.g. 1,2,3,5)
  -w, --workers N        Worker threads for the sweep (default: all cores)

Output:
  --json FILE            Write metrics as JSON
  --trades FILE          Write trade log CSV
  --equity FILE          Write equity curve CSV
  -v, --verbose          Log every trade
  -h, --help             Show this help

Examples:
  run_backtest btc_1h.csv -s sma --p1 20 --p2 50 -l 3
  run_backtest btc_1h.csv -f config.json --json metrics.json
  run_backtest btc_1h.csv -s breakout --sweep-leverage 1,2,3,5 -w 4
)";
}

/**
 * Split a comma-separated list of numbers ("1, 2.5,3").
 * Throws std::invalid_argument on a non-numeric item.
 */
inline std::vector<double> split_numbers(const std::string& s) {
    std::vector<double> result;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            result.push_back(std::stod(item));
        }
    }
    return result;
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output argument struct
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "--help" || arg == "-h") {
                args.help = true;
            }
            else if (arg == "--verbose" || arg == "-v") {
                args.verbose = true;
            }
            else if ((arg == "--signal" || arg == "-s") && has_value) {
                args.signal = argv[++i];
            }
            else if (arg == "--p1" && has_value) {
                args.param1 = std::stoi(argv[++i]);
            }
            else if (arg == "--p2" && has_value) {
                args.param2 = std::stoi(argv[++i]);
            }
            else if (arg == "--fraction" && has_value) {
                args.sizer_fraction = std::stod(argv[++i]);
            }
            else if ((arg == "--config" || arg == "-f") && has_value) {
                args.config_file = argv[++i];
            }
            else if ((arg == "--capital" || arg == "-c") && has_value) {
                args.capital = std::stod(argv[++i]);
            }
            else if ((arg == "--leverage" || arg == "-l") && has_value) {
                args.leverage = std::stod(argv[++i]);
            }
            else if (arg == "--taker-fee" && has_value) {
                args.taker_fee = std::stod(argv[++i]);
            }
            else if (arg == "--maker-fee" && has_value) {
                args.maker_fee = std::stod(argv[++i]);
            }
            else if (arg == "--slippage" && has_value) {
                args.slippage_pct = std::stod(argv[++i]);
            }
            else if (arg == "--risk-free" && has_value) {
                args.risk_free_rate = std::stod(argv[++i]);
            }
            else if (arg == "--sweep-leverage" && has_value) {
                args.sweep_leverage = split_numbers(argv[++i]);
            }
            else if ((arg == "--workers" || arg == "-w") && has_value) {
                args.workers = static_cast<unsigned>(std::stoul(argv[++i]));
            }
            else if (arg == "--json" && has_value) {
                args.json_out = argv[++i];
            }
            else if (arg == "--trades" && has_value) {
                args.trades_out = argv[++i];
            }
            else if (arg == "--equity" && has_value) {
                args.equity_out = argv[++i];
            }
            else if (!arg.empty() && arg[0] != '-' && args.data_file.empty()) {
                args.data_file = arg;
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                std::cerr << "Use --help for usage information.\n";
                return false;
            }
        }
    } catch (const std::logic_error& e) {
        // stoi/stod: invalid_argument, out_of_range
        std::cerr << "Invalid numeric value: " << e.what() << "\n";
        return false;
    }
    return true;
}

/**
 * Apply command-line overrides on top of a (file or default) config.
 */
inline config::BacktestConfig apply_overrides(config::BacktestConfig cfg, const CLIArgs& args) {
    if (args.capital) cfg.initial_capital = *args.capital;
    if (args.leverage) cfg.leverage = *args.leverage;
    if (args.taker_fee) cfg.taker_fee = *args.taker_fee;
    if (args.maker_fee) cfg.maker_fee = *args.maker_fee;
    if (args.slippage_pct) cfg.slippage_pct = *args.slippage_pct;
    if (args.risk_free_rate) cfg.risk_free_rate = *args.risk_free_rate;
    return cfg;
}

}  // namespace util
}  // namespace fbt
