/**
 * Backtest Runner
 *
 * Runs a sample signal generator over historical kline data.
 *
 * Usage:
 *   ./run_backtest data.csv [options]
 *
 * See --help for the option list.
 */

#include "../include/backtest/backtest_engine.hpp"
#include "../include/backtest/parameter_sweep.hpp"
#include "../include/backtest/report.hpp"
#include "../include/backtest/strategies.hpp"
#include "../include/config/backtest_config.hpp"
#include "../include/exchange/market_data.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/risk/position_sizer.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/time_utils.hpp"

#include <iomanip>
#include <iostream>

using namespace fbt;
using namespace fbt::backtest;
using namespace fbt::exchange;

namespace {

void print_data_summary(const std::vector<Bar>& bars) {
    std::cout << "Loaded " << bars.size() << " bars\n";
    std::cout << "Period: " << util::format_timestamp(bars.front().timestamp, "%Y-%m-%d %H:%M")
              << " to " << util::format_timestamp(bars.back().timestamp, "%Y-%m-%d %H:%M") << "\n";

    // Price range
    Price min_price = bars[0].low;
    Price max_price = bars[0].high;
    for (const auto& b : bars) {
        if (b.low < min_price) min_price = b.low;
        if (b.high > max_price) max_price = b.high;
    }
    std::cout << "Price range: $" << std::fixed << std::setprecision(2)
              << min_price << " - $" << max_price << "\n";
    std::cout.unsetf(std::ios::fixed);
}

void print_sweep(const std::vector<SweepResult>& results) {
    std::cout << "\n  " << std::string(70, '-') << "\n";
    std::cout << "  " << std::right << std::setw(9) << "Leverage"
              << std::setw(11) << "Return"
              << std::setw(10) << "Sharpe"
              << std::setw(10) << "Sortino"
              << std::setw(10) << "MaxDD"
              << std::setw(10) << "WinRate"
              << std::setw(8) << "Trades" << "\n";
    std::cout << "  " << std::string(70, '-') << "\n";

    for (const auto& r : results) {
        std::cout << "  " << std::fixed << std::setprecision(2)
                  << std::setw(9) << r.config.leverage
                  << std::setw(10) << r.report.total_return_pct << "%"
                  << std::setw(10) << r.report.sharpe_ratio
                  << std::setw(10) << r.report.sortino_ratio
                  << std::setw(9) << r.report.max_drawdown_pct << "%"
                  << std::setw(9) << r.report.win_rate_pct << "%"
                  << std::setw(8) << r.report.total_trades << "\n";
    }
    std::cout << "  " << std::string(70, '-') << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    util::CLIArgs args;
    if (!util::parse_args(argc, argv, args)) {
        return 1;
    }
    if (args.help) {
        util::print_help();
        return 0;
    }
    if (args.data_file.empty()) {
        util::print_help();
        return 1;
    }

    logging::AsyncLogger logger;
    logger.set_min_level(args.verbose ? logging::LogLevel::Debug : logging::LogLevel::Info);
    logger.start();

    int rc = 0;
    try {
        config::BacktestConfig cfg;
        if (!args.config_file.empty()) {
            cfg = config::load_backtest_config(args.config_file);
            FBT_LOGF_INFO(logger, System, "config: %s", args.config_file.c_str());
        }
        cfg = util::apply_overrides(cfg, args);
        cfg.validate();

        std::cout << "Loading data from " << args.data_file << "...\n";
        auto bars = load_bars_csv(args.data_file);
        if (bars.empty()) {
            throw std::runtime_error("No data loaded from " + args.data_file);
        }
        FBT_LOGF_INFO(logger, Data, "loaded %zu bars", bars.size());
        print_data_summary(bars);

        SignalFn signal = make_signal(args.signal, args.param1, args.param2);
        SizerFn sizer = risk::fixed_fraction_sizer(args.sizer_fraction);

        if (!args.sweep_leverage.empty()) {
            std::cout << "\n*** Leverage sweep: " << args.signal << " ***\n";
            ParameterSweep sweep(bars, signal, sizer, args.workers);
            auto results = sweep.run(ParameterSweep::leverage_grid(cfg, args.sweep_leverage), &logger);
            print_sweep(results);
        } else {
            std::cout << "\n========================================\n";
            std::cout << "Signal: " << args.signal << "  Leverage: " << cfg.leverage << "x\n";
            std::cout << "========================================\n";

            BacktestEngine engine(cfg, &logger);
            MetricsReport report = engine.run(bars, signal, sizer);

            report.print(std::cout);
            print_trades(engine.trades(), std::cout);

            if (!args.json_out.empty()) {
                write_metrics_json(report, args.json_out);
                std::cout << "\nMetrics written to " << args.json_out << "\n";
            }
            if (!args.trades_out.empty()) {
                write_trades_csv(engine.trades(), args.trades_out);
                std::cout << "Trades written to " << args.trades_out << "\n";
            }
            if (!args.equity_out.empty()) {
                write_equity_csv(engine.equity_curve(), args.equity_out);
                std::cout << "Equity curve written to " << args.equity_out << "\n";
            }
        }
    } catch (const std::exception& e) {
        FBT_LOGF(logger, logging::LogLevel::Error, System, "%s", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }

    logger.stop();
    if (logger.dropped_count() > 0) {
        std::cerr << "(" << logger.dropped_count() << " log lines dropped)\n";
    }
    return rc;
}
