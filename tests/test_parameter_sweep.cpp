#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include "../include/backtest/parameter_sweep.hpp"
#include "../include/backtest/strategies.hpp"
#include "../include/risk/position_sizer.hpp"

using namespace fbt;
using namespace fbt::backtest;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

// Six-hour bars drifting up through a few trend changes
static std::vector<Bar> wave_bars(size_t n = 200) {
    std::vector<Bar> bars;
    for (size_t i = 0; i < n; i++) {
        double price = 100 + 10 * std::sin(i / 12.0) + i * 0.05;
        Bar b;
        b.timestamp = 1704067200000ULL + i * 6 * MS_PER_HOUR;
        b.open = price - 0.2;
        b.close = price;
        b.high = price + 0.5;
        b.low = price - 0.7;
        b.volume = 100;
        bars.push_back(b);
    }
    return bars;
}

static BacktestConfig base_config() {
    BacktestConfig cfg;
    cfg.initial_capital = 10000;
    return cfg;
}

TEST(test_results_in_input_order) {
    auto bars = wave_bars();
    ParameterSweep sweep(bars, sma_crossover(5, 20), risk::fixed_fraction_sizer(), 4);

    std::vector<double> leverages{5, 1, 3, 2, 4};
    auto results = sweep.run(ParameterSweep::leverage_grid(base_config(), leverages));

    ASSERT_EQ(results.size(), leverages.size());
    for (size_t i = 0; i < leverages.size(); i++) {
        ASSERT_NEAR(results[i].config.leverage, leverages[i], 1e-12);
    }
}

TEST(test_matches_sequential_runs) {
    auto bars = wave_bars();
    auto signal = breakout_signal(10);
    auto sizer = risk::fixed_fraction_sizer();

    auto configs = ParameterSweep::leverage_grid(base_config(), {1, 2, 3, 5});
    ParameterSweep sweep(bars, signal, sizer, 3);
    auto results = sweep.run(configs);

    for (size_t i = 0; i < configs.size(); i++) {
        BacktestEngine engine(configs[i]);
        auto expected = engine.run(bars, signal, sizer);
        ASSERT_EQ(results[i].report.total_trades, expected.total_trades);
        ASSERT_NEAR(results[i].report.total_return_pct, expected.total_return_pct, 1e-12);
        ASSERT_NEAR(results[i].report.sharpe_ratio, expected.sharpe_ratio, 1e-12);
        ASSERT_NEAR(results[i].report.max_drawdown_pct, expected.max_drawdown_pct, 1e-12);
    }
    ASSERT_TRUE(results[0].report.total_trades > 0);
}

TEST(test_single_worker) {
    auto bars = wave_bars(50);
    ParameterSweep sweep(bars, always(Signal::Long), risk::fixed_fraction_sizer(), 1);
    auto results = sweep.run(ParameterSweep::leverage_grid(base_config(), {1, 2}));

    ASSERT_EQ(results.size(), 2u);
    // Same trade, twice the exposure
    double r1 = results[0].report.final_capital - 10000;
    double r2 = results[1].report.final_capital - 10000;
    ASSERT_NEAR(r2, 2 * r1, 1e-6);
}

TEST(test_empty_grid) {
    auto bars = wave_bars(10);
    ParameterSweep sweep(bars, always(Signal::Flat), risk::fixed_fraction_sizer());
    auto results = sweep.run({});
    ASSERT_TRUE(results.empty());
}

TEST(test_invalid_config_rejected_before_any_run) {
    auto bars = wave_bars(20);
    std::atomic<int> calls{0};
    SignalFn counting = [&calls](std::span<const Bar>) {
        calls.fetch_add(1);
        return Signal::Long;
    };

    auto configs = ParameterSweep::leverage_grid(base_config(), {1, 2, 0.5});
    ParameterSweep sweep(bars, counting, risk::fixed_fraction_sizer());

    bool thrown = false;
    try {
        sweep.run(configs);
    } catch (const InvalidInputError&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
    ASSERT_EQ(calls.load(), 0);
}

TEST(test_bad_bars_rejected) {
    std::vector<Bar> one_bar = wave_bars(1);
    ParameterSweep sweep(one_bar, always(Signal::Long), risk::fixed_fraction_sizer());

    bool thrown = false;
    try {
        sweep.run({base_config()});
    } catch (const InvalidInputError&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
}

TEST(test_job_failure_propagates) {
    auto bars = wave_bars(30);
    SignalFn failing = [](std::span<const Bar> history) {
        if (history.size() == 15) throw std::runtime_error("signal failed");
        return Signal::Long;
    };

    ParameterSweep sweep(bars, failing, risk::fixed_fraction_sizer(), 2);

    std::string message;
    try {
        sweep.run(ParameterSweep::leverage_grid(base_config(), {1, 2, 3, 4}));
    } catch (const std::runtime_error& e) {
        message = e.what();
    }
    ASSERT_EQ(message, std::string("signal failed"));
}

// An exception after some workers started must still join them
TEST(test_worker_threads_join_on_unwind) {
    std::atomic<int> finished{0};
    bool thrown = false;
    try {
        WorkerThreads threads(4);
        for (int i = 0; i < 3; i++) {
            threads.spawn([&finished]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                finished.fetch_add(1);
            });
        }
        ASSERT_EQ(threads.size(), 3u);
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    } catch (const std::system_error&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
    ASSERT_EQ(finished.load(), 3);
}

TEST(test_worker_threads_join_all_twice) {
    std::atomic<int> finished{0};
    WorkerThreads threads(2);
    threads.spawn([&finished]() { finished.fetch_add(1); });
    threads.spawn([&finished]() { finished.fetch_add(1); });
    threads.join_all();
    threads.join_all();
    ASSERT_EQ(finished.load(), 2);
}

TEST(test_sweep_logs_from_calling_thread) {
    auto bars = wave_bars(30);
    logging::AsyncLogger logger;
    int lines = 0;
    logger.set_output_callback([&lines](const logging::LogEntry& e) {
        if (e.category == logging::LogCategory::Sweep) lines++;
    });

    ParameterSweep sweep(bars, always(Signal::Long), risk::fixed_fraction_sizer(), 2);
    sweep.run(ParameterSweep::leverage_grid(base_config(), {1, 2}), &logger);
    logger.flush();

    ASSERT_EQ(lines, 2);  // Start and completion
}

int main() {
    std::cout << "\n=== Parameter Sweep Tests ===\n\n";

    RUN_TEST(test_results_in_input_order);
    RUN_TEST(test_matches_sequential_runs);
    RUN_TEST(test_single_worker);
    RUN_TEST(test_empty_grid);
    RUN_TEST(test_invalid_config_rejected_before_any_run);
    RUN_TEST(test_bad_bars_rejected);
    RUN_TEST(test_job_failure_propagates);
    RUN_TEST(test_worker_threads_join_on_unwind);
    RUN_TEST(test_worker_threads_join_all_twice);
    RUN_TEST(test_sweep_logs_from_calling_thread);

    std::cout << "\nAll tests passed!\n";
    return 0;
}
