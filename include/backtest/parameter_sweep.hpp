#pragma once

#include "backtest_engine.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace fbt {
namespace backtest {

/**
 * Owns worker threads and joins every started one on destruction, so a
 * failed spawn or an exception between spawn and join never destroys a
 * joinable std::thread.
 */
class WorkerThreads {
public:
    explicit WorkerThreads(std::size_t expected) { threads_.reserve(expected); }
    ~WorkerThreads() { join_all(); }

    WorkerThreads(const WorkerThreads&) = delete;
    WorkerThreads& operator=(const WorkerThreads&) = delete;

    template <typename Fn>
    void spawn(Fn&& fn) {
        threads_.emplace_back(std::forward<Fn>(fn));
    }

    void join_all() {
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
    }

    std::size_t size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

struct SweepResult {
    BacktestConfig config;
    MetricsReport report;
};

/**
 * Parameter Sweep
 *
 * Runs the same signal/sizer pair under many configurations. Every job gets
 * its own BacktestEngine; workers share only the read-only bars and the
 * callbacks, which must therefore be safe to call concurrently (the sample
 * generators in strategies.hpp are).
 *
 * Usage:
 *   ParameterSweep sweep(bars, sma_crossover(20, 50), fixed_fraction_sizer());
 *   auto results = sweep.run(ParameterSweep::leverage_grid(base, {1, 2, 3}));
 */
class ParameterSweep {
public:
    ParameterSweep(std::span<const Bar> bars, SignalFn signal_fn, SizerFn sizer_fn, unsigned max_workers = 0)
        : bars_(bars)
        , signal_fn_(std::move(signal_fn))
        , sizer_fn_(std::move(sizer_fn))
        , max_workers_(max_workers)
    {}

    /**
     * Run every config. Results come back in input order.
     * If any job throws, remaining jobs are abandoned and the first
     * exception is rethrown once all workers have joined.
     *
     * The logger, if given, is only written from the calling thread.
     */
    std::vector<SweepResult> run(const std::vector<BacktestConfig>& configs,
                                 logging::AsyncLogger* logger = nullptr) const {
        // Fail before spawning anything
        for (const auto& cfg : configs) {
            cfg.validate();
        }
        BacktestEngine::validate_bars(bars_);

        std::vector<SweepResult> results(configs.size());
        if (configs.empty()) return results;

        unsigned workers = worker_count(configs.size());
        if (logger) {
            FBT_LOGF_INFO(*logger, Sweep, "sweep: %zu configs on %u workers", configs.size(), workers);
        }

        std::atomic<std::size_t> next{0};
        std::atomic<bool> failed{false};
        std::exception_ptr first_error;
        std::mutex error_mutex;

        auto worker = [&]() {
            while (!failed.load(std::memory_order_relaxed)) {
                std::size_t job = next.fetch_add(1);
                if (job >= configs.size()) return;

                try {
                    BacktestEngine engine(configs[job]);
                    results[job].config = configs[job];
                    results[job].report = engine.run(bars_, signal_fn_, sizer_fn_);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) first_error = std::current_exception();
                    failed.store(true);
                    return;
                }
            }
        };

        {
            WorkerThreads threads(workers);
            try {
                for (unsigned i = 0; i < workers; ++i) {
                    threads.spawn(worker);
                }
            } catch (const std::system_error& e) {
                // Started workers stop at their next job and are joined on unwind
                failed.store(true);
                if (logger) {
                    FBT_LOGF_ERROR(*logger, Sweep, "sweep: could not start worker %zu: %s", threads.size(), e.what());
                }
                throw;
            }
            threads.join_all();
        }

        if (first_error) {
            if (logger) {
                FBT_LOG_ERROR(*logger, Sweep, "sweep aborted by failing job");
            }
            std::rethrow_exception(first_error);
        }

        if (logger) {
            FBT_LOGF_INFO(*logger, Sweep, "sweep: %zu runs complete", results.size());
        }
        return results;
    }

    // Copies of base differing only in leverage
    static std::vector<BacktestConfig> leverage_grid(const BacktestConfig& base, const std::vector<double>& leverages) {
        std::vector<BacktestConfig> grid;
        grid.reserve(leverages.size());
        for (double lev : leverages) {
            BacktestConfig cfg = base;
            cfg.leverage = lev;
            grid.push_back(cfg);
        }
        return grid;
    }

private:
    std::span<const Bar> bars_;
    SignalFn signal_fn_;
    SizerFn sizer_fn_;
    unsigned max_workers_;

    unsigned worker_count(std::size_t jobs) const {
        unsigned hw = std::max(1u, std::thread::hardware_concurrency());
        unsigned limit = max_workers_ > 0 ? max_workers_ : hw;
        return static_cast<unsigned>(std::min<std::size_t>(limit, jobs));
    }
};

}  // namespace backtest
}  // namespace fbt
