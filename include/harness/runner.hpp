// Analysis runner - single configuration execution and parallel multi-config processing
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/common.hpp"
#include "events/types.hpp"
#include "structure/config.hpp"
#include "structure/pipeline.hpp"
#include "structure/transitions.hpp"

namespace smc {
namespace harness {

// Result from running a single analysis configuration
template <typename T>
struct AnalysisResult {
    std::string tag;
    structure::Analysis<T> analysis{};

    // Effective parameters (after timeframe defaults)
    structure::AnalysisConfig<T> config{};

    // Lifecycle transitions (only populated when tracing)
    std::vector<structure::Transition<T>> transitions{};

    // Timing
    double elapsed_ms{0};

    // Success flag
    bool success{false};
    std::string error_msg;
};

// Options shared by every run
struct RunOptions {
    bool trace{false};
    const std::vector<Candle>* ltf_candles{nullptr};
};

// Run a single analysis configuration; exceptions become success=false
template <typename T>
AnalysisResult<T> run_single_analysis(
    const structure::AnalysisConfig<T>& cfg,
    const std::vector<Candle>& candles,
    const RunOptions& opts
) {
    AnalysisResult<T> result;
    result.tag = cfg.tag;
    result.config = cfg;

    auto t_start = std::chrono::high_resolution_clock::now();

    try {
        result.config.apply_timeframe_defaults();
        structure::TransitionLogger<T> log(opts.trace);
        result.analysis = structure::analyze(candles, result.config, opts.ltf_candles, &log);
        result.transitions = log.take_transitions();
        result.success = true;
    } catch (const std::exception& e) {
        result.success = false;
        result.error_msg = e.what();
    }

    auto t_end = std::chrono::high_resolution_clock::now();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();

    return result;
}

// Run every configuration over the same candles using a thread pool
template <typename T>
std::vector<AnalysisResult<T>> run_analyses_parallel(
    const std::vector<structure::AnalysisConfig<T>>& configs,
    const std::vector<Candle>& candles,
    const RunOptions& opts,
    size_t n_threads = 0,
    bool verbose = true
) {
    if (n_threads == 0) {
        n_threads = std::thread::hardware_concurrency();
        if (n_threads == 0) n_threads = 1;
    }

    const size_t n_runs = configs.size();
    std::vector<AnalysisResult<T>> results(n_runs);
    if (n_runs == 0) {
        return results;
    }

    auto run_one = [&](size_t i) {
        if (verbose) {
            std::lock_guard<std::mutex> lock(io_mu);
            std::cout << "dispatch job " << (i + 1) << "/" << n_runs << "\n";
        }

        results[i] = run_single_analysis(configs[i], candles, opts);

        if (verbose) {
            std::lock_guard<std::mutex> lock(io_mu);
            std::cout << "finished job " << (i + 1) << "/" << n_runs
                      << ", time: " << std::fixed << std::setprecision(4)
                      << (results[i].elapsed_ms / 1000.0) << " s\n";
            if (!results[i].success) {
                std::cerr << "job " << (i + 1) << " failed: " << results[i].error_msg << "\n";
            }
        }
    };

    // For single config or single thread, run sequentially
    if (n_runs == 1 || n_threads == 1) {
        for (size_t i = 0; i < n_runs; ++i) run_one(i);
        return results;
    }

    // Work stealing via atomic index
    std::atomic<size_t> next_idx{0};

    auto worker = [&]() {
        while (true) {
            const size_t i = next_idx.fetch_add(1);
            if (i >= n_runs) break;
            run_one(i);
        }
    };

    const size_t actual_threads = std::min(n_threads, n_runs);
    std::vector<std::thread> threads;
    threads.reserve(actual_threads);
    for (size_t t = 0; t < actual_threads; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& th : threads) {
        th.join();
    }

    return results;
}

} // namespace harness
} // namespace smc
