// smc_analyzer - Entry point with compile-time numeric type selection
//
// Build targets:
//   smc_analyzer    - double (default)
//   smc_analyzer_f  - float
//   smc_analyzer_ld - long double

#include <chrono>
#include <iostream>
#include <stdexcept>

#include "core/common.hpp"
#include "core/numeric_types.hpp"
#include "events/loader.hpp"
#include "harness/cli.hpp"
#include "harness/output.hpp"
#include "harness/runner.hpp"
#include "structure/config.hpp"
#include "structure/timeframe.hpp"

// Compile-time numeric type selection (floating-only)
#if defined(SMC_MODE_F)
using RealT = float;
#elif defined(SMC_MODE_LD)
using RealT = long double;
#else
using RealT = double;
#endif

int main(int argc, char* argv[]) {
    auto args = smc::harness::parse_cli(argc, argv);

    if (!args.valid) {
        if (argc < 2) {
            std::cout << "smc_analyzer: " << smc::NumTraits<RealT>::name << "\n";
            smc::harness::print_usage(argv[0]);
            return 0;
        }
        std::cerr << "Error: " << args.error_msg << "\n";
        smc::harness::print_usage(argv[0]);
        return 1;
    }

    const bool verbose = !args.quiet;

    try {
        auto t_read0 = std::chrono::high_resolution_clock::now();

        auto candles = smc::load_candles_auto(args.candles_path, args.max_candles);
        if (verbose) {
            std::cout << "loaded " << candles.size() << " candles from " << args.candles_path << "\n" << std::flush;
        }

        std::vector<smc::Candle> ltf_candles;
        if (!args.ltf_path.empty()) {
            ltf_candles = smc::load_candles_auto(args.ltf_path, 0);
            if (verbose) {
                std::cout << "loaded " << ltf_candles.size() << " lower-timeframe candles from "
                          << args.ltf_path << "\n" << std::flush;
            }
        }

        auto t_read1 = std::chrono::high_resolution_clock::now();
        double candles_read_ms = std::chrono::duration<double, std::milli>(t_read1 - t_read0).count();

        auto configs = smc::structure::load_analysis_configs<RealT>(args.config_path);
        if (configs.empty()) {
            throw std::runtime_error("No analysis configurations found in " + args.config_path);
        }
        if (!args.timeframe.empty()) {
            const auto tf = smc::structure::parse_timeframe(args.timeframe);
            for (auto& c : configs) c.timeframe = tf;
        }
        if (verbose) {
            std::cout << "loaded " << configs.size() << " analyses\n" << std::flush;
        }

        smc::harness::RunOptions opts;
        opts.trace = args.trace;
        opts.ltf_candles = ltf_candles.empty() ? nullptr : &ltf_candles;

        auto t_exec0 = std::chrono::high_resolution_clock::now();

        auto results = smc::harness::run_analyses_parallel(configs, candles, opts, args.n_threads, verbose);

        auto t_exec1 = std::chrono::high_resolution_clock::now();
        double exec_ms = std::chrono::duration<double, std::milli>(t_exec1 - t_exec0).count();

        bool ok = smc::harness::write_results_json(
            args.out_path,
            results,
            candles.size(),
            args.candles_path,
            args.n_threads,
            candles_read_ms,
            exec_ms
        );
        if (!ok) {
            std::cerr << "Error: Failed to write output to " << args.out_path << "\n";
            return 1;
        }

        size_t failed = 0;
        for (const auto& r : results) {
            if (!r.success) ++failed;
        }
        if (failed > 0) {
            std::lock_guard<std::mutex> lock(smc::io_mu);
            std::cerr << "Warning: " << failed << "/" << results.size() << " analyses failed\n";
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
