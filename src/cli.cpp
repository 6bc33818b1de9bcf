// CLI argument parsing implementation

#include "harness/cli.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "core/json_utils.hpp"

namespace smc {
namespace harness {

void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name
              << " <config.json> <candles.{json,csv}> <output.json>\n"
              << "       [--n-candles N] [--timeframe TF] [--ltf PATH]\n"
              << "       [--threads N | -n N] [--trace] [--quiet]\n";
}

namespace {

size_t parse_count(const std::string& flag, const char* raw) {
    const std::string s(raw);
    if (s.empty() || s[0] == '-') {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + s + "'");
    }
    size_t pos = 0;
    const unsigned long long v = std::stoull(s, &pos);
    if (pos != s.size()) {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + s + "'");
    }
    return static_cast<size_t>(v);
}

} // namespace

CliArgs parse_cli(int argc, char* argv[]) {
    CliArgs args{};

    if (argc < 4) {
        args.valid = false;
        args.error_msg = "Not enough arguments (need config.json, candles file, output.json)";
        return args;
    }

    args.config_path = argv[1];
    args.candles_path = argv[2];
    args.out_path = argv[3];

    for (int i = 4; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        try {
            if (arg == "--n-candles" && has_value) {
                args.max_candles = parse_count(arg, argv[++i]);
            } else if (arg == "--timeframe" && has_value) {
                args.timeframe = argv[++i];
            } else if (arg == "--ltf" && has_value) {
                args.ltf_path = argv[++i];
            } else if ((arg == "--threads" || arg == "-n") && has_value) {
                args.n_threads = parse_count(arg, argv[++i]);
            } else if (arg == "--trace") {
                args.trace = true;
            } else if (arg == "--quiet") {
                args.quiet = true;
            } else {
                args.error_msg = "Unknown or incomplete option: " + arg;
                return args;
            }
        } catch (const std::exception& e) {
            args.error_msg = std::string("Bad value for ") + arg + ": " + e.what();
            return args;
        }
    }

    if (args.n_threads == 0) {
        args.n_threads = static_cast<size_t>(env_u64("SMC_THREADS", std::thread::hardware_concurrency()));
    }
    if (args.n_threads == 0) args.n_threads = 1;

    args.valid = true;
    return args;
}

} // namespace harness
} // namespace smc
