// CLI argument parsing
#pragma once

#include <cstdint>
#include <string>

namespace smc {
namespace harness {

struct CliArgs {
    // Positional arguments
    std::string config_path;
    std::string candles_path;
    std::string out_path;

    // Options
    size_t max_candles{0};           // 0 = all
    std::string timeframe;           // overrides every analysis' timeframe when set
    std::string ltf_path;            // lower-timeframe candles for OB refinement
    size_t n_threads{0};             // 0 = SMC_THREADS or hardware concurrency
    bool trace{false};               // record lifecycle transitions per run
    bool quiet{false};               // no progress lines

    // Validation
    bool valid{false};
    std::string error_msg;
};

// Parse command line arguments
// Returns CliArgs with valid=true on success, valid=false with error_msg on failure
CliArgs parse_cli(int argc, char* argv[]);

// Print usage message
void print_usage(const char* prog_name);

} // namespace harness
} // namespace smc
