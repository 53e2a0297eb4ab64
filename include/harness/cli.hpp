// CLI argument parsing
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>

#include "harness/config.hpp"

namespace mev {
namespace harness {

struct CliArgs {
    std::string config_path;    // empty = built-in defaults
    std::string out_path;       // empty = console summary only

    // Overrides applied on top of the config file (unset = keep file/default value)
    std::optional<uint64_t> transactions;
    std::optional<double> attack_probability;
    std::optional<uint64_t> min_swap;
    std::optional<uint64_t> max_swap;
    std::optional<uint64_t> pool_a;
    std::optional<uint64_t> pool_b;
    std::optional<uint64_t> fee_bps;
    std::optional<uint64_t> attacker_capital;
    std::optional<uint64_t> traders;
    std::optional<uint64_t> trader_balance;
    std::optional<uint64_t> slippage_bps;
    std::optional<uint64_t> seed;
    bool search_frontrun{false};
    bool save_actions{false};
    bool quiet{false};

    // Batch
    size_t runs{1};
    size_t n_threads{std::thread::hardware_concurrency()};

    bool help{false};

    // Validation
    bool valid{false};
    std::string error_msg;
};

// Parse command line arguments
// Returns CliArgs with valid=true on success, valid=false with error_msg on failure
CliArgs parse_cli(int argc, char* argv[]);

// Apply CLI overrides to a loaded config. Throws std::invalid_argument when a
// narrowed value (fee, slippage) is out of range.
SimulationConfig apply_overrides(const CliArgs& args, SimulationConfig cfg);

// Print usage message
void print_usage(const char* prog_name);

} // namespace harness
} // namespace mev
