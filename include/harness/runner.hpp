// Simulation runner - single run and parallel multi-seed batches
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "harness/config.hpp"
#include "harness/orchestrator.hpp"

namespace mev {
namespace harness {

// Result from one whole simulation run
struct RunResult {
    uint64_t seed{0};
    SimulationResults results{};

    // Timing
    double elapsed_ms{0};

    // Success flag
    bool success{false};
    std::string error_msg;
};

// Run one configuration; exceptions are captured into the result
RunResult run_single(const SimulationConfig& cfg);

// Copies of `base` with seeds base.seed, base.seed + 1, ...
std::vector<SimulationConfig> seed_sweep(const SimulationConfig& base, size_t n_runs);

// Run independent simulations on a thread pool. Runs share nothing except
// the work index and the console mutex. n_threads == 0 picks hardware_concurrency.
std::vector<RunResult> run_batch_parallel(const std::vector<SimulationConfig>& configs,
                                          size_t n_threads = 0, bool verbose = true);

} // namespace harness
} // namespace mev
