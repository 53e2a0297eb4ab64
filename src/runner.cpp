// Simulation runner - implementation

#include "harness/runner.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>

#include "core/common.hpp"

namespace mev {
namespace harness {

RunResult run_single(const SimulationConfig& cfg) {
    RunResult result;
    result.seed = cfg.seed;

    auto t_start = std::chrono::high_resolution_clock::now();

    try {
        Orchestrator orch(cfg);
        result.results = orch.run();
        result.success = true;
    } catch (const std::exception& e) {
        result.success = false;
        result.error_msg = e.what();
    } catch (...) {
        result.success = false;
        result.error_msg = "Unknown error";
    }

    auto t_end = std::chrono::high_resolution_clock::now();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();

    return result;
}

std::vector<SimulationConfig> seed_sweep(const SimulationConfig& base, size_t n_runs) {
    std::vector<SimulationConfig> out;
    out.reserve(n_runs);
    for (size_t i = 0; i < n_runs; ++i) {
        SimulationConfig c = base;
        c.seed = base.seed + i;
        out.push_back(c);
    }
    return out;
}

std::vector<RunResult> run_batch_parallel(const std::vector<SimulationConfig>& configs,
                                          size_t n_threads, bool verbose) {
    if (n_threads == 0) {
        n_threads = std::thread::hardware_concurrency();
        if (n_threads == 0) n_threads = 1;
    }

    const size_t n_runs = configs.size();
    std::vector<RunResult> results(n_runs);

    if (n_runs == 0) {
        return results;
    }

    auto run_one = [&](size_t i) {
        if (verbose) {
            std::lock_guard<std::mutex> lock(io_mu);
            std::cout << "dispatch run " << (i + 1) << "/" << n_runs << " (seed " << configs[i].seed << ")\n";
        }

        results[i] = run_single(configs[i]);

        if (verbose) {
            std::lock_guard<std::mutex> lock(io_mu);
            std::cout << "finished run " << (i + 1) << "/" << n_runs
                      << ", time: " << std::fixed << std::setprecision(4)
                      << (results[i].elapsed_ms / 1000.0) << " s"
                      << (results[i].success ? "" : ", FAILED: " + results[i].error_msg) << "\n"
                      << std::defaultfloat << std::setprecision(6);
        }
    };

    // For single run or single thread, run sequentially
    if (n_runs == 1 || n_threads == 1) {
        for (size_t i = 0; i < n_runs; ++i) {
            run_one(i);
        }
        return results;
    }

    // Thread pool with work stealing via atomic index
    std::atomic<size_t> next_idx{0};

    auto worker = [&]() {
        while (true) {
            const size_t i = next_idx.fetch_add(1);
            if (i >= n_runs) break;
            run_one(i);
        }
    };

    // Launch worker threads
    const size_t actual_threads = std::min(n_threads, n_runs);
    std::vector<std::thread> threads;
    threads.reserve(actual_threads);

    for (size_t t = 0; t < actual_threads; ++t) {
        threads.emplace_back(worker);
    }

    // Wait for all to complete
    for (auto& th : threads) {
        th.join();
    }

    return results;
}

} // namespace harness
} // namespace mev
