// mevsim - sandwich attack vs commit-reveal simulator, command-line entry point

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/common.hpp"
#include "harness/cli.hpp"
#include "harness/config.hpp"
#include "harness/output.hpp"
#include "harness/runner.hpp"

namespace {

double to_sol(double lamports) {
    return lamports / static_cast<double>(mev::harness::LAMPORTS_PER_SOL);
}

void print_summary(const mev::harness::RunResult& r) {
    std::lock_guard<std::mutex> lock(mev::io_mu);
    std::cout << "\n=== seed " << r.seed << " ===\n";
    if (!r.success) {
        std::cout << "  FAILED: " << r.error_msg << "\n";
        return;
    }
    const auto& s = r.results.summary;
    std::cout << std::fixed << std::setprecision(4)
              << "  transactions        = " << s.total_transactions << "\n"
              << "  unprotected trades  = " << s.unprotected_trades << "\n"
              << "  protected trades    = " << s.protected_trades << "\n"
              << "  attack attempts     = " << s.attack_attempts << "\n"
              << "  successful attacks  = " << s.successful_attacks
              << " (" << std::setprecision(1) << s.attack_success_rate << "%)\n"
              << std::setprecision(4)
              << "  MEV extracted       = " << s.total_mev_extracted
              << " (" << to_sol(static_cast<double>(s.total_mev_extracted)) << " SOL)\n"
              << "  victim losses       = " << s.total_victim_losses
              << " (" << to_sol(static_cast<double>(s.total_victim_losses)) << " SOL)\n"
              << "  avg loss per attack = " << to_sol(s.avg_loss_per_attack) << " SOL\n"
              << "  unprotected loss    = " << s.unprotected_total_loss << "\n"
              << "  protected loss      = " << s.protected_total_loss << "\n"
              << "  savings             = " << s.savings
              << " (" << std::setprecision(2) << s.savings_pct << "%)\n"
              << "  final reserves      = [" << r.results.final_pool.reserve_a << ", "
              << r.results.final_pool.reserve_b << "]\n"
              << "  time                = " << std::setprecision(4) << (r.elapsed_ms / 1000.0) << " s\n"
              << std::defaultfloat << std::setprecision(6);
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = mev::harness::parse_cli(argc, argv);

    if (!args.valid) {
        std::cerr << "Error: " << args.error_msg << "\n";
        mev::harness::print_usage(argv[0]);
        return 1;
    }
    if (args.help) {
        mev::harness::print_usage(argv[0]);
        return 0;
    }

    try {
        mev::harness::SimulationConfig base{};
        if (!args.config_path.empty()) {
            base = mev::harness::load_config(args.config_path);
            if (!args.quiet) {
                std::cout << "loaded config from " << args.config_path << "\n" << std::flush;
            }
        }
        base = mev::harness::apply_overrides(args, base);
        base.validate();

        auto run_cfgs = mev::harness::seed_sweep(base, args.runs);
        // Per-transaction progress from concurrent runs would interleave
        if (args.runs > 1 && args.n_threads > 1) {
            for (auto& c : run_cfgs) c.verbose = false;
        }

        auto t_exec0 = std::chrono::high_resolution_clock::now();

        auto results = mev::harness::run_batch_parallel(run_cfgs, args.n_threads, !args.quiet);

        auto t_exec1 = std::chrono::high_resolution_clock::now();
        double exec_ms = std::chrono::duration<double, std::milli>(t_exec1 - t_exec0).count();

        for (const auto& r : results) {
            print_summary(r);
        }

        // Write JSON output
        if (!args.out_path.empty()) {
            mev::harness::OutputMeta meta;
            meta.config_path = args.config_path;
            meta.threads = args.n_threads;
            meta.exec_ms = exec_ms;
            bool ok = mev::harness::write_results_json(args.out_path, results, meta);
            if (!ok) {
                std::cerr << "Error: Failed to write output to " << args.out_path << "\n";
                return 1;
            }
            if (!args.quiet) {
                std::cout << "\nwrote " << results.size() << " run(s) to " << args.out_path << "\n";
            }
        }

        for (const auto& r : results) {
            if (!r.success) return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
