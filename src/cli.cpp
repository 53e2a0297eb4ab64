// CLI argument parsing implementation

#include "harness/cli.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace mev {
namespace harness {

namespace {

uint64_t parse_u64_arg(const std::string& flag, const std::string& v) {
    if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("expected non-negative integer for " + flag + ", got '" + v + "'");
    }
    try {
        return static_cast<uint64_t>(std::stoull(v));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("value out of range for " + flag + ": " + v);
    }
}

double parse_real_arg(const std::string& flag, const std::string& v) {
    size_t pos = 0;
    double d = 0.0;
    try {
        d = std::stod(v, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("expected number for " + flag + ", got '" + v + "'");
    }
    if (pos != v.size()) {
        throw std::invalid_argument("expected number for " + flag + ", got '" + v + "'");
    }
    return d;
}

uint16_t narrow_u16(const char* what, uint64_t v) {
    if (v > std::numeric_limits<uint16_t>::max()) {
        throw std::invalid_argument(std::string(what) + " out of range: " + std::to_string(v));
    }
    return static_cast<uint16_t>(v);
}

} // namespace

void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " [--config FILE] [--out FILE]\n"
              << "       [--transactions N] [--attack-prob P]\n"
              << "       [--min-swap L] [--max-swap L]\n"
              << "       [--pool-a L] [--pool-b L] [--fee-bps B]\n"
              << "       [--attacker-capital L] [--traders N] [--trader-balance L]\n"
              << "       [--slippage-bps B] [--seed S]\n"
              << "       [--runs N] [--threads N | -n N]\n"
              << "       [--search-frontrun] [--save-actions] [--quiet]\n"
              << "Amounts (L) are base units (1 SOL = 1000000000).\n";
}

CliArgs parse_cli(int argc, char* argv[]) {
    CliArgs args{};

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            return argv[++i];
        };
        try {
            if (arg == "--config") {
                args.config_path = next();
            } else if (arg == "--out") {
                args.out_path = next();
            } else if (arg == "--transactions") {
                args.transactions = parse_u64_arg(arg, next());
            } else if (arg == "--attack-prob") {
                args.attack_probability = parse_real_arg(arg, next());
            } else if (arg == "--min-swap") {
                args.min_swap = parse_u64_arg(arg, next());
            } else if (arg == "--max-swap") {
                args.max_swap = parse_u64_arg(arg, next());
            } else if (arg == "--pool-a") {
                args.pool_a = parse_u64_arg(arg, next());
            } else if (arg == "--pool-b") {
                args.pool_b = parse_u64_arg(arg, next());
            } else if (arg == "--fee-bps") {
                args.fee_bps = parse_u64_arg(arg, next());
            } else if (arg == "--attacker-capital") {
                args.attacker_capital = parse_u64_arg(arg, next());
            } else if (arg == "--traders") {
                args.traders = parse_u64_arg(arg, next());
            } else if (arg == "--trader-balance") {
                args.trader_balance = parse_u64_arg(arg, next());
            } else if (arg == "--slippage-bps") {
                args.slippage_bps = parse_u64_arg(arg, next());
            } else if (arg == "--seed") {
                args.seed = parse_u64_arg(arg, next());
            } else if (arg == "--runs") {
                args.runs = static_cast<size_t>(parse_u64_arg(arg, next()));
            } else if (arg == "--threads" || arg == "-n") {
                args.n_threads = static_cast<size_t>(parse_u64_arg(arg, next()));
            } else if (arg == "--search-frontrun") {
                args.search_frontrun = true;
            } else if (arg == "--save-actions") {
                args.save_actions = true;
            } else if (arg == "--quiet") {
                args.quiet = true;
            } else if (arg == "--help" || arg == "-h") {
                args.help = true;
            } else {
                args.valid = false;
                args.error_msg = "Unknown argument: " + arg;
                return args;
            }
        } catch (const std::invalid_argument& e) {
            args.valid = false;
            args.error_msg = e.what();
            return args;
        }
    }

    if (args.runs == 0) {
        args.valid = false;
        args.error_msg = "--runs must be > 0";
        return args;
    }
    if (args.n_threads == 0) args.n_threads = 1;

    args.valid = true;
    return args;
}

SimulationConfig apply_overrides(const CliArgs& args, SimulationConfig cfg) {
    if (args.transactions) cfg.total_transactions = *args.transactions;
    if (args.attack_probability) cfg.attack_probability = *args.attack_probability;
    if (args.min_swap) cfg.min_swap = *args.min_swap;
    if (args.max_swap) cfg.max_swap = *args.max_swap;
    if (args.pool_a) cfg.pool_reserve_a = *args.pool_a;
    if (args.pool_b) cfg.pool_reserve_b = *args.pool_b;
    if (args.fee_bps) cfg.fee_bps = narrow_u16("--fee-bps", *args.fee_bps);
    if (args.attacker_capital) cfg.attacker_capital = *args.attacker_capital;
    if (args.traders) cfg.num_traders = static_cast<size_t>(*args.traders);
    if (args.trader_balance) {
        cfg.trader_balance_a = *args.trader_balance;
        cfg.trader_balance_b = *args.trader_balance;
    }
    if (args.slippage_bps) cfg.protected_slippage_bps = narrow_u16("--slippage-bps", *args.slippage_bps);
    if (args.seed) cfg.seed = *args.seed;
    if (args.search_frontrun) cfg.frontrun.strategy = trading::FrontrunStrategy::search;
    if (args.save_actions) cfg.save_actions = true;
    if (args.quiet) cfg.verbose = false;
    return cfg;
}

} // namespace harness
} // namespace mev
