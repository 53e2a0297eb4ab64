// Simulation configuration (defaults mirror the reference devnet setup)
#pragma once

#include <cstddef>
#include <cstdint>

#include "trading/sandwich.hpp"

namespace mev {
namespace harness {

constexpr uint64_t LAMPORTS_PER_SOL = 1000000000ULL;

struct SimulationConfig {
    uint64_t total_transactions{1000};
    double attack_probability{0.8};

    // Swap size range, base units
    uint64_t min_swap{LAMPORTS_PER_SOL / 10};       // 0.1 SOL
    uint64_t max_swap{5 * LAMPORTS_PER_SOL};        // 5 SOL

    // Initial pool
    uint64_t pool_reserve_a{1000 * LAMPORTS_PER_SOL};
    uint64_t pool_reserve_b{1000 * LAMPORTS_PER_SOL};
    uint16_t fee_bps{30};

    // Attacker holds this much of each token
    uint64_t attacker_capital{100 * LAMPORTS_PER_SOL};

    // Trader population; each trader index has one unprotected and one protected actor
    size_t num_traders{10};
    uint64_t trader_balance_a{50 * LAMPORTS_PER_SOL};
    uint64_t trader_balance_b{50 * LAMPORTS_PER_SOL};

    uint16_t protected_slippage_bps{100};   // 1%
    uint64_t seed{42};

    trading::FrontrunParams frontrun{};

    bool save_actions{false};
    bool verbose{true};

    // Throws std::invalid_argument describing the first bad field
    void validate() const;
};

} // namespace harness
} // namespace mev
