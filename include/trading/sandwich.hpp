// Sandwich attack optimizer: front-run sizing and the three-leg simulation
#pragma once

#include <cstdint>
#include <string>

#include "pools/pool_state.hpp"

namespace mev {
namespace trading {

enum class FrontrunStrategy : uint8_t {
    heuristic,  // min(victim / victim_divisor, capital, reserve_in / reserve_divisor)
    search,     // Brent search for max integer profit under the capital/reserve caps
};

inline const char* strategy_name(FrontrunStrategy s) {
    return s == FrontrunStrategy::search ? "search" : "heuristic";
}

struct FrontrunParams {
    uint64_t victim_divisor{2};     // share of the victim's size to front-run
    uint64_t reserve_divisor{10};   // cap on self-inflicted impact (fraction of reserve_in)
    FrontrunStrategy strategy{FrontrunStrategy::heuristic};
};

struct SandwichOutcome {
    uint64_t frontrun_amount{0};
    uint64_t frontrun_output{0};
    uint64_t backrun_input{0};
    uint64_t backrun_output{0};
    int64_t  profit{0};                 // backrun_output - frontrun_amount, input-token units
    uint64_t victim_expected{0};        // quoted against the pre-attack pool
    uint64_t victim_actual{0};
    uint64_t victim_loss{0};
    uint64_t victim_fee{0};
    uint64_t victim_price_impact_bps{0};
    bool executed{false};               // legs were run against a pool
    bool success{false};                // profit > 0 and the victim lost something
    std::string victim;
    uint64_t tx_id{0};
    uint64_t slot{0};
};

// Run front-run, victim and back-run legs against `pool` (mutates it).
// victim_expected is quoted before the first leg.
SandwichOutcome simulate_sandwich(pools::PoolState& pool, uint64_t victim_amount, pools::Direction dir,
                                  uint64_t frontrun_amount);

// Heuristic front-run size; 0 means no attack is possible
uint64_t heuristic_frontrun(const pools::PoolState& pool, uint64_t victim_amount, pools::Direction dir,
                            uint64_t attacker_capital, const FrontrunParams& params = {});

// Dry run on a clone of `pool`; the caller's pool is never touched.
// Returns a non-executed outcome when the capped size is 0.
SandwichOutcome optimal_frontrun(const pools::PoolState& pool, uint64_t victim_amount, pools::Direction dir,
                                 uint64_t attacker_capital, const FrontrunParams& params = {});

} // namespace trading
} // namespace mev
