// Simulation configuration validation

#include "harness/config.hpp"

#include <limits>
#include <stdexcept>
#include <string>

#include "commit/commitment.hpp"
#include "core/numeric_types.hpp"

namespace mev {
namespace harness {

namespace {

// Everything of one token the unprotected timeline can ever hold, plus one
// protected swap on top of a forked pool. Reserves can never exceed this.
uint128_t token_ceiling(uint64_t reserve, uint64_t attacker, size_t traders, uint64_t trader_balance,
                        uint64_t max_swap) {
    return uint128_t(reserve) + uint128_t(attacker) + uint128_t(traders) * uint128_t(trader_balance) +
           uint128_t(max_swap);
}

} // namespace

void SimulationConfig::validate() const {
    if (total_transactions == 0) {
        throw std::invalid_argument("total_transactions must be > 0");
    }
    if (!(attack_probability >= 0.0 && attack_probability <= 1.0)) {
        throw std::invalid_argument("attack_probability must be within [0, 1], got " +
                                    std::to_string(attack_probability));
    }
    if (min_swap == 0) {
        throw std::invalid_argument("min_swap must be > 0");
    }
    if (min_swap > max_swap) {
        throw std::invalid_argument("min_swap (" + std::to_string(min_swap) +
                                    ") exceeds max_swap (" + std::to_string(max_swap) + ")");
    }
    if (fee_bps > BPS_DENOM) {
        throw std::invalid_argument("fee_bps must be <= 10000, got " + std::to_string(fee_bps));
    }
    if (pool_reserve_a == 0 || pool_reserve_b == 0) {
        throw std::invalid_argument("initial pool reserves must be > 0");
    }
    if (num_traders == 0) {
        throw std::invalid_argument("num_traders must be > 0");
    }
    const uint128_t u64_max = uint128_t(std::numeric_limits<uint64_t>::max());
    if (token_ceiling(pool_reserve_a, attacker_capital, num_traders, trader_balance_a, max_swap) > u64_max ||
        token_ceiling(pool_reserve_b, attacker_capital, num_traders, trader_balance_b, max_swap) > u64_max) {
        throw std::invalid_argument("pool reserves plus all balances and max_swap must fit in u64");
    }
    if (protected_slippage_bps > commit::MAX_SLIPPAGE_BPS) {
        throw std::invalid_argument("protected_slippage_bps must be <= " +
                                    std::to_string(commit::MAX_SLIPPAGE_BPS));
    }
    if (frontrun.victim_divisor == 0 || frontrun.reserve_divisor == 0) {
        throw std::invalid_argument("frontrun divisors must be > 0");
    }
}

} // namespace harness
} // namespace mev
