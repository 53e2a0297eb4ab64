// Constant-product (x * y = k) swap math matching the on-chain AMM settlement
#pragma once

#include <cstdint>

#include "pools/pool_state.hpp"

namespace mev {
namespace pools {

// Pure quote: fee, constant-product output and price impact. Never fails:
// a zero reserve on either side yields amount_out = 0 and 10000 bps impact.
SwapOutcome quote(const PoolState& pool, uint64_t amount_in, Direction dir);

// Same computation as quote(), then moves reserves: reserve_in += amount_in
// (fee stays in the pool), reserve_out -= amount_out saturating at zero.
SwapOutcome apply(PoolState& pool, uint64_t amount_in, Direction dir);

// Quoted output reduced by floor(out * slippage_bps / 10000)
uint64_t calculate_min_output(const PoolState& pool, uint64_t amount_in, Direction dir, uint16_t slippage_bps);

} // namespace pools
} // namespace mev
