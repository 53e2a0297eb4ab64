// Constant-product swap math - implementation

#include "pools/cpmm_math.hpp"

#include "core/numeric_types.hpp"

namespace mev {
namespace pools {

SwapOutcome quote(const PoolState& pool, uint64_t amount_in, Direction dir) {
    SwapOutcome out{};

    const uint64_t r_in  = pool.reserve_in(dir);
    const uint64_t r_out = pool.reserve_out(dir);

    out.fee_charged = mul_div_floor(amount_in, pool.fee_bps, BPS_DENOM);
    const uint64_t net_in = saturating_sub(amount_in, out.fee_charged);

    if (r_in == 0 || r_out == 0) {
        out.amount_out = 0;
        out.price_impact_bps = BPS_DENOM;
        return out;
    }

    // amount_out = net_in * r_out / (r_in + net_in); result <= r_out so it fits u64
    const uint128_t numerator   = uint128_t(net_in) * uint128_t(r_out);
    const uint128_t denominator = uint128_t(r_in) + uint128_t(net_in);
    out.amount_out = NumTraits<uint128_t>::to_u64_saturating(numerator / denominator);

    // Linear (no-impact) output; can exceed u64 when r_in is tiny, so stay wide
    const uint128_t ideal = numerator / uint128_t(r_in);
    if (ideal > 0) {
        const uint256_t shortfall = uint256_t(ideal) - uint256_t(out.amount_out);
        const uint256_t impact = shortfall * uint256_t(BPS_DENOM) / uint256_t(ideal);
        out.price_impact_bps = NumTraits<uint256_t>::to_u64_saturating(impact);
    } else {
        out.price_impact_bps = 0;
    }
    return out;
}

SwapOutcome apply(PoolState& pool, uint64_t amount_in, Direction dir) {
    const SwapOutcome res = quote(pool, amount_in, dir);

    // Saturation on the input side would drop part of amount_in and shrink k.
    // SimulationConfig::validate() bounds total token supply below u64 max, so
    // simulated reserves never get there.
    if (dir == Direction::a_to_b) {
        pool.reserve_a = saturating_add(pool.reserve_a, amount_in);
        pool.reserve_b = saturating_sub(pool.reserve_b, res.amount_out);
    } else {
        pool.reserve_b = saturating_add(pool.reserve_b, amount_in);
        pool.reserve_a = saturating_sub(pool.reserve_a, res.amount_out);
    }
    return res;
}

uint64_t calculate_min_output(const PoolState& pool, uint64_t amount_in, Direction dir, uint16_t slippage_bps) {
    const uint64_t out = quote(pool, amount_in, dir).amount_out;
    return saturating_sub(out, mul_div_floor(out, slippage_bps, BPS_DENOM));
}

} // namespace pools
} // namespace mev
