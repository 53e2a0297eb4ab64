// Sandwich attack optimizer - implementation

#include "trading/sandwich.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

#include <boost/math/tools/minima.hpp>

#include "core/common.hpp"
#include "core/numeric_types.hpp"
#include "pools/cpmm_math.hpp"

namespace mev {
namespace trading {

using pools::Direction;
using pools::PoolState;

SandwichOutcome simulate_sandwich(PoolState& pool, uint64_t victim_amount, Direction dir, uint64_t frontrun_amount) {
    SandwichOutcome o{};
    o.frontrun_amount = frontrun_amount;

    // Baseline the victim would get with nobody in front of them
    o.victim_expected = pools::quote(pool, victim_amount, dir).amount_out;

    const auto front = pools::apply(pool, frontrun_amount, dir);
    o.frontrun_output = front.amount_out;

    const auto victim = pools::apply(pool, victim_amount, dir);
    o.victim_actual = victim.amount_out;
    o.victim_fee = victim.fee_charged;
    o.victim_price_impact_bps = victim.price_impact_bps;

    o.backrun_input = o.frontrun_output;
    const auto back = pools::apply(pool, o.backrun_input, pools::opposite(dir));
    o.backrun_output = back.amount_out;

    o.profit = signed_diff(o.backrun_output, o.frontrun_amount);
    o.victim_loss = saturating_sub(o.victim_expected, o.victim_actual);
    o.executed = true;
    // On dust pools flooring can pay the attacker while the victim's output is
    // unchanged; that is rounding, not a sandwich
    o.success = o.profit > 0 && o.victim_loss > 0;
    return o;
}

uint64_t heuristic_frontrun(const PoolState& pool, uint64_t victim_amount, Direction dir,
                            uint64_t attacker_capital, const FrontrunParams& params) {
    const uint64_t by_victim = params.victim_divisor == 0 ? victim_amount : victim_amount / params.victim_divisor;
    const uint64_t reserve_in = pool.reserve_in(dir);
    const uint64_t by_reserve = params.reserve_divisor == 0 ? reserve_in : reserve_in / params.reserve_divisor;
    return std::min({by_victim, attacker_capital, by_reserve});
}

namespace {

int64_t dry_profit(const PoolState& pool, uint64_t victim_amount, Direction dir, uint64_t frontrun) {
    PoolState scratch = pool;
    return simulate_sandwich(scratch, victim_amount, dir, frontrun).profit;
}

// Maximize the exact integer profit over [1, cap]; falls back to `seed` when it is no worse
uint64_t search_frontrun(const PoolState& pool, uint64_t victim_amount, Direction dir, uint64_t cap, uint64_t seed) {
    if (cap == 0) return 0;

    auto to_size = [cap](double x) -> uint64_t {
        if (!(x >= 1.0)) return 1;
        if (x >= static_cast<double>(cap)) return cap;
        return static_cast<uint64_t>(std::floor(x));
    };
    auto neg_profit = [&](double x) -> double {
        return -static_cast<double>(dry_profit(pool, victim_amount, dir, to_size(x)));
    };

    const int bits = std::numeric_limits<double>::digits / 2;
    boost::uintmax_t max_iter = 200;
    const auto r = boost::math::tools::brent_find_minima(neg_profit, 1.0, static_cast<double>(cap), bits, max_iter);

    uint64_t best = seed;
    int64_t best_profit = seed == 0 ? std::numeric_limits<int64_t>::min() : dry_profit(pool, victim_amount, dir, seed);

    const uint64_t lo = to_size(r.first);
    for (uint64_t cand : {lo, std::min(lo + 1, cap)}) {
        const int64_t p = dry_profit(pool, victim_amount, dir, cand);
        if (p > best_profit) {
            best = cand;
            best_profit = p;
        }
    }

    if (trace_sandwich_enabled()) {
        std::cerr << "[TRACE_SANDWICH] search: cap=" << cap << " seed=" << seed
                  << " brent_x=" << r.first << " iters=" << max_iter
                  << " chosen=" << best << " profit=" << best_profit << "\n";
    }
    return best;
}

} // namespace

SandwichOutcome optimal_frontrun(const PoolState& pool, uint64_t victim_amount, Direction dir,
                                 uint64_t attacker_capital, const FrontrunParams& params) {
    uint64_t frontrun = heuristic_frontrun(pool, victim_amount, dir, attacker_capital, params);

    if (params.strategy == FrontrunStrategy::search) {
        const uint64_t reserve_in = pool.reserve_in(dir);
        const uint64_t by_reserve = params.reserve_divisor == 0 ? reserve_in : reserve_in / params.reserve_divisor;
        frontrun = search_frontrun(pool, victim_amount, dir, std::min(attacker_capital, by_reserve), frontrun);
    }

    if (frontrun == 0) {
        return SandwichOutcome{};
    }

    PoolState scratch = pool;
    SandwichOutcome o = simulate_sandwich(scratch, victim_amount, dir, frontrun);

    if (trace_sandwich_enabled()) {
        std::cerr << "[TRACE_SANDWICH] dry run: victim=" << victim_amount
                  << " dir=" << pools::direction_name(dir)
                  << " frontrun=" << o.frontrun_amount
                  << " backrun_out=" << o.backrun_output
                  << " profit=" << o.profit
                  << " victim_loss=" << o.victim_loss << "\n";
    }
    return o;
}

} // namespace trading
} // namespace mev
