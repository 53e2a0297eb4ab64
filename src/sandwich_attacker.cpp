// Sandwich attacker actor - implementation

#include "trading/sandwich_attacker.hpp"

#include <iostream>
#include <utility>

#include "core/common.hpp"
#include "core/numeric_types.hpp"

namespace mev {
namespace trading {

using pools::Direction;
using pools::PoolState;

SandwichAttacker::SandwichAttacker(std::string id, uint64_t balance_a, uint64_t balance_b, FrontrunParams params)
    : id_(std::move(id)), balance_a_(balance_a), balance_b_(balance_b), params_(params) {}

std::optional<SandwichOutcome> SandwichAttacker::should_attack(const PendingSwap& pending, const PoolState& pool) const {
    if (pending.amount_in == 0) return std::nullopt;

    SandwichOutcome dry = optimal_frontrun(pool, pending.amount_in, pending.direction,
                                           balance_in(pending.direction), params_);
    if (!dry.executed || !dry.success) return std::nullopt;
    if (pending.min_out > 0 && dry.victim_actual < pending.min_out) return std::nullopt;
    return dry;
}

SandwichOutcome SandwichAttacker::skipped(const PendingSwap& pending, uint64_t tx_id, uint64_t slot) {
    ++stats_.skipped;
    SandwichOutcome o{};
    o.victim = pending.victim;
    o.tx_id = tx_id;
    o.slot = slot;
    return o;
}

SandwichOutcome SandwichAttacker::execute_sandwich(const PendingSwap& pending, PoolState& pool,
                                                   uint64_t tx_id, uint64_t slot) {
    ++stats_.attempts;

    const auto dry = should_attack(pending, pool);
    if (!dry) {
        if (trace_sandwich_enabled()) {
            std::cerr << "[TRACE_SANDWICH] tx=" << tx_id << " skip: victim=" << pending.victim
                      << " amount=" << pending.amount_in << " not profitable\n";
        }
        return skipped(pending, tx_id, slot);
    }

    const bool in_is_a = pending.direction == Direction::a_to_b;
    uint64_t& bal_in = balance_ref(in_is_a);
    uint64_t& bal_out = balance_ref(!in_is_a);

    if (bal_in < dry->frontrun_amount) {
        if (trace_sandwich_enabled()) {
            std::cerr << "[TRACE_SANDWICH] tx=" << tx_id << " skip: balance " << bal_in
                      << " < frontrun " << dry->frontrun_amount << "\n";
        }
        return skipped(pending, tx_id, slot);
    }

    // Same arithmetic as the dry run, now on the live pool
    SandwichOutcome o = simulate_sandwich(pool, pending.amount_in, pending.direction, dry->frontrun_amount);
    o.victim = pending.victim;
    o.tx_id = tx_id;
    o.slot = slot;

    bal_in -= o.frontrun_amount;
    bal_out = saturating_add(bal_out, o.frontrun_output);
    // Back-run spends exactly what the front-run bought; whatever it returns
    // (possibly less than the front-run cost) is the realized result.
    bal_out = saturating_sub(bal_out, o.backrun_input);
    bal_in = saturating_add(bal_in, o.backrun_output);

    ++stats_.executed;
    if (o.success) ++stats_.successful;
    stats_.total_profit += o.profit;
    stats_.total_victim_loss = saturating_add(stats_.total_victim_loss, o.victim_loss);

    if (trace_sandwich_enabled()) {
        std::cerr << "[TRACE_SANDWICH] tx=" << tx_id << " executed: frontrun=" << o.frontrun_amount
                  << " backrun_out=" << o.backrun_output << " profit=" << o.profit
                  << " victim_loss=" << o.victim_loss << "\n";
    }
    return o;
}

void SandwichAttacker::reset(uint64_t balance_a, uint64_t balance_b) {
    balance_a_ = balance_a;
    balance_b_ = balance_b;
    stats_ = AttackerStats{};
}

} // namespace trading
} // namespace mev
