// Unprotected trader - implementation

#include "trading/normal_trader.hpp"

#include <utility>

#include "core/numeric_types.hpp"
#include "pools/cpmm_math.hpp"
#include "trading/sandwich_attacker.hpp"

namespace mev {
namespace trading {

using pools::Direction;
using pools::PoolState;

NormalTrader::NormalTrader(std::string id, uint64_t balance_a, uint64_t balance_b)
    : id_(std::move(id)), balance_a_(balance_a), balance_b_(balance_b) {}

VictimTradeResult NormalTrader::trade(PoolState& pool, uint64_t amount, Direction dir,
                                      uint64_t tx_id, uint64_t slot, SandwichAttacker* attacker) {
    VictimTradeResult result{};

    const bool in_is_a = dir == Direction::a_to_b;
    uint64_t& bal_in = in_is_a ? balance_a_ : balance_b_;
    uint64_t& bal_out = in_is_a ? balance_b_ : balance_a_;
    if (amount == 0 || bal_in < amount) {
        return result;
    }

    TradeRecord rec{};
    rec.tx_id = tx_id;
    rec.trader = id_;
    rec.amount_in = amount;
    rec.direction = dir;
    rec.slot = slot;
    // Before anybody has reacted to the swap
    rec.expected_out = pools::quote(pool, amount, dir).amount_out;

    bool sandwiched = false;
    if (attacker != nullptr) {
        PendingSwap pending{amount, dir, id_, 0};
        result.sandwich = attacker->execute_sandwich(pending, pool, tx_id, slot);
        if (result.sandwich->executed) {
            sandwiched = true;
            rec.actual_out = result.sandwich->victim_actual;
            rec.fee_paid = result.sandwich->victim_fee;
            rec.price_impact_bps = result.sandwich->victim_price_impact_bps;
        }
    }

    if (!sandwiched) {
        const auto swap = pools::apply(pool, amount, dir);
        rec.actual_out = swap.amount_out;
        rec.fee_paid = swap.fee_charged;
        rec.price_impact_bps = swap.price_impact_bps;
    }

    rec.was_attacked = sandwiched;
    rec.loss = saturating_sub(rec.expected_out, rec.actual_out);

    bal_in -= amount;
    bal_out = saturating_add(bal_out, rec.actual_out);
    total_loss_ = saturating_add(total_loss_, rec.loss);

    result.record = std::move(rec);
    return result;
}

void NormalTrader::reset(uint64_t balance_a, uint64_t balance_b) {
    balance_a_ = balance_a;
    balance_b_ = balance_b;
    total_loss_ = 0;
}

} // namespace trading
} // namespace mev
