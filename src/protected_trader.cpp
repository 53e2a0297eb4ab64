// Commit-reveal protected trader - implementation

#include "trading/protected_trader.hpp"

#include <iostream>
#include <utility>

#include "core/common.hpp"
#include "core/numeric_types.hpp"
#include "pools/cpmm_math.hpp"

namespace mev {
namespace trading {

using pools::Direction;
using pools::PoolState;

namespace {

void trace_reveal(const std::string& id, const RevealResult& r) {
    if (!trace_commit_enabled()) return;
    std::cerr << "[TRACE_COMMIT] " << id << " reveal " << reveal_status_name(r.status)
              << " hash=" << to_hex(r.commitment_hash, 8)
              << " waited=" << r.slots_waited << "\n";
}

} // namespace

ProtectedTrader::ProtectedTrader(std::string id, uint64_t balance_a, uint64_t balance_b)
    : id_(std::move(id)), balance_a_(balance_a), balance_b_(balance_b) {}

std::optional<commit::Hash32> ProtectedTrader::commit(uint64_t amount_in, uint64_t min_out, uint16_t slippage_bps,
                                                     Direction dir) {
    if (commit::is_live(state_)) return std::nullopt;
    if (amount_in == 0) return std::nullopt;
    if (slippage_bps > commit::MAX_SLIPPAGE_BPS) return std::nullopt;
    const uint64_t bal_in = dir == Direction::a_to_b ? balance_a_ : balance_b_;
    if (bal_in < amount_in) return std::nullopt;

    commit::Committed c{};
    c.owner = id_;
    c.intent = commit::make_intent(amount_in, min_out, slippage_bps);
    c.hash = commit::hash_intent(c.intent);
    c.direction = dir;
    c.created_at = slot_;

    const commit::Hash32 hash = c.hash;
    state_ = std::move(c);

    if (trace_commit_enabled()) {
        std::cerr << "[TRACE_COMMIT] " << id_ << " commit slot=" << slot_
                  << " hash=" << to_hex(hash, 8) << "\n";
    }
    return hash;
}

RevealResult ProtectedTrader::reveal(PoolState& pool, uint64_t tx_id) {
    const auto* c = std::get_if<commit::Committed>(&state_);
    if (c == nullptr) {
        RevealResult r{};
        r.status = RevealStatus::no_commitment;
        trace_reveal(id_, r);
        return r;
    }
    const commit::SwapIntent stored = c->intent;
    return reveal(pool, stored, tx_id);
}

RevealResult ProtectedTrader::reveal(PoolState& pool, const commit::SwapIntent& presented, uint64_t tx_id) {
    RevealResult r{};

    const auto* c = std::get_if<commit::Committed>(&state_);
    if (c == nullptr) {
        r.status = RevealStatus::no_commitment;
        trace_reveal(id_, r);
        return r;
    }

    r.commitment_hash = c->hash;
    r.slots_waited = saturating_sub(slot_, c->created_at);

    if (r.slots_waited < commit::MIN_REVEAL_DELAY_SLOTS) {
        r.status = RevealStatus::too_early;
        trace_reveal(id_, r);
        return r;
    }
    if (!commit::verify(presented, c->hash)) {
        r.status = RevealStatus::hash_mismatch;
        trace_reveal(id_, r);
        return r;
    }

    const Direction dir = c->direction;
    const bool in_is_a = dir == Direction::a_to_b;
    uint64_t& bal_in = in_is_a ? balance_a_ : balance_b_;
    uint64_t& bal_out = in_is_a ? balance_b_ : balance_a_;
    if (bal_in < presented.amount_in) {
        r.status = RevealStatus::insufficient_balance;
        trace_reveal(id_, r);
        return r;
    }

    // Quoted at reveal time; nobody could see the amount before now
    const auto expected = pools::quote(pool, presented.amount_in, dir);
    if (expected.amount_out < presented.min_out) {
        r.status = RevealStatus::slippage_exceeded;
        trace_reveal(id_, r);
        return r;
    }

    bal_in -= presented.amount_in;
    const auto swap = pools::apply(pool, presented.amount_in, dir);
    bal_out = saturating_add(bal_out, swap.amount_out);

    TradeRecord rec{};
    rec.tx_id = tx_id;
    rec.trader = id_;
    rec.amount_in = presented.amount_in;
    rec.direction = dir;
    rec.expected_out = expected.amount_out;
    rec.actual_out = swap.amount_out;
    rec.loss = saturating_sub(rec.expected_out, rec.actual_out);
    rec.fee_paid = swap.fee_charged;
    rec.price_impact_bps = swap.price_impact_bps;
    rec.was_attacked = false;
    rec.slot = slot_;

    state_ = commit::Revealed{c->hash, c->created_at, slot_};

    r.status = RevealStatus::ok;
    r.trade = std::move(rec);
    trace_reveal(id_, r);
    return r;
}

void ProtectedTrader::cancel() {
    if (const auto* c = std::get_if<commit::Committed>(&state_)) {
        if (trace_commit_enabled()) {
            std::cerr << "[TRACE_COMMIT] " << id_ << " cancel hash=" << to_hex(c->hash, 8) << "\n";
        }
        state_ = commit::Cancelled{c->hash, c->created_at};
        return;
    }
    state_ = commit::NoCommitment{};
}

ProtectedTradeResult ProtectedTrader::execute_protected_trade(PoolState& pool, uint64_t amount, Direction dir,
                                                              uint16_t slippage_bps, uint64_t tx_id) {
    ProtectedTradeResult res{};
    res.min_out = pools::calculate_min_output(pool, amount, dir, slippage_bps);

    res.commitment = commit(amount, res.min_out, slippage_bps, dir);
    if (!res.commitment) {
        return res;
    }

    advance_slot(commit::MIN_REVEAL_DELAY_SLOTS);
    res.reveal = reveal(pool, tx_id);
    return res;
}

void ProtectedTrader::reset(uint64_t balance_a, uint64_t balance_b) {
    balance_a_ = balance_a;
    balance_b_ = balance_b;
    slot_ = 0;
    state_ = commit::NoCommitment{};
}

} // namespace trading
} // namespace mev
