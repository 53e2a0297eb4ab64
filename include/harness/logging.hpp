// Action logging for --save-actions mode
// Centralizes all save_actions logic; every method is a noop when disabled
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "harness/actions.hpp"
#include "pools/cpmm_math.hpp"
#include "trading/protected_trader.hpp"
#include "trading/sandwich.hpp"
#include "trading/trade_record.hpp"

namespace mev {
namespace harness {

class ActionLogger {
public:
    ActionLogger() = default;
    explicit ActionLogger(bool enabled) : enabled_(enabled) {}

    bool enabled() const { return enabled_; }
    void set_enabled(bool e) { enabled_ = e; }

    // Get recorded actions (moves out)
    std::vector<Action> take_actions() { return std::move(actions_); }

    const std::vector<Action>& actions() const { return actions_; }

    // Log the three legs of an executed sandwich. Legs are replayed on a copy
    // of the pre-attack pool to recover the intermediate reserves.
    void log_sandwich(const trading::SandwichOutcome& s, const trading::TradeRecord& victim,
                      const pools::PoolState& before) {
        if (!enabled_ || !s.executed) return;
        pools::PoolState p = before;

        FrontrunAction fr;
        fr.tx_id = s.tx_id;
        fr.slot = s.slot;
        fr.direction = victim.direction;
        fr.amount_in = s.frontrun_amount;
        fr.reserves.before = reserves_of(p);
        fr.amount_out = pools::apply(p, s.frontrun_amount, victim.direction).amount_out;
        fr.reserves.after = reserves_of(p);
        actions_.push_back(std::move(fr));

        VictimSwapAction vs;
        vs.tx_id = s.tx_id;
        vs.slot = s.slot;
        vs.trader = victim.trader;
        vs.direction = victim.direction;
        vs.amount_in = victim.amount_in;
        vs.expected_out = victim.expected_out;
        vs.reserves.before = reserves_of(p);
        vs.amount_out = pools::apply(p, victim.amount_in, victim.direction).amount_out;
        vs.loss = victim.loss;
        vs.reserves.after = reserves_of(p);
        actions_.push_back(std::move(vs));

        BackrunAction br;
        br.tx_id = s.tx_id;
        br.slot = s.slot;
        br.direction = pools::opposite(victim.direction);
        br.amount_in = s.backrun_input;
        br.reserves.before = reserves_of(p);
        br.amount_out = pools::apply(p, s.backrun_input, br.direction).amount_out;
        br.profit = s.profit;
        br.reserves.after = reserves_of(p);
        actions_.push_back(std::move(br));
    }

    void log_skip(uint64_t tx_id, uint64_t slot, const std::string& victim, uint64_t amount_in,
                  const std::string& reason) {
        if (!enabled_) return;
        SkipAction act;
        act.tx_id = tx_id;
        act.slot = slot;
        act.victim = victim;
        act.amount_in = amount_in;
        act.reason = reason;
        actions_.push_back(std::move(act));
    }

    void log_direct_swap(const trading::TradeRecord& rec, const pools::PoolState& before,
                         const pools::PoolState& after) {
        if (!enabled_) return;
        DirectSwapAction act;
        act.tx_id = rec.tx_id;
        act.slot = rec.slot;
        act.trader = rec.trader;
        act.direction = rec.direction;
        act.amount_in = rec.amount_in;
        act.amount_out = rec.actual_out;
        act.fee = rec.fee_paid;
        act.reserves.before = reserves_of(before);
        act.reserves.after = reserves_of(after);
        actions_.push_back(std::move(act));
    }

    void log_commit(uint64_t tx_id, uint64_t slot, const std::string& trader, const commit::Hash32& hash,
                    uint64_t min_out, const pools::PoolState& pool) {
        if (!enabled_) return;
        CommitAction act;
        act.tx_id = tx_id;
        act.slot = slot;
        act.trader = trader;
        act.hash = hash;
        act.min_out = min_out;
        act.reserves = reserves_of(pool);
        actions_.push_back(std::move(act));
    }

    void log_reveal(uint64_t tx_id, uint64_t slot, const std::string& trader, const trading::RevealResult& r,
                    uint64_t amount_in, const pools::PoolState& before, const pools::PoolState& after) {
        if (!enabled_) return;
        RevealAction act;
        act.tx_id = tx_id;
        act.slot = slot;
        act.trader = trader;
        act.status = trading::reveal_status_name(r.status);
        act.hash = r.commitment_hash;
        act.slots_waited = r.slots_waited;
        act.amount_in = amount_in;
        act.amount_out = r.trade ? r.trade->actual_out : 0;
        act.reserves.before = reserves_of(before);
        act.reserves.after = reserves_of(after);
        actions_.push_back(std::move(act));
    }

private:
    bool enabled_{false};
    std::vector<Action> actions_;
};

} // namespace harness
} // namespace mev
