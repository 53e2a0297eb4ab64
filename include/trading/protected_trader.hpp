// Commit-reveal protected trader
// Trade parameters stay hidden behind a SHA-256 commitment until at least
// MIN_REVEAL_DELAY_SLOTS have passed; the swap is quoted at reveal time.
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "commit/commitment.hpp"
#include "commit/swap_intent.hpp"
#include "pools/pool_state.hpp"
#include "trading/trade_record.hpp"

namespace mev {
namespace trading {

enum class RevealStatus : uint8_t {
    ok,
    no_commitment,
    too_early,              // retry once the delay has passed
    hash_mismatch,          // wrong payload; the stored commitment stays live
    insufficient_balance,
    slippage_exceeded,      // reveal-time output below intent.min_out
};

inline const char* reveal_status_name(RevealStatus s) {
    switch (s) {
        case RevealStatus::ok: return "ok";
        case RevealStatus::no_commitment: return "no_commitment";
        case RevealStatus::too_early: return "too_early";
        case RevealStatus::hash_mismatch: return "hash_mismatch";
        case RevealStatus::insufficient_balance: return "insufficient_balance";
        case RevealStatus::slippage_exceeded: return "slippage_exceeded";
    }
    return "unknown";
}

struct RevealResult {
    RevealStatus status{RevealStatus::no_commitment};
    std::optional<TradeRecord> trade;
    uint64_t slots_waited{0};
    commit::Hash32 commitment_hash{};

    bool ok() const { return status == RevealStatus::ok; }
};

struct ProtectedTradeResult {
    std::optional<commit::Hash32> commitment;   // empty: commit rejected
    RevealResult reveal{};
    uint64_t min_out{0};

    bool ok() const { return commitment.has_value() && reveal.ok(); }
};

class ProtectedTrader {
public:
    ProtectedTrader(std::string id, uint64_t balance_a, uint64_t balance_b);

    // nullopt (no state change) if a commitment is live, amount is 0,
    // slippage exceeds MAX_SLIPPAGE_BPS, or the input balance is short.
    std::optional<commit::Hash32> commit(uint64_t amount_in, uint64_t min_out, uint16_t slippage_bps,
                                         pools::Direction dir);

    // Reveal the stored intent. Failures leave the commitment live and
    // touch neither balances nor the pool.
    RevealResult reveal(pools::PoolState& pool, uint64_t tx_id = 0);

    // Reveal with a caller-supplied payload checked against the stored hash
    RevealResult reveal(pools::PoolState& pool, const commit::SwapIntent& presented, uint64_t tx_id = 0);

    // Committed -> Cancelled, anything else -> None
    void cancel();

    // min_out from calculate_min_output, commit, wait one slot, reveal
    ProtectedTradeResult execute_protected_trade(pools::PoolState& pool, uint64_t amount, pools::Direction dir,
                                                 uint16_t slippage_bps, uint64_t tx_id = 0);

    void advance_slot(uint64_t n = 1) { slot_ += n; }
    void set_slot(uint64_t s) { slot_ = s; }
    uint64_t slot() const { return slot_; }

    void reset(uint64_t balance_a, uint64_t balance_b);

    const std::string& id() const { return id_; }
    uint64_t balance_a() const { return balance_a_; }
    uint64_t balance_b() const { return balance_b_; }
    const commit::CommitmentState& state() const { return state_; }
    bool has_live_commitment() const { return commit::is_live(state_); }

private:
    std::string id_;
    uint64_t balance_a_{0};
    uint64_t balance_b_{0};
    uint64_t slot_{0};
    commit::CommitmentState state_{commit::NoCommitment{}};
};

} // namespace trading
} // namespace mev
