// Sandwich attacker actor: watches pending swaps, attacks when the dry run pays
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "pools/pool_state.hpp"
#include "trading/sandwich.hpp"

namespace mev {
namespace trading {

// A swap visible in the mempool before it lands
struct PendingSwap {
    uint64_t amount_in{0};
    pools::Direction direction{pools::Direction::a_to_b};
    std::string victim;
    uint64_t min_out{0};    // 0 = no slippage protection
};

struct AttackerStats {
    uint64_t attempts{0};
    uint64_t executed{0};
    uint64_t successful{0};
    uint64_t skipped{0};
    int64_t  total_profit{0};
    uint64_t total_victim_loss{0};
};

class SandwichAttacker {
public:
    SandwichAttacker(std::string id, uint64_t balance_a, uint64_t balance_b, FrontrunParams params = {});

    // Dry run only; neither the pool nor the attacker changes.
    // nullopt when no front-run is possible, the outcome is not a success
    // (no profit, or no victim loss), or the victim's min_out would make their swap fail.
    std::optional<SandwichOutcome> should_attack(const PendingSwap& pending, const pools::PoolState& pool) const;

    // Attack against the live pool. Unprofitable attempts come back with
    // executed == false and leave pool and balances untouched.
    SandwichOutcome execute_sandwich(const PendingSwap& pending, pools::PoolState& pool,
                                     uint64_t tx_id = 0, uint64_t slot = 0);

    void reset(uint64_t balance_a, uint64_t balance_b);

    const std::string& id() const { return id_; }
    uint64_t balance_a() const { return balance_a_; }
    uint64_t balance_b() const { return balance_b_; }
    uint64_t balance_in(pools::Direction d) const { return d == pools::Direction::a_to_b ? balance_a_ : balance_b_; }
    const AttackerStats& stats() const { return stats_; }
    const FrontrunParams& params() const { return params_; }

private:
    uint64_t& balance_ref(bool token_a) { return token_a ? balance_a_ : balance_b_; }
    SandwichOutcome skipped(const PendingSwap& pending, uint64_t tx_id, uint64_t slot);

    std::string id_;
    uint64_t balance_a_{0};
    uint64_t balance_b_{0};
    FrontrunParams params_{};
    AttackerStats stats_{};
};

} // namespace trading
} // namespace mev
