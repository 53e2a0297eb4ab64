// Unprotected trader: swaps go straight to the public mempool
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "pools/pool_state.hpp"
#include "trading/sandwich.hpp"
#include "trading/trade_record.hpp"

namespace mev {
namespace trading {

class SandwichAttacker;

struct VictimTradeResult {
    std::optional<TradeRecord> record;          // empty: input rejected, nothing happened
    std::optional<SandwichOutcome> sandwich;    // set whenever an attacker looked at the swap
};

class NormalTrader {
public:
    NormalTrader(std::string id, uint64_t balance_a, uint64_t balance_b);

    // Quote expected output, then either let `attacker` sandwich the swap or
    // execute it directly. Rejects zero amounts and insufficient balance.
    VictimTradeResult trade(pools::PoolState& pool, uint64_t amount, pools::Direction dir,
                            uint64_t tx_id = 0, uint64_t slot = 0, SandwichAttacker* attacker = nullptr);

    void reset(uint64_t balance_a, uint64_t balance_b);

    const std::string& id() const { return id_; }
    uint64_t balance_a() const { return balance_a_; }
    uint64_t balance_b() const { return balance_b_; }
    uint64_t total_loss() const { return total_loss_; }

private:
    std::string id_;
    uint64_t balance_a_{0};
    uint64_t balance_b_{0};
    uint64_t total_loss_{0};
};

} // namespace trading
} // namespace mev
