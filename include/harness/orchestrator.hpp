// Scenario orchestrator: every transaction is replayed twice from the same pool,
// once in the public mempool (sandwich-able) and once through commit-reveal.
// Only the unprotected branch's pool carries forward to the next transaction.
#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "harness/actions.hpp"
#include "harness/config.hpp"
#include "harness/logging.hpp"
#include "harness/metrics.hpp"
#include "pools/pool_state.hpp"
#include "trading/normal_trader.hpp"
#include "trading/protected_trader.hpp"
#include "trading/sandwich_attacker.hpp"

namespace mev {
namespace harness {

enum class Scenario : uint8_t {
    unprotected,
    commit_reveal,
};

inline const char* scenario_name(Scenario s) {
    return s == Scenario::unprotected ? "unprotected" : "protected";
}

struct PoolSnapshot {
    uint64_t tx_id{0};
    uint64_t reserve_a{0};
    uint64_t reserve_b{0};
    double price_a_in_b{0.0};
    Scenario scenario{Scenario::unprotected};

    static PoolSnapshot of(uint64_t tx_id, const pools::PoolState& p, Scenario s) {
        return PoolSnapshot{tx_id, p.reserve_a, p.reserve_b, p.price_a_in_b(), s};
    }
};

struct SimulationResults {
    SimulationConfig config{};
    std::vector<trading::TradeRecord> unprotected_trades;
    std::vector<trading::TradeRecord> protected_trades;
    std::vector<trading::SandwichOutcome> sandwiches;
    std::vector<PoolSnapshot> pool_history;
    SimulationSummary summary{};
    pools::PoolState final_pool{};
    trading::AttackerStats attacker{};
    std::vector<Action> actions;    // only with save_actions
};

class Orchestrator {
public:
    // Throws std::invalid_argument if the config does not validate
    explicit Orchestrator(SimulationConfig config);

    SimulationResults run();

    // Fresh pool, balances and RNG; run() twice in a row gives identical results
    void reset();

    const SimulationConfig& config() const { return config_; }
    const pools::PoolState& pool() const { return pool_; }
    const trading::SandwichAttacker& attacker() const { return attacker_; }
    const std::vector<trading::NormalTrader>& normal_traders() const { return normal_; }
    const std::vector<trading::ProtectedTrader>& protected_traders() const { return protected_; }

private:
    struct TxDraw {
        uint64_t amount{0};
        pools::Direction direction{pools::Direction::a_to_b};
        size_t trader{0};
        bool attack{false};
    };

    TxDraw draw();
    void run_unprotected(uint64_t tx_id, const TxDraw& d, SimulationResults& out);
    void run_protected(uint64_t tx_id, const TxDraw& d, SimulationResults& out);

    SimulationConfig config_;
    pools::PoolState pool_{};
    trading::SandwichAttacker attacker_;
    std::vector<trading::NormalTrader> normal_;
    std::vector<trading::ProtectedTrader> protected_;
    std::mt19937_64 rng_;
    uint64_t slot_{0};
    ActionLogger logger_{};
};

// One-shot convenience wrapper
SimulationResults run_simulation(const SimulationConfig& config);

} // namespace harness
} // namespace mev
