// Scenario orchestrator - implementation

#include "harness/orchestrator.hpp"

#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

#include "core/common.hpp"

namespace mev {
namespace harness {

using pools::Direction;
using pools::PoolState;

namespace {

SimulationConfig validated(SimulationConfig cfg) {
    cfg.validate();
    return cfg;
}

} // namespace

Orchestrator::Orchestrator(SimulationConfig config)
    : config_(validated(std::move(config))),
      attacker_("attacker", config_.attacker_capital, config_.attacker_capital, config_.frontrun) {
    normal_.reserve(config_.num_traders);
    protected_.reserve(config_.num_traders);
    for (size_t i = 0; i < config_.num_traders; ++i) {
        normal_.emplace_back("trader_" + std::to_string(i), config_.trader_balance_a, config_.trader_balance_b);
        protected_.emplace_back("protected_" + std::to_string(i), config_.trader_balance_a, config_.trader_balance_b);
    }
    reset();
}

void Orchestrator::reset() {
    pool_ = PoolState(config_.pool_reserve_a, config_.pool_reserve_b, config_.fee_bps);
    attacker_.reset(config_.attacker_capital, config_.attacker_capital);
    for (auto& t : normal_) t.reset(config_.trader_balance_a, config_.trader_balance_b);
    for (auto& t : protected_) t.reset(config_.trader_balance_a, config_.trader_balance_b);
    rng_.seed(config_.seed);
    slot_ = 0;
    logger_ = ActionLogger(config_.save_actions);
}

Orchestrator::TxDraw Orchestrator::draw() {
    std::uniform_int_distribution<uint64_t> amount_dist(config_.min_swap, config_.max_swap);
    std::bernoulli_distribution dir_dist(0.5);
    std::uniform_int_distribution<size_t> trader_dist(0, config_.num_traders - 1);
    std::bernoulli_distribution attack_dist(config_.attack_probability);

    TxDraw d;
    d.amount = amount_dist(rng_);
    d.direction = dir_dist(rng_) ? Direction::a_to_b : Direction::b_to_a;
    d.trader = trader_dist(rng_);
    d.attack = attack_dist(rng_);
    return d;
}

void Orchestrator::run_unprotected(uint64_t tx_id, const TxDraw& d, SimulationResults& out) {
    const PoolState before = pool_;
    auto& trader = normal_[d.trader];

    auto res = trader.trade(pool_, d.amount, d.direction, tx_id, slot_, d.attack ? &attacker_ : nullptr);

    if (res.sandwich) {
        if (res.sandwich->executed && res.record) {
            logger_.log_sandwich(*res.sandwich, *res.record, before);
        } else if (!res.sandwich->executed) {
            logger_.log_skip(tx_id, slot_, trader.id(), d.amount, "unprofitable");
        }
        out.sandwiches.push_back(std::move(*res.sandwich));
    }
    if (res.record) {
        if (!res.record->was_attacked) {
            logger_.log_direct_swap(*res.record, before, pool_);
        }
        out.unprotected_trades.push_back(std::move(*res.record));
    }
}

void Orchestrator::run_protected(uint64_t tx_id, const TxDraw& d, SimulationResults& out) {
    const PoolState before = pool_;
    auto& trader = protected_[d.trader];
    trader.set_slot(slot_);

    auto res = trader.execute_protected_trade(pool_, d.amount, d.direction, config_.protected_slippage_bps, tx_id);
    if (!res.commitment) {
        return;
    }
    logger_.log_commit(tx_id, slot_, trader.id(), *res.commitment, res.min_out, before);
    logger_.log_reveal(tx_id, trader.slot(), trader.id(), res.reveal, d.amount, before, pool_);

    if (res.reveal.ok()) {
        out.protected_trades.push_back(std::move(*res.reveal.trade));
        return;
    }

    // Do not leave a stale live commitment behind
    trader.cancel();
    if (config_.verbose) {
        std::lock_guard<std::mutex> lock(io_mu);
        std::cout << "tx " << tx_id << ": reveal failed for " << trader.id()
                  << " (" << trading::reveal_status_name(res.reveal.status) << "), commitment cancelled\n";
    }
}

SimulationResults Orchestrator::run() {
    reset();

    SimulationResults out;
    out.config = config_;
    out.unprotected_trades.reserve(config_.total_transactions);
    out.protected_trades.reserve(config_.total_transactions);
    out.pool_history.reserve(2 * config_.total_transactions);

    for (uint64_t i = 0; i < config_.total_transactions; ++i) {
        const TxDraw d = draw();

        if (config_.verbose && (i == 0 || (i + 1) % 100 == 0)) {
            std::lock_guard<std::mutex> lock(io_mu);
            std::cout << "seed " << config_.seed << ": tx " << (i + 1) << "/" << config_.total_transactions
                      << " reserves=[" << pool_.reserve_a << ", " << pool_.reserve_b << "]"
                      << " attacker_profit=" << attacker_.stats().total_profit << "\n";
        }

        const PoolState pool_before = pool_;

        run_unprotected(i, d, out);
        out.pool_history.push_back(PoolSnapshot::of(i, pool_, Scenario::unprotected));
        const PoolState carried = pool_;

        // Protected branch forks from the same starting point
        pool_ = pool_before;
        run_protected(i, d, out);
        out.pool_history.push_back(PoolSnapshot::of(i, pool_, Scenario::commit_reveal));

        pool_ = carried;
        ++slot_;
    }

    out.summary = compute_summary(config_.total_transactions, out.unprotected_trades, out.protected_trades,
                                  out.sandwiches);
    out.final_pool = pool_;
    out.attacker = attacker_.stats();
    out.actions = logger_.take_actions();

    if (config_.verbose) {
        std::lock_guard<std::mutex> lock(io_mu);
        std::cout << "seed " << config_.seed << ": done, mev=" << out.summary.total_mev_extracted
                  << " victim_losses=" << out.summary.total_victim_losses
                  << " success_rate=" << std::fixed << std::setprecision(1)
                  << out.summary.attack_success_rate << "%\n"
                  << std::defaultfloat << std::setprecision(6);
    }
    return out;
}

SimulationResults run_simulation(const SimulationConfig& config) {
    Orchestrator orch(config);
    return orch.run();
}

} // namespace harness
} // namespace mev
