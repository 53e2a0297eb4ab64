#include <catch2/catch.hpp>

#include <cstdint>
#include <stdexcept>
#include <variant>
#include <vector>

#include "harness/config.hpp"
#include "harness/orchestrator.hpp"
#include "harness/runner.hpp"
#include "pools/cpmm_math.hpp"

using mev::harness::Orchestrator;
using mev::harness::Scenario;
using mev::harness::SimulationConfig;
using mev::harness::SimulationResults;
using mev::pools::PoolState;

namespace {

SimulationConfig small_config(uint64_t n = 50) {
    SimulationConfig cfg{};
    cfg.total_transactions = n;
    cfg.verbose = false;
    return cfg;
}

bool same_snapshot(const mev::harness::PoolSnapshot& a, const mev::harness::PoolSnapshot& b) {
    return a.reserve_a == b.reserve_a && a.reserve_b == b.reserve_b;
}

} // namespace

TEST_CASE("Pool history interleaves both scenarios", "[orchestrator]") {
    const auto r = mev::harness::run_simulation(small_config(40));

    REQUIRE(r.pool_history.size() == 80);
    for (size_t i = 0; i < r.pool_history.size(); ++i) {
        const auto& snap = r.pool_history[i];
        REQUIRE(snap.tx_id == i / 2);
        REQUIRE(snap.scenario == (i % 2 == 0 ? Scenario::unprotected : Scenario::commit_reveal));
    }
    REQUIRE(r.summary.total_transactions == 40);

    SECTION("Final pool is the last unprotected snapshot") {
        const auto& last = r.pool_history[r.pool_history.size() - 2];
        REQUIRE(r.final_pool.reserve_a == last.reserve_a);
        REQUIRE(r.final_pool.reserve_b == last.reserve_b);
    }
}

TEST_CASE("Protected branch forks from the unprotected pre-trade pool", "[orchestrator]") {
    auto cfg = small_config(60);
    cfg.attack_probability = 1.0;
    const auto r = mev::harness::run_simulation(cfg);

    // Every protected trade reproduces its snapshot from the previous
    // unprotected snapshot (or the initial pool for tx 0)
    REQUIRE(r.protected_trades.size() == 60);
    for (const auto& t : r.protected_trades) {
        PoolState start(cfg.pool_reserve_a, cfg.pool_reserve_b, cfg.fee_bps);
        if (t.tx_id > 0) {
            const auto& prev = r.pool_history[2 * (t.tx_id - 1)];
            REQUIRE(prev.scenario == Scenario::unprotected);
            start = PoolState(prev.reserve_a, prev.reserve_b, cfg.fee_bps);
        }
        const auto out = mev::pools::apply(start, t.amount_in, t.direction);
        REQUIRE(out.amount_out == t.actual_out);

        const auto& snap = r.pool_history[2 * t.tx_id + 1];
        REQUIRE(snap.scenario == Scenario::commit_reveal);
        REQUIRE(snap.reserve_a == start.reserve_a);
        REQUIRE(snap.reserve_b == start.reserve_b);
    }
}

TEST_CASE("No attacks means both branches coincide", "[orchestrator]") {
    auto cfg = small_config(80);
    cfg.attack_probability = 0.0;
    const auto r = mev::harness::run_simulation(cfg);

    REQUIRE(r.sandwiches.empty());
    REQUIRE(r.summary.attack_attempts == 0);
    REQUIRE(r.summary.total_mev_extracted == 0);
    REQUIRE(r.summary.unprotected_total_loss == 0);
    REQUIRE(r.summary.protected_total_loss == 0);
    REQUIRE(r.summary.savings_pct == 0.0);
    REQUIRE(r.attacker.attempts == 0);

    for (size_t i = 0; i + 1 < r.pool_history.size(); i += 2) {
        REQUIRE(same_snapshot(r.pool_history[i], r.pool_history[i + 1]));
    }
}

TEST_CASE("Every unprotected trade is attempted when attack probability is one", "[orchestrator]") {
    auto cfg = small_config(100);
    cfg.attack_probability = 1.0;
    const auto r = mev::harness::run_simulation(cfg);

    REQUIRE(r.sandwiches.size() == r.unprotected_trades.size());
    REQUIRE(r.attacker.attempts == r.sandwiches.size());
    REQUIRE(r.attacker.executed + r.attacker.skipped == r.attacker.attempts);
    REQUIRE(r.summary.attacked_transactions == r.attacker.executed);

    for (const auto& t : r.protected_trades) {
        REQUIRE_FALSE(t.was_attacked);
        REQUIRE(t.loss == 0);
    }
    REQUIRE(r.summary.protected_total_loss == 0);

    // With 0.1-5 SOL victims in a 1000 SOL pool some attacks pay off
    REQUIRE(r.summary.successful_attacks > 0);
    REQUIRE(r.summary.total_victim_losses > 0);
    REQUIRE(r.summary.savings == r.summary.unprotected_total_loss);
    REQUIRE(r.summary.savings_pct == Approx(100.0));

    for (const auto& s : r.sandwiches) {
        if (s.success) {
            REQUIRE(s.executed);
            REQUIRE(s.victim_loss > 0);
        }
    }
}

TEST_CASE("Runs are deterministic for a seed", "[orchestrator]") {
    auto cfg = small_config(120);
    const auto a = mev::harness::run_simulation(cfg);
    const auto b = mev::harness::run_simulation(cfg);

    REQUIRE(a.final_pool == b.final_pool);
    REQUIRE(a.summary.total_mev_extracted == b.summary.total_mev_extracted);
    REQUIRE(a.summary.total_victim_losses == b.summary.total_victim_losses);
    REQUIRE(a.unprotected_trades.size() == b.unprotected_trades.size());
    for (size_t i = 0; i < a.unprotected_trades.size(); ++i) {
        REQUIRE(a.unprotected_trades[i].amount_in == b.unprotected_trades[i].amount_in);
        REQUIRE(a.unprotected_trades[i].actual_out == b.unprotected_trades[i].actual_out);
        REQUIRE(a.unprotected_trades[i].trader == b.unprotected_trades[i].trader);
    }

    SECTION("Reusing an orchestrator starts from scratch") {
        Orchestrator orch(cfg);
        const auto first = orch.run();
        const auto second = orch.run();
        REQUIRE(first.final_pool == second.final_pool);
        REQUIRE(first.attacker.total_profit == second.attacker.total_profit);
        REQUIRE(second.final_pool == a.final_pool);
    }

    SECTION("A different seed gives a different run") {
        cfg.seed = 43;
        const auto c = mev::harness::run_simulation(cfg);
        REQUIRE_FALSE(c.final_pool == a.final_pool);
    }
}

TEST_CASE("Draws stay inside the configured swap range", "[orchestrator]") {
    auto cfg = small_config(200);
    cfg.min_swap = mev::harness::LAMPORTS_PER_SOL;
    cfg.max_swap = 2 * mev::harness::LAMPORTS_PER_SOL;
    cfg.num_traders = 3;
    const auto r = mev::harness::run_simulation(cfg);

    for (const auto& t : r.unprotected_trades) {
        REQUIRE(t.amount_in >= cfg.min_swap);
        REQUIRE(t.amount_in <= cfg.max_swap);
        REQUIRE((t.trader == "trader_0" || t.trader == "trader_1" || t.trader == "trader_2"));
    }
    for (const auto& t : r.protected_trades) {
        REQUIRE(t.trader.rfind("protected_", 0) == 0);
    }
}

TEST_CASE("Invalid configurations are rejected up front", "[orchestrator][config]") {
    auto cfg = small_config();

    SECTION("Zero transactions") { cfg.total_transactions = 0; }
    SECTION("Probability above one") { cfg.attack_probability = 1.5; }
    SECTION("Inverted swap range") { cfg.min_swap = cfg.max_swap + 1; }
    SECTION("Zero min swap") { cfg.min_swap = 0; }
    SECTION("Fee above 100%") { cfg.fee_bps = 10001; }
    SECTION("Empty pool") { cfg.pool_reserve_b = 0; }
    SECTION("No traders") { cfg.num_traders = 0; }
    SECTION("Slippage above the commit-reveal cap") { cfg.protected_slippage_bps = 1001; }
    SECTION("Zero divisor") { cfg.frontrun.reserve_divisor = 0; }
    SECTION("Token supply past u64") { cfg.pool_reserve_a = UINT64_MAX - mev::harness::LAMPORTS_PER_SOL; }

    REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    REQUIRE_THROWS_AS(Orchestrator(cfg), std::invalid_argument);

    const auto rr = mev::harness::run_single(cfg);
    REQUIRE_FALSE(rr.success);
    REQUIRE_FALSE(rr.error_msg.empty());
}

TEST_CASE("Token supply bound is exact", "[orchestrator][config]") {
    auto cfg = small_config();
    const uint64_t others = cfg.attacker_capital + cfg.num_traders * cfg.trader_balance_a + cfg.max_swap;
    cfg.pool_reserve_a = UINT64_MAX - others;
    REQUIRE_NOTHROW(cfg.validate());

    cfg.pool_reserve_a += 1;
    REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);

    cfg.pool_reserve_a = SimulationConfig{}.pool_reserve_a;
    cfg.trader_balance_b = UINT64_MAX / 4;
    REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
}

TEST_CASE("Dust pools never record a lossless sandwich", "[orchestrator][dust]") {
    for (uint16_t fee : {uint16_t(26), uint16_t(348), uint16_t(450), uint16_t(2740), uint16_t(7050)}) {
        SimulationConfig cfg = small_config(400);
        cfg.attack_probability = 1.0;
        cfg.pool_reserve_a = 91637;
        cfg.pool_reserve_b = 22652;
        cfg.fee_bps = fee;
        cfg.min_swap = 1;
        cfg.max_swap = 2000;
        cfg.attacker_capital = 100000;
        cfg.num_traders = 4;
        cfg.trader_balance_a = 100000;
        cfg.trader_balance_b = 100000;

        const auto r = mev::harness::run_simulation(cfg);
        for (const auto& s : r.sandwiches) {
            REQUIRE(s.executed == s.success);
            if (s.profit > 0 && s.executed) {
                REQUIRE(s.victim_loss > 0);
            }
        }
        REQUIRE(r.summary.attacked_transactions == r.summary.successful_attacks);
    }
}

TEST_CASE("Action recording", "[orchestrator][actions]") {
    auto cfg = small_config(30);
    cfg.attack_probability = 1.0;

    SECTION("Disabled by default") {
        const auto r = mev::harness::run_simulation(cfg);
        REQUIRE(r.actions.empty());
    }

    SECTION("Enabled records every step") {
        cfg.save_actions = true;
        const auto r = mev::harness::run_simulation(cfg);
        REQUIRE_FALSE(r.actions.empty());

        size_t frontruns = 0, backruns = 0, victims = 0, commits = 0, reveals = 0, direct = 0, skips = 0;
        for (const auto& a : r.actions) {
            if (std::holds_alternative<mev::harness::FrontrunAction>(a)) ++frontruns;
            if (std::holds_alternative<mev::harness::BackrunAction>(a)) ++backruns;
            if (std::holds_alternative<mev::harness::VictimSwapAction>(a)) ++victims;
            if (std::holds_alternative<mev::harness::CommitAction>(a)) ++commits;
            if (std::holds_alternative<mev::harness::RevealAction>(a)) ++reveals;
            if (std::holds_alternative<mev::harness::DirectSwapAction>(a)) ++direct;
            if (std::holds_alternative<mev::harness::SkipAction>(a)) ++skips;
        }
        REQUIRE(frontruns == r.attacker.executed);
        REQUIRE(backruns == frontruns);
        REQUIRE(victims == frontruns);
        REQUIRE(skips == r.attacker.skipped);
        REQUIRE(direct + victims == r.unprotected_trades.size());
        REQUIRE(commits == 30);
        REQUIRE(reveals == commits);

        // Backrun leg lands on the unprotected snapshot of its transaction
        for (const auto& a : r.actions) {
            if (const auto* br = std::get_if<mev::harness::BackrunAction>(&a)) {
                const auto& snap = r.pool_history[2 * br->tx_id];
                REQUIRE(br->reserves.after[0] == snap.reserve_a);
                REQUIRE(br->reserves.after[1] == snap.reserve_b);
            }
        }
    }
}

TEST_CASE("Parallel batch matches sequential runs", "[runner]") {
    auto base = small_config(60);
    const auto cfgs = mev::harness::seed_sweep(base, 4);
    REQUIRE(cfgs.size() == 4);
    REQUIRE(cfgs[0].seed == 42);
    REQUIRE(cfgs[3].seed == 45);

    const auto batch = mev::harness::run_batch_parallel(cfgs, 3, false);
    REQUIRE(batch.size() == 4);
    for (size_t i = 0; i < cfgs.size(); ++i) {
        const auto single = mev::harness::run_single(cfgs[i]);
        REQUIRE(batch[i].success);
        REQUIRE(batch[i].seed == cfgs[i].seed);
        REQUIRE(batch[i].results.final_pool == single.results.final_pool);
        REQUIRE(batch[i].results.summary.total_mev_extracted == single.results.summary.total_mev_extracted);
    }

    REQUIRE(mev::harness::run_batch_parallel({}, 2, false).empty());
}
