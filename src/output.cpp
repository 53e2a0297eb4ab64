// JSON config loading and results writer - implementation

#include "harness/output.hpp"

#include <fstream>
#include <stdexcept>
#include <type_traits>
#include <variant>

#include "core/common.hpp"
#include "core/json_utils.hpp"
#include "harness/metrics.hpp"

namespace mev {
namespace harness {

// ============================================================================
// Configuration
// ============================================================================

SimulationConfig config_from_json(const json::object& root, SimulationConfig cfg) {
    const json::object& o = (root.contains("simulation") && root.at("simulation").is_object())
        ? root.at("simulation").as_object()
        : root;

    cfg.total_transactions = get_u64_opt(o, "total_transactions", cfg.total_transactions);
    cfg.attack_probability = get_real_opt(o, "attack_probability", cfg.attack_probability);
    cfg.min_swap = get_u64_opt(o, "min_swap", cfg.min_swap);
    cfg.max_swap = get_u64_opt(o, "max_swap", cfg.max_swap);
    cfg.pool_reserve_a = get_u64_opt(o, "pool_reserve_a", cfg.pool_reserve_a);
    cfg.pool_reserve_b = get_u64_opt(o, "pool_reserve_b", cfg.pool_reserve_b);
    cfg.fee_bps = get_u16_opt(o, "fee_bps", cfg.fee_bps);
    cfg.attacker_capital = get_u64_opt(o, "attacker_capital", cfg.attacker_capital);
    cfg.num_traders = static_cast<size_t>(get_u64_opt(o, "num_traders", cfg.num_traders));
    cfg.trader_balance_a = get_u64_opt(o, "trader_balance_a", cfg.trader_balance_a);
    cfg.trader_balance_b = get_u64_opt(o, "trader_balance_b", cfg.trader_balance_b);
    cfg.protected_slippage_bps = get_u16_opt(o, "protected_slippage_bps", cfg.protected_slippage_bps);
    cfg.seed = get_u64_opt(o, "seed", cfg.seed);
    cfg.save_actions = get_bool_opt(o, "save_actions", cfg.save_actions);

    // Optimizer (optional nested object)
    if (auto* f = o.if_contains("frontrun")) {
        if (!f->is_object()) {
            throw std::runtime_error("expected object for key: frontrun");
        }
        const auto& fo = f->as_object();
        cfg.frontrun.victim_divisor = get_u64_opt(fo, "victim_divisor", cfg.frontrun.victim_divisor);
        cfg.frontrun.reserve_divisor = get_u64_opt(fo, "reserve_divisor", cfg.frontrun.reserve_divisor);
        const std::string strategy = get_str_opt(fo, "strategy", trading::strategy_name(cfg.frontrun.strategy));
        if (strategy == "heuristic") {
            cfg.frontrun.strategy = trading::FrontrunStrategy::heuristic;
        } else if (strategy == "search") {
            cfg.frontrun.strategy = trading::FrontrunStrategy::search;
        } else {
            throw std::runtime_error("unknown frontrun strategy: " + strategy);
        }
    }
    return cfg;
}

SimulationConfig load_config(const std::string& path, SimulationConfig base) {
    const std::string s = read_file(path);
    json::error_code ec;
    json::value root = json::parse(s, ec);
    if (ec) {
        throw std::runtime_error("Invalid config json " + path + ": " + ec.message());
    }
    if (!root.is_object()) {
        throw std::runtime_error("Invalid config json root type: " + path);
    }
    return config_from_json(root.as_object(), std::move(base));
}

json::object config_to_json(const SimulationConfig& cfg) {
    json::object o;
    o["total_transactions"] = cfg.total_transactions;
    o["attack_probability"] = cfg.attack_probability;
    o["min_swap"] = cfg.min_swap;
    o["max_swap"] = cfg.max_swap;
    o["pool_reserve_a"] = cfg.pool_reserve_a;
    o["pool_reserve_b"] = cfg.pool_reserve_b;
    o["fee_bps"] = cfg.fee_bps;
    o["attacker_capital"] = cfg.attacker_capital;
    o["num_traders"] = static_cast<uint64_t>(cfg.num_traders);
    o["trader_balance_a"] = cfg.trader_balance_a;
    o["trader_balance_b"] = cfg.trader_balance_b;
    o["protected_slippage_bps"] = cfg.protected_slippage_bps;
    o["seed"] = cfg.seed;
    o["save_actions"] = cfg.save_actions;

    json::object f;
    f["strategy"] = trading::strategy_name(cfg.frontrun.strategy);
    f["victim_divisor"] = cfg.frontrun.victim_divisor;
    f["reserve_divisor"] = cfg.frontrun.reserve_divisor;
    o["frontrun"] = f;
    return o;
}

// ============================================================================
// Actions
// ============================================================================

namespace {

json::array reserves_json(const std::array<uint64_t, 2>& r) {
    return json::array{r[0], r[1]};
}

void put_reserves(json::object& o, const ReserveDelta& d) {
    o["reserves_before"] = reserves_json(d.before);
    o["reserves_after"] = reserves_json(d.after);
}

json::object to_json(const FrontrunAction& a) {
    json::object o;
    o["type"] = "frontrun";
    o["tx_id"] = a.tx_id;
    o["slot"] = a.slot;
    o["direction"] = pools::direction_name(a.direction);
    o["amount_in"] = a.amount_in;
    o["amount_out"] = a.amount_out;
    put_reserves(o, a.reserves);
    return o;
}

json::object to_json(const VictimSwapAction& a) {
    json::object o;
    o["type"] = "victim_swap";
    o["tx_id"] = a.tx_id;
    o["slot"] = a.slot;
    o["trader"] = a.trader;
    o["direction"] = pools::direction_name(a.direction);
    o["amount_in"] = a.amount_in;
    o["expected_out"] = a.expected_out;
    o["amount_out"] = a.amount_out;
    o["loss"] = a.loss;
    put_reserves(o, a.reserves);
    return o;
}

json::object to_json(const BackrunAction& a) {
    json::object o;
    o["type"] = "backrun";
    o["tx_id"] = a.tx_id;
    o["slot"] = a.slot;
    o["direction"] = pools::direction_name(a.direction);
    o["amount_in"] = a.amount_in;
    o["amount_out"] = a.amount_out;
    o["profit"] = a.profit;
    put_reserves(o, a.reserves);
    return o;
}

json::object to_json(const DirectSwapAction& a) {
    json::object o;
    o["type"] = "swap";
    o["tx_id"] = a.tx_id;
    o["slot"] = a.slot;
    o["trader"] = a.trader;
    o["direction"] = pools::direction_name(a.direction);
    o["amount_in"] = a.amount_in;
    o["amount_out"] = a.amount_out;
    o["fee"] = a.fee;
    put_reserves(o, a.reserves);
    return o;
}

json::object to_json(const CommitAction& a) {
    json::object o;
    o["type"] = "commit";
    o["tx_id"] = a.tx_id;
    o["slot"] = a.slot;
    o["trader"] = a.trader;
    o["hash"] = to_hex(a.hash);
    o["min_out"] = a.min_out;
    o["reserves"] = reserves_json(a.reserves);
    return o;
}

json::object to_json(const RevealAction& a) {
    json::object o;
    o["type"] = "reveal";
    o["tx_id"] = a.tx_id;
    o["slot"] = a.slot;
    o["trader"] = a.trader;
    o["status"] = a.status;
    o["hash"] = to_hex(a.hash);
    o["slots_waited"] = a.slots_waited;
    o["amount_in"] = a.amount_in;
    o["amount_out"] = a.amount_out;
    put_reserves(o, a.reserves);
    return o;
}

json::object to_json(const SkipAction& a) {
    json::object o;
    o["type"] = "skip";
    o["tx_id"] = a.tx_id;
    o["slot"] = a.slot;
    o["victim"] = a.victim;
    o["amount_in"] = a.amount_in;
    o["reason"] = a.reason;
    return o;
}

json::object trade_json(const trading::TradeRecord& t) {
    json::object o;
    o["tx_id"] = t.tx_id;
    o["trader"] = t.trader;
    o["amount_in"] = t.amount_in;
    o["direction"] = pools::direction_name(t.direction);
    o["expected_out"] = t.expected_out;
    o["actual_out"] = t.actual_out;
    o["loss"] = t.loss;
    o["loss_pct"] = t.loss_pct();
    o["fee_paid"] = t.fee_paid;
    o["price_impact_bps"] = t.price_impact_bps;
    o["was_attacked"] = t.was_attacked;
    o["slot"] = t.slot;
    return o;
}

json::object sandwich_json(const trading::SandwichOutcome& s) {
    json::object o;
    o["tx_id"] = s.tx_id;
    o["slot"] = s.slot;
    o["victim"] = s.victim;
    o["executed"] = s.executed;
    o["success"] = s.success;
    o["frontrun_amount"] = s.frontrun_amount;
    o["frontrun_output"] = s.frontrun_output;
    o["backrun_input"] = s.backrun_input;
    o["backrun_output"] = s.backrun_output;
    o["profit"] = s.profit;
    o["victim_expected"] = s.victim_expected;
    o["victim_actual"] = s.victim_actual;
    o["victim_loss"] = s.victim_loss;
    o["victim_fee"] = s.victim_fee;
    o["victim_price_impact_bps"] = s.victim_price_impact_bps;
    return o;
}

json::object pool_json(const pools::PoolState& p) {
    json::object o;
    o["reserve_a"] = p.reserve_a;
    o["reserve_b"] = p.reserve_b;
    o["fee_bps"] = p.fee_bps;
    o["price_a_in_b"] = p.price_a_in_b();
    o["k"] = p.k().str();
    return o;
}

json::object attacker_json(const trading::AttackerStats& a) {
    json::object o;
    o["attempts"] = a.attempts;
    o["executed"] = a.executed;
    o["successful"] = a.successful;
    o["skipped"] = a.skipped;
    o["total_profit"] = a.total_profit;
    o["total_victim_loss"] = a.total_victim_loss;
    return o;
}

json::array histogram_json(const std::vector<HistogramBucket>& buckets) {
    json::array arr;
    arr.reserve(buckets.size());
    for (const auto& b : buckets) {
        json::object o;
        o["range_start"] = b.range_start;
        o["range_end"] = b.range_end;
        o["count"] = b.count;
        arr.push_back(std::move(o));
    }
    return arr;
}

json::array cumulative_json(const std::vector<CumulativePoint>& pts) {
    json::array arr;
    arr.reserve(pts.size());
    for (const auto& p : pts) {
        arr.push_back(json::array{p.index, p.value});
    }
    return arr;
}

json::object analytics_json(const SimulationResults& r) {
    json::object o;
    o["cumulative_mev"] = cumulative_json(cumulative_mev(r));
    o["cumulative_losses"] = cumulative_json(cumulative_losses(r));
    o["loss_distribution"] = histogram_json(loss_distribution(r));
    o["profit_distribution"] = histogram_json(profit_distribution(r));

    json::array prices;
    for (const auto& p : price_series(r)) {
        prices.push_back(json::array{p.tx_id, p.price});
    }
    o["price_series"] = prices;
    return o;
}

} // namespace

json::object action_to_json(const Action& action) {
    return std::visit([](const auto& a) { return to_json(a); }, action);
}

json::array actions_to_json(const std::vector<Action>& actions) {
    json::array arr;
    arr.reserve(actions.size());
    for (const auto& a : actions) {
        arr.push_back(action_to_json(a));
    }
    return arr;
}

// ============================================================================
// Results
// ============================================================================

json::object summary_to_json(const SimulationSummary& s) {
    json::object o;
    o["total_transactions"] = s.total_transactions;
    o["unprotected_trades"] = s.unprotected_trades;
    o["protected_trades"] = s.protected_trades;
    o["attack_attempts"] = s.attack_attempts;
    o["successful_attacks"] = s.successful_attacks;
    o["attack_success_rate"] = s.attack_success_rate;
    o["total_mev_extracted"] = s.total_mev_extracted;
    o["total_victim_losses"] = s.total_victim_losses;
    o["avg_loss_per_attack"] = s.avg_loss_per_attack;
    o["total_protected_savings"] = s.total_protected_savings;
    o["total_volume"] = s.total_volume;
    o["avg_trade_amount"] = s.avg_trade_amount;
    o["unprotected_total_loss"] = s.unprotected_total_loss;
    o["protected_total_loss"] = s.protected_total_loss;
    o["savings"] = s.savings;
    o["savings_pct"] = s.savings_pct;
    o["attacked_transactions"] = s.attacked_transactions;
    return o;
}

json::object run_to_json(const RunResult& r) {
    json::object run;
    run["seed"] = r.seed;
    run["success"] = r.success;
    run["elapsed_ms"] = r.elapsed_ms;
    if (!r.success) {
        run["error"] = r.error_msg;
        return run;
    }

    const SimulationResults& res = r.results;
    run["config"] = config_to_json(res.config);
    run["summary"] = summary_to_json(res.summary);
    run["analytics"] = analytics_json(res);
    run["final_pool"] = pool_json(res.final_pool);
    run["attacker"] = attacker_json(res.attacker);

    json::array unprotected;
    unprotected.reserve(res.unprotected_trades.size());
    for (const auto& t : res.unprotected_trades) unprotected.push_back(trade_json(t));
    run["unprotected_trades"] = std::move(unprotected);

    json::array protected_arr;
    protected_arr.reserve(res.protected_trades.size());
    for (const auto& t : res.protected_trades) protected_arr.push_back(trade_json(t));
    run["protected_trades"] = std::move(protected_arr);

    json::array sandwiches;
    sandwiches.reserve(res.sandwiches.size());
    for (const auto& s : res.sandwiches) sandwiches.push_back(sandwich_json(s));
    run["sandwiches"] = std::move(sandwiches);

    json::array history;
    history.reserve(res.pool_history.size());
    for (const auto& h : res.pool_history) {
        json::object o;
        o["tx_id"] = h.tx_id;
        o["reserve_a"] = h.reserve_a;
        o["reserve_b"] = h.reserve_b;
        o["price_a_in_b"] = h.price_a_in_b;
        o["scenario"] = scenario_name(h.scenario);
        history.push_back(std::move(o));
    }
    run["pool_history"] = std::move(history);

    // Actions array (only if save_actions was enabled and we have actions)
    if (!res.actions.empty()) {
        run["actions"] = actions_to_json(res.actions);
    }
    return run;
}

json::object build_output_json(const std::vector<RunResult>& runs, const OutputMeta& meta) {
    json::object m;
    m["config_file"] = meta.config_path;
    m["runs"] = static_cast<uint64_t>(runs.size());
    m["threads"] = static_cast<uint64_t>(meta.threads);
    m["exec_ms"] = meta.exec_ms;

    json::array arr;
    arr.reserve(runs.size());
    for (const auto& r : runs) {
        arr.push_back(run_to_json(r));
    }

    json::object O;
    O["metadata"] = m;
    O["runs"] = arr;
    return O;
}

bool write_results_json(const std::string& output_path, const std::vector<RunResult>& runs,
                        const OutputMeta& meta) {
    auto O = build_output_json(runs, meta);

    std::ofstream of(output_path);
    if (!of) {
        return false;
    }

    of << json::serialize(O) << '\n';
    return of.good();
}

} // namespace harness
} // namespace mev
