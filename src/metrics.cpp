// Metrics for the sandwich vs commit-reveal comparison - implementation

#include "harness/metrics.hpp"

#include <algorithm>
#include <cmath>

#include "core/numeric_types.hpp"
#include "harness/config.hpp"
#include "harness/orchestrator.hpp"

namespace mev {
namespace harness {

SimulationSummary compute_summary(uint64_t total_transactions,
                                  const std::vector<trading::TradeRecord>& unprotected,
                                  const std::vector<trading::TradeRecord>& protected_trades,
                                  const std::vector<trading::SandwichOutcome>& sandwiches) {
    SimulationSummary s{};
    s.total_transactions = total_transactions;
    s.unprotected_trades = unprotected.size();
    s.protected_trades = protected_trades.size();

    s.attack_attempts = sandwiches.size();
    int128_t mev = 0;
    for (const auto& sw : sandwiches) {
        if (sw.success) ++s.successful_attacks;
        mev += sw.profit;
        s.total_victim_losses = saturating_add(s.total_victim_losses, sw.victim_loss);
    }
    s.total_mev_extracted = NumTraits<int128_t>::to_i64_saturating(mev);
    s.attack_success_rate = s.attack_attempts > 0
        ? static_cast<double>(s.successful_attacks) / static_cast<double>(s.attack_attempts) * 100.0
        : 0.0;
    s.avg_loss_per_attack = s.successful_attacks > 0
        ? static_cast<double>(s.total_victim_losses) / static_cast<double>(s.successful_attacks)
        : 0.0;
    // What commit-reveal users did not hand to the attacker
    s.total_protected_savings = s.total_victim_losses;

    for (const auto& t : unprotected) {
        s.total_volume = saturating_add(s.total_volume, t.amount_in);
        s.unprotected_total_loss = saturating_add(s.unprotected_total_loss, t.loss);
        if (t.was_attacked) ++s.attacked_transactions;
    }
    s.avg_trade_amount = s.unprotected_trades > 0
        ? static_cast<double>(s.total_volume) / static_cast<double>(s.unprotected_trades)
        : 0.0;

    for (const auto& t : protected_trades) {
        s.protected_total_loss = saturating_add(s.protected_total_loss, t.loss);
    }
    s.savings = saturating_sub(s.unprotected_total_loss, s.protected_total_loss);
    s.savings_pct = s.unprotected_total_loss > 0
        ? static_cast<double>(s.savings) / static_cast<double>(s.unprotected_total_loss) * 100.0
        : 0.0;
    return s;
}

std::vector<CumulativePoint> cumulative_mev(const SimulationResults& r) {
    std::vector<CumulativePoint> out;
    out.reserve(r.sandwiches.size());
    int128_t acc = 0;
    for (size_t i = 0; i < r.sandwiches.size(); ++i) {
        acc += r.sandwiches[i].profit;
        out.push_back({i, NumTraits<int128_t>::to_i64_saturating(acc)});
    }
    return out;
}

std::vector<CumulativePoint> cumulative_losses(const SimulationResults& r) {
    std::vector<CumulativePoint> out;
    out.reserve(r.sandwiches.size());
    uint64_t acc = 0;
    for (size_t i = 0; i < r.sandwiches.size(); ++i) {
        acc = saturating_add(acc, r.sandwiches[i].victim_loss);
        out.push_back({i, signed_diff(acc, 0)});
    }
    return out;
}

namespace {

constexpr size_t N_BUCKETS = 10;

// Equal-width histogram; zero width puts everything in the first bucket
std::vector<HistogramBucket> bucketize(const std::vector<double>& xs, bool collapse_if_flat) {
    std::vector<HistogramBucket> buckets;
    if (xs.empty()) return buckets;

    const auto mm = std::minmax_element(xs.begin(), xs.end());
    const double lo = *mm.first;
    const double hi = *mm.second;
    const double width = (hi - lo) / static_cast<double>(N_BUCKETS);

    if (width == 0.0 && collapse_if_flat) {
        buckets.push_back({lo, hi, static_cast<uint64_t>(xs.size())});
        return buckets;
    }

    buckets.resize(N_BUCKETS);
    for (size_t i = 0; i < N_BUCKETS; ++i) {
        buckets[i].range_start = lo + static_cast<double>(i) * width;
        buckets[i].range_end = buckets[i].range_start + width;
    }
    for (double x : xs) {
        size_t idx = 0;
        if (width > 0.0) {
            idx = static_cast<size_t>(std::floor((x - lo) / width));
        }
        buckets[std::min(idx, N_BUCKETS - 1)].count += 1;
    }
    return buckets;
}

double to_sol(double lamports) { return lamports / static_cast<double>(LAMPORTS_PER_SOL); }

} // namespace

std::vector<HistogramBucket> loss_distribution(const SimulationResults& r) {
    std::vector<double> losses;
    for (const auto& sw : r.sandwiches) {
        if (sw.victim_loss > 0) losses.push_back(to_sol(static_cast<double>(sw.victim_loss)));
    }
    return bucketize(losses, false);
}

std::vector<HistogramBucket> profit_distribution(const SimulationResults& r) {
    std::vector<double> profits;
    profits.reserve(r.sandwiches.size());
    for (const auto& sw : r.sandwiches) {
        profits.push_back(to_sol(static_cast<double>(sw.profit)));
    }
    return bucketize(profits, true);
}

std::vector<PricePoint> price_series(const SimulationResults& r) {
    std::vector<PricePoint> out;
    for (const auto& snap : r.pool_history) {
        if (snap.scenario == Scenario::unprotected) {
            out.push_back({snap.tx_id, snap.price_a_in_b});
        }
    }
    return out;
}

} // namespace harness
} // namespace mev
