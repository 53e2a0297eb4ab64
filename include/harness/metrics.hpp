// Metrics for the sandwich vs commit-reveal comparison
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "trading/sandwich.hpp"
#include "trading/trade_record.hpp"

namespace mev {
namespace harness {

struct SimulationResults;

// Aggregate counters; always rebuilt from the full record collections
struct SimulationSummary {
    uint64_t total_transactions{0};
    uint64_t unprotected_trades{0};
    uint64_t protected_trades{0};

    // Attack side
    uint64_t attack_attempts{0};
    uint64_t successful_attacks{0};
    double attack_success_rate{0.0};        // %
    int64_t total_mev_extracted{0};
    uint64_t total_victim_losses{0};
    double avg_loss_per_attack{0.0};        // per successful attack
    uint64_t total_protected_savings{0};

    // Volume (unprotected branch)
    uint64_t total_volume{0};
    double avg_trade_amount{0.0};

    // Unprotected vs protected
    uint64_t unprotected_total_loss{0};
    uint64_t protected_total_loss{0};
    uint64_t savings{0};
    double savings_pct{0.0};
    uint64_t attacked_transactions{0};
};

SimulationSummary compute_summary(uint64_t total_transactions,
                                  const std::vector<trading::TradeRecord>& unprotected,
                                  const std::vector<trading::TradeRecord>& protected_trades,
                                  const std::vector<trading::SandwichOutcome>& sandwiches);

// Running sum per sandwich attempt
struct CumulativePoint {
    uint64_t index{0};
    int64_t value{0};
};

struct HistogramBucket {
    double range_start{0.0};
    double range_end{0.0};
    uint64_t count{0};
};

struct PricePoint {
    uint64_t tx_id{0};
    double price{0.0};
};

std::vector<CumulativePoint> cumulative_mev(const SimulationResults& r);
std::vector<CumulativePoint> cumulative_losses(const SimulationResults& r);

// 10 equal-width buckets over the non-zero victim losses (SOL units)
std::vector<HistogramBucket> loss_distribution(const SimulationResults& r);

// 10 equal-width buckets over all attempt profits (SOL units);
// a single bucket when every profit is the same
std::vector<HistogramBucket> profit_distribution(const SimulationResults& r);

// price_a_in_b of the unprotected snapshots
std::vector<PricePoint> price_series(const SimulationResults& r);

} // namespace harness
} // namespace mev
