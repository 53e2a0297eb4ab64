// Constant-product pool state (plain value type)
// Snapshot and restore are ordinary copies; nothing in here is shared by pointer.
#pragma once

#include <cstdint>
#include <string>

#include "core/numeric_types.hpp"

namespace mev {
namespace pools {

enum class Direction : uint8_t {
    a_to_b,
    b_to_a,
};

inline Direction opposite(Direction d) {
    return d == Direction::a_to_b ? Direction::b_to_a : Direction::a_to_b;
}

inline const char* direction_name(Direction d) {
    return d == Direction::a_to_b ? "A->B" : "B->A";
}

struct PoolState {
    uint64_t reserve_a{0};
    uint64_t reserve_b{0};
    uint16_t fee_bps{0};    // 30 = 0.3%

    PoolState() = default;
    PoolState(uint64_t a, uint64_t b, uint16_t fee) : reserve_a(a), reserve_b(b), fee_bps(fee) {}

    // Constant product k = reserve_a * reserve_b
    uint128_t k() const { return uint128_t(reserve_a) * uint128_t(reserve_b); }

    // Reporting-only spot prices; never fed back into settlement
    double price_a_in_b() const {
        return reserve_a == 0 ? 0.0 : static_cast<double>(reserve_b) / static_cast<double>(reserve_a);
    }
    double price_b_in_a() const {
        return reserve_b == 0 ? 0.0 : static_cast<double>(reserve_a) / static_cast<double>(reserve_b);
    }

    uint64_t reserve_in(Direction d) const { return d == Direction::a_to_b ? reserve_a : reserve_b; }
    uint64_t reserve_out(Direction d) const { return d == Direction::a_to_b ? reserve_b : reserve_a; }

    bool operator==(const PoolState& o) const {
        return reserve_a == o.reserve_a && reserve_b == o.reserve_b && fee_bps == o.fee_bps;
    }
    bool operator!=(const PoolState& o) const { return !(*this == o); }
};

// Result of a swap computation (derived, immutable)
struct SwapOutcome {
    uint64_t amount_out{0};
    uint64_t fee_charged{0};        // in input tokens
    uint64_t price_impact_bps{0};
};

} // namespace pools
} // namespace mev
