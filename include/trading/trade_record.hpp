// Immutable record of one executed trade
#pragma once

#include <cstdint>
#include <string>

#include "pools/pool_state.hpp"

namespace mev {
namespace trading {

struct TradeRecord {
    uint64_t tx_id{0};
    std::string trader;
    uint64_t amount_in{0};
    pools::Direction direction{pools::Direction::a_to_b};
    uint64_t expected_out{0};
    uint64_t actual_out{0};
    uint64_t loss{0};               // max(0, expected_out - actual_out)
    uint64_t fee_paid{0};
    uint64_t price_impact_bps{0};
    bool was_attacked{false};
    uint64_t slot{0};

    double loss_pct() const {
        if (expected_out == 0) return 0.0;
        return static_cast<double>(loss) / static_cast<double>(expected_out) * 100.0;
    }
};

} // namespace trading
} // namespace mev
