// Commitment lifecycle: None -> Committed -> {Revealed | Cancelled}
#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "commit/swap_intent.hpp"
#include "pools/pool_state.hpp"

namespace mev {
namespace commit {

// Reveal must happen at least this many slots after commit
constexpr uint64_t MIN_REVEAL_DELAY_SLOTS = 1;

// Upper bound on slippage tolerance accepted at commit (10%)
constexpr uint16_t MAX_SLIPPAGE_BPS = 1000;

struct NoCommitment {};

struct Committed {
    std::string owner;
    Hash32 hash{};
    SwapIntent intent{};
    pools::Direction direction{pools::Direction::a_to_b};
    uint64_t created_at{0};     // slot
};

struct Revealed {
    Hash32 hash{};
    uint64_t created_at{0};
    uint64_t revealed_at{0};
};

struct Cancelled {
    Hash32 hash{};
    uint64_t created_at{0};
};

using CommitmentState = std::variant<NoCommitment, Committed, Revealed, Cancelled>;

inline bool is_live(const CommitmentState& s) {
    return std::holds_alternative<Committed>(s);
}

inline const char* state_name(const CommitmentState& s) {
    switch (s.index()) {
        case 0: return "none";
        case 1: return "committed";
        case 2: return "revealed";
        default: return "cancelled";
    }
}

} // namespace commit
} // namespace mev
