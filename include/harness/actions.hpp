// Action recording for --save-actions mode
#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "commit/swap_intent.hpp"
#include "pools/pool_state.hpp"

namespace mev {
namespace harness {

// Reserves before/after, common to every pool-touching action
struct ReserveDelta {
    std::array<uint64_t, 2> before{0, 0};
    std::array<uint64_t, 2> after{0, 0};
};

// Attacker leg 1: buy ahead of the victim
struct FrontrunAction {
    uint64_t tx_id{0};
    uint64_t slot{0};
    pools::Direction direction{pools::Direction::a_to_b};
    uint64_t amount_in{0};
    uint64_t amount_out{0};
    ReserveDelta reserves{};
};

// Victim swap executed between the two attacker legs
struct VictimSwapAction {
    uint64_t tx_id{0};
    uint64_t slot{0};
    std::string trader;
    pools::Direction direction{pools::Direction::a_to_b};
    uint64_t amount_in{0};
    uint64_t expected_out{0};
    uint64_t amount_out{0};
    uint64_t loss{0};
    ReserveDelta reserves{};
};

// Attacker leg 3: sell back what the front-run bought
struct BackrunAction {
    uint64_t tx_id{0};
    uint64_t slot{0};
    pools::Direction direction{pools::Direction::b_to_a};
    uint64_t amount_in{0};
    uint64_t amount_out{0};
    int64_t profit{0};
    ReserveDelta reserves{};
};

// Unattacked swap (unprotected branch)
struct DirectSwapAction {
    uint64_t tx_id{0};
    uint64_t slot{0};
    std::string trader;
    pools::Direction direction{pools::Direction::a_to_b};
    uint64_t amount_in{0};
    uint64_t amount_out{0};
    uint64_t fee{0};
    ReserveDelta reserves{};
};

// Commitment posted; pool untouched
struct CommitAction {
    uint64_t tx_id{0};
    uint64_t slot{0};
    std::string trader;
    commit::Hash32 hash{};
    uint64_t min_out{0};
    std::array<uint64_t, 2> reserves{0, 0};
};

struct RevealAction {
    uint64_t tx_id{0};
    uint64_t slot{0};
    std::string trader;
    std::string status;
    commit::Hash32 hash{};
    uint64_t slots_waited{0};
    uint64_t amount_in{0};
    uint64_t amount_out{0};
    ReserveDelta reserves{};
};

// Attack roll hit but the attacker passed
struct SkipAction {
    uint64_t tx_id{0};
    uint64_t slot{0};
    std::string victim;
    uint64_t amount_in{0};
    std::string reason;
};

// Variant for all action types
using Action = std::variant<FrontrunAction, VictimSwapAction, BackrunAction, DirectSwapAction,
                            CommitAction, RevealAction, SkipAction>;

inline std::array<uint64_t, 2> reserves_of(const pools::PoolState& p) {
    return {p.reserve_a, p.reserve_b};
}

} // namespace harness
} // namespace mev
