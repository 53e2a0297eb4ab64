// Swap intent payload and its SHA-256 commitment
// Wire layout (little-endian, no padding):
//   [0..8)   amount_in
//   [8..16)  min_out
//   [16..18) slippage_tolerance_bps
//   [18..50) nonce
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace mev {
namespace commit {

constexpr size_t SWAP_INTENT_SIZE = 50;
constexpr size_t NONCE_SIZE = 32;

using Hash32 = std::array<uint8_t, 32>;
using Nonce = std::array<uint8_t, NONCE_SIZE>;
using IntentBytes = std::array<uint8_t, SWAP_INTENT_SIZE>;

struct SwapIntent {
    uint64_t amount_in{0};
    uint64_t min_out{0};
    uint16_t slippage_tolerance_bps{0};
    Nonce nonce{};

    bool operator==(const SwapIntent& o) const {
        return amount_in == o.amount_in && min_out == o.min_out &&
               slippage_tolerance_bps == o.slippage_tolerance_bps && nonce == o.nonce;
    }
    bool operator!=(const SwapIntent& o) const { return !(*this == o); }
};

IntentBytes serialize(const SwapIntent& intent);

// nullopt unless len == SWAP_INTENT_SIZE
std::optional<SwapIntent> deserialize(const uint8_t* data, size_t len);

// SHA-256 over serialize(intent). Throws std::runtime_error if the digest backend fails.
Hash32 hash_intent(const SwapIntent& intent);

// Recompute and compare in constant time
bool verify(const SwapIntent& intent, const Hash32& expected);

// 32 bytes from the OS CSPRNG. Throws std::runtime_error on RNG failure.
Nonce generate_nonce();

// Intent with a fresh nonce
SwapIntent make_intent(uint64_t amount_in, uint64_t min_out, uint16_t slippage_bps);

} // namespace commit
} // namespace mev
