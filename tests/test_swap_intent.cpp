#include <catch2/catch.hpp>

#include <cstdint>
#include <limits>
#include <set>

#include "commit/commitment.hpp"
#include "commit/swap_intent.hpp"
#include "core/common.hpp"

using mev::commit::Hash32;
using mev::commit::SwapIntent;

namespace {
SwapIntent sample_intent() {
    SwapIntent intent{};
    intent.amount_in = 1000000000ULL;
    intent.min_out = 900000000ULL;
    intent.slippage_tolerance_bps = 100;
    intent.nonce.fill(42);
    return intent;
}
}

TEST_CASE("Intent serialization layout", "[commit]") {
    const SwapIntent intent = sample_intent();
    const auto bytes = mev::commit::serialize(intent);

    REQUIRE(bytes.size() == 50);
    // amount_in, min_out, slippage: little-endian, no padding
    REQUIRE(mev::to_hex(bytes, 20) == "00ca9a3b0000000000e9a4350000000064002a2a");
    for (size_t i = 18; i < 50; ++i) {
        REQUIRE(bytes[i] == 42);
    }

    SECTION("Round trip") {
        const auto back = mev::commit::deserialize(bytes.data(), bytes.size());
        REQUIRE(back.has_value());
        REQUIRE(*back == intent);
    }

    SECTION("Extreme values round trip") {
        SwapIntent max_intent{};
        max_intent.amount_in = std::numeric_limits<uint64_t>::max();
        max_intent.min_out = 1;
        max_intent.slippage_tolerance_bps = std::numeric_limits<uint16_t>::max();
        for (size_t i = 0; i < max_intent.nonce.size(); ++i) {
            max_intent.nonce[i] = static_cast<uint8_t>(255 - i);
        }
        const auto b = mev::commit::serialize(max_intent);
        const auto back = mev::commit::deserialize(b.data(), b.size());
        REQUIRE(back.has_value());
        REQUIRE(*back == max_intent);
    }

    SECTION("Wrong length is rejected") {
        REQUIRE_FALSE(mev::commit::deserialize(bytes.data(), 49).has_value());
        REQUIRE_FALSE(mev::commit::deserialize(bytes.data(), 0).has_value());
        REQUIRE_FALSE(mev::commit::deserialize(nullptr, 50).has_value());
    }
}

TEST_CASE("Intent hashing", "[commit]") {
    SECTION("Known SHA-256 vectors") {
        REQUIRE(mev::to_hex(mev::commit::hash_intent(sample_intent())) ==
                "5d46ed19c80e630c52d1c3e0a2ef88ead99c91ef858e3622646ca0c015fac5da");
        REQUIRE(mev::to_hex(mev::commit::hash_intent(SwapIntent{})) ==
                "cc2786e1f9910a9d811400edcddaf7075195f7a16b216dcbefba3bc7c4f2ae51");
    }

    SECTION("Verify accepts the exact payload only") {
        const SwapIntent intent = sample_intent();
        const Hash32 h = mev::commit::hash_intent(intent);
        REQUIRE(mev::commit::verify(intent, h));

        SwapIntent tampered = intent;
        tampered.amount_in += 1;
        REQUIRE_FALSE(mev::commit::verify(tampered, h));

        tampered = intent;
        tampered.min_out -= 1;
        REQUIRE_FALSE(mev::commit::verify(tampered, h));

        tampered = intent;
        tampered.slippage_tolerance_bps = 101;
        REQUIRE_FALSE(mev::commit::verify(tampered, h));

        tampered = intent;
        tampered.nonce[31] ^= 1;
        REQUIRE_FALSE(mev::commit::verify(tampered, h));
    }

    SECTION("Fresh nonces make identical trades hash differently") {
        std::set<Hash32> seen;
        for (int i = 0; i < 64; ++i) {
            const auto intent = mev::commit::make_intent(1000000000ULL, 900000000ULL, 100);
            REQUIRE(seen.insert(mev::commit::hash_intent(intent)).second);
        }
    }
}

TEST_CASE("Commitment state helpers", "[commit]") {
    mev::commit::CommitmentState s = mev::commit::NoCommitment{};
    REQUIRE_FALSE(mev::commit::is_live(s));
    REQUIRE(std::string(mev::commit::state_name(s)) == "none");

    s = mev::commit::Committed{};
    REQUIRE(mev::commit::is_live(s));
    REQUIRE(std::string(mev::commit::state_name(s)) == "committed");

    s = mev::commit::Revealed{};
    REQUIRE_FALSE(mev::commit::is_live(s));
    REQUIRE(std::string(mev::commit::state_name(s)) == "revealed");

    s = mev::commit::Cancelled{};
    REQUIRE(std::string(mev::commit::state_name(s)) == "cancelled");
}
