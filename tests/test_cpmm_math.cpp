#include <catch2/catch.hpp>

#include <cstdint>
#include <random>

#include "pools/cpmm_math.hpp"
#include "pools/pool_state.hpp"

using mev::pools::Direction;
using mev::pools::PoolState;
using mev::uint128_t;

namespace {
constexpr uint64_t SOL = 1000000000ULL;
PoolState deep_pool() { return PoolState(1000 * SOL, 1000 * SOL, 30); }
}

TEST_CASE("Quote against a 1000/1000 SOL pool", "[cpmm]") {
    const PoolState pool = deep_pool();

    SECTION("1 SOL A->B") {
        const auto q = mev::pools::quote(pool, SOL, Direction::a_to_b);
        REQUIRE(q.fee_charged == 3000000);
        REQUIRE(q.amount_out == 996006981);
        REQUIRE(q.amount_out > 900000000);
        REQUIRE(q.amount_out < 1000000000);
        REQUIRE(q.price_impact_bps == 9);
    }

    SECTION("Symmetric pool gives the same quote both ways") {
        const auto ab = mev::pools::quote(pool, SOL, Direction::a_to_b);
        const auto ba = mev::pools::quote(pool, SOL, Direction::b_to_a);
        REQUIRE(ab.amount_out == ba.amount_out);
        REQUIRE(ab.fee_charged == ba.fee_charged);
    }

    SECTION("Zero fee keeps the full input") {
        const auto q = mev::pools::quote(PoolState(1000 * SOL, 1000 * SOL, 0), SOL, Direction::a_to_b);
        REQUIRE(q.fee_charged == 0);
        REQUIRE(q.amount_out == 999000999);
    }

    SECTION("Quote is side-effect free and repeatable") {
        PoolState p = pool;
        const auto q1 = mev::pools::quote(p, 7 * SOL, Direction::b_to_a);
        const auto q2 = mev::pools::quote(p, 7 * SOL, Direction::b_to_a);
        REQUIRE(p == pool);
        REQUIRE(q1.amount_out == q2.amount_out);
        REQUIRE(q1.fee_charged == q2.fee_charged);
        REQUIRE(q1.price_impact_bps == q2.price_impact_bps);
    }
}

TEST_CASE("Degenerate inputs degrade instead of failing", "[cpmm]") {
    SECTION("Empty input reserve") {
        const auto q = mev::pools::quote(PoolState(0, 1000 * SOL, 30), SOL, Direction::a_to_b);
        REQUIRE(q.amount_out == 0);
        REQUIRE(q.price_impact_bps == 10000);
        REQUIRE(q.fee_charged == 3000000);
    }

    SECTION("Empty output reserve") {
        const auto q = mev::pools::quote(PoolState(1000 * SOL, 0, 30), SOL, Direction::a_to_b);
        REQUIRE(q.amount_out == 0);
        REQUIRE(q.price_impact_bps == 10000);
    }

    SECTION("Zero amount") {
        const auto q = mev::pools::quote(deep_pool(), 0, Direction::a_to_b);
        REQUIRE(q.amount_out == 0);
        REQUIRE(q.fee_charged == 0);
        REQUIRE(q.price_impact_bps == 0);
    }

    SECTION("Tiny pool, large relative trade") {
        const auto q = mev::pools::quote(PoolState(1000, 1000, 30), 1000, Direction::a_to_b);
        REQUIRE(q.fee_charged == 3);
        REQUIRE(q.amount_out == 499);
        REQUIRE(q.price_impact_bps == 4994);
    }

    SECTION("Full fee leaves nothing to swap") {
        const auto q = mev::pools::quote(PoolState(1000 * SOL, 1000 * SOL, 10000), SOL, Direction::a_to_b);
        REQUIRE(q.fee_charged == SOL);
        REQUIRE(q.amount_out == 0);
        REQUIRE(q.price_impact_bps == 0);
    }

    SECTION("Near-max reserves do not overflow") {
        const uint64_t big = UINT64_MAX / 2;
        const auto q = mev::pools::quote(PoolState(big, big, 30), big / 4, Direction::a_to_b);
        REQUIRE(q.amount_out > 0);
        REQUIRE(q.amount_out < big);
    }
}

TEST_CASE("Apply moves reserves by the fee-inclusive swap", "[cpmm]") {
    PoolState pool = deep_pool();
    const auto r = mev::pools::apply(pool, SOL, Direction::a_to_b);
    REQUIRE(r.amount_out == 996006981);
    REQUIRE(pool.reserve_a == 1001000000000ULL);
    REQUIRE(pool.reserve_b == 999003993019ULL);
    REQUIRE(pool.fee_bps == 30);

    SECTION("Not idempotent") {
        const auto r2 = mev::pools::apply(pool, SOL, Direction::a_to_b);
        REQUIRE(r2.amount_out < r.amount_out);
        REQUIRE(pool.reserve_a == 1002000000000ULL);
    }

    SECTION("Reverse direction credits reserve_b") {
        PoolState p = deep_pool();
        mev::pools::apply(p, SOL, Direction::b_to_a);
        REQUIRE(p.reserve_b == 1001000000000ULL);
        REQUIRE(p.reserve_a == 999003993019ULL);
    }
}

TEST_CASE("Minimum output with slippage", "[cpmm]") {
    const PoolState pool = deep_pool();
    REQUIRE(mev::pools::calculate_min_output(pool, SOL, Direction::a_to_b, 100) == 986046912);
    REQUIRE(mev::pools::calculate_min_output(pool, SOL, Direction::a_to_b, 0) == 996006981);
    REQUIRE(mev::pools::calculate_min_output(pool, SOL, Direction::a_to_b, 10000) == 0);
}

TEST_CASE("Pricing properties over random pools", "[cpmm][property]") {
    std::mt19937_64 rng(7);
    std::uniform_int_distribution<uint64_t> reserve_dist(SOL, 1000000 * SOL);
    std::uniform_int_distribution<uint64_t> amount_dist(1, 100 * SOL);
    std::uniform_int_distribution<int> fee_dist(0, 300);

    for (int iter = 0; iter < 500; ++iter) {
        const PoolState pool(reserve_dist(rng), reserve_dist(rng), static_cast<uint16_t>(fee_dist(rng)));
        const uint64_t amount = amount_dist(rng);
        const auto q = mev::pools::quote(pool, amount, Direction::a_to_b);

        // Strictly below the linear no-impact quote
        const uint128_t lhs = uint128_t(q.amount_out) * uint128_t(pool.reserve_a);
        const uint128_t rhs = uint128_t(amount) * uint128_t(pool.reserve_b);
        REQUIRE(lhs < rhs);
        REQUIRE(q.price_impact_bps <= 10000);
    }
}

TEST_CASE("Constant product never decreases", "[cpmm][property]") {
    std::mt19937_64 rng(11);
    std::uniform_int_distribution<uint64_t> amount_dist(1, 50 * SOL);
    std::bernoulli_distribution dir_dist(0.5);

    PoolState pool = deep_pool();
    uint128_t k = pool.k();
    for (int i = 0; i < 1000; ++i) {
        mev::pools::apply(pool, amount_dist(rng), dir_dist(rng) ? Direction::a_to_b : Direction::b_to_a);
        const uint128_t k_next = pool.k();
        REQUIRE(k_next >= k);
        k = k_next;
    }
}

TEST_CASE("Pool helpers", "[cpmm]") {
    const PoolState pool(2000, 1000, 30);
    REQUIRE(pool.price_a_in_b() == Approx(0.5));
    REQUIRE(pool.price_b_in_a() == Approx(2.0));
    REQUIRE(PoolState(0, 1000, 30).price_a_in_b() == 0.0);
    REQUIRE(pool.k() == uint128_t(2000000));
    REQUIRE(mev::pools::opposite(Direction::a_to_b) == Direction::b_to_a);
    REQUIRE(mev::pools::opposite(Direction::b_to_a) == Direction::a_to_b);
}
