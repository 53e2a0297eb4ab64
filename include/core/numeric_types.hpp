// Core integer types for exact settlement math
// Token amounts are u64 base units; every product of two amounts is taken in a
// double-width multiprecision intermediate so no realistic supply can overflow.
#pragma once

#include <cstdint>
#include <limits>
#include <boost/multiprecision/cpp_int.hpp>

namespace mev {

using uint128_t = boost::multiprecision::uint128_t;
using int128_t  = boost::multiprecision::int128_t;
using uint256_t = boost::multiprecision::uint256_t;

// Basis-point denominator (10000 bps = 100%)
constexpr uint64_t BPS_DENOM = 10000;

// NumTraits: narrowing helpers from wide intermediates back to u64/i64.
template <typename Wide>
struct NumTraits {
    // Clamp to [0, u64::max]
    static uint64_t to_u64_saturating(const Wide& v) {
        static const Wide hi = Wide(std::numeric_limits<uint64_t>::max());
        if (v <= Wide(0)) return 0;
        if (v >= hi) return std::numeric_limits<uint64_t>::max();
        return v.template convert_to<uint64_t>();
    }
};

// Specialization for the signed intermediate used by profit accounting
template <>
struct NumTraits<int128_t> {
    static int64_t to_i64_saturating(const int128_t& v) {
        static const int128_t hi = int128_t(std::numeric_limits<int64_t>::max());
        static const int128_t lo = int128_t(std::numeric_limits<int64_t>::min());
        if (v >= hi) return std::numeric_limits<int64_t>::max();
        if (v <= lo) return std::numeric_limits<int64_t>::min();
        return v.convert_to<int64_t>();
    }
};

// floor(a * b / d) with a 128-bit intermediate; d == 0 yields 0
inline uint64_t mul_div_floor(uint64_t a, uint64_t b, uint64_t d) {
    if (d == 0) return 0;
    const uint128_t q = uint128_t(a) * uint128_t(b) / uint128_t(d);
    return NumTraits<uint128_t>::to_u64_saturating(q);
}

inline uint64_t saturating_add(uint64_t a, uint64_t b) {
    const uint64_t s = a + b;
    return s < a ? std::numeric_limits<uint64_t>::max() : s;
}

inline uint64_t saturating_sub(uint64_t a, uint64_t b) {
    return a > b ? a - b : 0;
}

// Signed difference a - b, saturated into i64
inline int64_t signed_diff(uint64_t a, uint64_t b) {
    return NumTraits<int128_t>::to_i64_saturating(int128_t(a) - int128_t(b));
}

} // namespace mev
