// Common utilities: io_mu, env trace flags, hex formatting
#pragma once

#include <array>
#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <string>

namespace mev {

// Global mutex for synchronized console output
inline std::mutex io_mu;

// Read an env flag once ("1" enables)
inline bool env_flag(const char* key) {
    if (const char* v = std::getenv(key)) {
        return std::string(v) == "1";
    }
    return false;
}

// Debug flag - set TRACE_SANDWICH=1 to trace attacker decisions
inline bool trace_sandwich_enabled() {
    static const bool enabled = env_flag("TRACE_SANDWICH");
    return enabled;
}

// Debug flag - set TRACE_COMMIT=1 to trace commit/reveal transitions
inline bool trace_commit_enabled() {
    static const bool enabled = env_flag("TRACE_COMMIT");
    return enabled;
}

// Lowercase hex of a byte array (first n bytes, 0 = all)
template <size_t N>
inline std::string to_hex(const std::array<uint8_t, N>& bytes, size_t n = 0) {
    static const char* digits = "0123456789abcdef";
    const size_t len = (n == 0 || n > N) ? N : n;
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[bytes[i] >> 4]);
        out.push_back(digits[bytes[i] & 0x0f]);
    }
    return out;
}

} // namespace mev
