// Swap intent codec - implementation (OpenSSL libcrypto)

#include "commit/swap_intent.hpp"

#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace mev {
namespace commit {

namespace {

template <typename U>
inline void put_le(uint8_t* dst, U v) {
    for (size_t i = 0; i < sizeof(U); ++i) {
        dst[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

template <typename U>
inline U get_le(const uint8_t* src) {
    U v = 0;
    for (size_t i = 0; i < sizeof(U); ++i) {
        v = static_cast<U>(v | (static_cast<U>(src[i]) << (8 * i)));
    }
    return v;
}

} // namespace

IntentBytes serialize(const SwapIntent& intent) {
    IntentBytes out{};
    put_le<uint64_t>(out.data(), intent.amount_in);
    put_le<uint64_t>(out.data() + 8, intent.min_out);
    put_le<uint16_t>(out.data() + 16, intent.slippage_tolerance_bps);
    for (size_t i = 0; i < NONCE_SIZE; ++i) {
        out[18 + i] = intent.nonce[i];
    }
    return out;
}

std::optional<SwapIntent> deserialize(const uint8_t* data, size_t len) {
    if (data == nullptr || len != SWAP_INTENT_SIZE) return std::nullopt;
    SwapIntent intent{};
    intent.amount_in = get_le<uint64_t>(data);
    intent.min_out = get_le<uint64_t>(data + 8);
    intent.slippage_tolerance_bps = get_le<uint16_t>(data + 16);
    for (size_t i = 0; i < NONCE_SIZE; ++i) {
        intent.nonce[i] = data[18 + i];
    }
    return intent;
}

Hash32 hash_intent(const SwapIntent& intent) {
    const IntentBytes bytes = serialize(intent);
    Hash32 digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(bytes.data(), bytes.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1 ||
        digest_len != digest.size()) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return digest;
}

bool verify(const SwapIntent& intent, const Hash32& expected) {
    const Hash32 actual = hash_intent(intent);
    return CRYPTO_memcmp(actual.data(), expected.data(), actual.size()) == 0;
}

Nonce generate_nonce() {
    Nonce nonce{};
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed to produce a nonce");
    }
    return nonce;
}

SwapIntent make_intent(uint64_t amount_in, uint64_t min_out, uint16_t slippage_bps) {
    SwapIntent intent{};
    intent.amount_in = amount_in;
    intent.min_out = min_out;
    intent.slippage_tolerance_bps = slippage_bps;
    intent.nonce = generate_nonce();
    return intent;
}

} // namespace commit
} // namespace mev
