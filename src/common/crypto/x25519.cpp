#include "common/crypto/x25519.hpp"
#include <sodium.h>
#include <algorithm>

namespace agora::crypto {

namespace {

bool is_all_zero(const std::array<uint8_t, 32>& bytes) {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

// Points of order 1, 2, 4 and 8 plus their non-canonical encodings
// (https://cr.yp.to/ecdh.html#validate). Any of them yields a predictable
// shared secret.
constexpr std::array<std::array<uint8_t, 32>, 5> LOW_ORDER_POINTS = {{
    // 1
    {1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
     0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
    // p - 1
    {0xec, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
    // p
    {0xed, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
    // order 8
    {0x5f, 0x9c, 0x95, 0xbc, 0xa3, 0x50, 0x8c, 0x24,
     0xb1, 0xd0, 0xb1, 0x55, 0x9c, 0x83, 0xef, 0x5b,
     0x04, 0x44, 0x5c, 0xc4, 0x58, 0x1c, 0x8e, 0x86,
     0xd8, 0x22, 0x4e, 0xdd, 0xd0, 0x9f, 0x11, 0x57},
    {0xe0, 0xeb, 0x7a, 0x7c, 0x3b, 0x41, 0xb8, 0xae,
     0x16, 0x56, 0xe3, 0xfa, 0xf1, 0x9f, 0xc4, 0x6a,
     0xda, 0x09, 0x8d, 0xeb, 0x9c, 0x32, 0xb1, 0xfd,
     0x86, 0x62, 0x05, 0x16, 0x5f, 0x49, 0xb8, 0x00},
}};

}  // namespace

std::pair<X25519PublicKey, X25519PrivateKey> X25519::generate_keypair() {
    X25519PublicKey pub;
    X25519PrivateKey priv;

    crypto_box_keypair(pub.data(), priv.data());

    return {pub, priv};
}

std::expected<SessionKey, ErrorCode> X25519::compute_shared_secret(
    const X25519PrivateKey& my_private,
    const X25519PublicKey& peer_public) {

    if (!validate_public_key(peer_public)) {
        return std::unexpected(ErrorCode::INVALID_KEY);
    }

    SessionKey shared;
    if (crypto_scalarmult(shared.data(), my_private.data(), peer_public.data()) != 0) {
        return std::unexpected(ErrorCode::INVALID_KEY);
    }

    if (is_all_zero(shared)) {
        return std::unexpected(ErrorCode::INVALID_KEY);
    }

    return shared;
}

bool X25519::validate_public_key(const X25519PublicKey& key) {
    if (is_all_zero(key)) {
        return false;
    }

    // The top bit is masked by X25519, so compare with it cleared
    X25519PublicKey masked = key;
    masked[31] &= 0x7f;
    for (const auto& point : LOW_ORDER_POINTS) {
        if (masked == point) return false;
    }

    // p + 1 is a non-canonical encoding of 1
    static constexpr std::array<uint8_t, 32> p_plus_1 = {
        0xee, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f
    };
    return masked != p_plus_1;
}

} // namespace agora::crypto
