#pragma once

#include "common/protocol.hpp"
#include <span>
#include <string_view>
#include <vector>

namespace agora::crypto {

// ============================================================================
// HKDF-SHA256 Key Derivation (RFC 5869)
// ============================================================================
// Handshake chaining keys, session epochs and the key ratchet

class HKDF {
public:
    // HKDF Extract + Expand
    static std::vector<uint8_t> derive(
        std::span<const uint8_t> input_key_material,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info,
        size_t output_length
    );

    // 32-byte key from ikm, with info = label || u32 index (big endian)
    static SessionKey derive_key(
        std::span<const uint8_t> input_key_material,
        std::span<const uint8_t> salt,
        std::string_view label,
        uint32_t index
    );

    // HKDF Extract only
    // PRK = HMAC-SHA256(salt, IKM)
    static std::array<uint8_t, 32> extract(
        std::span<const uint8_t> salt,
        std::span<const uint8_t> input_key_material
    );

    // HKDF Expand only
    // Output = T(1) || T(2) || ... with T(i) = HMAC-SHA256(PRK, T(i-1) || info || i)
    static std::vector<uint8_t> expand(
        std::span<const uint8_t> prk,
        std::span<const uint8_t> info,
        size_t output_length
    );

    static std::array<uint8_t, 32> hmac_sha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data
    );
};

} // namespace agora::crypto
