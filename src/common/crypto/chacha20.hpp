#pragma once

#include "common/protocol.hpp"
#include <expected>
#include <span>
#include <vector>

namespace agora::crypto {

// ============================================================================
// ChaCha20-Poly1305 AEAD (IETF, 96-bit nonce)
// ============================================================================
// Secure frames and the encrypted handshake payloads

class ChaCha20Poly1305 {
public:
    // Returns ciphertext || tag
    static std::expected<std::vector<uint8_t>, ErrorCode> encrypt_with_nonce(
        const SessionKey& key,
        const Nonce& nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {}
    );

    // Expects ciphertext || tag. DECRYPTION_FAILED when the tag does not verify.
    static std::expected<std::vector<uint8_t>, ErrorCode> decrypt_with_nonce(
        const SessionKey& key,
        const Nonce& nonce,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> associated_data = {}
    );

    // nonce = prefix (4 bytes BE) || counter (8 bytes BE)
    static Nonce create_nonce(uint32_t prefix, uint64_t counter);
};

} // namespace agora::crypto
