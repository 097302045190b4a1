#pragma once

#include "common/protocol.hpp"
#include <expected>
#include <utility>

namespace agora::crypto {

// ============================================================================
// X25519 ECDH Key Exchange
// ============================================================================
// Ephemeral key agreement inside the handshake

class X25519 {
public:
    // Generate a new key pair
    static std::pair<X25519PublicKey, X25519PrivateKey> generate_keypair();

    // Compute shared secret using ECDH
    // shared = X25519(my_private, peer_public)
    // Low-order peer points and all-zero results are rejected with INVALID_KEY.
    static std::expected<SessionKey, ErrorCode> compute_shared_secret(
        const X25519PrivateKey& my_private,
        const X25519PublicKey& peer_public
    );

    // Reject the identity point and the known small-order points
    static bool validate_public_key(const X25519PublicKey& key);
};

} // namespace agora::crypto
