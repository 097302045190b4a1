#pragma once

#include "common/protocol.hpp"
#include <expected>
#include <span>
#include <string>
#include <utility>

namespace agora::crypto {

// ============================================================================
// Ed25519 Digital Signatures
// ============================================================================
// Long-term peer identity keys

class Ed25519 {
public:
    using Signature = std::array<uint8_t, CryptoConstants::ED25519_SIG_SIZE>;

    // Generate a new key pair
    static std::pair<Ed25519PublicKey, Ed25519PrivateKey> generate_keypair();

    // Deterministic key pair from a 32-byte seed
    static std::pair<Ed25519PublicKey, Ed25519PrivateKey> keypair_from_seed(const Ed25519Seed& seed);

    // Recover the seed a private key was expanded from
    static Ed25519Seed seed_from_private(const Ed25519PrivateKey& private_key);

    // Sign a message
    static Signature sign(
        const Ed25519PrivateKey& private_key,
        std::span<const uint8_t> message
    );

    // Verify a signature
    static bool verify(
        const Ed25519PublicKey& public_key,
        std::span<const uint8_t> message,
        const Signature& signature
    );

    // Extract public key from private key
    static Ed25519PublicKey public_key_from_private(const Ed25519PrivateKey& private_key);

    // First 8 bytes of SHA256(public key)
    static Fingerprint key_fingerprint(const Ed25519PublicKey& public_key);
};

// SHA-256 of a byte string
Sha256Digest sha256(std::span<const uint8_t> data);

// SHA-256 over the concatenation a || b (transcript hashing)
Sha256Digest sha256(std::span<const uint8_t> a, std::span<const uint8_t> b);

// Lower-case hex of a byte string
std::string to_hex(std::span<const uint8_t> data);

} // namespace agora::crypto
