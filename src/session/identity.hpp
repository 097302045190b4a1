#pragma once

#include "common/protocol.hpp"

#include <span>
#include <string>

namespace agora::session {

// ============================================================================
// Peer identity
// ============================================================================

/**
 * PeerIdentity - long-term Ed25519 signing key of this process
 *
 * Created once from a persisted seed (or generated) and shared read-only by
 * every connection. The private key is wiped on destruction.
 */
class PeerIdentity {
public:
    static PeerIdentity generate();
    static PeerIdentity from_seed(const Ed25519Seed& seed);

    ~PeerIdentity();

    PeerIdentity(const PeerIdentity&) = delete;
    PeerIdentity& operator=(const PeerIdentity&) = delete;
    PeerIdentity(PeerIdentity&&) = default;
    PeerIdentity& operator=(PeerIdentity&&) = default;

    // For the caller to persist
    Ed25519Seed seed() const;

    const Ed25519PublicKey& public_key() const { return public_key_; }
    const PeerId& peer_id() const { return peer_id_; }
    Fingerprint fingerprint() const;

    std::array<uint8_t, CryptoConstants::ED25519_SIG_SIZE> sign(std::span<const uint8_t> message) const;

private:
    PeerIdentity(const Ed25519PublicKey& pub, const Ed25519PrivateKey& priv);

    Ed25519PublicKey public_key_{};
    Ed25519PrivateKey private_key_{};
    PeerId peer_id_;
};

// "12D3KooW" + 'b' + base32-lower(SHA256(public key)[0..20])
PeerId peer_id_from_public_key(const Ed25519PublicKey& public_key);

// RFC 4648 base32, lower-case alphabet, no padding
std::string base32_lower(std::span<const uint8_t> data);

// "0A1B 2C3D 4E5F 6071"
std::string format_fingerprint(const Fingerprint& fingerprint);

} // namespace agora::session
