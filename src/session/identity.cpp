#include "session/identity.hpp"
#include "common/crypto.hpp"
#include "common/crypto/ed25519.hpp"

namespace agora::session {

namespace {
constexpr std::string_view PEER_ID_PREFIX = "12D3KooW";
constexpr size_t PEER_ID_DIGEST_BYTES = 20;
}

PeerIdentity::PeerIdentity(const Ed25519PublicKey& pub, const Ed25519PrivateKey& priv)
    : public_key_(pub)
    , private_key_(priv)
    , peer_id_(peer_id_from_public_key(pub)) {}

PeerIdentity::~PeerIdentity() {
    crypto::secure_wipe(private_key_);
}

PeerIdentity PeerIdentity::generate() {
    auto [pub, priv] = crypto::Ed25519::generate_keypair();
    PeerIdentity identity(pub, priv);
    crypto::secure_wipe(priv);
    return identity;
}

PeerIdentity PeerIdentity::from_seed(const Ed25519Seed& seed) {
    auto [pub, priv] = crypto::Ed25519::keypair_from_seed(seed);
    PeerIdentity identity(pub, priv);
    crypto::secure_wipe(priv);
    return identity;
}

Ed25519Seed PeerIdentity::seed() const {
    return crypto::Ed25519::seed_from_private(private_key_);
}

Fingerprint PeerIdentity::fingerprint() const {
    return crypto::Ed25519::key_fingerprint(public_key_);
}

std::array<uint8_t, CryptoConstants::ED25519_SIG_SIZE> PeerIdentity::sign(
    std::span<const uint8_t> message) const {
    return crypto::Ed25519::sign(private_key_, message);
}

// ============================================================================
// Textual forms
// ============================================================================

PeerId peer_id_from_public_key(const Ed25519PublicKey& public_key) {
    auto digest = crypto::sha256(public_key);
    PeerId id(PEER_ID_PREFIX);
    id += 'b';
    id += base32_lower(std::span<const uint8_t>(digest.data(), PEER_ID_DIGEST_BYTES));
    return id;
}

std::string base32_lower(std::span<const uint8_t> data) {
    static constexpr char ALPHABET[] = "abcdefghijklmnopqrstuvwxyz234567";

    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            out += ALPHABET[(buffer >> (bits - 5)) & 0x1F];
            bits -= 5;
        }
    }
    if (bits > 0) {
        out += ALPHABET[(buffer << (5 - bits)) & 0x1F];
    }
    return out;
}

std::string format_fingerprint(const Fingerprint& fingerprint) {
    static constexpr char HEX[] = "0123456789ABCDEF";

    std::string out;
    for (size_t i = 0; i < fingerprint.size(); ++i) {
        if (i > 0 && i % 2 == 0) out += ' ';
        out += HEX[fingerprint[i] >> 4];
        out += HEX[fingerprint[i] & 0x0F];
    }
    return out;
}

} // namespace agora::session
