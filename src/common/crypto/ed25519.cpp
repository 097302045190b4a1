#include "common/crypto/ed25519.hpp"
#include <sodium.h>
#include <cstring>

namespace agora::crypto {

std::pair<Ed25519PublicKey, Ed25519PrivateKey> Ed25519::generate_keypair() {
    Ed25519PublicKey pub;
    Ed25519PrivateKey priv;

    crypto_sign_keypair(pub.data(), priv.data());

    return {pub, priv};
}

std::pair<Ed25519PublicKey, Ed25519PrivateKey> Ed25519::keypair_from_seed(const Ed25519Seed& seed) {
    Ed25519PublicKey pub;
    Ed25519PrivateKey priv;

    crypto_sign_seed_keypair(pub.data(), priv.data(), seed.data());

    return {pub, priv};
}

Ed25519Seed Ed25519::seed_from_private(const Ed25519PrivateKey& private_key) {
    Ed25519Seed seed;
    crypto_sign_ed25519_sk_to_seed(seed.data(), private_key.data());
    return seed;
}

Ed25519::Signature Ed25519::sign(
    const Ed25519PrivateKey& private_key,
    std::span<const uint8_t> message) {

    Signature sig;
    crypto_sign_detached(sig.data(), nullptr, message.data(), message.size(), private_key.data());
    return sig;
}

bool Ed25519::verify(
    const Ed25519PublicKey& public_key,
    std::span<const uint8_t> message,
    const Signature& signature) {

    return crypto_sign_verify_detached(
        signature.data(), message.data(), message.size(), public_key.data()) == 0;
}

Ed25519PublicKey Ed25519::public_key_from_private(const Ed25519PrivateKey& private_key) {
    Ed25519PublicKey pub;
    crypto_sign_ed25519_sk_to_pk(pub.data(), private_key.data());
    return pub;
}

Fingerprint Ed25519::key_fingerprint(const Ed25519PublicKey& public_key) {
    auto hash = sha256(public_key);
    Fingerprint fp;
    std::memcpy(fp.data(), hash.data(), fp.size());
    return fp;
}

Sha256Digest sha256(std::span<const uint8_t> data) {
    Sha256Digest out;
    crypto_hash_sha256(out.data(), data.data(), data.size());
    return out;
}

Sha256Digest sha256(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    Sha256Digest out;
    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);
    crypto_hash_sha256_update(&state, a.data(), a.size());
    crypto_hash_sha256_update(&state, b.data(), b.size());
    crypto_hash_sha256_final(&state, out.data());
    return out;
}

std::string to_hex(std::span<const uint8_t> data) {
    std::string out(data.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
    out.pop_back();
    return out;
}

} // namespace agora::crypto
