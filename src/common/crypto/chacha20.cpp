#include "common/crypto/chacha20.hpp"
#include <sodium.h>

namespace agora::crypto {

std::expected<std::vector<uint8_t>, ErrorCode> ChaCha20Poly1305::encrypt_with_nonce(
    const SessionKey& key,
    const Nonce& nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {

    std::vector<uint8_t> ciphertext(plaintext.size() + crypto_aead_chacha20poly1305_ietf_ABYTES);
    unsigned long long ciphertext_len = 0;

    if (crypto_aead_chacha20poly1305_ietf_encrypt(
            ciphertext.data(), &ciphertext_len,
            plaintext.data(), plaintext.size(),
            associated_data.data(), associated_data.size(),
            nullptr,
            nonce.data(),
            key.data()) != 0) {
        return std::unexpected(ErrorCode::CRYPTO_ERROR);
    }

    ciphertext.resize(ciphertext_len);
    return ciphertext;
}

std::expected<std::vector<uint8_t>, ErrorCode> ChaCha20Poly1305::decrypt_with_nonce(
    const SessionKey& key,
    const Nonce& nonce,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> associated_data) {

    if (ciphertext.size() < crypto_aead_chacha20poly1305_ietf_ABYTES) {
        return std::unexpected(ErrorCode::INVALID_MESSAGE);
    }

    std::vector<uint8_t> plaintext(ciphertext.size() - crypto_aead_chacha20poly1305_ietf_ABYTES);
    unsigned long long plaintext_len = 0;

    if (crypto_aead_chacha20poly1305_ietf_decrypt(
            plaintext.data(), &plaintext_len,
            nullptr,
            ciphertext.data(), ciphertext.size(),
            associated_data.data(), associated_data.size(),
            nonce.data(),
            key.data()) != 0) {
        return std::unexpected(ErrorCode::DECRYPTION_FAILED);
    }

    plaintext.resize(plaintext_len);
    return plaintext;
}

Nonce ChaCha20Poly1305::create_nonce(uint32_t prefix, uint64_t counter) {
    Nonce nonce{};
    for (int i = 0; i < 4; ++i) {
        nonce[i] = static_cast<uint8_t>((prefix >> (24 - 8 * i)) & 0xFF);
    }
    for (int i = 0; i < 8; ++i) {
        nonce[4 + i] = static_cast<uint8_t>((counter >> (56 - 8 * i)) & 0xFF);
    }
    return nonce;
}

} // namespace agora::crypto
