#include "common/crypto/hkdf.hpp"
#include <sodium.h>
#include <algorithm>
#include <cstring>

namespace agora::crypto {

std::array<uint8_t, 32> HKDF::hmac_sha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {
    
    std::array<uint8_t, 32> result;
    
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, key.data(), key.size());
    crypto_auth_hmacsha256_update(&state, data.data(), data.size());
    crypto_auth_hmacsha256_final(&state, result.data());
    
    return result;
}

std::array<uint8_t, 32> HKDF::extract(
    std::span<const uint8_t> salt,
    std::span<const uint8_t> input_key_material) {
    
    // RFC 5869: absent salt is HashLen zero bytes
    if (salt.empty()) {
        std::array<uint8_t, 32> zero_salt{};
        return hmac_sha256(zero_salt, input_key_material);
    }
    
    return hmac_sha256(salt, input_key_material);
}

std::vector<uint8_t> HKDF::expand(
    std::span<const uint8_t> prk,
    std::span<const uint8_t> info,
    size_t output_length) {
    
    std::vector<uint8_t> output;
    output.reserve(output_length);
    
    std::array<uint8_t, 32> t{};  // Previous block
    uint8_t counter = 1;
    
    while (output.size() < output_length) {
        std::vector<uint8_t> input;
        
        if (counter > 1) {
            input.insert(input.end(), t.begin(), t.end());
        }
        input.insert(input.end(), info.begin(), info.end());
        input.push_back(counter);
        
        t = hmac_sha256(prk, input);
        
        size_t remaining = output_length - output.size();
        size_t to_copy = std::min(remaining, t.size());
        output.insert(output.end(), t.begin(), t.begin() + to_copy);
        
        ++counter;
        
        // Output length is capped at 255 blocks
        if (counter == 0) break;
    }

    sodium_memzero(t.data(), t.size());
    return output;
}

std::vector<uint8_t> HKDF::derive(
    std::span<const uint8_t> input_key_material,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info,
    size_t output_length) {
    
    auto prk = extract(salt, input_key_material);
    auto okm = expand(prk, info, output_length);
    sodium_memzero(prk.data(), prk.size());
    return okm;
}

SessionKey HKDF::derive_key(
    std::span<const uint8_t> input_key_material,
    std::span<const uint8_t> salt,
    std::string_view label,
    uint32_t index) {

    std::vector<uint8_t> info(label.begin(), label.end());
    info.push_back(static_cast<uint8_t>((index >> 24) & 0xFF));
    info.push_back(static_cast<uint8_t>((index >> 16) & 0xFF));
    info.push_back(static_cast<uint8_t>((index >> 8) & 0xFF));
    info.push_back(static_cast<uint8_t>(index & 0xFF));

    auto derived = derive(input_key_material, salt, info, CryptoConstants::SESSION_KEY_SIZE);

    SessionKey key;
    std::memcpy(key.data(), derived.data(), key.size());
    sodium_memzero(derived.data(), derived.size());

    return key;
}

} // namespace agora::crypto
