#include "common/crypto.hpp"
#include <sodium.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace agora::crypto {

bool init() {
    return sodium_init() >= 0;
}

// ============================================================================
// Random Generation
// ============================================================================

void random_bytes(std::span<uint8_t> buffer) {
    randombytes_buf(buffer.data(), buffer.size());
}

uint32_t random_u32() {
    return randombytes_random();
}

uint64_t random_u64() {
    uint64_t value = 0;
    randombytes_buf(&value, sizeof(value));
    return value;
}

// ============================================================================
// Legacy digests
// ============================================================================

Sha1Digest hmac_sha1(std::span<const uint8_t> key, std::span<const uint8_t> data) {
    Sha1Digest out{};
    unsigned int len = 0;
    HMAC(EVP_sha1(),
         key.data(), static_cast<int>(key.size()),
         data.data(), data.size(),
         out.data(), &len);
    return out;
}

Md5Digest md5(std::string_view data) {
    Md5Digest out{};
    unsigned int len = 0;
    EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_md5(), nullptr);
    return out;
}

// ============================================================================
// Utility Functions
// ============================================================================

bool secure_compare(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    if (a.size() != b.size()) return false;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

void secure_wipe(std::span<uint8_t> memory) {
    sodium_memzero(memory.data(), memory.size());
}

} // namespace agora::crypto
