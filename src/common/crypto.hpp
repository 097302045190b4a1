#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace agora::crypto {

// Initialize libsodium (idempotent, call once at startup)
bool init();

// ============================================================================
// Random Generation
// ============================================================================

void random_bytes(std::span<uint8_t> buffer);
uint32_t random_u32();
uint64_t random_u64();

// ============================================================================
// Legacy digests (STUN/TURN long-term credentials)
// ============================================================================
// RFC 5389 fixes HMAC-SHA1 for MESSAGE-INTEGRITY and MD5 for the key;
// libsodium has neither, these go through OpenSSL.

using Sha1Digest = std::array<uint8_t, 20>;
using Md5Digest = std::array<uint8_t, 16>;

Sha1Digest hmac_sha1(std::span<const uint8_t> key, std::span<const uint8_t> data);
Md5Digest md5(std::string_view data);

// ============================================================================
// Utility Functions
// ============================================================================

// Constant-time memory comparison
bool secure_compare(std::span<const uint8_t> a, std::span<const uint8_t> b);

// Secure memory wipe
void secure_wipe(std::span<uint8_t> memory);

} // namespace agora::crypto
