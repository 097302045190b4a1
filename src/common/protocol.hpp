#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <array>

namespace agora {

// ============================================================================
// Protocol Version
// ============================================================================
constexpr uint8_t PROTOCOL_VERSION = 0x01;

// ============================================================================
// Datagram Types
// ============================================================================
// Every datagram on an attempt socket is classified by its first byte.
// STUN/TURN messages always start with 0b00 (RFC 5389 section 6), so the
// application types live in the 0xC0-0xFF range.
enum class DatagramType : uint8_t {
    HANDSHAKE_INIT     = 0xC1,
    HANDSHAKE_RESPONSE = 0xC2,
    HANDSHAKE_FINISH   = 0xC3,
    SECURE_FRAME       = 0xD0,
};

constexpr std::string_view datagram_type_to_string(DatagramType type) {
    switch (type) {
        case DatagramType::HANDSHAKE_INIT:     return "HANDSHAKE_INIT";
        case DatagramType::HANDSHAKE_RESPONSE: return "HANDSHAKE_RESPONSE";
        case DatagramType::HANDSHAKE_FINISH:   return "HANDSHAKE_FINISH";
        case DatagramType::SECURE_FRAME:       return "SECURE_FRAME";
        default:                               return "UNKNOWN";
    }
}

// ============================================================================
// Error Codes
// ============================================================================
enum class ErrorCode : uint16_t {
    // General errors (0xxx)
    SUCCESS               = 0,
    INVALID_ARGUMENT      = 1,
    SYSTEM_ERROR          = 2,
    TIMEOUT               = 3,
    CANCELLED             = 4,

    // Transport errors (1xxx)
    TRANSPORT_UNREACHABLE = 1001,
    STUN_FAILED           = 1002,
    TURN_FAILED           = 1003,
    TURN_AUTH_FAILED      = 1004,
    UPNP_UNAVAILABLE      = 1005,

    // Handshake errors (2xxx)
    AUTHENTICATION_FAILED = 2001,
    HANDSHAKE_TIMEOUT     = 2002,
    UNEXPECTED_MESSAGE    = 2003,

    // Channel errors (3xxx)
    FRAME_REJECTED        = 3001,
    EPOCH_EXPIRED         = 3002,
    CHANNEL_CLOSED        = 3003,
    REPLAY_DETECTED       = 3004,

    // Protocol errors (4xxx)
    INVALID_MESSAGE       = 4001,
    UNSUPPORTED_VERSION   = 4002,
    MESSAGE_TOO_LARGE     = 4003,

    // Crypto errors (5xxx)
    CRYPTO_ERROR          = 5001,
    DECRYPTION_FAILED     = 5002,
    INVALID_KEY           = 5003   // Invalid or weak cryptographic key
};

constexpr std::string_view error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:               return "Success";
        case ErrorCode::INVALID_ARGUMENT:      return "Invalid argument";
        case ErrorCode::SYSTEM_ERROR:          return "System error";
        case ErrorCode::TIMEOUT:               return "Timeout";
        case ErrorCode::CANCELLED:             return "Cancelled";
        case ErrorCode::TRANSPORT_UNREACHABLE: return "No candidate pair reachable";
        case ErrorCode::STUN_FAILED:           return "STUN binding failed";
        case ErrorCode::TURN_FAILED:           return "TURN allocation failed";
        case ErrorCode::TURN_AUTH_FAILED:      return "TURN authentication failed";
        case ErrorCode::UPNP_UNAVAILABLE:      return "No port mapping gateway";
        case ErrorCode::AUTHENTICATION_FAILED: return "Peer authentication failed";
        case ErrorCode::HANDSHAKE_TIMEOUT:     return "Handshake timed out";
        case ErrorCode::UNEXPECTED_MESSAGE:    return "Unexpected message";
        case ErrorCode::FRAME_REJECTED:        return "Frame rejected";
        case ErrorCode::EPOCH_EXPIRED:         return "Key epoch expired";
        case ErrorCode::CHANNEL_CLOSED:        return "Channel closed";
        case ErrorCode::REPLAY_DETECTED:       return "Replay detected";
        case ErrorCode::INVALID_MESSAGE:       return "Invalid message format";
        case ErrorCode::UNSUPPORTED_VERSION:   return "Unsupported protocol version";
        case ErrorCode::MESSAGE_TOO_LARGE:     return "Message too large";
        case ErrorCode::CRYPTO_ERROR:          return "Cryptographic error";
        case ErrorCode::DECRYPTION_FAILED:     return "Decryption failed";
        case ErrorCode::INVALID_KEY:           return "Invalid or weak cryptographic key";
        default:                               return "Unknown error";
    }
}

// ============================================================================
// Crypto Constants
// ============================================================================
namespace CryptoConstants {
    constexpr size_t X25519_KEY_SIZE = 32;
    constexpr size_t ED25519_PUB_SIZE = 32;
    constexpr size_t ED25519_SEC_SIZE = 64;
    constexpr size_t ED25519_SEED_SIZE = 32;
    constexpr size_t ED25519_SIG_SIZE = 64;
    constexpr size_t CHACHA20_KEY_SIZE = 32;
    constexpr size_t CHACHA20_NONCE_SIZE = 12;
    constexpr size_t POLY1305_TAG_SIZE = 16;
    constexpr size_t SESSION_KEY_SIZE = 32;
    constexpr size_t SHA256_SIZE = 32;
    constexpr size_t FINGERPRINT_SIZE = 8;

    // Nonce: 4 bytes epoch id + 8 bytes counter
    constexpr size_t NONCE_PREFIX_SIZE = 4;
    constexpr size_t NONCE_COUNTER_SIZE = 8;

    // Replay protection sliding window
    constexpr size_t REPLAY_WINDOW_SIZE = 2048;
}

// ============================================================================
// Key Types
// ============================================================================
using X25519PublicKey = std::array<uint8_t, CryptoConstants::X25519_KEY_SIZE>;
using X25519PrivateKey = std::array<uint8_t, CryptoConstants::X25519_KEY_SIZE>;
using Ed25519PublicKey = std::array<uint8_t, CryptoConstants::ED25519_PUB_SIZE>;
using Ed25519PrivateKey = std::array<uint8_t, CryptoConstants::ED25519_SEC_SIZE>;
using Ed25519Seed = std::array<uint8_t, CryptoConstants::ED25519_SEED_SIZE>;
using SessionKey = std::array<uint8_t, CryptoConstants::SESSION_KEY_SIZE>;
using Sha256Digest = std::array<uint8_t, CryptoConstants::SHA256_SIZE>;
using Fingerprint = std::array<uint8_t, CryptoConstants::FINGERPRINT_SIZE>;
using Nonce = std::array<uint8_t, CryptoConstants::CHACHA20_NONCE_SIZE>;
using AuthTag = std::array<uint8_t, CryptoConstants::POLY1305_TAG_SIZE>;

// Peer identifier derived from the long-term public key ("12D3KooW...")
using PeerId = std::string;

} // namespace agora
