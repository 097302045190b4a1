#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>

namespace agora {

// ============================================================================
// Wire protocol
// ============================================================================
namespace protocol {

// Candidate advertisement format version
inline constexpr uint8_t ADVERTISEMENT_VERSION = 0x01;

// Handshake message format version
inline constexpr uint8_t HANDSHAKE_VERSION = 0x01;

// ============================================================================
// Size limits
// ============================================================================
inline constexpr size_t MAX_DATAGRAM_SIZE = 65536;
inline constexpr size_t MAX_FRAME_PAYLOAD = 65000;
inline constexpr size_t MAX_CANDIDATES = 32;
inline constexpr size_t MAX_PEER_ID_LENGTH = 128;

// SecureFrame header: type(1) + epoch(4) + counter(8)
inline constexpr size_t SECURE_FRAME_HEADER_SIZE = 13;

}  // namespace protocol

// ============================================================================
// ICE candidate preferences
// ============================================================================
namespace ice {

inline constexpr uint32_t TYPE_PREF_HOST = 126;
inline constexpr uint32_t TYPE_PREF_PEER_REFLEXIVE = 110;
inline constexpr uint32_t TYPE_PREF_SERVER_REFLEXIVE = 100;
inline constexpr uint32_t TYPE_PREF_RELAYED = 0;
// TCP candidates rank below every direct UDP candidate and above relays
inline constexpr uint32_t TYPE_PREF_TCP_HOST = 60;
inline constexpr uint32_t TYPE_PREF_TCP_REFLEXIVE = 50;

inline constexpr uint32_t LOCAL_PREF_MAX = 65535;
// Port-mapped reflexive candidates rank just below the primary interface
inline constexpr uint32_t LOCAL_PREF_MAPPED = 65534;

inline constexpr uint16_t DEFAULT_COMPONENT = 1;

}  // namespace ice

// ============================================================================
// Default timeouts
// ============================================================================
namespace defaults {

// STUN
inline constexpr auto STUN_TIMEOUT = std::chrono::milliseconds(500);
inline constexpr uint32_t STUN_RETRANSMITS = 2;

// TURN
inline constexpr auto TURN_LIFETIME = std::chrono::seconds(600);
inline constexpr auto TURN_REFRESH_MARGIN = std::chrono::seconds(60);
inline constexpr auto TURN_PERMISSION_LIFETIME = std::chrono::seconds(300);
inline constexpr auto TURN_TIMEOUT = std::chrono::milliseconds(3000);

// UPnP / NAT-PMP
inline constexpr auto UPNP_DISCOVERY_TIMEOUT = std::chrono::milliseconds(2000);
inline constexpr auto UPNP_LEASE = std::chrono::seconds(3600);
inline constexpr auto NATPMP_INITIAL_RTO = std::chrono::milliseconds(250);

// ICE
inline constexpr uint32_t ICE_MAX_IN_FLIGHT = 4;
inline constexpr auto ICE_CHECK_INTERVAL = std::chrono::milliseconds(50);
inline constexpr auto ICE_CHECK_TIMEOUT = std::chrono::milliseconds(500);
inline constexpr uint32_t ICE_MAX_CHECK_ATTEMPTS = 4;
inline constexpr auto ICE_GATHER_TIMEOUT = std::chrono::milliseconds(3000);
inline constexpr auto ICE_CONNECT_TIMEOUT = std::chrono::milliseconds(5000);
inline constexpr auto INTERFACE_POLL_INTERVAL = std::chrono::seconds(30);
inline constexpr auto TCP_CONNECT_TIMEOUT = std::chrono::milliseconds(2000);
inline constexpr uint32_t TCP_CONNECT_ATTEMPTS = 3;
inline constexpr auto TCP_RETRY_DELAY = std::chrono::milliseconds(100);

// Handshake
inline constexpr auto HANDSHAKE_TIMEOUT = std::chrono::milliseconds(5000);
inline constexpr auto HANDSHAKE_RETRANSMIT = std::chrono::milliseconds(250);

// Session keys
inline constexpr auto KEY_ROTATION_INTERVAL = std::chrono::seconds(3600);
inline constexpr auto KEY_OVERLAP_WINDOW = std::chrono::seconds(30);
inline constexpr uint32_t MAX_CONSECUTIVE_REJECTIONS = 64;
inline constexpr auto SESSION_MAINTENANCE_INTERVAL = std::chrono::seconds(1);

}  // namespace defaults

// ============================================================================
// Network defaults
// ============================================================================
namespace network {

inline constexpr uint16_t DEFAULT_STUN_PORT = 3478;
inline constexpr uint16_t DEFAULT_TURN_PORT = 3478;
inline constexpr uint16_t NATPMP_PORT = 5351;

// Channel capacity
inline constexpr size_t RECEIVE_QUEUE_CAPACITY = 256;
inline constexpr size_t HANDSHAKE_QUEUE_CAPACITY = 16;
inline constexpr size_t STREAM_WRITE_QUEUE_CAPACITY = 256;

}  // namespace network

}  // namespace agora
