#pragma once

#include "common/constants.hpp"
#include "common/logger.hpp"

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <chrono>
#include <expected>

namespace agora {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
    MISSING_REQUIRED,
};

std::string config_error_message(ConfigError error);

// ============================================================================
// Connectivity Configuration
// ============================================================================

struct StunConfig {
    // host[:port], port defaults to 3478
    std::vector<std::string> servers = {
        "stun.l.google.com:19302",
        "stun1.l.google.com:19302",
        "stun2.l.google.com:19302",
        "stun3.l.google.com:19302",
        "stun4.l.google.com:19302",
    };
    std::chrono::milliseconds timeout{defaults::STUN_TIMEOUT};  // initial RTO
    uint32_t retransmits = defaults::STUN_RETRANSMITS;
};

struct TurnServerConfig {
    std::string host;
    uint16_t port = network::DEFAULT_TURN_PORT;
    std::string username;
    std::string password;
};

struct TurnConfig {
    std::vector<TurnServerConfig> servers;
    std::chrono::seconds lifetime{defaults::TURN_LIFETIME};
    std::chrono::seconds refresh_margin{defaults::TURN_REFRESH_MARGIN};
    std::chrono::seconds permission_lifetime{defaults::TURN_PERMISSION_LIFETIME};
    std::chrono::milliseconds timeout{defaults::TURN_TIMEOUT};
};

struct UpnpConfig {
    bool enabled = true;
    bool igd = true;                        // try UPnP IGD before NAT-PMP
    std::chrono::milliseconds discovery_timeout{defaults::UPNP_DISCOVERY_TIMEOUT};
    std::chrono::seconds lease{defaults::UPNP_LEASE};
    std::string natpmp_gateway;             // empty = default route
    uint16_t natpmp_port = network::NATPMP_PORT;
    std::string description = "agora-connect";
};

struct IceConfig {
    uint16_t bind_port = 0;                 // 0 = ephemeral
    uint32_t max_in_flight = defaults::ICE_MAX_IN_FLIGHT;
    std::chrono::milliseconds check_interval{defaults::ICE_CHECK_INTERVAL};
    std::chrono::milliseconds check_timeout{defaults::ICE_CHECK_TIMEOUT};
    uint32_t max_check_attempts = defaults::ICE_MAX_CHECK_ATTEMPTS;
    std::chrono::milliseconds gather_timeout{defaults::ICE_GATHER_TIMEOUT};
    std::chrono::milliseconds connect_timeout{defaults::ICE_CONNECT_TIMEOUT};
    std::chrono::seconds interface_poll_interval{defaults::INTERFACE_POLL_INTERVAL};
    size_t receive_queue = network::RECEIVE_QUEUE_CAPACITY;

    // TCP candidates: listen and simultaneous-open from one port
    bool tcp_candidates = true;
    std::chrono::milliseconds tcp_connect_timeout{defaults::TCP_CONNECT_TIMEOUT};
    uint32_t tcp_connect_attempts = defaults::TCP_CONNECT_ATTEMPTS;
};

struct HandshakeConfig {
    std::chrono::milliseconds timeout{defaults::HANDSHAKE_TIMEOUT};
    std::chrono::milliseconds retransmit{defaults::HANDSHAKE_RETRANSMIT};
};

struct SessionConfig {
    std::chrono::seconds rotation_interval{defaults::KEY_ROTATION_INTERVAL};
    std::chrono::seconds overlap_window{defaults::KEY_OVERLAP_WINDOW};
    uint32_t max_consecutive_rejections = defaults::MAX_CONSECUTIVE_REJECTIONS;
};

struct ConnectivityConfig {
    LogConfig log;
    StunConfig stun;
    TurnConfig turn;
    UpnpConfig upnp;
    IceConfig ice;
    HandshakeConfig handshake;
    SessionConfig session;

    // Load from JSON file
    static std::expected<ConnectivityConfig, ConfigError> load(const std::string& path);

    // Load from JSON string (for testing)
    static std::expected<ConnectivityConfig, ConfigError> parse(const std::string& json_content);

    // Cross-field checks, run by parse()
    std::optional<ConfigError> validate() const;
};

} // namespace agora
