#include "common/config.hpp"
#include "common/logger.hpp"
#include <boost/json.hpp>
#include <fstream>
#include <sstream>

namespace json = boost::json;

// Safe JSON field accessors with defaults
namespace {

std::string jstr(const json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return def;
}

bool jbool(const json::object& obj, std::string_view key, bool def = false) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_bool())
        return it->value().as_bool();
    return def;
}

uint64_t juint(const json::object& obj, std::string_view key, uint64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_uint64()) return it->value().as_uint64();
        if (it->value().is_int64()) return static_cast<uint64_t>(it->value().as_int64());
    }
    return def;
}

const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

const json::array* jarray(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_array())
        return &it->value().as_array();
    return nullptr;
}

template<typename Duration>
Duration jduration(const json::object& obj, std::string_view key, Duration def) {
    return Duration(static_cast<typename Duration::rep>(
        juint(obj, key, static_cast<uint64_t>(def.count()))));
}

}  // anonymous namespace

namespace agora {

namespace {
auto& log() { return Logger::get("common.config"); }
}  // anonymous namespace

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        case ConfigError::MISSING_REQUIRED: return "Missing required configuration";
        default: return "Unknown configuration error";
    }
}

std::expected<ConnectivityConfig, ConfigError> ConnectivityConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::expected<ConnectivityConfig, ConfigError> ConnectivityConfig::parse(const std::string& json_content) {
    ConnectivityConfig config;
    try {
        auto jv = json::parse(json_content);
        auto& root = jv.as_object();

        // log section
        if (auto* log_sec = jsection(root, "log")) {
            config.log.global_level = log_level_from_string(
                jstr(*log_sec, "level", std::string(log_level_to_string(config.log.global_level))));
            config.log.file_path = jstr(*log_sec, "file");
            config.log.file_enabled = !config.log.file_path.empty();
            if (auto* modules = jsection(*log_sec, "modules")) {
                for (const auto& kv : *modules) {
                    if (kv.value().is_string()) {
                        config.log.module_levels[std::string(kv.key())] =
                            log_level_from_string(std::string(kv.value().as_string()));
                    }
                }
            }
        }

        // stun section
        if (auto* stun = jsection(root, "stun")) {
            if (auto* servers = jarray(*stun, "servers")) {
                config.stun.servers.clear();
                for (const auto& s : *servers) {
                    if (s.is_string()) config.stun.servers.emplace_back(s.as_string());
                }
            }
            config.stun.timeout = jduration(*stun, "timeout_ms", config.stun.timeout);
            config.stun.retransmits = static_cast<uint32_t>(
                juint(*stun, "retransmits", config.stun.retransmits));
        }

        // turn section
        if (auto* turn = jsection(root, "turn")) {
            if (auto* servers = jarray(*turn, "servers")) {
                for (const auto& s : *servers) {
                    if (!s.is_object()) {
                        log().error("turn.servers entries must be objects");
                        return std::unexpected(ConfigError::INVALID_VALUE);
                    }
                    const auto& obj = s.as_object();
                    TurnServerConfig server;
                    server.host = jstr(obj, "host");
                    server.port = static_cast<uint16_t>(juint(obj, "port", server.port));
                    server.username = jstr(obj, "username");
                    server.password = jstr(obj, "password");
                    if (server.username.empty()) {
                        log().error("TURN server {} has no username", server.host);
                        return std::unexpected(ConfigError::MISSING_REQUIRED);
                    }
                    config.turn.servers.push_back(std::move(server));
                }
            }
            config.turn.lifetime = jduration(*turn, "lifetime", config.turn.lifetime);
            config.turn.refresh_margin = jduration(*turn, "refresh_margin", config.turn.refresh_margin);
            config.turn.permission_lifetime =
                jduration(*turn, "permission_lifetime", config.turn.permission_lifetime);
            config.turn.timeout = jduration(*turn, "timeout_ms", config.turn.timeout);
        }

        // upnp section
        if (auto* upnp = jsection(root, "upnp")) {
            config.upnp.enabled = jbool(*upnp, "enabled", config.upnp.enabled);
            config.upnp.igd = jbool(*upnp, "igd", config.upnp.igd);
            config.upnp.discovery_timeout =
                jduration(*upnp, "discovery_timeout_ms", config.upnp.discovery_timeout);
            config.upnp.lease = jduration(*upnp, "lease", config.upnp.lease);
            config.upnp.natpmp_gateway = jstr(*upnp, "natpmp_gateway", config.upnp.natpmp_gateway);
            config.upnp.natpmp_port = static_cast<uint16_t>(
                juint(*upnp, "natpmp_port", config.upnp.natpmp_port));
            config.upnp.description = jstr(*upnp, "description", config.upnp.description);
        }

        // ice section
        if (auto* ice = jsection(root, "ice")) {
            config.ice.bind_port = static_cast<uint16_t>(juint(*ice, "bind_port", config.ice.bind_port));
            config.ice.max_in_flight = static_cast<uint32_t>(
                juint(*ice, "max_in_flight", config.ice.max_in_flight));
            config.ice.check_interval = jduration(*ice, "check_interval_ms", config.ice.check_interval);
            config.ice.check_timeout = jduration(*ice, "check_timeout_ms", config.ice.check_timeout);
            config.ice.max_check_attempts = static_cast<uint32_t>(
                juint(*ice, "max_check_attempts", config.ice.max_check_attempts));
            config.ice.gather_timeout = jduration(*ice, "gather_timeout_ms", config.ice.gather_timeout);
            config.ice.connect_timeout = jduration(*ice, "connect_timeout_ms", config.ice.connect_timeout);
            config.ice.interface_poll_interval =
                jduration(*ice, "interface_poll_interval", config.ice.interface_poll_interval);
            config.ice.receive_queue = static_cast<size_t>(
                juint(*ice, "receive_queue", config.ice.receive_queue));
            config.ice.tcp_candidates = jbool(*ice, "tcp_candidates", config.ice.tcp_candidates);
            config.ice.tcp_connect_timeout =
                jduration(*ice, "tcp_connect_timeout_ms", config.ice.tcp_connect_timeout);
            config.ice.tcp_connect_attempts = static_cast<uint32_t>(
                juint(*ice, "tcp_connect_attempts", config.ice.tcp_connect_attempts));
        }

        // handshake section
        if (auto* hs = jsection(root, "handshake")) {
            config.handshake.timeout = jduration(*hs, "timeout_ms", config.handshake.timeout);
            config.handshake.retransmit = jduration(*hs, "retransmit_ms", config.handshake.retransmit);
        }

        // session section
        if (auto* session = jsection(root, "session")) {
            config.session.rotation_interval =
                jduration(*session, "rotation_interval", config.session.rotation_interval);
            config.session.overlap_window =
                jduration(*session, "overlap_window", config.session.overlap_window);
            config.session.max_consecutive_rejections = static_cast<uint32_t>(
                juint(*session, "max_consecutive_rejections", config.session.max_consecutive_rejections));
        }

    } catch (const boost::system::system_error& e) {
        log().error("JSON parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    } catch (const std::exception& e) {
        log().error("Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }

    if (auto err = config.validate()) {
        return std::unexpected(*err);
    }
    return config;
}

std::optional<ConfigError> ConnectivityConfig::validate() const {
    if (ice.max_in_flight == 0) {
        log().error("ice.max_in_flight must be at least 1");
        return ConfigError::INVALID_VALUE;
    }
    if (ice.max_check_attempts == 0) {
        log().error("ice.max_check_attempts must be at least 1");
        return ConfigError::INVALID_VALUE;
    }
    if (ice.receive_queue == 0) {
        log().error("ice.receive_queue must be at least 1");
        return ConfigError::INVALID_VALUE;
    }
    if (ice.tcp_candidates && ice.tcp_connect_attempts == 0) {
        log().error("ice.tcp_connect_attempts must be at least 1");
        return ConfigError::INVALID_VALUE;
    }
    if (session.rotation_interval.count() == 0 ||
        session.overlap_window >= session.rotation_interval) {
        log().error("session.overlap_window ({}s) must be shorter than rotation_interval ({}s)",
                    session.overlap_window.count(), session.rotation_interval.count());
        return ConfigError::INVALID_VALUE;
    }
    if (session.max_consecutive_rejections == 0) {
        log().error("session.max_consecutive_rejections must be at least 1");
        return ConfigError::INVALID_VALUE;
    }
    if (turn.refresh_margin >= turn.lifetime) {
        log().error("turn.refresh_margin must be shorter than turn.lifetime");
        return ConfigError::INVALID_VALUE;
    }
    for (const auto& server : turn.servers) {
        if (server.host.empty()) {
            log().error("TURN server entry without host");
            return ConfigError::INVALID_VALUE;
        }
    }
    return std::nullopt;
}

} // namespace agora
