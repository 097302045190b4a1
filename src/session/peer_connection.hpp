#pragma once

#include "common/async_channel.hpp"
#include "common/config.hpp"
#include "common/protocol.hpp"
#include "net/ice_agent.hpp"
#include "session/handshake.hpp"
#include "session/identity.hpp"
#include "session/secure_channel.hpp"
#include "session/session_key_manager.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace agora::session {

namespace asio = boost::asio;

/**
 * PeerConnection - authenticated, encrypted path to one peer
 *
 * Owns the ICE agent (and through it the socket, TURN allocation and port
 * mapping), the session keys and the secure channel. A pump task decrypts
 * incoming frames into the receive queue and answers handshake
 * retransmissions; a maintenance task rotates and sweeps key epochs.
 * Neither task keeps the connection alive. Closing the channel, by close(),
 * by too many rejected frames or by dropping the last reference, releases
 * the path.
 *
 * All methods run on the connection's executor.
 */
class PeerConnection : public std::enable_shared_from_this<PeerConnection> {
public:
    PeerConnection(std::shared_ptr<net::IceAgent> agent,
                   std::shared_ptr<const PeerIdentity> identity,
                   std::unique_ptr<HandshakeEngine> handshake,
                   const ConnectivityConfig& config);
    ~PeerConnection();

    PeerConnection(const PeerConnection&) = delete;
    PeerConnection& operator=(const PeerConnection&) = delete;

    // Spawn the pump and maintenance tasks. early_frames are secure frames
    // that overtook the end of the handshake.
    void start(std::vector<net::Datagram> early_frames = {});

    // Errors: CHANNEL_CLOSED, MESSAGE_TOO_LARGE, SYSTEM_ERROR
    asio::awaitable<std::expected<void, ErrorCode>> send(std::span<const uint8_t> data);

    // Next authenticated plaintext. CHANNEL_CLOSED once closed and drained.
    asio::awaitable<std::expected<std::vector<uint8_t>, ErrorCode>> receive();

    // Release the path and wipe keys
    asio::awaitable<void> close();

    // Start a new key epoch now. Returns its id.
    std::expected<uint32_t, ErrorCode> rotate_keys();

    Fingerprint peer_fingerprint() const;
    const PeerId& peer_id() const { return remote_peer_id_; }
    const Ed25519PublicKey& peer_public_key() const { return remote_public_key_; }
    HandshakeRole role() const { return handshake_->role(); }

    bool used_relay() const { return agent_->used_relay(); }
    std::optional<net::CandidatePair> selected_pair() const { return agent_->selected_pair(); }
    ChannelStats stats() const { return channel_->stats(); }
    uint32_t current_epoch() const { return keys_->current_epoch(); }
    bool is_open() const { return !closed_; }

private:
    static asio::awaitable<void> pump(std::weak_ptr<PeerConnection> weak,
                                      std::shared_ptr<net::IceAgent> agent);
    static asio::awaitable<void> maintain(std::weak_ptr<PeerConnection> weak,
                                          std::shared_ptr<asio::steady_timer> timer);
    void handle(std::span<const uint8_t> datagram);
    void shutdown_local();
    void release_path();

    std::shared_ptr<net::IceAgent> agent_;
    std::shared_ptr<const PeerIdentity> identity_;   // outlives handshake_
    std::unique_ptr<HandshakeEngine> handshake_;
    ConnectivityConfig config_;

    PeerId remote_peer_id_;
    Ed25519PublicKey remote_public_key_{};

    std::shared_ptr<SessionKeyManager> keys_;
    std::unique_ptr<SecureChannel> channel_;

    AsyncChannel<std::vector<uint8_t>> delivered_;
    std::shared_ptr<asio::steady_timer> maintenance_timer_;
    bool started_ = false;
    bool closed_ = false;
    bool path_released_ = false;
};

} // namespace agora::session
