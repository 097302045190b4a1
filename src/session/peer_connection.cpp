#include "session/peer_connection.hpp"
#include "common/crypto/ed25519.hpp"
#include "common/logger.hpp"

namespace agora::session {

namespace {
auto& log() { return Logger::get("session.connector"); }
}

PeerConnection::PeerConnection(std::shared_ptr<net::IceAgent> agent,
                               std::shared_ptr<const PeerIdentity> identity,
                               std::unique_ptr<HandshakeEngine> handshake,
                               const ConnectivityConfig& config)
    : agent_(std::move(agent))
    , identity_(std::move(identity))
    , handshake_(std::move(handshake))
    , config_(config)
    , delivered_(config.ice.receive_queue, agent_->mux()->get_executor())
    , maintenance_timer_(std::make_shared<asio::steady_timer>(agent_->mux()->get_executor())) {

    const auto& result = *handshake_->result();
    remote_peer_id_ = result.remote_peer_id;
    remote_public_key_ = result.remote_public_key;

    keys_ = std::make_shared<SessionKeyManager>(result, config_.session);
    handshake_->release_secret();
    channel_ = std::make_unique<SecureChannel>(keys_, config_.session);
}

PeerConnection::~PeerConnection() {
    shutdown_local();
    release_path();
}

void PeerConnection::start(std::vector<net::Datagram> early_frames) {
    if (started_ || closed_) return;
    started_ = true;

    for (const auto& frame : early_frames) {
        handle(frame);
    }

    auto ex = agent_->mux()->get_executor();
    std::weak_ptr<PeerConnection> weak = shared_from_this();
    asio::co_spawn(ex, pump(weak, agent_), asio::detached);
    asio::co_spawn(ex, maintain(weak, maintenance_timer_), asio::detached);

    auto pair = agent_->selected_pair();
    log().info("Connected to {} [{}] via {}{}", remote_peer_id_, format_fingerprint(peer_fingerprint()),
               pair ? net::endpoint_to_string(pair->remote.address) : std::string("?"),
               used_relay() ? " (relayed)" : "");
}

Fingerprint PeerConnection::peer_fingerprint() const {
    return crypto::Ed25519::key_fingerprint(remote_public_key_);
}

// ============================================================================
// Data path
// ============================================================================

asio::awaitable<std::expected<void, ErrorCode>> PeerConnection::send(std::span<const uint8_t> data) {
    if (closed_) {
        co_return std::unexpected(ErrorCode::CHANNEL_CLOSED);
    }
    auto wire = channel_->send(data);
    if (!wire) {
        co_return std::unexpected(wire.error());
    }
    if (!agent_->send(*wire)) {
        log().debug("Send of {} bytes to {} failed", wire->size(), remote_peer_id_);
        co_return std::unexpected(ErrorCode::SYSTEM_ERROR);
    }
    co_return std::expected<void, ErrorCode>{};
}

asio::awaitable<std::expected<std::vector<uint8_t>, ErrorCode>> PeerConnection::receive() {
    auto frame = co_await delivered_.read();
    if (!frame) {
        co_return std::unexpected(ErrorCode::CHANNEL_CLOSED);
    }
    co_return std::move(*frame);
}

void PeerConnection::handle(std::span<const uint8_t> datagram) {
    if (SecureChannel::is_secure_frame(datagram)) {
        auto plaintext = channel_->receive(datagram);
        if (plaintext) {
            if (!delivered_.try_send(std::move(*plaintext))) {
                log().debug("Receive queue for {} full, dropping frame", remote_peer_id_);
            }
        } else if (plaintext.error() == ErrorCode::CHANNEL_CLOSED) {
            log().warn("Channel to {} closed after repeated rejections", remote_peer_id_);
            shutdown_local();
            release_path();
        }
        return;
    }

    if (is_handshake_message(datagram)) {
        // Our msg3 got lost, the responder is retransmitting msg2
        auto reply = handshake_->on_message(datagram);
        if (reply && *reply) {
            agent_->send(**reply);
        }
        return;
    }

    log().trace("Dropping {} byte datagram of unknown type from {}", datagram.size(), remote_peer_id_);
}

asio::awaitable<void> PeerConnection::pump(std::weak_ptr<PeerConnection> weak,
                                           std::shared_ptr<net::IceAgent> agent) {
    for (;;) {
        auto datagram = co_await agent->receive_until(std::chrono::steady_clock::time_point::max());
        if (!datagram) break;
        auto self = weak.lock();
        if (!self || self->closed_) break;
        self->handle(*datagram);
    }
    log().debug("Receive pump finished");
}

asio::awaitable<void> PeerConnection::maintain(std::weak_ptr<PeerConnection> weak,
                                               std::shared_ptr<asio::steady_timer> timer) {
    for (;;) {
        timer->expires_after(defaults::SESSION_MAINTENANCE_INTERVAL);
        boost::system::error_code ec;
        co_await timer->async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec == asio::error::operation_aborted) break;

        auto self = weak.lock();
        if (!self || self->closed_) break;
        auto now = Clock::now();
        self->keys_->sweep(now);
        if (self->keys_->rotation_due(now)) {
            self->keys_->rotate(now);
        }
    }
}

std::expected<uint32_t, ErrorCode> PeerConnection::rotate_keys() {
    if (closed_) {
        return std::unexpected(ErrorCode::CHANNEL_CLOSED);
    }
    return keys_->rotate();
}

// ============================================================================
// Teardown
// ============================================================================

void PeerConnection::shutdown_local() {
    if (closed_) return;
    closed_ = true;
    channel_->close();
    delivered_.close();
    maintenance_timer_->cancel();
}

void PeerConnection::release_path() {
    if (path_released_) return;
    path_released_ = true;
    asio::co_spawn(agent_->mux()->get_executor(),
                   [agent = agent_]() { return agent->close(); }, asio::detached);
}

asio::awaitable<void> PeerConnection::close() {
    auto self = shared_from_this();
    bool was_open = !closed_;
    shutdown_local();
    path_released_ = true;
    co_await agent_->close();
    if (was_open) {
        auto stats = channel_->stats();
        log().info("Closed connection to {} ({} frames out, {} in, {} rejected)", remote_peer_id_,
                   stats.frames_sent, stats.frames_received, stats.frames_rejected);
    }
}

} // namespace agora::session
