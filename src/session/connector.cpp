#include "session/connector.hpp"
#include "common/logger.hpp"
#include "net/datagram_mux.hpp"
#include "net/stun_client.hpp"
#include "session/secure_channel.hpp"

#include <algorithm>

namespace agora::session {

namespace {

auto& log() { return Logger::get("session.connector"); }

std::expected<std::shared_ptr<net::DatagramSocket>, ErrorCode> open_udp_socket(
    asio::any_io_executor ex, uint16_t port) {
    auto sock = net::UdpDatagramSocket::open(ex, port);
    if (!sock) return std::unexpected(sock.error());
    return std::shared_ptr<net::DatagramSocket>(*sock);
}

}  // namespace

Connector::Connector(asio::any_io_executor ex, std::shared_ptr<const PeerIdentity> identity,
                     ConnectivityConfig config, std::shared_ptr<CandidateSignaler> signaler,
                     ConnectorEnvironment env)
    : executor_(std::move(ex))
    , identity_(std::move(identity))
    , config_(std::move(config))
    , signaler_(std::move(signaler))
    , env_(std::move(env))
    , poll_timer_(executor_) {

    if (!env_.open_socket) env_.open_socket = open_udp_socket;
    if (!env_.local_addresses) env_.local_addresses = net::enumerate_local_addresses;

    if (env_.port_mapping && config_.upnp.enabled) {
        upnp_ = std::make_shared<net::UpnpMapper>(executor_, config_.upnp);
    }
    last_addresses_ = net::sorted_addresses(env_.local_addresses());

    log().info("Connector ready for {} [{}]", identity_->peer_id(),
               format_fingerprint(identity_->fingerprint()));
}

Connector::~Connector() {
    poll_timer_.cancel();
}

void Connector::start() {
    if (running_) return;
    running_ = true;
    asio::co_spawn(executor_, [self = shared_from_this()]() { return self->interface_poll_loop(); },
                   asio::detached);
}

void Connector::stop() {
    running_ = false;
    poll_timer_.cancel();
    for (auto& [peer, attempt] : attempts_) {
        attempt->cancelled = true;
        if (attempt->agent) attempt->agent->cancel();
    }
}

// ============================================================================
// connect
// ============================================================================

asio::awaitable<std::expected<std::shared_ptr<PeerConnection>, ErrorCode>> Connector::connect(
    const PeerId& peer, std::vector<net::Candidate> candidates, ConnectOptions options) {

    auto self = shared_from_this();
    if (peer.empty() || peer == identity_->peer_id()) {
        co_return std::unexpected(ErrorCode::INVALID_ARGUMENT);
    }
    if (attempts_.contains(peer)) {
        log().warn("Connection attempt to {} already running", peer);
        co_return std::unexpected(ErrorCode::INVALID_ARGUMENT);
    }

    auto socket = env_.open_socket(executor_, config_.ice.bind_port);
    if (!socket && config_.ice.bind_port != 0) {
        log().warn("Port {} unavailable, using an ephemeral port", config_.ice.bind_port);
        socket = env_.open_socket(executor_, 0);
    }
    if (!socket) {
        co_return std::unexpected(socket.error());
    }

    auto mux = std::make_shared<net::DatagramMux>(executor_, *socket);
    auto ice_role = identity_->peer_id() < peer ? net::IceRole::CONTROLLING : net::IceRole::CONTROLLED;
    auto hs_role = ice_role == net::IceRole::CONTROLLING ? HandshakeRole::INITIATOR : HandshakeRole::RESPONDER;

    auto agent = std::make_shared<net::IceAgent>(
        mux, config_, net::IceOptions{ice_role, options.force_relay}, env_.local_addresses, upnp_);

    std::weak_ptr<CandidateSignaler> weak_signaler = signaler_;
    agent->set_local_candidate_handler(
        [weak_signaler, peer, local_id = identity_->peer_id()](const std::vector<net::Candidate>& all) {
            auto signaler = weak_signaler.lock();
            if (!signaler) return;
            net::CandidateAdvertisement advertisement;
            advertisement.peer_id = local_id;
            auto count = std::min(all.size(), protocol::MAX_CANDIDATES);
            advertisement.candidates.assign(all.begin(), all.begin() + count);
            signaler->advertise(peer, advertisement);
        });

    if (auto it = pending_remote_.find(peer); it != pending_remote_.end()) {
        candidates.insert(candidates.end(), it->second.begin(), it->second.end());
        pending_remote_.erase(it);
    }
    agent->add_remote_candidates(candidates);

    auto attempt = std::make_shared<Attempt>();
    attempt->agent = agent;
    attempts_[peer] = attempt;

    log().info("Connecting to {} with {} candidates as {}{}", peer, candidates.size(),
               net::ice_role_to_string(ice_role), options.force_relay ? ", relay only" : "");

    auto finish_failed = [&](ErrorCode code) -> asio::awaitable<std::expected<std::shared_ptr<PeerConnection>, ErrorCode>> {
        co_await agent->close();
        if (auto it = attempts_.find(peer); it != attempts_.end() && it->second == attempt) {
            attempts_.erase(it);
        }
        log().warn("Connection to {} failed: {}", peer, error_code_to_string(code));
        co_return std::unexpected(code);
    };

    auto pair = co_await agent->run();
    if (auto assessment = agent->nat_assessment()) {
        remember_assessment(*assessment);
    }
    if (!pair) {
        co_return co_await finish_failed(pair.error());
    }
    if (attempt->cancelled) {
        co_return co_await finish_failed(ErrorCode::CANCELLED);
    }

    auto outcome = co_await run_handshake(attempt, peer, hs_role);
    if (!outcome) {
        co_return co_await finish_failed(outcome.error());
    }
    if (attempt->cancelled) {
        co_return co_await finish_failed(ErrorCode::CANCELLED);
    }

    auto connection = std::make_shared<PeerConnection>(agent, identity_, std::move(outcome->engine), config_);
    connection->start(std::move(outcome->early_frames));

    if (auto it = attempts_.find(peer); it != attempts_.end() && it->second == attempt) {
        attempts_.erase(it);
    }
    co_return connection;
}

// ============================================================================
// Handshake driver
// ============================================================================

asio::awaitable<std::expected<Connector::HandshakeOutcome, ErrorCode>> Connector::run_handshake(
    std::shared_ptr<Attempt> attempt, const PeerId& peer, HandshakeRole role) {

    auto self = shared_from_this();
    auto& agent = attempt->agent;
    auto engine = std::make_unique<HandshakeEngine>(*identity_, role, peer);
    std::vector<net::Datagram> early_frames;

    const auto deadline = std::chrono::steady_clock::now() + config_.handshake.timeout;
    auto interval = config_.handshake.retransmit;

    if (role == HandshakeRole::INITIATOR) {
        auto msg1 = engine->start();
        if (!msg1) co_return std::unexpected(msg1.error());
        agent->send(*msg1);
    }
    auto next_retransmit = std::chrono::steady_clock::now() + interval;

    while (!engine->is_established()) {
        if (attempt->cancelled) {
            co_return std::unexpected(ErrorCode::CANCELLED);
        }

        auto datagram = co_await agent->receive_until(std::min(deadline, next_retransmit));
        auto now = std::chrono::steady_clock::now();

        if (!datagram) {
            if (datagram.error() == ErrorCode::CHANNEL_CLOSED) {
                co_return std::unexpected(ErrorCode::CANCELLED);
            }
            if (now >= deadline) {
                log().warn("Handshake with {} timed out in state {}", peer,
                           handshake_state_to_string(engine->state()));
                co_return std::unexpected(ErrorCode::HANDSHAKE_TIMEOUT);
            }
            if (!engine->last_sent().empty()) {
                log().trace("Retransmitting handshake message to {}", peer);
                agent->send(engine->last_sent());
            }
            interval = std::min(interval * 2, config_.handshake.timeout);
            next_retransmit = now + interval;
            continue;
        }

        if (SecureChannel::is_secure_frame(*datagram)) {
            // The initiator finished first and is already sending
            if (early_frames.size() < network::HANDSHAKE_QUEUE_CAPACITY) {
                early_frames.push_back(std::move(*datagram));
            }
            continue;
        }
        if (!is_handshake_message(*datagram)) {
            continue;
        }

        auto reply = engine->on_message(*datagram);
        if (!reply) {
            co_return std::unexpected(reply.error());
        }
        if (*reply) {
            agent->send(**reply);
        }
    }

    HandshakeOutcome outcome;
    outcome.engine = std::move(engine);
    outcome.early_frames = std::move(early_frames);
    co_return outcome;
}

// ============================================================================
// Trickle and cancellation
// ============================================================================

void Connector::on_remote_candidates(const net::CandidateAdvertisement& advertisement) {
    if (advertisement.peer_id.empty() || advertisement.peer_id == identity_->peer_id()) return;

    auto it = attempts_.find(advertisement.peer_id);
    if (it != attempts_.end() && it->second->agent) {
        it->second->agent->add_remote_candidates(advertisement.candidates);
        return;
    }

    // Latest advertisement wins
    auto& pending = pending_remote_[advertisement.peer_id];
    pending = advertisement.candidates;
    if (pending.size() > protocol::MAX_CANDIDATES) {
        pending.resize(protocol::MAX_CANDIDATES);
    }
}

void Connector::cancel(const PeerId& peer) {
    pending_remote_.erase(peer);
    auto it = attempts_.find(peer);
    if (it == attempts_.end()) return;

    log().info("Cancelling connection attempt to {}", peer);
    it->second->cancelled = true;
    if (it->second->agent) it->second->agent->cancel();
}

// ============================================================================
// NAT assessment
// ============================================================================

std::optional<net::NatAssessment> Connector::nat_assessment() const {
    auto it = nat_cache_.find(last_addresses_);
    if (it == nat_cache_.end()) return std::nullopt;
    return it->second;
}

void Connector::remember_assessment(const net::NatAssessment& assessment) {
    auto& cached = nat_cache_[last_addresses_];
    if (cached != assessment) {
        log().info("NAT behaviour: {}{}", net::nat_type_to_string(assessment.type),
                   assessment.can_hole_punch ? "" : " (relay likely needed)");
    }
    cached = assessment;
}

asio::awaitable<void> Connector::interface_poll_loop() {
    auto self = shared_from_this();
    while (running_) {
        poll_timer_.expires_after(config_.ice.interface_poll_interval);
        boost::system::error_code ec;
        co_await poll_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec == asio::error::operation_aborted || !running_) break;

        auto current = net::sorted_addresses(env_.local_addresses());
        if (current == last_addresses_) continue;

        log().info("Local interfaces changed ({} -> {} addresses), re-probing NAT",
                   last_addresses_.size(), current.size());
        nat_cache_.erase(last_addresses_);
        last_addresses_ = current;
        co_await reprobe(current);
    }
}

asio::awaitable<void> Connector::reprobe(std::vector<asio::ip::address> addresses) {
    auto self = shared_from_this();
    if (config_.stun.servers.empty()) co_return;

    auto socket = env_.open_socket(executor_, 0);
    if (!socket) co_return;

    auto mux = std::make_shared<net::DatagramMux>(executor_, *socket);
    mux->start();
    net::StunClient stun(mux, config_.stun);
    auto result = co_await stun.probe(config_.stun.servers, addresses);
    mux->stop();

    if (result) {
        remember_assessment(result->nat);
    } else {
        log().debug("NAT re-probe failed: {}", error_code_to_string(result.error()));
    }
}

} // namespace agora::session
