#include "net/ice_agent.hpp"
#include "common/crypto.hpp"
#include "common/logger.hpp"

#include <algorithm>

namespace agora::net {

namespace {
auto& log() { return Logger::get("net.ice"); }
}

IceAgent::IceAgent(std::shared_ptr<DatagramMux> mux, const ConnectivityConfig& config,
                   IceOptions options, AddressProvider addresses,
                   std::shared_ptr<UpnpMapper> upnp)
    : mux_(std::move(mux))
    , config_(config)
    , options_(options)
    , addresses_(std::move(addresses))
    , upnp_(std::move(upnp))
    , checklist_(options.role, config.ice.max_in_flight, options.force_relay)
    , tie_breaker_(crypto::random_u64())
    , wake_timer_(mux_->get_executor())
    , inbound_(config.ice.receive_queue, mux_->get_executor()) {}

IceAgent::~IceAgent() {
    if (stun_handler_id_ != 0) {
        mux_->remove_stun_handler(stun_handler_id_);
    }
}

void IceAgent::set_local_candidate_handler(LocalCandidateHandler handler) {
    local_handler_ = std::move(handler);
}

void IceAgent::wake() {
    wake_timer_.cancel();
}

// ============================================================================
// Main loop
// ============================================================================

asio::awaitable<std::expected<CandidatePair, ErrorCode>> IceAgent::run() {
    auto self = shared_from_this();
    if (cancelled_ || closed_) {
        co_return std::unexpected(ErrorCode::CANCELLED);
    }

    std::weak_ptr<IceAgent> weak = self;
    stun_handler_id_ = mux_->add_stun_handler(
        [weak](const StunMessage& msg, const udp::endpoint& from, PathId path) {
            auto agent = weak.lock();
            return agent && agent->on_stun_request(msg, from, path);
        });
    mux_->set_datagram_handler(
        [weak](const udp::endpoint& from, PathId path, std::span<const uint8_t> data) {
            if (auto agent = weak.lock()) agent->on_datagram(from, path, data);
        });
    mux_->start();

    log().info("ICE attempt started as {} on {}{}", ice_role_to_string(options_.role),
               endpoint_to_string(mux_->local_endpoint()),
               options_.force_relay ? " (relay only)" : "");

    start_gathering();

    const auto deadline = std::chrono::steady_clock::now() + config_.ice.connect_timeout;
    auto last_check = std::chrono::steady_clock::time_point{};

    for (;;) {
        if (cancelled_) {
            log().info("ICE attempt cancelled");
            co_await release_resources(false);
            co_return std::unexpected(ErrorCode::CANCELLED);
        }

        auto now = std::chrono::steady_clock::now();

        if (checklist_.selected()) {
            if (options_.role == IceRole::CONTROLLED || nomination_done_) {
                auto pair = *checklist_.selected_pair();
                log().info("ICE selected {} -> {} via path {} (rtt {}ms)", to_string(pair.local),
                           to_string(pair.remote), pair.path, pair.rtt ? pair.rtt->count() : -1);
                co_await release_resources(true);
                co_return pair;
            }
            if (nomination_failed_) {
                log().warn("Nomination of the selected pair was not acknowledged");
                co_await release_resources(false);
                co_return std::unexpected(ErrorCode::TRANSPORT_UNREACHABLE);
            }
        } else {
            if (options_.role == IceRole::CONTROLLING && gathering_done_ &&
                checklist_.exhausted() && checklist_.all_failed()) {
                log().warn("All {} candidate pairs failed", checklist_.pairs().size());
                co_await release_resources(false);
                co_return std::unexpected(ErrorCode::TRANSPORT_UNREACHABLE);
            }

            // Pace: one new check per interval
            if (now - last_check >= config_.ice.check_interval) {
                if (auto id = checklist_.next_check()) {
                    last_check = now;
                    asio::co_spawn(mux_->get_executor(), check(*id), asio::detached);
                }
            }
        }

        if (now >= deadline) {
            log().warn("ICE attempt timed out after {}ms ({} pairs)",
                       config_.ice.connect_timeout.count(), checklist_.pairs().size());
            co_await release_resources(false);
            co_return std::unexpected(ErrorCode::TRANSPORT_UNREACHABLE);
        }

        wake_timer_.expires_at(std::min(deadline, now + config_.ice.check_interval));
        boost::system::error_code ec;
        co_await wake_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
}

void IceAgent::cancel() {
    if (cancelled_) return;
    cancelled_ = true;
    if (stun_) stun_->cancel();
    mux_->cancel_transactions();
    wake();
}

// ============================================================================
// Gathering
// ============================================================================

void IceAgent::start_gathering() {
    if (gathering_started_) return;
    gathering_started_ = true;

    auto hosts = addresses_ ? addresses_() : std::vector<asio::ip::address>{};
    const auto port = mux_->local_endpoint().port();

    if (!options_.force_relay) {
        for (size_t i = 0; i < hosts.size(); ++i) {
            Candidate c;
            c.kind = CandidateKind::HOST;
            c.address = udp::endpoint(hosts[i], port);
            c.base = c.address;
            c.priority = candidate_priority(CandidateKind::HOST,
                                            ice::LOCAL_PREF_MAX - static_cast<uint32_t>(i));
            add_local_candidate(c, DIRECT_PATH);
        }
    }

    if (!options_.force_relay && config_.ice.tcp_candidates) {
        gather_tcp(hosts);
        dial_tcp(checklist_.remote_candidates());
    }

    auto ex = mux_->get_executor();
    if (!options_.force_relay && !config_.stun.servers.empty()) {
        stun_ = std::make_unique<StunClient>(mux_, config_.stun);
        ++pending_gathers_;
        asio::co_spawn(ex, gather_reflexive(hosts), asio::detached);
    }
    if (!options_.force_relay && upnp_ && config_.upnp.enabled) {
        ++pending_gathers_;
        asio::co_spawn(ex, gather_mapped(), asio::detached);
    }
    turn_clients_.resize(config_.turn.servers.size());
    for (size_t i = 0; i < config_.turn.servers.size(); ++i) {
        ++pending_gathers_;
        asio::co_spawn(ex, gather_relayed(i), asio::detached);
    }

    if (pending_gathers_ == 0) {
        gathering_done_ = true;
    } else {
        asio::co_spawn(ex, gather_deadline(), asio::detached);
    }
}

void IceAgent::add_local_candidate(const Candidate& candidate, PathId path) {
    bool duplicate = std::any_of(local_candidates_.begin(), local_candidates_.end(), [&](const Candidate& c) {
        return c.address == candidate.address && c.transport == candidate.transport;
    });
    if (duplicate) return;

    local_candidates_.push_back(candidate);
    if (candidate.transport == TransportProtocol::TCP) {
        // Paired per connected stream, see attach_stream
        log().debug("Local candidate {}", to_string(candidate));
    } else {
        auto created = checklist_.add_local(candidate, path);
        log().debug("Local candidate {} on path {} ({} new pairs)", to_string(candidate), path,
                    created.size());
    }

    if (local_handler_) {
        local_handler_(local_candidates_);
    }
    wake();
}

void IceAgent::gather_task_done() {
    if (pending_gathers_ > 0 && --pending_gathers_ == 0 && !gathering_done_) {
        gathering_done_ = true;
        log().debug("Gathering complete: {} local candidates", local_candidates_.size());
        wake();
    }
}

asio::awaitable<void> IceAgent::gather_deadline() {
    auto self = shared_from_this();
    asio::steady_timer timer(mux_->get_executor());
    timer.expires_after(config_.ice.gather_timeout);
    boost::system::error_code ec;
    co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));

    if (!gathering_done_) {
        log().debug("Gathering timed out with {} tasks outstanding", pending_gathers_);
        gathering_done_ = true;
        wake();
    }
}

asio::awaitable<void> IceAgent::gather_reflexive(std::vector<asio::ip::address> hosts) {
    auto self = shared_from_this();
    auto result = co_await stun_->probe(config_.stun.servers, hosts);

    if (result && !cancelled_) {
        nat_ = result->nat;
        if (result->public_address) {
            Candidate c;
            c.kind = CandidateKind::SERVER_REFLEXIVE;
            c.address = *result->public_address;
            c.priority = candidate_priority(CandidateKind::SERVER_REFLEXIVE, ice::LOCAL_PREF_MAX);
            c.base = udp::endpoint(hosts.empty() ? asio::ip::address(asio::ip::address_v4::any())
                                                 : hosts.front(),
                                   mux_->local_endpoint().port());
            add_local_candidate(c, DIRECT_PATH);
        }
    } else if (!result) {
        log().debug("Reflexive gathering failed: {}", error_code_to_string(result.error()));
    }
    gather_task_done();
}

asio::awaitable<void> IceAgent::gather_mapped() {
    auto self = shared_from_this();
    const auto port = mux_->local_endpoint().port();
    auto mapping = co_await upnp_->try_map(port);

    if (mapping) {
        if (cancelled_ || closed_) {
            co_await upnp_->release(*mapping);
        } else {
            mapping_ = mapping;
            Candidate c;
            c.kind = CandidateKind::SERVER_REFLEXIVE;
            c.address = mapping->external;
            c.priority = candidate_priority(CandidateKind::SERVER_REFLEXIVE, ice::LOCAL_PREF_MAPPED);
            c.base = udp::endpoint(asio::ip::address_v4::any(), port);
            for (const auto& local : local_candidates_) {
                if (local.kind == CandidateKind::HOST) {
                    c.base = local.address;
                    break;
                }
            }
            add_local_candidate(c, DIRECT_PATH);
        }
    }
    gather_task_done();
}

asio::awaitable<void> IceAgent::gather_relayed(size_t index) {
    auto self = shared_from_this();
    const auto& server = config_.turn.servers[index];

    auto endpoint = co_await resolve_endpoint(mux_->get_executor(), server.host, server.port);
    if (!endpoint || cancelled_) {
        if (!endpoint) log().warn("Cannot resolve TURN server {}", server.host);
        gather_task_done();
        co_return;
    }

    auto path = static_cast<PathId>(index + 1);
    auto client = std::make_shared<TurnClient>(mux_, config_.turn, server, path);
    turn_clients_[index] = client;

    auto allocation = co_await client->allocate(*endpoint);
    if (!allocation) {
        log().warn("TURN server {} unavailable: {}", server.host, error_code_to_string(allocation.error()));
        turn_clients_[index].reset();
        gather_task_done();
        co_return;
    }
    if (cancelled_ || closed_) {
        co_await client->release();
        turn_clients_[index].reset();
        gather_task_done();
        co_return;
    }

    // Permissions first, so checks through the relay are not dropped
    std::vector<asio::ip::address> peers;
    for (const auto& remote : checklist_.remote_candidates()) {
        if (std::find(peers.begin(), peers.end(), remote.address.address()) == peers.end()) {
            peers.push_back(remote.address.address());
        }
    }
    if (!peers.empty()) {
        auto permitted = co_await client->create_permission(peers);
        if (!permitted) {
            log().warn("TURN permissions on {} failed: {}", server.host,
                       error_code_to_string(permitted.error()));
        }
    }

    Candidate c;
    c.kind = CandidateKind::RELAYED;
    c.address = allocation->relayed;
    c.base = allocation->relayed;
    c.priority = candidate_priority(CandidateKind::RELAYED,
                                    ice::LOCAL_PREF_MAX - static_cast<uint32_t>(index));
    add_local_candidate(c, path);
    gather_task_done();
}

void IceAgent::install_permissions(const std::vector<Candidate>& remotes) {
    std::vector<asio::ip::address> peers;
    for (const auto& remote : remotes) {
        if (remote.transport != TransportProtocol::UDP) continue;
        if (std::find(peers.begin(), peers.end(), remote.address.address()) == peers.end()) {
            peers.push_back(remote.address.address());
        }
    }
    if (peers.empty()) return;

    for (const auto& client : turn_clients_) {
        if (!client || !client->is_allocated()) continue;
        asio::co_spawn(mux_->get_executor(),
            [client, peers]() -> asio::awaitable<void> {
                auto result = co_await client->create_permission(peers);
                if (!result) {
                    log().debug("TURN permission update failed: {}", error_code_to_string(result.error()));
                }
            },
            asio::detached);
    }
}

void IceAgent::add_remote_candidates(const std::vector<Candidate>& candidates) {
    size_t created = 0;
    for (const auto& c : candidates) {
        created += checklist_.add_remote(c).size();
    }
    log().debug("Added {} remote candidates ({} new pairs)", candidates.size(), created);
    install_permissions(candidates);
    dial_tcp(candidates);
    wake();
}

// ============================================================================
// TCP candidates
// ============================================================================

void IceAgent::gather_tcp(const std::vector<asio::ip::address>& hosts) {
    tcp_ = std::make_shared<TcpPuncher>(mux_->get_executor(), config_.ice);

    std::weak_ptr<IceAgent> weak = shared_from_this();
    auto on_accept = [weak](tcp::socket socket) {
        if (auto agent = weak.lock()) agent->attach_stream(std::move(socket));
    };

    // Same number as the UDP port where it is free
    auto port = tcp_->listen(mux_->local_endpoint().port(), on_accept);
    if (!port) port = tcp_->listen(0, on_accept);
    if (!port) {
        log().warn("No TCP candidates: cannot listen");
        tcp_.reset();
        return;
    }

    for (size_t i = 0; i < hosts.size(); ++i) {
        if (!hosts[i].is_v4()) continue;
        Candidate c;
        c.kind = CandidateKind::HOST;
        c.transport = TransportProtocol::TCP;
        c.address = udp::endpoint(hosts[i], *port);
        c.base = c.address;
        c.priority = tcp_candidate_priority(CandidateKind::HOST,
                                            ice::LOCAL_PREF_MAX - static_cast<uint32_t>(i));
        add_local_candidate(c, DIRECT_PATH);
    }
}

void IceAgent::dial_tcp(const std::vector<Candidate>& remotes) {
    if (!tcp_ || cancelled_ || closed_ || checklist_.selected()) return;

    for (const auto& remote : remotes) {
        if (remote.transport != TransportProtocol::TCP || !remote.address.address().is_v4()) continue;
        if (!tcp_dialed_.insert(remote.address).second) continue;
        asio::co_spawn(mux_->get_executor(), connect_stream(remote), asio::detached);
    }
}

asio::awaitable<void> IceAgent::connect_stream(Candidate remote) {
    auto self = shared_from_this();
    auto puncher = tcp_;
    if (!puncher) co_return;

    auto socket = co_await puncher->connect(to_tcp(remote.address));
    if (!socket) {
        log().debug("TCP candidate {} not reachable: {}", to_string(remote),
                    error_code_to_string(socket.error()));
        co_return;
    }
    attach_stream(std::move(*socket));
}

void IceAgent::attach_stream(tcp::socket socket) {
    if (cancelled_ || closed_ || checklist_.selected()) {
        boost::system::error_code ec;
        socket.close(ec);
        return;
    }

    auto path = next_stream_path_++;
    auto stream = std::make_shared<TcpPath>(std::move(socket), mux_, path);
    streams_[path] = stream;
    stream->start();

    Candidate local;
    local.kind = CandidateKind::HOST;
    local.transport = TransportProtocol::TCP;
    local.address = stream->local();
    local.base = local.address;
    local.priority = tcp_candidate_priority(CandidateKind::HOST, ice::LOCAL_PREF_MAX);
    for (const auto& advertised : local_candidates_) {
        if (advertised.transport == TransportProtocol::TCP && advertised.address == local.address) {
            local.priority = advertised.priority;
            break;
        }
    }

    auto created = checklist_.add_stream(local, path, stream->peer());
    log().debug("TCP stream {} -> {} on path {} ({} new pairs)", endpoint_to_string(stream->local()),
                endpoint_to_string(stream->peer()), path, created.size());
    wake();
}

// ============================================================================
// Connectivity checks
// ============================================================================

StunMessage IceAgent::build_check(const CandidatePair& pair, bool use_candidate) const {
    auto msg = StunMessage::request(stun::Method::BINDING);
    const auto pref = local_preference(pair.local.priority);
    msg.add_u32(stun::attr::PRIORITY,
                pair.local.transport == TransportProtocol::TCP
                    ? tcp_candidate_priority(CandidateKind::PEER_REFLEXIVE, pref, pair.local.component)
                    : candidate_priority(CandidateKind::PEER_REFLEXIVE, pref, pair.local.component));
    if (options_.role == IceRole::CONTROLLING) {
        msg.add_u64(stun::attr::ICE_CONTROLLING, tie_breaker_);
    } else {
        msg.add_u64(stun::attr::ICE_CONTROLLED, tie_breaker_);
    }
    if (use_candidate) {
        msg.add_flag(stun::attr::USE_CANDIDATE);
    }
    return msg;
}

bool IceAgent::send_on_path(PathId path, const udp::endpoint& to, std::span<const uint8_t> data) {
    if (path == DIRECT_PATH) {
        return mux_->send_to(data, to);
    }
    if (is_stream_path(path)) {
        auto it = streams_.find(path);
        if (it == streams_.end() || it->second->peer() != to) return false;
        return it->second->send(data);
    }
    size_t index = path - 1;
    if (index >= turn_clients_.size() || !turn_clients_[index]) return false;
    return turn_clients_[index]->send_to(to, data);
}

SendFn IceAgent::path_sender(PathId path, const udp::endpoint& to) {
    std::weak_ptr<IceAgent> weak = shared_from_this();
    return [weak, path, to](std::span<const uint8_t> data) {
        auto agent = weak.lock();
        return agent && agent->send_on_path(path, to, data);
    };
}

asio::awaitable<void> IceAgent::check(uint32_t pair_id) {
    auto self = shared_from_this();
    const auto* found = checklist_.find_pair(pair_id);
    if (!found) co_return;
    const CandidatePair pair = *found;

    auto msg = build_check(pair, false);
    in_flight_[pair_id] = msg.transaction_id();

    RetryPolicy policy{config_.ice.max_check_attempts, config_.ice.check_timeout,
                       config_.ice.check_timeout * 2, 2.0, 0.0};
    auto started = std::chrono::steady_clock::now();

    log().trace("Check {} -> {} on path {}", to_string(pair.local), to_string(pair.remote), pair.path);
    auto response = co_await mux_->transact(msg.transaction_id(), msg.encode(),
                                            path_sender(pair.path, pair.remote.address), policy);
    in_flight_.erase(pair_id);
    if (cancelled_) co_return;

    bool ok = response &&
              response->message.message_class() == stun::Class::SUCCESS &&
              response->from == pair.remote.address &&
              response->path == pair.path;

    if (!ok) {
        if (checklist_.on_failure(pair_id)) {
            log().debug("Check to {} on path {} failed", endpoint_to_string(pair.remote.address), pair.path);
        }
        wake();
        co_return;
    }

    auto rtt = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (checklist_.on_success(pair_id, rtt)) {
        log().debug("Check to {} on path {} succeeded ({}ms)",
                    endpoint_to_string(pair.remote.address), pair.path, rtt.count());

        if (!checklist_.selected()) {
            if (options_.role == IceRole::CONTROLLING) {
                if (auto best = checklist_.best_succeeded()) promote(*best);
            } else if (const auto* p = checklist_.find_pair(pair_id); p && p->nominated) {
                promote(pair_id);
            }
        }
    }
    wake();
}

void IceAgent::promote(uint32_t pair_id) {
    if (!checklist_.promote(pair_id)) return;

    const auto* pair = checklist_.selected_pair();
    log().info("Promoted pair {} -> {} on path {}", to_string(pair->local), to_string(pair->remote),
               pair->path);

    // Remaining checks are moot
    for (const auto& [id, transaction] : in_flight_) {
        if (id != pair_id) mux_->cancel_transaction(transaction);
    }

    if (options_.role == IceRole::CONTROLLING) {
        asio::co_spawn(mux_->get_executor(), nominate(pair_id), asio::detached);
    }
    flush_early_datagrams();
    wake();
}

asio::awaitable<void> IceAgent::nominate(uint32_t pair_id) {
    auto self = shared_from_this();
    const auto* found = checklist_.find_pair(pair_id);
    if (!found) co_return;
    const CandidatePair pair = *found;

    auto msg = build_check(pair, true);
    RetryPolicy policy{config_.ice.max_check_attempts, config_.ice.check_timeout,
                       config_.ice.check_timeout * 2, 2.0, 0.0};
    auto response = co_await mux_->transact(msg.transaction_id(), msg.encode(),
                                            path_sender(pair.path, pair.remote.address), policy);
    if (cancelled_) co_return;

    if (response && response->message.message_class() == stun::Class::SUCCESS &&
        response->from == pair.remote.address && response->path == pair.path) {
        nomination_done_ = true;
    } else {
        nomination_failed_ = true;
    }
    wake();
}

// ============================================================================
// Incoming traffic
// ============================================================================

bool IceAgent::on_stun_request(const StunMessage& msg, const udp::endpoint& from, PathId path) {
    if (!msg.is_request() || msg.method() != stun::Method::BINDING) return false;

    // Always answer: before promotion this is a check, afterwards a keepalive
    auto reply = StunMessage::success_for(msg);
    reply.add_xor_address(stun::attr::XOR_MAPPED_ADDRESS, from);
    send_on_path(path, from, reply.encode());

    if (cancelled_ || closed_ || checklist_.selected()) return true;

    auto priority = msg.get_u32(stun::attr::PRIORITY).value_or(0);
    auto id = checklist_.add_peer_reflexive(from, priority, path);
    if (!id) return true;

    if (msg.has(stun::attr::USE_CANDIDATE) && options_.role == IceRole::CONTROLLED) {
        const auto* pair = checklist_.find_pair(*id);
        if (pair && pair->state == PairState::SUCCEEDED) {
            promote(*id);
        } else {
            checklist_.nominate(*id);
        }
    } else {
        checklist_.trigger(*id);
    }
    wake();
    return true;
}

void IceAgent::on_datagram(const udp::endpoint& from, PathId path, std::span<const uint8_t> data) {
    if (const auto* selected = checklist_.selected_pair()) {
        if (selected->path != path || selected->remote.address != from) {
            log().trace("Dropping datagram from {} off the selected path", endpoint_to_string(from));
            return;
        }
        if (!inbound_.try_send(Datagram(data.begin(), data.end()))) {
            log().debug("Receive queue full, dropping {} bytes", data.size());
        }
        return;
    }

    // The peer may promote and start its handshake before we do
    if (early_.size() < network::HANDSHAKE_QUEUE_CAPACITY) {
        early_.push_back({from, path, Datagram(data.begin(), data.end())});
    }
}

void IceAgent::flush_early_datagrams() {
    const auto* selected = checklist_.selected_pair();
    if (!selected) return;

    for (auto& early : early_) {
        if (early.path == selected->path && early.from == selected->remote.address) {
            inbound_.try_send(std::move(early.data));
        }
    }
    early_.clear();
}

// ============================================================================
// Selected path
// ============================================================================

bool IceAgent::send(std::span<const uint8_t> data) {
    const auto* selected = checklist_.selected_pair();
    if (!selected || closed_) return false;
    return send_on_path(selected->path, selected->remote.address, data);
}

asio::awaitable<std::expected<Datagram, ErrorCode>> IceAgent::receive_until(
    std::chrono::steady_clock::time_point deadline) {
    co_return co_await inbound_.read_until(deadline);
}

std::optional<CandidatePair> IceAgent::selected_pair() const {
    if (const auto* pair = checklist_.selected_pair()) return *pair;
    return std::nullopt;
}

bool IceAgent::used_relay() const {
    const auto* pair = checklist_.selected_pair();
    return pair && (pair->local.kind == CandidateKind::RELAYED ||
                    pair->remote.kind == CandidateKind::RELAYED);
}

// ============================================================================
// Teardown
// ============================================================================

asio::awaitable<void> IceAgent::release_resources(bool keep_selected) {
    auto self = shared_from_this();
    std::optional<PathId> keep;
    if (keep_selected) {
        if (const auto* pair = checklist_.selected_pair()) keep = pair->path;
    }

    if (tcp_) {
        tcp_->close();
        tcp_.reset();
    }
    for (auto it = streams_.begin(); it != streams_.end();) {
        if (keep && it->first == *keep) {
            ++it;
            continue;
        }
        it->second->close();
        it = streams_.erase(it);
    }

    for (auto& client : turn_clients_) {
        if (!client) continue;
        if (keep && client->path() == *keep) continue;
        auto released = client;
        client.reset();
        co_await released->release();
    }

    if (!keep_selected && mapping_ && upnp_) {
        auto mapping = *mapping_;
        mapping_.reset();
        co_await upnp_->release(mapping);
    }
}

asio::awaitable<void> IceAgent::close() {
    auto self = shared_from_this();
    if (closed_) co_return;
    closed_ = true;
    cancelled_ = true;

    if (stun_handler_id_ != 0) {
        mux_->remove_stun_handler(stun_handler_id_);
        stun_handler_id_ = 0;
    }
    co_await release_resources(false);

    inbound_.close();
    wake_timer_.cancel();
    mux_->stop();
    log().debug("ICE agent closed");
}

} // namespace agora::net
