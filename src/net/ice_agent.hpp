#pragma once

#include "common/async_channel.hpp"
#include "common/config.hpp"
#include "common/protocol.hpp"
#include "net/candidate.hpp"
#include "net/datagram_mux.hpp"
#include "net/ice_checklist.hpp"
#include "net/local_addresses.hpp"
#include "net/nat.hpp"
#include "net/stun_client.hpp"
#include "net/tcp_punch.hpp"
#include "net/turn_client.hpp"
#include "net/upnp_mapper.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <vector>

namespace agora::net {

// Datagram received on the selected path
using Datagram = std::vector<uint8_t>;

struct IceOptions {
    IceRole role = IceRole::CONTROLLING;
    bool force_relay = false;
};

/**
 * IceAgent - turns local and remote candidate sets into one usable path
 *
 * Gathers host, server-reflexive, port-mapped and relayed candidates in
 * parallel, pairs them as they trickle in, runs paced connectivity checks
 * and promotes exactly one pair. TCP candidates are dialed as soon as both
 * ends are known; each connected stream becomes a path of its own. After promotion it keeps answering
 * Binding requests and exposes the path for datagrams.
 *
 * Runs on the mux's executor; none of the methods are thread-safe.
 */
class IceAgent : public std::enable_shared_from_this<IceAgent> {
public:
    using LocalCandidateHandler = std::function<void(const std::vector<Candidate>& all)>;

    IceAgent(std::shared_ptr<DatagramMux> mux, const ConnectivityConfig& config,
             IceOptions options, AddressProvider addresses,
             std::shared_ptr<UpnpMapper> upnp = nullptr);
    ~IceAgent();

    IceAgent(const IceAgent&) = delete;
    IceAgent& operator=(const IceAgent&) = delete;

    // Called with the full local list each time a candidate is gathered
    void set_local_candidate_handler(LocalCandidateHandler handler);

    // Remote candidates from the connect call or trickled later
    void add_remote_candidates(const std::vector<Candidate>& candidates);

    // Gather and check until one pair is promoted.
    // Errors: TRANSPORT_UNREACHABLE, CANCELLED.
    asio::awaitable<std::expected<CandidatePair, ErrorCode>> run();

    // Abort run() with CANCELLED at its next suspension point
    void cancel();

    // Release TURN allocations and port mappings, stop the mux
    asio::awaitable<void> close();

    // ========================================================================
    // Selected path
    // ========================================================================

    bool send(std::span<const uint8_t> data);
    asio::awaitable<std::expected<Datagram, ErrorCode>> receive_until(
        std::chrono::steady_clock::time_point deadline);

    std::optional<CandidatePair> selected_pair() const;
    bool used_relay() const;

    // ========================================================================
    // Introspection
    // ========================================================================

    IceRole role() const { return options_.role; }
    const std::vector<Candidate>& local_candidates() const { return local_candidates_; }
    const CheckList& checklist() const { return checklist_; }
    const std::optional<NatAssessment>& nat_assessment() const { return nat_; }
    bool gathering_done() const { return gathering_done_; }
    std::shared_ptr<DatagramMux> mux() const { return mux_; }

private:
    // Gathering
    void start_gathering();
    void add_local_candidate(const Candidate& candidate, PathId path);
    void gather_task_done();
    asio::awaitable<void> gather_reflexive(std::vector<asio::ip::address> hosts);
    asio::awaitable<void> gather_mapped();
    asio::awaitable<void> gather_relayed(size_t index);
    asio::awaitable<void> gather_deadline();
    void install_permissions(const std::vector<Candidate>& remotes);

    // TCP candidates
    void gather_tcp(const std::vector<asio::ip::address>& hosts);
    void dial_tcp(const std::vector<Candidate>& remotes);
    asio::awaitable<void> connect_stream(Candidate remote);
    void attach_stream(tcp::socket socket);

    // Checks
    asio::awaitable<void> check(uint32_t pair_id);
    asio::awaitable<void> nominate(uint32_t pair_id);
    void promote(uint32_t pair_id);
    StunMessage build_check(const CandidatePair& pair, bool use_candidate) const;
    SendFn path_sender(PathId path, const udp::endpoint& to);
    bool send_on_path(PathId path, const udp::endpoint& to, std::span<const uint8_t> data);

    // Incoming
    bool on_stun_request(const StunMessage& msg, const udp::endpoint& from, PathId path);
    void on_datagram(const udp::endpoint& from, PathId path, std::span<const uint8_t> data);
    void flush_early_datagrams();

    void wake();
    asio::awaitable<void> release_resources(bool keep_selected);

    std::shared_ptr<DatagramMux> mux_;
    ConnectivityConfig config_;
    IceOptions options_;
    AddressProvider addresses_;
    std::shared_ptr<UpnpMapper> upnp_;

    CheckList checklist_;
    uint64_t tie_breaker_;
    std::vector<Candidate> local_candidates_;
    LocalCandidateHandler local_handler_;

    std::unique_ptr<StunClient> stun_;
    std::vector<std::shared_ptr<TurnClient>> turn_clients_;  // index = path - 1
    std::optional<ExternalMapping> mapping_;

    std::shared_ptr<TcpPuncher> tcp_;
    std::map<PathId, std::shared_ptr<TcpPath>> streams_;
    std::set<udp::endpoint> tcp_dialed_;
    PathId next_stream_path_ = STREAM_PATH_BASE;

    std::optional<NatAssessment> nat_;

    size_t pending_gathers_ = 0;
    bool gathering_started_ = false;
    bool gathering_done_ = false;
    bool nomination_done_ = false;
    bool nomination_failed_ = false;
    bool cancelled_ = false;
    bool closed_ = false;

    // Transactions of checks still in flight, cancelled on promotion
    std::map<uint32_t, TransactionId> in_flight_;

    uint64_t stun_handler_id_ = 0;
    asio::steady_timer wake_timer_;

    // Non-STUN datagrams that arrive before promotion
    struct EarlyDatagram {
        udp::endpoint from;
        PathId path;
        Datagram data;
    };
    std::vector<EarlyDatagram> early_;

    AsyncChannel<Datagram> inbound_;
};

} // namespace agora::net
