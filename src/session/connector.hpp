#pragma once

#include "common/config.hpp"
#include "common/protocol.hpp"
#include "net/candidate.hpp"
#include "net/datagram_socket.hpp"
#include "net/ice_agent.hpp"
#include "net/local_addresses.hpp"
#include "net/nat.hpp"
#include "net/upnp_mapper.hpp"
#include "session/handshake.hpp"
#include "session/identity.hpp"
#include "session/peer_connection.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace agora::session {

namespace asio = boost::asio;

// Publishes our candidates to a peer; implemented over the DHT by the host
class CandidateSignaler {
public:
    virtual ~CandidateSignaler() = default;
    virtual void advertise(const PeerId& peer, const net::CandidateAdvertisement& advertisement) = 0;
};

struct ConnectOptions {
    bool force_relay = false;   // skip host/reflexive candidates entirely
};

// Seams to the outside world, replaced in tests
struct ConnectorEnvironment {
    using SocketFactory = std::function<std::expected<std::shared_ptr<net::DatagramSocket>, ErrorCode>(
        asio::any_io_executor ex, uint16_t port)>;

    SocketFactory open_socket;            // default: UDP socket bound on 0.0.0.0
    net::AddressProvider local_addresses; // default: getifaddrs
    bool port_mapping = true;             // AND-ed with upnp.enabled
};

/**
 * Connector - turns (PeerId, candidates) into a PeerConnection
 *
 * Each connect() is one attempt on its own socket: ICE until a pair is
 * promoted, then the handshake over that pair. The side with the lower
 * PeerId controls ICE and initiates the handshake.
 *
 * Also keeps the latest NAT assessment per set of local addresses and
 * re-probes when the interfaces change.
 */
class Connector : public std::enable_shared_from_this<Connector> {
public:
    Connector(asio::any_io_executor ex, std::shared_ptr<const PeerIdentity> identity,
              ConnectivityConfig config, std::shared_ptr<CandidateSignaler> signaler,
              ConnectorEnvironment env = {});
    ~Connector();

    Connector(const Connector&) = delete;
    Connector& operator=(const Connector&) = delete;

    // Start the interface poll loop
    void start();
    void stop();

    // Errors: TRANSPORT_UNREACHABLE, AUTHENTICATION_FAILED, HANDSHAKE_TIMEOUT,
    // CANCELLED, INVALID_ARGUMENT (self, or an attempt already running)
    asio::awaitable<std::expected<std::shared_ptr<PeerConnection>, ErrorCode>> connect(
        const PeerId& peer, std::vector<net::Candidate> candidates, ConnectOptions options = {});

    // Trickled candidates; kept for a later connect() if no attempt is running
    void on_remote_candidates(const net::CandidateAdvertisement& advertisement);

    // Abort a running attempt with CANCELLED
    void cancel(const PeerId& peer);

    // Latest assessment for the current interface set
    std::optional<net::NatAssessment> nat_assessment() const;

    size_t active_attempts() const { return attempts_.size(); }
    const PeerIdentity& identity() const { return *identity_; }
    const ConnectivityConfig& config() const { return config_; }

private:
    struct Attempt {
        std::shared_ptr<net::IceAgent> agent;
        bool cancelled = false;
    };

    struct HandshakeOutcome {
        std::unique_ptr<HandshakeEngine> engine;
        std::vector<net::Datagram> early_frames;
    };

    asio::awaitable<std::expected<HandshakeOutcome, ErrorCode>> run_handshake(
        std::shared_ptr<Attempt> attempt, const PeerId& peer, HandshakeRole role);

    asio::awaitable<void> interface_poll_loop();
    asio::awaitable<void> reprobe(std::vector<asio::ip::address> addresses);
    void remember_assessment(const net::NatAssessment& assessment);

    asio::any_io_executor executor_;
    std::shared_ptr<const PeerIdentity> identity_;
    ConnectivityConfig config_;
    std::shared_ptr<CandidateSignaler> signaler_;
    ConnectorEnvironment env_;
    std::shared_ptr<net::UpnpMapper> upnp_;

    std::map<PeerId, std::shared_ptr<Attempt>> attempts_;
    std::map<PeerId, std::vector<net::Candidate>> pending_remote_;

    std::map<std::vector<asio::ip::address>, net::NatAssessment> nat_cache_;
    std::vector<asio::ip::address> last_addresses_;

    asio::steady_timer poll_timer_;
    bool running_ = false;
};

} // namespace agora::session
