#pragma once

#include "common/config.hpp"
#include "common/protocol.hpp"
#include "net/datagram_mux.hpp"
#include "net/nat.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agora::net {

struct StunServerAddress {
    std::string host;
    uint16_t port = network::DEFAULT_STUN_PORT;
};

// "host", "host:port", "1.2.3.4:port" or "[v6]:port"
std::optional<StunServerAddress> parse_stun_server(std::string_view server,
                                                   uint16_t default_port = network::DEFAULT_STUN_PORT);

// IP literals skip DNS; names resolve asynchronously (IPv4 preferred)
asio::awaitable<std::optional<udp::endpoint>> resolve_endpoint(asio::any_io_executor ex,
                                                               const std::string& host,
                                                               uint16_t port);

struct StunAnswer {
    std::string server;
    udp::endpoint server_endpoint;
    udp::endpoint mapped;
};

struct StunProbeResult {
    std::optional<udp::endpoint> public_address;
    uint16_t local_port = 0;
    NatAssessment nat;
    std::vector<StunAnswer> answers;
};

/**
 * StunClient - Binding requests over an attempt socket (RFC 5389)
 *
 * Learns the server-reflexive address and classifies NAT behavior from up
 * to two distinct servers. Servers that do not answer, do not resolve or
 * answer garbage are skipped.
 */
class StunClient {
public:
    StunClient(std::shared_ptr<DatagramMux> mux, const StunConfig& config);

    // Errors: INVALID_ARGUMENT (empty list), CANCELLED.
    // No answer at all is not an error: nat.type stays UNKNOWN.
    asio::awaitable<std::expected<StunProbeResult, ErrorCode>> probe(
        const std::vector<std::string>& servers,
        const std::vector<boost::asio::ip::address>& local_addresses);

    // One Binding transaction. Errors: TIMEOUT, STUN_FAILED, CANCELLED.
    asio::awaitable<std::expected<udp::endpoint, ErrorCode>> binding(const udp::endpoint& server);

    void cancel();

private:
    std::shared_ptr<DatagramMux> mux_;
    StunConfig config_;
    bool cancelled_ = false;
};

} // namespace agora::net
