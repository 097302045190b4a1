#pragma once

#include "common/config.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agora::net {

namespace asio = boost::asio;
using udp = asio::ip::udp;

enum class MappingProtocol : uint8_t {
    UPNP_IGD = 0,
    NAT_PMP = 1,
};

std::string_view mapping_protocol_to_string(MappingProtocol protocol);

struct ExternalMapping {
    MappingProtocol protocol = MappingProtocol::UPNP_IGD;
    udp::endpoint external;
    uint16_t internal_port = 0;
    std::chrono::seconds lease{0};

    // UPnP IGD control point, needed for release
    std::string control_url;
    std::string service_type;

    // NAT-PMP gateway, needed for release
    udp::endpoint gateway;
};

/**
 * UpnpMapper - best-effort inbound UDP port mapping
 *
 * Tries UPnP IGD through miniupnpc first, then NAT-PMP (RFC 6886) against
 * the default gateway. miniupnpc blocks, so IGD work runs on a private
 * worker thread; NAT-PMP is plain async UDP on the caller's executor.
 * Every failure ends in nullopt and a log line, never an exception.
 */
class UpnpMapper : public std::enable_shared_from_this<UpnpMapper> {
public:
    UpnpMapper(asio::any_io_executor ex, const UpnpConfig& config);
    ~UpnpMapper();

    UpnpMapper(const UpnpMapper&) = delete;
    UpnpMapper& operator=(const UpnpMapper&) = delete;

    asio::awaitable<std::optional<ExternalMapping>> try_map(uint16_t local_port);

    // Delete the mapping (IGD) or send a lifetime-0 map (NAT-PMP)
    asio::awaitable<void> release(ExternalMapping mapping);

    asio::awaitable<std::optional<ExternalMapping>> try_natpmp(uint16_t local_port);

    // Default IPv4 gateway from the contents of /proc/net/route
    static std::optional<asio::ip::address_v4> parse_default_gateway(std::string_view route_table);

private:
    // Run on pool_
    asio::awaitable<std::optional<ExternalMapping>> igd_map(uint16_t local_port);
    asio::awaitable<bool> igd_delete(ExternalMapping mapping);

    std::optional<udp::endpoint> natpmp_gateway() const;

    // One NAT-PMP request with retransmission; returns the validated response
    asio::awaitable<std::optional<std::vector<uint8_t>>> natpmp_request(
        const udp::endpoint& gateway, std::span<const uint8_t> request,
        uint8_t expected_op, size_t expected_size,
        std::chrono::milliseconds budget);

    asio::any_io_executor executor_;
    UpnpConfig config_;
    asio::thread_pool pool_{1};
};

} // namespace agora::net
