#pragma once

#include "common/protocol.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <expected>
#include <memory>
#include <span>
#include <string>

namespace agora::net {

namespace asio = boost::asio;
using udp = asio::ip::udp;

// "a.b.c.d:port" for logs
std::string endpoint_to_string(const udp::endpoint& ep);

/**
 * DatagramSocket - unconnected datagram endpoint
 *
 * Every connection attempt owns one. STUN, TURN, connectivity checks,
 * handshake and secure frames all share it.
 * async_receive_from throws boost::system::system_error
 * (operation_aborted once closed), send_to never throws.
 */
class DatagramSocket {
public:
    virtual ~DatagramSocket() = default;

    virtual asio::awaitable<size_t> async_receive_from(
        std::span<uint8_t> buffer, udp::endpoint& sender) = 0;

    // false when the datagram could not be handed to the network
    virtual bool send_to(std::span<const uint8_t> data, const udp::endpoint& to) = 0;

    virtual udp::endpoint local_endpoint() const = 0;
    virtual bool is_open() const = 0;
    virtual void close() = 0;
};

// ============================================================================
// UdpDatagramSocket - Boost.Asio UDP socket
// ============================================================================
class UdpDatagramSocket : public DatagramSocket {
public:
    explicit UdpDatagramSocket(asio::any_io_executor ex);

    // Bind to 0.0.0.0:port (port 0 = ephemeral)
    static std::expected<std::shared_ptr<UdpDatagramSocket>, ErrorCode> open(
        asio::any_io_executor ex, uint16_t port);

    asio::awaitable<size_t> async_receive_from(
        std::span<uint8_t> buffer, udp::endpoint& sender) override;
    bool send_to(std::span<const uint8_t> data, const udp::endpoint& to) override;
    udp::endpoint local_endpoint() const override;
    bool is_open() const override { return socket_.is_open(); }
    void close() override;

private:
    udp::socket socket_;
};

} // namespace agora::net
