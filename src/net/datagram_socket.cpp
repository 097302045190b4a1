#include "net/datagram_socket.hpp"
#include "common/logger.hpp"

namespace agora::net {

namespace {
auto& log() { return Logger::get("net.mux"); }
}

std::string endpoint_to_string(const udp::endpoint& ep) {
    if (ep.address().is_v6()) {
        return "[" + ep.address().to_string() + "]:" + std::to_string(ep.port());
    }
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

UdpDatagramSocket::UdpDatagramSocket(asio::any_io_executor ex)
    : socket_(ex) {}

std::expected<std::shared_ptr<UdpDatagramSocket>, ErrorCode> UdpDatagramSocket::open(
    asio::any_io_executor ex, uint16_t port) {

    auto sock = std::make_shared<UdpDatagramSocket>(ex);
    boost::system::error_code ec;

    sock->socket_.open(udp::v4(), ec);
    if (ec) {
        log().error("Failed to open UDP socket: {}", ec.message());
        return std::unexpected(ErrorCode::SYSTEM_ERROR);
    }

    sock->socket_.bind(udp::endpoint(udp::v4(), port), ec);
    if (ec) {
        log().error("Failed to bind UDP port {}: {}", port, ec.message());
        return std::unexpected(ErrorCode::SYSTEM_ERROR);
    }

    log().debug("UDP socket bound to {}", sock->local_endpoint().port());
    return sock;
}

asio::awaitable<size_t> UdpDatagramSocket::async_receive_from(
    std::span<uint8_t> buffer, udp::endpoint& sender) {
    co_return co_await socket_.async_receive_from(
        asio::buffer(buffer.data(), buffer.size()), sender, asio::use_awaitable);
}

bool UdpDatagramSocket::send_to(std::span<const uint8_t> data, const udp::endpoint& to) {
    boost::system::error_code ec;
    socket_.send_to(asio::buffer(data.data(), data.size()), to, 0, ec);
    if (ec) {
        log().debug("send_to {} failed: {}", endpoint_to_string(to), ec.message());
        return false;
    }
    return true;
}

udp::endpoint UdpDatagramSocket::local_endpoint() const {
    boost::system::error_code ec;
    auto ep = socket_.local_endpoint(ec);
    return ec ? udp::endpoint() : ep;
}

void UdpDatagramSocket::close() {
    boost::system::error_code ec;
    socket_.close(ec);
}

} // namespace agora::net
