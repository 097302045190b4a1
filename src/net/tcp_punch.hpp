#pragma once

#include "common/config.hpp"
#include "common/protocol.hpp"
#include "net/datagram_mux.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <set>
#include <span>
#include <vector>

namespace agora::net {

using tcp = asio::ip::tcp;

// Candidates carry udp endpoints whatever their transport
udp::endpoint to_udp(const tcp::endpoint& ep);
tcp::endpoint to_tcp(const udp::endpoint& ep);

/**
 * TcpPath - one connected stream carrying datagrams
 *
 * Every datagram is framed with a 16-bit big-endian length (RFC 4571).
 * Received datagrams enter the mux under this path's id with the peer's
 * address as sender, so connectivity checks, handshake and secure frames
 * run over the stream as they do over UDP.
 */
class TcpPath : public std::enable_shared_from_this<TcpPath> {
public:
    TcpPath(tcp::socket socket, std::shared_ptr<DatagramMux> mux, PathId path);
    ~TcpPath();

    TcpPath(const TcpPath&) = delete;
    TcpPath& operator=(const TcpPath&) = delete;

    // Spawn the reader and writer
    void start();

    // Queue one datagram; false once closed, for oversized data or a full queue
    bool send(std::span<const uint8_t> data);

    void close();

    PathId path() const { return path_; }
    const udp::endpoint& peer() const { return peer_; }
    const udp::endpoint& local() const { return local_; }
    bool is_open() const { return open_; }

private:
    asio::awaitable<void> run();
    asio::awaitable<void> reader();
    asio::awaitable<void> writer();

    tcp::socket socket_;
    std::weak_ptr<DatagramMux> mux_;
    PathId path_;
    udp::endpoint peer_;
    udp::endpoint local_;

    std::deque<std::vector<uint8_t>> write_queue_;
    asio::steady_timer write_signal_;
    bool open_ = true;
};

/**
 * TcpPuncher - TCP reachability for one connection attempt
 *
 * Listens on one port and dials remote TCP candidates from that same port,
 * so crossing SYNs open a path through NATs that only admit replies to
 * outbound connections (simultaneous open). Whichever side's connect or
 * accept completes first yields the stream. After the last simultaneous
 * attempt one plain connect from an ephemeral port is tried.
 */
class TcpPuncher : public std::enable_shared_from_this<TcpPuncher> {
public:
    using AcceptHandler = std::function<void(tcp::socket)>;

    TcpPuncher(asio::any_io_executor ex, const IceConfig& config);
    ~TcpPuncher();

    TcpPuncher(const TcpPuncher&) = delete;
    TcpPuncher& operator=(const TcpPuncher&) = delete;

    // Bind 0.0.0.0:port (0 = ephemeral) and start accepting.
    // Errors: SYSTEM_ERROR.
    std::expected<uint16_t, ErrorCode> listen(uint16_t port, AcceptHandler on_accept);

    // Errors: TRANSPORT_UNREACHABLE, CANCELLED
    asio::awaitable<std::expected<tcp::socket, ErrorCode>> connect(tcp::endpoint remote);

    // Stop listening and abort pending connects
    void close();

    uint16_t local_port() const { return port_; }
    bool is_listening() const { return acceptor_.is_open(); }

private:
    asio::awaitable<void> accept_loop();

    // One connect with the configured timeout, from the listening port
    // when `shared_port` is set
    asio::awaitable<std::expected<tcp::socket, ErrorCode>> dial(const tcp::endpoint& remote,
                                                                 bool shared_port);

    asio::any_io_executor executor_;
    IceConfig config_;
    tcp::acceptor acceptor_;
    AcceptHandler on_accept_;
    uint16_t port_ = 0;
    bool closed_ = false;

    // Sockets with a connect in flight, closed by close()
    std::set<std::shared_ptr<tcp::socket>> dialing_;
};

} // namespace agora::net
