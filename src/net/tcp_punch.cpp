#include "net/tcp_punch.hpp"
#include "common/binary_codec.hpp"
#include "common/constants.hpp"
#include "common/logger.hpp"

#include <boost/asio/experimental/awaitable_operators.hpp>
#include <sys/socket.h>

#include <array>

namespace agora::net {

using namespace boost::asio::experimental::awaitable_operators;

namespace {

auto& log() { return Logger::get("net.tcp"); }

using reuse_port = asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;

}

udp::endpoint to_udp(const tcp::endpoint& ep) {
    return udp::endpoint(ep.address(), ep.port());
}

tcp::endpoint to_tcp(const udp::endpoint& ep) {
    return tcp::endpoint(ep.address(), ep.port());
}

// ============================================================================
// TcpPath
// ============================================================================

TcpPath::TcpPath(tcp::socket socket, std::shared_ptr<DatagramMux> mux, PathId path)
    : socket_(std::move(socket))
    , mux_(mux)
    , path_(path)
    , write_signal_(socket_.get_executor()) {
    boost::system::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    if (!ec) peer_ = to_udp(remote);
    auto local = socket_.local_endpoint(ec);
    if (!ec) local_ = to_udp(local);

    socket_.set_option(tcp::no_delay(true), ec);
}

TcpPath::~TcpPath() {
    boost::system::error_code ec;
    socket_.close(ec);
}

void TcpPath::start() {
    asio::co_spawn(socket_.get_executor(), [self = shared_from_this()]() { return self->run(); },
                   asio::detached);
}

bool TcpPath::send(std::span<const uint8_t> data) {
    if (!open_ || data.size() > wire::MAX_PREFIXED_LENGTH) return false;
    if (write_queue_.size() >= network::STREAM_WRITE_QUEUE_CAPACITY) {
        log().debug("Write queue to {} full, dropping {} bytes", endpoint_to_string(peer_), data.size());
        return false;
    }

    wire::BinaryWriter frame(2 + data.size());
    frame.write_bytes(data);
    write_queue_.push_back(frame.take());
    write_signal_.cancel();
    return true;
}

void TcpPath::close() {
    if (!open_) return;
    open_ = false;
    write_queue_.clear();
    write_signal_.cancel();
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    log().debug("TCP path {} to {} closed", path_, endpoint_to_string(peer_));
}

asio::awaitable<void> TcpPath::run() {
    auto self = shared_from_this();
    log().debug("TCP path {} {} -> {} up", path_, endpoint_to_string(local_), endpoint_to_string(peer_));

    try {
        co_await (reader() || writer());
    } catch (const boost::system::system_error& e) {
        if (e.code() != asio::error::operation_aborted) {
            log().debug("TCP path {} failed: {}", path_, e.what());
        }
    }
    close();
}

asio::awaitable<void> TcpPath::reader() {
    std::array<uint8_t, 2> header{};
    std::vector<uint8_t> payload;

    while (open_) {
        boost::system::error_code ec;
        co_await asio::async_read(socket_, asio::buffer(header),
                                  asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                log().debug("TCP path {} read: {}", path_, ec.message());
            }
            break;
        }

        payload.resize((static_cast<size_t>(header[0]) << 8) | header[1]);
        if (payload.empty()) continue;

        co_await asio::async_read(socket_, asio::buffer(payload),
                                  asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            log().debug("TCP path {} closed mid-frame: {}", path_, ec.message());
            break;
        }

        auto mux = mux_.lock();
        if (!mux) break;
        mux->deliver(peer_, path_, payload);
    }
}

asio::awaitable<void> TcpPath::writer() {
    while (open_) {
        while (write_queue_.empty() && open_) {
            write_signal_.expires_after(std::chrono::seconds(30));
            boost::system::error_code ec;
            co_await write_signal_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }

        while (!write_queue_.empty() && open_) {
            auto frame = std::move(write_queue_.front());
            write_queue_.pop_front();

            boost::system::error_code ec;
            co_await asio::async_write(socket_, asio::buffer(frame),
                                       asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                log().debug("TCP path {} write: {}", path_, ec.message());
                co_return;
            }
        }
    }
}

// ============================================================================
// TcpPuncher
// ============================================================================

TcpPuncher::TcpPuncher(asio::any_io_executor ex, const IceConfig& config)
    : executor_(std::move(ex))
    , config_(config)
    , acceptor_(executor_) {}

TcpPuncher::~TcpPuncher() {
    boost::system::error_code ec;
    acceptor_.close(ec);
}

std::expected<uint16_t, ErrorCode> TcpPuncher::listen(uint16_t port, AcceptHandler on_accept) {
    boost::system::error_code ec;
    if (acceptor_.is_open()) acceptor_.close(ec);

    acceptor_.open(tcp::v4(), ec);
    if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.set_option(reuse_port(true), ec);
    if (!ec) acceptor_.bind(tcp::endpoint(tcp::v4(), port), ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        log().debug("Cannot listen on TCP port {}: {}", port, ec.message());
        acceptor_.close(ec);
        return std::unexpected(ErrorCode::SYSTEM_ERROR);
    }

    port_ = acceptor_.local_endpoint(ec).port();
    on_accept_ = std::move(on_accept);
    asio::co_spawn(executor_, [self = shared_from_this()]() { return self->accept_loop(); },
                   asio::detached);

    log().debug("Listening for TCP candidates on port {}", port_);
    return port_;
}

asio::awaitable<void> TcpPuncher::accept_loop() {
    auto self = shared_from_this();
    while (!closed_ && acceptor_.is_open()) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_.async_accept(asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec == asio::error::operation_aborted || closed_) break;
            log().debug("TCP accept failed: {}", ec.message());
            continue;
        }

        auto remote = socket.remote_endpoint(ec);
        log().debug("Accepted TCP stream from {}", ec ? "?" : endpoint_to_string(to_udp(remote)));
        if (on_accept_) on_accept_(std::move(socket));
    }
}

asio::awaitable<std::expected<tcp::socket, ErrorCode>> TcpPuncher::dial(const tcp::endpoint& remote,
                                                                          bool shared_port) {
    auto self = shared_from_this();
    auto socket = std::make_shared<tcp::socket>(executor_);

    boost::system::error_code ec;
    socket->open(remote.protocol(), ec);
    if (!ec && shared_port) {
        socket->set_option(asio::socket_base::reuse_address(true), ec);
        if (!ec) socket->set_option(reuse_port(true), ec);
        if (!ec) socket->bind(tcp::endpoint(tcp::v4(), port_), ec);
    }
    if (ec) {
        log().debug("Cannot prepare TCP socket for {}: {}", endpoint_to_string(to_udp(remote)), ec.message());
        co_return std::unexpected(ErrorCode::SYSTEM_ERROR);
    }

    dialing_.insert(socket);
    asio::steady_timer timer(executor_);
    timer.expires_after(config_.tcp_connect_timeout);

    boost::system::error_code connect_ec;
    boost::system::error_code timer_ec;
    auto outcome = co_await (
        socket->async_connect(remote, asio::redirect_error(asio::use_awaitable, connect_ec)) ||
        timer.async_wait(asio::redirect_error(asio::use_awaitable, timer_ec)));
    dialing_.erase(socket);

    if (closed_) co_return std::unexpected(ErrorCode::CANCELLED);
    if (outcome.index() == 1) {
        socket->close(ec);
        co_return std::unexpected(ErrorCode::TIMEOUT);
    }
    if (connect_ec) {
        log().trace("TCP connect to {} failed: {}", endpoint_to_string(to_udp(remote)), connect_ec.message());
        co_return std::unexpected(ErrorCode::TRANSPORT_UNREACHABLE);
    }
    co_return std::move(*socket);
}

asio::awaitable<std::expected<tcp::socket, ErrorCode>> TcpPuncher::connect(tcp::endpoint remote) {
    auto self = shared_from_this();
    const auto target = endpoint_to_string(to_udp(remote));

    if (is_listening()) {
        for (uint32_t attempt = 1; attempt <= config_.tcp_connect_attempts && !closed_; ++attempt) {
            auto socket = co_await dial(remote, true);
            if (socket) {
                log().info("TCP simultaneous open to {} succeeded (attempt {})", target, attempt);
                co_return std::move(socket);
            }
            if (socket.error() == ErrorCode::CANCELLED) co_return std::unexpected(ErrorCode::CANCELLED);
            log().debug("TCP simultaneous open to {} attempt {}/{}: {}", target, attempt,
                        config_.tcp_connect_attempts, error_code_to_string(socket.error()));

            asio::steady_timer pause(executor_);
            pause.expires_after(defaults::TCP_RETRY_DELAY);
            boost::system::error_code ec;
            co_await pause.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }
    }
    if (closed_) co_return std::unexpected(ErrorCode::CANCELLED);

    auto socket = co_await dial(remote, false);
    if (socket) {
        log().info("TCP connect to {} succeeded", target);
        co_return std::move(socket);
    }
    if (socket.error() == ErrorCode::CANCELLED) co_return std::unexpected(ErrorCode::CANCELLED);

    log().debug("TCP candidate {} unreachable", target);
    co_return std::unexpected(ErrorCode::TRANSPORT_UNREACHABLE);
}

void TcpPuncher::close() {
    if (closed_) return;
    closed_ = true;

    boost::system::error_code ec;
    acceptor_.close(ec);
    for (const auto& socket : dialing_) {
        socket->close(ec);
    }
    dialing_.clear();
    on_accept_ = nullptr;
}

} // namespace agora::net
