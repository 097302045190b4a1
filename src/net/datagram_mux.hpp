#pragma once

#include "common/protocol.hpp"
#include "common/retry.hpp"
#include "net/datagram_socket.hpp"
#include "net/stun_message.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace agora::net {

// Which way a datagram travelled: DIRECT_PATH is the attempt socket itself,
// every TURN allocation gets its own id starting at 1.
using PathId = uint32_t;
inline constexpr PathId DIRECT_PATH = 0;

// Connected TCP streams get ids from here up
inline constexpr PathId STREAM_PATH_BASE = 0x10000;
inline bool is_stream_path(PathId path) { return path >= STREAM_PATH_BASE; }

struct StunResponse {
    StunMessage message;
    udp::endpoint from;
    PathId path = DIRECT_PATH;
};

// Puts one encoded datagram on the wire (direct socket or TURN Send indication)
using SendFn = std::function<bool(std::span<const uint8_t>)>;

// Incoming STUN request/indication. Return true when consumed.
using StunHandler = std::function<bool(const StunMessage& msg, const udp::endpoint& from, PathId path)>;

// Incoming non-STUN datagram (handshake, secure frames)
using DatagramHandler = std::function<void(const udp::endpoint& from, PathId path,
                                           std::span<const uint8_t> data)>;

/**
 * DatagramMux - demultiplexer for one attempt socket
 *
 * Runs the receive loop, matches STUN responses to pending transactions by
 * transaction id, offers STUN requests/indications to the registered
 * handlers in order and passes everything else to the datagram handler.
 * Relayed traffic unwrapped by a TurnClient re-enters through deliver().
 *
 * Not thread-safe: every call must happen on the executor.
 */
class DatagramMux : public std::enable_shared_from_this<DatagramMux> {
public:
    DatagramMux(asio::any_io_executor ex, std::shared_ptr<DatagramSocket> socket);
    ~DatagramMux();

    DatagramMux(const DatagramMux&) = delete;
    DatagramMux& operator=(const DatagramMux&) = delete;

    // Spawn the receive loop
    void start();

    // Close the socket and fail all pending transactions with CANCELLED
    void stop();

    bool is_running() const { return running_; }

    asio::any_io_executor get_executor() const { return executor_; }
    DatagramSocket& socket() { return *socket_; }
    udp::endpoint local_endpoint() const { return socket_->local_endpoint(); }

    // Send on the direct path
    bool send_to(std::span<const uint8_t> data, const udp::endpoint& to);

    // Feed one datagram into the demultiplexer
    void deliver(const udp::endpoint& from, PathId path, std::span<const uint8_t> data);

    uint64_t add_stun_handler(StunHandler handler);
    void remove_stun_handler(uint64_t id);
    void set_datagram_handler(DatagramHandler handler);

    // ========================================================================
    // STUN transactions
    // ========================================================================

    // Send `wire` through `send` and retransmit per `policy` until a response
    // with `id` arrives. policy.max_attempts counts every transmission.
    // Errors: TIMEOUT, CANCELLED.
    asio::awaitable<std::expected<StunResponse, ErrorCode>> transact(
        const TransactionId& id, std::vector<uint8_t> wire, SendFn send, RetryPolicy policy);

    // Direct-path convenience overload
    asio::awaitable<std::expected<StunResponse, ErrorCode>> transact(
        const StunMessage& request, const udp::endpoint& to, RetryPolicy policy);

    // Fail one pending transaction with CANCELLED
    void cancel_transaction(const TransactionId& id);

    // Fail every pending transaction with CANCELLED
    void cancel_transactions();

    size_t pending_transactions() const { return pending_.size(); }

private:
    struct Pending {
        explicit Pending(asio::any_io_executor ex) : timer(ex) {}
        asio::steady_timer timer;
        std::optional<StunResponse> response;
        bool cancelled = false;
    };

    asio::awaitable<void> recv_loop();
    void dispatch_stun(StunMessage msg, const udp::endpoint& from, PathId path);

    asio::any_io_executor executor_;
    std::shared_ptr<DatagramSocket> socket_;
    bool running_ = false;
    bool stopped_ = false;

    std::map<TransactionId, std::shared_ptr<Pending>> pending_;
    std::vector<std::pair<uint64_t, StunHandler>> stun_handlers_;
    uint64_t next_handler_id_ = 1;
    DatagramHandler datagram_handler_;
};

} // namespace agora::net
