#pragma once

#include "common/config.hpp"
#include "common/crypto.hpp"
#include "common/protocol.hpp"
#include "net/datagram_mux.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace agora::net {

struct TurnAllocation {
    udp::endpoint relayed;
    udp::endpoint mapped;
    std::chrono::seconds lifetime{0};
};

/**
 * TurnClient - one relayed transport address on a TURN server (RFC 5766)
 *
 * Shares the attempt socket through the DatagramMux. Data indications from
 * the server are unwrapped and fed back into the mux under this client's
 * PathId, so relayed traffic looks like any other datagram to the agent.
 */
class TurnClient : public std::enable_shared_from_this<TurnClient> {
public:
    TurnClient(std::shared_ptr<DatagramMux> mux, const TurnConfig& config,
               TurnServerConfig server, PathId path);
    ~TurnClient();

    TurnClient(const TurnClient&) = delete;
    TurnClient& operator=(const TurnClient&) = delete;

    // Allocate on `server` and start the refresh loops.
    // Errors: TURN_AUTH_FAILED, TURN_FAILED, TIMEOUT, CANCELLED.
    asio::awaitable<std::expected<TurnAllocation, ErrorCode>> allocate(const udp::endpoint& server);

    // Install permissions for the given peer addresses (renewed by the
    // permission loop until release)
    asio::awaitable<std::expected<void, ErrorCode>> create_permission(
        std::vector<asio::ip::address> peers);

    // Wrap `data` in a Send indication to `peer`
    bool send_to(const udp::endpoint& peer, std::span<const uint8_t> data);

    // Refresh with LIFETIME 0 and stop all loops
    asio::awaitable<void> release();

    bool is_allocated() const { return allocation_.has_value() && !released_; }
    const std::optional<TurnAllocation>& allocation() const { return allocation_; }
    const TurnServerConfig& server_config() const { return server_config_; }
    const udp::endpoint& server() const { return server_; }
    PathId path() const { return path_; }

private:
    // One authenticated request; handles the 401 challenge and one 438
    // stale nonce retry. Returns the final response (success or error).
    asio::awaitable<std::expected<StunMessage, ErrorCode>> request(StunMessage msg);

    // Refresh with LIFETIME 0; the server drops the allocation
    asio::awaitable<void> deallocate();

    void add_credentials(StunMessage& msg) const;
    std::vector<uint8_t> encode(const StunMessage& msg) const;
    RetryPolicy transaction_policy() const;
    SendFn server_sender() const;

    bool on_indication(const StunMessage& msg, const udp::endpoint& from, PathId path);

    asio::awaitable<void> refresh_loop();
    asio::awaitable<void> permission_loop();
    asio::awaitable<std::expected<void, ErrorCode>> send_permissions();

    std::shared_ptr<DatagramMux> mux_;
    TurnConfig config_;
    TurnServerConfig server_config_;
    PathId path_;
    udp::endpoint server_;

    // Long-term credential state
    std::string realm_;
    std::string nonce_;
    std::optional<crypto::Md5Digest> key_;

    std::optional<TurnAllocation> allocation_;
    std::vector<asio::ip::address> permissions_;
    bool released_ = false;
    uint64_t handler_id_ = 0;

    asio::steady_timer refresh_timer_;
    asio::steady_timer permission_timer_;
};

} // namespace agora::net
