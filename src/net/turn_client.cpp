#include "net/turn_client.hpp"
#include "common/logger.hpp"

#include <algorithm>

namespace agora::net {

namespace {

auto& log() { return Logger::get("net.turn"); }

// Permissions expire after 300s (RFC 5766 section 8); renew a minute early
constexpr auto PERMISSION_RENEW_MARGIN = std::chrono::seconds(60);

// 401 challenge + one stale nonce
constexpr int MAX_AUTH_ROUNDS = 3;

}  // namespace

TurnClient::TurnClient(std::shared_ptr<DatagramMux> mux, const TurnConfig& config,
                       TurnServerConfig server, PathId path)
    : mux_(std::move(mux))
    , config_(config)
    , server_config_(std::move(server))
    , path_(path)
    , refresh_timer_(mux_->get_executor())
    , permission_timer_(mux_->get_executor()) {}

TurnClient::~TurnClient() {
    if (handler_id_ != 0) {
        mux_->remove_stun_handler(handler_id_);
    }
    if (key_) {
        crypto::secure_wipe(*key_);
    }
}

RetryPolicy TurnClient::transaction_policy() const {
    // Three transmissions spread over the configured timeout: t/7, 2t/7, 4t/7
    auto first = std::max(config_.timeout / 7, std::chrono::milliseconds(1));
    return {3, first, config_.timeout, 2.0, 0.0};
}

SendFn TurnClient::server_sender() const {
    std::weak_ptr<DatagramMux> weak = mux_;
    auto server = server_;
    return [weak, server](std::span<const uint8_t> data) {
        auto mux = weak.lock();
        return mux && mux->send_to(data, server);
    };
}

void TurnClient::add_credentials(StunMessage& msg) const {
    if (!key_) return;
    msg.add_string(stun::attr::USERNAME, server_config_.username);
    msg.add_string(stun::attr::REALM, realm_);
    msg.add_string(stun::attr::NONCE, nonce_);
}

std::vector<uint8_t> TurnClient::encode(const StunMessage& msg) const {
    if (key_) {
        return msg.encode(*key_);
    }
    return msg.encode();
}

asio::awaitable<std::expected<StunMessage, ErrorCode>> TurnClient::request(StunMessage msg) {
    auto self = shared_from_this();
    const auto base = msg;

    for (int round = 0; round < MAX_AUTH_ROUNDS; ++round) {
        // Each attempt is a new transaction with fresh credentials attached
        StunMessage attempt(base.method(), stun::Class::REQUEST, random_transaction_id());
        for (const auto& a : base.attributes()) {
            attempt.add_attribute(a.type, a.value);
        }
        add_credentials(attempt);

        auto response = co_await mux_->transact(attempt.transaction_id(), encode(attempt),
                                                server_sender(), transaction_policy());
        if (!response) {
            co_return std::unexpected(response.error());
        }
        if (response->from != server_) {
            co_return std::unexpected(ErrorCode::TURN_FAILED);
        }

        auto& reply = response->message;
        if (reply.message_class() == stun::Class::SUCCESS) {
            if (key_ && reply.has_integrity() && !reply.verify_integrity(*key_)) {
                log().warn("TURN {} response failed integrity check", endpoint_to_string(server_));
                co_return std::unexpected(ErrorCode::TURN_FAILED);
            }
            co_return std::move(reply);
        }

        auto code = reply.get_error_code().value_or(0);
        if (code == stun::error::UNAUTHORIZED && !key_) {
            auto realm = reply.get_string(stun::attr::REALM);
            auto nonce = reply.get_string(stun::attr::NONCE);
            if (!realm || !nonce) {
                co_return std::unexpected(ErrorCode::TURN_FAILED);
            }
            realm_ = *realm;
            nonce_ = *nonce;
            key_ = crypto::md5(server_config_.username + ":" + realm_ + ":" + server_config_.password);
            continue;
        }
        if (code == stun::error::STALE_NONCE && key_) {
            if (auto nonce = reply.get_string(stun::attr::NONCE)) {
                nonce_ = *nonce;
                continue;
            }
        }
        co_return std::move(reply);
    }

    co_return std::unexpected(ErrorCode::TURN_AUTH_FAILED);
}

// ============================================================================
// Allocation
// ============================================================================

asio::awaitable<std::expected<TurnAllocation, ErrorCode>> TurnClient::allocate(const udp::endpoint& server) {
    auto self = shared_from_this();
    server_ = server;

    if (handler_id_ == 0) {
        std::weak_ptr<TurnClient> weak = self;
        handler_id_ = mux_->add_stun_handler(
            [weak](const StunMessage& msg, const udp::endpoint& from, PathId path) {
                auto client = weak.lock();
                return client && client->on_indication(msg, from, path);
            });
    }

    StunMessage msg(stun::Method::ALLOCATE, stun::Class::REQUEST, TransactionId{});
    msg.add_u32(stun::attr::REQUESTED_TRANSPORT, stun::TRANSPORT_UDP);
    msg.add_u32(stun::attr::LIFETIME, static_cast<uint32_t>(config_.lifetime.count()));

    auto response = co_await request(std::move(msg));
    if (!response) {
        log().warn("TURN allocate on {} failed: {}", endpoint_to_string(server_),
                   error_code_to_string(response.error()));
        co_return std::unexpected(response.error());
    }

    if (response->message_class() == stun::Class::ERROR) {
        auto code = response->get_error_code().value_or(0);
        log().warn("TURN allocate on {} rejected with {}", endpoint_to_string(server_), code);
        if (code == stun::error::UNAUTHORIZED) {
            co_return std::unexpected(ErrorCode::TURN_AUTH_FAILED);
        }
        co_return std::unexpected(ErrorCode::TURN_FAILED);
    }

    auto relayed = response->get_xor_address(stun::attr::XOR_RELAYED_ADDRESS);
    if (!relayed) {
        log().warn("TURN allocate on {} without relayed address", endpoint_to_string(server_));
        co_return std::unexpected(ErrorCode::TURN_FAILED);
    }

    TurnAllocation allocation;
    allocation.relayed = *relayed;
    allocation.mapped = response->get_xor_address(stun::attr::XOR_MAPPED_ADDRESS).value_or(udp::endpoint{});
    allocation.lifetime = std::chrono::seconds(
        response->get_u32(stun::attr::LIFETIME).value_or(static_cast<uint32_t>(config_.lifetime.count())));
    allocation_ = allocation;

    // Released while the request was in flight
    if (released_) {
        co_await deallocate();
        co_return std::unexpected(ErrorCode::CANCELLED);
    }

    log().info("TURN allocation on {}: relayed {} lifetime {}s", endpoint_to_string(server_),
               endpoint_to_string(allocation.relayed), allocation.lifetime.count());

    asio::co_spawn(mux_->get_executor(), refresh_loop(), asio::detached);
    asio::co_spawn(mux_->get_executor(), permission_loop(), asio::detached);
    co_return allocation;
}

asio::awaitable<void> TurnClient::refresh_loop() {
    auto self = shared_from_this();

    while (!released_ && allocation_) {
        auto lifetime = allocation_->lifetime;
        auto wait = lifetime > config_.refresh_margin ? lifetime - config_.refresh_margin
                                                      : lifetime / 2;
        refresh_timer_.expires_after(wait);
        boost::system::error_code ec;
        co_await refresh_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec || released_) break;

        StunMessage msg(stun::Method::REFRESH, stun::Class::REQUEST, TransactionId{});
        msg.add_u32(stun::attr::LIFETIME, static_cast<uint32_t>(config_.lifetime.count()));
        auto response = co_await request(std::move(msg));
        if (released_) break;
        if (!response && response.error() == ErrorCode::CANCELLED) break;

        if (!response || response->message_class() != stun::Class::SUCCESS) {
            auto code = response ? response->get_error_code().value_or(0) : 0;
            log().warn("TURN refresh on {} failed ({})", endpoint_to_string(server_), code);
            if (code == stun::error::ALLOCATION_MISMATCH) {
                allocation_.reset();
                break;
            }
            continue;
        }

        if (auto granted = response->get_u32(stun::attr::LIFETIME)) {
            allocation_->lifetime = std::chrono::seconds(*granted);
        }
        log().debug("TURN allocation on {} refreshed for {}s", endpoint_to_string(server_),
                    allocation_->lifetime.count());
    }
}

// ============================================================================
// Permissions
// ============================================================================

asio::awaitable<std::expected<void, ErrorCode>> TurnClient::create_permission(
    std::vector<asio::ip::address> peers) {
    auto self = shared_from_this();
    if (!is_allocated()) {
        co_return std::unexpected(ErrorCode::TURN_FAILED);
    }

    bool added = false;
    for (const auto& addr : peers) {
        if (std::find(permissions_.begin(), permissions_.end(), addr) == permissions_.end()) {
            permissions_.push_back(addr);
            added = true;
        }
    }
    if (!added) {
        co_return std::expected<void, ErrorCode>{};
    }
    co_return co_await send_permissions();
}

asio::awaitable<std::expected<void, ErrorCode>> TurnClient::send_permissions() {
    if (permissions_.empty()) {
        co_return std::expected<void, ErrorCode>{};
    }

    // XOR-PEER-ADDRESS depends on the transaction id, so every round
    // rebuilds the message instead of going through request()
    auto self = shared_from_this();
    for (int round = 0; round < MAX_AUTH_ROUNDS; ++round) {
        auto id = random_transaction_id();
        StunMessage attempt(stun::Method::CREATE_PERMISSION, stun::Class::REQUEST, id);
        for (const auto& addr : permissions_) {
            attempt.add_xor_address(stun::attr::XOR_PEER_ADDRESS, udp::endpoint(addr, 0));
        }
        add_credentials(attempt);

        auto response = co_await mux_->transact(id, encode(attempt), server_sender(),
                                                transaction_policy());
        if (!response) {
            co_return std::unexpected(response.error());
        }
        auto& reply = response->message;
        if (reply.message_class() == stun::Class::SUCCESS) {
            log().debug("TURN permissions installed for {} peers", permissions_.size());
            co_return std::expected<void, ErrorCode>{};
        }
        auto code = reply.get_error_code().value_or(0);
        if (code == stun::error::STALE_NONCE) {
            if (auto nonce = reply.get_string(stun::attr::NONCE)) {
                nonce_ = *nonce;
                continue;
            }
        }
        log().warn("TURN CreatePermission rejected with {}", code);
        co_return std::unexpected(code == stun::error::UNAUTHORIZED ? ErrorCode::TURN_AUTH_FAILED
                                                                    : ErrorCode::TURN_FAILED);
    }
    co_return std::unexpected(ErrorCode::TURN_FAILED);
}

asio::awaitable<void> TurnClient::permission_loop() {
    auto self = shared_from_this();
    auto interval = config_.permission_lifetime > PERMISSION_RENEW_MARGIN
        ? config_.permission_lifetime - PERMISSION_RENEW_MARGIN
        : config_.permission_lifetime / 2;

    while (!released_ && allocation_) {
        permission_timer_.expires_after(interval);
        boost::system::error_code ec;
        co_await permission_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec || released_) break;

        auto result = co_await send_permissions();
        if (!result && result.error() == ErrorCode::CANCELLED) break;
        if (!result && !released_) {
            log().warn("TURN permission refresh failed: {}", error_code_to_string(result.error()));
        }
    }
}

// ============================================================================
// Data path
// ============================================================================

bool TurnClient::send_to(const udp::endpoint& peer, std::span<const uint8_t> data) {
    if (!is_allocated()) return false;

    auto msg = StunMessage::indication(stun::Method::SEND);
    msg.add_xor_address(stun::attr::XOR_PEER_ADDRESS, peer);
    msg.add_attribute(stun::attr::DATA, data);
    return mux_->send_to(msg.encode(), server_);
}

bool TurnClient::on_indication(const StunMessage& msg, const udp::endpoint& from, PathId path) {
    if (path != DIRECT_PATH || from != server_) return false;
    if (!msg.is_indication() || msg.method() != stun::Method::DATA) return false;

    auto peer = msg.get_xor_address(stun::attr::XOR_PEER_ADDRESS);
    auto* data = msg.find(stun::attr::DATA);
    if (!peer || !data) {
        log().debug("Malformed Data indication from {}", endpoint_to_string(from));
        return true;
    }

    mux_->deliver(*peer, path_, data->value);
    return true;
}

asio::awaitable<void> TurnClient::release() {
    auto self = shared_from_this();
    if (released_) co_return;
    released_ = true;

    refresh_timer_.cancel();
    permission_timer_.cancel();
    if (handler_id_ != 0) {
        mux_->remove_stun_handler(handler_id_);
        handler_id_ = 0;
    }

    if (!allocation_ || !mux_->is_running()) {
        co_return;
    }
    co_await deallocate();
}

asio::awaitable<void> TurnClient::deallocate() {
    auto self = shared_from_this();
    auto id = random_transaction_id();
    StunMessage msg(stun::Method::REFRESH, stun::Class::REQUEST, id);
    msg.add_u32(stun::attr::LIFETIME, 0);
    add_credentials(msg);

    auto response = co_await mux_->transact(id, encode(msg), server_sender(),
                                            RetryPolicy::retransmit(config_.timeout / 4, 1));
    if (response && response->message.message_class() == stun::Class::SUCCESS) {
        log().info("TURN allocation on {} released", endpoint_to_string(server_));
    } else {
        log().debug("TURN release on {} not acknowledged", endpoint_to_string(server_));
    }
    allocation_.reset();
}

} // namespace agora::net
