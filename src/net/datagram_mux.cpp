#include "net/datagram_mux.hpp"
#include "common/constants.hpp"
#include "common/logger.hpp"

#include <array>

namespace agora::net {

namespace {
auto& log() { return Logger::get("net.mux"); }
}

DatagramMux::DatagramMux(asio::any_io_executor ex, std::shared_ptr<DatagramSocket> socket)
    : executor_(std::move(ex))
    , socket_(std::move(socket)) {}

DatagramMux::~DatagramMux() {
    if (socket_ && socket_->is_open()) {
        socket_->close();
    }
}

void DatagramMux::start() {
    if (running_ || stopped_) return;
    running_ = true;
    asio::co_spawn(executor_, [self = shared_from_this()]() { return self->recv_loop(); },
                   asio::detached);
}

void DatagramMux::stop() {
    if (stopped_) return;
    stopped_ = true;
    running_ = false;
    cancel_transactions();
    socket_->close();
    stun_handlers_.clear();
    datagram_handler_ = nullptr;
}

bool DatagramMux::send_to(std::span<const uint8_t> data, const udp::endpoint& to) {
    if (stopped_) return false;
    return socket_->send_to(data, to);
}

asio::awaitable<void> DatagramMux::recv_loop() {
    auto self = shared_from_this();
    std::vector<uint8_t> buffer(protocol::MAX_DATAGRAM_SIZE);
    udp::endpoint sender;

    log().debug("recv_loop started on {}", endpoint_to_string(local_endpoint()));

    while (running_ && socket_->is_open()) {
        try {
            auto bytes = co_await socket_->async_receive_from(buffer, sender);
            if (bytes > 0) {
                deliver(sender, DIRECT_PATH, std::span<const uint8_t>(buffer.data(), bytes));
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == asio::error::operation_aborted) {
                log().debug("recv_loop: cancelled");
                break;
            }
            // ICMP port unreachable surfaces as connection_refused on some stacks
            log().debug("UDP receive error: {}", e.what());
            if (!socket_->is_open()) break;
        } catch (const std::exception& e) {
            log().error("recv_loop exception: {}", e.what());
        }
    }

    log().debug("recv_loop finished");
}

void DatagramMux::deliver(const udp::endpoint& from, PathId path, std::span<const uint8_t> data) {
    if (stopped_ || data.empty()) return;

    if (StunMessage::is_stun(data)) {
        auto msg = StunMessage::decode(data);
        if (!msg) {
            log().trace("Malformed STUN message from {}", endpoint_to_string(from));
            return;
        }
        dispatch_stun(std::move(*msg), from, path);
        return;
    }

    if (datagram_handler_) {
        datagram_handler_(from, path, data);
    } else {
        log().trace("Dropping {} byte datagram from {} (no handler)", data.size(),
                    endpoint_to_string(from));
    }
}

void DatagramMux::dispatch_stun(StunMessage msg, const udp::endpoint& from, PathId path) {
    if (msg.is_response()) {
        auto it = pending_.find(msg.transaction_id());
        if (it == pending_.end() || it->second->response) {
            log().trace("Unmatched STUN response from {}", endpoint_to_string(from));
            return;
        }
        it->second->response = StunResponse{std::move(msg), from, path};
        it->second->timer.cancel();
        return;
    }

    // Handlers may add or remove handlers while running
    auto handlers = stun_handlers_;
    for (auto& [id, handler] : handlers) {
        if (handler(msg, from, path)) return;
    }
    log().trace("Unhandled STUN {} (method {}) from {}",
                msg.is_request() ? "request" : "indication",
                static_cast<uint16_t>(msg.method()), endpoint_to_string(from));
}

uint64_t DatagramMux::add_stun_handler(StunHandler handler) {
    auto id = next_handler_id_++;
    stun_handlers_.emplace_back(id, std::move(handler));
    return id;
}

void DatagramMux::remove_stun_handler(uint64_t id) {
    std::erase_if(stun_handlers_, [id](const auto& h) { return h.first == id; });
}

void DatagramMux::set_datagram_handler(DatagramHandler handler) {
    datagram_handler_ = std::move(handler);
}

// ============================================================================
// Transactions
// ============================================================================

asio::awaitable<std::expected<StunResponse, ErrorCode>> DatagramMux::transact(
    const TransactionId& id, std::vector<uint8_t> wire, SendFn send, RetryPolicy policy) {

    auto self = shared_from_this();
    if (stopped_) {
        co_return std::unexpected(ErrorCode::CANCELLED);
    }

    auto pending = std::make_shared<Pending>(executor_);
    pending_[id] = pending;

    RetryState retry(policy);
    std::expected<StunResponse, ErrorCode> result = std::unexpected(ErrorCode::TIMEOUT);

    while (retry.should_retry()) {
        if (!send(wire)) {
            log().trace("Transaction send failed, waiting for retransmit");
        }

        pending->timer.expires_after(retry.next_delay());
        if (!pending->response && !pending->cancelled) {
            boost::system::error_code ec;
            co_await pending->timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }

        if (pending->response) {
            result = std::move(*pending->response);
            break;
        }
        if (pending->cancelled) {
            result = std::unexpected(ErrorCode::CANCELLED);
            break;
        }
    }

    // cancel_transactions() may already have cleared the map
    if (auto it = pending_.find(id); it != pending_.end() && it->second == pending) {
        pending_.erase(it);
    }
    co_return result;
}

asio::awaitable<std::expected<StunResponse, ErrorCode>> DatagramMux::transact(
    const StunMessage& request, const udp::endpoint& to, RetryPolicy policy) {

    auto wire = request.encode();
    std::weak_ptr<DatagramMux> weak = shared_from_this();
    SendFn send = [weak, to](std::span<const uint8_t> data) {
        auto mux = weak.lock();
        return mux && mux->send_to(data, to);
    };
    co_return co_await transact(request.transaction_id(), std::move(wire), std::move(send), policy);
}

void DatagramMux::cancel_transaction(const TransactionId& id) {
    auto it = pending_.find(id);
    if (it == pending_.end()) return;
    it->second->cancelled = true;
    it->second->timer.cancel();
    pending_.erase(it);
}

void DatagramMux::cancel_transactions() {
    auto pending = std::move(pending_);
    pending_.clear();
    for (auto& [id, p] : pending) {
        p->cancelled = true;
        p->timer.cancel();
    }
}

} // namespace agora::net
