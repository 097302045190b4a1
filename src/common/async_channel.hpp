#pragma once

#include "common/protocol.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <queue>
#include <optional>

namespace agora {

namespace asio = boost::asio;

/// Bounded queue written from any thread and read by one coroutine.
///
/// Storage is mutex+queue; the reader parks on a steady_timer set to
/// time_point::max() (or to its deadline) and a producer wakes it with
/// cancel(). Only one reader may wait at a time.
template<typename T>
class AsyncChannel {
public:
    /// @param capacity queue limit, try_send returns false when full
    /// @param ex       executor of the consuming coroutine
    AsyncChannel(size_t capacity, asio::any_io_executor ex)
        : timer_(ex), capacity_(capacity) {
        timer_.expires_at(asio::steady_timer::time_point::max());
    }

    AsyncChannel(const AsyncChannel&) = delete;
    AsyncChannel& operator=(const AsyncChannel&) = delete;
    AsyncChannel(AsyncChannel&&) = delete;
    AsyncChannel& operator=(AsyncChannel&&) = delete;

    // ================================================================
    // Producer side, any thread
    // ================================================================

    /// Non-blocking write. false means full or closed.
    bool try_send(T value) {
        if (closed_->load(std::memory_order_relaxed)) return false;
        {
            std::lock_guard lock(mutex_);
            if (queue_.size() >= capacity_) return false;
            queue_.push(std::move(value));
        }
        wake();
        return true;
    }

    /// Close the channel and wake the reader. Queued items stay readable.
    void close() {
        closed_->store(true, std::memory_order_release);
        wake();
    }

    bool is_closed() const { return closed_->load(std::memory_order_acquire); }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    /// Drop everything queued
    void clear() {
        std::lock_guard lock(mutex_);
        std::queue<T>().swap(queue_);
    }

    // ================================================================
    // Consumer side, executor thread only
    // ================================================================

    /// Non-blocking read
    std::optional<T> try_read() {
        std::lock_guard lock(mutex_);
        if (queue_.empty()) return std::nullopt;
        T val = std::move(queue_.front());
        queue_.pop();
        return val;
    }

    /// Read one element. nullopt once the channel is closed and drained.
    asio::awaitable<std::optional<T>> read() {
        auto result = co_await read_until(asio::steady_timer::time_point::max());
        if (!result) co_return std::nullopt;
        co_return std::move(*result);
    }

    /// Read with a relative timeout
    asio::awaitable<std::expected<T, ErrorCode>> read_for(std::chrono::steady_clock::duration timeout) {
        co_return co_await read_until(std::chrono::steady_clock::now() + timeout);
    }

    /// Read with an absolute deadline. TIMEOUT past the deadline,
    /// CHANNEL_CLOSED once closed and drained.
    asio::awaitable<std::expected<T, ErrorCode>> read_until(asio::steady_timer::time_point deadline) {
        for (;;) {
            if (auto val = try_read()) {
                co_return std::move(*val);
            }
            if (closed_->load(std::memory_order_acquire)) {
                co_return std::unexpected(ErrorCode::CHANNEL_CLOSED);
            }
            if (asio::steady_timer::clock_type::now() >= deadline) {
                co_return std::unexpected(ErrorCode::TIMEOUT);
            }
            // operation_aborted means a producer woke us; loop and re-check
            timer_.expires_at(deadline);
            boost::system::error_code ec;
            co_await timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }
    }

private:
    /// Wake the reader; posted so the cancel runs on the consumer executor.
    /// closed_ doubles as the liveness token for handlers still queued.
    void wake() {
        std::weak_ptr<std::atomic<bool>> alive = closed_;
        asio::post(timer_.get_executor(), [this, alive]() {
            if (alive.lock()) timer_.cancel();
        });
    }

    asio::steady_timer timer_;
    size_t capacity_;
    std::shared_ptr<std::atomic<bool>> closed_ = std::make_shared<std::atomic<bool>>(false);
    mutable std::mutex mutex_;
    std::queue<T> queue_;
};

} // namespace agora
