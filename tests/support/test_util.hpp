#pragma once

#include "common/config.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace agora::test {

namespace asio = boost::asio;

// Drive `io` until the coroutine finishes or `limit` passes.
// Rethrows exceptions escaping the coroutine.
template<typename T>
T run_until_complete(asio::io_context& io, asio::awaitable<T> task,
                     std::chrono::milliseconds limit = std::chrono::seconds(20)) {
    std::optional<T> result;
    std::exception_ptr error;
    bool done = false;

    asio::co_spawn(io, std::move(task), [&](std::exception_ptr e, T value) {
        error = e;
        if (!e) result.emplace(std::move(value));
        done = true;
    });

    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done && std::chrono::steady_clock::now() < deadline) {
        if (io.stopped()) io.restart();
        io.run_one_for(std::chrono::milliseconds(50));
    }

    if (error) std::rethrow_exception(error);
    if (!done) throw std::runtime_error("coroutine did not complete in time");
    return std::move(*result);
}

inline void run_until_complete(asio::io_context& io, asio::awaitable<void> task,
                               std::chrono::milliseconds limit = std::chrono::seconds(20)) {
    auto wrapped = [](asio::awaitable<void> inner) -> asio::awaitable<bool> {
        co_await std::move(inner);
        co_return true;
    };
    run_until_complete(io, wrapped(std::move(task)), limit);
}

// Let queued handlers and timers run for `duration`
inline void run_for(asio::io_context& io, std::chrono::milliseconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
        if (io.stopped()) io.restart();
        io.run_one_for(std::chrono::milliseconds(10));
    }
}

inline asio::awaitable<void> sleep_for(std::chrono::milliseconds duration) {
    asio::steady_timer timer(co_await asio::this_coro::executor);
    timer.expires_after(duration);
    co_await timer.async_wait(asio::use_awaitable);
}

// Short timeouts, no public servers, no port mapping, no TCP candidates
inline ConnectivityConfig fast_config() {
    ConnectivityConfig config;
    config.log.global_level = LogLevel::WARN;
    config.stun.servers.clear();
    config.stun.timeout = std::chrono::milliseconds(50);
    config.stun.retransmits = 3;
    config.turn.timeout = std::chrono::milliseconds(50);
    config.upnp.enabled = false;
    config.ice.check_interval = std::chrono::milliseconds(10);
    config.ice.check_timeout = std::chrono::milliseconds(50);
    config.ice.max_check_attempts = 4;
    config.ice.gather_timeout = std::chrono::milliseconds(1000);
    config.ice.tcp_candidates = false;
    config.ice.connect_timeout = std::chrono::milliseconds(5000);
    config.handshake.timeout = std::chrono::milliseconds(3000);
    config.handshake.retransmit = std::chrono::milliseconds(100);
    return config;
}

inline std::vector<uint8_t> bytes(std::string_view text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace agora::test
