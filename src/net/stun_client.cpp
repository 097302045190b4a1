#include "net/stun_client.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <charconv>

namespace agora::net {

namespace {
auto& log() { return Logger::get("net.stun"); }
}

std::optional<StunServerAddress> parse_stun_server(std::string_view server, uint16_t default_port) {
    if (server.empty()) return std::nullopt;

    StunServerAddress result;
    result.port = default_port;

    std::string_view host = server;
    std::string_view port;

    if (server.front() == '[') {
        auto close = server.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        host = server.substr(1, close - 1);
        auto rest = server.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') return std::nullopt;
            port = rest.substr(1);
        }
    } else if (auto colon = server.rfind(':'); colon != std::string_view::npos) {
        // More than one colon without brackets is a bare IPv6 literal
        if (server.find(':') == colon) {
            host = server.substr(0, colon);
            port = server.substr(colon + 1);
        }
    }

    if (host.empty()) return std::nullopt;

    if (!port.empty()) {
        uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc{} || ptr != port.data() + port.size() || value == 0 || value > 0xFFFF) {
            return std::nullopt;
        }
        result.port = static_cast<uint16_t>(value);
    }

    result.host = std::string(host);
    return result;
}

StunClient::StunClient(std::shared_ptr<DatagramMux> mux, const StunConfig& config)
    : mux_(std::move(mux))
    , config_(config) {}

void StunClient::cancel() {
    cancelled_ = true;
    mux_->cancel_transactions();
}

asio::awaitable<std::optional<udp::endpoint>> resolve_endpoint(asio::any_io_executor ex,
                                                               const std::string& host,
                                                               uint16_t port) {
    boost::system::error_code ec;
    auto literal = boost::asio::ip::make_address(host, ec);
    if (!ec) {
        co_return udp::endpoint(literal, port);
    }

    try {
        udp::resolver resolver(ex);
        auto results = co_await resolver.async_resolve(host, std::to_string(port), asio::use_awaitable);

        std::optional<udp::endpoint> fallback;
        for (const auto& entry : results) {
            if (entry.endpoint().address().is_v4()) {
                co_return entry.endpoint();
            }
            if (!fallback) fallback = entry.endpoint();
        }
        co_return fallback;
    } catch (const boost::system::system_error& e) {
        log().debug("Failed to resolve {}: {}", host, e.what());
    }
    co_return std::nullopt;
}

asio::awaitable<std::expected<udp::endpoint, ErrorCode>> StunClient::binding(const udp::endpoint& server) {
    auto request = StunMessage::request(stun::Method::BINDING);
    auto policy = RetryPolicy::retransmit(config_.timeout, 1 + config_.retransmits);

    auto response = co_await mux_->transact(request, server, policy);
    if (!response) {
        co_return std::unexpected(response.error());
    }

    const auto& msg = response->message;
    if (msg.message_class() == stun::Class::ERROR) {
        log().debug("STUN server {} returned error {}", endpoint_to_string(server),
                    msg.get_error_code().value_or(0));
        co_return std::unexpected(ErrorCode::STUN_FAILED);
    }

    auto mapped = msg.mapped_address();
    if (!mapped) {
        log().debug("STUN response from {} has no mapped address", endpoint_to_string(server));
        co_return std::unexpected(ErrorCode::STUN_FAILED);
    }
    co_return *mapped;
}

asio::awaitable<std::expected<StunProbeResult, ErrorCode>> StunClient::probe(
    const std::vector<std::string>& servers,
    const std::vector<boost::asio::ip::address>& local_addresses) {

    if (servers.empty()) {
        co_return std::unexpected(ErrorCode::INVALID_ARGUMENT);
    }

    StunProbeResult result;
    result.local_port = mux_->local_endpoint().port();
    std::vector<udp::endpoint> mapped;

    for (const auto& server : servers) {
        if (cancelled_) {
            co_return std::unexpected(ErrorCode::CANCELLED);
        }
        if (result.answers.size() >= 2) break;

        auto parsed = parse_stun_server(server);
        if (!parsed) {
            log().warn("Invalid STUN server entry '{}'", server);
            continue;
        }

        auto endpoint = co_await resolve_endpoint(mux_->get_executor(), parsed->host, parsed->port);
        if (cancelled_) {
            co_return std::unexpected(ErrorCode::CANCELLED);
        }
        if (!endpoint) continue;

        // Classification needs two distinct servers
        bool seen = std::any_of(result.answers.begin(), result.answers.end(),
                                [&](const StunAnswer& a) { return a.server_endpoint == *endpoint; });
        if (seen) continue;

        auto answer = co_await binding(*endpoint);
        if (!answer) {
            if (answer.error() == ErrorCode::CANCELLED) {
                co_return std::unexpected(ErrorCode::CANCELLED);
            }
            log().debug("STUN server {} failed: {}", server, error_code_to_string(answer.error()));
            continue;
        }

        log().debug("STUN server {} reports {}", server, endpoint_to_string(*answer));
        result.answers.push_back({server, *endpoint, *answer});
        mapped.push_back(*answer);
    }

    result.nat = classify_nat(mapped, result.local_port, local_addresses);
    result.public_address = result.nat.public_address;

    log().info("NAT assessment: {} (public {}, {} answers)",
               nat_type_to_string(result.nat.type),
               result.public_address ? endpoint_to_string(*result.public_address) : "none",
               result.answers.size());
    co_return result;
}

} // namespace agora::net
