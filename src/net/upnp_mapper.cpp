#include "net/upnp_mapper.hpp"
#include "net/datagram_socket.hpp"
#include "common/binary_codec.hpp"
#include "common/logger.hpp"

#include <miniupnpc/miniupnpc.h>
#include <miniupnpc/upnpcommands.h>
#include <miniupnpc/upnperrors.h>

#include <charconv>
#include <cstring>
#include <fstream>
#include <sstream>

namespace agora::net {

namespace {

auto& log() { return Logger::get("net.upnp"); }

// RFC 6886
constexpr uint8_t NATPMP_VERSION = 0;
constexpr uint8_t NATPMP_OP_EXTERNAL_ADDRESS = 0;
constexpr uint8_t NATPMP_OP_MAP_UDP = 1;
constexpr uint8_t NATPMP_RESPONSE_BIT = 128;
constexpr size_t NATPMP_ADDRESS_RESPONSE_SIZE = 12;
constexpr size_t NATPMP_MAP_RESPONSE_SIZE = 16;

// External ports tried: local_port .. local_port + 9
constexpr int IGD_PORT_ATTEMPTS = 10;

std::vector<uint8_t> natpmp_map_request(uint16_t internal_port, uint16_t suggested_external,
                                        uint32_t lifetime) {
    wire::BinaryWriter w(12);
    w.write_u8(NATPMP_VERSION);
    w.write_u8(NATPMP_OP_MAP_UDP);
    w.write_u16(0);  // reserved
    w.write_u16(internal_port);
    w.write_u16(suggested_external);
    w.write_u32(lifetime);
    return w.take();
}

}  // namespace

std::string_view mapping_protocol_to_string(MappingProtocol protocol) {
    switch (protocol) {
        case MappingProtocol::UPNP_IGD: return "upnp-igd";
        case MappingProtocol::NAT_PMP: return "nat-pmp";
        default: return "unknown";
    }
}

UpnpMapper::UpnpMapper(asio::any_io_executor ex, const UpnpConfig& config)
    : executor_(std::move(ex))
    , config_(config) {}

UpnpMapper::~UpnpMapper() {
    pool_.join();
}

asio::awaitable<std::optional<ExternalMapping>> UpnpMapper::try_map(uint16_t local_port) {
    auto self = shared_from_this();

    if (!config_.enabled) {
        co_return std::nullopt;
    }

    if (config_.igd) {
        auto mapping = co_await asio::co_spawn(pool_.get_executor(), igd_map(local_port),
                                               asio::use_awaitable);
        if (mapping) {
            co_return mapping;
        }
    }

    co_return co_await try_natpmp(local_port);
}

asio::awaitable<void> UpnpMapper::release(ExternalMapping mapping) {
    auto self = shared_from_this();

    if (mapping.protocol == MappingProtocol::UPNP_IGD) {
        bool ok = co_await asio::co_spawn(pool_.get_executor(), igd_delete(mapping),
                                          asio::use_awaitable);
        if (ok) {
            log().info("Removed UPnP mapping for external UDP port {}", mapping.external.port());
        } else {
            log().warn("Failed to remove UPnP mapping for external UDP port {}",
                       mapping.external.port());
        }
        co_return;
    }

    auto request = natpmp_map_request(mapping.internal_port, 0, 0);
    auto response = co_await natpmp_request(mapping.gateway, request, NATPMP_OP_MAP_UDP,
                                            NATPMP_MAP_RESPONSE_SIZE,
                                            std::chrono::milliseconds(500));
    if (response) {
        log().info("Released NAT-PMP mapping for internal port {}", mapping.internal_port);
    } else {
        log().warn("NAT-PMP release for internal port {} got no answer", mapping.internal_port);
    }
}

// ============================================================================
// UPnP IGD (blocking, worker thread)
// ============================================================================

asio::awaitable<std::optional<ExternalMapping>> UpnpMapper::igd_map(uint16_t local_port) {
    int err = 0;
    auto delay = static_cast<int>(config_.discovery_timeout.count());
    UPNPDev* devlist = upnpDiscover(delay, nullptr, nullptr, 0, 0, 2, &err);
    if (!devlist) {
        log().debug("UPnP: no devices discovered (error {})", err);
        co_return std::nullopt;
    }

    UPNPUrls urls;
    IGDdatas data;
    char lanaddr[64] = {};
    char wanaddr[64] = {};
    std::memset(&urls, 0, sizeof(urls));
    std::memset(&data, 0, sizeof(data));

    int igd = UPNP_GetValidIGD(devlist, &urls, &data, lanaddr, sizeof(lanaddr),
                               wanaddr, sizeof(wanaddr));
    freeUPNPDevlist(devlist);
    if (igd != 1) {
        log().debug("UPnP: no connected IGD found ({})", igd);
        FreeUPNPUrls(&urls);
        co_return std::nullopt;
    }

    std::string control = urls.controlURL ? urls.controlURL : "";
    std::string service = data.first.servicetype;
    std::string lan = lanaddr;

    char external_ip[40] = {};
    int rc = UPNP_GetExternalIPAddress(control.c_str(), service.c_str(), external_ip);
    if (rc != UPNPCOMMAND_SUCCESS) {
        log().debug("UPnP: GetExternalIPAddress failed: {}", strupnperror(rc));
        FreeUPNPUrls(&urls);
        co_return std::nullopt;
    }

    boost::system::error_code ec;
    auto external_addr = asio::ip::make_address(external_ip, ec);
    if (ec || external_addr.is_unspecified()) {
        log().debug("UPnP: gateway reports unusable external address '{}'", external_ip);
        FreeUPNPUrls(&urls);
        co_return std::nullopt;
    }

    const std::string internal_s = std::to_string(local_port);
    const std::string lease_s = std::to_string(config_.lease.count());

    for (int i = 0; i < IGD_PORT_ATTEMPTS; ++i) {
        uint32_t ext = static_cast<uint32_t>(local_port) + static_cast<uint32_t>(i);
        if (ext > 0xFFFF) break;
        const std::string ext_s = std::to_string(ext);

        rc = UPNP_AddPortMapping(control.c_str(), service.c_str(), ext_s.c_str(),
                                 internal_s.c_str(), lan.c_str(), config_.description.c_str(),
                                 "UDP", nullptr, lease_s.c_str());
        if (rc == UPNPCOMMAND_SUCCESS) {
            ExternalMapping mapping;
            mapping.protocol = MappingProtocol::UPNP_IGD;
            mapping.external = udp::endpoint(external_addr, static_cast<uint16_t>(ext));
            mapping.internal_port = local_port;
            mapping.lease = config_.lease;
            mapping.control_url = control;
            mapping.service_type = service;
            FreeUPNPUrls(&urls);

            log().info("UPnP: mapped {} -> {}:{}", endpoint_to_string(mapping.external), lan, local_port);
            co_return mapping;
        }
        log().debug("UPnP: AddPortMapping {} failed: {}", ext_s, strupnperror(rc));
    }

    FreeUPNPUrls(&urls);
    log().debug("UPnP: port mapping failed");
    co_return std::nullopt;
}

asio::awaitable<bool> UpnpMapper::igd_delete(ExternalMapping mapping) {
    const std::string ext_s = std::to_string(mapping.external.port());
    int rc = UPNP_DeletePortMapping(mapping.control_url.c_str(), mapping.service_type.c_str(),
                                    ext_s.c_str(), "UDP", nullptr);
    co_return rc == UPNPCOMMAND_SUCCESS;
}

// ============================================================================
// NAT-PMP
// ============================================================================

std::optional<asio::ip::address_v4> UpnpMapper::parse_default_gateway(std::string_view route_table) {
    std::istringstream in{std::string(route_table)};
    std::string line;
    std::getline(in, line);  // header

    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string iface, destination, gateway;
        if (!(fields >> iface >> destination >> gateway)) continue;
        if (destination != "00000000") continue;

        uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(gateway.data(), gateway.data() + gateway.size(), value, 16);
        if (ec != std::errc{} || value == 0) continue;

        // Kernel prints the address in host byte order (little endian)
        asio::ip::address_v4::bytes_type bytes = {
            static_cast<uint8_t>(value & 0xFF),
            static_cast<uint8_t>((value >> 8) & 0xFF),
            static_cast<uint8_t>((value >> 16) & 0xFF),
            static_cast<uint8_t>((value >> 24) & 0xFF),
        };
        return asio::ip::address_v4(bytes);
    }
    return std::nullopt;
}

std::optional<udp::endpoint> UpnpMapper::natpmp_gateway() const {
    if (!config_.natpmp_gateway.empty()) {
        boost::system::error_code ec;
        auto addr = asio::ip::make_address(config_.natpmp_gateway, ec);
        if (ec) {
            log().warn("Invalid upnp.natpmp_gateway '{}'", config_.natpmp_gateway);
            return std::nullopt;
        }
        return udp::endpoint(addr, config_.natpmp_port);
    }

    std::ifstream file("/proc/net/route");
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto gw = parse_default_gateway(buffer.str());
    if (!gw) return std::nullopt;
    return udp::endpoint(*gw, config_.natpmp_port);
}

asio::awaitable<std::optional<std::vector<uint8_t>>> UpnpMapper::natpmp_request(
    const udp::endpoint& gateway, std::span<const uint8_t> request,
    uint8_t expected_op, size_t expected_size, std::chrono::milliseconds budget) {

    auto socket = std::make_shared<udp::socket>(executor_);
    boost::system::error_code ec;
    socket->open(udp::v4(), ec);
    if (ec) {
        log().debug("NAT-PMP: cannot open socket: {}", ec.message());
        co_return std::nullopt;
    }

    asio::steady_timer timer(executor_);
    std::array<uint8_t, 64> buffer{};
    udp::endpoint sender;

    const auto deadline = std::chrono::steady_clock::now() + budget;
    auto rto = defaults::NATPMP_INITIAL_RTO;

    while (std::chrono::steady_clock::now() < deadline) {
        socket->send_to(asio::buffer(request.data(), request.size()), gateway, 0, ec);
        if (ec) {
            log().debug("NAT-PMP: send to {} failed: {}", endpoint_to_string(gateway), ec.message());
            co_return std::nullopt;
        }

        auto wait = std::min<std::chrono::steady_clock::duration>(
            rto, deadline - std::chrono::steady_clock::now());
        timer.expires_after(wait);
        std::weak_ptr<udp::socket> weak = socket;
        timer.async_wait([weak](const boost::system::error_code& tec) {
            if (tec) return;
            if (auto s = weak.lock()) {
                boost::system::error_code ignored;
                s->cancel(ignored);
            }
        });

        // Keep reading until the timer cancels us or a valid answer shows up
        for (;;) {
            boost::system::error_code rec;
            size_t n = co_await socket->async_receive_from(
                asio::buffer(buffer), sender, asio::redirect_error(asio::use_awaitable, rec));
            if (rec) break;

            if (sender.address() != gateway.address()) continue;
            if (n < expected_size) continue;

            wire::BinaryReader r(std::span<const uint8_t>(buffer.data(), n));
            auto version = r.read_u8();
            auto op = r.read_u8();
            auto result = r.read_u16();
            if (!version || !op || !result) continue;
            if (*version != NATPMP_VERSION || *op != (NATPMP_RESPONSE_BIT | expected_op)) continue;

            timer.cancel();
            if (*result != 0) {
                log().debug("NAT-PMP: gateway answered op {} with result {}", expected_op, *result);
                co_return std::nullopt;
            }
            co_return std::vector<uint8_t>(buffer.begin(), buffer.begin() + n);
        }

        rto *= 2;
    }

    log().debug("NAT-PMP: no answer from {}", endpoint_to_string(gateway));
    co_return std::nullopt;
}

asio::awaitable<std::optional<ExternalMapping>> UpnpMapper::try_natpmp(uint16_t local_port) {
    auto self = shared_from_this();

    auto gateway = natpmp_gateway();
    if (!gateway) {
        log().debug("NAT-PMP: no default gateway");
        co_return std::nullopt;
    }

    const std::array<uint8_t, 2> address_request = {NATPMP_VERSION, NATPMP_OP_EXTERNAL_ADDRESS};
    auto address_response = co_await natpmp_request(*gateway, address_request,
                                                    NATPMP_OP_EXTERNAL_ADDRESS,
                                                    NATPMP_ADDRESS_RESPONSE_SIZE,
                                                    config_.discovery_timeout);
    if (!address_response) {
        co_return std::nullopt;
    }

    wire::BinaryReader ar(*address_response);
    ar.skip(8);  // version, op, result, epoch
    auto external_ip = ar.read_u32();
    if (!external_ip || *external_ip == 0) {
        co_return std::nullopt;
    }

    auto lifetime = static_cast<uint32_t>(config_.lease.count());
    auto map_request = natpmp_map_request(local_port, local_port, lifetime);
    auto map_response = co_await natpmp_request(*gateway, map_request, NATPMP_OP_MAP_UDP,
                                                NATPMP_MAP_RESPONSE_SIZE,
                                                config_.discovery_timeout);
    if (!map_response) {
        co_return std::nullopt;
    }

    wire::BinaryReader mr(*map_response);
    mr.skip(8);  // version, op, result, epoch
    auto internal = mr.read_u16();
    auto external = mr.read_u16();
    auto granted = mr.read_u32();
    if (!internal || !external || !granted) {
        co_return std::nullopt;
    }
    if (*internal != local_port || *external == 0) {
        log().debug("NAT-PMP: mismatched mapping {} -> {}", *internal, *external);
        co_return std::nullopt;
    }

    ExternalMapping mapping;
    mapping.protocol = MappingProtocol::NAT_PMP;
    mapping.external = udp::endpoint(asio::ip::address_v4(*external_ip), *external);
    mapping.internal_port = local_port;
    mapping.lease = std::chrono::seconds(*granted);
    mapping.gateway = *gateway;

    log().info("NAT-PMP: mapped {} -> :{} for {}s", endpoint_to_string(mapping.external),
               local_port, *granted);
    co_return mapping;
}

} // namespace agora::net
