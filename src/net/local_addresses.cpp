#include "net/local_addresses.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace agora::net {

namespace {
auto& log() { return Logger::get("net.ice"); }
}

std::vector<boost::asio::ip::address> enumerate_local_addresses() {
    std::vector<boost::asio::ip::address> result;

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        log().error("getifaddrs failed: {}", std::strerror(errno));
        return result;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) continue;
        if (ifa->ifa_addr->sa_family != AF_INET) continue;

        // Skip loopback and interfaces that are down
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;
        if (!(ifa->ifa_flags & IFF_RUNNING)) continue;

        auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        boost::asio::ip::address_v4 addr(ntohl(sin->sin_addr.s_addr));

        // 169.254.0.0/16
        if ((addr.to_uint() & 0xFFFF0000u) == 0xA9FE0000u) continue;

        if (std::find(result.begin(), result.end(), addr) != result.end()) continue;

        log().debug("Found local address {} on {}", addr.to_string(), ifa->ifa_name);
        result.emplace_back(addr);
    }

    freeifaddrs(ifaddr);
    return result;
}

std::vector<boost::asio::ip::address> sorted_addresses(std::vector<boost::asio::ip::address> addrs) {
    std::sort(addrs.begin(), addrs.end());
    addrs.erase(std::unique(addrs.begin(), addrs.end()), addrs.end());
    return addrs;
}

} // namespace agora::net
