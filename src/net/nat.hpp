#pragma once

#include <boost/asio/ip/udp.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace agora::net {

using udp = boost::asio::ip::udp;

// NAT behavior as far as two STUN answers can tell
enum class NatType : uint8_t {
    UNKNOWN = 0,
    OPEN_INTERNET = 1,     // no translation
    FULL_CONE = 2,         // mapping independent of destination
    RESTRICTED_CONE = 3,   // never reported by classify_nat
    PORT_RESTRICTED = 4,   // never reported by classify_nat
    SYMMETRIC = 5,         // mapping depends on destination
};

std::string_view nat_type_to_string(NatType type);

// false only where direct hole punching is hopeless or untested
bool can_hole_punch(NatType type);

struct NatAssessment {
    NatType type = NatType::UNKNOWN;
    bool can_hole_punch = false;
    std::optional<udp::endpoint> public_address;

    bool operator==(const NatAssessment&) const = default;
};

// Classify from the mapped addresses reported by up to two distinct
// servers, the socket's local port and the host's interface addresses.
NatAssessment classify_nat(const std::vector<udp::endpoint>& mapped,
                           uint16_t local_port,
                           const std::vector<boost::asio::ip::address>& local_addresses);

} // namespace agora::net
