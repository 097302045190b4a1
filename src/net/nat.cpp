#include "net/nat.hpp"

#include <algorithm>

namespace agora::net {

std::string_view nat_type_to_string(NatType type) {
    switch (type) {
        case NatType::UNKNOWN: return "unknown";
        case NatType::OPEN_INTERNET: return "open";
        case NatType::FULL_CONE: return "full_cone";
        case NatType::RESTRICTED_CONE: return "restricted_cone";
        case NatType::PORT_RESTRICTED: return "port_restricted";
        case NatType::SYMMETRIC: return "symmetric";
        default: return "unknown";
    }
}

bool can_hole_punch(NatType type) {
    return type != NatType::SYMMETRIC && type != NatType::UNKNOWN;
}

NatAssessment classify_nat(const std::vector<udp::endpoint>& mapped,
                           uint16_t local_port,
                           const std::vector<boost::asio::ip::address>& local_addresses) {
    NatAssessment result;
    if (mapped.empty()) {
        return result;
    }

    const auto& first = mapped.front();
    result.public_address = first;

    bool is_local = first.port() == local_port &&
        std::find(local_addresses.begin(), local_addresses.end(), first.address()) != local_addresses.end();

    if (is_local) {
        result.type = NatType::OPEN_INTERNET;
    } else if (mapped.size() >= 2) {
        // Filtering is not observable here; a destination-independent
        // mapping counts as a cone whether or not the port was kept
        result.type = mapped[1] == first ? NatType::FULL_CONE : NatType::SYMMETRIC;
    }
    // One non-local answer: mapping known, behavior not

    result.can_hole_punch = can_hole_punch(result.type);
    return result;
}

} // namespace agora::net
