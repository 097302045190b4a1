#include "common/binary_codec.hpp"

namespace agora::wire {

namespace {
constexpr uint8_t FAMILY_V4 = 4;
constexpr uint8_t FAMILY_V6 = 6;
}

// ============================================================================
// Addresses and endpoints
// ============================================================================

void BinaryWriter::write_address(const boost::asio::ip::address& addr) {
    if (addr.is_v4()) {
        write_u8(FAMILY_V4);
        write_fixed_bytes(addr.to_v4().to_bytes());
    } else {
        write_u8(FAMILY_V6);
        write_fixed_bytes(addr.to_v6().to_bytes());
    }
}

void BinaryWriter::write_endpoint(const boost::asio::ip::udp::endpoint& ep) {
    write_address(ep.address());
    write_u16(ep.port());
}

std::expected<boost::asio::ip::address, ErrorCode> BinaryReader::read_address() {
    const auto start = pos_;
    auto family = read_u8();
    if (!family) return std::unexpected(family.error());

    switch (*family) {
    case FAMILY_V4:
        if (auto bytes = read_fixed_array<4>()) {
            return boost::asio::ip::address(boost::asio::ip::address_v4(*bytes));
        }
        break;
    case FAMILY_V6:
        if (auto bytes = read_fixed_array<16>()) {
            return boost::asio::ip::address(boost::asio::ip::address_v6(*bytes));
        }
        break;
    default:
        break;
    }
    pos_ = start;
    return std::unexpected(ErrorCode::INVALID_MESSAGE);
}

std::expected<boost::asio::ip::udp::endpoint, ErrorCode> BinaryReader::read_endpoint() {
    const auto start = pos_;
    auto addr = read_address();
    if (!addr) return std::unexpected(addr.error());
    auto port = read_u16();
    if (!port) {
        pos_ = start;
        return std::unexpected(port.error());
    }
    return boost::asio::ip::udp::endpoint(*addr, *port);
}

} // namespace agora::wire
