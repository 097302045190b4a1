#pragma once

#include "common/protocol.hpp"

#include <boost/asio/ip/udp.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agora::net {

using udp = boost::asio::ip::udp;

// ============================================================================
// STUN / TURN constants (RFC 5389, RFC 5766, RFC 8445)
// ============================================================================
namespace stun {

inline constexpr uint32_t MAGIC_COOKIE = 0x2112A442;
inline constexpr size_t HEADER_SIZE = 20;
inline constexpr size_t MESSAGE_INTEGRITY_SIZE = 20;

enum class Method : uint16_t {
    BINDING           = 0x001,
    ALLOCATE          = 0x003,
    REFRESH           = 0x004,
    SEND              = 0x006,
    DATA              = 0x007,
    CREATE_PERMISSION = 0x008,
};

enum class Class : uint8_t {
    REQUEST    = 0,
    INDICATION = 1,
    SUCCESS    = 2,
    ERROR      = 3,
};

namespace attr {
inline constexpr uint16_t MAPPED_ADDRESS      = 0x0001;
inline constexpr uint16_t USERNAME            = 0x0006;
inline constexpr uint16_t MESSAGE_INTEGRITY   = 0x0008;
inline constexpr uint16_t ERROR_CODE          = 0x0009;
inline constexpr uint16_t LIFETIME            = 0x000D;
inline constexpr uint16_t XOR_PEER_ADDRESS    = 0x0012;
inline constexpr uint16_t DATA                = 0x0013;
inline constexpr uint16_t REALM               = 0x0014;
inline constexpr uint16_t NONCE               = 0x0015;
inline constexpr uint16_t XOR_RELAYED_ADDRESS = 0x0016;
inline constexpr uint16_t REQUESTED_TRANSPORT = 0x0019;
inline constexpr uint16_t XOR_MAPPED_ADDRESS  = 0x0020;
inline constexpr uint16_t PRIORITY            = 0x0024;
inline constexpr uint16_t USE_CANDIDATE       = 0x0025;
inline constexpr uint16_t SOFTWARE            = 0x8022;
inline constexpr uint16_t ICE_CONTROLLED      = 0x8029;
inline constexpr uint16_t ICE_CONTROLLING     = 0x802A;
}  // namespace attr

namespace error {
inline constexpr uint16_t BAD_REQUEST       = 400;
inline constexpr uint16_t UNAUTHORIZED      = 401;
inline constexpr uint16_t FORBIDDEN         = 403;
inline constexpr uint16_t ALLOCATION_MISMATCH = 437;
inline constexpr uint16_t STALE_NONCE       = 438;
inline constexpr uint16_t ROLE_CONFLICT     = 487;
inline constexpr uint16_t INSUFFICIENT_CAPACITY = 508;
}  // namespace error

// REQUESTED-TRANSPORT value for UDP (protocol 17 in the top byte)
inline constexpr uint32_t TRANSPORT_UDP = 17u << 24;

}  // namespace stun

using TransactionId = std::array<uint8_t, 12>;

struct StunAttribute {
    uint16_t type;
    std::vector<uint8_t> value;
};

// ============================================================================
// StunMessage - encode/decode
// ============================================================================
class StunMessage {
public:
    StunMessage() = default;
    StunMessage(stun::Method method, stun::Class cls, const TransactionId& id);

    // New request/indication with a random transaction id
    static StunMessage request(stun::Method method);
    static StunMessage indication(stun::Method method);

    // Success or error response carrying the request's transaction id
    static StunMessage success_for(const StunMessage& request);
    static StunMessage error_for(const StunMessage& request, uint16_t code, std::string_view reason);

    // Quick check on the first bytes (RFC 5389 section 6: top two bits 0 + cookie)
    static bool is_stun(std::span<const uint8_t> data);

    static std::expected<StunMessage, ErrorCode> decode(std::span<const uint8_t> data);

    std::vector<uint8_t> encode() const;

    // Encode with a trailing MESSAGE-INTEGRITY (HMAC-SHA1 keyed by `key`)
    std::vector<uint8_t> encode(std::span<const uint8_t> integrity_key) const;

    // Check MESSAGE-INTEGRITY of a decoded message against `key`
    bool verify_integrity(std::span<const uint8_t> key) const;
    bool has_integrity() const { return has_integrity_; }

    stun::Method method() const { return method_; }
    stun::Class message_class() const { return class_; }
    uint16_t message_type() const;
    const TransactionId& transaction_id() const { return transaction_id_; }

    bool is_request() const { return class_ == stun::Class::REQUEST; }
    bool is_indication() const { return class_ == stun::Class::INDICATION; }
    bool is_response() const {
        return class_ == stun::Class::SUCCESS || class_ == stun::Class::ERROR;
    }

    // ------------------------------------------------------------------
    // Attributes
    // ------------------------------------------------------------------
    void add_attribute(uint16_t type, std::span<const uint8_t> value);
    void add_u32(uint16_t type, uint32_t value);
    void add_u64(uint16_t type, uint64_t value);
    void add_string(uint16_t type, std::string_view value);
    void add_flag(uint16_t type);
    void add_xor_address(uint16_t type, const udp::endpoint& ep);
    void add_mapped_address(const udp::endpoint& ep);
    void add_error_code(uint16_t code, std::string_view reason);

    const StunAttribute* find(uint16_t type) const;
    bool has(uint16_t type) const { return find(type) != nullptr; }

    std::optional<uint32_t> get_u32(uint16_t type) const;
    std::optional<uint64_t> get_u64(uint16_t type) const;
    std::optional<std::string> get_string(uint16_t type) const;
    std::optional<udp::endpoint> get_xor_address(uint16_t type) const;
    std::optional<uint16_t> get_error_code() const;

    // XOR-MAPPED-ADDRESS, falling back to MAPPED-ADDRESS for old servers
    std::optional<udp::endpoint> mapped_address() const;

    const std::vector<StunAttribute>& attributes() const { return attributes_; }

private:
    std::vector<uint8_t> encode_header_and_attributes(size_t extra_length) const;

    stun::Method method_ = stun::Method::BINDING;
    stun::Class class_ = stun::Class::REQUEST;
    TransactionId transaction_id_{};
    std::vector<StunAttribute> attributes_;

    // Set by decode(): raw bytes preceding MESSAGE-INTEGRITY, for verification
    std::vector<uint8_t> integrity_prefix_;
    std::array<uint8_t, stun::MESSAGE_INTEGRITY_SIZE> integrity_{};
    bool has_integrity_ = false;
};

TransactionId random_transaction_id();

} // namespace agora::net
