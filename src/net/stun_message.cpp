#include "net/stun_message.hpp"
#include "common/binary_codec.hpp"
#include "common/crypto.hpp"

#include <cstring>

namespace agora::net {

namespace {

constexpr uint16_t COOKIE_HIGH = static_cast<uint16_t>(stun::MAGIC_COOKIE >> 16);

constexpr uint8_t FAMILY_IPV4 = 0x01;
constexpr uint8_t FAMILY_IPV6 = 0x02;

uint16_t compose_type(stun::Method method, stun::Class cls) {
    auto m = static_cast<uint16_t>(method);
    auto c = static_cast<uint16_t>(cls);
    return static_cast<uint16_t>((m & 0x000F) | ((m & 0x0070) << 1) | ((m & 0x0F80) << 2) |
                                 ((c & 0x1) << 4) | ((c & 0x2) << 7));
}

// Address value layout: 0 | family | port | address (RFC 5389 section 15.1)
std::vector<uint8_t> encode_address(const udp::endpoint& ep, bool xored, const TransactionId& id) {
    wire::BinaryWriter w(20);
    w.write_u8(0);
    uint16_t port = ep.port();
    if (xored) port ^= COOKIE_HIGH;

    if (ep.address().is_v4()) {
        w.write_u8(FAMILY_IPV4);
        w.write_u16(port);
        uint32_t addr = ep.address().to_v4().to_uint();
        if (xored) addr ^= stun::MAGIC_COOKIE;
        w.write_u32(addr);
    } else {
        w.write_u8(FAMILY_IPV6);
        w.write_u16(port);
        auto bytes = ep.address().to_v6().to_bytes();
        if (xored) {
            // XOR with cookie || transaction id
            std::array<uint8_t, 16> mask{};
            mask[0] = 0x21; mask[1] = 0x12; mask[2] = 0xA4; mask[3] = 0x42;
            std::memcpy(mask.data() + 4, id.data(), id.size());
            for (size_t i = 0; i < bytes.size(); ++i) bytes[i] ^= mask[i];
        }
        w.write_fixed_bytes(bytes);
    }
    return w.take();
}

std::optional<udp::endpoint> decode_address(std::span<const uint8_t> value, bool xored,
                                            const TransactionId& id) {
    wire::BinaryReader r(value);
    auto reserved = r.read_u8();
    auto family = r.read_u8();
    auto port = r.read_u16();
    if (!reserved || !family || !port) return std::nullopt;

    uint16_t p = *port;
    if (xored) p ^= COOKIE_HIGH;

    if (*family == FAMILY_IPV4) {
        auto addr = r.read_u32();
        if (!addr) return std::nullopt;
        uint32_t a = *addr;
        if (xored) a ^= stun::MAGIC_COOKIE;
        return udp::endpoint(boost::asio::ip::address_v4(a), p);
    }
    if (*family == FAMILY_IPV6) {
        auto bytes = r.read_fixed_array<16>();
        if (!bytes) return std::nullopt;
        if (xored) {
            std::array<uint8_t, 16> mask{};
            mask[0] = 0x21; mask[1] = 0x12; mask[2] = 0xA4; mask[3] = 0x42;
            std::memcpy(mask.data() + 4, id.data(), id.size());
            for (size_t i = 0; i < bytes->size(); ++i) (*bytes)[i] ^= mask[i];
        }
        return udp::endpoint(boost::asio::ip::address_v6(*bytes), p);
    }
    return std::nullopt;
}

}  // namespace

TransactionId random_transaction_id() {
    TransactionId id;
    crypto::random_bytes(id);
    return id;
}

StunMessage::StunMessage(stun::Method method, stun::Class cls, const TransactionId& id)
    : method_(method), class_(cls), transaction_id_(id) {}

StunMessage StunMessage::request(stun::Method method) {
    return StunMessage(method, stun::Class::REQUEST, random_transaction_id());
}

StunMessage StunMessage::indication(stun::Method method) {
    return StunMessage(method, stun::Class::INDICATION, random_transaction_id());
}

StunMessage StunMessage::success_for(const StunMessage& request) {
    return StunMessage(request.method(), stun::Class::SUCCESS, request.transaction_id());
}

StunMessage StunMessage::error_for(const StunMessage& request, uint16_t code, std::string_view reason) {
    StunMessage msg(request.method(), stun::Class::ERROR, request.transaction_id());
    msg.add_error_code(code, reason);
    return msg;
}

uint16_t StunMessage::message_type() const {
    return compose_type(method_, class_);
}

bool StunMessage::is_stun(std::span<const uint8_t> data) {
    if (data.size() < stun::HEADER_SIZE) return false;
    if ((data[0] & 0xC0) != 0) return false;
    uint32_t cookie = (static_cast<uint32_t>(data[4]) << 24) | (static_cast<uint32_t>(data[5]) << 16) |
                      (static_cast<uint32_t>(data[6]) << 8) | static_cast<uint32_t>(data[7]);
    return cookie == stun::MAGIC_COOKIE;
}

// ============================================================================
// Decode
// ============================================================================

std::expected<StunMessage, ErrorCode> StunMessage::decode(std::span<const uint8_t> data) {
    if (!is_stun(data)) {
        return std::unexpected(ErrorCode::INVALID_MESSAGE);
    }

    wire::BinaryReader r(data);
    uint16_t type = *r.read_u16();
    uint16_t length = *r.read_u16();
    r.skip(4);  // cookie
    auto id = r.read_fixed_array<12>();

    if (length % 4 != 0 || stun::HEADER_SIZE + length > data.size()) {
        return std::unexpected(ErrorCode::INVALID_MESSAGE);
    }

    StunMessage msg;
    auto cls = static_cast<uint8_t>(((type >> 4) & 0x1) | ((type >> 7) & 0x2));
    auto method = static_cast<uint16_t>((type & 0x000F) | ((type >> 1) & 0x0070) | ((type >> 2) & 0x0F80));
    msg.class_ = static_cast<stun::Class>(cls);
    msg.method_ = static_cast<stun::Method>(method);
    msg.transaction_id_ = *id;

    const size_t end = stun::HEADER_SIZE + length;
    while (r.position() + 4 <= end) {
        size_t attr_start = r.position();
        uint16_t attr_type = *r.read_u16();
        uint16_t attr_len = *r.read_u16();
        if (r.position() + attr_len > end) {
            return std::unexpected(ErrorCode::INVALID_MESSAGE);
        }

        auto value = r.read_fixed_bytes(attr_len);
        if (!value) return std::unexpected(value.error());

        if (attr_type == stun::attr::MESSAGE_INTEGRITY) {
            if (attr_len != stun::MESSAGE_INTEGRITY_SIZE) {
                return std::unexpected(ErrorCode::INVALID_MESSAGE);
            }
            msg.has_integrity_ = true;
            std::memcpy(msg.integrity_.data(), value->data(), value->size());
            msg.integrity_prefix_.assign(data.begin(), data.begin() + attr_start);
            // Attributes after MESSAGE-INTEGRITY are not covered; ignore them
            break;
        }

        msg.attributes_.push_back({attr_type, std::move(*value)});

        if (!r.skip_padding(4, attr_start)) {
            return std::unexpected(ErrorCode::INVALID_MESSAGE);
        }
    }

    return msg;
}

// ============================================================================
// Encode
// ============================================================================

std::vector<uint8_t> StunMessage::encode_header_and_attributes(size_t extra_length) const {
    size_t body = 0;
    for (const auto& a : attributes_) {
        body += 4 + wire::aligned_size(a.value.size(), 4);
    }

    wire::BinaryWriter w(stun::HEADER_SIZE + body + extra_length);
    w.write_u16(message_type());
    w.write_u16(static_cast<uint16_t>(body + extra_length));
    w.write_u32(stun::MAGIC_COOKIE);
    w.write_fixed_bytes(transaction_id_);

    for (const auto& a : attributes_) {
        w.write_u16(a.type);
        w.write_u16(static_cast<uint16_t>(a.value.size()));
        w.write_fixed_bytes(a.value);
        w.write_padding(4, stun::HEADER_SIZE);
    }
    return w.take();
}

std::vector<uint8_t> StunMessage::encode() const {
    return encode_header_and_attributes(0);
}

std::vector<uint8_t> StunMessage::encode(std::span<const uint8_t> integrity_key) const {
    // The length field must already count the MESSAGE-INTEGRITY attribute
    // when the HMAC is computed (RFC 5389 section 15.4)
    auto out = encode_header_and_attributes(4 + stun::MESSAGE_INTEGRITY_SIZE);
    auto mac = crypto::hmac_sha1(integrity_key, out);

    wire::BinaryWriter w;
    w.write_u16(stun::attr::MESSAGE_INTEGRITY);
    w.write_u16(static_cast<uint16_t>(stun::MESSAGE_INTEGRITY_SIZE));
    w.write_fixed_bytes(mac);
    out.insert(out.end(), w.data().begin(), w.data().end());
    return out;
}

bool StunMessage::verify_integrity(std::span<const uint8_t> key) const {
    if (!has_integrity_ || integrity_prefix_.size() < stun::HEADER_SIZE) {
        return false;
    }

    std::vector<uint8_t> covered = integrity_prefix_;
    uint16_t adjusted = static_cast<uint16_t>(
        covered.size() - stun::HEADER_SIZE + 4 + stun::MESSAGE_INTEGRITY_SIZE);
    covered[2] = static_cast<uint8_t>(adjusted >> 8);
    covered[3] = static_cast<uint8_t>(adjusted & 0xFF);

    auto mac = crypto::hmac_sha1(key, covered);
    return crypto::secure_compare(mac, integrity_);
}

// ============================================================================
// Attribute helpers
// ============================================================================

void StunMessage::add_attribute(uint16_t type, std::span<const uint8_t> value) {
    attributes_.push_back({type, std::vector<uint8_t>(value.begin(), value.end())});
}

void StunMessage::add_u32(uint16_t type, uint32_t value) {
    wire::BinaryWriter w(4);
    w.write_u32(value);
    add_attribute(type, w.data());
}

void StunMessage::add_u64(uint16_t type, uint64_t value) {
    wire::BinaryWriter w(8);
    w.write_u64(value);
    add_attribute(type, w.data());
}

void StunMessage::add_string(uint16_t type, std::string_view value) {
    add_attribute(type, std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(value.data()), value.size()));
}

void StunMessage::add_flag(uint16_t type) {
    attributes_.push_back({type, {}});
}

void StunMessage::add_xor_address(uint16_t type, const udp::endpoint& ep) {
    attributes_.push_back({type, encode_address(ep, true, transaction_id_)});
}

void StunMessage::add_mapped_address(const udp::endpoint& ep) {
    attributes_.push_back({stun::attr::MAPPED_ADDRESS, encode_address(ep, false, transaction_id_)});
}

void StunMessage::add_error_code(uint16_t code, std::string_view reason) {
    wire::BinaryWriter w(4 + reason.size());
    w.write_u16(0);
    w.write_u8(static_cast<uint8_t>(code / 100));
    w.write_u8(static_cast<uint8_t>(code % 100));
    w.write_fixed_bytes(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(reason.data()), reason.size()));
    add_attribute(stun::attr::ERROR_CODE, w.data());
}

const StunAttribute* StunMessage::find(uint16_t type) const {
    for (const auto& a : attributes_) {
        if (a.type == type) return &a;
    }
    return nullptr;
}

std::optional<uint32_t> StunMessage::get_u32(uint16_t type) const {
    auto* a = find(type);
    if (!a) return std::nullopt;
    wire::BinaryReader r(a->value);
    auto v = r.read_u32();
    if (!v) return std::nullopt;
    return *v;
}

std::optional<uint64_t> StunMessage::get_u64(uint16_t type) const {
    auto* a = find(type);
    if (!a) return std::nullopt;
    wire::BinaryReader r(a->value);
    auto v = r.read_u64();
    if (!v) return std::nullopt;
    return *v;
}

std::optional<std::string> StunMessage::get_string(uint16_t type) const {
    auto* a = find(type);
    if (!a) return std::nullopt;
    return std::string(a->value.begin(), a->value.end());
}

std::optional<udp::endpoint> StunMessage::get_xor_address(uint16_t type) const {
    auto* a = find(type);
    if (!a) return std::nullopt;
    return decode_address(a->value, true, transaction_id_);
}

std::optional<uint16_t> StunMessage::get_error_code() const {
    auto* a = find(stun::attr::ERROR_CODE);
    if (!a || a->value.size() < 4) return std::nullopt;
    return static_cast<uint16_t>((a->value[2] & 0x07) * 100 + a->value[3]);
}

std::optional<udp::endpoint> StunMessage::mapped_address() const {
    if (auto ep = get_xor_address(stun::attr::XOR_MAPPED_ADDRESS)) {
        return ep;
    }
    if (auto* a = find(stun::attr::MAPPED_ADDRESS)) {
        return decode_address(a->value, false, transaction_id_);
    }
    return std::nullopt;
}

} // namespace agora::net
