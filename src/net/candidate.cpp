#include "net/candidate.hpp"
#include "common/binary_codec.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace agora::net {

std::string_view candidate_kind_to_string(CandidateKind kind) {
    switch (kind) {
        case CandidateKind::HOST: return "host";
        case CandidateKind::SERVER_REFLEXIVE: return "srflx";
        case CandidateKind::PEER_REFLEXIVE: return "prflx";
        case CandidateKind::RELAYED: return "relay";
        default: return "unknown";
    }
}

std::string_view transport_to_string(TransportProtocol transport) {
    switch (transport) {
        case TransportProtocol::UDP: return "udp";
        case TransportProtocol::TCP: return "tcp";
        default: return "unknown";
    }
}

uint32_t type_preference(CandidateKind kind) {
    switch (kind) {
        case CandidateKind::HOST: return ice::TYPE_PREF_HOST;
        case CandidateKind::PEER_REFLEXIVE: return ice::TYPE_PREF_PEER_REFLEXIVE;
        case CandidateKind::SERVER_REFLEXIVE: return ice::TYPE_PREF_SERVER_REFLEXIVE;
        case CandidateKind::RELAYED: return ice::TYPE_PREF_RELAYED;
        default: return 0;
    }
}

uint32_t candidate_priority(CandidateKind kind, uint32_t local_pref, uint16_t component) {
    return (type_preference(kind) << 24) +
           ((local_pref & 0xFFFF) << 8) +
           (256 - static_cast<uint32_t>(component));
}

uint32_t tcp_candidate_priority(CandidateKind kind, uint32_t local_pref, uint16_t component) {
    auto type = kind == CandidateKind::HOST ? ice::TYPE_PREF_TCP_HOST : ice::TYPE_PREF_TCP_REFLEXIVE;
    return (type << 24) + ((local_pref & 0xFFFF) << 8) + (256 - static_cast<uint32_t>(component));
}

uint32_t local_preference(uint32_t priority) {
    return (priority >> 8) & 0xFFFF;
}

uint64_t pair_priority(uint32_t controlling, uint32_t controlled) {
    uint64_t g = controlling;
    uint64_t d = controlled;
    return (std::min(g, d) << 32) + 2 * std::max(g, d) + (g > d ? 1 : 0);
}

std::string to_string(const Candidate& c) {
    return fmt::format("{}/{} {}:{} prio={}", candidate_kind_to_string(c.kind),
                       transport_to_string(c.transport), c.address.address().to_string(),
                       c.address.port(), c.priority);
}

// ============================================================================
// Advertisement codec
// ============================================================================

std::expected<std::vector<uint8_t>, ErrorCode> CandidateAdvertisement::encode() const {
    if (candidates.size() > protocol::MAX_CANDIDATES) {
        return std::unexpected(ErrorCode::MESSAGE_TOO_LARGE);
    }
    if (peer_id.size() > protocol::MAX_PEER_ID_LENGTH) {
        return std::unexpected(ErrorCode::INVALID_ARGUMENT);
    }

    wire::BinaryWriter w(4 + peer_id.size() + candidates.size() * 24);
    w.write_u8(protocol::ADVERTISEMENT_VERSION);
    w.write_string(peer_id);
    w.write_array_header(static_cast<uint16_t>(candidates.size()));
    for (const auto& c : candidates) {
        w.write_u8(static_cast<uint8_t>(c.kind));
        w.write_u8(static_cast<uint8_t>(c.transport));
        w.write_endpoint(c.address);
        w.write_u32(c.priority);
    }
    return w.take();
}

std::expected<CandidateAdvertisement, ErrorCode> CandidateAdvertisement::decode(std::span<const uint8_t> data) {
    wire::BinaryReader r(data);

    auto version = r.read_u8();
    if (!version) return std::unexpected(version.error());
    if (*version != protocol::ADVERTISEMENT_VERSION) {
        return std::unexpected(ErrorCode::UNSUPPORTED_VERSION);
    }

    CandidateAdvertisement adv;
    auto peer_id = r.read_string();
    if (!peer_id) return std::unexpected(peer_id.error());
    if (peer_id->empty() || peer_id->size() > protocol::MAX_PEER_ID_LENGTH) {
        return std::unexpected(ErrorCode::INVALID_MESSAGE);
    }
    adv.peer_id = std::move(*peer_id);

    auto count = r.read_array_header();
    if (!count) return std::unexpected(count.error());
    if (*count > protocol::MAX_CANDIDATES) {
        return std::unexpected(ErrorCode::MESSAGE_TOO_LARGE);
    }

    adv.candidates.reserve(*count);
    for (uint16_t i = 0; i < *count; ++i) {
        auto kind = r.read_u8();
        auto transport = r.read_u8();
        if (!kind || !transport) return std::unexpected(ErrorCode::INVALID_MESSAGE);
        if (*kind > static_cast<uint8_t>(CandidateKind::RELAYED) ||
            *transport > static_cast<uint8_t>(TransportProtocol::TCP)) {
            return std::unexpected(ErrorCode::INVALID_MESSAGE);
        }

        auto endpoint = r.read_endpoint();
        if (!endpoint) return std::unexpected(endpoint.error());
        auto priority = r.read_u32();
        if (!priority) return std::unexpected(priority.error());

        Candidate c;
        c.kind = static_cast<CandidateKind>(*kind);
        c.transport = static_cast<TransportProtocol>(*transport);
        c.address = *endpoint;
        c.priority = *priority;
        c.base = c.address;
        adv.candidates.push_back(c);
    }

    if (r.remaining() != 0) {
        return std::unexpected(ErrorCode::INVALID_MESSAGE);
    }
    return adv;
}

} // namespace agora::net
