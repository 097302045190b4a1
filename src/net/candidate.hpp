#pragma once

#include "common/constants.hpp"
#include "common/protocol.hpp"

#include <boost/asio/ip/udp.hpp>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agora::net {

using udp = boost::asio::ip::udp;

// ============================================================================
// Candidate
// ============================================================================

enum class CandidateKind : uint8_t {
    HOST = 0,
    SERVER_REFLEXIVE = 1,
    PEER_REFLEXIVE = 2,
    RELAYED = 3,
};

enum class TransportProtocol : uint8_t {
    UDP = 0,
    TCP = 1,
};

std::string_view candidate_kind_to_string(CandidateKind kind);
std::string_view transport_to_string(TransportProtocol transport);

struct Candidate {
    CandidateKind kind = CandidateKind::HOST;
    TransportProtocol transport = TransportProtocol::UDP;
    udp::endpoint address;
    uint32_t priority = 0;
    uint16_t component = ice::DEFAULT_COMPONENT;
    // Where traffic for this candidate is sent from: the host socket, or
    // the relay allocation for RELAYED
    udp::endpoint base;

    bool operator==(const Candidate&) const = default;
};

uint32_t type_preference(CandidateKind kind);

// 2^24 * type pref + 2^8 * local pref + (256 - component)
uint32_t candidate_priority(CandidateKind kind, uint32_t local_pref,
                            uint16_t component = ice::DEFAULT_COMPONENT);

// Same layout with the lower TCP type preferences
uint32_t tcp_candidate_priority(CandidateKind kind, uint32_t local_pref,
                                uint16_t component = ice::DEFAULT_COMPONENT);

// Local preference encoded in a candidate priority
uint32_t local_preference(uint32_t priority);

// G = controlling agent's candidate priority, D = controlled agent's
uint64_t pair_priority(uint32_t controlling, uint32_t controlled);

std::string to_string(const Candidate& c);

// ============================================================================
// CandidateAdvertisement - signalled through the discovery layer
// ============================================================================
// u8 version | string peer_id | u16 count |
// count * { u8 kind | u8 transport | address | u16 port | u32 priority }

struct CandidateAdvertisement {
    PeerId peer_id;
    std::vector<Candidate> candidates;

    // MESSAGE_TOO_LARGE past protocol::MAX_CANDIDATES
    std::expected<std::vector<uint8_t>, ErrorCode> encode() const;
    static std::expected<CandidateAdvertisement, ErrorCode> decode(std::span<const uint8_t> data);
};

} // namespace agora::net
