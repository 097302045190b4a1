#pragma once

#include "common/protocol.hpp"
#include "session/identity.hpp"

#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace agora::session {

enum class HandshakeRole : uint8_t {
    INITIATOR,
    RESPONDER,
};

enum class HandshakeState : uint8_t {
    IDLE,
    SENT_INIT,        // initiator, waiting for msg2
    SENT_RESPONSE,    // responder, waiting for msg3
    ESTABLISHED,
    FAILED,
};

std::string_view handshake_role_to_string(HandshakeRole role);
std::string_view handshake_state_to_string(HandshakeState state);

struct HandshakeResult {
    SessionKey secret{};
    Sha256Digest transcript_hash{};
    Ed25519PublicKey remote_public_key{};
    PeerId remote_peer_id;
    HandshakeRole role = HandshakeRole::INITIATOR;
};

namespace handshake {
inline constexpr std::string_view PROTOCOL_NAME = "Agora_XX_25519_ChaChaPoly_SHA256";
inline constexpr size_t MSG1_SIZE = 1 + 1 + 32 + 2;
inline constexpr size_t PROOF_PAYLOAD_SIZE = CryptoConstants::ED25519_PUB_SIZE + CryptoConstants::ED25519_SIG_SIZE;
inline constexpr size_t PROOF_CIPHERTEXT_SIZE = PROOF_PAYLOAD_SIZE + CryptoConstants::POLY1305_TAG_SIZE;
inline constexpr size_t MSG2_SIZE = 1 + 1 + 32 + 2 + PROOF_CIPHERTEXT_SIZE;
inline constexpr size_t MSG3_SIZE = 1 + 1 + 2 + PROOF_CIPHERTEXT_SIZE;
}  // namespace handshake

// First byte in 0xC1..0xC3
bool is_handshake_message(std::span<const uint8_t> data);

/**
 * HandshakeEngine - three-message mutual authentication
 *
 * msg1 carries the initiator's ephemeral key. msg2 carries the responder's
 * ephemeral key and its encrypted identity proof; msg3 the initiator's.
 * Every message is folded into the transcript hash, which keys the
 * following message and salts the session keys.
 *
 * Pure state machine: the caller moves bytes and owns retransmission.
 * Any failure is AUTHENTICATION_FAILED and final.
 */
class HandshakeEngine {
public:
    // expected_peer: when set, the remote identity must hash to this PeerId
    HandshakeEngine(const PeerIdentity& identity, HandshakeRole role,
                    std::optional<PeerId> expected_peer = std::nullopt);
    ~HandshakeEngine();

    HandshakeEngine(const HandshakeEngine&) = delete;
    HandshakeEngine& operator=(const HandshakeEngine&) = delete;

    // Initiator only: produce msg1
    std::expected<std::vector<uint8_t>, ErrorCode> start();

    // Feed one received message. Returns the reply to send, if any.
    // Duplicates of an already answered message get the cached reply.
    std::expected<std::optional<std::vector<uint8_t>>, ErrorCode> on_message(std::span<const uint8_t> data);

    HandshakeRole role() const { return role_; }
    HandshakeState state() const { return state_; }
    bool is_established() const { return state_ == HandshakeState::ESTABLISHED; }

    // Last message this side sent, for retransmission
    const std::vector<uint8_t>& last_sent() const { return last_sent_; }

    // Set once ESTABLISHED
    const std::optional<HandshakeResult>& result() const { return result_; }

    // Wipe the secret once the session keys have been derived from it.
    // The engine stays usable for answering duplicates.
    void release_secret();

private:
    std::expected<std::optional<std::vector<uint8_t>>, ErrorCode> on_init(std::span<const uint8_t> data);
    std::expected<std::optional<std::vector<uint8_t>>, ErrorCode> on_response(std::span<const uint8_t> data);
    std::expected<std::optional<std::vector<uint8_t>>, ErrorCode> on_finish(std::span<const uint8_t> data);

    // Decrypt and check an identity proof; returns the remote public key
    std::expected<Ed25519PublicKey, ErrorCode> open_proof(const SessionKey& key,
                                                          std::span<const uint8_t> ciphertext,
                                                          std::span<const uint8_t> transcript,
                                                          std::string_view label);
    std::expected<std::vector<uint8_t>, ErrorCode> seal_proof(const SessionKey& key,
                                                              std::span<const uint8_t> transcript,
                                                              std::string_view label) const;

    void finish(const Ed25519PublicKey& remote);
    std::unexpected<ErrorCode> fail(std::string_view reason);
    void wipe();

    const PeerIdentity& identity_;
    HandshakeRole role_;
    std::optional<PeerId> expected_peer_;
    HandshakeState state_ = HandshakeState::IDLE;

    X25519PublicKey ephemeral_public_{};
    X25519PrivateKey ephemeral_private_{};

    Sha256Digest hash_{};        // running transcript hash
    SessionKey chaining_key_{};
    SessionKey message_key_{};   // k2, held by the responder until msg3

    std::vector<uint8_t> last_received_;
    std::vector<uint8_t> last_sent_;
    std::optional<HandshakeResult> result_;
};

} // namespace agora::session
