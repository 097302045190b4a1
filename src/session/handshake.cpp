#include "session/handshake.hpp"
#include "common/binary_codec.hpp"
#include "common/crypto.hpp"
#include "common/crypto/chacha20.hpp"
#include "common/crypto/ed25519.hpp"
#include "common/crypto/hkdf.hpp"
#include "common/crypto/x25519.hpp"
#include "common/constants.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <tuple>

namespace agora::session {

namespace {

auto& log() { return Logger::get("session.handshake"); }

constexpr std::string_view LABEL_CHAIN = "agora-hs-chain";
constexpr std::string_view LABEL_MSG3 = "agora-hs-msg3";
constexpr std::string_view LABEL_SECRET = "agora-hs-secret";
constexpr std::string_view LABEL_RESPONDER = "agora-hs-resp";
constexpr std::string_view LABEL_INITIATOR = "agora-hs-init";

std::span<const uint8_t> as_bytes(std::string_view s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

struct KeyPair {
    SessionKey chaining{};
    SessionKey message{};
};

// HKDF to 64 bytes, split into the next chaining key and a message key
KeyPair split(std::span<const uint8_t> ikm, std::span<const uint8_t> salt, std::string_view label) {
    auto okm = crypto::HKDF::derive(ikm, salt, as_bytes(label), 64);
    KeyPair out;
    std::copy_n(okm.begin(), 32, out.chaining.begin());
    std::copy_n(okm.begin() + 32, 32, out.message.begin());
    crypto::secure_wipe(okm);
    return out;
}

std::vector<uint8_t> signed_input(std::string_view label, std::span<const uint8_t> transcript) {
    std::vector<uint8_t> input(label.begin(), label.end());
    input.insert(input.end(), transcript.begin(), transcript.end());
    return input;
}

}  // namespace

std::string_view handshake_role_to_string(HandshakeRole role) {
    switch (role) {
        case HandshakeRole::INITIATOR: return "initiator";
        case HandshakeRole::RESPONDER: return "responder";
        default: return "unknown";
    }
}

std::string_view handshake_state_to_string(HandshakeState state) {
    switch (state) {
        case HandshakeState::IDLE: return "idle";
        case HandshakeState::SENT_INIT: return "sent_init";
        case HandshakeState::SENT_RESPONSE: return "sent_response";
        case HandshakeState::ESTABLISHED: return "established";
        case HandshakeState::FAILED: return "failed";
        default: return "unknown";
    }
}

bool is_handshake_message(std::span<const uint8_t> data) {
    if (data.empty()) return false;
    return data[0] >= static_cast<uint8_t>(DatagramType::HANDSHAKE_INIT) &&
           data[0] <= static_cast<uint8_t>(DatagramType::HANDSHAKE_FINISH);
}

HandshakeEngine::HandshakeEngine(const PeerIdentity& identity, HandshakeRole role,
                                 std::optional<PeerId> expected_peer)
    : identity_(identity)
    , role_(role)
    , expected_peer_(std::move(expected_peer)) {
    hash_ = crypto::sha256(as_bytes(handshake::PROTOCOL_NAME));
    chaining_key_ = hash_;
}

HandshakeEngine::~HandshakeEngine() {
    wipe();
    if (result_) {
        crypto::secure_wipe(result_->secret);
    }
}

void HandshakeEngine::release_secret() {
    if (result_) {
        crypto::secure_wipe(result_->secret);
    }
}

void HandshakeEngine::wipe() {
    crypto::secure_wipe(ephemeral_private_);
    crypto::secure_wipe(chaining_key_);
    crypto::secure_wipe(message_key_);
}

std::unexpected<ErrorCode> HandshakeEngine::fail(std::string_view reason) {
    log().warn("Handshake failed as {} in state {}: {}", handshake_role_to_string(role_),
               handshake_state_to_string(state_), reason);
    state_ = HandshakeState::FAILED;
    wipe();
    return std::unexpected(ErrorCode::AUTHENTICATION_FAILED);
}

// ============================================================================
// msg1
// ============================================================================

std::expected<std::vector<uint8_t>, ErrorCode> HandshakeEngine::start() {
    if (role_ != HandshakeRole::INITIATOR || state_ != HandshakeState::IDLE) {
        return std::unexpected(ErrorCode::UNEXPECTED_MESSAGE);
    }

    std::tie(ephemeral_public_, ephemeral_private_) = crypto::X25519::generate_keypair();

    wire::BinaryWriter writer(handshake::MSG1_SIZE);
    writer.write_u8(static_cast<uint8_t>(DatagramType::HANDSHAKE_INIT));
    writer.write_u8(protocol::HANDSHAKE_VERSION);
    writer.write_fixed_bytes(ephemeral_public_);
    writer.write_u16(0);  // no payload
    auto msg1 = writer.take();

    hash_ = crypto::sha256(hash_, msg1);
    state_ = HandshakeState::SENT_INIT;
    last_sent_ = msg1;
    log().debug("Sent init");
    return msg1;
}

std::expected<std::optional<std::vector<uint8_t>>, ErrorCode> HandshakeEngine::on_message(
    std::span<const uint8_t> data) {

    if (state_ == HandshakeState::FAILED) {
        return std::unexpected(ErrorCode::AUTHENTICATION_FAILED);
    }

    // Retransmitted copy of what we already answered
    if (!last_received_.empty() && std::ranges::equal(data, last_received_)) {
        if (last_sent_.empty()) return std::optional<std::vector<uint8_t>>{};
        return std::optional<std::vector<uint8_t>>{last_sent_};
    }

    if (data.empty()) return fail("empty message");

    switch (state_) {
        case HandshakeState::IDLE:
            if (role_ == HandshakeRole::RESPONDER) return on_init(data);
            return fail("message before start");
        case HandshakeState::SENT_INIT:
            return on_response(data);
        case HandshakeState::SENT_RESPONSE:
            return on_finish(data);
        case HandshakeState::ESTABLISHED:
            // Stray copies after completion carry nothing new
            return std::optional<std::vector<uint8_t>>{};
        default:
            return fail("invalid state");
    }
}

std::expected<std::optional<std::vector<uint8_t>>, ErrorCode> HandshakeEngine::on_init(
    std::span<const uint8_t> data) {

    if (data.size() != handshake::MSG1_SIZE) return fail("msg1 size");

    wire::BinaryReader reader(data);
    auto type = reader.read_u8();
    auto version = reader.read_u8();
    auto remote_ephemeral = reader.read_fixed_array<CryptoConstants::X25519_KEY_SIZE>();
    auto payload_len = reader.read_u16();
    if (!type || !version || !remote_ephemeral || !payload_len) return fail("msg1 truncated");
    if (*type != static_cast<uint8_t>(DatagramType::HANDSHAKE_INIT)) return fail("expected msg1");
    if (*version != protocol::HANDSHAKE_VERSION) return fail("unsupported version");
    if (*payload_len != 0) return fail("msg1 payload");
    if (!crypto::X25519::validate_public_key(*remote_ephemeral)) return fail("weak ephemeral key");

    hash_ = crypto::sha256(hash_, data);

    // msg2
    std::tie(ephemeral_public_, ephemeral_private_) = crypto::X25519::generate_keypair();
    hash_ = crypto::sha256(hash_, ephemeral_public_);

    auto shared = crypto::X25519::compute_shared_secret(ephemeral_private_, *remote_ephemeral);
    if (!shared) return fail("key agreement");
    auto k1 = split(*shared, chaining_key_, LABEL_CHAIN);
    crypto::secure_wipe(*shared);
    chaining_key_ = k1.chaining;

    auto proof = seal_proof(k1.message, hash_, LABEL_RESPONDER);
    crypto::secure_wipe(k1.message);
    crypto::secure_wipe(k1.chaining);
    if (!proof) return fail("seal proof");

    wire::BinaryWriter writer(handshake::MSG2_SIZE);
    writer.write_u8(static_cast<uint8_t>(DatagramType::HANDSHAKE_RESPONSE));
    writer.write_u8(protocol::HANDSHAKE_VERSION);
    writer.write_fixed_bytes(ephemeral_public_);
    writer.write_bytes(*proof);
    auto msg2 = writer.take();

    hash_ = crypto::sha256(hash_, *proof);

    auto k2 = split(chaining_key_, {}, LABEL_MSG3);
    chaining_key_ = k2.chaining;
    message_key_ = k2.message;
    crypto::secure_wipe(k2.chaining);
    crypto::secure_wipe(k2.message);
    crypto::secure_wipe(ephemeral_private_);

    last_received_.assign(data.begin(), data.end());
    last_sent_ = msg2;
    state_ = HandshakeState::SENT_RESPONSE;
    log().debug("Answered init");
    return std::optional<std::vector<uint8_t>>{std::move(msg2)};
}

std::expected<std::optional<std::vector<uint8_t>>, ErrorCode> HandshakeEngine::on_response(
    std::span<const uint8_t> data) {

    if (data.size() != handshake::MSG2_SIZE) return fail("msg2 size");

    wire::BinaryReader reader(data);
    auto type = reader.read_u8();
    auto version = reader.read_u8();
    auto remote_ephemeral = reader.read_fixed_array<CryptoConstants::X25519_KEY_SIZE>();
    auto ciphertext = reader.read_bytes();
    if (!type || !version || !remote_ephemeral || !ciphertext) return fail("msg2 truncated");
    if (*type != static_cast<uint8_t>(DatagramType::HANDSHAKE_RESPONSE)) return fail("expected msg2");
    if (*version != protocol::HANDSHAKE_VERSION) return fail("unsupported version");
    if (ciphertext->size() != handshake::PROOF_CIPHERTEXT_SIZE) return fail("msg2 payload size");
    if (!crypto::X25519::validate_public_key(*remote_ephemeral)) return fail("weak ephemeral key");

    hash_ = crypto::sha256(hash_, *remote_ephemeral);

    auto shared = crypto::X25519::compute_shared_secret(ephemeral_private_, *remote_ephemeral);
    if (!shared) return fail("key agreement");
    auto k1 = split(*shared, chaining_key_, LABEL_CHAIN);
    crypto::secure_wipe(*shared);
    chaining_key_ = k1.chaining;

    auto remote = open_proof(k1.message, *ciphertext, hash_, LABEL_RESPONDER);
    crypto::secure_wipe(k1.message);
    crypto::secure_wipe(k1.chaining);
    if (!remote) return std::unexpected(remote.error());

    hash_ = crypto::sha256(hash_, *ciphertext);

    // msg3
    auto k2 = split(chaining_key_, {}, LABEL_MSG3);
    chaining_key_ = k2.chaining;
    auto proof = seal_proof(k2.message, hash_, LABEL_INITIATOR);
    crypto::secure_wipe(k2.message);
    crypto::secure_wipe(k2.chaining);
    if (!proof) return fail("seal proof");

    wire::BinaryWriter writer(handshake::MSG3_SIZE);
    writer.write_u8(static_cast<uint8_t>(DatagramType::HANDSHAKE_FINISH));
    writer.write_u8(protocol::HANDSHAKE_VERSION);
    writer.write_bytes(*proof);
    auto msg3 = writer.take();

    hash_ = crypto::sha256(hash_, *proof);
    last_received_.assign(data.begin(), data.end());
    last_sent_ = msg3;
    finish(*remote);
    return std::optional<std::vector<uint8_t>>{std::move(msg3)};
}

std::expected<std::optional<std::vector<uint8_t>>, ErrorCode> HandshakeEngine::on_finish(
    std::span<const uint8_t> data) {

    if (data.size() != handshake::MSG3_SIZE) return fail("msg3 size");

    wire::BinaryReader reader(data);
    auto type = reader.read_u8();
    auto version = reader.read_u8();
    auto ciphertext = reader.read_bytes();
    if (!type || !version || !ciphertext) return fail("msg3 truncated");
    if (*type != static_cast<uint8_t>(DatagramType::HANDSHAKE_FINISH)) return fail("expected msg3");
    if (*version != protocol::HANDSHAKE_VERSION) return fail("unsupported version");
    if (ciphertext->size() != handshake::PROOF_CIPHERTEXT_SIZE) return fail("msg3 payload size");

    auto remote = open_proof(message_key_, *ciphertext, hash_, LABEL_INITIATOR);
    crypto::secure_wipe(message_key_);
    if (!remote) return std::unexpected(remote.error());

    hash_ = crypto::sha256(hash_, *ciphertext);
    last_received_.assign(data.begin(), data.end());
    last_sent_.clear();
    finish(*remote);
    return std::optional<std::vector<uint8_t>>{};
}

// ============================================================================
// Identity proofs
// ============================================================================

std::expected<std::vector<uint8_t>, ErrorCode> HandshakeEngine::seal_proof(
    const SessionKey& key, std::span<const uint8_t> transcript, std::string_view label) const {

    auto signature = identity_.sign(signed_input(label, transcript));

    std::vector<uint8_t> payload;
    payload.reserve(handshake::PROOF_PAYLOAD_SIZE);
    payload.insert(payload.end(), identity_.public_key().begin(), identity_.public_key().end());
    payload.insert(payload.end(), signature.begin(), signature.end());

    return crypto::ChaCha20Poly1305::encrypt_with_nonce(
        key, crypto::ChaCha20Poly1305::create_nonce(0, 0), payload, transcript);
}

std::expected<Ed25519PublicKey, ErrorCode> HandshakeEngine::open_proof(
    const SessionKey& key, std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> transcript, std::string_view label) {

    auto payload = crypto::ChaCha20Poly1305::decrypt_with_nonce(
        key, crypto::ChaCha20Poly1305::create_nonce(0, 0), ciphertext, transcript);
    if (!payload) return fail("proof does not decrypt");
    if (payload->size() != handshake::PROOF_PAYLOAD_SIZE) return fail("proof size");

    Ed25519PublicKey remote{};
    crypto::Ed25519::Signature signature{};
    std::copy_n(payload->begin(), remote.size(), remote.begin());
    std::copy_n(payload->begin() + remote.size(), signature.size(), signature.begin());

    if (!crypto::Ed25519::verify(remote, signed_input(label, transcript), signature)) {
        return fail("bad identity signature");
    }
    if (expected_peer_ && peer_id_from_public_key(remote) != *expected_peer_) {
        return fail("identity does not match the expected peer");
    }
    if (remote == identity_.public_key()) {
        return fail("remote presented our own identity");
    }
    return remote;
}

void HandshakeEngine::finish(const Ed25519PublicKey& remote) {
    auto secret = crypto::HKDF::derive(chaining_key_, {}, as_bytes(LABEL_SECRET),
                                       CryptoConstants::SESSION_KEY_SIZE);

    HandshakeResult result;
    std::copy_n(secret.begin(), result.secret.size(), result.secret.begin());
    crypto::secure_wipe(secret);
    result.transcript_hash = hash_;
    result.remote_public_key = remote;
    result.remote_peer_id = peer_id_from_public_key(remote);
    result.role = role_;
    result_ = std::move(result);

    wipe();
    state_ = HandshakeState::ESTABLISHED;
    log().info("Handshake established as {} with {}", handshake_role_to_string(role_),
               result_->remote_peer_id);
}

} // namespace agora::session
