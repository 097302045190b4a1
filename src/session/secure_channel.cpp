#include "session/secure_channel.hpp"
#include "common/binary_codec.hpp"
#include "common/constants.hpp"
#include "common/crypto.hpp"
#include "common/crypto/chacha20.hpp"
#include "common/logger.hpp"

namespace agora::session {

namespace {
auto& log() { return Logger::get("session.channel"); }
}

SecureChannel::SecureChannel(std::shared_ptr<SessionKeyManager> keys, const SessionConfig& config)
    : keys_(std::move(keys))
    , config_(config) {}

SecureChannel::~SecureChannel() {
    close();
}

bool SecureChannel::is_secure_frame(std::span<const uint8_t> data) {
    return !data.empty() && data[0] == static_cast<uint8_t>(DatagramType::SECURE_FRAME);
}

std::expected<std::vector<uint8_t>, ErrorCode> SecureChannel::send(std::span<const uint8_t> plaintext) {
    std::lock_guard lock(mutex_);
    if (closed_) {
        return std::unexpected(ErrorCode::CHANNEL_CLOSED);
    }
    if (plaintext.size() > protocol::MAX_FRAME_PAYLOAD) {
        return std::unexpected(ErrorCode::MESSAGE_TOO_LARGE);
    }

    auto ring = keys_->ring();
    if (ring->current().id == send_epoch_ && send_counter_ + 1 >= SEND_COUNTER_LIMIT) {
        log().info("Send counter exhausted in epoch {}, rotating", send_epoch_);
        keys_->rotate();
        ring = keys_->ring();
    }

    const auto& epoch = ring->current();
    if (epoch.id != send_epoch_) {
        send_epoch_ = epoch.id;
        send_counter_ = 0;
    }
    uint64_t counter = ++send_counter_;

    wire::BinaryWriter writer(protocol::SECURE_FRAME_HEADER_SIZE + plaintext.size() +
                        CryptoConstants::POLY1305_TAG_SIZE);
    writer.write_u8(static_cast<uint8_t>(DatagramType::SECURE_FRAME));
    writer.write_u32(epoch.id);
    writer.write_u64(counter);

    auto header = writer.data();
    auto ciphertext = crypto::ChaCha20Poly1305::encrypt_with_nonce(
        epoch.send_key, crypto::ChaCha20Poly1305::create_nonce(epoch.id, counter), plaintext, header);
    if (!ciphertext) {
        log().error("Frame encryption failed in epoch {}", epoch.id);
        return std::unexpected(ciphertext.error());
    }
    writer.write_fixed_bytes(*ciphertext);

    ++stats_.frames_sent;
    stats_.bytes_sent += plaintext.size();
    stats_.epoch = epoch.id;
    return writer.take();
}

std::expected<std::vector<uint8_t>, ErrorCode> SecureChannel::receive(std::span<const uint8_t> frame,
                                                                      Clock::time_point now) {
    std::lock_guard lock(mutex_);
    if (closed_) {
        return std::unexpected(ErrorCode::CHANNEL_CLOSED);
    }

    if (frame.size() < protocol::SECURE_FRAME_HEADER_SIZE + CryptoConstants::POLY1305_TAG_SIZE ||
        !is_secure_frame(frame)) {
        return reject(ErrorCode::FRAME_REJECTED);
    }

    wire::BinaryReader reader(frame);
    (void)reader.read_u8();
    auto epoch_id = reader.read_u32();
    auto counter = reader.read_u64();
    if (!epoch_id || !counter) {
        return reject(ErrorCode::FRAME_REJECTED);
    }

    auto ring = keys_->ring();
    const SessionKeyEpoch* epoch = ring->find(*epoch_id, now);

    // First frame of the peer's next epoch: verify before adopting it
    std::optional<SessionKeyEpoch> tentative;
    if (!epoch && *epoch_id == ring->current().id + 1) {
        tentative = keys_->peek_next();
        epoch = &*tentative;
    }
    if (!epoch) {
        ++stats_.epochs_expired;
        log().debug("Frame for epoch {} outside the live epochs (current {})", *epoch_id,
                    ring->current().id);
        return reject(ErrorCode::EPOCH_EXPIRED);
    }

    if (!replay_check(*epoch_id, *counter)) {
        ++stats_.replays_rejected;
        log().trace("Replayed or stale counter {} in epoch {}", *counter, *epoch_id);
        return reject(ErrorCode::FRAME_REJECTED);
    }

    auto header = frame.first(protocol::SECURE_FRAME_HEADER_SIZE);
    auto plaintext = crypto::ChaCha20Poly1305::decrypt_with_nonce(
        epoch->recv_key, crypto::ChaCha20Poly1305::create_nonce(*epoch_id, *counter),
        frame.subspan(protocol::SECURE_FRAME_HEADER_SIZE), header);
    if (!plaintext) {
        log().trace("Frame in epoch {} failed authentication", *epoch_id);
        return reject(ErrorCode::FRAME_REJECTED);
    }

    if (tentative) {
        if (keys_->commit_next(*tentative, now)) {
            log().info("Peer rotated, following to epoch {}", *epoch_id);
        }
        crypto::secure_wipe(tentative->send_key);
        crypto::secure_wipe(tentative->recv_key);
    }

    replay_commit(*epoch_id, *counter);
    stats_.consecutive_rejections = 0;
    ++stats_.frames_received;
    stats_.bytes_received += plaintext->size();
    return plaintext;
}

bool SecureChannel::replay_check(uint32_t epoch, uint64_t counter) const {
    const auto& slot = windows_[epoch % 2];
    if (slot.epoch != epoch) {
        // Nothing seen in this epoch yet
        return counter != 0;
    }
    return slot.window.check(counter);
}

void SecureChannel::replay_commit(uint32_t epoch, uint64_t counter) {
    auto& slot = windows_[epoch % 2];
    if (slot.epoch != epoch) {
        slot.epoch = epoch;
        slot.window.reset();
    }
    slot.window.commit(counter);
}

std::unexpected<ErrorCode> SecureChannel::reject(ErrorCode code) {
    ++stats_.frames_rejected;
    if (++stats_.consecutive_rejections >= config_.max_consecutive_rejections) {
        log().warn("Closing channel after {} consecutive rejected frames", stats_.consecutive_rejections);
        closed_ = true;
        return std::unexpected(ErrorCode::CHANNEL_CLOSED);
    }
    return std::unexpected(code);
}

void SecureChannel::close() {
    std::lock_guard lock(mutex_);
    if (closed_ && !keys_) return;
    closed_ = true;
    // Dropping our reference lets the key ring wipe itself
    keys_.reset();
}

bool SecureChannel::is_closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

ChannelStats SecureChannel::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

} // namespace agora::session
