#pragma once

#include "common/config.hpp"
#include "common/protocol.hpp"
#include "session/replay_window.hpp"
#include "session/session_key_manager.hpp"

#include <array>
#include <expected>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace agora::session {

struct ChannelStats {
    uint64_t frames_sent = 0;
    uint64_t frames_received = 0;
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t frames_rejected = 0;      // tag, format or replay
    uint64_t replays_rejected = 0;
    uint64_t epochs_expired = 0;
    uint32_t consecutive_rejections = 0;
    uint32_t epoch = 0;
};

/**
 * SecureChannel - SecureFrame encryption over the session epochs
 *
 * Wire: u8 0xD0 | u32 epoch | u64 counter | ciphertext || tag.
 * The 13-byte header is the associated data, the nonce is epoch || counter.
 *
 * send() and receive() may be called from different threads; counters and
 * replay windows sit behind one mutex, keys come from the published ring.
 */
class SecureChannel {
public:
    // Counter value that forces a rotation before it is used
    static constexpr uint64_t SEND_COUNTER_LIMIT = uint64_t{1} << 63;

    SecureChannel(std::shared_ptr<SessionKeyManager> keys, const SessionConfig& config);
    ~SecureChannel();

    SecureChannel(const SecureChannel&) = delete;
    SecureChannel& operator=(const SecureChannel&) = delete;

    // Errors: CHANNEL_CLOSED, MESSAGE_TOO_LARGE, CRYPTO_ERROR
    std::expected<std::vector<uint8_t>, ErrorCode> send(std::span<const uint8_t> plaintext);

    // Errors: FRAME_REJECTED, EPOCH_EXPIRED, CHANNEL_CLOSED
    std::expected<std::vector<uint8_t>, ErrorCode> receive(std::span<const uint8_t> frame,
                                                           Clock::time_point now = Clock::now());

    // Wipes keys; every later call returns CHANNEL_CLOSED
    void close();
    bool is_closed() const;

    ChannelStats stats() const;

    static bool is_secure_frame(std::span<const uint8_t> data);

private:
    struct RecvWindow {
        uint32_t epoch = 0;
        ReplayWindow window;
    };

    // Windows are only touched once a frame has authenticated
    bool replay_check(uint32_t epoch, uint64_t counter) const;
    void replay_commit(uint32_t epoch, uint64_t counter);
    std::unexpected<ErrorCode> reject(ErrorCode code);

    std::shared_ptr<SessionKeyManager> keys_;
    SessionConfig config_;

    mutable std::mutex mutex_;
    bool closed_ = false;
    uint32_t send_epoch_ = 0;
    uint64_t send_counter_ = 0;
    std::array<RecvWindow, 2> windows_;   // indexed by epoch % 2
    ChannelStats stats_;
};

} // namespace agora::session
