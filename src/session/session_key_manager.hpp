#pragma once

#include "common/config.hpp"
#include "common/protocol.hpp"
#include "session/handshake.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>

namespace agora::session {

using Clock = std::chrono::steady_clock;

struct SessionKeyEpoch {
    uint32_t id = 0;
    SessionKey send_key{};
    SessionKey recv_key{};
    Clock::time_point created_at{};
    // Set once superseded: decryption allowed until then
    std::optional<Clock::time_point> valid_until;
};

// ============================================================================
// KeyRing - immutable snapshot of the live epochs
// ============================================================================
// Two-slot arena indexed by epoch id % 2. A new ring is built for every
// change and published atomically, readers never see a half-updated pair.
// Key material is wiped when the last reference goes away.
class KeyRing {
public:
    KeyRing(SessionKeyEpoch current, std::optional<SessionKeyEpoch> previous);
    ~KeyRing();

    KeyRing(const KeyRing&) = delete;
    KeyRing& operator=(const KeyRing&) = delete;

    const SessionKeyEpoch& current() const { return *slots_[current_id_ % 2]; }
    const SessionKeyEpoch* previous() const;

    // Current or a still-valid previous epoch
    const SessionKeyEpoch* find(uint32_t epoch_id, Clock::time_point now) const;

private:
    std::array<std::optional<SessionKeyEpoch>, 2> slots_;
    uint32_t current_id_;
};

/**
 * SessionKeyManager - epoch keys derived from one handshake
 *
 * chain_1 = HKDF(secret, salt = transcript hash, "agora-chain" || 1)
 * epoch n: i2r/r2i keys from chain_n, chain_{n+1} ratcheted from chain_n.
 * Old chain keys are wiped as soon as the next one exists.
 *
 * Rotation is driven from outside: rotate() on the local schedule, and
 * peek_next()/commit_next() when the peer's first frame of epoch n+1
 * arrives. Readers take ring() snapshots without locking.
 */
class SessionKeyManager {
public:
    SessionKeyManager(const HandshakeResult& handshake, const SessionConfig& config,
                      Clock::time_point now = Clock::now());
    ~SessionKeyManager();

    SessionKeyManager(const SessionKeyManager&) = delete;
    SessionKeyManager& operator=(const SessionKeyManager&) = delete;

    std::shared_ptr<const KeyRing> ring() const { return ring_.load(std::memory_order_acquire); }
    uint32_t current_epoch() const { return ring()->current().id; }

    // Advance to the next epoch; the old one stays decryptable for the
    // overlap window. Returns the new epoch id.
    uint32_t rotate(Clock::time_point now = Clock::now());

    // Epoch current+1, derived without committing
    SessionKeyEpoch peek_next() const;

    // Adopt a peeked epoch once a frame under it has authenticated.
    // False when the ring moved on in the meantime.
    bool commit_next(const SessionKeyEpoch& next, Clock::time_point now = Clock::now());

    // Purge a previous epoch whose overlap has ended. True when one was purged.
    bool sweep(Clock::time_point now = Clock::now());

    bool rotation_due(Clock::time_point now = Clock::now()) const;
    Clock::time_point next_rotation_at() const;

    HandshakeRole role() const { return role_; }

private:
    SessionKeyEpoch derive_epoch(const SessionKey& chain, uint32_t id, Clock::time_point now) const;
    SessionKey ratchet(const SessionKey& chain, uint32_t next_id) const;
    void advance(SessionKeyEpoch next, Clock::time_point now);

    HandshakeRole role_;
    SessionConfig config_;

    mutable std::mutex mutex_;   // guards chain_ and ring replacement
    SessionKey chain_{};         // chain key of the current epoch
    std::atomic<std::shared_ptr<const KeyRing>> ring_;
};

} // namespace agora::session
