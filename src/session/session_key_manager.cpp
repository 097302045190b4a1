#include "session/session_key_manager.hpp"
#include "common/crypto.hpp"
#include "common/crypto/hkdf.hpp"
#include "common/logger.hpp"

namespace agora::session {

namespace {

auto& log() { return Logger::get("session.keys"); }

constexpr std::string_view LABEL_CHAIN = "agora-chain";
constexpr std::string_view LABEL_I2R = "agora-i2r";
constexpr std::string_view LABEL_R2I = "agora-r2i";
constexpr std::string_view LABEL_RATCHET = "agora-ratchet";

void wipe_epoch(SessionKeyEpoch& epoch) {
    crypto::secure_wipe(epoch.send_key);
    crypto::secure_wipe(epoch.recv_key);
}

}  // namespace

// ============================================================================
// KeyRing
// ============================================================================

KeyRing::KeyRing(SessionKeyEpoch current, std::optional<SessionKeyEpoch> previous)
    : current_id_(current.id) {
    if (previous) {
        slots_[previous->id % 2] = *previous;
        wipe_epoch(*previous);
    }
    slots_[current.id % 2] = current;
    wipe_epoch(current);
}

KeyRing::~KeyRing() {
    for (auto& slot : slots_) {
        if (slot) wipe_epoch(*slot);
    }
}

const SessionKeyEpoch* KeyRing::previous() const {
    const auto& slot = slots_[(current_id_ + 1) % 2];
    if (slot && slot->id + 1 == current_id_) return &*slot;
    return nullptr;
}

const SessionKeyEpoch* KeyRing::find(uint32_t epoch_id, Clock::time_point now) const {
    const auto& slot = slots_[epoch_id % 2];
    if (!slot || slot->id != epoch_id) return nullptr;
    if (slot->valid_until && now >= *slot->valid_until) return nullptr;
    return &*slot;
}

// ============================================================================
// SessionKeyManager
// ============================================================================

SessionKeyManager::SessionKeyManager(const HandshakeResult& handshake, const SessionConfig& config,
                                     Clock::time_point now)
    : role_(handshake.role)
    , config_(config) {
    chain_ = crypto::HKDF::derive_key(handshake.secret, handshake.transcript_hash, LABEL_CHAIN, 1);
    ring_.store(std::make_shared<const KeyRing>(derive_epoch(chain_, 1, now), std::nullopt),
                std::memory_order_release);
    log().debug("Session keys ready as {}", handshake_role_to_string(role_));
}

SessionKeyManager::~SessionKeyManager() {
    crypto::secure_wipe(chain_);
}

SessionKeyEpoch SessionKeyManager::derive_epoch(const SessionKey& chain, uint32_t id,
                                                Clock::time_point now) const {
    auto i2r = crypto::HKDF::derive_key(chain, {}, LABEL_I2R, id);
    auto r2i = crypto::HKDF::derive_key(chain, {}, LABEL_R2I, id);

    SessionKeyEpoch epoch;
    epoch.id = id;
    epoch.created_at = now;
    if (role_ == HandshakeRole::INITIATOR) {
        epoch.send_key = i2r;
        epoch.recv_key = r2i;
    } else {
        epoch.send_key = r2i;
        epoch.recv_key = i2r;
    }
    crypto::secure_wipe(i2r);
    crypto::secure_wipe(r2i);
    return epoch;
}

SessionKey SessionKeyManager::ratchet(const SessionKey& chain, uint32_t next_id) const {
    return crypto::HKDF::derive_key(chain, {}, LABEL_RATCHET, next_id);
}

void SessionKeyManager::advance(SessionKeyEpoch next, Clock::time_point now) {
    auto old = ring_.load(std::memory_order_acquire);

    SessionKeyEpoch previous = old->current();
    previous.valid_until = now + config_.overlap_window;
    auto id = next.id;

    ring_.store(std::make_shared<const KeyRing>(next, previous), std::memory_order_release);
    wipe_epoch(next);
    wipe_epoch(previous);
    log().info("Rotated to epoch {}, epoch {} decryptable for {}s", id, id - 1,
               config_.overlap_window.count());
}

uint32_t SessionKeyManager::rotate(Clock::time_point now) {
    std::lock_guard lock(mutex_);
    auto next_id = ring_.load(std::memory_order_acquire)->current().id + 1;

    auto next_chain = ratchet(chain_, next_id);
    crypto::secure_wipe(chain_);
    chain_ = next_chain;
    crypto::secure_wipe(next_chain);

    advance(derive_epoch(chain_, next_id, now), now);
    return next_id;
}

SessionKeyEpoch SessionKeyManager::peek_next() const {
    std::lock_guard lock(mutex_);
    auto next_id = ring_.load(std::memory_order_acquire)->current().id + 1;
    auto next_chain = ratchet(chain_, next_id);
    auto epoch = derive_epoch(next_chain, next_id, Clock::now());
    crypto::secure_wipe(next_chain);
    return epoch;
}

bool SessionKeyManager::commit_next(const SessionKeyEpoch& next, Clock::time_point now) {
    std::lock_guard lock(mutex_);
    auto current_id = ring_.load(std::memory_order_acquire)->current().id;
    if (next.id != current_id + 1) return false;

    auto next_chain = ratchet(chain_, next.id);
    crypto::secure_wipe(chain_);
    chain_ = next_chain;
    crypto::secure_wipe(next_chain);

    SessionKeyEpoch adopted = next;
    adopted.created_at = now;
    adopted.valid_until.reset();
    advance(adopted, now);
    wipe_epoch(adopted);
    return true;
}

bool SessionKeyManager::sweep(Clock::time_point now) {
    std::lock_guard lock(mutex_);
    auto ring = ring_.load(std::memory_order_acquire);
    const auto* previous = ring->previous();
    if (!previous || !previous->valid_until || now < *previous->valid_until) return false;

    auto purged = previous->id;
    ring_.store(std::make_shared<const KeyRing>(ring->current(), std::nullopt),
                std::memory_order_release);
    log().debug("Purged epoch {}", purged);
    return true;
}

bool SessionKeyManager::rotation_due(Clock::time_point now) const {
    return now >= next_rotation_at();
}

Clock::time_point SessionKeyManager::next_rotation_at() const {
    return ring()->current().created_at + config_.rotation_interval;
}

} // namespace agora::session
