#pragma once

#include "common/protocol.hpp"

#include <bitset>
#include <cstdint>

namespace agora::session {

// ============================================================================
// Replay Protection Window
// ============================================================================
// Highest counter seen plus a bitmap of the 2048 counters below it.
// check() is side-effect free so a frame is only recorded by commit()
// once its tag has verified. Not thread-safe, SecureChannel serializes.
class ReplayWindow {
public:
    static constexpr size_t WINDOW_SIZE = CryptoConstants::REPLAY_WINDOW_SIZE;

    // False for counter 0, duplicates and counters too far behind
    bool check(uint64_t counter) const;

    // Record an authenticated counter
    void commit(uint64_t counter);

    void reset();

    uint64_t highest_counter() const { return highest_counter_; }

private:
    uint64_t highest_counter_ = 0;
    std::bitset<WINDOW_SIZE> window_;
};

} // namespace agora::session
