#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace agora {

// ============================================================================
// Retry Policy Configuration
// ============================================================================

struct RetryPolicy {
    // Maximum number of attempts (0 = infinite)
    uint32_t max_attempts{5};

    // Delay before the first retransmission
    std::chrono::milliseconds initial_delay{100};

    // Maximum delay between retries
    std::chrono::milliseconds max_delay{30000};

    // Multiplier for exponential backoff
    double multiplier{2.0};

    // Add randomness to avoid synchronized retransmits (0.0 to 1.0)
    double jitter{0.0};

    // STUN-style retransmission: RTO doubles, no jitter
    static RetryPolicy retransmit(std::chrono::milliseconds rto, uint32_t attempts) {
        return {attempts, rto, rto * 16, 2.0, 0.0};
    }

    static RetryPolicy standard() {
        return {5, std::chrono::milliseconds(100), std::chrono::milliseconds(30000), 2.0, 0.1};
    }
};

// ============================================================================
// Retry State
// ============================================================================
// Pure bookkeeping; callers wait on their own asio timers.

class RetryState {
public:
    explicit RetryState(const RetryPolicy& policy = RetryPolicy::standard())
        : policy_(policy), attempt_(0), current_delay_(policy.initial_delay) {}

    void reset() {
        attempt_ = 0;
        current_delay_ = policy_.initial_delay;
    }

    bool should_retry() const {
        return policy_.max_attempts == 0 || attempt_ < policy_.max_attempts;
    }

    // Number of delays handed out so far
    uint32_t attempt() const { return attempt_; }

    // Get delay for next retry and advance the backoff
    std::chrono::milliseconds next_delay() {
        auto delay = current_delay_;

        if (policy_.jitter > 0) {
            static thread_local std::mt19937 rng(std::random_device{}());
            std::uniform_real_distribution<double> dist(1.0 - policy_.jitter, 1.0 + policy_.jitter);
            delay = std::chrono::milliseconds(static_cast<int64_t>(delay.count() * dist(rng)));
        }

        ++attempt_;
        current_delay_ = std::chrono::milliseconds(
            static_cast<int64_t>(current_delay_.count() * policy_.multiplier));
        if (current_delay_ > policy_.max_delay) {
            current_delay_ = policy_.max_delay;
        }

        return delay;
    }

    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    uint32_t attempt_;
    std::chrono::milliseconds current_delay_;
};

} // namespace agora
