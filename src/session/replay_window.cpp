#include "session/replay_window.hpp"

namespace agora::session {

bool ReplayWindow::check(uint64_t counter) const {
    // Counter 0 is never valid (reserved)
    if (counter == 0) {
        return false;
    }

    if (counter > highest_counter_) {
        return true;
    }

    uint64_t diff = highest_counter_ - counter;
    if (diff >= WINDOW_SIZE) {
        // Too old
        return false;
    }
    return !window_.test(diff);
}

void ReplayWindow::commit(uint64_t counter) {
    if (counter == 0) return;

    if (counter > highest_counter_) {
        uint64_t diff = counter - highest_counter_;
        if (diff >= WINDOW_SIZE) {
            // Way ahead, nothing in the old window is still reachable
            window_.reset();
        } else {
            window_ <<= diff;
        }
        highest_counter_ = counter;
        window_.set(0);
        return;
    }

    uint64_t diff = highest_counter_ - counter;
    if (diff < WINDOW_SIZE) {
        window_.set(diff);
    }
}

void ReplayWindow::reset() {
    highest_counter_ = 0;
    window_.reset();
}

} // namespace agora::session
