#pragma once

#include <chrono>

namespace ladle::sync {

/**
 * RetryBackoff - Delay before the next retry sweep.
 *
 * Starts at base, doubles after every failed sweep up to max, and returns
 * to base after any successful one.
 */
class RetryBackoff {
public:
    RetryBackoff(std::chrono::seconds base, std::chrono::seconds max)
        : base_(base)
        , max_(max < base ? base : max)
        , current_(base) {}
    
    [[nodiscard]] std::chrono::seconds current_delay() const noexcept { return current_; }
    [[nodiscard]] int consecutive_failures() const noexcept { return failures_; }
    
    /** Returns the new delay. */
    std::chrono::seconds record_failure() noexcept {
        ++failures_;
        current_ = current_ * 2 > max_ ? max_ : current_ * 2;
        return current_;
    }
    
    std::chrono::seconds record_success() noexcept {
        failures_ = 0;
        current_ = base_;
        return current_;
    }

private:
    std::chrono::seconds base_;
    std::chrono::seconds max_;
    std::chrono::seconds current_;
    int failures_ = 0;
};

} // namespace ladle::sync
