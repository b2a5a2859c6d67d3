#pragma once

#include <chrono>
#include <core/types.hpp>

// Retry delay rule for one supervision cycle.
//
// The policy is a plain value. The channel runner builds a fresh one at the
// top of every cycle, so max_attempts bounds a cycle, not the channel:
// overall retries are unbounded and only cancellation stops a channel.
class BackoffPolicy {
public:
    enum class Mode { Exponential, Fixed };

    BackoffPolicy(Mode mode,
                  std::chrono::milliseconds initial_delay,
                  std::chrono::milliseconds max_delay,
                  int max_retries);

    static BackoffPolicy from_config(const ReconnectionConfig& config);

    // Delay before retry number `retry` (1-based): initial, 2x, 4x ... capped.
    // Fixed mode always returns the initial delay.
    std::chrono::milliseconds delay_for(int retry) const;

    // True once `failed_attempts` failures leave no retry budget.
    // Always false when max_retries is 0.
    bool exhausted(int failed_attempts) const;

    Mode mode() const { return mode_; }
    std::chrono::milliseconds initial_delay() const { return initial_; }
    std::chrono::milliseconds max_delay() const { return max_; }
    int max_retries() const { return max_retries_; }

private:
    Mode mode_;
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    int max_retries_;
};
