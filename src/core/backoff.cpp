#include "backoff.hpp"
#include <algorithm>

BackoffPolicy::BackoffPolicy(Mode mode,
                             std::chrono::milliseconds initial_delay,
                             std::chrono::milliseconds max_delay,
                             int max_retries)
    : mode_(mode),
      initial_((std::max)(initial_delay, std::chrono::milliseconds(0))),
      max_((std::max)(max_delay, initial_)),
      max_retries_((std::max)(max_retries, 0)) {}

BackoffPolicy BackoffPolicy::from_config(const ReconnectionConfig& config) {
    // Fixed interval pins both ends to the initial delay.
    if (!config.use_exponential_backoff) {
        auto d = std::chrono::seconds(config.initial_delay_secs);
        return BackoffPolicy(Mode::Fixed, d, d, config.max_retries);
    }
    return BackoffPolicy(Mode::Exponential,
                         std::chrono::seconds(config.initial_delay_secs),
                         std::chrono::seconds(config.max_delay_secs),
                         config.max_retries);
}

std::chrono::milliseconds BackoffPolicy::delay_for(int retry) const {
    if (mode_ == Mode::Fixed || retry <= 1) return initial_;

    auto delay = initial_;
    for (int i = 1; i < retry; i++) {
        if (delay >= max_ / 2) return max_;
        delay *= 2;
    }
    return (std::min)(delay, max_);
}

bool BackoffPolicy::exhausted(int failed_attempts) const {
    if (max_retries_ == 0) return false;
    return failed_attempts > max_retries_;
}
