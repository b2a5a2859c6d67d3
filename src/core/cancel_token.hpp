#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

// Shared cancellation signal. Copies refer to the same signal.
// A child token is cancelled by its own cancel() or by any ancestor's.
class CancelToken {
public:
    CancelToken();

    void cancel();
    bool is_cancelled() const;

    // Sleep up to `duration`, waking early on cancellation.
    // Returns true if the token is cancelled.
    bool wait_for(std::chrono::milliseconds duration) const;

    CancelToken child() const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::shared_ptr<State> parent;
        std::mutex mutex;
        std::condition_variable cv;
    };

    explicit CancelToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};
