#include "cancel_token.hpp"
#include <algorithm>

// Ancestors don't notify their children, so waits re-check in slices.
static constexpr std::chrono::milliseconds WAIT_SLICE{50};

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

CancelToken::CancelToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

void CancelToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled.store(true);
    }
    state_->cv.notify_all();
}

bool CancelToken::is_cancelled() const {
    for (const State* s = state_.get(); s; s = s->parent.get()) {
        if (s->cancelled.load()) return true;
    }
    return false;
}

bool CancelToken::wait_for(std::chrono::milliseconds duration) const {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!is_cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, WAIT_SLICE);

        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait_for(lock, slice, [this] { return state_->cancelled.load(); });
    }
    return true;
}

CancelToken CancelToken::child() const {
    auto s = std::make_shared<State>();
    s->parent = state_;
    return CancelToken(std::move(s));
}
