#include "tusclient/cancellation.hpp"
#include "tusclient/constants.hpp"
#include "tusclient/error.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace tusclient {

struct CancellationToken::State {
    std::atomic<bool> cancelled{false};
    std::shared_ptr<State> parent;

    std::mutex mutex;
    std::condition_variable cv;

    bool is_cancelled() const {
        for (const State* s = this; s; s = s->parent.get()) {
            if (s->cancelled.load(std::memory_order_acquire)) return true;
        }
        return false;
    }
};

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken::CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

void CancellationToken::cancel() const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled.store(true, std::memory_order_release);
    }
    state_->cv.notify_all();
}

bool CancellationToken::is_cancelled() const {
    return state_->is_cancelled();
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) throw UploadCancelled();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    auto deadline = std::chrono::steady_clock::now() + duration;

    std::unique_lock<std::mutex> lock(state_->mutex);
    while (!state_->is_cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;

        // Ancestors notify their own condition variable, not ours, so wake
        // up periodically to look at them.
        auto slice = std::min<std::chrono::steady_clock::duration>(
            deadline - now, constants::CANCELLATION_POLL_INTERVAL);
        state_->cv.wait_for(lock, slice);
    }
    return true;
}

CancellationToken CancellationToken::child() const {
    auto state = std::make_shared<State>();
    state->parent = state_;
    return CancellationToken(std::move(state));
}

}  // namespace tusclient
