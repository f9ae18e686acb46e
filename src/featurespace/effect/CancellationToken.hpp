#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace FS {

/**
 * Cooperative cancellation flag handed to an effect.
 *
 * Long running operations poll isCancelled() or wait with sleepFor(), which
 * returns early once the token is cancelled. Actions an operation sends after
 * its token was cancelled are dropped by the store.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(CancellationToken const&)            = delete;
    CancellationToken& operator=(CancellationToken const&) = delete;

    auto cancel() -> void;

    [[nodiscard]] auto isCancelled() const -> bool { return this->cancelled_.load(std::memory_order_acquire); }

    // Returns true when the full duration elapsed, false if cancelled first.
    auto sleepFor(std::chrono::milliseconds duration) const -> bool;

private:
    std::atomic<bool>               cancelled_{false};
    mutable std::mutex              mutex_;
    mutable std::condition_variable cv_;
};

} // namespace FS
