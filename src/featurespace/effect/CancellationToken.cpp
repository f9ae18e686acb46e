#include "effect/CancellationToken.hpp"

namespace FS {

auto CancellationToken::cancel() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        this->cancelled_.store(true, std::memory_order_release);
    }
    this->cv_.notify_all();
}

auto CancellationToken::sleepFor(std::chrono::milliseconds duration) const -> bool {
    std::unique_lock<std::mutex> lock(this->mutex_);
    return !this->cv_.wait_for(lock, duration, [this] { return this->isCancelled(); });
}

} // namespace FS
