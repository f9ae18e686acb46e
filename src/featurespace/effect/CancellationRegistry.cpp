#include "effect/CancellationRegistry.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace FS {

auto CancellationRegistry::cancelTokens(Tokens const& tokens) -> std::size_t {
    std::size_t cancelled = 0;
    for (auto const& weak : tokens) {
        if (auto token = weak.lock()) {
            token->cancel();
            ++cancelled;
        }
    }
    return cancelled;
}

auto CancellationRegistry::add(CancellationId const& id, std::shared_ptr<CancellationToken> const& token) -> void {
    std::lock_guard<std::mutex> lock(this->mutex_);
    auto&                       bucket = this->tokens_[id];
    std::erase_if(bucket, [](std::weak_ptr<CancellationToken> const& weak) { return weak.expired(); });
    bucket.push_back(token);
}

auto CancellationRegistry::remove(CancellationId const& id, CancellationToken const* token) -> void {
    std::lock_guard<std::mutex> lock(this->mutex_);
    auto                        it = this->tokens_.find(id);
    if (it == this->tokens_.end())
        return;
    std::erase_if(it->second, [token](std::weak_ptr<CancellationToken> const& weak) {
        auto locked = weak.lock();
        return !locked || locked.get() == token;
    });
    if (it->second.empty())
        this->tokens_.erase(it);
}

auto CancellationRegistry::cancel(CancellationId const& id) -> std::size_t {
    Tokens tokens;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        auto                        it = this->tokens_.find(id);
        if (it == this->tokens_.end())
            return 0;
        tokens = std::move(it->second);
        this->tokens_.erase(it);
    }
    auto const cancelled = cancelTokens(tokens);
    fs_log("Cancelled " + std::to_string(cancelled) + " effect(s) for " + toString(id), "Effect");
    return cancelled;
}

auto CancellationRegistry::cancelScope(Identity scope) -> std::size_t {
    Tokens tokens;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        for (auto it = this->tokens_.begin(); it != this->tokens_.end();) {
            if (it->first.scope == scope) {
                tokens.insert(tokens.end(), it->second.begin(), it->second.end());
                this->tokens_.erase(it++);
            } else {
                ++it;
            }
        }
    }
    auto const cancelled = cancelTokens(tokens);
    if (cancelled > 0)
        fs_log("Cancelled " + std::to_string(cancelled) + " effect(s) scoped to " + toString(scope), "Effect");
    return cancelled;
}

auto CancellationRegistry::cancelAll() -> std::size_t {
    decltype(this->tokens_) tokens;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        tokens.swap(this->tokens_);
    }
    std::size_t cancelled = 0;
    for (auto const& [id, bucket] : tokens)
        cancelled += cancelTokens(bucket);
    return cancelled;
}

auto CancellationRegistry::activeCount(CancellationId const& id) const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    auto                        it = this->tokens_.find(id);
    if (it == this->tokens_.end())
        return 0;
    return static_cast<std::size_t>(std::count_if(it->second.begin(), it->second.end(), [](std::weak_ptr<CancellationToken> const& weak) {
        auto locked = weak.lock();
        return locked && !locked->isCancelled();
    }));
}

auto CancellationRegistry::empty() const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->tokens_.empty();
}

} // namespace FS
