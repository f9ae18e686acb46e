#pragma once
#include "effect/CancellationId.hpp"
#include "effect/CancellationToken.hpp"

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace FS {

// Tokens of the effects a store has in flight, indexed by cancellation id.
class CancellationRegistry {
public:
    auto add(CancellationId const& id, std::shared_ptr<CancellationToken> const& token) -> void;

    // Called when an effect finishes; forgets the token under `id`.
    auto remove(CancellationId const& id, CancellationToken const* token) -> void;

    // Each returns the number of tokens cancelled.
    auto cancel(CancellationId const& id) -> std::size_t;
    auto cancelScope(Identity scope) -> std::size_t;
    auto cancelAll() -> std::size_t;

    [[nodiscard]] auto activeCount(CancellationId const& id) const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool;

private:
    using Tokens = std::vector<std::weak_ptr<CancellationToken>>;

    static auto cancelTokens(Tokens const& tokens) -> std::size_t;

    mutable std::mutex                                                mutex_;
    phmap::flat_hash_map<CancellationId, Tokens, CancellationIdHash> tokens_;
};

} // namespace FS
