#pragma once
#include "identity/Identity.hpp"

#include <parallel_hashmap/phmap.h>

#include <atomic>
#include <cstdint>
#include <mutex>

namespace FS {

/**
 * @brief Process-wide source of state identities.
 *
 * allocate() is a single atomic increment and may be called from any thread.
 * The registry additionally tracks which identities are attached to a live
 * composition slot (an active enum case, a presented child, an element of an
 * identified collection). The composition engine attaches an identity when
 * the slot is filled and retires it when the slot is torn down; plain copies
 * of a state never touch the registry.
 */
class IdentityRegistry {
public:
    static IdentityRegistry& Instance();

    IdentityRegistry();
    IdentityRegistry(IdentityRegistry const&)            = delete;
    IdentityRegistry& operator=(IdentityRegistry const&) = delete;

    [[nodiscard]] auto allocate() -> Identity;

    // Mark an identity as occupying a live slot. Idempotent.
    auto attach(Identity id) -> void;

    // Returns true if the identity was live.
    auto retire(Identity id) -> bool;

    [[nodiscard]] auto isLive(Identity id) const -> bool;
    [[nodiscard]] auto liveCount() const -> std::size_t;

private:
    using LiveSet = phmap::parallel_flat_hash_set<std::uint64_t,
                                                  phmap::Hash<std::uint64_t>,
                                                  phmap::EqualTo<std::uint64_t>,
                                                  std::allocator<std::uint64_t>,
                                                  4,
                                                  std::mutex>;

    std::atomic<std::uint64_t> next_{1};
    LiveSet                    live_;
};

} // namespace FS
