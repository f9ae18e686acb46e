#pragma once
#include "identity/Identity.hpp"
#include "observation/Observer.hpp"

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace FS {

struct ObservationKey {
    Identity identity;
    FieldKey key;

    friend auto operator==(ObservationKey const&, ObservationKey const&) -> bool = default;
};

struct ObservationKeyHash {
    auto operator()(ObservationKey const& k) const noexcept -> std::size_t {
        auto const h = std::hash<std::uint64_t>{}(k.identity.value);
        return h ^ (std::hash<FieldKey>{}(k.key) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

/**
 * Bookkeeping between tracked reads and tracked writes.
 *
 * Reads register (identity, key) -> observer; writes call willModify before
 * the value changes and didModify after. Each call synchronously notifies the
 * observers registered for that phase and clears them (observe-once).
 *
 * Ordering
 * --------
 * willModify runs before the storage is overwritten, so a callback that reads
 * state sees the pre-mutation value.
 *
 * Reentrancy
 * ----------
 * A modification of an identity issued from inside a notification for that
 * same identity on the same thread is queued and delivered once the outermost
 * notification returns instead of recursing.
 *
 * Thread-safety
 * -------------
 * Registration tables are guarded by a mutex; callbacks run without it held.
 */
class ObservationRegistrar {
public:
    ObservationRegistrar();
    ~ObservationRegistrar();

    ObservationRegistrar(ObservationRegistrar const&)            = delete;
    ObservationRegistrar& operator=(ObservationRegistrar const&) = delete;

    // Registrar used by every ObservableState that is not given one explicitly.
    static auto Shared() -> ObservationRegistrar&;

    auto trackAccess(Identity identity, FieldKey const& key, std::shared_ptr<Observer> const& observer) -> void;

    // Records a tracked read for the innermost observation scope on this thread, if any.
    auto access(Identity identity, FieldKey const& key) -> void;

    auto willModify(Identity identity, FieldKey const& key) -> void;
    auto didModify(Identity identity, FieldKey const& key) -> void;

    // Drops every registration held for an identity (used when it is retired).
    auto forget(Identity identity) -> void;

    [[nodiscard]] auto observerCount(Identity identity, FieldKey const& key) const -> std::size_t;

private:
    struct Registration {
        std::weak_ptr<Observer>   observer;
        std::uint64_t             generation = 0;
        std::shared_ptr<Observer> retained; // set for detached observers
    };

    // Every key a detached observer is registered under, so a firing can
    // release all of its strong references at once.
    struct DetachedPlacement {
        std::weak_ptr<Observer>     observer;
        std::vector<ObservationKey> keys;
    };

    auto notify(Identity identity, FieldKey const& key, ObservationPhase phase) -> void;
    auto releaseDetached(Observer const* observer, std::vector<Registration>& released) -> void;

    mutable std::mutex mutex_;
    phmap::flat_hash_map<ObservationKey, std::vector<Registration>, ObservationKeyHash> registrations_;
    phmap::flat_hash_map<Observer const*, DetachedPlacement>                           detached_;
};

} // namespace FS
