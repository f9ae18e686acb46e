#include "observation/ObservationRegistrar.hpp"
#include "log/TaggedLogger.hpp"
#include "observation/ObservationTracking.hpp"

#include <algorithm>
#include <deque>
#include <utility>

namespace FS {

namespace {

struct ActiveNotification {
    ObservationRegistrar const* registrar;
    Identity                    identity;
};

struct DeferredModification {
    ObservationRegistrar* registrar;
    Identity              identity;
    FieldKey              key;
    ObservationPhase      phase;
};

thread_local std::vector<std::shared_ptr<Observer>> scopeStack;
thread_local std::vector<ActiveNotification>        activeNotifications;
thread_local std::deque<DeferredModification>       deferredModifications;

auto isNotifying(ObservationRegistrar const* registrar, Identity identity) -> bool {
    return std::any_of(activeNotifications.begin(), activeNotifications.end(), [&](ActiveNotification const& active) {
        return active.registrar == registrar && active.identity == identity;
    });
}

struct NotificationFrame {
    NotificationFrame(ObservationRegistrar const* registrar, Identity identity) {
        activeNotifications.push_back(ActiveNotification{registrar, identity});
    }
    ~NotificationFrame() {
        activeNotifications.pop_back();
    }
};

} // namespace

ObservationScope::ObservationScope(std::shared_ptr<Observer> observer) {
    scopeStack.push_back(std::move(observer));
}

ObservationScope::~ObservationScope() {
    scopeStack.pop_back();
}

auto ObservationScope::current() -> std::shared_ptr<Observer> const* {
    if (scopeStack.empty())
        return nullptr;
    return &scopeStack.back();
}

ObservationRegistrar::ObservationRegistrar()  = default;
ObservationRegistrar::~ObservationRegistrar() = default;

auto ObservationRegistrar::Shared() -> ObservationRegistrar& {
    static ObservationRegistrar* instance = new ObservationRegistrar();
    return *instance;
}

auto ObservationRegistrar::trackAccess(Identity identity, FieldKey const& key, std::shared_ptr<Observer> const& observer) -> void {
    if (!observer)
        return;
    auto const generation = observer->generation();

    std::lock_guard<std::mutex> lock(this->mutex_);
    auto& bucket = this->registrations_[ObservationKey{identity, key}];
    // Prune registrations that already fired or whose observer went away.
    std::erase_if(bucket, [](Registration const& registration) {
        auto locked = registration.observer.lock();
        return !locked || locked->generation() != registration.generation;
    });
    bool const present = std::any_of(bucket.begin(), bucket.end(), [&](Registration const& registration) {
        return registration.observer.lock() == observer;
    });
    if (present)
        return;
    bucket.push_back(Registration{observer, generation, observer->detached() ? observer : nullptr});
    if (observer->detached()) {
        auto& placement = this->detached_[observer.get()];
        if (placement.observer.lock() != observer)
            placement = DetachedPlacement{observer, {}};
        placement.keys.push_back(ObservationKey{identity, key});
    }
}

auto ObservationRegistrar::access(Identity identity, FieldKey const& key) -> void {
    if (auto const* observer = ObservationScope::current())
        this->trackAccess(identity, key, *observer);
}

auto ObservationRegistrar::willModify(Identity identity, FieldKey const& key) -> void {
    this->notify(identity, key, ObservationPhase::WillSet);
}

auto ObservationRegistrar::didModify(Identity identity, FieldKey const& key) -> void {
    this->notify(identity, key, ObservationPhase::DidSet);
}

auto ObservationRegistrar::forget(Identity identity) -> void {
    std::vector<std::vector<Registration>> released;
    std::lock_guard<std::mutex>            lock(this->mutex_);
    phmap::erase_if(this->registrations_, [&](auto& entry) {
        if (entry.first.identity != identity)
            return false;
        released.push_back(std::move(entry.second));
        return true;
    });
    phmap::erase_if(this->detached_, [&](auto& entry) {
        std::erase_if(entry.second.keys, [&](ObservationKey const& k) { return k.identity == identity; });
        return entry.second.keys.empty() || entry.second.observer.expired();
    });
}

auto ObservationRegistrar::observerCount(Identity identity, FieldKey const& key) const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    auto                        it = this->registrations_.find(ObservationKey{identity, key});
    if (it == this->registrations_.end())
        return 0;
    return static_cast<std::size_t>(std::count_if(it->second.begin(), it->second.end(), [](Registration const& registration) {
        auto locked = registration.observer.lock();
        return locked && locked->generation() == registration.generation;
    }));
}

// Called with mutex_ held. Moves the registrations `observer` still has under
// other keys into `released`.
auto ObservationRegistrar::releaseDetached(Observer const* observer, std::vector<Registration>& released) -> void {
    auto placement = this->detached_.find(observer);
    if (placement == this->detached_.end())
        return;
    for (auto const& k : placement->second.keys) {
        auto bucket = this->registrations_.find(k);
        if (bucket == this->registrations_.end())
            continue;
        std::erase_if(bucket->second, [&](Registration& registration) {
            if (registration.retained.get() != observer)
                return false;
            released.push_back(std::move(registration));
            return true;
        });
        if (bucket->second.empty())
            this->registrations_.erase(bucket);
    }
    this->detached_.erase(placement);
}

auto ObservationRegistrar::notify(Identity identity, FieldKey const& key, ObservationPhase phase) -> void {
    if (isNotifying(this, identity)) {
        fs_log("ObservationRegistrar deferring reentrant modification of " + toString(identity) + "." + key, "Observation");
        deferredModifications.push_back(DeferredModification{this, identity, key, phase});
        return;
    }

    std::vector<std::shared_ptr<Observer>> toNotify;
    std::vector<Registration>              released; // destroyed after the lock is dropped
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        auto                        it = this->registrations_.find(ObservationKey{identity, key});
        if (it == this->registrations_.end())
            return;

        std::vector<Registration> keep;
        for (auto const& registration : it->second) {
            auto observer = registration.observer.lock();
            if (!observer)
                continue;
            if (observer->phase() != phase) {
                keep.push_back(registration);
                continue;
            }
            if (observer->tryClaim(registration.generation))
                toNotify.push_back(std::move(observer));
        }
        released = std::exchange(it->second, std::move(keep));
        if (it->second.empty())
            this->registrations_.erase(it);
        for (auto const& observer : toNotify) {
            if (observer->detached())
                this->releaseDetached(observer.get(), released);
        }
    }

    if (toNotify.empty())
        return;

    fs_log("ObservationRegistrar notifying " + std::to_string(toNotify.size()) + " observer(s) of " + toString(identity) + "." + key,
           "Observation");
    {
        NotificationFrame       frame{this, identity};
        ObservationEvent const event{identity, key, phase};
        for (auto const& observer : toNotify)
            observer->fire(event);
    }

    if (!activeNotifications.empty())
        return;
    while (!deferredModifications.empty()) {
        auto next = std::move(deferredModifications.front());
        deferredModifications.pop_front();
        next.registrar->notify(next.identity, next.key, next.phase);
    }
}

} // namespace FS
