#pragma once
#include "observation/Observer.hpp"

#include <memory>
#include <utility>

namespace FS {

// Installs an observer as the target of tracked reads on the current thread
// for the lifetime of the scope. Scopes nest; the innermost one wins.
class ObservationScope {
public:
    explicit ObservationScope(std::shared_ptr<Observer> observer);
    ~ObservationScope();

    ObservationScope(ObservationScope const&)            = delete;
    ObservationScope& operator=(ObservationScope const&) = delete;

    static auto current() -> std::shared_ptr<Observer> const*;
};

// Runs `apply`; every tracked field read inside it subscribes `observer`.
template <typename Apply>
auto withObservationTracking(std::shared_ptr<Observer> const& observer, Apply&& apply) -> decltype(auto) {
    ObservationScope scope{observer};
    return std::forward<Apply>(apply)();
}

// Runs `apply` and calls `onChange` once, the first time any field read by
// `apply` is modified afterwards. The observer is owned by its registrations.
template <typename Apply>
auto withObservationTracking(Apply&& apply, Observer::Callback onChange, ObservationPhase phase = ObservationPhase::WillSet) -> decltype(auto) {
    auto observer = Observer::CreateDetached(std::move(onChange), phase);
    return withObservationTracking(observer, std::forward<Apply>(apply));
}

} // namespace FS
