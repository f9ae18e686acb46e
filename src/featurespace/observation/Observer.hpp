#pragma once
#include "identity/Identity.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace FS {

using FieldKey = std::string;

enum class ObservationPhase {
    WillSet, // fired before the new value is installed
    DidSet   // fired after the new value is installed
};

struct ObservationEvent {
    Identity         identity;
    FieldKey         key;
    ObservationPhase phase = ObservationPhase::WillSet;
};

/**
 * A one-shot interest in a set of (Identity, FieldKey) pairs.
 *
 * Every registration records the observer's generation at registration time.
 * Firing bumps the generation, which invalidates all outstanding
 * registrations at once, so an observer is notified at most once per batch no
 * matter how many of its pairs are modified. Registering again after a
 * notification arms it for the next batch.
 */
class Observer {
public:
    using Callback = std::function<void(ObservationEvent const&)>;

    static auto Create(Callback callback, ObservationPhase phase = ObservationPhase::WillSet) -> std::shared_ptr<Observer> {
        return std::shared_ptr<Observer>(new Observer(std::move(callback), phase, false));
    }

    // An observer with no owner besides its registrations. It stays alive
    // until it fires or is pruned.
    static auto CreateDetached(Callback callback, ObservationPhase phase = ObservationPhase::WillSet) -> std::shared_ptr<Observer> {
        return std::shared_ptr<Observer>(new Observer(std::move(callback), phase, true));
    }

    Observer(Observer const&)            = delete;
    Observer& operator=(Observer const&) = delete;

    [[nodiscard]] auto phase() const -> ObservationPhase { return this->phase_; }
    [[nodiscard]] auto detached() const -> bool { return this->detached_; }
    [[nodiscard]] auto generation() const -> std::uint64_t { return this->generation_.load(std::memory_order_acquire); }
    [[nodiscard]] auto notificationCount() const -> std::size_t { return this->notifications_.load(std::memory_order_acquire); }

    // Drop every outstanding registration without notifying.
    auto cancel() -> void { this->generation_.fetch_add(1, std::memory_order_acq_rel); }

private:
    friend class ObservationRegistrar;

    Observer(Callback callback, ObservationPhase phase, bool detached)
        : callback_(std::move(callback)), phase_(phase), detached_(detached) {}

    // Claims the registration made at `generation`; fails if it already fired.
    auto tryClaim(std::uint64_t generation) -> bool {
        return this->generation_.compare_exchange_strong(generation, generation + 1, std::memory_order_acq_rel);
    }

    auto fire(ObservationEvent const& event) -> void {
        this->notifications_.fetch_add(1, std::memory_order_acq_rel);
        if (this->callback_)
            this->callback_(event);
    }

    Callback                   callback_;
    ObservationPhase           phase_;
    bool                       detached_;
    std::atomic<std::uint64_t> generation_{0};
    std::atomic<std::size_t>   notifications_{0};
};

} // namespace FS
