#pragma once
#include "core/Error.hpp"
#include "effect/CancellationRegistry.hpp"
#include "effect/Effect.hpp"
#include "log/TaggedLogger.hpp"
#include "observation/ObservationTracking.hpp"
#include "reducer/Reducer.hpp"
#include "store/StoreOptions.hpp"
#include "task/Task.hpp"
#include "task/TaskPool.hpp"

#include <parallel_hashmap/phmap.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace FS {

/**
 * Owns a state tree and drives it with a reducer.
 *
 * Actions sent from any thread are queued; one thread at a time drains the
 * queue and runs the reducer, so transitions never overlap. The effect of
 * each transition is processed before the next action is dequeued:
 *  1. every Cancel item is executed,
 *  2. Send items are queued behind the actions already waiting,
 *  3. Run items are submitted to the executor with a fresh cancellation
 *     token registered under their cancellation ids.
 * Run items scoped to an identity that the same transition cancelled are not
 * started at all. Actions sent by an effect whose token has been cancelled
 * are dropped, both when sent and when dequeued.
 *
 * Effects only hold a weak reference to the store internals; destroying the
 * store cancels everything still running.
 */
template <typename State, typename Action>
class Store {
public:
    using StateType  = State;
    using ActionType = Action;

    Store(State initial, Reducer<State, Action> reducer, StoreOptions options = {})
        : core_(std::make_shared<Core>(std::move(initial), std::move(reducer), std::move(options))) {}

    ~Store() {
        auto const cancelled = this->core_->cancellations.cancelAll();
        std::lock_guard<std::mutex> lock(this->core_->mutex);
        this->core_->closed = true;
        this->core_->queue.clear();
        fs_log(this->core_->name + " destroyed, cancelled " + std::to_string(cancelled) + " effect(s)", "Store");
    }

    Store(Store const&)            = delete;
    Store& operator=(Store const&) = delete;

    auto send(Action action) -> void {
        enqueue(this->core_, Envelope{std::move(action), nullptr});
    }

    // Runs `fn` on the current state with transitions held off.
    template <typename Fn>
    auto withState(Fn&& fn) const -> decltype(auto) {
        std::lock_guard<std::recursive_mutex> lock(this->core_->stateMutex);
        return std::forward<Fn>(fn)(std::as_const(this->core_->state));
    }

    [[nodiscard]] auto state() const -> State {
        return this->withState([](State const& state) { return state; });
    }

    // Runs `apply` on the state and calls `onChange` once, around the first
    // later write to any tracked field `apply` read. With DidSet the state the
    // callback reads already holds the write.
    template <typename Apply>
    auto observe(Apply&& apply, Observer::Callback onChange, ObservationPhase phase = ObservationPhase::WillSet) const -> decltype(auto) {
        return withObservationTracking([&]() -> decltype(auto) { return this->withState(std::forward<Apply>(apply)); }, std::move(onChange), phase);
    }

    // True once the queue is empty and no effect is running.
    auto waitUntilIdle(std::chrono::milliseconds timeout) const -> bool {
        std::unique_lock<std::mutex> lock(this->core_->mutex);
        return this->core_->idleCv.wait_for(lock, timeout, [this] { return this->core_->isIdle(); });
    }

    [[nodiscard]] auto inFlightEffects() const -> std::size_t {
        std::lock_guard<std::mutex> lock(this->core_->mutex);
        return this->core_->tasks.size();
    }

    // Last error an executor returned when refusing an effect.
    [[nodiscard]] auto lastExecutorError() const -> std::optional<Error> {
        std::lock_guard<std::mutex> lock(this->core_->mutex);
        return this->core_->lastExecutorError;
    }

    [[nodiscard]] auto name() const -> std::string const& { return this->core_->name; }

private:
    using EffectType = Effect<Action>;
    using Item       = typename EffectType::Item;

    struct Envelope {
        Action                             action;
        std::shared_ptr<CancellationToken> origin; // token of the effect that sent it, if any
    };

    struct Core {
        Core(State initial, Reducer<State, Action> reducer, StoreOptions options)
            : state(std::move(initial)),
              reducer(std::move(reducer)),
              executor(options.executor != nullptr ? options.executor : &TaskPool::Instance()),
              name(std::move(options.name)) {}

        auto isIdle() const -> bool { return this->queue.empty() && !this->draining && this->tasks.empty(); }

        State                          state;
        Reducer<State, Action>         reducer;
        Executor*                      executor;
        std::string                    name;
        mutable std::recursive_mutex   stateMutex;
        CancellationRegistry           cancellations;

        mutable std::mutex                                      mutex; // guards everything below
        mutable std::condition_variable                         idleCv;
        std::deque<Envelope>                                    queue;
        bool                                                    draining = false;
        bool                                                    closed   = false;
        phmap::flat_hash_map<Task const*, std::shared_ptr<Task>> tasks;
        std::optional<Error>                                    lastExecutorError;
    };

    // Releases the drainer role if a reducer throws.
    struct DrainGuard {
        Core& core;
        bool  released = false;

        ~DrainGuard() {
            if (this->released)
                return;
            std::lock_guard<std::mutex> lock(this->core.mutex);
            this->core.draining = false;
            this->core.idleCv.notify_all();
        }
    };

    static auto enqueue(std::shared_ptr<Core> const& core, Envelope envelope) -> void {
        {
            std::lock_guard<std::mutex> lock(core->mutex);
            if (core->closed)
                return;
            core->queue.push_back(std::move(envelope));
            if (core->draining)
                return;
            core->draining = true;
        }
        drain(core);
    }

    static auto drain(std::shared_ptr<Core> const& core) -> void {
        DrainGuard guard{*core};
        while (true) {
            std::optional<Envelope> next;
            {
                std::lock_guard<std::mutex> lock(core->mutex);
                if (core->queue.empty()) {
                    core->draining = false;
                    guard.released = true;
                    core->idleCv.notify_all();
                    return;
                }
                next.emplace(std::move(core->queue.front()));
                core->queue.pop_front();
            }
            if (next->origin && next->origin->isCancelled()) {
                fs_log(core->name + " dropped an action sent by a cancelled effect", "Store");
                continue;
            }
            auto effect = EffectType::none();
            {
                std::lock_guard<std::recursive_mutex> lock(core->stateMutex);
                effect = core->reducer.reduce(core->state, next->action);
            }
            process(core, effect);
        }
    }

    static auto process(std::shared_ptr<Core> const& core, EffectType const& effect) -> void {
        phmap::flat_hash_set<Identity, IdentityHash> cancelledScopes;
        for (auto const& item : effect.items()) {
            if (item.kind != Item::Kind::Cancel)
                continue;
            if (item.target)
                core->cancellations.cancel(*item.target);
            if (item.cancelScope.isValid()) {
                core->cancellations.cancelScope(item.cancelScope);
                cancelledScopes.insert(item.cancelScope);
            }
        }

        for (auto const& item : effect.items()) {
            switch (item.kind) {
                case Item::Kind::Cancel:
                    break;
                case Item::Kind::Send:
                    if (item.action) {
                        std::lock_guard<std::mutex> lock(core->mutex);
                        core->queue.push_back(Envelope{*item.action, nullptr});
                    }
                    break;
                case Item::Kind::Run: {
                    bool retired = false;
                    for (auto const& id : item.cancellationIds)
                        retired = retired || (id.scope.isValid() && cancelledScopes.contains(id.scope));
                    if (retired) {
                        fs_log(core->name + " skipped an effect of a retired instance", "Store");
                        break;
                    }
                    if (item.cancelInFlight) {
                        for (auto const& id : item.cancellationIds)
                            core->cancellations.cancel(id);
                    }
                    start(core, item);
                    break;
                }
            }
        }
    }

    static auto start(std::shared_ptr<Core> const& core, Item const& item) -> void {
        auto token = std::make_shared<CancellationToken>();
        for (auto const& id : item.cancellationIds)
            core->cancellations.add(id, token);

        std::weak_ptr<Core> weak = core;
        auto task = Task::Create(
            [weak, token, operation = item.operation, onError = item.onError, ids = item.cancellationIds](Task& self) {
                struct Finish {
                    std::weak_ptr<Core> const&               weak;
                    std::vector<CancellationId> const&        ids;
                    std::shared_ptr<CancellationToken> const& token;
                    Task const*                               task;

                    ~Finish() {
                        if (auto core = this->weak.lock())
                            finish(core, this->ids, this->token, this->task);
                    }
                } finishGuard{weak, ids, token, &self};

                typename EffectType::Send const send = [weak, token](Action action) {
                    if (token->isCancelled())
                        return;
                    if (auto core = weak.lock())
                        enqueue(core, Envelope{std::move(action), token});
                };
                try {
                    operation(send, *token);
                } catch (...) {
                    if (!onError)
                        throw;
                    onError(std::current_exception(), send);
                }
            },
            core->name + " effect");

        {
            std::lock_guard<std::mutex> lock(core->mutex);
            core->tasks.emplace(task.get(), task);
        }
        if (auto error = core->executor->submit(task)) {
            fs_log(core->name + " executor refused an effect: " + describeError(*error), "Store", "Error");
            for (auto const& id : item.cancellationIds)
                core->cancellations.remove(id, token.get());
            std::lock_guard<std::mutex> lock(core->mutex);
            core->tasks.erase(task.get());
            core->lastExecutorError = std::move(error);
            core->idleCv.notify_all();
        }
    }

    static auto finish(std::shared_ptr<Core> const&              core,
                       std::vector<CancellationId> const&        ids,
                       std::shared_ptr<CancellationToken> const& token,
                       Task const*                               task) -> void {
        for (auto const& id : ids)
            core->cancellations.remove(id, token.get());
        std::lock_guard<std::mutex> lock(core->mutex);
        core->tasks.erase(task);
        core->idleCv.notify_all();
    }

    std::shared_ptr<Core> core_;
};

} // namespace FS
