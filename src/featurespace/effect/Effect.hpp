#pragma once
#include "effect/CancellationId.hpp"
#include "effect/CancellationToken.hpp"
#include "identity/Identity.hpp"

#include <exception>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace FS {

/**
 * The work a transition asks the store to perform afterwards.
 *
 * An effect is an ordered list of items:
 *  - Send:   feed an action back into the store right away
 *  - Run:    execute an operation on the store's executor; the operation
 *            delivers actions through the Send callback it is given
 *  - Cancel: cancel in-flight Run items by id, or every item scoped to an
 *            identity
 *
 * The store executes all Cancel items of a transition before it starts any
 * other item of that transition. Send and Run items start in list order.
 *
 * `stop()` carries no work; it tells combine() not to run later reducers for
 * the current action.
 */
template <typename Action>
class Effect {
public:
    using ActionType = Action;
    using Send       = std::function<void(Action)>;
    using Operation  = std::function<void(Send const&, CancellationToken const&)>;
    using Catch      = std::function<void(std::exception_ptr, Send const&)>;

    struct Item {
        enum class Kind {
            Send,
            Run,
            Cancel
        };

        Kind                          kind = Kind::Send;
        std::optional<Action>         action;
        Operation                     operation;
        Catch                         onError;
        std::vector<CancellationId>   cancellationIds;
        bool                          cancelInFlight = false;
        std::optional<CancellationId> target;
        Identity                      cancelScope;
    };

    Effect() = default;

    static auto none() -> Effect { return Effect{}; }

    static auto send(Action action) -> Effect {
        Item item;
        item.kind   = Item::Kind::Send;
        item.action = std::move(action);
        return Effect{std::move(item)};
    }

    // `onError` receives exceptions escaping `operation` and may send a
    // failure action; without it the failure is logged by the store.
    static auto run(Operation operation, Catch onError = {}) -> Effect {
        Item item;
        item.kind      = Item::Kind::Run;
        item.operation = std::move(operation);
        item.onError   = std::move(onError);
        return Effect{std::move(item)};
    }

    static auto cancel(CancellationId id) -> Effect {
        Item item;
        item.kind   = Item::Kind::Cancel;
        item.target = std::move(id);
        return Effect{std::move(item)};
    }

    static auto cancelScope(Identity scope) -> Effect {
        Item item;
        item.kind        = Item::Kind::Cancel;
        item.cancelScope = scope;
        return Effect{std::move(item)};
    }

    static auto stop() -> Effect {
        Effect effect;
        effect.stop_ = true;
        return effect;
    }

    static auto merge(std::vector<Effect> effects) -> Effect {
        Effect merged;
        for (auto& effect : effects)
            merged.append(std::move(effect));
        return merged;
    }

    template <typename... Effects>
    static auto concatenate(Effects&&... effects) -> Effect {
        Effect result;
        (result.append(std::forward<Effects>(effects)), ...);
        return result;
    }

    auto append(Effect other) -> Effect& {
        for (auto& item : other.items_)
            this->items_.push_back(std::move(item));
        this->stop_ = this->stop_ || other.stop_;
        return *this;
    }

    // Tags every Run item with `id`. With `cancelInFlight`, starting the item
    // first cancels whatever is still running under the same id.
    auto cancellable(CancellationId id, bool cancelInFlight = false) && -> Effect {
        for (auto& item : this->items_) {
            if (item.kind != Item::Kind::Run)
                continue;
            item.cancellationIds.push_back(id);
            item.cancelInFlight = item.cancelInFlight || cancelInFlight;
        }
        return std::move(*this);
    }

    auto cancellable(CancellationId id, bool cancelInFlight = false) const& -> Effect {
        return Effect{*this}.cancellable(std::move(id), cancelInFlight);
    }

    // Lifts the effect into a parent action space.
    template <typename Parent, typename Embed>
    auto map(Embed embed) const -> Effect<Parent> {
        using ParentEffect = Effect<Parent>;
        using ParentItem   = typename ParentEffect::Item;
        using ParentSend   = typename ParentEffect::Send;

        ParentEffect result;
        result.stop_ = this->stop_;
        for (auto const& item : this->items_) {
            ParentItem mapped;
            mapped.cancellationIds = item.cancellationIds;
            mapped.cancelInFlight  = item.cancelInFlight;
            mapped.target          = item.target;
            mapped.cancelScope     = item.cancelScope;
            switch (item.kind) {
                case Item::Kind::Send:
                    mapped.kind = ParentItem::Kind::Send;
                    if (item.action)
                        mapped.action = embed(*item.action);
                    break;
                case Item::Kind::Run:
                    mapped.kind      = ParentItem::Kind::Run;
                    mapped.operation = [operation = item.operation, embed](ParentSend const& send, CancellationToken const& token) {
                        operation([send, embed](Action action) { send(embed(std::move(action))); }, token);
                    };
                    if (item.onError) {
                        mapped.onError = [onError = item.onError, embed](std::exception_ptr error, ParentSend const& send) {
                            onError(error, [send, embed](Action action) { send(embed(std::move(action))); });
                        };
                    }
                    break;
                case Item::Kind::Cancel:
                    mapped.kind = ParentItem::Kind::Cancel;
                    break;
            }
            result.items_.push_back(std::move(mapped));
        }
        return result;
    }

    [[nodiscard]] auto isNone() const -> bool { return this->items_.empty(); }
    [[nodiscard]] auto stopsPropagation() const -> bool { return this->stop_; }
    [[nodiscard]] auto items() const -> std::vector<Item> const& { return this->items_; }

    // Drops the stop flag once the combinator that honours it is done.
    auto clearStop() -> void { this->stop_ = false; }

private:
    template <typename>
    friend class Effect;

    explicit Effect(Item item) { this->items_.push_back(std::move(item)); }

    std::vector<Item> items_;
    bool              stop_ = false;
};

} // namespace FS
