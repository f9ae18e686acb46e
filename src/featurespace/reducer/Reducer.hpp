#pragma once
#include "effect/Effect.hpp"

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace FS {

/**
 * A feature's transition function.
 *
 * Mutates the state in place and returns the effect to run afterwards. Any
 * callable with the matching signature converts implicitly, so combinators
 * accept plain lambdas. A default constructed reducer does nothing.
 */
template <typename State, typename Action>
class Reducer {
public:
    using StateType  = State;
    using ActionType = Action;
    using EffectType = Effect<Action>;
    using Function   = std::function<Effect<Action>(State&, Action const&)>;

    Reducer() = default;

    template <typename Fn>
        requires(!std::same_as<std::remove_cvref_t<Fn>, Reducer> && std::is_invocable_r_v<Effect<Action>, Fn&, State&, Action const&>)
    Reducer(Fn fn)
        : function_(std::move(fn)) {}

    auto reduce(State& state, Action const& action) const -> Effect<Action> {
        if (!this->function_)
            return Effect<Action>::none();
        return this->function_(state, action);
    }

    auto operator()(State& state, Action const& action) const -> Effect<Action> {
        return this->reduce(state, action);
    }

private:
    Function function_;
};

} // namespace FS
