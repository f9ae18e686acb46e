#pragma once
#include "reducer/Paths.hpp"
#include "reducer/Reducer.hpp"

#include <vector>

namespace FS {

// Runs the reducers in order on the same state and concatenates their
// effects. A reducer returning Effect::stop() ends the run for that action.
template <typename State, typename Action, typename... Rest>
auto combine(Reducer<State, Action> first, Rest... rest) -> Reducer<State, Action> {
    std::vector<Reducer<State, Action>> reducers{std::move(first), Reducer<State, Action>(std::move(rest))...};
    return [reducers = std::move(reducers)](State& state, Action const& action) -> Effect<Action> {
        auto result = Effect<Action>::none();
        for (auto const& reducer : reducers) {
            auto effect = reducer.reduce(state, action);
            bool const stop = effect.stopsPropagation();
            result.append(std::move(effect));
            if (stop)
                break;
        }
        result.clearStop();
        return result;
    };
}

// Routes the child's actions to the child's slice of the parent state and
// lifts the child's effects back into the parent action.
template <typename Parent, typename ParentAction, typename Child, typename ChildAction>
auto scopeChild(StatePath<Parent, Child> toChildState, CasePath<ParentAction, ChildAction> toChildAction, Reducer<Child, ChildAction> child)
    -> Reducer<Parent, ParentAction> {
    return [toChildState = std::move(toChildState), toChildAction = std::move(toChildAction), child = std::move(child)](
               Parent& parent, ParentAction const& action) -> Effect<ParentAction> {
        auto const* childAction = toChildAction.extract(action);
        if (childAction == nullptr)
            return Effect<ParentAction>::none();
        return child.reduce(toChildState(parent), *childAction).template map<ParentAction>(toChildAction.embed);
    };
}

} // namespace FS
