#pragma once
#include "store/Store.hpp"

#include <concepts>
#include <utility>

namespace FS {

// A feature action that nests the actions its view may send.
template <typename Action>
concept HasViewActions = requires(typename Action::View view) {
    { Action::view(std::move(view)) } -> std::convertible_to<Action>;
};

template <typename State, HasViewActions Action>
auto sendView(Store<State, Action>& store, typename Action::View view) -> void {
    store.send(Action::view(std::move(view)));
}

} // namespace FS
