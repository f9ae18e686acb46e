#pragma once
#include "collection/IdentifiedArray.hpp"
#include "effect/Effect.hpp"
#include "log/TaggedLogger.hpp"
#include "reducer/Paths.hpp"
#include "reducer/Reducer.hpp"

#include <parallel_hashmap/phmap.h>

#include <utility>
#include <vector>

namespace FS {

// An element action addressed by element id.
template <typename Id, typename Action>
struct IdentifiedAction {
    Id     id;
    Action action;

    friend auto operator==(IdentifiedAction const&, IdentifiedAction const&) -> bool = default;
};

/**
 * Runs `element` in place on the element an IdentifiedAction names, then
 * the parent.
 *
 * Actions for ids that are not in the array are dropped. Element effects are
 * cancellable by the element's identity; elements the transition removed get
 * their effects cancelled ahead of everything else.
 */
template <typename Parent, typename ParentAction, typename Element, typename ElementAction>
auto forEach(Reducer<Parent, ParentAction>                                                  parent,
             StatePath<Parent, IdentifiedArray<Element>>                                    toElements,
             CasePath<ParentAction, IdentifiedAction<ElementIdOf<Element>, ElementAction>> toElementAction,
             Reducer<Element, ElementAction>                                                element) -> Reducer<Parent, ParentAction> {
    static_assert(Observable<Element>, "forEach elements must be observable state");
    using Id = ElementIdOf<Element>;

    return [parent = std::move(parent), toElements = std::move(toElements), toElementAction = std::move(toElementAction),
            element = std::move(element)](Parent& state, ParentAction const& action) -> Effect<ParentAction> {
        auto& elements = toElements(state);
        auto  before   = elements.elementIdentities();

        auto elementEffect = Effect<ParentAction>::none();
        if (auto const* addressed = toElementAction.extract(action)) {
            if (elements.peek(addressed->id) != nullptr) {
                auto effect = Effect<ElementAction>::none();
                elements.modify(addressed->id, [&](Element& current) { effect = element.reduce(current, addressed->action); });
                auto const* updated = elements.peek(addressed->id);
                auto const  embed   = toElementAction.embed;
                elementEffect       = effect
                                    .template map<ParentAction>([embed, id = addressed->id](ElementAction elementAction) {
                                        return embed(IdentifiedAction<Id, ElementAction>{id, std::move(elementAction)});
                                    })
                                    .cancellable(CancellationId::forIdentity(updated->identity()));
            } else {
                fs_log("Dropped action for missing element of " + toString(elements.identity()), "Routing");
            }
        }

        auto parentEffect = parent.reduce(state, action);

        auto                                        cancel = Effect<ParentAction>::none();
        phmap::flat_hash_set<Identity, IdentityHash> remaining;
        for (auto identity : toElements(state).elementIdentities())
            remaining.insert(identity);
        for (auto identity : before) {
            if (remaining.contains(identity))
                continue;
            IdentityRegistry::Instance().retire(identity);
            cancel.append(Effect<ParentAction>::cancelScope(identity));
        }
        return Effect<ParentAction>::concatenate(std::move(cancel), std::move(elementEffect), std::move(parentEffect));
    };
}

} // namespace FS
