#pragma once
#include "identity/IdentityRegistry.hpp"
#include "log/TaggedLogger.hpp"
#include "reducer/CaseReducer.hpp"
#include "reducer/Paths.hpp"
#include "reducer/Reducer.hpp"
#include "scope/CaseState.hpp"

#include <utility>
#include <variant>

namespace FS {

// Optional child state with an identity: a one-case CaseState.
template <typename T>
class PresentationState : public CaseState<T> {
public:
    static constexpr CaseTag kPresented = 1;

    PresentationState() = default;
    explicit PresentationState(ObservationRegistrar& registrar)
        : CaseState<T>(registrar) {}

    auto present(T value) -> CaseTransition { return this->template activate<kPresented>(std::move(value)); }
    auto dismiss() -> Identity { return this->reset(); }

    [[nodiscard]] auto isPresented() const -> bool { return this->tag() == kPresented; }
    [[nodiscard]] auto wrapped() const -> T const* { return this->template get<kPresented>(); }
};

struct Dismiss {
    friend auto operator==(Dismiss, Dismiss) -> bool = default;
};

template <typename Action>
using PresentationAction = std::variant<Dismiss, Action>;

/**
 * Attaches a presented child to its parent.
 *
 * Child actions run the child on the presented instance and are dropped when
 * nothing is presented. Dismiss is seen by the parent first and then clears
 * the presentation. Whenever the transition ends with a different instance
 * presented (or none), the previous one is retired and its effects are
 * cancelled ahead of all other effects.
 */
template <typename Parent, typename ParentAction, typename Child, typename ChildAction>
auto ifLet(Reducer<Parent, ParentAction>                                parent,
           StatePath<Parent, PresentationState<Child>>                  toPresentation,
           CasePath<ParentAction, PresentationAction<ChildAction>>      toPresentationAction,
           Reducer<Child, ChildAction>                                  child) -> Reducer<Parent, ParentAction> {
    return [parent = std::move(parent), toPresentation = std::move(toPresentation), toPresentationAction = std::move(toPresentationAction),
            child = std::move(child)](Parent& state, ParentAction const& action) -> Effect<ParentAction> {
        auto&      presentation = toPresentation(state);
        auto const before       = presentation.activeIdentity();

        bool dismissRequested = false;
        auto childEffect      = Effect<ParentAction>::none();
        if (auto const* presentationAction = toPresentationAction.extract(action)) {
            if (std::holds_alternative<Dismiss>(*presentationAction)) {
                if (before.isValid())
                    dismissRequested = true;
                else
                    fs_log("Dropped dismiss for " + toString(presentation.identity()) + ": nothing presented", "Routing");
            } else {
                auto const& embed = toPresentationAction.embed;
                childEffect       = detail::runScopedCase<PresentationState<Child>::kPresented, ParentAction>(
                    presentation, child, std::get<1>(*presentationAction), [embed](ChildAction childAction) {
                        return embed(PresentationAction<ChildAction>{std::in_place_index<1>, std::move(childAction)});
                    });
            }
        }

        auto parentEffect = parent.reduce(state, action);

        auto& after = toPresentation(state);
        if (dismissRequested && after.activeIdentity() == before)
            after.dismiss();

        auto cancel = Effect<ParentAction>::none();
        if (before.isValid() && after.activeIdentity() != before) {
            IdentityRegistry::Instance().retire(before);
            cancel = Effect<ParentAction>::cancelScope(before);
        }
        return Effect<ParentAction>::concatenate(std::move(cancel), std::move(childEffect), std::move(parentEffect));
    };
}

} // namespace FS
