#pragma once
#include "core/Error.hpp"
#include "effect/Effect.hpp"
#include "identity/IdentityRegistry.hpp"
#include "log/TaggedLogger.hpp"
#include "reducer/Paths.hpp"
#include "reducer/Reducer.hpp"
#include "scope/CaseScope.hpp"

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace FS {

// Action type of cases that never receive actions.
struct NoAction {
    friend auto operator==(NoAction, NoAction) -> bool = default;
};

// Action addressed to one case of a CaseState<P1..PN>: alternative i is the
// action of case i, alternative 0 (the empty case) is never routed.
template <typename... Actions>
using CaseAction = std::variant<std::monostate, Actions...>;

template <CaseTag Tag, typename CompositeAction>
auto caseAction(std::variant_alternative_t<Tag, CompositeAction> action) -> CompositeAction {
    return CompositeAction{std::in_place_index<Tag>, std::move(action)};
}

enum class CaseClassification {
    Unclassified,
    Composed,  // a child reducer runs inside the case
    Ephemeral, // presence only; any action dismisses it
    Ignored    // opaque to routing
};

constexpr auto classificationToString(CaseClassification classification) -> std::string_view {
    switch (classification) {
        case CaseClassification::Unclassified:
            return "unclassified";
        case CaseClassification::Composed:
            return "composed";
        case CaseClassification::Ephemeral:
            return "ephemeral";
        case CaseClassification::Ignored:
            return "ignored";
    }
    return "unclassified";
}

namespace detail {

// Runs `child` on case Tag of `composite` in place. Effects are lifted with
// `embed` and made cancellable by the case instance.
template <CaseTag Tag, typename ParentAction, typename Composite, typename ChildState, typename ChildAction, typename Embed>
auto runScopedCase(Composite& composite, Reducer<ChildState, ChildAction> const& child, ChildAction const& action, Embed const& embed)
    -> Effect<ParentAction> {
    auto scoped = scope<Tag>(composite);
    if (!scoped) {
        fs_log("Dropped action for inactive case " + std::to_string(Tag) + " of " + toString(composite.identity()), "Routing");
        return Effect<ParentAction>::none();
    }

    auto const before = scoped->identity();
    auto       effect = Effect<ChildAction>::none();
    if (!scoped->modify([&](ChildState& payload) { effect = child.reduce(payload, action); }))
        return Effect<ParentAction>::none();

    auto const after  = composite.activeIdentity();
    auto       lifted = effect.template map<ParentAction>(embed).cancellable(CancellationId::forIdentity(after));
    if (after != before)
        return Effect<ParentAction>::concatenate(Effect<ParentAction>::cancelScope(before), std::move(lifted));
    return lifted;
}

} // namespace detail

template <typename Composite, typename CompositeAction>
class CaseReducer;

/**
 * Classifies every case of an enum composite.
 *
 * Each case 1..N must be declared exactly once as composed (with the reducer
 * of its payload), ephemeral or ignored. Shape mismatches are compile errors;
 * missing or repeated classifications make build() fail.
 */
template <typename Composite, typename CompositeAction>
class CaseReducerBuilder {
public:
    static constexpr std::size_t kCaseCount = Composite::kCaseCount;

    static_assert(std::variant_size_v<CompositeAction> == kCaseCount, "the case action needs one alternative per case, including the empty case");

    template <CaseTag Tag>
    using PayloadAt = typename Composite::template Payload<Tag>;
    template <CaseTag Tag>
    using ActionAt = std::variant_alternative_t<Tag, CompositeAction>;

    using Runner = std::function<Effect<CompositeAction>(Composite&, CompositeAction const&)>;

    template <CaseTag Tag>
    auto composed(Reducer<PayloadAt<Tag>, ActionAt<Tag>> child) -> CaseReducerBuilder& {
        static_assert(Tag != kNoCase && Tag < kCaseCount, "case tag out of range");
        static_assert(!std::is_same_v<ActionAt<Tag>, NoAction>, "a composed case needs an action type");
        if (this->classify(Tag, CaseClassification::Composed)) {
            this->runners_[Tag] = [child = std::move(child)](Composite& composite, CompositeAction const& action) -> Effect<CompositeAction> {
                return detail::runScopedCase<Tag, CompositeAction>(composite, child, std::get<Tag>(action), [](ActionAt<Tag> childAction) {
                    return caseAction<Tag, CompositeAction>(std::move(childAction));
                });
            };
        }
        return *this;
    }

    template <CaseTag Tag>
    auto ephemeral() -> CaseReducerBuilder& {
        static_assert(Tag != kNoCase && Tag < kCaseCount, "case tag out of range");
        if (this->classify(Tag, CaseClassification::Ephemeral)) {
            this->runners_[Tag] = [](Composite& composite, CompositeAction const&) -> Effect<CompositeAction> {
                composite.reset();
                return Effect<CompositeAction>::none();
            };
        }
        return *this;
    }

    template <CaseTag Tag>
    auto ignored() -> CaseReducerBuilder& {
        static_assert(Tag != kNoCase && Tag < kCaseCount, "case tag out of range");
        static_assert(std::is_same_v<ActionAt<Tag>, NoAction>, "an ignored case takes NoAction");
        this->classify(Tag, CaseClassification::Ignored);
        return *this;
    }

    [[nodiscard]] auto build() const -> Expected<CaseReducer<Composite, CompositeAction>> {
        if (this->error_)
            return std::unexpected(*this->error_);
        for (CaseTag tag = 1; tag < kCaseCount; ++tag) {
            if (this->classifications_[tag] == CaseClassification::Unclassified)
                return std::unexpected(Error{Error::Code::UnclassifiedCase, "case " + std::to_string(tag) + " has no classification"});
        }
        return CaseReducer<Composite, CompositeAction>{this->classifications_, this->runners_};
    }

private:
    auto classify(CaseTag tag, CaseClassification classification) -> bool {
        auto& slot = this->classifications_[tag];
        if (slot == CaseClassification::Unclassified) {
            slot = classification;
            return true;
        }
        if (!this->error_) {
            auto const message = "case " + std::to_string(tag) + " classified as " + std::string(classificationToString(slot)) + " and " +
                                 std::string(classificationToString(classification));
            this->error_ = Error{slot == classification ? Error::Code::InvalidComposition : Error::Code::ConflictingClassification, message};
        }
        return false;
    }

    std::array<CaseClassification, kCaseCount> classifications_{};
    std::array<Runner, kCaseCount>             runners_{};
    std::optional<Error>                       error_;
};

/**
 * Routes a case action to the active case of a composite.
 *
 * Actions for the empty case, an ignored case or a case that is not active
 * are dropped without touching the state.
 */
template <typename Composite, typename CompositeAction>
class CaseReducer {
public:
    static constexpr std::size_t kCaseCount = Composite::kCaseCount;

    using Runner = typename CaseReducerBuilder<Composite, CompositeAction>::Runner;

    CaseReducer(std::array<CaseClassification, kCaseCount> classifications, std::array<Runner, kCaseCount> runners)
        : classifications_(classifications), runners_(std::move(runners)) {}

    auto reduce(Composite& composite, CompositeAction const& action) const -> Effect<CompositeAction> {
        CaseTag const tag = action.index();
        if (tag == kNoCase) {
            fs_log("Dropped action for the empty case of " + toString(composite.identity()), "Routing");
            return Effect<CompositeAction>::none();
        }
        if (composite.activeTag() != tag) {
            fs_log("Dropped stale action for inactive case " + std::to_string(tag) + " of " + toString(composite.identity()), "Routing");
            return Effect<CompositeAction>::none();
        }
        if (this->classifications_[tag] == CaseClassification::Ignored || !this->runners_[tag]) {
            fs_log("Dropped action for ignored case " + std::to_string(tag) + " of " + toString(composite.identity()), "Routing");
            return Effect<CompositeAction>::none();
        }
        return this->runners_[tag](composite, action);
    }

    auto operator()(Composite& composite, CompositeAction const& action) const -> Effect<CompositeAction> {
        return this->reduce(composite, action);
    }

    [[nodiscard]] auto classification(CaseTag tag) const -> CaseClassification {
        if (tag >= kCaseCount)
            return CaseClassification::Unclassified;
        return this->classifications_[tag];
    }

private:
    std::array<CaseClassification, kCaseCount> classifications_;
    std::array<Runner, kCaseCount>             runners_;
};

/**
 * Attaches an enum composite to its parent.
 *
 * The case reducer runs first, then the parent. When the transition leaves a
 * different case or case instance in the slot (switch, reset, or replacement
 * by the child itself), the old instance is retired and, for composed cases, a
 * cancellation of its effects is placed ahead of every other effect.
 */
template <typename Parent, typename ParentAction, typename Composite, typename CompositeAction>
auto ifCaseLet(Reducer<Parent, ParentAction>                 parent,
               StatePath<Parent, Composite>                  toComposite,
               CasePath<ParentAction, CompositeAction>       toCompositeAction,
               CaseReducer<Composite, CompositeAction> const& cases) -> Reducer<Parent, ParentAction> {
    return [parent = std::move(parent), toComposite = std::move(toComposite), toCompositeAction = std::move(toCompositeAction), cases](
               Parent& state, ParentAction const& action) -> Effect<ParentAction> {
        auto&      composite = toComposite(state);
        auto const beforeTag = composite.activeTag();
        auto const before    = composite.activeIdentity();

        auto childEffect = Effect<ParentAction>::none();
        if (auto const* compositeAction = toCompositeAction.extract(action))
            childEffect = cases.reduce(composite, *compositeAction).template map<ParentAction>(toCompositeAction.embed);

        auto parentEffect = parent.reduce(state, action);

        auto cancel = Effect<ParentAction>::none();
        auto const& after = toComposite(state);
        if (before.isValid() && (after.activeTag() != beforeTag || after.activeIdentity() != before)) {
            IdentityRegistry::Instance().retire(before);
            if (cases.classification(beforeTag) == CaseClassification::Composed)
                cancel = Effect<ParentAction>::cancelScope(before);
        }
        return Effect<ParentAction>::concatenate(std::move(cancel), std::move(childEffect), std::move(parentEffect));
    };
}

} // namespace FS
