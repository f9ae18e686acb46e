#include "identity/IdentityRegistry.hpp"
#include "reducer/CaseReducer.hpp"
#include "store/Store.hpp"

#include "unit/FeatureSpaceTestHelper.hpp"

#include <doctest/doctest.h>

#include <variant>

using namespace FS;
using namespace FS::testing;

namespace {

struct DetailState : ObservableState {
    int                id = 0;
    TrackedField<int>  refreshes{"refreshes", 0};
    TrackedField<bool> loaded{"loaded", false};

    DetailState() = default;
    explicit DetailState(int id)
        : id(id) {}

    friend auto operator==(DetailState const&, DetailState const&) -> bool = default;
};

struct Refresh {};
struct RefreshDone {};
struct Close {};
using DetailAction = std::variant<Refresh, RefreshDone, Close>;

using Destination       = CaseState<DetailState>;
using DestinationAction = CaseAction<DetailAction>;
constexpr CaseTag kDetail = 1;

struct AppState {
    Destination destination;
};

struct PresentDetail {
    int id = 0;
};
using AppAction = std::variant<PresentDetail, DestinationAction>;

auto detailReducer() -> Reducer<DetailState, DetailAction> {
    return [](DetailState& state, DetailAction const& action) -> Effect<DetailAction> {
        if (std::holds_alternative<Refresh>(action)) {
            state.refreshes.set(state, state.refreshes.peek() + 1);
            return Effect<DetailAction>::run([](Effect<DetailAction>::Send const& send, CancellationToken const&) { send(RefreshDone{}); });
        }
        if (std::holds_alternative<RefreshDone>(action))
            state.loaded.set(state, true);
        return Effect<DetailAction>::none();
    };
}

auto appReducer() -> Reducer<AppState, AppAction> {
    Reducer<AppState, AppAction> parent = [](AppState& state, AppAction const& action) -> Effect<AppAction> {
        if (auto const* present = std::get_if<PresentDetail>(&action)) {
            state.destination.activate<kDetail>(DetailState{present->id});
            return Effect<AppAction>::none();
        }
        auto const& destination = std::get<DestinationAction>(action);
        if (destination.index() == kDetail && std::holds_alternative<Close>(std::get<kDetail>(destination)))
            state.destination.reset();
        return Effect<AppAction>::none();
    };

    auto destination = CaseReducerBuilder<Destination, DestinationAction>{}.composed<kDetail>(detailReducer()).build();
    REQUIRE(destination.has_value());
    return ifCaseLet(parent, statePath(&AppState::destination), casePath<AppAction, DestinationAction>(), *destination);
}

auto detail(DetailAction action) -> AppAction {
    return AppAction{caseAction<kDetail, DestinationAction>(std::move(action))};
}

} // namespace

TEST_SUITE("store.destination") {
    TEST_CASE("Present, close and a stale action") {
        ManualExecutor executor;
        Store          store{AppState{}, appReducer(), StoreOptions{&executor, "App"}};
        CHECK(store.state().destination.tag() == kNoCase);

        store.send(PresentDetail{1});
        auto const presented = store.state();
        REQUIRE(presented.destination.tag() == kDetail);
        auto const detailIdentity = presented.destination.caseIdentity();
        CHECK(detailIdentity.isValid());
        CHECK(presented.destination.get<kDetail>()->id == 1);
        CHECK(IdentityRegistry::Instance().isLive(detailIdentity));

        store.send(detail(Refresh{}));
        CHECK(store.state().destination.get<kDetail>()->refreshes.peek() == 1);
        CHECK(executor.pending() == 1);
        CHECK(store.inFlightEffects() == 1);

        store.send(detail(Close{}));
        CHECK(store.state().destination.tag() == kNoCase);
        CHECK_FALSE(IdentityRegistry::Instance().isLive(detailIdentity));

        // The refresh started before the close can no longer reach the state.
        CHECK(executor.runAll() == 1);
        CHECK(store.state().destination.tag() == kNoCase);
        CHECK(store.inFlightEffects() == 0);

        store.send(detail(Refresh{}));
        CHECK(store.state().destination.tag() == kNoCase);
        CHECK(executor.pending() == 0);
        CHECK(store.waitUntilIdle(std::chrono::milliseconds(0)));
    }

    TEST_CASE("Presenting again gets a new instance") {
        ManualExecutor executor;
        Store          store{AppState{}, appReducer(), StoreOptions{&executor, "App"}};

        store.send(PresentDetail{1});
        auto const first = store.state().destination.caseIdentity();
        store.send(detail(Refresh{}));

        store.send(PresentDetail{1});
        auto const second = store.state().destination.caseIdentity();
        CHECK(second != first);
        CHECK_FALSE(IdentityRegistry::Instance().isLive(first));

        executor.runAll();
        auto const state = store.state();
        CHECK(state.destination.get<kDetail>()->refreshes.peek() == 0);
        CHECK_FALSE(state.destination.get<kDetail>()->loaded.peek());
    }

    TEST_CASE("Did-set observers of a routed child see the store updated") {
        ManualExecutor executor;
        Store          store{AppState{}, appReducer(), StoreOptions{&executor, "App"}};
        store.send(PresentDetail{1});

        int seen = -1;
        store.observe([](AppState const& state) { return state.destination.get<kDetail>()->refreshes.get(*state.destination.get<kDetail>()); },
                      [&](ObservationEvent const&) { seen = store.state().destination.get<kDetail>()->refreshes.peek(); },
                      ObservationPhase::DidSet);

        store.send(detail(Refresh{}));
        CHECK(seen == 1);
    }
}
