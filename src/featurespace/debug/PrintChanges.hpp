#pragma once
#include "core/Conformance.hpp"
#include "log/TaggedLogger.hpp"
#include "reducer/Reducer.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <variant>

namespace FS {

using ChangePrinter = std::function<void(std::string const&)>;

// Writes change reports through fs_log with the PrintChanges tag.
inline auto loggerChangePrinter() -> ChangePrinter {
    return [](std::string const& report) {
        (void)report;
        fs_log(report, "PrintChanges");
    };
}

namespace detail {
template <typename T>
struct IsVariant : std::false_type {};
template <typename... Ts>
struct IsVariant<std::variant<Ts...>> : std::true_type {};

template <typename T>
auto describeAction(T const& action) -> std::string {
    if constexpr (Encodable<T>) {
        return nlohmann::json(action).dump();
    } else if constexpr (IsVariant<T>::value) {
        return "case " + std::to_string(action.index());
    } else {
        return "(opaque action)";
    }
}
} // namespace detail

/**
 * Wraps a reducer and reports every action together with the change it made.
 *
 * Encodable states are reported as a JSON patch between the states before and
 * after the transition. States that are only Equatable are reported as changed
 * or unchanged. For any other state only the action is reported.
 */
template <typename State, typename Action>
auto printChanges(Reducer<State, Action> reducer, ChangePrinter sink = loggerChangePrinter()) -> Reducer<State, Action> {
    return [reducer = std::move(reducer), sink = std::move(sink)](State& state, Action const& action) -> Effect<Action> {
        std::string report = "received action: " + detail::describeAction(action);
        auto        effect = Effect<Action>::none();
        if constexpr (Encodable<State>) {
            nlohmann::json const before = state;
            effect                      = reducer.reduce(state, action);
            auto const patch            = nlohmann::json::diff(before, nlohmann::json(state));
            report += patch.empty() ? "\n  (no state changes)" : "\n  state patch: " + patch.dump();
        } else if constexpr (Equatable<State>) {
            State const before = state;
            effect             = reducer.reduce(state, action);
            report += before == state ? "\n  (no state changes)" : "\n  state changed";
        } else {
            effect = reducer.reduce(state, action);
        }
        if (sink)
            sink(report);
        return effect;
    };
}

} // namespace FS
