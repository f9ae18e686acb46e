#pragma once
#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

namespace FS {

// Writable projection from a parent state to one of its children.
template <typename Root, typename Value>
using StatePath = std::function<Value&(Root&)>;

template <typename Root, typename Value>
auto statePath(Value Root::*member) -> StatePath<Root, Value> {
    return [member](Root& root) -> Value& { return root.*member; };
}

// Partial projection between a parent action and one of its cases.
// `extract` yields nullptr when the action is some other case.
template <typename Root, typename Value>
struct CasePath {
    std::function<Value const*(Root const&)> extract;
    std::function<Root(Value)>               embed;
};

namespace detail {
template <typename T, typename Variant>
struct IsVariantAlternative : std::false_type {};
template <typename T, typename... Ts>
struct IsVariantAlternative<T, std::variant<Ts...>> : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};
} // namespace detail

// Case path for an action modelled as a std::variant.
template <typename Root, typename Value>
    requires detail::IsVariantAlternative<Value, Root>::value
auto casePath() -> CasePath<Root, Value> {
    return CasePath<Root, Value>{
        [](Root const& root) -> Value const* { return std::get_if<Value>(&root); },
        [](Value value) -> Root { return Root{std::in_place_type<Value>, std::move(value)}; }};
}

} // namespace FS
