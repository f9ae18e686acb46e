#pragma once
#include <nlohmann/json.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <type_traits>

namespace FS {

// Capabilities a state or action type can opt into. Checked at compile time
// where a feature is defined.
enum class Conformance : std::uint8_t {
    Equatable = 1 << 0,
    Hashable  = 1 << 1,
    Encodable = 1 << 2,
    Decodable = 1 << 3,
    Sendable  = 1 << 4,
    Codable   = Encodable | Decodable
};

constexpr auto operator|(Conformance lhs, Conformance rhs) -> Conformance {
    return static_cast<Conformance>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

constexpr auto hasConformance(Conformance set, Conformance member) -> bool {
    return (static_cast<std::uint8_t>(set) & static_cast<std::uint8_t>(member)) == static_cast<std::uint8_t>(member);
}

template <typename T>
concept Equatable = std::equality_comparable<T>;

template <typename T>
concept Hashable = Equatable<T> && requires(T const& value) {
    { std::hash<T>{}(value) } -> std::convertible_to<std::size_t>;
};

// A to_json overload is visible for T.
template <typename T>
concept Encodable = requires(nlohmann::json& json, T const& value) { nlohmann::adl_serializer<T>::to_json(json, value); };

// A from_json overload is visible for T.
template <typename T>
concept Decodable = requires(nlohmann::json const& json, T& value) { nlohmann::adl_serializer<T>::from_json(json, value); };

template <typename T>
concept Codable = Encodable<T> && Decodable<T>;

// Safe to hand to another thread by value.
template <typename T>
concept Sendable = std::is_object_v<T> && std::copy_constructible<T> && std::is_nothrow_move_constructible_v<T>;

template <typename T>
constexpr auto conformsTo(Conformance required) -> bool {
    bool ok = true;
    if (hasConformance(required, Conformance::Equatable))
        ok = ok && Equatable<T>;
    if (hasConformance(required, Conformance::Hashable))
        ok = ok && Hashable<T>;
    if (hasConformance(required, Conformance::Encodable))
        ok = ok && Encodable<T>;
    if (hasConformance(required, Conformance::Decodable))
        ok = ok && Decodable<T>;
    if (hasConformance(required, Conformance::Sendable))
        ok = ok && Sendable<T>;
    return ok;
}

template <typename T, Conformance... Required>
constexpr auto requireConformances() -> void {
    static_assert((conformsTo<T>(Required) && ...), "type is missing a required conformance");
}

} // namespace FS
