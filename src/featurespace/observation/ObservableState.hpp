#pragma once
#include "identity/Identity.hpp"
#include "identity/IdentityRegistry.hpp"
#include "observation/ObservationRegistrar.hpp"

#include <concepts>
#include <optional>
#include <type_traits>

namespace FS {

/**
 * Base of every state type whose fields are tracked.
 *
 * Construction allocates a fresh Identity and binds the registrar that the
 * type's TrackedFields report to. Copies (construction and assignment) carry
 * both along, so a copy mutated by a reducer and written back is still the
 * same logical instance.
 *
 * Equality is identity-blind: the base always compares equal, which lets a
 * derived type default operator== over its fields alone.
 */
class ObservableState {
public:
    ObservableState()
        : identity_(IdentityRegistry::Instance().allocate()), registrar_(&ObservationRegistrar::Shared()) {}

    explicit ObservableState(ObservationRegistrar& registrar)
        : identity_(IdentityRegistry::Instance().allocate()), registrar_(&registrar) {}

    ObservableState(ObservableState const&)            = default;
    ObservableState& operator=(ObservableState const&) = default;

    [[nodiscard]] auto identity() const -> Identity { return this->identity_; }
    [[nodiscard]] auto registrar() const -> ObservationRegistrar& { return *this->registrar_; }

    // Makes this value a new logical instance. Used when a copy is moved into
    // a slot whose previous instance it would otherwise impersonate.
    auto reidentify() -> Identity {
        this->identity_ = IdentityRegistry::Instance().allocate();
        return this->identity_;
    }

    [[nodiscard]] auto isIdentityEqual(ObservableState const& other) const -> bool {
        return this->identity_ == other.identity_;
    }

    friend auto operator==(ObservableState const&, ObservableState const&) -> bool { return true; }

private:
    Identity              identity_;
    ObservationRegistrar* registrar_;
};

template <typename T>
concept Observable = std::derived_from<std::remove_cvref_t<T>, ObservableState>;

namespace detail {
template <typename T>
struct IsOptional : std::false_type {};
template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {
    using Value = T;
};
} // namespace detail

// Identity of `value`, or nullopt when the type is not tracked (or is an
// empty optional of a tracked type).
template <typename T>
[[nodiscard]] auto identityOf(T const& value) -> std::optional<Identity> {
    if constexpr (Observable<T>) {
        return value.identity();
    } else if constexpr (detail::IsOptional<T>::value) {
        if constexpr (Observable<typename detail::IsOptional<T>::Value>) {
            if (value)
                return value->identity();
        }
        return std::nullopt;
    } else {
        return std::nullopt;
    }
}

} // namespace FS
