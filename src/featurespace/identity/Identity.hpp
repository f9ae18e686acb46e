#pragma once
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace FS {

/**
 * Opaque token naming one logical state instance.
 *
 * Copies of a state carry the same Identity; a freshly created state gets a
 * new one. Comparing identities therefore tells "the same thing, edited"
 * apart from "a different thing in the same slot". Value 0 is never handed
 * out and means "no identity".
 */
struct Identity {
    std::uint64_t value = 0;

    [[nodiscard]] constexpr auto isValid() const noexcept -> bool {
        return this->value != 0;
    }

    friend constexpr auto operator==(Identity, Identity) noexcept -> bool = default;
    friend constexpr auto operator<=>(Identity, Identity) noexcept        = default;
};

struct IdentityHash {
    auto operator()(Identity id) const noexcept -> std::size_t {
        return std::hash<std::uint64_t>{}(id.value);
    }
};

[[nodiscard]] inline auto toString(Identity id) -> std::string {
    return id.isValid() ? "#" + std::to_string(id.value) : std::string{"#invalid"};
}

} // namespace FS

template <>
struct std::hash<FS::Identity> {
    auto operator()(FS::Identity id) const noexcept -> std::size_t {
        return FS::IdentityHash{}(id);
    }
};
