#pragma once
#include "identity/Identity.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace FS {

// Key under which running effects can be cancelled. Effects produced inside a
// composed child are scoped by the identity of the child instance; `name`
// distinguishes several cancellable effects of the same instance.
struct CancellationId {
    Identity    scope;
    std::string name;

    static auto forIdentity(Identity identity, std::string name = {}) -> CancellationId {
        return CancellationId{identity, std::move(name)};
    }

    static auto named(std::string name) -> CancellationId {
        return CancellationId{Identity{}, std::move(name)};
    }

    friend auto operator==(CancellationId const&, CancellationId const&) -> bool = default;
};

struct CancellationIdHash {
    auto operator()(CancellationId const& id) const noexcept -> std::size_t {
        auto const h = IdentityHash{}(id.scope);
        return h ^ (std::hash<std::string>{}(id.name) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

[[nodiscard]] inline auto toString(CancellationId const& id) -> std::string {
    if (!id.scope.isValid())
        return id.name;
    return id.name.empty() ? toString(id.scope) : toString(id.scope) + "/" + id.name;
}

} // namespace FS
