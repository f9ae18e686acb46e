#include "identity/IdentityRegistry.hpp"
#include "log/TaggedLogger.hpp"

namespace FS {

IdentityRegistry& IdentityRegistry::Instance() {
    // Leak-on-exit so identities can still be retired from static destructors.
    static IdentityRegistry* instance = new IdentityRegistry();
    return *instance;
}

IdentityRegistry::IdentityRegistry() = default;

auto IdentityRegistry::allocate() -> Identity {
    return Identity{this->next_.fetch_add(1, std::memory_order_relaxed)};
}

auto IdentityRegistry::attach(Identity id) -> void {
    if (!id.isValid())
        return;
    if (this->live_.insert(id.value).second) {
        fs_log("IdentityRegistry::attach " + toString(id), "Identity");
    }
}

auto IdentityRegistry::retire(Identity id) -> bool {
    if (!id.isValid())
        return false;
    bool const erased = this->live_.erase(id.value) > 0;
    if (erased) {
        fs_log("IdentityRegistry::retire " + toString(id), "Identity");
    }
    return erased;
}

auto IdentityRegistry::isLive(Identity id) const -> bool {
    return id.isValid() && this->live_.contains(id.value);
}

auto IdentityRegistry::liveCount() const -> std::size_t {
    return this->live_.size();
}

} // namespace FS
