#pragma once
#include "scope/CaseState.hpp"

#include <optional>
#include <utility>

namespace FS {

/**
 * A handle on one case instance of a CaseState.
 *
 * Captures the instance identity when created. Reads and writes go through
 * the composite and succeed only while that same instance is still active;
 * after a switch or reset the scope is stale and every write is discarded.
 */
template <CaseTag Tag, typename... Payloads>
class CaseScope {
public:
    using Composite = CaseState<Payloads...>;
    using Payload   = typename Composite::template Payload<Tag>;

    static constexpr CaseTag kTag = Tag;

    CaseScope(Composite& composite, Identity identity)
        : composite_(&composite), identity_(identity) {}

    [[nodiscard]] auto identity() const -> Identity { return this->identity_; }

    [[nodiscard]] auto isActive() const -> bool {
        return this->composite_->activeTag() == Tag && this->composite_->activeIdentity() == this->identity_;
    }

    // Tracked read of the live payload; nullptr once stale.
    [[nodiscard]] auto payload() const -> Payload const* {
        if (!this->isActive())
            return nullptr;
        return this->composite_->template get<Tag>();
    }

    auto writeBack(Payload payload) -> bool {
        return this->composite_->template writeBack<Tag>(this->identity_, std::move(payload));
    }

    // Applies `fn` to the stored payload in place, so did-set observers of
    // its fields see the composite already updated.
    template <typename Fn>
    auto modify(Fn&& fn) -> bool {
        return this->composite_->template modifyInPlace<Tag>(this->identity_, std::forward<Fn>(fn));
    }

private:
    Composite* composite_;
    Identity   identity_;
};

// Engaged only while case Tag is the active case of `composite`.
template <CaseTag Tag, typename... Payloads>
auto scope(CaseState<Payloads...>& composite) -> std::optional<CaseScope<Tag, Payloads...>> {
    static_assert(Tag != kNoCase && Tag < CaseState<Payloads...>::kCaseCount, "case tag out of range");
    if (composite.activeTag() != Tag)
        return std::nullopt;
    return CaseScope<Tag, Payloads...>{composite, composite.activeIdentity()};
}

} // namespace FS
