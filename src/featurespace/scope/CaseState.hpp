#pragma once
#include "identity/IdentityRegistry.hpp"
#include "log/TaggedLogger.hpp"
#include "observation/ObservableState.hpp"
#include "observation/TrackedField.hpp"

#include <concepts>
#include <cstddef>
#include <utility>
#include <variant>

namespace FS {

using CaseTag = std::size_t;

// Tag of the empty case every composite starts in.
inline constexpr CaseTag kNoCase = 0;

struct CaseTransition {
    Identity retired;   // previous case instance, invalid if none was replaced
    Identity activated; // current case instance
    CaseTag  from = kNoCase;
    CaseTag  to   = kNoCase;

    [[nodiscard]] auto replaced() const -> bool { return this->retired.isValid(); }
};

template <CaseTag Tag, typename... Payloads>
class CaseScope;

/**
 * Enum-shaped state with exactly one live case.
 *
 * Case 0 is the empty case; cases 1..N hold the given payloads. The active
 * case and its instance identity live in a single tracked field ("case"), so
 * observers reading the tag are notified when the case switches.
 *
 * The instance identity is the payload's own identity when the payload is
 * observable, otherwise one allocated when the case is activated. Every
 * activation of a different instance attaches the new identity and retires
 * the old one in the IdentityRegistry.
 */
template <typename... Payloads>
class CaseState : public ObservableState {
public:
    using Storage = std::variant<std::monostate, Payloads...>;

    static constexpr std::size_t kCaseCount = sizeof...(Payloads) + 1;

    template <CaseTag Tag>
    using Payload = std::variant_alternative_t<Tag, Storage>;

    struct Active {
        Storage  storage;
        Identity identity;
    };

    CaseState() = default;
    explicit CaseState(ObservationRegistrar& registrar)
        : ObservableState(registrar) {}

    // Tracked.
    [[nodiscard]] auto tag() const -> CaseTag { return this->active_.get(*this).storage.index(); }
    [[nodiscard]] auto caseIdentity() const -> Identity { return this->active_.get(*this).identity; }

    // Untracked, for the engine.
    [[nodiscard]] auto activeTag() const -> CaseTag { return this->active_.peek().storage.index(); }
    [[nodiscard]] auto activeIdentity() const -> Identity { return this->active_.peek().identity; }

    template <CaseTag Tag>
    [[nodiscard]] auto is() const -> bool {
        return this->tag() == Tag;
    }

    // Tracked read of a payload; nullptr unless case Tag is active.
    template <CaseTag Tag>
    [[nodiscard]] auto get() const -> Payload<Tag> const* {
        static_assert(Tag != kNoCase && Tag < kCaseCount, "case tag out of range");
        return std::get_if<Tag>(&this->active_.get(*this).storage);
    }

    template <CaseTag Tag>
    auto activate(Payload<Tag> payload) -> CaseTransition {
        static_assert(Tag != kNoCase && Tag < kCaseCount, "case tag out of range");

        auto const& current = this->active_.peek();
        if constexpr (Observable<Payload<Tag>>) {
            // A copy of the outgoing case moved to another tag is a new instance.
            if (current.storage.index() != Tag && current.identity.isValid() && payload.identity() == current.identity)
                payload.reidentify();
        }
        auto const     observed = identityOf(payload);
        auto const     instance = observed ? *observed : IdentityRegistry::Instance().allocate();
        CaseTransition transition{Identity{}, instance, current.storage.index(), Tag};
        bool const     sameInstance = current.storage.index() == Tag && current.identity == instance;
        if (!sameInstance)
            transition.retired = current.identity;

        this->active_.set(*this, Active{Storage{std::in_place_index<Tag>, std::move(payload)}, instance});

        if (!sameInstance) {
            IdentityRegistry::Instance().attach(instance);
            this->retire(transition.retired);
            fs_log("CaseState " + toString(this->identity()) + " case " + std::to_string(transition.from) + " -> " + std::to_string(Tag) + " instance " +
                       toString(instance),
                   "CaseScope");
        }
        return transition;
    }

    // Back to the empty case. Returns the retired case instance, if any.
    auto reset() -> Identity {
        auto const retired = this->active_.peek().identity;
        if (this->active_.peek().storage.index() == kNoCase)
            return Identity{};
        this->active_.set(*this, Active{});
        this->retire(retired);
        fs_log("CaseState " + toString(this->identity()) + " reset, retired " + toString(retired), "CaseScope");
        return retired;
    }

    friend auto operator==(CaseState const& lhs, CaseState const& rhs) -> bool
        requires(std::equality_comparable<Payloads> && ...)
    {
        return lhs.active_.peek().storage == rhs.active_.peek().storage;
    }

private:
    template <CaseTag, typename...>
    friend class CaseScope;

    auto retire(Identity identity) -> void {
        if (!identity.isValid())
            return;
        IdentityRegistry::Instance().retire(identity);
        this->registrar().forget(identity);
    }

    // Writes an updated payload back into case Tag, provided that case is
    // still active with instance `expected`.
    template <CaseTag Tag>
    auto writeBack(Identity expected, Payload<Tag> payload) -> bool {
        auto const& current = this->active_.peek();
        if (current.storage.index() != Tag || current.identity != expected) {
            fs_log("CaseState " + toString(this->identity()) + " discarded stale write to case " + std::to_string(Tag) + " instance " + toString(expected),
                   "CaseScope");
            return false;
        }
        auto const payloadIdentity = identityOf(payload);
        if (payloadIdentity && *payloadIdentity != expected) {
            this->template activate<Tag>(std::move(payload));
            return true;
        }
        Active next{Storage{std::in_place_index<Tag>, std::move(payload)}, expected};
        if (payloadIdentity)
            this->active_.setQuietly(std::move(next));
        else
            this->active_.set(*this, std::move(next));
        return true;
    }

    // Runs `fn` on the stored payload of case Tag, provided that case is still
    // active with instance `expected`. An observable payload reports its own
    // field writes, so only a change of instance notifies "case"; plain
    // payloads notify "case" around the mutation.
    template <CaseTag Tag, typename Fn>
    auto modifyInPlace(Identity expected, Fn&& fn) -> bool {
        auto const& current = this->active_.peek();
        if (current.storage.index() != Tag || current.identity != expected) {
            fs_log("CaseState " + toString(this->identity()) + " discarded stale modification of case " + std::to_string(Tag) + " instance " +
                       toString(expected),
                   "CaseScope");
            return false;
        }
        if constexpr (Observable<Payload<Tag>>) {
            Identity next;
            this->active_.modifyQuietly([&](Active& active) {
                auto& payload = std::get<Tag>(active.storage);
                std::forward<Fn>(fn)(payload);
                next = payload.identity();
            });
            if (next != expected) {
                this->active_.modify(*this, [&](Active& active) { active.identity = next; });
                IdentityRegistry::Instance().attach(next);
                this->retire(expected);
                fs_log("CaseState " + toString(this->identity()) + " case " + std::to_string(Tag) + " replaced " + toString(expected) + " with " + toString(next),
                       "CaseScope");
            }
        } else {
            this->active_.modify(*this, [&](Active& active) { std::forward<Fn>(fn)(std::get<Tag>(active.storage)); });
        }
        return true;
    }

    TrackedField<Active> active_{"case"};
};

} // namespace FS
