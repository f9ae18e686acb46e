#pragma once
#include "identity/IdentityRegistry.hpp"
#include "log/TaggedLogger.hpp"
#include "observation/ObservableState.hpp"
#include "observation/TrackedField.hpp"

#include <parallel_hashmap/phmap.h>

#include <concepts>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace FS {

template <typename T>
concept HasElementId = requires(T const& value) {
    { value.id };
    requires std::equality_comparable<std::remove_cvref_t<decltype(value.id)>>;
};

template <HasElementId T>
using ElementIdOf = std::remove_cvref_t<decltype(std::declval<T const&>().id)>;

/**
 * Ordered elements addressed by their `id` member.
 *
 * The element list is one tracked field ("elements"). Observable elements
 * are attached to the IdentityRegistry while they are in the array and
 * retired when removed.
 */
template <HasElementId T>
class IdentifiedArray : public ObservableState {
public:
    using Id = ElementIdOf<T>;

    IdentifiedArray() = default;
    explicit IdentifiedArray(ObservationRegistrar& registrar)
        : ObservableState(registrar) {}

    [[nodiscard]] auto size() const -> std::size_t { return this->elements_.get(*this).size(); }
    [[nodiscard]] auto empty() const -> bool { return this->elements_.get(*this).empty(); }
    [[nodiscard]] auto elements() const -> std::vector<T> const& { return this->elements_.get(*this); }

    [[nodiscard]] auto contains(Id const& id) const -> bool {
        this->elements_.get(*this);
        return this->index_.contains(id);
    }

    [[nodiscard]] auto find(Id const& id) const -> T const* {
        auto const& elements = this->elements_.get(*this);
        auto        it       = this->index_.find(id);
        return it == this->index_.end() ? nullptr : &elements[it->second];
    }

    // Untracked lookup.
    [[nodiscard]] auto peek(Id const& id) const -> T const* {
        auto it = this->index_.find(id);
        return it == this->index_.end() ? nullptr : &this->elements_.peek()[it->second];
    }

    [[nodiscard]] auto ids() const -> std::vector<Id> {
        std::vector<Id> result;
        for (auto const& element : this->elements_.get(*this))
            result.push_back(element.id);
        return result;
    }

    // Identities of the observable elements currently held, untracked.
    [[nodiscard]] auto elementIdentities() const -> std::vector<Identity> {
        std::vector<Identity> result;
        for (auto const& element : this->elements_.peek()) {
            if (auto identity = identityOf(element))
                result.push_back(*identity);
        }
        return result;
    }

    // False if an element with the same id is already present.
    auto append(T value) -> bool {
        if (this->index_.contains(value.id))
            return false;
        auto const identity = identityOf(value);
        this->index_.emplace(value.id, this->elements_.peek().size());
        this->elements_.modify(*this, [&](std::vector<T>& elements) { elements.push_back(std::move(value)); });
        if (identity)
            IdentityRegistry::Instance().attach(*identity);
        return true;
    }

    auto remove(Id const& id) -> std::optional<T> {
        auto it = this->index_.find(id);
        if (it == this->index_.end())
            return std::nullopt;
        auto const position = it->second;
        std::optional<T> removed;
        this->elements_.modify(*this, [&](std::vector<T>& elements) {
            removed.emplace(std::move(elements[position]));
            elements.erase(elements.begin() + static_cast<std::ptrdiff_t>(position));
        });
        this->rebuildIndex();
        if (auto identity = identityOf(*removed)) {
            IdentityRegistry::Instance().retire(*identity);
            this->registrar().forget(*identity);
        }
        return removed;
    }

    // Replaces the element with the same id. An observable element that is
    // still the same instance is stored quietly; its own fields notified.
    auto update(T value) -> bool {
        auto it = this->index_.find(value.id);
        if (it == this->index_.end())
            return false;
        auto const position = it->second;
        auto const previous = identityOf(this->elements_.peek()[position]);
        auto const next     = identityOf(value);
        if (previous && next && *previous == *next) {
            this->elements_.modifyQuietly([&](std::vector<T>& elements) { elements[position] = std::move(value); });
            return true;
        }
        this->elements_.modify(*this, [&](std::vector<T>& elements) { elements[position] = std::move(value); });
        if (previous && next) {
            IdentityRegistry::Instance().attach(*next);
            IdentityRegistry::Instance().retire(*previous);
        }
        return true;
    }

    // Runs `fn` on the stored element with `id`. An observable element that
    // stays the same instance reports its own field writes; a replaced
    // instance or a plain element notifies "elements". Ids are fixed while an
    // element is held, so an id changed by `fn` is put back.
    template <typename Fn>
    auto modify(Id const& id, Fn&& fn) -> bool {
        auto it = this->index_.find(id);
        if (it == this->index_.end())
            return false;
        auto const position = it->second;
        auto const apply    = [&](std::vector<T>& elements) {
            auto& element = elements[position];
            std::forward<Fn>(fn)(element);
            if (!(element.id == id)) {
                fs_log("IdentifiedArray " + toString(this->identity()) + " kept the id of an element modified in place", "Routing");
                element.id = id;
            }
        };
        if constexpr (Observable<T>) {
            auto const previous = this->elements_.peek()[position].identity();
            this->elements_.modifyQuietly(apply);
            auto const next = this->elements_.peek()[position].identity();
            if (next != previous) {
                this->elements_.modify(*this, [](std::vector<T>&) {});
                IdentityRegistry::Instance().attach(next);
                IdentityRegistry::Instance().retire(previous);
                this->registrar().forget(previous);
            }
        } else {
            this->elements_.modify(*this, apply);
        }
        return true;
    }

    auto clear() -> std::size_t {
        auto const retired = this->elementIdentities();
        auto const count   = this->elements_.peek().size();
        this->elements_.set(*this, {});
        this->index_.clear();
        for (auto identity : retired) {
            IdentityRegistry::Instance().retire(identity);
            this->registrar().forget(identity);
        }
        return count;
    }

    friend auto operator==(IdentifiedArray const& lhs, IdentifiedArray const& rhs) -> bool
        requires std::equality_comparable<T>
    {
        return lhs.elements_.peek() == rhs.elements_.peek();
    }

private:
    auto rebuildIndex() -> void {
        this->index_.clear();
        auto const& elements = this->elements_.peek();
        for (std::size_t i = 0; i < elements.size(); ++i)
            this->index_.emplace(elements[i].id, i);
    }

    TrackedField<std::vector<T>>          elements_{"elements"};
    phmap::flat_hash_map<Id, std::size_t> index_;
};

} // namespace FS
