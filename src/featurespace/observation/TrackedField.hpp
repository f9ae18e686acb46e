#pragma once
#include "observation/ObservableState.hpp"

#include <concepts>
#include <type_traits>
#include <utility>

namespace FS {

enum class FieldTracking {
    Tracked,
    Untracked // plain storage: reads never subscribe, writes never notify
};

/**
 * One stored property of an ObservableState.
 *
 * Reads go through get(owner), which registers the read with the owner's
 * registrar. Writes go through set/modify, which bracket the store with
 * willModify/didModify. There is no equality short-circuit; every set
 * notifies.
 */
template <typename V>
class TrackedField {
public:
    using Value = V;

    explicit TrackedField(FieldKey key, V value = V{}, FieldTracking tracking = FieldTracking::Tracked)
        : key_(std::move(key)), value_(std::move(value)), tracking_(tracking) {}

    auto get(ObservableState const& owner) const -> V const& {
        if (this->tracking_ == FieldTracking::Tracked)
            owner.registrar().access(owner.identity(), this->key_);
        return this->value_;
    }

    auto set(ObservableState const& owner, V value) -> void {
        if (this->tracking_ == FieldTracking::Untracked) {
            this->value_ = std::move(value);
            return;
        }
        auto& registrar = owner.registrar();
        registrar.willModify(owner.identity(), this->key_);
        this->value_ = std::move(value);
        registrar.didModify(owner.identity(), this->key_);
    }

    template <typename Fn>
    auto modify(ObservableState const& owner, Fn&& fn) -> auto {
        if (this->tracking_ == FieldTracking::Untracked)
            return std::forward<Fn>(fn)(this->value_);
        auto& registrar = owner.registrar();
        registrar.willModify(owner.identity(), this->key_);
        if constexpr (std::is_void_v<std::invoke_result_t<Fn, V&>>) {
            std::forward<Fn>(fn)(this->value_);
            registrar.didModify(owner.identity(), this->key_);
        } else {
            auto result = std::forward<Fn>(fn)(this->value_);
            registrar.didModify(owner.identity(), this->key_);
            return result;
        }
    }

    // Untracked read.
    [[nodiscard]] auto peek() const -> V const& { return this->value_; }

    // Store without notifying. Only for write-backs whose change was already
    // reported by the nested value's own fields.
    auto setQuietly(V value) -> void { this->value_ = std::move(value); }

    template <typename Fn>
    auto modifyQuietly(Fn&& fn) -> auto {
        return std::forward<Fn>(fn)(this->value_);
    }

    [[nodiscard]] auto key() const -> FieldKey const& { return this->key_; }
    [[nodiscard]] auto tracking() const -> FieldTracking { return this->tracking_; }

    friend auto operator==(TrackedField const& lhs, TrackedField const& rhs) -> bool
        requires std::equality_comparable<V>
    {
        return lhs.value_ == rhs.value_;
    }

private:
    FieldKey      key_;
    V             value_;
    FieldTracking tracking_;
};

} // namespace FS
