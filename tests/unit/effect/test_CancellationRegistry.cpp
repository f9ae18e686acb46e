#include "effect/CancellationRegistry.hpp"

#include <doctest/doctest.h>

#include <memory>

using namespace FS;

TEST_SUITE("effect.cancellation_registry") {
    TEST_CASE("Cancel by id") {
        CancellationRegistry registry;
        auto                 first  = std::make_shared<CancellationToken>();
        auto                 second = std::make_shared<CancellationToken>();
        auto                 other  = std::make_shared<CancellationToken>();
        auto const           id     = CancellationId::named("refresh");

        registry.add(id, first);
        registry.add(id, second);
        registry.add(CancellationId::named("other"), other);
        CHECK(registry.activeCount(id) == 2);

        CHECK(registry.cancel(id) == 2);
        CHECK(first->isCancelled());
        CHECK(second->isCancelled());
        CHECK_FALSE(other->isCancelled());
        CHECK(registry.activeCount(id) == 0);
        CHECK(registry.cancel(id) == 0);
    }

    TEST_CASE("Cancel by scope") {
        CancellationRegistry registry;
        auto                 poll    = std::make_shared<CancellationToken>();
        auto                 load    = std::make_shared<CancellationToken>();
        auto                 sibling = std::make_shared<CancellationToken>();

        registry.add(CancellationId::forIdentity(Identity{7}, "poll"), poll);
        registry.add(CancellationId::forIdentity(Identity{7}), load);
        registry.add(CancellationId::forIdentity(Identity{8}), sibling);

        CHECK(registry.cancelScope(Identity{7}) == 2);
        CHECK(poll->isCancelled());
        CHECK(load->isCancelled());
        CHECK_FALSE(sibling->isCancelled());
        CHECK(registry.cancelScope(Identity{7}) == 0);
    }

    TEST_CASE("Finished effects are forgotten") {
        CancellationRegistry registry;
        auto                 token = std::make_shared<CancellationToken>();
        auto const           id    = CancellationId::named("once");

        registry.add(id, token);
        registry.remove(id, token.get());
        CHECK(registry.empty());
        CHECK(registry.cancel(id) == 0);
        CHECK_FALSE(token->isCancelled());
    }

    TEST_CASE("Released tokens are skipped") {
        CancellationRegistry registry;
        auto const           id = CancellationId::named("gone");
        {
            auto token = std::make_shared<CancellationToken>();
            registry.add(id, token);
        }
        CHECK(registry.activeCount(id) == 0);
        CHECK(registry.cancel(id) == 0);
    }

    TEST_CASE("cancelAll") {
        CancellationRegistry registry;
        auto                 a = std::make_shared<CancellationToken>();
        auto                 b = std::make_shared<CancellationToken>();
        registry.add(CancellationId::named("a"), a);
        registry.add(CancellationId::forIdentity(Identity{4}), b);
        CHECK(registry.cancelAll() == 2);
        CHECK(a->isCancelled());
        CHECK(b->isCancelled());
        CHECK(registry.empty());
    }
}
