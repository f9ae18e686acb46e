#include "identity/IdentityRegistry.hpp"
#include "observation/ObservableState.hpp"

#include "unit/FeatureSpaceTestHelper.hpp"

#include <doctest/doctest.h>

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace FS;
using FS::testing::Counter;

TEST_SUITE("identity.registry") {
    TEST_CASE("Allocation") {
        auto& registry = IdentityRegistry::Instance();

        SUBCASE("Allocated identities are valid and distinct") {
            auto a = registry.allocate();
            auto b = registry.allocate();
            CHECK(a.isValid());
            CHECK(b.isValid());
            CHECK(a != b);
            CHECK_FALSE(Identity{}.isValid());
        }

        SUBCASE("Concurrent allocation never repeats") {
            constexpr int                      kThreads   = 8;
            constexpr int                      kPerThread = 500;
            std::mutex                         mutex;
            std::set<std::uint64_t>            seen;
            std::vector<std::thread>           threads;
            for (int t = 0; t < kThreads; ++t) {
                threads.emplace_back([&] {
                    std::vector<std::uint64_t> local;
                    for (int i = 0; i < kPerThread; ++i)
                        local.push_back(registry.allocate().value);
                    std::lock_guard<std::mutex> lock(mutex);
                    seen.insert(local.begin(), local.end());
                });
            }
            for (auto& thread : threads)
                thread.join();
            CHECK(seen.size() == static_cast<std::size_t>(kThreads * kPerThread));
        }

        SUBCASE("toString formats identities") {
            CHECK(toString(Identity{42}) == "#42");
            CHECK(toString(Identity{}) == "#invalid");
        }
    }

    TEST_CASE("Live set") {
        auto& registry = IdentityRegistry::Instance();
        auto  id       = registry.allocate();
        auto  before   = registry.liveCount();

        CHECK_FALSE(registry.isLive(id));
        registry.attach(id);
        registry.attach(id);
        CHECK(registry.isLive(id));
        CHECK(registry.liveCount() == before + 1);

        CHECK(registry.retire(id));
        CHECK_FALSE(registry.isLive(id));
        CHECK_FALSE(registry.retire(id));
        CHECK(registry.liveCount() == before);

        registry.attach(Identity{});
        CHECK_FALSE(registry.isLive(Identity{}));
        CHECK_FALSE(registry.retire(Identity{}));
    }

    TEST_CASE("Identity stability of observable state") {
        Counter counter;
        auto const id = counter.identity();
        REQUIRE(id.isValid());

        SUBCASE("In-place mutation keeps the identity") {
            counter.setCount(3);
            counter.setLabel("three");
            CHECK(counter.identity() == id);
        }

        SUBCASE("Copies share the identity, new instances do not") {
            Counter copy = counter;
            copy.setCount(9);
            CHECK(copy.identity() == id);
            CHECK(copy.isIdentityEqual(counter));

            Counter other;
            CHECK(other.identity() != id);

            Counter assigned;
            assigned = copy;
            CHECK(assigned.identity() == id);
        }

        SUBCASE("Equality ignores identity") {
            Counter other;
            CHECK(other == counter);
            other.setCount(1);
            CHECK_FALSE(other == counter);
        }
    }

    TEST_CASE("identityOf") {
        Counter counter;
        CHECK(identityOf(counter) == std::optional<Identity>{counter.identity()});
        CHECK_FALSE(identityOf(5).has_value());
        CHECK_FALSE(identityOf(std::string{"plain"}).has_value());

        std::optional<Counter> present = counter;
        std::optional<Counter> absent;
        CHECK(identityOf(present) == std::optional<Identity>{counter.identity()});
        CHECK_FALSE(identityOf(absent).has_value());
    }
}
