#include "task/TaskPool.hpp"

#include "unit/FeatureSpaceTestHelper.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace FS;
using namespace std::chrono_literals;
using FS::testing::waitUntil;

TEST_SUITE("task.pool") {
    TEST_CASE("TaskPool Misc") {
        SUBCASE("Basic task execution") {
            TaskPool         pool(2);
            std::atomic<int> counter{0};

            auto task = Task::Create([&counter](Task&) { counter++; }, "basic");
            CHECK_FALSE(pool.submit(task).has_value());
            REQUIRE(waitUntil([&] { return task->isCompleted(); }));
            CHECK(counter == 1);
            CHECK(task->label() == "basic");
        }

        SUBCASE("Multiple tasks execution") {
            TaskPool         pool(4);
            std::atomic<int> counter{0};
            const int        NUM_TASKS = 100;

            std::vector<std::shared_ptr<Task>> tasks;
            tasks.reserve(NUM_TASKS);
            for (int i = 0; i < NUM_TASKS; ++i) {
                tasks.push_back(Task::Create([&counter](Task&) { counter++; }));
                CHECK_FALSE(pool.submit(tasks.back()).has_value());
            }

            REQUIRE(waitUntil([&] { return counter.load() == NUM_TASKS; }));
            CHECK(pool.size() == 4);
        }

        SUBCASE("Submitting a task twice runs it once") {
            TaskPool         pool(2);
            std::atomic<int> counter{0};
            auto             task = Task::Create([&counter](Task&) { counter++; });
            CHECK_FALSE(pool.submit(task).has_value());
            CHECK_FALSE(pool.submit(task).has_value());
            REQUIRE(waitUntil([&] { return task->isCompleted(); }));
            std::this_thread::sleep_for(10ms);
            CHECK(counter == 1);
        }
    }

    TEST_CASE("TaskPool shutdown") {
        SUBCASE("Clean shutdown with no tasks") {
            TaskPool pool(2);
            pool.shutdown();
            CHECK(pool.size() == 2);
        }

        SUBCASE("Double shutdown safety") {
            TaskPool pool(2);
            pool.shutdown();
            pool.shutdown();
        }

        SUBCASE("Submission after shutdown is refused") {
            TaskPool pool(1);
            pool.shutdown();
            auto task  = Task::Create([](Task&) {});
            auto error = pool.submit(task);
            REQUIRE(error.has_value());
            CHECK(error->code == Error::Code::ExecutorShuttingDown);
            CHECK_FALSE(task->hasStarted());
        }

        SUBCASE("Pending tasks may be dropped but never run twice") {
            TaskPool                           pool(2);
            std::atomic<int>                   counter{0};
            std::vector<std::shared_ptr<Task>> tasks;
            for (int i = 0; i < 10; ++i) {
                tasks.push_back(Task::Create([&counter](Task&) {
                    std::this_thread::sleep_for(5ms);
                    counter++;
                }));
                CHECK_FALSE(pool.submit(tasks.back()).has_value());
            }
            pool.shutdown();
            CHECK(counter <= 10);
        }
    }

    TEST_CASE("TaskPool task lifetime") {
        SUBCASE("Expired tasks are refused") {
            TaskPool            pool(1);
            std::weak_ptr<Task> weak;
            {
                auto task = Task::Create([](Task&) {});
                weak      = task;
            }
            auto error = pool.submit(std::move(weak));
            REQUIRE(error.has_value());
            CHECK(error->code == Error::Code::TaskExpired);
        }

        SUBCASE("Tasks released before a worker picks them up are skipped") {
            TaskPool                pool(1);
            std::mutex              mutex;
            std::condition_variable cv;
            bool                    release = false;
            std::atomic<bool>       secondRan{false};

            auto blocker = Task::Create([&](Task&) {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait_for(lock, 2s, [&] { return release; });
            });
            CHECK_FALSE(pool.submit(blocker).has_value());
            {
                auto second = Task::Create([&](Task&) { secondRan = true; });
                CHECK_FALSE(pool.submit(second).has_value());
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                release = true;
            }
            cv.notify_all();
            REQUIRE(waitUntil([&] { return blocker->isCompleted(); }));
            std::this_thread::sleep_for(20ms);
            CHECK_FALSE(secondRan);
        }
    }

    TEST_CASE("TaskPool exception handling") {
        TaskPool         pool(1);
        std::atomic<int> after{0};

        auto failing = Task::Create([](Task&) { throw std::runtime_error("effect failed"); }, "failing");
        auto next    = Task::Create([&after](Task&) { after++; });
        CHECK_FALSE(pool.submit(failing).has_value());
        CHECK_FALSE(pool.submit(next).has_value());

        REQUIRE(waitUntil([&] { return failing->isTerminal() && next->isTerminal(); }));
        CHECK(failing->isFailed());
        CHECK(next->isCompleted());
        CHECK(after == 1);
    }

    TEST_CASE("Shared instance is usable") {
        auto&            pool = TaskPool::Instance();
        std::atomic<int> counter{0};
        auto             task = Task::Create([&counter](Task&) { counter++; });
        CHECK(pool.size() >= 1);
        CHECK_FALSE(pool.submit(task).has_value());
        REQUIRE(waitUntil([&] { return task->isCompleted(); }));
        CHECK(counter == 1);
    }
}
