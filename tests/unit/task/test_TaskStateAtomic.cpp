#include "task/TaskStateAtomic.hpp"

#include <doctest/doctest.h>

using namespace FS;

TEST_SUITE("task.taskstate.atomic") {
    TEST_CASE("TaskStateAtomic transitions cover all branches") {
        TaskStateAtomic state;
        CHECK_FALSE(state.hasStarted());
        CHECK_FALSE(state.isTerminal());
        CHECK(state.toString() == "NotStarted");

        CHECK(state.tryStart());
        CHECK_FALSE(state.tryStart());
        CHECK(state.hasStarted());
        CHECK(state.toString() == "Starting");

        CHECK(state.transitionToRunning());
        CHECK_FALSE(state.transitionToRunning());
        CHECK(state.isRunning());
        CHECK_FALSE(state.isCompleted());

        CHECK(state.markCompleted());
        CHECK(state.isCompleted());
        CHECK(state.isTerminal());
        CHECK_FALSE(state.markCompleted());
        CHECK(state.toString() == "Completed");

        CHECK_FALSE(state.markFailed());
        CHECK(state.get() == TaskState::Completed);
    }

    TEST_CASE("TaskStateAtomic markFailed before completion") {
        TaskStateAtomic state;
        CHECK(state.markFailed());
        CHECK(state.isFailed());
        CHECK(state.isTerminal());
        CHECK(state.toString() == "Failed");
        CHECK_FALSE(state.markFailed());
        CHECK_FALSE(state.markCompleted());
    }

    TEST_CASE("TaskStateAtomic copy and assignment snapshot current state") {
        TaskStateAtomic original;
        CHECK(original.tryStart());
        CHECK(original.transitionToRunning());

        TaskStateAtomic copied{original};
        CHECK(copied.isRunning());

        TaskStateAtomic assigned;
        assigned = original;
        CHECK(assigned.isRunning());

        CHECK(original.markCompleted());
        CHECK(copied.isRunning());
    }

    TEST_CASE("taskStateToString names every state") {
        static_assert(taskStateToString(TaskState::Running) == "Running");
        CHECK(taskStateToString(TaskState::NotStarted) == "NotStarted");
        CHECK(taskStateToString(TaskState::Starting) == "Starting");
        CHECK(taskStateToString(TaskState::Completed) == "Completed");
        CHECK(taskStateToString(TaskState::Failed) == "Failed");
    }
}
