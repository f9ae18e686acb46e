#pragma once
#include "task/TaskState.hpp"

#include <atomic>
#include <string_view>

namespace FS {

// Lock-free task lifecycle: NotStarted -> Starting -> Running -> Completed,
// with Failed reachable from any non-completed state.
struct TaskStateAtomic {
    TaskStateAtomic() = default;
    TaskStateAtomic(const TaskStateAtomic& other);            // snapshot
    TaskStateAtomic& operator=(const TaskStateAtomic& other); // snapshot

    TaskStateAtomic(TaskStateAtomic&& other)            = delete;
    TaskStateAtomic& operator=(TaskStateAtomic&& other) = delete;

    bool tryStart();            // NotStarted -> Starting
    bool transitionToRunning(); // Starting -> Running
    bool markCompleted();       // Running -> Completed
    bool markFailed();          // anything but Completed -> Failed
    bool isTerminal() const;
    bool hasStarted() const;
    bool isCompleted() const;
    bool isFailed() const;
    bool isRunning() const;

    TaskState        get() const;
    std::string_view toString() const;

private:
    std::atomic<TaskState> state{TaskState::NotStarted};
};

} // namespace FS
