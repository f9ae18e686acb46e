#pragma once
#include "task/TaskStateAtomic.hpp"

#include <functional>
#include <memory>
#include <string>

namespace FS {

/**
 * One unit of effect work scheduled on an Executor.
 *
 * Created through Create() and always owned by a shared_ptr. The executor
 * only sees a weak reference, so whoever submits the task decides how long
 * it may stay queued.
 */
struct Task {
    using Function = std::function<void(Task&)>;

    static auto Create(Function function, std::string label = {}) -> std::shared_ptr<Task> {
        auto task      = std::shared_ptr<Task>(new Task{});
        task->function = std::move(function);
        task->label_   = std::move(label);
        return task;
    }

    // Runs the function on the calling thread. The task must have been
    // started by an executor; exceptions from the function propagate.
    auto execute() -> void;

    auto isCompleted() const -> bool;
    auto isFailed() const -> bool;
    auto isTerminal() const -> bool;
    auto hasStarted() const -> bool;
    auto tryStart() -> bool;
    auto transitionToRunning() -> bool;
    auto markCompleted() -> void;
    auto markFailed() -> void;
    auto label() const -> std::string const& { return this->label_; }

private:
    Task()                       = default;
    Task(const Task&)            = delete;
    Task& operator=(const Task&) = delete;
    Task(Task&&)                 = delete;
    Task& operator=(Task&&)      = delete;

    TaskStateAtomic state;
    Function        function;
    std::string     label_;
};

} // namespace FS
