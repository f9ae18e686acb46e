#include "task/TaskStateAtomic.hpp"

namespace FS {

TaskStateAtomic::TaskStateAtomic(const TaskStateAtomic& other)
    : state(other.state.load(std::memory_order_acquire)) {}

TaskStateAtomic& TaskStateAtomic::operator=(const TaskStateAtomic& other) {
    this->state.store(other.state.load(std::memory_order_acquire), std::memory_order_release);
    return *this;
}

bool TaskStateAtomic::tryStart() {
    TaskState expected = TaskState::NotStarted;
    return this->state.compare_exchange_strong(expected, TaskState::Starting, std::memory_order_acq_rel);
}

bool TaskStateAtomic::transitionToRunning() {
    TaskState expected = TaskState::Starting;
    return this->state.compare_exchange_strong(expected, TaskState::Running, std::memory_order_acq_rel);
}

bool TaskStateAtomic::markCompleted() {
    TaskState expected = TaskState::Running;
    return this->state.compare_exchange_strong(expected, TaskState::Completed, std::memory_order_acq_rel);
}

bool TaskStateAtomic::markFailed() {
    TaskState current = this->state.load(std::memory_order_acquire);
    while (current != TaskState::Completed && current != TaskState::Failed) {
        if (this->state.compare_exchange_weak(current, TaskState::Failed, std::memory_order_acq_rel))
            return true;
    }
    return false;
}

TaskState TaskStateAtomic::get() const {
    return this->state.load(std::memory_order_acquire);
}

bool TaskStateAtomic::isTerminal() const {
    auto const current = this->get();
    return current == TaskState::Completed || current == TaskState::Failed;
}

bool TaskStateAtomic::hasStarted() const {
    return this->get() != TaskState::NotStarted;
}

bool TaskStateAtomic::isCompleted() const {
    return this->get() == TaskState::Completed;
}

bool TaskStateAtomic::isFailed() const {
    return this->get() == TaskState::Failed;
}

bool TaskStateAtomic::isRunning() const {
    return this->get() == TaskState::Running;
}

std::string_view TaskStateAtomic::toString() const {
    return taskStateToString(this->get());
}

} // namespace FS
