#include "task/Task.hpp"

namespace FS {

auto Task::execute() -> void {
    this->state.transitionToRunning();
    if (this->function)
        this->function(*this);
    this->state.markCompleted();
}

auto Task::isCompleted() const -> bool {
    return this->state.isCompleted();
}

auto Task::isFailed() const -> bool {
    return this->state.isFailed();
}

auto Task::isTerminal() const -> bool {
    return this->state.isTerminal();
}

auto Task::hasStarted() const -> bool {
    return this->state.hasStarted();
}

auto Task::tryStart() -> bool {
    return this->state.tryStart();
}

auto Task::transitionToRunning() -> bool {
    return this->state.transitionToRunning();
}

auto Task::markCompleted() -> void {
    this->state.markCompleted();
}

auto Task::markFailed() -> void {
    this->state.markFailed();
}

} // namespace FS
