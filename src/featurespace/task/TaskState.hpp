#pragma once
#include <string_view>

namespace FS {

enum class TaskState {
    NotStarted, // created, not yet handed to an executor
    Starting,   // accepted by an executor, waiting for a worker
    Running,
    Completed,
    Failed // the operation threw
};

constexpr auto taskStateToString(TaskState state) -> std::string_view {
    switch (state) {
        case TaskState::NotStarted:
            return "NotStarted";
        case TaskState::Starting:
            return "Starting";
        case TaskState::Running:
            return "Running";
        case TaskState::Completed:
            return "Completed";
        case TaskState::Failed:
            return "Failed";
    }
    return "Unknown";
}

} // namespace FS
