#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <memory>
#include <optional>

namespace FS {

struct Task;

/**
 * Where a Store runs the asynchronous part of its effects.
 *
 * Contract
 * --------
 * - submit(...) returns std::nullopt on success, or an Error when the task
 *   is refused (executor shutting down, task already expired).
 * - The executor holds tasks weakly; the submitter keeps a task alive until
 *   it has run.
 * - shutdown() stops accepting new tasks, wakes workers and lets in-flight
 *   tasks finish.
 *
 * Implementations must accept concurrent submit() calls and a shutdown()
 * racing with running tasks.
 */
struct Executor {
    virtual ~Executor() = default;

    virtual auto submit(std::weak_ptr<Task>&&) -> std::optional<Error> = 0;

    auto submit(std::shared_ptr<Task> const& task) -> std::optional<Error> {
        return submit(std::weak_ptr<Task>(task));
    }

    virtual auto shutdown() -> void = 0;

    // Number of workers.
    virtual auto size() const -> std::size_t = 0;
};

} // namespace FS
