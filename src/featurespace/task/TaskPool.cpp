#include "task/TaskPool.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>
#include <system_error>

namespace FS {

TaskPool& TaskPool::Instance() {
    // Leaked so effects finishing during static destruction still have a pool.
    static TaskPool* instance = new TaskPool();
    return *instance;
}

TaskPool::TaskPool(size_t threadCount) {
    if (threadCount == 0)
        threadCount = 1;
    for (size_t i = 0; i < threadCount; ++i) {
        try {
            this->workers.emplace_back(&TaskPool::workerFunction, this);
            ++this->activeWorkers;
        } catch (std::system_error const& error) {
            fs_log(std::string("TaskPool failed to spawn worker: ") + error.what(), "TaskPool", "Error");
            break;
        }
    }
    fs_log("TaskPool constructed with workers=" + std::to_string(this->activeWorkers.load()), "TaskPool");
}

TaskPool::~TaskPool() {
    this->shutdown();
}

auto TaskPool::submit(std::weak_ptr<Task>&& task) -> std::optional<Error> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->shuttingDown) {
        fs_log("TaskPool::submit refused: shutting down", "TaskPool");
        return Error{Error::Code::ExecutorShuttingDown, "Executor shutting down"};
    }
    auto locked = task.lock();
    if (!locked) {
        fs_log("TaskPool::submit task expired before enqueue", "TaskPool");
        return Error{Error::Code::TaskExpired, "Task expired before enqueue"};
    }
    if (!locked->tryStart()) {
        // Submitting a task twice is harmless; it only runs once.
        if (locked->hasStarted())
            return std::nullopt;
        return Error{Error::Code::TaskStartFailed, "Task could not be started"};
    }
    this->tasks.push(std::move(task));
    this->taskCV.notify_one();
    return std::nullopt;
}

auto TaskPool::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (!this->shuttingDown) {
            fs_log("TaskPool::shutdown begin", "TaskPool");
            this->shuttingDown = true;
            this->taskCV.notify_all();
        }
    }

    for (auto& worker : this->workers) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id())
            worker.join();
    }
    this->activeWorkers = 0;

    std::lock_guard<std::mutex> lock(this->mutex);
    while (!this->tasks.empty())
        this->tasks.pop();
}

auto TaskPool::size() const -> size_t {
    return this->workers.size();
}

auto TaskPool::workerFunction() -> void {
    while (true) {
        std::weak_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(this->mutex);
            this->taskCV.wait(lock, [this] { return this->shuttingDown || !this->tasks.empty(); });
            if (this->shuttingDown && this->tasks.empty())
                break;
            task = std::move(this->tasks.front());
            this->tasks.pop();
        }

        auto strongTask = task.lock();
        if (!strongTask) {
            fs_log("TaskPool worker: task released before it ran", "TaskPool");
            continue;
        }

        ++this->activeTasks;
        try {
            strongTask->execute();
        } catch (std::exception const& error) {
            strongTask->markFailed();
            fs_log("Task '" + strongTask->label() + "' failed: " + error.what(), "TaskPool", "Error");
        } catch (...) {
            strongTask->markFailed();
            fs_log("Task '" + strongTask->label() + "' failed with a non-standard exception", "TaskPool", "Error");
        }
        --this->activeTasks;
    }
    --this->activeWorkers;
}

} // namespace FS
