#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "executor/executor_types.hpp"

namespace runbox::runner {

struct TaskFailure {
    std::size_t index = 0;
    std::string message;
};

// Fail-fast group of tasks run on worker threads. The first task that
// throws (other than CancelledError) cancels the shared token; tasks not
// yet started are skipped and running ones are expected to observe the
// token. Every worker is joined before Wait returns or the group dies.
class TaskGroup {
public:
    using Task = std::function<void(const executor::CancellationToken&)>;

    // max_workers == 0 starts one worker per task.
    explicit TaskGroup(std::size_t max_workers = 0);
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    // Tasks are identified by insertion order. Must be called before Wait.
    void Add(Task task);

    // Runs all tasks and blocks until each finished or was skipped.
    // Returns the failures ordered by task index; empty on success.
    std::vector<TaskFailure> Wait();

    // While Wait runs, cancelling parent cancels this group.
    void LinkParent(const executor::CancellationToken* parent) { parent_ = parent; }

    void Cancel() { cancel_.Cancel(); }
    bool Cancelled() const { return cancel_.IsCancelled(); }

private:
    void WorkerLoop();
    void JoinAll() noexcept;
    void WatchParent(const std::atomic<bool>& done);

    std::size_t max_workers_;
    const executor::CancellationToken* parent_ = nullptr;
    std::vector<Task> tasks_;
    std::vector<std::thread> workers_;
    std::atomic<std::size_t> next_{0};
    executor::CancellationToken cancel_;
    std::mutex failures_mutex_;
    std::vector<TaskFailure> failures_;
};

}  // namespace runbox::runner
