#include "runner/task_group.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <system_error>
#include <utility>

#include "utils/logging.hpp"

namespace runbox::runner {
namespace {

constexpr auto kParentPollInterval = std::chrono::milliseconds(50);

}  // namespace

TaskGroup::TaskGroup(std::size_t max_workers)
    : max_workers_(max_workers) {}

TaskGroup::~TaskGroup() {
    cancel_.Cancel();
    JoinAll();
}

void TaskGroup::Add(Task task) {
    tasks_.push_back(std::move(task));
}

std::vector<TaskFailure> TaskGroup::Wait() {
    auto worker_count = tasks_.size();
    if (max_workers_ > 0) {
        worker_count = std::min(worker_count, max_workers_);
    }
    workers_.reserve(worker_count);
    try {
        for (std::size_t i = 0; i < worker_count; ++i) {
            workers_.emplace_back([this] { WorkerLoop(); });
        }
    } catch (const std::system_error& ex) {
        utils::LogError("task_group", "failed to start worker", {{"error", ex.what()}});
        cancel_.Cancel();
        JoinAll();
        throw;
    }
    if (parent_) {
        std::atomic<bool> done{false};
        std::thread watcher([this, &done] { WatchParent(done); });
        JoinAll();
        done.store(true);
        watcher.join();
    } else {
        JoinAll();
    }

    std::lock_guard<std::mutex> lock(failures_mutex_);
    std::sort(failures_.begin(), failures_.end(), [](const TaskFailure& a, const TaskFailure& b) {
        return a.index < b.index;
    });
    return failures_;
}

void TaskGroup::WorkerLoop() {
    while (true) {
        const auto index = next_.fetch_add(1);
        if (index >= tasks_.size() || cancel_.IsCancelled()) {
            return;
        }
        try {
            tasks_[index](cancel_);
        } catch (const executor::CancelledError&) {
            return;
        } catch (const std::exception& ex) {
            {
                std::lock_guard<std::mutex> lock(failures_mutex_);
                failures_.push_back({index, ex.what()});
            }
            cancel_.Cancel();
            return;
        }
    }
}

void TaskGroup::WatchParent(const std::atomic<bool>& done) {
    while (!done.load()) {
        if (parent_->IsCancelled()) {
            cancel_.Cancel();
            return;
        }
        std::this_thread::sleep_for(kParentPollInterval);
    }
}

void TaskGroup::JoinAll() noexcept {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

}  // namespace runbox::runner
