/**
 * @file scheduler.cpp
 * @brief Worker pool with cancellable deferred tasks
 *
 * A single deadline-ordered queue serves both immediate and delayed work.
 * Workers sleep on a condition variable until the earliest deadline or a
 * new submission, whichever comes first.
 *
 * @date 2025
 */

#include "warden/utils/scheduler.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace warden {
namespace utils {

Scheduler::Scheduler(std::size_t worker_count) {
    if (worker_count == 0) {
        worker_count = 1;
    }
    workers_.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this] { WorkerLoop(); });
    }
    spdlog::debug("Scheduler started with {} workers", worker_count);
}

Scheduler::~Scheduler() {
    Shutdown();
}

Scheduler::TaskId Scheduler::Post(Task task) {
    return ScheduleAfter(std::chrono::milliseconds(0), std::move(task));
}

Scheduler::TaskId Scheduler::ScheduleAfter(std::chrono::milliseconds delay, Task task) {
    TaskId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            spdlog::warn("Scheduler is shutting down, task rejected");
            return 0;
        }
        id = next_id_++;
        auto deadline = Clock::now() + delay;
        tasks_.emplace(id, PendingTask{deadline, std::move(task)});
        queue_.emplace(deadline, id);
    }
    cv_.notify_one();
    return id;
}

bool Scheduler::Cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return false;
    }
    queue_.erase({it->second.deadline, id});
    tasks_.erase(it);
    return true;
}

std::size_t Scheduler::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void Scheduler::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
        if (!tasks_.empty()) {
            spdlog::debug("Scheduler discarding {} pending tasks", tasks_.size());
        }
        tasks_.clear();
        queue_.clear();
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void Scheduler::WorkerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_) {
        if (queue_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto next = *queue_.begin();
        if (next.first > Clock::now()) {
            cv_.wait_until(lock, next.first);
            continue;
        }

        queue_.erase(queue_.begin());
        auto node = tasks_.extract(next.second);
        if (node.empty()) {
            continue;
        }
        Task task = std::move(node.mapped().task);

        lock.unlock();
        try {
            task();
        }
        catch (const std::exception& e) {
            spdlog::error("Scheduled task {} failed: {}", next.second, e.what());
        }
        lock.lock();
    }
}

} // namespace utils
} // namespace warden
