/**
 * @file scheduler.hpp
 * @brief Worker pool with cancellable deferred tasks
 *
 * Runs fire-and-forget work (backend launches) and deadline work (timeout
 * watchdogs) on a fixed set of worker threads. Deferred tasks can be
 * cancelled until they begin executing.
 *
 * **Usage Example**:
 * @code
 * Scheduler scheduler(4);
 * scheduler.Post([] { LaunchSomething(); });
 *
 * auto id = scheduler.ScheduleAfter(std::chrono::seconds(30), [] { Expire(); });
 * if (finished_early) {
 *     scheduler.Cancel(id);
 * }
 * @endcode
 *
 * **Thread Safety**: All methods are thread-safe. Tasks must not call
 * Shutdown() on the scheduler running them.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <utility>
#include <vector>

namespace warden {
namespace utils {

class Scheduler {
public:
    using Task = std::function<void()>;
    using TaskId = std::uint64_t;
    using Clock = std::chrono::steady_clock;

    explicit Scheduler(std::size_t worker_count = 4);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// Run as soon as a worker is free. Returns 0 after Shutdown().
    TaskId Post(Task task);

    /// Run once @p delay has elapsed. Returns 0 after Shutdown().
    TaskId ScheduleAfter(std::chrono::milliseconds delay, Task task);

    /**
     * @brief Cancel a task that has not started
     * @return true if the task was still pending and will never run
     */
    bool Cancel(TaskId id);

    /// Tasks queued but not yet started.
    std::size_t PendingCount() const;

    /**
     * @brief Stop workers; pending tasks are discarded
     *
     * Waits for tasks already executing. Idempotent.
     */
    void Shutdown();

private:
    struct PendingTask {
        Clock::time_point deadline;
        Task task;
    };

    void WorkerLoop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<TaskId, PendingTask> tasks_;
    std::set<std::pair<Clock::time_point, TaskId>> queue_;
    std::vector<std::thread> workers_;
    TaskId next_id_{1};
    bool stopping_{false};
};

} // namespace utils
} // namespace warden
