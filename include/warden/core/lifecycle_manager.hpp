/**
 * @file lifecycle_manager.hpp
 * @brief Registry and state machine for all sandboxes in the process
 *
 * Owns every sandbox, dispatches launches to the backend selected by the
 * policy's isolation kind, wires process output into each sandbox's log,
 * and arms a watchdog per running sandbox when the policy sets a timeout.
 *
 * **Concurrency**:
 * - The registry map is guarded by its own mutex, held only for lookups,
 *   insertions and removals
 * - Every sandbox has its own mutex; create/start/stop/delete, exit
 *   notifications, launch completions and watchdogs on one id are
 *   serialized by it, while different ids never contend
 * - start() is fire-and-forget: the launch runs on a launch worker and
 *   its outcome is observed through get(), getLogs() or WaitUntilSettled()
 * - Watchdogs run on their own workers, so slow launches never delay a
 *   due timeout
 * - Stopping changes the status under the sandbox mutex, then terminates
 *   the backend handle after releasing it; readers of the sandbox never
 *   wait on a termination
 *
 * **Launch attempts**: every start() opens a new attempt. Exit
 * notifications, launch completions and watchdogs carry the attempt they
 * belong to and are ignored once it is no longer current. A launch that
 * completes after its sandbox was stopped is terminated immediately.
 *
 * **Usage Example**:
 * @code
 * LifecycleManager manager(config, backends::MakeDefaultBackends(config, runner));
 *
 * auto sandbox = manager.Create("build-job");
 * manager.Start(sandbox.id, "make test");
 * manager.WaitUntilSettled(sandbox.id, std::chrono::minutes(5));
 * for (const auto& line : manager.GetLogs(sandbox.id)) {
 *     std::cout << line << "\n";
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "warden/backends/backend.hpp"
#include "warden/core/log_sink.hpp"
#include "warden/core/policy.hpp"
#include "warden/core/sandbox.hpp"
#include "warden/core/service_config.hpp"
#include "warden/utils/scheduler.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace warden {
namespace core {

class LifecycleManager {
public:
    LifecycleManager(ServiceConfig config, backends::BackendSet backends);

    /**
     * @brief Stop the schedulers and terminate every live process
     *
     * Waits (bounded) for all exit notifications before returning.
     */
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    /**
     * @brief Register a new Pending sandbox
     *
     * @param policy Defaults to ServiceConfig::default_policy
     * @throws SandboxError (INVALID_INPUT) for an empty name or invalid policy
     */
    SandboxSnapshot Create(const std::string& name,
                           const std::optional<Policy>& policy = std::nullopt);

    /**
     * @brief Begin a launch attempt
     *
     * Marks the sandbox Running and returns; the backend launch happens on a
     * worker thread. A launch failure turns the sandbox Failed with a
     * "Failed to start" log entry.
     *
     * @param command Shell command; empty runs the backend's default shell
     * @throws SandboxError (NOT_FOUND, ALREADY_RUNNING)
     */
    void Start(const std::string& id, const std::string& command = "");

    /**
     * @brief Terminate a running sandbox; no-op for any other status
     *
     * Termination errors are written to the sandbox log, never thrown.
     * Stopping a terminal sandbox keeps its stoppedAt and only adds a log entry.
     *
     * @throws SandboxError (NOT_FOUND)
     */
    void Stop(const std::string& id);

    /// Stop if running, then forget the id. @throws SandboxError (NOT_FOUND)
    void Delete(const std::string& id);

    /// @throws SandboxError (NOT_FOUND)
    SandboxSnapshot Get(const std::string& id) const;

    std::vector<SandboxSnapshot> List(const std::optional<SandboxStatus>& filter = std::nullopt) const;

    /**
     * @brief Last @p max_lines log entries in emission order
     *
     * Values <= 0 use LogSink::kDefaultTailLines.
     *
     * @throws SandboxError (NOT_FOUND)
     */
    std::vector<std::string> GetLogs(const std::string& id,
                                     int max_lines = LogSink::kDefaultTailLines) const;

    /// Entries currently held in the sandbox log. @throws SandboxError (NOT_FOUND)
    std::size_t LogLineCount(const std::string& id) const;

    /**
     * @brief Log entries appended at or after @p position
     *
     * For followers: pass the returned LogChunk::next on the next call.
     *
     * @throws SandboxError (NOT_FOUND)
     */
    LogChunk GetLogsSince(const std::string& id, std::size_t position) const;

    /**
     * @brief Replace the allowed and/or blocked network sets
     *
     * Absent arguments leave the corresponding set unchanged. A running
     * process keeps the rules it was launched with.
     *
     * @throws SandboxError (NOT_FOUND)
     */
    Policy UpdateNetworkPolicy(const std::string& id,
                               const std::optional<std::set<std::string>>& allowed,
                               const std::optional<std::set<std::string>>& blocked);

    SandboxStats GetStats() const;

    /**
     * @brief Block until the sandbox is terminal and its process has been reaped
     *
     * @return false on timeout
     * @throws SandboxError (NOT_FOUND)
     */
    bool WaitUntilSettled(const std::string& id, std::chrono::milliseconds timeout) const;

    const ServiceConfig& config() const { return config_; }

private:
    struct Entry;
    using EntryPtr = std::shared_ptr<Entry>;
    using WeakEntry = std::weak_ptr<Entry>;

    /// Handle taken out of a sandbox by a stop, terminated after unlocking
    struct PendingTermination {
        backends::LaunchHandle handle;
        IsolationKind kind;
    };

    EntryPtr Find(const std::string& id) const;
    EntryPtr FindLive(const std::string& id) const;
    SandboxSnapshot SnapshotLocked(const Entry& entry) const;

    void RunLaunch(WeakEntry weak, std::uint64_t attempt,
                   Policy policy, std::string command);
    void FailLaunch(const EntryPtr& entry, std::uint64_t attempt, const std::string& reason);
    void OnExit(WeakEntry weak, std::uint64_t attempt, const utils::ExitStatus& status);
    void OnTimeout(WeakEntry weak, std::uint64_t attempt, int seconds);

    std::optional<PendingTermination> StopLocked(Entry& entry);
    void FinishStop(Entry& entry, const std::optional<PendingTermination>& pending);
    void ApplyExitLocked(Entry& entry, const utils::ExitStatus& status);
    void TerminateHandle(const std::string& id, LogSink& logs, const PendingTermination& pending);

    void TrackProcess(const std::shared_ptr<utils::Subprocess>& process);

    ServiceConfig config_;
    backends::BackendSet backends_;
    backends::TerminationOptions termination_;

    mutable std::mutex registry_mutex_;                      ///< Guards registry_ and processes_
    std::map<std::string, EntryPtr> registry_;               ///< id → sandbox
    std::vector<std::weak_ptr<utils::Subprocess>> processes_;  ///< Every process ever launched

    utils::Scheduler launches_;                              ///< Backend launches
    utils::Scheduler watchdogs_;                             ///< Timeout stops only
};

} // namespace core
} // namespace warden
