/**
 * @file lifecycle_manager.cpp
 * @brief Sandbox registry, launch dispatch, exit handling and watchdogs
 *
 * **Lock order**: an entry mutex is never held while taking the registry
 * mutex, and the registry mutex is never held while taking an entry mutex.
 *
 * **Termination outside the entry lock**: a stop flips the status under the
 * entry mutex and counts itself in `terminating`; the backend terminate
 * and the closing "Sandbox stopped" entry follow after unlocking.
 * WaitUntilSettled() waits for `terminating` to drop back to zero.
 *
 * @date 2025
 */

#include "warden/core/lifecycle_manager.hpp"
#include "warden/core/errors.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>

namespace warden {
namespace core {

namespace {

SandboxError NotFound(const std::string& id) {
    return SandboxError(ErrorKind::NOT_FOUND, "sandbox not found: " + id);
}

std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

} // anonymous namespace

struct LifecycleManager::Entry {
    mutable std::mutex mutex;
    mutable std::condition_variable changed;

    std::string id;
    std::string name;
    SandboxStatus status{SandboxStatus::PENDING};
    Policy policy;

    SandboxSnapshot::TimePoint created_at;
    std::optional<SandboxSnapshot::TimePoint> started_at;
    std::optional<SandboxSnapshot::TimePoint> stopped_at;

    std::string command;
    std::optional<backends::LaunchHandle> handle;   ///< Current attempt only
    std::optional<int> exit_code;
    std::optional<utils::ExitStatus> pending_exit;  ///< Exit seen before the handle was stored

    std::uint64_t attempt{0};
    bool launch_in_flight{false};
    int terminating{0};                             ///< Stops still terminating a handle
    utils::Scheduler::TaskId watchdog{0};
    bool removed{false};

    std::shared_ptr<LogSink> logs;                  ///< Shared with output callbacks
};

// ============================================================================
// CONSTRUCTION / DESTRUCTION
// ============================================================================

LifecycleManager::LifecycleManager(ServiceConfig config, backends::BackendSet backends)
    : config_(std::move(config))
    , backends_(std::move(backends))
    , launches_(config_.launch_workers)
    , watchdogs_(config_.watchdog_workers) {

    config_.default_policy.Validate();
    termination_.grace_period = config_.termination_grace;

    spdlog::info("Lifecycle manager initialized ({} launch workers, {} watchdog workers, "
                 "log capacity {}, grace {} ms)",
                 config_.launch_workers, config_.watchdog_workers,
                 config_.log_capacity, config_.termination_grace.count());
}

LifecycleManager::~LifecycleManager() {
    launches_.Shutdown();
    watchdogs_.Shutdown();

    std::vector<EntryPtr> entries;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (const auto& [id, entry] : registry_) {
            entries.push_back(entry);
        }
    }

    for (const auto& entry : entries) {
        std::optional<PendingTermination> pending;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (entry->status != SandboxStatus::RUNNING) {
                continue;
            }
            spdlog::info("Stopping sandbox {} for shutdown", entry->id);
            pending = StopLocked(*entry);
        }
        FinishStop(*entry, pending);
    }

    std::vector<std::shared_ptr<utils::Subprocess>> live;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (const auto& weak : processes_) {
            if (auto process = weak.lock()) {
                live.push_back(process);
            }
        }
    }

    auto wait_budget = config_.termination_grace + std::chrono::seconds(5);
    for (const auto& process : live) {
        if (process->IsRunning() && !process->Terminate(config_.termination_grace)) {
            spdlog::error("Process {} survived shutdown", process->pid());
        }
        if (!process->WaitForCompletion(wait_budget)) {
            spdlog::warn("Exit handling for process {} did not finish", process->pid());
        }
    }

    spdlog::info("Lifecycle manager shut down");
}

// ============================================================================
// REGISTRY OPERATIONS
// ============================================================================

SandboxSnapshot LifecycleManager::Create(const std::string& name,
                                         const std::optional<Policy>& policy) {
    if (utils::StringUtils::Trim(name).empty()) {
        throw SandboxError(ErrorKind::INVALID_INPUT, "sandbox name is required");
    }

    Policy effective = policy ? *policy : config_.default_policy;
    effective.Validate();

    auto entry = std::make_shared<Entry>();
    entry->name = name;
    entry->policy = std::move(effective);
    entry->created_at = Now();
    entry->logs = std::make_shared<LogSink>(config_.log_capacity);

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        do {
            entry->id = utils::StringUtils::GenerateUuid();
        } while (registry_.count(entry->id) > 0);
        registry_[entry->id] = entry;
    }

    spdlog::info("Created sandbox {} '{}' ({})", entry->id, name,
                 IsolationKindToString(entry->policy.isolation_kind));

    std::lock_guard<std::mutex> lock(entry->mutex);
    return SnapshotLocked(*entry);
}

void LifecycleManager::Start(const std::string& id, const std::string& command) {
    auto entry = Find(id);

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->removed) {
        throw NotFound(id);
    }
    if (entry->status == SandboxStatus::RUNNING) {
        throw SandboxError(ErrorKind::ALREADY_RUNNING, "sandbox " + id + " is already running");
    }

    entry->handle.reset();

    std::uint64_t attempt = ++entry->attempt;
    entry->status = SandboxStatus::RUNNING;
    entry->started_at = Now();
    entry->stopped_at.reset();
    entry->exit_code.reset();
    entry->pending_exit.reset();
    entry->command = command;
    entry->launch_in_flight = true;
    entry->logs->Append("Sandbox starting...");

    WeakEntry weak = entry;
    auto task = launches_.Post([this, weak, attempt, policy = entry->policy, command] {
        RunLaunch(weak, attempt, policy, command);
    });

    if (task == 0) {
        entry->launch_in_flight = false;
        entry->status = SandboxStatus::FAILED;
        entry->stopped_at = Now();
        entry->logs->Append("Failed to start: service is shutting down");
    } else {
        spdlog::info("Starting sandbox {} (attempt {})", id, attempt);
    }
    entry->changed.notify_all();
}

void LifecycleManager::Stop(const std::string& id) {
    auto entry = Find(id);
    std::optional<PendingTermination> pending;
    SandboxStatus previous{SandboxStatus::PENDING};

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed) {
            throw NotFound(id);
        }
        previous = entry->status;
        pending = StopLocked(*entry);
    }
    FinishStop(*entry, pending);

    if (previous == SandboxStatus::RUNNING) {
        spdlog::info("Stopped sandbox {}", id);
    } else {
        spdlog::debug("Stop on sandbox {} in state {}", id, SandboxStatusToString(previous));
    }
}

void LifecycleManager::Delete(const std::string& id) {
    auto entry = Find(id);
    std::optional<PendingTermination> pending;

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed) {
            throw NotFound(id);
        }
        if (entry->status == SandboxStatus::RUNNING) {
            pending = StopLocked(*entry);
        }
        entry->removed = true;
        entry->changed.notify_all();
    }
    FinishStop(*entry, pending);

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        registry_.erase(id);
    }

    spdlog::info("Deleted sandbox {}", id);
}

SandboxSnapshot LifecycleManager::Get(const std::string& id) const {
    auto entry = Find(id);

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->removed) {
        throw NotFound(id);
    }
    return SnapshotLocked(*entry);
}

std::vector<SandboxSnapshot> LifecycleManager::List(const std::optional<SandboxStatus>& filter) const {
    std::vector<EntryPtr> entries;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        entries.reserve(registry_.size());
        for (const auto& [id, entry] : registry_) {
            entries.push_back(entry);
        }
    }

    std::vector<SandboxSnapshot> result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed || (filter && entry->status != *filter)) {
            continue;
        }
        result.push_back(SnapshotLocked(*entry));
    }
    return result;
}

std::vector<std::string> LifecycleManager::GetLogs(const std::string& id, int max_lines) const {
    return FindLive(id)->logs->Tail(max_lines);
}

std::size_t LifecycleManager::LogLineCount(const std::string& id) const {
    return FindLive(id)->logs->Size();
}

LogChunk LifecycleManager::GetLogsSince(const std::string& id, std::size_t position) const {
    return FindLive(id)->logs->Since(position);
}

Policy LifecycleManager::UpdateNetworkPolicy(const std::string& id,
                                             const std::optional<std::set<std::string>>& allowed,
                                             const std::optional<std::set<std::string>>& blocked) {
    auto entry = Find(id);

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->removed) {
        throw NotFound(id);
    }

    if (allowed) {
        entry->policy.allowed_networks = *allowed;
    }
    if (blocked) {
        entry->policy.blocked_networks = *blocked;
    }

    if (entry->status == SandboxStatus::RUNNING) {
        entry->logs->Append("Network policy updated (applies on next start)");
    } else {
        entry->logs->Append("Network policy updated");
    }

    spdlog::info("Updated network policy of sandbox {}", id);
    return entry->policy;
}

SandboxStats LifecycleManager::GetStats() const {
    std::vector<EntryPtr> entries;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (const auto& [id, entry] : registry_) {
            entries.push_back(entry);
        }
    }

    SandboxStats stats;
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (!entry->removed) {
            stats.Add(entry->status, entry->policy.isolation_kind);
        }
    }
    return stats;
}

bool LifecycleManager::WaitUntilSettled(const std::string& id,
                                        std::chrono::milliseconds timeout) const {
    auto entry = Find(id);

    std::unique_lock<std::mutex> lock(entry->mutex);
    return entry->changed.wait_for(lock, timeout, [&entry] {
        if (entry->removed) {
            return true;
        }
        bool reaped = !entry->handle || !entry->handle->process || entry->exit_code.has_value();
        return IsTerminal(entry->status) && !entry->launch_in_flight &&
               entry->terminating == 0 && reaped;
    });
}

// ============================================================================
// LAUNCH
// ============================================================================

void LifecycleManager::RunLaunch(WeakEntry weak, std::uint64_t attempt,
                                 Policy policy, std::string command) {
    auto entry = weak.lock();
    if (!entry) {
        return;
    }

    std::shared_ptr<LogSink> logs = entry->logs;

    backends::LaunchCallbacks callbacks;
    callbacks.sandbox_id = entry->id;
    callbacks.on_output = [logs](utils::OutputStream stream, const std::string& line) {
        logs->Append((stream == utils::OutputStream::STDOUT ? "[stdout] " : "[stderr] ") + line);
    };
    callbacks.on_exit = [this, weak, attempt](const utils::ExitStatus& status) {
        OnExit(weak, attempt, status);
    };

    backends::LaunchHandle handle;
    try {
        handle = backends_.Get(policy.isolation_kind).Launch(policy, command, std::move(callbacks));
    }
    catch (const std::exception& e) {
        FailLaunch(entry, attempt, e.what());
        return;
    }

    TrackProcess(handle.process);

    std::unique_lock<std::mutex> lock(entry->mutex);
    bool current = entry->attempt == attempt && !entry->removed;

    if (!current || entry->status != SandboxStatus::RUNNING) {
        // Stopped, deleted or restarted while the backend was launching
        if (current) {
            entry->launch_in_flight = false;
            ++entry->terminating;
            if (entry->pending_exit) {
                auto status = *entry->pending_exit;
                entry->pending_exit.reset();
                ApplyExitLocked(*entry, status);
            }
        }
        lock.unlock();

        spdlog::info("Sandbox {} stopped during launch, terminating {}",
                     entry->id, handle.Describe());
        TerminateHandle(entry->id, *logs, PendingTermination{handle, policy.isolation_kind});

        if (current) {
            lock.lock();
            --entry->terminating;
            entry->changed.notify_all();
        }
        return;
    }

    for (const auto& note : handle.notes) {
        logs->Append(note);
    }
    logs->Append("Process started with PID: " + std::to_string(handle.pid()));

    entry->launch_in_flight = false;
    entry->handle = handle;

    if (entry->pending_exit) {
        auto status = *entry->pending_exit;
        entry->pending_exit.reset();
        ApplyExitLocked(*entry, status);
    } else if (policy.timeout_seconds) {
        int seconds = *policy.timeout_seconds;

        // Measured from start(), not from launch completion
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            Now() - entry->started_at.value_or(Now()));
        auto delay = std::max(std::chrono::milliseconds(0),
                              std::chrono::milliseconds(std::chrono::seconds(seconds)) - elapsed);

        entry->watchdog = watchdogs_.ScheduleAfter(delay, [this, weak, attempt, seconds] {
            OnTimeout(weak, attempt, seconds);
        });
    }

    entry->changed.notify_all();
    spdlog::info("Sandbox {} running: {}", entry->id, handle.Describe());
}

void LifecycleManager::FailLaunch(const EntryPtr& entry, std::uint64_t attempt,
                                  const std::string& reason) {
    spdlog::error("Sandbox {} failed to start: {}", entry->id, reason);

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->attempt != attempt || entry->removed) {
        return;
    }

    entry->launch_in_flight = false;
    entry->logs->Append("Failed to start: " + reason);
    if (entry->status == SandboxStatus::RUNNING) {
        entry->status = SandboxStatus::FAILED;
        entry->stopped_at = Now();
    }
    entry->changed.notify_all();
}

// ============================================================================
// ASYNCHRONOUS EVENTS
// ============================================================================

void LifecycleManager::OnExit(WeakEntry weak, std::uint64_t attempt,
                              const utils::ExitStatus& status) {
    auto entry = weak.lock();
    if (!entry) {
        return;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->attempt != attempt || entry->removed) {
        return;
    }
    if (entry->launch_in_flight) {
        entry->pending_exit = status;
        return;
    }
    ApplyExitLocked(*entry, status);
}

void LifecycleManager::OnTimeout(WeakEntry weak, std::uint64_t attempt, int seconds) {
    auto entry = weak.lock();
    if (!entry) {
        return;
    }

    std::optional<PendingTermination> pending;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->attempt != attempt || entry->removed ||
            entry->status != SandboxStatus::RUNNING) {
            return;
        }

        entry->watchdog = 0;
        entry->logs->Append("Sandbox timed out after " + std::to_string(seconds) + " seconds");
        spdlog::warn("Sandbox {} timed out after {} s", entry->id, seconds);

        pending = StopLocked(*entry);
    }
    FinishStop(*entry, pending);
}

// ============================================================================
// LOCKED HELPERS
// ============================================================================

std::optional<LifecycleManager::PendingTermination> LifecycleManager::StopLocked(Entry& entry) {
    std::optional<PendingTermination> pending;

    if (entry.status == SandboxStatus::RUNNING) {
        if (entry.watchdog != 0) {
            watchdogs_.Cancel(entry.watchdog);
            entry.watchdog = 0;
        }
        if (entry.handle) {
            pending = PendingTermination{*entry.handle, entry.policy.isolation_kind};
            ++entry.terminating;
        }
        entry.status = SandboxStatus::STOPPED;
        entry.stopped_at = Now();
    } else if (entry.status == SandboxStatus::PENDING) {
        entry.status = SandboxStatus::STOPPED;
        entry.stopped_at = Now();
    }

    if (!pending) {
        entry.logs->Append("Sandbox stopped");
    }
    entry.changed.notify_all();
    return pending;
}

void LifecycleManager::FinishStop(Entry& entry, const std::optional<PendingTermination>& pending) {
    if (!pending) {
        return;
    }

    TerminateHandle(entry.id, *entry.logs, *pending);

    std::lock_guard<std::mutex> lock(entry.mutex);
    entry.logs->Append("Sandbox stopped");
    --entry.terminating;
    entry.changed.notify_all();
}

void LifecycleManager::ApplyExitLocked(Entry& entry, const utils::ExitStatus& status) {
    entry.exit_code = status.exit_code;

    std::string line = "Process exited with code: " + std::to_string(status.exit_code);
    if (status.signal != 0) {
        line += " (" + status.Describe() + ")";
    }
    entry.logs->Append(line);

    if (entry.status == SandboxStatus::RUNNING) {
        if (entry.watchdog != 0) {
            watchdogs_.Cancel(entry.watchdog);
            entry.watchdog = 0;
        }
        entry.status = SandboxStatus::STOPPED;
        entry.stopped_at = Now();
        spdlog::info("Sandbox {} finished: {}", entry.id, status.Describe());
    }
    entry.changed.notify_all();
}

void LifecycleManager::TerminateHandle(const std::string& id, LogSink& logs,
                                       const PendingTermination& pending) {
    try {
        backends_.Get(pending.kind).Terminate(pending.handle, termination_);
        logs.Append("Process " + std::to_string(pending.handle.pid()) + " terminated");
    }
    catch (const std::exception& e) {
        logs.Append(std::string("Error terminating process: ") + e.what());
        spdlog::error("Terminating sandbox {} failed: {}", id, e.what());
    }
}

// ============================================================================
// INTERNAL
// ============================================================================

LifecycleManager::EntryPtr LifecycleManager::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = registry_.find(id);
    if (it == registry_.end()) {
        throw NotFound(id);
    }
    return it->second;
}

LifecycleManager::EntryPtr LifecycleManager::FindLive(const std::string& id) const {
    auto entry = Find(id);

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->removed) {
        throw NotFound(id);
    }
    return entry;
}

SandboxSnapshot LifecycleManager::SnapshotLocked(const Entry& entry) const {
    SandboxSnapshot snapshot;
    snapshot.id = entry.id;
    snapshot.name = entry.name;
    snapshot.status = entry.status;
    snapshot.policy = entry.policy;
    snapshot.created_at = entry.created_at;
    snapshot.started_at = entry.started_at;
    snapshot.stopped_at = entry.stopped_at;
    snapshot.command = entry.command;
    snapshot.exit_code = entry.exit_code;
    snapshot.attempt = entry.attempt;
    snapshot.log_lines = entry.logs->Size();

    if (entry.handle) {
        snapshot.handle = entry.handle->Describe();
        snapshot.pid = entry.handle->pid();
    }
    return snapshot;
}

void LifecycleManager::TrackProcess(const std::shared_ptr<utils::Subprocess>& process) {
    if (!process) {
        return;
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    processes_.erase(std::remove_if(processes_.begin(), processes_.end(),
                                    [](const std::weak_ptr<utils::Subprocess>& weak) {
                                        return weak.expired();
                                    }),
                     processes_.end());
    processes_.push_back(process);
}

} // namespace core
} // namespace warden
