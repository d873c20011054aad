/**
 * @file sandbox.hpp
 * @brief Sandbox status, read-only snapshots and aggregate counts
 *
 * @date 2025
 */

#pragma once

#include "warden/core/policy.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace warden {
namespace core {

/**
 * @brief Lifecycle state
 *
 * Pending → Running → Stopped, or Pending/Running → Failed on a launch
 * failure. Stopped and Failed are terminal for a launch attempt.
 */
enum class SandboxStatus {
    PENDING,
    RUNNING,
    STOPPED,
    FAILED
};

std::string SandboxStatusToString(SandboxStatus status);

/// @throws SandboxError (INVALID_INPUT) for unknown names
SandboxStatus ParseSandboxStatus(const std::string& name);

bool IsTerminal(SandboxStatus status);

/**
 * @struct SandboxSnapshot
 * @brief Copy of one sandbox's state at a point in time
 */
struct SandboxSnapshot {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string id;
    std::string name;
    SandboxStatus status{SandboxStatus::PENDING};
    Policy policy;

    TimePoint created_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> stopped_at;

    std::string command;                ///< Last command started, empty for the default shell
    std::optional<std::string> handle;  ///< Backend handle description, absent before launch
    std::optional<int> pid;             ///< Supervised host process
    std::optional<int> exit_code;       ///< Set once the process has been reaped
    std::uint64_t attempt{0};           ///< Launch attempts so far
    std::size_t log_lines{0};           ///< Entries currently held by the log
};

/**
 * @struct SandboxStats
 * @brief Registry-wide counts; every status and kind is always present
 */
struct SandboxStats {
    std::size_t total{0};
    std::map<SandboxStatus, std::size_t> by_status;
    std::map<IsolationKind, std::size_t> by_kind;

    SandboxStats();

    void Add(SandboxStatus status, IsolationKind kind);
};

} // namespace core
} // namespace warden
