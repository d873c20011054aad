/**
 * @file sandbox.cpp
 * @brief Sandbox status names and stats aggregation
 *
 * @date 2025
 */

#include "warden/core/sandbox.hpp"
#include "warden/core/errors.hpp"

#include <algorithm>
#include <cctype>

namespace warden {
namespace core {

std::string SandboxStatusToString(SandboxStatus status) {
    switch (status) {
        case SandboxStatus::PENDING: return "pending";
        case SandboxStatus::RUNNING: return "running";
        case SandboxStatus::STOPPED: return "stopped";
        case SandboxStatus::FAILED:  return "failed";
    }
    return "unknown";
}

SandboxStatus ParseSandboxStatus(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "pending") return SandboxStatus::PENDING;
    if (lower == "running") return SandboxStatus::RUNNING;
    if (lower == "stopped") return SandboxStatus::STOPPED;
    if (lower == "failed")  return SandboxStatus::FAILED;

    throw SandboxError(ErrorKind::INVALID_INPUT, "unknown sandbox status: " + name);
}

bool IsTerminal(SandboxStatus status) {
    return status == SandboxStatus::STOPPED || status == SandboxStatus::FAILED;
}

SandboxStats::SandboxStats() {
    for (auto status : {SandboxStatus::PENDING, SandboxStatus::RUNNING,
                        SandboxStatus::STOPPED, SandboxStatus::FAILED}) {
        by_status[status] = 0;
    }
    for (auto kind : {IsolationKind::NAMESPACE, IsolationKind::CONTAINER,
                      IsolationKind::RESTRICTED_PROCESS}) {
        by_kind[kind] = 0;
    }
}

void SandboxStats::Add(SandboxStatus status, IsolationKind kind) {
    ++total;
    ++by_status[status];
    ++by_kind[kind];
}

} // namespace core
} // namespace warden
