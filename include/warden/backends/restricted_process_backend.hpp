/**
 * @file restricted_process_backend.hpp
 * @brief Weakest isolation tier: a plain child process
 *
 * Runs `/bin/sh -c <command>` in its own session with a reduced environment,
 * RLIMIT_AS, no core dumps, CPU affinity and PR_SET_NO_NEW_PRIVS. There is
 * no filesystem or network containment: file and network lists in the
 * policy are recorded in the sandbox log but not enforced.
 *
 * @date 2025
 */

#pragma once

#include "warden/backends/backend.hpp"
#include "warden/core/service_config.hpp"

#include <string>
#include <vector>

namespace warden {
namespace backends {

class RestrictedProcessBackend : public Backend {
public:
    explicit RestrictedProcessBackend(core::RestrictedProcessSettings settings);

    core::IsolationKind kind() const override { return core::IsolationKind::RESTRICTED_PROCESS; }

    LaunchHandle Launch(const core::Policy& policy,
                        const std::string& command,
                        LaunchCallbacks callbacks) override;

    void Terminate(const LaunchHandle& handle, const TerminationOptions& options) override;

    utils::SpawnOptions BuildSpawnOptions(const core::Policy& policy,
                                          const std::string& command) const;

private:
    core::RestrictedProcessSettings settings_;
};

} // namespace backends
} // namespace warden
