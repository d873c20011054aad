/**
 * @file container_backend.hpp
 * @brief Ephemeral container isolation through the container runtime CLI
 *
 * Each sandbox is one `docker run --rm` container named
 * "warden-<first 8 chars of a launch token>", with every capability dropped,
 * no-new-privileges, a pids ceiling, and the policy's memory and CPU limits
 * passed straight to the runtime. The docker client process is supervised
 * like any other child: its stdout/stderr are the container's output and its
 * exit code is the container's exit code.
 *
 * **Network**:
 * - No egress: --network none
 * - Filtered egress: a per-sandbox bridge network with a /28 subnet and
 *   DOCKER-USER rules restricting traffic from that subnet; allowed host
 *   names are pinned with --add-host
 *
 * **Files**: allowed prefixes are bind-mounted at the same path; blocked
 * prefixes are never mounted. The image's own filesystem is not restricted.
 *
 * @date 2025
 */

#pragma once

#include "warden/backends/backend.hpp"
#include "warden/core/service_config.hpp"
#include "warden/utils/command_runner.hpp"
#include "warden/utils/network_jail.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace backends {

class ContainerBackend : public Backend {
public:
    ContainerBackend(core::ContainerSettings settings,
                     std::shared_ptr<utils::CommandRunner> runner,
                     utils::ResolveFunction resolve = utils::ResolveIPv4);

    core::IsolationKind kind() const override { return core::IsolationKind::CONTAINER; }

    LaunchHandle Launch(const core::Policy& policy,
                        const std::string& command,
                        LaunchCallbacks callbacks) override;

    void Terminate(const LaunchHandle& handle, const TerminationOptions& options) override;

    /// "warden-" + first 8 characters of @p token.
    static std::string ContainerName(const std::string& token);

    /**
     * @brief Full `docker run` argument vector
     *
     * @param network Network name, or std::nullopt for --network none
     */
    std::vector<std::string> BuildRunArgs(const core::Policy& policy,
                                          const std::string& command,
                                          const std::string& container_name,
                                          const std::optional<std::string>& network,
                                          const utils::EgressPlan& plan) const;

private:
    class ContainerResources;

    void SetupNetwork(ContainerResources& resources,
                      const utils::EgressPlan& plan,
                      std::vector<std::string>& notes);

    core::ContainerSettings settings_;
    std::shared_ptr<utils::CommandRunner> runner_;
    utils::ResolveFunction resolve_;
    std::shared_ptr<utils::SubnetPool> subnets_;
};

} // namespace backends
} // namespace warden
