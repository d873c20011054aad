/**
 * @file namespace_backend.hpp
 * @brief Linux namespace isolation through bubblewrap
 *
 * The command runs under bwrap with fresh user, IPC, PID and UTS namespaces,
 * a read-only view of the system directories, private /tmp, and read-write
 * binds only for the policy's allowed file prefixes. Blocked prefixes are
 * masked after the allowed binds, so they stay hidden even when nested
 * inside an allowed one.
 *
 * **Network**:
 * - No egress: bwrap --unshare-net (loopback only)
 * - Filtered egress: a dedicated network namespace "warden-xxxxxxxx" joined
 *   through a veth pair, NATed on the host, with an OUTPUT chain built from
 *   the resolved allow/block lists. Allowed host names are pinned through a
 *   generated /etc/hosts.
 *
 * **Ceilings**: memory through RLIMIT_AS, CPU through affinity to
 * ceil(max_cpu_cores) CPUs.
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

/**
 * @struct NamespaceNetwork
 * @brief Names and addresses of one sandbox network namespace
 */
struct NamespaceNetwork {
    std::string netns;            ///< "warden-1a2b3c4d"
    std::string host_interface;   ///< Host end of the veth pair
    std::string jail_interface;   ///< Namespace end of the veth pair
    utils::Subnet subnet;         ///< /30: .1 host, .2 namespace
    std::string hosts_file;       ///< Generated /etc/hosts, empty if none

    static NamespaceNetwork ForToken(const std::string& token, const utils::Subnet& subnet);
};

class NamespaceBackend : public Backend {
public:
    NamespaceBackend(core::NamespaceSettings settings,
                     std::shared_ptr<utils::CommandRunner> runner,
                     utils::ResolveFunction resolve = utils::ResolveIPv4);

    core::IsolationKind kind() const override { return core::IsolationKind::NAMESPACE; }

    LaunchHandle Launch(const core::Policy& policy,
                        const std::string& command,
                        LaunchCallbacks callbacks) override;

    void Terminate(const LaunchHandle& handle, const TerminationOptions& options) override;

    /**
     * @brief bwrap argument vector, starting with the bwrap binary
     *
     * @param share_network false adds --unshare-net
     * @param hosts_file Bound over /etc/hosts when set
     */
    std::vector<std::string> BuildBwrapArgs(const core::Policy& policy,
                                            const std::string& command,
                                            bool share_network,
                                            const std::optional<std::string>& hosts_file) const;

    /**
     * @brief Host commands that create and wire a sandbox network namespace
     *
     * Firewall rules are not included; see BuildJailOutputRules() and
     * BuildHostNatRules().
     */
    std::vector<std::vector<std::string>> BuildNetnsSetupCommands(const NamespaceNetwork& net) const;

    /// Commands that remove what BuildNetnsSetupCommands() created.
    std::vector<std::vector<std::string>> BuildNetnsTeardownCommands(const NamespaceNetwork& net) const;

private:
    class NetnsResources;

    std::shared_ptr<NetnsResources> SetupNetwork(const utils::EgressPlan& plan,
                                                 std::vector<std::string>& notes);

    core::NamespaceSettings settings_;
    std::shared_ptr<utils::CommandRunner> runner_;
    utils::ResolveFunction resolve_;
    std::shared_ptr<utils::SubnetPool> subnets_;
};

} // namespace backends
} // namespace warden
