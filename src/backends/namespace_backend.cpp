/**
 * @file namespace_backend.cpp
 * @brief bubblewrap launch and per-sandbox network namespaces
 *
 * **Filtered network setup** (all through the CommandRunner, as root):
 * 1. ip netns add warden-xxxxxxxx
 * 2. veth pair wdhxxxxxxxx (host) / wdjxxxxxxxx (namespace), /30 addresses
 * 3. default route in the namespace via the host end
 * 4. MASQUERADE + FORWARD accept on the host for the /30
 * 5. OUTPUT chain inside the namespace from the resolved egress plan
 *
 * The command then runs as `ip netns exec warden-xxxxxxxx bwrap ...`.
 * Teardown deletes the veth pair (both ends), the namespace, the host rules
 * and the generated hosts file; every step tolerates partial setups.
 *
 * @date 2025
 */

#include "warden/backends/namespace_backend.hpp"
#include "warden/core/errors.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace warden {
namespace backends {

namespace {

const char* const kSandboxPath = "/usr/local/bin:/usr/bin:/bin";
const std::vector<std::string> kPassthroughEnv = {"LANG", "LC_ALL", "TERM", "TZ"};

core::SandboxError LaunchError(const std::string& message) {
    return core::SandboxError(core::ErrorKind::LAUNCH_FAILURE, message);
}

std::string CommandText(const std::vector<std::string>& argv) {
    return utils::StringUtils::Join(argv, " ");
}

} // anonymous namespace

NamespaceNetwork NamespaceNetwork::ForToken(const std::string& token, const utils::Subnet& subnet) {
    NamespaceNetwork net;
    net.netns = "warden-" + token;
    net.host_interface = "wdh" + token;
    net.jail_interface = "wdj" + token;
    net.subnet = subnet;
    return net;
}

// ============================================================================
// NETWORK RESOURCES
// ============================================================================

class NamespaceBackend::NetnsResources : public LaunchResources {
public:
    NetnsResources(std::shared_ptr<utils::CommandRunner> runner,
                   std::shared_ptr<utils::SubnetPool> subnets,
                   std::string iptables_binary,
                   NamespaceNetwork net,
                   std::vector<std::vector<std::string>> teardown)
        : runner_(std::move(runner))
        , subnets_(std::move(subnets))
        , iptables_binary_(std::move(iptables_binary))
        , net_(std::move(net))
        , teardown_(std::move(teardown)) {}

    const NamespaceNetwork& network() const { return net_; }
    void SetHostsFile(const std::string& path) { net_.hosts_file = path; }
    void AddHostRule(const utils::FirewallRule& rule) { host_rules_.push_back(rule); }

protected:
    void ReleaseOnce() override {
        spdlog::debug("Tearing down network namespace {}", net_.netns);

        for (auto it = host_rules_.rbegin(); it != host_rules_.rend(); ++it) {
            auto result = utils::ApplyFirewallRules(*runner_, {iptables_binary_}, {*it}, "-D");
            if (!result.Succeeded()) {
                spdlog::warn("Could not remove host rule for {}: {}", net_.netns,
                             utils::StringUtils::Trim(result.output));
            }
        }

        for (const auto& argv : teardown_) {
            auto result = runner_->Run(argv);
            if (!result.Succeeded()) {
                spdlog::debug("'{}' failed: {}", CommandText(argv),
                              utils::StringUtils::Trim(result.output));
            }
        }

        if (!net_.hosts_file.empty()) {
            std::error_code ec;
            fs::remove(net_.hosts_file, ec);
        }

        subnets_->Release(net_.subnet);
    }

private:
    std::shared_ptr<utils::CommandRunner> runner_;
    std::shared_ptr<utils::SubnetPool> subnets_;
    std::string iptables_binary_;
    NamespaceNetwork net_;
    std::vector<std::vector<std::string>> teardown_;
    std::vector<utils::FirewallRule> host_rules_;
};

// ============================================================================
// CONSTRUCTION
// ============================================================================

NamespaceBackend::NamespaceBackend(core::NamespaceSettings settings,
                                   std::shared_ptr<utils::CommandRunner> runner,
                                   utils::ResolveFunction resolve)
    : settings_(std::move(settings))
    , runner_(std::move(runner))
    , resolve_(std::move(resolve))
    , subnets_(std::make_shared<utils::SubnetPool>(settings_.subnet_base, 30)) {

    spdlog::info("Namespace backend initialized (bwrap: {}, subnets: {}/16)",
                 settings_.bwrap_binary, settings_.subnet_base);
}

// ============================================================================
// ARGUMENT BUILDING
// ============================================================================

std::vector<std::string> NamespaceBackend::BuildBwrapArgs(
    const core::Policy& policy,
    const std::string& command,
    bool share_network,
    const std::optional<std::string>& hosts_file) const {

    std::vector<std::string> args = {
        settings_.bwrap_binary,
        "--unshare-user",
        "--unshare-ipc",
        "--unshare-pid",
        "--unshare-uts",
        "--unshare-cgroup-try"
    };
    if (!share_network) {
        args.push_back("--unshare-net");
    }
    args.insert(args.end(), {"--die-with-parent", "--new-session", "--cap-drop", "ALL",
                             "--hostname", "warden"});

    for (const auto& path : settings_.system_paths) {
        args.insert(args.end(), {"--ro-bind-try", path, path});
    }

    args.insert(args.end(), {
        "--proc", "/proc",
        "--dev", "/dev",
        "--tmpfs", "/tmp",
        "--tmpfs", "/var/tmp"
    });

    std::string resolv = settings_.resolv_conf.string();
    args.insert(args.end(), {"--ro-bind-try", resolv, "/etc/resolv.conf"});

    if (hosts_file) {
        args.insert(args.end(), {"--ro-bind", *hosts_file, "/etc/hosts"});
    }

    for (const auto& prefix : policy.EffectiveAllowedFiles()) {
        args.insert(args.end(), {"--bind-try", prefix, prefix});
    }

    // Masks come last so they cover anything bound above
    for (const auto& blocked : policy.blocked_files) {
        std::error_code ec;
        auto status = fs::status(blocked, ec);
        if (ec || !fs::exists(status)) {
            continue;
        }
        if (fs::is_directory(status)) {
            args.insert(args.end(), {"--tmpfs", blocked});
        } else {
            args.insert(args.end(), {"--ro-bind", "/dev/null", blocked});
        }
    }

    args.insert(args.end(), {"--chdir", "/tmp", "--"});

    auto shell = ShellArgv(settings_.default_shell, command);
    args.insert(args.end(), shell.begin(), shell.end());
    return args;
}

std::vector<std::vector<std::string>> NamespaceBackend::BuildNetnsSetupCommands(
    const NamespaceNetwork& net) const {

    const std::string& ip = settings_.ip_binary;
    std::string host_address = net.subnet.Host(1);
    std::string jail_address = net.subnet.Host(2);
    std::string suffix = "/" + std::to_string(net.subnet.prefix_length);

    std::vector<std::string> in_netns = {ip, "netns", "exec", net.netns, ip};
    auto inside = [&in_netns](std::initializer_list<std::string> rest) {
        std::vector<std::string> argv = in_netns;
        argv.insert(argv.end(), rest.begin(), rest.end());
        return argv;
    };

    return {
        {ip, "netns", "add", net.netns},
        {ip, "link", "add", net.host_interface, "type", "veth", "peer", "name", net.jail_interface},
        {ip, "link", "set", net.jail_interface, "netns", net.netns},
        {ip, "addr", "add", host_address + suffix, "dev", net.host_interface},
        {ip, "link", "set", net.host_interface, "up"},
        inside({"addr", "add", jail_address + suffix, "dev", net.jail_interface}),
        inside({"link", "set", net.jail_interface, "up"}),
        inside({"link", "set", "lo", "up"}),
        inside({"route", "add", "default", "via", host_address}),
    };
}

std::vector<std::vector<std::string>> NamespaceBackend::BuildNetnsTeardownCommands(
    const NamespaceNetwork& net) const {

    return {
        {settings_.ip_binary, "link", "del", net.host_interface},
        {settings_.ip_binary, "netns", "del", net.netns},
    };
}

// ============================================================================
// NETWORK SETUP
// ============================================================================

std::shared_ptr<NamespaceBackend::NetnsResources> NamespaceBackend::SetupNetwork(
    const utils::EgressPlan& plan,
    std::vector<std::string>& notes) {

    auto subnet = subnets_->Acquire();
    if (!subnet) {
        throw LaunchError("no free sandbox subnet in " + settings_.subnet_base + "/16");
    }

    auto net = NamespaceNetwork::ForToken(utils::StringUtils::GenerateUuid().substr(0, 8), *subnet);
    auto resources = std::make_shared<NetnsResources>(
        runner_, subnets_, settings_.iptables_binary, net, BuildNetnsTeardownCommands(net));

    try {
        if (plan.access == core::NetworkAccess::ALLOW_LISTED) {
            fs::create_directories(settings_.state_dir);
            fs::path hosts_path = settings_.state_dir / (net.netns + ".hosts");
            std::ofstream hosts(hosts_path);
            if (!hosts) {
                throw LaunchError("cannot write " + hosts_path.string());
            }
            hosts << utils::BuildHostsFile(plan);
            resources->SetHostsFile(hosts_path.string());
        }

        // NAT out of the veth link needs forwarding on the host
        auto forwarding = runner_->Run({settings_.sysctl_binary, "-w", "net.ipv4.ip_forward=1"});
        if (!forwarding.Succeeded()) {
            throw LaunchError("cannot enable net.ipv4.ip_forward: " +
                              utils::StringUtils::Trim(forwarding.output));
        }

        for (const auto& argv : BuildNetnsSetupCommands(net)) {
            auto result = runner_->Run(argv);
            if (!result.Succeeded()) {
                throw LaunchError("network setup failed at '" + CommandText(argv) + "': " +
                                  utils::StringUtils::Trim(result.output));
            }
        }

        for (const auto& rule : utils::BuildHostNatRules(subnet->Cidr(), net.host_interface)) {
            auto result = utils::ApplyFirewallRules(*runner_, {settings_.iptables_binary},
                                                    {rule}, "-A");
            if (!result.Succeeded()) {
                throw LaunchError("host NAT rule failed: " +
                                  utils::StringUtils::Trim(result.output));
            }
            resources->AddHostRule(rule);
        }

        auto result = utils::ApplyFirewallRules(
            *runner_,
            {settings_.ip_binary, "netns", "exec", net.netns, settings_.iptables_binary},
            utils::BuildJailOutputRules(plan), "-A");
        if (!result.Succeeded()) {
            throw LaunchError("egress rule failed: " + utils::StringUtils::Trim(result.output));
        }
    }
    catch (const fs::filesystem_error& e) {
        resources->Release();
        throw LaunchError(std::string("network setup failed: ") + e.what());
    }
    catch (const core::SandboxError&) {
        resources->Release();
        throw;
    }

    if (plan.access == core::NetworkAccess::ALLOW_LISTED) {
        notes.push_back("Network namespace " + net.netns + ": " +
                        std::to_string(plan.accept.size()) + " address(es) reachable");
    } else {
        notes.push_back("Network namespace " + net.netns + ": " +
                        std::to_string(plan.reject.size()) + " address(es) blocked");
    }

    spdlog::debug("Network namespace {} ready on {}", net.netns, subnet->Cidr());
    return resources;
}

// ============================================================================
// LAUNCH / TERMINATE
// ============================================================================

LaunchHandle NamespaceBackend::Launch(const core::Policy& policy,
                                      const std::string& command,
                                      LaunchCallbacks callbacks) {
    LaunchHandle handle;
    handle.notes = DescribeNetworkPolicy(policy);

    auto plan = utils::PlanEgress(policy, resolve_);
    for (const auto& host : plan.unresolved) {
        handle.notes.push_back("Could not resolve " + host);
    }

    std::shared_ptr<NetnsResources> network;
    if (plan.HasEgress()) {
        network = SetupNetwork(plan, handle.notes);
    } else if (plan.access == core::NetworkAccess::ALLOW_LISTED) {
        handle.notes.push_back("No allowed host is reachable; network disabled");
    }

    std::optional<std::string> hosts_file;
    if (network && !network->network().hosts_file.empty()) {
        hosts_file = network->network().hosts_file;
    }

    utils::SpawnOptions options;
    auto bwrap = BuildBwrapArgs(policy, command, network != nullptr, hosts_file);
    if (network) {
        options.argv = {settings_.ip_binary, "netns", "exec", network->network().netns};
        options.argv.insert(options.argv.end(), bwrap.begin(), bwrap.end());
    } else {
        options.argv = std::move(bwrap);
    }
    options.environment = SanitizedEnvironment(kSandboxPath, "/tmp", kPassthroughEnv);
    options.memory_limit_mb = policy.max_memory_mb;
    options.cpu_count = CpuCountFor(policy);

    spdlog::debug("bwrap: {}", CommandText(options.argv));

    try {
        handle.process = utils::Subprocess::Spawn(options, std::move(callbacks.on_output),
                                                  WrapExitCallback(network, std::move(callbacks.on_exit)));
    }
    catch (const std::system_error& e) {
        if (network) {
            network->Release();
        }
        throw LaunchError(std::string("bubblewrap launch failed: ") + e.what());
    }

    if (network) {
        handle.reference = network->network().netns;
        handle.resources = network;
    }

    spdlog::info("Namespace sandbox launched: {}", handle.Describe());
    return handle;
}

void NamespaceBackend::Terminate(const LaunchHandle& handle, const TerminationOptions& options) {
    spdlog::debug("Terminating namespace sandbox {}", handle.Describe());
    TerminateProcess(handle, options);
    if (handle.resources) {
        handle.resources->Release();
    }
}

} // namespace backends
} // namespace warden
