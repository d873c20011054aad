/**
 * @file container_backend.cpp
 * @brief docker run launch, per-sandbox bridge networks and DOCKER-USER rules
 *
 * @date 2025
 */

#include "warden/backends/container_backend.hpp"
#include "warden/core/errors.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace warden {
namespace backends {

namespace {

const char* const kNamePrefix = "warden-";

core::SandboxError LaunchError(const std::string& message) {
    return core::SandboxError(core::ErrorKind::LAUNCH_FAILURE, message);
}

std::string FormatCpus(double cores) {
    std::ostringstream out;
    out << cores;
    return out.str();
}

bool UnderAny(const std::string& path, const std::set<std::string>& prefixes) {
    for (const auto& prefix : prefixes) {
        if (core::PathHasPrefix(path, prefix)) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// CONTAINER RESOURCES
// ============================================================================

class ContainerBackend::ContainerResources : public LaunchResources {
public:
    ContainerResources(std::shared_ptr<utils::CommandRunner> runner,
                       std::shared_ptr<utils::SubnetPool> subnets,
                       const core::ContainerSettings& settings,
                       std::string name)
        : runner_(std::move(runner))
        , subnets_(std::move(subnets))
        , runtime_binary_(settings.runtime_binary)
        , iptables_binary_(settings.iptables_binary)
        , name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    std::string BridgeName() const {
        return "wdb" + name_.substr(std::string(kNamePrefix).size());
    }

    void SetSubnet(const utils::Subnet& subnet) { subnet_ = subnet; }
    void MarkNetworkCreated() { network_created_ = true; }
    void AddRule(const utils::FirewallRule& rule) { rules_.push_back(rule); }

protected:
    void ReleaseOnce() override {
        // --rm normally removes the container; this covers a killed client
        auto removed = runner_->Run({runtime_binary_, "rm", "-f", name_});
        if (!removed.Succeeded()) {
            spdlog::debug("Container {} already gone", name_);
        }

        for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
            auto result = utils::ApplyFirewallRules(*runner_, {iptables_binary_}, {*it}, "-D");
            if (!result.Succeeded()) {
                spdlog::warn("Could not remove DOCKER-USER rule for {}: {}", name_,
                             utils::StringUtils::Trim(result.output));
            }
        }

        if (network_created_) {
            auto result = runner_->Run({runtime_binary_, "network", "rm", name_});
            if (!result.Succeeded()) {
                spdlog::warn("Could not remove network {}: {}", name_,
                             utils::StringUtils::Trim(result.output));
            }
        }

        if (subnet_) {
            subnets_->Release(*subnet_);
        }
    }

private:
    std::shared_ptr<utils::CommandRunner> runner_;
    std::shared_ptr<utils::SubnetPool> subnets_;
    std::string runtime_binary_;
    std::string iptables_binary_;
    std::string name_;
    std::optional<utils::Subnet> subnet_;
    bool network_created_{false};
    std::vector<utils::FirewallRule> rules_;
};

// ============================================================================
// CONSTRUCTION
// ============================================================================

ContainerBackend::ContainerBackend(core::ContainerSettings settings,
                                   std::shared_ptr<utils::CommandRunner> runner,
                                   utils::ResolveFunction resolve)
    : settings_(std::move(settings))
    , runner_(std::move(runner))
    , resolve_(std::move(resolve))
    , subnets_(std::make_shared<utils::SubnetPool>(settings_.subnet_base, 28)) {

    spdlog::info("Container backend initialized (runtime: {}, image: {})",
                 settings_.runtime_binary, settings_.image);
}

std::string ContainerBackend::ContainerName(const std::string& token) {
    return kNamePrefix + token.substr(0, 8);
}

// ============================================================================
// ARGUMENT BUILDING
// ============================================================================

std::vector<std::string> ContainerBackend::BuildRunArgs(const core::Policy& policy,
                                                        const std::string& command,
                                                        const std::string& container_name,
                                                        const std::optional<std::string>& network,
                                                        const utils::EgressPlan& plan) const {
    std::vector<std::string> args = {
        settings_.runtime_binary, "run", "--rm",
        "--name", container_name,
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--pids-limit", std::to_string(settings_.pids_limit)
    };

    if (policy.max_memory_mb) {
        std::string memory = std::to_string(*policy.max_memory_mb) + "m";
        args.insert(args.end(), {"--memory", memory, "--memory-swap", memory});
    }
    if (policy.max_cpu_cores) {
        args.insert(args.end(), {"--cpus", FormatCpus(*policy.max_cpu_cores)});
    }

    if (network) {
        args.insert(args.end(), {"--network", *network});
        for (const auto& [host, addresses] : plan.pins) {
            for (const auto& address : addresses) {
                args.insert(args.end(), {"--add-host", host + ":" + address});
            }
        }
    } else {
        args.insert(args.end(), {"--network", "none"});
    }

    auto allowed = policy.EffectiveAllowedFiles();
    for (const auto& prefix : allowed) {
        args.insert(args.end(), {"-v", prefix + ":" + prefix});
    }

    // Blocked paths only need masking where an allowed bind exposes them
    for (const auto& blocked : policy.blocked_files) {
        if (!UnderAny(blocked, allowed)) {
            continue;
        }
        std::error_code ec;
        if (fs::is_directory(blocked, ec)) {
            args.insert(args.end(), {"--tmpfs", blocked});
        } else if (fs::exists(blocked, ec)) {
            args.insert(args.end(), {"-v", "/dev/null:" + blocked + ":ro"});
        }
    }

    args.insert(args.end(), {"--tmpfs", "/tmp", settings_.image});

    auto shell = ShellArgv(settings_.default_shell, command);
    args.insert(args.end(), shell.begin(), shell.end());
    return args;
}

// ============================================================================
// NETWORK SETUP
// ============================================================================

void ContainerBackend::SetupNetwork(ContainerResources& resources,
                                    const utils::EgressPlan& plan,
                                    std::vector<std::string>& notes) {
    auto subnet = subnets_->Acquire();
    if (!subnet) {
        throw LaunchError("no free container subnet in " + settings_.subnet_base + "/16");
    }
    resources.SetSubnet(*subnet);

    auto created = runner_->Run({
        settings_.runtime_binary, "network", "create",
        "--driver", "bridge",
        "--subnet", subnet->Cidr(),
        "--opt", "com.docker.network.bridge.name=" + resources.BridgeName(),
        resources.name()
    });
    if (!created.Succeeded()) {
        throw LaunchError("creating network " + resources.name() + " failed: " +
                          utils::StringUtils::Trim(created.output));
    }
    resources.MarkNetworkCreated();

    for (const auto& rule : utils::BuildDockerUserRules(plan, subnet->Cidr())) {
        auto result = utils::ApplyFirewallRules(*runner_, {settings_.iptables_binary}, {rule}, "-I");
        if (!result.Succeeded()) {
            throw LaunchError("DOCKER-USER rule failed: " +
                              utils::StringUtils::Trim(result.output));
        }
        resources.AddRule(rule);
    }

    if (plan.access == core::NetworkAccess::ALLOW_LISTED) {
        notes.push_back("Container network " + resources.name() + " (" + subnet->Cidr() + "): " +
                        std::to_string(plan.accept.size()) + " address(es) reachable");
    } else {
        notes.push_back("Container network " + resources.name() + " (" + subnet->Cidr() + "): " +
                        std::to_string(plan.reject.size()) + " address(es) blocked");
    }
}

// ============================================================================
// LAUNCH / TERMINATE
// ============================================================================

LaunchHandle ContainerBackend::Launch(const core::Policy& policy,
                                      const std::string& command,
                                      LaunchCallbacks callbacks) {
    LaunchHandle handle;
    handle.notes = DescribeNetworkPolicy(policy);

    std::string name = ContainerName(callbacks.sandbox_id.empty() ? utils::StringUtils::GenerateUuid()
                                                                  : callbacks.sandbox_id);
    auto resources = std::make_shared<ContainerResources>(runner_, subnets_, settings_, name);

    auto plan = utils::PlanEgress(policy, resolve_);
    for (const auto& host : plan.unresolved) {
        handle.notes.push_back("Could not resolve " + host);
    }

    std::optional<std::string> network;
    if (plan.HasEgress()) {
        try {
            SetupNetwork(*resources, plan, handle.notes);
        }
        catch (const core::SandboxError&) {
            resources->Release();
            throw;
        }
        network = name;
    } else if (plan.access == core::NetworkAccess::ALLOW_LISTED) {
        handle.notes.push_back("No allowed host is reachable; network disabled");
    }

    utils::SpawnOptions options;
    options.argv = BuildRunArgs(policy, command, name, network, plan);

    spdlog::debug("docker: {}", utils::StringUtils::Join(options.argv, " "));

    try {
        handle.process = utils::Subprocess::Spawn(options, std::move(callbacks.on_output),
                                                  WrapExitCallback(resources, std::move(callbacks.on_exit)));
    }
    catch (const std::system_error& e) {
        resources->Release();
        throw LaunchError(std::string("container launch failed: ") + e.what());
    }

    handle.reference = name;
    handle.resources = resources;
    handle.notes.push_back("Container " + name + " from " + settings_.image);

    spdlog::info("Container sandbox launched: {}", handle.Describe());
    return handle;
}

void ContainerBackend::Terminate(const LaunchHandle& handle, const TerminationOptions& options) {
    if (handle.process && handle.process->IsRunning() && !handle.reference.empty()) {
        auto seconds = static_cast<long long>(
            std::ceil(static_cast<double>(options.grace_period.count()) / 1000.0));

        auto stopped = runner_->Run({settings_.runtime_binary, "stop",
                                     "--time", std::to_string(seconds), handle.reference});
        if (!stopped.Succeeded()) {
            spdlog::warn("'{} stop {}' failed, killing: {}", settings_.runtime_binary,
                         handle.reference, utils::StringUtils::Trim(stopped.output));
            auto killed = runner_->Run({settings_.runtime_binary, "kill", handle.reference});
            if (!killed.Succeeded()) {
                spdlog::debug("'{} kill {}' failed: {}", settings_.runtime_binary,
                              handle.reference, utils::StringUtils::Trim(killed.output));
            }
        }
    }

    // The client exits with its container; signal it in case it did not
    TerminateProcess(handle, options);
    if (handle.resources) {
        handle.resources->Release();
    }
}

} // namespace backends
} // namespace warden
