/**
 * @file backend.cpp
 * @brief Backend registry and shared launch helpers
 *
 * @date 2025
 */

#include "warden/backends/backend.hpp"
#include "warden/backends/container_backend.hpp"
#include "warden/backends/namespace_backend.hpp"
#include "warden/backends/restricted_process_backend.hpp"
#include "warden/core/errors.hpp"
#include "warden/core/service_config.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace warden {
namespace backends {

// ============================================================================
// LAUNCH RESOURCES / HANDLE
// ============================================================================

void LaunchResources::Release() {
    std::call_once(released_, [this] {
        try {
            ReleaseOnce();
        }
        catch (const std::exception& e) {
            spdlog::error("Releasing launch resources failed: {}", e.what());
        }
    });
}

int LaunchHandle::pid() const {
    return process ? static_cast<int>(process->pid()) : 0;
}

std::string LaunchHandle::Describe() const {
    std::string pid_text = "pid " + std::to_string(pid());
    if (reference.empty()) {
        return pid_text;
    }
    return reference + " (" + pid_text + ")";
}

// ============================================================================
// BACKEND SET
// ============================================================================

void BackendSet::Register(std::shared_ptr<Backend> backend) {
    auto kind = backend->kind();
    spdlog::debug("Registered {} backend", core::IsolationKindToString(kind));
    backends_[kind] = std::move(backend);
}

Backend& BackendSet::Get(core::IsolationKind kind) const {
    auto it = backends_.find(kind);
    if (it == backends_.end()) {
        throw core::SandboxError(core::ErrorKind::LAUNCH_FAILURE,
                                 "no backend registered for " + core::IsolationKindToString(kind));
    }
    return *it->second;
}

bool BackendSet::Has(core::IsolationKind kind) const {
    return backends_.count(kind) > 0;
}

BackendSet MakeDefaultBackends(const core::ServiceConfig& config,
                               std::shared_ptr<utils::CommandRunner> runner) {
    BackendSet set;
    set.Register(std::make_shared<NamespaceBackend>(config.namespace_settings, runner));
    set.Register(std::make_shared<ContainerBackend>(config.container_settings, runner));
    set.Register(std::make_shared<RestrictedProcessBackend>(config.restricted_settings));
    return set;
}

// ============================================================================
// SHARED HELPERS
// ============================================================================

utils::Subprocess::ExitCallback WrapExitCallback(std::shared_ptr<LaunchResources> resources,
                                                 utils::Subprocess::ExitCallback on_exit) {
    return [resources = std::move(resources), on_exit = std::move(on_exit)]
           (const utils::ExitStatus& status) {
        if (resources) {
            resources->Release();
        }
        if (on_exit) {
            on_exit(status);
        }
    };
}

void TerminateProcess(const LaunchHandle& handle, const TerminationOptions& options) {
    if (!handle.process) {
        return;
    }
    if (!handle.process->Terminate(options.grace_period)) {
        throw core::SandboxError(core::ErrorKind::TERMINATION_FAILURE,
                                 "process " + std::to_string(handle.pid()) +
                                 " did not exit after SIGKILL");
    }
}

std::vector<std::string> ShellArgv(const std::string& shell, const std::string& command) {
    if (utils::StringUtils::Trim(command).empty()) {
        return {shell};
    }
    return {shell, "-c", command};
}

std::optional<int> CpuCountFor(const core::Policy& policy) {
    if (!policy.max_cpu_cores) {
        return std::nullopt;
    }
    return std::max(1, static_cast<int>(std::ceil(*policy.max_cpu_cores)));
}

std::vector<std::string> SanitizedEnvironment(const std::string& search_path,
                                              const std::string& home,
                                              const std::vector<std::string>& passthrough) {
    std::vector<std::string> env = {"PATH=" + search_path};
    if (!home.empty()) {
        env.push_back("HOME=" + home);
    }
    for (const auto& name : passthrough) {
        if (name == "PATH" || name == "HOME") {
            continue;
        }
        if (const char* value = std::getenv(name.c_str())) {
            env.push_back(name + "=" + value);
        }
    }
    return env;
}

std::vector<std::string> DescribeNetworkPolicy(const core::Policy& policy) {
    std::vector<std::string> lines;
    if (!policy.allowed_networks.empty()) {
        std::vector<std::string> hosts(policy.allowed_networks.begin(),
                                       policy.allowed_networks.end());
        lines.push_back("Network allowlist: " + utils::StringUtils::Join(hosts, ", "));
    }
    if (!policy.blocked_networks.empty()) {
        std::vector<std::string> hosts(policy.blocked_networks.begin(),
                                       policy.blocked_networks.end());
        lines.push_back("Network blocklist: " + utils::StringUtils::Join(hosts, ", "));
    }
    if (lines.empty()) {
        lines.push_back("Network: disabled");
    }
    return lines;
}

} // namespace backends
} // namespace warden
