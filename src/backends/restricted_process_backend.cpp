/**
 * @file restricted_process_backend.cpp
 * @brief Plain child process with a reduced environment and rlimits
 *
 * @date 2025
 */

#include "warden/backends/restricted_process_backend.hpp"
#include "warden/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace warden {
namespace backends {

RestrictedProcessBackend::RestrictedProcessBackend(core::RestrictedProcessSettings settings)
    : settings_(std::move(settings)) {
    spdlog::info("Restricted-process backend initialized (PATH={})", settings_.search_path);
}

utils::SpawnOptions RestrictedProcessBackend::BuildSpawnOptions(const core::Policy& policy,
                                                                const std::string& command) const {
    utils::SpawnOptions options;
    options.argv = ShellArgv(settings_.default_shell, command);
    options.environment = SanitizedEnvironment(settings_.search_path, "", settings_.passthrough_env);
    options.working_directory = "/tmp";
    options.memory_limit_mb = policy.max_memory_mb;
    options.cpu_count = CpuCountFor(policy);
    options.no_new_privileges = true;
    options.kill_with_parent = true;
    return options;
}

LaunchHandle RestrictedProcessBackend::Launch(const core::Policy& policy,
                                              const std::string& command,
                                              LaunchCallbacks callbacks) {
    LaunchHandle handle;

    bool has_lists = !policy.allowed_networks.empty() || !policy.blocked_networks.empty() ||
                     !policy.allowed_files.empty() || !policy.blocked_files.empty();
    if (has_lists) {
        if (!policy.allowed_networks.empty() || !policy.blocked_networks.empty()) {
            handle.notes = DescribeNetworkPolicy(policy);
        }
        handle.notes.push_back("Restricted process: file and network lists are not enforced");
    }

    auto options = BuildSpawnOptions(policy, command);

    try {
        handle.process = utils::Subprocess::Spawn(options, std::move(callbacks.on_output),
                                                  WrapExitCallback(nullptr, std::move(callbacks.on_exit)));
    }
    catch (const std::system_error& e) {
        throw core::SandboxError(core::ErrorKind::LAUNCH_FAILURE,
                                 std::string("process launch failed: ") + e.what());
    }

    spdlog::info("Restricted process launched: {}", handle.Describe());
    return handle;
}

void RestrictedProcessBackend::Terminate(const LaunchHandle& handle,
                                         const TerminationOptions& options) {
    TerminateProcess(handle, options);
}

} // namespace backends
} // namespace warden
