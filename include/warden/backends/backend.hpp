/**
 * @file backend.hpp
 * @brief Uniform launch/terminate contract over isolation mechanisms
 *
 * A Backend turns a Policy and a command into a running, contained process
 * and hands back a LaunchHandle as soon as the process exists. Backends keep
 * no per-sandbox state: whatever host resources a launch needs (network
 * namespaces, firewall rules, container networks) travel inside the handle
 * and are released when the process ends or is terminated.
 *
 * New isolation kinds are added by implementing Backend and registering it
 * in a BackendSet; the lifecycle manager never branches on the kind itself.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/policy.hpp"
#include "warden/utils/subprocess.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden {

namespace core {
struct ServiceConfig;
}

namespace utils {
class CommandRunner;
}

namespace backends {

/**
 * @class LaunchResources
 * @brief Host-side state owned by one launch
 *
 * Release() undoes whatever the launch set up. It is called on natural exit
 * and after termination, possibly from different threads, and must be
 * idempotent; the base class guarantees a single ReleaseOnce() call.
 */
class LaunchResources {
public:
    virtual ~LaunchResources() = default;

    void Release();

protected:
    virtual void ReleaseOnce() = 0;

private:
    std::once_flag released_;
};

/**
 * @struct LaunchHandle
 * @brief Opaque reference to a launched process or container
 */
struct LaunchHandle {
    std::shared_ptr<utils::Subprocess> process;    ///< Supervised host process
    std::string reference;                         ///< Container name / netns name
    std::shared_ptr<LaunchResources> resources;    ///< Released on exit/terminate
    std::vector<std::string> notes;                ///< Launch details for the sandbox log

    bool IsValid() const { return static_cast<bool>(process); }
    int pid() const;

    /// "pid 4242" or "warden-1a2b3c4d (pid 4242)"
    std::string Describe() const;
};

/**
 * @struct LaunchCallbacks
 * @brief Who owns a launch, and where its process reports output and completion
 */
struct LaunchCallbacks {
    std::string sandbox_id;                        ///< Owner; names per-sandbox resources
    utils::Subprocess::OutputCallback on_output;   ///< One call per line
    utils::Subprocess::ExitCallback on_exit;       ///< Once, after resources are released
};

/**
 * @struct TerminationOptions
 * @brief How hard to try when stopping a handle
 */
struct TerminationOptions {
    std::chrono::milliseconds grace_period{2000};  ///< SIGTERM → SIGKILL delay
};

/**
 * @class Backend
 * @brief Isolation mechanism capability
 */
class Backend {
public:
    virtual ~Backend() = default;

    virtual core::IsolationKind kind() const = 0;

    /**
     * @brief Start @p command under @p policy
     *
     * Returns once the process exists. Policy enforcement (network, file,
     * memory, CPU) is in place before the command begins executing.
     *
     * @param command Shell command; empty selects the backend's default shell
     * @throws core::SandboxError (LAUNCH_FAILURE)
     */
    virtual LaunchHandle Launch(const core::Policy& policy,
                                const std::string& command,
                                LaunchCallbacks callbacks) = 0;

    /**
     * @brief Stop a launched process and release its resources
     *
     * A handle whose process already exited is a successful no-op.
     *
     * @throws core::SandboxError (TERMINATION_FAILURE)
     */
    virtual void Terminate(const LaunchHandle& handle,
                           const TerminationOptions& options) = 0;
};

/**
 * @class BackendSet
 * @brief Backend lookup by isolation kind
 */
class BackendSet {
public:
    void Register(std::shared_ptr<Backend> backend);

    /// @throws core::SandboxError (LAUNCH_FAILURE) if no backend is registered
    Backend& Get(core::IsolationKind kind) const;

    bool Has(core::IsolationKind kind) const;

private:
    std::map<core::IsolationKind, std::shared_ptr<Backend>> backends_;
};

/**
 * @brief Namespace, container and restricted-process backends wired from config
 */
BackendSet MakeDefaultBackends(const core::ServiceConfig& config,
                               std::shared_ptr<utils::CommandRunner> runner);

/**
 * @brief Shared exit path for backends
 *
 * Releases @p resources, then forwards to the caller's exit callback.
 */
utils::Subprocess::ExitCallback WrapExitCallback(std::shared_ptr<LaunchResources> resources,
                                                 utils::Subprocess::ExitCallback on_exit);

/**
 * @brief Signal a handle's process group and wait for it to be reaped
 * @throws core::SandboxError (TERMINATION_FAILURE) if it survives SIGKILL
 */
void TerminateProcess(const LaunchHandle& handle, const TerminationOptions& options);

/// {shell} for an empty command, else {shell, "-c", command}.
std::vector<std::string> ShellArgv(const std::string& shell, const std::string& command);

/// ceil(max_cpu_cores), absent when the policy sets no CPU ceiling.
std::optional<int> CpuCountFor(const core::Policy& policy);

/**
 * @brief Minimal "KEY=VALUE" environment for sandboxed commands
 *
 * PATH is @p search_path, HOME is @p home (omitted when empty), and only the
 * variables named in @p passthrough are copied from the service's own
 * environment.
 */
std::vector<std::string> SanitizedEnvironment(const std::string& search_path,
                                              const std::string& home,
                                              const std::vector<std::string>& passthrough);

/// "Network allowlist: a, b" / "Network blocklist: c" / "Network: disabled".
std::vector<std::string> DescribeNetworkPolicy(const core::Policy& policy);

} // namespace backends
} // namespace warden
