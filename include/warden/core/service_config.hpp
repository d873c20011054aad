/**
 * @file service_config.hpp
 * @brief Process-wide configuration for the sandbox service
 *
 * Settings come from three layers, later layers winning:
 * 1. In-class defaults below
 * 2. A JSON file (LoadServiceConfig)
 * 3. WARDEN_* environment variables (ApplyEnvironmentOverrides)
 *
 * The command-line front end applies its flags on top.
 *
 * **JSON Example**:
 * ```json
 * {
 *   "port": 3003,
 *   "logCapacity": 10000,
 *   "launchWorkers": 4,
 *   "watchdogWorkers": 2,
 *   "terminationGraceMs": 2000,
 *   "defaultPolicy": { "isolationKind": "namespace", "maxMemoryMb": 512 },
 *   "container": { "runtime": "docker", "image": "alpine:latest" },
 *   "namespace": { "bwrap": "bwrap", "subnetBase": "10.200.0.0" }
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "warden/core/policy.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace warden {
namespace core {

/**
 * @struct NamespaceSettings
 * @brief bubblewrap and network-namespace tooling
 */
struct NamespaceSettings {
    std::string bwrap_binary{"bwrap"};               ///< bubblewrap executable
    std::string ip_binary{"ip"};                     ///< iproute2 executable
    std::string iptables_binary{"iptables"};         ///< iptables executable
    std::string sysctl_binary{"sysctl"};             ///< Turns on net.ipv4.ip_forward
    std::string default_shell{"/bin/sh"};            ///< Used when no command given
    std::string subnet_base{"10.200.0.0"};           ///< /16 carved into /30 links
    std::filesystem::path resolv_conf{"/etc/resolv.conf"};  ///< Bound read-only
    std::filesystem::path state_dir{"/run/warden"};  ///< Generated hosts files
    std::vector<std::string> system_paths{"/usr", "/bin", "/sbin", "/lib", "/lib64", "/etc"};
};

/**
 * @struct ContainerSettings
 * @brief Container runtime invocation
 */
struct ContainerSettings {
    std::string runtime_binary{"docker"};            ///< docker or podman
    std::string iptables_binary{"iptables"};         ///< Applies DOCKER-USER rules
    std::string image{"alpine:latest"};              ///< Image for every sandbox
    std::string default_shell{"/bin/sh"};            ///< Used when no command given
    std::string subnet_base{"10.201.0.0"};           ///< /16 carved into /28 networks
    int pids_limit{256};                             ///< --pids-limit
};

/**
 * @struct RestrictedProcessSettings
 * @brief Environment shaping for plain child processes
 */
struct RestrictedProcessSettings {
    std::string search_path{"/usr/bin:/bin"};        ///< PATH inside the sandbox
    std::string default_shell{"/bin/sh"};            ///< Used when no command given
    std::vector<std::string> passthrough_env{"LANG", "LC_ALL", "TERM", "TZ"};
};

/**
 * @struct ServiceConfig
 * @brief Complete service configuration
 */
struct ServiceConfig {
    Policy default_policy{Policy::Default()};        ///< Applied when create() gets none
    int port{3003};                                  ///< API surface listen port
    std::size_t log_capacity{10000};                 ///< Per-sandbox lines kept (0 = all)
    std::size_t launch_workers{4};                   ///< Threads running backend launches
    std::size_t watchdog_workers{2};                 ///< Threads running timeout stops
    std::chrono::milliseconds termination_grace{2000};  ///< SIGTERM → SIGKILL

    NamespaceSettings namespace_settings;
    ContainerSettings container_settings;
    RestrictedProcessSettings restricted_settings;
};

/**
 * @brief Parse a configuration document over the defaults
 * @throws SandboxError (INVALID_INPUT) on malformed values
 */
ServiceConfig ServiceConfigFromJson(const nlohmann::json& document);

nlohmann::json ServiceConfigToJson(const ServiceConfig& config);

/**
 * @brief Read and parse a JSON configuration file
 * @throws SandboxError (INVALID_INPUT) if unreadable or malformed
 */
ServiceConfig LoadServiceConfig(const std::filesystem::path& path);

/**
 * @brief Apply WARDEN_PORT, WARDEN_CONTAINER_IMAGE, WARDEN_CONTAINER_RUNTIME,
 *        WARDEN_LOG_CAPACITY and WARDEN_LAUNCH_WORKERS
 * @throws SandboxError (INVALID_INPUT) on non-numeric numeric overrides
 */
void ApplyEnvironmentOverrides(ServiceConfig& config);

} // namespace core
} // namespace warden
