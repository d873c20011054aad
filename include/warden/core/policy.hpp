/**
 * @file policy.hpp
 * @brief Network, filesystem and resource policy attached to a sandbox
 *
 * A Policy is a plain value: the manager copies it into each sandbox and
 * backends receive it by const reference at launch time. Precedence between
 * allow and block lists is always deny-wins.
 *
 * **Network semantics**:
 * - allowed non-empty: only listed hosts (minus blocked) are reachable
 * - allowed empty, blocked non-empty: everything except blocked is reachable
 * - both empty: no egress at all
 *
 * **Usage Example**:
 * @code
 * Policy policy = Policy::Default();
 * policy.isolation_kind = IsolationKind::CONTAINER;
 * policy.blocked_networks.insert("api.openai.com");
 * policy.Validate();
 *
 * policy.IsHostReachable("api.github.com");   // true
 * policy.IsHostReachable("api.openai.com");   // false (deny-wins)
 * policy.IsHostReachable("example.org");      // false (not listed)
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <optional>
#include <set>
#include <string>

namespace warden {
namespace core {

/**
 * @enum IsolationKind
 * @brief Mechanism used to contain a sandbox's process
 */
enum class IsolationKind {
    NAMESPACE,          ///< Linux namespaces via bubblewrap
    CONTAINER,          ///< Ephemeral container via the container runtime
    RESTRICTED_PROCESS  ///< Plain child process, sanitized env and rlimits only
};

/**
 * @enum NetworkAccess
 * @brief Egress mode derived from the allow/block lists
 */
enum class NetworkAccess {
    NONE,              ///< No egress
    ALLOW_LISTED,      ///< Only the effective allowlist
    ALLOW_ALL_EXCEPT   ///< Everything but the blocklist
};

std::string IsolationKindToString(IsolationKind kind);

/**
 * @brief Parse an isolation kind name
 *
 * Accepts "namespace", "container", "restricted-process" and the legacy
 * aliases "bubblewrap", "docker", "proc".
 *
 * @throws SandboxError (INVALID_INPUT) for an unknown name
 */
IsolationKind ParseIsolationKind(const std::string& name);

/**
 * @struct Policy
 * @brief Immutable-by-convention constraint set for one sandbox
 */
struct Policy {
    IsolationKind isolation_kind{IsolationKind::NAMESPACE};  ///< Backend selector

    std::set<std::string> allowed_networks;   ///< Host names, IPs or CIDRs
    std::set<std::string> blocked_networks;   ///< Host names, IPs or CIDRs
    std::set<std::string> allowed_files;      ///< Absolute path prefixes
    std::set<std::string> blocked_files;      ///< Absolute path prefixes

    std::optional<std::size_t> max_memory_mb;   ///< Absent: backend default
    std::optional<double> max_cpu_cores;        ///< Absent: backend default
    std::optional<int> timeout_seconds;         ///< Absent: no watchdog

    /**
     * @brief Default policy applied when create() is called without one
     *
     * Namespace isolation, allowlist {api.github.com, api.openai.com,
     * api.anthropic.com}, 512 MB, 1 core, 300 s timeout.
     */
    static Policy Default();

    /**
     * @brief Check numeric ceilings and path syntax
     * @throws SandboxError (INVALID_INPUT) on non-positive ceilings or
     *         relative file prefixes
     */
    void Validate() const;

    NetworkAccess GetNetworkAccess() const;

    /// Allowed hosts with every blocked host removed.
    std::set<std::string> EffectiveAllowedNetworks() const;

    /// Allowed file prefixes that do not fall under a blocked prefix.
    std::set<std::string> EffectiveAllowedFiles() const;

    bool IsHostReachable(const std::string& host) const;

    /**
     * @brief Whether a path is reachable under the file lists
     *
     * Blocked prefixes always win. With a non-empty allowlist the path must
     * sit under one of its prefixes.
     */
    bool IsPathAllowed(const std::string& path) const;

    bool operator==(const Policy& other) const;
    bool operator!=(const Policy& other) const { return !(*this == other); }
};

/// Lowercase, strip a trailing dot and surrounding whitespace.
std::string NormalizeHost(const std::string& host);

/// True if @p path equals @p prefix or lies beneath it.
bool PathHasPrefix(const std::string& path, const std::string& prefix);

/**
 * @brief Serialize with camelCase keys (isolationKind, allowedNetworks, ...)
 */
nlohmann::json PolicyToJson(const Policy& policy);

/**
 * @brief Deserialize, starting from @p base for fields the document omits
 * @throws SandboxError (INVALID_INPUT) on wrong types or unknown kinds
 */
Policy PolicyFromJson(const nlohmann::json& document, const Policy& base = Policy{});

} // namespace core
} // namespace warden
