/**
 * @file policy.cpp
 * @brief Policy model: defaults, validation, deny-wins evaluation, JSON mapping
 *
 * @date 2025
 */

#include "warden/core/policy.hpp"
#include "warden/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace warden {
namespace core {

namespace {

std::set<std::string> NormalizeHosts(const std::set<std::string>& hosts) {
    std::set<std::string> normalized;
    for (const auto& host : hosts) {
        auto h = NormalizeHost(host);
        if (!h.empty()) {
            normalized.insert(h);
        }
    }
    return normalized;
}

bool UnderAnyPrefix(const std::string& path, const std::set<std::string>& prefixes) {
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [&path](const std::string& prefix) {
                           return PathHasPrefix(path, prefix);
                       });
}

std::set<std::string> ReadStringSet(const json& document, const char* key) {
    std::set<std::string> values;
    const auto& node = document.at(key);
    if (node.is_null()) {
        return values;
    }
    if (!node.is_array()) {
        throw SandboxError(ErrorKind::INVALID_INPUT,
                           std::string(key) + " must be an array of strings");
    }
    for (const auto& item : node) {
        if (!item.is_string()) {
            throw SandboxError(ErrorKind::INVALID_INPUT,
                               std::string(key) + " must be an array of strings");
        }
        values.insert(item.get<std::string>());
    }
    return values;
}

} // anonymous namespace

// ============================================================================
// ISOLATION KIND NAMES
// ============================================================================

std::string IsolationKindToString(IsolationKind kind) {
    switch (kind) {
        case IsolationKind::NAMESPACE:          return "namespace";
        case IsolationKind::CONTAINER:          return "container";
        case IsolationKind::RESTRICTED_PROCESS: return "restricted-process";
    }
    return "unknown";
}

IsolationKind ParseIsolationKind(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "namespace" || lowered == "bubblewrap") {
        return IsolationKind::NAMESPACE;
    }
    if (lowered == "container" || lowered == "docker") {
        return IsolationKind::CONTAINER;
    }
    if (lowered == "restricted-process" || lowered == "restrictedprocess" ||
        lowered == "proc") {
        return IsolationKind::RESTRICTED_PROCESS;
    }
    throw SandboxError(ErrorKind::INVALID_INPUT, "unknown isolation kind: " + name);
}

// ============================================================================
// DEFAULTS AND VALIDATION
// ============================================================================

Policy Policy::Default() {
    Policy policy;
    policy.isolation_kind = IsolationKind::NAMESPACE;
    policy.allowed_networks = {"api.github.com", "api.openai.com", "api.anthropic.com"};
    policy.max_memory_mb = 512;
    policy.max_cpu_cores = 1.0;
    policy.timeout_seconds = 300;
    return policy;
}

void Policy::Validate() const {
    if (max_memory_mb && *max_memory_mb == 0) {
        throw SandboxError(ErrorKind::INVALID_INPUT, "maxMemoryMb must be positive");
    }
    if (max_cpu_cores && !(*max_cpu_cores > 0.0)) {
        throw SandboxError(ErrorKind::INVALID_INPUT, "maxCpuCores must be positive");
    }
    if (timeout_seconds && *timeout_seconds <= 0) {
        throw SandboxError(ErrorKind::INVALID_INPUT, "timeoutSeconds must be positive");
    }
    for (const auto* files : {&allowed_files, &blocked_files}) {
        for (const auto& path : *files) {
            if (path.empty() || path.front() != '/') {
                throw SandboxError(ErrorKind::INVALID_INPUT,
                                   "file prefix must be absolute: " + path);
            }
        }
    }
}

// ============================================================================
// DENY-WINS EVALUATION
// ============================================================================

NetworkAccess Policy::GetNetworkAccess() const {
    if (!allowed_networks.empty()) {
        return NetworkAccess::ALLOW_LISTED;
    }
    if (!blocked_networks.empty()) {
        return NetworkAccess::ALLOW_ALL_EXCEPT;
    }
    return NetworkAccess::NONE;
}

std::set<std::string> Policy::EffectiveAllowedNetworks() const {
    auto allowed = NormalizeHosts(allowed_networks);
    auto blocked = NormalizeHosts(blocked_networks);

    std::set<std::string> effective;
    std::set_difference(allowed.begin(), allowed.end(),
                        blocked.begin(), blocked.end(),
                        std::inserter(effective, effective.begin()));
    return effective;
}

std::set<std::string> Policy::EffectiveAllowedFiles() const {
    std::set<std::string> effective;
    for (const auto& prefix : allowed_files) {
        if (!UnderAnyPrefix(prefix, blocked_files)) {
            effective.insert(prefix);
        }
    }
    return effective;
}

bool Policy::IsHostReachable(const std::string& host) const {
    auto h = NormalizeHost(host);
    if (NormalizeHosts(blocked_networks).count(h)) {
        return false;
    }
    switch (GetNetworkAccess()) {
        case NetworkAccess::ALLOW_LISTED:
            return NormalizeHosts(allowed_networks).count(h) > 0;
        case NetworkAccess::ALLOW_ALL_EXCEPT:
            return true;
        case NetworkAccess::NONE:
            return false;
    }
    return false;
}

bool Policy::IsPathAllowed(const std::string& path) const {
    if (UnderAnyPrefix(path, blocked_files)) {
        return false;
    }
    if (allowed_files.empty()) {
        return true;
    }
    return UnderAnyPrefix(path, allowed_files);
}

bool Policy::operator==(const Policy& other) const {
    return isolation_kind == other.isolation_kind &&
           allowed_networks == other.allowed_networks &&
           blocked_networks == other.blocked_networks &&
           allowed_files == other.allowed_files &&
           blocked_files == other.blocked_files &&
           max_memory_mb == other.max_memory_mb &&
           max_cpu_cores == other.max_cpu_cores &&
           timeout_seconds == other.timeout_seconds;
}

std::string NormalizeHost(const std::string& host) {
    auto begin = host.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = host.find_last_not_of(" \t\r\n");
    std::string result = host.substr(begin, end - begin + 1);

    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    while (result.size() > 1 && result.back() == '.') {
        result.pop_back();
    }
    return result;
}

bool PathHasPrefix(const std::string& path, const std::string& prefix) {
    if (prefix.empty()) {
        return false;
    }
    std::string p = prefix;
    while (p.size() > 1 && p.back() == '/') {
        p.pop_back();
    }
    if (p == "/") {
        return !path.empty() && path.front() == '/';
    }
    if (path.compare(0, p.size(), p) != 0) {
        return false;
    }
    // "/data" covers "/data" and "/data/x" but not "/database"
    return path.size() == p.size() || path[p.size()] == '/';
}

// ============================================================================
// JSON MAPPING
// ============================================================================

json PolicyToJson(const Policy& policy) {
    json j;
    j["isolationKind"] = IsolationKindToString(policy.isolation_kind);
    j["allowedNetworks"] = policy.allowed_networks;
    j["blockedNetworks"] = policy.blocked_networks;
    j["allowedFiles"] = policy.allowed_files;
    j["blockedFiles"] = policy.blocked_files;
    j["maxMemoryMb"] = policy.max_memory_mb ? json(*policy.max_memory_mb) : json(nullptr);
    j["maxCpuCores"] = policy.max_cpu_cores ? json(*policy.max_cpu_cores) : json(nullptr);
    j["timeoutSeconds"] = policy.timeout_seconds ? json(*policy.timeout_seconds) : json(nullptr);
    return j;
}

Policy PolicyFromJson(const json& document, const Policy& base) {
    if (!document.is_object()) {
        throw SandboxError(ErrorKind::INVALID_INPUT, "policy must be a JSON object");
    }

    Policy policy = base;

    try {
        if (document.contains("isolationKind")) {
            policy.isolation_kind =
                ParseIsolationKind(document.at("isolationKind").get<std::string>());
        } else if (document.contains("type")) {
            policy.isolation_kind = ParseIsolationKind(document.at("type").get<std::string>());
        }

        if (document.contains("allowedNetworks")) {
            policy.allowed_networks = ReadStringSet(document, "allowedNetworks");
        }
        if (document.contains("blockedNetworks")) {
            policy.blocked_networks = ReadStringSet(document, "blockedNetworks");
        }
        if (document.contains("allowedFiles")) {
            policy.allowed_files = ReadStringSet(document, "allowedFiles");
        }
        if (document.contains("blockedFiles")) {
            policy.blocked_files = ReadStringSet(document, "blockedFiles");
        }

        if (document.contains("maxMemoryMb")) {
            const auto& node = document.at("maxMemoryMb");
            if (node.is_null()) {
                policy.max_memory_mb.reset();
            } else {
                auto value = node.get<long long>();
                if (value <= 0) {
                    throw SandboxError(ErrorKind::INVALID_INPUT, "maxMemoryMb must be positive");
                }
                policy.max_memory_mb = static_cast<std::size_t>(value);
            }
        }
        if (document.contains("maxCpuCores")) {
            const auto& node = document.at("maxCpuCores");
            if (node.is_null()) {
                policy.max_cpu_cores.reset();
            } else {
                policy.max_cpu_cores = node.get<double>();
            }
        }
        if (document.contains("timeoutSeconds")) {
            const auto& node = document.at("timeoutSeconds");
            if (node.is_null()) {
                policy.timeout_seconds.reset();
            } else {
                policy.timeout_seconds = node.get<int>();
            }
        }
    }
    catch (const json::exception& e) {
        throw SandboxError(ErrorKind::INVALID_INPUT,
                           std::string("malformed policy: ") + e.what());
    }

    policy.Validate();
    return policy;
}

} // namespace core
} // namespace warden
