/**
 * @file service_config.cpp
 * @brief Service configuration loading (JSON file + environment)
 *
 * @date 2025
 */

#include "warden/core/service_config.hpp"
#include "warden/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace warden {
namespace core {

namespace {

template <typename T>
void ReadField(const json& node, const char* key, T& target) {
    if (node.contains(key) && !node.at(key).is_null()) {
        target = node.at(key).get<T>();
    }
}

long long ParseEnvNumber(const char* name, const char* value) {
    try {
        std::size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    }
    catch (const std::exception&) {
        throw SandboxError(ErrorKind::INVALID_INPUT,
                           std::string(name) + " must be an integer, got '" + value + "'");
    }
}

} // anonymous namespace

// ============================================================================
// JSON
// ============================================================================

ServiceConfig ServiceConfigFromJson(const json& document) {
    if (!document.is_object()) {
        throw SandboxError(ErrorKind::INVALID_INPUT, "configuration must be a JSON object");
    }

    ServiceConfig config;

    try {
        ReadField(document, "port", config.port);
        ReadField(document, "logCapacity", config.log_capacity);
        ReadField(document, "launchWorkers", config.launch_workers);
        ReadField(document, "watchdogWorkers", config.watchdog_workers);

        if (document.contains("terminationGraceMs")) {
            config.termination_grace =
                std::chrono::milliseconds(document.at("terminationGraceMs").get<long long>());
        }

        if (document.contains("defaultPolicy")) {
            config.default_policy = PolicyFromJson(document.at("defaultPolicy"),
                                                   config.default_policy);
        }

        if (document.contains("namespace")) {
            const auto& ns = document.at("namespace");
            auto& s = config.namespace_settings;
            ReadField(ns, "bwrap", s.bwrap_binary);
            ReadField(ns, "ip", s.ip_binary);
            ReadField(ns, "iptables", s.iptables_binary);
            ReadField(ns, "sysctl", s.sysctl_binary);
            ReadField(ns, "defaultShell", s.default_shell);
            ReadField(ns, "subnetBase", s.subnet_base);
            ReadField(ns, "systemPaths", s.system_paths);
            if (ns.contains("resolvConf")) {
                s.resolv_conf = ns.at("resolvConf").get<std::string>();
            }
            if (ns.contains("stateDir")) {
                s.state_dir = ns.at("stateDir").get<std::string>();
            }
        }

        if (document.contains("container")) {
            const auto& c = document.at("container");
            auto& s = config.container_settings;
            ReadField(c, "runtime", s.runtime_binary);
            ReadField(c, "iptables", s.iptables_binary);
            ReadField(c, "image", s.image);
            ReadField(c, "defaultShell", s.default_shell);
            ReadField(c, "subnetBase", s.subnet_base);
            ReadField(c, "pidsLimit", s.pids_limit);
        }

        if (document.contains("restrictedProcess")) {
            const auto& r = document.at("restrictedProcess");
            auto& s = config.restricted_settings;
            ReadField(r, "searchPath", s.search_path);
            ReadField(r, "defaultShell", s.default_shell);
            ReadField(r, "passthroughEnv", s.passthrough_env);
        }
    }
    catch (const json::exception& e) {
        throw SandboxError(ErrorKind::INVALID_INPUT,
                           std::string("malformed configuration: ") + e.what());
    }

    if (config.port <= 0 || config.port > 65535) {
        throw SandboxError(ErrorKind::INVALID_INPUT,
                           "port out of range: " + std::to_string(config.port));
    }
    if (config.termination_grace.count() < 0) {
        throw SandboxError(ErrorKind::INVALID_INPUT, "terminationGraceMs must not be negative");
    }

    return config;
}

json ServiceConfigToJson(const ServiceConfig& config) {
    const auto& ns = config.namespace_settings;
    const auto& c = config.container_settings;
    const auto& r = config.restricted_settings;

    return json{
        {"port", config.port},
        {"logCapacity", config.log_capacity},
        {"launchWorkers", config.launch_workers},
        {"watchdogWorkers", config.watchdog_workers},
        {"terminationGraceMs", config.termination_grace.count()},
        {"defaultPolicy", PolicyToJson(config.default_policy)},
        {"namespace", {
            {"bwrap", ns.bwrap_binary},
            {"ip", ns.ip_binary},
            {"iptables", ns.iptables_binary},
            {"sysctl", ns.sysctl_binary},
            {"defaultShell", ns.default_shell},
            {"subnetBase", ns.subnet_base},
            {"systemPaths", ns.system_paths},
            {"resolvConf", ns.resolv_conf.string()},
            {"stateDir", ns.state_dir.string()}
        }},
        {"container", {
            {"runtime", c.runtime_binary},
            {"iptables", c.iptables_binary},
            {"image", c.image},
            {"defaultShell", c.default_shell},
            {"subnetBase", c.subnet_base},
            {"pidsLimit", c.pids_limit}
        }},
        {"restrictedProcess", {
            {"searchPath", r.search_path},
            {"defaultShell", r.default_shell},
            {"passthroughEnv", r.passthrough_env}
        }}
    };
}

ServiceConfig LoadServiceConfig(const std::filesystem::path& path) {
    spdlog::info("Loading configuration: {}", path.string());

    std::ifstream file(path);
    if (!file) {
        throw SandboxError(ErrorKind::INVALID_INPUT,
                           "cannot open configuration file: " + path.string());
    }

    json document;
    try {
        file >> document;
    }
    catch (const json::parse_error& e) {
        throw SandboxError(ErrorKind::INVALID_INPUT,
                           "configuration is not valid JSON: " + std::string(e.what()));
    }

    return ServiceConfigFromJson(document);
}

// ============================================================================
// ENVIRONMENT
// ============================================================================

void ApplyEnvironmentOverrides(ServiceConfig& config) {
    if (const char* port = std::getenv("WARDEN_PORT")) {
        auto value = ParseEnvNumber("WARDEN_PORT", port);
        if (value <= 0 || value > 65535) {
            throw SandboxError(ErrorKind::INVALID_INPUT, "WARDEN_PORT out of range");
        }
        config.port = static_cast<int>(value);
        spdlog::debug("WARDEN_PORT override: {}", config.port);
    }
    if (const char* image = std::getenv("WARDEN_CONTAINER_IMAGE")) {
        config.container_settings.image = image;
        spdlog::debug("WARDEN_CONTAINER_IMAGE override: {}", image);
    }
    if (const char* runtime = std::getenv("WARDEN_CONTAINER_RUNTIME")) {
        config.container_settings.runtime_binary = runtime;
    }
    if (const char* capacity = std::getenv("WARDEN_LOG_CAPACITY")) {
        auto value = ParseEnvNumber("WARDEN_LOG_CAPACITY", capacity);
        if (value < 0) {
            throw SandboxError(ErrorKind::INVALID_INPUT, "WARDEN_LOG_CAPACITY must not be negative");
        }
        config.log_capacity = static_cast<std::size_t>(value);
    }
    if (const char* workers = std::getenv("WARDEN_LAUNCH_WORKERS")) {
        auto value = ParseEnvNumber("WARDEN_LAUNCH_WORKERS", workers);
        if (value <= 0) {
            throw SandboxError(ErrorKind::INVALID_INPUT, "WARDEN_LAUNCH_WORKERS must be positive");
        }
        config.launch_workers = static_cast<std::size_t>(value);
    }
}

} // namespace core
} // namespace warden
