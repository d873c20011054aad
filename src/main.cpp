/**
 * @file main.cpp
 * @brief warden - command-line front end for the sandbox lifecycle manager
 *
 * `warden run` creates one sandbox, starts a command in it, streams its log
 * until it reaches a terminal state and prints a JSON report.
 * `warden default-policy` prints the policy applied when none is given.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "warden/backends/backend.hpp"
#include "warden/core/errors.hpp"
#include "warden/core/lifecycle_manager.hpp"
#include "warden/core/service_config.hpp"
#include "warden/reporters/json_reporter.hpp"
#include "warden/utils/command_runner.hpp"
#include "warden/utils/string_utils.hpp"

#include <algorithm>
#include <chrono>
#include <climits>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void HandleSignal(int) {
    g_interrupted = 1;
}

/*******************************************************************************
 * Run Options
 ******************************************************************************/

struct RunOptions {
    std::string name{"cli"};
    std::string isolation;
    std::vector<std::string> allow;
    std::vector<std::string> block;
    std::vector<std::string> allow_files;
    std::vector<std::string> block_files;
    std::optional<std::size_t> memory_mb;
    std::optional<double> cpus;
    std::optional<int> timeout;
    bool no_timeout{false};
    std::string policy_file;
    std::string image;
    std::string output_file;
    bool json_only{false};
    std::vector<std::string> command;
};

warden::core::Policy BuildPolicy(const warden::core::ServiceConfig& config,
                                 const RunOptions& options) {
    using warden::core::Policy;

    Policy policy = config.default_policy;

    if (!options.policy_file.empty()) {
        std::ifstream file(options.policy_file);
        if (!file) {
            throw warden::core::SandboxError(warden::core::ErrorKind::INVALID_INPUT,
                                             "cannot open policy file: " + options.policy_file);
        }
        json document;
        try {
            file >> document;
        }
        catch (const json::parse_error& e) {
            throw warden::core::SandboxError(warden::core::ErrorKind::INVALID_INPUT,
                                             std::string("policy file is not valid JSON: ") + e.what());
        }
        policy = warden::core::PolicyFromJson(document, policy);
    }

    if (!options.isolation.empty()) {
        policy.isolation_kind = warden::core::ParseIsolationKind(options.isolation);
    }
    if (!options.allow.empty()) {
        policy.allowed_networks = {options.allow.begin(), options.allow.end()};
    }
    if (!options.block.empty()) {
        policy.blocked_networks = {options.block.begin(), options.block.end()};
    }
    if (!options.allow_files.empty()) {
        policy.allowed_files = {options.allow_files.begin(), options.allow_files.end()};
    }
    if (!options.block_files.empty()) {
        policy.blocked_files = {options.block_files.begin(), options.block_files.end()};
    }
    if (options.memory_mb) {
        policy.max_memory_mb = options.memory_mb;
    }
    if (options.cpus) {
        policy.max_cpu_cores = options.cpus;
    }
    if (options.timeout) {
        policy.timeout_seconds = options.timeout;
    }
    if (options.no_timeout) {
        policy.timeout_seconds.reset();
    }

    policy.Validate();
    return policy;
}

// A single argument is taken as a shell command line; several are quoted
std::string BuildCommand(const std::vector<std::string>& parts) {
    if (parts.size() == 1) {
        return parts.front();
    }
    std::vector<std::string> quoted;
    quoted.reserve(parts.size());
    for (const auto& part : parts) {
        quoted.push_back(warden::utils::StringUtils::ShellQuote(part));
    }
    return warden::utils::StringUtils::Join(quoted, " ");
}

/*******************************************************************************
 * Commands
 ******************************************************************************/

int RunSandbox(warden::core::ServiceConfig config, const RunOptions& options) {
    using warden::core::SandboxStatus;

    if (!options.image.empty()) {
        config.container_settings.image = options.image;
    }

    auto policy = BuildPolicy(config, options);
    auto backends = warden::backends::MakeDefaultBackends(config,
                                                          warden::utils::MakeSystemCommandRunner());
    warden::core::LifecycleManager manager(config, std::move(backends));

    auto sandbox = manager.Create(options.name, policy);
    spdlog::info("Sandbox {} created ({})", sandbox.id,
                 warden::core::IsolationKindToString(policy.isolation_kind));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    manager.Start(sandbox.id, BuildCommand(options.command));

    std::size_t position = 0;
    bool stop_requested = false;
    while (true) {
        bool settled = manager.WaitUntilSettled(sandbox.id, std::chrono::milliseconds(200));

        if (!options.json_only) {
            auto chunk = manager.GetLogsSince(sandbox.id, position);
            if (chunk.dropped > 0) {
                std::cout << "... " << chunk.dropped << " log lines dropped\n";
            }
            for (const auto& line : chunk.lines) {
                std::cout << line << "\n";
            }
            position = chunk.next;
            std::cout.flush();
        }

        if (settled) {
            break;
        }
        if (g_interrupted && !stop_requested) {
            spdlog::warn("Interrupted, stopping sandbox {}", sandbox.id);
            manager.Stop(sandbox.id);
            stop_requested = true;
        }
    }

    auto final_state = manager.Get(sandbox.id);
    auto total = manager.LogLineCount(sandbox.id);

    warden::reporters::JsonReporter reporter;
    std::string report = reporter.GenerateRunReport(
        final_state, manager.GetLogs(sandbox.id, static_cast<int>(std::min<std::size_t>(total, INT_MAX))),
        total);

    if (!options.output_file.empty()) {
        if (!reporter.SaveReport(report, options.output_file)) {
            spdlog::warn("Failed to write report to {}", options.output_file);
        }
    }
    if (options.json_only || options.output_file.empty()) {
        std::cout << report << std::endl;
    }

    bool clean = final_state.status == SandboxStatus::STOPPED &&
                 final_state.exit_code.value_or(-1) == 0;
    spdlog::info("Sandbox {} {} (exit code {})", sandbox.id,
                 warden::core::SandboxStatusToString(final_state.status),
                 final_state.exit_code ? std::to_string(*final_state.exit_code) : "none");
    return clean ? 0 : 2;
}

int PrintDefaultPolicy(const warden::core::ServiceConfig& config) {
    std::cout << warden::core::PolicyToJson(config.default_policy).dump(2) << std::endl;
    return 0;
}

int PrintConfig(const warden::core::ServiceConfig& config) {
    std::cout << warden::core::ServiceConfigToJson(config).dump(2) << std::endl;
    return 0;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"warden - OS-level sandbox lifecycle manager"};
    app.require_subcommand(1);

    std::string config_path;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "Service configuration file (JSON)")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    RunOptions run_options;
    auto* run = app.add_subcommand("run", "Run a command in a new sandbox and report the outcome");
    run->add_option("-n,--name", run_options.name, "Sandbox name")->default_val("cli");
    run->add_option("-i,--isolation", run_options.isolation,
                    "Isolation kind: namespace, container, restricted-process");
    run->add_option("--allow", run_options.allow, "Allowed network host (repeatable)");
    run->add_option("--block", run_options.block, "Blocked network host (repeatable)");
    run->add_option("--allow-file", run_options.allow_files, "Allowed path prefix (repeatable)");
    run->add_option("--block-file", run_options.block_files, "Blocked path prefix (repeatable)");
    run->add_option("--memory", run_options.memory_mb, "Memory ceiling in MB");
    run->add_option("--cpus", run_options.cpus, "CPU ceiling in cores");
    run->add_option("--timeout", run_options.timeout, "Timeout in seconds");
    run->add_flag("--no-timeout", run_options.no_timeout, "Disable the default timeout");
    run->add_option("--policy", run_options.policy_file, "Policy file (JSON)")
        ->check(CLI::ExistingFile);
    run->add_option("--image", run_options.image, "Container image for container isolation");
    run->add_option("-o,--output", run_options.output_file, "Write the JSON report to a file");
    run->add_flag("--json", run_options.json_only, "Print only the JSON report");
    run->add_option("command", run_options.command, "Command to run (after --)");

    auto* default_policy = app.add_subcommand("default-policy", "Print the default policy as JSON");
    auto* show_config = app.add_subcommand("config", "Print the effective service configuration");

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        warden::core::ServiceConfig config;
        if (!config_path.empty()) {
            config = warden::core::LoadServiceConfig(config_path);
        }
        warden::core::ApplyEnvironmentOverrides(config);

        if (*run) {
            return RunSandbox(config, run_options);
        }
        if (*default_policy) {
            return PrintDefaultPolicy(config);
        }
        if (*show_config) {
            return PrintConfig(config);
        }
    }
    catch (const warden::core::SandboxError& e) {
        spdlog::error("[{}] {}", warden::core::ErrorKindToString(e.kind()), e.what());
        return 1;
    }
    catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
