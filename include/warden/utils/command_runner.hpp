/**
 * @file command_runner.hpp
 * @brief Synchronous helper command execution (docker, ip, iptables)
 *
 * Backends drive host tooling through a CommandRunner so the exact
 * invocations can be recorded in tests instead of touching the host.
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace warden {
namespace utils {

/**
 * @struct CommandResult
 * @brief Outcome of a helper command
 */
struct CommandResult {
    int exit_code{0};      ///< Exit status (-1 if the command could not run)
    std::string output;    ///< Combined stdout and stderr

    bool Succeeded() const { return exit_code == 0; }
};

/**
 * @class CommandRunner
 * @brief Runs an argv to completion and captures its output
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// Non-zero exits are reported in the result, never thrown.
    virtual CommandResult Run(const std::vector<std::string>& argv) = 0;
};

/**
 * @class SystemCommandRunner
 * @brief CommandRunner backed by /bin/sh via popen
 *
 * Every argument is single-quoted, so argv elements never undergo word
 * splitting or expansion.
 */
class SystemCommandRunner : public CommandRunner {
public:
    CommandResult Run(const std::vector<std::string>& argv) override;
};

std::shared_ptr<CommandRunner> MakeSystemCommandRunner();

} // namespace utils
} // namespace warden
