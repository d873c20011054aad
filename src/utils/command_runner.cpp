/**
 * @file command_runner.cpp
 * @brief popen-based helper command execution with output capture
 *
 * @date 2025
 */

#include "warden/utils/command_runner.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cstdio>
#include <sys/wait.h>

namespace warden {
namespace utils {

CommandResult SystemCommandRunner::Run(const std::vector<std::string>& argv) {
    CommandResult result;

    if (argv.empty()) {
        result.exit_code = -1;
        result.output = "empty command";
        return result;
    }

    std::vector<std::string> quoted;
    quoted.reserve(argv.size());
    for (const auto& arg : argv) {
        quoted.push_back(StringUtils::ShellQuote(arg));
    }
    // Redirect stderr to stdout (2>&1)
    std::string cmd = StringUtils::Join(quoted, " ") + " 2>&1";

    spdlog::debug("Executing: {}", cmd);

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        result.exit_code = -1;
        result.output = "Failed to execute command";
        return result;
    }

    std::array<char, 256> buffer;
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (result.exit_code != 0) {
        spdlog::debug("Command exited with {}: {}", result.exit_code,
                      StringUtils::Trim(result.output));
    }
    return result;
}

std::shared_ptr<CommandRunner> MakeSystemCommandRunner() {
    return std::make_shared<SystemCommandRunner>();
}

} // namespace utils
} // namespace warden
