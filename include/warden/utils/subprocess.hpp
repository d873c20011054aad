/**
 * @file subprocess.hpp
 * @brief Supervised child process with continuous output capture
 *
 * Spawns a command in its own session, applies resource ceilings between
 * fork and exec, and drains stdout/stderr line by line on a supervisor
 * thread. The exit notification fires once the child has been reaped and
 * any stragglers left in its process group have been killed.
 *
 * Spawn() returns as soon as exec has succeeded; it does not wait for the
 * child's work to complete. An exec failure is reported synchronously.
 *
 * **Lifetime**: the supervisor thread keeps the Subprocess alive until the
 * exit callback has returned, so callers may drop their handle at any time.
 *
 * **Usage Example**:
 * @code
 * SpawnOptions options;
 * options.argv = {"/bin/sh", "-c", "echo hello"};
 * options.memory_limit_mb = 256;
 *
 * auto child = Subprocess::Spawn(options,
 *     [](OutputStream stream, const std::string& line) { Print(line); },
 *     [](const ExitStatus& status) { Done(status.exit_code); });
 *
 * child->Terminate(std::chrono::seconds(2));
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace utils {

enum class OutputStream {
    STDOUT,
    STDERR
};

/**
 * @struct SpawnOptions
 * @brief Everything applied to the child before exec
 */
struct SpawnOptions {
    std::vector<std::string> argv;                        ///< argv[0] resolved via PATH
    std::optional<std::vector<std::string>> environment;  ///< "KEY=VALUE"; absent inherits
    std::string working_directory;                        ///< Empty keeps the parent's

    std::optional<std::size_t> memory_limit_mb;  ///< RLIMIT_AS
    std::optional<int> cpu_count;                ///< Pin to the first N allowed CPUs
    bool no_new_privileges{false};               ///< PR_SET_NO_NEW_PRIVS
    bool kill_with_parent{true};                 ///< PR_SET_PDEATHSIG = SIGKILL
};

/**
 * @struct ExitStatus
 * @brief How a child finished
 */
struct ExitStatus {
    int exit_code{0};   ///< Valid when signal == 0
    int signal{0};      ///< Terminating signal, 0 for a normal exit

    bool Succeeded() const { return signal == 0 && exit_code == 0; }

    /// "exited with code 3" / "killed by signal 9 (Killed)"
    std::string Describe() const;
};

class Subprocess {
public:
    using OutputCallback = std::function<void(OutputStream, const std::string&)>;
    using ExitCallback = std::function<void(const ExitStatus&)>;

    /**
     * @brief Fork, configure and exec a child
     *
     * @throws std::system_error if pipes, fork, or any pre-exec step fails;
     *         the message names the failing step ("exec: No such file ...")
     */
    static std::shared_ptr<Subprocess> Spawn(const SpawnOptions& options,
                                             OutputCallback on_output,
                                             ExitCallback on_exit);

    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    pid_t pid() const { return pid_; }

    /// True until the child has been reaped.
    bool IsRunning() const;

    std::optional<ExitStatus> GetExitStatus() const;

    /**
     * @brief SIGTERM the process group, then SIGKILL after @p grace
     * @return true once the child is reaped; false if it survived SIGKILL
     */
    bool Terminate(std::chrono::milliseconds grace);

    /**
     * @brief Block until the exit callback has returned
     * @return false on timeout
     */
    bool WaitForCompletion(std::chrono::milliseconds timeout) const;

private:
    Subprocess(pid_t pid, int stdout_fd, int stderr_fd,
               OutputCallback on_output, ExitCallback on_exit);

    void Supervise();
    bool WaitReapedLocked(std::unique_lock<std::mutex>& lock,
                          std::chrono::milliseconds timeout);

    const pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    OutputCallback on_output_;
    ExitCallback on_exit_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::optional<ExitStatus> exit_status_;
    bool completed_{false};
};

} // namespace utils
} // namespace warden
