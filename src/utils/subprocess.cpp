/**
 * @file subprocess.cpp
 * @brief Supervised child process implementation
 *
 * **Spawn sequence**:
 * 1. Create CLOEXEC pipes for stdout, stderr and a status channel
 * 2. fork(); the child enters a new session, redirects stdio, applies
 *    rlimits / CPU affinity / no_new_privs, then execs
 * 3. Any failure before exec is written to the status pipe as
 *    (step, errno); a successful exec closes it with no data
 * 4. The parent blocks only on the status pipe, never on the child's work
 *
 * **Supervision**:
 * - poll() both output pipes, split into lines, forward to the callback
 * - Once the leader exits, SIGKILL the rest of its process group so a
 *   daemonized descendant can neither linger nor hold the pipes open
 * - Reap under the mutex, so Terminate() never signals a recycled pgid
 *
 * @date 2025
 */

#include "warden/utils/subprocess.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>
#include <thread>

namespace warden {
namespace utils {

namespace {

// ============================================================================
// CHILD-SIDE HELPERS
// ============================================================================
// Everything below runs between fork and exec: no allocation, no locks.

enum ChildStep : int {
    STEP_PDEATHSIG = 0,
    STEP_SETSID,
    STEP_STDIN,
    STEP_REDIRECT,
    STEP_RLIMIT_AS,
    STEP_RLIMIT_CORE,
    STEP_AFFINITY,
    STEP_NO_NEW_PRIVS,
    STEP_CHDIR,
    STEP_EXEC
};

const char* StepName(int step) {
    switch (step) {
        case STEP_PDEATHSIG:    return "prctl(PDEATHSIG)";
        case STEP_SETSID:       return "setsid";
        case STEP_STDIN:        return "open /dev/null";
        case STEP_REDIRECT:     return "dup2";
        case STEP_RLIMIT_AS:    return "setrlimit AS";
        case STEP_RLIMIT_CORE:  return "setrlimit CORE";
        case STEP_AFFINITY:     return "sched_setaffinity";
        case STEP_NO_NEW_PRIVS: return "prctl(NO_NEW_PRIVS)";
        case STEP_CHDIR:        return "chdir";
        case STEP_EXEC:         return "exec";
    }
    return "child setup";
}

struct ChildFailure {
    int step;
    int error;
};

[[noreturn]] void ChildDie(int status_fd, int step, int error) {
    ChildFailure failure{step, error};
    ssize_t written = write(status_fd, &failure, sizeof(failure));
    (void)written;
    _exit(127);
}

std::vector<char*> ToCArray(std::vector<std::string>& strings) {
    std::vector<char*> array;
    array.reserve(strings.size() + 1);
    for (auto& s : strings) {
        array.push_back(s.data());
    }
    array.push_back(nullptr);
    return array;
}

// First @p count CPUs of the current affinity mask.
bool BuildAffinity(int count, cpu_set_t* out) {
    cpu_set_t allowed;
    CPU_ZERO(&allowed);
    if (sched_getaffinity(0, sizeof(allowed), &allowed) == -1) {
        return false;
    }
    CPU_ZERO(out);
    int picked = 0;
    for (int cpu = 0; cpu < CPU_SETSIZE && picked < count; ++cpu) {
        if (CPU_ISSET(cpu, &allowed)) {
            CPU_SET(cpu, out);
            ++picked;
        }
    }
    return picked > 0;
}

void ClosePipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] != -1) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

} // anonymous namespace

std::string ExitStatus::Describe() const {
    if (signal != 0) {
        return "killed by signal " + std::to_string(signal) + " (" + strsignal(signal) + ")";
    }
    return "exited with code " + std::to_string(exit_code);
}

// ============================================================================
// SPAWN
// ============================================================================

std::shared_ptr<Subprocess> Subprocess::Spawn(const SpawnOptions& options,
                                              OutputCallback on_output,
                                              ExitCallback on_exit) {
    if (options.argv.empty()) {
        throw std::system_error(EINVAL, std::generic_category(), "exec: empty command");
    }

    // Prepare everything the child needs before forking
    std::vector<std::string> argv_storage = options.argv;
    std::vector<char*> argv = ToCArray(argv_storage);

    std::vector<std::string> env_storage;
    std::vector<char*> envp;
    if (options.environment) {
        env_storage = *options.environment;
        envp = ToCArray(env_storage);
    }

    cpu_set_t cpus;
    CPU_ZERO(&cpus);
    bool pin_cpus = false;
    if (options.cpu_count && *options.cpu_count > 0) {
        pin_cpus = BuildAffinity(*options.cpu_count, &cpus);
        if (!pin_cpus) {
            spdlog::warn("Could not read CPU affinity; CPU ceiling not applied");
        }
    }

    rlim_t memory_bytes = 0;
    if (options.memory_limit_mb && *options.memory_limit_mb > 0) {
        memory_bytes = static_cast<rlim_t>(*options.memory_limit_mb) * 1024 * 1024;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (pipe2(out_pipe, O_CLOEXEC) == -1 ||
        pipe2(err_pipe, O_CLOEXEC) == -1 ||
        pipe2(status_pipe, O_CLOEXEC) == -1) {
        int error = errno;
        ClosePipe(out_pipe);
        ClosePipe(err_pipe);
        ClosePipe(status_pipe);
        throw std::system_error(error, std::generic_category(), "pipe");
    }

    pid_t parent_pid = getpid();
    pid_t pid = fork();
    if (pid == -1) {
        int error = errno;
        ClosePipe(out_pipe);
        ClosePipe(err_pipe);
        ClosePipe(status_pipe);
        throw std::system_error(error, std::generic_category(), "fork");
    }

    if (pid == 0) {
        int status_fd = status_pipe[1];
        close(status_pipe[0]);
        close(out_pipe[0]);
        close(err_pipe[0]);

        if (options.kill_with_parent) {
            if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) {
                ChildDie(status_fd, STEP_PDEATHSIG, errno);
            }
            if (getppid() != parent_pid) {
                _exit(127);
            }
        }

        // New session: signals to -pid reach the whole tree
        if (setsid() == -1) {
            ChildDie(status_fd, STEP_SETSID, errno);
        }

        int stdin_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (stdin_fd == -1) {
            ChildDie(status_fd, STEP_STDIN, errno);
        }
        if (dup2(stdin_fd, STDIN_FILENO) == -1 ||
            dup2(out_pipe[1], STDOUT_FILENO) == -1 ||
            dup2(err_pipe[1], STDERR_FILENO) == -1) {
            ChildDie(status_fd, STEP_REDIRECT, errno);
        }

        struct rlimit rlim {};
        if (memory_bytes > 0) {
            rlim.rlim_cur = memory_bytes;
            rlim.rlim_max = memory_bytes;
            if (setrlimit(RLIMIT_AS, &rlim) == -1) {
                ChildDie(status_fd, STEP_RLIMIT_AS, errno);
            }
        }
        rlim.rlim_cur = 0;
        rlim.rlim_max = 0;
        if (setrlimit(RLIMIT_CORE, &rlim) == -1) {
            ChildDie(status_fd, STEP_RLIMIT_CORE, errno);
        }

        if (pin_cpus && sched_setaffinity(0, sizeof(cpus), &cpus) == -1) {
            ChildDie(status_fd, STEP_AFFINITY, errno);
        }

        if (options.no_new_privileges && prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) {
            ChildDie(status_fd, STEP_NO_NEW_PRIVS, errno);
        }

        if (!options.working_directory.empty() &&
            chdir(options.working_directory.c_str()) == -1) {
            ChildDie(status_fd, STEP_CHDIR, errno);
        }

        if (!envp.empty()) {
            execvpe(argv[0], argv.data(), envp.data());
        } else {
            execvp(argv[0], argv.data());
        }
        ChildDie(status_fd, STEP_EXEC, errno);
    }

    // Parent
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);

    ChildFailure failure{0, 0};
    ssize_t got = 0;
    do {
        got = read(status_pipe[0], &failure, sizeof(failure));
    } while (got == -1 && errno == EINTR);
    close(status_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        close(out_pipe[0]);
        close(err_pipe[0]);
        throw std::system_error(failure.error, std::generic_category(),
                                std::string(StepName(failure.step)) + " " + options.argv[0]);
    }

    std::shared_ptr<Subprocess> child(
        new Subprocess(pid, out_pipe[0], err_pipe[0], std::move(on_output), std::move(on_exit)));

    try {
        // The thread owns a reference until the exit callback has run
        std::thread([child] { child->Supervise(); }).detach();
    }
    catch (const std::system_error&) {
        kill(-pid, SIGKILL);
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        close(out_pipe[0]);
        close(err_pipe[0]);
        throw;
    }

    spdlog::debug("Spawned pid {}: {}", pid, options.argv[0]);
    return child;
}

Subprocess::Subprocess(pid_t pid, int stdout_fd, int stderr_fd,
                       OutputCallback on_output, ExitCallback on_exit)
    : pid_(pid)
    , stdout_fd_(stdout_fd)
    , stderr_fd_(stderr_fd)
    , on_output_(std::move(on_output))
    , on_exit_(std::move(on_exit)) {}

Subprocess::~Subprocess() {
    spdlog::debug("Subprocess {} released", pid_);
}

// ============================================================================
// SUPERVISION
// ============================================================================

void Subprocess::Supervise() {
    std::array<int, 2> fds = {stdout_fd_, stderr_fd_};
    std::array<std::string, 2> partial;
    std::array<char, 4096> buffer;

    auto emit_lines = [this, &partial](std::size_t idx) {
        auto stream = idx == 0 ? OutputStream::STDOUT : OutputStream::STDERR;
        std::size_t pos;
        while ((pos = partial[idx].find('\n')) != std::string::npos) {
            std::string line = partial[idx].substr(0, pos);
            partial[idx].erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (on_output_) {
                on_output_(stream, line);
            }
        }
    };

    bool leader_exited = false;
    auto drain_deadline = std::chrono::steady_clock::now();

    while (fds[0] != -1 || fds[1] != -1) {
        std::array<pollfd, 2> pfds{};
        std::array<std::size_t, 2> index{};
        nfds_t count = 0;
        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i] != -1) {
                pfds[count].fd = fds[i];
                pfds[count].events = POLLIN;
                index[count] = i;
                ++count;
            }
        }

        int ready = poll(pfds.data(), count, 200);
        if (ready == -1 && errno != EINTR) {
            spdlog::error("poll failed for pid {}: {}", pid_, std::strerror(errno));
            break;
        }

        for (nfds_t p = 0; ready > 0 && p < count; ++p) {
            if (!(pfds[p].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            std::size_t idx = index[p];
            ssize_t n = read(fds[idx], buffer.data(), buffer.size());
            if (n > 0) {
                partial[idx].append(buffer.data(), static_cast<std::size_t>(n));
                emit_lines(idx);
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close(fds[idx]);
                fds[idx] = -1;
            }
        }

        if (!leader_exited) {
            siginfo_t info{};
            if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
                info.si_pid == pid_) {
                leader_exited = true;
                // Leader is a zombie, so its pgid cannot be recycled yet
                kill(-pid_, SIGKILL);
                drain_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            }
        } else if (std::chrono::steady_clock::now() > drain_deadline) {
            spdlog::warn("Output of pid {} still open after exit, closing", pid_);
            break;
        }
    }

    for (auto& fd : fds) {
        if (fd != -1) {
            close(fd);
            fd = -1;
        }
    }
    for (std::size_t i = 0; i < partial.size(); ++i) {
        if (!partial[i].empty()) {
            partial[i] += '\n';
            emit_lines(i);
        }
    }

    if (!leader_exited) {
        // Pipes closed first; wait for the leader without reaping it
        siginfo_t info{};
        while (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) == -1 &&
               errno == EINTR) {
        }
        kill(-pid_, SIGKILL);
    }

    ExitStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int raw = 0;
        pid_t reaped;
        do {
            reaped = waitpid(pid_, &raw, 0);
        } while (reaped == -1 && errno == EINTR);

        if (reaped == -1) {
            spdlog::error("waitpid failed for pid {}: {}", pid_, std::strerror(errno));
            status.exit_code = -1;
        } else if (WIFEXITED(raw)) {
            status.exit_code = WEXITSTATUS(raw);
        } else if (WIFSIGNALED(raw)) {
            status.signal = WTERMSIG(raw);
            status.exit_code = 128 + status.signal;
        }
        exit_status_ = status;
    }
    cv_.notify_all();

    spdlog::debug("pid {} {}", pid_, status.Describe());

    if (on_exit_) {
        try {
            on_exit_(status);
        }
        catch (const std::exception& e) {
            spdlog::error("Exit handler for pid {} failed: {}", pid_, e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        completed_ = true;
    }
    cv_.notify_all();
}

// ============================================================================
// CONTROL
// ============================================================================

bool Subprocess::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !exit_status_.has_value();
}

std::optional<ExitStatus> Subprocess::GetExitStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_status_;
}

bool Subprocess::WaitReapedLocked(std::unique_lock<std::mutex>& lock,
                                  std::chrono::milliseconds timeout) {
    return cv_.wait_for(lock, timeout, [this] { return exit_status_.has_value(); });
}

bool Subprocess::Terminate(std::chrono::milliseconds grace) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (exit_status_) {
        return true;
    }

    spdlog::debug("Sending SIGTERM to process group {}", pid_);
    if (kill(-pid_, SIGTERM) == -1 && errno != ESRCH) {
        spdlog::warn("SIGTERM to {} failed: {}", pid_, std::strerror(errno));
    }
    if (WaitReapedLocked(lock, grace)) {
        return true;
    }

    spdlog::warn("pid {} survived SIGTERM for {} ms, sending SIGKILL", pid_, grace.count());
    if (kill(-pid_, SIGKILL) == -1 && errno != ESRCH) {
        spdlog::error("SIGKILL to {} failed: {}", pid_, std::strerror(errno));
    }
    return WaitReapedLocked(lock, std::chrono::seconds(5));
}

bool Subprocess::WaitForCompletion(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return completed_; });
}

} // namespace utils
} // namespace warden
