/**
 * @file process_runner.cpp
 * @brief Implementation of bounded child process execution
 * @date 2025
 */

#include "warden/sandbox/process_runner.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>

namespace warden {
namespace sandbox {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr auto kDrainGrace = std::chrono::milliseconds(500);
constexpr std::size_t kReadChunk = 65536;
constexpr std::size_t kDefaultOutputBound = 1 << 20;
constexpr int kMaxInheritedFd = 4096;

constexpr int kNamespaceFlags = CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNS |
                                CLONE_NEWIPC | CLONE_NEWUTS | CLONE_NEWNET;

enum LaunchStage : int {
    STAGE_CHDIR = 1,
    STAGE_LIMITS,
    STAGE_UNSHARE,
    STAGE_FORK,
    STAGE_EXEC
};

struct LaunchFailure {
    int stage;
    int error;
};

const char* StageName(int stage) {
    switch (stage) {
        case STAGE_CHDIR: return "chdir";
        case STAGE_LIMITS: return "resource limits";
        case STAGE_UNSHARE: return "unshare";
        case STAGE_FORK: return "fork";
        case STAGE_EXEC: return "exec";
        default: return "launch";
    }
}

/**
 * @class Pipe
 * @brief Close-on-exec pipe that closes its ends on destruction
 */
class Pipe {
public:
    Pipe() {
        if (pipe2(fds_, O_CLOEXEC) != 0) {
            throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
        }
    }

    ~Pipe() {
        CloseRead();
        CloseWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int ReadEnd() const { return fds_[0]; }
    int WriteEnd() const { return fds_[1]; }

    void CloseRead() { CloseFd(fds_[0]); }
    void CloseWrite() { CloseFd(fds_[1]); }

private:
    static void CloseFd(int& fd) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }

    int fds_[2]{-1, -1};
};

/// Everything the child needs, prepared before fork
struct ChildArgs {
    std::vector<char*> argv;
    std::vector<char*> envp;
    bool use_env{false};
    const char* working_dir{nullptr};
    const EnforcementPlan* plan{nullptr};
    bool isolate{false};
    int stdin_fd{-1};
    int stdout_fd{-1};
    int stderr_fd{-1};
    int error_fd{-1};
    int max_fd{kMaxInheritedFd};
};

[[noreturn]] void ReportAndExit(int error_fd, int stage) {
    LaunchFailure failure{stage, errno};
    if (write(error_fd, &failure, sizeof(failure)) != static_cast<ssize_t>(sizeof(failure))) {
        _exit(125);
    }
    _exit(126);
}

[[noreturn]] void Exec(const ChildArgs& args) {
    if (args.use_env) {
        execvpe(args.argv[0], args.argv.data(), args.envp.data());
    } else {
        execvp(args.argv[0], args.argv.data());
    }
    ReportAndExit(args.error_fd, STAGE_EXEC);
}

/// Wait for the namespaced child and mirror how it ended
[[noreturn]] void RelayExit(pid_t inner) {
    int status = 0;
    while (waitpid(inner, &status, 0) < 0) {
        if (errno != EINTR) {
            _exit(126);
        }
    }

    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        signal(sig, SIG_DFL);
        raise(sig);
        _exit(128 + sig);
    }
    _exit(WIFEXITED(status) ? WEXITSTATUS(status) : 126);
}

/// Runs in the forked child; only async-signal-safe calls from here on
[[noreturn]] void RunChild(const ChildArgs& args) {
    setpgid(0, 0);
    prctl(PR_SET_PDEATHSIG, SIGKILL);
    signal(SIGPIPE, SIG_DFL);

    if (dup2(args.stdin_fd, STDIN_FILENO) < 0 ||
        dup2(args.stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(args.stderr_fd, STDERR_FILENO) < 0) {
        _exit(126);
    }

    for (int fd = STDERR_FILENO + 1; fd < args.max_fd; ++fd) {
        if (fd != args.error_fd) {
            close(fd);
        }
    }

    if (args.working_dir && chdir(args.working_dir) != 0) {
        ReportAndExit(args.error_fd, STAGE_CHDIR);
    }

    // RLIMIT_NPROC waits for the innermost process when isolating
    if (args.plan && !ResourceLimiter::ApplyProcessLimits(*args.plan, !args.isolate)) {
        ReportAndExit(args.error_fd, STAGE_LIMITS);
    }

    prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);

    if (!args.isolate) {
        Exec(args);
    }

    if (unshare(kNamespaceFlags) != 0) {
        ReportAndExit(args.error_fd, STAGE_UNSHARE);
    }

    // First fork after CLONE_NEWPID becomes pid 1 of the new namespace
    pid_t inner = fork();
    if (inner < 0) {
        ReportAndExit(args.error_fd, STAGE_FORK);
    }

    if (inner == 0) {
        if (args.plan && args.plan->max_processes > 0) {
            struct rlimit limit;
            limit.rlim_cur = limit.rlim_max = static_cast<rlim_t>(args.plan->max_processes);
            if (setrlimit(RLIMIT_NPROC, &limit) != 0) {
                ReportAndExit(args.error_fd, STAGE_LIMITS);
            }
        }
        Exec(args);
    }

    close(args.error_fd);
    close(STDIN_FILENO);
    close(STDOUT_FILENO);
    close(STDERR_FILENO);
    RelayExit(inner);
}

void SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

/**
 * @brief Drain whatever is readable from fd into buffer
 * @return false once the write side is closed
 */
bool ReadAvailable(int fd, std::string& buffer, std::size_t bound, bool& truncated) {
    char chunk[kReadChunk];
    while (true) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            auto room = bound > buffer.size() ? bound - buffer.size() : 0;
            auto take = std::min(room, static_cast<std::size_t>(n));
            buffer.append(chunk, take);
            if (take < static_cast<std::size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

int InheritedFdBound() {
    struct rlimit limit;
    if (getrlimit(RLIMIT_NOFILE, &limit) != 0 || limit.rlim_cur == RLIM_INFINITY) {
        return kMaxInheritedFd;
    }
    return static_cast<int>(std::min<rlim_t>(limit.rlim_cur, kMaxInheritedFd));
}

} // anonymous namespace

ProcessOutcome ProcessRunner::Run(const ProcessSpec& spec) {
    if (spec.argv.empty()) {
        throw std::invalid_argument("ProcessSpec.argv must not be empty");
    }

    // Writes to a pipe whose reader died must fail with EPIPE, not kill us
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });

    Pipe stdin_pipe;
    Pipe stdout_pipe;
    Pipe stderr_pipe;
    Pipe error_pipe;

    ChildArgs args;
    for (const auto& arg : spec.argv) {
        args.argv.push_back(const_cast<char*>(arg.c_str()));
    }
    args.argv.push_back(nullptr);

    args.use_env = !spec.environment.empty();
    for (const auto& entry : spec.environment) {
        args.envp.push_back(const_cast<char*>(entry.c_str()));
    }
    args.envp.push_back(nullptr);

    args.working_dir = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();
    args.plan = spec.plan ? &*spec.plan : nullptr;
    args.isolate = spec.isolate_namespaces;
    args.stdin_fd = stdin_pipe.ReadEnd();
    args.stdout_fd = stdout_pipe.WriteEnd();
    args.stderr_fd = stderr_pipe.WriteEnd();
    args.error_fd = error_pipe.WriteEnd();
    args.max_fd = InheritedFdBound();

    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + spec.timeout;

    pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        RunChild(args);
    }

    // Also set from the parent so the group exists before we ever signal it
    if (setpgid(pid, pid) != 0 && errno != EACCES) {
        spdlog::debug("[RUNNER] setpgid({}) failed: {}", pid, std::strerror(errno));
    }

    stdin_pipe.CloseRead();
    stdout_pipe.CloseWrite();
    stderr_pipe.CloseWrite();
    error_pipe.CloseWrite();

    int in_fd = stdin_pipe.WriteEnd();
    int out_fd = stdout_pipe.ReadEnd();
    int err_fd = stderr_pipe.ReadEnd();
    SetNonBlocking(in_fd);
    SetNonBlocking(out_fd);
    SetNonBlocking(err_fd);
    SetNonBlocking(error_pipe.ReadEnd());

    if (spec.stdin_data.empty()) {
        stdin_pipe.CloseWrite();
        in_fd = -1;
    }

    ProcessOutcome outcome;
    const std::size_t output_bound = spec.plan ? spec.plan->max_output_bytes : kDefaultOutputBound;

    std::optional<BreachMonitor> monitor;
    if (spec.plan) {
        monitor.emplace(pid, *spec.plan);
    }

    bool group_killed = false;
    auto kill_group = [&]() {
        if (!group_killed) {
            kill(-pid, SIGKILL);
            group_killed = true;
        }
    };

    std::size_t written = 0;
    bool exited = false;
    int status = 0;
    auto exit_time = start;
    auto next_sample = start;

    while (true) {
        auto now = std::chrono::steady_clock::now();

        if (!exited && now >= deadline && !outcome.timed_out) {
            outcome.timed_out = true;
            spdlog::warn("[RUNNER] Process {} exceeded {}ms deadline, killing group",
                         pid, spec.timeout.count());
            kill_group();
        }

        if (monitor && !exited && !group_killed && now >= next_sample) {
            if (auto breach = monitor->Sample()) {
                outcome.breach = breach;
                kill_group();
            }
            next_sample = now + kPollInterval;
        }

        if (!exited) {
            siginfo_t info;
            std::memset(&info, 0, sizeof(info));
            if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
                info.si_pid == pid) {
                // Descendants go down with the leader before it is reaped
                kill_group();
                while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
                }
                exited = true;
                exit_time = std::chrono::steady_clock::now();
            }
        }

        if (exited && out_fd < 0 && err_fd < 0) {
            break;
        }
        if (exited && std::chrono::steady_clock::now() - exit_time > kDrainGrace) {
            spdlog::warn("[RUNNER] Output of process {} still open after exit, abandoning", pid);
            break;
        }

        std::vector<pollfd> fds;
        if (in_fd >= 0) fds.push_back({in_fd, POLLOUT, 0});
        if (out_fd >= 0) fds.push_back({out_fd, POLLIN, 0});
        if (err_fd >= 0) fds.push_back({err_fd, POLLIN, 0});

        int ready = poll(fds.empty() ? nullptr : fds.data(), fds.size(),
                         static_cast<int>(kPollInterval.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[RUNNER] poll failed: {}", std::strerror(errno));
            kill_group();
            continue;
        }

        for (const auto& entry : fds) {
            if (entry.revents == 0) {
                continue;
            }

            if (entry.fd == in_fd) {
                const auto remaining = spec.stdin_data.size() - written;
                ssize_t n = write(in_fd, spec.stdin_data.data() + written, std::min(remaining, kReadChunk));
                if (n > 0) {
                    written += static_cast<std::size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    written = spec.stdin_data.size();
                }
                if (written >= spec.stdin_data.size()) {
                    stdin_pipe.CloseWrite();
                    in_fd = -1;
                }
            } else if (entry.fd == out_fd) {
                if (!ReadAvailable(out_fd, outcome.stdout_data, output_bound, outcome.output_truncated)) {
                    stdout_pipe.CloseRead();
                    out_fd = -1;
                }
            } else if (entry.fd == err_fd) {
                if (!ReadAvailable(err_fd, outcome.stderr_data, output_bound, outcome.output_truncated)) {
                    stderr_pipe.CloseRead();
                    err_fd = -1;
                }
            }
        }
    }

    LaunchFailure failure{};
    if (read(error_pipe.ReadEnd(), &failure, sizeof(failure)) == static_cast<ssize_t>(sizeof(failure))) {
        outcome.launch_error = std::string(StageName(failure.stage)) + " failed: " + std::strerror(failure.error);
        spdlog::error("[RUNNER] Launch of '{}' failed: {}", spec.argv[0], outcome.launch_error);
    }

    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.term_signal = WTERMSIG(status);
    }

    if (monitor) {
        outcome.peak_memory_mb = monitor->PeakMemoryMb();
    }
    outcome.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    spdlog::debug("[RUNNER] '{}' finished: exit={}, signal={}, timed_out={}, {}ms",
                  spec.argv[0], outcome.exit_code, outcome.term_signal,
                  outcome.timed_out, outcome.wall_time.count());

    return outcome;
}

bool ProcessRunner::NamespacesAvailable() {
    static std::once_flag probe_once;
    static bool available = false;

    std::call_once(probe_once, []() {
        pid_t pid = fork();
        if (pid < 0) {
            spdlog::warn("[RUNNER] Namespace probe fork failed: {}", std::strerror(errno));
            return;
        }
        if (pid == 0) {
            _exit(unshare(kNamespaceFlags) == 0 ? 0 : 1);
        }

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return;
            }
        }
        available = WIFEXITED(status) && WEXITSTATUS(status) == 0;
        spdlog::info("[RUNNER] Unprivileged namespaces {}", available ? "available" : "unavailable");
    });

    return available;
}

} // namespace sandbox
} // namespace warden
