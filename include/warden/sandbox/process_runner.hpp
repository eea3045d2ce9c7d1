/**
 * @file process_runner.hpp
 * @brief Bounded child process execution
 *
 * Runs an argv with content on stdin and captures stdout/stderr, with a hard
 * wall-clock deadline, optional rlimits and Linux namespace isolation, and
 * /proc sampling for memory and process breaches. The child always runs in
 * its own process group; on timeout, breach or exit the whole group is
 * killed so no descendant survives the call.
 *
 * Used by the namespace backend to run content directly and by the container
 * backend to drive the container CLI.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/types.hpp"
#include "warden/sandbox/resource_limiter.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace sandbox {

/**
 * @struct ProcessSpec
 * @brief What to run and under which limits
 */
struct ProcessSpec {
    std::vector<std::string> argv;                  ///< argv[0] is resolved through PATH
    std::string stdin_data;                         ///< Written to the child's stdin, then closed
    std::optional<EnforcementPlan> plan;            ///< rlimits, affinity and breach sampling
    std::chrono::milliseconds timeout{30000};       ///< Hard wall-clock deadline
    bool isolate_namespaces{false};                 ///< New user/pid/mount/ipc/uts/net namespaces
    std::string working_dir;                        ///< chdir before exec (empty = inherit)
    std::vector<std::string> environment;           ///< KEY=VALUE (empty = inherit)
};

/**
 * @struct ProcessOutcome
 * @brief How the child ended and what it printed
 */
struct ProcessOutcome {
    int exit_code{-1};                               ///< -1 when killed by a signal
    int term_signal{0};                              ///< Terminating signal, 0 if exited
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out{false};
    bool output_truncated{false};                    ///< Output exceeded the plan's bound
    std::optional<core::ExitClassification> breach;  ///< First breach seen by the monitor
    std::size_t peak_memory_mb{0};
    std::chrono::milliseconds wall_time{0};
    std::string launch_error;                        ///< Setup failure before exec (empty on success)

    bool Exited() const { return term_signal == 0 && exit_code >= 0; }
};

/**
 * @class ProcessRunner
 * @brief Static utilities for running bounded child processes
 */
class ProcessRunner {
public:
    /**
     * @brief Run a process to completion or until a limit is hit
     * @throws std::runtime_error if pipes cannot be created or fork fails
     * @throws std::invalid_argument if argv is empty
     */
    static ProcessOutcome Run(const ProcessSpec& spec);

    /**
     * @brief Check whether unprivileged namespaces can be created here
     *
     * Forks a probe child that attempts unshare(); the answer is cached
     * for the process lifetime.
     */
    static bool NamespacesAvailable();
};

} // namespace sandbox
} // namespace warden
