/**
 * @file resource_limiter.hpp
 * @brief Translation of logical budgets into enforceable limits
 *
 * The limiter turns a ResourceBudget into an EnforcementPlan for a given
 * isolation level: rlimits for forked processes, CPU affinity, and the
 * container CLI arguments for OCI tiers. Budgets are clamped to the level's
 * ceiling from policy.
 *
 * BreachMonitor samples a running process group from /proc and reports the
 * first breach so the caller can kill the whole tree immediately.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/policy.hpp"
#include "warden/core/types.hpp"

#include <sys/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace sandbox {

/**
 * @struct EnforcementPlan
 * @brief Concrete limits for one execution
 */
struct EnforcementPlan {
    core::IsolationLevel level{core::IsolationLevel::CONTAINER};
    core::ResourceBudget budget;                 ///< Effective budget after clamping
    bool clamped{false};                         ///< Requested budget exceeded the ceiling

    // Process limits (namespace tier and helper processes)
    std::uint64_t address_space_bytes{0};        ///< RLIMIT_AS
    int max_processes{0};                        ///< RLIMIT_NPROC
    int max_open_files{64};                      ///< RLIMIT_NOFILE
    int cpu_seconds{0};                          ///< RLIMIT_CPU
    std::vector<int> cpu_affinity;               ///< CPUs the process may run on

    // Container limits (OCI tiers)
    std::vector<std::string> container_args;     ///< `update` flags: --memory, --cpus, --pids-limit, ...

    std::size_t max_output_bytes{1 << 20};       ///< Captured stdout/stderr bound
};

/**
 * @class ResourceLimiter
 * @brief Builds enforcement plans from budgets and policy ceilings
 */
class ResourceLimiter {
public:
    explicit ResourceLimiter(const core::IsolationPolicy& policy);

    /**
     * @brief Plan limits for a budget at a level
     *
     * Every dimension is clamped to the level ceiling; clamping is logged
     * and flagged on the plan.
     */
    EnforcementPlan Plan(const core::ResourceBudget& budget, core::IsolationLevel level) const;

    /**
     * @brief One-step smaller budget class
     *
     * Offered to callers after a breach for a later, independent request.
     * The gateway never retries a breached execution automatically.
     */
    static core::ResourceBudget RecommendBudgetAfterBreach(const core::ResourceBudget& budget);

    /**
     * @brief Apply the plan's rlimits and affinity to the calling process
     *
     * Meant for a freshly forked child before exec. Uses only
     * async-signal-safe calls.
     *
     * @return false if any limit could not be applied
     */
    static bool ApplyProcessLimits(const EnforcementPlan& plan, bool include_process_limit = true);

private:
    core::IsolationPolicy policy_;
};

/**
 * @class BreachMonitor
 * @brief Samples memory and process usage of a process group
 */
class BreachMonitor {
public:
    BreachMonitor(pid_t process_group, const EnforcementPlan& plan);

    /**
     * @brief Take one sample
     * @return MEMORY_EXCEEDED or PROCESS_LIMIT_EXCEEDED on the first breach
     */
    std::optional<core::ExitClassification> Sample();

    std::size_t PeakMemoryMb() const { return peak_rss_kb_ / 1024; }
    int PeakProcesses() const { return peak_tasks_; }

private:
    pid_t process_group_;
    std::size_t memory_limit_kb_;
    int task_limit_;
    std::size_t peak_rss_kb_{0};
    int peak_tasks_{0};
};

} // namespace sandbox
} // namespace warden
