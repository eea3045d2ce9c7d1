/**
 * @file resource_limiter.cpp
 * @brief Implementation of budget clamping, rlimits and breach sampling
 * @date 2025
 */

#include "warden/sandbox/resource_limiter.hpp"

#include <spdlog/spdlog.h>

#include <sched.h>
#include <sys/resource.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace warden {
namespace sandbox {

namespace {

constexpr std::size_t kMinMemoryMb = 64;
constexpr double kMinCpuCores = 0.5;
constexpr std::chrono::milliseconds kMinWallTime{1000};

std::string FormatCpus(double cores) {
    std::ostringstream oss;
    oss.precision(2);
    oss << std::fixed << cores;
    return oss.str();
}

/// CPUs the current process may use, in ascending order
std::vector<int> AvailableCpus() {
    std::vector<int> cpus;
    cpu_set_t set;
    CPU_ZERO(&set);
    if (sched_getaffinity(0, sizeof(set), &set) == 0) {
        for (int cpu = 0; cpu < CPU_SETSIZE; ++cpu) {
            if (CPU_ISSET(cpu, &set)) {
                cpus.push_back(cpu);
            }
        }
    }
    return cpus;
}

/// Process group of a /proc entry, or -1 if it vanished
pid_t ReadProcessGroup(const fs::path& proc_dir) {
    std::ifstream stat(proc_dir / "stat");
    std::string content;
    if (!std::getline(stat, content)) {
        return -1;
    }

    // comm may contain spaces and parentheses; fields resume after the last ')'
    auto close = content.rfind(')');
    if (close == std::string::npos) {
        return -1;
    }

    std::istringstream fields(content.substr(close + 1));
    std::string state;
    long ppid = 0;
    long pgrp = -1;
    fields >> state >> ppid >> pgrp;
    return fields ? static_cast<pid_t>(pgrp) : -1;
}

/// VmRSS (kB) and thread count of a /proc entry
std::pair<std::size_t, int> ReadUsage(const fs::path& proc_dir) {
    std::ifstream status(proc_dir / "status");
    std::string line;
    std::size_t rss_kb = 0;
    int threads = 1;

    while (std::getline(status, line)) {
        std::istringstream iss(line);
        std::string key;
        iss >> key;
        if (key == "VmRSS:") {
            iss >> rss_kb;
        } else if (key == "Threads:") {
            iss >> threads;
        }
    }
    return {rss_kb, threads};
}

} // anonymous namespace

// ============================================================================
// RESOURCE LIMITER
// ============================================================================

ResourceLimiter::ResourceLimiter(const core::IsolationPolicy& policy)
    : policy_(policy) {
}

EnforcementPlan ResourceLimiter::Plan(const core::ResourceBudget& budget,
                                      core::IsolationLevel level) const {
    EnforcementPlan plan;
    plan.level = level;
    plan.budget = budget;
    plan.max_open_files = policy_.max_open_files;
    plan.max_output_bytes = policy_.max_output_bytes;

    auto ceiling_it = policy_.ceilings.find(level);
    if (ceiling_it != policy_.ceilings.end()) {
        const auto& ceiling = ceiling_it->second;
        auto& b = plan.budget;

        if (b.max_memory_mb > ceiling.max_memory_mb) {
            b.max_memory_mb = ceiling.max_memory_mb;
            plan.clamped = true;
        }
        if (b.max_cpu_cores > ceiling.max_cpu_cores) {
            b.max_cpu_cores = ceiling.max_cpu_cores;
            plan.clamped = true;
        }
        if (b.max_processes > ceiling.max_processes) {
            b.max_processes = ceiling.max_processes;
            plan.clamped = true;
        }
        if (b.max_wall_time > ceiling.max_wall_time) {
            b.max_wall_time = ceiling.max_wall_time;
            plan.clamped = true;
        }
    }

    if (plan.clamped) {
        spdlog::info("[LIMITER] Budget clamped to {} ceiling: {}MB, {} cpus, {} procs, {}ms",
                     core::ToString(level), plan.budget.max_memory_mb, plan.budget.max_cpu_cores,
                     plan.budget.max_processes, plan.budget.max_wall_time.count());
    }

    const auto& b = plan.budget;

    plan.address_space_bytes = static_cast<std::uint64_t>(b.max_memory_mb) * 1024 * 1024;
    plan.max_processes = std::max(1, b.max_processes);

    // CPU seconds: wall time scaled by cores, rounded up, plus one second of slack
    auto wall_seconds = std::chrono::duration<double>(b.max_wall_time).count();
    plan.cpu_seconds = static_cast<int>(std::ceil(wall_seconds * std::max(b.max_cpu_cores, kMinCpuCores))) + 1;

    auto cpus = AvailableCpus();
    auto wanted = static_cast<std::size_t>(std::max(1.0, std::ceil(b.max_cpu_cores)));
    for (std::size_t i = 0; i < cpus.size() && i < wanted; ++i) {
        plan.cpu_affinity.push_back(cpus[i]);
    }

    plan.container_args = {
        "--memory", std::to_string(b.max_memory_mb) + "m",
        "--memory-swap", std::to_string(b.max_memory_mb) + "m",
        "--cpus", FormatCpus(b.max_cpu_cores),
        "--pids-limit", std::to_string(plan.max_processes)
    };

    return plan;
}

core::ResourceBudget ResourceLimiter::RecommendBudgetAfterBreach(const core::ResourceBudget& budget) {
    core::ResourceBudget next = budget;
    next.max_memory_mb = std::max(kMinMemoryMb, budget.max_memory_mb / 2);
    next.max_cpu_cores = std::max(kMinCpuCores, budget.max_cpu_cores / 2.0);
    next.max_processes = std::max(1, budget.max_processes / 2);
    next.max_wall_time = std::max(kMinWallTime, budget.max_wall_time / 2);
    return next;
}

bool ResourceLimiter::ApplyProcessLimits(const EnforcementPlan& plan, bool include_process_limit) {
    bool ok = true;
    struct rlimit limit;

    if (plan.address_space_bytes > 0) {
        limit.rlim_cur = limit.rlim_max = static_cast<rlim_t>(plan.address_space_bytes);
        ok &= setrlimit(RLIMIT_AS, &limit) == 0;
    }

    if (plan.cpu_seconds > 0) {
        limit.rlim_cur = limit.rlim_max = static_cast<rlim_t>(plan.cpu_seconds);
        ok &= setrlimit(RLIMIT_CPU, &limit) == 0;
    }

    if (plan.max_open_files > 0) {
        limit.rlim_cur = limit.rlim_max = static_cast<rlim_t>(plan.max_open_files);
        ok &= setrlimit(RLIMIT_NOFILE, &limit) == 0;
    }

    if (include_process_limit && plan.max_processes > 0) {
        limit.rlim_cur = limit.rlim_max = static_cast<rlim_t>(plan.max_processes);
        ok &= setrlimit(RLIMIT_NPROC, &limit) == 0;
    }

    // No core dumps
    limit.rlim_cur = limit.rlim_max = 0;
    ok &= setrlimit(RLIMIT_CORE, &limit) == 0;

    if (!plan.cpu_affinity.empty()) {
        cpu_set_t set;
        CPU_ZERO(&set);
        for (int cpu : plan.cpu_affinity) {
            CPU_SET(cpu, &set);
        }
        ok &= sched_setaffinity(0, sizeof(set), &set) == 0;
    }

    return ok;
}

// ============================================================================
// BREACH MONITOR
// ============================================================================

BreachMonitor::BreachMonitor(pid_t process_group, const EnforcementPlan& plan)
    : process_group_(process_group)
    , memory_limit_kb_(plan.budget.max_memory_mb * 1024)
    , task_limit_(plan.max_processes) {
}

std::optional<core::ExitClassification> BreachMonitor::Sample() {
    std::size_t rss_kb = 0;
    int tasks = 0;

    std::error_code ec;
    for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), ::isdigit)) {
            continue;
        }
        if (ReadProcessGroup(it->path()) != process_group_) {
            continue;
        }

        auto [process_rss, threads] = ReadUsage(it->path());
        rss_kb += process_rss;
        tasks += threads;
    }

    peak_rss_kb_ = std::max(peak_rss_kb_, rss_kb);
    peak_tasks_ = std::max(peak_tasks_, tasks);

    if (memory_limit_kb_ > 0 && rss_kb > memory_limit_kb_) {
        spdlog::warn("[LIMITER] Process group {} RSS {}MB exceeds {}MB",
                     process_group_, rss_kb / 1024, memory_limit_kb_ / 1024);
        return core::ExitClassification::MEMORY_EXCEEDED;
    }
    if (task_limit_ > 0 && tasks > task_limit_) {
        spdlog::warn("[LIMITER] Process group {} has {} tasks, limit {}",
                     process_group_, tasks, task_limit_);
        return core::ExitClassification::PROCESS_LIMIT_EXCEEDED;
    }
    return std::nullopt;
}

} // namespace sandbox
} // namespace warden
