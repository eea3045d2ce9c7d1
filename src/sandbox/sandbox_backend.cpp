/**
 * @file sandbox_backend.cpp
 * @brief Backend registry and helpers shared by every isolation tier
 * @date 2025
 */

#include "warden/sandbox/sandbox_backend.hpp"
#include "warden/sandbox/ast_only_backend.hpp"
#include "warden/sandbox/container_backend.hpp"
#include "warden/sandbox/namespace_backend.hpp"
#include "warden/network/network_guard.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <signal.h>

#include <algorithm>
#include <array>
#include <stdexcept>

namespace warden {
namespace sandbox {

using utils::StringUtils;

namespace {

constexpr std::size_t kMaxErrorOutput = 4096;

const std::array<const char*, 5> kMemoryMarkers = {
    "MemoryError",
    "Cannot allocate memory",
    "std::bad_alloc",
    "out of memory",
    "Out of memory"
};

const std::array<const char*, 3> kProcessLimitMarkers = {
    "can't start new thread",
    "BlockingIOError",
    "Resource temporarily unavailable"
};

template <std::size_t N>
bool ContainsAny(const std::string& text, const std::array<const char*, N>& markers) {
    return std::any_of(markers.begin(), markers.end(),
                       [&text](const char* marker) { return StringUtils::Contains(text, marker); });
}

/// Last non-empty stderr line, usually the exception summary
std::string LastLine(const std::string& text) {
    auto lines = StringUtils::Split(text, '\n');
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        auto line = StringUtils::Trim(*it);
        if (!line.empty()) {
            return line;
        }
    }
    return {};
}

} // anonymous namespace

// ============================================================================
// BACKEND REGISTRY
// ============================================================================

void BackendRegistry::Register(std::shared_ptr<SandboxBackend> backend) {
    if (!backend) {
        throw std::invalid_argument("Cannot register a null sandbox backend");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto level = backend->Level();
    spdlog::debug("[BACKEND] Registered '{}' for {}", backend->Name(), core::ToString(level));
    backends_[level] = std::move(backend);
}

std::shared_ptr<SandboxBackend> BackendRegistry::Get(core::IsolationLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = backends_.find(level);
    return it != backends_.end() ? it->second : nullptr;
}

bool BackendRegistry::Has(core::IsolationLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backends_.count(level) > 0;
}

std::vector<core::IsolationLevel> BackendRegistry::Levels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::IsolationLevel> levels;
    for (auto level : core::AllIsolationLevels()) {
        if (backends_.count(level)) {
            levels.push_back(level);
        }
    }
    return levels;
}

std::shared_ptr<BackendRegistry> BackendRegistry::CreateDefault(std::shared_ptr<core::PolicyStore> policy_store) {
    auto registry = std::make_shared<BackendRegistry>();

    for (auto level : {core::IsolationLevel::MICRO_VM,
                       core::IsolationLevel::USERSPACE_KERNEL,
                       core::IsolationLevel::CONTAINER}) {
        registry->Register(std::make_shared<ContainerBackend>(level, policy_store));
    }
    registry->Register(std::make_shared<NamespaceBackend>());
    registry->Register(std::make_shared<AstOnlyBackend>());

    return registry;
}

// ============================================================================
// SHARED BACKEND HELPERS
// ============================================================================

std::string BuildProgram(const ExecutionRequest& request) {
    if (request.content_type != core::ContentType::EXPRESSION) {
        return request.content;
    }

    std::string prelude = request.policy ? request.policy->isolation.expression_prelude : std::string();
    return prelude + "\nprint(" + StringUtils::Trim(request.content) + ")\n";
}

std::vector<std::string> RuntimeCommand(const ExecutionRequest& request) {
    if (request.policy) {
        const auto& commands = request.policy->isolation.runtime_commands;
        auto it = commands.find(request.content_type);
        if (it != commands.end() && !it->second.empty()) {
            return it->second;
        }
    }
    return {"python3", "-I", "-"};
}

std::optional<core::ExecutionResult> CheckEgress(const ExecutionRequest& request,
                                                 core::IsolationLevel level) {
    for (const auto& destination : request.context.EgressDestinations()) {
        if (!request.network_guard) {
            return MakeFailure(level, core::ExitClassification::NETWORK_VIOLATION,
                               "Egress to " + destination + " denied: no network guard configured");
        }

        try {
            auto access = request.network_guard->CheckAccess(destination, request.context.ComponentName());
            if (!access.allowed) {
                return MakeFailure(level, core::ExitClassification::NETWORK_VIOLATION,
                                   "Egress to " + access.target + " denied: " + access.reason);
            }
        } catch (const std::invalid_argument& e) {
            return MakeFailure(level, core::ExitClassification::NETWORK_VIOLATION,
                               std::string("Invalid egress destination: ") + e.what());
        }
    }
    return std::nullopt;
}

std::chrono::milliseconds RemainingTime(const ExecutionRequest& request) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        request.deadline - std::chrono::steady_clock::now());
    return std::max(remaining, std::chrono::milliseconds(0));
}

core::ExecutionResult MakeFailure(core::IsolationLevel level,
                                  core::ExitClassification classification,
                                  const std::string& reason) {
    core::ExecutionResult result;
    result.success = false;
    result.classification = classification;
    result.failure_reason = reason;
    result.isolation_level = level;
    return result;
}

core::ExecutionResult ClassifyOutcome(const ProcessOutcome& outcome, core::IsolationLevel level) {
    core::ExecutionResult result;
    result.isolation_level = level;
    result.output = StringUtils::Trim(outcome.stdout_data);
    result.error_output = StringUtils::Truncate(outcome.stderr_data, kMaxErrorOutput);
    result.wall_time = outcome.wall_time;
    result.peak_memory_mb = outcome.peak_memory_mb;
    result.exit_code = outcome.exit_code;

    if (!outcome.launch_error.empty()) {
        result.classification = core::ExitClassification::SANDBOX_CREATION_FAILED;
        result.failure_reason = "Sandbox launch failed: " + outcome.launch_error;
        return result;
    }

    if (outcome.timed_out) {
        result.classification = core::ExitClassification::TIMEOUT_EXCEEDED;
        result.failure_reason = "Execution exceeded its deadline after " +
                                std::to_string(outcome.wall_time.count()) + "ms";
        return result;
    }

    if (outcome.breach) {
        result.classification = *outcome.breach;
        result.failure_reason = *outcome.breach == core::ExitClassification::MEMORY_EXCEEDED
            ? "Memory limit exceeded (peak " + std::to_string(outcome.peak_memory_mb) + "MB)"
            : "Process limit exceeded";
        return result;
    }

    if (outcome.term_signal == SIGXCPU) {
        result.classification = core::ExitClassification::TIMEOUT_EXCEEDED;
        result.failure_reason = "CPU time limit exceeded";
        return result;
    }

    if (outcome.Exited() && outcome.exit_code == 0) {
        result.success = true;
        result.classification = core::ExitClassification::COMPLETED;
        return result;
    }

    if (ContainsAny(outcome.stderr_data, kMemoryMarkers)) {
        result.classification = core::ExitClassification::MEMORY_EXCEEDED;
        result.failure_reason = "Memory limit exceeded: " + LastLine(outcome.stderr_data);
        return result;
    }

    if (ContainsAny(outcome.stderr_data, kProcessLimitMarkers)) {
        result.classification = core::ExitClassification::PROCESS_LIMIT_EXCEEDED;
        result.failure_reason = "Process limit exceeded: " + LastLine(outcome.stderr_data);
        return result;
    }

    result.classification = core::ExitClassification::EXECUTION_FAILED;
    if (outcome.term_signal != 0) {
        result.failure_reason = "Killed by signal " + std::to_string(outcome.term_signal);
    } else {
        result.failure_reason = "Exited with code " + std::to_string(outcome.exit_code);
    }

    auto summary = LastLine(outcome.stderr_data);
    if (!summary.empty()) {
        result.failure_reason += ": " + StringUtils::Truncate(summary, 256);
    }
    return result;
}

} // namespace sandbox
} // namespace warden
