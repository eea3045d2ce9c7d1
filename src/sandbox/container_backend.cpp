/**
 * @file container_backend.cpp
 * @brief Implementation of the OCI container tiers
 * @date 2025
 */

#include "warden/sandbox/container_backend.hpp"
#include "warden/core/errors.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <signal.h>

#include <stdexcept>

namespace warden {
namespace sandbox {

using utils::StringUtils;

namespace {

constexpr auto kResetTimeout = std::chrono::seconds(10);
constexpr const char* kWorkDir = "/work";

/// exec exit status when the command inside was SIGKILLed (cgroup OOM)
constexpr int kKilledExitCode = 128 + SIGKILL;

/// kill -1 from the sandbox user never reaches pid 1 (the keep-alive)
constexpr const char* kResetScript =
    "kill -9 -1 2>/dev/null; "
    "rm -rf /work/* /work/.[!.]* /work/..?* /tmp/* /tmp/.[!.]* 2>/dev/null; "
    "test -z \"$(ls -A /work)\"";

std::string ShortLevelName(core::IsolationLevel level) {
    switch (level) {
        case core::IsolationLevel::MICRO_VM: return "vm";
        case core::IsolationLevel::USERSPACE_KERNEL: return "gvisor";
        case core::IsolationLevel::CONTAINER: return "ctr";
        default: return "sbx";
    }
}

} // anonymous namespace

// ============================================================================
// ENVIRONMENT
// ============================================================================

ContainerEnvironment::ContainerEnvironment(core::IsolationLevel level,
                                           ContainerUtils cli,
                                           std::string container_id,
                                           std::string user,
                                           std::string egress_network)
    : level_(level)
    , cli_(std::move(cli))
    , container_id_(std::move(container_id))
    , user_(std::move(user))
    , egress_network_(std::move(egress_network)) {
}

ContainerEnvironment::~ContainerEnvironment() {
    Destroy();
}

core::ExecutionResult ContainerEnvironment::Execute(const ExecutionRequest& request) {
    if (destroyed_) {
        return MakeFailure(level_, core::ExitClassification::SANDBOX_CREATION_FAILED,
                           "Container " + container_id_ + " was destroyed");
    }

    if (auto denied = CheckEgress(request, level_)) {
        return *denied;
    }

    if (!request.context.EgressDestinations().empty() && !AttachEgress()) {
        return MakeFailure(level_, core::ExitClassification::SANDBOX_CREATION_FAILED,
                           "Could not attach egress network " + egress_network_ + ": " + cli_.LastError());
    }

    if (!cli_.UpdateResources(container_id_, request.plan.container_args)) {
        return MakeFailure(level_, core::ExitClassification::SANDBOX_CREATION_FAILED,
                           "Could not apply resource limits: " + cli_.LastError());
    }

    auto timeout = std::min(RemainingTime(request), request.plan.budget.max_wall_time);
    if (timeout.count() <= 0) {
        return MakeFailure(level_, core::ExitClassification::TIMEOUT_EXCEEDED,
                           "Deadline expired before execution started");
    }

    spdlog::debug("[BACKEND] {} executing in {} ({}ms budget)",
                  core::ToString(request.content_type), container_id_.substr(0, 12), timeout.count());

    ProcessOutcome outcome;
    try {
        outcome = cli_.ExecuteCommand(container_id_, RuntimeCommand(request), BuildProgram(request),
                                      timeout, user_, kWorkDir);
    } catch (const std::runtime_error& e) {
        spdlog::error("[BACKEND] exec in {} failed: {}", container_id_.substr(0, 12), e.what());
        return MakeFailure(level_, core::ExitClassification::SANDBOX_CREATION_FAILED, e.what());
    }

    if (StringUtils::StartsWith(outcome.stderr_data, "Error response from daemon")) {
        outcome.launch_error = StringUtils::Trim(outcome.stderr_data);
    } else if (!outcome.timed_out && outcome.exit_code == kKilledExitCode) {
        outcome.breach = core::ExitClassification::MEMORY_EXCEEDED;
    }

    auto result = ClassifyOutcome(outcome, level_);
    if (result.classification == core::ExitClassification::MEMORY_EXCEEDED && result.peak_memory_mb == 0) {
        result.peak_memory_mb = request.plan.budget.max_memory_mb;
    }
    return result;
}

bool ContainerEnvironment::Reset() {
    if (destroyed_) {
        return false;
    }

    ProcessOutcome outcome;
    try {
        outcome = cli_.ExecuteCommand(container_id_, {"sh", "-c", kResetScript}, "",
                                      kResetTimeout, user_, "/");
    } catch (const std::runtime_error& e) {
        spdlog::warn("[BACKEND] Reset of {} failed: {}", container_id_.substr(0, 12), e.what());
        return false;
    }

    if (!outcome.Exited() || outcome.exit_code != 0) {
        spdlog::warn("[BACKEND] Reset of {} failed (exit {}): {}", container_id_.substr(0, 12),
                     outcome.exit_code, StringUtils::Truncate(outcome.stderr_data, 256));
        return false;
    }

    if (egress_attached_ && !DetachEgress()) {
        return false;
    }

    auto info = cli_.GetContainerInfo(container_id_);
    if (!info || info->state != ContainerState::RUNNING) {
        spdlog::warn("[BACKEND] {} is no longer running", container_id_.substr(0, 12));
        return false;
    }
    for (const auto& network : info->networks) {
        if (network != "none") {
            spdlog::warn("[BACKEND] {} still attached to {}", container_id_.substr(0, 12), network);
            return false;
        }
    }
    return true;
}

void ContainerEnvironment::Destroy() {
    if (destroyed_) {
        return;
    }
    destroyed_ = true;

    if (!cli_.RemoveContainer(container_id_, true)) {
        spdlog::warn("[BACKEND] Container {} may have leaked: {}", container_id_.substr(0, 12), cli_.LastError());
    }
}

bool ContainerEnvironment::AttachEgress() {
    if (egress_attached_) {
        return true;
    }
    if (!cli_.DisconnectNetwork(container_id_, "none")) {
        return false;
    }
    if (!cli_.ConnectNetwork(container_id_, egress_network_)) {
        // Leave the container unusable rather than half-attached
        Destroy();
        return false;
    }
    egress_attached_ = true;
    return true;
}

bool ContainerEnvironment::DetachEgress() {
    if (!cli_.DisconnectNetwork(container_id_, egress_network_) ||
        !cli_.ConnectNetwork(container_id_, "none")) {
        return false;
    }
    egress_attached_ = false;
    return true;
}

// ============================================================================
// BACKEND
// ============================================================================

ContainerBackend::ContainerBackend(core::IsolationLevel level, std::shared_ptr<core::PolicyStore> policy_store)
    : level_(level)
    , policy_store_(std::move(policy_store)) {
    if (!policy_store_) {
        throw std::invalid_argument("ContainerBackend requires a policy store");
    }
}

std::string ContainerBackend::Name() const {
    auto policy = policy_store_->Current();
    auto it = policy->isolation.oci_runtimes.find(level_);
    auto runtime = it != policy->isolation.oci_runtimes.end() ? it->second : std::string("default");
    return "container/" + runtime;
}

ContainerConfig ContainerBackend::BuildConfig(const core::PolicySnapshot& policy) const {
    const auto& isolation = policy.isolation;
    auto ceiling = policy.CeilingFor(level_);

    auto runtime_it = isolation.oci_runtimes.find(level_);
    auto runtime = runtime_it != isolation.oci_runtimes.end() ? runtime_it->second : std::string();

    return ContainerBuilder()
        .WithName(ContainerUtils::GenerateContainerName("warden_" + ShortLevelName(level_)))
        .WithImage(isolation.container_image)
        .WithRuntime(runtime)
        .WithMemoryLimit(ceiling.max_memory_mb)
        .WithCPULimit(ceiling.max_cpu_cores)
        .WithPidsLimit(ceiling.max_processes)
        .WithOpenFilesLimit(isolation.max_open_files)
        .WithNetwork(NetworkMode::NONE)
        .WithUser(isolation.sandbox_user)
        .WithReadOnlyRootfs(true)
        .DropAllCapabilities()
        .WithTmpfs(kWorkDir, "rw,nosuid,nodev,size=64m,mode=1777")
        .WithTmpfs("/tmp", "rw,nosuid,nodev,noexec,size=16m,mode=1777")
        .WithWorkingDir(kWorkDir)
        .WithEnvironment("PYTHONDONTWRITEBYTECODE", "1")
        .WithEnvironment("OMP_NUM_THREADS", "1")
        .WithEnvironment("OPENBLAS_NUM_THREADS", "1")
        .WithLabel("warden.level", core::ToString(level_))
        .Build();
}

std::unique_ptr<SandboxEnvironment> ContainerBackend::Create(std::chrono::milliseconds budget) {
    if (budget.count() <= 0) {
        throw core::SandboxCreationError(core::ToString(level_) + " creation budget already spent");
    }

    auto policy = policy_store_->Current();
    auto config = BuildConfig(*policy);

    // `run` is bounded by the caller's budget, later commands by their own timeouts
    ContainerUtils creator(policy->isolation.container_binary, budget);
    auto container_id = creator.CreateContainer(config);
    if (container_id.empty()) {
        if (!creator.IsDaemonRunning()) {
            throw core::SandboxCreationError(core::ToString(level_) + " container daemon unreachable: " +
                                             creator.LastError());
        }
        throw core::SandboxCreationError(core::ToString(level_) + " container creation failed: " +
                                         creator.LastError());
    }

    ContainerUtils cli(policy->isolation.container_binary);

    return std::make_unique<ContainerEnvironment>(level_, std::move(cli), container_id,
                                                  policy->isolation.sandbox_user,
                                                  policy->isolation.egress_network);
}

} // namespace sandbox
} // namespace warden
