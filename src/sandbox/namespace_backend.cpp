/**
 * @file namespace_backend.cpp
 * @brief Implementation of the namespace sandbox tier
 * @date 2025
 */

#include "warden/sandbox/namespace_backend.hpp"
#include "warden/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <stdlib.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace fs = std::filesystem;

namespace warden {
namespace sandbox {

// ============================================================================
// ENVIRONMENT
// ============================================================================

NamespaceEnvironment::NamespaceEnvironment(std::string id, fs::path work_dir, bool isolate)
    : id_(std::move(id))
    , work_dir_(std::move(work_dir))
    , isolate_(isolate) {
}

NamespaceEnvironment::~NamespaceEnvironment() {
    Destroy();
}

std::vector<std::string> NamespaceEnvironment::BuildEnvironment() const {
    return {
        "PATH=/usr/local/bin:/usr/bin:/bin",
        "HOME=" + work_dir_.string(),
        "TMPDIR=" + work_dir_.string(),
        "LANG=C.UTF-8",
        "PYTHONDONTWRITEBYTECODE=1",
        "OMP_NUM_THREADS=1",
        "OPENBLAS_NUM_THREADS=1"
    };
}

core::ExecutionResult NamespaceEnvironment::Execute(const ExecutionRequest& request) {
    const auto level = core::IsolationLevel::NAMESPACE_SANDBOX;

    if (destroyed_) {
        return MakeFailure(level, core::ExitClassification::SANDBOX_CREATION_FAILED,
                           "Environment " + id_ + " was destroyed");
    }

    if (auto denied = CheckEgress(request, level)) {
        return *denied;
    }
    if (!request.context.EgressDestinations().empty()) {
        return MakeFailure(level, core::ExitClassification::NETWORK_VIOLATION,
                           "Egress is unavailable at namespace isolation");
    }

    auto timeout = std::min(RemainingTime(request), request.plan.budget.max_wall_time);
    if (timeout.count() <= 0) {
        return MakeFailure(level, core::ExitClassification::TIMEOUT_EXCEEDED,
                           "Deadline expired before execution started");
    }

    ProcessSpec spec;
    spec.argv = RuntimeCommand(request);
    spec.stdin_data = BuildProgram(request);
    spec.plan = request.plan;
    spec.timeout = timeout;
    spec.isolate_namespaces = isolate_;
    spec.working_dir = work_dir_.string();
    spec.environment = BuildEnvironment();

    spdlog::debug("[BACKEND] {} executing {} ({}ms budget)", id_, spec.argv[0], timeout.count());

    try {
        auto outcome = ProcessRunner::Run(spec);
        return ClassifyOutcome(outcome, level);
    } catch (const std::runtime_error& e) {
        spdlog::error("[BACKEND] {} could not launch: {}", id_, e.what());
        return MakeFailure(level, core::ExitClassification::SANDBOX_CREATION_FAILED, e.what());
    }
}

bool NamespaceEnvironment::Reset() {
    if (destroyed_) {
        return false;
    }

    std::error_code ec;
    for (fs::directory_iterator it(work_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code remove_ec;
        fs::remove_all(it->path(), remove_ec);
        if (remove_ec) {
            spdlog::warn("[BACKEND] {} reset could not remove {}: {}",
                         id_, it->path().string(), remove_ec.message());
            return false;
        }
    }

    if (ec) {
        spdlog::warn("[BACKEND] {} reset failed: {}", id_, ec.message());
        return false;
    }
    return fs::is_directory(work_dir_, ec) && fs::is_empty(work_dir_, ec);
}

void NamespaceEnvironment::Destroy() {
    if (destroyed_) {
        return;
    }
    destroyed_ = true;

    std::error_code ec;
    fs::remove_all(work_dir_, ec);
    if (ec) {
        spdlog::warn("[BACKEND] Failed to remove {}: {}", work_dir_.string(), ec.message());
    }
}

// ============================================================================
// BACKEND
// ============================================================================

NamespaceBackend::NamespaceBackend(fs::path base_dir, bool isolate)
    : base_dir_(std::move(base_dir))
    , isolate_(isolate) {
    if (base_dir_.empty()) {
        std::error_code ec;
        auto tmp = fs::temp_directory_path(ec);
        base_dir_ = (ec ? fs::path("/tmp") : tmp) / "warden";
    }
}

std::unique_ptr<SandboxEnvironment> NamespaceBackend::Create(std::chrono::milliseconds budget) {
    if (budget.count() <= 0) {
        throw core::SandboxCreationError("namespace creation budget already spent");
    }
    if (isolate_ && !ProcessRunner::NamespacesAvailable()) {
        throw core::SandboxCreationError("Unprivileged user namespaces are unavailable on this host");
    }

    std::error_code ec;
    fs::create_directories(base_dir_, ec);
    if (ec) {
        throw core::SandboxCreationError("Cannot create " + base_dir_.string() + ": " + ec.message());
    }

    std::string pattern = (base_dir_ / "ns-XXXXXX").string();
    if (!mkdtemp(pattern.data())) {
        throw core::SandboxCreationError("mkdtemp failed under " + base_dir_.string() + ": " +
                                         std::strerror(errno));
    }

    fs::path work_dir(pattern);
    fs::permissions(work_dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("[BACKEND] Could not restrict {}: {}", work_dir.string(), ec.message());
    }

    auto id = work_dir.filename().string();
    spdlog::debug("[BACKEND] Created namespace environment {}", id);
    return std::make_unique<NamespaceEnvironment>(id, work_dir, isolate_);
}

} // namespace sandbox
} // namespace warden
