/**
 * @file namespace_backend.hpp
 * @brief Linux namespace sandbox tier
 *
 * Runs the interpreter as a forked child inside fresh user, PID, mount,
 * IPC, UTS and network namespaces with rlimits and CPU affinity applied.
 * Each environment owns a private work directory that Reset() empties.
 *
 * The new network namespace has no interfaces, so this tier cannot grant
 * egress: requests that ask for network destinations are refused with
 * NETWORK_VIOLATION even when the network guard would allow them.
 *
 * @date 2025
 */

#pragma once

#include "warden/sandbox/sandbox_backend.hpp"

#include <atomic>
#include <filesystem>

namespace warden {
namespace sandbox {

class NamespaceEnvironment : public SandboxEnvironment {
public:
    NamespaceEnvironment(std::string id, std::filesystem::path work_dir, bool isolate);
    ~NamespaceEnvironment() override;

    const std::string& Id() const override { return id_; }
    core::IsolationLevel Level() const override { return core::IsolationLevel::NAMESPACE_SANDBOX; }

    core::ExecutionResult Execute(const ExecutionRequest& request) override;
    bool Reset() override;
    void Destroy() override;

    const std::filesystem::path& WorkDir() const { return work_dir_; }

private:
    std::vector<std::string> BuildEnvironment() const;

    std::string id_;
    std::filesystem::path work_dir_;
    bool isolate_;
    bool destroyed_{false};
};

/**
 * @class NamespaceBackend
 * @brief Creates namespace environments under a base directory
 */
class NamespaceBackend : public SandboxBackend {
public:
    /**
     * @param base_dir Parent of per-environment work dirs (default: $TMPDIR/warden)
     * @param isolate Enter namespaces (disable only where rlimits alone are acceptable)
     */
    explicit NamespaceBackend(std::filesystem::path base_dir = {}, bool isolate = true);

    core::IsolationLevel Level() const override { return core::IsolationLevel::NAMESPACE_SANDBOX; }
    std::string Name() const override { return "namespace"; }

    /// @throws core::SandboxCreationError if namespaces or the work dir are unavailable
    std::unique_ptr<SandboxEnvironment> Create(std::chrono::milliseconds budget) override;

private:
    std::filesystem::path base_dir_;
    bool isolate_;
};

} // namespace sandbox
} // namespace warden
