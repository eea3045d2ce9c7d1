/**
 * @file container_backend.hpp
 * @brief OCI container tiers (micro-VM, userspace kernel, container)
 *
 * The three strongest isolation levels share one implementation and differ
 * only in the OCI runtime handed to the container CLI: kata-fc for
 * MICRO_VM, runsc (gVisor) for USERSPACE_KERNEL, runc for CONTAINER.
 *
 * Each environment is a warm `sleep infinity` container. Execute() tightens
 * the container's limits to the request's plan with `update`, then pipes the
 * program into the interpreter with `exec -i`. Egress is granted by swapping
 * the `none` network for the configured egress network, and Reset() swaps
 * it back.
 *
 * @date 2025
 */

#pragma once

#include "warden/sandbox/container_utils.hpp"
#include "warden/sandbox/sandbox_backend.hpp"

namespace warden {
namespace sandbox {

class ContainerEnvironment : public SandboxEnvironment {
public:
    ContainerEnvironment(core::IsolationLevel level,
                         ContainerUtils cli,
                         std::string container_id,
                         std::string user,
                         std::string egress_network);
    ~ContainerEnvironment() override;

    const std::string& Id() const override { return container_id_; }
    core::IsolationLevel Level() const override { return level_; }

    core::ExecutionResult Execute(const ExecutionRequest& request) override;
    bool Reset() override;
    void Destroy() override;

private:
    bool AttachEgress();
    bool DetachEgress();

    core::IsolationLevel level_;
    ContainerUtils cli_;
    std::string container_id_;
    std::string user_;
    std::string egress_network_;
    bool egress_attached_{false};
    bool destroyed_{false};
};

/**
 * @class ContainerBackend
 * @brief Creates hardened warm containers for one isolation level
 */
class ContainerBackend : public SandboxBackend {
public:
    ContainerBackend(core::IsolationLevel level, std::shared_ptr<core::PolicyStore> policy_store);

    core::IsolationLevel Level() const override { return level_; }
    std::string Name() const override;

    /// @throws core::SandboxCreationError if the CLI, daemon, image or runtime is unavailable
    std::unique_ptr<SandboxEnvironment> Create(std::chrono::milliseconds budget) override;

    /// Configuration a new environment would be created with
    ContainerConfig BuildConfig(const core::PolicySnapshot& policy) const;

private:
    core::IsolationLevel level_;
    std::shared_ptr<core::PolicyStore> policy_store_;
};

} // namespace sandbox
} // namespace warden
