/**
 * @file sandbox_backend.hpp
 * @brief Strategy interface over isolation technologies
 *
 * Each isolation level is served by one SandboxBackend that creates
 * SandboxEnvironment instances. The pool and the orchestrator only ever
 * talk to these interfaces, so moving down the degradation ladder is a
 * matter of asking the registry for a different level.
 *
 * **Environment Lifecycle**:
 * 1. Create()  - backend builds a warm environment within a time budget (may throw)
 * 2. Execute() - run one approved piece of content
 * 3. Reset()   - scrub state so the instance can be leased again
 * 4. Destroy() - tear down; the instance is never used again
 *
 * @date 2025
 */

#pragma once

#include "warden/core/policy.hpp"
#include "warden/core/types.hpp"
#include "warden/sandbox/process_runner.hpp"
#include "warden/sandbox/resource_limiter.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden {

namespace network {
class NetworkGuard;
}

namespace sandbox {

/**
 * @struct ExecutionRequest
 * @brief Everything a backend needs for one execution
 */
struct ExecutionRequest {
    std::string content;                                  ///< Approved content
    core::ContentType content_type;                       ///< Code or Expression
    const core::SecurityContext& context;                 ///< Caller identity and egress wishes
    EnforcementPlan plan;                                 ///< Limits for the effective level
    std::shared_ptr<network::NetworkGuard> network_guard; ///< Egress decisions (null = deny all)
    std::chrono::steady_clock::time_point deadline;       ///< Absolute request deadline
    std::shared_ptr<const core::PolicySnapshot> policy;   ///< Snapshot the request was validated under
};

/**
 * @class SandboxEnvironment
 * @brief One isolated, reusable execution environment
 */
class SandboxEnvironment {
public:
    virtual ~SandboxEnvironment() = default;

    /// Unique instance identifier (container id, work dir name, ...)
    virtual const std::string& Id() const = 0;

    virtual core::IsolationLevel Level() const = 0;

    /**
     * @brief Run content under the request's limits
     *
     * Never throws for content failures; every outcome is classified on
     * the returned result.
     */
    virtual core::ExecutionResult Execute(const ExecutionRequest& request) = 0;

    /// Scrub state for reuse; false means the instance must be destroyed
    virtual bool Reset() = 0;

    virtual void Destroy() = 0;
};

/**
 * @class SandboxBackend
 * @brief Factory for environments at one isolation level
 */
class SandboxBackend {
public:
    virtual ~SandboxBackend() = default;

    virtual core::IsolationLevel Level() const = 0;
    virtual std::string Name() const = 0;

    /**
     * @brief Create a warm environment
     * @param budget Time left for creation; backends bound their own calls by it
     * @throws core::SandboxCreationError if the technology is unavailable or the budget ran out
     */
    virtual std::unique_ptr<SandboxEnvironment> Create(std::chrono::milliseconds budget) = 0;
};

/**
 * @class BackendRegistry
 * @brief Backends keyed by isolation level
 *
 * **Thread Safety**: All methods are thread-safe.
 */
class BackendRegistry {
public:
    /// Register or replace the backend for its level
    void Register(std::shared_ptr<SandboxBackend> backend);

    /// Backend for a level, nullptr if none is registered
    std::shared_ptr<SandboxBackend> Get(core::IsolationLevel level) const;

    bool Has(core::IsolationLevel level) const;

    /// Registered levels, strongest first
    std::vector<core::IsolationLevel> Levels() const;

    /**
     * @brief Registry with the built-in backends
     *
     * Container tiers for MICRO_VM, USERSPACE_KERNEL and CONTAINER (each
     * with its configured OCI runtime), the namespace sandbox, and the
     * AST-only tier.
     */
    static std::shared_ptr<BackendRegistry> CreateDefault(std::shared_ptr<core::PolicyStore> policy_store);

private:
    mutable std::mutex mutex_;
    std::map<core::IsolationLevel, std::shared_ptr<SandboxBackend>> backends_;
};

// ============================================================================
// SHARED BACKEND HELPERS
// ============================================================================

/**
 * @brief Program text fed to the interpreter
 *
 * Expressions are wrapped with the operator prelude and printed; code is
 * passed through unchanged.
 */
std::string BuildProgram(const ExecutionRequest& request);

/// Interpreter argv for the request's content type
std::vector<std::string> RuntimeCommand(const ExecutionRequest& request);

/**
 * @brief Ask the network guard about every requested destination
 * @return NETWORK_VIOLATION result on the first denial, std::nullopt when all are allowed
 */
std::optional<core::ExecutionResult> CheckEgress(const ExecutionRequest& request,
                                                 core::IsolationLevel level);

/// Time left until the request deadline (zero when already past)
std::chrono::milliseconds RemainingTime(const ExecutionRequest& request);

/// Failed result with a classification and reason
core::ExecutionResult MakeFailure(core::IsolationLevel level,
                                  core::ExitClassification classification,
                                  const std::string& reason);

/**
 * @brief Turn a finished process into an ExecutionResult
 *
 * Timeouts win over breaches; breaches win over exit status. Allocation
 * failures reported on stderr are classified as MEMORY_EXCEEDED.
 */
core::ExecutionResult ClassifyOutcome(const ProcessOutcome& outcome, core::IsolationLevel level);

} // namespace sandbox
} // namespace warden
