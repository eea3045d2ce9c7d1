/**
 * @file security_gateway.hpp
 * @brief Mandatory choke-point for AI-generated content
 *
 * Orchestrates one request end to end:
 *
 * ```
 *   ValidationRequested -> Validate -> ValidationCompleted
 *        |                                  |
 *        | rejected                         | approved (Code / Expression)
 *        v                                  v
 *   SecurityViolationDetected     ladder level -> Acquire lease -> Execute
 *        |                                  |           |
 *        |                                  |   creation failure -> ladder step
 *        v                                  v
 *   one GatewayDecision audit event   Release / Destroy -> one GatewayDecision audit event
 * ```
 *
 * The gateway owns the degradation ladder and is the only component that
 * changes it. Prompt and Config content is validated only.
 *
 * @date 2025
 */

#pragma once

#include "warden/audit/audit_logger.hpp"
#include "warden/core/degradation_ladder.hpp"
#include "warden/core/event_bus.hpp"
#include "warden/core/policy.hpp"
#include "warden/core/types.hpp"
#include "warden/network/network_guard.hpp"
#include "warden/sandbox/sandbox_backend.hpp"
#include "warden/sandbox/sandbox_pool.hpp"

#include <memory>
#include <optional>
#include <string>

namespace warden {
namespace core {

/**
 * @struct GatewayResult
 * @brief Definitive outcome of one request
 */
struct GatewayResult {
    std::string request_id;
    ValidationResult validation;
    std::optional<ExecutionResult> execution;          ///< Absent when rejected or not executable
    IsolationLevel requested_level{IsolationLevel::CONTAINER};
    IsolationLevel effective_level{IsolationLevel::CONTAINER};
    bool degraded{false};                              ///< Ran below the requested level
    std::string reason;                                ///< One-line summary for the caller
    std::optional<ResourceBudget> recommended_budget;  ///< Smaller budget after a resource breach

    /// Approved and, when executed, completed successfully
    bool Succeeded() const;
};

/// Caller-facing JSON rendering, also printed by the CLI
nlohmann::json ToJson(const GatewayResult& result);

/**
 * @struct GatewayComponents
 * @brief Collaborators a gateway is assembled from
 *
 * Unset members are built from the policy: the built-in backend registry,
 * a fresh event bus and a file audit sink under policy.audit.directory.
 */
struct GatewayComponents {
    std::shared_ptr<PolicyStore> policy_store;                ///< Required
    std::shared_ptr<sandbox::BackendRegistry> backends;
    std::shared_ptr<EventBus> event_bus;
    std::unique_ptr<audit::AuditSink> audit_sink;
    bool start_pool_maintenance{true};
};

/**
 * @class SecurityGateway
 * @brief Validates, executes and audits untrusted content
 *
 * **Usage Example**:
 * @code
 * SecurityGateway gateway(PolicySnapshot::LoadFile("config/policy.json"));
 *
 * auto context = SecurityContextBuilder()
 *     .WithComponent("factor_mining")
 *     .WithIsolation(IsolationLevel::CONTAINER)
 *     .WithTimeout(std::chrono::seconds(2))
 *     .Build();
 *
 * auto result = gateway.ValidateAndExecute("mean(close) - mean(close, 20)",
 *                                          ContentType::EXPRESSION, context);
 * if (result.Succeeded()) {
 *     spdlog::info("value: {}", result.execution->output);
 * }
 * @endcode
 *
 * **Thread Safety**: ValidateAndExecute may be called from many threads.
 */
class SecurityGateway {
public:
    /**
     * @brief Gateway with built-in collaborators
     * @throws PolicyError if the snapshot is invalid
     */
    explicit SecurityGateway(PolicySnapshot policy);

    /**
     * @brief Gateway over supplied collaborators
     * @throws std::invalid_argument if no policy store is given
     */
    explicit SecurityGateway(GatewayComponents components);

    ~SecurityGateway();

    SecurityGateway(const SecurityGateway&) = delete;
    SecurityGateway& operator=(const SecurityGateway&) = delete;

    /**
     * @brief Run one request through validation and, if approved, execution
     *
     * Never throws for request-level failures; every outcome, including
     * internal errors, is reported on the result and audited exactly once.
     */
    GatewayResult ValidateAndExecute(const std::string& content,
                                     ContentType type,
                                     const SecurityContext& context);

    /**
     * @brief Administrative reset of a degraded level
     * @return true if the level was degraded or failing
     */
    bool ResetDegradation(IsolationLevel level);

    /// Level a request at `requested` currently runs at
    IsolationLevel EffectiveLevel(IsolationLevel requested) const;

    /**
     * @brief Swap in a new policy snapshot atomically
     * @throws PolicyError if invalid; the active policy is kept
     */
    void ReloadPolicy(PolicySnapshot policy);

    std::shared_ptr<const PolicySnapshot> Policy() const;

    /// Create idle instances up to the configured targets
    void Prewarm();

    std::shared_ptr<EventBus> Events() const;
    audit::AuditLogger& Audit();
    sandbox::SandboxPool& Pool();
    const DegradationLadder& Ladder() const;

    /// Current network guard (replaced on reload)
    std::shared_ptr<network::NetworkGuard> Network() const;

    /// Stop the pool and drain the audit queue
    void Shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace core
} // namespace warden
