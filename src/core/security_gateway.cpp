/**
 * @file security_gateway.cpp
 * @brief Implementation of the gateway orchestrator
 *
 * **Lease Disposal**:
 * - Completed, failed and network-denied runs release the lease (reset, reuse)
 * - Timeouts, resource breaches and broken environments destroy it
 *
 * @date 2025
 */

#include "warden/core/security_gateway.hpp"
#include "warden/core/errors.hpp"
#include "warden/sandbox/resource_limiter.hpp"
#include "warden/validators/capability_validator.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <mutex>
#include <stdexcept>

using json = nlohmann::json;

namespace warden {
namespace core {

namespace {

constexpr auto kShutdownFlushTimeout = std::chrono::seconds(5);

bool IsExecutable(ContentType type) {
    return type == ContentType::CODE || type == ContentType::EXPRESSION;
}

/// Outcomes after which the environment must not be reused
bool RequiresDestroy(ExitClassification classification) {
    switch (classification) {
        case ExitClassification::TIMEOUT_EXCEEDED:
        case ExitClassification::MEMORY_EXCEEDED:
        case ExitClassification::PROCESS_LIMIT_EXCEEDED:
        case ExitClassification::SANDBOX_CREATION_FAILED:
            return true;
        default:
            return false;
    }
}

bool IsResourceBreach(ExitClassification classification) {
    return classification == ExitClassification::MEMORY_EXCEEDED ||
           classification == ExitClassification::PROCESS_LIMIT_EXCEEDED ||
           classification == ExitClassification::TIMEOUT_EXCEEDED;
}

std::chrono::microseconds Since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
}

} // anonymous namespace

bool GatewayResult::Succeeded() const {
    return validation.approved && (!execution || execution->success);
}

nlohmann::json ToJson(const GatewayResult& result) {
    nlohmann::json j = {
        {"request_id", result.request_id},
        {"requested_level", ToString(result.requested_level)},
        {"effective_level", ToString(result.effective_level)},
        {"degraded", result.degraded},
        {"reason", result.reason},
        {"validation", ToJson(result.validation)},
        {"execution", result.execution ? ToJson(*result.execution) : nlohmann::json(nullptr)}
    };
    if (result.recommended_budget) {
        j["recommended_budget"] = {
            {"max_memory_mb", result.recommended_budget->max_memory_mb},
            {"max_cpu_cores", result.recommended_budget->max_cpu_cores},
            {"max_processes", result.recommended_budget->max_processes},
            {"max_wall_time_ms", result.recommended_budget->max_wall_time.count()}
        };
    }
    return j;
}

// ============================================================================
// IMPLEMENTATION
// ============================================================================

class SecurityGateway::Impl {
public:
    std::shared_ptr<PolicyStore> policy_store;
    std::shared_ptr<EventBus> event_bus;
    std::unique_ptr<audit::AuditLogger> audit_logger;
    std::unique_ptr<validators::CapabilityValidator> validator;
    std::shared_ptr<sandbox::BackendRegistry> backends;
    std::unique_ptr<sandbox::SandboxPool> pool;
    std::unique_ptr<DegradationLadder> ladder;

    mutable std::mutex guard_mutex;
    std::shared_ptr<network::NetworkGuard> network_guard;

    std::atomic<bool> shut_down{false};

    std::shared_ptr<network::NetworkGuard> CurrentGuard() const {
        std::lock_guard<std::mutex> lock(guard_mutex);
        return network_guard;
    }

    /// Guard whose traffic is audited and whose alerts reach the bus
    std::shared_ptr<network::NetworkGuard> BuildGuard(const NetworkPolicy& policy) {
        auto guard = std::make_shared<network::NetworkGuard>(policy);

        auto* logger = audit_logger.get();
        guard->SetAuditHook([logger](const network::TrafficRecord& record) {
            audit::AuditEvent event;
            event.timestamp = record.timestamp;
            event.event_type = audit::event_types::kNetworkAccess;
            event.source = "network";
            event.component = record.component;
            event.decision = record.allowed ? "allowed" : "denied";
            event.details = {
                {"destination", record.destination},
                {"target", record.target},
                {"rule_matched", record.rule_matched},
                {"reason", record.reason}
            };
            logger->Append(std::move(event));
        });

        auto bus = event_bus;
        guard->SetAlertCallback([bus](const std::string& message) {
            Alert alert;
            alert.source = "network";
            alert.kind = ViolationKind::NETWORK_VIOLATION;
            alert.message = message;
            bus->RaiseAlert(std::move(alert));
        });

        return guard;
    }

    void Publish(GatewayEventType type, const SecurityContext& context,
                 std::optional<IsolationLevel> level = std::nullopt,
                 std::optional<ViolationKind> violation = std::nullopt,
                 const std::string& detail = {},
                 std::chrono::microseconds elapsed = std::chrono::microseconds(0)) {
        GatewayEvent event;
        event.type = type;
        event.component = context.ComponentName();
        event.request_id = context.RequestId();
        event.level = level;
        event.violation = violation;
        event.detail = detail;
        event.elapsed = elapsed;
        event_bus->Publish(std::move(event));
    }

    void Execute(const std::string& content, ContentType type, const SecurityContext& context,
                 std::chrono::steady_clock::time_point deadline, GatewayResult& result);

    void Degrade(const SecurityContext& context, IsolationLevel from, IsolationLevel to,
                 const std::string& cause);
};

void SecurityGateway::Impl::Degrade(const SecurityContext& context, IsolationLevel from,
                                    IsolationLevel to, const std::string& cause) {
    GatewayEvent event;
    event.type = GatewayEventType::DEGRADATION_TRIGGERED;
    event.component = context.ComponentName();
    event.request_id = context.RequestId();
    event.level = from;
    event.new_level = to;
    event.violation = ViolationKind::SANDBOX_CREATION_FAILED;
    event.detail = cause;
    event_bus->Publish(std::move(event));

    Alert alert;
    alert.source = "gateway";
    alert.kind = ViolationKind::SANDBOX_CREATION_FAILED;
    alert.message = "Isolation for " + ToString(context.RequestedLevel()) + " degraded from " +
                    ToString(from) + " to " + ToString(to) + ": " + cause;
    event_bus->RaiseAlert(std::move(alert));
}

void SecurityGateway::Impl::Execute(const std::string& content, ContentType type,
                                    const SecurityContext& context,
                                    std::chrono::steady_clock::time_point deadline,
                                    GatewayResult& result) {
    const auto requested = context.RequestedLevel();
    auto policy = policy_store->Current();
    auto guard = CurrentGuard();

    while (true) {
        auto level = ladder->EffectiveLevel(requested);
        result.effective_level = level;
        result.degraded = level != requested;

        if (std::chrono::steady_clock::now() >= deadline) {
            result.execution = sandbox::MakeFailure(level, ExitClassification::TIMEOUT_EXCEEDED,
                                                    "Deadline expired before a sandbox was acquired");
            break;
        }

        sandbox::Lease lease;
        try {
            lease = pool->Acquire(level, deadline, context.RequestId());
        } catch (const PoolExhaustedError& e) {
            result.execution = sandbox::MakeFailure(level, ExitClassification::POOL_EXHAUSTED, e.what());
            break;
        } catch (const DeadlineExceededError& e) {
            result.execution = sandbox::MakeFailure(level, ExitClassification::TIMEOUT_EXCEEDED, e.what());
            break;
        } catch (const SandboxCreationError& e) {
            if (auto weaker = ladder->RecordFailure(requested)) {
                Degrade(context, level, *weaker, e.what());
                continue;
            }
            if (ladder->IsExhausted(requested)) {
                result.execution = sandbox::MakeFailure(
                    level, ExitClassification::SANDBOX_CREATION_FAILED,
                    "Isolation ladder exhausted for " + ToString(requested) + ": " + e.what());
                break;
            }
            spdlog::debug("[GATEWAY] {} creation failed ({} consecutive), retrying",
                          ToString(level), ladder->ConsecutiveFailures(requested));
            continue;
        }

        ladder->RecordSuccess(requested);

        if (std::chrono::steady_clock::now() >= deadline) {
            pool->Release(lease);
            result.execution = sandbox::MakeFailure(level, ExitClassification::TIMEOUT_EXCEEDED,
                                                    "Deadline expired while acquiring a sandbox");
            break;
        }

        sandbox::ResourceLimiter limiter(policy->isolation);
        sandbox::ExecutionRequest request{content, type, context,
                                          limiter.Plan(context.Budget(), level),
                                          guard, deadline, policy};

        auto execution = lease.Execute(request);
        execution.isolation_level = level;
        execution.degraded = result.degraded;

        if (RequiresDestroy(execution.classification)) {
            pool->Destroy(lease, ToString(execution.classification));
        } else {
            pool->Release(lease);
        }

        result.execution = std::move(execution);
        break;
    }

    result.execution->degraded = result.degraded;
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

SecurityGateway::SecurityGateway(PolicySnapshot policy)
    : SecurityGateway([&policy]() {
          GatewayComponents components;
          components.policy_store = std::make_shared<PolicyStore>(std::move(policy));
          return components;
      }()) {
}

SecurityGateway::SecurityGateway(GatewayComponents components)
    : impl_(std::make_unique<Impl>()) {

    if (!components.policy_store) {
        throw std::invalid_argument("SecurityGateway requires a policy store");
    }

    impl_->policy_store = std::move(components.policy_store);
    auto policy = impl_->policy_store->Current();

    impl_->event_bus = components.event_bus ? std::move(components.event_bus)
                                            : std::make_shared<EventBus>();

    impl_->audit_logger = std::make_unique<audit::AuditLogger>(policy->audit, std::move(components.audit_sink));
    auto bus = impl_->event_bus;
    impl_->audit_logger->SetAlertCallback([bus](const Alert& alert) { bus->RaiseAlert(alert); });

    impl_->validator = std::make_unique<validators::CapabilityValidator>(impl_->policy_store);

    impl_->backends = components.backends ? std::move(components.backends)
                                          : sandbox::BackendRegistry::CreateDefault(impl_->policy_store);

    impl_->pool = std::make_unique<sandbox::SandboxPool>(impl_->backends, policy->pool, impl_->event_bus,
                                                         components.start_pool_maintenance);

    impl_->ladder = std::make_unique<DegradationLadder>(
        policy->gateway.creation_failure_threshold,
        policy->gateway.allow_ast_only_fallback ? IsolationLevel::NONE_AST_ONLY
                                                : IsolationLevel::NAMESPACE_SANDBOX);

    impl_->network_guard = impl_->BuildGuard(policy->network);

    spdlog::info("[GATEWAY] Initialized (policy version {}, {} backends)",
                 policy->version, impl_->backends->Levels().size());
}

SecurityGateway::~SecurityGateway() {
    Shutdown();
}

void SecurityGateway::Shutdown() {
    if (impl_->shut_down.exchange(true)) {
        return;
    }

    impl_->pool->Shutdown();
    if (!impl_->audit_logger->Flush(kShutdownFlushTimeout)) {
        spdlog::error("[GATEWAY] {} audit events still pending at shutdown",
                      impl_->audit_logger->PendingCount());
    }
    impl_->audit_logger->Shutdown();
}

// ============================================================================
// REQUEST PIPELINE
// ============================================================================

GatewayResult SecurityGateway::ValidateAndExecute(const std::string& content,
                                                  ContentType type,
                                                  const SecurityContext& context) {
    const auto start = std::chrono::steady_clock::now();
    auto policy = impl_->policy_store->Current();

    auto timeout = context.Timeout().count() > 0 ? context.Timeout() : policy->gateway.default_timeout;
    const auto deadline = start + timeout;

    GatewayResult result;
    result.request_id = context.RequestId();
    result.requested_level = context.RequestedLevel();
    result.effective_level = context.RequestedLevel();
    result.validation.content_type = type;

    audit::AuditEvent audit;
    audit.event_type = audit::event_types::kGatewayDecision;
    audit.source = "gateway";
    audit.CaptureContext(context);

    try {
        impl_->Publish(GatewayEventType::VALIDATION_REQUESTED, context);

        result.validation = impl_->validator->Validate(content, type);

        impl_->Publish(GatewayEventType::VALIDATION_COMPLETED, context, std::nullopt, std::nullopt,
                       result.validation.approved ? "approved" : "rejected", result.validation.elapsed);

        audit.content_hash = result.validation.content_hash;
        audit.violations = result.validation.violations;

        if (!result.validation.approved) {
            Violation first{ViolationKind::VALIDATION_FAILED, "Content was not approved", {}, std::nullopt, std::nullopt};
            if (!result.validation.violations.empty()) {
                first = result.validation.violations.front();
            }
            impl_->Publish(GatewayEventType::SECURITY_VIOLATION_DETECTED, context, std::nullopt,
                           first.kind, first.detail, result.validation.elapsed);

            result.reason = "Rejected with " + std::to_string(result.validation.violations.size()) +
                            " violation(s): " + first.detail;
            audit.decision = "rejected";

            spdlog::warn("[GATEWAY] {} rejected {} content {} from {} (risk {})",
                         context.RequestId(), ToString(type), result.validation.content_hash.substr(0, 12),
                         context.ComponentName(), result.validation.risk_score);

        } else if (!IsExecutable(type)) {
            result.reason = "Approved; " + ToString(type) + " content is not executed";
            audit.decision = "approved";

        } else {
            impl_->Execute(content, type, context, deadline, result);
            const auto& execution = *result.execution;

            audit.effective_level = execution.isolation_level;
            audit.wall_time = execution.wall_time;
            audit.peak_memory_mb = execution.peak_memory_mb;
            audit.decision = execution.success ? "executed" : "failed";

            if (auto kind = ToViolationKind(execution.classification)) {
                audit.violations.push_back({*kind, execution.failure_reason, {}, std::nullopt, std::nullopt});

                if (IsResourceBreach(execution.classification) ||
                    execution.classification == ExitClassification::NETWORK_VIOLATION) {
                    impl_->Publish(GatewayEventType::SECURITY_VIOLATION_DETECTED, context,
                                   execution.isolation_level, *kind, execution.failure_reason,
                                   std::chrono::duration_cast<std::chrono::microseconds>(execution.wall_time));
                }
            }

            if (execution.classification == ExitClassification::MEMORY_EXCEEDED ||
                execution.classification == ExitClassification::PROCESS_LIMIT_EXCEEDED) {
                result.recommended_budget = sandbox::ResourceLimiter::RecommendBudgetAfterBreach(context.Budget());
            }

            result.reason = execution.success
                ? "Executed at " + ToString(execution.isolation_level) + (result.degraded ? " (degraded)" : "")
                : ToString(execution.classification) + ": " + execution.failure_reason;
        }

    } catch (const std::exception& e) {
        spdlog::error("[GATEWAY] {} failed internally: {}", context.RequestId(), e.what());
        result.reason = std::string("Internal gateway error: ") + e.what();
        audit.decision = "error";
        if (result.validation.approved && IsExecutable(type) && !result.execution) {
            result.execution = sandbox::MakeFailure(result.effective_level,
                                                    ExitClassification::EXECUTION_FAILED, result.reason);
        }
    }

    audit.elapsed = Since(start);
    audit.details = {
        {"content_type", ToString(type)},
        {"detected_content_type", ToString(result.validation.detected_type)},
        {"approved", result.validation.approved},
        {"risk_score", result.validation.risk_score},
        {"effective_level", ToString(result.effective_level)},
        {"degraded", result.degraded},
        {"reason", result.reason},
        {"policy_version", policy->version}
    };
    if (result.execution) {
        audit.details["classification"] = ToString(result.execution->classification);
        audit.details["exit_code"] = result.execution->exit_code;
    }
    impl_->audit_logger->Append(std::move(audit));

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    if (!result.execution && elapsed > policy->gateway.slow_request_warning) {
        spdlog::warn("[GATEWAY] {} validation took {}ms", context.RequestId(), elapsed.count());
    }
    spdlog::debug("[GATEWAY] {} done in {}ms: {}", context.RequestId(), elapsed.count(), result.reason);

    return result;
}

// ============================================================================
// ADMINISTRATION
// ============================================================================

bool SecurityGateway::ResetDegradation(IsolationLevel level) {
    return impl_->ladder->Reset(level);
}

IsolationLevel SecurityGateway::EffectiveLevel(IsolationLevel requested) const {
    return impl_->ladder->EffectiveLevel(requested);
}

void SecurityGateway::ReloadPolicy(PolicySnapshot policy) {
    impl_->policy_store->Replace(std::move(policy));
    auto current = impl_->policy_store->Current();

    auto guard = impl_->BuildGuard(current->network);
    {
        std::lock_guard<std::mutex> lock(impl_->guard_mutex);
        impl_->network_guard = std::move(guard);
    }

    impl_->pool->UpdatePolicy(current->pool);
    impl_->ladder->SetFailureThreshold(current->gateway.creation_failure_threshold);

    spdlog::info("[GATEWAY] Policy reloaded (version {}, generation {})",
                 current->version, impl_->policy_store->Generation());
}

std::shared_ptr<const PolicySnapshot> SecurityGateway::Policy() const {
    return impl_->policy_store->Current();
}

void SecurityGateway::Prewarm() {
    impl_->pool->Prewarm();
}

std::shared_ptr<EventBus> SecurityGateway::Events() const {
    return impl_->event_bus;
}

audit::AuditLogger& SecurityGateway::Audit() {
    return *impl_->audit_logger;
}

sandbox::SandboxPool& SecurityGateway::Pool() {
    return *impl_->pool;
}

const DegradationLadder& SecurityGateway::Ladder() const {
    return *impl_->ladder;
}

std::shared_ptr<network::NetworkGuard> SecurityGateway::Network() const {
    return impl_->CurrentGuard();
}

} // namespace core
} // namespace warden
