/**
 * @file types.cpp
 * @brief Implementation of core value types and enum conversions
 *
 * @date 2025
 */

#include "warden/core/types.hpp"
#include "warden/utils/string_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace warden {
namespace core {

namespace {

std::string GenerateId(const std::string& prefix) {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dis;

    std::ostringstream oss;
    oss << prefix << "-" << std::hex << std::setw(16) << std::setfill('0') << dis(gen);
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// SECURITY CONTEXT
// ============================================================================

SecurityContext::SecurityContext(std::string component_name,
                                 std::string user_id,
                                 std::string session_id,
                                 IsolationLevel isolation_level,
                                 ResourceBudget budget,
                                 std::chrono::milliseconds timeout,
                                 std::vector<std::string> egress_destinations,
                                 std::string request_id)
    : component_name_(std::move(component_name))
    , user_id_(std::move(user_id))
    , session_id_(std::move(session_id))
    , isolation_level_(isolation_level)
    , budget_(budget)
    , timeout_(timeout)
    , egress_destinations_(std::move(egress_destinations))
    , request_id_(std::move(request_id)) {
}

SecurityContextBuilder& SecurityContextBuilder::WithComponent(const std::string& name) {
    component_name_ = name;
    return *this;
}

SecurityContextBuilder& SecurityContextBuilder::WithUser(const std::string& user_id) {
    user_id_ = user_id;
    return *this;
}

SecurityContextBuilder& SecurityContextBuilder::WithSession(const std::string& session_id) {
    session_id_ = session_id;
    return *this;
}

SecurityContextBuilder& SecurityContextBuilder::WithIsolation(IsolationLevel level) {
    isolation_level_ = level;
    return *this;
}

SecurityContextBuilder& SecurityContextBuilder::WithBudget(const ResourceBudget& budget) {
    budget_ = budget;
    return *this;
}

SecurityContextBuilder& SecurityContextBuilder::WithMemoryLimit(std::size_t mb) {
    budget_.max_memory_mb = mb;
    return *this;
}

SecurityContextBuilder& SecurityContextBuilder::WithTimeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
    return *this;
}

SecurityContextBuilder& SecurityContextBuilder::WithEgress(const std::string& destination) {
    egress_destinations_.push_back(destination);
    return *this;
}

SecurityContextBuilder& SecurityContextBuilder::WithRequestId(const std::string& request_id) {
    request_id_ = request_id;
    return *this;
}

SecurityContext SecurityContextBuilder::Build() const {
    return SecurityContext(
        component_name_,
        user_id_,
        session_id_.empty() ? GenerateId("session") : session_id_,
        isolation_level_,
        budget_,
        timeout_,
        egress_destinations_,
        request_id_.empty() ? GenerateId("req") : request_id_);
}

// ============================================================================
// RESULT QUERIES
// ============================================================================

bool ValidationResult::HasViolation(ViolationKind kind) const {
    return std::any_of(violations.begin(), violations.end(),
                       [kind](const Violation& v) { return v.kind == kind; });
}

bool ValidationResult::NamesSubject(const std::string& subject) const {
    return std::any_of(violations.begin(), violations.end(),
                       [&subject](const Violation& v) { return v.subject == subject; });
}

// ============================================================================
// ISOLATION LADDER
// ============================================================================

const std::vector<IsolationLevel>& AllIsolationLevels() {
    static const std::vector<IsolationLevel> levels = {
        IsolationLevel::MICRO_VM,
        IsolationLevel::USERSPACE_KERNEL,
        IsolationLevel::CONTAINER,
        IsolationLevel::NAMESPACE_SANDBOX,
        IsolationLevel::NONE_AST_ONLY
    };
    return levels;
}

std::optional<IsolationLevel> WeakerLevel(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::MICRO_VM:          return IsolationLevel::USERSPACE_KERNEL;
        case IsolationLevel::USERSPACE_KERNEL:  return IsolationLevel::CONTAINER;
        case IsolationLevel::CONTAINER:         return IsolationLevel::NAMESPACE_SANDBOX;
        case IsolationLevel::NAMESPACE_SANDBOX: return IsolationLevel::NONE_AST_ONLY;
        case IsolationLevel::NONE_AST_ONLY:     return std::nullopt;
    }
    return std::nullopt;
}

bool IsStronger(IsolationLevel a, IsolationLevel b) {
    // Enumerators are declared strongest first
    return static_cast<int>(a) < static_cast<int>(b);
}

std::optional<ViolationKind> ToViolationKind(ExitClassification classification) {
    switch (classification) {
        case ExitClassification::EXECUTION_FAILED:        return ViolationKind::EXECUTION_FAILED;
        case ExitClassification::TIMEOUT_EXCEEDED:        return ViolationKind::TIMEOUT_EXCEEDED;
        case ExitClassification::MEMORY_EXCEEDED:         return ViolationKind::MEMORY_EXCEEDED;
        case ExitClassification::PROCESS_LIMIT_EXCEEDED:  return ViolationKind::PROCESS_LIMIT_EXCEEDED;
        case ExitClassification::NETWORK_VIOLATION:       return ViolationKind::NETWORK_VIOLATION;
        case ExitClassification::SANDBOX_CREATION_FAILED: return ViolationKind::SANDBOX_CREATION_FAILED;
        case ExitClassification::POOL_EXHAUSTED:          return ViolationKind::POOL_EXHAUSTED;
        case ExitClassification::COMPLETED:
        case ExitClassification::NOT_EXECUTED:
            return std::nullopt;
    }
    return std::nullopt;
}

// ============================================================================
// STRING CONVERSION
// ============================================================================

std::string ToString(ContentType type) {
    switch (type) {
        case ContentType::CODE:       return "code";
        case ContentType::PROMPT:     return "prompt";
        case ContentType::CONFIG:     return "config";
        case ContentType::EXPRESSION: return "expression";
    }
    return "unknown";
}

std::string ToString(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::MICRO_VM:          return "microvm";
        case IsolationLevel::USERSPACE_KERNEL:  return "userspace_kernel";
        case IsolationLevel::CONTAINER:         return "container";
        case IsolationLevel::NAMESPACE_SANDBOX: return "namespace";
        case IsolationLevel::NONE_AST_ONLY:     return "ast_only";
    }
    return "unknown";
}

std::string ToString(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::VALIDATION_FAILED:       return "ValidationFailed";
        case ViolationKind::BLACKLIST_DETECTED:      return "BlacklistDetected";
        case ViolationKind::SANDBOX_CREATION_FAILED: return "SandboxCreationFailed";
        case ViolationKind::TIMEOUT_EXCEEDED:        return "TimeoutExceeded";
        case ViolationKind::MEMORY_EXCEEDED:         return "MemoryExceeded";
        case ViolationKind::PROCESS_LIMIT_EXCEEDED:  return "ProcessLimitExceeded";
        case ViolationKind::NETWORK_VIOLATION:       return "NetworkViolation";
        case ViolationKind::EXECUTION_FAILED:        return "ExecutionFailed";
        case ViolationKind::POOL_EXHAUSTED:          return "PoolExhausted";
        case ViolationKind::AUDIT_WRITE_FAILED:      return "AuditWriteFailed";
    }
    return "Unknown";
}

std::string ToString(ExitClassification classification) {
    switch (classification) {
        case ExitClassification::COMPLETED:               return "completed";
        case ExitClassification::EXECUTION_FAILED:        return "execution_failed";
        case ExitClassification::TIMEOUT_EXCEEDED:        return "timeout_exceeded";
        case ExitClassification::MEMORY_EXCEEDED:         return "memory_exceeded";
        case ExitClassification::PROCESS_LIMIT_EXCEEDED:  return "process_limit_exceeded";
        case ExitClassification::NETWORK_VIOLATION:       return "network_violation";
        case ExitClassification::SANDBOX_CREATION_FAILED: return "sandbox_creation_failed";
        case ExitClassification::POOL_EXHAUSTED:          return "pool_exhausted";
        case ExitClassification::NOT_EXECUTED:            return "not_executed";
    }
    return "unknown";
}

std::optional<ContentType> ParseContentType(const std::string& name) {
    auto lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lower == "code") return ContentType::CODE;
    if (lower == "prompt") return ContentType::PROMPT;
    if (lower == "config") return ContentType::CONFIG;
    if (lower == "expression" || lower == "factor") return ContentType::EXPRESSION;
    return std::nullopt;
}

std::optional<IsolationLevel> ParseIsolationLevel(const std::string& name) {
    auto lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lower == "microvm" || lower == "firecracker") return IsolationLevel::MICRO_VM;
    if (lower == "userspace_kernel" || lower == "gvisor") return IsolationLevel::USERSPACE_KERNEL;
    if (lower == "container" || lower == "docker") return IsolationLevel::CONTAINER;
    if (lower == "namespace" || lower == "bubblewrap") return IsolationLevel::NAMESPACE_SANDBOX;
    if (lower == "ast_only" || lower == "none") return IsolationLevel::NONE_AST_ONLY;
    return std::nullopt;
}

// ============================================================================
// JSON SERIALIZATION
// ============================================================================

nlohmann::json ToJson(const Violation& violation) {
    nlohmann::json j = {
        {"kind", ToString(violation.kind)},
        {"detail", violation.detail}
    };
    if (!violation.subject.empty()) j["subject"] = violation.subject;
    if (violation.line) j["line"] = *violation.line;
    if (violation.column) j["column"] = *violation.column;
    return j;
}

nlohmann::json ToJson(const ValidationResult& result) {
    auto violations = nlohmann::json::array();
    for (const auto& violation : result.violations) {
        violations.push_back(ToJson(violation));
    }

    return {
        {"approved", result.approved},
        {"content_type", ToString(result.content_type)},
        {"detected_type", ToString(result.detected_type)},
        {"risk_score", result.risk_score},
        {"content_hash", result.content_hash},
        {"elapsed_us", result.elapsed.count()},
        {"violations", violations},
        {"referenced_destinations", result.referenced_destinations},
        {"metrics", {
            {"node_count", result.metrics.node_count},
            {"max_depth", result.metrics.max_depth},
            {"complexity", result.metrics.complexity},
            {"import_count", result.metrics.import_count}
        }}
    };
}

nlohmann::json ToJson(const ExecutionResult& result) {
    return {
        {"success", result.success},
        {"classification", ToString(result.classification)},
        {"output", result.output},
        {"error_output", result.error_output},
        {"failure_reason", result.failure_reason},
        {"exit_code", result.exit_code},
        {"wall_time_ms", result.wall_time.count()},
        {"peak_memory_mb", result.peak_memory_mb},
        {"isolation_level", ToString(result.isolation_level)},
        {"degraded", result.degraded}
    };
}

} // namespace core
} // namespace warden
