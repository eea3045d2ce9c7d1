/**
 * @file types.hpp
 * @brief Core value types shared by every gateway component
 *
 * Content and isolation enums, the closed violation taxonomy, resource
 * budgets, the immutable per-request SecurityContext, and the validation
 * and execution result records.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace core {

/**
 * @enum ContentType
 * @brief Category of untrusted artifact submitted to the gateway
 */
enum class ContentType {
    CODE,        ///< Python-like source code
    PROMPT,      ///< LLM prompt text
    CONFIG,      ///< JSON configuration document
    EXPRESSION   ///< Single factor expression
};

/**
 * @enum IsolationLevel
 * @brief Sandbox technology, ordered strongest to weakest
 *
 * The degradation ladder only ever moves down this list.
 */
enum class IsolationLevel {
    MICRO_VM,           ///< Hardware virtualization (Firecracker/Kata)
    USERSPACE_KERNEL,   ///< Userspace kernel (gVisor)
    CONTAINER,          ///< OCI container (runc)
    NAMESPACE_SANDBOX,  ///< Linux namespaces + rlimits
    NONE_AST_ONLY       ///< Static analysis only, never executes
};

/**
 * @enum ViolationKind
 * @brief Closed error taxonomy for validation and execution failures
 */
enum class ViolationKind {
    VALIDATION_FAILED,        ///< Parse error or content-type rule violation
    BLACKLIST_DETECTED,       ///< Denied call, module or namespace
    SANDBOX_CREATION_FAILED,  ///< Backend could not create an environment
    TIMEOUT_EXCEEDED,         ///< Deadline reached
    MEMORY_EXCEEDED,          ///< Memory ceiling breached
    PROCESS_LIMIT_EXCEEDED,   ///< Process-count ceiling breached
    NETWORK_VIOLATION,        ///< Denied network destination
    EXECUTION_FAILED,         ///< Sandboxed code raised or crashed
    POOL_EXHAUSTED,           ///< No lease available before the deadline
    AUDIT_WRITE_FAILED        ///< Audit sink unreachable (non-fatal)
};

/**
 * @enum ExitClassification
 * @brief How a sandboxed execution attempt ended
 */
enum class ExitClassification {
    COMPLETED,
    EXECUTION_FAILED,
    TIMEOUT_EXCEEDED,
    MEMORY_EXCEEDED,
    PROCESS_LIMIT_EXCEEDED,
    NETWORK_VIOLATION,
    SANDBOX_CREATION_FAILED,
    POOL_EXHAUSTED,
    NOT_EXECUTED   ///< AST-only tier, nothing ran
};

/**
 * @struct ResourceBudget
 * @brief Logical resource ceilings for one execution
 */
struct ResourceBudget {
    std::size_t max_memory_mb{512};                     ///< Address-space / cgroup memory (MB)
    double max_cpu_cores{1.0};                          ///< CPU cores
    int max_processes{32};                              ///< Process/thread count
    std::chrono::milliseconds max_wall_time{30000};     ///< Wall-clock limit
};

/**
 * @struct Violation
 * @brief A single detected rule breach
 */
struct Violation {
    ViolationKind kind{ViolationKind::VALIDATION_FAILED};  ///< Taxonomy entry
    std::string detail;                                    ///< Human-readable detail
    std::string subject;                                   ///< Offending identifier (e.g. "os.system")
    std::optional<int> line;                               ///< 1-based source line
    std::optional<int> column;                             ///< 1-based source column
};

/**
 * @struct ComplexityMetrics
 * @brief Structural measurements gathered while walking a syntax tree
 */
struct ComplexityMetrics {
    std::size_t node_count{0};
    std::size_t max_depth{0};
    std::size_t complexity{0};    ///< Decision points
    std::size_t import_count{0};  ///< Distinct top-level namespaces
};

/**
 * @class SecurityContext
 * @brief Immutable description of who is asking and under which limits
 *
 * Built once by SecurityContextBuilder and never mutated afterwards.
 */
class SecurityContext {
public:
    SecurityContext(std::string component_name,
                    std::string user_id,
                    std::string session_id,
                    IsolationLevel isolation_level,
                    ResourceBudget budget,
                    std::chrono::milliseconds timeout,
                    std::vector<std::string> egress_destinations,
                    std::string request_id);

    const std::string& ComponentName() const { return component_name_; }
    const std::string& UserId() const { return user_id_; }
    const std::string& SessionId() const { return session_id_; }
    IsolationLevel RequestedLevel() const { return isolation_level_; }
    const ResourceBudget& Budget() const { return budget_; }
    std::chrono::milliseconds Timeout() const { return timeout_; }

    /// Network destinations the content asks to reach during execution
    const std::vector<std::string>& EgressDestinations() const { return egress_destinations_; }

    const std::string& RequestId() const { return request_id_; }

private:
    const std::string component_name_;
    const std::string user_id_;
    const std::string session_id_;
    const IsolationLevel isolation_level_;
    const ResourceBudget budget_;
    const std::chrono::milliseconds timeout_;
    const std::vector<std::string> egress_destinations_;
    const std::string request_id_;
};

/**
 * @class SecurityContextBuilder
 * @brief Fluent API for building security contexts
 *
 * **Usage Example**:
 * @code
 * auto context = SecurityContextBuilder()
 *     .WithComponent("factor_mining")
 *     .WithIsolation(IsolationLevel::CONTAINER)
 *     .WithTimeout(std::chrono::milliseconds(2000))
 *     .Build();
 * @endcode
 */
class SecurityContextBuilder {
public:
    SecurityContextBuilder& WithComponent(const std::string& name);
    SecurityContextBuilder& WithUser(const std::string& user_id);
    SecurityContextBuilder& WithSession(const std::string& session_id);
    SecurityContextBuilder& WithIsolation(IsolationLevel level);
    SecurityContextBuilder& WithBudget(const ResourceBudget& budget);
    SecurityContextBuilder& WithMemoryLimit(std::size_t mb);
    SecurityContextBuilder& WithTimeout(std::chrono::milliseconds timeout);
    SecurityContextBuilder& WithEgress(const std::string& destination);
    SecurityContextBuilder& WithRequestId(const std::string& request_id);

    /// Generates a request id and a session id when none were given
    SecurityContext Build() const;

private:
    std::string component_name_{"unknown"};
    std::string user_id_{"system"};
    std::string session_id_;
    IsolationLevel isolation_level_{IsolationLevel::CONTAINER};
    ResourceBudget budget_;
    std::chrono::milliseconds timeout_{30000};
    std::vector<std::string> egress_destinations_;
    std::string request_id_;
};

/**
 * @struct ValidationResult
 * @brief Outcome of static capability analysis, immutable once returned
 */
struct ValidationResult {
    bool approved{false};                              ///< No violations found
    ContentType content_type{ContentType::CODE};       ///< Rules applied
    ContentType detected_type{ContentType::CODE};      ///< Type inferred from the content itself
    std::vector<Violation> violations;                 ///< Every violation, in discovery order
    int risk_score{0};                                 ///< 0-100
    std::chrono::microseconds elapsed{0};              ///< Validation time
    std::string content_hash;                          ///< SHA-256 of the content
    std::vector<std::string> referenced_destinations;  ///< URL/host literals found in code
    ComplexityMetrics metrics;                         ///< Structural measurements

    /// true if any violation has the given kind
    bool HasViolation(ViolationKind kind) const;

    /// true if any violation names the subject exactly
    bool NamesSubject(const std::string& subject) const;
};

/**
 * @struct ExecutionResult
 * @brief Outcome of one sandboxed execution attempt
 */
struct ExecutionResult {
    bool success{false};                                            ///< Completed with exit code 0
    std::string output;                                             ///< Captured stdout / return value
    std::string error_output;                                       ///< Captured stderr (truncated)
    std::string failure_reason;                                     ///< Set when !success
    std::chrono::milliseconds wall_time{0};                         ///< Elapsed wall-clock time
    std::size_t peak_memory_mb{0};                                  ///< Highest sampled RSS
    int exit_code{-1};                                              ///< Process exit code
    ExitClassification classification{ExitClassification::NOT_EXECUTED};
    IsolationLevel isolation_level{IsolationLevel::NONE_AST_ONLY};  ///< Level actually used
    bool degraded{false};                                           ///< Ran below the requested level
};

// ============================================================================
// ISOLATION LADDER
// ============================================================================

/// Next weaker level, or std::nullopt at the bottom of the ladder
std::optional<IsolationLevel> WeakerLevel(IsolationLevel level);

/// true if a provides strictly stronger isolation than b
bool IsStronger(IsolationLevel a, IsolationLevel b);

/// Every level, strongest first
const std::vector<IsolationLevel>& AllIsolationLevels();

/// Violation kind matching an abnormal exit, std::nullopt for normal outcomes
std::optional<ViolationKind> ToViolationKind(ExitClassification classification);

// ============================================================================
// STRING CONVERSION
// ============================================================================

std::string ToString(ContentType type);
std::string ToString(IsolationLevel level);
std::string ToString(ViolationKind kind);
std::string ToString(ExitClassification classification);

std::optional<ContentType> ParseContentType(const std::string& name);
std::optional<IsolationLevel> ParseIsolationLevel(const std::string& name);

// ============================================================================
// JSON SERIALIZATION
// ============================================================================

nlohmann::json ToJson(const Violation& violation);
nlohmann::json ToJson(const ValidationResult& result);
nlohmann::json ToJson(const ExecutionResult& result);

} // namespace core
} // namespace warden
