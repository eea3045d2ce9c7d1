/**
 * @file policy.hpp
 * @brief Versioned security policy, immutable snapshots and atomic reload
 *
 * A PolicySnapshot holds every tunable the gateway reads: validator allow and
 * deny sets, per-level resource ceilings, runtime commands, the network
 * allow-list and deny ranges, pool sizing, and audit settings. Snapshots are
 * never mutated after publication; PolicyStore swaps the active pointer
 * atomically so concurrent validators never see a half-applied update.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace warden {
namespace core {

/**
 * @struct ValidatorPolicy
 * @brief Capability sets and structural limits for static analysis
 */
struct ValidatorPolicy {
    // Capability Sets
    std::set<std::string> denied_calls;          ///< Bare or qualified call names
    std::set<std::string> denied_modules;        ///< Module roots, prefix-matched on dotted parts
    std::set<std::string> denied_attributes;     ///< Attribute names that escape the object model
    std::set<std::string> allowed_calls;         ///< Closed numeric/statistical call list
    std::set<std::string> allowed_modules;       ///< Importable namespaces for code
    std::set<std::string> expression_operators;  ///< Domain operators for expressions
    std::map<std::string, std::string> expression_aliases;  ///< Predefined names (np -> numpy)
    std::set<std::string> expression_series;     ///< Market data names the expression prelude binds
    std::set<std::string> allowed_constants;     ///< Module members usable as plain values (math.pi)

    // Structural Limits
    std::size_t max_depth{64};             ///< Syntax tree depth
    std::size_t max_nodes{5000};           ///< Syntax tree node count
    std::size_t max_complexity{50};        ///< Decision points
    std::size_t max_imports{10};           ///< Distinct top-level namespaces
    std::size_t max_content_bytes{100000}; ///< Raw size bound
    std::size_t max_lines{1000};           ///< Line count bound
    bool strict_calls{false};              ///< Reject unknown bare calls in code

    // Prompt Rules
    std::size_t prompt_max_bytes{32768};
    std::vector<std::string> injection_markers;

    // Config Rules
    std::size_t config_max_bytes{65536};
    std::size_t config_max_depth{16};
    std::vector<std::string> config_denied_patterns;
};

/**
 * @struct IsolationPolicy
 * @brief Per-level ceilings and how each backend launches content
 */
struct IsolationPolicy {
    std::map<IsolationLevel, ResourceBudget> ceilings;           ///< Hard upper bounds per level
    std::map<IsolationLevel, std::string> oci_runtimes;          ///< --runtime per container tier
    std::string container_binary{"docker"};                      ///< Container CLI
    std::string container_image{"python:3.11-slim"};             ///< Warm container image
    std::string sandbox_user{"65534:65534"};                     ///< Non-root uid:gid
    std::string egress_network{"warden-egress"};                 ///< Network used when egress is granted
    std::map<ContentType, std::vector<std::string>> runtime_commands;  ///< argv; content on stdin
    std::string expression_prelude;                              ///< Operator definitions for expressions
    int max_open_files{64};                                      ///< RLIMIT_NOFILE
    std::size_t max_output_bytes{1 << 20};                       ///< Captured stdout bound
};

/**
 * @struct NetworkPolicy
 * @brief Domain allow-list and always-denied address ranges
 */
struct NetworkPolicy {
    std::vector<std::string> allowed_domains;
    std::vector<std::string> denied_ranges;             ///< CIDR notation
    int repeat_violation_threshold{3};                  ///< Denials that form a pattern
    std::chrono::seconds repeat_violation_window{60};   ///< Sliding window for the pattern
    std::size_t traffic_log_capacity{10000};            ///< Retained attempts
};

/**
 * @struct PoolPolicy
 * @brief Pool sizing and maintenance cadence
 */
struct PoolPolicy {
    std::map<IsolationLevel, std::size_t> target_sizes;          ///< Pre-warmed idle instances
    std::size_t min_size{0};
    std::size_t max_size{16};
    std::chrono::milliseconds lease_grace_period{2000};          ///< Leased -> Executing bound
    std::chrono::milliseconds grow_latency_threshold{200};       ///< P99 acquire latency
    std::chrono::seconds shrink_idle_period{300};                ///< Sustained idleness
    std::chrono::milliseconds maintenance_interval{500};
    std::chrono::milliseconds create_timeout{30000};             ///< Budget for background replenishment
};

/**
 * @struct GatewayPolicy
 * @brief Orchestrator knobs
 */
struct GatewayPolicy {
    int creation_failure_threshold{10};                     ///< Consecutive failures before degrading
    std::chrono::milliseconds default_timeout{30000};
    std::chrono::milliseconds slow_request_warning{150};
    bool allow_ast_only_fallback{true};                     ///< Ladder may end at NONE_AST_ONLY
};

/**
 * @struct AuditPolicy
 * @brief Audit persistence settings
 */
struct AuditPolicy {
    std::filesystem::path directory{"./audit_logs"};
    std::chrono::milliseconds retry_backoff{200};
    int alert_after_failures{5};
    int retention_days{90};   ///< Enforced by external log rotation
};

/**
 * @struct PolicySnapshot
 * @brief Complete immutable policy document
 */
struct PolicySnapshot {
    std::string version{"1"};
    ValidatorPolicy validator;
    IsolationPolicy isolation;
    NetworkPolicy network;
    PoolPolicy pool;
    GatewayPolicy gateway;
    AuditPolicy audit;
    std::uint64_t operator_registry_version{0};   ///< Registry version merged into this snapshot

    /// Compiled defaults
    static PolicySnapshot Defaults();

    /**
     * @brief Overlay a JSON policy document on the defaults
     * @throws PolicyError on malformed or contradictory input
     */
    static PolicySnapshot FromJson(const nlohmann::json& document);

    /// @throws PolicyError if the file is missing or invalid
    static PolicySnapshot LoadFile(const std::filesystem::path& path);

    nlohmann::json ToJson() const;

    /**
     * @brief Check internal consistency
     *
     * Allow and deny sets must be disjoint, ranges must be CIDR, limits
     * must be positive.
     *
     * @throws PolicyError describing the first problem found
     */
    void Validate() const;

    /// Ceiling for a level, or the default budget when unset
    ResourceBudget CeilingFor(IsolationLevel level) const;
};

/**
 * @class OperatorRegistry
 * @brief External, evolving source of expression operators
 */
class OperatorRegistry {
public:
    virtual ~OperatorRegistry() = default;

    /// Monotonic version; a change triggers a snapshot rebuild
    virtual std::uint64_t Version() const = 0;

    virtual std::set<std::string> Operators() const = 0;
};

/**
 * @class StaticOperatorRegistry
 * @brief In-process registry; each mutation bumps the version
 */
class StaticOperatorRegistry : public OperatorRegistry {
public:
    explicit StaticOperatorRegistry(std::set<std::string> operators = {});

    std::uint64_t Version() const override;
    std::set<std::string> Operators() const override;

    void AddOperator(const std::string& name);
    void RemoveOperator(const std::string& name);

private:
    mutable std::mutex mutex_;
    std::set<std::string> operators_;
    std::uint64_t version_{1};
};

/**
 * @class PolicyStore
 * @brief Holds the active snapshot and replaces it atomically
 *
 * Readers call Current() and keep the returned pointer for the whole
 * request. When the operator registry reports a new version the store
 * rebuilds the snapshot with the new operator set before returning it.
 *
 * **Thread Safety**: Current() is lock-free on the fast path. Replace()
 * and registry refreshes are serialized internally.
 */
class PolicyStore {
public:
    /**
     * @throws PolicyError if the initial snapshot is invalid
     */
    explicit PolicyStore(PolicySnapshot initial,
                         std::shared_ptr<OperatorRegistry> registry = nullptr);

    std::shared_ptr<const PolicySnapshot> Current() const;

    /**
     * @brief Publish a new snapshot
     * @throws PolicyError if invalid; the active snapshot is left untouched
     */
    void Replace(PolicySnapshot next);

    /// Number of snapshots published so far
    std::uint64_t Generation() const;

private:
    std::shared_ptr<const PolicySnapshot> Merge(const PolicySnapshot& base) const;
    void RefreshOperators() const;

    std::shared_ptr<OperatorRegistry> registry_;
    mutable std::mutex reload_mutex_;                         ///< Serializes writers
    mutable PolicySnapshot base_;                             ///< Last document without registry operators
    mutable std::shared_ptr<const PolicySnapshot> active_;   ///< Accessed with std::atomic_load/store
    mutable std::atomic<std::uint64_t> generation_{0};
    mutable std::atomic<std::uint64_t> rejected_registry_version_{0};  ///< Last registry version that failed validation
};

} // namespace core
} // namespace warden
