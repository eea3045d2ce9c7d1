/**
 * @file network_guard.hpp
 * @brief Default-deny egress control for sandboxed executions
 *
 * Every destination a sandbox wants to reach is checked here before launch.
 * Private, loopback and link-local ranges are always denied; public
 * destinations are allowed only when their domain (or a parent domain) is on
 * the allow-list. Bare public IPs are denied because they cannot be matched
 * against a domain allow-list.
 *
 * **Decision Order**:
 * 1. Denied CIDR ranges (always win)
 * 2. Public IPv4 literal          -> deny ("requires domain allow-list")
 * 3. Exact allow-list match       -> allow (whitelist_exact)
 * 4. Subdomain of an allowed name -> allow (whitelist_subdomain)
 * 5. Anything else                -> deny (default_deny)
 *
 * @date 2025
 */

#pragma once

#include "warden/core/policy.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace warden {
namespace network {

/**
 * @struct NetworkAccessResult
 * @brief Decision for one destination
 */
struct NetworkAccessResult {
    bool allowed{false};
    std::string reason;          ///< Human-readable explanation
    std::string rule_matched;    ///< whitelist_exact, whitelist_subdomain, blacklist_ip_range, ...
    std::string target;          ///< Normalized host that was evaluated
    bool repeated_violation{false};  ///< Component crossed the repeat-denial threshold
};

/**
 * @struct TrafficRecord
 * @brief One access attempt in the traffic log
 */
struct TrafficRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string component;
    std::string destination;     ///< As requested
    std::string target;          ///< Normalized host
    bool allowed{false};
    std::string rule_matched;
    std::string reason;
};

/**
 * @class NetworkGuard
 * @brief Allow-list / deny-range evaluator with traffic log and alerts
 *
 * **Usage Example**:
 * @code
 * NetworkGuard guard(policy.network);
 * guard.SetAlertCallback([](const std::string& msg) { spdlog::warn(msg); });
 *
 * auto result = guard.CheckAccess("https://pypi.org/simple/numpy", "factor_mining");
 * // result.allowed == true, result.rule_matched == "whitelist_exact"
 * @endcode
 *
 * **Thread Safety**: All methods are thread-safe. Callbacks run outside the
 * internal lock and their failures are logged, never propagated.
 */
class NetworkGuard {
public:
    using AuditHook = std::function<void(const TrafficRecord&)>;
    using AlertCallback = std::function<void(const std::string& message)>;

    /**
     * @brief Build from policy
     *
     * Domains are lowercased; ranges that are not valid CIDR are skipped
     * with a warning.
     */
    explicit NetworkGuard(const core::NetworkPolicy& policy);

    /**
     * @brief Evaluate a destination and record the attempt
     * @param destination Hostname, IPv4 address or URL
     * @param component Requesting component (for the repeat-violation window)
     * @throws std::invalid_argument if destination is empty
     */
    NetworkAccessResult CheckAccess(const std::string& destination,
                                    const std::string& component = "unknown");

    /**
     * @brief Evaluate without recording or alerting
     * @throws std::invalid_argument if destination is empty
     */
    bool IsAllowed(const std::string& destination) const;

    /// @throws std::invalid_argument if domain is not a valid hostname
    void AddAllowedDomain(const std::string& domain);

    /// @throws std::invalid_argument if domain is not on the allow-list
    void RemoveAllowedDomain(const std::string& domain);

    /// @throws std::invalid_argument if cidr is not valid CIDR notation
    void AddDeniedRange(const std::string& cidr);

    void SetAuditHook(AuditHook hook);
    void SetAlertCallback(AlertCallback callback);

    std::vector<std::string> AllowedDomains() const;
    std::vector<std::string> DeniedRanges() const;

    /// Most recent attempts, oldest first (0 = all retained)
    std::vector<TrafficRecord> GetTrafficLog(std::size_t limit = 0) const;

    /// Current configuration as JSON
    nlohmann::json GetConfig() const;

private:
    struct DeniedRange {
        std::string cidr;
        std::uint32_t network;
        std::uint32_t mask;
    };

    static std::string Normalize(const std::string& destination);
    NetworkAccessResult Evaluate(const std::string& target) const;

    /// Record a denial; returns the number of denials inside the window
    int RecordDenial(const std::string& component, std::chrono::steady_clock::time_point now);

    mutable std::mutex mutex_;
    std::set<std::string> allowed_domains_;
    std::vector<DeniedRange> denied_ranges_;
    int repeat_threshold_;
    std::chrono::seconds repeat_window_;
    std::size_t log_capacity_;

    std::deque<TrafficRecord> traffic_log_;
    std::map<std::string, std::deque<std::chrono::steady_clock::time_point>> denials_;

    AuditHook audit_hook_;
    AlertCallback alert_callback_;
};

} // namespace network
} // namespace warden
