/**
 * @file network_guard.cpp
 * @brief Implementation of default-deny egress control
 * @date 2025
 */

#include "warden/network/network_guard.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace warden {
namespace network {

using utils::StringUtils;

namespace {

std::uint32_t PrefixMask(int prefix) {
    return prefix == 0 ? 0u : ~0u << (32 - prefix);
}

std::string FormatIPv4(std::uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." +
           std::to_string((address >> 16) & 0xFF) + "." +
           std::to_string((address >> 8) & 0xFF) + "." +
           std::to_string(address & 0xFF);
}

} // anonymous namespace

NetworkGuard::NetworkGuard(const core::NetworkPolicy& policy)
    : repeat_threshold_(policy.repeat_violation_threshold)
    , repeat_window_(policy.repeat_violation_window)
    , log_capacity_(policy.traffic_log_capacity) {

    for (const auto& domain : policy.allowed_domains) {
        auto normalized = StringUtils::ToLower(StringUtils::Trim(domain));
        if (!normalized.empty()) {
            allowed_domains_.insert(normalized);
        }
    }

    for (const auto& range : policy.denied_ranges) {
        auto parsed = StringUtils::ParseCIDR(range);
        if (!parsed) {
            spdlog::warn("[NETWORK] Skipping invalid denied range '{}'", range);
            continue;
        }
        auto mask = PrefixMask(parsed->second);
        denied_ranges_.push_back({StringUtils::Trim(range), parsed->first & mask, mask});
    }

    spdlog::debug("[NETWORK] Guard initialized: {} allowed domains, {} denied ranges",
                  allowed_domains_.size(), denied_ranges_.size());
}

std::string NetworkGuard::Normalize(const std::string& destination) {
    if (StringUtils::IsBlank(destination)) {
        throw std::invalid_argument("Network destination must not be empty");
    }

    auto host = StringUtils::ExtractHost(destination);
    while (!host.empty() && host.back() == '.') {
        host.pop_back();
    }
    if (host.empty()) {
        throw std::invalid_argument("Network destination has no host: " + destination);
    }
    return host;
}

NetworkAccessResult NetworkGuard::Evaluate(const std::string& target) const {
    NetworkAccessResult result;
    result.target = target;

    if (auto ip = StringUtils::ParseIPv4(target)) {
        for (const auto& range : denied_ranges_) {
            if ((*ip & range.mask) == range.network) {
                result.rule_matched = "blacklist_ip_range";
                result.reason = "IP " + FormatIPv4(*ip) + " is in denied range " + range.cidr;
                return result;
            }
        }
        result.rule_matched = "ip_requires_domain";
        result.reason = "Public IP " + target + " requires domain allow-list validation";
        return result;
    }

    if (allowed_domains_.count(target)) {
        result.allowed = true;
        result.rule_matched = "whitelist_exact";
        result.reason = "Domain " + target + " is on the allow-list";
        return result;
    }

    for (const auto& domain : allowed_domains_) {
        if (StringUtils::EndsWith(target, "." + domain)) {
            result.allowed = true;
            result.rule_matched = "whitelist_subdomain";
            result.reason = "Domain " + target + " is a subdomain of " + domain;
            return result;
        }
    }

    result.rule_matched = "default_deny";
    result.reason = "Domain " + target + " is not on the allow-list (default deny)";
    return result;
}

int NetworkGuard::RecordDenial(const std::string& component,
                               std::chrono::steady_clock::time_point now) {
    auto& window = denials_[component];
    window.push_back(now);
    while (!window.empty() && now - window.front() > repeat_window_) {
        window.pop_front();
    }
    return static_cast<int>(window.size());
}

NetworkAccessResult NetworkGuard::CheckAccess(const std::string& destination,
                                              const std::string& component) {
    auto target = Normalize(destination);

    NetworkAccessResult result;
    TrafficRecord record;
    AuditHook audit_hook;
    AlertCallback alert_callback;
    int denials_in_window = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = Evaluate(target);

        record.timestamp = std::chrono::system_clock::now();
        record.component = component;
        record.destination = destination;
        record.target = target;
        record.allowed = result.allowed;
        record.rule_matched = result.rule_matched;
        record.reason = result.reason;

        traffic_log_.push_back(record);
        while (traffic_log_.size() > log_capacity_) {
            traffic_log_.pop_front();
        }

        if (!result.allowed) {
            denials_in_window = RecordDenial(component, std::chrono::steady_clock::now());
            result.repeated_violation = repeat_threshold_ > 0 && denials_in_window >= repeat_threshold_;
        }

        audit_hook = audit_hook_;
        alert_callback = alert_callback_;
    }

    if (result.allowed) {
        spdlog::debug("[NETWORK] Allowed {} for {} ({})", target, component, result.rule_matched);
    } else {
        spdlog::warn("[NETWORK] Denied {} for {}: {}", target, component, result.reason);
    }

    if (audit_hook) {
        try {
            audit_hook(record);
        } catch (const std::exception& e) {
            spdlog::error("[NETWORK] Audit hook failed: {}", e.what());
        }
    }

    if (!result.allowed && alert_callback) {
        try {
            alert_callback("Network access violation: " + component + " -> " + target + " (" + result.reason + ")");
            if (denials_in_window == repeat_threshold_) {
                alert_callback("Repeated network violations: " + component + " was denied "
                               + std::to_string(denials_in_window) + " times within "
                               + std::to_string(repeat_window_.count()) + "s");
            }
        } catch (const std::exception& e) {
            spdlog::error("[NETWORK] Alert callback failed: {}", e.what());
        }
    }

    return result;
}

bool NetworkGuard::IsAllowed(const std::string& destination) const {
    auto target = Normalize(destination);
    std::lock_guard<std::mutex> lock(mutex_);
    return Evaluate(target).allowed;
}

void NetworkGuard::AddAllowedDomain(const std::string& domain) {
    auto normalized = StringUtils::ToLower(StringUtils::Trim(domain));
    if (!StringUtils::IsDomain(normalized)) {
        throw std::invalid_argument("Invalid domain: " + domain);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    allowed_domains_.insert(normalized);
    spdlog::info("[NETWORK] Added allowed domain {}", normalized);
}

void NetworkGuard::RemoveAllowedDomain(const std::string& domain) {
    auto normalized = StringUtils::ToLower(StringUtils::Trim(domain));

    std::lock_guard<std::mutex> lock(mutex_);
    if (allowed_domains_.erase(normalized) == 0) {
        throw std::invalid_argument("Domain is not on the allow-list: " + domain);
    }
    spdlog::info("[NETWORK] Removed allowed domain {}", normalized);
}

void NetworkGuard::AddDeniedRange(const std::string& cidr) {
    auto parsed = StringUtils::ParseCIDR(cidr);
    if (!parsed) {
        throw std::invalid_argument("Invalid CIDR range: " + cidr);
    }

    auto mask = PrefixMask(parsed->second);
    std::lock_guard<std::mutex> lock(mutex_);
    denied_ranges_.push_back({StringUtils::Trim(cidr), parsed->first & mask, mask});
    spdlog::info("[NETWORK] Added denied range {}", cidr);
}

void NetworkGuard::SetAuditHook(AuditHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    audit_hook_ = std::move(hook);
}

void NetworkGuard::SetAlertCallback(AlertCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    alert_callback_ = std::move(callback);
}

std::vector<std::string> NetworkGuard::AllowedDomains() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {allowed_domains_.begin(), allowed_domains_.end()};
}

std::vector<std::string> NetworkGuard::DeniedRanges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ranges;
    for (const auto& range : denied_ranges_) {
        ranges.push_back(range.cidr);
    }
    return ranges;
}

std::vector<TrafficRecord> NetworkGuard::GetTrafficLog(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto skip = (limit == 0 || limit >= traffic_log_.size()) ? 0 : traffic_log_.size() - limit;
    return {traffic_log_.begin() + static_cast<std::ptrdiff_t>(skip), traffic_log_.end()};
}

nlohmann::json NetworkGuard::GetConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ranges;
    for (const auto& range : denied_ranges_) {
        ranges.push_back(range.cidr);
    }

    return {
        {"allowed_domains", std::vector<std::string>(allowed_domains_.begin(), allowed_domains_.end())},
        {"denied_ranges", ranges},
        {"repeat_violation_threshold", repeat_threshold_},
        {"repeat_violation_window_s", repeat_window_.count()},
        {"audit_hook_enabled", static_cast<bool>(audit_hook_)},
        {"alert_callback_enabled", static_cast<bool>(alert_callback_)}
    };
}

} // namespace network
} // namespace warden
