/**
 * @file test_network_guard.cpp
 * @brief Tests for egress allow-list enforcement and traffic logging
 * @date 2025
 */

#include "warden/network/network_guard.hpp"

#include <gtest/gtest.h>

#include <algorithm>

#include <stdexcept>

using namespace warden::network;
using warden::core::NetworkPolicy;

class NetworkGuardTest : public ::testing::Test {
protected:
    static NetworkPolicy MakePolicy() {
        NetworkPolicy policy;
        policy.allowed_domains = {"PyPI.org", "files.pythonhosted.org"};
        policy.denied_ranges = {"10.0.0.0/8", "172.16.0.0/12", "192.168.0.0/16",
                                "169.254.0.0/16", "127.0.0.0/8"};
        return policy;
    }

    NetworkGuard guard_{MakePolicy()};
};

TEST_F(NetworkGuardTest, AllowsExactDomain) {
    auto result = guard_.CheckAccess("pypi.org", "factor_mining");
    EXPECT_TRUE(result.allowed);
    EXPECT_EQ(result.rule_matched, "whitelist_exact");
    EXPECT_EQ(result.target, "pypi.org");
}

TEST_F(NetworkGuardTest, AllowsSubdomainAndUrls) {
    auto sub = guard_.CheckAccess("cdn.pypi.org");
    EXPECT_TRUE(sub.allowed);
    EXPECT_EQ(sub.rule_matched, "whitelist_subdomain");

    auto url = guard_.CheckAccess("https://files.pythonhosted.org:443/packages/x.whl");
    EXPECT_TRUE(url.allowed);
    EXPECT_EQ(url.target, "files.pythonhosted.org");
}

TEST_F(NetworkGuardTest, DeniesLookAlikeDomains) {
    auto result = guard_.CheckAccess("evilpypi.org");
    EXPECT_FALSE(result.allowed);
    EXPECT_EQ(result.rule_matched, "default_deny");

    EXPECT_FALSE(guard_.IsAllowed("pypi.org.attacker.net"));
}

TEST_F(NetworkGuardTest, DeniesPrivateAddresses) {
    for (const auto* address : {"10.1.2.3", "172.20.0.1", "192.168.1.10", "169.254.169.254", "127.0.0.1"}) {
        auto result = guard_.CheckAccess(address);
        EXPECT_FALSE(result.allowed) << address;
        EXPECT_EQ(result.rule_matched, "blacklist_ip_range") << address;
    }
}

TEST_F(NetworkGuardTest, PublicAddressesRequireDomains) {
    auto result = guard_.CheckAccess("http://8.8.8.8/resolve");
    EXPECT_FALSE(result.allowed);
    EXPECT_EQ(result.rule_matched, "ip_requires_domain");
    EXPECT_EQ(result.target, "8.8.8.8");
}

TEST_F(NetworkGuardTest, EmptyDestinationIsInvalid) {
    EXPECT_THROW(guard_.CheckAccess(""), std::invalid_argument);
    EXPECT_THROW(guard_.CheckAccess("   "), std::invalid_argument);
    EXPECT_THROW(guard_.IsAllowed(""), std::invalid_argument);
    EXPECT_TRUE(guard_.GetTrafficLog().empty());
}

TEST_F(NetworkGuardTest, RecordsEveryAttempt) {
    guard_.CheckAccess("pypi.org", "a");
    guard_.CheckAccess("example.com", "b");
    guard_.CheckAccess("10.0.0.1", "c");

    auto log = guard_.GetTrafficLog();
    ASSERT_EQ(log.size(), 3u);
    EXPECT_TRUE(log[0].allowed);
    EXPECT_EQ(log[1].component, "b");
    EXPECT_EQ(log[1].rule_matched, "default_deny");
    EXPECT_EQ(log[2].destination, "10.0.0.1");

    auto tail = guard_.GetTrafficLog(1);
    ASSERT_EQ(tail.size(), 1u);
    EXPECT_EQ(tail[0].component, "c");
}

TEST(NetworkGuardCapacityTest, TrafficLogIsBounded) {
    NetworkPolicy policy;
    policy.traffic_log_capacity = 2;
    NetworkGuard guard(policy);

    guard.CheckAccess("a.example.com");
    guard.CheckAccess("b.example.com");
    guard.CheckAccess("c.example.com");

    auto log = guard.GetTrafficLog();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].target, "b.example.com");
}

TEST_F(NetworkGuardTest, AuditHookSeesAllowedAndDenied) {
    std::vector<TrafficRecord> seen;
    guard_.SetAuditHook([&seen](const TrafficRecord& record) { seen.push_back(record); });

    guard_.CheckAccess("pypi.org", "research");
    guard_.CheckAccess("192.168.0.5", "research");

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_TRUE(seen[0].allowed);
    EXPECT_FALSE(seen[1].allowed);
    EXPECT_EQ(seen[1].rule_matched, "blacklist_ip_range");
}

TEST_F(NetworkGuardTest, RepeatedViolationsRaiseAlert) {
    std::vector<std::string> alerts;
    guard_.SetAlertCallback([&alerts](const std::string& message) { alerts.push_back(message); });

    EXPECT_FALSE(guard_.CheckAccess("a.evil.net", "miner").repeated_violation);
    EXPECT_FALSE(guard_.CheckAccess("b.evil.net", "miner").repeated_violation);
    EXPECT_FALSE(guard_.CheckAccess("c.evil.net", "other").repeated_violation);
    EXPECT_TRUE(guard_.CheckAccess("d.evil.net", "miner").repeated_violation);

    // One alert per denial plus one for crossing the threshold
    ASSERT_EQ(alerts.size(), 5u);
    EXPECT_NE(alerts.back().find("Repeated network violations: miner"), std::string::npos);
}

TEST_F(NetworkGuardTest, HookExceptionsDoNotBlockDecision) {
    guard_.SetAuditHook([](const TrafficRecord&) { throw std::runtime_error("sink down"); });
    EXPECT_TRUE(guard_.CheckAccess("pypi.org").allowed);
}

TEST_F(NetworkGuardTest, RuntimeUpdates) {
    EXPECT_FALSE(guard_.IsAllowed("data.example.com"));
    guard_.AddAllowedDomain("Example.com");
    EXPECT_TRUE(guard_.IsAllowed("data.example.com"));
    auto domains = guard_.AllowedDomains();
    EXPECT_NE(std::find(domains.begin(), domains.end(), "example.com"), domains.end());

    guard_.RemoveAllowedDomain("example.com");
    EXPECT_FALSE(guard_.IsAllowed("data.example.com"));
    EXPECT_THROW(guard_.RemoveAllowedDomain("example.com"), std::invalid_argument);
    EXPECT_THROW(guard_.AddAllowedDomain("not a domain"), std::invalid_argument);

    guard_.AddDeniedRange("100.64.0.0/10");
    EXPECT_EQ(guard_.CheckAccess("100.100.1.1").rule_matched, "blacklist_ip_range");
    EXPECT_THROW(guard_.AddDeniedRange("100.64.0.0"), std::invalid_argument);
    EXPECT_EQ(guard_.DeniedRanges().size(), 6u);
}

TEST_F(NetworkGuardTest, ConfigReflectsState) {
    auto config = guard_.GetConfig();
    EXPECT_EQ(config["allowed_domains"].size(), 2u);
    EXPECT_EQ(config["allowed_domains"][0], "files.pythonhosted.org");
    EXPECT_EQ(config["denied_ranges"].size(), 5u);
    EXPECT_EQ(config["repeat_violation_threshold"], 3);
    EXPECT_FALSE(config["audit_hook_enabled"].get<bool>());
}
