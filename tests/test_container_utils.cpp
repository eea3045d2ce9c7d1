/**
 * @file test_container_utils.cpp
 * @brief Tests for container CLI argument building and inspect parsing
 * @date 2025
 */

#include "warden/sandbox/container_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>

using namespace warden::sandbox;

namespace {

bool HasPair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag && args[i + 1] == value) {
            return true;
        }
    }
    return false;
}

bool HasFlag(const std::vector<std::string>& args, const std::string& flag) {
    return std::find(args.begin(), args.end(), flag) != args.end();
}

} // anonymous namespace

// ============================================================================
// RUN COMMAND
// ============================================================================

TEST(ContainerUtilsTest, RunCommandIsHardenedByDefault) {
    ContainerUtils utils;
    auto config = ContainerBuilder()
        .WithName("warden_test")
        .WithRuntime("runsc")
        .WithMemoryLimit(256)
        .WithCPULimit(0.5)
        .WithPidsLimit(16)
        .WithTmpfs("/tmp", "rw,noexec,size=64m")
        .Build();

    auto args = utils.BuildRunCommand(config);

    ASSERT_GE(args.size(), 2u);
    EXPECT_EQ(args[0], "run");
    EXPECT_EQ(args[1], "-d");
    EXPECT_TRUE(HasPair(args, "--name", "warden_test"));
    EXPECT_TRUE(HasPair(args, "--runtime", "runsc"));
    EXPECT_TRUE(HasPair(args, "--memory", "256m"));
    EXPECT_TRUE(HasPair(args, "--memory-swap", "256m"));
    EXPECT_TRUE(HasPair(args, "--cpus", "0.50"));
    EXPECT_TRUE(HasPair(args, "--pids-limit", "16"));
    EXPECT_TRUE(HasPair(args, "--ulimit", "nofile=64:64"));
    EXPECT_TRUE(HasPair(args, "--network", "none"));
    EXPECT_TRUE(HasPair(args, "--cap-drop", "ALL"));
    EXPECT_TRUE(HasPair(args, "--security-opt", "no-new-privileges"));
    EXPECT_TRUE(HasPair(args, "--user", "65534:65534"));
    EXPECT_TRUE(HasPair(args, "--tmpfs", "/tmp:rw,noexec,size=64m"));
    EXPECT_TRUE(HasFlag(args, "--read-only"));

    // Image then the keep-alive command close the argument list
    ASSERT_GE(args.size(), 3u);
    EXPECT_EQ(args[args.size() - 3], "python:3.11-slim");
    EXPECT_EQ(args[args.size() - 2], "sleep");
    EXPECT_EQ(args.back(), "infinity");
}

TEST(ContainerUtilsTest, RunCommandWithEgressNetwork) {
    ContainerUtils utils;
    auto config = ContainerBuilder()
        .WithNetwork(NetworkMode::CUSTOM, "warden-egress")
        .WithEnvironment("PYTHONDONTWRITEBYTECODE", "1")
        .WithLabel("warden.level", "container")
        .WithReadOnlyRootfs(false)
        .Build();

    auto args = utils.BuildRunCommand(config);
    EXPECT_TRUE(HasPair(args, "--network", "warden-egress"));
    EXPECT_TRUE(HasPair(args, "-e", "PYTHONDONTWRITEBYTECODE=1"));
    EXPECT_TRUE(HasPair(args, "--label", "warden.level=container"));
    EXPECT_FALSE(HasFlag(args, "--read-only"));
    EXPECT_FALSE(HasFlag(args, "--runtime"));
}

TEST(ContainerUtilsTest, CustomModeWithoutNameFallsBackToNone) {
    ContainerUtils utils;
    auto args = utils.BuildRunCommand(ContainerBuilder().WithNetwork(NetworkMode::CUSTOM).Build());
    EXPECT_TRUE(HasPair(args, "--network", "none"));
}

// ============================================================================
// INSPECT PARSING
// ============================================================================

TEST(ContainerUtilsTest, ParsesInspectOutput) {
    const std::string output = R"([{
        "Id": "4f2a9c0e1b7d",
        "Name": "/warden_123",
        "Config": { "Image": "python:3.11-slim" },
        "State": { "Status": "exited", "OOMKilled": true, "ExitCode": 137 },
        "NetworkSettings": { "Networks": { "warden-egress": {}, "none": {} } }
    }])";

    auto info = ContainerUtils::ParseInspectOutput(output);
    EXPECT_EQ(info.id, "4f2a9c0e1b7d");
    EXPECT_EQ(info.name, "warden_123");
    EXPECT_EQ(info.image, "python:3.11-slim");
    EXPECT_EQ(info.state, ContainerState::EXITED);
    EXPECT_TRUE(info.oom_killed);
    EXPECT_EQ(info.exit_code, 137);
    EXPECT_EQ(info.networks.size(), 2u);
}

TEST(ContainerUtilsTest, ParsesMinimalInspectOutput) {
    auto info = ContainerUtils::ParseInspectOutput(R"({"Id": "abc"})");
    EXPECT_EQ(info.id, "abc");
    EXPECT_EQ(info.state, ContainerState::UNKNOWN);
    EXPECT_FALSE(info.oom_killed);

    EXPECT_THROW(ContainerUtils::ParseInspectOutput("not json"), nlohmann::json::parse_error);
}

TEST(ContainerUtilsTest, ParsesStates) {
    EXPECT_EQ(ContainerUtils::ParseState("running"), ContainerState::RUNNING);
    EXPECT_EQ(ContainerUtils::ParseState("paused"), ContainerState::PAUSED);
    EXPECT_EQ(ContainerUtils::ParseState("dead"), ContainerState::DEAD);
    EXPECT_EQ(ContainerUtils::ParseState("bogus"), ContainerState::UNKNOWN);
}

TEST(ContainerUtilsTest, GeneratesUniqueNames) {
    auto first = ContainerUtils::GenerateContainerName("warden_ns");
    auto second = ContainerUtils::GenerateContainerName("warden_ns");
    EXPECT_EQ(first.rfind("warden_ns_", 0), 0u);
    EXPECT_NE(first, second);
}

// ============================================================================
// CLI INVOCATION
// ============================================================================

TEST(ContainerUtilsTest, CreateReturnsCliOutput) {
    // echo stands in for the container CLI and prints its arguments as the "id"
    ContainerUtils utils("echo", std::chrono::seconds(5));
    auto id = utils.CreateContainer(ContainerBuilder().WithName("n1").Build());
    EXPECT_EQ(id.rfind("run -d --name n1", 0), 0u);
}

TEST(ContainerUtilsTest, FailedCliIsReported) {
    ContainerUtils utils("false", std::chrono::seconds(5));
    EXPECT_FALSE(utils.IsDaemonRunning());
    EXPECT_TRUE(utils.CreateContainer(ContainerConfig{}).empty());
    EXPECT_EQ(utils.LastError(), "exit code 1");
    EXPECT_FALSE(utils.RemoveContainer("abc", true));
    EXPECT_FALSE(utils.GetContainerInfo("abc").has_value());
}

TEST(ContainerUtilsTest, MissingCliIsReported) {
    ContainerUtils utils("/nonexistent/docker", std::chrono::seconds(5));
    EXPECT_TRUE(utils.CreateContainer(ContainerConfig{}).empty());
    EXPECT_NE(utils.LastError().find("exec failed"), std::string::npos);
}

TEST(ContainerUtilsTest, MissingImageIsRejectedBeforeLaunch) {
    ContainerUtils utils("echo");
    ContainerConfig config;
    config.image.clear();
    EXPECT_TRUE(utils.CreateContainer(config).empty());
    EXPECT_EQ(utils.LastError(), "Container image not specified");
}

TEST(ContainerUtilsTest, UpdateWithoutArgumentsIsNoOp) {
    ContainerUtils utils("false");
    EXPECT_TRUE(utils.UpdateResources("abc", {}));
    EXPECT_FALSE(utils.UpdateResources("abc", {"--memory", "128m"}));
}
