/**
 * @file container_utils.hpp
 * @brief Container CLI driver and hardened container configuration
 *
 * Wraps the Docker-compatible CLI (docker, podman) for the container
 * isolation tiers. Every invocation goes through ProcessRunner, so each CLI
 * call has its own deadline and never blocks the gateway indefinitely.
 *
 * The configuration defaults are the hardened profile used by every warm
 * sandbox: no network, all capabilities dropped, no-new-privileges,
 * read-only root filesystem, tmpfs work directory, non-root user.
 *
 * @date 2025
 */

#pragma once

#include "warden/sandbox/process_runner.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace sandbox {

/**
 * @enum ContainerState
 * @brief Container lifecycle states
 */
enum class ContainerState {
    CREATED,
    RUNNING,
    PAUSED,
    EXITED,
    DEAD,
    UNKNOWN
};

/**
 * @enum NetworkMode
 * @brief Network attachment at creation time
 */
enum class NetworkMode {
    NONE,     ///< No interfaces besides loopback
    CUSTOM    ///< Named network (egress)
};

/**
 * @struct ContainerConfig
 * @brief Complete container configuration
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                              ///< Container name
    std::string image{"python:3.11-slim"};         ///< Base image
    std::string hostname{"warden-sandbox"};        ///< Container hostname
    std::string runtime;                           ///< OCI runtime (empty = daemon default)

    // Resource Limits
    std::size_t memory_limit_mb{512};              ///< Memory limit; swap is pinned to the same value
    double cpu_limit{1.0};                         ///< CPU limit
    int pids_limit{32};                            ///< Process limit
    int open_files_limit{64};                      ///< nofile ulimit

    // Network Settings
    NetworkMode network_mode{NetworkMode::NONE};
    std::string network_name;                      ///< Used with NetworkMode::CUSTOM

    // Security Settings
    bool read_only_rootfs{true};
    bool no_new_privileges{true};
    std::vector<std::string> capabilities_drop{"ALL"};
    std::string user{"65534:65534"};               ///< uid:gid

    // Filesystem Settings
    std::map<std::string, std::string> tmpfs;      ///< Mount point -> options
    std::string working_dir{"/work"};

    std::map<std::string, std::string> environment_vars;
    std::map<std::string, std::string> labels;

    std::vector<std::string> command{"sleep", "infinity"};  ///< Keeps the warm container alive
};

/**
 * @struct ContainerInfo
 * @brief Subset of `inspect` output the backends care about
 */
struct ContainerInfo {
    std::string id;
    std::string name;
    std::string image;
    ContainerState state{ContainerState::UNKNOWN};
    bool oom_killed{false};
    int exit_code{0};
    std::vector<std::string> networks;             ///< Attached network names
};

/**
 * @struct ContainerExecResult
 * @brief Result of one CLI invocation
 */
struct ContainerExecResult {
    int exit_code{0};
    std::string stdout_output;
    std::string stderr_output;
    std::chrono::milliseconds duration{0};
    bool success{false};
};

/**
 * @class ContainerUtils
 * @brief Container lifecycle through the CLI
 *
 * **Usage Example**:
 * @code
 * ContainerUtils cli("docker");
 *
 * auto config = ContainerBuilder()
 *     .WithName(ContainerUtils::GenerateContainerName("warden"))
 *     .WithRuntime("runsc")
 *     .WithMemoryLimit(512)
 *     .DropAllCapabilities()
 *     .Build();
 *
 * std::string id = cli.CreateContainer(config);
 * auto outcome = cli.ExecuteCommand(id, {"python3", "-I", "-"}, "print(1)",
 *                                   std::chrono::seconds(5));
 * cli.RemoveContainer(id, true);
 * @endcode
 */
class ContainerUtils {
public:
    explicit ContainerUtils(std::string binary = "docker",
                            std::chrono::milliseconds command_timeout = std::chrono::seconds(30));

    /// true if the CLI can reach its daemon
    bool IsDaemonRunning() const;

    /**
     * @brief Create and start a detached container
     * @return Container ID, empty on failure (see LastError())
     */
    std::string CreateContainer(const ContainerConfig& config);

    /**
     * @brief Run a command inside a running container
     *
     * stdin_data is piped to the command. The CLI process is killed at the
     * timeout; the in-container process survives until the container is
     * removed.
     */
    ProcessOutcome ExecuteCommand(const std::string& container_id,
                                  const std::vector<std::string>& command,
                                  const std::string& stdin_data,
                                  std::chrono::milliseconds timeout,
                                  const std::string& user = {},
                                  const std::string& working_dir = {});

    /// Apply `update` resource flags (--memory, --cpus, --pids-limit, ...)
    bool UpdateResources(const std::string& container_id, const std::vector<std::string>& resource_args);

    bool ConnectNetwork(const std::string& container_id, const std::string& network);
    bool DisconnectNetwork(const std::string& container_id, const std::string& network);

    bool RemoveContainer(const std::string& container_id, bool force = false);

    std::optional<ContainerInfo> GetContainerInfo(const std::string& container_id);

    /// Arguments for `run`, without the binary
    std::vector<std::string> BuildRunCommand(const ContainerConfig& config) const;

    /// stderr of the last failed invocation
    const std::string& LastError() const { return last_error_; }

    const std::string& Binary() const { return binary_; }

    static std::string GenerateContainerName(const std::string& prefix = "warden");
    static ContainerInfo ParseInspectOutput(const std::string& json);
    static ContainerState ParseState(const std::string& state);

private:
    ContainerExecResult ExecuteDockerCommand(const std::vector<std::string>& args) const;
    bool RecordFailure(const ContainerExecResult& result, const std::string& action);

    std::string binary_;
    std::chrono::milliseconds command_timeout_;
    std::string last_error_;
};

/**
 * @class ContainerBuilder
 * @brief Fluent API for building container configurations
 */
class ContainerBuilder {
public:
    ContainerBuilder& WithName(const std::string& name);
    ContainerBuilder& WithImage(const std::string& image);
    ContainerBuilder& WithRuntime(const std::string& runtime);
    ContainerBuilder& WithMemoryLimit(std::size_t mb);
    ContainerBuilder& WithCPULimit(double cpus);
    ContainerBuilder& WithPidsLimit(int pids);
    ContainerBuilder& WithOpenFilesLimit(int files);
    ContainerBuilder& WithNetwork(NetworkMode mode, const std::string& name = {});
    ContainerBuilder& WithTmpfs(const std::string& mount_point, const std::string& options);
    ContainerBuilder& WithWorkingDir(const std::string& dir);
    ContainerBuilder& WithEnvironment(const std::string& key, const std::string& value);
    ContainerBuilder& WithLabel(const std::string& key, const std::string& value);
    ContainerBuilder& WithReadOnlyRootfs(bool read_only = true);
    ContainerBuilder& DropAllCapabilities();
    ContainerBuilder& WithUser(const std::string& user);

    ContainerConfig Build() const;

private:
    ContainerConfig config_;
};

} // namespace sandbox
} // namespace warden
