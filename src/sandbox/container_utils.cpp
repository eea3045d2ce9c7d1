/**
 * @file container_utils.cpp
 * @brief Implementation of the container CLI driver
 *
 * **Hardening applied to every warm container**:
 * 1. Namespace isolation from the OCI runtime (runc, runsc, kata)
 * 2. --cap-drop ALL and --security-opt no-new-privileges
 * 3. --read-only root filesystem with tmpfs work and temp dirs
 * 4. --network none until egress is explicitly granted
 * 5. --memory/--memory-swap, --cpus, --pids-limit and nofile ulimit
 * 6. Non-root --user
 *
 * @date 2025
 */

#include "warden/sandbox/container_utils.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace warden {
namespace sandbox {

using utils::StringUtils;

namespace {

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << cpus;
    return oss.str();
}

} // anonymous namespace

ContainerUtils::ContainerUtils(std::string binary, std::chrono::milliseconds command_timeout)
    : binary_(std::move(binary))
    , command_timeout_(command_timeout) {
}

bool ContainerUtils::IsDaemonRunning() const {
    auto result = ExecuteDockerCommand({"info", "--format", "{{.ServerVersion}}"});
    return result.success;
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

std::string ContainerUtils::CreateContainer(const ContainerConfig& config) {
    if (config.image.empty()) {
        last_error_ = "Container image not specified";
        spdlog::error("[CONTAINER] {}", last_error_);
        return "";
    }

    spdlog::debug("[CONTAINER] Creating {} from {} (runtime: {})",
                  config.name, config.image, config.runtime.empty() ? "default" : config.runtime);

    auto result = ExecuteDockerCommand(BuildRunCommand(config));
    if (!result.success) {
        RecordFailure(result, "create container");
        return "";
    }

    auto container_id = StringUtils::Trim(result.stdout_output);
    spdlog::info("[CONTAINER] Created {} ({})", config.name, container_id.substr(0, 12));
    return container_id;
}

std::vector<std::string> ContainerUtils::BuildRunCommand(const ContainerConfig& config) const {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back("-d");

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    if (!config.hostname.empty()) {
        args.push_back("--hostname");
        args.push_back(config.hostname);
    }

    if (!config.runtime.empty()) {
        args.push_back("--runtime");
        args.push_back(config.runtime);
    }

    // Resource limits; swap equal to memory means no swap
    if (config.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
        args.push_back("--memory-swap");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
    }

    if (config.cpu_limit > 0) {
        args.push_back("--cpus");
        args.push_back(FormatCpus(config.cpu_limit));
    }

    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    if (config.open_files_limit > 0) {
        args.push_back("--ulimit");
        args.push_back("nofile=" + std::to_string(config.open_files_limit) + ":" +
                       std::to_string(config.open_files_limit));
    }

    // Network
    args.push_back("--network");
    if (config.network_mode == NetworkMode::CUSTOM && !config.network_name.empty()) {
        args.push_back(config.network_name);
    } else {
        args.push_back("none");
    }

    // Security
    for (const auto& cap : config.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }

    if (config.no_new_privileges) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges");
    }

    if (!config.user.empty()) {
        args.push_back("--user");
        args.push_back(config.user);
    }

    if (config.read_only_rootfs) {
        args.push_back("--read-only");
    }

    for (const auto& [mount_point, options] : config.tmpfs) {
        args.push_back("--tmpfs");
        args.push_back(options.empty() ? mount_point : mount_point + ":" + options);
    }

    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    if (!config.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(config.working_dir);
    }

    // Image, then the keep-alive command
    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

// ============================================================================
// CONTAINER COMMAND EXECUTION
// ============================================================================

ProcessOutcome ContainerUtils::ExecuteCommand(const std::string& container_id,
                                              const std::vector<std::string>& command,
                                              const std::string& stdin_data,
                                              std::chrono::milliseconds timeout,
                                              const std::string& user,
                                              const std::string& working_dir) {
    ProcessSpec spec;
    spec.argv = {binary_, "exec", "-i"};

    if (!user.empty()) {
        spec.argv.push_back("-u");
        spec.argv.push_back(user);
    }
    if (!working_dir.empty()) {
        spec.argv.push_back("-w");
        spec.argv.push_back(working_dir);
    }

    spec.argv.push_back(container_id);
    spec.argv.insert(spec.argv.end(), command.begin(), command.end());
    spec.stdin_data = stdin_data;
    spec.timeout = timeout;

    return ProcessRunner::Run(spec);
}

bool ContainerUtils::UpdateResources(const std::string& container_id,
                                     const std::vector<std::string>& resource_args) {
    if (resource_args.empty()) {
        return true;
    }

    std::vector<std::string> args = {"update"};
    args.insert(args.end(), resource_args.begin(), resource_args.end());
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args);
    return result.success || RecordFailure(result, "update resources");
}

// ============================================================================
// NETWORK ATTACHMENT
// ============================================================================

bool ContainerUtils::ConnectNetwork(const std::string& container_id, const std::string& network) {
    auto result = ExecuteDockerCommand({"network", "connect", network, container_id});
    if (result.success) {
        spdlog::debug("[CONTAINER] {} connected to {}", container_id.substr(0, 12), network);
        return true;
    }
    return RecordFailure(result, "connect network " + network);
}

bool ContainerUtils::DisconnectNetwork(const std::string& container_id, const std::string& network) {
    auto result = ExecuteDockerCommand({"network", "disconnect", "--force", network, container_id});
    if (result.success) {
        spdlog::debug("[CONTAINER] {} disconnected from {}", container_id.substr(0, 12), network);
        return true;
    }
    return RecordFailure(result, "disconnect network " + network);
}

// ============================================================================
// CONTAINER REMOVAL AND INSPECTION
// ============================================================================

bool ContainerUtils::RemoveContainer(const std::string& container_id, bool force) {
    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args);
    if (result.success) {
        spdlog::info("[CONTAINER] Removed {}", container_id.substr(0, 12));
        return true;
    }
    return RecordFailure(result, "remove container");
}

std::optional<ContainerInfo> ContainerUtils::GetContainerInfo(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"inspect", container_id});
    if (!result.success) {
        RecordFailure(result, "inspect container");
        return std::nullopt;
    }

    try {
        return ParseInspectOutput(result.stdout_output);
    } catch (const json::exception& e) {
        spdlog::error("[CONTAINER] Failed to parse inspect output: {}", e.what());
    }
    return std::nullopt;
}

ContainerInfo ContainerUtils::ParseInspectOutput(const std::string& json_str) {
    json j = json::parse(json_str);

    // inspect returns an array with a single object
    if (j.is_array() && !j.empty()) {
        j = j[0];
    }

    ContainerInfo info;
    info.id = j.value("Id", "");
    info.name = j.value("Name", "");
    if (!info.name.empty() && info.name.front() == '/') {
        info.name.erase(0, 1);
    }

    if (j.contains("Config") && j["Config"].is_object()) {
        info.image = j["Config"].value("Image", "");
    }

    if (j.contains("State") && j["State"].is_object()) {
        const auto& state = j["State"];
        info.state = ParseState(state.value("Status", ""));
        info.oom_killed = state.value("OOMKilled", false);
        info.exit_code = state.value("ExitCode", 0);
    }

    if (j.contains("NetworkSettings") && j["NetworkSettings"].contains("Networks") &&
        j["NetworkSettings"]["Networks"].is_object()) {
        for (const auto& [name, settings] : j["NetworkSettings"]["Networks"].items()) {
            info.networks.push_back(name);
        }
    }

    return info;
}

ContainerState ContainerUtils::ParseState(const std::string& state) {
    if (state == "created") return ContainerState::CREATED;
    if (state == "running") return ContainerState::RUNNING;
    if (state == "restarting") return ContainerState::RUNNING;
    if (state == "paused") return ContainerState::PAUSED;
    if (state == "exited") return ContainerState::EXITED;
    if (state == "removing") return ContainerState::EXITED;
    if (state == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

std::string ContainerUtils::GenerateContainerName(const std::string& prefix) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(100000, 999999);

    auto now = std::chrono::system_clock::now();
    auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();

    return prefix + "_" + std::to_string(timestamp) + "_" + std::to_string(dis(gen));
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteDockerCommand(const std::vector<std::string>& args) const {
    ProcessSpec spec;
    spec.argv.push_back(binary_);
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.timeout = command_timeout_;

    spdlog::debug("[CONTAINER] Executing: {} {}", binary_, StringUtils::Join(args, " "));

    ContainerExecResult exec_result;
    try {
        auto outcome = ProcessRunner::Run(spec);
        exec_result.exit_code = outcome.exit_code;
        exec_result.stdout_output = outcome.stdout_data;
        exec_result.stderr_output = outcome.launch_error.empty() ? outcome.stderr_data : outcome.launch_error;
        exec_result.duration = outcome.wall_time;
        exec_result.success = outcome.launch_error.empty() && outcome.Exited() && outcome.exit_code == 0;

        if (outcome.timed_out) {
            exec_result.stderr_output = binary_ + " " + args.front() + " timed out after " +
                                        std::to_string(command_timeout_.count()) + "ms";
        }
    } catch (const std::runtime_error& e) {
        exec_result.exit_code = -1;
        exec_result.stderr_output = e.what();
        exec_result.success = false;
    }

    return exec_result;
}

bool ContainerUtils::RecordFailure(const ContainerExecResult& result, const std::string& action) {
    last_error_ = StringUtils::Trim(result.stderr_output);
    if (last_error_.empty()) {
        last_error_ = "exit code " + std::to_string(result.exit_code);
    }
    spdlog::error("[CONTAINER] Failed to {}: {}", action, last_error_);
    return false;
}

// ============================================================================
// CONTAINER BUILDER IMPLEMENTATION (FLUENT API)
// ============================================================================

ContainerBuilder& ContainerBuilder::WithName(const std::string& name) {
    config_.name = name;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithImage(const std::string& image) {
    config_.image = image;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithRuntime(const std::string& runtime) {
    config_.runtime = runtime;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMemoryLimit(std::size_t mb) {
    config_.memory_limit_mb = mb;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCPULimit(double cpus) {
    config_.cpu_limit = cpus;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithPidsLimit(int pids) {
    config_.pids_limit = pids;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithOpenFilesLimit(int files) {
    config_.open_files_limit = files;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithNetwork(NetworkMode mode, const std::string& name) {
    config_.network_mode = mode;
    config_.network_name = name;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithTmpfs(const std::string& mount_point, const std::string& options) {
    config_.tmpfs[mount_point] = options;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithWorkingDir(const std::string& dir) {
    config_.working_dir = dir;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithEnvironment(const std::string& key, const std::string& value) {
    config_.environment_vars[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithLabel(const std::string& key, const std::string& value) {
    config_.labels[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithReadOnlyRootfs(bool read_only) {
    config_.read_only_rootfs = read_only;
    return *this;
}

ContainerBuilder& ContainerBuilder::DropAllCapabilities() {
    config_.capabilities_drop = {"ALL"};
    return *this;
}

ContainerBuilder& ContainerBuilder::WithUser(const std::string& user) {
    config_.user = user;
    return *this;
}

ContainerConfig ContainerBuilder::Build() const {
    return config_;
}

} // namespace sandbox
} // namespace warden
