/**
 * @file container_utils.cpp
 * @brief Docker CLI runtime implementation
 *
 * Drives the docker/podman client through RunProcess(). Arguments are passed
 * as argv, never through a shell, so image tags, label values and commands
 * need no quoting.
 *
 * **Container Hardening** (applied by BuildCreateArgs):
 * - `--network none` unless the caller opts in to networking
 * - `--cap-drop ALL`, `--security-opt no-new-privileges`
 * - Non-root `--user`
 * - `--memory` with `--memory-swap` equal to it (no swap), `--cpus`,
 *   `--cpu-shares`, `--pids-limit`
 *
 * **Lifecycle Commands**:
 * - create/start/stop/kill/rm
 * - exec for test commands
 * - ps --filter label=... for crash-recovery sweeps
 *
 * @date 2025
 */

#include "patchbench/utils/container_utils.hpp"
#include "patchbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <random>
#include <sstream>

using json = nlohmann::json;

namespace patchbench {
namespace utils {

// ============================================================================
// CONSTRUCTOR / IDENTITY
// ============================================================================

DockerRuntime::DockerRuntime(RuntimeKind kind)
    : kind_(kind) {
    spdlog::debug("Container runtime: {}", Binary());
}

std::string DockerRuntime::Name() const {
    return Binary();
}

std::string DockerRuntime::Binary() const {
    return kind_ == RuntimeKind::PODMAN ? "podman" : "docker";
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool DockerRuntime::IsAvailable() {
    if (!IsProgramAvailable(Binary())) {
        spdlog::error("{} client not found on PATH", Binary());
        return false;
    }

    ProcessOptions options;
    options.timeout = std::chrono::seconds(30);
    auto result = ExecuteDockerCommand({"info", "--format", "{{.ServerVersion}}"}, options);

    if (!result.success) {
        spdlog::error("{} daemon not responding: {}", Binary(),
                      StringUtils::Trim(result.stderr_output));
        return false;
    }

    spdlog::info("{} server version {}", Binary(), StringUtils::Trim(result.stdout_output));
    return true;
}

// ============================================================================
// IMAGES
// ============================================================================

bool DockerRuntime::ImageExists(const std::string& tag) {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{.Id}}", tag});
    return result.success;
}

ContainerExecResult DockerRuntime::BuildImage(const std::string& tag,
                                              const std::filesystem::path& context_dir,
                                              std::chrono::seconds timeout,
                                              const CancellationToken* cancel) {
    spdlog::info("Building image {} from {}", tag, context_dir.string());

    ProcessOptions options;
    options.timeout = timeout;
    options.cancel = cancel;

    auto result = ExecuteDockerCommand({
        "build",
        "--tag", tag,
        "--file", (context_dir / "Dockerfile").string(),
        context_dir.string()
    }, options);

    if (result.cancelled) {
        spdlog::warn("Image build cancelled for {}", tag);
    } else if (!result.success) {
        spdlog::error("Image build failed for {} (exit {})", tag, result.exit_code);
    }

    return result;
}

ContainerExecResult DockerRuntime::PullImage(const std::string& tag, std::chrono::seconds timeout,
                                             const CancellationToken* cancel) {
    spdlog::info("Pulling image {}", tag);

    ProcessOptions options;
    options.timeout = timeout;
    options.cancel = cancel;
    return ExecuteDockerCommand({"pull", tag}, options);
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

std::string DockerRuntime::CreateContainer(const ContainerConfig& config, std::string* error_message) {
    spdlog::debug("Creating container: {}", config.name);

    if (config.image.empty()) {
        if (error_message) {
            *error_message = "Container image not specified";
        }
        spdlog::error("Container image not specified");
        return "";
    }

    auto issues = ContainerUtils::CheckSecurityIssues(config);
    for (const auto& issue : issues) {
        spdlog::warn("  - {}", issue);
    }

    auto result = ExecuteDockerCommand(BuildCreateArgs(config));

    if (result.success) {
        std::string container_id = StringUtils::Trim(result.stdout_output);
        spdlog::debug("Container created: {}", container_id.substr(0, 12));
        return container_id;
    }

    std::string error = StringUtils::Trim(result.stderr_output);
    if (error.empty()) {
        error = "create exited with status " + std::to_string(result.exit_code);
    }
    if (error_message) {
        *error_message = error;
    }

    spdlog::error("Failed to create container {}: {}", config.name, error);
    return "";
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

bool DockerRuntime::StartContainer(const std::string& container_id, std::string* error_message) {
    auto result = ExecuteDockerCommand({"start", container_id});

    if (result.success) {
        spdlog::debug("Container started: {}", container_id.substr(0, 12));
        return true;
    }

    std::string error = StringUtils::Trim(result.stderr_output);
    if (error_message) {
        *error_message = error;
    }
    spdlog::error("Failed to start container {}: {}", container_id.substr(0, 12), error);
    return false;
}

bool DockerRuntime::StopContainer(const std::string& container_id, std::chrono::seconds grace) {
    ProcessOptions options;
    options.timeout = grace + std::chrono::seconds(30);

    auto result = ExecuteDockerCommand({
        "stop",
        "--time", std::to_string(grace.count()),
        container_id
    }, options);

    if (!result.success) {
        spdlog::warn("Failed to stop container {}: {}", container_id.substr(0, 12),
                     StringUtils::Trim(result.stderr_output));
    }
    return result.success;
}

bool DockerRuntime::KillContainer(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"kill", container_id});

    if (!result.success) {
        spdlog::debug("Kill of {} failed: {}", container_id.substr(0, 12),
                      StringUtils::Trim(result.stderr_output));
    }
    return result.success;
}

bool DockerRuntime::RemoveContainer(const std::string& container_id, bool force) {
    std::vector<std::string> args = {"rm", "--volumes"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args);

    if (result.success) {
        spdlog::debug("Container removed: {}", container_id.substr(0, 12));
        return true;
    }

    spdlog::error("Failed to remove container {}: {}", container_id.substr(0, 12),
                  StringUtils::Trim(result.stderr_output));
    return false;
}

// ============================================================================
// CONTAINER COMMAND EXECUTION
// ============================================================================

ContainerExecResult DockerRuntime::ExecuteCommand(const std::string& container_id,
                                                  const std::vector<std::string>& command,
                                                  const ExecOptions& options) {
    std::vector<std::string> args = {"exec"};

    if (!options.working_dir.empty()) {
        args.push_back("--workdir");
        args.push_back(options.working_dir.string());
    }

    for (const auto& [key, value] : options.environment) {
        args.push_back("--env");
        args.push_back(key + "=" + value);
    }

    args.push_back(container_id);
    args.insert(args.end(), command.begin(), command.end());

    ProcessOptions process_options;
    process_options.timeout = options.timeout;
    process_options.max_output_bytes = options.max_output_bytes;
    process_options.cancel = options.cancel;

    return ExecuteDockerCommand(args, process_options);
}

// ============================================================================
// CONTAINER INFORMATION RETRIEVAL
// ============================================================================

std::vector<ContainerInfo> DockerRuntime::ListContainers(const std::string& label_filter) {
    auto result = ExecuteDockerCommand({
        "ps", "--all",
        "--filter", "label=" + label_filter,
        "--format", "{{json .}}"
    });

    std::vector<ContainerInfo> containers;

    if (!result.success) {
        spdlog::warn("Failed to list containers: {}", StringUtils::Trim(result.stderr_output));
        return containers;
    }

    // One JSON object per line
    for (const auto& line : StringUtils::SplitLines(result.stdout_output)) {
        if (StringUtils::Trim(line).empty()) continue;

        try {
            json j = json::parse(line);

            ContainerInfo info;
            info.id = j.value("ID", "");
            info.name = j.value("Names", "");
            info.image = j.value("Image", "");
            info.state = ContainerUtils::ParseState(j.value("State", ""));
            info.labels = ContainerUtils::ParseLabels(j.value("Labels", ""));

            containers.push_back(info);
        }
        catch (const json::exception& e) {
            spdlog::warn("Failed to parse container info: {}", e.what());
        }
    }

    return containers;
}

ContainerState DockerRuntime::GetContainerState(const std::string& container_id) {
    auto result = ExecuteDockerCommand({
        "inspect",
        "--format", "{{.State.Status}}",
        container_id
    });

    if (result.success) {
        return ContainerUtils::ParseState(StringUtils::Trim(result.stdout_output));
    }

    return ContainerState::UNKNOWN;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ContainerExecResult DockerRuntime::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                        const ProcessOptions& options) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(Binary());
    argv.insert(argv.end(), args.begin(), args.end());

    return ContainerUtils::FromProcessResult(RunProcess(argv, options));
}

std::vector<std::string> DockerRuntime::BuildCreateArgs(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("create");

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    if (!config.hostname.empty()) {
        args.push_back("--hostname");
        args.push_back(config.hostname);
    }

    // Memory limit, swap disabled
    if (config.memory_limit_mb > 0) {
        std::string memory = std::to_string(config.memory_limit_mb) + "m";
        args.push_back("--memory");
        args.push_back(memory);
        args.push_back("--memory-swap");
        args.push_back(memory);
    }

    if (config.cpu_limit > 0) {
        std::ostringstream cpus;
        cpus << config.cpu_limit;
        args.push_back("--cpus");
        args.push_back(cpus.str());
    }

    if (config.cpu_shares > 0) {
        args.push_back("--cpu-shares");
        args.push_back(std::to_string(config.cpu_shares));
    }

    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    args.push_back("--network");
    args.push_back(config.network_mode == NetworkMode::NONE ? "none" : "bridge");

    for (const auto& cap : config.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }

    for (const auto& opt : config.security_opts) {
        args.push_back("--security-opt");
        args.push_back(opt);
    }

    if (!config.user.empty()) {
        args.push_back("--user");
        args.push_back(config.user);
    }

    for (const auto& mount : config.mounts) {
        std::string spec = mount.host_path.string() + ":" + mount.container_path.string();
        if (mount.read_only) {
            spec += ":ro";
        }
        args.push_back("--volume");
        args.push_back(spec);
    }

    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("--env");
        args.push_back(key + "=" + value);
    }

    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    if (!config.working_dir.empty()) {
        args.push_back("--workdir");
        args.push_back(config.working_dir.string());
    }

    // Image (must be last before command)
    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

// ============================================================================
// CONTAINER UTILS (STATIC HELPERS)
// ============================================================================

std::string ContainerUtils::GenerateContainerName(const std::string& prefix) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(1000, 9999);

    auto now = std::chrono::system_clock::now();
    auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();

    return prefix + "_" + std::to_string(timestamp) + "_" + std::to_string(dis(gen));
}

ContainerState ContainerUtils::ParseState(const std::string& state_str) {
    if (state_str == "created") return ContainerState::CREATED;
    if (state_str == "running") return ContainerState::RUNNING;
    if (state_str == "paused") return ContainerState::PAUSED;
    if (state_str == "restarting") return ContainerState::RUNNING;
    if (state_str == "removing") return ContainerState::EXITED;
    if (state_str == "exited") return ContainerState::EXITED;
    if (state_str == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

std::map<std::string, std::string> ContainerUtils::ParseLabels(const std::string& labels) {
    std::map<std::string, std::string> parsed;

    for (const auto& pair : StringUtils::Split(labels, ',')) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            parsed[pair] = "";
        } else {
            parsed[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
    }

    return parsed;
}

std::vector<std::string> ContainerUtils::CheckSecurityIssues(const ContainerConfig& config) {
    std::vector<std::string> issues;

    if (config.network_mode != NetworkMode::NONE) {
        issues.push_back("WARNING: Network access enabled for sandbox");
    }

    if (config.user == "root" || config.user == "0" || config.user.empty()) {
        issues.push_back("WARNING: Running as root user");
    }

    if (config.capabilities_drop.empty()) {
        issues.push_back("WARNING: Default capabilities retained");
    }

    return issues;
}

ContainerExecResult ContainerUtils::FromProcessResult(const ProcessResult& result) {
    ContainerExecResult exec_result;
    exec_result.exit_code = result.exit_code;
    exec_result.stdout_output = result.stdout_output;
    exec_result.stderr_output = result.spawn_failed ? result.error_message : result.stderr_output;
    exec_result.duration = result.duration;
    exec_result.timed_out = result.timed_out;
    exec_result.cancelled = result.cancelled;
    exec_result.truncated = result.stdout_truncated || result.stderr_truncated;
    exec_result.success = result.Succeeded();
    return exec_result;
}

} // namespace utils
} // namespace patchbench
