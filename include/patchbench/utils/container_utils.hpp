/**
 * @file container_utils.hpp
 * @brief Container runtime interface and Docker CLI implementation
 *
 * The harness never talks to a container engine directly; it goes through
 * the ContainerRuntime interface declared here. DockerRuntime implements it
 * by driving the `docker` (or `podman`) command-line client, so any engine
 * with a Docker-compatible CLI works. Tests substitute an in-process fake.
 *
 * @date 2025
 */

#pragma once

#include "patchbench/utils/process_utils.hpp"

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <chrono>

namespace patchbench {
namespace utils {

/**
 * @enum RuntimeKind
 * @brief Docker-compatible command-line clients
 */
enum class RuntimeKind {
    DOCKER,   ///< Docker Engine (`docker`)
    PODMAN    ///< Podman (`podman`, daemonless)
};

/**
 * @enum ContainerState
 * @brief Container lifecycle states as reported by the engine
 */
enum class ContainerState {
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running
    PAUSED,    ///< Container paused
    EXITED,    ///< Container exited
    DEAD,      ///< Container is dead
    UNKNOWN    ///< Unknown or missing
};

/**
 * @enum NetworkMode
 * @brief Container network isolation modes
 */
enum class NetworkMode {
    NONE,     ///< No network access (default for test runs)
    BRIDGE    ///< Default bridge network
};

/**
 * @struct Mount
 * @brief Bind mount from the host into the container
 */
struct Mount {
    std::filesystem::path host_path;       ///< Absolute host path
    std::filesystem::path container_path;  ///< Mount point inside container
    bool read_only{false};                 ///< Mount read-only
};

/**
 * @struct ContainerConfig
 * @brief Complete container configuration
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                           ///< Container name
    std::string image;                          ///< Image reference
    std::string hostname{"testbed"};            ///< Container hostname

    // Resource Limits
    std::size_t memory_limit_mb{4096};          ///< Memory limit; swap disabled
    double cpu_limit{2.0};                      ///< CPU limit (cores)
    int cpu_shares{1024};                       ///< Relative CPU weight
    int pids_limit{1024};                       ///< Process limit

    // Network Settings
    NetworkMode network_mode{NetworkMode::NONE};  ///< Network mode

    // Security Settings
    std::vector<std::string> capabilities_drop{"ALL"};          ///< Dropped capabilities
    std::vector<std::string> security_opts{"no-new-privileges"}; ///< --security-opt values
    std::string user{"1000:1000"};              ///< Non-root execution identity

    // Filesystem Settings
    std::vector<Mount> mounts;                  ///< Bind mounts
    std::filesystem::path working_dir{"/testbed"};  ///< Working directory

    // Environment
    std::map<std::string, std::string> environment_vars;  ///< Environment variables
    std::map<std::string, std::string> labels;            ///< Labels for discovery/sweeps

    /// Keep-alive command; tests run through exec while it idles
    std::vector<std::string> command{"tail", "-f", "/dev/null"};
};

/**
 * @struct ContainerInfo
 * @brief Container runtime information
 */
struct ContainerInfo {
    std::string id;                               ///< Container ID
    std::string name;                             ///< Container name
    std::string image;                            ///< Image name
    ContainerState state{ContainerState::UNKNOWN}; ///< Current state
    std::map<std::string, std::string> labels;    ///< Labels
};

/**
 * @struct ExecOptions
 * @brief Parameters for running a command inside a container
 */
struct ExecOptions {
    std::chrono::milliseconds timeout{0};             ///< 0 = no deadline
    std::size_t max_output_bytes{10 * 1024 * 1024};   ///< Per stream capture ceiling
    const CancellationToken* cancel{nullptr};         ///< Optional cancellation
    std::filesystem::path working_dir;                ///< Empty = container default
    std::map<std::string, std::string> environment;   ///< Extra environment
};

/**
 * @struct ContainerExecResult
 * @brief Result of command execution in container or of a runtime call
 */
struct ContainerExecResult {
    int exit_code{0};              ///< Exit code
    std::string stdout_output;     ///< Standard output
    std::string stderr_output;     ///< Standard error
    std::chrono::milliseconds duration{0};  ///< Execution duration
    bool success{false};           ///< Success flag
    bool timed_out{false};         ///< Deadline exceeded
    bool cancelled{false};         ///< Cancelled by token
    bool truncated{false};         ///< Either stream hit the capture ceiling
};

/**
 * @class ContainerRuntime
 * @brief Abstract container engine used by the image cache and sandbox
 *
 * Implementations must be safe to call from multiple worker threads at once;
 * every call is independent and addresses containers by ID.
 *
 * Methods returning bool log the engine's error output; methods returning a
 * string return an empty string on failure and fill error_message if given.
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /**
     * @brief Human-readable runtime name for logs
     */
    virtual std::string Name() const = 0;

    /**
     * @brief Check the engine is installed and responsive
     */
    virtual bool IsAvailable() = 0;

    /**
     * @brief Check whether an image tag is present locally
     */
    virtual bool ImageExists(const std::string& tag) = 0;

    /**
     * @brief Build an image from a context directory containing a Dockerfile
     * @param tag Tag to apply to the built image
     * @param context_dir Build context
     * @param timeout Build deadline (0 = none)
     * @param cancel Stops the build early; the result is then marked cancelled
     */
    virtual ContainerExecResult BuildImage(const std::string& tag,
                                           const std::filesystem::path& context_dir,
                                           std::chrono::seconds timeout,
                                           const CancellationToken* cancel = nullptr) = 0;

    /**
     * @brief Pull an image from its registry
     */
    virtual ContainerExecResult PullImage(const std::string& tag,
                                          std::chrono::seconds timeout,
                                          const CancellationToken* cancel = nullptr) = 0;

    /**
     * @brief Create (but do not start) a container
     * @return Container ID, empty on failure
     */
    virtual std::string CreateContainer(const ContainerConfig& config,
                                        std::string* error_message = nullptr) = 0;

    virtual bool StartContainer(const std::string& container_id,
                                std::string* error_message = nullptr) = 0;

    /**
     * @brief Stop gracefully, killing after the grace period
     */
    virtual bool StopContainer(const std::string& container_id,
                               std::chrono::seconds grace) = 0;

    virtual bool KillContainer(const std::string& container_id) = 0;

    virtual bool RemoveContainer(const std::string& container_id, bool force) = 0;

    /**
     * @brief Run a command inside a running container
     *
     * On deadline or cancellation the client process is terminated; callers
     * that need the in-container processes gone must kill the container.
     */
    virtual ContainerExecResult ExecuteCommand(const std::string& container_id,
                                               const std::vector<std::string>& command,
                                               const ExecOptions& options) = 0;

    /**
     * @brief List containers (running or not) carrying a label
     * @param label_filter "key=value" or "key"
     */
    virtual std::vector<ContainerInfo> ListContainers(const std::string& label_filter) = 0;

    virtual ContainerState GetContainerState(const std::string& container_id) = 0;
};

/**
 * @class DockerRuntime
 * @brief ContainerRuntime backed by the docker/podman CLI
 *
 * **Usage Example**:
 * @code
 * DockerRuntime runtime(RuntimeKind::DOCKER);
 *
 * ContainerConfig config;
 * config.name = ContainerUtils::GenerateContainerName("patchbench");
 * config.image = "python:3.11";
 * config.mounts.push_back({"/tmp/ws", "/testbed", false});
 *
 * std::string error;
 * std::string id = runtime.CreateContainer(config, &error);
 * runtime.StartContainer(id);
 * auto result = runtime.ExecuteCommand(id, {"bash", "-lc", "pytest"}, {});
 * runtime.RemoveContainer(id, true);
 * @endcode
 */
class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(RuntimeKind kind = RuntimeKind::DOCKER);
    ~DockerRuntime() override = default;

    std::string Name() const override;
    bool IsAvailable() override;
    bool ImageExists(const std::string& tag) override;
    ContainerExecResult BuildImage(const std::string& tag,
                                   const std::filesystem::path& context_dir,
                                   std::chrono::seconds timeout,
                                   const CancellationToken* cancel = nullptr) override;
    ContainerExecResult PullImage(const std::string& tag,
                                  std::chrono::seconds timeout,
                                  const CancellationToken* cancel = nullptr) override;
    std::string CreateContainer(const ContainerConfig& config,
                                std::string* error_message = nullptr) override;
    bool StartContainer(const std::string& container_id,
                        std::string* error_message = nullptr) override;
    bool StopContainer(const std::string& container_id,
                       std::chrono::seconds grace) override;
    bool KillContainer(const std::string& container_id) override;
    bool RemoveContainer(const std::string& container_id, bool force) override;
    ContainerExecResult ExecuteCommand(const std::string& container_id,
                                       const std::vector<std::string>& command,
                                       const ExecOptions& options) override;
    std::vector<ContainerInfo> ListContainers(const std::string& label_filter) override;
    ContainerState GetContainerState(const std::string& container_id) override;

    /**
     * @brief Build `create` arguments for a configuration (exposed for tests)
     */
    static std::vector<std::string> BuildCreateArgs(const ContainerConfig& config);

private:
    RuntimeKind kind_;

    ContainerExecResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                             const ProcessOptions& options = ProcessOptions{}) const;
    std::string Binary() const;
};

/**
 * @class ContainerUtils
 * @brief Static helpers shared by runtime implementations
 */
class ContainerUtils {
public:
    /**
     * @brief Generate a unique container name: prefix_<epoch>_<4 digits>
     */
    static std::string GenerateContainerName(const std::string& prefix);

    static ContainerState ParseState(const std::string& state_str);

    /**
     * @brief Parse the "k=v,k2=v2" label format used by `ps`
     */
    static std::map<std::string, std::string> ParseLabels(const std::string& labels);

    /**
     * @brief Security audit of a configuration; empty when hardened
     */
    static std::vector<std::string> CheckSecurityIssues(const ContainerConfig& config);

    /**
     * @brief Convert a ProcessResult from the CLI into a ContainerExecResult
     */
    static ContainerExecResult FromProcessResult(const ProcessResult& result);
};

} // namespace utils
} // namespace patchbench
