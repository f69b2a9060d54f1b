/**
 * @file sandbox_engine.hpp
 * @brief Isolated, resource-limited test execution containers
 *
 * Manages one container per in-flight instance. The workspace is bind
 * mounted read-write at the container working directory; the container has
 * no network unless configured, runs as a non-root user with all
 * capabilities dropped, and is capped in memory (no swap), CPU and process
 * count. The container idles on a keep-alive command and the test command
 * runs through exec, so the sandbox can be inspected and torn down
 * independently of the command's fate.
 *
 * @date 2025
 */

#pragma once

#include "patchbench/core/instance.hpp"
#include "patchbench/core/stage_result.hpp"
#include "patchbench/core/workspace_builder.hpp"
#include "patchbench/utils/container_utils.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace patchbench {
namespace core {

/**
 * @enum SandboxState
 * @brief Sandbox lifecycle
 *
 * ```
 * CREATED -> STARTED -> RUNNING -> EXITED
 *        \-> START_FAILED
 * any -> RELEASED
 * ```
 */
enum class SandboxState {
    CREATED,        ///< Container allocated, not started
    STARTED,        ///< Container running, test command not yet launched
    RUNNING,        ///< Test command executing
    EXITED,         ///< Test command finished or was killed
    START_FAILED,   ///< Container could not be started
    RELEASED        ///< Container stopped and removed
};

std::string ToString(SandboxState state);

/**
 * @struct SandboxOptions
 * @brief Engine-wide sandbox settings
 */
struct SandboxOptions {
    std::string user{"1000:1000"};                          ///< Execution identity
    bool allow_network{false};                              ///< Bridge network instead of none
    std::filesystem::path container_workdir{"/testbed"};    ///< Workspace mount point
    std::chrono::seconds stop_grace{10};                    ///< Graceful stop before kill
    int pids_limit{4096};                                   ///< Process count ceiling
    std::string run_id;                                     ///< Label for sweeps
};

/**
 * @class SandboxHandle
 * @brief Owns exactly one container bound to exactly one workspace
 *
 * Release() stops the container (grace period, then kill) and removes it;
 * the destructor calls it, so the container is released on every exit path.
 * A test command may be executed once.
 *
 * **Thread Safety**: Kill() may be called from another thread while
 * Execute() is in progress; everything else belongs to the owning worker.
 */
class SandboxHandle {
public:
    ~SandboxHandle();

    SandboxHandle(const SandboxHandle&) = delete;
    SandboxHandle& operator=(const SandboxHandle&) = delete;

    /**
     * @brief Run the test command (STARTED -> RUNNING -> EXITED)
     *
     * On deadline or cancellation the whole container is killed so no
     * process of the command survives; the result carries timed_out or
     * cancelled.
     */
    utils::ContainerExecResult Execute(const std::vector<std::string>& command,
                                       const utils::ExecOptions& options);

    /**
     * @brief Forcibly terminate everything in the container
     */
    void Kill();

    /**
     * @brief Stop and remove the container; idempotent, never throws
     */
    void Release() noexcept;

    SandboxState GetState() const { return state_.load(); }
    const std::string& ContainerId() const { return container_id_; }
    const std::string& ContainerName() const { return container_name_; }

private:
    friend class SandboxEngine;

    SandboxHandle(std::shared_ptr<utils::ContainerRuntime> runtime,
                  std::string instance_id,
                  std::string container_id,
                  std::string container_name,
                  std::filesystem::path workspace_root,
                  std::chrono::seconds stop_grace,
                  std::function<void()> on_release);

    std::shared_ptr<utils::ContainerRuntime> runtime_;
    std::string instance_id_;
    std::string container_id_;
    std::string container_name_;
    std::filesystem::path workspace_root_;
    std::chrono::seconds stop_grace_;
    std::function<void()> on_release_;
    std::atomic<SandboxState> state_{SandboxState::CREATED};
};

/**
 * @class SandboxEngine
 * @brief Creates sandboxes and sweeps orphans
 *
 * **Usage Example**:
 * @code
 * SandboxEngine engine(runtime, options);
 * auto created = engine.Create(spec.instance_id, *workspace, image.tag, limits);
 * if (!Succeeded(created)) {
 *     return FailureOf(created);      // SANDBOX_START_FAILED
 * }
 * auto& sandbox = ValueOf(created);   // released when it goes out of scope
 * auto output = sandbox->Execute({"bash", "-lc", spec.test_cmd}, exec_options);
 * @endcode
 *
 * Handles must not outlive the engine that created them.
 */
class SandboxEngine {
public:
    SandboxEngine(std::shared_ptr<utils::ContainerRuntime> runtime,
                  const SandboxOptions& options = SandboxOptions{});

    SandboxEngine(const SandboxEngine&) = delete;
    SandboxEngine& operator=(const SandboxEngine&) = delete;

    /**
     * @brief Check the container runtime is usable
     */
    bool Initialize();

    /**
     * @brief Create and start a sandbox (CREATED -> STARTED)
     *
     * Any container left from a failed start is removed before returning
     * SANDBOX_START_FAILED. Start failures are not retried.
     */
    StageResult<std::unique_ptr<SandboxHandle>> Create(const std::string& instance_id,
                                                       const Workspace& workspace,
                                                       const std::string& image,
                                                       const ResourceLimits& limits,
                                                       const utils::CancellationToken* cancel = nullptr);

    /**
     * @brief Force-remove every container labelled as managed by patchbench
     * @return Number of containers removed
     */
    std::size_t SweepOrphans();

    /**
     * @brief Container configuration for an instance (exposed for tests)
     */
    utils::ContainerConfig BuildContainerConfig(const std::string& instance_id,
                                                const Workspace& workspace,
                                                const std::string& image,
                                                const ResourceLimits& limits) const;

    std::size_t ActiveCount() const { return active_.load(); }
    std::size_t PeakActiveCount() const { return peak_.load(); }

    static constexpr const char* kManagedLabel = "patchbench.managed";
    static constexpr const char* kRunLabel = "patchbench.run";
    static constexpr const char* kInstanceLabel = "patchbench.instance";

private:
    void OnAcquired();
    void OnReleased();

    std::shared_ptr<utils::ContainerRuntime> runtime_;
    SandboxOptions options_;
    std::atomic<std::size_t> active_{0};
    std::atomic<std::size_t> peak_{0};
};

} // namespace core
} // namespace patchbench
