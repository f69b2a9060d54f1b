/**
 * @file instance_orchestrator.hpp
 * @brief Per-instance stage pipeline and the concurrent batch driver
 *
 * Drives one instance through
 *
 * ```
 * validation -> image -> checkout -> patch -> test patch -> sandbox -> test run -> parse
 * ```
 *
 * Each stage returns a StageResult; the first failure short-circuits to a
 * terminal InstanceResult carrying the stage and cause. A patch that does not
 * apply ends the instance as PatchFailed before any sandbox exists. A test
 * command that exceeds its deadline maps every expected test to Fail.
 *
 * Batches run on a WorkerPool of configurable size. Instances share nothing
 * but the image cache: every instance gets a fresh workspace, a fresh
 * sandbox and its own artifact directory, all released when it finishes.
 *
 * @date 2025
 */

#pragma once

#include "patchbench/core/harness_config.hpp"
#include "patchbench/core/instance.hpp"
#include "patchbench/utils/container_utils.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace patchbench {
namespace core {

/// Called on the collecting thread as each instance finishes
using ResultCallback = std::function<void(const InstanceResult&)>;

/**
 * @class InstanceOrchestrator
 * @brief Top-level state machine coordinating every stage
 *
 * **Usage Example**:
 * @code
 * HarnessConfig config;
 * config.workers = 8;
 *
 * auto runtime = std::make_shared<utils::DockerRuntime>();
 * InstanceOrchestrator orchestrator(config, runtime);
 * if (!orchestrator.Initialize()) {
 *     return 1;
 * }
 *
 * auto results = orchestrator.RunAll(specs, [](const InstanceResult& r) {
 *     spdlog::info("{}: {}", r.instance_id, ToString(r.status));
 * });
 * @endcode
 *
 * **Artifacts**: `<log_dir>/<run_id>/<instance_id>/` receives patch.diff,
 * test_patch.diff, test_output.txt, run_instance.log and report.json.
 *
 * **Thread Safety**: RunInstance() may run on many threads at once.
 * CancelAll() only performs an atomic store and may be called from a
 * signal handler.
 */
class InstanceOrchestrator {
public:
    InstanceOrchestrator(const HarnessConfig& config,
                         std::shared_ptr<utils::ContainerRuntime> runtime);
    ~InstanceOrchestrator();

    InstanceOrchestrator(const InstanceOrchestrator&) = delete;
    InstanceOrchestrator& operator=(const InstanceOrchestrator&) = delete;

    /**
     * @brief Check the runtime, sweep leftovers from crashed runs, create directories
     *
     * @param sweep Remove orphaned managed containers and stale workspaces
     * @return false if the container runtime is unusable or directories cannot be created
     */
    bool Initialize(bool sweep = true);

    /**
     * @brief Cancel everything still running and drop components
     */
    void Shutdown();

    /**
     * @brief Run one instance to its terminal result
     *
     * Never throws: internal faults become a SandboxError result.
     */
    InstanceResult RunInstance(const InstanceSpec& spec);

    /**
     * @brief Run a batch on the worker pool
     *
     * Returns exactly one result per spec, in completion order.
     */
    std::vector<InstanceResult> RunAll(const std::vector<InstanceSpec>& specs,
                                       ResultCallback on_result = nullptr);

    /**
     * @brief Terminal result for a definition that failed validation
     */
    InstanceResult RejectInvalid(const std::string& instance_id,
                                 const std::vector<std::string>& errors) const;

    /**
     * @brief Cancel one in-flight instance
     * @return false if no instance with this id is running
     */
    bool Cancel(const std::string& instance_id);

    /**
     * @brief Cancel every in-flight and future instance
     */
    void CancelAll() noexcept;

    bool IsCancelled() const noexcept;

    /**
     * @brief Highest number of sandboxes alive at the same time
     */
    std::size_t PeakConcurrentSandboxes() const;

    /**
     * @brief Image builds performed (cache misses)
     */
    std::size_t ImageBuildCount() const;

    /**
     * @brief <log_dir>/<run_id>
     */
    std::filesystem::path RunDirectory() const;

    /**
     * @brief Artifact directory of one instance
     */
    std::filesystem::path InstanceLogDirectory(const std::string& instance_id) const;

    const HarnessConfig& GetConfig() const { return config_; }

private:
    class Impl;

    HarnessConfig config_;
    std::unique_ptr<Impl> impl_;
};

} // namespace core
} // namespace patchbench
