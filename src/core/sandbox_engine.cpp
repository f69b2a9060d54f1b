/**
 * @file sandbox_engine.cpp
 * @brief Container lifecycle for test execution
 *
 * **Security Hardening**:
 * - **Network Isolation**: --network none unless explicitly allowed
 * - **Capability Dropping**: --cap-drop ALL
 * - **No Privilege Escalation**: --security-opt no-new-privileges
 * - **Non-root Execution**: --user 1000:1000 by default
 * - **Resource Limits**: memory (swap disabled), CPU, CPU shares, pids
 * - **Filesystem**: only the instance workspace is bind mounted
 *
 * **Execution Workflow**:
 * 1. create with labels patchbench.managed/run/instance
 * 2. start (keep-alive command)
 * 3. exec the test command with a deadline
 * 4. on deadline or cancellation: kill the container
 * 5. stop (grace period) and remove, on every path
 *
 * @date 2025
 */

#include "patchbench/core/sandbox_engine.hpp"
#include "patchbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace patchbench {
namespace core {

std::string ToString(SandboxState state) {
    switch (state) {
        case SandboxState::CREATED: return "Created";
        case SandboxState::STARTED: return "Started";
        case SandboxState::RUNNING: return "Running";
        case SandboxState::EXITED: return "Exited";
        case SandboxState::START_FAILED: return "StartFailed";
        case SandboxState::RELEASED: return "Released";
    }
    return "Unknown";
}

// ============================================================================
// SANDBOX HANDLE
// ============================================================================

SandboxHandle::SandboxHandle(std::shared_ptr<utils::ContainerRuntime> runtime,
                             std::string instance_id,
                             std::string container_id,
                             std::string container_name,
                             std::filesystem::path workspace_root,
                             std::chrono::seconds stop_grace,
                             std::function<void()> on_release)
    : runtime_(std::move(runtime))
    , instance_id_(std::move(instance_id))
    , container_id_(std::move(container_id))
    , container_name_(std::move(container_name))
    , workspace_root_(std::move(workspace_root))
    , stop_grace_(stop_grace)
    , on_release_(std::move(on_release)) {
}

SandboxHandle::~SandboxHandle() {
    Release();
}

utils::ContainerExecResult SandboxHandle::Execute(const std::vector<std::string>& command,
                                                  const utils::ExecOptions& options) {
    SandboxState expected = SandboxState::STARTED;
    if (!state_.compare_exchange_strong(expected, SandboxState::RUNNING)) {
        utils::ContainerExecResult refused;
        refused.exit_code = -1;
        refused.stderr_output = "sandbox is " + ToString(expected) + ", not Started";
        spdlog::error("[{}] {}", instance_id_, refused.stderr_output);
        return refused;
    }

    spdlog::info("[{}] Running test command in {} (workspace {})", instance_id_, container_name_,
                 workspace_root_.string());
    auto result = runtime_->ExecuteCommand(container_id_, command, options);

    if (result.timed_out || result.cancelled) {
        spdlog::warn("[{}] Test command {} after {}ms; killing container",
                     instance_id_, result.timed_out ? "timed out" : "cancelled",
                     result.duration.count());
        Kill();
    }

    expected = SandboxState::RUNNING;
    state_.compare_exchange_strong(expected, SandboxState::EXITED);

    spdlog::debug("[{}] Test command exited with {} in {}ms",
                  instance_id_, result.exit_code, result.duration.count());
    return result;
}

void SandboxHandle::Kill() {
    if (state_.load() == SandboxState::RELEASED) {
        return;
    }
    runtime_->KillContainer(container_id_);
}

void SandboxHandle::Release() noexcept {
    SandboxState previous = state_.exchange(SandboxState::RELEASED);
    if (previous == SandboxState::RELEASED) {
        return;
    }

    try {
        if (previous == SandboxState::STARTED || previous == SandboxState::RUNNING ||
            previous == SandboxState::EXITED) {
            runtime_->StopContainer(container_id_, stop_grace_);
        }

        if (!runtime_->RemoveContainer(container_id_, true)) {
            spdlog::error("[{}] Container {} could not be removed; it will be swept on next start",
                          instance_id_, container_name_);
        } else {
            spdlog::debug("[{}] Sandbox released: {}", instance_id_, container_name_);
        }
    }
    catch (const std::exception& e) {
        spdlog::error("[{}] Error releasing sandbox {}: {}", instance_id_, container_name_, e.what());
    }

    if (on_release_) {
        on_release_();
    }
}

// ============================================================================
// SANDBOX ENGINE
// ============================================================================

SandboxEngine::SandboxEngine(std::shared_ptr<utils::ContainerRuntime> runtime,
                             const SandboxOptions& options)
    : runtime_(std::move(runtime))
    , options_(options) {
    spdlog::debug("Sandbox engine: runtime={} user={} network={} workdir={}",
                  runtime_->Name(), options_.user,
                  options_.allow_network ? "bridge" : "none",
                  options_.container_workdir.string());
}

bool SandboxEngine::Initialize() {
    spdlog::info("Checking {} availability...", runtime_->Name());
    if (!runtime_->IsAvailable()) {
        spdlog::error("{} is not available or not running", runtime_->Name());
        return false;
    }
    return true;
}

utils::ContainerConfig SandboxEngine::BuildContainerConfig(const std::string& instance_id,
                                                           const Workspace& workspace,
                                                           const std::string& image,
                                                           const ResourceLimits& limits) const {
    utils::ContainerConfig config;

    config.name = utils::ContainerUtils::GenerateContainerName(
        "patchbench_" + utils::StringUtils::SanitizeIdentifier(instance_id));
    config.image = image;

    config.memory_limit_mb = limits.memory_mb;
    config.cpu_limit = limits.cpus;
    config.cpu_shares = limits.cpu_shares;
    config.pids_limit = options_.pids_limit;

    config.network_mode = options_.allow_network ? utils::NetworkMode::BRIDGE : utils::NetworkMode::NONE;
    config.user = options_.user;

    config.mounts.push_back({std::filesystem::absolute(workspace.Root()), options_.container_workdir, false});
    config.working_dir = options_.container_workdir;

    config.environment_vars["HOME"] = "/tmp";
    config.environment_vars["PYTHONDONTWRITEBYTECODE"] = "1";

    config.labels[kManagedLabel] = "true";
    config.labels[kInstanceLabel] = instance_id;
    if (!options_.run_id.empty()) {
        config.labels[kRunLabel] = options_.run_id;
    }

    return config;
}

StageResult<std::unique_ptr<SandboxHandle>> SandboxEngine::Create(const std::string& instance_id,
                                                                  const Workspace& workspace,
                                                                  const std::string& image,
                                                                  const ResourceLimits& limits,
                                                                  const utils::CancellationToken* cancel) {
    if (cancel && cancel->IsCancelled()) {
        return MakeFailure(Stage::SANDBOX, FailureKind::CANCELLED, "cancelled before sandbox creation");
    }

    auto config = BuildContainerConfig(instance_id, workspace, image, limits);
    spdlog::info("[{}] Creating sandbox {} ({} MiB, {} cpus)", instance_id, config.name,
                 limits.memory_mb, limits.cpus);

    std::string error;
    std::string container_id = runtime_->CreateContainer(config, &error);
    if (container_id.empty()) {
        return MakeFailure(Stage::SANDBOX, FailureKind::SANDBOX_START_FAILED,
                           "container create failed: " + error);
    }

    OnAcquired();
    std::unique_ptr<SandboxHandle> handle(new SandboxHandle(
        runtime_, instance_id, container_id, config.name, workspace.Root(),
        options_.stop_grace, [this]() { OnReleased(); }));

    if (!runtime_->StartContainer(container_id, &error)) {
        handle->state_.store(SandboxState::START_FAILED);
        handle->Release();
        return MakeFailure(Stage::SANDBOX, FailureKind::SANDBOX_START_FAILED,
                           "container start failed: " + error);
    }

    handle->state_.store(SandboxState::STARTED);
    spdlog::debug("[{}] Sandbox started: {}", instance_id, container_id.substr(0, 12));
    return std::move(handle);
}

std::size_t SandboxEngine::SweepOrphans() {
    auto containers = runtime_->ListContainers(std::string(kManagedLabel) + "=true");
    std::size_t removed = 0;

    for (const auto& container : containers) {
        spdlog::warn("Removing orphaned sandbox {} (instance {})", container.name,
                     container.labels.count(kInstanceLabel) ? container.labels.at(kInstanceLabel) : "?");
        if (runtime_->RemoveContainer(container.id, true)) {
            removed++;
        }
    }

    if (removed > 0) {
        spdlog::info("Swept {} orphaned sandbox container(s)", removed);
    }
    return removed;
}

void SandboxEngine::OnAcquired() {
    std::size_t now = ++active_;
    std::size_t peak = peak_.load();
    while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
    }
}

void SandboxEngine::OnReleased() {
    --active_;
}

} // namespace core
} // namespace patchbench
