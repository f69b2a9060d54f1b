/**
 * @file harness_config.hpp
 * @brief Harness-wide configuration surface
 *
 * Holds every tunable of the harness with its default. Values are layered:
 * built-in defaults, then an optional JSON config file, then PATCHBENCH_*
 * environment variables, then command-line flags (applied by main). Each
 * instance may override memory, CPU, timeout and fuzz; EffectiveLimits()
 * and EffectiveFuzz() resolve the final values.
 *
 * **Config file** (all keys optional):
 * @code
 * {
 *   "memory_mb": 4096, "cpus": 2.0, "cpu_shares": 1024, "timeout": 1800,
 *   "fuzz": 3, "max_log_bytes": 10485760, "workers": 4,
 *   "cache_dir": ".patchbench/images", "work_dir": "/tmp/patchbench",
 *   "log_dir": "logs/run_evaluation", "checkout_retries": 3,
 *   "image_build_retries": 1, "retry_backoff_ms": 1000, "stop_grace": 10,
 *   "allow_network": false, "sandbox_user": "1000:1000",
 *   "runtime": "docker", "default_test_format": "pytest"
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "patchbench/core/instance.hpp"
#include "patchbench/utils/container_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace patchbench {
namespace core {

/**
 * @struct HarnessConfig
 * @brief Complete harness configuration
 */
struct HarnessConfig {
    // Sandbox Limits
    ResourceLimits limits;                          ///< Default per-instance limits
    int fuzz{3};                                    ///< Patch context drift tolerance (lines)
    std::size_t max_log_bytes{10 * 1024 * 1024};    ///< Per-stream capture ceiling

    // Pool
    std::size_t workers{4};                         ///< Concurrent instances

    // Directories
    std::filesystem::path cache_dir{".patchbench/images"};  ///< Image cache records
    std::filesystem::path work_dir;                 ///< Workspace root (temp/patchbench)
    std::filesystem::path log_dir{"logs/run_evaluation"};   ///< Per-run artifacts

    // Retries and Timeouts
    int checkout_retries{3};                        ///< Transient clone retries
    int image_build_retries{1};                     ///< Transient build retries
    std::chrono::milliseconds retry_backoff{1000};  ///< Initial backoff
    std::chrono::seconds stop_grace{10};            ///< Container stop grace period
    std::chrono::seconds image_build_timeout{3600}; ///< Build/pull deadline
    std::chrono::seconds checkout_timeout{900};     ///< Per git command deadline

    // Sandbox Identity
    bool allow_network{false};                      ///< Give sandboxes a network
    std::string sandbox_user{"1000:1000"};          ///< Non-root execution identity
    std::filesystem::path container_workdir{"/testbed"};  ///< Workspace mount point
    utils::RuntimeKind runtime{utils::RuntimeKind::DOCKER};  ///< Container CLI

    // Instance Defaults
    std::string default_test_format{"pytest"};      ///< When an instance names none
    std::string run_id;                             ///< Set by the front end

    HarnessConfig();
};

/**
 * @class ConfigManager
 * @brief Loads, layers and validates HarnessConfig
 */
class ConfigManager {
public:
    /**
     * @brief Overlay a JSON config file onto config
     * @throws std::runtime_error if the file is unreadable or not valid JSON
     */
    static void LoadFromFile(const std::filesystem::path& path, HarnessConfig& config);

    /**
     * @brief Overlay a parsed JSON object onto config
     * @throws std::runtime_error on a value of the wrong type
     */
    static void ApplyJson(const nlohmann::json& j, HarnessConfig& config);

    /**
     * @brief Overlay PATCHBENCH_* environment variables onto config
     *
     * Malformed values are logged and ignored.
     */
    static void ApplyEnvironment(HarnessConfig& config);

    /**
     * @brief Check ranges; empty when valid
     */
    static std::vector<std::string> Validate(const HarnessConfig& config);

    static nlohmann::json ToJson(const HarnessConfig& config);

    /**
     * @brief Generate run_<yyyymmdd_HHMMSS>_<4 hex>
     */
    static std::string GenerateRunId();
};

/**
 * @brief Limits for an instance: override if present, else config
 */
ResourceLimits EffectiveLimits(const HarnessConfig& config, const InstanceSpec& spec);

int EffectiveFuzz(const HarnessConfig& config, const InstanceSpec& spec);

} // namespace core
} // namespace patchbench
