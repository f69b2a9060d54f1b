/**
 * @file harness_config.cpp
 * @brief Configuration layering: defaults, JSON file, environment
 *
 * @date 2025
 */

#include "patchbench/core/harness_config.hpp"
#include "patchbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace patchbench {
namespace core {

namespace {

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

template <typename T, typename Convert>
void OverlayEnv(const char* name, T& target, Convert convert) {
    auto value = GetEnv(name);
    if (!value) {
        return;
    }

    try {
        target = convert(*value);
        spdlog::debug("{} = {}", name, *value);
    }
    catch (const std::exception&) {
        spdlog::warn("Ignoring malformed {}='{}'", name, *value);
    }
}

utils::RuntimeKind ParseRuntime(const std::string& name) {
    std::string lower = utils::StringUtils::ToLower(name);
    if (lower == "docker") return utils::RuntimeKind::DOCKER;
    if (lower == "podman") return utils::RuntimeKind::PODMAN;
    throw std::runtime_error("Unknown container runtime: " + name);
}

} // anonymous namespace

HarnessConfig::HarnessConfig()
    : work_dir(std::filesystem::temp_directory_path() / "patchbench") {
}

// ============================================================================
// CONFIG FILE
// ============================================================================

void ConfigManager::LoadFromFile(const std::filesystem::path& path, HarnessConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path.string());
    }

    json j;
    try {
        file >> j;
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid config file " + path.string() + ": " + e.what());
    }

    if (!j.is_object()) {
        throw std::runtime_error("Config file must contain a JSON object: " + path.string());
    }

    ApplyJson(j, config);
    spdlog::info("Loaded configuration from {}", path.string());
}

void ConfigManager::ApplyJson(const json& j, HarnessConfig& config) {
    try {
        if (j.contains("memory_mb")) config.limits.memory_mb = j["memory_mb"].get<std::size_t>();
        if (j.contains("cpus")) config.limits.cpus = j["cpus"].get<double>();
        if (j.contains("cpu_shares")) config.limits.cpu_shares = j["cpu_shares"].get<int>();
        if (j.contains("timeout")) config.limits.timeout = std::chrono::seconds(j["timeout"].get<long>());
        if (j.contains("fuzz")) config.fuzz = j["fuzz"].get<int>();
        if (j.contains("max_log_bytes")) config.max_log_bytes = j["max_log_bytes"].get<std::size_t>();
        if (j.contains("workers")) config.workers = j["workers"].get<std::size_t>();
        if (j.contains("cache_dir")) config.cache_dir = j["cache_dir"].get<std::string>();
        if (j.contains("work_dir")) config.work_dir = j["work_dir"].get<std::string>();
        if (j.contains("log_dir")) config.log_dir = j["log_dir"].get<std::string>();
        if (j.contains("checkout_retries")) config.checkout_retries = j["checkout_retries"].get<int>();
        if (j.contains("image_build_retries")) config.image_build_retries = j["image_build_retries"].get<int>();
        if (j.contains("retry_backoff_ms")) {
            config.retry_backoff = std::chrono::milliseconds(j["retry_backoff_ms"].get<long>());
        }
        if (j.contains("stop_grace")) config.stop_grace = std::chrono::seconds(j["stop_grace"].get<long>());
        if (j.contains("image_build_timeout")) {
            config.image_build_timeout = std::chrono::seconds(j["image_build_timeout"].get<long>());
        }
        if (j.contains("checkout_timeout")) {
            config.checkout_timeout = std::chrono::seconds(j["checkout_timeout"].get<long>());
        }
        if (j.contains("allow_network")) config.allow_network = j["allow_network"].get<bool>();
        if (j.contains("sandbox_user")) config.sandbox_user = j["sandbox_user"].get<std::string>();
        if (j.contains("container_workdir")) config.container_workdir = j["container_workdir"].get<std::string>();
        if (j.contains("runtime")) config.runtime = ParseRuntime(j["runtime"].get<std::string>());
        if (j.contains("default_test_format")) {
            config.default_test_format = j["default_test_format"].get<std::string>();
        }
    }
    catch (const json::type_error& e) {
        throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    }
}

// ============================================================================
// ENVIRONMENT
// ============================================================================

void ConfigManager::ApplyEnvironment(HarnessConfig& config) {
    auto to_size = [](const std::string& s) { return static_cast<std::size_t>(std::stoull(s)); };
    auto to_int = [](const std::string& s) { return std::stoi(s); };
    auto to_path = [](const std::string& s) { return std::filesystem::path(s); };

    OverlayEnv("PATCHBENCH_MEMORY_MB", config.limits.memory_mb, to_size);
    OverlayEnv("PATCHBENCH_CPUS", config.limits.cpus, [](const std::string& s) { return std::stod(s); });
    OverlayEnv("PATCHBENCH_TIMEOUT", config.limits.timeout,
               [](const std::string& s) { return std::chrono::seconds(std::stol(s)); });
    OverlayEnv("PATCHBENCH_FUZZ", config.fuzz, to_int);
    OverlayEnv("PATCHBENCH_MAX_LOG_BYTES", config.max_log_bytes, to_size);
    OverlayEnv("PATCHBENCH_WORKERS", config.workers, to_size);
    OverlayEnv("PATCHBENCH_CACHE_DIR", config.cache_dir, to_path);
    OverlayEnv("PATCHBENCH_WORK_DIR", config.work_dir, to_path);
    OverlayEnv("PATCHBENCH_LOG_DIR", config.log_dir, to_path);
    OverlayEnv("PATCHBENCH_RUNTIME", config.runtime, ParseRuntime);
}

// ============================================================================
// VALIDATION
// ============================================================================

std::vector<std::string> ConfigManager::Validate(const HarnessConfig& config) {
    std::vector<std::string> errors;

    if (config.limits.memory_mb < 64) {
        errors.push_back("memory limit must be at least 64 MiB");
    }
    if (config.limits.cpus <= 0.0) {
        errors.push_back("CPU limit must be positive");
    }
    if (config.limits.timeout.count() <= 0) {
        errors.push_back("timeout must be positive");
    }
    if (config.fuzz < 0) {
        errors.push_back("fuzz must not be negative");
    }
    if (config.workers == 0) {
        errors.push_back("worker pool size must be at least 1");
    }
    if (config.max_log_bytes < 1024) {
        errors.push_back("max log bytes must be at least 1024");
    }
    if (config.checkout_retries < 0 || config.image_build_retries < 0) {
        errors.push_back("retry counts must not be negative");
    }
    if (config.work_dir.empty()) {
        errors.push_back("workspace root must be set");
    }

    return errors;
}

json ConfigManager::ToJson(const HarnessConfig& config) {
    return json{
        {"memory_mb", config.limits.memory_mb},
        {"cpus", config.limits.cpus},
        {"cpu_shares", config.limits.cpu_shares},
        {"timeout", config.limits.timeout.count()},
        {"fuzz", config.fuzz},
        {"max_log_bytes", config.max_log_bytes},
        {"workers", config.workers},
        {"cache_dir", config.cache_dir.string()},
        {"work_dir", config.work_dir.string()},
        {"log_dir", config.log_dir.string()},
        {"checkout_retries", config.checkout_retries},
        {"image_build_retries", config.image_build_retries},
        {"retry_backoff_ms", config.retry_backoff.count()},
        {"stop_grace", config.stop_grace.count()},
        {"allow_network", config.allow_network},
        {"sandbox_user", config.sandbox_user},
        {"runtime", config.runtime == utils::RuntimeKind::PODMAN ? "podman" : "docker"},
        {"default_test_format", config.default_test_format},
        {"run_id", config.run_id}
    };
}

std::string ConfigManager::GenerateRunId() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);

    std::random_device rd;
    std::uniform_int_distribution<int> dis(0, 0xffff);

    std::ostringstream oss;
    oss << "run_" << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << "_"
        << std::hex << std::setw(4) << std::setfill('0') << dis(rd);
    return oss.str();
}

// ============================================================================
// EFFECTIVE LIMITS
// ============================================================================

ResourceLimits EffectiveLimits(const HarnessConfig& config, const InstanceSpec& spec) {
    ResourceLimits limits = config.limits;

    if (spec.limits.memory_mb) limits.memory_mb = *spec.limits.memory_mb;
    if (spec.limits.cpus) limits.cpus = *spec.limits.cpus;
    if (spec.limits.cpu_shares) limits.cpu_shares = *spec.limits.cpu_shares;
    if (spec.limits.timeout) limits.timeout = *spec.limits.timeout;

    return limits;
}

int EffectiveFuzz(const HarnessConfig& config, const InstanceSpec& spec) {
    return spec.limits.fuzz.value_or(config.fuzz);
}

} // namespace core
} // namespace patchbench
