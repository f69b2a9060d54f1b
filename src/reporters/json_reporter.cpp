/**
 * @file json_reporter.cpp
 * @brief Instance records and batch summaries as JSON
 *
 * **summary.json**:
 * ```json
 * {
 *   "run_id": "run_20250301_101500_3fa2",
 *   "generated_at": "2025-03-01T10:22:41Z",
 *   "total": 3, "resolved": 1, "unresolved": 1, "patch_failed": 1, "sandbox_error": 0,
 *   "resolved_rate": 0.3333,
 *   "resolved_ids": ["..."], "unresolved_ids": ["..."],
 *   "patch_failed_ids": ["..."], "error_ids": [],
 *   "instances": [ { ...record... } ]
 * }
 * ```
 *
 * @date 2025
 */

#include "patchbench/reporters/json_reporter.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace patchbench {
namespace reporters {

namespace {

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // anonymous namespace

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
    spdlog::debug("JSON Reporter initialized");
}

// ============================================================================
// RECORDS
// ============================================================================

json JsonReporter::ResultToJson(const core::InstanceResult& result) {
    json verdicts = json::object();
    for (const auto& [test, verdict] : result.test_verdicts) {
        verdicts[test] = core::ToString(verdict);
    }

    json j = {
        {"instance_id", result.instance_id},
        {"status", core::ToString(result.status)},
        {"test_verdicts", verdicts},
        {"duration_ms", result.duration.count()},
        {"log_ref", result.log_ref.string()},
        {"timed_out", result.timed_out}
    };

    if (result.failure) {
        j["failure"] = {
            {"stage", core::ToString(result.failure->stage)},
            {"kind", core::ToString(result.failure->kind)},
            {"cause", result.failure->cause}
        };
    }

    return j;
}

RunSummary JsonReporter::Summarize(const std::vector<core::InstanceResult>& results) {
    RunSummary summary;
    summary.total = results.size();

    for (const auto& result : results) {
        switch (result.status) {
            case core::InstanceStatus::RESOLVED: summary.resolved++; break;
            case core::InstanceStatus::UNRESOLVED: summary.unresolved++; break;
            case core::InstanceStatus::PATCH_FAILED: summary.patch_failed++; break;
            case core::InstanceStatus::SANDBOX_ERROR: summary.sandbox_error++; break;
        }
    }

    return summary;
}

json JsonReporter::GenerateSummary(const std::vector<core::InstanceResult>& results,
                                   const std::string& run_id) const {
    RunSummary summary = Summarize(results);

    json resolved_ids = json::array();
    json unresolved_ids = json::array();
    json patch_failed_ids = json::array();
    json error_ids = json::array();
    json instances = json::array();

    for (const auto& result : results) {
        switch (result.status) {
            case core::InstanceStatus::RESOLVED: resolved_ids.push_back(result.instance_id); break;
            case core::InstanceStatus::UNRESOLVED: unresolved_ids.push_back(result.instance_id); break;
            case core::InstanceStatus::PATCH_FAILED: patch_failed_ids.push_back(result.instance_id); break;
            case core::InstanceStatus::SANDBOX_ERROR: error_ids.push_back(result.instance_id); break;
        }
        instances.push_back(ResultToJson(result));
    }

    return {
        {"run_id", run_id},
        {"generated_at", FormatTimestamp(std::chrono::system_clock::now())},
        {"total", summary.total},
        {"resolved", summary.resolved},
        {"unresolved", summary.unresolved},
        {"patch_failed", summary.patch_failed},
        {"sandbox_error", summary.sandbox_error},
        {"resolved_rate", summary.ResolvedRate()},
        {"resolved_ids", resolved_ids},
        {"unresolved_ids", unresolved_ids},
        {"patch_failed_ids", patch_failed_ids},
        {"error_ids", error_ids},
        {"instances", instances}
    };
}

// ============================================================================
// OUTPUT
// ============================================================================

bool JsonReporter::WriteInstanceReport(const core::InstanceResult& result,
                                       const std::filesystem::path& output_path) const {
    return WriteJson(ResultToJson(result), output_path);
}

bool JsonReporter::WriteSummary(const std::vector<core::InstanceResult>& results,
                                const std::string& run_id,
                                const std::filesystem::path& output_path) const {
    if (!WriteJson(GenerateSummary(results, run_id), output_path)) {
        return false;
    }

    spdlog::info("Summary written to: {}", output_path.string());
    return true;
}

bool JsonReporter::WriteJson(const json& j, const std::filesystem::path& output_path) const {
    try {
        if (output_path.has_parent_path()) {
            std::filesystem::create_directories(output_path.parent_path());
        }

        std::ofstream file(output_path, std::ios::trunc);
        if (!file) {
            spdlog::error("Cannot open {} for writing", output_path.string());
            return false;
        }

        file << (config_.pretty_print ? j.dump(config_.indent_size) : j.dump()) << "\n";
        if (!file) {
            spdlog::error("Failed writing {}", output_path.string());
            return false;
        }
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to write JSON report {}: {}", output_path.string(), e.what());
        return false;
    }
}

std::string JsonReporter::FormatConsoleSummary(const RunSummary& summary) {
    std::ostringstream oss;
    oss << "Total instances: " << summary.total << "\n"
        << "  Resolved:      " << summary.resolved << "\n"
        << "  Unresolved:    " << summary.unresolved << "\n"
        << "  Patch failed:  " << summary.patch_failed << "\n"
        << "  Sandbox error: " << summary.sandbox_error << "\n"
        << "Resolved rate:   " << std::fixed << std::setprecision(2)
        << summary.ResolvedRate() * 100.0 << "%";
    return oss.str();
}

} // namespace reporters
} // namespace patchbench
