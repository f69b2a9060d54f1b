/**
 * @file json_reporter.hpp
 * @brief Machine-readable instance records and batch summaries
 *
 * Serializes InstanceResult in the stable record schema consumed by
 * evaluation pipelines and aggregates a batch into a summary:
 *
 * ```json
 * {
 *   "instance_id": "astropy__astropy-12907",
 *   "status": "Resolved",
 *   "test_verdicts": {"tests/test_a.py::test_x": "Pass"},
 *   "duration_ms": 48211,
 *   "log_ref": "logs/run_evaluation/run_20250301_101500_3fa2/astropy__astropy-12907",
 *   "timed_out": false
 * }
 * ```
 *
 * A record whose pipeline stopped early also carries
 * `"failure": {"stage": ..., "kind": ..., "cause": ...}`.
 *
 * @date 2025
 */

#pragma once

#include "patchbench/core/instance.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace patchbench {
namespace reporters {

/**
 * @struct RunSummary
 * @brief Status counts over a batch
 */
struct RunSummary {
    std::size_t total{0};
    std::size_t resolved{0};
    std::size_t unresolved{0};
    std::size_t patch_failed{0};
    std::size_t sandbox_error{0};

    /// resolved / total, 0 for an empty batch
    double ResolvedRate() const {
        return total == 0 ? 0.0 : static_cast<double>(resolved) / static_cast<double>(total);
    }

    bool AllResolved() const { return total > 0 && resolved == total; }
};

/**
 * @struct JsonReporterConfig
 * @brief Output formatting
 */
struct JsonReporterConfig {
    bool pretty_print{true};    ///< Indent output
    int indent_size{2};         ///< Indentation spaces
};

/**
 * @class JsonReporter
 * @brief Writes report.json per instance and summary.json per run
 *
 * **Usage Example**:
 * @code
 * JsonReporter reporter;
 * reporter.WriteInstanceReport(result, result.log_ref / "report.json");
 * reporter.WriteSummary(results, run_id, run_dir / "summary.json");
 * @endcode
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    /**
     * @brief Stable record for one instance
     */
    static nlohmann::json ResultToJson(const core::InstanceResult& result);

    static RunSummary Summarize(const std::vector<core::InstanceResult>& results);

    /**
     * @brief Summary counts plus every instance record
     */
    nlohmann::json GenerateSummary(const std::vector<core::InstanceResult>& results,
                                   const std::string& run_id) const;

    bool WriteInstanceReport(const core::InstanceResult& result,
                             const std::filesystem::path& output_path) const;

    bool WriteSummary(const std::vector<core::InstanceResult>& results,
                      const std::string& run_id,
                      const std::filesystem::path& output_path) const;

    /**
     * @brief Multi-line human-readable summary for the console
     */
    static std::string FormatConsoleSummary(const RunSummary& summary);

private:
    bool WriteJson(const nlohmann::json& j, const std::filesystem::path& output_path) const;

    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace patchbench
