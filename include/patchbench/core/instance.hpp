/**
 * @file instance.hpp
 * @brief Data model for one unit of evaluation
 *
 * An instance is a (repository, base commit, patch, test command) tuple.
 * InstanceSpec describes the work, the intermediate records describe each
 * stage's outcome, and InstanceResult is the single terminal record produced
 * for every submitted spec.
 *
 * @date 2025
 */

#pragma once

#include "patchbench/core/stage_result.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace patchbench {
namespace core {

// ============================================================================
// INSTANCE DEFINITION
// ============================================================================

/**
 * @struct ResourceLimits
 * @brief Resource ceilings for one sandbox
 */
struct ResourceLimits {
    std::size_t memory_mb{4096};           ///< Memory ceiling (MiB), swap disabled
    double cpus{2.0};                      ///< CPU ceiling (cores)
    int cpu_shares{1024};                  ///< Relative CPU weight
    std::chrono::seconds timeout{1800};    ///< Wall clock limit for the test command
};

/**
 * @struct LimitOverrides
 * @brief Per-instance overrides of the configured defaults
 */
struct LimitOverrides {
    std::optional<std::size_t> memory_mb;
    std::optional<double> cpus;
    std::optional<int> cpu_shares;
    std::optional<std::chrono::seconds> timeout;
    std::optional<int> fuzz;
};

/**
 * @struct ImageSpec
 * @brief Base image specification
 *
 * With an empty dockerfile the base tag is used as-is. Otherwise the image
 * is built from the dockerfile text and tagged by content hash.
 */
struct ImageSpec {
    std::string base;         ///< Base image tag
    std::string dockerfile;   ///< Dockerfile text, may be empty
};

/**
 * @struct InstanceSpec
 * @brief Immutable description of one unit of work
 */
struct InstanceSpec {
    std::string instance_id;                 ///< owner__repo-number
    std::string repo;                        ///< owner/name, URL or local path
    std::string base_commit;                 ///< Commit to check out
    std::string patch;                       ///< Candidate patch (unified diff)
    std::string test_patch;                  ///< Optional test patch, applied second
    ImageSpec image;                         ///< Environment image
    std::string test_cmd;                    ///< Command run inside the sandbox
    std::string test_format;                 ///< Result Parser format name
    std::vector<std::string> fail_to_pass;   ///< Tests the patch must fix
    std::vector<std::string> pass_to_pass;   ///< Tests that must keep passing
    LimitOverrides limits;                   ///< Per-instance overrides

    /**
     * @brief FAIL_TO_PASS followed by PASS_TO_PASS, duplicates dropped
     */
    std::vector<std::string> ExpectedTests() const;
};

// ============================================================================
// STAGE RECORDS
// ============================================================================

/**
 * @enum PatchOutcome
 * @brief Outcome tag of a patch application
 */
enum class PatchOutcome {
    APPLIED,             ///< Every hunk applied
    REJECTED,            ///< Nothing applied (or the diff is unusable)
    PARTIALLY_APPLIED    ///< Some hunks failed; rolled back
};

/**
 * @struct PatchApplicationResult
 * @brief Outcome of applying one diff to a workspace
 *
 * For REJECTED and PARTIALLY_APPLIED the workspace is byte-identical to its
 * state before the attempt and modified_files is empty.
 */
struct PatchApplicationResult {
    PatchOutcome outcome{PatchOutcome::REJECTED};  ///< Outcome tag
    std::string reason;                            ///< Why it was not applied
    std::vector<std::string> rejected_hunks;       ///< "file @@ -a,b +c,d @@: reason"
    int applied_hunks{0};                          ///< Hunks that matched
    int total_hunks{0};                            ///< Hunks in the diff
    std::vector<std::filesystem::path> modified_files;  ///< Relative paths now changed

    bool Applied() const { return outcome == PatchOutcome::APPLIED; }
};

/**
 * @struct RawExecutionOutput
 * @brief Captured result of the test command
 */
struct RawExecutionOutput {
    std::string stdout_output;                 ///< Bounded stdout
    std::string stderr_output;                 ///< Bounded stderr
    int exit_code{-1};                         ///< Exit status
    std::chrono::milliseconds duration{0};     ///< Wall clock
    bool timed_out{false};                     ///< Killed by the deadline
    bool truncated{false};                     ///< Output hit the size ceiling
};

/**
 * @enum TestVerdict
 * @brief Per-test classification
 */
enum class TestVerdict {
    PASS,      ///< Test passed
    FAIL,      ///< Test failed (or timed out)
    ERROR,     ///< Errored or never reported
    NOT_RUN    ///< Skipped
};

using VerdictMap = std::map<std::string, TestVerdict>;

// ============================================================================
// TERMINAL RECORD
// ============================================================================

/**
 * @enum InstanceStatus
 * @brief Overall instance outcome
 */
enum class InstanceStatus {
    RESOLVED,       ///< Every expected test passed
    UNRESOLVED,     ///< Tests ran but at least one did not pass
    PATCH_FAILED,   ///< A patch did not apply; tests never ran
    SANDBOX_ERROR   ///< Infrastructure failure
};

/**
 * @struct InstanceResult
 * @brief Exactly one per submitted InstanceSpec
 */
struct InstanceResult {
    std::string instance_id;                     ///< Instance identifier
    InstanceStatus status{InstanceStatus::SANDBOX_ERROR};  ///< Overall status
    VerdictMap test_verdicts;                    ///< Per-test verdicts
    std::chrono::milliseconds duration{0};       ///< End-to-end wall clock
    std::filesystem::path log_ref;               ///< Per-instance artifact directory
    std::optional<StageFailure> failure;         ///< Set when a stage failed
    bool timed_out{false};                       ///< Test command hit the deadline
};

// ============================================================================
// STATUS FUNCTION
// ============================================================================

/**
 * @brief Overall status from the patch outcome and verdicts
 *
 * PATCH_FAILED unless the patch applied; otherwise RESOLVED iff the verdict
 * map is non-empty and every verdict is PASS.
 */
InstanceStatus ComputeStatus(PatchOutcome patch_outcome, const VerdictMap& verdicts);

/**
 * @brief Status for a pipeline that stopped at a failure
 */
InstanceStatus StatusForFailure(const StageFailure& failure);

std::string ToString(PatchOutcome outcome);
std::string ToString(TestVerdict verdict);
std::string ToString(InstanceStatus status);

std::optional<InstanceStatus> ParseInstanceStatus(const std::string& text);

} // namespace core
} // namespace patchbench
