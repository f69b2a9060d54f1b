/**
 * @file instance.cpp
 * @brief Status function, retry sleep and enum names for the data model
 *
 * @date 2025
 */

#include "patchbench/core/instance.hpp"

#include <algorithm>
#include <set>
#include <thread>

namespace patchbench {
namespace core {

std::vector<std::string> InstanceSpec::ExpectedTests() const {
    std::vector<std::string> tests;
    std::set<std::string> seen;

    for (const auto* list : {&fail_to_pass, &pass_to_pass}) {
        for (const auto& test : *list) {
            if (seen.insert(test).second) {
                tests.push_back(test);
            }
        }
    }

    return tests;
}

// ============================================================================
// STATUS FUNCTION
// ============================================================================

InstanceStatus ComputeStatus(PatchOutcome patch_outcome, const VerdictMap& verdicts) {
    if (patch_outcome != PatchOutcome::APPLIED) {
        return InstanceStatus::PATCH_FAILED;
    }

    if (verdicts.empty()) {
        return InstanceStatus::UNRESOLVED;
    }

    bool all_pass = std::all_of(verdicts.begin(), verdicts.end(),
        [](const auto& entry) { return entry.second == TestVerdict::PASS; });

    return all_pass ? InstanceStatus::RESOLVED : InstanceStatus::UNRESOLVED;
}

InstanceStatus StatusForFailure(const StageFailure& failure) {
    switch (failure.kind) {
        case FailureKind::PATCH_REJECTED:
        case FailureKind::PATCH_PARTIALLY_APPLIED:
            return InstanceStatus::PATCH_FAILED;
        case FailureKind::TIMEOUT_EXCEEDED:
            return InstanceStatus::UNRESOLVED;
        default:
            return InstanceStatus::SANDBOX_ERROR;
    }
}

// ============================================================================
// RETRY SUPPORT
// ============================================================================

bool SleepUnlessCancelled(std::chrono::milliseconds duration,
                          const utils::CancellationToken* cancel) {
    constexpr std::chrono::milliseconds kSlice{50};
    auto deadline = std::chrono::steady_clock::now() + duration;

    while (std::chrono::steady_clock::now() < deadline) {
        if (cancel && cancel->IsCancelled()) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(kSlice, std::max(remaining, std::chrono::milliseconds(0))));
    }

    return !(cancel && cancel->IsCancelled());
}

// ============================================================================
// NAMES
// ============================================================================

std::string ToString(Stage stage) {
    switch (stage) {
        case Stage::VALIDATION: return "validation";
        case Stage::IMAGE: return "image";
        case Stage::CHECKOUT: return "checkout";
        case Stage::PATCH: return "patch";
        case Stage::TEST_PATCH: return "test_patch";
        case Stage::SANDBOX: return "sandbox";
        case Stage::TEST_RUN: return "test_run";
        case Stage::PARSE: return "parse";
        case Stage::REPORT: return "report";
    }
    return "unknown";
}

std::string ToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::IMAGE_BUILD_FAILED: return "ImageBuildFailed";
        case FailureKind::CHECKOUT_FAILED: return "CheckoutFailed";
        case FailureKind::PATCH_REJECTED: return "PatchRejected";
        case FailureKind::PATCH_PARTIALLY_APPLIED: return "PatchPartiallyApplied";
        case FailureKind::SANDBOX_START_FAILED: return "SandboxStartFailed";
        case FailureKind::TIMEOUT_EXCEEDED: return "TimeoutExceeded";
        case FailureKind::PARSER_FORMAT_ERROR: return "ParserFormatError";
        case FailureKind::INVALID_DEFINITION: return "InvalidDefinition";
        case FailureKind::CANCELLED: return "Cancelled";
        case FailureKind::INTERNAL_ERROR: return "InternalError";
    }
    return "Unknown";
}

std::string ToString(PatchOutcome outcome) {
    switch (outcome) {
        case PatchOutcome::APPLIED: return "Applied";
        case PatchOutcome::REJECTED: return "Rejected";
        case PatchOutcome::PARTIALLY_APPLIED: return "PartiallyApplied";
    }
    return "Unknown";
}

std::string ToString(TestVerdict verdict) {
    switch (verdict) {
        case TestVerdict::PASS: return "Pass";
        case TestVerdict::FAIL: return "Fail";
        case TestVerdict::ERROR: return "Error";
        case TestVerdict::NOT_RUN: return "NotRun";
    }
    return "Unknown";
}

std::string ToString(InstanceStatus status) {
    switch (status) {
        case InstanceStatus::RESOLVED: return "Resolved";
        case InstanceStatus::UNRESOLVED: return "Unresolved";
        case InstanceStatus::PATCH_FAILED: return "PatchFailed";
        case InstanceStatus::SANDBOX_ERROR: return "SandboxError";
    }
    return "Unknown";
}

std::optional<InstanceStatus> ParseInstanceStatus(const std::string& text) {
    if (text == "Resolved") return InstanceStatus::RESOLVED;
    if (text == "Unresolved") return InstanceStatus::UNRESOLVED;
    if (text == "PatchFailed") return InstanceStatus::PATCH_FAILED;
    if (text == "SandboxError") return InstanceStatus::SANDBOX_ERROR;
    return std::nullopt;
}

} // namespace core
} // namespace patchbench
