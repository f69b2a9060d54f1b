/**
 * @file stage_result.hpp
 * @brief Tagged success/failure values passed between pipeline stages
 *
 * Every stage of the instance pipeline returns a StageResult<T>: either the
 * stage's product or a StageFailure naming the stage, the failure kind and a
 * human-readable cause. The orchestrator composes stages by inspecting these
 * values; no stage signals failure by throwing.
 *
 * @date 2025
 */

#pragma once

#include "patchbench/utils/process_utils.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <variant>

namespace patchbench {
namespace core {

/**
 * @enum Stage
 * @brief Pipeline stages, in execution order
 */
enum class Stage {
    VALIDATION,   ///< Instance definition checks
    IMAGE,        ///< Image Cache Manager
    CHECKOUT,     ///< Workspace Builder
    PATCH,        ///< Candidate patch application
    TEST_PATCH,   ///< Test patch application
    SANDBOX,      ///< Container creation and start
    TEST_RUN,     ///< Test command execution
    PARSE,        ///< Result Parser
    REPORT        ///< Artifact and record output
};

/**
 * @enum FailureKind
 * @brief Failure taxonomy
 */
enum class FailureKind {
    IMAGE_BUILD_FAILED,        ///< Image could not be built or pulled
    CHECKOUT_FAILED,           ///< Clone or checkout failed (retryable)
    PATCH_REJECTED,            ///< No hunk applied, or the diff is malformed
    PATCH_PARTIALLY_APPLIED,   ///< Some hunks failed; workspace rolled back
    SANDBOX_START_FAILED,      ///< Container could not be created or started
    TIMEOUT_EXCEEDED,          ///< Test command exceeded the wall clock limit
    PARSER_FORMAT_ERROR,       ///< Test output not recognized
    INVALID_DEFINITION,        ///< Instance definition failed validation
    CANCELLED,                 ///< Cancelled externally
    INTERNAL_ERROR             ///< Unexpected exception inside the harness
};

/**
 * @struct StageFailure
 * @brief Typed failure produced by a stage
 */
struct StageFailure {
    Stage stage{Stage::VALIDATION};              ///< Stage that failed
    FailureKind kind{FailureKind::INTERNAL_ERROR}; ///< Failure classification
    std::string cause;                           ///< Human-readable cause
    bool transient{false};                       ///< Worth retrying (network flake)
};

/// Stage product or typed failure
template <typename T>
using StageResult = std::variant<T, StageFailure>;

/// Product of stages that only succeed or fail
using Done = std::monostate;

template <typename T>
bool Succeeded(const StageResult<T>& result) {
    return std::holds_alternative<T>(result);
}

template <typename T>
const StageFailure& FailureOf(const StageResult<T>& result) {
    return std::get<StageFailure>(result);
}

template <typename T>
T& ValueOf(StageResult<T>& result) {
    return std::get<T>(result);
}

inline StageFailure MakeFailure(Stage stage, FailureKind kind, std::string cause,
                                bool transient = false) {
    return StageFailure{stage, kind, std::move(cause), transient};
}

std::string ToString(Stage stage);
std::string ToString(FailureKind kind);

/**
 * @struct RetryPolicy
 * @brief Bounded retry with exponential backoff
 *
 * Attempt n (0-based) waits backoff * 2^n before the next attempt.
 */
struct RetryPolicy {
    int max_retries{0};                          ///< Retries after the first attempt
    std::chrono::milliseconds backoff{1000};     ///< Initial delay
};

/**
 * @brief Sleep for the given duration, waking early on cancellation
 * @return false if cancelled while waiting
 */
bool SleepUnlessCancelled(std::chrono::milliseconds duration,
                          const utils::CancellationToken* cancel);

/**
 * @brief Run a stage, retrying transient failures per policy
 *
 * Non-transient failures and successes return immediately. A cancellation
 * during backoff returns the last failure.
 */
template <typename Fn>
auto RetryTransient(const RetryPolicy& policy, const utils::CancellationToken* cancel, Fn&& fn)
    -> decltype(fn(0)) {
    auto result = fn(0);

    for (int attempt = 1; attempt <= policy.max_retries; ++attempt) {
        if (result.index() == 0 || !std::get<StageFailure>(result).transient) {
            break;
        }

        auto delay = policy.backoff * (1 << (attempt - 1));
        if (!SleepUnlessCancelled(delay, cancel)) {
            break;
        }
        result = fn(attempt);
    }

    return result;
}

} // namespace core
} // namespace patchbench
