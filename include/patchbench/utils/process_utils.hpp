/**
 * @file process_utils.hpp
 * @brief Child process execution with deadlines and bounded output capture
 *
 * Every external tool patchbench drives (the container CLI, git) runs through
 * RunProcess(). The child is placed in its own process group so a deadline or
 * cancellation can terminate the whole tree (SIGTERM, then SIGKILL after a
 * grace period). stdout and stderr are drained concurrently through poll()
 * into bounded buffers, so runaway output can neither block the child on a
 * full pipe nor grow memory without limit.
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace patchbench {
namespace utils {

/**
 * @class CancellationToken
 * @brief Cooperative cancellation flag, optionally chained to a parent
 *
 * A token reports cancelled when it or any ancestor has been cancelled.
 * Cancel() is a single atomic store and is safe to call from a signal
 * handler. The parent must outlive the child token.
 */
class CancellationToken {
public:
    explicit CancellationToken(const CancellationToken* parent = nullptr) noexcept
        : parent_(parent) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void Cancel() noexcept { cancelled_.store(true); }

    bool IsCancelled() const noexcept {
        return cancelled_.load() || (parent_ != nullptr && parent_->IsCancelled());
    }

private:
    const CancellationToken* parent_;
    std::atomic<bool> cancelled_{false};
};

/**
 * @class BoundedBuffer
 * @brief Append-only text buffer with a hard size ceiling
 *
 * Once the ceiling is reached further input is discarded and a single
 * truncation marker is appended. A ceiling of 0 means unlimited.
 */
class BoundedBuffer {
public:
    explicit BoundedBuffer(std::size_t max_bytes) : max_bytes_(max_bytes) {}

    void Append(const char* data, std::size_t size);

    bool Truncated() const { return truncated_; }
    std::size_t DiscardedBytes() const { return discarded_; }

    /**
     * @brief Buffered text, with the truncation marker if input was cut
     */
    std::string Take();

private:
    std::size_t max_bytes_;
    std::string data_;
    bool truncated_{false};
    std::size_t discarded_{0};
};

/**
 * @struct ProcessOptions
 * @brief Execution parameters for RunProcess()
 */
struct ProcessOptions {
    std::filesystem::path working_dir;                    ///< Empty = inherit
    std::map<std::string, std::string> environment;       ///< Added to inherited env
    std::chrono::milliseconds timeout{0};                 ///< 0 = no deadline
    std::chrono::milliseconds kill_grace{2000};           ///< SIGTERM -> SIGKILL delay
    std::size_t max_output_bytes{10 * 1024 * 1024};       ///< Per stream, 0 = unlimited
    const CancellationToken* cancel{nullptr};             ///< Optional cancellation
};

/**
 * @struct ProcessResult
 * @brief Outcome of a child process
 */
struct ProcessResult {
    int exit_code{-1};              ///< Exit status, 128+N when killed by signal N
    int term_signal{0};             ///< Terminating signal, 0 on normal exit
    std::string stdout_output;      ///< Captured stdout (bounded)
    std::string stderr_output;      ///< Captured stderr (bounded)
    bool stdout_truncated{false};   ///< stdout hit the size ceiling
    bool stderr_truncated{false};   ///< stderr hit the size ceiling
    bool timed_out{false};          ///< Killed because the deadline passed
    bool cancelled{false};          ///< Killed because the token was cancelled
    bool spawn_failed{false};       ///< fork/exec failed; see error_message
    std::string error_message;      ///< Spawn failure description
    std::chrono::milliseconds duration{0};  ///< Wall-clock runtime

    /**
     * @brief True when the process ran to completion with exit status 0
     */
    bool Succeeded() const {
        return !spawn_failed && !timed_out && !cancelled && exit_code == 0;
    }
};

/**
 * @brief Run a program and capture its output
 *
 * argv[0] is resolved through PATH. No shell is involved, so arguments need
 * no quoting. stdin is connected to /dev/null.
 *
 * @param argv Program and arguments (must not be empty)
 * @param options Deadline, capture limits, cancellation, cwd and environment
 * @return ProcessResult; never throws for child failures
 *
 * @throws std::invalid_argument if argv is empty
 */
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const ProcessOptions& options = ProcessOptions{});

/**
 * @brief Check whether a program can be found on PATH
 */
bool IsProgramAvailable(const std::string& program);

/**
 * @brief Render argv as a shell-like string for logging
 */
std::string FormatCommandLine(const std::vector<std::string>& argv);

} // namespace utils
} // namespace patchbench
