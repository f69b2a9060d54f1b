/**
 * @file test_runner.hpp
 * @brief Test command invocation inside a sandbox
 *
 * @date 2025
 */

#pragma once

#include "patchbench/core/instance.hpp"
#include "patchbench/core/sandbox_engine.hpp"
#include "patchbench/core/stage_result.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace patchbench {
namespace core {

/**
 * @struct TestRunOptions
 * @brief Deadline and capture limits for one test run
 */
struct TestRunOptions {
    std::chrono::seconds timeout{1800};                 ///< Wall clock limit
    std::size_t max_output_bytes{10 * 1024 * 1024};     ///< Per stream ceiling
    const utils::CancellationToken* cancel{nullptr};    ///< Instance cancellation
    std::map<std::string, std::string> environment;     ///< Extra environment
};

/**
 * @class TestRunner
 * @brief Runs the test command and captures bounded output
 *
 * A timeout is a normal outcome (RawExecutionOutput::timed_out), not a
 * failure. Cancellation and a sandbox that refuses the command are
 * failures.
 */
class TestRunner {
public:
    TestRunner() = default;

    StageResult<RawExecutionOutput> Run(SandboxHandle& sandbox,
                                        const std::string& test_command,
                                        const TestRunOptions& options) const;

    /**
     * @brief argv for a shell test command: bash -lc <command>
     */
    static std::vector<std::string> BuildCommand(const std::string& test_command);
};

} // namespace core
} // namespace patchbench
