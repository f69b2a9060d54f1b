/**
 * @file result_parser.hpp
 * @brief Test output parser producing per-test verdicts
 *
 * Interprets the captured output of a test command according to the
 * repository's test output format and maps every expected test identifier
 * to a verdict. Expected tests missing from recognized output are ERROR
 * (the run crashed before reporting them). Output in which the format is
 * not recognized at all is a PARSER_FORMAT_ERROR; verdicts are never
 * guessed.
 *
 * @date 2025
 */

#pragma once

#include "patchbench/core/instance.hpp"
#include "patchbench/core/stage_result.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace patchbench {
namespace parsers {

/**
 * @struct ObservedResults
 * @brief What a format parser found in the output
 */
struct ObservedResults {
    std::map<std::string, core::TestVerdict> tests;  ///< Reported tests
    bool format_marker{false};                       ///< Banner/summary/plan seen
    int result_lines{0};                             ///< Lines that carried a result

    bool Recognized() const { return format_marker || result_lines > 0; }
};

/**
 * @class ResultParser
 * @brief Line-oriented parser for common test runner formats
 *
 * **Formats**:
 * - `pytest`: `-rA` summary lines (`PASSED tests/t.py::test_a`) and verbose
 *   lines (`tests/t.py::test_a PASSED [ 50%]`)
 * - `django`: `test_a (app.tests.Case) ... ok`
 * - `googletest`: `[       OK ] Suite.Name (0 ms)`
 * - `tap`: `ok 1 - name`, `not ok 2 - name # SKIP`
 * - `simple`: `name: pass|fail|error|skip`
 *
 * **Usage Example**:
 * @code
 * ResultParser parser;
 * auto parsed = parser.Parse(raw_output, spec.ExpectedTests(), "pytest");
 * if (core::Succeeded(parsed)) {
 *     for (const auto& [test, verdict] : core::ValueOf(parsed)) {
 *         spdlog::info("{}: {}", test, core::ToString(verdict));
 *     }
 * }
 * @endcode
 */
class ResultParser {
public:
    /// Lines longer than this carry no result and are skipped before matching
    static constexpr std::size_t kMaxResultLineLength = 4096;

    ResultParser();

    /**
     * @brief Map expected tests to verdicts
     *
     * stdout and stderr are both scanned. When expected_tests is empty every
     * reported test is returned.
     */
    core::StageResult<core::VerdictMap> Parse(const core::RawExecutionOutput& output,
                                              const std::vector<std::string>& expected_tests,
                                              const std::string& format) const;

    /**
     * @brief Run one format's line parser over text
     * @return nullopt for an unknown format name
     */
    std::optional<ObservedResults> Observe(const std::string& text, const std::string& format) const;

    static bool IsSupportedFormat(const std::string& format);
    static std::vector<std::string> SupportedFormats();

private:
    ObservedResults ParsePytest(const std::vector<std::string>& lines) const;
    ObservedResults ParseDjango(const std::vector<std::string>& lines) const;
    ObservedResults ParseGoogleTest(const std::vector<std::string>& lines) const;
    ObservedResults ParseTap(const std::vector<std::string>& lines) const;
    ObservedResults ParseSimple(const std::vector<std::string>& lines) const;

    static void Record(ObservedResults& results, const std::string& test, core::TestVerdict verdict);
};

} // namespace parsers
} // namespace patchbench
