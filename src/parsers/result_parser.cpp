/**
 * @file result_parser.cpp
 * @brief Test runner output parsing
 *
 * **pytest Output**:
 * ```
 * ============================= test session starts ==============================
 * tests/test_math.py::test_add PASSED                                      [ 50%]
 * tests/test_math.py::test_div FAILED                                      [100%]
 * =========================== short test summary info ============================
 * PASSED tests/test_math.py::test_add
 * FAILED tests/test_math.py::test_div - ZeroDivisionError
 * ```
 *
 * **Django Output**:
 * ```
 * test_login (auth_tests.test_views.LoginTest) ... ok
 * test_logout (auth_tests.test_views.LoginTest) ... FAIL
 * Ran 2 tests in 0.120s
 * ```
 *
 * **Verdict Merging**: a test reported more than once keeps its worst
 * verdict (a pytest teardown ERROR after PASSED is an ERROR).
 *
 * @date 2025
 */

#include "patchbench/parsers/result_parser.hpp"
#include "patchbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <regex>

namespace patchbench {
namespace parsers {

using core::TestVerdict;
using utils::StringUtils;

namespace {

int Severity(TestVerdict verdict) {
    switch (verdict) {
        case TestVerdict::NOT_RUN: return 0;
        case TestVerdict::PASS: return 1;
        case TestVerdict::FAIL: return 2;
        case TestVerdict::ERROR: return 3;
    }
    return 0;
}

TestVerdict FromPytestStatus(const std::string& status) {
    if (status == "PASSED" || status == "XFAIL" || status == "XPASS") return TestVerdict::PASS;
    if (status == "FAILED") return TestVerdict::FAIL;
    if (status == "SKIPPED") return TestVerdict::NOT_RUN;
    return TestVerdict::ERROR;
}

} // anonymous namespace

ResultParser::ResultParser() {
    spdlog::debug("Result parser initialized");
}

std::vector<std::string> ResultParser::SupportedFormats() {
    return {"pytest", "django", "googletest", "tap", "simple"};
}

bool ResultParser::IsSupportedFormat(const std::string& format) {
    for (const auto& known : SupportedFormats()) {
        if (known == format) return true;
    }
    return false;
}

// ============================================================================
// ENTRY POINTS
// ============================================================================

core::StageResult<core::VerdictMap> ResultParser::Parse(const core::RawExecutionOutput& output,
                                                        const std::vector<std::string>& expected_tests,
                                                        const std::string& format) const {
    std::string text = output.stdout_output;
    if (!output.stderr_output.empty()) {
        text += "\n" + output.stderr_output;
    }

    auto observed = Observe(text, format);
    if (!observed) {
        return core::MakeFailure(core::Stage::PARSE, core::FailureKind::PARSER_FORMAT_ERROR,
                                 "unknown test output format '" + format + "'");
    }

    if (!observed->Recognized()) {
        return core::MakeFailure(core::Stage::PARSE, core::FailureKind::PARSER_FORMAT_ERROR,
                                 "test output not recognized as " + format + " (exit code " +
                                 std::to_string(output.exit_code) + ")");
    }

    core::VerdictMap verdicts;

    if (expected_tests.empty()) {
        verdicts = observed->tests;
    } else {
        int missing = 0;
        for (const auto& test : expected_tests) {
            auto it = observed->tests.find(test);
            if (it != observed->tests.end()) {
                verdicts[test] = it->second;
            } else {
                verdicts[test] = TestVerdict::ERROR;
                missing++;
            }
        }
        if (missing > 0) {
            spdlog::debug("{} expected test(s) absent from output", missing);
        }
    }

    spdlog::debug("Parsed {} verdict(s) from {} reported test(s) ({})",
                  verdicts.size(), observed->tests.size(), format);
    return verdicts;
}

std::optional<ObservedResults> ResultParser::Observe(const std::string& text, const std::string& format) const {
    // std::regex recurses per character; an unbounded line exhausts the stack
    std::vector<std::string> lines;
    std::size_t skipped = 0;
    for (auto& line : StringUtils::SplitLines(text)) {
        if (line.size() > kMaxResultLineLength) {
            skipped++;
            continue;
        }
        lines.push_back(std::move(line));
    }
    if (skipped > 0) {
        spdlog::debug("Skipped {} output line(s) longer than {} bytes", skipped, kMaxResultLineLength);
    }

    if (format == "pytest") return ParsePytest(lines);
    if (format == "django") return ParseDjango(lines);
    if (format == "googletest") return ParseGoogleTest(lines);
    if (format == "tap") return ParseTap(lines);
    if (format == "simple") return ParseSimple(lines);

    return std::nullopt;
}

void ResultParser::Record(ObservedResults& results, const std::string& test, TestVerdict verdict) {
    results.result_lines++;

    auto it = results.tests.find(test);
    if (it == results.tests.end() || Severity(verdict) > Severity(it->second)) {
        results.tests[test] = verdict;
    }
}

// ============================================================================
// FORMAT PARSERS
// ============================================================================

ObservedResults ResultParser::ParsePytest(const std::vector<std::string>& lines) const {
    static const std::regex summary_regex(R"(^(PASSED|FAILED|ERROR|SKIPPED|XFAIL|XPASS) (\S.*?)(?: - .*)?$)");
    static const std::regex verbose_regex(
        R"(^(\S.*?::\S.*?) (PASSED|FAILED|ERROR|SKIPPED|XFAIL|XPASS)(?:\s+\[\s*\d+%\])?\s*$)");
    static const std::regex marker_regex(
        R"(^=+ (test session starts|short test summary info|.*\b(passed|failed|errors?|skipped|no tests ran)\b.*) =+$)");

    ObservedResults results;

    for (const auto& raw : lines) {
        std::string line = StringUtils::TrimRight(raw);
        std::smatch match;

        if (std::regex_match(line, match, marker_regex)) {
            results.format_marker = true;
            continue;
        }

        if (std::regex_match(line, match, summary_regex)) {
            // "SKIPPED [1] file.py:12: reason" names no test id
            std::string test = match[2].str();
            if (!StringUtils::StartsWith(test, "[")) {
                Record(results, test, FromPytestStatus(match[1].str()));
            }
            continue;
        }

        if (std::regex_match(line, match, verbose_regex)) {
            Record(results, match[1].str(), FromPytestStatus(match[2].str()));
        }
    }

    return results;
}

ObservedResults ResultParser::ParseDjango(const std::vector<std::string>& lines) const {
    static const std::regex result_regex(
        R"(^(\w+ \([\w.]+\)).*? \.\.\. (ok|OK|FAIL|ERROR|skipped.*|expected failure|unexpected success)\s*$)");
    static const std::regex section_regex(R"(^(FAIL|ERROR): (\w+ \([\w.]+\)))");
    static const std::regex marker_regex(R"(^Ran \d+ tests? in )");

    ObservedResults results;

    for (const auto& raw : lines) {
        std::string line = StringUtils::TrimRight(raw);
        std::smatch match;

        if (std::regex_search(line, match, marker_regex)) {
            results.format_marker = true;
            continue;
        }

        if (std::regex_match(line, match, result_regex)) {
            std::string status = match[2].str();
            TestVerdict verdict = TestVerdict::PASS;
            if (status == "FAIL" || status == "unexpected success") verdict = TestVerdict::FAIL;
            else if (status == "ERROR") verdict = TestVerdict::ERROR;
            else if (StringUtils::StartsWith(status, "skipped")) verdict = TestVerdict::NOT_RUN;
            Record(results, match[1].str(), verdict);
            continue;
        }

        if (std::regex_search(line, match, section_regex)) {
            Record(results, match[2].str(),
                   match[1].str() == "FAIL" ? TestVerdict::FAIL : TestVerdict::ERROR);
        }
    }

    return results;
}

ObservedResults ResultParser::ParseGoogleTest(const std::vector<std::string>& lines) const {
    static const std::regex result_regex(R"(^\[\s+(OK|FAILED|SKIPPED)\s+\]\s+([\w/]+\.[\w/]+)(?:, where .*)?(?: \(\d+ ms\))?\s*$)");
    static const std::regex run_regex(R"(^\[\s+RUN\s+\]\s+([\w/]+\.[\w/]+)\s*$)");

    ObservedResults results;
    std::map<std::string, bool> started;

    for (const auto& raw : lines) {
        std::string line = StringUtils::TrimRight(raw);
        std::smatch match;

        if (StringUtils::StartsWith(line, "[==========]")) {
            results.format_marker = true;
            continue;
        }

        if (std::regex_match(line, match, run_regex)) {
            started[match[1].str()] = true;
            continue;
        }

        if (std::regex_match(line, match, result_regex)) {
            std::string status = match[1].str();
            TestVerdict verdict = status == "OK" ? TestVerdict::PASS
                                : status == "SKIPPED" ? TestVerdict::NOT_RUN
                                : TestVerdict::FAIL;
            Record(results, match[2].str(), verdict);
            started.erase(match[2].str());
        }
    }

    // Started but never finished: the binary died mid-test
    for (const auto& entry : started) {
        Record(results, entry.first, TestVerdict::ERROR);
    }

    return results;
}

ObservedResults ResultParser::ParseTap(const std::vector<std::string>& lines) const {
    static const std::regex result_regex(
        R"(^\s*(not ok|ok)\b\s*\d*\s*(?:-\s*)?([^#]*?)\s*(?:#\s*(SKIP|TODO)\b.*)?$)",
        std::regex::icase);
    static const std::regex plan_regex(R"(^\s*1\.\.\d+)");

    ObservedResults results;

    for (const auto& raw : lines) {
        std::string line = StringUtils::TrimRight(raw);
        std::smatch match;

        if (StringUtils::StartsWith(line, "TAP version") || std::regex_search(line, match, plan_regex)) {
            results.format_marker = true;
            continue;
        }

        if (std::regex_match(line, match, result_regex)) {
            std::string name = match[2].str();
            if (name.empty()) continue;

            std::string directive = StringUtils::ToLower(match[3].str());
            bool ok = StringUtils::ToLower(match[1].str()) == "ok";

            TestVerdict verdict = ok ? TestVerdict::PASS : TestVerdict::FAIL;
            if (directive == "skip" || (directive == "todo" && !ok)) {
                verdict = TestVerdict::NOT_RUN;
            }
            Record(results, name, verdict);
        }
    }

    return results;
}

ObservedResults ResultParser::ParseSimple(const std::vector<std::string>& lines) const {
    static const std::regex result_regex(
        R"(^\s*(\S.*?)\s*:\s*(pass|passed|ok|fail|failed|error|skip|skipped)\s*$)",
        std::regex::icase);

    ObservedResults results;

    for (const auto& line : lines) {
        std::smatch match;
        if (!std::regex_match(line, match, result_regex)) {
            continue;
        }

        std::string status = StringUtils::ToLower(match[2].str());
        TestVerdict verdict = TestVerdict::PASS;
        if (status == "fail" || status == "failed") verdict = TestVerdict::FAIL;
        else if (status == "error") verdict = TestVerdict::ERROR;
        else if (status == "skip" || status == "skipped") verdict = TestVerdict::NOT_RUN;

        Record(results, match[1].str(), verdict);
    }

    return results;
}

} // namespace parsers
} // namespace patchbench
