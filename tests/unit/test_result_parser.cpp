#include <gtest/gtest.h>

#include "patchbench/parsers/result_parser.hpp"

namespace patchbench {
namespace {

using core::TestVerdict;
using parsers::ResultParser;

core::RawExecutionOutput Output(const std::string& stdout_text, int exit_code = 0) {
    core::RawExecutionOutput output;
    output.stdout_output = stdout_text;
    output.exit_code = exit_code;
    return output;
}

class ResultParserTest : public ::testing::Test {
protected:
    ResultParser parser_;
};

// ============================================================================
// pytest
// ============================================================================

TEST_F(ResultParserTest, PytestSummaryAndVerboseLines) {
    const std::string text =
        "============================= test session starts ==============================\n"
        "tests/test_math.py::test_add PASSED                                      [ 33%]\n"
        "tests/test_math.py::test_div FAILED                                      [ 66%]\n"
        "tests/test_math.py::test_skip SKIPPED                                    [100%]\n"
        "=========================== short test summary info ============================\n"
        "FAILED tests/test_math.py::test_div - ZeroDivisionError: division by zero\n"
        "========================= 1 failed, 1 passed, 1 skipped in 0.12s ===============\n";

    auto parsed = parser_.Parse(Output(text, 1),
                                {"tests/test_math.py::test_add", "tests/test_math.py::test_div",
                                 "tests/test_math.py::test_skip"},
                                "pytest");

    ASSERT_TRUE(core::Succeeded(parsed));
    auto& verdicts = core::ValueOf(parsed);
    EXPECT_EQ(verdicts["tests/test_math.py::test_add"], TestVerdict::PASS);
    EXPECT_EQ(verdicts["tests/test_math.py::test_div"], TestVerdict::FAIL);
    EXPECT_EQ(verdicts["tests/test_math.py::test_skip"], TestVerdict::NOT_RUN);
}

TEST_F(ResultParserTest, PytestTeardownErrorOverridesPass) {
    const std::string text =
        "tests/t.py::test_a PASSED\n"
        "ERROR tests/t.py::test_a - RuntimeError: teardown\n";

    auto observed = parser_.Observe(text, "pytest");

    ASSERT_TRUE(observed.has_value());
    EXPECT_EQ(observed->tests["tests/t.py::test_a"], TestVerdict::ERROR);
}

TEST_F(ResultParserTest, ExpectedTestMissingFromOutputIsError) {
    const std::string text = "PASSED tests/t.py::test_a\n";

    auto parsed = parser_.Parse(Output(text), {"tests/t.py::test_a", "tests/t.py::test_b"}, "pytest");

    ASSERT_TRUE(core::Succeeded(parsed));
    auto& verdicts = core::ValueOf(parsed);
    EXPECT_EQ(verdicts.size(), 2u);
    EXPECT_EQ(verdicts["tests/t.py::test_b"], TestVerdict::ERROR);
}

TEST_F(ResultParserTest, UnexpectedTestsAreIgnoredWhenExpectationsGiven) {
    const std::string text =
        "PASSED tests/t.py::test_a\n"
        "FAILED tests/t.py::test_unrelated\n";

    auto parsed = parser_.Parse(Output(text), {"tests/t.py::test_a"}, "pytest");

    ASSERT_TRUE(core::Succeeded(parsed));
    EXPECT_EQ(core::ValueOf(parsed).size(), 1u);
}

TEST_F(ResultParserTest, EmptyExpectationsReturnEverythingObserved) {
    auto parsed = parser_.Parse(Output("PASSED a.py::x\nFAILED a.py::y\n"), {}, "pytest");

    ASSERT_TRUE(core::Succeeded(parsed));
    EXPECT_EQ(core::ValueOf(parsed).size(), 2u);
}

// ============================================================================
// Other Formats
// ============================================================================

TEST_F(ResultParserTest, Django) {
    const std::string text =
        "test_login (auth_tests.test_views.LoginTest) ... ok\n"
        "test_logout (auth_tests.test_views.LoginTest) ... FAIL\n"
        "test_slow (auth_tests.test_views.LoginTest) ... skipped 'slow'\n"
        "----------------------------------------------------------------------\n"
        "Ran 3 tests in 0.120s\n";

    auto observed = parser_.Observe(text, "django");

    ASSERT_TRUE(observed.has_value());
    EXPECT_TRUE(observed->format_marker);
    EXPECT_EQ(observed->tests["test_login (auth_tests.test_views.LoginTest)"], TestVerdict::PASS);
    EXPECT_EQ(observed->tests["test_logout (auth_tests.test_views.LoginTest)"], TestVerdict::FAIL);
    EXPECT_EQ(observed->tests["test_slow (auth_tests.test_views.LoginTest)"], TestVerdict::NOT_RUN);
}

TEST_F(ResultParserTest, GoogleTestCrashMidTestIsError) {
    const std::string text =
        "[==========] Running 2 tests from 1 test suite.\n"
        "[ RUN      ] Math.Add\n"
        "[       OK ] Math.Add (0 ms)\n"
        "[ RUN      ] Math.Divide\n"
        "Segmentation fault\n";

    auto observed = parser_.Observe(text, "googletest");

    ASSERT_TRUE(observed.has_value());
    EXPECT_EQ(observed->tests["Math.Add"], TestVerdict::PASS);
    EXPECT_EQ(observed->tests["Math.Divide"], TestVerdict::ERROR);
}

TEST_F(ResultParserTest, Tap) {
    const std::string text =
        "TAP version 13\n"
        "1..3\n"
        "ok 1 - parses input\n"
        "not ok 2 - rejects garbage\n"
        "ok 3 - network # SKIP offline\n";

    auto observed = parser_.Observe(text, "tap");

    ASSERT_TRUE(observed.has_value());
    EXPECT_EQ(observed->tests["parses input"], TestVerdict::PASS);
    EXPECT_EQ(observed->tests["rejects garbage"], TestVerdict::FAIL);
    EXPECT_EQ(observed->tests["network"], TestVerdict::NOT_RUN);
}

TEST_F(ResultParserTest, Simple) {
    auto observed = parser_.Observe("test_x: pass\ntest_y: FAILED\ntest_z: error\n", "simple");

    ASSERT_TRUE(observed.has_value());
    EXPECT_EQ(observed->tests["test_x"], TestVerdict::PASS);
    EXPECT_EQ(observed->tests["test_y"], TestVerdict::FAIL);
    EXPECT_EQ(observed->tests["test_z"], TestVerdict::ERROR);
}

// ============================================================================
// Format Errors
// ============================================================================

TEST_F(ResultParserTest, UnknownFormatIsParserFormatError) {
    auto parsed = parser_.Parse(Output("whatever"), {"a"}, "junit-xml");

    ASSERT_FALSE(core::Succeeded(parsed));
    EXPECT_EQ(core::FailureOf(parsed).kind, core::FailureKind::PARSER_FORMAT_ERROR);
    EXPECT_FALSE(ResultParser::IsSupportedFormat("junit-xml"));
}

TEST_F(ResultParserTest, UnrecognizedOutputIsParserFormatError) {
    auto parsed = parser_.Parse(Output("bash: pytest: command not found", 127), {"a"}, "pytest");

    ASSERT_FALSE(core::Succeeded(parsed));
    EXPECT_EQ(core::FailureOf(parsed).stage, core::Stage::PARSE);
    EXPECT_EQ(core::FailureOf(parsed).kind, core::FailureKind::PARSER_FORMAT_ERROR);
}

TEST_F(ResultParserTest, StderrIsParsedToo) {
    core::RawExecutionOutput output;
    output.stderr_output = "ok 1 - from stderr\n";

    auto parsed = parser_.Parse(output, {"from stderr"}, "tap");

    ASSERT_TRUE(core::Succeeded(parsed));
    EXPECT_EQ(core::ValueOf(parsed)["from stderr"], TestVerdict::PASS);
}

// ============================================================================
// Oversized Output
// ============================================================================

TEST_F(ResultParserTest, MegabyteLineIsSkippedInEveryFormat) {
    const std::string huge(1 << 20, 'a');
    const std::vector<std::pair<std::string, std::pair<std::string, std::string>>> cases = {
        {"pytest", {"PASSED t.py::test_x", "t.py::test_x"}},
        {"django", {"test_x (app.tests.Case) ... ok", "test_x (app.tests.Case)"}},
        {"googletest", {"[       OK ] Suite.Name (0 ms)", "Suite.Name"}},
        {"tap", {"ok 1 - test_x", "test_x"}},
        {"simple", {"test_x: pass", "test_x"}},
    };

    for (const auto& [format, sample] : cases) {
        const auto& [line, test] = sample;
        std::string text = line + "\n" + huge + ": pass\n" + "PASSED " + huge + "\n";

        auto parsed = parser_.Parse(Output(text), {test}, format);

        ASSERT_TRUE(core::Succeeded(parsed)) << format;
        EXPECT_EQ(core::ValueOf(parsed).at(test), TestVerdict::PASS) << format;
    }
}

TEST_F(ResultParserTest, LineAtLengthLimitIsStillParsed) {
    std::string name(ResultParser::kMaxResultLineLength - 6, 't');
    auto parsed = parser_.Parse(Output(name + ": pass\n"), {name}, "simple");

    ASSERT_TRUE(core::Succeeded(parsed));
    EXPECT_EQ(core::ValueOf(parsed).at(name), TestVerdict::PASS);
}

TEST(ResultParserFormatsTest, SupportedFormats) {
    for (const auto& format : ResultParser::SupportedFormats()) {
        EXPECT_TRUE(ResultParser::IsSupportedFormat(format)) << format;
    }
    EXPECT_EQ(ResultParser::SupportedFormats().size(), 5u);
}

} // namespace
} // namespace patchbench
