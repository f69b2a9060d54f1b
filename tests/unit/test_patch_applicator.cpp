#include <gtest/gtest.h>

#include "patchbench/core/patch_applicator.hpp"
#include "patchbench/utils/hash_utils.hpp"
#include "test_support.hpp"

namespace patchbench {
namespace {

using core::PatchApplicator;
using core::PatchOutcome;
using utils::HashUtils;

class PatchApplicatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::WriteFile(dir_ / "calc.py",
                        "def add(a, b):\n"
                        "    return a + b\n"
                        "\n"
                        "def sub(a, b):\n"
                        "    return a - b\n");
        test::WriteFile(dir_ / "README.md", "calc\n");
    }

    std::string TreeHash() const { return HashUtils::ComputeTreeHash(dir_.Path()); }

    test::TempDir dir_;
};

// ============================================================================
// Successful Application
// ============================================================================

TEST_F(PatchApplicatorTest, AppliesExactHunk) {
    const std::string patch =
        "--- a/calc.py\n"
        "+++ b/calc.py\n"
        "@@ -4,2 +4,2 @@\n"
        " def sub(a, b):\n"
        "-    return a - b\n"
        "+    return a - b - 0\n";

    PatchApplicator applicator(0);
    auto result = applicator.ApplyToDirectory(dir_.Path(), patch);

    ASSERT_TRUE(result.Applied()) << result.reason;
    EXPECT_EQ(result.applied_hunks, 1);
    EXPECT_NE(test::ReadFile(dir_ / "calc.py").find("return a - b - 0\n"), std::string::npos);
}

TEST_F(PatchApplicatorTest, FuzzToleratesDrift) {
    // Declared at line 6, real context sits at line 4
    const std::string patch =
        "--- a/calc.py\n"
        "+++ b/calc.py\n"
        "@@ -6,2 +6,2 @@\n"
        " def sub(a, b):\n"
        "-    return a - b\n"
        "+    return b - a\n";

    PatchApplicator strict(0);
    EXPECT_FALSE(strict.ApplyToDirectory(dir_.Path(), patch).Applied());

    PatchApplicator tolerant(3);
    auto result = tolerant.ApplyToDirectory(dir_.Path(), patch);
    ASSERT_TRUE(result.Applied()) << result.reason;
    EXPECT_NE(test::ReadFile(dir_ / "calc.py").find("return b - a"), std::string::npos);
}

TEST_F(PatchApplicatorTest, CreatesFilesInNewDirectories) {
    const std::string patch =
        "diff --git a/tests/test_calc.py b/tests/test_calc.py\n"
        "new file mode 100644\n"
        "--- /dev/null\n"
        "+++ b/tests/test_calc.py\n"
        "@@ -0,0 +1,2 @@\n"
        "+def test_add():\n"
        "+    assert True\n";

    PatchApplicator applicator;
    auto result = applicator.ApplyToDirectory(dir_.Path(), patch);

    ASSERT_TRUE(result.Applied()) << result.reason;
    EXPECT_EQ(test::ReadFile(dir_ / "tests/test_calc.py"), "def test_add():\n    assert True\n");
}

TEST_F(PatchApplicatorTest, DeletesFiles) {
    const std::string patch =
        "diff --git a/README.md b/README.md\n"
        "deleted file mode 100644\n"
        "--- a/README.md\n"
        "+++ /dev/null\n"
        "@@ -1 +0,0 @@\n"
        "-calc\n";

    PatchApplicator applicator;
    auto result = applicator.ApplyToDirectory(dir_.Path(), patch);

    ASSERT_TRUE(result.Applied()) << result.reason;
    EXPECT_FALSE(std::filesystem::exists(dir_ / "README.md"));
}

TEST_F(PatchApplicatorTest, PreservesMissingTrailingNewline) {
    test::WriteFile(dir_ / "VERSION", "1.0");
    const std::string patch =
        "--- a/VERSION\n"
        "+++ b/VERSION\n"
        "@@ -1 +1 @@\n"
        "-1.0\n"
        "\\ No newline at end of file\n"
        "+1.1\n"
        "\\ No newline at end of file\n";

    PatchApplicator applicator;
    auto result = applicator.ApplyToDirectory(dir_.Path(), patch);

    ASSERT_TRUE(result.Applied()) << result.reason;
    EXPECT_EQ(test::ReadFile(dir_ / "VERSION"), "1.1");
}

// ============================================================================
// Rejection and Rollback
// ============================================================================

TEST_F(PatchApplicatorTest, ContextMismatchIsRejectedAndTreeUnchanged) {
    auto before = TreeHash();
    const std::string patch =
        "--- a/calc.py\n"
        "+++ b/calc.py\n"
        "@@ -1,2 +1,2 @@\n"
        " def multiply(a, b):\n"
        "-    return a * b\n"
        "+    return b * a\n";

    PatchApplicator applicator;
    auto result = applicator.ApplyToDirectory(dir_.Path(), patch);

    EXPECT_EQ(result.outcome, PatchOutcome::REJECTED);
    EXPECT_EQ(result.applied_hunks, 0);
    ASSERT_EQ(result.rejected_hunks.size(), 1u);
    EXPECT_NE(result.rejected_hunks[0].find("calc.py"), std::string::npos);
    EXPECT_EQ(before, TreeHash());
}

TEST_F(PatchApplicatorTest, PartialApplicationRollsBackEveryFile) {
    auto before = TreeHash();
    // First file applies cleanly, second file's context is wrong
    const std::string patch =
        "--- a/README.md\n"
        "+++ b/README.md\n"
        "@@ -1 +1 @@\n"
        "-calc\n"
        "+calculator\n"
        "--- a/calc.py\n"
        "+++ b/calc.py\n"
        "@@ -1,2 +1,2 @@\n"
        " def add(x, y):\n"
        "-    return x + y\n"
        "+    return y + x\n"
        "diff --git a/extra/new.py b/extra/new.py\n"
        "new file mode 100644\n"
        "--- /dev/null\n"
        "+++ b/extra/new.py\n"
        "@@ -0,0 +1 @@\n"
        "+x = 1\n";

    PatchApplicator applicator;
    auto result = applicator.ApplyToDirectory(dir_.Path(), patch);

    EXPECT_EQ(result.outcome, PatchOutcome::PARTIALLY_APPLIED);
    EXPECT_GT(result.applied_hunks, 0);
    EXPECT_EQ(result.rejected_hunks.size(), 1u);
    EXPECT_EQ(before, TreeHash()) << "workspace must be byte-identical after a failed patch";
    EXPECT_FALSE(std::filesystem::exists(dir_ / "extra"));
}

TEST_F(PatchApplicatorTest, MissingTargetFileIsRejected) {
    const std::string patch =
        "--- a/nowhere.py\n"
        "+++ b/nowhere.py\n"
        "@@ -1 +1 @@\n"
        "-a\n"
        "+b\n";

    PatchApplicator applicator;
    auto result = applicator.ApplyToDirectory(dir_.Path(), patch);

    EXPECT_EQ(result.outcome, PatchOutcome::REJECTED);
    ASSERT_FALSE(result.rejected_hunks.empty());
    EXPECT_NE(result.rejected_hunks[0].find("file not found"), std::string::npos);
}

TEST_F(PatchApplicatorTest, PathsOutsideWorkspaceAreRejected) {
    auto before = TreeHash();
    const std::string patch =
        "diff --git a/../escape.txt b/../escape.txt\n"
        "new file mode 100644\n"
        "--- /dev/null\n"
        "+++ b/../escape.txt\n"
        "@@ -0,0 +1 @@\n"
        "+owned\n";

    PatchApplicator applicator;
    auto result = applicator.ApplyToDirectory(dir_.Path(), patch);

    EXPECT_EQ(result.outcome, PatchOutcome::REJECTED);
    EXPECT_NE(result.reason.find("escapes"), std::string::npos) << result.reason;
    EXPECT_FALSE(std::filesystem::exists(dir_.Path().parent_path() / "escape.txt"));
    EXPECT_EQ(before, TreeHash());
}

TEST_F(PatchApplicatorTest, EmptyAndMalformedPatchesAreRejected) {
    PatchApplicator applicator;

    auto empty = applicator.ApplyToDirectory(dir_.Path(), "");
    EXPECT_EQ(empty.outcome, PatchOutcome::REJECTED);
    EXPECT_FALSE(empty.reason.empty());

    auto malformed = applicator.ApplyToDirectory(dir_.Path(),
        "--- a/calc.py\n+++ b/calc.py\n@@ -1,9 +1,9 @@\n def add(a, b):\n");
    EXPECT_EQ(malformed.outcome, PatchOutcome::REJECTED);
    EXPECT_NE(malformed.reason.find("malformed"), std::string::npos);
}

TEST_F(PatchApplicatorTest, BinaryPatchesAreRejected) {
    const std::string patch =
        "diff --git a/logo.png b/logo.png\n"
        "Binary files a/logo.png and b/logo.png differ\n";

    PatchApplicator applicator;
    auto result = applicator.ApplyToDirectory(dir_.Path(), patch);

    EXPECT_EQ(result.outcome, PatchOutcome::REJECTED);
    EXPECT_NE(result.reason.find("binary"), std::string::npos);
}

TEST(PatchApplicatorFuzzTest, NegativeFuzzClampsToZero) {
    PatchApplicator applicator(-4);
    EXPECT_EQ(applicator.GetFuzz(), 0);
}

} // namespace
} // namespace patchbench
