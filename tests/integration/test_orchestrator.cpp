#include <gtest/gtest.h>

#include "patchbench/core/instance_orchestrator.hpp"
#include "patchbench/core/workspace_builder.hpp"
#include "patchbench/utils/process_utils.hpp"
#include "patchbench/utils/string_utils.hpp"
#include "fake_runtime.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <set>
#include <thread>

namespace patchbench {
namespace {

using namespace std::chrono_literals;
using core::FailureKind;
using core::InstanceOrchestrator;
using core::InstanceResult;
using core::InstanceSpec;
using core::InstanceStatus;
using core::TestVerdict;

constexpr const char* kFixPatch =
    "diff --git a/calc.py b/calc.py\n"
    "--- a/calc.py\n"
    "+++ b/calc.py\n"
    "@@ -1,2 +1,2 @@\n"
    " def add(a, b):\n"
    "-    return a - b\n"
    "+    return a + b\n";

constexpr const char* kMismatchedPatch =
    "diff --git a/calc.py b/calc.py\n"
    "--- a/calc.py\n"
    "+++ b/calc.py\n"
    "@@ -1,2 +1,2 @@\n"
    " def multiply(a, b):\n"
    "-    return a / b\n"
    "+    return a * b\n";

constexpr const char* kCheckFix =
    "if grep -q 'a + b' calc.py; then echo 'test_add: pass'; else echo 'test_add: fail'; fi; "
    "echo 'test_existing: pass'";

/**
 * Real git repository and workspaces on disk, container runtime faked so the
 * test command runs as a host process inside the staged workspace.
 */
class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!utils::IsProgramAvailable("git")) {
            GTEST_SKIP() << "git is not installed";
        }

        repo_ = root_ / "upstream";
        std::filesystem::create_directories(repo_);
        test::Git(repo_, {"init", "-q"});
        test::WriteFile(repo_ / "calc.py", "def add(a, b):\n    return a - b\n");
        test::WriteFile(repo_ / "README.md", "calculator\n");
        test::Git(repo_, {"add", "-A"});
        test::Git(repo_, {"commit", "-q", "-m", "init"});
        commit_ = utils::StringUtils::Trim(test::Git(repo_, {"rev-parse", "HEAD"}));

        config_.cache_dir = root_ / "cache";
        config_.work_dir = root_ / "work";
        config_.log_dir = root_ / "logs";
        config_.run_id = "run_test";
        config_.workers = 2;
        config_.checkout_retries = 0;
        config_.retry_backoff = 10ms;
        config_.stop_grace = 1s;
        config_.limits.timeout = 30s;

        runtime_ = std::make_shared<test::FakeRuntime>();
    }

    InstanceSpec Spec(const std::string& id) const {
        InstanceSpec spec;
        spec.instance_id = id;
        spec.repo = repo_.string();
        spec.base_commit = commit_;
        spec.patch = kFixPatch;
        spec.image.base = "python:3.11";
        spec.test_cmd = kCheckFix;
        spec.test_format = "simple";
        spec.fail_to_pass = {"test_add"};
        spec.pass_to_pass = {"test_existing"};
        return spec;
    }

    std::unique_ptr<InstanceOrchestrator> Start() {
        auto orchestrator = std::make_unique<InstanceOrchestrator>(config_, runtime_);
        EXPECT_TRUE(orchestrator->Initialize());
        return orchestrator;
    }

    bool WorkDirIsEmpty() const {
        std::error_code ec;
        return !std::filesystem::exists(config_.work_dir, ec) ||
               std::filesystem::is_empty(config_.work_dir, ec);
    }

    test::TempDir root_{"patchbench_orchestrator"};
    std::filesystem::path repo_;
    std::string commit_;
    core::HarnessConfig config_;
    std::shared_ptr<test::FakeRuntime> runtime_;
};

// ============================================================================
// Single Instance
// ============================================================================

TEST_F(OrchestratorTest, FixingPatchResolves) {
    auto orchestrator = Start();

    auto result = orchestrator->RunInstance(Spec("calc__calc-1"));

    EXPECT_EQ(result.status, InstanceStatus::RESOLVED)
        << (result.failure ? result.failure->cause : std::string("no failure"));
    EXPECT_EQ(result.test_verdicts.size(), 2u);
    EXPECT_EQ(result.test_verdicts["test_add"], TestVerdict::PASS);
    EXPECT_FALSE(result.failure.has_value());
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(runtime_->LiveCount(), 0) << "sandbox must be released";
    EXPECT_TRUE(WorkDirIsEmpty()) << "workspace must be removed";
}

TEST_F(OrchestratorTest, MissingFixIsUnresolved) {
    auto orchestrator = Start();
    auto spec = Spec("calc__calc-2");
    spec.patch = "diff --git a/README.md b/README.md\n"
                 "--- a/README.md\n"
                 "+++ b/README.md\n"
                 "@@ -1 +1 @@\n"
                 "-calculator\n"
                 "+a calculator\n";

    auto result = orchestrator->RunInstance(spec);

    EXPECT_EQ(result.status, InstanceStatus::UNRESOLVED);
    EXPECT_EQ(result.test_verdicts["test_add"], TestVerdict::FAIL);
    EXPECT_EQ(result.test_verdicts["test_existing"], TestVerdict::PASS);
}

TEST_F(OrchestratorTest, ArtifactsAreWritten) {
    auto orchestrator = Start();

    auto result = orchestrator->RunInstance(Spec("calc__calc-3"));
    auto dir = orchestrator->InstanceLogDirectory("calc__calc-3");

    EXPECT_EQ(result.log_ref.string(), dir.string());
    EXPECT_TRUE(std::filesystem::exists(dir / "report.json"));
    EXPECT_TRUE(std::filesystem::exists(dir / "run_instance.log"));
    EXPECT_TRUE(std::filesystem::exists(dir / "patch.diff"));
    EXPECT_TRUE(std::filesystem::exists(dir / "test_output.txt"));
    EXPECT_FALSE(std::filesystem::exists(dir / "test_patch.diff")) << "no test patch was given";

    auto report = nlohmann::json::parse(test::ReadFile(dir / "report.json"));
    EXPECT_EQ(report["status"], "Resolved");
    EXPECT_NE(test::ReadFile(dir / "test_output.txt").find("test_add: pass"), std::string::npos);
}

TEST_F(OrchestratorTest, RepeatedRunsGiveIdenticalVerdicts) {
    auto orchestrator = Start();
    auto spec = Spec("calc__calc-4");
    spec.test_cmd = std::string(kCheckFix) + "; echo 'test_flag: fail'";
    spec.pass_to_pass.push_back("test_flag");

    auto first = orchestrator->RunInstance(spec);
    auto second = orchestrator->RunInstance(spec);

    EXPECT_EQ(first.status, InstanceStatus::UNRESOLVED);
    EXPECT_EQ(second.status, first.status);
    EXPECT_EQ(second.test_verdicts, first.test_verdicts);
    EXPECT_EQ(first.test_verdicts["test_flag"], TestVerdict::FAIL);
    EXPECT_TRUE(WorkDirIsEmpty()) << "each run stages and removes its own workspace";
}

TEST_F(OrchestratorTest, TestPatchIsAppliedAfterCandidate) {
    auto orchestrator = Start();
    auto spec = Spec("calc__calc-4");
    spec.test_patch = "diff --git a/test_calc.py b/test_calc.py\n"
                      "new file mode 100644\n"
                      "--- /dev/null\n"
                      "+++ b/test_calc.py\n"
                      "@@ -0,0 +1 @@\n"
                      "+test_new\n";
    spec.test_cmd = std::string(kCheckFix) + "; test -f test_calc.py && echo 'test_new: pass'";
    spec.fail_to_pass.push_back("test_new");

    auto result = orchestrator->RunInstance(spec);

    EXPECT_EQ(result.status, InstanceStatus::RESOLVED);
    EXPECT_EQ(result.test_verdicts["test_new"], TestVerdict::PASS);
    EXPECT_TRUE(std::filesystem::exists(orchestrator->InstanceLogDirectory("calc__calc-4") / "test_patch.diff"));
}

// ============================================================================
// Failure Paths
// ============================================================================

TEST_F(OrchestratorTest, ContextMismatchIsPatchFailedWithoutSandbox) {
    auto orchestrator = Start();
    auto spec = Spec("calc__calc-5");
    spec.patch = kMismatchedPatch;

    auto result = orchestrator->RunInstance(spec);

    EXPECT_EQ(result.status, InstanceStatus::PATCH_FAILED);
    EXPECT_TRUE(result.test_verdicts.empty());
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->stage, core::Stage::PATCH);
    EXPECT_EQ(runtime_->CreatedCount(), 0) << "no sandbox for a patch that does not apply";
    EXPECT_TRUE(WorkDirIsEmpty());
}

TEST_F(OrchestratorTest, TimeoutMarksExpectedTestsFailed) {
    config_.limits.timeout = 1s;
    auto orchestrator = Start();
    auto spec = Spec("calc__calc-6");
    spec.test_cmd = "sleep 30";

    auto start = std::chrono::steady_clock::now();
    auto result = orchestrator->RunInstance(spec);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.status, InstanceStatus::UNRESOLVED);
    EXPECT_TRUE(result.timed_out);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->kind, FailureKind::TIMEOUT_EXCEEDED);
    ASSERT_EQ(result.test_verdicts.size(), 2u);
    for (const auto& [test, verdict] : result.test_verdicts) {
        EXPECT_EQ(verdict, TestVerdict::FAIL) << test;
    }
    EXPECT_LT(elapsed, 15s);
    EXPECT_EQ(runtime_->LiveCount(), 0);
}

TEST_F(OrchestratorTest, UnknownFormatIsRejectedBeforeAnyWork) {
    auto orchestrator = Start();
    auto spec = Spec("calc__calc-7");
    spec.test_format = "junit-xml";

    auto result = orchestrator->RunInstance(spec);

    EXPECT_EQ(result.status, InstanceStatus::SANDBOX_ERROR);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->kind, FailureKind::PARSER_FORMAT_ERROR);
    EXPECT_EQ(runtime_->CreatedCount(), 0);
}

TEST_F(OrchestratorTest, MissingTestCommandIsInvalid) {
    auto orchestrator = Start();
    auto spec = Spec("calc__calc-8");
    spec.test_cmd.clear();

    auto result = orchestrator->RunInstance(spec);

    EXPECT_EQ(result.status, InstanceStatus::SANDBOX_ERROR);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->kind, FailureKind::INVALID_DEFINITION);
}

TEST_F(OrchestratorTest, UnknownCommitIsCheckoutFailure) {
    auto orchestrator = Start();
    auto spec = Spec("calc__calc-9");
    spec.base_commit = "0123456789abcdef0123456789abcdef01234567";

    auto result = orchestrator->RunInstance(spec);

    EXPECT_EQ(result.status, InstanceStatus::SANDBOX_ERROR);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->stage, core::Stage::CHECKOUT);
    EXPECT_TRUE(WorkDirIsEmpty());
}

TEST_F(OrchestratorTest, OptionLikeCommitIsRejectedBeforeCheckout) {
    auto orchestrator = Start();
    auto spec = Spec("calc__calc-11");
    spec.base_commit = "--upload-pack=touch " + (root_ / "pwned").string();

    auto result = orchestrator->RunInstance(spec);

    EXPECT_EQ(result.status, InstanceStatus::SANDBOX_ERROR);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->kind, FailureKind::INVALID_DEFINITION);
    EXPECT_EQ(result.failure->stage, core::Stage::VALIDATION);
    EXPECT_FALSE(std::filesystem::exists(root_ / "pwned"));
    EXPECT_EQ(runtime_->CreatedCount(), 0);
}

TEST_F(OrchestratorTest, SandboxStartFailureIsReported) {
    runtime_->fail_start = true;
    auto orchestrator = Start();

    auto result = orchestrator->RunInstance(Spec("calc__calc-10"));

    EXPECT_EQ(result.status, InstanceStatus::SANDBOX_ERROR);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->kind, FailureKind::SANDBOX_START_FAILED);
    EXPECT_EQ(runtime_->LiveCount(), 0);
}

TEST_F(OrchestratorTest, RejectInvalidProducesSandboxError) {
    auto orchestrator = Start();

    auto result = orchestrator->RejectInvalid("broken", {"missing repo", "missing base_commit"});

    EXPECT_EQ(result.status, InstanceStatus::SANDBOX_ERROR);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->kind, FailureKind::INVALID_DEFINITION);
    EXPECT_NE(result.failure->cause.find("missing repo"), std::string::npos);
}

// ============================================================================
// Batch
// ============================================================================

TEST_F(OrchestratorTest, BatchRespectsWorkerBound) {
    runtime_->build_delay = 50ms;
    auto orchestrator = Start();

    std::vector<InstanceSpec> specs;
    for (int i = 0; i < 6; ++i) {
        auto spec = Spec("calc__calc-" + std::to_string(100 + i));
        spec.test_cmd = std::string("sleep 0.3; ") + kCheckFix;
        specs.push_back(spec);
    }

    std::atomic<int> callbacks{0};
    auto results = orchestrator->RunAll(specs, [&](const InstanceResult&) { callbacks++; });

    ASSERT_EQ(results.size(), 6u);
    EXPECT_EQ(callbacks.load(), 6);

    std::set<std::string> ids;
    for (const auto& result : results) {
        ids.insert(result.instance_id);
        EXPECT_EQ(result.status, InstanceStatus::RESOLVED) << result.instance_id;
    }
    EXPECT_EQ(ids.size(), 6u);

    EXPECT_LE(orchestrator->PeakConcurrentSandboxes(), 2u);
    EXPECT_LE(runtime_->PeakLiveCount(), 2);
    EXPECT_EQ(orchestrator->ImageBuildCount(), 0u) << "a plain base image is pulled, not built";
    EXPECT_EQ(runtime_->LiveCount(), 0);
    EXPECT_TRUE(WorkDirIsEmpty());
}

TEST_F(OrchestratorTest, SharedDockerfileIsBuiltOnce) {
    runtime_->build_delay = 100ms;
    auto orchestrator = Start();

    std::vector<InstanceSpec> specs;
    for (int i = 0; i < 4; ++i) {
        auto spec = Spec("calc__calc-" + std::to_string(200 + i));
        spec.image.dockerfile = "FROM python:3.11\nRUN pip install pytest\n";
        specs.push_back(spec);
    }

    auto results = orchestrator->RunAll(specs);

    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(orchestrator->ImageBuildCount(), 1u);
    EXPECT_EQ(runtime_->BuildCalls(), 1);
}

TEST_F(OrchestratorTest, FailingSiblingDoesNotAffectOthers) {
    auto orchestrator = Start();

    auto broken = Spec("calc__calc-301");
    broken.patch = kMismatchedPatch;

    auto results = orchestrator->RunAll({Spec("calc__calc-300"), broken, Spec("calc__calc-302")});

    ASSERT_EQ(results.size(), 3u);
    for (const auto& result : results) {
        if (result.instance_id == "calc__calc-301") {
            EXPECT_EQ(result.status, InstanceStatus::PATCH_FAILED);
        } else {
            EXPECT_EQ(result.status, InstanceStatus::RESOLVED) << result.instance_id;
        }
    }
}

TEST_F(OrchestratorTest, DuplicateIdsInBatchRunOnce) {
    auto orchestrator = Start();

    auto results = orchestrator->RunAll({Spec("calc__calc-400"), Spec("calc__calc-400"), Spec("calc__calc-401")});

    ASSERT_EQ(results.size(), 3u);
    int resolved = 0;
    int rejected = 0;
    for (const auto& result : results) {
        if (result.status == InstanceStatus::RESOLVED) {
            resolved++;
        } else {
            rejected++;
            EXPECT_EQ(result.instance_id, "calc__calc-400");
            ASSERT_TRUE(result.failure.has_value());
            EXPECT_EQ(result.failure->kind, FailureKind::INVALID_DEFINITION);
            EXPECT_NE(result.failure->cause.find("duplicate"), std::string::npos);
        }
    }
    EXPECT_EQ(resolved, 2);
    EXPECT_EQ(rejected, 1);
    EXPECT_EQ(runtime_->CreatedCount(), 2);

    auto report = nlohmann::json::parse(
        test::ReadFile(orchestrator->InstanceLogDirectory("calc__calc-400") / "report.json"));
    EXPECT_EQ(report["status"], "Resolved") << "the first run's artifacts are not overwritten";
}

TEST_F(OrchestratorTest, IdsCollidingAfterSanitizingAreRejected) {
    auto orchestrator = Start();

    auto results = orchestrator->RunAll({Spec("calc__calc/500"), Spec("calc__calc_500")});

    ASSERT_EQ(results.size(), 2u);
    int rejected = 0;
    for (const auto& result : results) {
        if (result.failure && result.failure->kind == FailureKind::INVALID_DEFINITION) {
            rejected++;
            EXPECT_NE(result.failure->cause.find("log directory"), std::string::npos);
        }
    }
    EXPECT_EQ(rejected, 1);
}

TEST_F(OrchestratorTest, EmptyBatch) {
    auto orchestrator = Start();
    EXPECT_TRUE(orchestrator->RunAll({}).empty());
}

// ============================================================================
// Cancellation and Recovery
// ============================================================================

TEST_F(OrchestratorTest, CancelAllBeforeRunCancelsEveryInstance) {
    auto orchestrator = Start();
    orchestrator->CancelAll();

    auto results = orchestrator->RunAll({Spec("calc__calc-400"), Spec("calc__calc-401")});

    ASSERT_EQ(results.size(), 2u);
    for (const auto& result : results) {
        EXPECT_EQ(result.status, InstanceStatus::SANDBOX_ERROR);
        ASSERT_TRUE(result.failure.has_value());
        EXPECT_EQ(result.failure->kind, FailureKind::CANCELLED);
    }
    EXPECT_EQ(runtime_->CreatedCount(), 0);
}

TEST_F(OrchestratorTest, CancelDuringTestRunStopsPromptly) {
    auto orchestrator = Start();
    auto spec = Spec("calc__calc-402");
    spec.test_cmd = "sleep 30";

    std::thread canceller([&] {
        std::this_thread::sleep_for(1s);
        orchestrator->Cancel("calc__calc-402");
    });

    auto start = std::chrono::steady_clock::now();
    auto result = orchestrator->RunInstance(spec);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_EQ(result.status, InstanceStatus::SANDBOX_ERROR);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->kind, FailureKind::CANCELLED);
    EXPECT_LT(elapsed, 15s);
    EXPECT_EQ(runtime_->LiveCount(), 0);
    EXPECT_FALSE(orchestrator->IsCancelled()) << "cancelling one instance leaves the run going";
}

TEST_F(OrchestratorTest, CancelUnknownInstance) {
    auto orchestrator = Start();
    EXPECT_FALSE(orchestrator->Cancel("nobody__here-1"));
}

TEST_F(OrchestratorTest, InitializeSweepsOrphans) {
    runtime_->AddOrphan("patchbench_crashed_1");
    runtime_->AddOrphan("patchbench_crashed_2");
    test::WriteFile(config_.work_dir / "calc__calc-1_deadbeef" / core::WorkspaceBuilder::kWorkspaceMarker,
                    "calc__calc-1\n");
    test::WriteFile(config_.work_dir / "notes" / "keep.txt", "not a workspace\n");

    auto orchestrator = Start();

    EXPECT_EQ(runtime_->LiveCount(), 0);
    EXPECT_FALSE(std::filesystem::exists(config_.work_dir / "calc__calc-1_deadbeef"));
    EXPECT_TRUE(std::filesystem::exists(config_.work_dir / "notes" / "keep.txt"))
        << "directories the harness did not allocate survive the sweep";
}

TEST_F(OrchestratorTest, NoSweepLeavesOrphans) {
    runtime_->AddOrphan("patchbench_crashed_1");

    InstanceOrchestrator orchestrator(config_, runtime_);
    ASSERT_TRUE(orchestrator.Initialize(false));

    EXPECT_EQ(runtime_->LiveCount(), 1);
}

TEST_F(OrchestratorTest, UnavailableRuntimeFailsInitialize) {
    runtime_->available = false;

    InstanceOrchestrator orchestrator(config_, runtime_);
    EXPECT_FALSE(orchestrator.Initialize());
}

TEST_F(OrchestratorTest, RunBeforeInitializeFails) {
    InstanceOrchestrator orchestrator(config_, runtime_);

    auto result = orchestrator.RunInstance(Spec("calc__calc-500"));

    EXPECT_EQ(result.status, InstanceStatus::SANDBOX_ERROR);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->kind, FailureKind::INTERNAL_ERROR);
}

} // namespace
} // namespace patchbench
