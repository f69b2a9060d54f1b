#include <gtest/gtest.h>

#include "patchbench/core/sandbox_engine.hpp"
#include "patchbench/core/test_runner.hpp"
#include "fake_runtime.hpp"
#include "test_support.hpp"

namespace patchbench {
namespace {

using namespace std::chrono_literals;
using core::SandboxEngine;
using core::SandboxState;

class SandboxEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime_ = std::make_shared<test::FakeRuntime>();
        core::SandboxOptions options;
        options.run_id = "run_test";
        options.stop_grace = 1s;
        engine_ = std::make_unique<SandboxEngine>(runtime_, options);
        workspace_ = std::make_unique<core::Workspace>(scratch_.Path() / "ws", "org__repo-1");
        std::filesystem::create_directories(workspace_->Root());
    }

    core::ResourceLimits Limits() const {
        core::ResourceLimits limits;
        limits.memory_mb = 1024;
        limits.cpus = 1.0;
        limits.timeout = 5s;
        return limits;
    }

    test::TempDir scratch_;
    std::shared_ptr<test::FakeRuntime> runtime_;
    std::unique_ptr<SandboxEngine> engine_;
    std::unique_ptr<core::Workspace> workspace_;
};

// ============================================================================
// Configuration
// ============================================================================

TEST_F(SandboxEngineTest, ContainerConfigIsIsolated) {
    auto config = engine_->BuildContainerConfig("org__repo-1", *workspace_, "img:1", Limits());

    EXPECT_EQ(config.network_mode, utils::NetworkMode::NONE);
    EXPECT_EQ(config.memory_limit_mb, 1024u);
    EXPECT_NE(config.user, "root");
    ASSERT_EQ(config.mounts.size(), 1u) << "only the workspace is mounted";
    EXPECT_EQ(config.mounts[0].container_path.string(), "/testbed");
    EXPECT_EQ(config.labels.at(SandboxEngine::kManagedLabel), "true");
    EXPECT_EQ(config.labels.at(SandboxEngine::kRunLabel), "run_test");
    EXPECT_EQ(config.labels.at(SandboxEngine::kInstanceLabel), "org__repo-1");
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(SandboxEngineTest, CreateExecuteRelease) {
    auto created = engine_->Create("org__repo-1", *workspace_, "img:1", Limits());
    ASSERT_TRUE(core::Succeeded(created)) << core::FailureOf(created).cause;
    auto sandbox = std::move(core::ValueOf(created));

    EXPECT_EQ(sandbox->GetState(), SandboxState::STARTED);
    EXPECT_EQ(engine_->ActiveCount(), 1u);

    utils::ExecOptions options;
    options.timeout = 5s;
    auto result = sandbox->Execute({"sh", "-c", "echo hello"}, options);

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "hello\n");
    EXPECT_EQ(sandbox->GetState(), SandboxState::EXITED);

    sandbox->Release();
    EXPECT_EQ(sandbox->GetState(), SandboxState::RELEASED);
    EXPECT_EQ(engine_->ActiveCount(), 0u);
    EXPECT_EQ(runtime_->LiveCount(), 0);
}

TEST_F(SandboxEngineTest, HandleDestructorReleases) {
    {
        auto created = engine_->Create("org__repo-1", *workspace_, "img:1", Limits());
        ASSERT_TRUE(core::Succeeded(created));
        EXPECT_EQ(runtime_->LiveCount(), 1);
    }

    EXPECT_EQ(runtime_->LiveCount(), 0);
    EXPECT_EQ(engine_->ActiveCount(), 0u);
    EXPECT_EQ(engine_->PeakActiveCount(), 1u);
}

TEST_F(SandboxEngineTest, SecondExecuteIsRefused) {
    auto created = engine_->Create("org__repo-1", *workspace_, "img:1", Limits());
    ASSERT_TRUE(core::Succeeded(created));
    auto& sandbox = core::ValueOf(created);

    sandbox->Execute({"true"}, utils::ExecOptions{});
    auto again = sandbox->Execute({"true"}, utils::ExecOptions{});

    EXPECT_NE(again.exit_code, 0);
}

TEST_F(SandboxEngineTest, StartFailureRemovesContainer) {
    runtime_->fail_start = true;

    auto created = engine_->Create("org__repo-1", *workspace_, "img:1", Limits());

    ASSERT_FALSE(core::Succeeded(created));
    EXPECT_EQ(core::FailureOf(created).kind, core::FailureKind::SANDBOX_START_FAILED);
    EXPECT_EQ(runtime_->LiveCount(), 0) << "a container that failed to start must not leak";
    EXPECT_EQ(engine_->ActiveCount(), 0u);
}

TEST_F(SandboxEngineTest, CreateFailure) {
    runtime_->fail_create = true;

    auto created = engine_->Create("org__repo-1", *workspace_, "img:1", Limits());

    ASSERT_FALSE(core::Succeeded(created));
    EXPECT_EQ(core::FailureOf(created).stage, core::Stage::SANDBOX);
}

TEST_F(SandboxEngineTest, SweepRemovesOnlyManagedContainers) {
    runtime_->AddOrphan("leftover_1");
    runtime_->AddOrphan("leftover_2");

    utils::ContainerConfig unrelated;
    unrelated.name = "someone_elses";
    runtime_->CreateContainer(unrelated);

    EXPECT_EQ(engine_->SweepOrphans(), 2u);
    EXPECT_EQ(runtime_->LiveCount(), 1);
}

TEST_F(SandboxEngineTest, UnavailableRuntimeFailsInitialize) {
    runtime_->available = false;
    EXPECT_FALSE(engine_->Initialize());
}

// ============================================================================
// Test Runner
// ============================================================================

TEST_F(SandboxEngineTest, TestRunnerCapturesOutput) {
    auto created = engine_->Create("org__repo-1", *workspace_, "img:1", Limits());
    ASSERT_TRUE(core::Succeeded(created));

    core::TestRunner runner;
    core::TestRunOptions options;
    options.timeout = 5s;

    auto ran = runner.Run(*core::ValueOf(created), "echo 'test_a: pass'; exit 1", options);

    ASSERT_TRUE(core::Succeeded(ran)) << core::FailureOf(ran).cause;
    const auto& output = core::ValueOf(ran);
    EXPECT_EQ(output.exit_code, 1) << "a failing test command is still a completed run";
    EXPECT_NE(output.stdout_output.find("test_a: pass"), std::string::npos);
    EXPECT_FALSE(output.timed_out);
}

TEST_F(SandboxEngineTest, TestRunnerDeadlineKillsContainer) {
    auto created = engine_->Create("org__repo-1", *workspace_, "img:1", Limits());
    ASSERT_TRUE(core::Succeeded(created));

    core::TestRunner runner;
    core::TestRunOptions options;
    options.timeout = 1s;

    auto start = std::chrono::steady_clock::now();
    auto ran = runner.Run(*core::ValueOf(created), "sleep 30", options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(core::Succeeded(ran));
    EXPECT_TRUE(core::ValueOf(ran).timed_out);
    EXPECT_LT(elapsed, 10s);
    EXPECT_GE(runtime_->KillCalls(), 1);
}

TEST_F(SandboxEngineTest, TestRunnerCancellation) {
    auto created = engine_->Create("org__repo-1", *workspace_, "img:1", Limits());
    ASSERT_TRUE(core::Succeeded(created));

    utils::CancellationToken token;
    token.Cancel();

    core::TestRunner runner;
    core::TestRunOptions options;
    options.cancel = &token;

    auto ran = runner.Run(*core::ValueOf(created), "sleep 30", options);

    ASSERT_FALSE(core::Succeeded(ran));
    EXPECT_EQ(core::FailureOf(ran).kind, core::FailureKind::CANCELLED);
}

} // namespace
} // namespace patchbench
