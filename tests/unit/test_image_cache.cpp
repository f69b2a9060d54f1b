#include <gtest/gtest.h>

#include "patchbench/core/image_cache.hpp"
#include "fake_runtime.hpp"
#include "test_support.hpp"

#include <future>
#include <thread>
#include <vector>

namespace patchbench {
namespace {

using namespace std::chrono_literals;
using core::ImageCacheManager;
using core::ImageSpec;

class ImageCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime_ = std::make_shared<test::FakeRuntime>();
        core::ImageCacheOptions options;
        options.cache_dir = cache_dir_.Path();
        options.retry = core::RetryPolicy{2, 10ms};
        cache_ = std::make_unique<ImageCacheManager>(runtime_, options);
    }

    static ImageSpec DockerfileSpec(const std::string& extra = "") {
        ImageSpec spec;
        spec.base = "python:3.9-slim";
        spec.dockerfile = "FROM python:3.9-slim\nRUN pip install pytest" + extra + "\n";
        return spec;
    }

    test::TempDir cache_dir_;
    std::shared_ptr<test::FakeRuntime> runtime_;
    std::unique_ptr<ImageCacheManager> cache_;
};

// ============================================================================
// Identity
// ============================================================================

TEST_F(ImageCacheTest, TagIsDeterministicPerSpec) {
    EXPECT_EQ(ImageCacheManager::TagFor(DockerfileSpec()), ImageCacheManager::TagFor(DockerfileSpec()));
    EXPECT_NE(ImageCacheManager::TagFor(DockerfileSpec()), ImageCacheManager::TagFor(DockerfileSpec("==8")));
    EXPECT_EQ(ImageCacheManager::TagFor(DockerfileSpec()).rfind("patchbench-env:", 0), 0u);
}

TEST_F(ImageCacheTest, TransientSignatures) {
    EXPECT_TRUE(ImageCacheManager::IsTransientFailure("curl: (6) Could not resolve host: pypi.org"));
    EXPECT_TRUE(ImageCacheManager::IsTransientFailure("net/http: TLS handshake timeout"));
    EXPECT_FALSE(ImageCacheManager::IsTransientFailure("ERROR: No matching distribution found for nope"));
}

// ============================================================================
// Build and Reuse
// ============================================================================

TEST_F(ImageCacheTest, BuildsOnceThenReuses) {
    auto first = cache_->Resolve(DockerfileSpec());
    ASSERT_TRUE(core::Succeeded(first)) << core::FailureOf(first).cause;
    EXPECT_TRUE(core::ValueOf(first).built);

    auto second = cache_->Resolve(DockerfileSpec());
    ASSERT_TRUE(core::Succeeded(second));
    EXPECT_FALSE(core::ValueOf(second).built);
    EXPECT_EQ(core::ValueOf(first).tag, core::ValueOf(second).tag);

    EXPECT_EQ(runtime_->BuildCalls(), 1);
    EXPECT_TRUE(std::filesystem::exists(cache_dir_.Path() / core::ValueOf(first).spec_hash / "Dockerfile"));
    EXPECT_TRUE(std::filesystem::exists(cache_dir_.Path() / core::ValueOf(first).spec_hash / "image.json"));
}

TEST_F(ImageCacheTest, ConcurrentRequestsShareOneBuild) {
    runtime_->build_delay = 300ms;
    constexpr int kRequests = 8;

    std::vector<std::future<core::StageResult<core::ImageRef>>> futures;
    for (int i = 0; i < kRequests; ++i) {
        futures.push_back(std::async(std::launch::async, [this]() { return cache_->Resolve(DockerfileSpec()); }));
    }

    std::string tag;
    for (auto& future : futures) {
        auto result = future.get();
        ASSERT_TRUE(core::Succeeded(result));
        if (tag.empty()) tag = core::ValueOf(result).tag;
        EXPECT_EQ(core::ValueOf(result).tag, tag);
    }

    EXPECT_EQ(runtime_->BuildCalls(), 1) << "identical specs must not build concurrently";
    EXPECT_EQ(cache_->BuildCount(), 1u);
}

TEST_F(ImageCacheTest, DistinctSpecsBuildSeparately) {
    ASSERT_TRUE(core::Succeeded(cache_->Resolve(DockerfileSpec("==7"))));
    ASSERT_TRUE(core::Succeeded(cache_->Resolve(DockerfileSpec("==8"))));

    EXPECT_EQ(runtime_->BuildCalls(), 2);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(ImageCacheTest, TransientFailureIsRetried) {
    runtime_->transient_build_failures = 1;

    auto result = cache_->Resolve(DockerfileSpec());

    ASSERT_TRUE(core::Succeeded(result)) << core::FailureOf(result).cause;
    EXPECT_EQ(runtime_->BuildCalls(), 2);
}

TEST_F(ImageCacheTest, DeterministicFailureIsNotRetried) {
    runtime_->fail_builds = true;

    auto result = cache_->Resolve(DockerfileSpec());

    ASSERT_FALSE(core::Succeeded(result));
    EXPECT_EQ(core::FailureOf(result).stage, core::Stage::IMAGE);
    EXPECT_EQ(core::FailureOf(result).kind, core::FailureKind::IMAGE_BUILD_FAILED);
    EXPECT_FALSE(core::FailureOf(result).transient);
    EXPECT_EQ(runtime_->BuildCalls(), 1);
}

TEST_F(ImageCacheTest, FailedBuildCanBeRetriedLater) {
    runtime_->fail_builds = true;
    ASSERT_FALSE(core::Succeeded(cache_->Resolve(DockerfileSpec())));

    runtime_->fail_builds = false;
    EXPECT_TRUE(core::Succeeded(cache_->Resolve(DockerfileSpec())));
    EXPECT_EQ(runtime_->BuildCalls(), 2);
}

TEST_F(ImageCacheTest, RetriesAreBounded) {
    runtime_->transient_build_failures = 10;

    auto result = cache_->Resolve(DockerfileSpec());

    ASSERT_FALSE(core::Succeeded(result));
    EXPECT_TRUE(core::FailureOf(result).transient);
    EXPECT_EQ(runtime_->BuildCalls(), 3) << "one attempt plus two retries";
}

// ============================================================================
// Plain Tags
// ============================================================================

TEST_F(ImageCacheTest, PlainBaseTagIsPulledNotBuilt) {
    ImageSpec spec;
    spec.base = "python:3.11";

    auto result = cache_->Resolve(spec);

    ASSERT_TRUE(core::Succeeded(result));
    EXPECT_EQ(core::ValueOf(result).tag, "python:3.11");
    EXPECT_EQ(runtime_->BuildCalls(), 0);
    EXPECT_TRUE(runtime_->ImageExists("python:3.11"));
}

TEST_F(ImageCacheTest, EmptySpecFails) {
    auto result = cache_->Resolve(ImageSpec{});

    ASSERT_FALSE(core::Succeeded(result));
    EXPECT_EQ(core::FailureOf(result).kind, core::FailureKind::IMAGE_BUILD_FAILED);
}

// ============================================================================
// Runtime Store
// ============================================================================

TEST_F(ImageCacheTest, PrunedImageIsRebuilt) {
    auto first = cache_->Resolve(DockerfileSpec());
    ASSERT_TRUE(core::Succeeded(first));

    runtime_->RemoveImage(core::ValueOf(first).tag);

    auto second = cache_->Resolve(DockerfileSpec());
    ASSERT_TRUE(core::Succeeded(second)) << core::FailureOf(second).cause;
    EXPECT_TRUE(core::ValueOf(second).built);
    EXPECT_EQ(runtime_->BuildCalls(), 2);
    EXPECT_TRUE(runtime_->ImageExists(core::ValueOf(second).tag));
}

TEST_F(ImageCacheTest, PrunedBaseTagIsPulledAgain) {
    ImageSpec spec;
    spec.base = "python:3.11";

    ASSERT_TRUE(core::Succeeded(cache_->Resolve(spec)));
    runtime_->RemoveImage("python:3.11");

    ASSERT_TRUE(core::Succeeded(cache_->Resolve(spec)));
    EXPECT_EQ(runtime_->PullCalls(), 2);
    EXPECT_TRUE(runtime_->ImageExists("python:3.11"));
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(ImageCacheTest, CancelStopsBuildInProgress) {
    runtime_->build_delay = 30s;
    utils::CancellationToken cancel;

    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(100ms);
        cancel.Cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto result = cache_->Resolve(DockerfileSpec(), &cancel);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_FALSE(core::Succeeded(result));
    EXPECT_EQ(core::FailureOf(result).kind, core::FailureKind::CANCELLED);
    EXPECT_LT(elapsed, 5s);
    EXPECT_EQ(runtime_->BuildCalls(), 1) << "a cancelled build is not retried";
    EXPECT_FALSE(runtime_->ImageExists(ImageCacheManager::TagFor(DockerfileSpec())));
}

TEST_F(ImageCacheTest, CancelStopsPullInProgress) {
    runtime_->build_delay = 30s;
    utils::CancellationToken cancel;
    ImageSpec spec;
    spec.base = "python:3.11";

    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(100ms);
        cancel.Cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto result = cache_->Resolve(spec, &cancel);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_FALSE(core::Succeeded(result));
    EXPECT_EQ(core::FailureOf(result).kind, core::FailureKind::CANCELLED);
    EXPECT_LT(elapsed, 5s);
}

TEST_F(ImageCacheTest, WaiterBuildsWhenOwnerIsCancelled) {
    runtime_->build_delay = 500ms;
    utils::CancellationToken owner_cancel;

    auto owner = std::async(std::launch::async, [&]() { return cache_->Resolve(DockerfileSpec(), &owner_cancel); });
    std::this_thread::sleep_for(100ms);
    auto waiter = std::async(std::launch::async, [&]() { return cache_->Resolve(DockerfileSpec()); });
    std::this_thread::sleep_for(100ms);
    owner_cancel.Cancel();

    auto owner_result = owner.get();
    auto waiter_result = waiter.get();

    ASSERT_FALSE(core::Succeeded(owner_result));
    EXPECT_EQ(core::FailureOf(owner_result).kind, core::FailureKind::CANCELLED);
    ASSERT_TRUE(core::Succeeded(waiter_result)) << core::FailureOf(waiter_result).cause;
    EXPECT_EQ(runtime_->BuildCalls(), 2);
}

} // namespace
} // namespace patchbench
