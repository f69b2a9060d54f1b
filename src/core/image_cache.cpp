/**
 * @file image_cache.cpp
 * @brief Image resolution with a per-spec build lock
 *
 * **Cache Layout**:
 * ```
 * <cache_dir>/<spec hash>/Dockerfile    build context
 * <cache_dir>/<spec hash>/image.json    {tag, spec_hash, base, built_at}
 * ```
 *
 * @date 2025
 */

#include "patchbench/core/image_cache.hpp"
#include "patchbench/utils/hash_utils.hpp"
#include "patchbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>

using json = nlohmann::json;

namespace patchbench {
namespace core {

namespace {

constexpr std::size_t kTagHashLength = 16;

// Exit output is truncated to keep failure causes readable
std::string Tail(const std::string& text, std::size_t max_chars = 2000) {
    if (text.size() <= max_chars) {
        return text;
    }
    return "..." + text.substr(text.size() - max_chars);
}

} // anonymous namespace

ImageCacheManager::ImageCacheManager(std::shared_ptr<utils::ContainerRuntime> runtime,
                                     const ImageCacheOptions& options)
    : runtime_(std::move(runtime))
    , options_(options) {
    spdlog::debug("Image cache at {}", options_.cache_dir.string());
}

// ============================================================================
// HASHING
// ============================================================================

std::string ImageCacheManager::ComputeSpecHash(const ImageSpec& spec) {
    return utils::HashUtils::ComputeSHA256(spec.dockerfile + "\n" + spec.base);
}

std::string ImageCacheManager::TagFor(const ImageSpec& spec) {
    return "patchbench-env:" + ComputeSpecHash(spec).substr(0, kTagHashLength);
}

bool ImageCacheManager::IsTransientFailure(const std::string& output) {
    static const std::vector<std::string> signatures = {
        "Could not resolve host",
        "Temporary failure in name resolution",
        "Connection timed out",
        "Connection reset",
        "TLS handshake timeout",
        "i/o timeout",
        "early EOF",
        "RPC failed"
    };

    for (const auto& signature : signatures) {
        if (utils::StringUtils::ContainsIgnoreCase(output, signature)) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// RESOLUTION
// ============================================================================

StageResult<ImageRef> ImageCacheManager::Resolve(const ImageSpec& spec,
                                                 const utils::CancellationToken* cancel) {
    // Plain base tags share the lock map so concurrent pulls are deduplicated too
    bool plain = spec.dockerfile.empty();
    std::string hash = plain ? "pull:" + spec.base : ComputeSpecHash(spec);

    std::shared_future<StageResult<ImageRef>> pending;
    std::promise<StageResult<ImageRef>> promise;

    for (;;) {
        std::uint64_t generation = 0;
        bool owner = false;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = builds_.find(hash);
            if (it != builds_.end()) {
                pending = it->second.result;
                generation = it->second.generation;
            } else {
                pending = promise.get_future().share();
                builds_.emplace(hash, PendingBuild{pending, ++generation_});
                owner = true;
            }
        }

        if (owner) {
            break;
        }

        spdlog::debug("Waiting on in-flight build for {}", plain ? spec.base : hash.substr(0, kTagHashLength));
        while (pending.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
            if (cancel && cancel->IsCancelled()) {
                return MakeFailure(Stage::IMAGE, FailureKind::CANCELLED,
                                   "cancelled while waiting for image build");
            }
        }

        StageResult<ImageRef> shared = pending.get();
        if (!Succeeded(shared)) {
            // Another caller's cancellation is not ours; its entry is already gone
            if (FailureOf(shared).kind == FailureKind::CANCELLED && !(cancel && cancel->IsCancelled())) {
                continue;
            }
            return shared;
        }

        // The runtime store may have lost the image since it was remembered
        if (!runtime_->ImageExists(ValueOf(shared).tag)) {
            spdlog::info("Image {} is no longer in the runtime store; resolving again", ValueOf(shared).tag);
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = builds_.find(hash);
            if (it != builds_.end() && it->second.generation == generation) {
                builds_.erase(it);
            }
            continue;
        }

        ValueOf(shared).built = false;
        return shared;
    }

    StageResult<ImageRef> result = MakeFailure(Stage::IMAGE, FailureKind::INTERNAL_ERROR,
                                               "image build did not complete");
    try {
        result = plain ? ResolveBaseTag(spec, cancel) : BuildOrReuse(spec, hash, cancel);
    }
    catch (const std::exception& e) {
        result = MakeFailure(Stage::IMAGE, FailureKind::INTERNAL_ERROR,
                             std::string("image cache error: ") + e.what());
    }

    // Failed builds are forgotten so a later instance can try again
    if (!Succeeded(result)) {
        std::lock_guard<std::mutex> lock(mutex_);
        builds_.erase(hash);
    }

    promise.set_value(result);
    return result;
}

StageResult<ImageRef> ImageCacheManager::ResolveBaseTag(const ImageSpec& spec,
                                                        const utils::CancellationToken* cancel) {
    if (spec.base.empty()) {
        return MakeFailure(Stage::IMAGE, FailureKind::IMAGE_BUILD_FAILED,
                           "image spec has neither a base tag nor a Dockerfile");
    }

    if (runtime_->ImageExists(spec.base)) {
        return ImageRef{spec.base, "", false};
    }

    return RetryTransient(options_.retry, cancel, [&](int attempt) -> StageResult<ImageRef> {
        if (attempt > 0) {
            spdlog::warn("Retrying pull of {} (attempt {})", spec.base, attempt + 1);
        }

        auto pulled = runtime_->PullImage(spec.base, options_.build_timeout, cancel);
        if (pulled.success) {
            return ImageRef{spec.base, "", false};
        }
        if (pulled.cancelled) {
            return MakeFailure(Stage::IMAGE, FailureKind::CANCELLED, "cancelled during pull of " + spec.base);
        }

        std::string output = pulled.stderr_output + pulled.stdout_output;
        return MakeFailure(Stage::IMAGE, FailureKind::IMAGE_BUILD_FAILED,
                           "pull of " + spec.base + " failed: " + Tail(utils::StringUtils::Trim(output)),
                           IsTransientFailure(output));
    });
}

StageResult<ImageRef> ImageCacheManager::BuildOrReuse(const ImageSpec& spec, const std::string& hash,
                                                      const utils::CancellationToken* cancel) {
    std::string tag = "patchbench-env:" + hash.substr(0, kTagHashLength);

    if (runtime_->ImageExists(tag)) {
        spdlog::info("Image cache hit: {}", tag);
        return ImageRef{tag, hash, false};
    }

    std::filesystem::path context_dir = options_.cache_dir / hash;
    std::filesystem::create_directories(context_dir);
    {
        std::ofstream dockerfile(context_dir / "Dockerfile", std::ios::binary | std::ios::trunc);
        if (!dockerfile) {
            return MakeFailure(Stage::IMAGE, FailureKind::IMAGE_BUILD_FAILED,
                               "cannot write build context in " + context_dir.string());
        }
        dockerfile << spec.dockerfile;
    }

    return RetryTransient(options_.retry, cancel, [&](int attempt) {
        if (attempt > 0) {
            spdlog::warn("Retrying build of {} after transient failure (attempt {})", tag, attempt + 1);
        }
        return BuildOnce(spec, hash, context_dir, cancel);
    });
}

StageResult<ImageRef> ImageCacheManager::BuildOnce(const ImageSpec& spec, const std::string& hash,
                                                   const std::filesystem::path& context_dir,
                                                   const utils::CancellationToken* cancel) {
    std::string tag = "patchbench-env:" + hash.substr(0, kTagHashLength);

    build_count_++;
    auto built = runtime_->BuildImage(tag, context_dir, options_.build_timeout, cancel);

    if (built.cancelled) {
        return MakeFailure(Stage::IMAGE, FailureKind::CANCELLED, "cancelled during build of " + tag);
    }

    if (!built.success) {
        std::string output = built.stderr_output + built.stdout_output;
        std::string cause = built.timed_out
            ? "image build timed out after " + std::to_string(options_.build_timeout.count()) + "s"
            : "image build failed: " + Tail(utils::StringUtils::Trim(output));
        return MakeFailure(Stage::IMAGE, FailureKind::IMAGE_BUILD_FAILED, cause,
                           IsTransientFailure(output));
    }

    ImageRef ref{tag, hash, true};
    WriteRecord(ref, spec, context_dir);

    spdlog::info("Built image {} in {}ms", tag, built.duration.count());
    return ref;
}

void ImageCacheManager::WriteRecord(const ImageRef& ref, const ImageSpec& spec,
                                    const std::filesystem::path& context_dir) const {
    json record = {
        {"tag", ref.tag},
        {"spec_hash", ref.spec_hash},
        {"base", spec.base},
        {"built_at", std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count()}
    };

    std::ofstream file(context_dir / "image.json", std::ios::trunc);
    if (!file) {
        spdlog::warn("Cannot write image record in {}", context_dir.string());
        return;
    }
    file << record.dump(2) << "\n";
}

} // namespace core
} // namespace patchbench
