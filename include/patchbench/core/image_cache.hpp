/**
 * @file image_cache.hpp
 * @brief Content-addressed environment image cache
 *
 * Resolves an ImageSpec to a runnable image reference. Images built from a
 * Dockerfile are tagged by a hash of the spec, so identical specs share one
 * image and never rebuild. Concurrent requests for the same spec are
 * serialized through a per-key build lock: the first caller builds, later
 * callers wait on its result.
 *
 * @date 2025
 */

#pragma once

#include "patchbench/core/instance.hpp"
#include "patchbench/core/stage_result.hpp"
#include "patchbench/utils/container_utils.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace patchbench {
namespace core {

/**
 * @struct ImageRef
 * @brief Resolved, ready-to-run image
 */
struct ImageRef {
    std::string tag;          ///< Image reference passed to the runtime
    std::string spec_hash;    ///< Content hash (empty for plain base tags)
    bool built{false};        ///< Built by this call rather than reused
};

/**
 * @struct ImageCacheOptions
 * @brief Cache location and build policy
 */
struct ImageCacheOptions {
    std::filesystem::path cache_dir{".patchbench/images"};  ///< Build contexts and records
    RetryPolicy retry{1, std::chrono::milliseconds(1000)};  ///< Transient build retries
    std::chrono::seconds build_timeout{3600};              ///< Per build deadline
};

/**
 * @class ImageCacheManager
 * @brief Process-wide image cache with single-writer-per-key builds
 *
 * The runtime's image store is authoritative: a tag that already exists
 * there is reused without building. The in-process map only deduplicates
 * builds in flight and remembers successful resolutions; a remembered image
 * that has since left the store is resolved again.
 *
 * **Thread Safety**: Resolve() may be called from any number of workers.
 */
class ImageCacheManager {
public:
    ImageCacheManager(std::shared_ptr<utils::ContainerRuntime> runtime,
                      const ImageCacheOptions& options = ImageCacheOptions{});

    ImageCacheManager(const ImageCacheManager&) = delete;
    ImageCacheManager& operator=(const ImageCacheManager&) = delete;

    /**
     * @brief Resolve a spec to an image, building it if needed
     *
     * Build failures come back as IMAGE_BUILD_FAILED; transient ones (network
     * signatures in the build output) are retried per the retry policy.
     */
    StageResult<ImageRef> Resolve(const ImageSpec& spec,
                                  const utils::CancellationToken* cancel = nullptr);

    /**
     * @brief sha256 of dockerfile + "\n" + base, hex
     */
    static std::string ComputeSpecHash(const ImageSpec& spec);

    /**
     * @brief patchbench-env:<first 16 hex of the spec hash>
     */
    static std::string TagFor(const ImageSpec& spec);

    /**
     * @brief Whether runtime/git output looks like a network flake
     */
    static bool IsTransientFailure(const std::string& output);

    /// Builds actually performed by this manager
    std::size_t BuildCount() const { return build_count_.load(); }

private:
    StageResult<ImageRef> ResolveBaseTag(const ImageSpec& spec,
                                         const utils::CancellationToken* cancel);
    StageResult<ImageRef> BuildOrReuse(const ImageSpec& spec, const std::string& hash,
                                       const utils::CancellationToken* cancel);
    StageResult<ImageRef> BuildOnce(const ImageSpec& spec, const std::string& hash,
                                    const std::filesystem::path& context_dir,
                                    const utils::CancellationToken* cancel);
    void WriteRecord(const ImageRef& ref, const ImageSpec& spec,
                     const std::filesystem::path& context_dir) const;

    std::shared_ptr<utils::ContainerRuntime> runtime_;
    ImageCacheOptions options_;

    struct PendingBuild {
        std::shared_future<StageResult<ImageRef>> result;
        std::uint64_t generation;
    };

    std::mutex mutex_;
    std::map<std::string, PendingBuild> builds_;  ///< Keyed by spec hash
    std::uint64_t generation_{0};
    std::atomic<std::size_t> build_count_{0};
};

} // namespace core
} // namespace patchbench
