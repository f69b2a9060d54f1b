/**
 * @file workspace_builder.hpp
 * @brief Per-instance repository checkout staged for container mounting
 *
 * @date 2025
 */

#pragma once

#include "patchbench/core/stage_result.hpp"
#include "patchbench/utils/process_utils.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace patchbench {
namespace core {

/**
 * @class Workspace
 * @brief Exclusively owned staging directory, deleted on destruction
 *
 * One Workspace belongs to one in-flight instance. It is never reused:
 * once released (explicitly or by the destructor) the directory is gone.
 */
class Workspace {
public:
    /**
     * @param root Checkout directory handed to the sandbox
     * @param owned_dir Directory deleted on release; defaults to root
     */
    Workspace(std::filesystem::path root, std::string instance_id,
              std::filesystem::path owned_dir = {});
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const std::filesystem::path& Root() const { return root_; }
    const std::string& InstanceId() const { return instance_id_; }

    /**
     * @brief Check that a relative path stays inside the workspace root
     */
    bool Contains(const std::filesystem::path& relative) const;

    /**
     * @brief Delete the directory now; idempotent
     */
    void Release();

    bool IsReleased() const { return released_; }

private:
    std::filesystem::path root_;
    std::filesystem::path owned_dir_;
    std::string instance_id_;
    bool released_{false};
};

/**
 * @struct WorkspaceOptions
 * @brief Where workspaces live and how checkouts are retried
 */
struct WorkspaceOptions {
    std::filesystem::path work_root;                        ///< Parent of all workspaces
    RetryPolicy retry{3, std::chrono::milliseconds(1000)};  ///< Transient clone retries
    std::chrono::seconds command_timeout{900};              ///< Per git command deadline
    bool shared_permissions{true};                          ///< Make the tree writable by the sandbox user
};

/**
 * @class WorkspaceBuilder
 * @brief Clones a repository and checks out the base commit
 *
 * Clone transport errors are transient and retried with backoff in a fresh
 * directory. An unreachable commit is a definite CHECKOUT_FAILED.
 */
class WorkspaceBuilder {
public:
    explicit WorkspaceBuilder(const WorkspaceOptions& options);

    /**
     * @brief Stage a fresh workspace at the given commit
     */
    StageResult<std::unique_ptr<Workspace>> Stage(const std::string& instance_id,
                                                  const std::string& repo,
                                                  const std::string& commit,
                                                  const utils::CancellationToken* cancel = nullptr);

    /**
     * @brief Map a repository reference to something git can clone
     *
     * owner/name becomes https://github.com/owner/name.git; URLs, scp-style
     * remotes and existing local paths are used unchanged.
     */
    static std::string ResolveRepositoryUrl(const std::string& repo);

    /**
     * @brief Delete leftover workspaces under the root
     *
     * Only directories named <id>_<8 hex> that carry kWorkspaceMarker are
     * removed; anything else sharing the root is left alone.
     * @return Number of directories removed
     */
    std::size_t SweepStaleWorkspaces();

    /**
     * @brief Reject commit references git would read as an option
     */
    static bool IsSafeCommitReference(const std::string& commit);

    /// File written into every allocated workspace directory
    static constexpr const char* kWorkspaceMarker = ".patchbench-workspace";
    /// Name of the checkout inside an allocated directory
    static constexpr const char* kCheckoutDirectory = "testbed";

private:
    StageResult<Done> CloneAndCheckout(const std::filesystem::path& dir,
                                       const std::string& url,
                                       const std::string& commit,
                                       const utils::CancellationToken* cancel);
    utils::ProcessResult RunGit(const std::vector<std::string>& args,
                                const utils::CancellationToken* cancel) const;
    std::filesystem::path AllocateDirectory(const std::string& instance_id) const;

    WorkspaceOptions options_;
};

} // namespace core
} // namespace patchbench
