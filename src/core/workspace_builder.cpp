/**
 * @file workspace_builder.cpp
 * @brief git-based workspace staging
 *
 * **Staging Workflow**:
 * 1. Allocate <work_root>/<sanitized id>_<8 hex> holding the marker file
 * 2. git clone --no-checkout <url> <dir>/testbed
 * 3. git checkout --force --detach <commit>
 * 4. Open permissions so the non-root sandbox user can write
 *
 * A failed clone removes the checkout before the next attempt. The sweep
 * only touches directories that carry the marker.
 *
 * @date 2025
 */

#include "patchbench/core/workspace_builder.hpp"
#include "patchbench/core/image_cache.hpp"
#include "patchbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>

namespace patchbench {
namespace core {

namespace fs = std::filesystem;

// ============================================================================
// WORKSPACE
// ============================================================================

Workspace::Workspace(fs::path root, std::string instance_id, fs::path owned_dir)
    : root_(std::move(root))
    , owned_dir_(std::move(owned_dir))
    , instance_id_(std::move(instance_id)) {
    if (owned_dir_.empty()) {
        owned_dir_ = root_;
    }
}

Workspace::~Workspace() {
    Release();
}

bool Workspace::Contains(const fs::path& relative) const {
    if (relative.empty() || relative.is_absolute()) {
        return false;
    }

    int depth = 0;
    for (const auto& part : relative.lexically_normal()) {
        if (part == "..") {
            if (--depth < 0) {
                return false;
            }
        } else if (part != ".") {
            ++depth;
        }
    }
    return depth > 0;
}

void Workspace::Release() {
    if (released_) {
        return;
    }
    released_ = true;

    std::error_code ec;
    fs::remove_all(owned_dir_, ec);
    if (ec) {
        spdlog::error("[{}] Failed to remove workspace {}: {}", instance_id_, owned_dir_.string(), ec.message());
    } else {
        spdlog::debug("[{}] Workspace removed: {}", instance_id_, owned_dir_.string());
    }
}

// ============================================================================
// BUILDER
// ============================================================================

WorkspaceBuilder::WorkspaceBuilder(const WorkspaceOptions& options)
    : options_(options) {
    std::error_code ec;
    fs::create_directories(options_.work_root, ec);
    if (ec) {
        spdlog::error("Cannot create workspace root {}: {}", options_.work_root.string(), ec.message());
    }
}

std::string WorkspaceBuilder::ResolveRepositoryUrl(const std::string& repo) {
    static const std::regex owner_name(R"(^[A-Za-z0-9_.-]+/[A-Za-z0-9_.-]+$)");

    if (repo.find("://") != std::string::npos || repo.rfind("git@", 0) == 0) {
        return repo;
    }

    std::error_code ec;
    if (fs::exists(repo, ec)) {
        return fs::absolute(repo).string();
    }

    if (std::regex_match(repo, owner_name)) {
        return "https://github.com/" + repo + ".git";
    }

    return repo;
}

StageResult<std::unique_ptr<Workspace>> WorkspaceBuilder::Stage(const std::string& instance_id,
                                                                const std::string& repo,
                                                                const std::string& commit,
                                                                const utils::CancellationToken* cancel) {
    if (!IsSafeCommitReference(commit)) {
        return MakeFailure(Stage::CHECKOUT, FailureKind::CHECKOUT_FAILED,
                           "refusing commit reference '" + commit + "'");
    }

    std::string url = ResolveRepositoryUrl(repo);
    spdlog::info("[{}] Staging {} at {}", instance_id, url, commit.substr(0, 12));

    fs::path home = AllocateDirectory(instance_id);
    fs::path dir = home / kCheckoutDirectory;
    auto workspace = std::make_unique<Workspace>(dir, instance_id, home);

    {
        std::error_code ec;
        fs::create_directories(home, ec);
        std::ofstream marker(home / kWorkspaceMarker);
        if (ec || !(marker << instance_id << "\n")) {
            return MakeFailure(Stage::CHECKOUT, FailureKind::INTERNAL_ERROR,
                               "cannot create workspace " + home.string() +
                               (ec ? ": " + ec.message() : std::string()));
        }
    }

    auto staged = RetryTransient(options_.retry, cancel, [&](int attempt) {
        if (attempt > 0) {
            spdlog::warn("[{}] Retrying checkout (attempt {}/{})", instance_id,
                         attempt + 1, options_.retry.max_retries + 1);
        }

        std::error_code ec;
        fs::remove_all(dir, ec);
        return CloneAndCheckout(dir, url, commit, cancel);
    });

    if (!Succeeded(staged)) {
        return FailureOf(staged);
    }

    if (options_.shared_permissions) {
        std::error_code ec;
        const auto shared = fs::perms::owner_all | fs::perms::group_all |
                            fs::perms::others_read | fs::perms::others_write;
        fs::permissions(home, fs::perms::others_read | fs::perms::others_exec, fs::perm_options::add, ec);
        fs::permissions(dir, shared | fs::perms::others_exec, fs::perm_options::add, ec);

        for (auto it = fs::recursive_directory_iterator(dir, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code entry_ec;
            if (it->is_symlink(entry_ec)) {
                continue;
            }
            auto extra = it->is_directory(entry_ec) ? shared | fs::perms::others_exec : shared;
            fs::permissions(it->path(), extra, fs::perm_options::add, entry_ec);
            if (entry_ec) {
                spdlog::debug("[{}] Could not open permissions on {}: {}", instance_id,
                              it->path().string(), entry_ec.message());
            }
        }
        if (ec) {
            spdlog::warn("[{}] Could not open workspace permissions: {}", instance_id, ec.message());
        }
    }

    spdlog::debug("[{}] Workspace ready: {}", instance_id, dir.string());
    return std::move(workspace);
}

StageResult<Done> WorkspaceBuilder::CloneAndCheckout(const fs::path& dir,
                                                     const std::string& url,
                                                     const std::string& commit,
                                                     const utils::CancellationToken* cancel) {
    auto clone = RunGit({"clone", "--quiet", "--no-checkout", url, dir.string()}, cancel);

    if (clone.cancelled) {
        return MakeFailure(Stage::CHECKOUT, FailureKind::CANCELLED, "cancelled during clone");
    }
    if (!clone.Succeeded()) {
        std::string cause = clone.spawn_failed ? clone.error_message
                          : clone.timed_out ? "clone timed out"
                          : utils::StringUtils::Trim(clone.stderr_output);
        // A missing repository fails every attempt the same way; anything else may be transport
        bool missing = utils::StringUtils::ContainsIgnoreCase(cause, "not found") ||
                       utils::StringUtils::ContainsIgnoreCase(cause, "does not exist");
        return MakeFailure(Stage::CHECKOUT, FailureKind::CHECKOUT_FAILED,
                           "clone of " + url + " failed: " + cause,
                           !clone.spawn_failed && !missing);
    }

    auto checkout = RunGit({"-C", dir.string(), "-c", "advice.detachedHead=false",
                            "checkout", "--quiet", "--force", "--detach", commit}, cancel);

    if (checkout.cancelled) {
        return MakeFailure(Stage::CHECKOUT, FailureKind::CANCELLED, "cancelled during checkout");
    }
    if (!checkout.Succeeded()) {
        std::string output = checkout.stderr_output;
        return MakeFailure(Stage::CHECKOUT, FailureKind::CHECKOUT_FAILED,
                           "commit " + commit + " not reachable: " + utils::StringUtils::Trim(output),
                           ImageCacheManager::IsTransientFailure(output));
    }

    return Done{};
}

bool WorkspaceBuilder::IsSafeCommitReference(const std::string& commit) {
    if (commit.empty() || commit.front() == '-') {
        return false;
    }
    for (unsigned char c : commit) {
        if (std::isspace(c) || std::iscntrl(c)) {
            return false;
        }
    }
    return true;
}

std::size_t WorkspaceBuilder::SweepStaleWorkspaces() {
    static const std::regex allocated_name(R"(^.+_[0-9a-f]{8}$)");

    std::size_t removed = 0;
    std::error_code ec;

    if (!fs::exists(options_.work_root, ec)) {
        return 0;
    }

    for (const auto& entry : fs::directory_iterator(options_.work_root, ec)) {
        std::error_code remove_ec;
        if (!entry.is_directory(remove_ec) || entry.is_symlink(remove_ec)) {
            continue;
        }
        if (!std::regex_match(entry.path().filename().string(), allocated_name) ||
            !fs::is_regular_file(entry.path() / kWorkspaceMarker, remove_ec)) {
            spdlog::debug("Leaving unrecognized directory {}", entry.path().string());
            continue;
        }
        fs::remove_all(entry.path(), remove_ec);
        if (remove_ec) {
            spdlog::warn("Failed to remove stale workspace {}: {}", entry.path().string(), remove_ec.message());
        } else {
            removed++;
        }
    }

    if (removed > 0) {
        spdlog::info("Removed {} stale workspace(s) from {}", removed, options_.work_root.string());
    }
    return removed;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

utils::ProcessResult WorkspaceBuilder::RunGit(const std::vector<std::string>& args,
                                              const utils::CancellationToken* cancel) const {
    std::vector<std::string> argv = {"git"};
    argv.insert(argv.end(), args.begin(), args.end());

    utils::ProcessOptions options;
    options.timeout = options_.command_timeout;
    options.cancel = cancel;
    options.environment["GIT_TERMINAL_PROMPT"] = "0";
    options.environment["GIT_LFS_SKIP_SMUDGE"] = "1";

    spdlog::debug("$ {}", utils::FormatCommandLine(argv));
    return utils::RunProcess(argv, options);
}

fs::path WorkspaceBuilder::AllocateDirectory(const std::string& instance_id) const {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint32_t> dis;

    std::ostringstream suffix;
    suffix << std::hex << std::setw(8) << std::setfill('0') << dis(gen);

    return options_.work_root / (utils::StringUtils::SanitizeIdentifier(instance_id) + "_" + suffix.str());
}

} // namespace core
} // namespace patchbench
