/**
 * @file patch_applicator.hpp
 * @brief All-or-nothing application of a diff to a workspace
 *
 * @date 2025
 */

#pragma once

#include "patchbench/core/instance.hpp"
#include "patchbench/core/workspace_builder.hpp"
#include "patchbench/parsers/diff_parser.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace patchbench {
namespace core {

/**
 * @class PatchApplicator
 * @brief Applies unified diffs hunk by hunk, all or nothing
 *
 * Every hunk is first matched against an in-memory copy of its file. A hunk
 * matches at its recorded position shifted by the drift of earlier hunks, or
 * at most `fuzz` lines away from it; context must match exactly. Only when
 * every hunk matches are files written, each through a temporary file and a
 * rename, with the originals held in memory. A write failure restores every
 * file already touched, so a rejected or partially applicable patch always
 * leaves the workspace byte-identical to its state before the attempt.
 *
 * Paths are resolved strictly inside the workspace root: absolute paths,
 * `..` escapes and symlinks leading outside the root are rejected. Binary
 * patches are rejected.
 *
 * **Usage Example**:
 * @code
 * PatchApplicator applicator(3);
 * auto result = applicator.Apply(*workspace, spec.patch);
 * if (!result.Applied()) {
 *     spdlog::warn("Patch {}: {}", ToString(result.outcome), result.reason);
 * }
 * @endcode
 */
class PatchApplicator {
public:
    /**
     * @param fuzz Maximum positional drift (lines) tolerated per hunk
     */
    explicit PatchApplicator(int fuzz = 3);

    PatchApplicationResult Apply(const Workspace& workspace, const std::string& patch_text) const;

    /**
     * @brief Apply to an arbitrary directory treated as the workspace root
     */
    PatchApplicationResult ApplyToDirectory(const std::filesystem::path& root,
                                            const std::string& patch_text) const;

    int GetFuzz() const { return fuzz_; }

private:
    /**
     * @struct FileContent
     * @brief File split into lines, '\r' kept
     */
    struct FileContent {
        std::vector<std::string> lines;
        bool trailing_newline{true};
    };

    /// nullopt = file absent (or to be deleted)
    using PendingFile = std::optional<FileContent>;

    bool ResolveInsideRoot(const std::filesystem::path& root, const std::string& relative,
                           std::filesystem::path& resolved, std::string& error) const;
    std::optional<std::string> ApplyHunk(FileContent& content, const parsers::Hunk& hunk,
                                         long& offset, std::size_t& floor) const;
    bool Commit(const std::filesystem::path& root,
                const std::map<std::string, PendingFile>& pending,
                std::string& error) const;

    static FileContent SplitContent(const std::string& bytes);
    static std::string JoinContent(const FileContent& content);

    int fuzz_;
};

} // namespace core
} // namespace patchbench
