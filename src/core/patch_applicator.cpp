/**
 * @file patch_applicator.cpp
 * @brief Two-phase patch application with rollback
 *
 * **Phase 1 (match)**: every file touched by the diff is loaded once into
 * memory and each hunk is matched and applied to that copy. Nothing on disk
 * changes in this phase.
 *
 * **Phase 2 (commit)**: only reached when every hunk matched. Each file's
 * original bytes and permissions are recorded, then the new content is
 * written to a sibling temporary file and renamed over the target. Any
 * failure restores all recorded originals and removes directories the
 * commit created.
 *
 * **Hunk Matching**:
 * ```
 * expected = old_start - 1 + offset      (offset = drift of earlier hunks)
 * try expected, expected-1, expected+1, ... expected-fuzz, expected+fuzz
 * ```
 * Candidates never overlap text produced by an earlier hunk.
 *
 * @date 2025
 */

#include "patchbench/core/patch_applicator.hpp"
#include "patchbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace patchbench {
namespace core {

namespace fs = std::filesystem;

namespace {

std::string ReadBytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot read " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void WriteBytes(const fs::path& path, const std::string& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("cannot write " + path.string());
    }
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        throw std::runtime_error("write failed for " + path.string());
    }
}

struct Backup {
    fs::path path;
    bool existed{false};
    std::string bytes;
    fs::perms perms{fs::perms::none};
};

void Restore(const std::vector<Backup>& backups, const std::vector<fs::path>& created_dirs) {
    for (auto it = backups.rbegin(); it != backups.rend(); ++it) {
        std::error_code ec;
        if (it->existed) {
            try {
                WriteBytes(it->path, it->bytes);
                fs::permissions(it->path, it->perms, fs::perm_options::replace, ec);
            }
            catch (const std::exception& e) {
                spdlog::error("Rollback could not restore {}: {}", it->path.string(), e.what());
            }
        } else {
            fs::remove(it->path, ec);
        }
    }

    for (auto it = created_dirs.rbegin(); it != created_dirs.rend(); ++it) {
        std::error_code ec;
        fs::remove(*it, ec);
    }
}

} // anonymous namespace

PatchApplicator::PatchApplicator(int fuzz)
    : fuzz_(fuzz < 0 ? 0 : fuzz) {
}

PatchApplicationResult PatchApplicator::Apply(const Workspace& workspace,
                                              const std::string& patch_text) const {
    return ApplyToDirectory(workspace.Root(), patch_text);
}

PatchApplicationResult PatchApplicator::ApplyToDirectory(const fs::path& root,
                                                         const std::string& patch_text) const {
    PatchApplicationResult result;

    parsers::DiffParser parser;
    auto parsed = parser.Parse(patch_text);
    result.total_hunks = static_cast<int>(parsed.HunkCount());

    if (parsed.files.empty()) {
        result.reason = "patch contains no file changes";
        return result;
    }
    if (!parsed.Ok()) {
        result.reason = "malformed patch: " + utils::StringUtils::Join(parsed.errors, "; ");
        return result;
    }

    std::map<std::string, PendingFile> pending;

    auto load = [&](const std::string& relative, const fs::path& resolved) -> PendingFile {
        auto it = pending.find(relative);
        if (it != pending.end()) {
            return it->second;
        }
        std::error_code ec;
        if (!fs::exists(resolved, ec)) {
            return std::nullopt;
        }
        if (!fs::is_regular_file(resolved, ec)) {
            throw std::runtime_error(relative + " is not a regular file");
        }
        return SplitContent(ReadBytes(resolved));
    };

    auto reject_all = [&](const parsers::FilePatch& file, const std::string& why) {
        if (file.hunks.empty()) {
            result.rejected_hunks.push_back(file.TargetPath() + ": " + why);
        }
        for (const auto& hunk : file.hunks) {
            result.rejected_hunks.push_back(file.TargetPath() + " " + hunk.header + ": " + why);
        }
    };

    // Phase 1: match every hunk in memory
    for (const auto& file : parsed.files) {
        if (file.is_binary) {
            result.reason = "binary patch for " + file.TargetPath() + " is not supported";
            result.applied_hunks = 0;
            result.rejected_hunks.clear();
            return result;
        }

        std::string source = file.is_new_file ? file.new_path
                           : (file.old_path.empty() ? file.new_path : file.old_path);
        std::string target = file.TargetPath();

        fs::path source_path;
        fs::path target_path;
        std::string path_error;
        if (!ResolveInsideRoot(root, source, source_path, path_error) ||
            !ResolveInsideRoot(root, target, target_path, path_error)) {
            result.reason = path_error;
            result.applied_hunks = 0;
            result.rejected_hunks.clear();
            return result;
        }

        PendingFile current;
        try {
            current = load(source, source_path);
        }
        catch (const std::exception& e) {
            reject_all(file, e.what());
            continue;
        }

        FileContent content;
        if (file.is_new_file) {
            if (current && !current->lines.empty()) {
                reject_all(file, "file already exists");
                continue;
            }
        } else if (!current) {
            reject_all(file, "file not found");
            continue;
        } else {
            content = *current;
        }

        if (file.is_rename && source != target) {
            PendingFile existing_target;
            try {
                existing_target = load(target, target_path);
            }
            catch (const std::exception& e) {
                reject_all(file, e.what());
                continue;
            }
            if (existing_target) {
                reject_all(file, "rename target already exists");
                continue;
            }
        }

        long offset = 0;
        std::size_t floor = 0;
        int file_failures = 0;

        for (const auto& hunk : file.hunks) {
            auto error = ApplyHunk(content, hunk, offset, floor);
            if (error) {
                result.rejected_hunks.push_back(target + " " + hunk.header + ": " + *error);
                file_failures++;
            } else {
                result.applied_hunks++;
            }
        }

        if (file_failures > 0) {
            continue;
        }

        if (file.is_deleted_file) {
            if (!content.lines.empty()) {
                reject_all(file, "deleted file has content the patch does not remove");
                result.applied_hunks -= static_cast<int>(file.hunks.size());
                continue;
            }
            pending[source] = std::nullopt;
        } else {
            if (file.is_rename && source != target) {
                pending[source] = std::nullopt;
            }
            pending[target] = content;
        }
    }

    if (!result.rejected_hunks.empty()) {
        result.outcome = result.applied_hunks > 0 ? PatchOutcome::PARTIALLY_APPLIED : PatchOutcome::REJECTED;
        result.reason = std::to_string(result.rejected_hunks.size()) + " of " +
                        std::to_string(std::max(result.total_hunks, static_cast<int>(result.rejected_hunks.size()))) +
                        " hunk(s) did not apply";
        spdlog::debug("Patch not applied: {}", result.reason);
        return result;
    }

    // Phase 2: write everything or nothing
    std::string commit_error;
    if (!Commit(root, pending, commit_error)) {
        result.outcome = PatchOutcome::REJECTED;
        result.reason = "write failed, workspace restored: " + commit_error;
        result.applied_hunks = 0;
        return result;
    }

    result.outcome = PatchOutcome::APPLIED;
    for (const auto& [relative, content] : pending) {
        result.modified_files.push_back(relative);
    }

    spdlog::debug("Patch applied: {} hunk(s) across {} file(s)", result.applied_hunks, pending.size());
    return result;
}

// ============================================================================
// HUNK MATCHING
// ============================================================================

std::optional<std::string> PatchApplicator::ApplyHunk(FileContent& content, const parsers::Hunk& hunk,
                                                      long& offset, std::size_t& floor) const {
    const std::vector<std::string> old_lines = hunk.OldLines();
    const std::vector<std::string> new_lines = hunk.NewLines();
    const long size = static_cast<long>(content.lines.size());
    const long old_size = static_cast<long>(old_lines.size());

    // A zero-length old side inserts after line old_start
    long expected = (old_lines.empty() ? hunk.old_start : hunk.old_start - 1) + offset;

    auto matches_at = [&](long pos) {
        if (pos < static_cast<long>(floor) || pos < 0 || pos + old_size > size) {
            return false;
        }
        for (long k = 0; k < old_size; ++k) {
            if (content.lines[pos + k] != old_lines[k]) {
                return false;
            }
        }
        // The final newline is part of the context when the hunk reaches end of file
        if (old_size > 0 && pos + old_size == size) {
            if (hunk.OldEndsWithoutNewline() == content.trailing_newline) {
                return false;
            }
        }
        return true;
    };

    long found = -1;
    int max_drift = old_lines.empty() ? 0 : fuzz_;
    for (int drift = 0; drift <= max_drift && found < 0; ++drift) {
        if (matches_at(expected - drift)) {
            found = expected - drift;
        } else if (drift > 0 && matches_at(expected + drift)) {
            found = expected + drift;
        }
    }

    if (found < 0) {
        if (old_lines.empty()) {
            return "insertion point " + std::to_string(expected) + " is outside the file";
        }
        return "context does not match near line " + std::to_string(expected + 1) +
               " (fuzz " + std::to_string(fuzz_) + ")";
    }

    bool reaches_end = (found + old_size == size);

    content.lines.erase(content.lines.begin() + found, content.lines.begin() + found + old_size);
    content.lines.insert(content.lines.begin() + found, new_lines.begin(), new_lines.end());

    if (reaches_end) {
        content.trailing_newline = !hunk.NewEndsWithoutNewline();
    }

    offset += static_cast<long>(new_lines.size()) - old_size + (found - expected);
    floor = static_cast<std::size_t>(found) + new_lines.size();

    if (found != expected) {
        spdlog::debug("Hunk {} applied with offset {}", hunk.header, found - expected);
    }
    return std::nullopt;
}

// ============================================================================
// PATH CONFINEMENT
// ============================================================================

bool PatchApplicator::ResolveInsideRoot(const fs::path& root, const std::string& relative,
                                        fs::path& resolved, std::string& error) const {
    if (relative.empty()) {
        error = "patch names an empty path";
        return false;
    }

    fs::path rel(relative);
    if (rel.is_absolute()) {
        error = "absolute path in patch: " + relative;
        return false;
    }

    fs::path normal = rel.lexically_normal();
    if (normal.empty() || *normal.begin() == ".." || normal == ".") {
        error = "path escapes the workspace: " + relative;
        return false;
    }

    std::error_code ec;
    fs::path canonical_root = fs::weakly_canonical(root, ec);
    if (ec) {
        error = "cannot resolve workspace root: " + ec.message();
        return false;
    }

    // Symlinks may point outside even when the lexical path does not
    fs::path candidate = fs::weakly_canonical(root / normal, ec);
    if (ec) {
        error = "cannot resolve " + relative + ": " + ec.message();
        return false;
    }

    fs::path inside = candidate.lexically_relative(canonical_root);
    if (inside.empty() || *inside.begin() == "..") {
        error = "path escapes the workspace: " + relative;
        return false;
    }

    resolved = root / normal;
    return true;
}

// ============================================================================
// COMMIT
// ============================================================================

bool PatchApplicator::Commit(const fs::path& root,
                             const std::map<std::string, PendingFile>& pending,
                             std::string& error) const {
    std::vector<Backup> backups;
    std::vector<fs::path> created_dirs;

    try {
        for (const auto& [relative, content] : pending) {
            fs::path path = root / fs::path(relative).lexically_normal();

            Backup backup;
            backup.path = path;
            backup.existed = fs::exists(path);
            if (backup.existed) {
                backup.bytes = ReadBytes(path);
                backup.perms = fs::status(path).permissions();
            }
            backups.push_back(backup);

            if (!content) {
                if (backup.existed) {
                    fs::remove(path);
                }
                continue;
            }

            fs::path parent = path.parent_path();
            std::vector<fs::path> missing;
            for (fs::path dir = parent; dir != root && !fs::exists(dir); dir = dir.parent_path()) {
                missing.push_back(dir);
            }
            for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
                fs::create_directory(*it);
                created_dirs.push_back(*it);
            }

            fs::path temp = path;
            temp += ".patchbench.tmp";
            WriteBytes(temp, JoinContent(*content));
            if (backup.existed) {
                fs::permissions(temp, backup.perms, fs::perm_options::replace);
            }
            fs::rename(temp, path);
        }
    }
    catch (const std::exception& e) {
        error = e.what();
        spdlog::error("Patch commit failed, restoring workspace: {}", error);

        for (const auto& backup : backups) {
            std::error_code ec;
            fs::path temp = backup.path;
            temp += ".patchbench.tmp";
            fs::remove(temp, ec);
        }
        Restore(backups, created_dirs);
        return false;
    }

    return true;
}

// ============================================================================
// CONTENT HELPERS
// ============================================================================

PatchApplicator::FileContent PatchApplicator::SplitContent(const std::string& bytes) {
    FileContent content;
    if (bytes.empty()) {
        return content;
    }

    std::size_t start = 0;
    while (start < bytes.size()) {
        std::size_t end = bytes.find('\n', start);
        if (end == std::string::npos) {
            content.lines.push_back(bytes.substr(start));
            content.trailing_newline = false;
            return content;
        }
        content.lines.push_back(bytes.substr(start, end - start));
        start = end + 1;
    }

    content.trailing_newline = true;
    return content;
}

std::string PatchApplicator::JoinContent(const FileContent& content) {
    std::string bytes;
    for (std::size_t i = 0; i < content.lines.size(); ++i) {
        bytes += content.lines[i];
        if (i + 1 < content.lines.size() || content.trailing_newline) {
            bytes += '\n';
        }
    }
    return bytes;
}

} // namespace core
} // namespace patchbench
