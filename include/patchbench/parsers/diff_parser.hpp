/**
 * @file diff_parser.hpp
 * @brief Parser for unified and git-style diffs
 *
 * Splits patch text into per-file patches and hunks. Text before the first
 * file header (commit messages, `git format-patch` mail headers) is ignored.
 * Line content is kept byte-exact, including any trailing '\r'.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace patchbench {
namespace parsers {

/**
 * @enum LineKind
 * @brief Role of a line inside a hunk
 */
enum class LineKind {
    CONTEXT,    ///< ' ' present on both sides
    ADDITION,   ///< '+' new side only
    DELETION    ///< '-' old side only
};

/**
 * @struct HunkLine
 * @brief One body line of a hunk
 */
struct HunkLine {
    LineKind kind{LineKind::CONTEXT};   ///< Line role
    std::string text;                   ///< Content without prefix or newline
    bool no_newline{false};             ///< Followed by "\ No newline at end of file"
};

/**
 * @struct Hunk
 * @brief One @@ block
 */
struct Hunk {
    int old_start{0};                   ///< First old line (1-based)
    int old_count{0};                   ///< Old side length
    int new_start{0};                   ///< First new line (1-based)
    int new_count{0};                   ///< New side length
    std::string header;                 ///< The full @@ line
    std::vector<HunkLine> lines;        ///< Body

    /// Context and deletions, in order
    std::vector<std::string> OldLines() const;

    /// Context and additions, in order
    std::vector<std::string> NewLines() const;

    /// Old side ends without a trailing newline
    bool OldEndsWithoutNewline() const;

    /// New side ends without a trailing newline
    bool NewEndsWithoutNewline() const;
};

/**
 * @struct FilePatch
 * @brief Changes to one file
 */
struct FilePatch {
    std::string old_path;               ///< Prefix-stripped; empty for /dev/null
    std::string new_path;               ///< Prefix-stripped; empty for /dev/null
    bool is_new_file{false};            ///< Created by the patch
    bool is_deleted_file{false};        ///< Deleted by the patch
    bool is_rename{false};              ///< Renamed (old_path -> new_path)
    bool is_binary{false};              ///< Binary content change
    std::vector<Hunk> hunks;            ///< Text hunks

    /// Path the patch writes (old path for deletions)
    const std::string& TargetPath() const { return is_deleted_file ? old_path : new_path; }
};

/**
 * @struct DiffParseResult
 * @brief Parsed diff plus any structural errors
 */
struct DiffParseResult {
    std::vector<FilePatch> files;       ///< Files in patch order
    std::vector<std::string> errors;    ///< Malformed headers, truncated hunks

    bool Ok() const { return errors.empty(); }
    std::size_t HunkCount() const;
};

/**
 * @class DiffParser
 * @brief Unified diff parser
 *
 * **Usage Example**:
 * @code
 * DiffParser parser;
 * auto parsed = parser.Parse(patch_text);
 * if (!parsed.Ok()) {
 *     for (const auto& error : parsed.errors) spdlog::error("{}", error);
 * }
 * for (const auto& file : parsed.files) {
 *     spdlog::info("{}: {} hunks", file.TargetPath(), file.hunks.size());
 * }
 * @endcode
 */
class DiffParser {
public:
    DiffParser();

    /**
     * @brief Parse patch text
     * @param diff_text Unified diff, git extended headers allowed
     * @return Files and errors; never throws on malformed input
     */
    DiffParseResult Parse(const std::string& diff_text) const;

    /**
     * @brief Normalize a header path
     *
     * Removes a trailing tab-separated timestamp, git quoting and the a/ or
     * b/ prefix; /dev/null becomes an empty string.
     */
    static std::string NormalizePath(const std::string& raw);
};

} // namespace parsers
} // namespace patchbench
