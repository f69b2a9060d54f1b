/**
 * @file diff_parser.cpp
 * @brief Unified diff parsing
 *
 * **Recognized Headers**:
 * ```
 * diff --git a/path b/path
 * new file mode 100644 / deleted file mode 100644
 * rename from old / rename to new
 * Binary files a/x and b/x differ / GIT binary patch
 * --- a/path
 * +++ b/path
 * @@ -12,7 +12,8 @@ optional section heading
 * ```
 *
 * Hunk bodies are consumed by their declared line counts, so a body line that
 * happens to start with "--- " is never mistaken for a header.
 *
 * @date 2025
 */

#include "patchbench/parsers/diff_parser.hpp"

#include <spdlog/spdlog.h>

#include <regex>

namespace patchbench {
namespace parsers {

namespace {

bool StartsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

// Split on '\n' only; '\r' stays part of the line
std::vector<std::string> SplitRawLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;

    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }

    return lines;
}

std::string Unquote(const std::string& quoted) {
    std::string out;
    for (std::size_t i = 1; i + 1 < quoted.size(); ++i) {
        char c = quoted[i];
        if (c == '\\' && i + 2 < quoted.size()) {
            char next = quoted[++i];
            switch (next) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                default:
                    // Octal escape for non-ASCII bytes
                    if (next >= '0' && next <= '7' && i + 2 < quoted.size()) {
                        int value = (next - '0') * 64 + (quoted[i + 1] - '0') * 8 + (quoted[i + 2] - '0');
                        out += static_cast<char>(value);
                        i += 2;
                    } else {
                        out += next;
                    }
            }
        } else {
            out += c;
        }
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// HUNK HELPERS
// ============================================================================

std::vector<std::string> Hunk::OldLines() const {
    std::vector<std::string> out;
    for (const auto& line : lines) {
        if (line.kind != LineKind::ADDITION) out.push_back(line.text);
    }
    return out;
}

std::vector<std::string> Hunk::NewLines() const {
    std::vector<std::string> out;
    for (const auto& line : lines) {
        if (line.kind != LineKind::DELETION) out.push_back(line.text);
    }
    return out;
}

bool Hunk::OldEndsWithoutNewline() const {
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (it->kind != LineKind::ADDITION) return it->no_newline;
    }
    return false;
}

bool Hunk::NewEndsWithoutNewline() const {
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (it->kind != LineKind::DELETION) return it->no_newline;
    }
    return false;
}

std::size_t DiffParseResult::HunkCount() const {
    std::size_t count = 0;
    for (const auto& file : files) {
        count += file.hunks.size();
    }
    return count;
}

// ============================================================================
// PARSER
// ============================================================================

DiffParser::DiffParser() {
    spdlog::debug("Diff parser initialized");
}

std::string DiffParser::NormalizePath(const std::string& raw) {
    std::string path = raw;

    if (!path.empty() && path.front() == '"') {
        std::size_t close = path.find('"', 1);
        while (close != std::string::npos && path[close - 1] == '\\') {
            close = path.find('"', close + 1);
        }
        path = Unquote(path.substr(0, close == std::string::npos ? path.size() : close + 1));
    } else {
        std::size_t tab = path.find('\t');
        if (tab != std::string::npos) {
            path = path.substr(0, tab);
        }
        while (!path.empty() && (path.back() == ' ' || path.back() == '\r')) {
            path.pop_back();
        }
    }

    if (path == "/dev/null") {
        return "";
    }

    if (StartsWith(path, "a/") || StartsWith(path, "b/")) {
        path = path.substr(2);
    }

    return path;
}

DiffParseResult DiffParser::Parse(const std::string& diff_text) const {
    static const std::regex hunk_regex(R"(^@@ -(\d+)(?:,(\d+))? \+(\d+)(?:,(\d+))? @@(.*)$)");
    static const std::regex git_header_regex(R"(^diff --git (\S+) (\S+)\s*$)");

    DiffParseResult result;
    std::vector<std::string> lines = SplitRawLines(diff_text);

    FilePatch* current = nullptr;
    bool saw_old_header = false;

    auto start_file = [&]() {
        result.files.emplace_back();
        current = &result.files.back();
        saw_old_header = false;
    };

    std::size_t i = 0;
    while (i < lines.size()) {
        const std::string& line = lines[i];

        if (StartsWith(line, "diff --git ")) {
            start_file();
            std::smatch match;
            if (std::regex_match(line, match, git_header_regex)) {
                current->old_path = NormalizePath(match[1].str());
                current->new_path = NormalizePath(match[2].str());
            }
            ++i;
            continue;
        }

        if (StartsWith(line, "--- ") && i + 1 < lines.size() && StartsWith(lines[i + 1], "+++ ")) {
            // Plain unified diffs have no "diff --git" line
            if (current == nullptr || saw_old_header || !current->hunks.empty()) {
                start_file();
            }
            saw_old_header = true;

            std::string old_raw = line.substr(4);
            std::string new_raw = lines[i + 1].substr(4);
            current->old_path = NormalizePath(old_raw);
            current->new_path = NormalizePath(new_raw);

            if (current->old_path.empty()) current->is_new_file = true;
            if (current->new_path.empty()) current->is_deleted_file = true;

            i += 2;
            continue;
        }

        if (StartsWith(line, "@@ ")) {
            std::smatch match;
            if (current == nullptr) {
                result.errors.push_back("hunk without a file header at line " + std::to_string(i + 1));
                ++i;
                continue;
            }
            if (!std::regex_match(line, match, hunk_regex)) {
                result.errors.push_back("malformed hunk header at line " + std::to_string(i + 1) + ": " + line);
                ++i;
                continue;
            }

            Hunk hunk;
            hunk.header = line;
            hunk.old_start = std::stoi(match[1].str());
            hunk.old_count = match[2].matched ? std::stoi(match[2].str()) : 1;
            hunk.new_start = std::stoi(match[3].str());
            hunk.new_count = match[4].matched ? std::stoi(match[4].str()) : 1;

            int old_remaining = hunk.old_count;
            int new_remaining = hunk.new_count;
            ++i;

            while (i < lines.size() && (old_remaining > 0 || new_remaining > 0)) {
                const std::string& body = lines[i];

                if (StartsWith(body, "\\")) {
                    if (!hunk.lines.empty()) hunk.lines.back().no_newline = true;
                    ++i;
                    continue;
                }

                HunkLine hunk_line;
                char prefix = body.empty() ? ' ' : body[0];
                hunk_line.text = body.empty() ? "" : body.substr(1);

                if (prefix == ' ') {
                    hunk_line.kind = LineKind::CONTEXT;
                    --old_remaining;
                    --new_remaining;
                } else if (prefix == '-') {
                    hunk_line.kind = LineKind::DELETION;
                    --old_remaining;
                } else if (prefix == '+') {
                    hunk_line.kind = LineKind::ADDITION;
                    --new_remaining;
                } else {
                    break;
                }

                hunk.lines.push_back(hunk_line);
                ++i;
            }

            // Trailing marker for the last body line
            if (i < lines.size() && StartsWith(lines[i], "\\") && !hunk.lines.empty()) {
                hunk.lines.back().no_newline = true;
                ++i;
            }

            if (old_remaining != 0 || new_remaining != 0) {
                result.errors.push_back("truncated or miscounted hunk in " + current->TargetPath() +
                                        ": " + hunk.header);
            }

            current->hunks.push_back(std::move(hunk));
            continue;
        }

        if (current != nullptr) {
            if (StartsWith(line, "new file mode")) {
                current->is_new_file = true;
            } else if (StartsWith(line, "deleted file mode")) {
                current->is_deleted_file = true;
            } else if (StartsWith(line, "rename from ")) {
                current->is_rename = true;
                current->old_path = NormalizePath(line.substr(12));
            } else if (StartsWith(line, "rename to ")) {
                current->is_rename = true;
                current->new_path = NormalizePath(line.substr(10));
            } else if (StartsWith(line, "Binary files ") || StartsWith(line, "GIT binary patch")) {
                current->is_binary = true;
            }
        }

        ++i;
    }

    for (const auto& file : result.files) {
        if (file.TargetPath().empty()) {
            result.errors.push_back("file patch without a usable path");
        }
    }

    spdlog::debug("Parsed diff: {} file(s), {} hunk(s), {} error(s)",
                  result.files.size(), result.HunkCount(), result.errors.size());

    return result;
}

} // namespace parsers
} // namespace patchbench
