/**
 * @file dataset_loader.cpp
 * @brief Instance definition parsing and validation
 *
 * @date 2025
 */

#include "patchbench/core/dataset_loader.hpp"
#include "patchbench/core/workspace_builder.hpp"
#include "patchbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <map>
#include <sstream>

using json = nlohmann::json;

namespace patchbench {
namespace core {

using utils::StringUtils;

namespace {

/// Copy an optional string field, recording a type error
void ReadString(const json& j, const char* field, std::string& target, std::vector<std::string>& errors) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return;
    }
    if (!it->is_string()) {
        errors.push_back(std::string(field) + " must be a string");
        return;
    }
    target = it->get<std::string>();
}

void ReadLimits(const json& j, LimitOverrides& limits, std::vector<std::string>& errors) {
    if (!j.is_object()) {
        errors.push_back("limits must be an object");
        return;
    }

    if (j.contains("memory_mb")) {
        const auto& value = j["memory_mb"];
        if (value.is_number_unsigned() && value.get<std::size_t>() > 0) {
            limits.memory_mb = value.get<std::size_t>();
        } else {
            errors.push_back("limits.memory_mb must be a positive integer");
        }
    }

    if (j.contains("cpus")) {
        const auto& value = j["cpus"];
        if (value.is_number() && value.get<double>() > 0.0) {
            limits.cpus = value.get<double>();
        } else {
            errors.push_back("limits.cpus must be a positive number");
        }
    }

    if (j.contains("cpu_shares")) {
        const auto& value = j["cpu_shares"];
        if (value.is_number_integer() && value.get<int>() > 0) {
            limits.cpu_shares = value.get<int>();
        } else {
            errors.push_back("limits.cpu_shares must be a positive integer");
        }
    }

    if (j.contains("timeout")) {
        const auto& value = j["timeout"];
        if (value.is_number_integer() && value.get<long long>() > 0) {
            limits.timeout = std::chrono::seconds(value.get<long long>());
        } else {
            errors.push_back("limits.timeout must be a positive integer (seconds)");
        }
    }

    if (j.contains("fuzz")) {
        const auto& value = j["fuzz"];
        if (value.is_number_integer() && value.get<int>() >= 0) {
            limits.fuzz = value.get<int>();
        } else {
            errors.push_back("limits.fuzz must be a non-negative integer");
        }
    }
}

void ReadImage(const json& j, ImageSpec& image, std::vector<std::string>& errors) {
    if (j.is_string()) {
        image.base = j.get<std::string>();
        return;
    }

    if (!j.is_object()) {
        errors.push_back("image must be a tag string or an object");
        return;
    }

    ReadString(j, "base", image.base, errors);
    ReadString(j, "dockerfile", image.dockerfile, errors);

    if (image.base.empty() && image.dockerfile.empty()) {
        errors.push_back("image needs a base tag or a dockerfile");
    }
}

DefinitionEntry InvalidDocument(const std::string& source, const std::string& error) {
    DefinitionEntry entry;
    entry.source = source;
    entry.errors.push_back(error);
    return entry;
}

} // anonymous namespace

// ============================================================================
// LOADING
// ============================================================================

std::vector<DefinitionEntry> DatasetLoader::LoadFile(const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        spdlog::error("Cannot open definition file: {}", path.string());
        return {InvalidDocument(path.string(), "cannot open file")};
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto entries = LoadText(buffer.str(), path.string());
    spdlog::debug("Loaded {} definition(s) from {}", entries.size(), path.string());
    return entries;
}

std::vector<DefinitionEntry> DatasetLoader::LoadText(const std::string& text, const std::string& source) const {
    std::vector<DefinitionEntry> entries;

    if (StringUtils::Trim(text).empty()) {
        entries.push_back(InvalidDocument(source, "empty document"));
        return entries;
    }

    json document = json::parse(text, nullptr, false);

    if (!document.is_discarded()) {
        if (document.is_array()) {
            for (std::size_t i = 0; i < document.size(); ++i) {
                entries.push_back(FromJson(document[i], source + "#" + std::to_string(i)));
            }
            if (entries.empty()) {
                entries.push_back(InvalidDocument(source, "no definitions in array"));
            }
        } else {
            entries.push_back(FromJson(document, source));
        }
        return entries;
    }

    // Not a single document: try JSON Lines
    auto lines = StringUtils::SplitLines(text);
    bool any_parsed = false;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::string line = StringUtils::Trim(lines[i]);
        if (line.empty()) {
            continue;
        }

        std::string line_source = source + ":" + std::to_string(i + 1);
        json record = json::parse(line, nullptr, false);
        if (record.is_discarded()) {
            entries.push_back(InvalidDocument(line_source, "invalid JSON"));
            continue;
        }

        any_parsed = true;
        entries.push_back(FromJson(record, line_source));
    }

    if (!any_parsed) {
        entries.clear();
        entries.push_back(InvalidDocument(source, "invalid JSON"));
    }

    return entries;
}

// ============================================================================
// VALIDATION
// ============================================================================

DefinitionEntry DatasetLoader::FromJson(const json& j, const std::string& source) const {
    DefinitionEntry entry;
    entry.source = source;

    if (!j.is_object()) {
        entry.errors.push_back("definition must be a JSON object");
        return entry;
    }

    auto& spec = entry.spec;
    auto& errors = entry.errors;

    for (const char* field : kRequiredFields) {
        if (!j.contains(field)) {
            errors.push_back(std::string("missing required field: ") + field);
        }
    }
    for (const char* field : kDatasetFields) {
        if (!j.contains(field)) {
            entry.warnings.push_back(std::string("missing dataset field: ") + field);
        }
    }

    ReadString(j, "instance_id", spec.instance_id, errors);
    ReadString(j, "repo", spec.repo, errors);
    ReadString(j, "base_commit", spec.base_commit, errors);
    ReadString(j, "patch", spec.patch, errors);
    ReadString(j, "test_patch", spec.test_patch, errors);
    ReadString(j, "test_cmd", spec.test_cmd, errors);
    ReadString(j, "test_format", spec.test_format, errors);

    if (!spec.base_commit.empty() && !WorkspaceBuilder::IsSafeCommitReference(spec.base_commit)) {
        errors.push_back("base_commit must be a commit reference, not an option or whitespace");
    }

    if (j.contains("instance_id") && j["instance_id"].is_string() &&
        (spec.instance_id.empty() || !StringUtils::Contains(spec.instance_id, "__"))) {
        errors.push_back("instance_id must contain '__' (format: owner__repo-number)");
    }

    for (const char* field : {"FAIL_TO_PASS", "PASS_TO_PASS"}) {
        auto it = j.find(field);
        if (it == j.end() || it->is_null()) {
            continue;
        }

        std::string error;
        auto tests = ParseTestList(*it, field, error);
        if (!tests) {
            errors.push_back(error);
            continue;
        }

        if (std::string(field) == "FAIL_TO_PASS") {
            spec.fail_to_pass = std::move(*tests);
        } else {
            spec.pass_to_pass = std::move(*tests);
        }
    }

    if (j.contains("image") && !j["image"].is_null()) {
        ReadImage(j["image"], spec.image, errors);
    }

    if (j.contains("limits") && !j["limits"].is_null()) {
        ReadLimits(j["limits"], spec.limits, errors);
    }

    if (!errors.empty()) {
        spdlog::debug("{}: {} validation error(s)", source, errors.size());
    }
    if (!entry.warnings.empty()) {
        spdlog::debug("{}: {} dataset field(s) missing", source, entry.warnings.size());
    }

    return entry;
}

std::optional<std::vector<std::string>> DatasetLoader::ParseTestList(const json& value,
                                                                     const std::string& field,
                                                                     std::string& error) {
    json list = value;

    if (value.is_string()) {
        list = json::parse(value.get<std::string>(), nullptr, false);
        if (list.is_discarded()) {
            error = field + " contains invalid JSON";
            return std::nullopt;
        }
    }

    if (!list.is_array()) {
        error = field + " must be a list of test ids";
        return std::nullopt;
    }

    std::vector<std::string> tests;
    tests.reserve(list.size());

    for (const auto& item : list) {
        if (!item.is_string()) {
            error = field + " must contain only strings";
            return std::nullopt;
        }
        tests.push_back(item.get<std::string>());
    }

    return tests;
}

void DatasetLoader::MarkDuplicates(std::vector<DefinitionEntry>& entries) {
    std::map<std::string, std::string> first_seen;

    for (auto& entry : entries) {
        const std::string& id = entry.spec.instance_id;
        if (id.empty()) {
            continue;
        }

        auto [it, inserted] = first_seen.emplace(id, entry.source);
        if (!inserted) {
            entry.errors.push_back("duplicate instance_id (first defined at " + it->second + ")");
        }
    }
}

void DatasetLoader::PromoteWarnings(std::vector<DefinitionEntry>& entries) {
    for (auto& entry : entries) {
        entry.errors.insert(entry.errors.end(), entry.warnings.begin(), entry.warnings.end());
        entry.warnings.clear();
    }
}

} // namespace core
} // namespace patchbench
