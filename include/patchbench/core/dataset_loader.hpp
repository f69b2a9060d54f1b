/**
 * @file dataset_loader.hpp
 * @brief Instance definition intake and structural validation
 *
 * Reads instance definitions from JSON (one object or an array) or JSON
 * Lines and turns each into an InstanceSpec plus the list of problems found.
 *
 * **Definition**:
 * @code
 * {
 *   "instance_id": "psf__requests-2317",
 *   "repo": "psf/requests",
 *   "base_commit": "091991be0da19de9108dbe5e3752917fea3d7fdc",
 *   "patch": "diff --git a/requests/sessions.py ...",
 *   "test_patch": "diff --git a/test_requests.py ...",
 *   "FAIL_TO_PASS": "[\"test_requests.py::test_binary_method\"]",
 *   "PASS_TO_PASS": ["test_requests.py::test_basic"],
 *   "image": {"base": "python:3.9-slim", "dockerfile": "FROM python:3.9-slim\n..."},
 *   "test_cmd": "pytest -rA test_requests.py",
 *   "test_format": "pytest",
 *   "limits": {"memory_mb": 2048, "cpus": 1, "timeout": 600, "fuzz": 2}
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "patchbench/core/instance.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace patchbench {
namespace core {

/**
 * @struct DefinitionEntry
 * @brief One parsed definition and its validation errors
 */
struct DefinitionEntry {
    InstanceSpec spec;                 ///< Populated from whatever fields were usable
    std::vector<std::string> errors;   ///< Empty when the definition is valid
    std::vector<std::string> warnings; ///< Missing dataset metadata; does not block evaluation
    std::string source;                ///< file[:line or #index]

    bool Valid() const { return errors.empty(); }
};

/**
 * @class DatasetLoader
 * @brief Parses and validates instance definitions
 *
 * Required fields: instance_id (containing "__"), repo, base_commit, patch.
 * FAIL_TO_PASS / PASS_TO_PASS may be JSON lists or strings holding a
 * JSON-encoded list. A dataset record also carries kDatasetFields; those
 * missing are reported as warnings, or as errors after PromoteWarnings().
 */
class DatasetLoader {
public:
    DatasetLoader() = default;

    /**
     * @brief Load every definition in a file
     *
     * An unreadable file or unparsable document yields a single invalid
     * entry rather than an exception.
     */
    std::vector<DefinitionEntry> LoadFile(const std::filesystem::path& path) const;

    /**
     * @brief Load definitions from text (object, array or JSON Lines)
     */
    std::vector<DefinitionEntry> LoadText(const std::string& text, const std::string& source) const;

    DefinitionEntry FromJson(const nlohmann::json& j, const std::string& source) const;

    /**
     * @brief Flag every repeated instance_id in a batch
     */
    static void MarkDuplicates(std::vector<DefinitionEntry>& entries);

    /**
     * @brief Treat every warning as an error (strict dataset validation)
     */
    static void PromoteWarnings(std::vector<DefinitionEntry>& entries);

    /**
     * @brief Decode FAIL_TO_PASS / PASS_TO_PASS
     * @return nullopt with error set if the value is not a list of strings
     */
    static std::optional<std::vector<std::string>> ParseTestList(const nlohmann::json& value,
                                                                 const std::string& field,
                                                                 std::string& error);

    static constexpr const char* kRequiredFields[] = {"instance_id", "repo", "base_commit", "patch"};

    /// Fields of a complete dataset record beyond what evaluation needs
    static constexpr const char* kDatasetFields[] = {"test_patch", "problem_statement", "hints_text",
                                                     "created_at", "version", "FAIL_TO_PASS",
                                                     "PASS_TO_PASS"};
};

} // namespace core
} // namespace patchbench
