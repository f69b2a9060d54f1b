/**
 * @file string_utils.hpp
 * @brief String manipulation helpers shared by parsers and the pipeline
 * 
 * Provides trimming, splitting, joining and matching helpers used when
 * reading diffs, test logs and command output, plus sanitization for
 * identifiers that end up in container names and file paths.
 * 
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace patchbench {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string helpers
 * 
 * All functions are static and thread-safe.
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic manipulation
     **************************************************************************/
    
    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string Trim(const std::string& str);
    
    /**
     * @brief Remove trailing whitespace only (keeps indentation)
     */
    static std::string TrimRight(const std::string& str);
    
    static std::string ToLower(const std::string& str);
    
    /**
     * @brief Split string by delimiter, skipping empty tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);
    
    /**
     * @brief Split text into lines
     * 
     * Recognizes "\n" and "\r\n". A trailing newline does not produce an
     * empty final element.
     */
    static std::vector<std::string> SplitLines(const std::string& text);
    
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);
    
    /***************************************************************************
     * Matching
     **************************************************************************/
    
    static bool StartsWith(const std::string& str, const std::string& prefix);
    
    static bool Contains(const std::string& str, const std::string& substring);
    
    /**
     * @brief Case-insensitive substring search
     */
    static bool ContainsIgnoreCase(const std::string& str, const std::string& substring);
    
    /***************************************************************************
     * Sanitization
     **************************************************************************/
    
    /**
     * @brief Reduce a string to [A-Za-z0-9_.-], replacing everything else with '_'
     * 
     * Used for container names and per-instance log directories.
     */
    static std::string SanitizeIdentifier(const std::string& str);
    
    /**
     * @brief Truncate string to max_length, appending suffix when cut
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace patchbench
