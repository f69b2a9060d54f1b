/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation helpers
 * 
 * @date 2025
 */

#include "patchbench/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace patchbench {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(), 
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(), 
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::TrimRight(const std::string& str) {
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return std::string(str.begin(), end);
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Split string by delimiter
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);
    
    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }
    
    return tokens;
}

std::vector<std::string> StringUtils::SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }
    
    return lines;
}

std::string StringUtils::Join(const std::vector<std::string>& strings, 
                             const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }
    
    std::ostringstream oss;
    oss << strings[0];
    
    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }
    
    return oss.str();
}

// ============================================================================
// MATCHING
// ============================================================================

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && 
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

bool StringUtils::ContainsIgnoreCase(const std::string& str, const std::string& substring) {
    return ToLower(str).find(ToLower(substring)) != std::string::npos;
}

// ============================================================================
// SANITIZATION AND TRUNCATION
// ============================================================================

std::string StringUtils::SanitizeIdentifier(const std::string& str) {
    std::string result;
    result.reserve(str.length());
    
    for (char c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_' || c == '.' || c == '-') {
            result += c;
        } else {
            result += '_';
        }
    }
    
    return result;
}

std::string StringUtils::Truncate(const std::string& str, 
                                 std::size_t max_length,
                                 const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    
    if (max_length <= suffix.length()) {
        return suffix.substr(0, max_length);
    }
    
    return str.substr(0, max_length - suffix.length()) + suffix;
}

} // namespace utils
} // namespace patchbench
