/**
 * @file hash_utils.hpp
 * @brief SHA-256 content hashing for cache keys and workspace fingerprints
 * 
 * The image cache keys images by the SHA-256 of their specification, and the
 * patch applicator fingerprints the files it touches so rollback can be
 * verified byte-for-byte. All digests are lowercase hexadecimal.
 * 
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

namespace patchbench {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL-backed SHA-256 helpers
 * 
 * **Thread Safety**: All functions are reentrant.
 * 
 * **Usage Example**:
 * @code
 * std::string key = HashUtils::ComputeSHA256(dockerfile + "\n" + base_tag);
 * std::string tree = HashUtils::ComputeTreeHash(workspace.Root());
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Hash an in-memory string
     */
    static std::string ComputeSHA256(const std::string& data);
    
    /**
     * @brief Hash a file, streaming in 8KB chunks
     * @throws std::runtime_error if the file cannot be opened or read
     */
    static std::string ComputeFileSHA256(const std::filesystem::path& file_path);
    
    /**
     * @brief Fingerprint a directory tree
     * 
     * Hashes the sorted list of (relative path, file type, content digest)
     * for every entry under root. Symlinks are hashed by target, not
     * followed. Entries named in skip_names (e.g. ".git") are pruned.
     * 
     * @param root Directory to fingerprint
     * @param skip_names Directory names excluded from the walk
     * @return Hex digest; identical trees produce identical digests
     */
    static std::string ComputeTreeHash(const std::filesystem::path& root,
                                       const std::vector<std::string>& skip_names = {".git"});
    
    /**
     * @brief Convert raw bytes to lowercase hex
     */
    static std::string BytesToHex(const uint8_t* data, std::size_t size);
};

} // namespace utils
} // namespace patchbench
