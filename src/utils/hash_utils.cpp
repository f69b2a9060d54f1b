/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 content hashing
 * 
 * Uses the OpenSSL EVP digest interface. Files are streamed in 8KB chunks so
 * large repository files never load fully into memory.
 * 
 * **Error Handling**:
 * - File not found / unreadable: throws std::runtime_error
 * - OpenSSL context failure: throws std::runtime_error
 * 
 * @date 2025
 */

#include "patchbench/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/evp.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace patchbench {
namespace utils {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewSHA256Context() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
    return ctx;
}

std::string FinishDigest(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &length) != 1) {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }
    return HashUtils::BytesToHex(hash, length);
}

} // anonymous namespace

std::string HashUtils::ComputeSHA256(const std::string& data) {
    auto ctx = NewSHA256Context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA-256 digest");
    }
    return FinishDigest(ctx.get());
}

std::string HashUtils::ComputeFileSHA256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    auto ctx = NewSHA256Context();

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<std::size_t>(file.gcount())) != 1) {
            throw std::runtime_error("Failed to update SHA-256 digest");
        }
    }
    
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path.string());
    }

    return FinishDigest(ctx.get());
}

std::string HashUtils::ComputeTreeHash(const std::filesystem::path& root,
                                       const std::vector<std::string>& skip_names) {
    namespace fs = std::filesystem;
    
    std::vector<std::string> records;
    
    auto it = fs::recursive_directory_iterator(root, fs::directory_options::none);
    for (; it != fs::recursive_directory_iterator(); ++it) {
        const auto& entry = *it;
        const std::string name = entry.path().filename().string();
        
        if (std::find(skip_names.begin(), skip_names.end(), name) != skip_names.end()) {
            if (entry.is_directory()) {
                it.disable_recursion_pending();
            }
            continue;
        }
        
        const std::string rel = fs::relative(entry.path(), root).generic_string();
        
        if (entry.is_symlink()) {
            records.push_back("L " + rel + " " + fs::read_symlink(entry.path()).generic_string());
        } else if (entry.is_directory()) {
            records.push_back("D " + rel);
        } else if (entry.is_regular_file()) {
            records.push_back("F " + rel + " " + ComputeFileSHA256(entry.path()));
        }
    }
    
    std::sort(records.begin(), records.end());
    
    std::ostringstream joined;
    for (const auto& record : records) {
        joined << record << '\n';
    }
    
    spdlog::debug("Tree hash over {} entries under {}", records.size(), root.string());
    return ComputeSHA256(joined.str());
}

std::string HashUtils::BytesToHex(const uint8_t* data, std::size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace utils
} // namespace patchbench
