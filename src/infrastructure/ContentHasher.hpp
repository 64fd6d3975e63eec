/**
 * @file ContentHasher.hpp
 * @brief SHA-256 digests of page content and of whole file sets.
 */

#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace loopbinder::infrastructure {

/**
 * @class ContentHasher
 * @brief Thin wrapper over OpenSSL's EVP SHA-256. Digests are lower-case hex.
 */
class ContentHasher {
public:
    /** @brief Digest of an in-memory buffer (page-scope fingerprint). */
    std::string digest(std::string_view data) const;

    /** @brief Digest of one file's bytes. @throws domain::IoError */
    std::string fileDigest(const std::filesystem::path& file) const;

    /**
     * @brief Folder-scope fingerprint of a file set.
     *
     * Files are sorted by name; for each one the name, byte size and full
     * content are fed into a single digest, length-delimited so that moving
     * bytes between files changes the result.
     * @throws domain::IoError if a file cannot be read.
     */
    std::string setDigest(std::vector<std::filesystem::path> files) const;
};

} // namespace loopbinder::infrastructure
