/**
 * @file PersistenceService.hpp
 * @brief Atomic file writes (temp file + rename) for tables and sidecars.
 */

#pragma once
#include <filesystem>
#include <string>

namespace loopbinder::infrastructure {

/**
 * @class PersistenceService
 * @brief Writes whole files so that readers see either the old or the new content.
 *
 * Every write lands in a hidden temporary file beside the target and is
 * renamed over it once flushed. A process killed mid-write leaves the
 * previous file intact.
 */
class PersistenceService {
public:
    /**
     * @brief Atomically replaces a file with text content.
     * @throws domain::IoError when the temp file cannot be written or renamed.
     */
    void writeTextAtomic(const std::filesystem::path& target, const std::string& content) const;

    /** @brief Reads a whole file. @throws domain::IoError if it cannot be opened. */
    std::string readText(const std::filesystem::path& source) const;

    /** @brief Hidden temp path used for a target ("dir/.name.<stamp>.tmp"). */
    static std::filesystem::path TempPathFor(const std::filesystem::path& target);
};

} // namespace loopbinder::infrastructure
