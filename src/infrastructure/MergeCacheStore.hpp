/**
 * @file MergeCacheStore.hpp
 * @brief Per-folder sidecar recording the fingerprint of the last successful merge.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "infrastructure/PersistenceService.hpp"

namespace loopbinder::infrastructure {

/**
 * @struct MergeCacheEntry
 * @brief Content of one sidecar file.
 */
struct MergeCacheEntry {
    std::string folder;      ///< Folder name at the time of the merge.
    std::string fingerprint; ///< Folder-scope fingerprint of the merged inputs.
    std::string timestamp;   ///< UTC, ISO-8601.
};

/**
 * @class MergeCacheStore
 * @brief Reads and writes the hidden cache sidecar of a folder.
 *
 * Entries are written only after a verified merged-output write and are
 * never shared between folders.
 */
class MergeCacheStore {
public:
    MergeCacheStore(std::string sidecarName, const PersistenceService& persistence);

    /**
     * @brief Loads the entry of a folder.
     * @return nullopt when the sidecar is absent or unreadable (treated as a miss).
     */
    std::optional<MergeCacheEntry> load(const std::filesystem::path& folder) const;

    /** @brief True if the stored fingerprint equals the given one. */
    bool matches(const std::filesystem::path& folder, const std::string& fingerprint) const;

    /**
     * @brief Persists a new entry stamped with the current time.
     * @throws domain::IoError if the sidecar cannot be written.
     */
    MergeCacheEntry store(const std::filesystem::path& folder, const std::string& fingerprint) const;

    std::filesystem::path sidecarPath(const std::filesystem::path& folder) const;

private:
    std::string m_sidecarName;
    const PersistenceService& m_persistence;

    static std::string NowUtc();
};

} // namespace loopbinder::infrastructure
