/**
 * @file FolderSnapshot.hpp
 * @brief Immutable directory listing captured before a stage mutates anything.
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace loopbinder::infrastructure {

/**
 * @struct FolderEntry
 * @brief One directory entry as seen when the snapshot was taken.
 */
struct FolderEntry {
    std::string name;
    std::filesystem::path path;
    std::uintmax_t sizeBytes = 0;
    bool isDirectory = false;
};

/**
 * @class FolderSnapshot
 * @brief Sorted, hidden-file-free listing of one directory.
 *
 * Files created while a stage runs are not visible through a snapshot taken
 * before they existed.
 */
class FolderSnapshot {
public:
    /**
     * @brief Lists a directory (non-recursive). Hidden entries are skipped.
     * @throws std::filesystem::filesystem_error if the directory cannot be read.
     */
    static FolderSnapshot Capture(const std::filesystem::path& directory);

    const std::filesystem::path& directory() const { return m_directory; }
    const std::vector<FolderEntry>& entries() const { return m_entries; }

    std::vector<FolderEntry> files() const;
    std::vector<FolderEntry> subdirectories() const;

    bool contains(const std::string& name) const;
    bool empty() const { return m_entries.empty(); }

private:
    std::filesystem::path m_directory;
    std::vector<FolderEntry> m_entries;
};

} // namespace loopbinder::infrastructure
