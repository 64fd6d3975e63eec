/**
 * @file SourceStore.hpp
 * @brief Read-only view of the directory holding source-original documents.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace loopbinder::infrastructure {

/**
 * @class SourceStore
 * @brief Resolves a document reference to a file in the store.
 *
 * The listing is captured once at construction; the store is not expected
 * to change during a run.
 */
class SourceStore {
public:
    SourceStore(std::filesystem::path directory, std::string documentExtension = ".pdf");

    /**
     * @brief Finds the file for a reference.
     *
     * Exact file name first (case-insensitive), then the first document whose
     * lower-cased name contains "(<reference>)".
     * @throws domain::LookupError when nothing matches.
     */
    std::filesystem::path locate(const std::string& reference) const;

    std::size_t size() const { return m_files.size(); }

private:
    struct StoredFile {
        std::string lowerName;
        std::filesystem::path path;
    };

    std::filesystem::path m_directory;
    std::string m_extension;
    std::vector<StoredFile> m_files;
};

} // namespace loopbinder::infrastructure
