/**
 * @file ReferenceIndex.hpp
 * @brief "<document> <page>" index of the master document.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "infrastructure/PersistenceService.hpp"

namespace loopbinder::infrastructure {

struct IndexEntry {
    std::string document; ///< Lower-cased document name.
    int page = 0;         ///< 1-based page of the master document.
};

/**
 * @class ReferenceIndex
 * @brief Maps content codes to master-document pages.
 */
class ReferenceIndex {
public:
    static ReferenceIndex Parse(const std::string& text);
    static ReferenceIndex Load(const std::filesystem::path& path, const PersistenceService& persistence);

    /** @brief Pages of every entry whose document name contains the code, sorted and unique. */
    std::vector<int> pagesFor(const std::string& code) const;

    const std::vector<IndexEntry>& entries() const { return m_entries; }
    int ignoredLines() const { return m_ignoredLines; }

private:
    std::vector<IndexEntry> m_entries;
    int m_ignoredLines = 0;
};

} // namespace loopbinder::infrastructure
