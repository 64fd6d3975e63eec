/**
 * @file PageDeduplicator.hpp
 * @brief Page-level content deduplication for one folder's merge.
 */

#pragma once
#include <filesystem>
#include <vector>
#include "domain/DocumentEngine.hpp"
#include "domain/DocumentNaming.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/FolderSnapshot.hpp"

namespace loopbinder::application {

/**
 * @struct DedupResult
 * @brief Pages that survive deduplication, in output order.
 */
struct DedupResult {
    std::vector<domain::PageRef> pages;
    std::vector<std::filesystem::path> fullyDuplicated; ///< Documents that contributed no page.
    int duplicatesSkipped = 0;
};

/**
 * @class PageDeduplicator
 * @brief Keeps the first occurrence of every distinct page content.
 *
 * Page fingerprints live only for the duration of one run() call; nothing
 * is shared between folders or persisted.
 */
class PageDeduplicator {
public:
    PageDeduplicator(domain::DocumentEngine& engine, const infrastructure::ContentHasher& hasher);

    /**
     * @brief Walks the documents in the given order, page by page.
     * @throws domain::IoError if a document cannot be read.
     */
    DedupResult run(const std::vector<std::filesystem::path>& orderedDocuments) const;

    /**
     * @brief Merge inputs of a folder in precedence order.
     *
     * Extracted-range files by page number, then source-original and other
     * documents by name, then backup copies by name. The merged output and
     * non-documents are excluded.
     */
    static std::vector<std::filesystem::path> OrderCandidates(const infrastructure::FolderSnapshot& snapshot,
                                                              const domain::NamingConvention& naming);

private:
    domain::DocumentEngine& m_engine;
    const infrastructure::ContentHasher& m_hasher;
};

} // namespace loopbinder::application
