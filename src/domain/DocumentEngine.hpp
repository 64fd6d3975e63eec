/**
 * @file DocumentEngine.hpp
 * @brief Interface for page-level document operations.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace loopbinder::domain {

/**
 * @struct PageRef
 * @brief One page of one physical document.
 */
struct PageRef {
    std::filesystem::path document;
    int pageIndex = 0; ///< 0-based.
};

/**
 * @class DocumentEngine
 * @brief Abstract page reader/writer. All failures are reported as IoError.
 */
class DocumentEngine {
public:
    virtual ~DocumentEngine() = default;

    /**
     * @brief Checks that the engine can run at all (tools present, etc.).
     * @param reason Filled with a human-readable cause when false is returned.
     */
    virtual bool isAvailable(std::string& reason) const = 0;

    /** @brief Number of pages in a document. */
    virtual int pageCount(const std::filesystem::path& document) = 0;

    /**
     * @brief Canonical textual/structural content of every page, in order.
     *
     * The result must not depend on binary metadata (producer, object
     * numbering, timestamps) so that re-saved copies compare equal.
     */
    virtual std::vector<std::string> pageContents(const std::filesystem::path& document) = 0;

    /**
     * @brief Writes a single page of a document as a new document.
     * @param pageNumber 1-based page number.
     */
    virtual void extractPage(const std::filesystem::path& source, int pageNumber,
                             const std::filesystem::path& destination) = 0;

    /** @brief Writes the given pages, in order, as one new document. */
    virtual void assemble(const std::vector<PageRef>& pages, const std::filesystem::path& destination) = 0;
};

} // namespace loopbinder::domain
