/**
 * @file CandidateTable.hpp
 * @brief Per-folder table of content codes and the master-document pages they reference.
 */

#pragma once
#include <algorithm>
#include <string>
#include <vector>
#include "domain/Entity.hpp"
#include "domain/PipelineErrors.hpp"

namespace loopbinder::domain {

/**
 * @struct CandidateRow
 * @brief One content code of a folder.
 */
struct CandidateRow {
    std::string code;       ///< e.g. "AB-12".
    std::vector<int> pages; ///< 1-based pages of the master document.
    EntityStatus status = EntityStatus::Unknown;
    int row = 0;            ///< 1-based data row in the table file; 0 until saved.
};

/**
 * @struct CandidateTable
 * @brief Rows plus the recoverable issues found while loading them.
 */
struct CandidateTable {
    std::vector<CandidateRow> rows;
    std::vector<FormatIssue> issues;

    bool contains(const std::string& code) const {
        return std::any_of(rows.begin(), rows.end(), [&](const CandidateRow& r){ return r.code == code; });
    }

    /** @brief Union of all referenced pages, sorted, unique. */
    std::vector<int> allPages() const {
        std::vector<int> pages;
        for (const auto& row : rows) pages.insert(pages.end(), row.pages.begin(), row.pages.end());
        std::sort(pages.begin(), pages.end());
        pages.erase(std::unique(pages.begin(), pages.end()), pages.end());
        return pages;
    }
};

} // namespace loopbinder::domain
