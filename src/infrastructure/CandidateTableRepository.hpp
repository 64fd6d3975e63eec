/**
 * @file CandidateTableRepository.hpp
 * @brief Loads and saves the per-folder candidate table.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "domain/CandidateTable.hpp"
#include "infrastructure/CsvTable.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace loopbinder::infrastructure {

/**
 * @class CandidateTableRepository
 * @brief Typed access to "code | page range | status" tables.
 */
class CandidateTableRepository {
public:
    static constexpr const char* kCodeColumn = "code";
    static constexpr const char* kPagesColumn = "page range";
    static constexpr const char* kStatusColumn = "status";

    explicit CandidateTableRepository(const PersistenceService& persistence);

    static const TableSchema& Schema();

    /**
     * @brief Loads a folder's table.
     * @return nullopt when the file does not exist.
     * @throws domain::FormatError when the code or page range column is missing.
     * @throws domain::IoError when the file exists but cannot be read.
     */
    std::optional<domain::CandidateTable> load(const std::filesystem::path& tablePath) const;

    /**
     * @brief Writes a table back over the file at @p tablePath.
     *
     * Rows loaded from the file only get their status cell replaced, so
     * unparsed page tokens, skipped rows and extra columns survive. New rows
     * are appended in full.
     */
    void save(const std::filesystem::path& tablePath, const domain::CandidateTable& table) const;

    /**
     * @brief Parses "3, 4,12" into page numbers.
     *
     * Tokens that are not positive integers become BadValue issues and are
     * skipped; the rest of the cell is kept.
     */
    static std::vector<int> ParsePageRange(const std::string& cell, int row, std::vector<domain::FormatIssue>& issues);

    static std::string FormatPageRange(const std::vector<int>& pages);

private:
    const PersistenceService& m_persistence;
};

} // namespace loopbinder::infrastructure
