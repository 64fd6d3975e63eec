/**
 * @file EntityTableRepository.hpp
 * @brief Loads and saves the primary entity table.
 */

#pragma once
#include <filesystem>
#include <vector>
#include "domain/Entity.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/CsvTable.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace loopbinder::infrastructure {

/**
 * @class EntityTableRepository
 * @brief Typed access to the entity table (one CSV document).
 *
 * Columns: document no | loop no | system no | folder name |
 * history folder name | status. The two identity columns are required;
 * the others are created when absent. Any other column belongs to the
 * operator and is written back as found.
 */
class EntityTableRepository {
public:
    static constexpr const char* kDocumentColumn = "document no";
    static constexpr const char* kLoopColumn = "loop no";
    static constexpr const char* kSystemColumn = "system no";
    static constexpr const char* kFolderColumn = "folder name";
    static constexpr const char* kHistoryColumn = "history folder name";
    static constexpr const char* kStatusColumn = "status";

    struct LoadResult {
        domain::EntityRegistry entities;
        std::vector<domain::FormatIssue> issues; ///< Rows lacking an identity part.
    };

    EntityTableRepository(std::filesystem::path tablePath, const PersistenceService& persistence);

    static const TableSchema& Schema();

    bool exists() const;

    /**
     * @brief Reads every row; rows without identity are kept but reported.
     * @throws domain::IoError if the file cannot be read.
     * @throws domain::FormatError if an identity column is missing.
     */
    LoadResult load() const;

    /**
     * @brief Writes every entity back into the table on disk.
     *
     * Loaded rows (Entity::row) only get their folder, history and status
     * cells replaced; other cells and columns stay as they are in the file.
     * Entities without a row are appended.
     */
    void save(const domain::EntityRegistry& entities) const;

    /** @brief Writes an empty table containing only the header row. */
    void createTemplate() const;

    const std::filesystem::path& path() const { return m_tablePath; }

private:
    std::filesystem::path m_tablePath;
    const PersistenceService& m_persistence;

    CsvTable readTable() const;
};

} // namespace loopbinder::infrastructure
