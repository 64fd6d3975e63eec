/**
 * @file EntityTableRepository.cpp
 * @brief Implementation of EntityTableRepository.
 */

#include "infrastructure/EntityTableRepository.hpp"

namespace loopbinder::infrastructure {

namespace fs = std::filesystem;

EntityTableRepository::EntityTableRepository(fs::path tablePath, const PersistenceService& persistence)
    : m_tablePath(std::move(tablePath)), m_persistence(persistence) {}

const TableSchema& EntityTableRepository::Schema() {
    static const TableSchema schema{{
        {kDocumentColumn, false},
        {kLoopColumn, true},
        {kSystemColumn, true},
        {kFolderColumn, false},
        {kHistoryColumn, false},
        {kStatusColumn, false},
    }};
    return schema;
}

bool EntityTableRepository::exists() const {
    std::error_code ec;
    return fs::is_regular_file(m_tablePath, ec);
}

EntityTableRepository::LoadResult EntityTableRepository::load() const {
    CsvTable table = readTable();

    LoadResult result;
    result.entities.reserve(table.rowCount());
    for (std::size_t r = 0; r < table.rowCount(); ++r) {
        domain::Entity entity;
        entity.row = static_cast<int>(r) + 1;
        entity.documentNo = domain::Trim(table.cell(r, kDocumentColumn));
        entity.loopNo = domain::Trim(table.cell(r, kLoopColumn));
        entity.systemNo = domain::Trim(table.cell(r, kSystemColumn));
        entity.folderName = domain::Trim(table.cell(r, kFolderColumn));
        entity.historyFolderName = domain::Trim(table.cell(r, kHistoryColumn));
        entity.status = domain::StatusFromString(table.cell(r, kStatusColumn));

        if (!entity.hasIdentity()) {
            domain::FormatIssue issue;
            issue.kind = domain::FormatIssue::Kind::BadValue;
            issue.column = entity.loopNo.empty() ? kLoopColumn : kSystemColumn;
            issue.row = entity.row;
            result.issues.push_back(issue);
        }
        result.entities.push_back(std::move(entity));
    }
    return result;
}

CsvTable EntityTableRepository::readTable() const {
    return CsvTable::Parse(m_persistence.readText(m_tablePath)).conform(Schema());
}

void EntityTableRepository::save(const domain::EntityRegistry& entities) const {
    CsvTable table = exists() ? readTable() : CsvTable(Schema().headers());
    for (const auto& entity : entities) {
        std::size_t r = 0;
        if (entity.row > 0 && static_cast<std::size_t>(entity.row) <= table.rowCount()) {
            r = static_cast<std::size_t>(entity.row) - 1;
        } else {
            table.addRow({});
            r = table.rowCount() - 1;
            table.set(r, kDocumentColumn, entity.documentNo);
            table.set(r, kLoopColumn, entity.loopNo);
            table.set(r, kSystemColumn, entity.systemNo);
        }
        table.set(r, kFolderColumn, entity.folderName);
        table.set(r, kHistoryColumn, entity.historyFolderName);
        table.set(r, kStatusColumn, domain::StatusToString(entity.status));
    }
    m_persistence.writeTextAtomic(m_tablePath, table.serialize());
}

void EntityTableRepository::createTemplate() const {
    CsvTable table(Schema().headers());
    m_persistence.writeTextAtomic(m_tablePath, table.serialize());
}

} // namespace loopbinder::infrastructure
