/**
 * @file CandidateTableRepository.cpp
 * @brief Implementation of CandidateTableRepository.
 */

#include "infrastructure/CandidateTableRepository.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace loopbinder::infrastructure {

namespace fs = std::filesystem;

CandidateTableRepository::CandidateTableRepository(const PersistenceService& persistence)
    : m_persistence(persistence) {}

const TableSchema& CandidateTableRepository::Schema() {
    static const TableSchema schema{{
        {kCodeColumn, true},
        {kPagesColumn, true},
        {kStatusColumn, false},
    }};
    return schema;
}

std::vector<int> CandidateTableRepository::ParsePageRange(const std::string& cell, int row,
                                                          std::vector<domain::FormatIssue>& issues) {
    std::vector<int> pages;
    std::stringstream ss(cell);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = domain::Trim(token);
        if (token.empty()) continue;

        const bool digits = std::all_of(token.begin(), token.end(), [](unsigned char c){ return std::isdigit(c); });
        if (!digits || token.size() > 9 || std::stoi(token) == 0) {
            domain::FormatIssue issue;
            issue.kind = domain::FormatIssue::Kind::BadValue;
            issue.column = kPagesColumn;
            issue.value = token;
            issue.row = row;
            issues.push_back(issue);
            continue;
        }
        pages.push_back(std::stoi(token));
    }
    return pages;
}

std::string CandidateTableRepository::FormatPageRange(const std::vector<int>& pages) {
    std::string text;
    for (std::size_t i = 0; i < pages.size(); ++i) {
        if (i > 0) text += ",";
        text += std::to_string(pages[i]);
    }
    return text;
}

std::optional<domain::CandidateTable> CandidateTableRepository::load(const fs::path& tablePath) const {
    std::error_code ec;
    if (!fs::is_regular_file(tablePath, ec)) return std::nullopt;

    CsvTable csv = CsvTable::Parse(m_persistence.readText(tablePath)).conform(Schema());

    domain::CandidateTable table;
    for (std::size_t r = 0; r < csv.rowCount(); ++r) {
        const int row = static_cast<int>(r) + 1;
        domain::CandidateRow entry;
        entry.row = row;
        entry.code = domain::Trim(csv.cell(r, kCodeColumn));
        if (entry.code.empty()) {
            domain::FormatIssue issue;
            issue.kind = domain::FormatIssue::Kind::BadValue;
            issue.column = kCodeColumn;
            issue.row = row;
            table.issues.push_back(issue);
            continue;
        }
        entry.pages = ParsePageRange(csv.cell(r, kPagesColumn), row, table.issues);
        entry.status = domain::StatusFromString(csv.cell(r, kStatusColumn));
        table.rows.push_back(std::move(entry));
    }
    return table;
}

void CandidateTableRepository::save(const fs::path& tablePath, const domain::CandidateTable& table) const {
    std::error_code ec;
    CsvTable csv = fs::is_regular_file(tablePath, ec)
        ? CsvTable::Parse(m_persistence.readText(tablePath)).conform(Schema())
        : CsvTable(Schema().headers());

    for (const auto& row : table.rows) {
        if (row.row > 0 && static_cast<std::size_t>(row.row) <= csv.rowCount()) {
            csv.set(static_cast<std::size_t>(row.row) - 1, kStatusColumn, domain::StatusToString(row.status));
            continue;
        }
        csv.addRow({});
        const std::size_t r = csv.rowCount() - 1;
        csv.set(r, kCodeColumn, row.code);
        csv.set(r, kPagesColumn, FormatPageRange(row.pages));
        csv.set(r, kStatusColumn, domain::StatusToString(row.status));
    }
    m_persistence.writeTextAtomic(tablePath, csv.serialize());
}

} // namespace loopbinder::infrastructure
