/**
 * @file CsvTable.cpp
 * @brief Implementation of CsvTable.
 */

#include "infrastructure/CsvTable.hpp"
#include "domain/Entity.hpp"
#include "domain/PipelineErrors.hpp"
#include <sstream>

namespace loopbinder::infrastructure {

namespace {

// Splits text into logical records, keeping line breaks that sit inside quotes.
std::vector<std::string> SplitRecords(const std::string& text) {
    std::vector<std::string> records;
    std::string current;
    bool inQuotes = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '"') {
            inQuotes = !inQuotes;
            current.push_back(c);
        } else if ((c == '\n' || c == '\r') && !inQuotes) {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
            records.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) records.push_back(current);
    return records;
}

bool IsBlank(const std::vector<std::string>& row) {
    for (const auto& field : row) {
        if (!domain::Trim(field).empty()) return false;
    }
    return true;
}

} // namespace

std::vector<std::string> TableSchema::headers() const {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& column : columns) names.push_back(column.name);
    return names;
}

CsvTable::CsvTable(std::vector<std::string> headers) : m_headers(std::move(headers)) {}

std::vector<std::string> CsvTable::ParseRow(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool inQuotes = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.push_back(c);
            }
        } else if (c == '"') {
            inQuotes = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else {
            field.push_back(c);
        }
    }
    fields.push_back(field);
    return fields;
}

std::string CsvTable::EscapeField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') escaped += "\"\"";
        else escaped.push_back(c);
    }
    escaped += "\"";
    return escaped;
}

CsvTable CsvTable::Parse(const std::string& text) {
    std::string body = text;
    // UTF-8 BOM written by spreadsheet applications
    if (body.size() >= 3 && body.compare(0, 3, "\xEF\xBB\xBF") == 0) body.erase(0, 3);

    CsvTable table;
    auto records = SplitRecords(body);
    if (records.empty()) return table;

    for (auto& header : ParseRow(records.front())) {
        table.m_headers.push_back(domain::Trim(header));
    }
    for (std::size_t i = 1; i < records.size(); ++i) {
        auto row = ParseRow(records[i]);
        if (IsBlank(row)) continue;
        table.m_rows.push_back(std::move(row));
    }
    return table;
}

std::string CsvTable::serialize() const {
    std::ostringstream out;
    auto writeRow = [&out](const std::vector<std::string>& row) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out << ',';
            out << EscapeField(row[i]);
        }
        out << "\n";
    };
    writeRow(m_headers);
    for (const auto& row : m_rows) writeRow(row);
    return out.str();
}

std::optional<std::size_t> CsvTable::columnIndex(const std::string& name) const {
    for (std::size_t i = 0; i < m_headers.size(); ++i) {
        if (m_headers[i] == name) return i;
    }
    return std::nullopt;
}

std::string CsvTable::cell(std::size_t row, const std::string& column) const {
    auto index = columnIndex(column);
    if (!index || row >= m_rows.size() || *index >= m_rows[row].size()) return {};
    return m_rows[row][*index];
}

void CsvTable::set(std::size_t row, const std::string& column, std::string value) {
    auto index = columnIndex(column);
    if (!index || row >= m_rows.size()) return;
    if (*index >= m_rows[row].size()) m_rows[row].resize(*index + 1);
    m_rows[row][*index] = std::move(value);
}

void CsvTable::addRow(std::vector<std::string> row) {
    row.resize(m_headers.size());
    m_rows.push_back(std::move(row));
}

CsvTable CsvTable::conform(const TableSchema& schema) const {
    CsvTable result(m_headers);
    for (const auto& column : schema.columns) {
        if (columnIndex(column.name)) continue;
        if (column.required) {
            domain::FormatIssue issue;
            issue.kind = domain::FormatIssue::Kind::MissingColumn;
            issue.column = column.name;
            throw domain::FormatError(issue);
        }
        result.m_headers.push_back(column.name);
    }

    result.m_rows = m_rows;
    for (auto& row : result.m_rows) {
        if (row.size() < result.m_headers.size()) row.resize(result.m_headers.size());
    }
    return result;
}

} // namespace loopbinder::infrastructure
