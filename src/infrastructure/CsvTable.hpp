/**
 * @file CsvTable.hpp
 * @brief Spreadsheet-format (CSV) table with a typed column schema.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace loopbinder::infrastructure {

/**
 * @struct ColumnSpec
 * @brief One named column. Required columns must be present in the file.
 */
struct ColumnSpec {
    std::string name;
    bool required = false;
};

/**
 * @struct TableSchema
 * @brief Ordered column list. Output tables are written in this order.
 */
struct TableSchema {
    std::vector<ColumnSpec> columns;

    std::vector<std::string> headers() const;
};

/**
 * @class CsvTable
 * @brief Header row plus data rows, all cells as text.
 *
 * Parsing follows RFC 4180 quoting: fields containing the delimiter, a quote
 * or a line break are quoted and embedded quotes are doubled.
 */
class CsvTable {
public:
    CsvTable() = default;
    explicit CsvTable(std::vector<std::string> headers);

    static CsvTable Parse(const std::string& text);
    std::string serialize() const;

    /**
     * @brief Checks a table against a schema.
     *
     * Columns keep their file order; missing optional columns are appended
     * empty and every row is padded to the header width. Columns the schema
     * does not name are kept untouched.
     * @throws domain::FormatError (MissingColumn) for an absent required column.
     */
    CsvTable conform(const TableSchema& schema) const;

    std::optional<std::size_t> columnIndex(const std::string& name) const;

    /** @brief Cell by column name; empty when the row is short or the column absent. */
    std::string cell(std::size_t row, const std::string& column) const;

    /** @brief Sets a cell by column name; no-op when the column is absent. */
    void set(std::size_t row, const std::string& column, std::string value);

    void addRow(std::vector<std::string> row);

    const std::vector<std::string>& headers() const { return m_headers; }
    const std::vector<std::vector<std::string>>& rows() const { return m_rows; }
    std::size_t rowCount() const { return m_rows.size(); }

    static std::vector<std::string> ParseRow(const std::string& line);
    static std::string EscapeField(const std::string& field);

private:
    std::vector<std::string> m_headers;
    std::vector<std::vector<std::string>> m_rows;
};

} // namespace loopbinder::infrastructure
