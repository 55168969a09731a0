// =============================================================================
// guidfix - Delimited Table I/O
// =============================================================================
// RFC 4180 style reading and writing of one spreadsheet sheet.
//
// Sheets are exchanged as delimited text, one file per sheet. Quoted fields
// may contain the delimiter, doubled quotes and embedded line breaks, which
// is how spreadsheet exports carry the wrapped identifier cells.
//
// Usage:
//   auto table = readCsvFile("parameters.csv");
//   if (!table) { ... table.error().message() ... }
//   auto col = table->columnIndex("GUID");
// =============================================================================

#ifndef GUIDFIX_TABLE_CSV_H
#define GUIDFIX_TABLE_CSV_H

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "guidfix/common/error.h"

namespace guidfix::table {

// =============================================================================
// Dialect
// =============================================================================

/// @brief Field and record separators.
struct CsvDialect {
    /// @brief Field delimiter.
    char delimiter = ',';

    /// @brief Quote character; doubled inside a quoted field.
    char quote = '"';

    /// @brief Record terminator used when writing. Reading accepts
    ///        "\n", "\r\n" and "\r".
    std::string_view lineTerminator = "\n";
};

// =============================================================================
// Table
// =============================================================================

/// @brief A header row plus data rows of string cells.
/// @note Every row has exactly header.size() cells after parsing.
struct Table {
    /// @brief Column names.
    std::vector<std::string> header;

    /// @brief Data rows.
    std::vector<std::vector<std::string>> rows;

    /// @brief Index of the first column named `name`.
    [[nodiscard]] std::optional<std::size_t> columnIndex(std::string_view name) const noexcept;

    /// @brief Insert an empty column before `position` (clamped to the end).
    void insertColumn(std::size_t position, std::string name);

    /// @brief Remove a column from the header and every row.
    void removeColumn(std::size_t index);

    [[nodiscard]] std::size_t columnCount() const noexcept { return header.size(); }

    [[nodiscard]] std::size_t rowCount() const noexcept { return rows.size(); }
};

// =============================================================================
// Parsing and Formatting
// =============================================================================

/// @brief Parse delimited text.
/// @return kFormatError for empty input, an unterminated quoted field, or a
///         row with more fields than the header. Short rows are padded.
[[nodiscard]] Result<Table> parseCsv(std::string_view text, const CsvDialect& dialect = {});

/// @brief Render a table, quoting only fields that need it.
[[nodiscard]] std::string formatCsv(const Table& table, const CsvDialect& dialect = {});

/// @brief Read and parse a file.
/// @return kIOError if the file cannot be read, otherwise as parseCsv().
[[nodiscard]] Result<Table> readCsvFile(const std::filesystem::path& path,
                                        const CsvDialect& dialect = {});

/// @brief Format and write a file, replacing any existing content.
[[nodiscard]] VoidResult writeCsvFile(const std::filesystem::path& path,
                                      const Table& table,
                                      const CsvDialect& dialect = {});

}  // namespace guidfix::table

#endif  // GUIDFIX_TABLE_CSV_H
