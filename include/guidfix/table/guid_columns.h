// =============================================================================
// guidfix - Identifier Column Processing
// =============================================================================
// Applies the artifact resolver to one column of a sheet and adds the
// recovered compact and long forms as two new leading columns.
//
// This module provides:
// - processGuidColumn: resolve every cell of the source column
// - cleanNameColumn / cleanNameCell: undo line wrapping in name cells
// - analyzeNames: flag abbreviations and title-cased words in names
// - reviewAndCleanNames: analyzeNames on the raw column, then clean it
//
// Rows are resolved in parallel with oneTBB. Each row's result depends only
// on its own cell, and results land in the row they came from.
//
// Cell contract:
// - empty/whitespace cell     -> both new cells empty, counted as empty
// - NotRecoverable            -> both new cells empty, counted and logged
// - resolved                  -> compact form and canonical long form
// The source cell itself is never modified.
// =============================================================================

#ifndef GUIDFIX_TABLE_GUID_COLUMNS_H
#define GUIDFIX_TABLE_GUID_COLUMNS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "guidfix/codec/compact_codec.h"
#include "guidfix/common/error.h"
#include "guidfix/table/csv.h"

namespace guidfix::table {

// =============================================================================
// Constants
// =============================================================================

inline constexpr std::string_view kDefaultSourceColumn = "GUID";
inline constexpr std::string_view kDefaultCompactColumn = "IFC-GUID";
inline constexpr std::string_view kDefaultLongColumn = "MS-GUID";
inline constexpr std::string_view kDefaultNameColumn = "Name";
inline constexpr std::string_view kDefaultIdColumn = "ID";

// =============================================================================
// Options and Statistics
// =============================================================================

/// @brief Configuration for processGuidColumn().
struct GuidColumnOptions {
    /// @brief Column holding the raw (possibly wrapped) compact form.
    std::string sourceColumn{kDefaultSourceColumn};

    /// @brief Output column for the compact form.
    std::string compactColumn{kDefaultCompactColumn};

    /// @brief Output column for the canonical long form.
    std::string longColumn{kDefaultLongColumn};

    /// @brief Column used to label rows in diagnostics.
    std::string idColumn{kDefaultIdColumn};

    /// @brief Remove the source column after processing.
    bool dropSource = false;

    /// @brief Surplus-bit policy handed to the resolver.
    codec::SurplusBits surplus = codec::SurplusBits::kReject;

    /// @brief Worker threads (0 = oneTBB default).
    int threads = 0;
};

/// @brief Outcome counts for one sheet.
struct GuidColumnStats {
    /// @brief Whether the source column was present.
    bool sourceFound = false;

    /// @brief Data rows examined.
    std::uint64_t rows = 0;

    /// @brief Cells recovered.
    std::uint64_t resolved = 0;

    /// @brief Cells recovered by repairing a line break.
    std::uint64_t repaired = 0;

    /// @brief Empty cells (no identifier).
    std::uint64_t empty = 0;

    /// @brief Non-empty cells that could not be recovered.
    std::uint64_t unrecoverable = 0;

    /// @brief Spreadsheet labels of the unrecoverable rows.
    std::vector<std::string> unrecoverableRows;
};

/// @brief An observation about a name cell.
struct NameFinding {
    enum class Kind : std::uint8_t {
        /// @brief Whole word of 2+ capitals (informational).
        kAbbreviation = 0,

        /// @brief Whole word of one capital then lowercase (warning).
        kImproperCapitalization = 1
    };

    Kind kind = Kind::kAbbreviation;

    /// @brief "ID: <id>" or "Row <n>".
    std::string rowLabel;

    /// @brief The analyzed name.
    std::string name;

    /// @brief Offending words in order of appearance.
    std::vector<std::string> words;
};

// =============================================================================
// Operations
// =============================================================================

/// @brief Label a data row for diagnostics.
/// @param rowIndex Zero-based data row index.
/// @note "ID: <value>" when the ID column exists, else "Row <n>" where the
///       header is spreadsheet row 1.
[[nodiscard]] std::string rowLabel(const Table& table,
                                   std::size_t rowIndex,
                                   std::string_view idColumn = kDefaultIdColumn);

/// @brief Resolve the source column into two new leading columns.
/// @note A missing source column leaves the table untouched and returns
///       stats with sourceFound == false. Existing output columns with the
///       same names are replaced.
[[nodiscard]] Result<GuidColumnStats> processGuidColumn(Table& table,
                                                        const GuidColumnOptions& options = {});

/// @brief Remove "-<break>" pairs, then turn remaining breaks into spaces.
[[nodiscard]] std::string cleanNameCell(std::string_view text);

/// @brief Apply cleanNameCell() to a column.
/// @return false if the column does not exist.
bool cleanNameColumn(Table& table, std::string_view nameColumn = kDefaultNameColumn);

/// @brief Inspect a name column for capitalization issues.
[[nodiscard]] std::vector<NameFinding> analyzeNames(const Table& table,
                                                    std::string_view nameColumn = kDefaultNameColumn,
                                                    std::string_view idColumn = kDefaultIdColumn);

/// @brief Review the raw name column, then clean it when `clean` is set.
/// @note Findings come from the text as read, so wrap artifacts are still visible.
[[nodiscard]] std::vector<NameFinding> reviewAndCleanNames(
    Table& table, bool clean, std::string_view nameColumn = kDefaultNameColumn,
    std::string_view idColumn = kDefaultIdColumn);

}  // namespace guidfix::table

#endif  // GUIDFIX_TABLE_GUID_COLUMNS_H
