// =============================================================================
// guidfix - Process Command
// =============================================================================
// Command handler for repairing the identifier column of a sheet.
//
// This module provides:
// - ProcessCommand: read a CSV sheet, resolve its GUID column into compact
//   and long-form columns, clean the Name column, write the converted sheet
// - Name review: abbreviations and title-cased words are logged per row
// =============================================================================

#ifndef GUIDFIX_COMMANDS_PROCESS_COMMAND_H
#define GUIDFIX_COMMANDS_PROCESS_COMMAND_H

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "guidfix/common/error.h"
#include "guidfix/table/csv.h"
#include "guidfix/table/guid_columns.h"

namespace guidfix::commands {

// =============================================================================
// Process Options
// =============================================================================

/// @brief Configuration options for the process command.
struct ProcessOptions {
    /// @brief Input CSV sheet.
    std::filesystem::path inputPath;

    /// @brief Output CSV sheet. Empty = "<stem>_converted.csv" beside the input.
    std::filesystem::path outputPath;

    /// @brief Column holding the raw identifiers.
    std::string sourceColumn{table::kDefaultSourceColumn};

    /// @brief Remove the source column from the output.
    bool dropSource = false;

    /// @brief Repair line breaks in the Name column.
    bool cleanNames = true;

    /// @brief Fail with kUnresolvedIdentifier when any cell is unrecoverable.
    bool strict = false;

    /// @brief Overwrite an existing output file.
    bool forceOverwrite = false;

    /// @brief Worker threads (0 = auto-detect).
    int threads = 0;

    /// @brief Print a summary when done.
    bool showSummary = true;
};

// =============================================================================
// ProcessCommand Class
// =============================================================================

/// @brief Command handler for sheet processing.
class ProcessCommand {
public:
    explicit ProcessCommand(ProcessOptions options);

    ~ProcessCommand();

    // Non-copyable, movable
    ProcessCommand(const ProcessCommand&) = delete;
    ProcessCommand& operator=(const ProcessCommand&) = delete;
    ProcessCommand(ProcessCommand&&) noexcept;
    ProcessCommand& operator=(ProcessCommand&&) noexcept;

    /// @brief Execute the process command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const ProcessOptions& options() const noexcept { return options_; }

    [[nodiscard]] const table::GuidColumnStats& stats() const noexcept { return stats_; }

private:
    /// @brief Check paths and fill in the default output path.
    void validateOptions();

    /// @brief Log the name review findings.
    void reviewNames(const std::vector<table::NameFinding>& findings) const;

    void printSummary() const;

    ProcessOptions options_;
    table::GuidColumnStats stats_;
};

// =============================================================================
// Helpers
// =============================================================================

/// @brief "<dir>/<stem>_converted.csv" for an input path.
[[nodiscard]] std::filesystem::path defaultProcessOutput(const std::filesystem::path& input);

}  // namespace guidfix::commands

#endif  // GUIDFIX_COMMANDS_PROCESS_COMMAND_H
