// =============================================================================
// guidfix - Revit Shared Parameter File Generation
// =============================================================================
// Builds a Revit shared parameter file from processed sheets.
//
// This module provides:
// - inferDataType: Revit DATATYPE from the "Format, Unit" and "Value set" cells
// - formatDescription: description with value set and examples, fitted to
//   Revit's 254-character limit
// - SharedParamsBuilder: one GROUP per sheet, one PARAM per identified row
//
// File layout (tab separated, UTF-16LE on disk):
//   # This is a Revit shared parameter file.
//   # Do not edit manually.
//   *META  VERSION  MINVERSION
//   META   2        1
//   *GROUP ID       NAME
//   GROUP  <id>     <sheet>
//   *PARAM GUID NAME DATATYPE DATACATEGORY GROUP VISIBLE DESCRIPTION
//          USERMODIFIABLE HIDEWHENNOVALUE
//   PARAM  <guid> <name> <type> "" <group> 1 <description> 1 0
//
// Lengths are counted in Unicode code points, not bytes.
// =============================================================================

#ifndef GUIDFIX_PARAMS_SHARED_PARAMETERS_H
#define GUIDFIX_PARAMS_SHARED_PARAMETERS_H

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "guidfix/common/error.h"
#include "guidfix/naming/name_style.h"
#include "guidfix/table/csv.h"

namespace guidfix::params {

// =============================================================================
// Constants
// =============================================================================

/// @brief Revit's description length limit (code points).
inline constexpr std::size_t kMaxDescriptionLength = 254;

/// @brief Truncation marker (U+2026).
inline constexpr std::string_view kEllipsis = "\xE2\x80\xA6";

/// @brief Columns a sheet needs to contribute parameters.
inline constexpr std::array<std::string_view, 6> kRequiredColumns = {
    "MS-GUID", "Name", "Description", "Format, Unit", "Value set", "Examples"};

// =============================================================================
// Cell Interpretation
// =============================================================================

/// @brief Infer the Revit DATATYPE of a parameter.
/// @note Rules in order: yes/no value set -> YESNO; a known unit in the
///       format cell (longest unit first) -> its type; "n.a." format with an
///       enumerated value set -> TEXT; "1E<n>" format -> NUMBER; else TEXT.
[[nodiscard]] std::string inferDataType(std::string_view formatUnit, std::string_view valueSet);

/// @brief Compose a parameter description.
/// @note "identical with name" descriptions and yes/no or n.a. value sets
///       are dropped. The value set is appended as " i.e. ..." (cut at a
///       comma) and examples as " e.g. ..." (cut at a word); never longer
///       than `limit` code points, so a zero limit yields "".
[[nodiscard]] std::string formatDescription(std::string_view description,
                                            std::string_view valueSet,
                                            std::string_view examples,
                                            std::size_t limit = kMaxDescriptionLength);

/// @brief Number of code points in UTF-8 text.
[[nodiscard]] std::size_t utf8Length(std::string_view text) noexcept;

/// @brief Encode UTF-8 text as UTF-16LE bytes (invalid input -> U+FFFD).
[[nodiscard]] std::string encodeUtf16Le(std::string_view utf8);

// =============================================================================
// Builder
// =============================================================================

/// @brief Configuration for SharedParamsBuilder.
struct SharedParamsConfig {
    /// @brief Naming style applied to the Name column.
    naming::NameStyle nameStyle = naming::NameStyle::kPascal;

    /// @brief Appended to every converted name.
    std::string nameSuffix;

    /// @brief Group id of the first sheet; later sheets count up from it.
    int groupIdBase = 200;
};

/// @brief Draw a group-id base from {200, 210, 220, 230, 240}.
[[nodiscard]] int randomGroupIdBase();

/// @brief One PARAM line.
struct ParameterEntry {
    std::string guid;
    std::string name;
    std::string dataType;
    int groupId = 0;
    std::string description;
};

/// @brief One GROUP line.
struct GroupEntry {
    int id = 0;
    std::string name;
};

/// @brief What addSheet() did with a sheet.
struct SheetSummary {
    int groupId = 0;

    /// @brief Sheet lacked a required column.
    bool skipped = false;

    /// @brief Missing required columns (when skipped).
    std::vector<std::string> missingColumns;

    /// @brief Parameters added.
    std::size_t parameters = 0;

    /// @brief Rows without an identifier.
    std::size_t emptyRows = 0;

    /// @brief Rows rejected for a malformed identifier or empty name.
    std::size_t rejectedRows = 0;
};

/// @brief Accumulates sheets and renders the shared parameter file.
class SharedParamsBuilder {
public:
    explicit SharedParamsBuilder(SharedParamsConfig config);

    /// @brief Add a sheet as the next group.
    /// @note Every sheet takes a group id, even a skipped one.
    SheetSummary addSheet(std::string sheetName, const table::Table& sheet);

    /// @brief Render the file as UTF-8 text with "\n" line endings.
    [[nodiscard]] std::string render() const;

    /// @brief Write render() as UTF-16LE.
    [[nodiscard]] VoidResult writeFile(const std::filesystem::path& path) const;

    [[nodiscard]] const std::vector<GroupEntry>& groups() const noexcept { return groups_; }

    [[nodiscard]] const std::vector<ParameterEntry>& parameters() const noexcept {
        return parameters_;
    }

    [[nodiscard]] const SharedParamsConfig& config() const noexcept { return config_; }

private:
    SharedParamsConfig config_;
    std::vector<GroupEntry> groups_;
    std::vector<ParameterEntry> parameters_;
};

}  // namespace guidfix::params

#endif  // GUIDFIX_PARAMS_SHARED_PARAMETERS_H
