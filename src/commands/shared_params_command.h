// =============================================================================
// guidfix - Shared Parameters Command
// =============================================================================
// Command handler for generating a Revit shared parameter file from one or
// more processed CSV sheets (one GROUP per sheet, named after the file stem).
// =============================================================================

#ifndef GUIDFIX_COMMANDS_SHARED_PARAMS_COMMAND_H
#define GUIDFIX_COMMANDS_SHARED_PARAMS_COMMAND_H

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "guidfix/common/error.h"
#include "guidfix/naming/name_style.h"

namespace guidfix::commands {

// =============================================================================
// Shared Parameters Options
// =============================================================================

/// @brief Configuration options for the shared-params command.
struct SharedParamsOptions {
    /// @brief Input CSV sheets, in group order.
    std::vector<std::filesystem::path> inputPaths;

    /// @brief Output file. Empty = "<first stem>_shared_params.txt".
    std::filesystem::path outputPath;

    /// @brief Style for parameter names.
    naming::NameStyle nameStyle = naming::NameStyle::kPascal;

    /// @brief Appended to every parameter name.
    std::string nameSuffix;

    /// @brief First group id; drawn at random when unset.
    std::optional<int> groupIdBase;

    /// @brief Overwrite an existing output file.
    bool forceOverwrite = false;

    /// @brief Print a summary when done.
    bool showSummary = true;
};

// =============================================================================
// SharedParamsCommand Class
// =============================================================================

/// @brief Command handler for shared parameter file generation.
class SharedParamsCommand {
public:
    explicit SharedParamsCommand(SharedParamsOptions options);

    ~SharedParamsCommand();

    // Non-copyable, movable
    SharedParamsCommand(const SharedParamsCommand&) = delete;
    SharedParamsCommand& operator=(const SharedParamsCommand&) = delete;
    SharedParamsCommand(SharedParamsCommand&&) noexcept;
    SharedParamsCommand& operator=(SharedParamsCommand&&) noexcept;

    /// @brief Execute the command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const SharedParamsOptions& options() const noexcept { return options_; }

private:
    void validateOptions();

    SharedParamsOptions options_;
};

// =============================================================================
// Helpers
// =============================================================================

/// @brief "<dir>/<stem>_shared_params.txt" for the first input path.
[[nodiscard]] std::filesystem::path defaultSharedParamsOutput(const std::filesystem::path& input);

}  // namespace guidfix::commands

#endif  // GUIDFIX_COMMANDS_SHARED_PARAMS_COMMAND_H
