// =============================================================================
// guidfix - Shared Parameters Command Implementation
// =============================================================================

#include "shared_params_command.h"

#include <iostream>

#include "guidfix/common/logger.h"
#include "guidfix/params/shared_parameters.h"
#include "guidfix/table/csv.h"
#include "guidfix/table/guid_columns.h"

namespace guidfix::commands {

std::filesystem::path defaultSharedParamsOutput(const std::filesystem::path& input) {
    auto output = input;
    output.replace_filename(input.stem().string() + "_shared_params.txt");
    return output;
}

// =============================================================================
// SharedParamsCommand Implementation
// =============================================================================

SharedParamsCommand::SharedParamsCommand(SharedParamsOptions options)
    : options_(std::move(options)) {}

SharedParamsCommand::~SharedParamsCommand() = default;

SharedParamsCommand::SharedParamsCommand(SharedParamsCommand&&) noexcept = default;
SharedParamsCommand& SharedParamsCommand::operator=(SharedParamsCommand&&) noexcept = default;

int SharedParamsCommand::execute() {
    try {
        validateOptions();

        params::SharedParamsConfig config;
        config.nameStyle = options_.nameStyle;
        config.nameSuffix = options_.nameSuffix;
        config.groupIdBase = options_.groupIdBase.value_or(params::randomGroupIdBase());
        GUIDFIX_LOG_DEBUG("Group ids start at {}", config.groupIdBase);

        params::SharedParamsBuilder builder(config);
        std::size_t skippedSheets = 0;

        for (const auto& inputPath : options_.inputPaths) {
            auto sheet = unwrapOrThrow(table::readCsvFile(inputPath));
            table::cleanNameColumn(sheet);

            auto summary = builder.addSheet(inputPath.stem().string(), sheet);
            if (summary.skipped) {
                ++skippedSheets;
            }
        }

        if (builder.parameters().empty()) {
            GUIDFIX_LOG_WARNING("No parameters found in {} sheet(s)", options_.inputPaths.size());
        }

        unwrapOrThrow(builder.writeFile(options_.outputPath));
        GUIDFIX_LOG_INFO("Wrote {}", options_.outputPath.string());

        if (options_.showSummary) {
            std::cout << "\n=== Shared Parameters Summary ===" << std::endl;
            std::cout << "  Output:           " << options_.outputPath.string() << std::endl;
            std::cout << "  Name style:       " << naming::nameStyleToString(config.nameStyle)
                      << std::endl;
            std::cout << "  Groups:           " << builder.groups().size() << std::endl;
            std::cout << "  Skipped sheets:   " << skippedSheets << std::endl;
            std::cout << "  Parameters:       " << builder.parameters().size() << std::endl;
        }

        return 0;

    } catch (const GuidfixException& e) {
        GUIDFIX_LOG_ERROR("Shared parameter generation failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        GUIDFIX_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void SharedParamsCommand::validateOptions() {
    if (options_.inputPaths.empty()) {
        throw UsageError("at least one input sheet is required");
    }

    std::error_code ec;
    for (const auto& inputPath : options_.inputPaths) {
        if (!std::filesystem::is_regular_file(inputPath, ec)) {
            throw IOError("Input file not found: " + inputPath.string());
        }
    }

    if (options_.outputPath.empty()) {
        options_.outputPath = defaultSharedParamsOutput(options_.inputPaths.front());
    }

    if (!options_.forceOverwrite && std::filesystem::exists(options_.outputPath, ec)) {
        throw IOError("Output file already exists: " + options_.outputPath.string() +
                      " (use -f to overwrite)");
    }
}

}  // namespace guidfix::commands
