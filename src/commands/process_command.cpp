// =============================================================================
// guidfix - Process Command Implementation
// =============================================================================

#include "process_command.h"

#include <chrono>
#include <iomanip>
#include <iostream>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "guidfix/common/logger.h"

namespace guidfix::commands {

std::filesystem::path defaultProcessOutput(const std::filesystem::path& input) {
    auto output = input;
    output.replace_filename(input.stem().string() + "_converted.csv");
    return output;
}

// =============================================================================
// ProcessCommand Implementation
// =============================================================================

ProcessCommand::ProcessCommand(ProcessOptions options) : options_(std::move(options)) {}

ProcessCommand::~ProcessCommand() = default;

ProcessCommand::ProcessCommand(ProcessCommand&&) noexcept = default;
ProcessCommand& ProcessCommand::operator=(ProcessCommand&&) noexcept = default;

int ProcessCommand::execute() {
    auto startTime = std::chrono::steady_clock::now();

    try {
        validateOptions();

        auto sheet = unwrapOrThrow(table::readCsvFile(options_.inputPath));
        GUIDFIX_LOG_INFO("Read {} row(s) from {}", sheet.rowCount(), options_.inputPath.string());

        reviewNames(table::reviewAndCleanNames(sheet, options_.cleanNames));

        table::GuidColumnOptions columnOptions;
        columnOptions.sourceColumn = options_.sourceColumn;
        columnOptions.dropSource = options_.dropSource;
        columnOptions.threads = options_.threads;
        stats_ = unwrapOrThrow(table::processGuidColumn(sheet, columnOptions));

        if (!stats_.sourceFound) {
            GUIDFIX_LOG_WARNING("{}: no '{}' column, identifiers left unchanged",
                                options_.inputPath.string(), options_.sourceColumn);
        }

        unwrapOrThrow(table::writeCsvFile(options_.outputPath, sheet));
        GUIDFIX_LOG_INFO("Wrote {}", options_.outputPath.string());

        if (options_.showSummary) {
            auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime);
            printSummary();
            std::cout << "  Elapsed time:     " << std::fixed << std::setprecision(2)
                      << elapsed.count() << " s" << std::endl;
        }

        if (options_.strict && stats_.unrecoverable > 0) {
            throw UnresolvedIdentifierError(
                fmt::format("{} identifier(s) could not be recovered: {}", stats_.unrecoverable,
                            fmt::join(stats_.unrecoverableRows, ", ")),
                ErrorContext{}.withFile(options_.inputPath.string())
                    .withColumn(options_.sourceColumn));
        }

        return 0;

    } catch (const GuidfixException& e) {
        GUIDFIX_LOG_ERROR("Processing failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        GUIDFIX_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void ProcessCommand::validateOptions() {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(options_.inputPath, ec)) {
        throw IOError("Input file not found: " + options_.inputPath.string());
    }

    if (options_.outputPath.empty()) {
        options_.outputPath = defaultProcessOutput(options_.inputPath);
    }

    if (std::filesystem::equivalent(options_.inputPath, options_.outputPath, ec)) {
        throw UsageError("Output would overwrite the input: " + options_.outputPath.string());
    }

    if (!options_.forceOverwrite && std::filesystem::exists(options_.outputPath, ec)) {
        throw IOError("Output file already exists: " + options_.outputPath.string() +
                      " (use -f to overwrite)");
    }
}

void ProcessCommand::reviewNames(const std::vector<table::NameFinding>& findings) const {
    for (const auto& finding : findings) {
        const std::string words = fmt::format("{}", fmt::join(finding.words, ", "));
        if (finding.kind == table::NameFinding::Kind::kAbbreviation) {
            GUIDFIX_LOG_INFO("{}: abbreviation(s) {} in '{}'", finding.rowLabel, words,
                             finding.name);
        } else {
            GUIDFIX_LOG_WARNING("{}: improper capitalization {} in '{}'", finding.rowLabel, words,
                                finding.name);
        }
    }
}

void ProcessCommand::printSummary() const {
    std::cout << "\n=== Processing Summary ===" << std::endl;
    std::cout << "  Input:            " << options_.inputPath.string() << std::endl;
    std::cout << "  Output:           " << options_.outputPath.string() << std::endl;
    std::cout << "  Rows:             " << stats_.rows << std::endl;
    std::cout << "  Resolved:         " << stats_.resolved << std::endl;
    std::cout << "  Repaired wraps:   " << stats_.repaired << std::endl;
    std::cout << "  Empty cells:      " << stats_.empty << std::endl;
    std::cout << "  Unrecoverable:    " << stats_.unrecoverable << std::endl;
}

}  // namespace guidfix::commands
