// =============================================================================
// guidfix - Identifier Repair Tool
// =============================================================================
// Main entry point for the guidfix command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: expand, compress, resolve, process, shared-params
// - Global options: threads, verbose, quiet, log-file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "guidfix/common/error.h"
#include "guidfix/common/logger.h"
#include "guidfix/naming/name_style.h"

// Command implementations
#include "commands/codec_command.h"
#include "commands/process_command.h"
#include "commands/shared_params_command.h"

// Forward declarations for command handlers
namespace guidfix::commands {
int runCodec(CodecMode mode);
int runProcess(CLI::App* app);
int runSharedParams(CLI::App* app);
}  // namespace guidfix::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "guidfix: identifier repair for parameter spreadsheets\n"
    "Converts between 22-character compact identifiers and 8-4-4-4-12 long\n"
    "forms, and recovers identifiers broken by line wrapping in table cells.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int threads = 0;    // 0 = auto-detect
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Codec Command Options
// =============================================================================

struct CliCodecOptions {
    std::vector<std::string> values;
    bool unescape = false;
    bool ignoreSurplus = false;
};

CliCodecOptions gExpandOpts;
CliCodecOptions gCompressOpts;
CliCodecOptions gResolveOpts;

// =============================================================================
// Process Command Options
// =============================================================================

struct CliProcessOptions {
    std::string input;
    std::string output;
    std::string sourceColumn = "GUID";
    bool dropSource = false;
    bool noCleanNames = false;
    bool strict = false;
    bool force = false;
};

CliProcessOptions gProcessOpts;

// =============================================================================
// Shared Parameters Command Options
// =============================================================================

struct CliSharedParamsOptions {
    std::vector<std::string> inputs;
    std::string output;
    std::string nameStyle = "pascal";
    std::string suffix;
    int groupIdBase = -1;  // -1 = random
    bool force = false;
};

CliSharedParamsOptions gSharedParamsOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupCodecCommands(CLI::App& app) {
    auto* expand = app.add_subcommand("expand", "Expand compact identifiers to long form");
    expand->add_option("values", gExpandOpts.values, "22-character compact identifiers")
        ->required();
    expand->add_flag("--ignore-surplus", gExpandOpts.ignoreSurplus,
                     "Accept nonzero padding bits in the last symbol");

    auto* compress = app.add_subcommand("compress", "Compress long-form identifiers");
    compress->add_option("values", gCompressOpts.values, "8-4-4-4-12 hexadecimal identifiers")
        ->required();

    auto* resolve = app.add_subcommand(
        "resolve", "Recover identifiers from line-wrapped text (stdin when no value is given)");
    resolve->add_option("values", gResolveOpts.values, "Raw cell text");
    resolve->add_flag("--unescape", gResolveOpts.unescape,
                      "Interpret \\n, \\r and \\t escapes in the values");
    resolve->add_flag("--ignore-surplus", gResolveOpts.ignoreSurplus,
                      "Accept nonzero padding bits in the last symbol");
}

void setupProcessCommand(CLI::App& app) {
    auto* process = app.add_subcommand("process", "Repair the identifier column of a CSV sheet");
    process->alias("p");

    process->add_option("-i,--input", gProcessOpts.input, "Input CSV sheet")
        ->required()
        ->check(CLI::ExistingFile);

    process->add_option("-o,--output", gProcessOpts.output,
                        "Output CSV sheet (default: <stem>_converted.csv)");

    process->add_option("--source-column", gProcessOpts.sourceColumn,
                        "Column holding the raw identifiers")
        ->default_val("GUID");

    process->add_flag("--drop-source", gProcessOpts.dropSource,
                      "Remove the source column from the output");

    process->add_flag("--no-clean-names", gProcessOpts.noCleanNames,
                      "Leave line breaks in the Name column untouched");

    process->add_flag("--strict", gProcessOpts.strict,
                      "Fail when any identifier cannot be recovered");

    process->add_flag("-f,--force", gProcessOpts.force, "Overwrite existing output file");
}

void setupSharedParamsCommand(CLI::App& app) {
    auto* shared = app.add_subcommand("shared-params",
                                      "Generate a Revit shared parameter file from CSV sheets");

    shared->add_option("-i,--input", gSharedParamsOpts.inputs, "Processed CSV sheet(s)")
        ->required()
        ->check(CLI::ExistingFile);

    shared->add_option("-o,--output", gSharedParamsOpts.output,
                       "Output file (default: <first stem>_shared_params.txt)");

    shared->add_option("--name-style", gSharedParamsOpts.nameStyle, "Parameter name style")
        ->default_val("pascal")
        ->check(CLI::IsMember(guidfix::naming::nameStyleNames(), CLI::ignore_case));

    shared->add_option("--suffix", gSharedParamsOpts.suffix, "Appended to every parameter name");

    shared->add_option("--group-id-base", gSharedParamsOpts.groupIdBase,
                       "First group id (default: random from 200, 210, ..., 240)")
        ->check(CLI::NonNegativeNumber);

    shared->add_flag("-f,--force", gSharedParamsOpts.force, "Overwrite existing output file");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("-t,--threads", gOptions.threads, "Number of threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Only report errors");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to a file");

    // Setup subcommands
    setupCodecCommands(app);
    setupProcessCommand(app);
    setupSharedParamsCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        guidfix::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = guidfix::log::levelFromVerbosity(gOptions.verbosity, gOptions.quiet);
        guidfix::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return guidfix::toExitCode(guidfix::ErrorCode::kIOError);
    }

    // Dispatch to subcommand handlers
    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("expand")) {
            exitCode = guidfix::commands::runCodec(guidfix::commands::CodecMode::kExpand);
        } else if (app.got_subcommand("compress")) {
            exitCode = guidfix::commands::runCodec(guidfix::commands::CodecMode::kCompress);
        } else if (app.got_subcommand("resolve")) {
            exitCode = guidfix::commands::runCodec(guidfix::commands::CodecMode::kResolve);
        } else if (app.got_subcommand("process")) {
            exitCode = guidfix::commands::runProcess(app.get_subcommand("process"));
        } else if (app.got_subcommand("shared-params")) {
            exitCode = guidfix::commands::runSharedParams(app.get_subcommand("shared-params"));
        }
    } catch (const guidfix::GuidfixException& ex) {
        GUIDFIX_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        GUIDFIX_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    guidfix::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace guidfix::commands {

int runCodec(CodecMode mode) {
    const CliCodecOptions& cli = mode == CodecMode::kExpand     ? gExpandOpts
                                 : mode == CodecMode::kCompress ? gCompressOpts
                                                                : gResolveOpts;
    auto cmd = createCodecCommand(mode, cli.values, cli.unescape, cli.ignoreSurplus);
    return cmd->execute();
}

int runProcess([[maybe_unused]] CLI::App* app) {
    ProcessOptions opts;
    opts.inputPath = gProcessOpts.input;
    opts.outputPath = gProcessOpts.output;
    opts.sourceColumn = gProcessOpts.sourceColumn;
    opts.dropSource = gProcessOpts.dropSource;
    opts.cleanNames = !gProcessOpts.noCleanNames;
    opts.strict = gProcessOpts.strict;
    opts.forceOverwrite = gProcessOpts.force;
    opts.threads = gOptions.threads;
    opts.showSummary = !gOptions.quiet;

    auto cmd = std::make_unique<ProcessCommand>(std::move(opts));
    return cmd->execute();
}

int runSharedParams([[maybe_unused]] CLI::App* app) {
    SharedParamsOptions opts;
    for (const auto& input : gSharedParamsOpts.inputs) {
        opts.inputPaths.emplace_back(input);
    }
    opts.outputPath = gSharedParamsOpts.output;
    opts.nameSuffix = gSharedParamsOpts.suffix;
    opts.forceOverwrite = gSharedParamsOpts.force;
    opts.showSummary = !gOptions.quiet;

    auto style = naming::parseNameStyle(gSharedParamsOpts.nameStyle);
    if (!style) {
        throw UsageError("Unknown name style: " + gSharedParamsOpts.nameStyle);
    }
    opts.nameStyle = *style;

    if (gSharedParamsOpts.groupIdBase >= 0) {
        opts.groupIdBase = gSharedParamsOpts.groupIdBase;
    }

    auto cmd = std::make_unique<SharedParamsCommand>(std::move(opts));
    return cmd->execute();
}

}  // namespace guidfix::commands
