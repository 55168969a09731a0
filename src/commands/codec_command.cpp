// =============================================================================
// guidfix - Codec Commands Implementation
// =============================================================================

#include "codec_command.h"

#include <iostream>
#include <iterator>

#include "guidfix/codec/artifact_resolver.h"
#include "guidfix/codec/identifier.h"
#include "guidfix/common/logger.h"

namespace guidfix::commands {

std::string unescapeText(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\' || i + 1 == text.size()) {
            result.push_back(text[i]);
            continue;
        }
        switch (text[i + 1]) {
            case 'n':
                result.push_back('\n');
                break;
            case 'r':
                result.push_back('\r');
                break;
            case 't':
                result.push_back('\t');
                break;
            case '\\':
                result.push_back('\\');
                break;
            default:
                // Unknown escape stays literal
                result.push_back('\\');
                result.push_back(text[i + 1]);
                break;
        }
        ++i;
    }
    return result;
}

// =============================================================================
// CodecCommand Implementation
// =============================================================================

CodecCommand::CodecCommand(CodecOptions options) : options_(std::move(options)) {}

CodecCommand::~CodecCommand() = default;

CodecCommand::CodecCommand(CodecCommand&&) noexcept = default;
CodecCommand& CodecCommand::operator=(CodecCommand&&) noexcept = default;

int CodecCommand::execute() {
    try {
        std::vector<std::string> inputs = options_.inputs;
        if (inputs.empty()) {
            if (options_.mode != CodecMode::kResolve) {
                throw UsageError("at least one value is required");
            }
            // The whole of stdin is one (possibly wrapped) cell
            inputs.emplace_back(std::istreambuf_iterator<char>(std::cin),
                                std::istreambuf_iterator<char>());
            if (std::cin.bad()) {
                throw IOError("failed to read standard input");
            }
        }

        std::size_t failures = 0;
        for (const auto& input : inputs) {
            const std::string text = options_.unescape ? unescapeText(input) : input;
            if (!convert(text)) {
                ++failures;
            }
        }
        std::cout.flush();

        if (failures > 0) {
            throw UnresolvedIdentifierError(
                std::to_string(failures) + " of " + std::to_string(inputs.size()) +
                " value(s) could not be converted");
        }
        return 0;

    } catch (const GuidfixException& e) {
        GUIDFIX_LOG_ERROR("{}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        GUIDFIX_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kUsageError);
    }
}

bool CodecCommand::convert(std::string_view input) {
    switch (options_.mode) {
        case CodecMode::kExpand:
            return expandOne(input);
        case CodecMode::kCompress:
            return compressOne(input);
        case CodecMode::kResolve:
            return resolveOne(input);
    }
    return false;
}

bool CodecCommand::expandOne(std::string_view input) {
    auto expansion = codec::expand(codec::trimWhitespace(input), options_.surplus);
    if (!expansion) {
        GUIDFIX_LOG_ERROR("'{}': {}", input, codec::decodeErrorToString(expansion.error()));
        return false;
    }
    std::cout << expansion->canonicalLongForm << '\n';
    return true;
}

bool CodecCommand::compressOne(std::string_view input) {
    auto identifier = codec::Identifier::parseLongForm(codec::trimWhitespace(input));
    if (!identifier) {
        GUIDFIX_LOG_ERROR("'{}': not an 8-4-4-4-12 hexadecimal identifier", input);
        return false;
    }
    std::cout << codec::compress(*identifier) << '\n';
    return true;
}

bool CodecCommand::resolveOne(std::string_view input) {
    auto resolution = codec::resolve(input, options_.surplus);
    if (!resolution) {
        GUIDFIX_LOG_ERROR("'{}': {}", input, codec::resolutionErrorToString(resolution.error()));
        return false;
    }
    GUIDFIX_LOG_DEBUG("'{}' resolved by hypothesis {}", input,
                      codec::hypothesisToString(resolution->hypothesis));
    std::cout << resolution->compactForm << '\t' << resolution->canonicalLongForm << '\n';
    return true;
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<CodecCommand> createCodecCommand(CodecMode mode,
                                                 std::vector<std::string> inputs,
                                                 bool unescape,
                                                 bool ignoreSurplus) {
    CodecOptions opts;
    opts.mode = mode;
    opts.inputs = std::move(inputs);
    opts.unescape = unescape;
    opts.surplus = ignoreSurplus ? codec::SurplusBits::kIgnore : codec::SurplusBits::kReject;
    return std::make_unique<CodecCommand>(std::move(opts));
}

}  // namespace guidfix::commands
