// =============================================================================
// guidfix - Codec Commands
// =============================================================================
// Command handler for the single-value codec operations.
//
// This module provides:
// - expand:   compact form -> canonical long form
// - compress: long form -> compact form
// - resolve:  possibly wrapped text -> compact form and long form
//
// One result line is printed per input. Inputs that fail are logged and make
// the command exit with kUnresolvedIdentifier once all inputs are processed.
// =============================================================================

#ifndef GUIDFIX_COMMANDS_CODEC_COMMAND_H
#define GUIDFIX_COMMANDS_CODEC_COMMAND_H

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "guidfix/codec/compact_codec.h"
#include "guidfix/common/error.h"

namespace guidfix::commands {

// =============================================================================
// Codec Options
// =============================================================================

/// @brief Which codec operation to run.
enum class CodecMode : std::uint8_t {
    kExpand,
    kCompress,
    kResolve
};

/// @brief Configuration options for the codec commands.
struct CodecOptions {
    /// @brief Operation.
    CodecMode mode = CodecMode::kExpand;

    /// @brief Values to convert. Empty for resolve means read stdin.
    std::vector<std::string> inputs;

    /// @brief Turn literal "\n", "\r" and "\t" escapes into characters.
    bool unescape = false;

    /// @brief Surplus-bit policy for expand and resolve.
    codec::SurplusBits surplus = codec::SurplusBits::kReject;
};

// =============================================================================
// CodecCommand Class
// =============================================================================

/// @brief Command handler for expand, compress and resolve.
class CodecCommand {
public:
    explicit CodecCommand(CodecOptions options);

    ~CodecCommand();

    // Non-copyable, movable
    CodecCommand(const CodecCommand&) = delete;
    CodecCommand& operator=(const CodecCommand&) = delete;
    CodecCommand(CodecCommand&&) noexcept;
    CodecCommand& operator=(CodecCommand&&) noexcept;

    /// @brief Execute the command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const CodecOptions& options() const noexcept { return options_; }

private:
    /// @brief Convert one input and print the result.
    /// @return true on success.
    bool convert(std::string_view input);

    bool expandOne(std::string_view input);
    bool compressOne(std::string_view input);
    bool resolveOne(std::string_view input);

    CodecOptions options_;
};

// =============================================================================
// Helpers
// =============================================================================

/// @brief Replace "\n", "\r", "\t" and "\\" escape sequences.
[[nodiscard]] std::string unescapeText(std::string_view text);

/// @brief Create a codec command.
[[nodiscard]] std::unique_ptr<CodecCommand> createCodecCommand(CodecMode mode,
                                                               std::vector<std::string> inputs,
                                                               bool unescape,
                                                               bool ignoreSurplus);

}  // namespace guidfix::commands

#endif  // GUIDFIX_COMMANDS_CODEC_COMMAND_H
