// =============================================================================
// guidfix - Compact Identifier Codec
// =============================================================================
// Lossless mapping between an Identifier and its 22-character compact form.
//
// The compact form is the URL-safe base64 alphabet (RFC 4648 section 5:
// A-Z a-z 0-9 '-' '_') without padding. 16 bytes need 128 bits; 22 symbols
// carry 132, so the 4 low-order bits of the last symbol are surplus and are
// always zero in compress() output.
//
// Round-trip behavior:
//   expand(compress(id)) == id for every identifier.
//   compress(expand(s)) == s for every s with zero surplus bits.
//   With SurplusBits::kIgnore, expand() also accepts nonzero surplus bits;
//   compress() of the result is then the canonical zero-padded form and
//   differs from the input. This is expected and not corrected.
//
// This codec is NOT the IFC-GUID encoding ("0-9A-Za-z_$" alphabet). The two
// are incompatible and must not be mixed.
// =============================================================================

#ifndef GUIDFIX_CODEC_COMPACT_CODEC_H
#define GUIDFIX_CODEC_COMPACT_CODEC_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "guidfix/codec/identifier.h"
#include "guidfix/common/error.h"

namespace guidfix::codec {

// =============================================================================
// Constants
// =============================================================================

/// @brief Compact-form alphabet, indexed by 6-bit symbol value.
inline constexpr std::string_view kCompactAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

/// @brief Number of meaningful symbols in a compact form.
inline constexpr std::size_t kCompactFormLength = 22;

/// @brief Padding symbol accepted (never emitted) by expand().
inline constexpr char kPaddingSymbol = '=';

// =============================================================================
// Decode Errors
// =============================================================================

/// @brief Reasons expand() rejects its input.
enum class DecodeError : std::uint8_t {
    /// @brief Not exactly 22 meaningful symbols, or padding other than the
    ///        two symbols that complete the last 4-symbol group.
    kInvalidLength = 0,

    /// @brief A symbol outside the compact alphabet.
    kInvalidAlphabetCharacter = 1,

    /// @brief The payload is not exactly 16 bytes (nonzero surplus bits
    ///        under SurplusBits::kReject).
    kInvalidByteLength = 2
};

/// @brief Convert DecodeError to a short description.
[[nodiscard]] constexpr std::string_view decodeErrorToString(DecodeError error) noexcept {
    switch (error) {
        case DecodeError::kInvalidLength:
            return "invalid length";
        case DecodeError::kInvalidAlphabetCharacter:
            return "invalid alphabet character";
        case DecodeError::kInvalidByteLength:
            return "invalid byte length";
    }
    return "unknown decode error";
}

/// @brief Treatment of the 4 surplus low bits of the last symbol.
enum class SurplusBits : std::uint8_t {
    /// @brief Nonzero surplus bits fail with kInvalidByteLength.
    kReject = 0,

    /// @brief Surplus bits are discarded.
    kIgnore = 1
};

// =============================================================================
// Expansion Result
// =============================================================================

/// @brief A decoded compact form.
struct Expansion {
    /// @brief The decoded identifier.
    Identifier identifier;

    /// @brief identifier.toLongForm(), computed once.
    std::string canonicalLongForm;
};

// =============================================================================
// Codec Operations
// =============================================================================

/// @brief Encode an identifier as its canonical 22-symbol compact form.
/// @note Total: never fails, never emits padding or surplus bits.
[[nodiscard]] std::string compress(const Identifier& identifier);

/// @brief Decode a compact form.
/// @param text 22 symbols, optionally followed by "==".
/// @param surplus Treatment of the surplus low bits.
/// @return The identifier and its canonical long form, or the first failed
///         check in the order length, alphabet, byte length.
[[nodiscard]] Result<Expansion, DecodeError> expand(std::string_view text,
                                                    SurplusBits surplus = SurplusBits::kReject);

/// @brief Check if a character belongs to the compact alphabet.
[[nodiscard]] bool isCompactSymbol(char c) noexcept;

}  // namespace guidfix::codec

#endif  // GUIDFIX_CODEC_COMPACT_CODEC_H
