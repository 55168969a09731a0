// =============================================================================
// guidfix - Identifier Model
// =============================================================================
// The 128-bit value behind both textual identifier forms.
//
// An Identifier is an immutable 16-byte value with no identity beyond its
// bits. Byte 0 is the most significant byte: it renders as the first two hex
// digits of the canonical long form and as the leading bits of the compact
// form.
//
// Canonical long form: lowercase hexadecimal grouped 8-4-4-4-12 with hyphens,
// 36 characters, no braces. Example: 3a35282d-a41b-4896-8b63-9e4a38d7759d
// =============================================================================

#ifndef GUIDFIX_CODEC_IDENTIFIER_H
#define GUIDFIX_CODEC_IDENTIFIER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace guidfix::codec {

// =============================================================================
// Constants
// =============================================================================

/// @brief Number of bytes in an identifier.
inline constexpr std::size_t kIdentifierBytes = 16;

/// @brief Length of the canonical long form (32 hex digits + 4 hyphens).
inline constexpr std::size_t kLongFormLength = 36;

// =============================================================================
// Identifier
// =============================================================================

/// @brief Opaque 128-bit identifier value.
class Identifier {
public:
    using Bytes = std::array<std::uint8_t, kIdentifierBytes>;

    /// @brief The all-zero identifier.
    constexpr Identifier() noexcept = default;

    /// @brief Construct from 16 bytes, most significant first.
    constexpr explicit Identifier(const Bytes& bytes) noexcept : bytes_(bytes) {}

    /// @brief Construct from a byte span.
    /// @return nullopt unless the span holds exactly 16 bytes.
    [[nodiscard]] static std::optional<Identifier> fromBytes(
        std::span<const std::uint8_t> bytes) noexcept;

    /// @brief Parse a long-form string.
    /// @note Accepts 8-4-4-4-12 hex in either case, optionally wrapped in
    ///       braces. Surrounding whitespace is not accepted.
    [[nodiscard]] static std::optional<Identifier> parseLongForm(std::string_view text) noexcept;

    /// @brief Raw bytes, most significant first.
    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    /// @brief Render the canonical long form.
    [[nodiscard]] std::string toLongForm() const;

    constexpr bool operator==(const Identifier&) const noexcept = default;

private:
    Bytes bytes_{};
};

}  // namespace guidfix::codec

#endif  // GUIDFIX_CODEC_IDENTIFIER_H
