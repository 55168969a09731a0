// =============================================================================
// guidfix - Compact Identifier Codec Implementation
// =============================================================================

#include "guidfix/codec/compact_codec.h"

#include <array>

namespace guidfix::codec {

namespace {

/// @brief Marker for bytes outside the alphabet in the decode table.
constexpr std::int8_t kInvalidSymbol = -1;

/// @brief Mask of the surplus bits in the last symbol.
constexpr std::uint8_t kSurplusMask = 0x0F;

/// @brief Reverse lookup table: byte -> 6-bit value or kInvalidSymbol.
constexpr std::array<std::int8_t, 256> kDecodeTable = [] {
    std::array<std::int8_t, 256> table{};
    table.fill(kInvalidSymbol);
    for (std::size_t i = 0; i < kCompactAlphabet.size(); ++i) {
        table[static_cast<unsigned char>(kCompactAlphabet[i])] = static_cast<std::int8_t>(i);
    }
    return table;
}();

[[nodiscard]] std::int8_t symbolValue(char c) noexcept {
    return kDecodeTable[static_cast<unsigned char>(c)];
}

}  // namespace

bool isCompactSymbol(char c) noexcept {
    return symbolValue(c) != kInvalidSymbol;
}

std::string compress(const Identifier& identifier) {
    const auto& bytes = identifier.bytes();

    std::string result;
    result.reserve(kCompactFormLength);

    // 5 full 3-byte groups -> 20 symbols
    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        std::uint32_t group = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                              (static_cast<std::uint32_t>(bytes[i + 1]) << 8) |
                              static_cast<std::uint32_t>(bytes[i + 2]);
        result.push_back(kCompactAlphabet[(group >> 18) & 0x3F]);
        result.push_back(kCompactAlphabet[(group >> 12) & 0x3F]);
        result.push_back(kCompactAlphabet[(group >> 6) & 0x3F]);
        result.push_back(kCompactAlphabet[group & 0x3F]);
    }

    // Trailing byte -> 2 symbols, surplus bits zero
    std::uint8_t last = bytes[i];
    result.push_back(kCompactAlphabet[last >> 2]);
    result.push_back(kCompactAlphabet[(last & 0x03) << 4]);

    return result;
}

Result<Expansion, DecodeError> expand(std::string_view text, SurplusBits surplus) {
    std::size_t padding = 0;
    while (padding < text.size() && text[text.size() - 1 - padding] == kPaddingSymbol) {
        ++padding;
    }

    const std::size_t meaningful = text.size() - padding;
    if (meaningful != kCompactFormLength) {
        return std::unexpected(DecodeError::kInvalidLength);
    }
    // Only the single re-pad to the next multiple of four is accepted
    if (padding != 0 && padding != (4 - kCompactFormLength % 4) % 4) {
        return std::unexpected(DecodeError::kInvalidLength);
    }

    std::array<std::uint8_t, kCompactFormLength> values{};
    for (std::size_t i = 0; i < kCompactFormLength; ++i) {
        std::int8_t value = symbolValue(text[i]);
        if (value == kInvalidSymbol) {
            return std::unexpected(DecodeError::kInvalidAlphabetCharacter);
        }
        values[i] = static_cast<std::uint8_t>(value);
    }

    if (surplus == SurplusBits::kReject && (values.back() & kSurplusMask) != 0) {
        return std::unexpected(DecodeError::kInvalidByteLength);
    }

    // 132 bits in, 128 bits out; the final 4 bits are the surplus
    Identifier::Bytes bytes{};
    std::uint32_t accumulator = 0;
    int bits = 0;
    std::size_t out = 0;

    for (std::uint8_t value : values) {
        accumulator = (accumulator << 6) | value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            bytes[out++] = static_cast<std::uint8_t>((accumulator >> bits) & 0xFF);
        }
    }

    Identifier identifier{bytes};
    return Expansion{identifier, identifier.toLongForm()};
}

}  // namespace guidfix::codec
