// =============================================================================
// guidfix - Identifier Model Implementation
// =============================================================================

#include "guidfix/codec/identifier.h"

#include <algorithm>

namespace guidfix::codec {

namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";

/// @brief Hyphen positions in the long form (after 8, 4, 4, 4 hex digits).
constexpr std::array<std::size_t, 4> kHyphenPositions = {8, 13, 18, 23};

[[nodiscard]] constexpr int hexValue(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

std::optional<Identifier> Identifier::fromBytes(std::span<const std::uint8_t> bytes) noexcept {
    if (bytes.size() != kIdentifierBytes) {
        return std::nullopt;
    }
    Bytes value{};
    std::copy(bytes.begin(), bytes.end(), value.begin());
    return Identifier{value};
}

std::optional<Identifier> Identifier::parseLongForm(std::string_view text) noexcept {
    if (text.size() == kLongFormLength + 2 && text.front() == '{' && text.back() == '}') {
        text = text.substr(1, kLongFormLength);
    }
    if (text.size() != kLongFormLength) {
        return std::nullopt;
    }

    Bytes value{};
    std::size_t byteIndex = 0;
    int high = -1;

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (std::find(kHyphenPositions.begin(), kHyphenPositions.end(), i) !=
            kHyphenPositions.end()) {
            if (text[i] != '-') {
                return std::nullopt;
            }
            continue;
        }

        int nibble = hexValue(text[i]);
        if (nibble < 0) {
            return std::nullopt;
        }
        if (high < 0) {
            high = nibble;
        } else {
            value[byteIndex++] = static_cast<std::uint8_t>((high << 4) | nibble);
            high = -1;
        }
    }

    return Identifier{value};
}

std::string Identifier::toLongForm() const {
    std::string result;
    result.reserve(kLongFormLength);

    for (std::size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            result.push_back('-');
        }
        result.push_back(kHexDigits[bytes_[i] >> 4]);
        result.push_back(kHexDigits[bytes_[i] & 0x0F]);
    }

    return result;
}

}  // namespace guidfix::codec
