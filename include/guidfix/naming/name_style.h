// =============================================================================
// guidfix - Parameter Name Styles
// =============================================================================
// Case-style conversion for parameter names.
//
// Names are first split into words: at each position a run of two or more
// ASCII capitals wins, otherwise the longest ASCII alphanumeric run is taken;
// every other character separates words.
//
//   "luminaire housing shape 3D" -> luminaire | housing | shape | 3D
//   "HVACSystem"                 -> HVACS | ystem
//
// A word "is upper" when it has at least one letter and no lowercase letter
// ("3D", "IFC"); such words keep their case in every style except snake and
// Pascal_Snake.
// =============================================================================

#ifndef GUIDFIX_NAMING_NAME_STYLE_H
#define GUIDFIX_NAMING_NAME_STYLE_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace guidfix::naming {

/// @brief Supported naming styles.
enum class NameStyle : std::uint8_t {
    /// @brief Chicago Manual of Style title case ("Power of the Light").
    kTitle = 0,

    /// @brief Every word capitalized ("Power Of The Light").
    kCapitalise,

    /// @brief Upper case, units of measure preserved ("RATED POWER 12kV").
    kAllCaps,

    /// @brief camelCase.
    kCamel,

    /// @brief PascalCase.
    kPascal,

    /// @brief snake_case.
    kSnake,

    /// @brief Pascal_Snake_Case.
    kPascalSnake
};

/// @brief Parse a style name (case-insensitive): title, capitalise, allcaps,
///        camel, pascal, snake, pascal_snake.
[[nodiscard]] std::optional<NameStyle> parseNameStyle(std::string_view text) noexcept;

/// @brief Canonical CLI spelling of a style.
[[nodiscard]] std::string_view nameStyleToString(NameStyle style) noexcept;

/// @brief All style spellings accepted by parseNameStyle().
[[nodiscard]] const std::vector<std::string>& nameStyleNames();

/// @brief Split a name into words.
[[nodiscard]] std::vector<std::string> splitWords(std::string_view text);

/// @brief Convert a name to a style.
[[nodiscard]] std::string convertName(std::string_view text, NameStyle style);

}  // namespace guidfix::naming

#endif  // GUIDFIX_NAMING_NAME_STYLE_H
