// =============================================================================
// guidfix - Parameter Name Styles Implementation
// =============================================================================

#include "guidfix/naming/name_style.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace guidfix::naming {

namespace {

/// @brief Words kept lowercase in title case unless first or last.
constexpr std::array<std::string_view, 19> kMinorWords = {
    // articles
    "a", "an", "the",
    // coordinating conjunctions
    "and", "but", "for", "or", "nor",
    // short prepositions
    "as", "at", "by", "in", "of", "off", "on", "per", "to", "up", "via"};

/// @brief Units of measure left untouched by the all-caps style.
constexpr std::array<std::string_view, 30> kUnitsToPreserve = {
    // length
    "mm", "cm", "m", "km", "nm",
    // area and volume
    "sqm", "m2", "m\u00b2", "m3", "m\u00b3", "l",
    // electrical
    "mA", "Ah", "mV", "kV", "VA",
    // time and frequency
    "s", "\u00b5s", "h", "Hz", "GHz",
    // mass
    "g", "kg",
    // lighting
    "lm", "cd/m\u00b2", "lx",
    // acoustics
    "dB", "dBm", "dBA",
    // force
    "kN"};

struct StyleName {
    std::string_view name;
    NameStyle style;
};

constexpr std::array<StyleName, 7> kStyleNames = {{
    {"title", NameStyle::kTitle},
    {"capitalise", NameStyle::kCapitalise},
    {"allcaps", NameStyle::kAllCaps},
    {"camel", NameStyle::kCamel},
    {"pascal", NameStyle::kPascal},
    {"snake", NameStyle::kSnake},
    {"pascal_snake", NameStyle::kPascalSnake},
}};

[[nodiscard]] bool isAsciiUpper(char c) noexcept {
    return c >= 'A' && c <= 'Z';
}

[[nodiscard]] bool isAsciiAlnum(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || isAsciiUpper(c);
}

[[nodiscard]] char toLowerAscii(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

[[nodiscard]] char toUpperAscii(char c) noexcept {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

[[nodiscard]] std::string lower(std::string_view word) {
    std::string result(word);
    std::transform(result.begin(), result.end(), result.begin(), toLowerAscii);
    return result;
}

[[nodiscard]] std::string upper(std::string_view word) {
    std::string result(word);
    std::transform(result.begin(), result.end(), result.begin(), toUpperAscii);
    return result;
}

/// @brief First character upper, the rest lower.
[[nodiscard]] std::string capitalize(std::string_view word) {
    std::string result = lower(word);
    if (!result.empty()) {
        result.front() = toUpperAscii(result.front());
    }
    return result;
}

/// @brief At least one letter and no lowercase letter.
[[nodiscard]] bool isUpperWord(std::string_view word) noexcept {
    bool hasLetter = false;
    for (char c : word) {
        if (c >= 'a' && c <= 'z') {
            return false;
        }
        hasLetter = hasLetter || isAsciiUpper(c);
    }
    return hasLetter;
}

[[nodiscard]] bool isMinorWord(std::string_view lowerWord) noexcept {
    return std::find(kMinorWords.begin(), kMinorWords.end(), lowerWord) != kMinorWords.end();
}

[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y) { return toLowerAscii(x) == toLowerAscii(y); });
}

/// @brief A unit, or digits directly followed by a unit (any case).
[[nodiscard]] bool isUnitWord(std::string_view word) noexcept {
    if (std::find(kUnitsToPreserve.begin(), kUnitsToPreserve.end(), word) !=
        kUnitsToPreserve.end()) {
        return true;
    }

    std::size_t digits = 0;
    while (digits < word.size() && word[digits] >= '0' && word[digits] <= '9') {
        ++digits;
    }
    if (digits == 0 || digits == word.size()) {
        return false;
    }

    std::string_view suffix = word.substr(digits);
    return std::any_of(kUnitsToPreserve.begin(), kUnitsToPreserve.end(),
                       [&](std::string_view unit) { return equalsIgnoreCase(suffix, unit); });
}

[[nodiscard]] std::string join(const std::vector<std::string>& words, std::string_view separator) {
    std::string result;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i != 0) {
            result.append(separator);
        }
        result.append(words[i]);
    }
    return result;
}

[[nodiscard]] std::string toTitleCase(const std::vector<std::string>& words) {
    std::vector<std::string> cased;
    cased.reserve(words.size());
    for (std::size_t i = 0; i < words.size(); ++i) {
        const std::string& word = words[i];
        if (isUpperWord(word)) {
            cased.push_back(word);
        } else if (i == 0 || i + 1 == words.size() || !isMinorWord(lower(word))) {
            cased.push_back(capitalize(word));
        } else {
            cased.push_back(lower(word));
        }
    }
    return join(cased, " ");
}

[[nodiscard]] std::string toCamelCase(const std::vector<std::string>& words, bool pascal) {
    if (words.empty()) {
        return {};
    }
    std::string result;
    const std::string& first = words.front();
    if (isUpperWord(first)) {
        result = first;
    } else {
        result = pascal ? capitalize(first) : lower(first);
    }
    for (std::size_t i = 1; i < words.size(); ++i) {
        result += isUpperWord(words[i]) ? words[i] : capitalize(words[i]);
    }
    return result;
}

}  // namespace

std::optional<NameStyle> parseNameStyle(std::string_view text) noexcept {
    for (const auto& entry : kStyleNames) {
        if (equalsIgnoreCase(entry.name, text)) {
            return entry.style;
        }
    }
    return std::nullopt;
}

std::string_view nameStyleToString(NameStyle style) noexcept {
    for (const auto& entry : kStyleNames) {
        if (entry.style == style) {
            return entry.name;
        }
    }
    return "unknown";
}

const std::vector<std::string>& nameStyleNames() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> result;
        for (const auto& entry : kStyleNames) {
            result.emplace_back(entry.name);
        }
        return result;
    }();
    return names;
}

std::vector<std::string> splitWords(std::string_view text) {
    std::vector<std::string> words;
    std::size_t pos = 0;

    while (pos < text.size()) {
        std::size_t capitals = 0;
        while (pos + capitals < text.size() && isAsciiUpper(text[pos + capitals])) {
            ++capitals;
        }
        if (capitals >= 2) {
            words.emplace_back(text.substr(pos, capitals));
            pos += capitals;
            continue;
        }

        std::size_t end = pos;
        while (end < text.size() && isAsciiAlnum(text[end])) {
            ++end;
        }
        if (end == pos) {
            ++pos;
            continue;
        }
        words.emplace_back(text.substr(pos, end - pos));
        pos = end;
    }

    return words;
}

std::string convertName(std::string_view text, NameStyle style) {
    const std::vector<std::string> words = splitWords(text);
    std::vector<std::string> cased;
    cased.reserve(words.size());

    switch (style) {
        case NameStyle::kTitle:
            return toTitleCase(words);

        case NameStyle::kCapitalise:
            for (const auto& word : words) {
                cased.push_back(isUpperWord(word) ? word : capitalize(word));
            }
            return join(cased, " ");

        case NameStyle::kAllCaps:
            for (const auto& word : words) {
                cased.push_back(isUnitWord(word) ? word : upper(word));
            }
            return join(cased, " ");

        case NameStyle::kCamel:
            return toCamelCase(words, false);

        case NameStyle::kPascal:
            return toCamelCase(words, true);

        case NameStyle::kSnake:
            for (const auto& word : words) {
                cased.push_back(lower(word));
            }
            return join(cased, "_");

        case NameStyle::kPascalSnake:
            for (const auto& word : words) {
                cased.push_back(capitalize(word));
            }
            return join(cased, "_");
    }

    return std::string(text);
}

}  // namespace guidfix::naming
