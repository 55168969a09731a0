// =============================================================================
// guidfix - Revit Shared Parameter File Generation Implementation
// =============================================================================

#include "guidfix/params/shared_parameters.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <random>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "guidfix/codec/identifier.h"
#include "guidfix/common/logger.h"

namespace guidfix::params {

namespace {

struct UnitType {
    std::string_view unit;
    std::string_view dataType;
};

/// @brief Unit -> DATATYPE, longest unit first so "mm2" wins over "m".
constexpr std::array<UnitType, 32> kUnitTypes = {{
    {"cd/m²", "ELECTRICAL_LUMINANCE"},
    {"lm/w", "ELECTRICAL_EFFICACY"},
    {"sqm", "AREA"},
    {"mm2", "AREA"},
    {"mm²", "AREA"},
    {"ghz", "ELECTRICAL_FREQUENCY"},
    {"url", "URL"},
    {"m2", "AREA"},
    {"m²", "AREA"},
    {"m3", "VOLUME"},
    {"m³", "VOLUME"},
    {"mm", "LENGTH"},
    {"cm", "LENGTH"},
    {"kg", "MASS_DENSITY"},
    {"°c", "HVAC_TEMPERATURE"},
    {"kn", "FORCE"},
    {"va", "ELECTRICAL_APPARENT_POWER"},
    {"kv", "ELECTRICAL_POTENTIAL"},
    {"mv", "ELECTRICAL_POTENTIAL"},
    {"ma", "ELECTRICAL_CURRENT"},
    {"hz", "ELECTRICAL_FREQUENCY"},
    {"lm", "ELECTRICAL_LUMINOUS_FLUX"},
    {"lx", "ELECTRICAL_ILLUMINANCE"},
    {"l", "VOLUME"},
    {"m", "LENGTH"},
    {"g", "MASS_DENSITY"},
    {"°", "ANGLE"},
    {"%", "HVAC_FACTOR"},
    {"w", "ELECTRICAL_POWER"},
    {"v", "ELECTRICAL_POTENTIAL"},
    {"a", "ELECTRICAL_CURRENT"},
    {"k", "COLOR_TEMPERATURE"},
}};

constexpr std::string_view kNotApplicable = "n.a.";
constexpr std::string_view kIdenticalWithName = "identical with name";
constexpr std::string_view kValueSetMarker = " i.e. ";
constexpr std::string_view kExamplesMarker = " e.g. ";

/// @brief Minimum room (code points) worth spending on a value set or examples.
constexpr std::size_t kMinAppendSpace = 5;

constexpr std::string_view kFilePreamble =
    "# This is a Revit shared parameter file.\n"
    "# Do not edit manually.\n"
    "*META\tVERSION\tMINVERSION\n"
    "META\t2\t1\n";

constexpr std::string_view kGroupHeader = "*GROUP\tID\tNAME\n";

constexpr std::string_view kParamHeader =
    "*PARAM\tGUID\tNAME\tDATATYPE\tDATACATEGORY\tGROUP\tVISIBLE\tDESCRIPTION"
    "\tUSERMODIFIABLE\tHIDEWHENNOVALUE\n";

[[nodiscard]] bool isSpace(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] std::string toLower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

[[nodiscard]] std::string removeAll(std::string_view text, std::string_view needle) {
    std::string result(text);
    if (needle.empty()) {
        return result;
    }
    for (auto pos = result.find(needle); pos != std::string::npos; pos = result.find(needle, pos)) {
        result.erase(pos, needle.size());
    }
    return result;
}

/// @brief Trim and collapse every whitespace run to one space.
[[nodiscard]] std::string collapseWhitespace(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text) {
        if (isSpace(c)) {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace) {
            result.push_back(' ');
            pendingSpace = false;
        }
        result.push_back(c);
    }
    return result;
}

/// @brief Byte offset just past the first `count` code points.
[[nodiscard]] std::size_t utf8Offset(std::string_view text, std::size_t count) noexcept {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (seen == count) {
                return i;
            }
            ++seen;
        }
    }
    return text.size();
}

/// @brief Cut at the last space so that prefix + ellipsis fits `width`.
/// @return nullopt when not even one word fits.
[[nodiscard]] std::optional<std::string> shortenAtWord(std::string_view text, std::size_t width) {
    if (utf8Length(text) <= width) {
        return std::string(text);
    }

    std::optional<std::string> best;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != ' ') {
            continue;
        }
        std::string_view prefix = text.substr(0, i);
        while (!prefix.empty() && prefix.back() == ' ') {
            prefix.remove_suffix(1);
        }
        if (utf8Length(prefix) + 1 > width) {
            break;
        }
        best = std::string(prefix).append(kEllipsis);
    }
    return best;
}

/// @brief "1E" followed by an optional sign and at least one digit, any case.
[[nodiscard]] bool hasScientificFormat(std::string_view text) noexcept {
    for (std::size_t i = 0; i + 2 < text.size(); ++i) {
        if (text[i] != '1' || (text[i + 1] != 'E' && text[i + 1] != 'e')) {
            continue;
        }
        std::size_t j = i + 2;
        if (j < text.size() && (text[j] == '+' || text[j] == '-')) {
            ++j;
        }
        if (j < text.size() && std::isdigit(static_cast<unsigned char>(text[j])) != 0) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] std::string sanitizeField(std::string_view text) {
    std::string result(text);
    std::replace_if(result.begin(), result.end(),
                    [](char c) { return c == '\t' || c == '\n' || c == '\r'; }, ' ');
    return result;
}

void appendUtf16Unit(std::string& out, std::uint16_t unit) {
    out.push_back(static_cast<char>(unit & 0xFF));
    out.push_back(static_cast<char>(unit >> 8));
}

}  // namespace

// =============================================================================
// Cell Interpretation
// =============================================================================

std::string inferDataType(std::string_view formatUnit, std::string_view valueSet) {
    if (removeAll(toLower(valueSet), ",").find("yes no") != std::string::npos) {
        return "YESNO";
    }

    const std::string unitText = removeAll(toLower(formatUnit), kNotApplicable);
    for (const auto& entry : kUnitTypes) {
        if (unitText.find(entry.unit) != std::string::npos) {
            return std::string(entry.dataType);
        }
    }

    if (formatUnit == kNotApplicable && std::count(valueSet.begin(), valueSet.end(), ',') > 0) {
        return "TEXT";
    }

    if (hasScientificFormat(formatUnit)) {
        return "NUMBER";
    }

    return "TEXT";
}

std::string formatDescription(std::string_view description,
                              std::string_view valueSet,
                              std::string_view examples,
                              std::size_t limit) {
    if (limit == 0) {
        return {};
    }

    std::string base = collapseWhitespace(description);
    std::string values = collapseWhitespace(valueSet);
    const std::string sample = collapseWhitespace(examples);

    if (toLower(base).find(kIdenticalWithName) != std::string::npos) {
        base.clear();
    }

    const std::string plainValues = removeAll(toLower(values), ",");
    if (plainValues == "yes no" || plainValues == "n.a" || plainValues == kNotApplicable) {
        values.clear();
    }

    std::string result = base;
    if (utf8Length(result) > limit) {
        result = shortenAtWord(base, limit).value_or(
            base.substr(0, utf8Offset(base, limit - 1)) + std::string(kEllipsis));
    }

    std::size_t available = limit - utf8Length(result);
    if (!values.empty() && available > kMinAppendSpace) {
        std::string appended = std::string(kValueSetMarker) + values;
        if (utf8Length(appended) <= available) {
            result += appended;
        } else {
            std::string_view head(appended.data(), utf8Offset(appended, available));
            auto lastComma = head.rfind(',');
            // keep at least one whole value after the marker
            if (lastComma != std::string_view::npos && lastComma > kMinAppendSpace) {
                result.append(head.substr(0, lastComma)).append(kEllipsis);
            }
        }
    }

    available = limit - utf8Length(result);
    if (!sample.empty() && available > kMinAppendSpace) {
        std::string appended = std::string(kExamplesMarker) + sample;
        if (utf8Length(appended) <= available) {
            result += appended;
        } else if (auto shortened = shortenAtWord(appended, available);
                   shortened && utf8Length(*shortened) > kExamplesMarker.size()) {
            result += *shortened;
        }
    }

    const auto first = result.find_first_not_of(' ');
    return first == std::string::npos ? std::string{} : result.substr(first);
}

std::size_t utf8Length(std::string_view text) noexcept {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string encodeUtf16Le(std::string_view utf8) {
    constexpr std::uint32_t kReplacement = 0xFFFD;

    std::string out;
    out.reserve(utf8.size() * 2);

    std::size_t i = 0;
    while (i < utf8.size()) {
        auto lead = static_cast<unsigned char>(utf8[i]);
        std::uint32_t codePoint = kReplacement;
        std::size_t length = 1;

        if (lead < 0x80) {
            codePoint = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            codePoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            codePoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            codePoint = lead & 0x07;
        } else {
            length = 0;
        }

        bool valid = length != 0 && i + length <= utf8.size();
        for (std::size_t k = 1; valid && k < length; ++k) {
            auto next = static_cast<unsigned char>(utf8[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            codePoint = (codePoint << 6) | (next & 0x3F);
        }
        if (valid && (codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF))) {
            valid = false;
        }

        if (!valid) {
            codePoint = kReplacement;
            length = 1;
        }
        i += length;

        if (codePoint >= 0x10000) {
            codePoint -= 0x10000;
            appendUtf16Unit(out, static_cast<std::uint16_t>(0xD800 + (codePoint >> 10)));
            appendUtf16Unit(out, static_cast<std::uint16_t>(0xDC00 + (codePoint & 0x3FF)));
        } else {
            appendUtf16Unit(out, static_cast<std::uint16_t>(codePoint));
        }
    }

    return out;
}

// =============================================================================
// SharedParamsBuilder Implementation
// =============================================================================

int randomGroupIdBase() {
    std::random_device device;
    std::uniform_int_distribution<int> step(0, 4);
    return 200 + 10 * step(device);
}

SharedParamsBuilder::SharedParamsBuilder(SharedParamsConfig config) : config_(std::move(config)) {}

SheetSummary SharedParamsBuilder::addSheet(std::string sheetName, const table::Table& sheet) {
    SheetSummary summary;
    summary.groupId = config_.groupIdBase + static_cast<int>(groups_.size());
    groups_.push_back({summary.groupId, sanitizeField(sheetName)});

    std::array<std::size_t, kRequiredColumns.size()> columns{};
    for (std::size_t i = 0; i < kRequiredColumns.size(); ++i) {
        auto index = sheet.columnIndex(kRequiredColumns[i]);
        if (!index) {
            summary.missingColumns.emplace_back(kRequiredColumns[i]);
            continue;
        }
        columns[i] = *index;
    }

    if (!summary.missingColumns.empty()) {
        summary.skipped = true;
        GUIDFIX_LOG_WARNING("Sheet '{}' is missing required column(s) {}; skipping", sheetName,
                            fmt::format("{}", fmt::join(summary.missingColumns, ", ")));
        return summary;
    }

    const auto& [guidCol, nameCol, descriptionCol, formatCol, valueSetCol, examplesCol] = columns;

    for (std::size_t i = 0; i < sheet.rows.size(); ++i) {
        const auto& row = sheet.rows[i];

        std::string_view guidCell = row[guidCol];
        const auto first = guidCell.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) {
            ++summary.emptyRows;
            continue;
        }
        guidCell = guidCell.substr(first, guidCell.find_last_not_of(" \t\r\n") - first + 1);

        auto identifier = codec::Identifier::parseLongForm(guidCell);
        if (!identifier) {
            ++summary.rejectedRows;
            GUIDFIX_LOG_WARNING("Sheet '{}' row {}: '{}' is not a long-form identifier; skipping",
                                sheetName, i + 2, guidCell);
            continue;
        }

        std::string name = naming::convertName(row[nameCol], config_.nameStyle);
        if (name.empty()) {
            ++summary.rejectedRows;
            GUIDFIX_LOG_WARNING("Sheet '{}' row {}: empty parameter name; skipping", sheetName, i + 2);
            continue;
        }
        name += config_.nameSuffix;

        ParameterEntry entry;
        entry.guid = identifier->toLongForm();
        entry.name = sanitizeField(name);
        entry.dataType = inferDataType(row[formatCol], row[valueSetCol]);
        entry.groupId = summary.groupId;
        entry.description =
            sanitizeField(formatDescription(row[descriptionCol], row[valueSetCol], row[examplesCol]));
        parameters_.push_back(std::move(entry));
        ++summary.parameters;
    }

    GUIDFIX_LOG_INFO("Sheet '{}' -> group {}: {} parameter(s)", sheetName, summary.groupId,
                     summary.parameters);
    return summary;
}

std::string SharedParamsBuilder::render() const {
    std::string out(kFilePreamble);

    out.append(kGroupHeader);
    for (const auto& group : groups_) {
        out += fmt::format("GROUP\t{}\t{}\n", group.id, group.name);
    }

    out.append(kParamHeader);
    for (const auto& param : parameters_) {
        out += fmt::format("PARAM\t{}\t{}\t{}\t\t{}\t1\t{}\t1\t0\n", param.guid, param.name,
                           param.dataType, param.groupId, param.description);
    }

    return out;
}

VoidResult SharedParamsBuilder::writeFile(const std::filesystem::path& path) const {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("failed to open output: {}", path.string()));
    }

    const std::string content = encodeUtf16Le(render());
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("failed to write output: {}", path.string()));
    }
    return makeVoidSuccess();
}

}  // namespace guidfix::params
