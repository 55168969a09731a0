// =============================================================================
// guidfix - Identifier Column Processing Implementation
// =============================================================================

#include "guidfix/table/guid_columns.h"

#include <algorithm>
#include <optional>

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "guidfix/codec/artifact_resolver.h"
#include "guidfix/common/logger.h"

namespace guidfix::table {

namespace {

/// @brief Per-row outcome, written by exactly one worker.
struct RowOutcome {
    enum class State : std::uint8_t { kEmpty, kResolved, kUnrecoverable };

    State state = State::kEmpty;
    codec::Resolution resolution;
};

[[nodiscard]] bool isUpper(char c) noexcept {
    return c >= 'A' && c <= 'Z';
}

[[nodiscard]] bool isLower(char c) noexcept {
    return c >= 'a' && c <= 'z';
}

/// @brief Word character for boundary purposes; non-ASCII bytes count as letters.
[[nodiscard]] bool isWordChar(char c) noexcept {
    auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || (c >= '0' && c <= '9') || isUpper(c) || isLower(c) || c == '_';
}

void removeColumnNamed(Table& table, std::string_view name) {
    while (auto index = table.columnIndex(name)) {
        table.removeColumn(*index);
    }
}

}  // namespace

std::string rowLabel(const Table& table, std::size_t rowIndex, std::string_view idColumn) {
    if (auto idIndex = table.columnIndex(idColumn); idIndex && rowIndex < table.rows.size()) {
        return fmt::format("ID: {}", table.rows[rowIndex][*idIndex]);
    }
    // Header occupies spreadsheet row 1
    return fmt::format("Row {}", rowIndex + 2);
}

// =============================================================================
// Identifier Column
// =============================================================================

Result<GuidColumnStats> processGuidColumn(Table& table, const GuidColumnOptions& options) {
    if (options.compactColumn == options.longColumn ||
        options.compactColumn == options.sourceColumn ||
        options.longColumn == options.sourceColumn) {
        return makeError<GuidColumnStats>(
            ErrorCode::kUsageError,
            fmt::format("column names must be distinct: source '{}', compact '{}', long '{}'",
                        options.sourceColumn, options.compactColumn, options.longColumn));
    }

    GuidColumnStats stats;

    auto sourceIndex = table.columnIndex(options.sourceColumn);
    if (!sourceIndex) {
        return stats;
    }
    stats.sourceFound = true;
    stats.rows = table.rows.size();

    const std::size_t column = *sourceIndex;
    std::vector<RowOutcome> outcomes(table.rows.size());

    auto resolveRows = [&]() {
        tbb::parallel_for(
            tbb::blocked_range<std::size_t>(0, table.rows.size()),
            [&](const tbb::blocked_range<std::size_t>& range) {
                for (std::size_t i = range.begin(); i < range.end(); ++i) {
                    const std::string& cell = table.rows[i][column];
                    if (codec::trimWhitespace(cell).empty()) {
                        continue;
                    }
                    auto resolution = codec::resolve(cell, options.surplus);
                    if (resolution) {
                        outcomes[i].state = RowOutcome::State::kResolved;
                        outcomes[i].resolution = std::move(*resolution);
                    } else {
                        outcomes[i].state = RowOutcome::State::kUnrecoverable;
                    }
                }
            });
    };

    if (options.threads > 0) {
        tbb::task_arena arena(options.threads);
        arena.execute(resolveRows);
    } else {
        resolveRows();
    }

    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        switch (outcomes[i].state) {
            case RowOutcome::State::kEmpty:
                ++stats.empty;
                break;
            case RowOutcome::State::kResolved:
                ++stats.resolved;
                if (outcomes[i].resolution.hypothesis != codec::Hypothesis::kDirect) {
                    ++stats.repaired;
                    GUIDFIX_LOG_DEBUG("{}: repaired wrapped identifier ({})",
                                      rowLabel(table, i, options.idColumn),
                                      codec::hypothesisToString(outcomes[i].resolution.hypothesis));
                }
                break;
            case RowOutcome::State::kUnrecoverable: {
                ++stats.unrecoverable;
                std::string label = rowLabel(table, i, options.idColumn);
                GUIDFIX_LOG_WARNING("{}: could not recover an identifier from '{}'", label,
                                    table.rows[i][column]);
                stats.unrecoverableRows.push_back(std::move(label));
                break;
            }
        }
    }

    removeColumnNamed(table, options.compactColumn);
    removeColumnNamed(table, options.longColumn);
    if (options.dropSource) {
        removeColumnNamed(table, options.sourceColumn);
    }

    table.insertColumn(0, options.compactColumn);
    table.insertColumn(1, options.longColumn);
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        if (outcomes[i].state != RowOutcome::State::kResolved) {
            continue;
        }
        table.rows[i][0] = std::move(outcomes[i].resolution.compactForm);
        table.rows[i][1] = std::move(outcomes[i].resolution.canonicalLongForm);
    }

    return stats;
}

// =============================================================================
// Name Column
// =============================================================================

std::string cleanNameCell(std::string_view text) {
    std::string normalized;
    normalized.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            normalized.push_back('\n');
        } else {
            normalized.push_back(text[i]);
        }
    }

    std::string result;
    result.reserve(normalized.size());
    for (std::size_t i = 0; i < normalized.size(); ++i) {
        char c = normalized[i];
        if (c == '-' && i + 1 < normalized.size() && normalized[i + 1] == '\n') {
            ++i;
            continue;
        }
        result.push_back(c == '\n' ? ' ' : c);
    }
    return result;
}

bool cleanNameColumn(Table& table, std::string_view nameColumn) {
    auto index = table.columnIndex(nameColumn);
    if (!index) {
        return false;
    }
    for (auto& row : table.rows) {
        row[*index] = cleanNameCell(row[*index]);
    }
    return true;
}

std::vector<NameFinding> analyzeNames(const Table& table,
                                      std::string_view nameColumn,
                                      std::string_view idColumn) {
    std::vector<NameFinding> findings;

    auto index = table.columnIndex(nameColumn);
    if (!index) {
        return findings;
    }

    for (std::size_t i = 0; i < table.rows.size(); ++i) {
        const std::string& name = table.rows[i][*index];
        if (name.empty()) {
            continue;
        }

        std::vector<std::string> abbreviations;
        std::vector<std::string> titleWords;

        std::size_t pos = 0;
        while (pos < name.size()) {
            if (!isWordChar(name[pos])) {
                ++pos;
                continue;
            }
            std::size_t end = pos;
            while (end < name.size() && isWordChar(name[end])) {
                ++end;
            }
            std::string_view word(name.data() + pos, end - pos);
            pos = end;

            if (word.size() < 2) {
                continue;
            }
            if (std::all_of(word.begin(), word.end(), isUpper)) {
                abbreviations.emplace_back(word);
            } else if (isUpper(word.front()) &&
                       std::all_of(word.begin() + 1, word.end(), isLower)) {
                titleWords.emplace_back(word);
            }
        }

        if (!abbreviations.empty()) {
            findings.push_back({NameFinding::Kind::kAbbreviation, rowLabel(table, i, idColumn),
                                name, std::move(abbreviations)});
        }
        if (!titleWords.empty()) {
            findings.push_back({NameFinding::Kind::kImproperCapitalization,
                                rowLabel(table, i, idColumn), name, std::move(titleWords)});
        }
    }

    return findings;
}

std::vector<NameFinding> reviewAndCleanNames(Table& table, bool clean,
                                             std::string_view nameColumn,
                                             std::string_view idColumn) {
    auto findings = analyzeNames(table, nameColumn, idColumn);
    if (clean && !cleanNameColumn(table, nameColumn)) {
        GUIDFIX_LOG_DEBUG("No '{}' column to clean", nameColumn);
    }
    return findings;
}

}  // namespace guidfix::table
