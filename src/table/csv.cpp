// =============================================================================
// guidfix - Delimited Table I/O Implementation
// =============================================================================

#include "guidfix/table/csv.h"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <fmt/format.h>

namespace guidfix::table {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

[[nodiscard]] bool needsQuoting(std::string_view field, const CsvDialect& dialect) noexcept {
    return std::any_of(field.begin(), field.end(), [&](char c) {
        return c == dialect.delimiter || c == dialect.quote || c == '\n' || c == '\r';
    });
}

/// @brief Streaming record splitter over the whole input.
class RecordReader {
public:
    RecordReader(std::string_view text, const CsvDialect& dialect)
        : text_(text), dialect_(dialect) {}

    [[nodiscard]] bool atEnd() const noexcept { return pos_ >= text_.size(); }

    /// @brief Line number (1-based) where the next record starts.
    [[nodiscard]] std::size_t line() const noexcept { return line_; }

    /// @brief Read one record. Returns false on an unterminated quote.
    [[nodiscard]] bool next(std::vector<std::string>& fields, bool& blank) {
        fields.clear();
        std::string field;
        bool quoted = false;
        bool inQuotes = false;

        while (pos_ < text_.size()) {
            char c = text_[pos_];

            if (inQuotes) {
                if (c == dialect_.quote) {
                    if (pos_ + 1 < text_.size() && text_[pos_ + 1] == dialect_.quote) {
                        field.push_back(c);
                        pos_ += 2;
                        continue;
                    }
                    inQuotes = false;
                    ++pos_;
                    continue;
                }
                if (c == '\n') {
                    ++line_;
                }
                field.push_back(c);
                ++pos_;
                continue;
            }

            if (c == dialect_.quote && field.empty() && !quoted) {
                inQuotes = true;
                quoted = true;
                ++pos_;
                continue;
            }

            if (c == dialect_.delimiter) {
                fields.push_back(std::move(field));
                field.clear();
                quoted = false;
                ++pos_;
                continue;
            }

            if (c == '\n' || c == '\r') {
                ++pos_;
                if (c == '\r' && pos_ < text_.size() && text_[pos_] == '\n') {
                    ++pos_;
                }
                ++line_;
                break;
            }

            field.push_back(c);
            ++pos_;
        }

        if (inQuotes) {
            return false;
        }

        blank = fields.empty() && field.empty() && !quoted;
        fields.push_back(std::move(field));
        return true;
    }

private:
    std::string_view text_;
    const CsvDialect& dialect_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
};

}  // namespace

// =============================================================================
// Table Implementation
// =============================================================================

std::optional<std::size_t> Table::columnIndex(std::string_view name) const noexcept {
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(header.begin(), it));
}

void Table::insertColumn(std::size_t position, std::string name) {
    position = std::min(position, header.size());
    header.insert(header.begin() + static_cast<std::ptrdiff_t>(position), std::move(name));
    for (auto& row : rows) {
        std::size_t at = std::min(position, row.size());
        row.insert(row.begin() + static_cast<std::ptrdiff_t>(at), std::string{});
    }
}

void Table::removeColumn(std::size_t index) {
    if (index >= header.size()) {
        return;
    }
    header.erase(header.begin() + static_cast<std::ptrdiff_t>(index));
    for (auto& row : rows) {
        if (index < row.size()) {
            row.erase(row.begin() + static_cast<std::ptrdiff_t>(index));
        }
    }
}

// =============================================================================
// Parsing
// =============================================================================

Result<Table> parseCsv(std::string_view text, const CsvDialect& dialect) {
    if (text.starts_with(kUtf8Bom)) {
        text.remove_prefix(kUtf8Bom.size());
    }

    RecordReader reader(text, dialect);
    Table table;
    std::vector<std::string> fields;
    bool haveHeader = false;

    while (!reader.atEnd()) {
        const std::size_t line = reader.line();
        bool blank = false;
        if (!reader.next(fields, blank)) {
            return makeError<Table>(ErrorCode::kFormatError,
                                    fmt::format("unterminated quoted field starting on line {}", line));
        }
        if (blank) {
            continue;
        }

        if (!haveHeader) {
            table.header = std::move(fields);
            fields = {};
            haveHeader = true;
            continue;
        }

        if (fields.size() > table.header.size()) {
            return makeError<Table>(
                ErrorCode::kFormatError,
                fmt::format("record on line {} has {} fields, header has {}", line, fields.size(),
                            table.header.size()));
        }
        fields.resize(table.header.size());
        table.rows.push_back(std::move(fields));
        fields = {};
    }

    if (!haveHeader) {
        return makeError<Table>(ErrorCode::kFormatError, "table has no header row");
    }

    return table;
}

std::string formatCsv(const Table& table, const CsvDialect& dialect) {
    std::string out;

    auto appendRecord = [&](const std::vector<std::string>& record) {
        for (std::size_t i = 0; i < record.size(); ++i) {
            if (i != 0) {
                out.push_back(dialect.delimiter);
            }
            const std::string& field = record[i];
            if (!needsQuoting(field, dialect)) {
                out.append(field);
                continue;
            }
            out.push_back(dialect.quote);
            for (char c : field) {
                if (c == dialect.quote) {
                    out.push_back(dialect.quote);
                }
                out.push_back(c);
            }
            out.push_back(dialect.quote);
        }
        out.append(dialect.lineTerminator);
    };

    appendRecord(table.header);
    for (const auto& row : table.rows) {
        appendRecord(row);
    }
    return out;
}

// =============================================================================
// File I/O
// =============================================================================

Result<Table> readCsvFile(const std::filesystem::path& path, const CsvDialect& dialect) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return makeError<Table>(ErrorCode::kIOError,
                                fmt::format("failed to open input: {}", path.string()));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return makeError<Table>(ErrorCode::kIOError,
                                fmt::format("failed to read input: {}", path.string()));
    }

    auto table = parseCsv(buffer.str(), dialect);
    if (!table) {
        return makeError<Table>(table.error().code(),
                                fmt::format("{}: {}", path.string(), table.error().message()));
    }
    return table;
}

VoidResult writeCsvFile(const std::filesystem::path& path,
                        const Table& table,
                        const CsvDialect& dialect) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("failed to open output: {}", path.string()));
    }

    const std::string content = formatCsv(table, dialect);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("failed to write output: {}", path.string()));
    }
    return makeVoidSuccess();
}

}  // namespace guidfix::table
