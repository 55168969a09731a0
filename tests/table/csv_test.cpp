// =============================================================================
// guidfix - CSV Table Tests
// =============================================================================
// Unit and property tests for delimited table parsing and formatting.
// =============================================================================

#include "guidfix/table/csv.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <filesystem>
#include <fstream>

namespace guidfix::table {
namespace {

// =============================================================================
// Parsing Tests
// =============================================================================

TEST(CsvParseTest, HeaderAndRows) {
    auto table = parseCsv("ID,GUID,Name\n1,abc,Power\n2,def,Voltage\n");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->header, (std::vector<std::string>{"ID", "GUID", "Name"}));
    ASSERT_EQ(table->rowCount(), 2u);
    EXPECT_EQ(table->rows[1], (std::vector<std::string>{"2", "def", "Voltage"}));
}

TEST(CsvParseTest, QuotedFieldsWithEmbeddedBreaks) {
    auto table = parseCsv("GUID,Name\n\"OjUoLaQbSJa-\nLY55KONd1nQ\",\"Power, rated\"\n");
    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table->rowCount(), 1u);
    EXPECT_EQ(table->rows[0][0], "OjUoLaQbSJa-\nLY55KONd1nQ");
    EXPECT_EQ(table->rows[0][1], "Power, rated");
}

TEST(CsvParseTest, DoubledQuotes) {
    auto table = parseCsv("A\n\"say \"\"hi\"\"\"\n");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->rows[0][0], "say \"hi\"");
}

TEST(CsvParseTest, BomCrLfAndBlankLines) {
    auto table = parseCsv("\xEF\xBB\xBFID,Name\r\n\r\n1,Power\r\n\r\n");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->header[0], "ID");
    ASSERT_EQ(table->rowCount(), 1u);
    EXPECT_EQ(table->rows[0][1], "Power");
}

TEST(CsvParseTest, ShortRowsArePadded) {
    auto table = parseCsv("A,B,C\n1\n");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->rows[0], (std::vector<std::string>{"1", "", ""}));
}

TEST(CsvParseTest, NoTrailingNewline) {
    auto table = parseCsv("A,B\n1,2");
    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table->rowCount(), 1u);
    EXPECT_EQ(table->rows[0][1], "2");
}

TEST(CsvParseTest, CustomDelimiter) {
    CsvDialect dialect;
    dialect.delimiter = ';';
    auto table = parseCsv("Format, Unit;Value set\n1E0, mm;n.a.\n", dialect);
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->header[0], "Format, Unit");
    EXPECT_EQ(table->rows[0][0], "1E0, mm");
}

TEST(CsvParseTest, Errors) {
    auto unterminated = parseCsv("A\n\"open\n");
    ASSERT_FALSE(unterminated.has_value());
    EXPECT_EQ(unterminated.error().code(), ErrorCode::kFormatError);

    auto tooLong = parseCsv("A,B\n1,2,3\n");
    ASSERT_FALSE(tooLong.has_value());
    EXPECT_EQ(tooLong.error().code(), ErrorCode::kFormatError);

    auto empty = parseCsv("");
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code(), ErrorCode::kFormatError);
}

// =============================================================================
// Table Editing Tests
// =============================================================================

TEST(TableTest, InsertAndRemoveColumns) {
    auto table = parseCsv("A,B\n1,2\n");
    ASSERT_TRUE(table.has_value());

    table->insertColumn(0, "X");
    table->insertColumn(99, "Z");
    EXPECT_EQ(table->header, (std::vector<std::string>{"X", "A", "B", "Z"}));
    EXPECT_EQ(table->rows[0], (std::vector<std::string>{"", "1", "2", ""}));

    table->removeColumn(*table->columnIndex("A"));
    EXPECT_EQ(table->header, (std::vector<std::string>{"X", "B", "Z"}));
    EXPECT_EQ(table->rows[0], (std::vector<std::string>{"", "2", ""}));
    EXPECT_FALSE(table->columnIndex("A").has_value());
}

// =============================================================================
// Formatting Tests
// =============================================================================

TEST(CsvFormatTest, QuotesOnlyWhenNeeded) {
    Table table;
    table.header = {"GUID", "Name"};
    table.rows = {{"abc", "Power, rated"}, {"a\nb", "say \"hi\""}};

    EXPECT_EQ(formatCsv(table),
              "GUID,Name\nabc,\"Power, rated\"\n\"a\nb\",\"say \"\"hi\"\"\"\n");
}

TEST(CsvFileTest, WriteThenRead) {
    const auto path = std::filesystem::temp_directory_path() / "guidfix_csv_file_test.csv";

    Table table;
    table.header = {"ID", "GUID"};
    table.rows = {{"1", "OjUoLaQbSJa-\nLY55KONd1nQ"}};

    ASSERT_TRUE(writeCsvFile(path, table).has_value());
    auto read = readCsvFile(path);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read->header, table.header);
    EXPECT_EQ(read->rows, table.rows);

    std::filesystem::remove(path);
}

TEST(CsvFileTest, MissingFileIsIOError) {
    auto read = readCsvFile(std::filesystem::temp_directory_path() / "guidfix_no_such_file.csv");
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().code(), ErrorCode::kIOError);
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(CsvProperty, FormatThenParsePreservesCells, ()) {
    const auto columns = *rc::gen::inRange<std::size_t>(2, 6);
    const auto cell = rc::gen::container<std::string>(rc::gen::elementOf(
        std::string("abcXYZ019 -_,;\"\n\r")));

    Table table;
    table.header = *rc::gen::container<std::vector<std::string>>(
        columns, rc::gen::nonEmpty(rc::gen::container<std::string>(
                     rc::gen::elementOf(std::string("ABCxyz -")))));
    const auto rows = *rc::gen::inRange<std::size_t>(0, 8);
    for (std::size_t i = 0; i < rows; ++i) {
        table.rows.push_back(*rc::gen::container<std::vector<std::string>>(columns, cell));
    }

    auto parsed = parseCsv(formatCsv(table));
    RC_ASSERT(parsed.has_value());
    RC_ASSERT(parsed->header == table.header);
    RC_ASSERT(parsed->rows == table.rows);
}

}  // namespace
}  // namespace guidfix::table
