// =============================================================================
// guidfix - Error Handling Tests
// =============================================================================

#include "guidfix/common/error.h"

#include <gtest/gtest.h>

namespace guidfix {
namespace {

TEST(ErrorCodeTest, ExitCodes) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kFormatError), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kUnresolvedIdentifier), 4);
    EXPECT_TRUE(isSuccess(ErrorCode::kSuccess));
    EXPECT_TRUE(isError(ErrorCode::kFormatError));
}

TEST(ErrorContextTest, Format) {
    ErrorContext context;
    EXPECT_EQ(context.format(), "");

    context.withFile("lighting.csv").withRow(7).withColumn("GUID");
    const std::string text = context.format();
    EXPECT_NE(text.find("file: lighting.csv"), std::string::npos);
    EXPECT_NE(text.find("row: 7"), std::string::npos);
    EXPECT_NE(text.find("column: GUID"), std::string::npos);
}

TEST(GuidfixExceptionTest, WhatIncludesCategoryAndContext) {
    FormatError error("missing column", ErrorContext{}.withSheet("Lighting"));
    EXPECT_EQ(error.code(), ErrorCode::kFormatError);
    EXPECT_EQ(error.exitCode(), 3);
    EXPECT_EQ(error.message(), "missing column");
    EXPECT_TRUE(error.hasContext());

    const std::string what = error.what();
    EXPECT_TRUE(what.starts_with("[format error] missing column"));
    EXPECT_NE(what.find("sheet: Lighting"), std::string::npos);
}

TEST(GuidfixExceptionTest, SystemErrorIsAppended) {
    IOError error("cannot open", std::make_error_code(std::errc::no_such_file_or_directory));
    ASSERT_TRUE(error.systemError().has_value());
    EXPECT_NE(std::string(error.what()).find("cannot open: "), std::string::npos);
}

TEST(ResultTest, UnwrapOrThrow) {
    EXPECT_EQ(unwrapOrThrow(makeSuccess(42)), 42);
    EXPECT_THROW(static_cast<void>(unwrapOrThrow(makeError<int>(ErrorCode::kIOError, "gone"))),
                 IOError);
    EXPECT_NO_THROW(unwrapOrThrow(makeVoidSuccess()));
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kUnresolvedIdentifier, "1 failed")),
                 UnresolvedIdentifierError);
}

TEST(ResultTest, TryExecute) {
    auto ok = tryExecute([] { return 7; });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 7);

    auto failed = tryExecute([]() -> int { throw UsageError("bad flag"); });
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code(), ErrorCode::kUsageError);
    EXPECT_EQ(failed.error().message(), "bad flag");

    auto voidOk = tryExecute([] {});
    EXPECT_TRUE(voidOk.has_value());
}

}  // namespace
}  // namespace guidfix
