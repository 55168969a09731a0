// =============================================================================
// guidfix - Identifier Tests
// =============================================================================
// Unit tests for the 128-bit identifier model and its long form.
// =============================================================================

#include "guidfix/codec/identifier.h"

#include <gtest/gtest.h>

#include <vector>

namespace guidfix::codec {
namespace {

constexpr Identifier::Bytes kSampleBytes = {0x3a, 0x35, 0x28, 0x2d, 0xa4, 0x1b, 0x48, 0x96,
                                            0x8b, 0x63, 0x9e, 0x4a, 0x38, 0xd7, 0x75, 0x9d};

// =============================================================================
// Construction Tests
// =============================================================================

TEST(IdentifierTest, DefaultIsAllZero) {
    Identifier id;
    EXPECT_EQ(id.toLongForm(), "00000000-0000-0000-0000-000000000000");
}

TEST(IdentifierTest, FromBytesRequiresSixteenBytes) {
    std::vector<std::uint8_t> bytes(kSampleBytes.begin(), kSampleBytes.end());
    auto id = Identifier::fromBytes(bytes);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->bytes(), kSampleBytes);

    bytes.pop_back();
    EXPECT_FALSE(Identifier::fromBytes(bytes).has_value());

    bytes.push_back(0x9d);
    bytes.push_back(0x00);
    EXPECT_FALSE(Identifier::fromBytes(bytes).has_value());
}

// =============================================================================
// Long Form Tests
// =============================================================================

TEST(IdentifierTest, LongFormIsLowercaseAndGrouped) {
    Identifier id{kSampleBytes};
    EXPECT_EQ(id.toLongForm(), "3a35282d-a41b-4896-8b63-9e4a38d7759d");
    EXPECT_EQ(id.toLongForm().size(), kLongFormLength);
}

TEST(IdentifierTest, ParseLongForm) {
    auto id = Identifier::parseLongForm("3a35282d-a41b-4896-8b63-9e4a38d7759d");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, Identifier{kSampleBytes});
}

TEST(IdentifierTest, ParseAcceptsUppercaseAndBraces) {
    auto upper = Identifier::parseLongForm("3A35282D-A41B-4896-8B63-9E4A38D7759D");
    auto braced = Identifier::parseLongForm("{3a35282d-a41b-4896-8b63-9e4a38d7759d}");
    ASSERT_TRUE(upper.has_value());
    ASSERT_TRUE(braced.has_value());
    EXPECT_EQ(*upper, Identifier{kSampleBytes});
    EXPECT_EQ(*braced, Identifier{kSampleBytes});
    EXPECT_EQ(braced->toLongForm(), "3a35282d-a41b-4896-8b63-9e4a38d7759d");
}

TEST(IdentifierTest, ParseRejectsMalformed) {
    // Missing hyphen
    EXPECT_FALSE(Identifier::parseLongForm("3a35282da41b-4896-8b63-9e4a38d7759d").has_value());
    // Hyphen in the wrong place
    EXPECT_FALSE(Identifier::parseLongForm("3a35282-da41b-4896-8b63-9e4a38d7759d").has_value());
    // Non-hex digit
    EXPECT_FALSE(Identifier::parseLongForm("3a35282d-a41b-4896-8b63-9e4a38d7759g").has_value());
    // Unbalanced brace
    EXPECT_FALSE(Identifier::parseLongForm("{3a35282d-a41b-4896-8b63-9e4a38d7759d").has_value());
    // Surrounding whitespace
    EXPECT_FALSE(Identifier::parseLongForm(" 3a35282d-a41b-4896-8b63-9e4a38d7759d").has_value());
    // Hex without hyphens
    EXPECT_FALSE(Identifier::parseLongForm("3a35282da41b48968b639e4a38d7759d").has_value());
    EXPECT_FALSE(Identifier::parseLongForm("").has_value());
}

TEST(IdentifierTest, Equality) {
    Identifier a{kSampleBytes};
    auto bytes = kSampleBytes;
    bytes[15] ^= 0x01;
    Identifier b{bytes};

    EXPECT_EQ(a, Identifier{kSampleBytes});
    EXPECT_NE(a, b);
}

}  // namespace
}  // namespace guidfix::codec
