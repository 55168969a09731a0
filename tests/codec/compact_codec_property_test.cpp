// =============================================================================
// guidfix - Compact Codec Property Tests
// =============================================================================
// Property-based tests for the compact identifier codec.
//
// *For any* identifier, expanding its compact form yields the identifier
// *For any* valid compact form, compressing its expansion yields it back
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string>

#include "guidfix/codec/compact_codec.h"

namespace guidfix::codec::test {

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief Generate an arbitrary identifier.
[[nodiscard]] rc::Gen<Identifier> identifier() {
    return rc::gen::map(rc::gen::container<std::vector<std::uint8_t>>(
                            kIdentifierBytes, rc::gen::arbitrary<std::uint8_t>()),
                        [](const std::vector<std::uint8_t>& bytes) {
                            return *Identifier::fromBytes(bytes);
                        });
}

/// @brief Generate a compact symbol.
[[nodiscard]] rc::Gen<char> compactSymbol() {
    return rc::gen::elementOf(std::string(kCompactAlphabet));
}

/// @brief Generate a 22-symbol string with arbitrary surplus bits.
[[nodiscard]] rc::Gen<std::string> anyCompactForm() {
    return rc::gen::container<std::string>(kCompactFormLength, compactSymbol());
}

/// @brief Generate a 22-symbol string whose surplus bits are zero.
[[nodiscard]] rc::Gen<std::string> canonicalCompactForm() {
    return rc::gen::apply(
        [](std::string head, int last) {
            head.push_back(kCompactAlphabet[static_cast<std::size_t>(last) << 4]);
            return head;
        },
        rc::gen::container<std::string>(kCompactFormLength - 1, compactSymbol()),
        rc::gen::inRange(0, 4));
}

}  // namespace gen

// =============================================================================
// Round-Trip Properties
// =============================================================================

RC_GTEST_PROP(CompactCodecProperty, ExpandInvertsCompress, ()) {
    auto id = *gen::identifier();

    auto compact = compress(id);
    RC_ASSERT(compact.size() == kCompactFormLength);
    RC_ASSERT(std::all_of(compact.begin(), compact.end(), isCompactSymbol));

    auto expansion = expand(compact);
    RC_ASSERT(expansion.has_value());
    RC_ASSERT(expansion->identifier == id);
    RC_ASSERT(expansion->canonicalLongForm == id.toLongForm());
}

RC_GTEST_PROP(CompactCodecProperty, CompressInvertsExpandOnCanonicalForms, ()) {
    auto compact = *gen::canonicalCompactForm();

    auto expansion = expand(compact);
    RC_ASSERT(expansion.has_value());
    RC_ASSERT(compress(expansion->identifier) == compact);
}

RC_GTEST_PROP(CompactCodecProperty, PaddedFormDecodesLikeUnpadded, ()) {
    auto compact = *gen::canonicalCompactForm();

    auto plain = expand(compact);
    auto padded = expand(compact + "==");
    RC_ASSERT(plain.has_value());
    RC_ASSERT(padded.has_value());
    RC_ASSERT(plain->identifier == padded->identifier);
}

/// @brief Nonzero surplus bits: rejected by default; dropped when ignored,
///        so the re-encoded form is the canonical one rather than the input.
RC_GTEST_PROP(CompactCodecProperty, SurplusBitsPolicy, ()) {
    auto compact = *gen::anyCompactForm();
    const auto lastValue = static_cast<std::size_t>(kCompactAlphabet.find(compact.back()));
    const bool hasSurplus = (lastValue & 0x0F) != 0;

    auto strict = expand(compact, SurplusBits::kReject);
    auto lenient = expand(compact, SurplusBits::kIgnore);
    RC_ASSERT(lenient.has_value());

    if (hasSurplus) {
        RC_ASSERT(!strict.has_value());
        RC_ASSERT(strict.error() == DecodeError::kInvalidByteLength);

        auto canonical = compress(lenient->identifier);
        RC_ASSERT(canonical != compact);
        RC_ASSERT(canonical.substr(0, kCompactFormLength - 1) ==
                  compact.substr(0, kCompactFormLength - 1));
        RC_ASSERT(compress(expand(canonical)->identifier) == canonical);
    } else {
        RC_ASSERT(strict.has_value());
        RC_ASSERT(compress(lenient->identifier) == compact);
    }
}

RC_GTEST_PROP(CompactCodecProperty, WrongLengthIsInvalidLength, ()) {
    auto length = *rc::gen::inRange<std::size_t>(0, 40);
    RC_PRE(length != kCompactFormLength);
    auto text = *rc::gen::container<std::string>(length, gen::compactSymbol());

    auto expansion = expand(text);
    RC_ASSERT(!expansion.has_value());
    RC_ASSERT(expansion.error() == DecodeError::kInvalidLength);
}

// =============================================================================
// Example Tests
// =============================================================================

TEST(CompactCodecTest, KnownVectors) {
    auto expansion = expand("OjUoLaQbSJaLY55KONd1nQ");
    ASSERT_TRUE(expansion.has_value());
    EXPECT_EQ(expansion->canonicalLongForm, "3a35282d-a41b-4896-8b63-9e4a38d7759d");

    auto other = expand("qn5yQy-FpkqfWJtOCWqM8Q");
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(other->canonicalLongForm, "aa7e7243-2f85-a64a-9f58-9b4e096a8cf1");

    auto id = Identifier::parseLongForm("722c41e5-6e7c-b54f-be68-ac4d9f8bb456");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(compress(*id), "cixB5W58tU--aKxNn4u0Vg");
}

TEST(CompactCodecTest, AllZeroAndAllOnes) {
    EXPECT_EQ(compress(Identifier{}), "AAAAAAAAAAAAAAAAAAAAAA");

    Identifier::Bytes ones{};
    ones.fill(0xFF);
    EXPECT_EQ(compress(Identifier{ones}), "_____________________w");
}

TEST(CompactCodecTest, CheckOrderLengthThenAlphabetThenByteLength) {
    // Wrong length wins over a foreign character
    auto tooShort = expand("OjUoLaQbSJaLY55KONd1+");
    ASSERT_FALSE(tooShort.has_value());
    EXPECT_EQ(tooShort.error(), DecodeError::kInvalidLength);

    // Standard base64 symbols are not part of the alphabet
    auto plus = expand("OjUoLaQbSJaLY55KONd1n+");
    ASSERT_FALSE(plus.has_value());
    EXPECT_EQ(plus.error(), DecodeError::kInvalidAlphabetCharacter);

    // Foreign character wins over surplus bits
    auto slash = expand("OjU/LaQbSJaLY55KONd1nR");
    ASSERT_FALSE(slash.has_value());
    EXPECT_EQ(slash.error(), DecodeError::kInvalidAlphabetCharacter);

    auto surplus = expand("OjUoLaQbSJaLY55KONd1nR");
    ASSERT_FALSE(surplus.has_value());
    EXPECT_EQ(surplus.error(), DecodeError::kInvalidByteLength);
}

TEST(CompactCodecTest, PaddingRules) {
    EXPECT_TRUE(expand("OjUoLaQbSJaLY55KONd1nQ==").has_value());

    auto single = expand("OjUoLaQbSJaLY55KONd1nQ=");
    ASSERT_FALSE(single.has_value());
    EXPECT_EQ(single.error(), DecodeError::kInvalidLength);

    auto extra = expand("OjUoLaQbSJaLY55KONd1nQ====");
    ASSERT_FALSE(extra.has_value());
    EXPECT_EQ(extra.error(), DecodeError::kInvalidLength);

    // Further multiples of four are still the wrong amount
    for (const char* text : {"OjUoLaQbSJaLY55KONd1nQ======", "OjUoLaQbSJaLY55KONd1nQ=========="}) {
        auto padded = expand(text);
        ASSERT_FALSE(padded.has_value()) << text;
        EXPECT_EQ(padded.error(), DecodeError::kInvalidLength) << text;
    }

    // Embedded padding is a foreign character
    auto embedded = expand("OjUoLaQbSJ=LY55KONd1nQ");
    ASSERT_FALSE(embedded.has_value());
    EXPECT_EQ(embedded.error(), DecodeError::kInvalidAlphabetCharacter);
}

TEST(CompactCodecTest, WhitespaceIsNotTrimmed) {
    auto expansion = expand(" OjUoLaQbSJaLY55KONd1nQ");
    ASSERT_FALSE(expansion.has_value());
    EXPECT_EQ(expansion.error(), DecodeError::kInvalidLength);
}

TEST(CompactCodecTest, ErrorStrings) {
    EXPECT_EQ(decodeErrorToString(DecodeError::kInvalidLength), "invalid length");
    EXPECT_EQ(decodeErrorToString(DecodeError::kInvalidAlphabetCharacter),
              "invalid alphabet character");
    EXPECT_EQ(decodeErrorToString(DecodeError::kInvalidByteLength), "invalid byte length");
}

}  // namespace guidfix::codec::test
