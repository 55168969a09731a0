// =============================================================================
// guidfix - Parameter Name Style Tests
// =============================================================================

#include "guidfix/naming/name_style.h"

#include <gtest/gtest.h>

namespace guidfix::naming {
namespace {

// =============================================================================
// Word Splitting
// =============================================================================

TEST(SplitWordsTest, SeparatorsAndDigits) {
    EXPECT_EQ(splitWords("luminaire housing shape 3D"),
              (std::vector<std::string>{"luminaire", "housing", "shape", "3D"}));
    EXPECT_EQ(splitWords("silicon-free"), (std::vector<std::string>{"silicon", "free"}));
    EXPECT_EQ(splitWords("ifcWall_and_hvacSystem"),
              (std::vector<std::string>{"ifcWall", "and", "hvacSystem"}));
    EXPECT_TRUE(splitWords(" - ").empty());
}

TEST(SplitWordsTest, CapitalRunsWinGreedily) {
    EXPECT_EQ(splitWords("HVACSystem"), (std::vector<std::string>{"HVACS", "ystem"}));
    EXPECT_EQ(splitWords("IFC guid"), (std::vector<std::string>{"IFC", "guid"}));
}

// =============================================================================
// Style Conversion
// =============================================================================

TEST(ConvertNameTest, Title) {
    EXPECT_EQ(convertName("the power of the light", NameStyle::kTitle), "The Power of the Light");
    EXPECT_EQ(convertName("IFC guid per room", NameStyle::kTitle), "IFC Guid per Room");
    EXPECT_EQ(convertName("luminaire housing shape 3D", NameStyle::kTitle),
              "Luminaire Housing Shape 3D");
    EXPECT_EQ(convertName("ifcWall_and_hvacSystem", NameStyle::kTitle),
              "Ifcwall and Hvacsystem");
}

TEST(ConvertNameTest, Capitalise) {
    EXPECT_EQ(convertName("the power of the light", NameStyle::kCapitalise),
              "The Power Of The Light");
}

TEST(ConvertNameTest, AllCapsPreservesUnits) {
    EXPECT_EQ(convertName("IFC guid per room", NameStyle::kAllCaps), "IFC GUID PER ROOM");
    EXPECT_EQ(convertName("nominal power 12kV", NameStyle::kAllCaps), "NOMINAL POWER 12kV");
    EXPECT_EQ(convertName("rated current 10mA", NameStyle::kAllCaps), "RATED CURRENT 10mA");
    EXPECT_EQ(convertName("length in mm", NameStyle::kAllCaps), "LENGTH IN mm");
}

TEST(ConvertNameTest, CamelAndPascal) {
    EXPECT_EQ(convertName("the power of the light", NameStyle::kCamel), "thePowerOfTheLight");
    EXPECT_EQ(convertName("luminaire housing shape 3D", NameStyle::kPascal),
              "LuminaireHousingShape3D");
    EXPECT_EQ(convertName("IFC guid per room", NameStyle::kPascal), "IFCGuidPerRoom");
    EXPECT_EQ(convertName("silicon-free", NameStyle::kPascal), "SiliconFree");
    EXPECT_EQ(convertName("overall diameter", NameStyle::kPascal), "OverallDiameter");
    EXPECT_EQ(convertName("HVACSystem", NameStyle::kPascal), "HVACSYstem");
}

TEST(ConvertNameTest, SnakeStyles) {
    EXPECT_EQ(convertName("luminaire housing shape 3D", NameStyle::kSnake),
              "luminaire_housing_shape_3d");
    EXPECT_EQ(convertName("IFC guid per room", NameStyle::kSnake), "ifc_guid_per_room");
    EXPECT_EQ(convertName("luminaire housing shape 3D", NameStyle::kPascalSnake),
              "Luminaire_Housing_Shape_3d");
}

TEST(ConvertNameTest, EmptyName) {
    EXPECT_EQ(convertName("", NameStyle::kPascal), "");
    EXPECT_EQ(convertName("--", NameStyle::kTitle), "");
}

// =============================================================================
// Style Names
// =============================================================================

TEST(NameStyleTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseNameStyle("pascal"), NameStyle::kPascal);
    EXPECT_EQ(parseNameStyle("Pascal_Snake"), NameStyle::kPascalSnake);
    EXPECT_EQ(parseNameStyle("ALLCAPS"), NameStyle::kAllCaps);
    EXPECT_FALSE(parseNameStyle("kebab").has_value());
}

TEST(NameStyleTest, NamesRoundTrip) {
    const auto& names = nameStyleNames();
    ASSERT_EQ(names.size(), 7u);
    for (const auto& name : names) {
        auto style = parseNameStyle(name);
        ASSERT_TRUE(style.has_value()) << name;
        EXPECT_EQ(nameStyleToString(*style), name);
    }
}

}  // namespace
}  // namespace guidfix::naming
