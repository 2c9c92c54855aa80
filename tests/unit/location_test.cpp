#include <gtest/gtest.h>

#include "core/Location.h"

TEST(ParseLocation, WithLabel) {
    auto loc = ParseLocation(" 48.8566 , 2.3522 , Paris ");
    ASSERT_TRUE(loc.has_value());
    EXPECT_DOUBLE_EQ(loc->latitude, 48.8566);
    EXPECT_DOUBLE_EQ(loc->longitude, 2.3522);
    EXPECT_EQ(loc->label, "Paris");
}

TEST(ParseLocation, LabelDefaultsToCoordinates) {
    auto loc = ParseLocation("-33.8688,151.2093");
    ASSERT_TRUE(loc.has_value());
    EXPECT_EQ(loc->label, "-33.8688, 151.2093");

    auto blank = ParseLocation("10,20,   ");
    ASSERT_TRUE(blank.has_value());
    EXPECT_EQ(blank->label, "10.0000, 20.0000");
}

TEST(ParseLocation, LabelMayContainCommas) {
    auto loc = ParseLocation("40.7128,-74.0060,New York, NY");
    ASSERT_TRUE(loc.has_value());
    EXPECT_EQ(loc->label, "New York, NY");
}

TEST(ParseLocation, DateLineIsNormalized) {
    auto loc = ParseLocation("0,-180");
    ASSERT_TRUE(loc.has_value());
    EXPECT_DOUBLE_EQ(loc->longitude, 180.0);
}

TEST(ParseLocation, RejectsMalformedInput) {
    EXPECT_FALSE(ParseLocation("").has_value());
    EXPECT_FALSE(ParseLocation("10").has_value());
    EXPECT_FALSE(ParseLocation("abc,1").has_value());
    EXPECT_FALSE(ParseLocation("10,20x").has_value());
    EXPECT_FALSE(ParseLocation(",5").has_value());
    EXPECT_FALSE(ParseLocation("nan,5").has_value());
}

TEST(ParseLocation, RejectsOutOfRange) {
    EXPECT_FALSE(ParseLocation("91,0").has_value());
    EXPECT_FALSE(ParseLocation("-90.5,0").has_value());
    EXPECT_FALSE(ParseLocation("0,180.1").has_value());
    EXPECT_TRUE(ParseLocation("90,180").has_value());
}
