#include <gtest/gtest.h>
#include <set>

#include "scene/TimeZoneArcs.h"

TEST(TimeZoneArcs, TwentyFourMeridiansPoleToPole) {
    auto arcs = BuildTimeZoneArcs();
    ASSERT_EQ(arcs.size(), 24u * 90u);

    std::set<double> meridians;
    for (const auto& a : arcs) {
        meridians.insert(a.startLng);
        EXPECT_DOUBLE_EQ(a.startLng, a.endLng);
        EXPECT_NEAR(a.startLat - a.endLat, 2.0, 1e-9);
        EXPECT_GE(a.endLat, -90.0);
        EXPECT_LE(a.startLat, 90.0);
    }
    EXPECT_EQ(meridians.size(), 24u);
    EXPECT_DOUBLE_EQ(*meridians.begin(), -180.0);
    EXPECT_DOUBLE_EQ(*meridians.rbegin(), 165.0);
}

TEST(TimeZoneArcs, FirstMeridianStartsAtNorthPole) {
    auto arcs = BuildTimeZoneArcs();
    EXPECT_DOUBLE_EQ(arcs.front().startLat, 90.0);
    EXPECT_EQ(arcs.front().name, "UTC-12");
    EXPECT_DOUBLE_EQ(arcs[89].endLat, -90.0);
}

TEST(TimeZoneArcs, InvalidSpacingGivesNothing) {
    EXPECT_TRUE(BuildTimeZoneArcs(0.0, 2.0).empty());
    EXPECT_TRUE(BuildTimeZoneArcs(15.0, -1.0).empty());
}

TEST(TimeZoneArcs, Labels) {
    EXPECT_EQ(TimeZoneLabel(0.0), "UTC");
    EXPECT_EQ(TimeZoneLabel(45.0), "UTC+3");
    EXPECT_EQ(TimeZoneLabel(-75.0), "UTC-5");
    EXPECT_EQ(TimeZoneLabel(-180.0), "UTC-12");
}

TEST(TimeZoneArcs, MeridianNearCursor) {
    EXPECT_EQ(TimeZoneMeridianNear(14.5).value_or(""), "UTC+1");
    EXPECT_EQ(TimeZoneMeridianNear(-0.4).value_or(""), "UTC");
    EXPECT_FALSE(TimeZoneMeridianNear(7.0).has_value());

    // The date line is labelled from the west side.
    EXPECT_EQ(TimeZoneMeridianNear(179.5).value_or(""), "UTC-12");
    EXPECT_EQ(TimeZoneMeridianNear(-179.5).value_or(""), "UTC-12");
}
