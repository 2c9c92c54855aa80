#include <gtest/gtest.h>
#include <cmath>

#include "scene/ViewState.h"

TEST(ViewState, NormalizeLongitude) {
    EXPECT_DOUBLE_EQ(NormalizeLongitude(0.0), 0.0);
    EXPECT_DOUBLE_EQ(NormalizeLongitude(190.0), -170.0);
    EXPECT_DOUBLE_EQ(NormalizeLongitude(-190.0), 170.0);
    EXPECT_DOUBLE_EQ(NormalizeLongitude(180.0), 180.0);
    EXPECT_DOUBLE_EQ(NormalizeLongitude(-180.0), 180.0);
    EXPECT_DOUBLE_EQ(NormalizeLongitude(540.0), 180.0);
    EXPECT_DOUBLE_EQ(NormalizeLongitude(720.0), 0.0);
}

TEST(ViewState, ClampLatitude) {
    EXPECT_DOUBLE_EQ(ClampLatitude(95.0), 90.0);
    EXPECT_DOUBLE_EQ(ClampLatitude(-100.0), -90.0);
    EXPECT_DOUBLE_EQ(ClampLatitude(12.5), 12.5);
}

TEST(ViewState, LatLngToUnitAxes) {
    glm::vec3 front = LatLngToUnit(0.0, 0.0);
    EXPECT_NEAR(front.z, 1.0f, 1e-6f);

    glm::vec3 east = LatLngToUnit(0.0, 90.0);
    EXPECT_NEAR(east.x, 1.0f, 1e-6f);
    EXPECT_NEAR(east.z, 0.0f, 1e-6f);

    glm::vec3 north = LatLngToUnit(90.0, 45.0);
    EXPECT_NEAR(north.y, 1.0f, 1e-6f);
}

TEST(ViewState, UnitToLatLngInvertsLatLngToUnit) {
    glm::dvec2 ll = UnitToLatLng(LatLngToUnit(35.0, -120.0) * 3.0f);
    EXPECT_NEAR(ll.x, 35.0, 1e-4);
    EXPECT_NEAR(ll.y, -120.0, 1e-4);
}

TEST(ViewState, GlobeRotationBringsPointOfViewToFront) {
    ViewState pov;
    pov.latitude = -25.0;
    pov.longitude = 135.0;
    glm::vec4 p = GlobeRotation(pov) * glm::vec4(LatLngToUnit(pov.latitude, pov.longitude), 1.0f);
    EXPECT_NEAR(p.x, 0.0f, 1e-5f);
    EXPECT_NEAR(p.y, 0.0f, 1e-5f);
    EXPECT_NEAR(p.z, 1.0f, 1e-5f);
}

TEST(PointOfViewAnimator, TakesShortestArcAcrossDateLine) {
    PointOfViewAnimator anim;
    anim.start(ViewState{0.0, 170.0, 2.0}, ViewState{20.0, -170.0, 4.0}, 1000, 1000);
    ASSERT_TRUE(anim.active());

    ViewState q = anim.sample(1250); // eased 0.0625
    EXPECT_NEAR(q.longitude, 171.25, 1e-9);
    EXPECT_NEAR(q.latitude, 1.25, 1e-9);
    EXPECT_NEAR(q.altitude, 2.125, 1e-9);

    ViewState mid = anim.sample(1500);
    EXPECT_NEAR(std::abs(mid.longitude), 180.0, 1e-9);
    EXPECT_NEAR(mid.latitude, 10.0, 1e-9);

    ViewState end = anim.sample(2000);
    EXPECT_DOUBLE_EQ(end.longitude, -170.0);
    EXPECT_DOUBLE_EQ(end.altitude, 4.0);
    EXPECT_FALSE(anim.active());
}

TEST(PointOfViewAnimator, ZeroDurationJumps) {
    PointOfViewAnimator anim;
    anim.start(ViewState{}, ViewState{10.0, 370.0, 1.0}, 0, 0);
    ViewState v = anim.sample(0);
    EXPECT_DOUBLE_EQ(v.longitude, 10.0);
    EXPECT_FALSE(anim.active());
}

TEST(PointOfViewAnimator, CancelStops) {
    PointOfViewAnimator anim;
    anim.start(ViewState{}, ViewState{10.0, 10.0, 1.0}, 0, 1000);
    anim.cancel();
    EXPECT_FALSE(anim.active());
}
