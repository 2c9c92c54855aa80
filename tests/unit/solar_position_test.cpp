#include <gtest/gtest.h>
#include <cmath>

#include "environment/SolarPosition.h"
#include "engine/CameraSynchronizer.h"

namespace {
constexpr std::int64_t kJuneSolstice2024Noon = 1718884800000;   // 2024-06-20 12:00 UTC
constexpr std::int64_t kDecemberSolstice2024Noon = 1734782400000; // 2024-12-21 12:00 UTC
constexpr std::int64_t kMarchEquinox2024Noon = 1710936000000;   // 2024-03-20 12:00 UTC
constexpr std::int64_t kHourMs = 3600000;
}

TEST(SolarPositionTest, CenturyAtJ2000IsZero) {
    // 2000-01-01 12:00 UTC
    EXPECT_NEAR(SolarEphemeris::Century(946728000000), 0.0, 1e-12);
}

TEST(SolarPositionTest, JuneSolsticeDeclinationAndTilt) {
    SolarPositionModel model;
    double decl = model.declinationAt(kJuneSolstice2024Noon);
    EXPECT_NEAR(decl, 23.44, 0.02);

    // The camera leans so that north tips toward the viewer's left.
    glm::vec3 up = CameraSynchronizer::UpVectorFor(decl);
    EXPECT_LT(up.x, 0.0f);
    EXPECT_NEAR(up.x, -std::sin(23.44 * 3.14159265358979 / 180.0), 1e-3);
}

TEST(SolarPositionTest, DecemberSolsticeIsSouthern) {
    SolarPositionModel model;
    EXPECT_NEAR(model.declinationAt(kDecemberSolstice2024Noon), -23.44, 0.02);
    EXPECT_GT(CameraSynchronizer::UpVectorFor(model.declinationAt(kDecemberSolstice2024Noon)).x, 0.0f);
}

TEST(SolarPositionTest, EquinoxNearZero) {
    SolarPositionModel model;
    EXPECT_NEAR(model.declinationAt(kMarchEquinox2024Noon), 0.0, 0.5);
}

TEST(SolarPositionTest, DeclinationStaysWithinPhysicalRange) {
    SolarPositionModel model;
    // Every six hours over several years, including pre-1970 instants.
    for (std::int64_t t = -2 * 365LL * 24 * kHourMs; t < kDecemberSolstice2024Noon; t += 6 * kHourMs * 37) {
        double d = model.declinationAt(t);
        EXPECT_GE(d, -SolarPositionModel::kMaxDeclination);
        EXPECT_LE(d, SolarPositionModel::kMaxDeclination);
    }
}

TEST(SolarPositionTest, EquationOfTimeMatchesAlmanac) {
    // Extremes of the year: about -14.2 min mid February, +16.5 min early November.
    EXPECT_NEAR(SolarEphemeris::EquationOfTime(SolarEphemeris::Century(1707652800000)), -14.2, 0.2);
    EXPECT_NEAR(SolarEphemeris::EquationOfTime(SolarEphemeris::Century(1730635200000)), 16.5, 0.2);
}

TEST(SolarPositionTest, SubsolarLongitudeAtNoonUtcIsNearGreenwich) {
    SolarPositionModel model;
    SolarPosition p = model.positionAt(kJuneSolstice2024Noon);
    // Equation of time is about -1.7 min: the sun has not reached Greenwich yet.
    EXPECT_NEAR(p.longitude, 0.427, 0.01);
    EXPECT_NEAR(p.declination, model.declinationAt(kJuneSolstice2024Noon), 1e-12);
}

TEST(SolarPositionTest, SubsolarLongitudeFollowsTheDay) {
    SolarPositionModel model;
    // 2024-01-01 06:00 UTC: local noon near 90 E.
    EXPECT_NEAR(model.positionAt(1704088800000).longitude, 90.8, 0.1);
    // 2024-01-01 18:00 UTC: near 90 W.
    EXPECT_NEAR(model.positionAt(1704132000000).longitude, -89.14, 0.1);
}

TEST(SolarPositionTest, LongitudeIsNormalizedAndContinuousAcrossMidnight) {
    SolarPositionModel model;
    const std::int64_t midnight = 1718928000000; // 2024-06-21 00:00 UTC

    double before = model.positionAt(midnight - 1).longitude;
    double at = model.positionAt(midnight).longitude;
    double after = model.positionAt(midnight + 1).longitude;

    for (double l : {before, at, after}) {
        EXPECT_GT(l, -180.0);
        EXPECT_LE(l, 180.0);
    }
    EXPECT_NEAR(before, at, 1e-4);
    EXPECT_NEAR(at, after, 1e-4);
}

TEST(SolarPositionTest, DeclinationIsContinuousAcrossUtcMidnights) {
    SolarPositionModel model;
    const std::int64_t midnights[] = {
        -31536000000,  // 1969-01-01
        0,             // 1970-01-01
        946684800000,  // 2000-01-01
        1710892800000, // 2024-03-20
        1718928000000, // 2024-06-21
        1734739200000, // 2024-12-21
    };

    for (std::int64_t m : midnights) {
        double at = model.declinationAt(m);
        EXPECT_NEAR(model.declinationAt(m - 1), at, 1e-6) << "midnight " << m;
        EXPECT_NEAR(model.declinationAt(m + 1), at, 1e-6) << "midnight " << m;
        EXPECT_GE(at, -SolarPositionModel::kMaxDeclination);
        EXPECT_LE(at, SolarPositionModel::kMaxDeclination);
    }
}

TEST(SolarPositionTest, StartOfUtcDayFloorsNegativeInstants) {
    EXPECT_EQ(SolarEphemeris::StartOfUtcDay(0), 0);
    EXPECT_EQ(SolarEphemeris::StartOfUtcDay(86399999), 0);
    EXPECT_EQ(SolarEphemeris::StartOfUtcDay(86400000), 86400000);
    EXPECT_EQ(SolarEphemeris::StartOfUtcDay(-1), -86400000);
}
