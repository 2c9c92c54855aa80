/*
 * SolarPosition.cpp
 *
 * Purpose:
 *   Implements the NOAA solar ephemeris terms and the subsolar point.
 *
 * Notes:
 *   - Terms are evaluated in double precision; t is the Julian century since J2000.0.
 *   - The nutation correction uses the longitude of the Moon's ascending node: 125.04 - 1934.136 t.
 */

#include "environment/SolarPosition.h"
#include "scene/ViewState.h"

#include <algorithm>
#include <cmath>

namespace {

constexpr double kPi = 3.14159265358979323846;

inline double Rad(double deg) { return deg * kPi / 180.0; }
inline double Deg(double rad) { return rad * 180.0 / kPi; }

// Longitude of the Moon's ascending node (degrees) used by the nutation terms.
inline double Omega(double t) { return 125.04 - 1934.136 * t; }

} // namespace

namespace SolarEphemeris {

double Century(std::int64_t instantMs) {
    constexpr double kUnixEpochJulianDay = 2440587.5;
    constexpr double kJ2000JulianDay = 2451545.0;
    double jd = static_cast<double>(instantMs) / kMsPerDay + kUnixEpochJulianDay;
    return (jd - kJ2000JulianDay) / 36525.0;
}

double MeanLongitude(double t) {
    double l = std::fmod(280.46646 + t * (36000.76983 + t * 0.0003032), 360.0);
    return (l < 0.0) ? l + 360.0 : l;
}

double MeanAnomaly(double t) {
    return 357.52911 + t * (35999.05029 - 0.0001537 * t);
}

double OrbitEccentricity(double t) {
    return 0.016708634 - t * (0.000042037 + 0.0000001267 * t);
}

double EquationOfCenter(double t) {
    double m = Rad(MeanAnomaly(t));
    return std::sin(m) * (1.914602 - t * (0.004817 + 0.000014 * t))
         + std::sin(2.0 * m) * (0.019993 - 0.000101 * t)
         + std::sin(3.0 * m) * 0.000289;
}

double TrueLongitude(double t) {
    return MeanLongitude(t) + EquationOfCenter(t);
}

double ApparentLongitude(double t) {
    return TrueLongitude(t) - 0.00569 - 0.00478 * std::sin(Rad(Omega(t)));
}

double MeanObliquity(double t) {
    return 23.0 + (26.0 + (21.448 - t * (46.815 + t * (0.00059 - t * 0.001813))) / 60.0) / 60.0;
}

double ObliquityCorrection(double t) {
    return MeanObliquity(t) + 0.00256 * std::cos(Rad(Omega(t)));
}

double Declination(double t) {
    return Deg(std::asin(std::sin(Rad(ObliquityCorrection(t))) * std::sin(Rad(ApparentLongitude(t)))));
}

double EquationOfTime(double t) {
    double epsilon = Rad(ObliquityCorrection(t));
    double l0 = Rad(MeanLongitude(t));
    double e = OrbitEccentricity(t);
    double m = Rad(MeanAnomaly(t));

    double y = std::tan(epsilon / 2.0);
    y *= y;

    double sin2l0 = std::sin(2.0 * l0);
    double sinm = std::sin(m);
    double cos2l0 = std::cos(2.0 * l0);
    double sin4l0 = std::sin(4.0 * l0);
    double sin2m = std::sin(2.0 * m);

    double eqRad = y * sin2l0 - 2.0 * e * sinm + 4.0 * e * y * sinm * cos2l0
                 - 0.5 * y * y * sin4l0 - 1.25 * e * e * sin2m;

    return 4.0 * Deg(eqRad);
}

std::int64_t StartOfUtcDay(std::int64_t instantMs) {
    constexpr std::int64_t day = static_cast<std::int64_t>(kMsPerDay);
    std::int64_t q = instantMs / day;
    if (instantMs % day < 0) --q; // floor for pre-1970 instants
    return q * day;
}

} // namespace SolarEphemeris

SolarPosition SolarPositionModel::positionAt(std::int64_t instantMs) const {
    using namespace SolarEphemeris;

    double t = Century(instantMs);
    double sinceMidnight = static_cast<double>(StartOfUtcDay(instantMs) - instantMs);
    double lng = sinceMidnight / kMsPerDay * 360.0 - 180.0;

    SolarPosition p;
    p.longitude = NormalizeLongitude(lng - EquationOfTime(t) / 4.0);
    p.declination = declinationAt(instantMs);
    return p;
}

double SolarPositionModel::declinationAt(std::int64_t instantMs) const {
    double d = SolarEphemeris::Declination(SolarEphemeris::Century(instantMs));
    return std::max(-kMaxDeclination, std::min(kMaxDeclination, d));
}
