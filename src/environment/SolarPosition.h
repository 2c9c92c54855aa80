/*
 * SolarPosition.h
 *
 * Purpose:
 *   Declares the solar position model: wall-clock instant -> subsolar longitude and solar declination.
 *   Replaces a stylized time-of-day sun with the real sun so the terminator and the seasonal camera
 *   tilt follow the actual date and time.
 *
 * Model:
 *   - NOAA low-precision solar ephemeris (Meeus, "Astronomical Algorithms"), parameterized by the
 *     Julian century since J2000.0.
 *   - Accuracy is well below one degree, sufficient for a visual terminator; not a navigation ephemeris.
 *
 * Conventions:
 *   - Instants are milliseconds since the Unix epoch (UTC).
 *   - All angles are in degrees. Longitude is normalized into (-180, 180].
 *   - Equation of time is returned in minutes (positive when apparent solar time runs ahead).
 */

#pragma once
#include <cstdint>

struct SolarPosition {
    double longitude;   // subsolar longitude, (-180, 180]
    double declination; // [-kMaxDeclination, kMaxDeclination]
};

namespace SolarEphemeris {

constexpr double kMsPerDay = 86400000.0;

// Julian centuries since J2000.0 for an instant.
double Century(std::int64_t instantMs);

double MeanLongitude(double t);       // [0, 360)
double MeanAnomaly(double t);
double OrbitEccentricity(double t);
double EquationOfCenter(double t);
double TrueLongitude(double t);
double ApparentLongitude(double t);
double MeanObliquity(double t);
double ObliquityCorrection(double t);

// Unclamped solar declination.
double Declination(double t);

// Equation of time in minutes.
double EquationOfTime(double t);

// Start (00:00:00.000 UTC) of the day containing instantMs.
std::int64_t StartOfUtcDay(std::int64_t instantMs);

} // namespace SolarEphemeris

class SolarPositionModel {
public:
    // Physical bound of |declination| (axial tilt, rounded up).
    static constexpr double kMaxDeclination = 23.44;

    /*
     * Computes the subsolar point for an instant.
     *
     * Behavior:
     *   - longitude = (startOfUtcDay - t) / day * 360 - 180 - equationOfTime / 4, normalized.
     *   - declination = declinationAt(t).
     */
    SolarPosition positionAt(std::int64_t instantMs) const;

    // Solar declination in degrees, clamped to [-kMaxDeclination, kMaxDeclination].
    double declinationAt(std::int64_t instantMs) const;
};
