/*
 * TimeZoneArcs.h
 *
 * Purpose:
 *   Builds the time-zone overlay: one meridian every 15 degrees of longitude (standard zone
 *   boundaries), split into short pole-to-pole segments so the lines follow the sphere.
 *
 * Labels:
 *   - "UTC" at 0, "UTC+N" east of Greenwich, "UTC-N" west (N = lng / 15).
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

struct ArcSegment {
    double startLat;
    double startLng;
    double endLat;
    double endLng;
    std::string name;
};

/*
 * Generates meridian segments.
 *
 * Parameters:
 *   stepDeg    : Longitude spacing between meridians (15 for standard zones).
 *   segmentDeg : Latitude length of each segment (smaller = smoother curve).
 *
 * Returns:
 *   Segments for lng = -180, -180 + stepDeg, ... < 180, each running from +90 down to -90.
 */
std::vector<ArcSegment> BuildTimeZoneArcs(double stepDeg = 15.0, double segmentDeg = 2.0);

// Zone label for a meridian longitude (multiple of 15 expected).
std::string TimeZoneLabel(double meridianLng);

/*
 * Returns the label of the nearest 15-degree meridian if lng lies within toleranceDeg of it.
 */
std::optional<std::string> TimeZoneMeridianNear(double lng, double toleranceDeg = 1.0);
