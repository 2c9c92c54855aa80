/*
 * TimeZoneArcs.cpp
 *
 * Purpose:
 *   Implements the time-zone meridian overlay data and hover label lookup.
 */

#include "scene/TimeZoneArcs.h"
#include "scene/ViewState.h"

#include <algorithm>
#include <cmath>

std::string TimeZoneLabel(double meridianLng) {
    long hours = std::lround(meridianLng / 15.0);
    if (hours == 0) return "UTC";
    if (hours > 0) return "UTC+" + std::to_string(hours);
    return "UTC" + std::to_string(hours);
}

std::vector<ArcSegment> BuildTimeZoneArcs(double stepDeg, double segmentDeg) {
    std::vector<ArcSegment> arcs;
    if (stepDeg <= 0.0 || segmentDeg <= 0.0) return arcs;

    int meridians = static_cast<int>(std::ceil(360.0 / stepDeg - 1e-9));
    for (int m = 0; m < meridians; ++m) {
        double lng = -180.0 + m * stepDeg;
        std::string name = TimeZoneLabel(lng);

        for (double lat = 90.0; lat > -90.0; lat -= segmentDeg) {
            arcs.push_back(ArcSegment{lat, lng, std::max(lat - segmentDeg, -90.0), lng, name});
        }
    }
    return arcs;
}

std::optional<std::string> TimeZoneMeridianNear(double lng, double toleranceDeg) {
    double l = NormalizeLongitude(lng);
    double nearest = std::round(l / 15.0) * 15.0;
    if (std::abs(l - nearest) > toleranceDeg) return std::nullopt;
    // +180 and -180 are the same meridian; the overlay labels it from the -180 side.
    if (nearest >= 180.0) nearest = -180.0;
    return TimeZoneLabel(nearest);
}
