/*
 * ViewState.cpp
 *
 * Purpose:
 *   Implements longitude normalization, globe-local coordinate conversion, and the recenter animator.
 */

#include "scene/ViewState.h"

#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>

double NormalizeLongitude(double lng) {
    double l = std::fmod(lng, 360.0); // (-360, 360)
    if (l <= -180.0) l += 360.0;
    else if (l > 180.0) l -= 360.0;
    return l;
}

double ClampLatitude(double lat) {
    return std::max(-90.0, std::min(90.0, lat));
}

/*
 * Polar -> cartesian on the unit sphere.
 *
 * Notes:
 *   - theta = 90 - lng, phi = 90 - lat (polar angle from +Y).
 *   - x = sin(phi) cos(theta), y = cos(phi), z = sin(phi) sin(theta).
 */
glm::vec3 LatLngToUnit(double latDeg, double lngDeg) {
    double theta = glm::radians(90.0 - lngDeg);
    double phi   = glm::radians(90.0 - latDeg);
    return glm::vec3(
        static_cast<float>(std::sin(phi) * std::cos(theta)),
        static_cast<float>(std::cos(phi)),
        static_cast<float>(std::sin(phi) * std::sin(theta)));
}

glm::dvec2 UnitToLatLng(const glm::vec3& p) {
    glm::dvec3 n = glm::normalize(glm::dvec3(p));
    double lat = glm::degrees(std::asin(std::max(-1.0, std::min(1.0, n.y))));
    // theta = atan2(z, x) = 90 - lng
    double lng = 90.0 - glm::degrees(std::atan2(n.z, n.x));
    return glm::dvec2(lat, NormalizeLongitude(lng));
}

glm::mat4 GlobeRotation(const ViewState& view) {
    glm::mat4 m(1.0f);
    m = glm::rotate(m, static_cast<float>(glm::radians(view.latitude)), glm::vec3(1, 0, 0));
    m = glm::rotate(m, static_cast<float>(glm::radians(-view.longitude)), glm::vec3(0, 1, 0));
    return m;
}

double PointOfViewAnimator::EaseCubicInOut(double t) {
    if (t < 0.5) return 4.0 * t * t * t;
    double f = -2.0 * t + 2.0;
    return 1.0 - f * f * f / 2.0;
}

/*
 * Starts a transition.
 *
 * Parameters:
 *   from, to   : Start and end points of view. to.longitude is normalized.
 *   nowMs      : Transition start instant.
 *   durationMs : Length of the transition; <= 0 makes the next sample() return `to`.
 */
void PointOfViewAnimator::start(const ViewState& from, const ViewState& to,
                                std::int64_t nowMs, std::int64_t durationMs) {
    m_from = from;
    m_to = to;
    m_to.longitude = NormalizeLongitude(to.longitude);
    m_to.latitude = ClampLatitude(to.latitude);
    m_startMs = nowMs;
    m_durationMs = durationMs;
    m_active = true;
}

ViewState PointOfViewAnimator::sample(std::int64_t nowMs) {
    if (!m_active) return m_to;

    if (m_durationMs <= 0 || nowMs - m_startMs >= m_durationMs) {
        m_active = false;
        return m_to;
    }

    double t = static_cast<double>(nowMs - m_startMs) / static_cast<double>(m_durationMs);
    t = std::max(0.0, t);
    double e = EaseCubicInOut(t);

    ViewState v;
    double dLng = NormalizeLongitude(m_to.longitude - m_from.longitude);
    v.longitude = NormalizeLongitude(m_from.longitude + dLng * e);
    v.latitude  = m_from.latitude + (m_to.latitude - m_from.latitude) * e;
    v.altitude  = m_from.altitude + (m_to.altitude - m_from.altitude) * e;
    return v;
}
