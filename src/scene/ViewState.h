/*
 * ViewState.h
 *
 * Purpose:
 *   Declares the globe orientation state (point of view), the location marker, and the animator
 *   used for one-shot recenter transitions.
 *
 * Conventions:
 *   - Angles are in degrees. Longitude is kept in (-180, 180], latitude in [-90, 90].
 *   - altitude is the camera distance above the globe surface in globe radii (globe.gl convention).
 *   - Globe-local cartesian: (lat, lng) = (0, 0) faces +Z, the north pole is +Y, lng = 90 is +X.
 */

#pragma once

#include <cstdint>
#include <string>
#include <glm/glm.hpp>

struct ViewState {
    double latitude  = 0.0;
    double longitude = 0.0;
    double altitude  = 2.5;
};

struct Marker {
    double latitude  = 0.0;
    double longitude = 0.0;
    std::string label;
};

// Maps any finite longitude into (-180, 180] (same bearing modulo 360).
double NormalizeLongitude(double lng);

// Clamps latitude into [-90, 90].
double ClampLatitude(double lat);

// Unit-sphere position for a latitude/longitude pair (degrees).
glm::vec3 LatLngToUnit(double latDeg, double lngDeg);

// Inverse of LatLngToUnit for any non-zero vector. Returns (lat, lng) in degrees.
glm::dvec2 UnitToLatLng(const glm::vec3& p);

/*
 * Globe model rotation that brings (view.latitude, view.longitude) in front of a camera on +Z.
 *
 * Returns:
 *   rotateX(lat) * rotateY(-lng), without scale.
 */
glm::mat4 GlobeRotation(const ViewState& view);

/*
 * One-shot transition between two points of view.
 *
 * Model:
 *   - Cubic in-out easing over durationMs.
 *   - Longitude follows the shortest arc; latitude and altitude interpolate linearly.
 *   - sample() past the end returns the target and deactivates the animator.
 */
class PointOfViewAnimator {
public:
    void start(const ViewState& from, const ViewState& to, std::int64_t nowMs, std::int64_t durationMs);
    void cancel() { m_active = false; }
    bool active() const { return m_active; }

    ViewState sample(std::int64_t nowMs);

    const ViewState& target() const { return m_to; }

private:
    ViewState m_from;
    ViewState m_to;
    std::int64_t m_startMs = 0;
    std::int64_t m_durationMs = 0;
    bool m_active = false;

    static double EaseCubicInOut(double t);
};
