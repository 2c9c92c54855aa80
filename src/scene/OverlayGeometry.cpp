/*
 * OverlayGeometry.cpp
 *
 * Purpose:
 *   Implements overlay vertex generation for arcs and markers.
 */

#include "scene/OverlayGeometry.h"
#include "scene/ViewState.h"

#include <algorithm>
#include <cmath>
#include <glm/gtc/constants.hpp>

static void PushVertex(std::vector<float>& v, const glm::vec3& p, const glm::vec3& c) {
    v.push_back(p.x); v.push_back(p.y); v.push_back(p.z);
    v.push_back(c.r); v.push_back(c.g); v.push_back(c.b);
}

std::vector<float> BuildArcLineVertices(const std::vector<ArcSegment>& arcs, float radius, const glm::vec3& color) {
    std::vector<float> v;
    v.reserve(arcs.size() * 2 * 6);

    for (const auto& a : arcs) {
        PushVertex(v, LatLngToUnit(a.startLat, a.startLng) * radius, color);
        PushVertex(v, LatLngToUnit(a.endLat, a.endLng) * radius, color);
    }
    return v;
}

std::vector<float> BuildMarkerFanVertices(double latDeg, double lngDeg, double radiusDeg, float radius,
                                          const glm::vec3& color, int segments) {
    segments = std::max(3, segments);

    glm::vec3 n = LatLngToUnit(latDeg, lngDeg);

    // Tangent basis at n. Near the poles, east is taken from +X instead of cross(up, n).
    glm::vec3 east = glm::cross(glm::vec3(0, 1, 0), n);
    if (glm::length(east) < 1e-4f) east = glm::vec3(1, 0, 0);
    east = glm::normalize(east);
    glm::vec3 north = glm::cross(n, east);

    float a = static_cast<float>(glm::radians(radiusDeg));
    float ca = std::cos(a);
    float sa = std::sin(a);

    std::vector<float> v;
    v.reserve(static_cast<size_t>(segments + 2) * 6);

    PushVertex(v, n * radius, color);
    for (int i = 0; i <= segments; ++i) {
        float t = glm::two_pi<float>() * static_cast<float>(i % segments) / static_cast<float>(segments);
        glm::vec3 dir = n * ca + (east * std::cos(t) + north * std::sin(t)) * sa;
        PushVertex(v, glm::normalize(dir) * radius, color);
    }
    return v;
}
