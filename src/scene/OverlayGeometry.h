/*
 * OverlayGeometry.h
 *
 * Purpose:
 *   CPU vertex builders for the layers drawn on top of the globe surface:
 *     - time-zone arcs as a GL_LINES list
 *     - the location marker as a GL_TRIANGLE_FAN disc
 *
 * Data layout:
 *   - Interleaved [px, py, pz, r, g, b] (6 floats per vertex), globe-local coordinates
 *     (same frame as BuildGlobeGeometry, scaled to world radius).
 */

#pragma once

#include <vector>
#include <glm/glm.hpp>

#include "scene/TimeZoneArcs.h"

/*
 * Line-list vertices for arc segments (two vertices per segment).
 *
 * Parameters:
 *   radius : Distance from the globe center (slightly above the surface to avoid z-fighting).
 */
std::vector<float> BuildArcLineVertices(const std::vector<ArcSegment>& arcs, float radius, const glm::vec3& color);

/*
 * Triangle-fan disc lying on a sphere, centered on (lat, lng).
 *
 * Parameters:
 *   radiusDeg : Angular radius of the disc.
 *   radius    : Sphere radius the disc sits on.
 *   segments  : Rim segments (clamped to >= 3).
 *
 * Returns:
 *   center vertex followed by segments + 1 rim vertices (the first rim vertex repeated to close).
 */
std::vector<float> BuildMarkerFanVertices(double latDeg, double lngDeg, double radiusDeg, float radius,
                                          const glm::vec3& color, int segments = 24);
