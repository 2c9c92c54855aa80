/*
 * GlobePicker.h
 *
 * Purpose:
 *   Screen-space picking against the globe: cursor pixel -> world ray -> sphere hit -> lat/lng.
 *
 * Notes:
 *   - Works for both projections by unprojecting the near and far clip planes.
 *   - The globe is centered at the origin; `rotation` is the globe model rotation (GlobeRotation()).
 */

#pragma once

#include <optional>
#include <glm/glm.hpp>

class Camera;

/*
 * Picks the globe surface under a cursor position.
 *
 * Parameters:
 *   camera   : Camera with up-to-date view and projection matrices.
 *   rotation : Globe model rotation (no scale).
 *   radius   : Globe radius in world units.
 *   cursorX, cursorY : Cursor position in pixels, origin top-left.
 *   width, height    : Surface size in pixels.
 *
 * Returns:
 *   (lat, lng) in degrees, or nullopt if the ray misses the globe or the surface size is invalid.
 */
std::optional<glm::dvec2> PickGlobe(const Camera& camera, const glm::mat4& rotation, float radius,
                                    double cursorX, double cursorY, int width, int height);
