/*
 * Camera.cpp
 *
 * Purpose:
 *   Implements the globe camera's look-at and projection updates.
 *
 * Notes:
 *   - glm::lookAt is right-handed (camera looks down its local -Z).
 *   - glm::ortho / glm::perspective produce OpenGL clip space (z in [-1, 1]).
 */

#include "scene/Camera.h"

#include <glm/gtc/matrix_transform.hpp>
#include <cmath>

/*
 * Rebuilds the view matrix so the camera at `position` faces `target` with the current `up`.
 *
 * Parameters:
 *   target : World-space point to look at (the globe center in practice).
 *
 * Edge cases:
 *   - Degenerate input (position == target, or up parallel to the view direction) keeps the
 *     previous view matrix; glm::lookAt would produce NaNs.
 */
void Camera::lookAt(const glm::vec3& target) {
    glm::vec3 dir = target - position;
    float len = glm::length(dir);
    if (len < 1e-6f) return;

    glm::vec3 u = up;
    float upLen = glm::length(u);
    if (upLen < 1e-6f) return;

    glm::vec3 side = glm::cross(dir / len, u / upLen);
    if (glm::length(side) < 1e-6f) return;

    m_view = glm::lookAt(position, target, u / upLen);
    m_target = target;
    m_appliedUp = u / upLen;
}

/*
 * Rebuilds the projection matrix.
 *
 * Behavior:
 *   - Orthographic: extents divided by zoom (zoom <= 0 is treated as 1).
 *   - Perspective: fovDeg is the vertical field of view; aspect <= 0 is treated as 1.
 */
void Camera::updateProjectionMatrix() {
    if (projection == ProjectionType::Orthographic) {
        float z = (zoom > 0.0f) ? zoom : 1.0f;
        m_proj = glm::ortho(left / z, right / z, bottom / z, top / z, nearPlane, farPlane);
    } else {
        float a = (aspect > 0.0f) ? aspect : 1.0f;
        m_proj = glm::perspective(glm::radians(fovDeg), a, nearPlane, farPlane);
    }
}
