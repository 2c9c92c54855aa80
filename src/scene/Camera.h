/*
 * Camera.h
 *
 * Purpose:
 *   Declares the globe camera: a look-at camera with an explicit, mutable up vector and either an
 *   orthographic or a perspective projection.
 *
 * Camera model:
 *   - position and up are plain fields.
 *   - The view matrix is only rebuilt by lookAt(target). Assigning a new up vector alone does not
 *     reorient the camera; lookAt must be re-issued (callers rely on this to batch updates).
 *   - The projection matrix is only rebuilt by updateProjectionMatrix().
 *
 * Orthographic extents follow the three.js convention: the effective extents are
 * (left, right, top, bottom) / zoom.
 *
 * Coordinate conventions:
 *   - World up is +Y; the default camera looks down -Z from (0, 0, 400) at the globe center.
 */

#pragma once

#include <glm/glm.hpp>

enum class ProjectionType {
    Orthographic,
    Perspective
};

class Camera {
public:
    ProjectionType projection = ProjectionType::Orthographic;

    glm::vec3 position{0.0f, 0.0f, 400.0f};
    glm::vec3 up{0.0f, 1.0f, 0.0f};

    // Orthographic extents (world units, before zoom).
    float left   = -250.0f;
    float right  =  250.0f;
    float top    =  250.0f;
    float bottom = -250.0f;
    float zoom   = 1.0f;

    // Perspective parameters.
    float fovDeg = 50.0f;
    float aspect = 1.0f;

    float nearPlane = 0.1f;
    float farPlane  = 2000.0f;

    /*
     * Re-aims the camera at a world-space target using the current position and up vector.
     *
     * Edge cases:
     *   - If up is parallel to the viewing direction, the previous view matrix is kept.
     */
    void lookAt(const glm::vec3& target);

    // Rebuilds the projection matrix from the current projection parameters.
    void updateProjectionMatrix();

    const glm::mat4& viewMatrix() const { return m_view; }
    const glm::mat4& projectionMatrix() const { return m_proj; }

    // Target passed to the most recent lookAt().
    const glm::vec3& target() const { return m_target; }

    // Up vector that was in effect at the most recent lookAt().
    const glm::vec3& appliedUp() const { return m_appliedUp; }

private:
    glm::mat4 m_view{1.0f};
    glm::mat4 m_proj{1.0f};
    glm::vec3 m_target{0.0f};
    glm::vec3 m_appliedUp{0.0f, 1.0f, 0.0f};
};
