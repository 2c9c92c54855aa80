/*
 * CameraSynchronizer.h
 *
 * Purpose:
 *   Tilts the camera by the sun's declination so the globe's axis leans the way the Earth's axis
 *   leans relative to the sun on the current date.
 *
 * Model:
 *   tilt = radians(declination)
 *   up   = (sin(-tilt), cos(-tilt), 0)
 *   then lookAt(target) so the view matrix picks up the new up vector.
 *
 * Notes:
 *   - Applied every frame, including while the user is dragging the globe.
 *   - The resulting CameraPose is owned here; shading never reads it.
 */

#pragma once

#include <glm/glm.hpp>

class Camera;

struct CameraPose {
    glm::vec3 upVector{0.0f, 1.0f, 0.0f};
    float tiltRadians = 0.0f;
};

class CameraSynchronizer {
public:
    /*
     * Applies the declination tilt to a camera and re-aims it at the globe center.
     *
     * Parameters:
     *   camera             : Camera to update (up vector + view matrix).
     *   declinationDegrees : Solar declination in degrees.
     */
    void apply(Camera& camera, double declinationDegrees);

    // Up vector for a declination (pure).
    static glm::vec3 UpVectorFor(double declinationDegrees);

    const CameraPose& pose() const { return m_pose; }

    // Look-at target; the globe is centered at the origin.
    glm::vec3 target{0.0f};

private:
    CameraPose m_pose;
};
