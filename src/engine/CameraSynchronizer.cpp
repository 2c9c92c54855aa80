/*
 * CameraSynchronizer.cpp
 *
 * Purpose:
 *   Implements the declination-driven camera tilt.
 */

#include "engine/CameraSynchronizer.h"
#include "scene/Camera.h"

#include <glm/gtc/constants.hpp>
#include <cmath>

glm::vec3 CameraSynchronizer::UpVectorFor(double declinationDegrees) {
    double tilt = glm::radians(declinationDegrees);
    return glm::vec3(static_cast<float>(std::sin(-tilt)), static_cast<float>(std::cos(-tilt)), 0.0f);
}

void CameraSynchronizer::apply(Camera& camera, double declinationDegrees) {
    m_pose.upVector = UpVectorFor(declinationDegrees);
    m_pose.tiltRadians = static_cast<float>(glm::radians(declinationDegrees));

    camera.up = m_pose.upVector;

    // Changing up alone does not reorient a camera already aimed at the target.
    camera.lookAt(target);
}
