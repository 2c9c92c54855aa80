/*
 * GlobePicker.cpp
 *
 * Purpose:
 *   Implements cursor picking against the globe sphere.
 */

#include "scene/GlobePicker.h"
#include "scene/Camera.h"
#include "scene/ViewState.h"

#include <cmath>

/*
 * Ray-sphere intersection for a sphere at the origin.
 *
 * Returns:
 *   Distance along the normalized ray to the nearest hit in front of the origin, or -1 on miss.
 */
static float RaySphereAtOrigin(const glm::vec3& origin, const glm::vec3& dir, float radius) {
    float b = glm::dot(origin, dir);
    float c = glm::dot(origin, origin) - radius * radius;
    float disc = b * b - c;
    if (disc < 0.0f) return -1.0f;

    float s = std::sqrt(disc);
    float t0 = -b - s;
    float t1 = -b + s;
    if (t0 >= 0.0f) return t0;
    if (t1 >= 0.0f) return t1;
    return -1.0f;
}

std::optional<glm::dvec2> PickGlobe(const Camera& camera, const glm::mat4& rotation, float radius,
                                    double cursorX, double cursorY, int width, int height) {
    if (width <= 0 || height <= 0 || radius <= 0.0f) return std::nullopt;

    float ndcX = static_cast<float>(2.0 * cursorX / width - 1.0);
    float ndcY = static_cast<float>(1.0 - 2.0 * cursorY / height);

    glm::mat4 inv = glm::inverse(camera.projectionMatrix() * camera.viewMatrix());
    glm::vec4 nearH = inv * glm::vec4(ndcX, ndcY, -1.0f, 1.0f);
    glm::vec4 farH  = inv * glm::vec4(ndcX, ndcY,  1.0f, 1.0f);
    if (std::abs(nearH.w) < 1e-12f || std::abs(farH.w) < 1e-12f) return std::nullopt;

    glm::vec3 nearP = glm::vec3(nearH) / nearH.w;
    glm::vec3 farP  = glm::vec3(farH) / farH.w;
    glm::vec3 dir = farP - nearP;
    float len = glm::length(dir);
    if (len < 1e-6f) return std::nullopt;
    dir /= len;

    float t = RaySphereAtOrigin(nearP, dir, radius);
    if (t < 0.0f) return std::nullopt;

    glm::vec3 hitWorld = nearP + dir * t;

    // Rotation matrices are orthonormal: inverse == transpose.
    glm::vec3 hitLocal = glm::transpose(glm::mat3(rotation)) * hitWorld;
    return UnitToLatLng(hitLocal);
}
