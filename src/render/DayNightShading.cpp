/*
 * DayNightShading.cpp
 *
 * Purpose:
 *   Implements the CPU reference of the day/night blend. Keep in sync with globe.frag.
 */

#include "render/DayNightShading.h"

#include <algorithm>

namespace DayNight {

float Smoothstep(float lo, float hi, float x) {
    if (hi <= lo) return (x < lo) ? 0.0f : 1.0f;
    float t = std::clamp((x - lo) / (hi - lo), 0.0f, 1.0f);
    return t * t * (3.0f - 2.0f * t);
}

float Illumination(const glm::vec3& normal, const glm::vec3& lightDir) {
    float nl = glm::length(normal);
    float ll = glm::length(lightDir);
    if (nl < 1e-12f || ll < 1e-12f) return 0.0f;
    return std::max(0.0f, glm::dot(normal / nl, lightDir / ll));
}

float BlendFactor(const glm::vec3& normal, const glm::vec3& lightDir, const TerminatorSoftness& edges) {
    return Smoothstep(edges.lo, edges.hi, Illumination(normal, lightDir));
}

glm::vec4 Shade(const glm::vec3& normal, const glm::vec3& lightDir,
                const glm::vec4& dayColor, const glm::vec4& nightColor,
                const TerminatorSoftness& edges) {
    float b = BlendFactor(normal, lightDir, edges);
    return glm::mix(nightColor, dayColor, b);
}

} // namespace DayNight
