/*
 * DayNightShading.h
 *
 * Purpose:
 *   CPU reference of the globe's day/night fragment shading (assets/shaders/globe.frag).
 *   Used by tests and by any CPU-side consumer that needs the exact terminator the GPU draws.
 *
 * Model:
 *   intensity = max(0, dot(normalize(normal), normalize(lightDir)))
 *   blend     = smoothstep(lo, hi, intensity)
 *   color     = mix(night, day, blend)
 *
 * Notes:
 *   - normal and lightDir are both in view space. The light is fixed relative to the camera, so the
 *     shading does not depend on the globe's rotation state.
 */

#pragma once
#include <glm/glm.hpp>

struct TerminatorSoftness {
    float lo = 0.0f;
    float hi = 0.15f;
};

namespace DayNight {

// GLSL smoothstep. hi <= lo degenerates to a step at lo (0 below, 1 at or above).
float Smoothstep(float lo, float hi, float x);

// Lambert term clamped at zero. Zero-length inputs yield 0.
float Illumination(const glm::vec3& normal, const glm::vec3& lightDir);

// Blend factor in [0, 1]: 0 = night sample, 1 = day sample.
float BlendFactor(const glm::vec3& normal, const glm::vec3& lightDir, const TerminatorSoftness& edges);

glm::vec4 Shade(const glm::vec3& normal, const glm::vec3& lightDir,
                const glm::vec4& dayColor, const glm::vec4& nightColor,
                const TerminatorSoftness& edges);

} // namespace DayNight
