/*
 * DayNightMaterial.h
 *
 * Purpose:
 *   GPU side of the day/night shading model: the globe shader program, the two surface maps and the
 *   fixed view-space light. The fragment shader evaluates the same function as DayNight::Shade.
 *
 * Uniforms set per draw:
 *   uModel, uView, uProj, uNormalMatrix (view-space normals)
 *   uDayTexture (unit 0), uNightTexture (unit 1)
 *   uLightDirView, uTerminatorLo, uTerminatorHi
 *
 * Ownership:
 *   - Takes ownership of the two texture handles passed to init() and deletes them.
 */

#pragma once

#include <string>
#include <glad/glad.h>
#include <glm/glm.hpp>

#include "render/DayNightShading.h"
#include "render/Shader.h"

class Camera;

class DayNightMaterial {
public:
    DayNightMaterial() = default;
    ~DayNightMaterial();

    DayNightMaterial(const DayNightMaterial&) = delete;
    DayNightMaterial& operator=(const DayNightMaterial&) = delete;

    /*
     * Builds the program and adopts the textures.
     *
     * Returns:
     *   false if the shader failed to build (textures are still adopted and released later).
     */
    bool init(const std::string& vertexPath, const std::string& fragmentPath,
              GLuint dayTexture, GLuint nightTexture,
              const glm::vec3& lightDirView, const TerminatorSoftness& edges);

    // Binds program, textures and all uniforms for drawing the globe with the given model matrix.
    void bind(const Camera& camera, const glm::mat4& model) const;

    bool ready() const { return m_shader.valid() && m_day && m_night; }

private:
    Shader m_shader;
    GLuint m_day = 0;
    GLuint m_night = 0;

    glm::vec3 m_lightDirView{1.0f, 0.0f, 0.0f};
    TerminatorSoftness m_edges;
};
