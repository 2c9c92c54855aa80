/*
 * DayNightMaterial.cpp
 *
 * Purpose:
 *   Implements program setup and per-draw uniform upload for the day/night globe material.
 */

#include "render/DayNightMaterial.h"
#include "scene/Camera.h"

#include <glm/gtc/matrix_inverse.hpp>
#include <iostream>

DayNightMaterial::~DayNightMaterial() {
    if (m_day) glDeleteTextures(1, &m_day);
    if (m_night) glDeleteTextures(1, &m_night);
}

bool DayNightMaterial::init(const std::string& vertexPath, const std::string& fragmentPath,
                            GLuint dayTexture, GLuint nightTexture,
                            const glm::vec3& lightDirView, const TerminatorSoftness& edges) {
    if (m_day && m_day != dayTexture) glDeleteTextures(1, &m_day);
    if (m_night && m_night != nightTexture) glDeleteTextures(1, &m_night);
    m_day = dayTexture;
    m_night = nightTexture;

    m_lightDirView = (glm::length(lightDirView) > 0.0f) ? glm::normalize(lightDirView) : glm::vec3(1, 0, 0);
    m_edges = edges;

    if (!m_shader.loadFromFiles(vertexPath, fragmentPath)) {
        std::cerr << "[Globe] day/night shader failed\n";
        return false;
    }

    m_shader.use();
    m_shader.setInt("uDayTexture", 0);
    m_shader.setInt("uNightTexture", 1);
    glUseProgram(0);
    return true;
}

void DayNightMaterial::bind(const Camera& camera, const glm::mat4& model) const {
    const glm::mat4& view = camera.viewMatrix();
    glm::mat3 normalMatrix = glm::inverseTranspose(glm::mat3(view * model));

    m_shader.use();
    m_shader.setMat4("uModel", model);
    m_shader.setMat4("uView", view);
    m_shader.setMat4("uProj", camera.projectionMatrix());
    m_shader.setMat3("uNormalMatrix", normalMatrix);

    m_shader.setVec3("uLightDirView", m_lightDirView);
    m_shader.setFloat("uTerminatorLo", m_edges.lo);
    m_shader.setFloat("uTerminatorHi", m_edges.hi);

    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, m_day);
    glActiveTexture(GL_TEXTURE1);
    glBindTexture(GL_TEXTURE_2D, m_night);
    glActiveTexture(GL_TEXTURE0);
}
