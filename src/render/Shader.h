/*
 * Shader.h
 *
 * Purpose:
 *   Declares Shader, the GLSL program wrapper used by the globe and overlay passes.
 *   A program is built from a vertex + fragment source file pair; uniforms are set by name.
 *
 * Ownership / lifetime:
 *   - Owns one OpenGL program object; non-copyable.
 *   - OpenGL context must be valid when loading and when the destructor runs.
 *
 * Failure policy:
 *   - loadFromFiles() returns false and logs on missing files, compile or link errors. A program
 *     loaded earlier stays in use in that case.
 *
 * Uniform locations:
 *   - Resolved on first use and cached per name; the cache is dropped when a new program is loaded.
 *     Names the program does not declare resolve to -1, which GL ignores.
 */

#pragma once
#include <string>
#include <unordered_map>
#include <glad/glad.h>
#include <glm/glm.hpp>

class Shader {
public:
    Shader() = default;
    ~Shader();

    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;

    bool loadFromFiles(const std::string& vertexPath, const std::string& fragmentPath);

    void use() const;
    bool valid() const { return m_program != 0; }

    void setMat4(const char* name, const glm::mat4& m) const;
    void setMat3(const char* name, const glm::mat3& m) const;
    void setVec3(const char* name, const glm::vec3& v) const;
    void setFloat(const char* name, float f) const;
    void setInt(const char* name, int i) const;

private:
    GLuint m_program = 0;
    mutable std::unordered_map<std::string, GLint> m_locations;

    GLint location(const char* name) const;
};
