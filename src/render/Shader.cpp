/*
 * Shader.cpp
 *
 * Purpose:
 *   Implements Shader: source loading, staged compile/link with info-log reporting, uniform setters.
 *
 * Conventions:
 *   - Matrices upload with transpose = GL_FALSE (GLM is column-major).
 */

#include "Shader.h"
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>

namespace {

std::optional<std::string> ReadSource(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        std::cerr << "[Shader] cannot open " << path << "\n";
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

const char* StageName(GLenum stage) {
    return stage == GL_VERTEX_SHADER ? "vertex" : "fragment";
}

// Compiles one stage. Returns 0 (after logging the info log) on failure.
GLuint CompileStage(GLenum stage, const std::string& source, const std::string& path) {
    GLuint shader = glCreateShader(stage);
    const char* text = source.c_str();
    glShaderSource(shader, 1, &text, nullptr);
    glCompileShader(shader);

    GLint status = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &status);
    if (status == GL_TRUE) return shader;

    GLint logLen = 0;
    glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &logLen);
    std::string infoLog(static_cast<size_t>(logLen > 1 ? logLen : 1), '\0');
    glGetShaderInfoLog(shader, static_cast<GLsizei>(infoLog.size()), nullptr, &infoLog[0]);
    std::cerr << "[Shader] " << StageName(stage) << " stage failed: " << path << "\n" << infoLog << "\n";

    glDeleteShader(shader);
    return 0;
}

} // namespace

Shader::~Shader() {
    if (m_program) glDeleteProgram(m_program);
}

/*
 * Builds a program from a vertex and a fragment source file.
 *
 * Returns:
 *   true if the new program linked and replaced the current one.
 */
bool Shader::loadFromFiles(const std::string& vertexPath, const std::string& fragmentPath) {
    auto vertexSrc = ReadSource(vertexPath);
    auto fragmentSrc = ReadSource(fragmentPath);
    if (!vertexSrc || !fragmentSrc) return false;

    GLuint vs = CompileStage(GL_VERTEX_SHADER, *vertexSrc, vertexPath);
    GLuint fs = vs ? CompileStage(GL_FRAGMENT_SHADER, *fragmentSrc, fragmentPath) : 0;
    if (!vs || !fs) {
        if (vs) glDeleteShader(vs);
        return false;
    }

    GLuint program = glCreateProgram();
    glAttachShader(program, vs);
    glAttachShader(program, fs);
    glLinkProgram(program);
    glDetachShader(program, vs);
    glDetachShader(program, fs);
    glDeleteShader(vs);
    glDeleteShader(fs);

    GLint linked = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &linked);
    if (linked != GL_TRUE) {
        GLint logLen = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &logLen);
        std::string infoLog(static_cast<size_t>(logLen > 1 ? logLen : 1), '\0');
        glGetProgramInfoLog(program, static_cast<GLsizei>(infoLog.size()), nullptr, &infoLog[0]);
        std::cerr << "[Shader] link failed: " << vertexPath << " + " << fragmentPath << "\n" << infoLog << "\n";
        glDeleteProgram(program);
        return false;
    }

    if (m_program) glDeleteProgram(m_program);
    m_program = program;
    m_locations.clear();
    return true;
}

void Shader::use() const {
    glUseProgram(m_program);
}

GLint Shader::location(const char* name) const {
    auto it = m_locations.find(name);
    if (it != m_locations.end()) return it->second;

    GLint loc = glGetUniformLocation(m_program, name);
    m_locations.emplace(name, loc);
    return loc;
}

void Shader::setMat4(const char* name, const glm::mat4& m) const {
    glUniformMatrix4fv(location(name), 1, GL_FALSE, &m[0][0]);
}

void Shader::setMat3(const char* name, const glm::mat3& m) const {
    glUniformMatrix3fv(location(name), 1, GL_FALSE, &m[0][0]);
}

void Shader::setVec3(const char* name, const glm::vec3& v) const {
    glUniform3fv(location(name), 1, &v[0]);
}

void Shader::setFloat(const char* name, float f) const {
    glUniform1f(location(name), f);
}

// Sampler unit bindings.
void Shader::setInt(const char* name, int i) const {
    glUniform1i(location(name), i);
}
