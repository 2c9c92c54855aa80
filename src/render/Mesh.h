/*
 * Mesh.h
 *
 * Purpose:
 *   Declares Mesh, an RAII owner of one VAO + VBO (+ optional EBO) used for the globe sphere and
 *   the overlay layers (time-zone arcs, location marker).
 *
 * Vertex layouts (interleaved floats):
 *   - PosColor      : [px, py, pz, r, g, b]           locations 0 = pos, 1 = color
 *   - PosNormalUV   : [px, py, pz, nx, ny, nz, u, v]  locations 0 = pos, 1 = normal, 2 = uv
 *
 * Ownership / lifetime:
 *   - Non-copyable, movable. OpenGL context must be valid for uploads and destruction.
 */

#pragma once
#include <cstdint>
#include <initializer_list>
#include <vector>
#include <glad/glad.h>

class Mesh {
public:
    Mesh() = default;
    ~Mesh();

    Mesh(const Mesh&) = delete;
    Mesh& operator=(const Mesh&) = delete;

    Mesh(Mesh&& other) noexcept;
    Mesh& operator=(Mesh&& other) noexcept;

    // Overlay data drawn with glDrawArrays. Empty input leaves the mesh unchanged.
    void uploadInterleavedPosColor(const std::vector<float>& vertices, GLenum primitive);

    // Globe surface drawn as an indexed triangle list.
    void uploadInterleavedPosNormalUVIndexed(const std::vector<float>& vertices,
                                             const std::vector<std::uint32_t>& indices);

    // Caller binds the program and sets uniforms first.
    void draw() const;

    bool empty() const { return m_vertexCount == 0; }

private:
    struct Attribute {
        GLuint location;
        GLint components;
    };

    GLuint m_vao = 0;
    GLuint m_vbo = 0;
    GLuint m_ebo = 0;

    GLsizei m_vertexCount = 0;
    GLsizei m_indexCount = 0;
    GLenum m_primitive = GL_TRIANGLES;

    void upload(const std::vector<float>& vertices, std::initializer_list<Attribute> layout,
                const std::vector<std::uint32_t>* indices, GLenum primitive);
    void release();
};
