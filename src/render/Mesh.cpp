/*
 * Mesh.cpp
 *
 * Purpose:
 *   Implements buffer upload, attribute layout and draw submission for Mesh.
 */

#include "Mesh.h"
#include <utility>

Mesh::~Mesh() {
    release();
}

Mesh::Mesh(Mesh&& other) noexcept
    : m_vao(std::exchange(other.m_vao, 0)),
      m_vbo(std::exchange(other.m_vbo, 0)),
      m_ebo(std::exchange(other.m_ebo, 0)),
      m_vertexCount(std::exchange(other.m_vertexCount, 0)),
      m_indexCount(std::exchange(other.m_indexCount, 0)),
      m_primitive(other.m_primitive) {}

Mesh& Mesh::operator=(Mesh&& other) noexcept {
    if (this != &other) {
        release();
        m_vao = std::exchange(other.m_vao, 0);
        m_vbo = std::exchange(other.m_vbo, 0);
        m_ebo = std::exchange(other.m_ebo, 0);
        m_vertexCount = std::exchange(other.m_vertexCount, 0);
        m_indexCount = std::exchange(other.m_indexCount, 0);
        m_primitive = other.m_primitive;
    }
    return *this;
}

void Mesh::release() {
    if (m_ebo) glDeleteBuffers(1, &m_ebo);
    if (m_vbo) glDeleteBuffers(1, &m_vbo);
    if (m_vao) glDeleteVertexArrays(1, &m_vao);
    m_vao = m_vbo = m_ebo = 0;
    m_vertexCount = m_indexCount = 0;
}

void Mesh::uploadInterleavedPosColor(const std::vector<float>& vertices, GLenum primitive) {
    upload(vertices, {{0, 3}, {1, 3}}, nullptr, primitive);
}

void Mesh::uploadInterleavedPosNormalUVIndexed(const std::vector<float>& vertices,
                                               const std::vector<std::uint32_t>& indices) {
    if (indices.empty()) return;
    upload(vertices, {{0, 3}, {1, 3}, {2, 2}}, &indices, GL_TRIANGLES);
}

/*
 * Replaces the mesh contents.
 *
 * Parameters:
 *   layout  : Attributes in interleave order; the stride is the sum of their component counts.
 *   indices : Optional index list. Null switches the mesh to glDrawArrays and drops any old EBO.
 *
 * Notes:
 *   - The element buffer binding is VAO state, so the EBO is bound while the VAO is bound and stays
 *     attached after the VAO is unbound.
 */
void Mesh::upload(const std::vector<float>& vertices, std::initializer_list<Attribute> layout,
                  const std::vector<std::uint32_t>* indices, GLenum primitive) {
    if (vertices.empty()) return;

    GLint floatsPerVertex = 0;
    for (const Attribute& a : layout) floatsPerVertex += a.components;

    if (!m_vao) glGenVertexArrays(1, &m_vao);
    if (!m_vbo) glGenBuffers(1, &m_vbo);

    glBindVertexArray(m_vao);
    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(vertices.size() * sizeof(float)),
                 vertices.data(), GL_STATIC_DRAW);

    if (indices) {
        if (!m_ebo) glGenBuffers(1, &m_ebo);
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, m_ebo);
        glBufferData(GL_ELEMENT_ARRAY_BUFFER, static_cast<GLsizeiptr>(indices->size() * sizeof(std::uint32_t)),
                     indices->data(), GL_STATIC_DRAW);
    } else if (m_ebo) {
        glDeleteBuffers(1, &m_ebo);
        m_ebo = 0;
    }

    const GLsizei stride = static_cast<GLsizei>(floatsPerVertex * sizeof(float));
    size_t offset = 0;
    for (const Attribute& a : layout) {
        glVertexAttribPointer(a.location, a.components, GL_FLOAT, GL_FALSE, stride,
                              reinterpret_cast<const void*>(offset * sizeof(float)));
        glEnableVertexAttribArray(a.location);
        offset += static_cast<size_t>(a.components);
    }

    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);

    m_vertexCount = static_cast<GLsizei>(vertices.size() / static_cast<size_t>(floatsPerVertex));
    m_indexCount = indices ? static_cast<GLsizei>(indices->size()) : 0;
    m_primitive = primitive;
}

void Mesh::draw() const {
    if (!m_vao || m_vertexCount == 0) return;

    glBindVertexArray(m_vao);
    if (m_indexCount > 0) glDrawElements(m_primitive, m_indexCount, GL_UNSIGNED_INT, nullptr);
    else glDrawArrays(m_primitive, 0, m_vertexCount);
    glBindVertexArray(0);
}
