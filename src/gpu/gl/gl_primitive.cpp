#include "mui/primitive.hpp"
#include "mui/program.hpp"
#include "gl_resources.hpp"
#include <cstddef>

namespace mui {

namespace {

struct LineVertex {
    f32 x, y;
    u8 r, g, b, a;
};

struct SpriteVertex {
    f32 x, y;
    f32 u, v;
};

} // namespace

void Primitive::bind() const {
    glBindVertexArray(vertexArray());
}

// LineGeom

std::unique_ptr<LineGeom> LineGeom::Make(Point from, Point to, Color color) {
    const LineVertex verts[kVertexCount] = {
        {from.x, from.y, color.r, color.g, color.b, color.a},
        {to.x, to.y, color.r, color.g, color.b, color.a},
    };

    GLuint vao = gl::genVertexArray();
    GLuint vbo = gl::genBuffer();
    gl::bufferData(GL_ARRAY_BUFFER, vbo, verts, kVertexCount);
    gl::vertexAttribArray(GuiProgram::kPositionAttrib, 2, gl::NumType::Float, false,
                          sizeof(LineVertex), offsetof(LineVertex, x));
    gl::vertexAttribArray(GuiProgram::kSecondAttrib, 4, gl::NumType::UnsignedByte, true,
                          sizeof(LineVertex), offsetof(LineVertex, r));
    glBindVertexArray(0);

    return std::unique_ptr<LineGeom>(new LineGeom(vao, vbo));
}

LineGeom::~LineGeom() {
    if (vbo_) glDeleteBuffers(1, &vbo_);
    if (vao_) glDeleteVertexArrays(1, &vao_);
}

void LineGeom::draw() const {
    glDrawArrays(GL_LINES, 0, GLsizei(kVertexCount));
}

// SpriteMesh

std::unique_ptr<SpriteMesh> SpriteMesh::Make(Point bottomLeft, Point topRight) {
    const f32 x0 = bottomLeft.x, y0 = bottomLeft.y;
    const f32 x1 = topRight.x, y1 = topRight.y;
    const SpriteVertex verts[4] = {
        {x0, y1, 0.0f, 1.0f},  // top-left
        {x0, y0, 0.0f, 0.0f},  // bottom-left
        {x1, y0, 1.0f, 0.0f},  // bottom-right
        {x1, y1, 1.0f, 1.0f},  // top-right
    };

    GLuint vao = gl::genVertexArray();
    GLuint vbo = gl::genBuffer();
    GLuint ebo = gl::genBuffer();
    gl::bufferData(GL_ARRAY_BUFFER, vbo, verts, 4);
    // Element buffer binding is recorded in the bound VAO.
    gl::bufferData(GL_ELEMENT_ARRAY_BUFFER, ebo, kIndices, kIndexCount);
    gl::vertexAttribArray(GuiProgram::kPositionAttrib, 2, gl::NumType::Float, false,
                          sizeof(SpriteVertex), offsetof(SpriteVertex, x));
    gl::vertexAttribArray(GuiProgram::kSecondAttrib, 2, gl::NumType::Float, false,
                          sizeof(SpriteVertex), offsetof(SpriteVertex, u));
    glBindVertexArray(0);

    return std::unique_ptr<SpriteMesh>(new SpriteMesh(vao, vbo, ebo));
}

SpriteMesh::~SpriteMesh() {
    if (ebo_) glDeleteBuffers(1, &ebo_);
    if (vbo_) glDeleteBuffers(1, &vbo_);
    if (vao_) glDeleteVertexArrays(1, &vao_);
}

void SpriteMesh::draw() const {
    glDrawElements(GL_TRIANGLES, GLsizei(kIndexCount), GL_UNSIGNED_INT, nullptr);
}

} // namespace mui
