#pragma once

// GL resource management utilities.
// Internal implementation - not part of public API.

#include "mui/result.hpp"
#include "mui/types.hpp"
#include "log.hpp"
#include <GL/glew.h>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace mui {
namespace gl {

/// Component type of a vertex attribute.
enum class NumType : u8 {
    Float,
    UnsignedByte,
    UnsignedInt,
};

inline GLenum toGL(NumType type) {
    switch (type) {
    case NumType::Float: return GL_FLOAT;
    case NumType::UnsignedByte: return GL_UNSIGNED_BYTE;
    case NumType::UnsignedInt: return GL_UNSIGNED_INT;
    }
    return GL_FLOAT;
}

inline GLuint genBuffer() {
    GLuint buf = 0;
    glGenBuffers(1, &buf);
    return buf;
}

/// Generate a vertex array object and leave it bound.
inline GLuint genVertexArray() {
    GLuint vao = 0;
    glGenVertexArrays(1, &vao);
    glBindVertexArray(vao);
    return vao;
}

/// Bind buf to target and upload data with GL_STATIC_DRAW.
template <typename T>
void bufferData(GLenum target, GLuint buf, const T* data, size_t count) {
    glBindBuffer(target, buf);
    glBufferData(target, GLsizeiptr(count * sizeof(T)), data, GL_STATIC_DRAW);
}

/// Describe and enable one vertex attribute of the bound GL_ARRAY_BUFFER.
inline void vertexAttribArray(GLuint index, GLint components, NumType type, bool normalized,
                              size_t strideBytes, size_t offsetBytes) {
    glVertexAttribPointer(index, components, toGL(type), normalized ? GL_TRUE : GL_FALSE,
                          GLsizei(strideBytes), reinterpret_cast<const void*>(offsetBytes));
    glEnableVertexAttribArray(index);
}

inline std::string shaderInfoLog(GLuint shader) {
    GLint len = 0;
    glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &len);
    if (len <= 1) return std::string();
    std::vector<char> log(size_t(len), '\0');
    glGetShaderInfoLog(shader, len, nullptr, log.data());
    return std::string(log.data());
}

inline std::string programInfoLog(GLuint program) {
    GLint len = 0;
    glGetProgramiv(program, GL_INFO_LOG_LENGTH, &len);
    if (len <= 1) return std::string();
    std::vector<char> log(size_t(len), '\0');
    glGetProgramInfoLog(program, len, nullptr, log.data());
    return std::string(log.data());
}

inline Result<GLuint> compileShader(GLenum type, const std::string& source) {
    GLuint shader = glCreateShader(type);
    if (!shader) return Result<GLuint>::Fail(ErrorCode::ShaderCompileFailed, "glCreateShader failed");
    const char* src = source.c_str();
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);
    GLint ok = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        std::string log = shaderInfoLog(shader);
        glDeleteShader(shader);
        const char* stage = type == GL_VERTEX_SHADER ? "vertex" : "fragment";
        logMessage("GL", "%s shader compile failed: %s", stage, log.c_str());
        if (log.empty()) log = std::string(stage) + " shader compile failed";
        return Result<GLuint>::Fail(ErrorCode::ShaderCompileFailed, log);
    }
    return Result<GLuint>::Ok(shader);
}

/// Compile, bind attribute locations and link. Shaders are released either way.
inline Result<GLuint> linkProgram(const std::string& vertSrc, const std::string& fragSrc,
                                  std::initializer_list<std::pair<GLuint, const char*>> attribs) {
    auto vert = compileShader(GL_VERTEX_SHADER, vertSrc);
    if (!vert) return vert;
    auto frag = compileShader(GL_FRAGMENT_SHADER, fragSrc);
    if (!frag) {
        glDeleteShader(vert.value());
        return frag;
    }

    GLuint prog = glCreateProgram();
    glAttachShader(prog, vert.value());
    glAttachShader(prog, frag.value());
    for (const auto& a : attribs) glBindAttribLocation(prog, a.first, a.second);
    glLinkProgram(prog);
    glDetachShader(prog, vert.value());
    glDetachShader(prog, frag.value());
    glDeleteShader(vert.value());
    glDeleteShader(frag.value());

    GLint ok = 0;
    glGetProgramiv(prog, GL_LINK_STATUS, &ok);
    if (!ok) {
        std::string log = programInfoLog(prog);
        glDeleteProgram(prog);
        logMessage("GL", "program link failed: %s", log.c_str());
        if (log.empty()) log = "program link failed";
        return Result<GLuint>::Fail(ErrorCode::ShaderCompileFailed, log);
    }
    return Result<GLuint>::Ok(prog);
}

} // namespace gl
} // namespace mui
