#pragma once

#include "mui/types.hpp"
#include <memory>

namespace mui {

enum class PrimitiveKind : u8 {
    Geometry,  ///< Colored vertices, drawn with a GeoProgram.
    Mesh,      ///< Textured vertices, drawn with a TexProgram.
};

/**
 * Primitive - GPU-resident vertex data with a fixed draw call.
 *
 * Owns its vertex array and buffer objects and deletes them on destruction,
 * so a primitive must be destroyed while its GL context is current.
 */
class Primitive {
public:
    virtual ~Primitive() = default;

    Primitive(const Primitive&) = delete;
    Primitive& operator=(const Primitive&) = delete;

    virtual PrimitiveKind kind() const = 0;

    /// @brief Vertex array object name.
    virtual u32 vertexArray() const = 0;

    /// @brief Bind this primitive's vertex array.
    void bind() const;

    /// @brief Issue the draw call. The vertex array must be bound.
    virtual void draw() const = 0;

protected:
    Primitive() = default;
};

/// @brief A single line segment with a constant color.
class LineGeom final : public Primitive {
public:
    static constexpr u32 kVertexCount = 2;

    static std::unique_ptr<LineGeom> Make(Point from, Point to, Color color);
    ~LineGeom() override;

    PrimitiveKind kind() const override { return PrimitiveKind::Geometry; }
    u32 vertexArray() const override { return vao_; }
    void draw() const override;

private:
    LineGeom(u32 vao, u32 vbo) : vao_(vao), vbo_(vbo) {}

    u32 vao_;
    u32 vbo_;
};

/**
 * SpriteMesh - an axis-aligned textured quad.
 *
 * Corners are given in canvas units, y up. The full texture is mapped onto
 * the quad with (0, 0) at the bottom-left corner.
 */
class SpriteMesh final : public Primitive {
public:
    static constexpr u32 kIndexCount = 6;
    static constexpr u32 kIndices[kIndexCount] = {0, 1, 2, 0, 2, 3};

    /// @brief Build the quad spanning bottomLeft to topRight.
    static std::unique_ptr<SpriteMesh> Make(Point bottomLeft, Point topRight);
    ~SpriteMesh() override;

    PrimitiveKind kind() const override { return PrimitiveKind::Mesh; }
    u32 vertexArray() const override { return vao_; }
    void draw() const override;

private:
    SpriteMesh(u32 vao, u32 vbo, u32 ebo) : vao_(vao), vbo_(vbo), ebo_(ebo) {}

    u32 vao_;
    u32 vbo_;
    u32 ebo_;
};

} // namespace mui
