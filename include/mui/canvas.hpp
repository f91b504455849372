#pragma once

#include "mui/drawable.hpp"
#include "mui/gpu/gpu_context.hpp"
#include "mui/program.hpp"
#include "mui/result.hpp"
#include "mui/types.hpp"
#include <glm/glm.hpp>
#include <memory>
#include <optional>
#include <string>

namespace mui {

class Window;

/// @brief Owning handle to a GL 2D texture. Move-only.
class Texture {
public:
    Texture() = default;
    Texture(u32 id, Size size) : id_(id), size_(size) {}
    ~Texture();

    Texture(Texture&& other) noexcept;
    Texture& operator=(Texture&& other) noexcept;

    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;

    u32 id() const { return id_; }
    Size size() const { return size_; }
    bool valid() const { return id_ != 0; }

private:
    void reset();

    u32 id_ = 0;
    Size size_;
};

/// @brief Orthographic projection mapping (0,0)-(w,h) onto clip space, y up.
glm::mat4 orthoProjection(Size size);

/**
 * Canvas - draws drawables onto the window's framebuffer.
 *
 * Coordinates are in pixels with the origin at the bottom-left. The canvas
 * remembers the last program it made current and skips rebinding it; call
 * invalidateProgramCache() after changing the current program elsewhere.
 *
 * Usage:
 *   auto canvas = Canvas::Make(*window);
 *   window->resize(*canvas);                 // on WindowPixelSizeChanged
 *   canvas->draw(line, *geoProgram);
 *   canvas->draw(sprite, *texProgram, texture.id());
 */
class Canvas {
public:
    static std::unique_ptr<Canvas> Make(const Window& window);

    /// @brief Construct for a surface of the given pixel size. Makes no GL calls.
    Canvas(Size size, std::shared_ptr<const GpuContext> gpu);

    Size size() const { return size_; }
    const glm::mat4& projection() const { return projection_; }
    const std::shared_ptr<const GpuContext>& gpuContext() const { return gpu_; }

    /// @brief Record a new surface size and rebuild the projection.
    void refreshSize(i32 width, i32 height);

    /// @brief Decode an image file and upload it as a mipmapped texture.
    Result<Texture> loadImage(const std::string& path) const;

    /// @brief Upload decoded pixels as a mipmapped texture. Rows are expected top first.
    Texture uploadImage(Pixmap pixels) const;

    /// @brief Draw with program, binding texture to unit 0 when given.
    void draw(const Drawable& drawable, const GuiProgram& program,
              std::optional<u32> texture = std::nullopt) const;

    void invalidateProgramCache() const { usedProgram_ = 0; }
    u32 cachedProgram() const { return usedProgram_; }

private:
    Size size_;
    glm::mat4 projection_;
    std::shared_ptr<const GpuContext> gpu_;
    mutable u32 usedProgram_ = 0;
};

} // namespace mui
