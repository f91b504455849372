#include "mui/canvas.hpp"
#include "mui/image_decoder.hpp"
#include "mui/window.hpp"
#include "gl_resources.hpp"
#include "log.hpp"
#include <glm/gtc/matrix_transform.hpp>

namespace mui {

// Texture

Texture::~Texture() { reset(); }

Texture::Texture(Texture&& other) noexcept : id_(other.id_), size_(other.size_) {
    other.id_ = 0;
    other.size_ = Size();
}

Texture& Texture::operator=(Texture&& other) noexcept {
    if (this != &other) {
        reset();
        id_ = other.id_;
        size_ = other.size_;
        other.id_ = 0;
        other.size_ = Size();
    }
    return *this;
}

void Texture::reset() {
    if (id_) {
        GLuint id = id_;
        glDeleteTextures(1, &id);
    }
    id_ = 0;
    size_ = Size();
}

// Canvas

glm::mat4 orthoProjection(Size size) {
    return glm::ortho(0.0f, f32(size.w), 0.0f, f32(size.h), -1.0f, 1.0f);
}

std::unique_ptr<Canvas> Canvas::Make(const Window& window) {
    return std::make_unique<Canvas>(window.pixelSize(), window.gpuContext());
}

Canvas::Canvas(Size size, std::shared_ptr<const GpuContext> gpu)
    : size_(size), projection_(orthoProjection(size)), gpu_(std::move(gpu)) {}

void Canvas::refreshSize(i32 width, i32 height) {
    size_ = {width, height};
    projection_ = orthoProjection(size_);
}

Result<Texture> Canvas::loadImage(const std::string& path) const {
    auto pixels = decodeImage(path);
    if (!pixels) {
        logMessage("Canvas", "%s", pixels.error().message.c_str());
        return Result<Texture>::Fail(pixels.error());
    }
    return Result<Texture>::Ok(uploadImage(pixels.take()));
}

Texture Canvas::uploadImage(Pixmap pixels) const {
    pixels.flipVertical();

    GLuint tex = 0;
    glGenTextures(1, &tex);
    glBindTexture(GL_TEXTURE_2D, tex);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST_MIPMAP_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);

    // glGenerateMipmap arrived with GL 3.0; older drivers generate on upload.
    const bool hasGenerateMipmap = GLEW_VERSION_3_0 || GLEW_ARB_framebuffer_object;
    if (!hasGenerateMipmap) glTexParameteri(GL_TEXTURE_2D, GL_GENERATE_MIPMAP, GL_TRUE);

    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, pixels.width(), pixels.height(), 0,
                 GL_RGBA, GL_UNSIGNED_BYTE, pixels.addr());
    if (hasGenerateMipmap) glGenerateMipmap(GL_TEXTURE_2D);
    glBindTexture(GL_TEXTURE_2D, 0);

    return Texture(tex, {pixels.width(), pixels.height()});
}

void Canvas::draw(const Drawable& drawable, const GuiProgram& program,
                  std::optional<u32> texture) const {
    if (usedProgram_ != program.id()) {
        program.apply();
        usedProgram_ = program.id();
    }
    program.uniform(projection_, drawable, DrawingContext{size_});

    if (texture) {
        glActiveTexture(GL_TEXTURE0 + TexProgram::kTextureUnit);
        glBindTexture(GL_TEXTURE_2D, *texture);
    }

    const Primitive& primitive = drawable.primitive();
    primitive.bind();
    primitive.draw();
    glBindVertexArray(0);
}

} // namespace mui
