#pragma once

#include "mui/drawable.hpp"
#include "mui/result.hpp"
#include "mui/types.hpp"
#include <glm/glm.hpp>
#include <memory>
#include <string>

namespace mui {

/**
 * GuiProgram - a linked shader program that knows how to feed its uniforms.
 *
 * Attribute locations are fixed before linking: 0 is "position", 1 is
 * "color" (GeoProgram) or "texCoord" (TexProgram). Every program takes
 * "projection" and "model" mat4 uniforms.
 *
 * A program must be destroyed while its GL context is current.
 */
class GuiProgram {
public:
    static constexpr u32 kPositionAttrib = 0;
    static constexpr u32 kSecondAttrib = 1;

    virtual ~GuiProgram();

    GuiProgram(const GuiProgram&) = delete;
    GuiProgram& operator=(const GuiProgram&) = delete;

    u32 id() const { return program_; }

    /// @brief Make this the current program.
    void apply() const;

    /// @brief Upload the uniforms for drawing drawable. The program must be current.
    virtual void uniform(const glm::mat4& projection, const Drawable& drawable,
                         const DrawingContext& ctx) const = 0;

protected:
    explicit GuiProgram(u32 program);

    i32 uniformLocation(const char* name) const;

private:
    u32 program_;
};

/// @brief Program for Geometry primitives: per-vertex color, no texture.
class GeoProgram final : public GuiProgram {
public:
    static Result<std::unique_ptr<GeoProgram>> FromSource(const std::string& vertexSource,
                                                          const std::string& fragmentSource);
    static Result<std::unique_ptr<GeoProgram>> FromFiles(const std::string& vertexPath,
                                                         const std::string& fragmentPath);

    void uniform(const glm::mat4& projection, const Drawable& drawable,
                 const DrawingContext& ctx) const override;

private:
    explicit GeoProgram(u32 program);

    i32 projectionLoc_;
    i32 modelLoc_;
};

/// @brief Program for Mesh primitives: samples texture unit 0 through a color filter matrix.
class TexProgram final : public GuiProgram {
public:
    static constexpr i32 kTextureUnit = 0;

    static Result<std::unique_ptr<TexProgram>> FromSource(const std::string& vertexSource,
                                                          const std::string& fragmentSource);
    static Result<std::unique_ptr<TexProgram>> FromFiles(const std::string& vertexPath,
                                                         const std::string& fragmentPath);

    void uniform(const glm::mat4& projection, const Drawable& drawable,
                 const DrawingContext& ctx) const override;

private:
    explicit TexProgram(u32 program);

    i32 projectionLoc_;
    i32 modelLoc_;
    i32 filterLoc_;
    i32 samplerLoc_;
};

/// @brief Read a whole text file. Fails with ResourceDecodeFailed.
Result<std::string> readTextFile(const std::string& path);

} // namespace mui
