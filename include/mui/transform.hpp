#pragma once

/**
 * @file transform.hpp
 * @brief Model transforms and color filters attached to drawables.
 */

#include "mui/types.hpp"
#include <glm/glm.hpp>
#include <optional>

namespace mui {

/// @brief Per-frame state handed to transforms when they are evaluated.
struct DrawingContext {
    Size surfaceSize;  ///< Current canvas size in pixels.
};

/**
 * ModelTransform - contributes a matrix to a drawable's model matrix.
 *
 * Each instance carries a process-unique id; a drawable holds a given
 * transform at most once. Instances are shared between drawables through
 * std::shared_ptr<const ModelTransform>.
 */
class ModelTransform {
public:
    virtual ~ModelTransform() = default;

    ModelTransform(const ModelTransform&) = delete;
    ModelTransform& operator=(const ModelTransform&) = delete;

    virtual glm::mat4 modelMatrix(const DrawingContext& ctx) const = 0;

    u64 uniqueId() const { return id_; }

protected:
    ModelTransform();

private:
    u64 id_;
};

/// @brief Contributes a 4x4 matrix applied to texture colors in the fragment stage.
class ColorFilter {
public:
    virtual ~ColorFilter() = default;

    ColorFilter(const ColorFilter&) = delete;
    ColorFilter& operator=(const ColorFilter&) = delete;

    virtual glm::mat4 filterMatrix(const DrawingContext& ctx) const = 0;

    u64 uniqueId() const { return id_; }

protected:
    ColorFilter();

private:
    u64 id_;
};

enum class CenterAxis : u8 { X, Y, Both };

/// @brief Centering of scaled content inside the surface.
struct CenterTranslation {
    CenterAxis axis = CenterAxis::Both;
    Size contentSize;  ///< Content extent in reference units.
};

/**
 * SmartScaling - uniform scale from a reference resolution to the surface.
 *
 * The factor is min(surface.w / reference.w, surface.h / reference.h), so
 * content authored at the reference size fits inside the surface without
 * distortion. With centering, the scaled content is offset by half the
 * leftover space on the chosen axes.
 */
class SmartScaling final : public ModelTransform {
public:
    explicit SmartScaling(Size referenceSize,
                          std::optional<CenterTranslation> centering = std::nullopt);

    glm::mat4 modelMatrix(const DrawingContext& ctx) const override;

    f32 scaleFactor(const DrawingContext& ctx) const;
    Size referenceSize() const { return reference_; }

private:
    Size reference_;
    std::optional<CenterTranslation> centering_;
};

/// @brief A fixed color matrix.
class ColorMatrixFilter final : public ColorFilter {
public:
    explicit ColorMatrixFilter(const glm::mat4& matrix) : matrix_(matrix) {}

    /// @brief Multiply each channel by the matching tint channel.
    static glm::mat4 Tint(Color tint);
    /// @brief Rec. 601 luma into each color channel, alpha kept.
    static glm::mat4 Grayscale();

    glm::mat4 filterMatrix(const DrawingContext&) const override { return matrix_; }

private:
    glm::mat4 matrix_;
};

} // namespace mui
