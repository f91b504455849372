#pragma once

#include "mui/primitive.hpp"
#include "mui/transform.hpp"
#include <glm/glm.hpp>
#include <memory>
#include <vector>

namespace mui {

/**
 * Drawable - a primitive plus the transforms and filters applied to it.
 *
 * Transforms compose in insertion order: for transforms added as A, B, C
 * the model matrix is C * B * A, so A is applied to vertices first. Filters
 * compose the same way. Adding an instance that is already attached has no
 * effect.
 *
 * The drawable owns its primitive; transforms and filters are shared.
 */
class Drawable {
public:
    explicit Drawable(std::unique_ptr<Primitive> primitive);

    Primitive& primitive() { return *primitive_; }
    const Primitive& primitive() const { return *primitive_; }

    /// @brief The primitive as a concrete type, or nullptr if it is another type.
    template <typename T>
    T* primitiveAs() { return dynamic_cast<T*>(primitive_.get()); }
    template <typename T>
    const T* primitiveAs() const { return dynamic_cast<const T*>(primitive_.get()); }

    void addModelTransform(std::shared_ptr<const ModelTransform> transform);
    void removeModelTransform(const ModelTransform& transform);
    bool hasModelTransform(const ModelTransform& transform) const;
    size_t modelTransformCount() const { return models_.size(); }

    /// @brief Attach a color filter. Only mesh primitives are drawn with filters.
    void addFilterTransform(std::shared_ptr<const ColorFilter> filter);
    void removeFilterTransform(const ColorFilter& filter);
    bool hasFilterTransform(const ColorFilter& filter) const;
    size_t filterTransformCount() const { return filters_.size(); }

    /// @brief Composed model matrix, identity when no transform is attached.
    glm::mat4 evaluateModelMatrix(const DrawingContext& ctx) const;
    /// @brief Composed filter matrix, identity when no filter is attached.
    glm::mat4 evaluateFilterMatrix(const DrawingContext& ctx) const;

private:
    std::unique_ptr<Primitive> primitive_;
    std::vector<std::shared_ptr<const ModelTransform>> models_;
    std::vector<std::shared_ptr<const ColorFilter>> filters_;
};

} // namespace mui
