#include "mui/transform.hpp"
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <atomic>

namespace mui {

namespace {

std::atomic<u64> gNextContributorId{1};

u64 nextContributorId() {
    return gNextContributorId.fetch_add(1, std::memory_order_relaxed);
}

} // namespace

ModelTransform::ModelTransform() : id_(nextContributorId()) {}

ColorFilter::ColorFilter() : id_(nextContributorId()) {}

// SmartScaling

SmartScaling::SmartScaling(Size referenceSize, std::optional<CenterTranslation> centering)
    : reference_(referenceSize), centering_(centering) {}

f32 SmartScaling::scaleFactor(const DrawingContext& ctx) const {
    if (reference_.w <= 0 || reference_.h <= 0) return 1.0f;
    return std::min(f32(ctx.surfaceSize.w) / f32(reference_.w),
                    f32(ctx.surfaceSize.h) / f32(reference_.h));
}

glm::mat4 SmartScaling::modelMatrix(const DrawingContext& ctx) const {
    const f32 f = scaleFactor(ctx);
    glm::mat4 m = glm::scale(glm::mat4(1.0f), glm::vec3(f, f, 1.0f));
    if (!centering_) return m;

    const CenterAxis axis = centering_->axis;
    const Size content = centering_->contentSize;
    f32 dx = 0.0f, dy = 0.0f;
    if (axis == CenterAxis::X || axis == CenterAxis::Both) {
        dx = (f32(ctx.surfaceSize.w) - f32(content.w) * f) * 0.5f;
    }
    if (axis == CenterAxis::Y || axis == CenterAxis::Both) {
        dy = (f32(ctx.surfaceSize.h) - f32(content.h) * f) * 0.5f;
    }
    // T * S, not S * T: the offset is already in surface pixels and must not be
    // scaled a second time. See the SmartScaling entry in DESIGN.md.
    return glm::translate(glm::mat4(1.0f), glm::vec3(dx, dy, 0.0f)) * m;
}

// ColorMatrixFilter

glm::mat4 ColorMatrixFilter::Tint(Color tint) {
    glm::mat4 m(1.0f);
    m[0][0] = tint.r / 255.0f;
    m[1][1] = tint.g / 255.0f;
    m[2][2] = tint.b / 255.0f;
    m[3][3] = tint.a / 255.0f;
    return m;
}

glm::mat4 ColorMatrixFilter::Grayscale() {
    // Columns are input channels, rows output channels.
    glm::mat4 m(0.0f);
    for (int row = 0; row < 3; ++row) {
        m[0][row] = 0.299f;
        m[1][row] = 0.587f;
        m[2][row] = 0.114f;
    }
    m[3][3] = 1.0f;
    return m;
}

} // namespace mui
