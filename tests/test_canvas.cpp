#include <gtest/gtest.h>
#include <mui/canvas.hpp>

using namespace mui;

namespace {

std::shared_ptr<const GpuContext> fakeGpu() {
    DriverInfo info;
    info.vendor = "Test";
    info.renderer = "Test";
    info.version = "3.3.0";
    auto ctx = GpuContext::Make(info);
    return ctx.ok() ? ctx.value() : nullptr;
}

glm::vec4 project(const Canvas& canvas, f32 x, f32 y) {
    return canvas.projection() * glm::vec4(x, y, 0.0f, 1.0f);
}

} // namespace

TEST(Canvas, ConstructionSetsSizeAndProjection) {
    Canvas canvas({800, 480}, fakeGpu());
    EXPECT_EQ(canvas.size(), (Size{800, 480}));
    ASSERT_NE(canvas.gpuContext().get(), nullptr);

    glm::vec4 p = project(canvas, 800.0f, 480.0f);
    EXPECT_FLOAT_EQ(p.x, 1.0f);
    EXPECT_FLOAT_EQ(p.y, 1.0f);
}

TEST(Canvas, ProjectionFollowsRefreshSize) {
    Canvas canvas({800, 480}, fakeGpu());
    canvas.refreshSize(1024, 768);
    EXPECT_EQ(canvas.size(), (Size{1024, 768}));

    glm::vec4 right = project(canvas, 1024.0f, 0.0f);
    EXPECT_FLOAT_EQ(right.x, 1.0f);
    EXPECT_FLOAT_EQ(right.y, -1.0f);

    glm::vec4 top = project(canvas, 0.0f, 768.0f);
    EXPECT_FLOAT_EQ(top.x, -1.0f);
    EXPECT_FLOAT_EQ(top.y, 1.0f);

    glm::vec4 center = project(canvas, 512.0f, 384.0f);
    EXPECT_NEAR(center.x, 0.0f, 1e-6f);
    EXPECT_NEAR(center.y, 0.0f, 1e-6f);
}

TEST(Canvas, OrthoProjectionOriginIsBottomLeft) {
    glm::vec4 p = orthoProjection({640, 360}) * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
    EXPECT_FLOAT_EQ(p.x, -1.0f);
    EXPECT_FLOAT_EQ(p.y, -1.0f);
    EXPECT_FLOAT_EQ(p.w, 1.0f);
}

TEST(Canvas, ProgramCacheStartsEmpty) {
    Canvas canvas({800, 480}, nullptr);
    EXPECT_EQ(canvas.cachedProgram(), 0u);
    canvas.invalidateProgramCache();
    EXPECT_EQ(canvas.cachedProgram(), 0u);
}

TEST(Texture, DefaultIsInvalid) {
    Texture tex;
    EXPECT_FALSE(tex.valid());
    EXPECT_EQ(tex.id(), 0u);
}
