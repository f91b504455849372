#include <gtest/gtest.h>
#include <mui/transform.hpp>

using namespace mui;

namespace {

glm::vec4 apply(const glm::mat4& m, f32 x, f32 y) {
    return m * glm::vec4(x, y, 0.0f, 1.0f);
}

} // namespace

// --- SmartScaling ---

TEST(SmartScaling, FactorIsLimitedBySmallerAxis) {
    SmartScaling scaling({800, 480});
    EXPECT_FLOAT_EQ(scaling.scaleFactor({{1600, 1440}}), 2.0f);
    EXPECT_FLOAT_EQ(scaling.scaleFactor({{400, 960}}), 0.5f);
    EXPECT_FLOAT_EQ(scaling.scaleFactor({{800, 480}}), 1.0f);
}

TEST(SmartScaling, UncenteredScalesFromOrigin) {
    SmartScaling scaling({800, 480});
    glm::mat4 m = scaling.modelMatrix({{1600, 1440}});
    glm::vec4 p = apply(m, 800.0f, 480.0f);
    EXPECT_FLOAT_EQ(p.x, 1600.0f);
    EXPECT_FLOAT_EQ(p.y, 960.0f);
    glm::vec4 origin = apply(m, 0.0f, 0.0f);
    EXPECT_FLOAT_EQ(origin.x, 0.0f);
    EXPECT_FLOAT_EQ(origin.y, 0.0f);
}

TEST(SmartScaling, CentersOnBothAxes) {
    SmartScaling scaling({800, 480}, CenterTranslation{CenterAxis::Both, {800, 480}});
    glm::mat4 m = scaling.modelMatrix({{1600, 1440}});
    // f = 2, leftover height 1440 - 960 = 480, half of it above and below.
    glm::vec4 bottomLeft = apply(m, 0.0f, 0.0f);
    EXPECT_FLOAT_EQ(bottomLeft.x, 0.0f);
    EXPECT_FLOAT_EQ(bottomLeft.y, 240.0f);
    glm::vec4 topRight = apply(m, 800.0f, 480.0f);
    EXPECT_FLOAT_EQ(topRight.x, 1600.0f);
    EXPECT_FLOAT_EQ(topRight.y, 1200.0f);
}

TEST(SmartScaling, CentersOnlySelectedAxis) {
    SmartScaling scaling({800, 480}, CenterTranslation{CenterAxis::X, {400, 480}});
    glm::mat4 m = scaling.modelMatrix({{1600, 1440}});
    glm::vec4 p = apply(m, 0.0f, 0.0f);
    // (1600 - 400 * 2) / 2 = 400 on x; y untouched.
    EXPECT_FLOAT_EQ(p.x, 400.0f);
    EXPECT_FLOAT_EQ(p.y, 0.0f);
}

TEST(SmartScaling, EmptyReferenceKeepsUnitScale) {
    SmartScaling scaling({0, 0});
    EXPECT_FLOAT_EQ(scaling.scaleFactor({{1024, 768}}), 1.0f);
}

// --- ColorMatrixFilter ---

TEST(ColorMatrixFilter, TintScalesChannels) {
    ColorMatrixFilter tint(ColorMatrixFilter::Tint({255, 128, 0, 255}));
    glm::vec4 c = tint.filterMatrix({{800, 480}}) * glm::vec4(1.0f, 1.0f, 1.0f, 1.0f);
    EXPECT_FLOAT_EQ(c.r, 1.0f);
    EXPECT_NEAR(c.g, 128.0f / 255.0f, 1e-6f);
    EXPECT_FLOAT_EQ(c.b, 0.0f);
    EXPECT_FLOAT_EQ(c.a, 1.0f);
}

TEST(ColorMatrixFilter, GrayscaleUsesLuma) {
    ColorMatrixFilter gray(ColorMatrixFilter::Grayscale());
    glm::vec4 c = gray.filterMatrix({}) * glm::vec4(1.0f, 0.0f, 0.0f, 0.5f);
    EXPECT_NEAR(c.r, 0.299f, 1e-6f);
    EXPECT_NEAR(c.g, 0.299f, 1e-6f);
    EXPECT_NEAR(c.b, 0.299f, 1e-6f);
    EXPECT_FLOAT_EQ(c.a, 0.5f);
}

// --- Identity ---

TEST(Contributor, IdsAreUniqueAcrossKinds) {
    SmartScaling a({800, 480});
    SmartScaling b({800, 480});
    ColorMatrixFilter f(glm::mat4(1.0f));
    EXPECT_NE(a.uniqueId(), b.uniqueId());
    EXPECT_NE(a.uniqueId(), f.uniqueId());
    EXPECT_NE(b.uniqueId(), f.uniqueId());
}
