#include <gtest/gtest.h>
#include <mui/gpu/gpu_context.hpp>
#include <string>

using namespace mui;

namespace {

DriverInfo driver(const std::string& version, std::unordered_set<std::string> extensions = {}) {
    DriverInfo info;
    info.vendor = "Test Vendor";
    info.renderer = "Test Renderer";
    info.version = version;
    info.shadingLanguageVersion = "1.20";
    info.extensions = std::move(extensions);
    return info;
}

} // namespace

// --- parseGLVersion ---

TEST(ParseGLVersion, IgnoresPatchAndVendorSuffix) {
    auto v = parseGLVersion("4.6.0 NVIDIA 550.54");
    ASSERT_TRUE(v.ok());
    EXPECT_EQ(v.value().major, 4);
    EXPECT_EQ(v.value().minor, 6);
}

TEST(ParseGLVersion, MesaCompatibilityString) {
    auto v = parseGLVersion("3.1 Mesa 23.2.1");
    ASSERT_TRUE(v.ok());
    EXPECT_EQ(v.value(), (GLVersion{3, 1}));
}

TEST(ParseGLVersion, MultiDigitComponents) {
    auto v = parseGLVersion("10.12");
    ASSERT_TRUE(v.ok());
    EXPECT_EQ(v.value(), (GLVersion{10, 12}));
}

TEST(ParseGLVersion, RejectsLeadingText) {
    auto v = parseGLVersion("OpenGL ES 3.2 Mesa");
    EXPECT_FALSE(v.ok());
    EXPECT_EQ(v.error().code, ErrorCode::VersionStringUnparseable);
}

TEST(ParseGLVersion, RejectsMissingMinor) {
    EXPECT_FALSE(parseGLVersion("4").ok());
    EXPECT_FALSE(parseGLVersion("4.").ok());
    EXPECT_FALSE(parseGLVersion("").ok());
}

TEST(ParseGLVersion, RejectsOverflow) {
    auto v = parseGLVersion("99999999999.0");
    EXPECT_FALSE(v.ok());
    EXPECT_EQ(v.error().code, ErrorCode::VersionStringUnparseable);
}

TEST(GLVersion, Ordering) {
    EXPECT_TRUE((GLVersion{2, 1}) < (GLVersion{3, 0}));
    EXPECT_TRUE((GLVersion{3, 0}) < (GLVersion{3, 1}));
    EXPECT_FALSE((GLVersion{3, 1}) < (GLVersion{3, 1}));
    EXPECT_TRUE((GLVersion{4, 0}) >= (GLVersion{3, 9}));
}

// --- GpuContext::Make requirement checks ---

TEST(GpuContext, BelowTwoIsUnsupportedRegardlessOfExtensions) {
    auto ctx = GpuContext::Make(driver("1.5.0", {"GL_ARB_vertex_array_object",
                                                 "GL_ARB_uniform_buffer_object"}));
    ASSERT_FALSE(ctx.ok());
    EXPECT_EQ(ctx.error().code, ErrorCode::DriverUnsupported);
    EXPECT_TRUE(isDriverError(ctx.error().code));
}

TEST(GpuContext, TwoOneWithoutVertexArrayObjectFails) {
    auto ctx = GpuContext::Make(driver("2.1.0"));
    ASSERT_FALSE(ctx.ok());
    EXPECT_EQ(ctx.error().code, ErrorCode::MissingRequiredExtension);
    EXPECT_NE(ctx.error().message.find("GL_ARB_vertex_array_object"), std::string::npos);
}

TEST(GpuContext, TwoOneWithVertexArrayObjectSucceeds) {
    auto ctx = GpuContext::Make(driver("2.1.0", {"GL_ARB_vertex_array_object"}));
    ASSERT_TRUE(ctx.ok());
    EXPECT_FALSE(ctx.value()->supports(GpuFeature::UniformBufferObject));
}

TEST(GpuContext, TwoXWithUniformBufferExtensionEnablesFeature) {
    auto ctx = GpuContext::Make(driver("2.5", {"GL_ARB_vertex_array_object",
                                               "GL_ARB_uniform_buffer_object"}));
    ASSERT_TRUE(ctx.ok());
    EXPECT_TRUE(ctx.value()->supports(GpuFeature::UniformBufferObject));
}

TEST(GpuContext, ThreeZeroNeedsUniformBufferExtension) {
    auto without = GpuContext::Make(driver("3.0"));
    ASSERT_TRUE(without.ok());
    EXPECT_FALSE(without.value()->supports(GpuFeature::UniformBufferObject));

    auto with = GpuContext::Make(driver("3.0", {"GL_ARB_uniform_buffer_object"}));
    ASSERT_TRUE(with.ok());
    EXPECT_TRUE(with.value()->supports(GpuFeature::UniformBufferObject));
}

TEST(GpuContext, ThreeOneEnablesUniformBuffersUnconditionally) {
    auto ctx = GpuContext::Make(driver("3.1"));
    ASSERT_TRUE(ctx.ok());
    EXPECT_TRUE(ctx.value()->supports(GpuFeature::UniformBufferObject));
}

TEST(GpuContext, ThreeTwoWithNoExtensionsSucceeds) {
    auto ctx = GpuContext::Make(driver("3.2.0"));
    ASSERT_TRUE(ctx.ok());
    EXPECT_TRUE(ctx.value()->supports(GpuFeature::UniformBufferObject));
    EXPECT_TRUE(ctx.value()->extensions().empty());
}

TEST(GpuContext, UnparseableVersionFails) {
    auto ctx = GpuContext::Make(driver("garbage"));
    ASSERT_FALSE(ctx.ok());
    EXPECT_EQ(ctx.error().code, ErrorCode::VersionStringUnparseable);
}

TEST(GpuContext, ReportsDriverStrings) {
    auto ctx = GpuContext::Make(driver("4.6.0 NVIDIA 550.54", {"GL_KHR_debug"}));
    ASSERT_TRUE(ctx.ok());
    const GpuContext& gpu = *ctx.value();
    EXPECT_EQ(gpu.vendor(), "Test Vendor");
    EXPECT_EQ(gpu.renderer(), "Test Renderer");
    EXPECT_EQ(gpu.versionString(), "4.6.0 NVIDIA 550.54");
    EXPECT_EQ(gpu.glVersion(), (GLVersion{4, 6}));
    EXPECT_EQ(gpu.glslVersion(), (GLVersion{1, 20}));
    EXPECT_TRUE(gpu.hasExtension("GL_KHR_debug"));
    EXPECT_FALSE(gpu.hasExtension("GL_ARB_vertex_array_object"));
}

TEST(GpuContext, UnparseableShadingLanguageVersionIsNotFatal) {
    DriverInfo info = driver("3.3");
    info.shadingLanguageVersion = "unknown";
    auto ctx = GpuContext::Make(info);
    ASSERT_TRUE(ctx.ok());
    EXPECT_EQ(ctx.value()->glslVersion(), (GLVersion{0, 0}));
}
