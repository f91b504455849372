#include "mui/gpu/gpu_context.hpp"
#include "log.hpp"
#include <charconv>
#include <regex>

namespace mui {

namespace {

u32 featureBit(GpuFeature feature) { return 1u << static_cast<u32>(feature); }

bool parseInt(const std::string& digits, i32& out) {
    auto r = std::from_chars(digits.data(), digits.data() + digits.size(), out);
    return r.ec == std::errc() && r.ptr == digits.data() + digits.size();
}

} // namespace

Result<GLVersion> parseGLVersion(std::string_view text) {
    static const std::regex kPattern(R"(^(\d+)\.(\d+))");
    std::cmatch m;
    if (!std::regex_search(text.data(), text.data() + text.size(), m, kPattern)) {
        return Result<GLVersion>::Fail(ErrorCode::VersionStringUnparseable,
                                       "cannot parse version string \"" + std::string(text) + "\"");
    }
    GLVersion v;
    if (!parseInt(m[1].str(), v.major) || !parseInt(m[2].str(), v.minor)) {
        return Result<GLVersion>::Fail(ErrorCode::VersionStringUnparseable,
                                       "version number out of range in \"" + std::string(text) + "\"");
    }
    return Result<GLVersion>::Ok(v);
}

GpuContext::GpuContext(DriverInfo info, GLVersion gl, GLVersion glsl, u32 features)
    : info_(std::move(info)), glVersion_(gl), glslVersion_(glsl), features_(features) {}

GpuContext::~GpuContext() = default;

Result<std::shared_ptr<const GpuContext>> GpuContext::Make(DriverInfo info) {
    using R = Result<std::shared_ptr<const GpuContext>>;

    auto gl = parseGLVersion(info.version);
    if (!gl) return R::Fail(gl.error());
    const GLVersion v = gl.value();

    if (v < GLVersion{2, 0}) {
        return R::Fail(ErrorCode::DriverUnsupported,
                       "GL " + std::to_string(v.major) + "." + std::to_string(v.minor) +
                       " not supported, 2.0 or newer required");
    }
    if (v < GLVersion{3, 0} && info.extensions.count("GL_ARB_vertex_array_object") == 0) {
        return R::Fail(ErrorCode::MissingRequiredExtension,
                       "GL_ARB_vertex_array_object not found with GL " + info.version);
    }

    u32 features = 0;
    if (v >= GLVersion{3, 1} || info.extensions.count("GL_ARB_uniform_buffer_object")) {
        features |= featureBit(GpuFeature::UniformBufferObject);
    }

    // Some drivers report no shading language version; it is informational only.
    GLVersion glsl;
    if (!info.shadingLanguageVersion.empty()) {
        auto parsed = parseGLVersion(info.shadingLanguageVersion);
        if (parsed) {
            glsl = parsed.value();
        } else {
            logMessage("GL", "ignoring shading language version \"%s\"",
                    info.shadingLanguageVersion.c_str());
        }
    }

    logMessage("GL", "%s / %s / GL %s", info.vendor.c_str(), info.renderer.c_str(), info.version.c_str());
    return R::Ok(std::shared_ptr<const GpuContext>(new GpuContext(std::move(info), v, glsl, features)));
}

bool GpuContext::supports(GpuFeature feature) const {
    return (features_ & featureBit(feature)) != 0;
}

} // namespace mui
