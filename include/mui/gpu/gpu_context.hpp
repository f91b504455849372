#pragma once

#include "mui/result.hpp"
#include "mui/types.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>

namespace mui {

/// @brief Optional capabilities a driver may or may not provide.
enum class GpuFeature : u8 {
    UniformBufferObject,
};

/// @brief A parsed "major.minor" GL or GLSL version.
struct GLVersion {
    i32 major = 0;
    i32 minor = 0;
};

inline bool operator==(GLVersion a, GLVersion b) { return a.major == b.major && a.minor == b.minor; }
inline bool operator!=(GLVersion a, GLVersion b) { return !(a == b); }
inline bool operator<(GLVersion a, GLVersion b) {
    return a.major < b.major || (a.major == b.major && a.minor < b.minor);
}
inline bool operator>=(GLVersion a, GLVersion b) { return !(a < b); }

/**
 * Parse the leading "major.minor" of a GL_VERSION or GL_SHADING_LANGUAGE_VERSION string.
 * Trailing text ("4.6.0 NVIDIA 535.54", "3.1 Mesa 23.0") is ignored.
 * Fails with VersionStringUnparseable when the string does not start with digits.digits.
 */
Result<GLVersion> parseGLVersion(std::string_view text);

/// @brief Raw strings reported by the driver of the current GL context.
struct DriverInfo {
    std::string vendor;
    std::string renderer;
    std::string version;
    std::string shadingLanguageVersion;
    std::unordered_set<std::string> extensions;
};

/**
 * GpuContext - capability handle for an OpenGL driver.
 *
 * Created once per GL context after the context is current. Immutable after
 * creation and shared read-only by the window, canvas and programs.
 *
 * Requirements checked at creation:
 *   - GL 2.0 or newer (DriverUnsupported otherwise)
 *   - below GL 3.0, GL_ARB_vertex_array_object (MissingRequiredExtension otherwise)
 *
 * Usage:
 *   auto ctx = GpuContexts::MakeGL();            // needs a current GL context
 *   auto ctx = GpuContext::Make(driverInfo);     // from already-queried strings
 */
class GpuContext {
public:
    /// @brief Validate driver strings and build a context.
    static Result<std::shared_ptr<const GpuContext>> Make(DriverInfo info);

    ~GpuContext();

    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    const std::string& vendor() const { return info_.vendor; }
    const std::string& renderer() const { return info_.renderer; }

    /// @brief Full GL_VERSION string as reported.
    const std::string& versionString() const { return info_.version; }
    const std::string& shadingLanguageVersionString() const { return info_.shadingLanguageVersion; }

    GLVersion glVersion() const { return glVersion_; }
    /// @brief Parsed GLSL version, {0, 0} when the driver reported none.
    GLVersion glslVersion() const { return glslVersion_; }

    bool hasExtension(const std::string& name) const { return info_.extensions.count(name) != 0; }
    const std::unordered_set<std::string>& extensions() const { return info_.extensions; }

    bool supports(GpuFeature feature) const;

private:
    GpuContext(DriverInfo info, GLVersion gl, GLVersion glsl, u32 features);

    DriverInfo info_;
    GLVersion glVersion_;
    GLVersion glslVersion_;
    u32 features_ = 0;
};

} // namespace mui
