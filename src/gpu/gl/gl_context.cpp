// GL context implementation - builds a GpuContext from the current OpenGL context.

#include "mui/gpu/gl/gl_context.hpp"
#include "gl_resources.hpp"
#include "log.hpp"
#include <sstream>

namespace mui {

namespace {

using R = Result<std::shared_ptr<const GpuContext>>;

std::string glString(GLenum name) {
    const GLubyte* s = glGetString(name);
    return s ? reinterpret_cast<const char*>(s) : std::string();
}

// GL 3.0 deprecated the single GL_EXTENSIONS string in favor of an indexed list.
void queryExtensions(GLVersion version, std::unordered_set<std::string>& out) {
    if (version >= GLVersion{3, 0}) {
        GLint count = 0;
        glGetIntegerv(GL_NUM_EXTENSIONS, &count);
        for (GLint i = 0; i < count; ++i) {
            const GLubyte* ext = glGetStringi(GL_EXTENSIONS, GLuint(i));
            if (ext) out.insert(reinterpret_cast<const char*>(ext));
        }
    } else {
        std::istringstream in(glString(GL_EXTENSIONS));
        std::string ext;
        while (in >> ext) out.insert(ext);
    }
}

// Entry points the library calls once a context is accepted. Null means GLEW
// could not resolve them on this context.
const char* missingEntryPoint() {
    if (!glCreateShader || !glShaderSource || !glCompileShader || !glCreateProgram ||
        !glAttachShader || !glBindAttribLocation || !glLinkProgram || !glUseProgram ||
        !glGetUniformLocation || !glUniformMatrix4fv || !glUniform1i) {
        return "shader objects";
    }
    if (!glGenBuffers || !glBindBuffer || !glBufferData ||
        !glVertexAttribPointer || !glEnableVertexAttribArray) {
        return "buffer objects";
    }
    if (!glGenVertexArrays || !glBindVertexArray || !glDeleteVertexArrays) return "vertex array objects";
    if ((GLEW_VERSION_3_0 || GLEW_ARB_framebuffer_object) && !glGenerateMipmap) return "glGenerateMipmap";
    return nullptr;
}

R entryPointFailure(const std::string& what, GLenum glewStatus) {
    std::string msg = "GL entry points not loaded: " + what;
    if (glewStatus != GLEW_OK) {
        msg += std::string(" (GLEW: ") + reinterpret_cast<const char*>(glewGetErrorString(glewStatus)) + ")";
    }
    logMessage("GL", "%s", msg.c_str());
    return R::Fail(ErrorCode::ContextCreationFailed, msg);
}

} // namespace

namespace GpuContexts {

Result<std::shared_ptr<const GpuContext>> MakeGL() {
    glewExperimental = GL_TRUE;
    GLenum err = glewInit();
    while (glGetError() != GL_NO_ERROR) {}
    // EGL setups can report non-fatal GLEW init errors; keep going if GL is alive.
    if (glGetString(GL_VERSION) == nullptr) {
        if (err != GLEW_OK) {
            return R::Fail(ErrorCode::ContextCreationFailed,
                           std::string("GLEW init failed: ") +
                           reinterpret_cast<const char*>(glewGetErrorString(err)));
        }
        return R::Fail(ErrorCode::ContextCreationFailed, "no GL context is current");
    }

    DriverInfo info;
    info.vendor = glString(GL_VENDOR);
    info.renderer = glString(GL_RENDERER);
    info.version = glString(GL_VERSION);
    info.shadingLanguageVersion = glString(GL_SHADING_LANGUAGE_VERSION);

    auto version = parseGLVersion(info.version);
    if (!version) return R::Fail(version.error());
    if (version.value() >= GLVersion{3, 0} && !glGetStringi) return entryPointFailure("glGetStringi", err);
    queryExtensions(version.value(), info.extensions);

    auto ctx = GpuContext::Make(std::move(info));
    if (!ctx) {
        logMessage("GL", "%s", ctx.error().message.c_str());
        return ctx;
    }
    // Driver checks come first so an old driver reports what it lacks.
    if (const char* missing = missingEntryPoint()) return entryPointFailure(missing, err);
    return ctx;
}

} // namespace GpuContexts

} // namespace mui
