#include "mui/program.hpp"
#include "gl_resources.hpp"
#include "log.hpp"
#include <glm/gtc/type_ptr.hpp>
#include <fstream>
#include <sstream>

namespace mui {

Result<std::string> readTextFile(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        return Result<std::string>::Fail(ErrorCode::ResourceDecodeFailed, "cannot open " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Result<std::string>::Fail(ErrorCode::ResourceDecodeFailed, "cannot read " + path);
    }
    return Result<std::string>::Ok(ss.str());
}

namespace {

// Shared FromFiles body: read both stages, then build from source.
template <typename P>
Result<std::unique_ptr<P>> programFromFiles(const std::string& vertexPath, const std::string& fragmentPath) {
    auto vert = readTextFile(vertexPath);
    if (!vert) return Result<std::unique_ptr<P>>::Fail(vert.error());
    auto frag = readTextFile(fragmentPath);
    if (!frag) return Result<std::unique_ptr<P>>::Fail(frag.error());
    return P::FromSource(vert.value(), frag.value());
}

Result<GLuint> buildProgram(const std::string& vertexSource, const std::string& fragmentSource,
                            const char* secondAttrib) {
    return gl::linkProgram(vertexSource, fragmentSource,
                           {{GuiProgram::kPositionAttrib, "position"},
                            {GuiProgram::kSecondAttrib, secondAttrib}});
}

} // namespace

// GuiProgram

GuiProgram::GuiProgram(u32 program) : program_(program) {}

GuiProgram::~GuiProgram() {
    if (program_) glDeleteProgram(program_);
}

void GuiProgram::apply() const {
    glUseProgram(program_);
}

i32 GuiProgram::uniformLocation(const char* name) const {
    GLint loc = glGetUniformLocation(program_, name);
    if (loc < 0) logMessage("GL", "program %u has no active uniform \"%s\"", program_, name);
    return loc;
}

// GeoProgram

GeoProgram::GeoProgram(u32 program)
    : GuiProgram(program),
      projectionLoc_(uniformLocation("projection")),
      modelLoc_(uniformLocation("model")) {}

Result<std::unique_ptr<GeoProgram>> GeoProgram::FromSource(const std::string& vertexSource,
                                                           const std::string& fragmentSource) {
    using R = Result<std::unique_ptr<GeoProgram>>;
    auto prog = buildProgram(vertexSource, fragmentSource, "color");
    if (!prog) return R::Fail(prog.error());
    return R::Ok(std::unique_ptr<GeoProgram>(new GeoProgram(prog.value())));
}

Result<std::unique_ptr<GeoProgram>> GeoProgram::FromFiles(const std::string& vertexPath,
                                                          const std::string& fragmentPath) {
    return programFromFiles<GeoProgram>(vertexPath, fragmentPath);
}

void GeoProgram::uniform(const glm::mat4& projection, const Drawable& drawable,
                         const DrawingContext& ctx) const {
    const glm::mat4 model = drawable.evaluateModelMatrix(ctx);
    glUniformMatrix4fv(projectionLoc_, 1, GL_FALSE, glm::value_ptr(projection));
    glUniformMatrix4fv(modelLoc_, 1, GL_FALSE, glm::value_ptr(model));
}

// TexProgram

TexProgram::TexProgram(u32 program)
    : GuiProgram(program),
      projectionLoc_(uniformLocation("projection")),
      modelLoc_(uniformLocation("model")),
      filterLoc_(uniformLocation("colorFilter")),
      samplerLoc_(uniformLocation("tex")) {}

Result<std::unique_ptr<TexProgram>> TexProgram::FromSource(const std::string& vertexSource,
                                                           const std::string& fragmentSource) {
    using R = Result<std::unique_ptr<TexProgram>>;
    auto prog = buildProgram(vertexSource, fragmentSource, "texCoord");
    if (!prog) return R::Fail(prog.error());
    return R::Ok(std::unique_ptr<TexProgram>(new TexProgram(prog.value())));
}

Result<std::unique_ptr<TexProgram>> TexProgram::FromFiles(const std::string& vertexPath,
                                                          const std::string& fragmentPath) {
    return programFromFiles<TexProgram>(vertexPath, fragmentPath);
}

void TexProgram::uniform(const glm::mat4& projection, const Drawable& drawable,
                         const DrawingContext& ctx) const {
    const glm::mat4 model = drawable.evaluateModelMatrix(ctx);
    const glm::mat4 filter = drawable.evaluateFilterMatrix(ctx);
    glUniformMatrix4fv(projectionLoc_, 1, GL_FALSE, glm::value_ptr(projection));
    glUniformMatrix4fv(modelLoc_, 1, GL_FALSE, glm::value_ptr(model));
    glUniformMatrix4fv(filterLoc_, 1, GL_FALSE, glm::value_ptr(filter));
    glUniform1i(samplerLoc_, kTextureUnit);
}

} // namespace mui
