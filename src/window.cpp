#include "mui/window.hpp"
#include "mui/canvas.hpp"
#include "mui/gpu/gl/gl_context.hpp"
#include "mui/platform.hpp"
#include "gpu/gl/gl_resources.hpp"
#include "log.hpp"
#include <SDL2/SDL.h>
#include <algorithm>

namespace mui {

namespace {

void applyContextAttributes(const WindowConfig& config) {
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    if (config.glMajor > 0) {
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, config.glMajor);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, config.glMinor);
    }
    if (config.coreProfile) {
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    }
}

void applySwapInterval(i32 interval) {
    if (SDL_GL_SetSwapInterval(interval) == 0) return;
    logMessage("SDL", "swap interval %d rejected: %s", interval, SDL_GetError());
    // Adaptive vsync is optional; fall back to plain vsync.
    if (interval < 0 && SDL_GL_SetSwapInterval(1) != 0) {
        logMessage("SDL", "vsync rejected: %s", SDL_GetError());
    }
}

} // namespace

Window::Window(SDL_Window* window, void* glContext, std::shared_ptr<const GpuContext> gpu)
    : window_(window), glContext_(glContext), gpu_(std::move(gpu)) {}

Result<std::unique_ptr<Window>> Window::Make(const Platform&, const WindowConfig& config) {
    using R = Result<std::unique_ptr<Window>>;

    applyContextAttributes(config);

    const Uint32 flags = SDL_WINDOW_OPENGL | SDL_WINDOW_HIDDEN | SDL_WINDOW_RESIZABLE;
    SDL_Window* window = SDL_CreateWindow(config.title.c_str(),
                                          SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                          std::max(config.width, kMinWidth),
                                          std::max(config.height, kMinHeight), flags);
    if (!window) {
        std::string err = SDL_GetError();
        logMessage("SDL", "window creation failed: %s", err.c_str());
        return R::Fail(ErrorCode::WindowCreationFailed, err);
    }
    SDL_SetWindowMinimumSize(window, kMinWidth, kMinHeight);

    SDL_GLContext glContext = SDL_GL_CreateContext(window);
    if (!glContext) {
        std::string err = SDL_GetError();
        logMessage("SDL", "GL context creation failed: %s", err.c_str());
        SDL_DestroyWindow(window);
        return R::Fail(ErrorCode::ContextCreationFailed, err);
    }
    if (SDL_GL_MakeCurrent(window, glContext) != 0) {
        std::string err = SDL_GetError();
        logMessage("SDL", "GL context not made current: %s", err.c_str());
        SDL_GL_DeleteContext(glContext);
        SDL_DestroyWindow(window);
        return R::Fail(ErrorCode::ContextCreationFailed, err);
    }
    applySwapInterval(config.swapInterval);

    auto gpu = GpuContexts::MakeGL();
    if (!gpu) {
        SDL_GL_DeleteContext(glContext);
        SDL_DestroyWindow(window);
        return R::Fail(gpu.error());
    }

    std::unique_ptr<Window> result(new Window(window, glContext, gpu.take()));
    result->clear();
    result->swap();
    return R::Ok(std::move(result));
}

Window::~Window() {
    if (glContext_) SDL_GL_DeleteContext(glContext_);
    if (window_) SDL_DestroyWindow(window_);
}

void Window::show() { SDL_ShowWindow(window_); }

void Window::hide() { SDL_HideWindow(window_); }

void Window::swap() { SDL_GL_SwapWindow(window_); }

void Window::clear(Color color) {
    glClearColor(color.r / 255.0f, color.g / 255.0f, color.b / 255.0f, color.a / 255.0f);
    glClear(GL_COLOR_BUFFER_BIT);
}

Size Window::pixelSize() const {
    int w = 0, h = 0;
    SDL_GL_GetDrawableSize(window_, &w, &h);
    return {w, h};
}

void Window::resize(Canvas& canvas) {
    Size size = pixelSize();
    glViewport(0, 0, size.w, size.h);
    canvas.refreshSize(size.w, size.h);
}

void Window::setTitle(const std::string& title) {
    SDL_SetWindowTitle(window_, title.c_str());
}

} // namespace mui
