#pragma once

#include "mui/gpu/gpu_context.hpp"
#include "mui/result.hpp"
#include "mui/types.hpp"
#include <memory>
#include <string>

struct SDL_Window;

namespace mui {

class Canvas;
class Platform;

/// @brief Window creation parameters.
struct WindowConfig {
    std::string title = "MUI";
    i32 width = 800;         ///< Initial logical width, at least the minimum width.
    i32 height = 480;        ///< Initial logical height, at least the minimum height.
    i32 swapInterval = 1;    ///< 0 immediate, 1 vsync, -1 adaptive vsync.
    i32 glMajor = 0;         ///< Requested context version, 0 leaves the driver default.
    i32 glMinor = 0;
    bool coreProfile = false;
};

/**
 * Window - the application's single native window and its GL context.
 *
 * The window starts hidden so the first visible frame is a drawn one; call
 * show() after the first swap(). The GL context stays current on the calling
 * thread for the window's lifetime.
 *
 * Usage:
 *   auto platform = Platform::Make();
 *   auto window = Window::Make(*platform.value());
 *   auto canvas = Canvas::Make(*window.value());
 */
class Window {
public:
    static constexpr i32 kMinWidth = 800;
    static constexpr i32 kMinHeight = 480;

    /// @brief Create the window, its GL context and the GpuContext for it.
    ///
    /// Fails with WindowCreationFailed, ContextCreationFailed or any driver error
    /// from GpuContext::Make. Nothing is left allocated on failure.
    /// The platform argument only proves SDL video is initialized for the call.
    static Result<std::unique_ptr<Window>> Make(const Platform& platform, const WindowConfig& config = {});

    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    void show();
    void hide();

    /// @brief Present the back buffer.
    void swap();

    /// @brief Clear the color buffer of the current framebuffer.
    void clear(Color color = {0, 0, 0, 255});

    /// @brief Drawable size in pixels, which differs from the logical size on high-DPI displays.
    Size pixelSize() const;

    /// @brief Match the viewport and canvas projection to the current pixel size.
    void resize(Canvas& canvas);

    void setTitle(const std::string& title);

    const std::shared_ptr<const GpuContext>& gpuContext() const { return gpu_; }
    SDL_Window* nativeHandle() const { return window_; }

private:
    Window(SDL_Window* window, void* glContext, std::shared_ptr<const GpuContext> gpu);

    SDL_Window* window_ = nullptr;
    void* glContext_ = nullptr;
    std::shared_ptr<const GpuContext> gpu_;
};

} // namespace mui
