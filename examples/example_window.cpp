/**
 * example_window.cpp - minimal mui host loop
 *
 * Demonstrates:
 *   - Platform / Window / Canvas setup
 *   - Translating SDL events through EventPump
 *   - Drawing a line and a sprite scaled from a 800x480 reference layout
 *
 * Build:
 *   cmake -B build -DMUI_BUILD_EXAMPLES=ON && cmake --build build
 *   ./build/example_window [image.png]
 */

#include <mui/mui.hpp>
#include <cstdio>
#include <memory>

int main(int argc, char* argv[]) {
    using namespace mui;

    auto platform = Platform::Make();
    if (!platform) {
        std::fprintf(stderr, "platform: %s\n", platform.error().message.c_str());
        return 1;
    }

    WindowConfig config;
    config.title = "mui - example_window";
    auto window = Window::Make(*platform.value(), config);
    if (!window) {
        std::fprintf(stderr, "window: %s\n", window.error().message.c_str());
        return 1;
    }
    Window& win = *window.value();

    auto gpu = win.gpuContext();
    std::printf("GL %s (%s, %s)\n", gpu->versionString().c_str(),
                gpu->vendor().c_str(), gpu->renderer().c_str());

    auto canvas = Canvas::Make(win);

    auto geo = GeoProgram::FromFiles(MUI_SHADER_DIR "/geo.vert", MUI_SHADER_DIR "/geo.frag");
    auto tex = TexProgram::FromFiles(MUI_SHADER_DIR "/tex.vert", MUI_SHADER_DIR "/tex.frag");
    if (!geo || !tex) {
        std::fprintf(stderr, "shaders: %s\n", (!geo ? geo.error() : tex.error()).message.c_str());
        return 1;
    }

    const Size layout{Window::kMinWidth, Window::kMinHeight};
    auto scaling = std::make_shared<SmartScaling>(layout, CenterTranslation{CenterAxis::Both, layout});

    Drawable diagonal(LineGeom::Make({0, 0}, {f32(layout.w), f32(layout.h)}, {0, 200, 255, 255}));
    diagonal.addModelTransform(scaling);

    std::unique_ptr<Drawable> sprite;
    Texture texture;
    if (argc > 1) {
        auto loaded = canvas->loadImage(argv[1]);
        if (loaded) {
            texture = loaded.take();
            sprite = std::make_unique<Drawable>(SpriteMesh::Make({300, 140}, {500, 340}));
            sprite->addModelTransform(scaling);
        } else {
            std::fprintf(stderr, "image: %s\n", loaded.error().message.c_str());
        }
    }

    EventPump pump(*platform.value());
    bool running = true;
    bool shown = false;
    bool grayscale = false;
    auto gray = std::make_shared<ColorMatrixFilter>(ColorMatrixFilter::Grayscale());

    while (running) {
        for (const Event& e : pump.poll()) {
            switch (e.type) {
            case Event::Type::Quit:
            case Event::Type::WindowCloseRequested:
                running = false;
                break;
            case Event::Type::WindowPixelSizeChanged:
                win.resize(*canvas);
                break;
            case Event::Type::KeyboardKeyDown:
                if (e.data.key.key == KeyboardKey::Escape) {
                    running = false;
                } else if (e.data.key.key == KeyboardKey::G && sprite) {
                    grayscale = !grayscale;
                    if (grayscale) sprite->addFilterTransform(gray);
                    else sprite->removeFilterTransform(*gray);
                }
                break;
            default:
                break;
            }
        }

        win.clear({20, 25, 35, 255});
        canvas->draw(diagonal, *geo.value());
        if (sprite) canvas->draw(*sprite, *tex.value(), texture.id());
        win.swap();

        if (!shown) {
            win.show();
            shown = true;
        }
    }
    return 0;
}
