#include "mui/platform.hpp"
#include "log.hpp"
#include <SDL2/SDL.h>

namespace mui {

Result<std::unique_ptr<Platform>> Platform::Make() {
    using R = Result<std::unique_ptr<Platform>>;

    const Uint32 required = SDL_INIT_VIDEO | SDL_INIT_EVENTS | SDL_INIT_JOYSTICK | SDL_INIT_GAMECONTROLLER;
    if (SDL_Init(required) != 0) {
        std::string err = SDL_GetError();
        logMessage("SDL", "init failed: %s", err.c_str());
        SDL_Quit();
        return R::Fail(ErrorCode::PlatformInitFailed, err);
    }
    // Force feedback is optional; many machines have no haptic driver.
    if (SDL_InitSubSystem(SDL_INIT_HAPTIC) != 0) {
        logMessage("SDL", "haptic unavailable: %s", SDL_GetError());
    }

    logMessage("SDL", "video driver %s", SDL_GetCurrentVideoDriver());
    return R::Ok(std::unique_ptr<Platform>(new Platform()));
}

Platform::~Platform() {
    SDL_Quit();
}

const char* Platform::videoDriver() const {
    const char* name = SDL_GetCurrentVideoDriver();
    return name ? name : "";
}

} // namespace mui
