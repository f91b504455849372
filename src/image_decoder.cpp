#include "mui/image_decoder.hpp"
#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>
#include <cstring>
#include <memory>
#include <string>

namespace mui {

namespace {

using SurfacePtr = std::unique_ptr<SDL_Surface, decltype(&SDL_FreeSurface)>;

} // namespace

Result<Pixmap> decodeImage(const std::string& path) {
    using R = Result<Pixmap>;

    SurfacePtr loaded(IMG_Load(path.c_str()), &SDL_FreeSurface);
    if (!loaded) return R::Fail(ErrorCode::ResourceDecodeFailed, path + ": " + IMG_GetError());

    SurfacePtr rgba(SDL_ConvertSurfaceFormat(loaded.get(), SDL_PIXELFORMAT_RGBA32, 0), &SDL_FreeSurface);
    if (!rgba) return R::Fail(ErrorCode::ResourceDecodeFailed, path + ": " + SDL_GetError());

    if (rgba->w <= 0 || rgba->h <= 0) return R::Fail(ErrorCode::ResourceDecodeFailed, path + ": empty image");
    Pixmap pixmap = Pixmap::Alloc(PixmapInfo::MakeRGBA(rgba->w, rgba->h));
    if (!pixmap.valid()) {
        return R::Fail(ErrorCode::ResourceDecodeFailed,
                       path + ": " + std::to_string(rgba->w) + "x" + std::to_string(rgba->h) +
                       " image does not fit in memory");
    }

    if (SDL_MUSTLOCK(rgba.get()) && SDL_LockSurface(rgba.get()) != 0) {
        return R::Fail(ErrorCode::ResourceDecodeFailed, path + ": " + SDL_GetError());
    }
    const u8* src = static_cast<const u8*>(rgba->pixels);
    const size_t rowBytes = size_t(rgba->w) * 4;
    for (i32 y = 0; y < rgba->h; ++y) {
        std::memcpy(pixmap.rowAddr(y), src + size_t(y) * size_t(rgba->pitch), rowBytes);
    }
    if (SDL_MUSTLOCK(rgba.get())) SDL_UnlockSurface(rgba.get());

    return R::Ok(std::move(pixmap));
}

} // namespace mui
