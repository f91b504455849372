#pragma once

#include "mui/pixmap.hpp"
#include "mui/result.hpp"
#include <string>

namespace mui {

/**
 * Decode an image file (PNG, JPEG, BMP, ... as supported by SDL_image)
 * into an RGBA pixmap, top row first.
 * Fails with ResourceDecodeFailed.
 */
Result<Pixmap> decodeImage(const std::string& path);

} // namespace mui
