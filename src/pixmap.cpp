#include "mui/pixmap.hpp"
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <utility>
#include <vector>

namespace mui {

Pixmap::Pixmap(const PixmapInfo& info, void* pixels)
    : info_(info), pixels_(pixels) {}

Pixmap Pixmap::Alloc(const PixmapInfo& info) {
    if (info.width <= 0 || info.height <= 0) return Pixmap();
    if (i64(info.stride) < i64(info.width) * 4) return Pixmap();
    const u64 bytes = info.computeByteSize();
    if (bytes > u64(SIZE_MAX)) return Pixmap();
    void* pixels = std::calloc(size_t(bytes), 1);
    if (!pixels) return Pixmap();
    return Pixmap(info, pixels);
}

Pixmap::~Pixmap() { reset(); }

Pixmap::Pixmap(Pixmap&& other) noexcept
    : info_(other.info_), pixels_(other.pixels_) {
    other.info_ = PixmapInfo();
    other.pixels_ = nullptr;
}

Pixmap& Pixmap::operator=(Pixmap&& other) noexcept {
    if (this != &other) {
        reset();
        info_ = other.info_;
        pixels_ = other.pixels_;
        other.info_ = PixmapInfo();
        other.pixels_ = nullptr;
    }
    return *this;
}

void Pixmap::reset() {
    std::free(pixels_);
    pixels_ = nullptr;
    info_ = PixmapInfo();
}

Color Pixmap::pixel(i32 x, i32 y) const {
    const u8* p = rowAddr(y) + size_t(x) * 4;
    return {p[0], p[1], p[2], p[3]};
}

void Pixmap::clear(Color c) {
    if (!valid()) return;
    for (i32 y = 0; y < info_.height; ++y) {
        u8* row = rowAddr(y);
        for (i32 x = 0; x < info_.width; ++x) {
            u8* p = row + size_t(x) * 4;
            p[0] = c.r;
            p[1] = c.g;
            p[2] = c.b;
            p[3] = c.a;
        }
    }
}

void Pixmap::flipVertical() {
    if (!valid()) return;
    const size_t rowBytes = size_t(info_.width) * 4;
    std::vector<u8> tmp(rowBytes);
    for (i32 top = 0, bottom = info_.height - 1; top < bottom; ++top, --bottom) {
        std::memcpy(tmp.data(), rowAddr(top), rowBytes);
        std::memcpy(rowAddr(top), rowAddr(bottom), rowBytes);
        std::memcpy(rowAddr(bottom), tmp.data(), rowBytes);
    }
}

} // namespace mui
