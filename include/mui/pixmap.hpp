#pragma once

/**
 * @file pixmap.hpp
 * @brief Pixel buffer descriptor and owning/non-owning RGBA pixel buffer.
 */

#include "mui/types.hpp"
#include <cstddef>

namespace mui {

/// @brief Descriptor for pixel buffer dimensions and stride. Pixels are RGBA, 8 bits each.
struct PixmapInfo {
    i32 width = 0;   ///< Width in pixels.
    i32 height = 0;  ///< Height in pixels.
    i32 stride = 0;  ///< Bytes per row.

    /// @brief Total byte size of the pixel buffer (stride x height), computed in 64 bits.
    u64 computeByteSize() const { return u64(stride) * u64(height); }

    /// @brief Create a tightly packed RGBA descriptor.
    ///
    /// A width whose row does not fit in i32 bytes leaves stride at 0, which Alloc rejects.
    static PixmapInfo MakeRGBA(i32 w, i32 h) {
        PixmapInfo info;
        info.width = w;
        info.height = h;
        const i64 rowBytes = i64(w) * 4;
        info.stride = rowBytes <= i64(INT32_MAX) ? i32(rowBytes) : 0;
        return info;
    }
};

/// @brief Owning RGBA pixel buffer.
///
/// Row 0 is the top row of the image as decoded.
class Pixmap {
public:
    /// @brief Allocate a zeroed pixel buffer described by info.
    /// @return An invalid Pixmap when either dimension is not positive, the stride
    ///         cannot hold a row, or the byte size is not addressable.
    static Pixmap Alloc(const PixmapInfo& info);

    Pixmap() = default;
    ~Pixmap();

    Pixmap(Pixmap&& other) noexcept;
    Pixmap& operator=(Pixmap&& other) noexcept;

    Pixmap(const Pixmap&) = delete;
    Pixmap& operator=(const Pixmap&) = delete;

    void* addr() { return pixels_; }
    const void* addr() const { return pixels_; }
    u8* addr8() { return static_cast<u8*>(pixels_); }
    const u8* addr8() const { return static_cast<const u8*>(pixels_); }

    i32 width() const { return info_.width; }
    i32 height() const { return info_.height; }
    i32 stride() const { return info_.stride; }

    /// @brief True if pixels are non-null and dimensions are positive.
    bool valid() const { return pixels_ != nullptr && info_.width > 0 && info_.height > 0; }

    u8* rowAddr(i32 y) { return addr8() + size_t(y) * size_t(info_.stride); }
    const u8* rowAddr(i32 y) const { return addr8() + size_t(y) * size_t(info_.stride); }

    /// @brief Read the pixel at (x, y).
    Color pixel(i32 x, i32 y) const;

    /// @brief Fill the entire buffer with a color.
    void clear(Color c);

    /// @brief Reverse the row order in place.
    ///
    /// GL texture uploads start at the bottom row, decoded images at the top.
    void flipVertical();

    /// @brief Release pixel data and reset to empty state.
    void reset();

private:
    Pixmap(const PixmapInfo& info, void* pixels);

    PixmapInfo info_;
    void* pixels_ = nullptr;
};

}
