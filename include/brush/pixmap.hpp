#pragma once

/**
 * @file pixmap.hpp
 * @brief Pixel buffer descriptor and owning/non-owning pixel buffer.
 */

#include "brush/pixel_codec.hpp"
#include "brush/types.hpp"
#include <cstdlib>
#include <cstring>

namespace brush {

/// @brief Descriptor for pixel buffer dimensions, stride, and format.
struct PixmapInfo {
    i32 width = 0;   ///< Width in pixels.
    i32 height = 0;  ///< Height in pixels.
    i32 stride = 0;  ///< Bytes per row.
    PixelFormat format = PixelFormat::RGBA8Unorm; ///< Pixel format.

    /// @brief Get bytes per pixel, or 0 for formats without a codec.
    i32 bytesPerPixel() const { return static_cast<i32>(pixelSize(format).valueOr(0)); }

    /// @brief Compute total byte size of the pixel buffer.
    /// @return stride x height.
    i32 computeByteSize() const { return stride * height; }

    /// @brief Create a tightly packed PixmapInfo with the given dimensions and format.
    static PixmapInfo Make(i32 w, i32 h, PixelFormat fmt) {
        PixmapInfo info;
        info.width = w;
        info.height = h;
        info.format = fmt;
        info.stride = w * info.bytesPerPixel();
        return info;
    }

    /// @brief Create a PixmapInfo with RGBA8Unorm format.
    static PixmapInfo MakeRGBA(i32 w, i32 h) { return Make(w, h, PixelFormat::RGBA8Unorm); }
};

/// @brief Owning or non-owning pixel buffer.
///
/// Use Alloc() to create an owned buffer, or Wrap() to reference external memory.
class Pixmap {
public:
    /// @brief Allocate a zeroed pixel buffer described by info.
    /// @return An invalid Pixmap if the dimensions are not positive or the
    ///         format has no codec.
    static Pixmap Alloc(const PixmapInfo& info);

    /// @brief Wrap existing pixel memory (caller keeps ownership).
    static Pixmap Wrap(const PixmapInfo& info, void* pixels);

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

    const PixmapInfo& info() const { return info_; }
    i32 width() const { return info_.width; }
    i32 height() const { return info_.height; }
    i32 stride() const { return info_.stride; }
    PixelFormat format() const { return info_.format; }

    /// @brief Check if the pixmap has valid pixel data.
    bool valid() const { return pixels_ != nullptr && info_.width > 0 && info_.height > 0; }

    /// @brief Get pointer to the start of a specific row (mutable).
    u8* rowAddr(i32 y) { return addr8() + y * info_.stride; }
    /// @brief Get pointer to the start of a specific row (const).
    const u8* rowAddr(i32 y) const { return addr8() + y * info_.stride; }

    /// @brief Get pointer to the texel at (x, y).
    u8* pixelAddr(i32 x, i32 y) { return rowAddr(y) + x * info_.bytesPerPixel(); }
    const u8* pixelAddr(i32 x, i32 y) const { return rowAddr(y) + x * info_.bytesPerPixel(); }

    /// @brief Decode the texel at (x, y).
    LinearColor readPixel(i32 x, i32 y) const { return decodeTexel(pixelAddr(x, y), info_.format); }
    /// @brief Encode a color into the texel at (x, y).
    void writePixel(i32 x, i32 y, const LinearColor& c) { encodeTexel(c, info_.format, pixelAddr(x, y)); }

    /// @brief Fill the entire buffer with a color.
    void clear(const LinearColor& c);

    /// @brief Release pixel data and reset to empty state.
    void reset();

    /// @brief Reallocate the buffer with new dimensions/format. Contents are zeroed.
    void reallocate(const PixmapInfo& info);

private:
    Pixmap(const PixmapInfo& info, void* pixels, bool ownsPixels);

    PixmapInfo info_;
    void* pixels_ = nullptr;
    bool ownsPixels_ = false;
};

} // namespace brush
