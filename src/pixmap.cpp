#include "brush/pixmap.hpp"

#include <utility>

namespace brush {

Pixmap::Pixmap(const PixmapInfo& info, void* pixels, bool ownsPixels)
    : info_(info), pixels_(pixels), ownsPixels_(ownsPixels) {
}

Pixmap Pixmap::Alloc(const PixmapInfo& info) {
    if (info.width <= 0 || info.height <= 0 || info.bytesPerPixel() == 0) {
        return Pixmap();
    }
    PixmapInfo actual = info;
    if (actual.stride < actual.width * actual.bytesPerPixel()) {
        actual.stride = actual.width * actual.bytesPerPixel();
    }
    void* pixels = std::calloc(size_t(actual.computeByteSize()), 1);
    if (!pixels) return Pixmap();
    return Pixmap(actual, pixels, true);
}

Pixmap Pixmap::Wrap(const PixmapInfo& info, void* pixels) {
    return Pixmap(info, pixels, false);
}

Pixmap::~Pixmap() {
    reset();
}

Pixmap::Pixmap(Pixmap&& other) noexcept
    : info_(other.info_), pixels_(other.pixels_), ownsPixels_(other.ownsPixels_) {
    other.info_ = {};
    other.pixels_ = nullptr;
    other.ownsPixels_ = false;
}

Pixmap& Pixmap::operator=(Pixmap&& other) noexcept {
    if (this != &other) {
        reset();
        info_ = other.info_;
        pixels_ = other.pixels_;
        ownsPixels_ = other.ownsPixels_;
        other.info_ = {};
        other.pixels_ = nullptr;
        other.ownsPixels_ = false;
    }
    return *this;
}

void Pixmap::clear(const LinearColor& c) {
    if (!valid()) return;
    i32 bpp = info_.bytesPerPixel();
    u8 texel[16];
    encodeTexel(c, info_.format, texel);
    for (i32 y = 0; y < info_.height; ++y) {
        u8* row = rowAddr(y);
        for (i32 x = 0; x < info_.width; ++x) {
            std::memcpy(row + x * bpp, texel, size_t(bpp));
        }
    }
}

void Pixmap::reset() {
    if (ownsPixels_ && pixels_) {
        std::free(pixels_);
    }
    pixels_ = nullptr;
    ownsPixels_ = false;
    info_ = {};
}

void Pixmap::reallocate(const PixmapInfo& info) {
    *this = Alloc(info);
}

} // namespace brush
