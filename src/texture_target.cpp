#include "brush/texture_target.hpp"

#include <string>

namespace brush {

namespace {

u32 paddedRow(const RenderDevice& device, u32 width, u32 px) {
    return alignBytesPerRow(width * px, device.copyBytesPerRowAlignment());
}

}

Result<TextureTarget> TextureTarget::Create(RenderDevice& device, u32 width, u32 height,
                                            PixelFormat format) {
    auto px = pixelSize(format);
    if (!px) return px.error();
    if (width == 0 || height == 0) {
        return Error{ErrorCode::InvalidArgument,
                     "size " + std::to_string(width) + "x" + std::to_string(height) +
                     " must be non-zero"};
    }

    auto texture = device.createTexture({width, height, format});
    if (!texture) return texture.error();

    u32 padded = paddedRow(device, width, px.value());
    auto buffer = device.createReadbackBuffer(size_t(padded) * height);
    if (!buffer) {
        device.destroyTexture(texture.value());
        return buffer.error();
    }

    TextureTarget target;
    target.texture_ = texture.value();
    target.buffer_ = buffer.value();
    target.width_ = width;
    target.height_ = height;
    target.format_ = format;
    target.paddedBytesPerRow_ = padded;
    return target;
}

void TextureTarget::destroy(RenderDevice& device) {
    if (buffer_.valid()) device.destroyBuffer(buffer_);
    if (texture_.valid()) device.destroyTexture(texture_);
    buffer_ = {};
    texture_ = {};
    width_ = height_ = 0;
    paddedBytesPerRow_ = 0;
}

Result<void> TextureTarget::resize(RenderDevice& device, u32 width, u32 height) {
    if (width == 0 || height == 0) {
        return Error{ErrorCode::InvalidArgument,
                     "size " + std::to_string(width) + "x" + std::to_string(height) +
                     " must be non-zero"};
    }
    if (width == width_ && height == height_) return {};

    auto resized = device.resizeTexture(texture_, width, height);
    if (!resized) return resized;

    u32 padded = paddedRow(device, width, pixelSize(format_).value());
    auto buffer = device.createReadbackBuffer(size_t(padded) * height);
    if (!buffer) return buffer.error();

    device.destroyBuffer(buffer_);
    buffer_ = buffer.value();
    width_ = width;
    height_ = height;
    paddedBytesPerRow_ = padded;
    return {};
}

Result<std::vector<LinearColor>> TextureTarget::readback(RenderDevice& device) const {
    auto bytes = device.copyTextureToBuffer(texture_, buffer_);
    if (!bytes) return bytes.error();
    return bytesToColors(bytes.value(), format_, width_, height_, paddedBytesPerRow_);
}

Result<void> TextureTarget::write(RenderDevice& device, const std::vector<LinearColor>& pixels) {
    return writeRegion(device, 0, 0, width_, height_, pixels);
}

Result<void> TextureTarget::checkRegion(u32 x, u32 y, u32 w, u32 h, size_t count) const {
    size_t expected = size_t(w) * h;
    if (count != expected) {
        return Error{ErrorCode::InvalidArgument,
                     "expected " + std::to_string(expected) + " pixels for " +
                     std::to_string(w) + "x" + std::to_string(h) + " region, got " +
                     std::to_string(count)};
    }
    if (u64(x) + w > width_ || u64(y) + h > height_) {
        return Error{ErrorCode::InvalidArgument,
                     "region (" + std::to_string(x) + "," + std::to_string(y) + "," +
                     std::to_string(w) + "," + std::to_string(h) + ") exceeds bounds " +
                     std::to_string(width_) + "x" + std::to_string(height_)};
    }
    return {};
}

Result<void> TextureTarget::writeRegion(RenderDevice& device, u32 x, u32 y, u32 w, u32 h,
                                        const std::vector<LinearColor>& pixels) {
    auto checked = checkRegion(x, y, w, h, pixels.size());
    if (!checked) return checked;
    if (pixels.empty()) return {};

    auto bytes = colorsToBytes(pixels, format_);
    if (!bytes) return bytes.error();
    return device.writeTextureRegion(texture_, x, y, w, h, bytes.value());
}

} // namespace brush
