#include "brush/image.hpp"

#include <string>
#include <utility>

namespace brush {

ImageStore::ImageStore(RenderDevice& device) : device_(device) {
}

ImageStore::~ImageStore() {
    for (auto& e : images_) {
        e.second.destroy(device_);
    }
}

Result<ImageId> ImageStore::create(u32 width, u32 height, PixelFormat format,
                                   const std::vector<u8>& bytes) {
    auto px = pixelSize(format);
    if (!px) return px.error();
    size_t expected = size_t(width) * height * px.value();
    if (!bytes.empty() && bytes.size() != expected) {
        return Error{ErrorCode::InvalidArgument,
                     "expected " + std::to_string(expected) + " bytes for " +
                     std::to_string(width) + "x" + std::to_string(height) + " " +
                     pixelFormatName(format) + " image, got " + std::to_string(bytes.size())};
    }

    auto target = TextureTarget::Create(device_, width, height, format);
    if (!target) return target.error();

    if (!bytes.empty()) {
        auto written = device_.writeTextureRegion(target.value().texture(), 0, 0, width, height, bytes);
        if (!written) {
            target.value().destroy(device_);
            return written.error();
        }
    }

    ImageId id{nextId_++};
    images_.emplace(id.value, std::move(target.value()));
    return id;
}

Result<ImageId> ImageStore::createFromColors(u32 width, u32 height, PixelFormat format,
                                             const std::vector<LinearColor>& pixels) {
    if (pixels.size() != size_t(width) * height) {
        return Error{ErrorCode::InvalidArgument,
                     "expected " + std::to_string(size_t(width) * height) + " pixels, got " +
                     std::to_string(pixels.size())};
    }
    auto bytes = colorsToBytes(pixels, format);
    if (!bytes) return bytes.error();
    return create(width, height, format, bytes.value());
}

Result<TextureTarget*> ImageStore::lookup(ImageId image) {
    auto it = images_.find(image.value);
    if (it == images_.end()) {
        return Error{ErrorCode::ImageNotFound, std::to_string(image.value)};
    }
    return &it->second;
}

Result<void> ImageStore::resize(ImageId image, u32 width, u32 height) {
    auto target = lookup(image);
    if (!target) return target.error();
    return target.value()->resize(device_, width, height);
}

Result<std::vector<LinearColor>> ImageStore::readback(ImageId image) {
    auto target = lookup(image);
    if (!target) return target.error();
    return target.value()->readback(device_);
}

Result<void> ImageStore::update(ImageId image, const std::vector<LinearColor>& pixels) {
    auto target = lookup(image);
    if (!target) return target.error();
    return target.value()->write(device_, pixels);
}

Result<void> ImageStore::updateRegion(ImageId image, u32 x, u32 y, u32 w, u32 h,
                                      const std::vector<LinearColor>& pixels) {
    auto target = lookup(image);
    if (!target) return target.error();
    return target.value()->writeRegion(device_, x, y, w, h, pixels);
}

Result<void> ImageStore::destroy(ImageId image) {
    auto it = images_.find(image.value);
    if (it == images_.end()) {
        return Error{ErrorCode::ImageNotFound, std::to_string(image.value)};
    }
    it->second.destroy(device_);
    images_.erase(it);
    return {};
}

const TextureTarget* ImageStore::find(ImageId image) const {
    auto it = images_.find(image.value);
    return it == images_.end() ? nullptr : &it->second;
}

TextureId ImageStore::texture(ImageId image) const {
    const TextureTarget* target = find(image);
    return target ? target->texture() : TextureId{};
}

} // namespace brush
