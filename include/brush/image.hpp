#pragma once

/**
 * @file image.hpp
 * @brief Device images usable as background images and material textures.
 */

#include "brush/error.hpp"
#include "brush/pixel_codec.hpp"
#include "brush/render_device.hpp"
#include "brush/texture_target.hpp"
#include "brush/types.hpp"
#include <unordered_map>
#include <vector>

namespace brush {

/// @brief Owner of images, each a device texture with its own readback buffer.
class ImageStore {
public:
    explicit ImageStore(RenderDevice& device);
    ~ImageStore();

    ImageStore(const ImageStore&) = delete;
    ImageStore& operator=(const ImageStore&) = delete;

    /// @brief Create an image from tightly packed texels in format.
    /// @param bytes width * height * pixelSize(format) bytes, or empty for a
    ///        zeroed image.
    Result<ImageId> create(u32 width, u32 height, PixelFormat format, const std::vector<u8>& bytes);

    /// @brief Create an image from linear colors (width * height of them).
    Result<ImageId> createFromColors(u32 width, u32 height, PixelFormat format,
                                     const std::vector<LinearColor>& pixels);

    /// @brief Resize; previous contents are discarded.
    Result<void> resize(ImageId image, u32 width, u32 height);
    Result<std::vector<LinearColor>> readback(ImageId image);
    Result<void> update(ImageId image, const std::vector<LinearColor>& pixels);
    Result<void> updateRegion(ImageId image, u32 x, u32 y, u32 w, u32 h,
                              const std::vector<LinearColor>& pixels);
    Result<void> destroy(ImageId image);

    bool contains(ImageId image) const { return images_.count(image.value) != 0; }
    const TextureTarget* find(ImageId image) const;
    /// @brief Device texture of an image, or an invalid id.
    TextureId texture(ImageId image) const;
    size_t size() const { return images_.size(); }

private:
    Result<TextureTarget*> lookup(ImageId image);

    RenderDevice& device_;
    u64 nextId_ = 1;
    std::unordered_map<u64, TextureTarget> images_;
};

} // namespace brush
