#pragma once

/**
 * @file texture_target.hpp
 * @brief A device texture paired with a reusable readback buffer, with pixel I/O.
 */

#include "brush/error.hpp"
#include "brush/pixel_codec.hpp"
#include "brush/render_device.hpp"
#include "brush/types.hpp"
#include <vector>

namespace brush {

/// @brief Backing storage of a canvas or image.
///
/// The readback buffer is sized for the whole texture at the device's row
/// alignment, reused by every readback and recreated only by resize().
/// Every pixel write is validated (count, bounds, format) before the
/// device is touched.
class TextureTarget {
public:
    /// @brief Create the texture and its readback buffer.
    /// @return UnsupportedPixelFormat, InvalidArgument for a zero size, or
    ///         the device's error.
    static Result<TextureTarget> Create(RenderDevice& device, u32 width, u32 height,
                                        PixelFormat format);

    TextureTarget() = default;

    /// @brief Release the texture and readback buffer.
    void destroy(RenderDevice& device);

    /// @brief Resize the texture (contents are lost) and recreate the readback buffer.
    Result<void> resize(RenderDevice& device, u32 width, u32 height);

    /// @brief Copy the texture back and decode it, width * height colors row-major.
    Result<std::vector<LinearColor>> readback(RenderDevice& device) const;

    /// @brief Replace every pixel. pixels.size() must equal width * height.
    Result<void> write(RenderDevice& device, const std::vector<LinearColor>& pixels);

    /// @brief Replace a sub-rectangle. pixels.size() must equal w * h.
    Result<void> writeRegion(RenderDevice& device, u32 x, u32 y, u32 w, u32 h,
                             const std::vector<LinearColor>& pixels);

    /// @brief Validate a write of count pixels into a sub-rectangle.
    /// @return InvalidArgument on a count mismatch or a region out of bounds.
    Result<void> checkRegion(u32 x, u32 y, u32 w, u32 h, size_t count) const;

    TextureId texture() const { return texture_; }
    BufferId readbackBuffer() const { return buffer_; }
    u32 width() const { return width_; }
    u32 height() const { return height_; }
    PixelFormat format() const { return format_; }
    /// @brief Row pitch of readback data.
    u32 paddedBytesPerRow() const { return paddedBytesPerRow_; }
    bool valid() const { return texture_.valid(); }

private:
    TextureId texture_;
    BufferId buffer_;
    u32 width_ = 0;
    u32 height_ = 0;
    PixelFormat format_ = PixelFormat::RGBA8Unorm;
    u32 paddedBytesPerRow_ = 0;
};

} // namespace brush
