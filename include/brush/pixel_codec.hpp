#pragma once

/**
 * @file pixel_codec.hpp
 * @brief Texture pixel formats and conversion between linear colors and texel bytes.
 *
 * Encoded texels are little-endian. 8-bit formats quantize each channel
 * directly to 0..255 (no gamma curve is applied, even for the sRGB format:
 * the conversion belongs to the sampler), 16-bit formats store IEEE half
 * floats and 32-bit formats store IEEE single floats.
 */

#include "brush/error.hpp"
#include "brush/types.hpp"
#include <cstddef>
#include <vector>

namespace brush {

/// @brief Texture pixel format.
enum class PixelFormat : u8 {
    RGBA8Unorm,      ///< 4 x 8-bit normalized.
    RGBA8UnormSrgb,  ///< 4 x 8-bit normalized, sRGB-encoded storage.
    BGRA8Unorm,      ///< 4 x 8-bit normalized, blue first.
    RGBA16Float,     ///< 4 x IEEE half float.
    RGBA32Float,     ///< 4 x IEEE single float.
    R8Unorm,         ///< Single channel, not supported by the codec.
    Depth32Float     ///< Depth attachment, not supported by the codec.
};

/// @brief Return the enumerator name of a pixel format.
const char* pixelFormatName(PixelFormat format);

/// @brief Bytes per texel: 4 for 8-bit RGBA formats, 8 for RGBA16Float, 16 for RGBA32Float.
/// @return UnsupportedPixelFormat for any other format.
Result<u32> pixelSize(PixelFormat format);

/// @brief True if pixelSize() succeeds for the format.
bool isSupportedPixelFormat(PixelFormat format);

/// @brief Round a row byte count up to a multiple of alignment.
u32 alignBytesPerRow(u32 unpaddedBytesPerRow, u32 alignment);

/// @brief Convert a float to IEEE 754 binary16 (round to nearest even).
u16 floatToHalf(f32 value);
/// @brief Convert IEEE 754 binary16 bits to a float.
f32 halfToFloat(u16 bits);

/// @brief Encode one color into dst, which must hold pixelSize(format) bytes.
/// The format must be supported.
void encodeTexel(const LinearColor& color, PixelFormat format, u8* dst);

/// @brief Decode one texel. The format must be supported.
LinearColor decodeTexel(const u8* src, PixelFormat format);

/// @brief Encode colors into tightly packed texels (no row padding).
Result<std::vector<u8>> colorsToBytes(const std::vector<LinearColor>& colors,
                                      PixelFormat format);

/// @brief Decode a row-padded buffer into width * height colors, row-major.
///
/// Walks height rows of paddedBytesPerRow bytes and decodes only the first
/// width * pixelSize(format) bytes of each.
/// @return InvalidArgument if the rows do not fit in size bytes or the
///         padded stride is smaller than a row of texels.
Result<std::vector<LinearColor>> bytesToColors(const u8* data, size_t size, PixelFormat format,
                                               u32 width, u32 height, u32 paddedBytesPerRow);

/// @brief Convenience overload taking a byte vector.
Result<std::vector<LinearColor>> bytesToColors(const std::vector<u8>& bytes, PixelFormat format,
                                               u32 width, u32 height, u32 paddedBytesPerRow);

} // namespace brush
