#include "brush/pixel_codec.hpp"

#include <cmath>
#include <cstring>
#include <string>

namespace brush {

namespace {

u8 quantize8(f32 v) {
    if (!(v > 0.0f)) return 0;
    if (v >= 1.0f) return 255;
    return static_cast<u8>(std::lround(v * 255.0f));
}

void storeU16(u8* dst, u16 v) {
    dst[0] = static_cast<u8>(v & 0xff);
    dst[1] = static_cast<u8>(v >> 8);
}

u16 loadU16(const u8* src) {
    return static_cast<u16>(src[0] | (src[1] << 8));
}

void storeF32(u8* dst, f32 v) {
    u32 bits;
    std::memcpy(&bits, &v, sizeof(bits));
    dst[0] = static_cast<u8>(bits & 0xff);
    dst[1] = static_cast<u8>((bits >> 8) & 0xff);
    dst[2] = static_cast<u8>((bits >> 16) & 0xff);
    dst[3] = static_cast<u8>(bits >> 24);
}

f32 loadF32(const u8* src) {
    u32 bits = u32(src[0]) | (u32(src[1]) << 8) | (u32(src[2]) << 16) | (u32(src[3]) << 24);
    f32 v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

Error unsupported(PixelFormat format) {
    return Error{ErrorCode::UnsupportedPixelFormat, pixelFormatName(format)};
}

}

const char* pixelFormatName(PixelFormat format) {
    switch (format) {
        case PixelFormat::RGBA8Unorm:     return "RGBA8Unorm";
        case PixelFormat::RGBA8UnormSrgb: return "RGBA8UnormSrgb";
        case PixelFormat::BGRA8Unorm:     return "BGRA8Unorm";
        case PixelFormat::RGBA16Float:    return "RGBA16Float";
        case PixelFormat::RGBA32Float:    return "RGBA32Float";
        case PixelFormat::R8Unorm:        return "R8Unorm";
        case PixelFormat::Depth32Float:   return "Depth32Float";
    }
    return "Unknown";
}

Result<u32> pixelSize(PixelFormat format) {
    switch (format) {
        case PixelFormat::RGBA8Unorm:
        case PixelFormat::RGBA8UnormSrgb:
        case PixelFormat::BGRA8Unorm:
            return 4u;
        case PixelFormat::RGBA16Float:
            return 8u;
        case PixelFormat::RGBA32Float:
            return 16u;
        case PixelFormat::R8Unorm:
        case PixelFormat::Depth32Float:
            break;
    }
    return unsupported(format);
}

bool isSupportedPixelFormat(PixelFormat format) {
    return pixelSize(format).ok();
}

u32 alignBytesPerRow(u32 unpaddedBytesPerRow, u32 alignment) {
    if (alignment <= 1) return unpaddedBytesPerRow;
    return (unpaddedBytesPerRow + alignment - 1) / alignment * alignment;
}

u16 floatToHalf(f32 value) {
    u32 bits;
    std::memcpy(&bits, &value, sizeof(bits));
    u32 sign = (bits >> 16) & 0x8000u;
    i32 exp = static_cast<i32>((bits >> 23) & 0xffu);
    u32 mant = bits & 0x7fffffu;

    if (exp == 0xff) {
        // Inf stays inf, NaN stays a quiet NaN.
        return static_cast<u16>(sign | 0x7c00u | (mant ? 0x200u : 0u));
    }

    i32 halfExp = exp - 127 + 15;
    if (halfExp >= 0x1f) {
        return static_cast<u16>(sign | 0x7c00u);
    }

    if (halfExp <= 0) {
        if (halfExp < -10) return static_cast<u16>(sign);
        mant |= 0x800000u;
        u32 shift = static_cast<u32>(14 - halfExp);
        u32 halfMant = mant >> shift;
        u32 rem = mant & ((1u << shift) - 1u);
        u32 halfway = 1u << (shift - 1u);
        if (rem > halfway || (rem == halfway && (halfMant & 1u))) ++halfMant;
        return static_cast<u16>(sign | halfMant);
    }

    u32 result = sign | (static_cast<u32>(halfExp) << 10) | (mant >> 13);
    u32 rem = mant & 0x1fffu;
    // A carry out of the mantissa correctly bumps the exponent (up to inf).
    if (rem > 0x1000u || (rem == 0x1000u && (result & 1u))) ++result;
    return static_cast<u16>(result);
}

f32 halfToFloat(u16 h) {
    u32 sign = static_cast<u32>(h & 0x8000u) << 16;
    u32 exp = (h >> 10) & 0x1fu;
    u32 mant = h & 0x3ffu;

    if (exp == 0) {
        f32 v = std::ldexp(static_cast<f32>(mant), -24);
        return sign ? -v : v;
    }

    u32 bits;
    if (exp == 0x1f) {
        bits = sign | 0x7f800000u | (mant << 13);
    } else {
        bits = sign | ((exp + 112u) << 23) | (mant << 13);
    }
    f32 v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

void encodeTexel(const LinearColor& c, PixelFormat format, u8* dst) {
    switch (format) {
        case PixelFormat::RGBA8Unorm:
        case PixelFormat::RGBA8UnormSrgb:
            dst[0] = quantize8(c.r);
            dst[1] = quantize8(c.g);
            dst[2] = quantize8(c.b);
            dst[3] = quantize8(c.a);
            break;
        case PixelFormat::BGRA8Unorm:
            dst[0] = quantize8(c.b);
            dst[1] = quantize8(c.g);
            dst[2] = quantize8(c.r);
            dst[3] = quantize8(c.a);
            break;
        case PixelFormat::RGBA16Float:
            storeU16(dst + 0, floatToHalf(c.r));
            storeU16(dst + 2, floatToHalf(c.g));
            storeU16(dst + 4, floatToHalf(c.b));
            storeU16(dst + 6, floatToHalf(c.a));
            break;
        case PixelFormat::RGBA32Float:
            storeF32(dst + 0, c.r);
            storeF32(dst + 4, c.g);
            storeF32(dst + 8, c.b);
            storeF32(dst + 12, c.a);
            break;
        case PixelFormat::R8Unorm:
        case PixelFormat::Depth32Float:
            break;
    }
}

LinearColor decodeTexel(const u8* src, PixelFormat format) {
    switch (format) {
        case PixelFormat::RGBA8Unorm:
        case PixelFormat::RGBA8UnormSrgb:
            return Color::rgba8(src[0], src[1], src[2], src[3]);
        case PixelFormat::BGRA8Unorm:
            return Color::rgba8(src[2], src[1], src[0], src[3]);
        case PixelFormat::RGBA16Float:
            return {halfToFloat(loadU16(src + 0)), halfToFloat(loadU16(src + 2)),
                    halfToFloat(loadU16(src + 4)), halfToFloat(loadU16(src + 6))};
        case PixelFormat::RGBA32Float:
            return {loadF32(src + 0), loadF32(src + 4), loadF32(src + 8), loadF32(src + 12)};
        case PixelFormat::R8Unorm:
        case PixelFormat::Depth32Float:
            break;
    }
    return {};
}

Result<std::vector<u8>> colorsToBytes(const std::vector<LinearColor>& colors,
                                      PixelFormat format) {
    auto px = pixelSize(format);
    if (!px) return px.error();

    std::vector<u8> bytes(colors.size() * px.value());
    u8* dst = bytes.data();
    for (const auto& c : colors) {
        encodeTexel(c, format, dst);
        dst += px.value();
    }
    return bytes;
}

Result<std::vector<LinearColor>> bytesToColors(const u8* data, size_t size, PixelFormat format,
                                               u32 width, u32 height, u32 paddedBytesPerRow) {
    auto px = pixelSize(format);
    if (!px) return px.error();

    size_t rowBytes = size_t(width) * px.value();
    if (paddedBytesPerRow < rowBytes) {
        return Error{ErrorCode::InvalidArgument,
                     "padded row of " + std::to_string(paddedBytesPerRow) +
                     " bytes is shorter than " + std::to_string(rowBytes) + " bytes of texels"};
    }
    if (height > 0) {
        size_t needed = size_t(paddedBytesPerRow) * (height - 1) + rowBytes;
        if (size < needed) {
            return Error{ErrorCode::InvalidArgument,
                         "expected at least " + std::to_string(needed) + " bytes, got " +
                         std::to_string(size)};
        }
    }

    std::vector<LinearColor> colors;
    colors.reserve(size_t(width) * height);
    for (u32 y = 0; y < height; ++y) {
        const u8* row = data + size_t(y) * paddedBytesPerRow;
        for (u32 x = 0; x < width; ++x) {
            colors.push_back(decodeTexel(row + size_t(x) * px.value(), format));
        }
    }
    return colors;
}

Result<std::vector<LinearColor>> bytesToColors(const std::vector<u8>& bytes, PixelFormat format,
                                               u32 width, u32 height, u32 paddedBytesPerRow) {
    return bytesToColors(bytes.data(), bytes.size(), format, width, height, paddedBytesPerRow);
}

} // namespace brush
