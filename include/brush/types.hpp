#pragma once

#include <cstdint>

/**
 * @file types.hpp
 * @brief Core type aliases, basic geometric/color types and opaque handles.
 */

namespace brush {

using i32 = int32_t;   ///< Signed 32-bit integer.
using u32 = uint32_t;  ///< Unsigned 32-bit integer.
using u64 = uint64_t;  ///< Unsigned 64-bit integer.
using u16 = uint16_t;  ///< Unsigned 16-bit integer.
using u8 = uint8_t;    ///< Unsigned 8-bit integer.
using f32 = float;     ///< 32-bit floating point.
using f64 = double;    ///< 64-bit floating point.

/// @brief A 2D point with floating-point coordinates.
struct Point {
    f32 x = 0;  ///< X coordinate.
    f32 y = 0;  ///< Y coordinate.
};

/// @brief An RGBA color with floating-point components, nominally in [0, 1].
struct Color {
    f32 r = 0;  ///< Red component.
    f32 g = 0;  ///< Green component.
    f32 b = 0;  ///< Blue component.
    f32 a = 1;  ///< Alpha component, default opaque.

    /// @brief Build a color from 8-bit components.
    static Color rgba8(u8 r, u8 g, u8 b, u8 a = 255) {
        return {r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f};
    }

    static Color white() { return {1, 1, 1, 1}; }
    static Color black() { return {0, 0, 0, 1}; }
    static Color transparent() { return {0, 0, 0, 0}; }

    /// @brief True if the color is not fully opaque.
    bool isTransparent() const { return a < 1.0f; }

    bool operator==(const Color& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

/// @brief Pixel buffers hold colors in linear (not display/gamma) space.
using LinearColor = Color;

/// @brief Opaque, typed 64-bit handle. Zero is never a valid handle.
template <typename Tag>
struct Handle {
    u64 value = 0;

    bool valid() const { return value != 0; }

    bool operator==(const Handle& o) const { return value == o.value; }
    bool operator!=(const Handle& o) const { return value != o.value; }
    bool operator<(const Handle& o) const { return value < o.value; }
};

struct CanvasTag;
struct ImageTag;
struct GeometryTag;
struct LayoutTag;
struct AttributeTag;
struct MaterialTag;
struct TextureTag;
struct BufferTag;
struct MeshTag;
struct EntityTag;

using CanvasId = Handle<CanvasTag>;        ///< A canvas owned by a Context.
using ImageId = Handle<ImageTag>;          ///< An image owned by an ImageStore.
using GeometryId = Handle<GeometryTag>;    ///< A retained mesh owned by a GeometryStore.
using LayoutId = Handle<LayoutTag>;        ///< A vertex layout.
using AttributeId = Handle<AttributeTag>;  ///< A vertex attribute description.
using MaterialId = Handle<MaterialTag>;    ///< A device material.
using TextureId = Handle<TextureTag>;      ///< A device texture.
using BufferId = Handle<BufferTag>;        ///< A device readback buffer.
using MeshId = Handle<MeshTag>;            ///< A device mesh.
using EntityId = Handle<EntityTag>;        ///< A spawned drawable.

}
