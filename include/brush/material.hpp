#pragma once

/**
 * @file material.hpp
 * @brief Material descriptors, named material properties and the batch material key.
 */

#include "brush/error.hpp"
#include "brush/types.hpp"
#include <array>
#include <string>

namespace brush {

/// @brief How a material's alpha channel is applied. Values match the public API.
enum class AlphaMode : u8 {
    Opaque = 0,
    Mask = 1,           ///< Alpha test against MaterialDesc::alphaCutoff.
    Blend = 2,
    Premultiplied = 3,
    Add = 4,
    Multiply = 5
};

/// @brief Everything a render device needs to create a material.
struct MaterialDesc {
    bool unlit = false;
    Color baseColor = Color::white();
    f32 roughness = 0.5f;
    f32 metallic = 0.0f;
    f32 reflectance = 0.5f;
    Color emissive = Color::black();
    AlphaMode alphaMode = AlphaMode::Opaque;
    f32 alphaCutoff = 0.5f;
    bool doubleSided = false;
    TextureId baseColorTexture;   ///< Optional, sampled by uv and multiplied in.

    bool operator==(const MaterialDesc& o) const {
        return unlit == o.unlit && baseColor == o.baseColor && roughness == o.roughness &&
               metallic == o.metallic && reflectance == o.reflectance &&
               emissive == o.emissive && alphaMode == o.alphaMode &&
               alphaCutoff == o.alphaCutoff && doubleSided == o.doubleSided &&
               baseColorTexture == o.baseColorTexture;
    }
    bool operator!=(const MaterialDesc& o) const { return !(*this == o); }
};

/// @brief A typed value assigned to a named material property.
struct MaterialValue {
    enum class Type : u8 { Float, Float2, Float3, Float4, Int, UInt };

    Type type = Type::Float;
    std::array<f32, 4> f{};   ///< Float..Float4 components.
    i32 i = 0;                ///< Int payload.
    u32 u = 0;                ///< UInt payload.

    static MaterialValue Float(f32 x) { MaterialValue v; v.type = Type::Float; v.f = {x, 0, 0, 0}; return v; }
    static MaterialValue Float2(f32 x, f32 y) { MaterialValue v; v.type = Type::Float2; v.f = {x, y, 0, 0}; return v; }
    static MaterialValue Float3(f32 x, f32 y, f32 z) { MaterialValue v; v.type = Type::Float3; v.f = {x, y, z, 0}; return v; }
    static MaterialValue Float4(f32 x, f32 y, f32 z, f32 w) { MaterialValue v; v.type = Type::Float4; v.f = {x, y, z, w}; return v; }
    static MaterialValue Int(i32 x) { MaterialValue v; v.type = Type::Int; v.i = x; return v; }
    static MaterialValue UInt(u32 x) { MaterialValue v; v.type = Type::UInt; v.u = x; return v; }

    const char* typeName() const;

    bool operator==(const MaterialValue& o) const {
        return type == o.type && f == o.f && i == o.i && u == o.u;
    }
};

/// @brief Assign a named property on a PBR material descriptor.
///
/// Names: base_color / color (Float4), metallic, roughness /
/// perceptual_roughness, reflectance, unlit, double_sided (Float),
/// emissive (Float4), alpha_mode (Int 0..5).
/// @return InvalidArgument for a wrong value type or out-of-range alpha
///         mode, UnknownMaterialProperty for an unknown name. desc is left
///         untouched on failure.
Result<void> setMaterialProperty(MaterialDesc& desc, const std::string& name,
                                 const MaterialValue& value);

/// @brief Quantize a [0, 1] value to 8 bits.
u8 quantizeUnit(f32 v);

/// @brief Describes what a batch would be rendered with, before any device material exists.
///
/// Two keys are equal iff their kind and that kind's fields match. A Color
/// key carries the paint color it was derived from, so shapes painted with
/// different colors never share a batch.
struct MaterialKey {
    enum class Kind : u8 { Color, Pbr, Custom };

    Kind kind = Kind::Color;

    // Color
    bool transparent = false;
    ImageId backgroundImage;
    Color paint = Color::white();

    // Pbr
    std::array<u8, 4> albedo{{255, 255, 255, 255}};
    u8 roughness = 128;
    u8 metallic = 0;
    std::array<u8, 4> emissive{{0, 0, 0, 255}};

    // Custom
    MaterialId material;

    /// @brief Unlit key for a paint color; transparent is derived from its alpha.
    static MaterialKey MakeColor(const Color& paint, ImageId backgroundImage = {});
    /// @brief PBR key with albedo white, roughness 0.5, metallic 0, emissive black.
    static MaterialKey MakePbr();
    static MaterialKey MakeCustom(MaterialId material);

    /// @brief Same key with the paint color dropped, for sharing device materials.
    MaterialKey appearance() const;

    /// @brief Device material descriptor for Color and Pbr keys.
    /// @param baseColorTexture Texture of backgroundImage, if any.
    MaterialDesc toDesc(TextureId baseColorTexture = {}) const;

    /// @brief Debug string, e.g. "Color{transparent=0, image=0}".
    std::string describe() const;

    bool operator==(const MaterialKey& o) const;
    bool operator!=(const MaterialKey& o) const { return !(*this == o); }
    bool operator<(const MaterialKey& o) const;
};

} // namespace brush
