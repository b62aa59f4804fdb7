#include "brush/material.hpp"

#include <cmath>
#include <tuple>

namespace brush {

namespace {

bool expect(const std::string& name, const MaterialValue& value, MaterialValue::Type type,
            const char* typeName, Error& err) {
    if (value.type == type) return true;
    err = Error{ErrorCode::InvalidArgument,
                "'" + name + "' expects " + typeName + ", got " + value.typeName()};
    return false;
}

Color colorOf(const MaterialValue& v) {
    return {v.f[0], v.f[1], v.f[2], v.f[3]};
}

Color colorOf(const std::array<u8, 4>& c) {
    return Color::rgba8(c[0], c[1], c[2], c[3]);
}

auto paintTuple(const Color& c) {
    return std::make_tuple(c.r, c.g, c.b, c.a);
}

}

const char* MaterialValue::typeName() const {
    switch (type) {
        case Type::Float:  return "Float";
        case Type::Float2: return "Float2";
        case Type::Float3: return "Float3";
        case Type::Float4: return "Float4";
        case Type::Int:    return "Int";
        case Type::UInt:   return "UInt";
    }
    return "Unknown";
}

u8 quantizeUnit(f32 v) {
    if (!(v > 0.0f)) return 0;
    if (v >= 1.0f) return 255;
    return static_cast<u8>(std::lround(v * 255.0f));
}

Result<void> setMaterialProperty(MaterialDesc& desc, const std::string& name,
                                 const MaterialValue& value) {
    using T = MaterialValue::Type;
    Error err;

    if (name == "base_color" || name == "color") {
        if (!expect(name, value, T::Float4, "Float4", err)) return err;
        desc.baseColor = colorOf(value);
    } else if (name == "metallic") {
        if (!expect(name, value, T::Float, "Float", err)) return err;
        desc.metallic = value.f[0];
    } else if (name == "roughness" || name == "perceptual_roughness") {
        if (!expect(name, value, T::Float, "Float", err)) return err;
        desc.roughness = value.f[0];
    } else if (name == "reflectance") {
        if (!expect(name, value, T::Float, "Float", err)) return err;
        desc.reflectance = value.f[0];
    } else if (name == "unlit") {
        if (!expect(name, value, T::Float, "Float", err)) return err;
        desc.unlit = value.f[0] > 0.5f;
    } else if (name == "double_sided") {
        if (!expect(name, value, T::Float, "Float", err)) return err;
        desc.doubleSided = value.f[0] > 0.5f;
    } else if (name == "emissive") {
        if (!expect(name, value, T::Float4, "Float4", err)) return err;
        desc.emissive = colorOf(value);
    } else if (name == "alpha_mode") {
        if (!expect(name, value, T::Int, "Int", err)) return err;
        switch (value.i) {
            case 0: desc.alphaMode = AlphaMode::Opaque; break;
            case 1: desc.alphaMode = AlphaMode::Mask; desc.alphaCutoff = 0.5f; break;
            case 2: desc.alphaMode = AlphaMode::Blend; break;
            case 3: desc.alphaMode = AlphaMode::Premultiplied; break;
            case 4: desc.alphaMode = AlphaMode::Add; break;
            case 5: desc.alphaMode = AlphaMode::Multiply; break;
            default:
                return Error{ErrorCode::InvalidArgument,
                             "'alpha_mode' must be 0..5, got " + std::to_string(value.i)};
        }
    } else {
        return Error{ErrorCode::UnknownMaterialProperty, name};
    }
    return {};
}

// --- MaterialKey ---

MaterialKey MaterialKey::MakeColor(const Color& paint, ImageId backgroundImage) {
    MaterialKey key;
    key.kind = Kind::Color;
    key.transparent = paint.isTransparent();
    key.backgroundImage = backgroundImage;
    key.paint = paint;
    return key;
}

MaterialKey MaterialKey::MakePbr() {
    MaterialKey key;
    key.kind = Kind::Pbr;
    return key;
}

MaterialKey MaterialKey::MakeCustom(MaterialId material) {
    MaterialKey key;
    key.kind = Kind::Custom;
    key.material = material;
    return key;
}

MaterialKey MaterialKey::appearance() const {
    MaterialKey key = *this;
    key.paint = Color::white();
    return key;
}

MaterialDesc MaterialKey::toDesc(TextureId baseColorTexture) const {
    MaterialDesc desc;
    if (kind == Kind::Color) {
        desc.unlit = true;
        desc.baseColor = Color::white();
        desc.alphaMode = transparent ? AlphaMode::Blend : AlphaMode::Opaque;
        desc.baseColorTexture = baseColorTexture;
        desc.doubleSided = true;
    } else if (kind == Kind::Pbr) {
        desc.unlit = false;
        desc.baseColor = colorOf(albedo);
        desc.roughness = roughness / 255.0f;
        desc.metallic = metallic / 255.0f;
        desc.emissive = colorOf(emissive);
        desc.alphaMode = albedo[3] < 255 ? AlphaMode::Blend : AlphaMode::Opaque;
    }
    return desc;
}

std::string MaterialKey::describe() const {
    switch (kind) {
        case Kind::Color:
            return "Color{transparent=" + std::to_string(transparent ? 1 : 0) +
                   ", image=" + std::to_string(backgroundImage.value) + "}";
        case Kind::Pbr:
            return "Pbr{albedo=" + std::to_string(albedo[0]) + "," + std::to_string(albedo[1]) +
                   "," + std::to_string(albedo[2]) + "," + std::to_string(albedo[3]) +
                   ", roughness=" + std::to_string(roughness) +
                   ", metallic=" + std::to_string(metallic) + "}";
        case Kind::Custom:
            return "Custom{" + std::to_string(material.value) + "}";
    }
    return "Unknown";
}

bool MaterialKey::operator==(const MaterialKey& o) const {
    if (kind != o.kind) return false;
    switch (kind) {
        case Kind::Color:
            return transparent == o.transparent && backgroundImage == o.backgroundImage &&
                   paint == o.paint;
        case Kind::Pbr:
            return albedo == o.albedo && roughness == o.roughness && metallic == o.metallic &&
                   emissive == o.emissive;
        case Kind::Custom:
            return material == o.material;
    }
    return false;
}

bool MaterialKey::operator<(const MaterialKey& o) const {
    if (kind != o.kind) return kind < o.kind;
    switch (kind) {
        case Kind::Color:
            return std::make_tuple(transparent, backgroundImage.value, paintTuple(paint)) <
                   std::make_tuple(o.transparent, o.backgroundImage.value, paintTuple(o.paint));
        case Kind::Pbr:
            return std::tie(albedo, roughness, metallic, emissive) <
                   std::tie(o.albedo, o.roughness, o.metallic, o.emissive);
        case Kind::Custom:
            return material < o.material;
    }
    return false;
}

} // namespace brush
