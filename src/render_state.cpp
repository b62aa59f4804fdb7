#include "brush/render_state.hpp"

namespace brush {

void RenderState::reset() {
    fill_ = Color::white();
    stroke_ = Color::black();
    strokeWeight_ = 1.0f;
    material_ = MaterialKey::MakeColor(Color::white());
    transform_.clear();
}

Result<void> RenderState::setMaterialProperty(const std::string& name,
                                              const MaterialValue& value) {
    using T = MaterialValue::Type;
    MaterialKey key = material_.kind == MaterialKey::Kind::Pbr ? material_ : MaterialKey::MakePbr();

    auto wrongType = [&](const char* expected) {
        return Error{ErrorCode::InvalidArgument,
                     "'" + name + "' expects " + expected + ", got " + value.typeName()};
    };

    if (name == "albedo" || name == "base_color" || name == "color") {
        if (value.type != T::Float4) return wrongType("Float4");
        for (int i = 0; i < 4; ++i) key.albedo[i] = quantizeUnit(value.f[i]);
    } else if (name == "emissive") {
        if (value.type != T::Float4) return wrongType("Float4");
        for (int i = 0; i < 4; ++i) key.emissive[i] = quantizeUnit(value.f[i]);
    } else if (name == "roughness" || name == "perceptual_roughness") {
        if (value.type != T::Float) return wrongType("Float");
        key.roughness = quantizeUnit(value.f[0]);
    } else if (name == "metallic") {
        if (value.type != T::Float) return wrongType("Float");
        key.metallic = quantizeUnit(value.f[0]);
    } else {
        return Error{ErrorCode::UnknownMaterialProperty, name};
    }

    material_ = key;
    return {};
}

std::optional<MaterialKey> RenderState::passKey(const std::optional<Color>& paint) const {
    if (!paint) return std::nullopt;
    if (material_.kind == MaterialKey::Kind::Color) {
        return MaterialKey::MakeColor(*paint, material_.backgroundImage);
    }
    return material_;
}

} // namespace brush
