#pragma once

/**
 * @file render_state.hpp
 * @brief Per-canvas paint and transform state driven by command replay.
 */

#include "brush/error.hpp"
#include "brush/material.hpp"
#include "brush/transform_stack.hpp"
#include "brush/types.hpp"
#include <optional>
#include <string>

namespace brush {

/// @brief Current fill/stroke/weight/material/transform of a canvas.
///
/// A missing fill or stroke color means that pass emits no geometry.
/// Persists across flushes; only reset() (called by beginDraw) restores
/// the defaults: fill white, stroke black, weight 1, an opaque untextured
/// color material and the identity transform.
class RenderState {
public:
    RenderState() { reset(); }

    void reset();

    const std::optional<Color>& fill() const { return fill_; }
    const std::optional<Color>& stroke() const { return stroke_; }
    f32 strokeWeight() const { return strokeWeight_; }
    const MaterialKey& material() const { return material_; }

    void setFill(Color c) { fill_ = c; }
    void clearFill() { fill_.reset(); }
    void setStroke(Color c) { stroke_ = c; }
    void clearStroke() { stroke_.reset(); }
    void setStrokeWeight(f32 weight) { strokeWeight_ = weight; }

    /// @brief Render subsequent shapes with an externally created material.
    void useMaterial(MaterialId material) { material_ = MaterialKey::MakeCustom(material); }
    void setMaterial(const MaterialKey& key) { material_ = key; }

    /// @brief Adjust the immediate PBR material.
    ///
    /// Switches a Color or Custom material to the default Pbr key first.
    /// Accepts albedo / base_color / color and emissive (Float4), roughness /
    /// perceptual_roughness and metallic (Float), each quantized to 8 bits.
    /// @return InvalidArgument for a wrong value type, UnknownMaterialProperty
    ///         otherwise; the state is unchanged on failure.
    Result<void> setMaterialProperty(const std::string& name, const MaterialValue& value);

    TransformStack& transform() { return transform_; }
    const TransformStack& transform() const { return transform_; }

    /// @brief Key for the fill pass of a shape, or nullopt when fill is off.
    std::optional<MaterialKey> fillKey() const { return passKey(fill_); }
    /// @brief Key for the stroke pass of a shape, or nullopt when stroke is off.
    std::optional<MaterialKey> strokeKey() const { return passKey(stroke_); }

private:
    std::optional<MaterialKey> passKey(const std::optional<Color>& paint) const;

    std::optional<Color> fill_;
    std::optional<Color> stroke_;
    f32 strokeWeight_ = 1.0f;
    MaterialKey material_;
    TransformStack transform_;
};

} // namespace brush
