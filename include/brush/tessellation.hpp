#pragma once

/**
 * @file tessellation.hpp
 * @brief Vertex/index generation for rounded rectangles, boxes and UV spheres.
 */

#include "brush/error.hpp"
#include "brush/mesh.hpp"
#include "brush/types.hpp"
#include <array>

namespace brush {

/// @brief Corner radii in order top-left, top-right, bottom-right, bottom-left.
using CornerRadii = std::array<f32, 4>;

/// @brief Whether a shape is filled or outlined.
struct ShapeMode {
    enum class Kind : u8 { Fill, Stroke };

    Kind kind = Kind::Fill;
    f32 weight = 0;   ///< Outline width, Stroke only.

    static ShapeMode Fill() { return {Kind::Fill, 0}; }
    static ShapeMode Stroke(f32 weight) { return {Kind::Stroke, weight}; }
};

/// @brief Clamp each radius into [0, min(w, h) / 2]. NaN becomes 0.
CornerRadii clampCornerRadii(f32 w, f32 h, const CornerRadii& radii);

/// @brief Number of arc segments used for a corner of the given radius (0 for a square corner).
u32 cornerSegments(f32 radius);

/// @brief Append an axis-aligned, optionally rounded rectangle as a triangle list.
///
/// Negative sizes are normalized. Fill emits the rectangle interior; Stroke
/// emits a band of the given weight centred on the outline, with the same
/// radii on the outer and inner contours. When the weight swallows the
/// interior the outer contour is filled instead. Every vertex gets normal
/// +Z, the given color and a uv relative to the rectangle.
void tessellateRect(MeshData& mesh, f32 x, f32 y, f32 w, f32 h, const CornerRadii& radii,
                    const Color& color, ShapeMode mode);

/// @brief A box centred on the origin: 24 vertices, 36 indices.
MeshData boxMesh(f32 width, f32 height, f32 depth, const Color& color);

/// @brief Largest vertex count sphereMesh() will build: (sectors + 1) * (stacks + 1).
constexpr u64 kMaxSphereVertices = u64(1) << 20;

/// @brief A UV sphere centred on the origin.
/// @return InvalidArgument unless sectors >= 3, stacks >= 2, radius >= 0 and the
///         vertex count stays within kMaxSphereVertices.
Result<MeshData> sphereMesh(f32 radius, u32 sectors, u32 stacks, const Color& color);

} // namespace brush
