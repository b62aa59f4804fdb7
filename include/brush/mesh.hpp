#pragma once

/**
 * @file mesh.hpp
 * @brief CPU-side vertex/index data handed to a render device.
 */

#include "brush/error.hpp"
#include "brush/math.hpp"
#include "brush/types.hpp"
#include <string>
#include <vector>

namespace brush {

/// @brief Primitive topology. Values match the public geometry API.
enum class Topology : u8 {
    PointList = 0,
    LineList = 1,
    LineStrip = 2,
    TriangleList = 3,
    TriangleStrip = 4
};

/// @brief Per-vertex attribute format (component count of f32).
enum class AttributeFormat : u8 {
    Float = 1,
    Float2 = 2,
    Float3 = 3,
    Float4 = 4
};

/// @brief Number of f32 components in an attribute format.
inline u32 componentCount(AttributeFormat format) { return static_cast<u32>(format); }

/// @brief Return the enumerator name of a topology.
const char* topologyName(Topology topology);

/// @brief A named vertex attribute beyond position/normal/color/uv, stored flat.
struct CustomAttribute {
    std::string name;
    AttributeId id;
    AttributeFormat format = AttributeFormat::Float;
    std::vector<f32> data;   ///< vertexCount * componentCount(format) values.
};

/// @brief Vertex and index data of one mesh.
///
/// positions is authoritative for the vertex count; normals, colors and uvs
/// are either empty or hold one entry per vertex. An empty index list means
/// vertices are consumed in order.
struct MeshData {
    Topology topology = Topology::TriangleList;
    std::vector<Vec3> positions;
    std::vector<Vec3> normals;
    std::vector<Color> colors;
    std::vector<Vec2> uvs;
    std::vector<u32> indices;
    std::vector<CustomAttribute> attributes;

    size_t vertexCount() const { return positions.size(); }
    bool empty() const { return positions.empty(); }

    void clear();

    /// @brief Check attribute lengths and index ranges.
    /// @return InvalidArgument describing the first inconsistency.
    Result<void> validate() const;
};

} // namespace brush
