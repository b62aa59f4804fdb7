#include "brush/mesh.hpp"

namespace brush {

const char* topologyName(Topology topology) {
    switch (topology) {
        case Topology::PointList:     return "PointList";
        case Topology::LineList:      return "LineList";
        case Topology::LineStrip:     return "LineStrip";
        case Topology::TriangleList:  return "TriangleList";
        case Topology::TriangleStrip: return "TriangleStrip";
    }
    return "Unknown";
}

void MeshData::clear() {
    positions.clear();
    normals.clear();
    colors.clear();
    uvs.clear();
    indices.clear();
    attributes.clear();
}

Result<void> MeshData::validate() const {
    size_t n = positions.size();
    if (!normals.empty() && normals.size() != n) {
        return Error{ErrorCode::InvalidArgument, "normal count does not match vertex count"};
    }
    if (!colors.empty() && colors.size() != n) {
        return Error{ErrorCode::InvalidArgument, "color count does not match vertex count"};
    }
    if (!uvs.empty() && uvs.size() != n) {
        return Error{ErrorCode::InvalidArgument, "uv count does not match vertex count"};
    }
    for (const auto& attr : attributes) {
        if (attr.data.size() != n * componentCount(attr.format)) {
            return Error{ErrorCode::InvalidArgument,
                         "attribute '" + attr.name + "' does not match vertex count"};
        }
    }
    for (u32 idx : indices) {
        if (idx >= n) {
            return Error{ErrorCode::InvalidArgument,
                         "index " + std::to_string(idx) + " out of range for " +
                         std::to_string(n) + " vertices"};
        }
    }
    return {};
}

} // namespace brush
