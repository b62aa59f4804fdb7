#include "brush/tessellation.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace brush {

namespace {

constexpr f32 kPi = 3.14159265358979323846f;
constexpr u32 kMaxCornerSegments = 16;

struct RectBounds {
    f32 x, y, w, h;
};

// Corner arcs in y-down screen space, walked clockwise starting at the
// top-left corner.
constexpr f32 kCornerStartAngle[4] = {kPi, 1.5f * kPi, 0.0f, 0.5f * kPi};

void appendContour(std::vector<Point>& out, const RectBounds& r, const CornerRadii& radii,
                   const std::array<u32, 4>& segments) {
    const Point corners[4] = {
        {r.x, r.y}, {r.x + r.w, r.y}, {r.x + r.w, r.y + r.h}, {r.x, r.y + r.h}};
    const Point inward[4] = {{1, 1}, {-1, 1}, {-1, -1}, {1, -1}};

    for (int c = 0; c < 4; ++c) {
        f32 rad = radii[c];
        if (segments[c] == 0) {
            out.push_back(corners[c]);
            continue;
        }
        Point center{corners[c].x + inward[c].x * rad, corners[c].y + inward[c].y * rad};
        for (u32 i = 0; i <= segments[c]; ++i) {
            f32 a = kCornerStartAngle[c] + 0.5f * kPi * f32(i) / f32(segments[c]);
            out.push_back({center.x + rad * std::cos(a), center.y + rad * std::sin(a)});
        }
    }
}

void appendVertex(MeshData& mesh, Point p, const RectBounds& uvFrame, const Color& color) {
    mesh.positions.push_back({p.x, p.y, 0});
    mesh.normals.push_back({0, 0, 1});
    mesh.colors.push_back(color);
    f32 u = uvFrame.w > 0 ? (p.x - uvFrame.x) / uvFrame.w : 0.0f;
    f32 v = uvFrame.h > 0 ? (p.y - uvFrame.y) / uvFrame.h : 0.0f;
    mesh.uvs.push_back({u, v});
}

void fillContour(MeshData& mesh, const RectBounds& r, const CornerRadii& radii,
                 const std::array<u32, 4>& segments, const RectBounds& uvFrame,
                 const Color& color) {
    if (r.w <= 0 || r.h <= 0) return;

    std::vector<Point> contour;
    appendContour(contour, r, radii, segments);
    u32 base = static_cast<u32>(mesh.positions.size());

    if (contour.size() == 4) {
        for (const auto& p : contour) appendVertex(mesh, p, uvFrame, color);
        const u32 quad[6] = {0, 1, 2, 0, 2, 3};
        for (u32 i : quad) mesh.indices.push_back(base + i);
        return;
    }

    appendVertex(mesh, {r.x + r.w * 0.5f, r.y + r.h * 0.5f}, uvFrame, color);
    for (const auto& p : contour) appendVertex(mesh, p, uvFrame, color);
    u32 n = static_cast<u32>(contour.size());
    for (u32 i = 0; i < n; ++i) {
        mesh.indices.push_back(base);
        mesh.indices.push_back(base + 1 + i);
        mesh.indices.push_back(base + 1 + (i + 1) % n);
    }
}

}

CornerRadii clampCornerRadii(f32 w, f32 h, const CornerRadii& radii) {
    f32 limit = std::max(0.0f, std::min(std::fabs(w), std::fabs(h)) * 0.5f);
    CornerRadii out{};
    for (int i = 0; i < 4; ++i) {
        f32 r = radii[i];
        out[i] = (r > 0.0f) ? std::min(r, limit) : 0.0f;
    }
    return out;
}

u32 cornerSegments(f32 radius) {
    if (!(radius > 0.0f)) return 0;
    u32 n = static_cast<u32>(std::ceil(radius * 0.5f));
    return std::clamp(n, 2u, kMaxCornerSegments);
}

void tessellateRect(MeshData& mesh, f32 x, f32 y, f32 w, f32 h, const CornerRadii& radii,
                    const Color& color, ShapeMode mode) {
    if (w < 0) { x += w; w = -w; }
    if (h < 0) { y += h; h = -h; }

    RectBounds bounds{x, y, w, h};
    CornerRadii clamped = clampCornerRadii(w, h, radii);
    std::array<u32, 4> segments{};
    for (int i = 0; i < 4; ++i) segments[i] = cornerSegments(clamped[i]);

    if (mode.kind == ShapeMode::Kind::Fill) {
        fillContour(mesh, bounds, clamped, segments, bounds, color);
        return;
    }

    if (!(mode.weight > 0.0f)) return;
    f32 half = mode.weight * 0.5f;
    RectBounds outer{x - half, y - half, w + mode.weight, h + mode.weight};
    RectBounds inner{x + half, y + half, w - mode.weight, h - mode.weight};

    if (inner.w <= 0 || inner.h <= 0) {
        fillContour(mesh, outer, clamped, segments, bounds, color);
        return;
    }

    // Both contours use the same radii and segment counts so their points
    // pair up one to one; an inner radius that no longer fits collapses.
    CornerRadii innerRadii = clampCornerRadii(inner.w, inner.h, clamped);
    std::vector<Point> outerPts;
    std::vector<Point> innerPts;
    appendContour(outerPts, outer, clamped, segments);
    appendContour(innerPts, inner, innerRadii, segments);

    u32 base = static_cast<u32>(mesh.positions.size());
    u32 n = static_cast<u32>(outerPts.size());
    for (const auto& p : outerPts) appendVertex(mesh, p, bounds, color);
    for (const auto& p : innerPts) appendVertex(mesh, p, bounds, color);

    for (u32 i = 0; i < n; ++i) {
        u32 j = (i + 1) % n;
        u32 o0 = base + i, o1 = base + j;
        u32 i0 = base + n + i, i1 = base + n + j;
        mesh.indices.push_back(o0);
        mesh.indices.push_back(o1);
        mesh.indices.push_back(i1);
        mesh.indices.push_back(o0);
        mesh.indices.push_back(i1);
        mesh.indices.push_back(i0);
    }
}

MeshData boxMesh(f32 width, f32 height, f32 depth, const Color& color) {
    f32 x = width * 0.5f, y = height * 0.5f, z = depth * 0.5f;

    struct Face {
        Vec3 p[4];
        Vec3 n;
        Vec2 uv[4];
    };
    const Face faces[6] = {
        // front
        {{{-x, -y, z}, {x, -y, z}, {x, y, z}, {-x, y, z}}, {0, 0, 1},
         {{0, 0}, {1, 0}, {1, 1}, {0, 1}}},
        // back
        {{{-x, y, -z}, {x, y, -z}, {x, -y, -z}, {-x, -y, -z}}, {0, 0, -1},
         {{1, 0}, {0, 0}, {0, 1}, {1, 1}}},
        // right
        {{{x, -y, -z}, {x, y, -z}, {x, y, z}, {x, -y, z}}, {1, 0, 0},
         {{0, 0}, {1, 0}, {1, 1}, {0, 1}}},
        // left
        {{{-x, -y, z}, {-x, y, z}, {-x, y, -z}, {-x, -y, -z}}, {-1, 0, 0},
         {{1, 0}, {0, 0}, {0, 1}, {1, 1}}},
        // top
        {{{x, y, -z}, {-x, y, -z}, {-x, y, z}, {x, y, z}}, {0, 1, 0},
         {{1, 0}, {0, 0}, {0, 1}, {1, 1}}},
        // bottom
        {{{x, -y, z}, {-x, -y, z}, {-x, -y, -z}, {x, -y, -z}}, {0, -1, 0},
         {{0, 0}, {1, 0}, {1, 1}, {0, 1}}},
    };

    MeshData mesh;
    mesh.topology = Topology::TriangleList;
    for (u32 f = 0; f < 6; ++f) {
        for (int v = 0; v < 4; ++v) {
            mesh.positions.push_back(faces[f].p[v]);
            mesh.normals.push_back(faces[f].n);
            mesh.colors.push_back(color);
            mesh.uvs.push_back(faces[f].uv[v]);
        }
        const u32 quad[6] = {0, 1, 2, 2, 3, 0};
        for (u32 i : quad) mesh.indices.push_back(f * 4 + i);
    }
    return mesh;
}

Result<MeshData> sphereMesh(f32 radius, u32 sectors, u32 stacks, const Color& color) {
    if (sectors < 3 || stacks < 2 || !(radius >= 0.0f)) {
        return Error{ErrorCode::InvalidArgument,
                     "sphere needs sectors >= 3, stacks >= 2 and radius >= 0 (got sectors " +
                     std::to_string(sectors) + ", stacks " + std::to_string(stacks) + ")"};
    }
    u64 vertexCount = (u64(sectors) + 1) * (u64(stacks) + 1);
    if (vertexCount > kMaxSphereVertices) {
        return Error{ErrorCode::InvalidArgument,
                     "sphere with sectors " + std::to_string(sectors) + " and stacks " +
                     std::to_string(stacks) + " exceeds " +
                     std::to_string(kMaxSphereVertices) + " vertices"};
    }

    MeshData mesh;
    mesh.topology = Topology::TriangleList;
    f32 sectorStep = 2.0f * kPi / f32(sectors);
    f32 stackStep = kPi / f32(stacks);
    f32 invRadius = radius > 0.0f ? 1.0f / radius : 0.0f;

    for (u32 i = 0; i <= stacks; ++i) {
        f32 stackAngle = 0.5f * kPi - f32(i) * stackStep;
        f32 xy = radius * std::cos(stackAngle);
        f32 z = radius * std::sin(stackAngle);
        for (u32 j = 0; j <= sectors; ++j) {
            f32 sectorAngle = f32(j) * sectorStep;
            Vec3 p{xy * std::cos(sectorAngle), xy * std::sin(sectorAngle), z};
            mesh.positions.push_back(p);
            mesh.normals.push_back(p * invRadius);
            mesh.colors.push_back(color);
            mesh.uvs.push_back({f32(j) / f32(sectors), f32(i) / f32(stacks)});
        }
    }

    for (u32 i = 0; i < stacks; ++i) {
        u32 k1 = i * (sectors + 1);
        u32 k2 = k1 + sectors + 1;
        for (u32 j = 0; j < sectors; ++j, ++k1, ++k2) {
            if (i != 0) {
                mesh.indices.push_back(k1);
                mesh.indices.push_back(k2);
                mesh.indices.push_back(k1 + 1);
            }
            if (i != stacks - 1) {
                mesh.indices.push_back(k1 + 1);
                mesh.indices.push_back(k2);
                mesh.indices.push_back(k2 + 1);
            }
        }
    }
    return mesh;
}

} // namespace brush
