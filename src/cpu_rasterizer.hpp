#pragma once

#include "brush/material.hpp"
#include "brush/math.hpp"
#include "brush/mesh.hpp"
#include "brush/pixmap.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace brush {

// Rasterizes one mesh at a time into a Pixmap. Positions are transformed
// into canvas pixel space (y down); pixel centres sit at +0.5. Within one
// mesh a depth buffer keeps the fragment nearest the viewer (larger z);
// ties go to the later primitive. No lighting model: lit materials add
// their emissive color to the unlit result.
class CpuRasterizer {
public:
    explicit CpuRasterizer(Pixmap* target) : target_(target) {}

    void draw(const MeshData& mesh, const MaterialDesc& material, const Pixmap* texture,
              const Affine3& transform) {
        if (!target_ || !target_->valid() || mesh.empty()) return;

        material_ = &material;
        texture_ = (texture && texture->valid()) ? texture : nullptr;
        mesh_ = &mesh;

        screen_.clear();
        screen_.reserve(mesh.positions.size());
        for (const auto& p : mesh.positions) {
            screen_.push_back(transform.transformPoint(p));
        }
        depth_.assign(size_t(target_->width()) * target_->height(),
                      -std::numeric_limits<f32>::infinity());

        std::vector<u32> order;
        if (mesh.indices.empty()) {
            order.resize(mesh.positions.size());
            for (u32 i = 0; i < order.size(); ++i) order[i] = i;
        } else {
            order = mesh.indices;
        }

        switch (mesh.topology) {
            case Topology::TriangleList:
                for (size_t i = 0; i + 2 < order.size(); i += 3) {
                    drawTriangle(order[i], order[i + 1], order[i + 2]);
                }
                break;
            case Topology::TriangleStrip:
                for (size_t i = 0; i + 2 < order.size(); ++i) {
                    drawTriangle(order[i], order[i + 1], order[i + 2]);
                }
                break;
            case Topology::LineList:
                for (size_t i = 0; i + 1 < order.size(); i += 2) {
                    drawLine(order[i], order[i + 1]);
                }
                break;
            case Topology::LineStrip:
                for (size_t i = 0; i + 1 < order.size(); ++i) {
                    drawLine(order[i], order[i + 1]);
                }
                break;
            case Topology::PointList:
                for (u32 idx : order) {
                    const Vec3& p = screen_[idx];
                    if (!insideTarget(p.x, p.y)) continue;
                    shadePixel(i32(std::floor(p.x)), i32(std::floor(p.y)), p.z,
                               vertexColor(idx), vertexUv(idx));
                }
                break;
        }
    }

private:
    Pixmap* target_ = nullptr;
    const MaterialDesc* material_ = nullptr;
    const Pixmap* texture_ = nullptr;
    const MeshData* mesh_ = nullptr;
    std::vector<Vec3> screen_;
    std::vector<f32> depth_;

    Color vertexColor(u32 i) const {
        return i < mesh_->colors.size() ? mesh_->colors[i] : Color::white();
    }

    Vec2 vertexUv(u32 i) const {
        return i < mesh_->uvs.size() ? mesh_->uvs[i] : Vec2{};
    }

    static bool finite(const Vec3& v) {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    // False for NaN as well as for points off the target.
    bool insideTarget(f32 x, f32 y) const {
        return x >= 0.0f && y >= 0.0f && x < f32(target_->width()) && y < f32(target_->height());
    }

    // Clamp in float before converting so out-of-range coordinates never
    // reach the i32 cast.
    static i32 clampToPixel(f32 v, i32 hi) {
        if (!(v > 0.0f)) return 0;
        if (v >= f32(hi)) return hi;
        return i32(v);
    }

    // Liang-Barsky clip of the segment a-b against [0, w) x [0, h).
    bool clipSegment(Vec3& a, Vec3& b) const {
        f32 w = f32(target_->width()), h = f32(target_->height());
        f32 dx = b.x - a.x, dy = b.y - a.y;
        f32 t0 = 0.0f, t1 = 1.0f;
        const f32 p[4] = {-dx, dx, -dy, dy};
        const f32 q[4] = {a.x, w - a.x, a.y, h - a.y};
        for (int i = 0; i < 4; ++i) {
            if (p[i] == 0.0f) {
                if (q[i] < 0.0f) return false;
                continue;
            }
            f32 r = q[i] / p[i];
            if (p[i] < 0.0f) {
                if (r > t1) return false;
                t0 = std::max(t0, r);
            } else {
                if (r < t0) return false;
                t1 = std::min(t1, r);
            }
        }
        Vec3 start = a;
        a = {start.x + t0 * dx, start.y + t0 * dy, start.z};
        b = {start.x + t1 * dx, start.y + t1 * dy, b.z};
        return true;
    }

    static f32 edge(const Vec3& a, const Vec3& b, f32 px, f32 py) {
        return (b.x - a.x) * (py - a.y) - (b.y - a.y) * (px - a.x);
    }

    // Edges are oriented so the interior is on the positive side; a pixel
    // centre exactly on an edge belongs to the triangle only for top and
    // left edges.
    static bool isTopLeft(const Vec3& a, const Vec3& b) {
        f32 dx = b.x - a.x, dy = b.y - a.y;
        return (dy == 0 && dx > 0) || dy < 0;
    }

    void drawTriangle(u32 i0, u32 i1, u32 i2) {
        Vec3 v0 = screen_[i0], v1 = screen_[i1], v2 = screen_[i2];
        if (!finite(v0) || !finite(v1) || !finite(v2)) return;
        f32 area = edge(v0, v1, v2.x, v2.y);
        if (area == 0 || !std::isfinite(area)) return;
        if (area < 0) {
            std::swap(v1, v2);
            std::swap(i1, i2);
            area = -area;
        }

        i32 w = target_->width(), h = target_->height();
        f32 minX = std::min({v0.x, v1.x, v2.x}), maxX = std::max({v0.x, v1.x, v2.x});
        f32 minY = std::min({v0.y, v1.y, v2.y}), maxY = std::max({v0.y, v1.y, v2.y});
        if (maxX < 0.0f || maxY < 0.0f || minX >= f32(w) || minY >= f32(h)) return;
        i32 x0 = clampToPixel(std::floor(minX), w - 1);
        i32 y0 = clampToPixel(std::floor(minY), h - 1);
        i32 x1 = clampToPixel(std::ceil(maxX), w - 1);
        i32 y1 = clampToPixel(std::ceil(maxY), h - 1);

        bool tl0 = isTopLeft(v1, v2), tl1 = isTopLeft(v2, v0), tl2 = isTopLeft(v0, v1);
        Color c0 = vertexColor(i0), c1 = vertexColor(i1), c2 = vertexColor(i2);
        Vec2 t0 = vertexUv(i0), t1 = vertexUv(i1), t2 = vertexUv(i2);

        for (i32 y = y0; y <= y1; ++y) {
            f32 py = y + 0.5f;
            for (i32 x = x0; x <= x1; ++x) {
                f32 px = x + 0.5f;
                f32 e0 = edge(v1, v2, px, py);
                f32 e1 = edge(v2, v0, px, py);
                f32 e2 = edge(v0, v1, px, py);
                if (e0 < 0 || e1 < 0 || e2 < 0) continue;
                if ((e0 == 0 && !tl0) || (e1 == 0 && !tl1) || (e2 == 0 && !tl2)) continue;

                f32 l0 = e0 / area, l1 = e1 / area, l2 = e2 / area;
                Color c{c0.r * l0 + c1.r * l1 + c2.r * l2,
                        c0.g * l0 + c1.g * l1 + c2.g * l2,
                        c0.b * l0 + c1.b * l1 + c2.b * l2,
                        c0.a * l0 + c1.a * l1 + c2.a * l2};
                Vec2 uv{t0.x * l0 + t1.x * l1 + t2.x * l2, t0.y * l0 + t1.y * l1 + t2.y * l2};
                f32 z = v0.z * l0 + v1.z * l1 + v2.z * l2;
                shadePixel(x, y, z, c, uv);
            }
        }
    }

    void drawLine(u32 ia, u32 ib) {
        Vec3 a = screen_[ia], b = screen_[ib];
        if (!finite(a) || !finite(b) || !clipSegment(a, b)) return;
        i32 w = target_->width(), h = target_->height();
        i32 x0 = clampToPixel(std::floor(a.x), w - 1), y0 = clampToPixel(std::floor(a.y), h - 1);
        i32 x1 = clampToPixel(std::floor(b.x), w - 1), y1 = clampToPixel(std::floor(b.y), h - 1);
        Color c = vertexColor(ia);
        Vec2 uv = vertexUv(ia);
        f32 z = screen_[ia].z;

        i32 dx = std::abs(x1 - x0), dy = std::abs(y1 - y0);
        i32 sx = x0 < x1 ? 1 : -1, sy = y0 < y1 ? 1 : -1;
        i32 err = dx - dy;

        while (true) {
            shadePixel(x0, y0, z, c, uv);
            if (x0 == x1 && y0 == y1) break;
            i32 e2 = 2 * err;
            if (e2 > -dy) { err -= dy; x0 += sx; }
            if (e2 < dx) { err += dx; y0 += sy; }
        }
    }

    void shadePixel(i32 x, i32 y, f32 z, Color c, Vec2 uv) {
        if (x < 0 || y < 0 || x >= target_->width() || y >= target_->height()) return;

        f32& stored = depth_[size_t(y) * target_->width() + x];
        if (z < stored) return;

        const Color& base = material_->baseColor;
        c = {c.r * base.r, c.g * base.g, c.b * base.b, c.a * base.a};
        if (texture_) {
            i32 tx = std::clamp(i32(std::floor(uv.x * texture_->width())), 0, texture_->width() - 1);
            i32 ty = std::clamp(i32(std::floor(uv.y * texture_->height())), 0, texture_->height() - 1);
            Color t = texture_->readPixel(tx, ty);
            c = {c.r * t.r, c.g * t.g, c.b * t.b, c.a * t.a};
        }
        if (!material_->unlit) {
            c.r += material_->emissive.r;
            c.g += material_->emissive.g;
            c.b += material_->emissive.b;
        }

        Color dst = target_->readPixel(x, y);
        Color out;
        f32 a = c.a;
        switch (material_->alphaMode) {
            case AlphaMode::Opaque:
                out = {c.r, c.g, c.b, 1.0f};
                break;
            case AlphaMode::Mask:
                if (a < material_->alphaCutoff) return;
                out = {c.r, c.g, c.b, 1.0f};
                break;
            case AlphaMode::Blend:
                out = {c.r * a + dst.r * (1 - a), c.g * a + dst.g * (1 - a),
                       c.b * a + dst.b * (1 - a), a + dst.a * (1 - a)};
                break;
            case AlphaMode::Premultiplied:
                out = {c.r + dst.r * (1 - a), c.g + dst.g * (1 - a),
                       c.b + dst.b * (1 - a), a + dst.a * (1 - a)};
                break;
            case AlphaMode::Add:
                out = {dst.r + c.r * a, dst.g + c.g * a, dst.b + c.b * a, dst.a};
                break;
            case AlphaMode::Multiply:
                out = {dst.r * c.r, dst.g * c.g, dst.b * c.b, dst.a};
                break;
        }

        stored = z;
        target_->writePixel(x, y, out);
    }
};

} // namespace brush
