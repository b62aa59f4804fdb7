#pragma once

/**
 * @file geometry.hpp
 * @brief Retained meshes built vertex by vertex, with custom vertex attributes and layouts.
 */

#include "brush/error.hpp"
#include "brush/math.hpp"
#include "brush/mesh.hpp"
#include "brush/render_device.hpp"
#include "brush/types.hpp"
#include <array>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace brush {

/// @brief 64-bit FNV-1a hash of an attribute name, used as its stable id.
u64 hashAttributeName(std::string_view name);

/// @brief A value of a vertex attribute (1 to 4 floats).
struct AttributeValue {
    AttributeFormat format = AttributeFormat::Float;
    std::array<f32, 4> v{};

    static AttributeValue Float(f32 x) { return {AttributeFormat::Float, {{x, 0, 0, 0}}}; }
    static AttributeValue Float2(f32 x, f32 y) { return {AttributeFormat::Float2, {{x, y, 0, 0}}}; }
    static AttributeValue Float3(f32 x, f32 y, f32 z) { return {AttributeFormat::Float3, {{x, y, z, 0}}}; }
    static AttributeValue Float4(f32 x, f32 y, f32 z, f32 w) { return {AttributeFormat::Float4, {{x, y, z, w}}}; }

    bool operator==(const AttributeValue& o) const { return format == o.format && v == o.v; }
    bool operator!=(const AttributeValue& o) const { return !(*this == o); }
};

/// @brief A named vertex attribute.
struct VertexAttribute {
    std::string name;
    AttributeFormat format = AttributeFormat::Float;
    bool builtin = false;
};

/**
 * GeometryStore - Owner of retained geometries, vertex attributes and layouts.
 *
 * A geometry copies its layout when created and starts empty; vertex()
 * appends a vertex carrying the current normal/color/uv and custom values
 * of every attribute in that layout (defaults: normal +Z, color white,
 * uv 0,0, custom zero). Positions are always stored. The device mesh is
 * created on the first upload() and refreshed only after a change.
 */
class GeometryStore {
public:
    explicit GeometryStore(RenderDevice& device);
    ~GeometryStore();

    GeometryStore(const GeometryStore&) = delete;
    GeometryStore& operator=(const GeometryStore&) = delete;

    // --- Attributes ---

    AttributeId positionAttribute() const { return position_; }
    AttributeId normalAttribute() const { return normal_; }
    AttributeId colorAttribute() const { return color_; }
    AttributeId uvAttribute() const { return uv_; }

    /// @brief Register a custom attribute. Its id is hashAttributeName(name).
    /// @return InvalidArgument for an empty name or a name already registered
    ///         with another format.
    Result<AttributeId> createAttribute(const std::string& name, AttributeFormat format);
    /// @return AttributeNotFound, or InvalidArgument for a built-in attribute.
    Result<void> destroyAttribute(AttributeId attribute);
    const VertexAttribute* attribute(AttributeId attribute) const;

    // --- Layouts ---

    LayoutId createLayout();
    /// @brief Layout with position, normal, color and uv.
    LayoutId createDefaultLayout();
    Result<void> addPosition(LayoutId layout);
    Result<void> addNormal(LayoutId layout);
    Result<void> addColor(LayoutId layout);
    Result<void> addUv(LayoutId layout);
    Result<void> addAttribute(LayoutId layout, AttributeId attribute);
    Result<std::vector<AttributeId>> layoutAttributes(LayoutId layout) const;
    Result<void> destroyLayout(LayoutId layout);

    // --- Geometries ---

    /// @brief Empty geometry with the default layout.
    GeometryId create(Topology topology = Topology::TriangleList);
    Result<GeometryId> createWithLayout(LayoutId layout, Topology topology = Topology::TriangleList);
    GeometryId createBox(f32 width, f32 height, f32 depth);
    Result<GeometryId> createSphere(f32 radius, u32 sectors, u32 stacks);
    Result<void> destroy(GeometryId geometry);
    bool contains(GeometryId geometry) const;
    size_t size() const { return geometries_.size(); }

    Result<void> normal(GeometryId geometry, f32 nx, f32 ny, f32 nz);
    Result<void> color(GeometryId geometry, f32 r, f32 g, f32 b, f32 a);
    Result<void> uv(GeometryId geometry, f32 u, f32 v);
    /// @brief Set the current value of a custom attribute.
    Result<void> attribute(GeometryId geometry, AttributeId attribute, const AttributeValue& value);

    Result<void> vertex(GeometryId geometry, f32 x, f32 y, f32 z);
    Result<void> index(GeometryId geometry, u32 i);

    Result<u32> vertexCount(GeometryId geometry) const;
    Result<u32> indexCount(GeometryId geometry) const;

    // Range reads clamp [begin, end) to the stored data.
    Result<std::vector<Vec3>> positions(GeometryId geometry, size_t begin, size_t end) const;
    Result<std::vector<Vec3>> normals(GeometryId geometry, size_t begin, size_t end) const;
    Result<std::vector<Color>> colors(GeometryId geometry, size_t begin, size_t end) const;
    Result<std::vector<Vec2>> uvs(GeometryId geometry, size_t begin, size_t end) const;
    Result<std::vector<u32>> indices(GeometryId geometry, size_t begin, size_t end) const;
    Result<std::vector<AttributeValue>> attributes(GeometryId geometry, AttributeId attribute,
                                                   size_t begin, size_t end) const;
    Result<AttributeValue> attributeAt(GeometryId geometry, AttributeId attribute, u32 index) const;

    // Indexed writes fail with InvalidArgument past the vertex count.
    Result<void> setVertex(GeometryId geometry, u32 index, f32 x, f32 y, f32 z);
    Result<void> setNormal(GeometryId geometry, u32 index, f32 nx, f32 ny, f32 nz);
    Result<void> setColor(GeometryId geometry, u32 index, f32 r, f32 g, f32 b, f32 a);
    Result<void> setUv(GeometryId geometry, u32 index, f32 u, f32 v);
    Result<void> setAttribute(GeometryId geometry, AttributeId attribute, u32 index,
                              const AttributeValue& value);

    /// @brief CPU copy of a geometry's mesh, or nullptr.
    const MeshData* meshData(GeometryId geometry) const;

    /// @brief Create or refresh the device mesh of a geometry.
    Result<MeshId> upload(GeometryId geometry);

private:
    struct Entry {
        MeshData mesh;
        std::vector<AttributeId> layout;
        Vec3 currentNormal{0, 0, 1};
        Color currentColor = Color::white();
        Vec2 currentUv{};
        std::unordered_map<u64, AttributeValue> customCurrent;
        MeshId deviceMesh;
        bool dirty = true;

        bool has(AttributeId a) const;
    };

    Result<Entry*> find(GeometryId geometry);
    Result<const Entry*> find(GeometryId geometry) const;
    Result<void> pushToLayout(LayoutId layout, AttributeId attribute);
    GeometryId insert(Entry entry);

    RenderDevice& device_;
    u64 nextId_ = 1;
    AttributeId position_;
    AttributeId normal_;
    AttributeId color_;
    AttributeId uv_;
    std::unordered_map<u64, VertexAttribute> attributes_;
    std::unordered_map<u64, std::vector<AttributeId>> layouts_;
    std::unordered_map<u64, Entry> geometries_;
};

} // namespace brush
