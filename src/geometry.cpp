#include "brush/geometry.hpp"
#include "brush/tessellation.hpp"

#include <algorithm>
#include <utility>

namespace brush {

namespace {

constexpr const char* kPositionName = "Vertex_Position";
constexpr const char* kNormalName = "Vertex_Normal";
constexpr const char* kColorName = "Vertex_Color";
constexpr const char* kUvName = "Vertex_Uv";

Error geometryNotFound(GeometryId id) {
    return Error{ErrorCode::GeometryNotFound, std::to_string(id.value)};
}

Error outOfBounds(u32 index, size_t count) {
    return Error{ErrorCode::InvalidArgument, "index " + std::to_string(index) +
                 " out of bounds (count: " + std::to_string(count) + ")"};
}

Error missingAttribute(const char* name) {
    return Error{ErrorCode::AttributeNotFound, std::string("geometry has no ") + name + " attribute"};
}

template <typename T>
std::vector<T> clampedRange(const std::vector<T>& data, size_t begin, size_t end) {
    begin = std::min(begin, data.size());
    end = std::min(end, data.size());
    if (begin >= end) return {};
    return std::vector<T>(data.begin() + begin, data.begin() + end);
}

CustomAttribute* findCustom(MeshData& mesh, AttributeId id) {
    for (auto& attr : mesh.attributes) {
        if (attr.id == id) return &attr;
    }
    return nullptr;
}

const CustomAttribute* findCustom(const MeshData& mesh, AttributeId id) {
    for (const auto& attr : mesh.attributes) {
        if (attr.id == id) return &attr;
    }
    return nullptr;
}

AttributeValue readValue(const CustomAttribute& attr, size_t i) {
    AttributeValue value;
    value.format = attr.format;
    u32 n = componentCount(attr.format);
    for (u32 c = 0; c < n; ++c) value.v[c] = attr.data[i * n + c];
    return value;
}

}

u64 hashAttributeName(std::string_view name) {
    u64 hash = 0xcbf29ce484222325ull;
    for (char ch : name) {
        hash ^= static_cast<u8>(ch);
        hash *= 0x100000001b3ull;
    }
    return hash;
}

bool GeometryStore::Entry::has(AttributeId a) const {
    return std::find(layout.begin(), layout.end(), a) != layout.end();
}

GeometryStore::GeometryStore(RenderDevice& device) : device_(device) {
    auto builtin = [this](const char* name, AttributeFormat format) {
        AttributeId id{hashAttributeName(name)};
        attributes_[id.value] = VertexAttribute{name, format, true};
        return id;
    };
    position_ = builtin(kPositionName, AttributeFormat::Float3);
    normal_ = builtin(kNormalName, AttributeFormat::Float3);
    color_ = builtin(kColorName, AttributeFormat::Float4);
    uv_ = builtin(kUvName, AttributeFormat::Float2);
}

GeometryStore::~GeometryStore() {
    for (auto& e : geometries_) {
        if (e.second.deviceMesh.valid()) device_.destroyMesh(e.second.deviceMesh);
    }
}

// --- Attributes ---

Result<AttributeId> GeometryStore::createAttribute(const std::string& name, AttributeFormat format) {
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "attribute name must not be empty"};
    }
    AttributeId id{hashAttributeName(name)};
    auto it = attributes_.find(id.value);
    if (it != attributes_.end()) {
        if (it->second.format != format || it->second.name != name) {
            return Error{ErrorCode::InvalidArgument,
                         "attribute '" + name + "' already exists with another format"};
        }
        return id;
    }
    attributes_[id.value] = VertexAttribute{name, format, false};
    return id;
}

Result<void> GeometryStore::destroyAttribute(AttributeId attribute) {
    auto it = attributes_.find(attribute.value);
    if (it == attributes_.end()) {
        return Error{ErrorCode::AttributeNotFound, std::to_string(attribute.value)};
    }
    if (it->second.builtin) {
        return Error{ErrorCode::InvalidArgument,
                     "built-in attribute '" + it->second.name + "' cannot be destroyed"};
    }
    attributes_.erase(it);
    return {};
}

const VertexAttribute* GeometryStore::attribute(AttributeId attribute) const {
    auto it = attributes_.find(attribute.value);
    return it == attributes_.end() ? nullptr : &it->second;
}

// --- Layouts ---

LayoutId GeometryStore::createLayout() {
    LayoutId id{nextId_++};
    layouts_[id.value] = {};
    return id;
}

LayoutId GeometryStore::createDefaultLayout() {
    LayoutId id{nextId_++};
    layouts_[id.value] = {position_, normal_, color_, uv_};
    return id;
}

Result<void> GeometryStore::pushToLayout(LayoutId layout, AttributeId attribute) {
    auto it = layouts_.find(layout.value);
    if (it == layouts_.end()) {
        return Error{ErrorCode::LayoutNotFound, std::to_string(layout.value)};
    }
    if (!attributes_.count(attribute.value)) {
        return Error{ErrorCode::AttributeNotFound, std::to_string(attribute.value)};
    }
    auto& attrs = it->second;
    if (std::find(attrs.begin(), attrs.end(), attribute) == attrs.end()) {
        attrs.push_back(attribute);
    }
    return {};
}

Result<void> GeometryStore::addPosition(LayoutId layout) { return pushToLayout(layout, position_); }
Result<void> GeometryStore::addNormal(LayoutId layout) { return pushToLayout(layout, normal_); }
Result<void> GeometryStore::addColor(LayoutId layout) { return pushToLayout(layout, color_); }
Result<void> GeometryStore::addUv(LayoutId layout) { return pushToLayout(layout, uv_); }

Result<void> GeometryStore::addAttribute(LayoutId layout, AttributeId attribute) {
    return pushToLayout(layout, attribute);
}

Result<std::vector<AttributeId>> GeometryStore::layoutAttributes(LayoutId layout) const {
    auto it = layouts_.find(layout.value);
    if (it == layouts_.end()) {
        return Error{ErrorCode::LayoutNotFound, std::to_string(layout.value)};
    }
    return it->second;
}

Result<void> GeometryStore::destroyLayout(LayoutId layout) {
    if (layouts_.erase(layout.value) == 0) {
        return Error{ErrorCode::LayoutNotFound, std::to_string(layout.value)};
    }
    return {};
}

// --- Geometries ---

GeometryId GeometryStore::insert(Entry entry) {
    GeometryId id{nextId_++};
    geometries_.emplace(id.value, std::move(entry));
    return id;
}

GeometryId GeometryStore::create(Topology topology) {
    Entry entry;
    entry.mesh.topology = topology;
    entry.layout = {position_, normal_, color_, uv_};
    return insert(std::move(entry));
}

Result<GeometryId> GeometryStore::createWithLayout(LayoutId layout, Topology topology) {
    auto attrs = layoutAttributes(layout);
    if (!attrs) return attrs.error();

    Entry entry;
    entry.mesh.topology = topology;
    entry.layout = attrs.value();
    for (AttributeId id : entry.layout) {
        const VertexAttribute* attr = attribute(id);
        if (!attr || attr->builtin) continue;
        entry.mesh.attributes.push_back(CustomAttribute{attr->name, id, attr->format, {}});
    }
    return insert(std::move(entry));
}

GeometryId GeometryStore::createBox(f32 width, f32 height, f32 depth) {
    Entry entry;
    entry.mesh = boxMesh(width, height, depth, Color::white());
    entry.layout = {position_, normal_, color_, uv_};
    return insert(std::move(entry));
}

Result<GeometryId> GeometryStore::createSphere(f32 radius, u32 sectors, u32 stacks) {
    auto mesh = sphereMesh(radius, sectors, stacks, Color::white());
    if (!mesh) return mesh.error();
    Entry entry;
    entry.mesh = std::move(mesh.value());
    entry.layout = {position_, normal_, color_, uv_};
    return insert(std::move(entry));
}

Result<void> GeometryStore::destroy(GeometryId geometry) {
    auto it = geometries_.find(geometry.value);
    if (it == geometries_.end()) return geometryNotFound(geometry);
    if (it->second.deviceMesh.valid()) device_.destroyMesh(it->second.deviceMesh);
    geometries_.erase(it);
    return {};
}

bool GeometryStore::contains(GeometryId geometry) const {
    return geometries_.count(geometry.value) != 0;
}

Result<GeometryStore::Entry*> GeometryStore::find(GeometryId geometry) {
    auto it = geometries_.find(geometry.value);
    if (it == geometries_.end()) return geometryNotFound(geometry);
    return &it->second;
}

Result<const GeometryStore::Entry*> GeometryStore::find(GeometryId geometry) const {
    auto it = geometries_.find(geometry.value);
    if (it == geometries_.end()) return geometryNotFound(geometry);
    return &it->second;
}

Result<void> GeometryStore::normal(GeometryId geometry, f32 nx, f32 ny, f32 nz) {
    auto e = find(geometry);
    if (!e) return e.error();
    e.value()->currentNormal = {nx, ny, nz};
    return {};
}

Result<void> GeometryStore::color(GeometryId geometry, f32 r, f32 g, f32 b, f32 a) {
    auto e = find(geometry);
    if (!e) return e.error();
    e.value()->currentColor = {r, g, b, a};
    return {};
}

Result<void> GeometryStore::uv(GeometryId geometry, f32 u, f32 v) {
    auto e = find(geometry);
    if (!e) return e.error();
    e.value()->currentUv = {u, v};
    return {};
}

Result<void> GeometryStore::attribute(GeometryId geometry, AttributeId attribute,
                                      const AttributeValue& value) {
    auto e = find(geometry);
    if (!e) return e.error();
    const VertexAttribute* attr = this->attribute(attribute);
    if (!attr) return Error{ErrorCode::AttributeNotFound, std::to_string(attribute.value)};
    if (attr->format != value.format) {
        return Error{ErrorCode::InvalidArgument,
                     "value format does not match attribute '" + attr->name + "'"};
    }
    e.value()->customCurrent[attribute.value] = value;
    return {};
}

Result<void> GeometryStore::vertex(GeometryId geometry, f32 x, f32 y, f32 z) {
    auto found = find(geometry);
    if (!found) return found.error();
    Entry& e = *found.value();

    e.mesh.positions.push_back({x, y, z});
    if (e.has(normal_)) e.mesh.normals.push_back(e.currentNormal);
    if (e.has(color_)) e.mesh.colors.push_back(e.currentColor);
    if (e.has(uv_)) e.mesh.uvs.push_back(e.currentUv);

    for (auto& attr : e.mesh.attributes) {
        auto cur = e.customCurrent.find(attr.id.value);
        u32 n = componentCount(attr.format);
        for (u32 c = 0; c < n; ++c) {
            attr.data.push_back(cur != e.customCurrent.end() ? cur->second.v[c] : 0.0f);
        }
    }
    e.dirty = true;
    return {};
}

Result<void> GeometryStore::index(GeometryId geometry, u32 i) {
    auto e = find(geometry);
    if (!e) return e.error();
    e.value()->mesh.indices.push_back(i);
    e.value()->dirty = true;
    return {};
}

Result<u32> GeometryStore::vertexCount(GeometryId geometry) const {
    auto e = find(geometry);
    if (!e) return e.error();
    return static_cast<u32>(e.value()->mesh.positions.size());
}

Result<u32> GeometryStore::indexCount(GeometryId geometry) const {
    auto e = find(geometry);
    if (!e) return e.error();
    return static_cast<u32>(e.value()->mesh.indices.size());
}

Result<std::vector<Vec3>> GeometryStore::positions(GeometryId geometry, size_t begin,
                                                   size_t end) const {
    auto e = find(geometry);
    if (!e) return e.error();
    return clampedRange(e.value()->mesh.positions, begin, end);
}

Result<std::vector<Vec3>> GeometryStore::normals(GeometryId geometry, size_t begin,
                                                 size_t end) const {
    auto e = find(geometry);
    if (!e) return e.error();
    if (!e.value()->has(normal_)) return missingAttribute("normal");
    return clampedRange(e.value()->mesh.normals, begin, end);
}

Result<std::vector<Color>> GeometryStore::colors(GeometryId geometry, size_t begin,
                                                 size_t end) const {
    auto e = find(geometry);
    if (!e) return e.error();
    if (!e.value()->has(color_)) return missingAttribute("color");
    return clampedRange(e.value()->mesh.colors, begin, end);
}

Result<std::vector<Vec2>> GeometryStore::uvs(GeometryId geometry, size_t begin,
                                             size_t end) const {
    auto e = find(geometry);
    if (!e) return e.error();
    if (!e.value()->has(uv_)) return missingAttribute("uv");
    return clampedRange(e.value()->mesh.uvs, begin, end);
}

Result<std::vector<u32>> GeometryStore::indices(GeometryId geometry, size_t begin,
                                                size_t end) const {
    auto e = find(geometry);
    if (!e) return e.error();
    return clampedRange(e.value()->mesh.indices, begin, end);
}

Result<std::vector<AttributeValue>> GeometryStore::attributes(GeometryId geometry,
                                                              AttributeId attribute,
                                                              size_t begin, size_t end) const {
    auto e = find(geometry);
    if (!e) return e.error();
    const CustomAttribute* attr = findCustom(e.value()->mesh, attribute);
    if (!attr) return Error{ErrorCode::AttributeNotFound, std::to_string(attribute.value)};

    size_t count = e.value()->mesh.vertexCount();
    begin = std::min(begin, count);
    end = std::min(end, count);
    std::vector<AttributeValue> out;
    for (size_t i = begin; i < end; ++i) out.push_back(readValue(*attr, i));
    return out;
}

Result<AttributeValue> GeometryStore::attributeAt(GeometryId geometry, AttributeId attribute,
                                                  u32 index) const {
    auto e = find(geometry);
    if (!e) return e.error();
    const CustomAttribute* attr = findCustom(e.value()->mesh, attribute);
    if (!attr) return Error{ErrorCode::AttributeNotFound, std::to_string(attribute.value)};
    size_t count = e.value()->mesh.vertexCount();
    if (index >= count) return outOfBounds(index, count);
    return readValue(*attr, index);
}

Result<void> GeometryStore::setVertex(GeometryId geometry, u32 index, f32 x, f32 y, f32 z) {
    auto e = find(geometry);
    if (!e) return e.error();
    auto& data = e.value()->mesh.positions;
    if (index >= data.size()) return outOfBounds(index, data.size());
    data[index] = {x, y, z};
    e.value()->dirty = true;
    return {};
}

Result<void> GeometryStore::setNormal(GeometryId geometry, u32 index, f32 nx, f32 ny, f32 nz) {
    auto e = find(geometry);
    if (!e) return e.error();
    if (!e.value()->has(normal_)) return missingAttribute("normal");
    auto& data = e.value()->mesh.normals;
    if (index >= data.size()) return outOfBounds(index, data.size());
    data[index] = {nx, ny, nz};
    e.value()->dirty = true;
    return {};
}

Result<void> GeometryStore::setColor(GeometryId geometry, u32 index, f32 r, f32 g, f32 b, f32 a) {
    auto e = find(geometry);
    if (!e) return e.error();
    if (!e.value()->has(color_)) return missingAttribute("color");
    auto& data = e.value()->mesh.colors;
    if (index >= data.size()) return outOfBounds(index, data.size());
    data[index] = {r, g, b, a};
    e.value()->dirty = true;
    return {};
}

Result<void> GeometryStore::setUv(GeometryId geometry, u32 index, f32 u, f32 v) {
    auto e = find(geometry);
    if (!e) return e.error();
    if (!e.value()->has(uv_)) return missingAttribute("uv");
    auto& data = e.value()->mesh.uvs;
    if (index >= data.size()) return outOfBounds(index, data.size());
    data[index] = {u, v};
    e.value()->dirty = true;
    return {};
}

Result<void> GeometryStore::setAttribute(GeometryId geometry, AttributeId attribute, u32 index,
                                         const AttributeValue& value) {
    auto e = find(geometry);
    if (!e) return e.error();
    CustomAttribute* attr = findCustom(e.value()->mesh, attribute);
    if (!attr) return Error{ErrorCode::AttributeNotFound, std::to_string(attribute.value)};
    if (attr->format != value.format) {
        return Error{ErrorCode::InvalidArgument,
                     "value format does not match attribute '" + attr->name + "'"};
    }
    size_t count = e.value()->mesh.vertexCount();
    if (index >= count) return outOfBounds(index, count);
    u32 n = componentCount(attr->format);
    for (u32 c = 0; c < n; ++c) attr->data[size_t(index) * n + c] = value.v[c];
    e.value()->dirty = true;
    return {};
}

const MeshData* GeometryStore::meshData(GeometryId geometry) const {
    auto it = geometries_.find(geometry.value);
    return it == geometries_.end() ? nullptr : &it->second.mesh;
}

Result<MeshId> GeometryStore::upload(GeometryId geometry) {
    auto found = find(geometry);
    if (!found) return found.error();
    Entry& e = *found.value();

    if (!e.deviceMesh.valid()) {
        auto mesh = device_.createMesh(e.mesh);
        if (!mesh) return mesh.error();
        e.deviceMesh = mesh.value();
    } else if (e.dirty) {
        auto updated = device_.updateMesh(e.deviceMesh, e.mesh);
        if (!updated) return updated.error();
    }
    e.dirty = false;
    return e.deviceMesh;
}

} // namespace brush
