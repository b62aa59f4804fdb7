#include "brush/cpu_device.hpp"
#include "cpu_rasterizer.hpp"

#include <algorithm>
#include <cstring>
#include <string>

namespace brush {

namespace {

constexpr u8 kPaddingByte = 0xCD;

Error textureNotFound(TextureId id) {
    return Error{ErrorCode::DeviceError, "texture " + std::to_string(id.value) + " not found"};
}

}

CpuDevice::CpuDevice(u32 copyAlignment) : alignment_(copyAlignment == 0 ? 1 : copyAlignment) {
}

// --- Textures ---

Result<TextureId> CpuDevice::createTexture(const TextureDesc& desc) {
    if (!isSupportedPixelFormat(desc.format)) {
        return Error{ErrorCode::UnsupportedPixelFormat, pixelFormatName(desc.format)};
    }
    if (desc.width == 0 || desc.height == 0) {
        return Error{ErrorCode::InvalidArgument, "texture size must be non-zero"};
    }
    Pixmap pixels = Pixmap::Alloc(PixmapInfo::Make(i32(desc.width), i32(desc.height), desc.format));
    if (!pixels.valid()) {
        return Error{ErrorCode::DeviceError, "texture allocation failed"};
    }
    TextureId id{nextId()};
    textures_.emplace(id.value, std::move(pixels));
    return id;
}

Result<void> CpuDevice::resizeTexture(TextureId texture, u32 width, u32 height) {
    auto it = textures_.find(texture.value);
    if (it == textures_.end()) return textureNotFound(texture);
    if (width == 0 || height == 0) {
        return Error{ErrorCode::InvalidArgument, "texture size must be non-zero"};
    }
    PixelFormat format = it->second.format();
    it->second.reallocate(PixmapInfo::Make(i32(width), i32(height), format));
    if (!it->second.valid()) {
        return Error{ErrorCode::DeviceError, "texture allocation failed"};
    }
    return {};
}

void CpuDevice::destroyTexture(TextureId texture) {
    textures_.erase(texture.value);
}

bool CpuDevice::hasTexture(TextureId texture) const {
    return textures_.count(texture.value) != 0;
}

// --- Readback ---

Result<BufferId> CpuDevice::createReadbackBuffer(size_t size) {
    BufferId id{nextId()};
    buffers_.emplace(id.value, std::vector<u8>(size, kPaddingByte));
    return id;
}

void CpuDevice::destroyBuffer(BufferId buffer) {
    buffers_.erase(buffer.value);
}

size_t CpuDevice::bufferSize(BufferId buffer) const {
    auto it = buffers_.find(buffer.value);
    return it == buffers_.end() ? 0 : it->second.size();
}

Result<std::vector<u8>> CpuDevice::copyTextureToBuffer(TextureId texture, BufferId buffer) {
    auto tex = textures_.find(texture.value);
    if (tex == textures_.end()) return textureNotFound(texture);
    auto buf = buffers_.find(buffer.value);
    if (buf == buffers_.end()) {
        return Error{ErrorCode::DeviceError, "buffer " + std::to_string(buffer.value) + " not found"};
    }

    const Pixmap& pixels = tex->second;
    u32 rowBytes = u32(pixels.width() * pixels.info().bytesPerPixel());
    u32 padded = alignBytesPerRow(rowBytes, alignment_);
    size_t needed = size_t(padded) * u32(pixels.height());
    std::vector<u8>& bytes = buf->second;
    if (bytes.size() < needed) {
        return Error{ErrorCode::InvalidArgument,
                     "readback buffer of " + std::to_string(bytes.size()) +
                     " bytes is smaller than " + std::to_string(needed)};
    }

    for (i32 y = 0; y < pixels.height(); ++y) {
        std::memcpy(bytes.data() + size_t(y) * padded, pixels.rowAddr(y), rowBytes);
    }
    return std::vector<u8>(bytes.begin(), bytes.begin() + needed);
}

Result<void> CpuDevice::writeTextureRegion(TextureId texture, u32 x, u32 y, u32 width,
                                           u32 height, const std::vector<u8>& bytes) {
    auto tex = textures_.find(texture.value);
    if (tex == textures_.end()) return textureNotFound(texture);

    Pixmap& pixels = tex->second;
    if (u64(x) + width > u64(pixels.width()) || u64(y) + height > u64(pixels.height())) {
        return Error{ErrorCode::InvalidArgument, "region exceeds texture bounds"};
    }
    size_t rowBytes = size_t(width) * pixels.info().bytesPerPixel();
    if (bytes.size() != rowBytes * height) {
        return Error{ErrorCode::InvalidArgument,
                     "expected " + std::to_string(rowBytes * height) + " bytes, got " +
                     std::to_string(bytes.size())};
    }
    for (u32 row = 0; row < height; ++row) {
        std::memcpy(pixels.pixelAddr(i32(x), i32(y + row)), bytes.data() + row * rowBytes,
                    rowBytes);
    }
    return {};
}

// --- Meshes ---

Result<MeshId> CpuDevice::createMesh(const MeshData& data) {
    auto valid = data.validate();
    if (!valid) return valid.error();
    MeshId id{nextId()};
    meshes_.emplace(id.value, data);
    return id;
}

Result<void> CpuDevice::updateMesh(MeshId mesh, const MeshData& data) {
    auto it = meshes_.find(mesh.value);
    if (it == meshes_.end()) {
        return Error{ErrorCode::DeviceError, "mesh " + std::to_string(mesh.value) + " not found"};
    }
    auto valid = data.validate();
    if (!valid) return valid.error();
    it->second = data;
    return {};
}

void CpuDevice::destroyMesh(MeshId mesh) {
    meshes_.erase(mesh.value);
}

bool CpuDevice::hasMesh(MeshId mesh) const {
    return meshes_.count(mesh.value) != 0;
}

const MeshData* CpuDevice::mesh(MeshId mesh) const {
    auto it = meshes_.find(mesh.value);
    return it == meshes_.end() ? nullptr : &it->second;
}

// --- Materials ---

Result<MaterialId> CpuDevice::createMaterial(const MaterialDesc& desc) {
    MaterialId id{nextId()};
    materials_.emplace(id.value, desc);
    return id;
}

Result<void> CpuDevice::updateMaterial(MaterialId material, const MaterialDesc& desc) {
    auto it = materials_.find(material.value);
    if (it == materials_.end()) {
        return Error{ErrorCode::MaterialNotFound, std::to_string(material.value)};
    }
    it->second = desc;
    return {};
}

void CpuDevice::destroyMaterial(MaterialId material) {
    materials_.erase(material.value);
}

bool CpuDevice::hasMaterial(MaterialId material) const {
    return materials_.count(material.value) != 0;
}

const MaterialDesc* CpuDevice::material(MaterialId material) const {
    auto it = materials_.find(material.value);
    return it == materials_.end() ? nullptr : &it->second;
}

const Pixmap* CpuDevice::texture(TextureId texture) const {
    auto it = textures_.find(texture.value);
    return it == textures_.end() ? nullptr : &it->second;
}

// --- Drawables ---

Result<EntityId> CpuDevice::spawnDrawable(const DrawableDesc& desc) {
    if (!hasMesh(desc.mesh)) {
        return Error{ErrorCode::DeviceError, "mesh " + std::to_string(desc.mesh.value) + " not found"};
    }
    if (!hasMaterial(desc.material)) {
        return Error{ErrorCode::MaterialNotFound, std::to_string(desc.material.value)};
    }
    EntityId id{nextId()};
    drawables_.emplace(id.value, desc);
    ++spawnCount_;
    return id;
}

void CpuDevice::despawnDrawable(EntityId entity) {
    if (drawables_.erase(entity.value) != 0) ++despawnCount_;
}

std::vector<std::pair<EntityId, DrawableDesc>> CpuDevice::drawables() const {
    std::vector<std::pair<EntityId, DrawableDesc>> out;
    out.reserve(drawables_.size());
    for (const auto& e : drawables_) {
        out.emplace_back(EntityId{e.first}, e.second);
    }
    return out;
}

// --- Frame ---

Result<void> CpuDevice::render(TextureId target, u32 layer) {
    auto tex = textures_.find(target.value);
    if (tex == textures_.end()) return textureNotFound(target);

    std::vector<const DrawableDesc*> queue;
    for (const auto& e : drawables_) {
        if (e.second.layer == layer) queue.push_back(&e.second);
    }
    // Larger depth offsets are farther away and paint first.
    std::stable_sort(queue.begin(), queue.end(),
                     [](const DrawableDesc* a, const DrawableDesc* b) {
                         return a->depthOffset > b->depthOffset;
                     });

    CpuRasterizer rasterizer(&tex->second);
    for (const DrawableDesc* d : queue) {
        const MeshData* meshData = mesh(d->mesh);
        const MaterialDesc* mat = material(d->material);
        if (!meshData || !mat) continue;
        const Pixmap* sampled = nullptr;
        if (mat->baseColorTexture.valid() && mat->baseColorTexture != target) {
            sampled = texture(mat->baseColorTexture);
        }
        rasterizer.draw(*meshData, *mat, sampled, d->transform);
    }
    ++renderCount_;
    return {};
}

Result<void> CpuDevice::present(TextureId target) {
    if (!hasTexture(target)) return textureNotFound(target);
    ++presentCount_;
    return {};
}

} // namespace brush
