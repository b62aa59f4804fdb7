#pragma once

/**
 * @file cpu_device.hpp
 * @brief Host-memory render device with a software rasterizer.
 */

#include "brush/pixmap.hpp"
#include "brush/render_device.hpp"
#include <map>
#include <unordered_map>
#include <utility>
#include <vector>

namespace brush {

/**
 * CpuDevice - RenderDevice backed by host memory.
 *
 * Textures are Pixmaps, readback buffers are byte vectors whose rows are
 * padded to the configured alignment (padding bytes are left as garbage,
 * the way a GPU leaves them). render() rasterizes triangle, line and point
 * meshes into the target texture. Inspection accessors exist for tests.
 */
class CpuDevice : public RenderDevice {
public:
    /// @param copyAlignment Row pitch alignment of readback copies (WebGPU uses 256).
    explicit CpuDevice(u32 copyAlignment = 256);

    u32 copyBytesPerRowAlignment() const override { return alignment_; }

    Result<TextureId> createTexture(const TextureDesc& desc) override;
    Result<void> resizeTexture(TextureId texture, u32 width, u32 height) override;
    void destroyTexture(TextureId texture) override;
    bool hasTexture(TextureId texture) const override;

    Result<BufferId> createReadbackBuffer(size_t size) override;
    void destroyBuffer(BufferId buffer) override;
    Result<std::vector<u8>> copyTextureToBuffer(TextureId texture, BufferId buffer) override;
    Result<void> writeTextureRegion(TextureId texture, u32 x, u32 y, u32 width, u32 height,
                                    const std::vector<u8>& bytes) override;

    Result<MeshId> createMesh(const MeshData& data) override;
    Result<void> updateMesh(MeshId mesh, const MeshData& data) override;
    void destroyMesh(MeshId mesh) override;
    bool hasMesh(MeshId mesh) const override;

    Result<MaterialId> createMaterial(const MaterialDesc& desc) override;
    Result<void> updateMaterial(MaterialId material, const MaterialDesc& desc) override;
    void destroyMaterial(MaterialId material) override;
    bool hasMaterial(MaterialId material) const override;

    Result<EntityId> spawnDrawable(const DrawableDesc& desc) override;
    void despawnDrawable(EntityId entity) override;

    Result<void> render(TextureId target, u32 layer) override;
    Result<void> present(TextureId target) override;

    // --- Inspection ---

    /// @brief Live drawables in spawn order.
    std::vector<std::pair<EntityId, DrawableDesc>> drawables() const;
    size_t drawableCount() const { return drawables_.size(); }
    size_t meshCount() const { return meshes_.size(); }
    size_t materialCount() const { return materials_.size(); }
    size_t textureCount() const { return textures_.size(); }
    size_t bufferCount() const { return buffers_.size(); }
    /// @brief Size in bytes of a readback buffer, or 0 if unknown.
    size_t bufferSize(BufferId buffer) const;

    const MeshData* mesh(MeshId mesh) const;
    const MaterialDesc* material(MaterialId material) const;
    const Pixmap* texture(TextureId texture) const;

    u64 spawnCount() const { return spawnCount_; }
    u64 despawnCount() const { return despawnCount_; }
    u64 presentCount() const { return presentCount_; }
    u64 renderCount() const { return renderCount_; }

private:
    u64 nextId() { return nextId_++; }

    u32 alignment_;
    u64 nextId_ = 1;
    std::unordered_map<u64, Pixmap> textures_;
    std::unordered_map<u64, std::vector<u8>> buffers_;
    std::unordered_map<u64, MeshData> meshes_;
    std::unordered_map<u64, MaterialDesc> materials_;
    std::map<u64, DrawableDesc> drawables_;

    u64 spawnCount_ = 0;
    u64 despawnCount_ = 0;
    u64 presentCount_ = 0;
    u64 renderCount_ = 0;
};

} // namespace brush
