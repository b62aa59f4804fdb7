#pragma once

#include "brush/error.hpp"
#include "brush/material.hpp"
#include "brush/math.hpp"
#include "brush/mesh.hpp"
#include "brush/pixel_codec.hpp"
#include "brush/types.hpp"
#include <vector>

namespace brush {

/// @brief Size and format of a device texture.
struct TextureDesc {
    u32 width = 0;
    u32 height = 0;
    PixelFormat format = PixelFormat::RGBA8Unorm;
};

/// @brief A mesh + material placed in the world for one frame.
struct DrawableDesc {
    MeshId mesh;
    MaterialId material;
    Affine3 transform;        ///< Model transform, canvas pixel space, y down.
    f32 depthOffset = 0;      ///< Depth bias; a smaller value draws on top.
    u32 drawIndex = 0;        ///< Position of the batch within its flush.
    u32 layer = 0;            ///< Render layer of the owning canvas.
    CanvasId owner;
};

/**
 * RenderDevice - Abstract GPU collaborator used by the drawing pipeline.
 *
 * Owns textures, readback buffers, meshes, materials and the drawables
 * spawned from them. Implementations:
 *
 *   - CpuDevice: host-memory resources and a software rasterizer
 *   - GlDevice:  OpenGL 3.3 textures, pack buffers and VAOs (optional)
 *
 * render() draws every live drawable of a layer into a texture, ordered by
 * depth offset, without clearing it first. Only copyTextureToBuffer()
 * blocks: it submits the copy and waits for the mapped data.
 */
class RenderDevice {
public:
    virtual ~RenderDevice() = default;

    /// Row pitch alignment, in bytes, of texture-to-buffer copies.
    virtual u32 copyBytesPerRowAlignment() const = 0;

    // --- Textures ---
    virtual Result<TextureId> createTexture(const TextureDesc& desc) = 0;
    /// Resize in place; previous contents are discarded.
    virtual Result<void> resizeTexture(TextureId texture, u32 width, u32 height) = 0;
    virtual void destroyTexture(TextureId texture) = 0;
    virtual bool hasTexture(TextureId texture) const = 0;

    // --- Readback ---
    virtual Result<BufferId> createReadbackBuffer(size_t size) = 0;
    virtual void destroyBuffer(BufferId buffer) = 0;

    /**
     * Copy a whole texture into a readback buffer and return its bytes.
     * Rows are padded to copyBytesPerRowAlignment(). Blocks until the
     * copy has completed and the buffer has been mapped and unmapped.
     */
    virtual Result<std::vector<u8>> copyTextureToBuffer(TextureId texture, BufferId buffer) = 0;

    /**
     * Write tightly packed texels (width * pixelSize bytes per row) into a
     * sub-rectangle of a texture.
     */
    virtual Result<void> writeTextureRegion(TextureId texture, u32 x, u32 y, u32 width,
                                            u32 height, const std::vector<u8>& bytes) = 0;

    // --- Meshes ---
    virtual Result<MeshId> createMesh(const MeshData& data) = 0;
    virtual Result<void> updateMesh(MeshId mesh, const MeshData& data) = 0;
    virtual void destroyMesh(MeshId mesh) = 0;
    virtual bool hasMesh(MeshId mesh) const = 0;

    // --- Materials ---
    virtual Result<MaterialId> createMaterial(const MaterialDesc& desc) = 0;
    virtual Result<void> updateMaterial(MaterialId material, const MaterialDesc& desc) = 0;
    virtual void destroyMaterial(MaterialId material) = 0;
    virtual bool hasMaterial(MaterialId material) const = 0;

    // --- Drawables ---
    virtual Result<EntityId> spawnDrawable(const DrawableDesc& desc) = 0;
    virtual void despawnDrawable(EntityId entity) = 0;

    // --- Frame ---
    virtual Result<void> render(TextureId target, u32 layer) = 0;
    virtual Result<void> present(TextureId target) = 0;
};

} // namespace brush
