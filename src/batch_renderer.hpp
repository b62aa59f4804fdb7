#pragma once

#include "brush/canvas.hpp"
#include "brush/command_visitor.hpp"
#include "brush/geometry.hpp"
#include "brush/image.hpp"
#include "brush/material_library.hpp"
#include "brush/mesh.hpp"
#include "brush/render_device.hpp"
#include <optional>

namespace brush {

/// Collaborators a flush draws through.
struct FlushResources {
    RenderDevice& device;
    const ImageStore& images;
    GeometryStore& geometry;
    MaterialLibrary& materials;
    f32 depthStep;
};

/**
 * BatchRenderer - Replays a canvas's command log into drawables.
 *
 * State commands update the canvas's RenderState. Shape commands append
 * into the open batch while its material key and transform match the
 * current ones; otherwise the batch is closed (one drawable, depth offset
 * -drawIndex * depthStep) and a new one is opened. Meshes, boxes, spheres
 * and backgrounds close the open batch and spawn their own drawable.
 * A command naming a missing resource is logged to stderr and skipped.
 */
class BatchRenderer : public CommandVisitor {
public:
    BatchRenderer(const FlushResources& resources, Canvas& canvas);

    /// Close the batch still open at the end of the log.
    void finish();

    /// Drawables spawned so far.
    u32 drawCount() const { return drawIndex_; }

    void visitSetFill(Color color) override;
    void visitClearFill() override;
    void visitSetStroke(Color color) override;
    void visitClearStroke() override;
    void visitSetStrokeWeight(f32 weight) override;
    void visitSetMaterialProperty(const std::string& name, const MaterialValue& value) override;
    void visitUseMaterial(MaterialId material) override;

    void visitRect(f32 x, f32 y, f32 w, f32 h, const CornerRadii& radii) override;
    void visitDrawMesh(GeometryId geometry) override;
    void visitDrawBox(f32 width, f32 height, f32 depth) override;
    void visitDrawSphere(f32 radius, u32 sectors, u32 stacks) override;
    void visitBackgroundColor(Color color) override;
    void visitBackgroundImage(ImageId image) override;

    void visitPushTransform() override;
    void visitPopTransform() override;
    void visitResetTransform() override;
    void visitTranslate(f32 x, f32 y) override;
    void visitRotate(f32 angle) override;
    void visitScale(f32 x, f32 y) override;
    void visitShearX(f32 angle) override;
    void visitShearY(f32 angle) override;

private:
    struct Batch {
        MaterialKey key;
        Affine3 transform;
        MeshData mesh;
    };

    /// Make sure the open batch accepts geometry for key at the current transform.
    MeshData& batchFor(const MaterialKey& key);
    void closeBatch();

    /// Key for a whole mesh: the fill key, or the bare material when fill is off.
    MaterialKey solidKey() const;

    /// Create a device mesh for data and spawn it as a transient drawable.
    void spawnTransient(const MeshData& data, const MaterialKey& key, const Affine3& transform);
    /// Spawn a drawable; a transient mesh is destroyed if spawning fails.
    void spawn(MeshId mesh, bool transient, const MaterialKey& key, const Affine3& transform);
    void drawBackground(const MaterialKey& key, Color color);

    FlushResources res_;
    Canvas& canvas_;
    RenderState& state_;
    std::optional<Batch> batch_;
    u32 drawIndex_ = 0;
};

} // namespace brush
