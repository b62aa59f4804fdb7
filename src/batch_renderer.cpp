#include "batch_renderer.hpp"
#include "brush/tessellation.hpp"

#include <cstdio>
#include <utility>

namespace brush {

BatchRenderer::BatchRenderer(const FlushResources& resources, Canvas& canvas)
    : res_(resources), canvas_(canvas), state_(canvas.state()) {}

void BatchRenderer::finish() {
    closeBatch();
}

// --- Paint state ---

void BatchRenderer::visitSetFill(Color color) {
    state_.setFill(color);
}

void BatchRenderer::visitClearFill() {
    state_.clearFill();
}

void BatchRenderer::visitSetStroke(Color color) {
    state_.setStroke(color);
}

void BatchRenderer::visitClearStroke() {
    state_.clearStroke();
}

void BatchRenderer::visitSetStrokeWeight(f32 weight) {
    state_.setStrokeWeight(weight);
}

void BatchRenderer::visitSetMaterialProperty(const std::string& name, const MaterialValue& value) {
    auto r = state_.setMaterialProperty(name, value);
    if (!r) {
        std::fprintf(stderr, "brush flush: material property rejected (%s), skipping\n",
                     r.error().describe().c_str());
    }
}

void BatchRenderer::visitUseMaterial(MaterialId material) {
    if (!res_.materials.contains(material)) {
        std::fprintf(stderr, "brush flush: material %llu not found, skipping\n",
                     static_cast<unsigned long long>(material.value));
        return;
    }
    state_.useMaterial(material);
}

// --- Shapes ---

void BatchRenderer::visitRect(f32 x, f32 y, f32 w, f32 h, const CornerRadii& radii) {
    if (auto key = state_.fillKey()) {
        tessellateRect(batchFor(*key), x, y, w, h, radii, *state_.fill(), ShapeMode::Fill());
    }
    if (auto key = state_.strokeKey()) {
        f32 weight = state_.strokeWeight();
        if (weight > 0) {
            tessellateRect(batchFor(*key), x, y, w, h, radii, *state_.stroke(),
                           ShapeMode::Stroke(weight));
        }
    }
}

void BatchRenderer::visitDrawMesh(GeometryId geometry) {
    closeBatch();
    auto mesh = res_.geometry.upload(geometry);
    if (!mesh) {
        std::fprintf(stderr, "brush flush: geometry %llu unavailable (%s), skipping\n",
                     static_cast<unsigned long long>(geometry.value),
                     mesh.error().describe().c_str());
        return;
    }
    spawn(mesh.value(), false, solidKey(), state_.transform().current());
}

void BatchRenderer::visitDrawBox(f32 width, f32 height, f32 depth) {
    closeBatch();
    Color color = state_.fill().value_or(Color::white());
    spawnTransient(boxMesh(width, height, depth, color), solidKey(), state_.transform().current());
}

void BatchRenderer::visitDrawSphere(f32 radius, u32 sectors, u32 stacks) {
    closeBatch();
    Color color = state_.fill().value_or(Color::white());
    auto mesh = sphereMesh(radius, sectors, stacks, color);
    if (!mesh) {
        std::fprintf(stderr, "brush flush: sphere rejected (%s), skipping\n",
                     mesh.error().describe().c_str());
        return;
    }
    spawnTransient(mesh.value(), solidKey(), state_.transform().current());
}

void BatchRenderer::visitBackgroundColor(Color color) {
    closeBatch();
    drawBackground(MaterialKey::MakeColor(color), color);
}

void BatchRenderer::visitBackgroundImage(ImageId image) {
    closeBatch();
    if (!res_.images.contains(image)) {
        std::fprintf(stderr, "brush flush: image %llu not found, skipping\n",
                     static_cast<unsigned long long>(image.value));
        return;
    }
    drawBackground(MaterialKey::MakeColor(Color::white(), image), Color::white());
}

// --- Transform ---

void BatchRenderer::visitPushTransform() {
    state_.transform().push();
}

void BatchRenderer::visitPopTransform() {
    state_.transform().pop();
}

void BatchRenderer::visitResetTransform() {
    state_.transform().reset();
}

void BatchRenderer::visitTranslate(f32 x, f32 y) {
    state_.transform().translate(x, y);
}

void BatchRenderer::visitRotate(f32 angle) {
    state_.transform().rotate(angle);
}

void BatchRenderer::visitScale(f32 x, f32 y) {
    state_.transform().scale(x, y);
}

void BatchRenderer::visitShearX(f32 angle) {
    state_.transform().shearX(angle);
}

void BatchRenderer::visitShearY(f32 angle) {
    state_.transform().shearY(angle);
}

// --- Batching ---

MeshData& BatchRenderer::batchFor(const MaterialKey& key) {
    const Affine3& transform = state_.transform().current();
    if (batch_ && batch_->key == key && batch_->transform == transform) {
        return batch_->mesh;
    }
    closeBatch();
    batch_ = Batch{key, transform, MeshData{}};
    return batch_->mesh;
}

void BatchRenderer::closeBatch() {
    if (!batch_) return;
    Batch batch = std::move(*batch_);
    batch_.reset();
    // A batch whose shapes were all degenerate spawns nothing.
    if (batch.mesh.empty()) return;
    spawnTransient(batch.mesh, batch.key, batch.transform);
}

MaterialKey BatchRenderer::solidKey() const {
    if (auto key = state_.fillKey()) return *key;
    const MaterialKey& material = state_.material();
    if (material.kind == MaterialKey::Kind::Color) {
        return MaterialKey::MakeColor(Color::white(), material.backgroundImage);
    }
    return material;
}

void BatchRenderer::spawnTransient(const MeshData& data, const MaterialKey& key,
                                   const Affine3& transform) {
    auto mesh = res_.device.createMesh(data);
    if (!mesh) {
        std::fprintf(stderr, "brush flush: mesh creation failed (%s), skipping\n",
                     mesh.error().describe().c_str());
        return;
    }
    spawn(mesh.value(), true, key, transform);
}

void BatchRenderer::spawn(MeshId mesh, bool transient, const MaterialKey& key,
                          const Affine3& transform) {
    auto material = res_.materials.materialize(key, res_.images);
    if (!material) {
        std::fprintf(stderr, "brush flush: %s for %s, skipping\n",
                     material.error().describe().c_str(), key.describe().c_str());
        if (transient) res_.device.destroyMesh(mesh);
        return;
    }

    DrawableDesc desc;
    desc.mesh = mesh;
    desc.material = material.value();
    desc.transform = transform;
    desc.depthOffset = -static_cast<f32>(drawIndex_) * res_.depthStep;
    desc.drawIndex = drawIndex_;
    desc.layer = canvas_.layer();
    desc.owner = canvas_.id();

    auto entity = res_.device.spawnDrawable(desc);
    if (!entity) {
        std::fprintf(stderr, "brush flush: spawn failed (%s), skipping\n",
                     entity.error().describe().c_str());
        if (transient) res_.device.destroyMesh(mesh);
        return;
    }
    canvas_.addTransient(entity.value(), transient ? mesh : MeshId{});
    ++drawIndex_;
}

void BatchRenderer::drawBackground(const MaterialKey& key, Color color) {
    MeshData quad;
    tessellateRect(quad, 0, 0, static_cast<f32>(canvas_.width()),
                   static_cast<f32>(canvas_.height()), {}, color, ShapeMode::Fill());
    spawnTransient(quad, key, Affine3{});
}

} // namespace brush
