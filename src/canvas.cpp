#include "brush/canvas.hpp"

#include <utility>

namespace brush {

Canvas::Canvas(CanvasId id, TextureTarget target, u32 layer)
    : id_(id), target_(std::move(target)), layer_(layer) {}

void Canvas::addTransient(EntityId entity, MeshId mesh) {
    entities_.push_back(entity);
    if (mesh.valid()) meshes_.push_back(mesh);
}

void Canvas::retireTransients(RenderDevice& device) {
    for (EntityId entity : entities_) {
        device.despawnDrawable(entity);
    }
    for (MeshId mesh : meshes_) {
        device.destroyMesh(mesh);
    }
    entities_.clear();
    meshes_.clear();
}

} // namespace brush
