#pragma once

/**
 * @file canvas.hpp
 * @brief A drawable surface: command log, paint state and backing texture.
 */

#include "brush/command.hpp"
#include "brush/render_device.hpp"
#include "brush/render_state.hpp"
#include "brush/texture_target.hpp"
#include "brush/types.hpp"
#include <vector>

namespace brush {

/// @brief A drawable surface owned by a Context.
///
/// Owns its command log, its render state, its backing texture with the
/// reusable readback buffer, and the render layer its drawables are tagged
/// with. Drawables spawned by a flush are transient: they are tracked here
/// and retired before the next flush of the same canvas.
class Canvas {
public:
    Canvas(CanvasId id, TextureTarget target, u32 layer);

    Canvas(const Canvas&) = delete;
    Canvas& operator=(const Canvas&) = delete;
    Canvas(Canvas&&) = default;
    Canvas& operator=(Canvas&&) = default;

    CanvasId id() const { return id_; }
    u32 layer() const { return layer_; }
    u32 width() const { return target_.width(); }
    u32 height() const { return target_.height(); }
    PixelFormat format() const { return target_.format(); }

    TextureTarget& target() { return target_; }
    const TextureTarget& target() const { return target_; }

    CommandBuffer& commands() { return commands_; }
    const CommandBuffer& commands() const { return commands_; }

    RenderState& state() { return state_; }
    const RenderState& state() const { return state_; }

    /// @brief Track a drawable spawned by the current flush.
    /// @param mesh Device mesh created for it, destroyed on retirement;
    ///        invalid when the mesh is retained elsewhere.
    void addTransient(EntityId entity, MeshId mesh);

    /// @brief Despawn every tracked drawable and destroy its transient mesh.
    void retireTransients(RenderDevice& device);

    const std::vector<EntityId>& transientEntities() const { return entities_; }
    const std::vector<MeshId>& transientMeshes() const { return meshes_; }

private:
    CanvasId id_;
    TextureTarget target_;
    u32 layer_ = 0;
    CommandBuffer commands_;
    RenderState state_;
    std::vector<EntityId> entities_;
    std::vector<MeshId> meshes_;
};

} // namespace brush
