#pragma once

/**
 * @file context.hpp
 * @brief Rendering context: canvases, images, geometry and materials on one device.
 */

#include "brush/canvas.hpp"
#include "brush/command.hpp"
#include "brush/error.hpp"
#include "brush/geometry.hpp"
#include "brush/image.hpp"
#include "brush/material_library.hpp"
#include "brush/pixel_codec.hpp"
#include "brush/render_device.hpp"
#include "brush/render_layers.hpp"
#include "brush/types.hpp"
#include <memory>
#include <unordered_map>
#include <vector>

namespace brush {

/// @brief Tunables of a Context.
struct ContextConfig {
    PixelFormat canvasFormat = PixelFormat::RGBA16Float;  ///< Default canvas texture format.
    f32 depthStep = 0.001f;                               ///< Depth offset between batches.
    u32 maxRenderLayers = 4096;                           ///< Layer 0 is reserved.
};

/**
 * Context - Owner of every canvas and the resources they draw with.
 *
 * The frame cycle of a canvas is:
 *
 *   beginDraw()  reset paint and transform state
 *   record()     append commands (no device work)
 *   flush()      retire the previous batches, replay the log into new
 *                ones and render them into the canvas texture
 *   endDraw()    flush, then present
 *
 * Canvases are independent: recording on one never touches another.
 * All calls for a context must come from the thread that owns it.
 */
class Context {
public:
    explicit Context(std::shared_ptr<RenderDevice> device, const ContextConfig& config = {});
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    // --- Canvases ---

    /// @brief Create a canvas with the configured format.
    Result<CanvasId> createCanvas(u32 width, u32 height);
    Result<CanvasId> createCanvas(u32 width, u32 height, PixelFormat format);
    /// @brief Retire the canvas's drawables and free its texture, buffer and layer.
    Result<void> destroyCanvas(CanvasId canvas);
    /// @brief Resize the backing texture and recreate the readback buffer.
    Result<void> resizeCanvas(CanvasId canvas, u32 width, u32 height);

    /// @brief Append a command to the canvas's log.
    Result<void> record(CanvasId canvas, DrawCommand command);

    /// @brief Reset the canvas's render state to its defaults.
    Result<void> beginDraw(CanvasId canvas);
    /// @brief Replay the pending log into batches and render them.
    Result<void> flush(CanvasId canvas);
    /// @brief Flush, then present the canvas texture.
    Result<void> endDraw(CanvasId canvas);

    /// @brief Current pixels, width * height linear colors. Flushes pending commands first.
    Result<std::vector<LinearColor>> readback(CanvasId canvas);
    /// @brief Replace every pixel. Flushes pending commands first.
    Result<void> updatePixels(CanvasId canvas, const std::vector<LinearColor>& pixels);
    /// @brief Replace a sub-rectangle. Flushes pending commands first.
    Result<void> updateRegion(CanvasId canvas, u32 x, u32 y, u32 w, u32 h,
                              const std::vector<LinearColor>& pixels);

    Canvas* canvas(CanvasId canvas);
    const Canvas* canvas(CanvasId canvas) const;
    size_t canvasCount() const { return canvases_.size(); }

    /// @brief Destroy an image and the cached materials that sample it.
    Result<void> destroyImage(ImageId image);

    ImageStore& images() { return images_; }
    GeometryStore& geometry() { return geometry_; }
    MaterialLibrary& materials() { return materials_; }
    RenderDevice& device() { return *device_; }
    const ContextConfig& config() const { return config_; }

private:
    Result<Canvas*> lookup(CanvasId canvas);

    std::shared_ptr<RenderDevice> device_;
    ContextConfig config_;
    ImageStore images_;
    GeometryStore geometry_;
    MaterialLibrary materials_;
    RenderLayerAllocator layers_;
    std::unordered_map<u64, Canvas> canvases_;
    u64 nextCanvas_ = 1;
};

} // namespace brush
