#include "brush/context.hpp"
#include "batch_renderer.hpp"

#include <string>
#include <utility>

namespace brush {

Context::Context(std::shared_ptr<RenderDevice> device, const ContextConfig& config)
    : device_(std::move(device)),
      config_(config),
      images_(*device_),
      geometry_(*device_),
      materials_(*device_),
      layers_(config.maxRenderLayers) {}

Context::~Context() {
    for (auto& e : canvases_) {
        e.second.retireTransients(*device_);
        e.second.target().destroy(*device_);
    }
}

Result<Canvas*> Context::lookup(CanvasId canvas) {
    auto it = canvases_.find(canvas.value);
    if (it == canvases_.end()) {
        return Error{ErrorCode::CanvasNotFound, "canvas " + std::to_string(canvas.value)};
    }
    return &it->second;
}

Canvas* Context::canvas(CanvasId canvas) {
    auto it = canvases_.find(canvas.value);
    return it == canvases_.end() ? nullptr : &it->second;
}

const Canvas* Context::canvas(CanvasId canvas) const {
    auto it = canvases_.find(canvas.value);
    return it == canvases_.end() ? nullptr : &it->second;
}

// --- Canvases ---

Result<CanvasId> Context::createCanvas(u32 width, u32 height) {
    return createCanvas(width, height, config_.canvasFormat);
}

Result<CanvasId> Context::createCanvas(u32 width, u32 height, PixelFormat format) {
    auto target = TextureTarget::Create(*device_, width, height, format);
    if (!target) return target.error();

    auto layer = layers_.allocate();
    if (!layer) {
        target.value().destroy(*device_);
        return layer.error();
    }

    CanvasId id{nextCanvas_++};
    canvases_.emplace(id.value, Canvas(id, std::move(target.value()), layer.value()));
    return id;
}

Result<void> Context::destroyCanvas(CanvasId canvas) {
    auto found = lookup(canvas);
    if (!found) return found.error();
    Canvas& c = *found.value();

    c.retireTransients(*device_);
    c.target().destroy(*device_);
    layers_.free(c.layer());
    canvases_.erase(canvas.value);
    return {};
}

Result<void> Context::resizeCanvas(CanvasId canvas, u32 width, u32 height) {
    auto found = lookup(canvas);
    if (!found) return found.error();
    return found.value()->target().resize(*device_, width, height);
}

Result<void> Context::record(CanvasId canvas, DrawCommand command) {
    auto found = lookup(canvas);
    if (!found) return found.error();
    found.value()->commands().push(std::move(command));
    return {};
}

// --- Frame ---

Result<void> Context::beginDraw(CanvasId canvas) {
    auto found = lookup(canvas);
    if (!found) return found.error();
    found.value()->state().reset();
    return {};
}

Result<void> Context::flush(CanvasId canvas) {
    auto found = lookup(canvas);
    if (!found) return found.error();
    Canvas& c = *found.value();

    c.retireTransients(*device_);

    // Nothing recorded since the last flush: the texture already holds the frame.
    if (c.commands().empty()) return {};

    std::vector<DrawCommand> commands = c.commands().take();

    BatchRenderer renderer({*device_, images_, geometry_, materials_, config_.depthStep}, c);
    for (const DrawCommand& cmd : commands) {
        dispatchCommand(cmd, renderer);
    }
    renderer.finish();

    return device_->render(c.target().texture(), c.layer());
}

Result<void> Context::endDraw(CanvasId canvas) {
    auto flushed = flush(canvas);
    if (!flushed) return flushed;
    return device_->present(canvases_.at(canvas.value).target().texture());
}

// --- Pixels ---

Result<std::vector<LinearColor>> Context::readback(CanvasId canvas) {
    auto flushed = flush(canvas);
    if (!flushed) return flushed.error();
    return canvases_.at(canvas.value).target().readback(*device_);
}

Result<void> Context::updatePixels(CanvasId canvas, const std::vector<LinearColor>& pixels) {
    auto found = lookup(canvas);
    if (!found) return found.error();
    const TextureTarget& target = found.value()->target();
    auto checked = target.checkRegion(0, 0, target.width(), target.height(), pixels.size());
    if (!checked) return checked;

    auto flushed = flush(canvas);
    if (!flushed) return flushed;
    return canvases_.at(canvas.value).target().write(*device_, pixels);
}

Result<void> Context::updateRegion(CanvasId canvas, u32 x, u32 y, u32 w, u32 h,
                                   const std::vector<LinearColor>& pixels) {
    auto found = lookup(canvas);
    if (!found) return found.error();
    auto checked = found.value()->target().checkRegion(x, y, w, h, pixels.size());
    if (!checked) return checked;

    auto flushed = flush(canvas);
    if (!flushed) return flushed;
    return canvases_.at(canvas.value).target().writeRegion(*device_, x, y, w, h, pixels);
}

// --- Images ---

Result<void> Context::destroyImage(ImageId image) {
    if (!images_.contains(image)) {
        return Error{ErrorCode::ImageNotFound, "image " + std::to_string(image.value)};
    }
    materials_.forgetImage(image);
    return images_.destroy(image);
}

} // namespace brush
