#pragma once

/**
 * @file sketch.hpp
 * @brief Processing-style drawing calls recorded onto one canvas.
 */

#include "brush/context.hpp"
#include "brush/error.hpp"
#include "brush/types.hpp"
#include <string>

namespace brush {

/// @brief Records Processing-style calls as draw commands on one canvas.
///
/// Every call only appends to the canvas's log; nothing touches the device
/// until flush()/endDraw(). Calls fail with CanvasNotFound once the canvas
/// has been destroyed.
class Sketch {
public:
    Sketch(Context& context, CanvasId canvas) : context_(context), canvas_(canvas) {}

    CanvasId canvas() const { return canvas_; }
    Context& context() { return context_; }

    Result<void> beginDraw() { return context_.beginDraw(canvas_); }
    Result<void> flush() { return context_.flush(canvas_); }
    Result<void> endDraw() { return context_.endDraw(canvas_); }

    // Paint
    Result<void> fill(Color c);
    Result<void> fill(f32 r, f32 g, f32 b, f32 a = 1.0f) { return fill(Color{r, g, b, a}); }
    Result<void> noFill();
    Result<void> stroke(Color c);
    Result<void> stroke(f32 r, f32 g, f32 b, f32 a = 1.0f) { return stroke(Color{r, g, b, a}); }
    Result<void> noStroke();
    Result<void> strokeWeight(f32 weight);
    Result<void> useMaterial(MaterialId material);
    Result<void> materialProperty(const std::string& name, const MaterialValue& value);

    // Shapes
    Result<void> rect(f32 x, f32 y, f32 w, f32 h);
    /// @brief Rounded rectangle, radii top-left, top-right, bottom-right, bottom-left.
    Result<void> rect(f32 x, f32 y, f32 w, f32 h, f32 tl, f32 tr, f32 br, f32 bl);
    Result<void> box(f32 width, f32 height, f32 depth);
    Result<void> sphere(f32 radius, u32 sectors = 24, u32 stacks = 16);
    Result<void> drawGeometry(GeometryId geometry);
    Result<void> background(Color c);
    Result<void> background(f32 r, f32 g, f32 b, f32 a = 1.0f) { return background(Color{r, g, b, a}); }
    Result<void> background(ImageId image);

    // Transform
    Result<void> pushMatrix();
    Result<void> popMatrix();
    Result<void> resetMatrix();
    Result<void> translate(f32 x, f32 y);
    Result<void> rotate(f32 angle);
    Result<void> scale(f32 s) { return scale(s, s); }
    Result<void> scale(f32 x, f32 y);
    Result<void> shearX(f32 angle);
    Result<void> shearY(f32 angle);

private:
    Result<void> record(DrawCommand cmd) { return context_.record(canvas_, std::move(cmd)); }

    Context& context_;
    CanvasId canvas_;
};

} // namespace brush
