#include "brush/sketch.hpp"

namespace brush {

Result<void> Sketch::fill(Color c) {
    return record(DrawCommand::SetFill(c));
}

Result<void> Sketch::noFill() {
    return record(DrawCommand::ClearFill());
}

Result<void> Sketch::stroke(Color c) {
    return record(DrawCommand::SetStroke(c));
}

Result<void> Sketch::noStroke() {
    return record(DrawCommand::ClearStroke());
}

Result<void> Sketch::strokeWeight(f32 weight) {
    return record(DrawCommand::SetStrokeWeight(weight));
}

Result<void> Sketch::useMaterial(MaterialId material) {
    return record(DrawCommand::UseMaterial(material));
}

Result<void> Sketch::materialProperty(const std::string& name, const MaterialValue& value) {
    return record(DrawCommand::SetMaterialProperty(name, value));
}

Result<void> Sketch::rect(f32 x, f32 y, f32 w, f32 h) {
    return record(DrawCommand::Rect(x, y, w, h));
}

Result<void> Sketch::rect(f32 x, f32 y, f32 w, f32 h, f32 tl, f32 tr, f32 br, f32 bl) {
    return record(DrawCommand::Rect(x, y, w, h, {{tl, tr, br, bl}}));
}

Result<void> Sketch::box(f32 width, f32 height, f32 depth) {
    return record(DrawCommand::DrawBox(width, height, depth));
}

Result<void> Sketch::sphere(f32 radius, u32 sectors, u32 stacks) {
    return record(DrawCommand::DrawSphere(radius, sectors, stacks));
}

Result<void> Sketch::drawGeometry(GeometryId geometry) {
    return record(DrawCommand::DrawMesh(geometry));
}

Result<void> Sketch::background(Color c) {
    return record(DrawCommand::BackgroundColor(c));
}

Result<void> Sketch::background(ImageId image) {
    return record(DrawCommand::BackgroundImage(image));
}

Result<void> Sketch::pushMatrix() {
    return record(DrawCommand::PushTransform());
}

Result<void> Sketch::popMatrix() {
    return record(DrawCommand::PopTransform());
}

Result<void> Sketch::resetMatrix() {
    return record(DrawCommand::ResetTransform());
}

Result<void> Sketch::translate(f32 x, f32 y) {
    return record(DrawCommand::Translate(x, y));
}

Result<void> Sketch::rotate(f32 angle) {
    return record(DrawCommand::Rotate(angle));
}

Result<void> Sketch::scale(f32 x, f32 y) {
    return record(DrawCommand::Scale(x, y));
}

Result<void> Sketch::shearX(f32 angle) {
    return record(DrawCommand::ShearX(angle));
}

Result<void> Sketch::shearY(f32 angle) {
    return record(DrawCommand::ShearY(angle));
}

} // namespace brush
